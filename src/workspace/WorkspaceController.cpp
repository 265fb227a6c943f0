/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorkspaceController.h"

#include "WorkspacePersistence.h"

#include <QDebug>
#include <QFileInfo>

namespace DevHaven
{

WorkspaceController::WorkspaceController(WorkspacePersistence *persistence, QObject *parent)
    : QObject(parent)
    , m_persistence(persistence)
{
}

WorkspaceController::~WorkspaceController() = default;

const TerminalWorkspace &WorkspaceController::workspace() const
{
    return m_persistence->workspace();
}

SessionSnapshot WorkspaceController::newSession(const QString &cwd) const
{
    SessionSnapshot session;
    session.id = TerminalWorkspace::createId();
    session.cwd = cwd.isEmpty() ? workspace().projectPath : cwd;
    return session;
}

void WorkspaceController::commit(const TerminalWorkspace &next, const QStringList &closedSessions)
{
    m_persistence->setWorkspace(next);
    Q_EMIT workspaceChanged();
    if (!closedSessions.isEmpty()) {
        Q_EMIT sessionsClosed(closedSessions);
    }
}

QString WorkspaceController::splitActivePane(SplitDirection direction, const QString &cwd)
{
    const TerminalTab *tab = workspace().activeTab();
    if (!tab) {
        return QString();
    }
    return splitPane(tab->id, tab->activeSessionId, direction, cwd);
}

QString WorkspaceController::splitPane(const QString &tabId, const QString &targetSessionId, SplitDirection direction, const QString &cwd)
{
    TerminalWorkspace next = workspace();
    const int index = next.tabIndex(tabId);
    if (index < 0 || !SplitLayout::findPanePath(next.tabs.at(index).root, targetSessionId)) {
        qDebug() << "WorkspaceController: nothing to split for" << tabId << targetSessionId;
        return QString();
    }

    const QString startDir = cwd.isEmpty() ? next.sessions.value(targetSessionId).cwd : cwd;
    const SessionSnapshot session = newSession(startDir);

    TerminalTab &tab = next.tabs[index];
    tab.root = SplitLayout::splitPane(tab.root, targetSessionId, direction, session.id);
    tab.activeSessionId = session.id;
    next.sessions.insert(session.id, session);

    commit(next);
    return session.id;
}

bool WorkspaceController::closePane(const QString &tabId, const QString &sessionId)
{
    TerminalWorkspace next = workspace();
    const int index = next.tabIndex(tabId);
    if (index < 0 || !SplitLayout::findPanePath(next.tabs.at(index).root, sessionId)) {
        return false;
    }

    const SplitNode root = SplitLayout::removePane(next.tabs.at(index).root, sessionId);
    if (!root.isValid()) {
        return closeTab(tabId);
    }

    TerminalTab &tab = next.tabs[index];
    tab.root = root;
    if (tab.activeSessionId == sessionId) {
        tab.activeSessionId = SplitLayout::collectSessionIds(root).first();
    }
    next.sessions.remove(sessionId);

    commit(next, {sessionId});
    return true;
}

bool WorkspaceController::resizeSplit(const QString &tabId, const QList<int> &path, const QList<double> &ratios)
{
    TerminalWorkspace next = workspace();
    const int index = next.tabIndex(tabId);
    if (index < 0) {
        return false;
    }

    const SplitNode *target = SplitLayout::nodeAtPath(next.tabs.at(index).root, path);
    if (!target || !target->isSplit()) {
        return false;
    }

    next.tabs[index].root = SplitLayout::updateSplitRatios(next.tabs.at(index).root, path, ratios);
    commit(next);
    return true;
}

bool WorkspaceController::dragDivider(const QString &tabId, const QList<int> &path, int dividerIndex, double delta)
{
    const TerminalTab *tab = workspace().tab(tabId);
    if (!tab) {
        return false;
    }

    const SplitNode *target = SplitLayout::nodeAtPath(tab->root, path);
    if (!target || !target->isSplit() || dividerIndex < 0 || dividerIndex + 1 >= static_cast<int>(target->children.size())) {
        return false;
    }

    TerminalWorkspace next = workspace();
    const int index = next.tabIndex(tabId);
    next.tabs[index].root = SplitLayout::dragDivider(next.tabs.at(index).root, path, dividerIndex, delta);
    commit(next);
    return true;
}

bool WorkspaceController::activateSession(const QString &tabId, const QString &sessionId)
{
    TerminalWorkspace next = workspace();
    const int index = next.tabIndex(tabId);
    if (index < 0 || !SplitLayout::findPanePath(next.tabs.at(index).root, sessionId)) {
        return false;
    }
    if (next.tabs.at(index).activeSessionId == sessionId) {
        return true;
    }

    next.tabs[index].activeSessionId = sessionId;
    commit(next);
    return true;
}

QString WorkspaceController::newTab(const QString &cwd, const QString &title)
{
    TerminalWorkspace next = workspace();
    const SessionSnapshot session = newSession(cwd);

    TerminalTab tab;
    tab.id = TerminalWorkspace::createId();
    tab.title = title.isEmpty() ? TerminalWorkspace::defaultTabTitle(next.tabs.size()) : title;
    tab.root = SplitNode::pane(session.id);
    tab.activeSessionId = session.id;

    next.tabs.append(tab);
    next.activeTabId = tab.id;
    next.sessions.insert(session.id, session);

    commit(next);
    return tab.id;
}

bool WorkspaceController::closeTab(const QString &tabId)
{
    const TerminalWorkspace &current = workspace();
    const int index = current.tabIndex(tabId);
    if (index < 0) {
        return false;
    }

    const QStringList closed = SplitLayout::collectSessionIds(current.tabs.at(index).root);

    TerminalWorkspace next;
    if (current.tabs.size() == 1) {
        next = TerminalWorkspace::createDefault(current.projectPath, current.projectId);
        next.ui = current.ui;
    } else {
        next = current;
        next.tabs.removeAt(index);
        for (const QString &id : closed) {
            next.sessions.remove(id);
        }
        if (next.activeTabId == tabId) {
            next.activeTabId = next.tabs.at(qMin(index, next.tabs.size() - 1)).id;
        }
    }

    commit(next, closed);
    return true;
}

bool WorkspaceController::selectTab(const QString &tabId)
{
    if (workspace().tabIndex(tabId) < 0) {
        return false;
    }
    if (workspace().activeTabId == tabId) {
        return true;
    }

    TerminalWorkspace next = workspace();
    next.activeTabId = tabId;
    commit(next);
    return true;
}

bool WorkspaceController::renameTab(const QString &tabId, const QString &title)
{
    TerminalWorkspace next = workspace();
    const int index = next.tabIndex(tabId);
    if (index < 0 || title.trimmed().isEmpty()) {
        return false;
    }

    next.tabs[index].title = title.trimmed();
    commit(next);
    return true;
}

QString WorkspaceController::openPath(const QString &path, std::optional<SplitDirection> direction)
{
    if (direction) {
        return splitActivePane(*direction, path);
    }

    const QString tabId = newTab(path, QFileInfo(path).fileName());
    const TerminalTab *tab = workspace().tab(tabId);
    return tab ? tab->activeSessionId : QString();
}

void WorkspaceController::setQuickCommandsPanel(bool open, std::optional<double> x, std::optional<double> y)
{
    TerminalWorkspace next = workspace();
    next.ui.quickCommandsPanel.open = open;
    if (x) {
        next.ui.quickCommandsPanel.x = x;
    }
    if (y) {
        next.ui.quickCommandsPanel.y = y;
    }
    commit(next);
}

void WorkspaceController::setFileExplorerPanel(bool open, bool showHidden)
{
    TerminalWorkspace next = workspace();
    next.ui.fileExplorerPanel.open = open;
    next.ui.fileExplorerPanel.showHidden = showHidden;
    commit(next);
}

} // namespace DevHaven

#include "moc_WorkspaceController.cpp"
