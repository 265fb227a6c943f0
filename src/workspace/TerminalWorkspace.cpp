/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalWorkspace.h"

#include <KLocalizedString>

#include <QDateTime>
#include <QJsonArray>
#include <QSet>
#include <QUuid>

namespace DevHaven
{

namespace
{

// Give every pane after the first one for a session id a fresh session, so
// two panes never drive the same shell.
SplitNode renameDuplicateSessions(const SplitNode &node, QSet<QString> &seen, QMap<QString, SessionSnapshot> &sessions, const QString &projectPath)
{
    if (node.isPane()) {
        if (!seen.contains(node.sessionId)) {
            seen.insert(node.sessionId);
            return node;
        }
        const QString freshId = TerminalWorkspace::createId();
        SessionSnapshot snapshot;
        snapshot.id = freshId;
        snapshot.cwd = sessions.contains(node.sessionId) ? sessions.value(node.sessionId).cwd : projectPath;
        sessions.insert(freshId, snapshot);
        seen.insert(freshId);
        return SplitNode::pane(freshId);
    }

    SplitNode next = node;
    for (SplitNode &child : next.children) {
        child = renameDuplicateSessions(child, seen, sessions, projectPath);
    }
    return next;
}

} // namespace

QJsonObject TerminalTab::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id;
    obj[QStringLiteral("title")] = title;
    obj[QStringLiteral("root")] = root.toJson();
    obj[QStringLiteral("activeSessionId")] = activeSessionId;
    return obj;
}

TerminalTab TerminalTab::fromJson(const QJsonObject &obj)
{
    TerminalTab tab;
    tab.id = obj.value(QStringLiteral("id")).toString();
    tab.title = obj.value(QStringLiteral("title")).toString();
    tab.root = SplitNode::fromJson(obj.value(QStringLiteral("root")).toObject());
    tab.activeSessionId = obj.value(QStringLiteral("activeSessionId")).toString();
    return tab;
}

bool TerminalTab::operator==(const TerminalTab &other) const
{
    return id == other.id && title == other.title && root == other.root && activeSessionId == other.activeSessionId;
}

QJsonObject SessionSnapshot::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id;
    obj[QStringLiteral("cwd")] = cwd;
    obj[QStringLiteral("savedState")] = savedState.isNull() ? QJsonValue(QJsonValue::Null) : QJsonValue(savedState);
    return obj;
}

SessionSnapshot SessionSnapshot::fromJson(const QJsonObject &obj)
{
    SessionSnapshot snapshot;
    snapshot.id = obj.value(QStringLiteral("id")).toString();
    snapshot.cwd = obj.value(QStringLiteral("cwd")).toString();
    const QJsonValue state = obj.value(QStringLiteral("savedState"));
    if (state.isString()) {
        snapshot.savedState = state.toString();
    }
    return snapshot;
}

QJsonObject WorkspaceUi::toJson() const
{
    QJsonObject obj = extra;

    QJsonObject quick;
    quick[QStringLiteral("open")] = quickCommandsPanel.open;
    quick[QStringLiteral("x")] = quickCommandsPanel.x ? QJsonValue(*quickCommandsPanel.x) : QJsonValue(QJsonValue::Null);
    quick[QStringLiteral("y")] = quickCommandsPanel.y ? QJsonValue(*quickCommandsPanel.y) : QJsonValue(QJsonValue::Null);
    obj[QStringLiteral("quickCommandsPanel")] = quick;

    QJsonObject files;
    files[QStringLiteral("open")] = fileExplorerPanel.open;
    files[QStringLiteral("showHidden")] = fileExplorerPanel.showHidden;
    obj[QStringLiteral("fileExplorerPanel")] = files;

    return obj;
}

WorkspaceUi WorkspaceUi::fromJson(const QJsonObject &obj, const WorkspaceDefaults &defaults)
{
    WorkspaceUi ui;
    ui.extra = obj;
    ui.extra.remove(QStringLiteral("quickCommandsPanel"));
    ui.extra.remove(QStringLiteral("fileExplorerPanel"));

    const QJsonObject quick = obj.value(QStringLiteral("quickCommandsPanel")).toObject();
    const QJsonValue quickOpen = quick.value(QStringLiteral("open"));
    ui.quickCommandsPanel.open = quickOpen.isBool() ? quickOpen.toBool() : defaults.quickCommandsPanelOpen;
    const QJsonValue x = quick.value(QStringLiteral("x"));
    const QJsonValue y = quick.value(QStringLiteral("y"));
    if (x.isDouble()) {
        ui.quickCommandsPanel.x = x.toDouble();
    }
    if (y.isDouble()) {
        ui.quickCommandsPanel.y = y.toDouble();
    }

    const QJsonObject files = obj.value(QStringLiteral("fileExplorerPanel")).toObject();
    const QJsonValue filesOpen = files.value(QStringLiteral("open"));
    const QJsonValue showHidden = files.value(QStringLiteral("showHidden"));
    ui.fileExplorerPanel.open = filesOpen.isBool() ? filesOpen.toBool() : defaults.fileExplorerPanelOpen;
    ui.fileExplorerPanel.showHidden = showHidden.isBool() ? showHidden.toBool() : defaults.fileExplorerShowHidden;

    return ui;
}

const TerminalTab *TerminalWorkspace::activeTab() const
{
    return tab(activeTabId);
}

const TerminalTab *TerminalWorkspace::tab(const QString &tabId) const
{
    const int index = tabIndex(tabId);
    return index >= 0 ? &tabs.at(index) : nullptr;
}

int TerminalWorkspace::tabIndex(const QString &tabId) const
{
    for (int i = 0; i < tabs.size(); ++i) {
        if (tabs.at(i).id == tabId) {
            return i;
        }
    }
    return -1;
}

QStringList TerminalWorkspace::referencedSessionIds() const
{
    QStringList ids;
    for (const TerminalTab &t : tabs) {
        ids.append(SplitLayout::collectSessionIds(t.root));
    }
    return ids;
}

QJsonObject TerminalWorkspace::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("version")] = version;
    obj[QStringLiteral("projectId")] = projectId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(projectId);
    obj[QStringLiteral("projectPath")] = projectPath;
    obj[QStringLiteral("activeTabId")] = activeTabId;
    obj[QStringLiteral("updatedAt")] = updatedAt;

    QJsonArray tabArray;
    for (const TerminalTab &t : tabs) {
        tabArray.append(t.toJson());
    }
    obj[QStringLiteral("tabs")] = tabArray;

    QJsonObject sessionObject;
    for (auto it = sessions.cbegin(); it != sessions.cend(); ++it) {
        sessionObject[it.key()] = it.value().toJson();
    }
    obj[QStringLiteral("sessions")] = sessionObject;
    obj[QStringLiteral("ui")] = ui.toJson();
    return obj;
}

TerminalWorkspace TerminalWorkspace::fromJson(const QJsonObject &obj, const WorkspaceDefaults &defaults)
{
    TerminalWorkspace workspace;
    workspace.version = obj.value(QStringLiteral("version")).toInt(CurrentVersion);
    workspace.projectId = obj.value(QStringLiteral("projectId")).toString();
    workspace.projectPath = obj.value(QStringLiteral("projectPath")).toString();
    workspace.activeTabId = obj.value(QStringLiteral("activeTabId")).toString();
    workspace.updatedAt = static_cast<qint64>(obj.value(QStringLiteral("updatedAt")).toDouble(0));

    const QJsonArray tabArray = obj.value(QStringLiteral("tabs")).toArray();
    for (const QJsonValue &value : tabArray) {
        if (value.isObject()) {
            workspace.tabs.append(TerminalTab::fromJson(value.toObject()));
        }
    }

    const QJsonObject sessionObject = obj.value(QStringLiteral("sessions")).toObject();
    for (auto it = sessionObject.constBegin(); it != sessionObject.constEnd(); ++it) {
        if (it.value().isObject()) {
            workspace.sessions.insert(it.key(), SessionSnapshot::fromJson(it.value().toObject()));
        }
    }

    workspace.ui = WorkspaceUi::fromJson(obj.value(QStringLiteral("ui")).toObject(), defaults);
    return workspace;
}

TerminalWorkspace TerminalWorkspace::createDefault(const QString &projectPath, const QString &projectId, const WorkspaceDefaults &defaults)
{
    const QString sessionId = createId();

    TerminalTab tab;
    tab.id = createId();
    tab.title = defaultTabTitle(0);
    tab.root = SplitNode::pane(sessionId);
    tab.activeSessionId = sessionId;

    SessionSnapshot session;
    session.id = sessionId;
    session.cwd = projectPath;

    TerminalWorkspace workspace;
    workspace.projectId = projectId;
    workspace.projectPath = projectPath;
    workspace.tabs.append(tab);
    workspace.activeTabId = tab.id;
    workspace.sessions.insert(sessionId, session);
    workspace.ui = WorkspaceUi::fromJson(QJsonObject(), defaults);
    workspace.updatedAt = QDateTime::currentMSecsSinceEpoch();
    return workspace;
}

TerminalWorkspace TerminalWorkspace::normalize(const TerminalWorkspace &raw,
                                               const QString &projectPath,
                                               const QString &projectId,
                                               const WorkspaceDefaults &defaults)
{
    if (raw.tabs.isEmpty()) {
        return createDefault(projectPath, projectId.isEmpty() ? raw.projectId : projectId, defaults);
    }

    QMap<QString, SessionSnapshot> sessions = raw.sessions;
    QSet<QString> seenSessions;
    QSet<QString> seenTabs;
    QList<TerminalTab> tabs;

    for (int index = 0; index < raw.tabs.size(); ++index) {
        TerminalTab tab = raw.tabs.at(index);

        if (tab.id.isEmpty() || seenTabs.contains(tab.id)) {
            tab.id = createId();
        }
        seenTabs.insert(tab.id);

        if (tab.title.isEmpty()) {
            tab.title = defaultTabTitle(index);
        }

        SplitNode root = SplitLayout::normalizeNode(tab.root);
        if (root.isValid()) {
            root = renameDuplicateSessions(root, seenSessions, sessions, projectPath);
        } else {
            const QString sessionId = createId();
            SessionSnapshot session;
            session.id = sessionId;
            session.cwd = projectPath;
            sessions.insert(sessionId, session);
            seenSessions.insert(sessionId);
            root = SplitNode::pane(sessionId);
        }
        tab.root = root;

        const QStringList ids = SplitLayout::collectSessionIds(root);
        if (!ids.contains(tab.activeSessionId)) {
            tab.activeSessionId = ids.first();
        }
        tabs.append(tab);
    }

    // Keep only referenced sessions, and make each entry consistent with its key.
    QMap<QString, SessionSnapshot> referenced;
    for (const TerminalTab &tab : std::as_const(tabs)) {
        const QStringList ids = SplitLayout::collectSessionIds(tab.root);
        for (const QString &id : ids) {
            SessionSnapshot session = sessions.value(id);
            session.id = id;
            if (session.cwd.isEmpty()) {
                session.cwd = projectPath;
            }
            referenced.insert(id, session);
        }
    }

    TerminalWorkspace workspace = raw;
    workspace.version = CurrentVersion;
    workspace.projectId = projectId.isEmpty() ? raw.projectId : projectId;
    workspace.projectPath = projectPath;
    workspace.tabs = tabs;
    workspace.sessions = referenced;
    if (workspace.tabIndex(raw.activeTabId) < 0) {
        workspace.activeTabId = tabs.first().id;
    }
    if (workspace.updatedAt <= 0) {
        workspace.updatedAt = QDateTime::currentMSecsSinceEpoch();
    }
    return workspace;
}

QString TerminalWorkspace::createId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QString TerminalWorkspace::defaultTabTitle(int index)
{
    return i18n("Terminal %1", index + 1);
}

bool TerminalWorkspace::operator==(const TerminalWorkspace &other) const
{
    return version == other.version && projectId == other.projectId && projectPath == other.projectPath && tabs == other.tabs
        && activeTabId == other.activeTabId && sessions == other.sessions && ui == other.ui && updatedAt == other.updatedAt;
}

} // namespace DevHaven
