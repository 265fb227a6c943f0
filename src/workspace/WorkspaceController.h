/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACECONTROLLER_H
#define WORKSPACECONTROLLER_H

#include "devhavenprivate_export.h"

#include "SplitLayout.h"
#include "TerminalWorkspace.h"

#include <QObject>
#include <QStringList>

#include <optional>

namespace DevHaven
{

class WorkspacePersistence;

/**
 * WorkspaceController applies the layout commands of a workspace window.
 *
 * Each command builds a complete new workspace from the current one and
 * hands it to WorkspacePersistence, which schedules the save. Commands that
 * refer to unknown tabs or sessions change nothing and return false or an
 * empty id.
 */
class DEVHAVENPRIVATE_EXPORT WorkspaceController : public QObject
{
    Q_OBJECT

public:
    explicit WorkspaceController(WorkspacePersistence *persistence, QObject *parent = nullptr);
    ~WorkspaceController() override;

    const TerminalWorkspace &workspace() const;

    /**
     * Split the focused pane of the active tab. Returns the new session id.
     */
    QString splitActivePane(SplitDirection direction, const QString &cwd = QString());

    /**
     * Split @p targetSessionId in @p tabId. The new pane gets focus and starts
     * in @p cwd, or in the project directory when empty.
     */
    QString splitPane(const QString &tabId, const QString &targetSessionId, SplitDirection direction, const QString &cwd = QString());

    /**
     * Close a pane. Closing the last pane closes its tab.
     */
    bool closePane(const QString &tabId, const QString &sessionId);

    bool resizeSplit(const QString &tabId, const QList<int> &path, const QList<double> &ratios);
    bool dragDivider(const QString &tabId, const QList<int> &path, int dividerIndex, double delta);

    bool activateSession(const QString &tabId, const QString &sessionId);

    /**
     * Append a tab with one pane and select it. Returns the tab id.
     */
    QString newTab(const QString &cwd = QString(), const QString &title = QString());

    /**
     * Close a tab. Closing the last tab leaves a fresh default tab.
     */
    bool closeTab(const QString &tabId);

    bool selectTab(const QString &tabId);
    bool renameTab(const QString &tabId, const QString &title);

    /**
     * Open @p path, e.g. a freshly created worktree: in a new tab, or next to
     * the focused pane when @p direction is given. Returns the session id.
     */
    QString openPath(const QString &path, std::optional<SplitDirection> direction = std::nullopt);

    void setQuickCommandsPanel(bool open, std::optional<double> x = std::nullopt, std::optional<double> y = std::nullopt);
    void setFileExplorerPanel(bool open, bool showHidden);

Q_SIGNALS:
    void workspaceChanged();

    /**
     * Sessions no pane references any more; their bindings should go away
     */
    void sessionsClosed(const QStringList &sessionIds);

private:
    void commit(const TerminalWorkspace &next, const QStringList &closedSessions = QStringList());
    SessionSnapshot newSession(const QString &cwd) const;

    WorkspacePersistence *m_persistence = nullptr;
};

} // namespace DevHaven

#endif // WORKSPACECONTROLLER_H
