/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALWORKSPACE_H
#define TERMINALWORKSPACE_H

#include "devhavenprivate_export.h"

#include "SplitLayout.h"

#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QString>

#include <optional>

namespace DevHaven
{

/**
 * One terminal tab: a layout tree and the pane that has focus.
 */
struct DEVHAVENPRIVATE_EXPORT TerminalTab {
    QString id;
    QString title;
    SplitNode root;
    QString activeSessionId;

    QJsonObject toJson() const;
    static TerminalTab fromJson(const QJsonObject &obj);

    bool operator==(const TerminalTab &other) const;
};

/**
 * Persisted side of a session: where it starts and the last serialized
 * terminal buffer. savedState is a null string when nothing was captured.
 */
struct DEVHAVENPRIVATE_EXPORT SessionSnapshot {
    QString id;
    QString cwd;
    QString savedState;

    QJsonObject toJson() const;
    static SessionSnapshot fromJson(const QJsonObject &obj);

    bool operator==(const SessionSnapshot &other) const
    {
        return id == other.id && cwd == other.cwd && savedState == other.savedState;
    }
};

/**
 * Defaults for the workspace side panels, normally read from settings.
 */
struct DEVHAVENPRIVATE_EXPORT WorkspaceDefaults {
    bool quickCommandsPanelOpen = true;
    bool fileExplorerPanelOpen = false;
    bool fileExplorerShowHidden = false;
};

struct DEVHAVENPRIVATE_EXPORT QuickCommandsPanelState {
    bool open = true;
    std::optional<double> x;
    std::optional<double> y;

    bool operator==(const QuickCommandsPanelState &other) const
    {
        return open == other.open && x == other.x && y == other.y;
    }
};

struct DEVHAVENPRIVATE_EXPORT FileExplorerPanelState {
    bool open = false;
    bool showHidden = false;

    bool operator==(const FileExplorerPanelState &other) const
    {
        return open == other.open && showHidden == other.showHidden;
    }
};

struct DEVHAVENPRIVATE_EXPORT WorkspaceUi {
    QuickCommandsPanelState quickCommandsPanel;
    FileExplorerPanelState fileExplorerPanel;

    // Keys this version does not know about, written back untouched
    QJsonObject extra;

    QJsonObject toJson() const;

    /**
     * Read the ui block; missing or mistyped fields take @p defaults.
     */
    static WorkspaceUi fromJson(const QJsonObject &obj, const WorkspaceDefaults &defaults = WorkspaceDefaults());

    bool operator==(const WorkspaceUi &other) const
    {
        return quickCommandsPanel == other.quickCommandsPanel && fileExplorerPanel == other.fileExplorerPanel && extra == other.extra;
    }
};

/**
 * TerminalWorkspace is the persisted state of a project's terminal window:
 * its tabs, the sessions their panes reference and the side panel state.
 *
 * Invariants after normalize():
 * - at least one tab, and activeTabId names one of them
 * - every tab root is a valid tree and activeSessionId is one of its leaves
 * - every session id appears in exactly one pane of exactly one tab
 * - sessions holds an entry for every referenced id and nothing else
 */
class DEVHAVENPRIVATE_EXPORT TerminalWorkspace
{
public:
    static constexpr int CurrentVersion = 1;

    int version = CurrentVersion;
    QString projectId;
    QString projectPath;
    QList<TerminalTab> tabs;
    QString activeTabId;
    QMap<QString, SessionSnapshot> sessions;
    WorkspaceUi ui;
    qint64 updatedAt = 0;

    bool isValid() const
    {
        return !projectPath.isEmpty() && !tabs.isEmpty();
    }

    const TerminalTab *activeTab() const;
    const TerminalTab *tab(const QString &tabId) const;
    int tabIndex(const QString &tabId) const;

    /**
     * Session ids referenced by any tab, in tab and layout order.
     */
    QStringList referencedSessionIds() const;

    QJsonObject toJson() const;

    /**
     * Parse without repairing anything. Pass the result through normalize()
     * before use.
     */
    static TerminalWorkspace fromJson(const QJsonObject &obj, const WorkspaceDefaults &defaults = WorkspaceDefaults());

    /**
     * One tab, one pane, one fresh session starting in @p projectPath.
     */
    static TerminalWorkspace createDefault(const QString &projectPath, const QString &projectId, const WorkspaceDefaults &defaults = WorkspaceDefaults());

    /**
     * Repair structurally broken data by falling back to defaults for the
     * broken parts only. Applying it twice gives the same result as once.
     */
    static TerminalWorkspace normalize(const TerminalWorkspace &raw,
                                       const QString &projectPath,
                                       const QString &projectId,
                                       const WorkspaceDefaults &defaults = WorkspaceDefaults());

    /**
     * Fresh identifier for tabs and sessions
     */
    static QString createId();

    /**
     * Title for the tab at @p index when none is stored
     */
    static QString defaultTabTitle(int index);

    bool operator==(const TerminalWorkspace &other) const;
    bool operator!=(const TerminalWorkspace &other) const
    {
        return !(*this == other);
    }
};

} // namespace DevHaven

#endif // TERMINALWORKSPACE_H
