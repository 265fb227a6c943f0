/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef DEVHAVEN_SETTINGS_H
#define DEVHAVEN_SETTINGS_H

#include "devhavenprivate_export.h"

#include "TerminalWorkspace.h"

#include <QObject>
#include <QString>

#include <KSharedConfig>

namespace DevHaven
{

/**
 * DevhavenSettings manages the terminal workspace settings.
 *
 * Settings include:
 * - Grace period before an unreferenced shell is killed
 * - Shell override and replay buffer size
 * - Workspace save debounce and side panel defaults
 * - Worktree root directory and git executable
 */
class DEVHAVENPRIVATE_EXPORT DevhavenSettings : public QObject
{
    Q_OBJECT

public:
    static DevhavenSettings *instance();

    /**
     * @param configName KConfig file name, relative to the config location
     */
    explicit DevhavenSettings(QObject *parent = nullptr, const QString &configName = QStringLiteral("devhavenrc"));
    ~DevhavenSettings() override;

    /**
     * Milliseconds a session with no references keeps its shell (default: 1000)
     */
    int killGracePeriodMs() const;
    void setKillGracePeriodMs(int ms);

    /**
     * Shell to run in new terminals. Empty means the user's login shell.
     */
    QString shellPath() const;
    void setShellPath(const QString &path);

    /**
     * Bytes of raw output kept per session for repainting remounted panes
     */
    int replayBufferBytes() const;
    void setReplayBufferBytes(int bytes);

    /**
     * Delay between the last workspace change and the save (default: 800)
     */
    int saveDebounceMs() const;
    void setSaveDebounceMs(int ms);

    bool quickCommandsPanelOpen() const;
    void setQuickCommandsPanelOpen(bool open);

    bool fileExplorerPanelOpen() const;
    void setFileExplorerPanelOpen(bool open);

    bool fileExplorerShowHidden() const;
    void setFileExplorerShowHidden(bool show);

    /**
     * Panel defaults for new or incomplete workspaces
     */
    WorkspaceDefaults workspaceDefaults() const;

    /**
     * Directory holding managed worktrees (default: ~/.devhaven/worktrees)
     */
    QString worktreeRoot() const;
    void setWorktreeRoot(const QString &path);

    QString gitExecutable() const;
    void setGitExecutable(const QString &path);

    /**
     * Save settings to disk
     */
    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    static DevhavenSettings *s_instance;
    KSharedConfig::Ptr m_config;
};

} // namespace DevHaven

#endif // DEVHAVEN_SETTINGS_H
