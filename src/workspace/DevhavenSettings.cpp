/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "DevhavenSettings.h"

#include <KConfigGroup>
#include <QDebug>
#include <QDir>

namespace DevHaven
{

DevhavenSettings *DevhavenSettings::s_instance = nullptr;

DevhavenSettings *DevhavenSettings::instance()
{
    return s_instance;
}

DevhavenSettings::DevhavenSettings(QObject *parent, const QString &configName)
    : QObject(parent)
{
    if (!s_instance) {
        s_instance = this;
    }

    // Load config from ~/.config/devhavenrc
    m_config = KSharedConfig::openConfig(configName);
}

DevhavenSettings::~DevhavenSettings()
{
    save();
    if (s_instance == this) {
        s_instance = nullptr;
    }
}

int DevhavenSettings::killGracePeriodMs() const
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    return qMax(0, group.readEntry("KillGracePeriodMs", 1000));
}

void DevhavenSettings::setKillGracePeriodMs(int ms)
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    group.writeEntry("KillGracePeriodMs", ms);
    Q_EMIT settingsChanged();
}

QString DevhavenSettings::shellPath() const
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    return group.readEntry("ShellPath", QString());
}

void DevhavenSettings::setShellPath(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    group.writeEntry("ShellPath", path);
    Q_EMIT settingsChanged();
}

int DevhavenSettings::replayBufferBytes() const
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    return qMax(0, group.readEntry("ReplayBufferBytes", 200000));
}

void DevhavenSettings::setReplayBufferBytes(int bytes)
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    group.writeEntry("ReplayBufferBytes", bytes);
    Q_EMIT settingsChanged();
}

int DevhavenSettings::saveDebounceMs() const
{
    KConfigGroup group(m_config, QStringLiteral("Workspace"));
    return qMax(0, group.readEntry("SaveDebounceMs", 800));
}

void DevhavenSettings::setSaveDebounceMs(int ms)
{
    KConfigGroup group(m_config, QStringLiteral("Workspace"));
    group.writeEntry("SaveDebounceMs", ms);
    Q_EMIT settingsChanged();
}

bool DevhavenSettings::quickCommandsPanelOpen() const
{
    KConfigGroup group(m_config, QStringLiteral("Workspace"));
    return group.readEntry("QuickCommandsPanelOpen", true);
}

void DevhavenSettings::setQuickCommandsPanelOpen(bool open)
{
    KConfigGroup group(m_config, QStringLiteral("Workspace"));
    group.writeEntry("QuickCommandsPanelOpen", open);
    Q_EMIT settingsChanged();
}

bool DevhavenSettings::fileExplorerPanelOpen() const
{
    KConfigGroup group(m_config, QStringLiteral("Workspace"));
    return group.readEntry("FileExplorerPanelOpen", false);
}

void DevhavenSettings::setFileExplorerPanelOpen(bool open)
{
    KConfigGroup group(m_config, QStringLiteral("Workspace"));
    group.writeEntry("FileExplorerPanelOpen", open);
    Q_EMIT settingsChanged();
}

bool DevhavenSettings::fileExplorerShowHidden() const
{
    KConfigGroup group(m_config, QStringLiteral("Workspace"));
    return group.readEntry("FileExplorerShowHidden", false);
}

void DevhavenSettings::setFileExplorerShowHidden(bool show)
{
    KConfigGroup group(m_config, QStringLiteral("Workspace"));
    group.writeEntry("FileExplorerShowHidden", show);
    Q_EMIT settingsChanged();
}

WorkspaceDefaults DevhavenSettings::workspaceDefaults() const
{
    WorkspaceDefaults defaults;
    defaults.quickCommandsPanelOpen = quickCommandsPanelOpen();
    defaults.fileExplorerPanelOpen = fileExplorerPanelOpen();
    defaults.fileExplorerShowHidden = fileExplorerShowHidden();
    return defaults;
}

QString DevhavenSettings::worktreeRoot() const
{
    KConfigGroup group(m_config, QStringLiteral("Git"));
    QString defaultRoot = QDir::homePath() + QStringLiteral("/.devhaven/worktrees");
    return group.readEntry("WorktreeRoot", defaultRoot);
}

void DevhavenSettings::setWorktreeRoot(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Git"));
    group.writeEntry("WorktreeRoot", path);
    Q_EMIT settingsChanged();
}

QString DevhavenSettings::gitExecutable() const
{
    KConfigGroup group(m_config, QStringLiteral("Git"));
    return group.readEntry("GitExecutable", QStringLiteral("git"));
}

void DevhavenSettings::setGitExecutable(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Git"));
    group.writeEntry("GitExecutable", path);
    Q_EMIT settingsChanged();
}

void DevhavenSettings::save()
{
    if (!m_config->sync()) {
        qWarning() << "DevhavenSettings: failed to write" << m_config->name();
    }
}

} // namespace DevHaven

#include "moc_DevhavenSettings.cpp"
