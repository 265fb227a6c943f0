/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKTREEENVIRONMENT_H
#define WORKTREEENVIRONMENT_H

#include "devhavenprivate_export.h"

#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>

namespace DevHaven
{

/**
 * WorktreeEnvironment prepares a freshly created worktree.
 *
 * The .devhaven directory of the main checkout is copied over when the
 * worktree has none, then the commands listed under "setup" in
 * .devhaven/config.json run one after another in the worktree through the
 * user's shell, with DEVHAVEN_WORKSPACE_NAME and DEVHAVEN_ROOT_PATH set.
 * Every problem is collected as a warning; preparation never fails.
 */
class DEVHAVENPRIVATE_EXPORT WorktreeEnvironment : public QObject
{
    Q_OBJECT

public:
    /**
     * Receives the collected warnings, empty when everything succeeded
     */
    using DoneCallback = std::function<void(const QString &warning)>;

    explicit WorktreeEnvironment(QObject *parent = nullptr);
    ~WorktreeEnvironment() override;

    void setShell(const QString &shell)
    {
        m_shell = shell;
    }

    void prepare(const QString &mainRepoPath, const QString &worktreePath, const QString &workspaceName, DoneCallback callback);

    /**
     * Setup commands of @p mainRepoPath, or an error when the config is unreadable
     */
    static QStringList loadSetupCommands(const QString &mainRepoPath, QString *error = nullptr);

    /**
     * Copy .devhaven from @p mainRepoPath unless @p worktreePath already has one
     */
    static bool copySetupDirectory(const QString &mainRepoPath, const QString &worktreePath, QString *error = nullptr);

private:
    void runNext();
    void finish();

    QString m_shell;
    QString m_mainRepoPath;
    QString m_worktreePath;
    QString m_workspaceName;
    QStringList m_pending;
    QStringList m_warnings;
    DoneCallback m_callback;

    static constexpr int COMMAND_TIMEOUT_MS = 600000;
};

} // namespace DevHaven

#endif // WORKTREEENVIRONMENT_H
