/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKTREEINITJOB_H
#define WORKTREEINITJOB_H

#include "devhavenprivate_export.h"

#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QObject>
#include <QPointer>
#include <QString>

#include <optional>

namespace DevHaven
{

class GitWorktreeManager;
class TrackedWorktreeStore;
class WorktreeEnvironment;

enum class WorktreeJobStep {
    Pending,
    Validating,
    CheckingBranch,
    CreatingWorktree,
    PreparingEnvironment,
    Syncing,
    Ready,
    Failed,
    Cancelled,
};

/**
 * Wire name of @p step, e.g. "checking_branch"
 */
DEVHAVENPRIVATE_EXPORT QString worktreeJobStepName(WorktreeJobStep step);
DEVHAVENPRIVATE_EXPORT std::optional<WorktreeJobStep> worktreeJobStepFromName(const QString &name);
DEVHAVENPRIVATE_EXPORT bool isTerminalStep(WorktreeJobStep step);

struct DEVHAVENPRIVATE_EXPORT WorktreeInitRequest {
    QString projectId;
    QString projectPath;
    QString projectName; // Defaults to the last component of projectPath
    QString branch;
    QString baseBranch; // Start point for a new branch, HEAD when empty
    bool createBranch = false;
    QString targetPath; // Overrides the derived worktree location
};

struct DEVHAVENPRIVATE_EXPORT WorktreeStepTransition {
    WorktreeJobStep step = WorktreeJobStep::Pending;
    qint64 at = 0;
};

/**
 * Observable state of one worktree init job
 */
struct DEVHAVENPRIVATE_EXPORT WorktreeJobStatus {
    QString jobId;
    QString projectId;
    QString projectPath;
    QString projectName;
    QString worktreePath;
    QString branch;
    QString baseBranch;
    bool createBranch = false;

    WorktreeJobStep step = WorktreeJobStep::Pending;
    QString message;
    QString error;
    QString warning;

    qint64 createdAt = 0;
    qint64 updatedAt = 0;
    QList<WorktreeStepTransition> transitions;

    bool cancelRequested = false;
    bool isRunning = false;

    bool isTerminal() const
    {
        return isTerminalStep(step);
    }

    /**
     * Steps entered so far, in order
     */
    QList<WorktreeJobStep> steps() const;

    QJsonObject toJson() const;

    /**
     * Indented JSON meant for a bug report
     */
    QString diagnostics() const;
};

/**
 * WorktreeInitJob provisions one Git worktree.
 *
 * The job walks pending, validating, checking_branch, creating_worktree,
 * preparing_environment and syncing to ready, or ends in failed or
 * cancelled. Each step runs from the event loop and every transition is
 * published through progress(). The job does not own the Git manager or the
 * tracked worktree store.
 */
class DEVHAVENPRIVATE_EXPORT WorktreeInitJob : public QObject
{
    Q_OBJECT

public:
    WorktreeInitJob(const WorktreeInitRequest &request,
                    const QString &worktreePath,
                    GitWorktreeManager *git,
                    TrackedWorktreeStore *trackedStore,
                    QObject *parent = nullptr);
    ~WorktreeInitJob() override;

    const WorktreeJobStatus &status() const
    {
        return m_status;
    }

    QString jobId() const
    {
        return m_status.jobId;
    }

    const WorktreeInitRequest &request() const
    {
        return m_request;
    }

    /**
     * Shell for the setup commands; empty uses the login shell
     */
    void setShell(const QString &shell)
    {
        m_shell = shell;
    }

    /**
     * Queue the first step. Has no effect once the job left pending.
     */
    void start();

    /**
     * Cancel the job. Only possible before creating_worktree; the job is
     * cancelled immediately.
     */
    bool requestCancel(QString *error = nullptr);

    /**
     * Replace characters outside [A-Za-z0-9._-] with '-', collapse runs of
     * '-' and trim leading or trailing '-' and '.'
     */
    static QString sanitize(const QString &name);

    /**
     * <worktreeRoot>/<sanitize(projectName)>/<sanitize(branch)>
     */
    static QString targetPathFor(const QString &worktreeRoot, const QString &projectName, const QString &branch);

Q_SIGNALS:
    void progress(const DevHaven::WorktreeJobStatus &status);
    void finished(const DevHaven::WorktreeJobStatus &status);

private:
    void enterStep(WorktreeJobStep step, const QString &message);
    void fail(const QString &message, const QString &error);
    void validate();
    void checkBranch();
    void createWorktree();
    void prepareEnvironment();
    void sync();
    void trackWorktree(const QString &trackedStatus);

    WorktreeInitRequest m_request;
    WorktreeJobStatus m_status;
    QPointer<GitWorktreeManager> m_git;
    TrackedWorktreeStore *m_trackedStore = nullptr;
    WorktreeEnvironment *m_environment = nullptr;
    QString m_shell;
    bool m_started = false;
};

} // namespace DevHaven

Q_DECLARE_METATYPE(DevHaven::WorktreeJobStatus)

#endif // WORKTREEINITJOB_H
