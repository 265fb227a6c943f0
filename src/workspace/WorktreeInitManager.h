/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKTREEINITMANAGER_H
#define WORKTREEINITMANAGER_H

#include "devhavenprivate_export.h"

#include "WorktreeInitJob.h"

#include <QList>
#include <QObject>
#include <QString>

#include <optional>

namespace DevHaven
{

class GitWorktreeManager;
class TrackedWorktreeStore;

/**
 * WorktreeInitManager starts and tracks worktree init jobs.
 *
 * At most one running job may target a given worktree path; a second
 * request for it is rejected. The most recent finished jobs stay queryable
 * so the UI can show their outcome and offer a retry; older ones are
 * dropped once more than finishedJobLimit() have finished.
 */
class DEVHAVENPRIVATE_EXPORT WorktreeInitManager : public QObject
{
    Q_OBJECT

public:
    static constexpr int DEFAULT_FINISHED_JOB_LIMIT = 20;

    /**
     * @param git runs the git commands; not owned
     * @param trackedStore receives the created worktrees; not owned, may be null
     */
    WorktreeInitManager(GitWorktreeManager *git, TrackedWorktreeStore *trackedStore, QObject *parent = nullptr);
    ~WorktreeInitManager() override;

    void setWorktreeRoot(const QString &path)
    {
        m_worktreeRoot = path;
    }
    QString worktreeRoot() const
    {
        return m_worktreeRoot;
    }

    void setShell(const QString &shell)
    {
        m_shell = shell;
    }

    void setFinishedJobLimit(int limit);
    int finishedJobLimit() const
    {
        return m_finishedJobLimit;
    }

    /**
     * Validate @p request and queue a job for it. Returns the initial
     * status, or nothing with @p error set.
     */
    std::optional<WorktreeJobStatus> start(const WorktreeInitRequest &request, QString *error = nullptr);

    bool cancel(const QString &jobId, QString *error = nullptr);

    /**
     * Start a new job with the parameters of a finished one
     */
    std::optional<WorktreeJobStatus> retry(const QString &jobId, QString *error = nullptr);

    /**
     * Jobs of @p projectPath (all jobs when empty), most recently updated first
     */
    QList<WorktreeJobStatus> status(const QString &projectPath = QString()) const;

    std::optional<WorktreeJobStatus> job(const QString &jobId) const;

    bool hasActiveJob(const QString &worktreePath) const;

    /**
     * Path a request would be provisioned at
     */
    QString resolveWorktreePath(const WorktreeInitRequest &request) const;

Q_SIGNALS:
    void progress(const DevHaven::WorktreeJobStatus &status);

    /**
     * The worktree is ready to be opened
     */
    void jobReady(const DevHaven::WorktreeJobStatus &status);

    void jobFinished(const DevHaven::WorktreeJobStatus &status);

private:
    WorktreeInitJob *findJob(const QString &jobId) const;
    void onJobFinished(const WorktreeJobStatus &status);
    void pruneFinishedJobs();

    GitWorktreeManager *m_git = nullptr;
    TrackedWorktreeStore *m_trackedStore = nullptr;
    QString m_worktreeRoot;
    QString m_shell;
    QList<WorktreeInitJob *> m_jobs;
    int m_finishedJobLimit = DEFAULT_FINISHED_JOB_LIMIT;
};

} // namespace DevHaven

#endif // WORKTREEINITMANAGER_H
