/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorktreeInitManager.h"

#include "DevhavenSettings.h"
#include "GitWorktreeManager.h"

#include <KLocalizedString>

#include <QDebug>
#include <QDir>
#include <QFileInfo>

#include <algorithm>
#include <utility>

namespace DevHaven
{

namespace
{

QString normalizePath(const QString &path)
{
    const QString trimmed = path.trimmed();
    if (trimmed.isEmpty()) {
        return QString();
    }
    return QDir::cleanPath(QDir::fromNativeSeparators(trimmed));
}

} // namespace

WorktreeInitManager::WorktreeInitManager(GitWorktreeManager *git, TrackedWorktreeStore *trackedStore, QObject *parent)
    : QObject(parent)
    , m_git(git)
    , m_trackedStore(trackedStore)
    , m_worktreeRoot(QDir::homePath() + QStringLiteral("/.devhaven/worktrees"))
{
    qRegisterMetaType<DevHaven::WorktreeJobStatus>();

    if (auto *settings = DevhavenSettings::instance()) {
        m_worktreeRoot = settings->worktreeRoot();
        m_shell = settings->shellPath();
    }
}

WorktreeInitManager::~WorktreeInitManager() = default;

void WorktreeInitManager::setFinishedJobLimit(int limit)
{
    m_finishedJobLimit = qMax(0, limit);
    pruneFinishedJobs();
}

QString WorktreeInitManager::resolveWorktreePath(const WorktreeInitRequest &request) const
{
    if (!request.targetPath.trimmed().isEmpty()) {
        return normalizePath(request.targetPath);
    }

    QString projectName = request.projectName.trimmed();
    if (projectName.isEmpty()) {
        projectName = QFileInfo(normalizePath(request.projectPath)).fileName();
    }
    return WorktreeInitJob::targetPathFor(m_worktreeRoot, projectName, request.branch.trimmed());
}

std::optional<WorktreeJobStatus> WorktreeInitManager::start(const WorktreeInitRequest &request, QString *error)
{
    WorktreeInitRequest normalized = request;
    normalized.projectPath = normalizePath(request.projectPath);
    normalized.branch = request.branch.trimmed();
    normalized.baseBranch = request.baseBranch.trimmed();

    if (normalized.projectPath.isEmpty()) {
        if (error) {
            *error = i18n("The project path is empty");
        }
        return std::nullopt;
    }
    if (normalized.branch.isEmpty()) {
        if (error) {
            *error = i18n("The branch name is empty");
        }
        return std::nullopt;
    }
    if (normalized.projectName.trimmed().isEmpty()) {
        normalized.projectName = QFileInfo(normalized.projectPath).fileName();
    }

    const QString worktreePath = resolveWorktreePath(normalized);
    if (worktreePath.isEmpty() || WorktreeInitJob::sanitize(normalized.branch).isEmpty()) {
        if (error) {
            *error = i18n("Cannot derive a worktree path for branch %1", normalized.branch);
        }
        return std::nullopt;
    }
    if (hasActiveJob(worktreePath)) {
        if (error) {
            *error = i18n("A worktree is already being created at %1", worktreePath);
        }
        return std::nullopt;
    }

    auto *initJob = new WorktreeInitJob(normalized, worktreePath, m_git, m_trackedStore, this);
    initJob->setShell(m_shell);
    connect(initJob, &WorktreeInitJob::progress, this, &WorktreeInitManager::progress);
    connect(initJob, &WorktreeInitJob::finished, this, &WorktreeInitManager::onJobFinished);
    m_jobs.append(initJob);

    qDebug() << "WorktreeInitManager: started job" << initJob->jobId() << "for" << normalized.branch << "at" << worktreePath;

    initJob->start();
    return initJob->status();
}

bool WorktreeInitManager::cancel(const QString &jobId, QString *error)
{
    WorktreeInitJob *initJob = findJob(jobId);
    if (!initJob) {
        if (error) {
            *error = i18n("No such job: %1", jobId);
        }
        return false;
    }
    return initJob->requestCancel(error);
}

std::optional<WorktreeJobStatus> WorktreeInitManager::retry(const QString &jobId, QString *error)
{
    WorktreeInitJob *initJob = findJob(jobId);
    if (!initJob) {
        if (error) {
            *error = i18n("No such job: %1", jobId);
        }
        return std::nullopt;
    }
    if (!initJob->status().isTerminal()) {
        if (error) {
            *error = i18n("The job is still running");
        }
        return std::nullopt;
    }

    WorktreeInitRequest request = initJob->request();
    request.targetPath = initJob->status().worktreePath;
    return start(request, error);
}

QList<WorktreeJobStatus> WorktreeInitManager::status(const QString &projectPath) const
{
    const QString key = normalizePath(projectPath);

    QList<WorktreeJobStatus> result;
    // Newest first so equal timestamps keep the latest job on top
    for (auto it = m_jobs.crbegin(); it != m_jobs.crend(); ++it) {
        const WorktreeJobStatus &jobStatus = (*it)->status();
        if (key.isEmpty() || jobStatus.projectPath == key) {
            result.append(jobStatus);
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const WorktreeJobStatus &a, const WorktreeJobStatus &b) {
        return a.updatedAt > b.updatedAt;
    });
    return result;
}

std::optional<WorktreeJobStatus> WorktreeInitManager::job(const QString &jobId) const
{
    if (WorktreeInitJob *initJob = findJob(jobId)) {
        return initJob->status();
    }
    return std::nullopt;
}

bool WorktreeInitManager::hasActiveJob(const QString &worktreePath) const
{
    const QString key = normalizePath(worktreePath);
    for (const WorktreeInitJob *initJob : m_jobs) {
        if (!initJob->status().isTerminal() && initJob->status().worktreePath == key) {
            return true;
        }
    }
    return false;
}

WorktreeInitJob *WorktreeInitManager::findJob(const QString &jobId) const
{
    for (WorktreeInitJob *initJob : m_jobs) {
        if (initJob->jobId() == jobId) {
            return initJob;
        }
    }
    return nullptr;
}

void WorktreeInitManager::onJobFinished(const WorktreeJobStatus &status)
{
    qDebug() << "WorktreeInitManager: job" << status.jobId << "finished as" << worktreeJobStepName(status.step);

    if (status.step == WorktreeJobStep::Ready) {
        Q_EMIT jobReady(status);
    }
    Q_EMIT jobFinished(status);

    pruneFinishedJobs();
}

void WorktreeInitManager::pruneFinishedJobs()
{
    int finished = 0;
    for (const WorktreeInitJob *initJob : std::as_const(m_jobs)) {
        if (initJob->status().isTerminal()) {
            ++finished;
        }
    }

    // Oldest first; the job may still be inside its finished() emission
    for (auto it = m_jobs.begin(); it != m_jobs.end() && finished > m_finishedJobLimit;) {
        WorktreeInitJob *initJob = *it;
        if (!initJob->status().isTerminal()) {
            ++it;
            continue;
        }
        it = m_jobs.erase(it);
        --finished;
        initJob->disconnect(this);
        initJob->deleteLater();
    }
}

} // namespace DevHaven

#include "moc_WorktreeInitManager.cpp"
