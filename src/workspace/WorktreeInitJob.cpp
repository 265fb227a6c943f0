/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorktreeInitJob.h"

#include "GitWorktreeManager.h"
#include "TrackedWorktreeStore.h"
#include "WorktreeEnvironment.h"

#include <KLocalizedString>

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTimer>
#include <QUuid>

namespace DevHaven
{

namespace
{

struct StepName {
    WorktreeJobStep step;
    const char *name;
};

const StepName StepNames[] = {
    {WorktreeJobStep::Pending, "pending"},
    {WorktreeJobStep::Validating, "validating"},
    {WorktreeJobStep::CheckingBranch, "checking_branch"},
    {WorktreeJobStep::CreatingWorktree, "creating_worktree"},
    {WorktreeJobStep::PreparingEnvironment, "preparing_environment"},
    {WorktreeJobStep::Syncing, "syncing"},
    {WorktreeJobStep::Ready, "ready"},
    {WorktreeJobStep::Failed, "failed"},
    {WorktreeJobStep::Cancelled, "cancelled"},
};

qint64 now()
{
    return QDateTime::currentMSecsSinceEpoch();
}

} // namespace

QString worktreeJobStepName(WorktreeJobStep step)
{
    for (const StepName &entry : StepNames) {
        if (entry.step == step) {
            return QString::fromLatin1(entry.name);
        }
    }
    return QString();
}

std::optional<WorktreeJobStep> worktreeJobStepFromName(const QString &name)
{
    for (const StepName &entry : StepNames) {
        if (name == QLatin1String(entry.name)) {
            return entry.step;
        }
    }
    return std::nullopt;
}

bool isTerminalStep(WorktreeJobStep step)
{
    return step == WorktreeJobStep::Ready || step == WorktreeJobStep::Failed || step == WorktreeJobStep::Cancelled;
}

QList<WorktreeJobStep> WorktreeJobStatus::steps() const
{
    QList<WorktreeJobStep> result;
    result.reserve(transitions.size());
    for (const WorktreeStepTransition &transition : transitions) {
        result.append(transition.step);
    }
    return result;
}

QJsonObject WorktreeJobStatus::toJson() const
{
    QJsonObject timestamps;
    for (const WorktreeStepTransition &transition : transitions) {
        timestamps.insert(worktreeJobStepName(transition.step), transition.at);
    }

    QJsonObject obj;
    obj[QStringLiteral("jobId")] = jobId;
    obj[QStringLiteral("projectId")] = projectId;
    obj[QStringLiteral("projectPath")] = projectPath;
    obj[QStringLiteral("worktreePath")] = worktreePath;
    obj[QStringLiteral("branch")] = branch;
    obj[QStringLiteral("baseBranch")] = baseBranch;
    obj[QStringLiteral("createBranch")] = createBranch;
    obj[QStringLiteral("step")] = worktreeJobStepName(step);
    obj[QStringLiteral("message")] = message;
    obj[QStringLiteral("error")] = error.isEmpty() ? QJsonValue() : QJsonValue(error);
    obj[QStringLiteral("warning")] = warning.isEmpty() ? QJsonValue() : QJsonValue(warning);
    obj[QStringLiteral("createdAt")] = createdAt;
    obj[QStringLiteral("updatedAt")] = updatedAt;
    obj[QStringLiteral("timestamps")] = timestamps;
    obj[QStringLiteral("cancelRequested")] = cancelRequested;
    obj[QStringLiteral("isRunning")] = isRunning;
    return obj;
}

QString WorktreeJobStatus::diagnostics() const
{
    QJsonArray timeline;
    for (const WorktreeStepTransition &transition : transitions) {
        timeline.append(QJsonObject{
            {QStringLiteral("step"), worktreeJobStepName(transition.step)},
            {QStringLiteral("at"), QDateTime::fromMSecsSinceEpoch(transition.at).toString(Qt::ISODateWithMs)},
        });
    }

    QJsonObject obj;
    obj[QStringLiteral("jobId")] = jobId;
    obj[QStringLiteral("worktreePath")] = worktreePath;
    obj[QStringLiteral("branch")] = branch;
    obj[QStringLiteral("step")] = worktreeJobStepName(step);
    obj[QStringLiteral("message")] = message;
    obj[QStringLiteral("error")] = error.isEmpty() ? QJsonValue() : QJsonValue(error);
    obj[QStringLiteral("warning")] = warning.isEmpty() ? QJsonValue() : QJsonValue(warning);
    obj[QStringLiteral("timestamps")] = timeline;
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Indented));
}

WorktreeInitJob::WorktreeInitJob(const WorktreeInitRequest &request,
                                 const QString &worktreePath,
                                 GitWorktreeManager *git,
                                 TrackedWorktreeStore *trackedStore,
                                 QObject *parent)
    : QObject(parent)
    , m_request(request)
    , m_git(git)
    , m_trackedStore(trackedStore)
{
    m_status.jobId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    m_status.projectId = request.projectId;
    m_status.projectPath = request.projectPath;
    m_status.projectName = request.projectName;
    m_status.worktreePath = worktreePath;
    m_status.branch = request.branch;
    m_status.baseBranch = request.baseBranch;
    m_status.createBranch = request.createBranch;
    m_status.createdAt = now();
    m_status.updatedAt = m_status.createdAt;
    m_status.step = WorktreeJobStep::Pending;
    m_status.message = i18n("Queued");
    m_status.transitions.append(WorktreeStepTransition{WorktreeJobStep::Pending, m_status.createdAt});
    m_status.isRunning = true;
}

WorktreeInitJob::~WorktreeInitJob() = default;

void WorktreeInitJob::start()
{
    if (m_started || m_status.step != WorktreeJobStep::Pending) {
        return;
    }
    m_started = true;

    qDebug() << "WorktreeInitJob:" << m_status.jobId << "queued for" << m_status.worktreePath;
    Q_EMIT progress(m_status);
    QTimer::singleShot(0, this, &WorktreeInitJob::validate);
}

bool WorktreeInitJob::requestCancel(QString *error)
{
    switch (m_status.step) {
    case WorktreeJobStep::Pending:
    case WorktreeJobStep::Validating:
    case WorktreeJobStep::CheckingBranch:
        break;
    case WorktreeJobStep::Ready:
    case WorktreeJobStep::Failed:
    case WorktreeJobStep::Cancelled:
        if (error) {
            *error = i18n("The job has already finished");
        }
        return false;
    default:
        if (error) {
            *error = i18n("The job cannot be cancelled while %1", worktreeJobStepName(m_status.step));
        }
        return false;
    }

    m_status.cancelRequested = true;
    qDebug() << "WorktreeInitJob:" << m_status.jobId << "cancelled during" << worktreeJobStepName(m_status.step);
    enterStep(WorktreeJobStep::Cancelled, i18n("Cancelled"));
    return true;
}

QString WorktreeInitJob::sanitize(const QString &name)
{
    QString result;
    result.reserve(name.size());
    for (const QChar c : name) {
        const bool allowed = (c >= QLatin1Char('a') && c <= QLatin1Char('z')) || (c >= QLatin1Char('A') && c <= QLatin1Char('Z'))
            || (c >= QLatin1Char('0') && c <= QLatin1Char('9')) || c == QLatin1Char('.') || c == QLatin1Char('_') || c == QLatin1Char('-');
        const QChar mapped = allowed ? c : QLatin1Char('-');
        if (mapped == QLatin1Char('-') && result.endsWith(QLatin1Char('-'))) {
            continue;
        }
        result.append(mapped);
    }

    int begin = 0;
    int end = result.size();
    auto trimmed = [](QChar c) {
        return c == QLatin1Char('-') || c == QLatin1Char('.');
    };
    while (begin < end && trimmed(result.at(begin))) {
        ++begin;
    }
    while (end > begin && trimmed(result.at(end - 1))) {
        --end;
    }
    return result.mid(begin, end - begin);
}

QString WorktreeInitJob::targetPathFor(const QString &worktreeRoot, const QString &projectName, const QString &branch)
{
    return QDir::cleanPath(worktreeRoot + QLatin1Char('/') + sanitize(projectName) + QLatin1Char('/') + sanitize(branch));
}

void WorktreeInitJob::enterStep(WorktreeJobStep step, const QString &message)
{
    const qint64 at = now();
    m_status.step = step;
    m_status.message = message;
    m_status.updatedAt = at;
    m_status.transitions.append(WorktreeStepTransition{step, at});

    const bool terminal = isTerminalStep(step);
    if (terminal) {
        m_status.isRunning = false;
    }

    Q_EMIT progress(m_status);
    if (terminal) {
        Q_EMIT finished(m_status);
    }
}

void WorktreeInitJob::fail(const QString &message, const QString &error)
{
    qWarning() << "WorktreeInitJob:" << m_status.jobId << message << error;
    m_status.error = error;
    enterStep(WorktreeJobStep::Failed, message);
}

void WorktreeInitJob::validate()
{
    if (m_status.isTerminal()) {
        return;
    }
    enterStep(WorktreeJobStep::Validating, i18n("Validating repository"));

    if (!m_git) {
        fail(i18n("Validation failed"), i18n("No Git backend available"));
        return;
    }
    if (!m_git->isGitRepository(m_status.projectPath)) {
        fail(i18n("Validation failed"), i18n("%1 is not a Git repository", m_status.projectPath));
        return;
    }
    if (!GitWorktreeManager::isValidBranchName(m_status.branch)) {
        fail(i18n("Validation failed"), i18n("Invalid branch name: %1", m_status.branch));
        return;
    }

    const QFileInfo target(m_status.worktreePath);
    if (target.exists()) {
        if (!target.isDir()) {
            fail(i18n("Validation failed"), i18n("Target path exists and is not a directory: %1", m_status.worktreePath));
            return;
        }
        const QDir dir(m_status.worktreePath);
        if (!dir.entryList(QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot).isEmpty()) {
            fail(i18n("Validation failed"), i18n("Target directory not empty: %1", m_status.worktreePath));
            return;
        }
    }

    QTimer::singleShot(0, this, &WorktreeInitJob::checkBranch);
}

void WorktreeInitJob::checkBranch()
{
    if (m_status.isTerminal()) {
        return;
    }
    enterStep(WorktreeJobStep::CheckingBranch, i18n("Checking branch availability"));

    if (!m_git) {
        fail(i18n("Branch check failed"), i18n("No Git backend available"));
        return;
    }

    QPointer<WorktreeInitJob> self(this);
    m_git->listBranches(m_status.projectPath, [self](bool ok, const QList<GitWorktreeManager::BranchInfo> &branches, const QString &error) {
        // Cancelled or destroyed while git was running
        if (!self || self->m_status.isTerminal()) {
            return;
        }
        if (!ok) {
            self->fail(i18n("Branch check failed"), error);
            return;
        }

        bool exists = false;
        for (const GitWorktreeManager::BranchInfo &branch : branches) {
            if (branch.name == self->m_status.branch) {
                exists = true;
                break;
            }
        }

        if (self->m_status.createBranch && exists) {
            self->fail(i18n("Branch check failed"), i18n("Branch %1 already exists; use the existing branch or pick another name", self->m_status.branch));
            return;
        }
        if (!self->m_status.createBranch && !exists) {
            self->fail(i18n("Branch check failed"), i18n("Branch %1 does not exist", self->m_status.branch));
            return;
        }

        QTimer::singleShot(0, self.data(), &WorktreeInitJob::createWorktree);
    });
}

void WorktreeInitJob::createWorktree()
{
    if (m_status.isTerminal()) {
        return;
    }
    enterStep(WorktreeJobStep::CreatingWorktree, i18n("Creating Git worktree"));

    if (!m_git) {
        fail(i18n("Creating the worktree failed"), i18n("No Git backend available"));
        return;
    }

    const QString parent = QFileInfo(m_status.worktreePath).absolutePath();
    if (!QDir().mkpath(parent)) {
        fail(i18n("Creating the worktree failed"), i18n("Cannot create directory %1", parent));
        return;
    }

    trackWorktree(TrackedWorktreeStore::StatusCreating);

    QPointer<WorktreeInitJob> self(this);
    m_git->addWorktree(m_status.projectPath,
                       m_status.worktreePath,
                       m_status.branch,
                       m_status.createBranch,
                       m_status.baseBranch,
                       [self](bool ok, const QString &error) {
                           if (!self || self->m_status.isTerminal()) {
                               return;
                           }
                           if (!ok) {
                               self->trackWorktree(TrackedWorktreeStore::StatusFailed);
                               self->fail(i18n("Creating the worktree failed"), error);
                               return;
                           }
                           QTimer::singleShot(0, self.data(), &WorktreeInitJob::prepareEnvironment);
                       });
}

void WorktreeInitJob::prepareEnvironment()
{
    if (m_status.isTerminal()) {
        return;
    }
    enterStep(WorktreeJobStep::PreparingEnvironment, i18n("Preparing environment"));

    if (!m_environment) {
        m_environment = new WorktreeEnvironment(this);
    }
    m_environment->setShell(m_shell);

    const QString workspaceName = QFileInfo(m_status.worktreePath).fileName();
    QPointer<WorktreeInitJob> self(this);
    m_environment->prepare(m_status.projectPath, m_status.worktreePath, workspaceName, [self](const QString &warning) {
        if (!self || self->m_status.isTerminal()) {
            return;
        }
        self->m_status.warning = warning;
        QTimer::singleShot(0, self.data(), &WorktreeInitJob::sync);
    });
}

void WorktreeInitJob::sync()
{
    if (m_status.isTerminal()) {
        return;
    }
    enterStep(WorktreeJobStep::Syncing, i18n("Syncing workspace state"));

    trackWorktree(TrackedWorktreeStore::StatusReady);

    if (!m_git) {
        enterStep(WorktreeJobStep::Ready, i18n("Worktree ready"));
        return;
    }

    QPointer<WorktreeInitJob> self(this);
    m_git->listWorktrees(m_status.projectPath, [self](bool ok, const QList<GitWorktreeManager::WorktreeInfo> &worktrees, const QString &error) {
        if (!self || self->m_status.isTerminal()) {
            return;
        }

        if (!ok) {
            qWarning() << "WorktreeInitJob: listing worktrees failed:" << error;
        } else if (self->m_trackedStore) {
            QStringList livePaths;
            for (const GitWorktreeManager::WorktreeInfo &info : worktrees) {
                livePaths.append(info.path);
            }
            QString storeError;
            if (!self->m_trackedStore->reconcile(self->m_status.projectPath, livePaths, &storeError)) {
                qWarning() << "WorktreeInitJob: reconciling tracked worktrees failed:" << storeError;
            }
        }

        qDebug() << "WorktreeInitJob:" << self->m_status.jobId << "ready at" << self->m_status.worktreePath;
        self->enterStep(WorktreeJobStep::Ready, i18n("Worktree ready"));
    });
}

void WorktreeInitJob::trackWorktree(const QString &trackedStatus)
{
    if (!m_trackedStore) {
        return;
    }

    TrackedWorktree worktree;
    worktree.path = m_status.worktreePath;
    worktree.branch = m_status.branch;
    worktree.baseBranch = m_status.baseBranch;
    worktree.status = trackedStatus;
    worktree.initJobId = m_status.jobId;
    worktree.updatedAt = now();

    QString error;
    if (!m_trackedStore->upsert(m_status.projectPath, worktree, &error)) {
        qWarning() << "WorktreeInitJob: tracking" << m_status.worktreePath << "failed:" << error;
    }
}

} // namespace DevHaven

#include "moc_WorktreeInitJob.cpp"
