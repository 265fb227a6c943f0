/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "WorktreeInitJobTest.h"

// Qt
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTest>

// DevHaven
#include "../workspace/TrackedWorktreeStore.h"
#include "../workspace/WorktreeEnvironment.h"
#include "../workspace/WorktreeInitJob.h"
#include "FakeGitWorktreeManager.h"

using namespace DevHaven;

namespace
{

bool writeFile(const QString &path, const QByteArray &bytes)
{
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return false;
    }
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    return file.write(bytes) == bytes.size();
}

// Scratch project with a scripted repository and a tracked worktree store
struct Fixture {
    Fixture()
    {
        projectPath = QDir::cleanPath(dir.filePath(QStringLiteral("project")));
        worktreePath = QDir::cleanPath(dir.filePath(QStringLiteral("worktrees/project/feature-login")));
        QDir().mkpath(projectPath);
        git.repositories.insert(projectPath);
        git.branches = {QStringLiteral("main"), QStringLiteral("existing")};
    }

    WorktreeInitRequest request(const QString &branch = QStringLiteral("feature/login"), bool createBranch = true) const
    {
        WorktreeInitRequest r;
        r.projectId = QStringLiteral("project");
        r.projectPath = projectPath;
        r.projectName = QStringLiteral("project");
        r.branch = branch;
        r.baseBranch = QStringLiteral("main");
        r.createBranch = createBranch;
        return r;
    }

    QTemporaryDir dir;
    QString projectPath;
    QString worktreePath;
    FakeGitWorktreeManager git;
    TrackedWorktreeStore store{dir.filePath(QStringLiteral("tracked.json"))};
};

QList<WorktreeJobStep> stepsFrom(const QSignalSpy &spy)
{
    QList<WorktreeJobStep> steps;
    for (const QList<QVariant> &args : spy) {
        steps.append(args.at(0).value<WorktreeJobStatus>().step);
    }
    return steps;
}

}

void WorktreeInitJobTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    qRegisterMetaType<DevHaven::WorktreeJobStatus>();
}

void WorktreeInitJobTest::testStepNames()
{
    const QList<WorktreeJobStep> all{WorktreeJobStep::Pending,
                                     WorktreeJobStep::Validating,
                                     WorktreeJobStep::CheckingBranch,
                                     WorktreeJobStep::CreatingWorktree,
                                     WorktreeJobStep::PreparingEnvironment,
                                     WorktreeJobStep::Syncing,
                                     WorktreeJobStep::Ready,
                                     WorktreeJobStep::Failed,
                                     WorktreeJobStep::Cancelled};
    for (WorktreeJobStep step : all) {
        const std::optional<WorktreeJobStep> parsed = worktreeJobStepFromName(worktreeJobStepName(step));
        QVERIFY(parsed.has_value());
        QVERIFY(*parsed == step);
    }

    QCOMPARE(worktreeJobStepName(WorktreeJobStep::CheckingBranch), QStringLiteral("checking_branch"));
    QCOMPARE(worktreeJobStepName(WorktreeJobStep::CreatingWorktree), QStringLiteral("creating_worktree"));
    QVERIFY(!worktreeJobStepFromName(QStringLiteral("done")).has_value());

    QVERIFY(isTerminalStep(WorktreeJobStep::Ready));
    QVERIFY(isTerminalStep(WorktreeJobStep::Failed));
    QVERIFY(isTerminalStep(WorktreeJobStep::Cancelled));
    QVERIFY(!isTerminalStep(WorktreeJobStep::Syncing));
}

void WorktreeInitJobTest::testSanitize_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<QString>("expected");

    QTest::newRow("slash") << QStringLiteral("feature/login") << QStringLiteral("feature-login");
    QTest::newRow("kept") << QStringLiteral("v1.2_rc-3") << QStringLiteral("v1.2_rc-3");
    QTest::newRow("runs collapse") << QStringLiteral("a  //  b") << QStringLiteral("a-b");
    QTest::newRow("edges trimmed") << QStringLiteral("  --My Project!!  ") << QStringLiteral("My-Project");
    QTest::newRow("dots trimmed") << QStringLiteral("..hidden..") << QStringLiteral("hidden");
    QTest::newRow("nothing left") << QStringLiteral("///") << QString();
}

void WorktreeInitJobTest::testSanitize()
{
    QFETCH(QString, input);
    QFETCH(QString, expected);
    QCOMPARE(WorktreeInitJob::sanitize(input), expected);
}

void WorktreeInitJobTest::testTargetPathFor()
{
    QCOMPARE(WorktreeInitJob::targetPathFor(QStringLiteral("/wt/"), QStringLiteral("My Project"), QStringLiteral("feature/x")),
             QStringLiteral("/wt/My-Project/feature-x"));
}

void WorktreeInitJobTest::testHappyPath()
{
    Fixture f;
    QVERIFY(f.dir.isValid());

    WorktreeInitJob job(f.request(), f.worktreePath, &f.git, &f.store);
    QSignalSpy progressSpy(&job, &WorktreeInitJob::progress);
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);

    QVERIFY(job.status().isRunning);
    QCOMPARE(job.status().step, WorktreeJobStep::Pending);
    job.start();

    QTRY_COMPARE(finishedSpy.count(), 1);

    const QList<WorktreeJobStep> expected{WorktreeJobStep::Pending,
                                          WorktreeJobStep::Validating,
                                          WorktreeJobStep::CheckingBranch,
                                          WorktreeJobStep::CreatingWorktree,
                                          WorktreeJobStep::PreparingEnvironment,
                                          WorktreeJobStep::Syncing,
                                          WorktreeJobStep::Ready};
    QVERIFY(stepsFrom(progressSpy) == expected);
    QVERIFY(job.status().steps() == expected);

    const WorktreeJobStatus status = job.status();
    QCOMPARE(status.step, WorktreeJobStep::Ready);
    QVERIFY(!status.isRunning);
    QVERIFY(status.error.isEmpty());
    QVERIFY(status.warning.isEmpty());
    QVERIFY(status.updatedAt >= status.createdAt);
    QCOMPARE(f.git.addCount, 1);
    QCOMPARE(f.git.lastBaseBranch, QStringLiteral("main"));
    QVERIFY(QFileInfo(f.worktreePath).isDir());

    const QList<TrackedWorktree> tracked = f.store.worktrees(f.projectPath);
    QCOMPARE(tracked.size(), 1);
    QCOMPARE(tracked.first().path, f.worktreePath);
    QCOMPARE(tracked.first().status, TrackedWorktreeStore::StatusReady);
    QCOMPARE(tracked.first().initJobId, status.jobId);

    // Starting again does nothing
    job.start();
    QTest::qWait(20);
    QCOMPARE(progressSpy.count(), expected.size());
}

void WorktreeInitJobTest::testTargetDirectoryNotEmpty()
{
    Fixture f;
    QVERIFY(f.dir.isValid());
    QVERIFY(writeFile(f.worktreePath + QStringLiteral("/leftover.txt"), "x"));

    WorktreeInitJob job(f.request(), f.worktreePath, &f.git, &f.store);
    QSignalSpy progressSpy(&job, &WorktreeInitJob::progress);
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);
    job.start();

    QTRY_COMPARE(finishedSpy.count(), 1);
    QVERIFY(stepsFrom(progressSpy) == (QList<WorktreeJobStep>{WorktreeJobStep::Pending, WorktreeJobStep::Validating, WorktreeJobStep::Failed}));
    QVERIFY(job.status().error.contains(QStringLiteral("Target directory not empty")));
    QCOMPARE(f.git.addCount, 0);
    QVERIFY(f.store.worktrees(f.projectPath).isEmpty());
}

void WorktreeInitJobTest::testEmptyTargetDirectoryAccepted()
{
    Fixture f;
    QVERIFY(f.dir.isValid());
    QVERIFY(QDir().mkpath(f.worktreePath));

    WorktreeInitJob job(f.request(), f.worktreePath, &f.git, &f.store);
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);
    job.start();

    QTRY_COMPARE(finishedSpy.count(), 1);
    QCOMPARE(job.status().step, WorktreeJobStep::Ready);
}

void WorktreeInitJobTest::testNotARepository()
{
    Fixture f;
    QVERIFY(f.dir.isValid());
    f.git.repositories.clear();

    WorktreeInitJob job(f.request(), f.worktreePath, &f.git, &f.store);
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);
    job.start();

    QTRY_COMPARE(finishedSpy.count(), 1);
    QCOMPARE(job.status().step, WorktreeJobStep::Failed);
    QVERIFY(job.status().error.contains(f.projectPath));
}

void WorktreeInitJobTest::testInvalidBranchName()
{
    Fixture f;
    QVERIFY(f.dir.isValid());

    WorktreeInitJob job(f.request(QStringLiteral("bad..name")), f.worktreePath, &f.git, &f.store);
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);
    job.start();

    QTRY_COMPARE(finishedSpy.count(), 1);
    QCOMPARE(job.status().step, WorktreeJobStep::Failed);
    QVERIFY(job.status().steps().contains(WorktreeJobStep::Validating));
    QVERIFY(!job.status().steps().contains(WorktreeJobStep::CheckingBranch));
}

void WorktreeInitJobTest::testNewBranchAlreadyExists()
{
    Fixture f;
    QVERIFY(f.dir.isValid());

    WorktreeInitJob job(f.request(QStringLiteral("existing"), true), f.worktreePath, &f.git, &f.store);
    QSignalSpy progressSpy(&job, &WorktreeInitJob::progress);
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);
    job.start();

    QTRY_COMPARE(finishedSpy.count(), 1);
    QVERIFY(stepsFrom(progressSpy)
            == (QList<WorktreeJobStep>{WorktreeJobStep::Pending, WorktreeJobStep::Validating, WorktreeJobStep::CheckingBranch, WorktreeJobStep::Failed}));
    QVERIFY(job.status().error.contains(QStringLiteral("already exists")));
    QCOMPARE(f.git.addCount, 0);
}

void WorktreeInitJobTest::testExistingBranchMissing()
{
    Fixture f;
    QVERIFY(f.dir.isValid());

    WorktreeInitJob job(f.request(QStringLiteral("nowhere"), false), f.worktreePath, &f.git, &f.store);
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);
    job.start();

    QTRY_COMPARE(finishedSpy.count(), 1);
    QCOMPARE(job.status().step, WorktreeJobStep::Failed);
    QVERIFY(job.status().error.contains(QStringLiteral("does not exist")));

    // Checking out an existing branch works
    WorktreeInitJob existing(f.request(QStringLiteral("existing"), false), f.worktreePath, &f.git, &f.store);
    QSignalSpy existingSpy(&existing, &WorktreeInitJob::finished);
    existing.start();
    QTRY_COMPARE(existingSpy.count(), 1);
    QCOMPARE(existing.status().step, WorktreeJobStep::Ready);
}

void WorktreeInitJobTest::testAddWorktreeFails()
{
    Fixture f;
    QVERIFY(f.dir.isValid());
    f.git.addError = QStringLiteral("fatal: '%1' is already checked out").arg(QStringLiteral("main"));

    WorktreeInitJob job(f.request(), f.worktreePath, &f.git, &f.store);
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);
    job.start();

    QTRY_COMPARE(finishedSpy.count(), 1);
    QCOMPARE(job.status().step, WorktreeJobStep::Failed);
    QCOMPARE(job.status().error, f.git.addError);
    QVERIFY(job.status().steps().contains(WorktreeJobStep::CreatingWorktree));

    const QList<TrackedWorktree> tracked = f.store.worktrees(f.projectPath);
    QCOMPARE(tracked.size(), 1);
    QCOMPARE(tracked.first().status, TrackedWorktreeStore::StatusFailed);
}

void WorktreeInitJobTest::testCancelWhilePending()
{
    Fixture f;
    QVERIFY(f.dir.isValid());

    WorktreeInitJob job(f.request(), f.worktreePath, &f.git, &f.store);
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);

    QVERIFY(job.requestCancel());
    QCOMPARE(job.status().step, WorktreeJobStep::Cancelled);
    QVERIFY(job.status().cancelRequested);
    QCOMPARE(finishedSpy.count(), 1);

    job.start();
    QTest::qWait(20);
    QCOMPARE(job.status().step, WorktreeJobStep::Cancelled);
    QCOMPARE(f.git.addCount, 0);
}

void WorktreeInitJobTest::testCancelWhileCheckingBranch()
{
    Fixture f;
    QVERIFY(f.dir.isValid());
    f.git.holdBranches = true;

    WorktreeInitJob job(f.request(), f.worktreePath, &f.git, &f.store);
    QSignalSpy progressSpy(&job, &WorktreeInitJob::progress);
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);
    job.start();

    QTRY_COMPARE(job.status().step, WorktreeJobStep::CheckingBranch);

    QString error;
    QVERIFY2(job.requestCancel(&error), qPrintable(error));
    QCOMPARE(job.status().step, WorktreeJobStep::Cancelled);
    QVERIFY(!job.status().isRunning);
    QCOMPARE(finishedSpy.count(), 1);

    // The late git reply is ignored
    const int progressCount = progressSpy.count();
    f.git.releaseBranches();
    QTest::qWait(50);
    QCOMPARE(progressSpy.count(), progressCount);
    QCOMPARE(job.status().step, WorktreeJobStep::Cancelled);
    QCOMPARE(f.git.addCount, 0);
    QVERIFY(!QFileInfo::exists(f.worktreePath));
}

void WorktreeInitJobTest::testCancelRefusedWhileCreating()
{
    Fixture f;
    QVERIFY(f.dir.isValid());
    f.git.holdAdd = true;

    WorktreeInitJob job(f.request(), f.worktreePath, &f.git, &f.store);
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);
    job.start();

    QTRY_COMPARE(f.git.addCount, 1);
    QCOMPARE(job.status().step, WorktreeJobStep::CreatingWorktree);
    QCOMPARE(f.store.worktrees(f.projectPath).first().status, TrackedWorktreeStore::StatusCreating);

    QString error;
    QVERIFY(!job.requestCancel(&error));
    QVERIFY(error.contains(QStringLiteral("creating_worktree")));
    QVERIFY(!job.status().cancelRequested);

    f.git.releaseAdd();
    QTRY_COMPARE(finishedSpy.count(), 1);
    QCOMPARE(job.status().step, WorktreeJobStep::Ready);
}

void WorktreeInitJobTest::testCancelRefusedWhenFinished()
{
    Fixture f;
    QVERIFY(f.dir.isValid());
    f.git.repositories.clear();

    WorktreeInitJob job(f.request(), f.worktreePath, &f.git, &f.store);
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);
    job.start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    QString error;
    QVERIFY(!job.requestCancel(&error));
    QVERIFY(!error.isEmpty());
    QCOMPARE(job.status().step, WorktreeJobStep::Failed);
    QCOMPARE(finishedSpy.count(), 1);
}

void WorktreeInitJobTest::testSetupCommands()
{
    Fixture f;
    QVERIFY(f.dir.isValid());
    QVERIFY(writeFile(f.projectPath + QStringLiteral("/.devhaven/config.json"),
                      R"({"setup": ["echo \"$DEVHAVEN_WORKSPACE_NAME\" > name.txt", "  ", "echo \"$DEVHAVEN_ROOT_PATH\" > root.txt"]})"));
    QVERIFY(writeFile(f.projectPath + QStringLiteral("/.devhaven/scripts/bootstrap.sh"), "true\n"));

    QCOMPARE(WorktreeEnvironment::loadSetupCommands(f.projectPath).size(), 2);

    WorktreeInitJob job(f.request(), f.worktreePath, &f.git, &f.store);
    job.setShell(QStringLiteral("/bin/sh"));
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);
    job.start();

    QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 30000);
    QCOMPARE(job.status().step, WorktreeJobStep::Ready);
    QVERIFY2(job.status().warning.isEmpty(), qPrintable(job.status().warning));

    QVERIFY(QFileInfo::exists(f.worktreePath + QStringLiteral("/.devhaven/config.json")));
    QVERIFY(QFileInfo::exists(f.worktreePath + QStringLiteral("/.devhaven/scripts/bootstrap.sh")));

    QFile name(f.worktreePath + QStringLiteral("/name.txt"));
    QVERIFY(name.open(QIODevice::ReadOnly));
    QCOMPARE(name.readAll().trimmed(), QByteArray("feature-login"));

    QFile root(f.worktreePath + QStringLiteral("/root.txt"));
    QVERIFY(root.open(QIODevice::ReadOnly));
    QCOMPARE(QString::fromUtf8(root.readAll().trimmed()), f.projectPath);
}

void WorktreeInitJobTest::testSetupCommandFailureIsWarning()
{
    Fixture f;
    QVERIFY(f.dir.isValid());
    QVERIFY(writeFile(f.projectPath + QStringLiteral("/.devhaven/config.json"), R"({"setup": ["touch first.txt", "echo broken; exit 3", "touch never.txt"]})"));

    WorktreeInitJob job(f.request(), f.worktreePath, &f.git, &f.store);
    job.setShell(QStringLiteral("/bin/sh"));
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);
    job.start();

    QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 30000);
    QCOMPARE(job.status().step, WorktreeJobStep::Ready);
    QVERIFY(job.status().error.isEmpty());

    const QString warning = job.status().warning;
    QVERIFY(warning.contains(QStringLiteral("exit 3")));
    QVERIFY(warning.contains(QStringLiteral("broken")));
    QVERIFY(QFileInfo::exists(f.worktreePath + QStringLiteral("/first.txt")));
    QVERIFY(!QFileInfo::exists(f.worktreePath + QStringLiteral("/never.txt")));
}

void WorktreeInitJobTest::testSetupConfigUnreadable()
{
    Fixture f;
    QVERIFY(f.dir.isValid());
    QVERIFY(writeFile(f.projectPath + QStringLiteral("/.devhaven/config.json"), "{ setup"));

    QString error;
    QVERIFY(WorktreeEnvironment::loadSetupCommands(f.projectPath, &error).isEmpty());
    QVERIFY(!error.isEmpty());

    WorktreeInitJob job(f.request(), f.worktreePath, &f.git, &f.store);
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);
    job.start();

    QTRY_COMPARE(finishedSpy.count(), 1);
    QCOMPARE(job.status().step, WorktreeJobStep::Ready);
    QVERIFY(job.status().warning.contains(QStringLiteral("config.json")));
}

void WorktreeInitJobTest::testStatusJson()
{
    Fixture f;
    QVERIFY(f.dir.isValid());

    WorktreeInitJob job(f.request(), f.worktreePath, &f.git, &f.store);
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);
    job.start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    const QJsonObject obj = job.status().toJson();
    QCOMPARE(obj.value(QStringLiteral("jobId")).toString(), job.jobId());
    QCOMPARE(obj.value(QStringLiteral("step")).toString(), QStringLiteral("ready"));
    QCOMPARE(obj.value(QStringLiteral("worktreePath")).toString(), f.worktreePath);
    QVERIFY(obj.value(QStringLiteral("error")).isNull());
    QVERIFY(!obj.value(QStringLiteral("isRunning")).toBool());

    const QJsonObject timestamps = obj.value(QStringLiteral("timestamps")).toObject();
    QVERIFY(timestamps.contains(QStringLiteral("pending")));
    QVERIFY(timestamps.contains(QStringLiteral("preparing_environment")));
    QVERIFY(timestamps.contains(QStringLiteral("ready")));
    QVERIFY(!timestamps.contains(QStringLiteral("failed")));
}

void WorktreeInitJobTest::testDiagnostics()
{
    Fixture f;
    QVERIFY(f.dir.isValid());
    f.git.repositories.clear();

    WorktreeInitJob job(f.request(), f.worktreePath, &f.git, &f.store);
    QSignalSpy finishedSpy(&job, &WorktreeInitJob::finished);
    job.start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(job.status().diagnostics().toUtf8(), &parseError);
    QCOMPARE(parseError.error, QJsonParseError::NoError);

    const QJsonObject obj = doc.object();
    QCOMPARE(obj.value(QStringLiteral("jobId")).toString(), job.jobId());
    QCOMPARE(obj.value(QStringLiteral("step")).toString(), QStringLiteral("failed"));
    QCOMPARE(obj.value(QStringLiteral("error")).toString(), job.status().error);

    const QJsonArray timeline = obj.value(QStringLiteral("timestamps")).toArray();
    QCOMPARE(timeline.size(), 3);
    QCOMPARE(timeline.at(0).toObject().value(QStringLiteral("step")).toString(), QStringLiteral("pending"));
    QCOMPARE(timeline.at(2).toObject().value(QStringLiteral("step")).toString(), QStringLiteral("failed"));
    QVERIFY(!timeline.at(1).toObject().value(QStringLiteral("at")).toString().isEmpty());
}

QTEST_GUILESS_MAIN(WorktreeInitJobTest)

#include "moc_WorktreeInitJobTest.cpp"
