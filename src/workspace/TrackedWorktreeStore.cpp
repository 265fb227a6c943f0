/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TrackedWorktreeStore.h"

#include <KLocalizedString>

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QStandardPaths>

namespace DevHaven
{

const QString TrackedWorktreeStore::StatusCreating = QStringLiteral("creating");
const QString TrackedWorktreeStore::StatusReady = QStringLiteral("ready");
const QString TrackedWorktreeStore::StatusFailed = QStringLiteral("failed");
const QString TrackedWorktreeStore::StatusMissing = QStringLiteral("missing");

QJsonObject TrackedWorktree::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("path")] = path;
    obj[QStringLiteral("branch")] = branch;
    obj[QStringLiteral("baseBranch")] = baseBranch.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(baseBranch);
    obj[QStringLiteral("status")] = status;
    obj[QStringLiteral("initJobId")] = initJobId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(initJobId);
    obj[QStringLiteral("updatedAt")] = updatedAt;
    return obj;
}

TrackedWorktree TrackedWorktree::fromJson(const QJsonObject &obj)
{
    TrackedWorktree worktree;
    worktree.path = obj.value(QStringLiteral("path")).toString();
    worktree.branch = obj.value(QStringLiteral("branch")).toString();
    worktree.baseBranch = obj.value(QStringLiteral("baseBranch")).toString();
    worktree.status = obj.value(QStringLiteral("status")).toString();
    worktree.initJobId = obj.value(QStringLiteral("initJobId")).toString();
    worktree.updatedAt = static_cast<qint64>(obj.value(QStringLiteral("updatedAt")).toDouble(0));
    return worktree;
}

TrackedWorktreeStore::TrackedWorktreeStore(const QString &filePath)
    : m_filePath(filePath.isEmpty() ? defaultFilePath() : filePath)
{
}

QString TrackedWorktreeStore::defaultFilePath()
{
    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return dataDir + QStringLiteral("/devhaven/tracked_worktrees.json");
}

QJsonObject TrackedWorktreeStore::readAll(bool *ok) const
{
    if (ok) {
        *ok = true;
    }
    QFile file(m_filePath);
    if (!file.exists()) {
        return QJsonObject();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "TrackedWorktreeStore: cannot read" << m_filePath << ":" << file.errorString();
        if (ok) {
            *ok = false;
        }
        return QJsonObject();
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "TrackedWorktreeStore: ignoring unreadable" << m_filePath << ":" << error.errorString();
        return QJsonObject();
    }
    return doc.object().value(QStringLiteral("projects")).toObject();
}

bool TrackedWorktreeStore::writeAll(const QJsonObject &projects, QString *error)
{
    QFileInfo fileInfo(m_filePath);
    if (!QDir().mkpath(fileInfo.absolutePath())) {
        if (error) {
            *error = i18n("Cannot create directory %1", fileInfo.absolutePath());
        }
        return false;
    }

    QJsonObject root;
    root[QStringLiteral("version")] = 1;
    root[QStringLiteral("projects")] = projects;

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) {
            *error = file.errorString();
        }
        return false;
    }
    const QByteArray bytes = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size()) {
        file.cancelWriting();
    }
    if (!file.commit()) {
        if (error) {
            *error = file.errorString();
        }
        return false;
    }
    return true;
}

bool TrackedWorktreeStore::store(const QString &projectPath, const QList<TrackedWorktree> &worktrees, QString *error)
{
    QJsonArray array;
    for (const TrackedWorktree &worktree : worktrees) {
        array.append(worktree.toJson());
    }

    bool readOk = false;
    QJsonObject projects = readAll(&readOk);
    if (!readOk) {
        if (error) {
            *error = i18n("Cannot read %1", m_filePath);
        }
        return false;
    }
    projects[QDir::cleanPath(projectPath)] = array;
    return writeAll(projects, error);
}

QList<TrackedWorktree> TrackedWorktreeStore::worktrees(const QString &projectPath) const
{
    QList<TrackedWorktree> result;
    const QJsonArray array = readAll().value(QDir::cleanPath(projectPath)).toArray();
    for (const QJsonValue &value : array) {
        const TrackedWorktree worktree = TrackedWorktree::fromJson(value.toObject());
        if (worktree.isValid()) {
            result.append(worktree);
        }
    }
    return result;
}

bool TrackedWorktreeStore::upsert(const QString &projectPath, const TrackedWorktree &worktree, QString *error)
{
    if (!worktree.isValid()) {
        if (error) {
            *error = i18n("Worktree path is empty");
        }
        return false;
    }

    TrackedWorktree entry = worktree;
    entry.path = QDir::cleanPath(entry.path);
    if (entry.updatedAt <= 0) {
        entry.updatedAt = QDateTime::currentMSecsSinceEpoch();
    }

    QList<TrackedWorktree> list = worktrees(projectPath);
    bool replaced = false;
    for (TrackedWorktree &existing : list) {
        if (QDir::cleanPath(existing.path) == entry.path) {
            existing = entry;
            replaced = true;
            break;
        }
    }
    if (!replaced) {
        list.append(entry);
    }

    return store(projectPath, list, error);
}

bool TrackedWorktreeStore::remove(const QString &projectPath, const QString &worktreePath, QString *error)
{
    QList<TrackedWorktree> list = worktrees(projectPath);
    const QString target = QDir::cleanPath(worktreePath);
    const auto removed = list.removeIf([&target](const TrackedWorktree &w) {
        return QDir::cleanPath(w.path) == target;
    });
    if (removed == 0) {
        return true;
    }
    return store(projectPath, list, error);
}

bool TrackedWorktreeStore::reconcile(const QString &projectPath, const QStringList &livePaths, QString *error)
{
    QStringList live;
    for (const QString &path : livePaths) {
        live.append(QDir::cleanPath(path));
    }

    QList<TrackedWorktree> list = worktrees(projectPath);
    bool changed = false;
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    for (TrackedWorktree &worktree : list) {
        const bool present = live.contains(QDir::cleanPath(worktree.path));
        if (!present && worktree.status != StatusMissing && worktree.status != StatusCreating && worktree.status != StatusFailed) {
            worktree.status = StatusMissing;
            worktree.updatedAt = now;
            changed = true;
        } else if (present && worktree.status == StatusMissing) {
            worktree.status = StatusReady;
            worktree.updatedAt = now;
            changed = true;
        }
    }

    if (!changed) {
        return true;
    }
    return store(projectPath, list, error);
}

} // namespace DevHaven
