/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRACKEDWORKTREESTORE_H
#define TRACKEDWORKTREESTORE_H

#include "devhavenprivate_export.h"

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

namespace DevHaven
{

/**
 * A worktree DevHaven created or adopted for a project
 */
struct DEVHAVENPRIVATE_EXPORT TrackedWorktree {
    QString path;
    QString branch;
    QString baseBranch;
    QString status; // creating, ready, failed, missing
    QString initJobId;
    qint64 updatedAt = 0;

    bool isValid() const
    {
        return !path.isEmpty();
    }

    QJsonObject toJson() const;
    static TrackedWorktree fromJson(const QJsonObject &obj);
};

/**
 * TrackedWorktreeStore persists each project's tracked worktree list in one
 * JSON file keyed by project path.
 */
class DEVHAVENPRIVATE_EXPORT TrackedWorktreeStore
{
public:
    static const QString StatusCreating;
    static const QString StatusReady;
    static const QString StatusFailed;
    static const QString StatusMissing;

    /**
     * @param filePath storage file; empty uses defaultFilePath()
     */
    explicit TrackedWorktreeStore(const QString &filePath = QString());

    QString filePath() const
    {
        return m_filePath;
    }

    /**
     * ~/.local/share/devhaven/tracked_worktrees.json
     */
    static QString defaultFilePath();

    QList<TrackedWorktree> worktrees(const QString &projectPath) const;

    /**
     * Add @p worktree, or replace the entry with the same path
     */
    bool upsert(const QString &projectPath, const TrackedWorktree &worktree, QString *error = nullptr);

    bool remove(const QString &projectPath, const QString &worktreePath, QString *error = nullptr);

    /**
     * Mark entries absent from @p livePaths as missing, and missing entries
     * that reappeared as ready.
     */
    bool reconcile(const QString &projectPath, const QStringList &livePaths, QString *error = nullptr);

private:
    // @p ok is false when the file exists but cannot be read
    QJsonObject readAll(bool *ok = nullptr) const;
    bool writeAll(const QJsonObject &projects, QString *error);
    bool store(const QString &projectPath, const QList<TrackedWorktree> &worktrees, QString *error);

    QString m_filePath;
};

} // namespace DevHaven

#endif // TRACKEDWORKTREESTORE_H
