/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACESTORE_H
#define WORKSPACESTORE_H

#include "devhavenprivate_export.h"

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>

namespace DevHaven
{

/**
 * WorkspaceStore keeps every project's terminal workspace in one JSON file,
 * keyed by project path:
 *
 *   { "version": 1, "workspaces": { "<projectPath>": { ... } } }
 *
 * Writes replace the file atomically.
 */
class DEVHAVENPRIVATE_EXPORT WorkspaceStore
{
public:
    /**
     * @param filePath storage file; empty uses defaultFilePath()
     */
    explicit WorkspaceStore(const QString &filePath = QString());

    QString filePath() const
    {
        return m_filePath;
    }

    /**
     * ~/.local/share/devhaven/terminal_workspaces.json
     */
    static QString defaultFilePath();

    /**
     * Serialized workspace of @p projectPath, or nothing when none is stored
     */
    std::optional<QByteArray> readWorkspaceFile(const QString &projectPath) const;

    /**
     * Store @p bytes (a JSON object) as the workspace of @p projectPath
     */
    bool writeWorkspaceFile(const QString &projectPath, const QByteArray &bytes, QString *error = nullptr);

    bool deleteWorkspace(const QString &projectPath, QString *error = nullptr);

    QStringList projectPaths() const;

    /**
     * Key used for @p projectPath inside the file
     */
    static QString normalizeProjectPath(const QString &projectPath);

private:
    // @p ok is false when the file exists but cannot be read
    QJsonObject readAll(bool *ok = nullptr) const;
    bool writeAll(const QJsonObject &workspaces, QString *error);

    QString m_filePath;
};

} // namespace DevHaven

#endif // WORKSPACESTORE_H
