/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorkspaceStore.h"

#include <KLocalizedString>

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

namespace DevHaven
{

WorkspaceStore::WorkspaceStore(const QString &filePath)
    : m_filePath(filePath.isEmpty() ? defaultFilePath() : filePath)
{
}

QString WorkspaceStore::defaultFilePath()
{
    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return dataDir + QStringLiteral("/devhaven/terminal_workspaces.json");
}

QString WorkspaceStore::normalizeProjectPath(const QString &projectPath)
{
    if (projectPath.isEmpty()) {
        return QString();
    }
    return QDir::cleanPath(projectPath);
}

QJsonObject WorkspaceStore::readAll(bool *ok) const
{
    if (ok) {
        *ok = true;
    }
    QFile file(m_filePath);
    if (!file.exists()) {
        return QJsonObject();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "WorkspaceStore: cannot read" << m_filePath << ":" << file.errorString();
        if (ok) {
            *ok = false;
        }
        return QJsonObject();
    }

    const QByteArray data = file.readAll();
    file.close();

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "WorkspaceStore: ignoring unreadable" << m_filePath << ":" << error.errorString();
        return QJsonObject();
    }

    return doc.object().value(QStringLiteral("workspaces")).toObject();
}

bool WorkspaceStore::writeAll(const QJsonObject &workspaces, QString *error)
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
    root[QStringLiteral("workspaces")] = workspaces;

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

std::optional<QByteArray> WorkspaceStore::readWorkspaceFile(const QString &projectPath) const
{
    const QJsonValue value = readAll().value(normalizeProjectPath(projectPath));
    if (!value.isObject()) {
        return std::nullopt;
    }
    return QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact);
}

bool WorkspaceStore::writeWorkspaceFile(const QString &projectPath, const QByteArray &bytes, QString *error)
{
    const QString key = normalizeProjectPath(projectPath);
    if (key.isEmpty()) {
        if (error) {
            *error = i18n("Project path is empty");
        }
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = i18n("Workspace data is not a JSON object");
        }
        return false;
    }

    bool readOk = false;
    QJsonObject workspaces = readAll(&readOk);
    if (!readOk) {
        if (error) {
            *error = i18n("Cannot read %1", m_filePath);
        }
        return false;
    }
    workspaces[key] = doc.object();
    return writeAll(workspaces, error);
}

bool WorkspaceStore::deleteWorkspace(const QString &projectPath, QString *error)
{
    bool readOk = false;
    QJsonObject workspaces = readAll(&readOk);
    if (!readOk) {
        if (error) {
            *error = i18n("Cannot read %1", m_filePath);
        }
        return false;
    }
    const QString key = normalizeProjectPath(projectPath);
    if (!workspaces.contains(key)) {
        return true;
    }
    workspaces.remove(key);
    return writeAll(workspaces, error);
}

QStringList WorkspaceStore::projectPaths() const
{
    return readAll().keys();
}

} // namespace DevHaven
