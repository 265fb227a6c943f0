/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorkspacePersistence.h"

#include "DevhavenSettings.h"
#include "PtySessionRegistry.h"
#include "WorkspaceStore.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDebug>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QTimer>

namespace DevHaven
{

WorkspacePersistence::WorkspacePersistence(WorkspaceStore *store, PtySessionRegistry *registry, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_registry(registry)
    , m_debounceTimer(new QTimer(this))
{
    m_debounceTimer->setSingleShot(true);
    m_debounceTimer->setInterval(DEFAULT_DEBOUNCE_MS);
    if (auto *settings = DevhavenSettings::instance()) {
        setDebounceInterval(settings->saveDebounceMs());
        m_defaults = settings->workspaceDefaults();
    }
    connect(m_debounceTimer, &QTimer::timeout, this, &WorkspacePersistence::onDebounceTimeout);

    if (m_registry) {
        connect(m_registry, &PtySessionRegistry::outputActivity, this, &WorkspacePersistence::onOutputActivity);
    }

    if (QCoreApplication::instance()) {
        connect(QCoreApplication::instance(), &QCoreApplication::aboutToQuit, this, &WorkspacePersistence::flush);
    }
}

WorkspacePersistence::~WorkspacePersistence()
{
    flush();
}

void WorkspacePersistence::setDebounceInterval(int ms)
{
    m_debounceTimer->setInterval(qMax(0, ms));
}

int WorkspacePersistence::debounceInterval() const
{
    return m_debounceTimer->interval();
}

bool WorkspacePersistence::isSaveScheduled() const
{
    return m_debounceTimer->isActive();
}

QString WorkspacePersistence::windowLabel() const
{
    return SessionKey::windowLabelForProject(m_workspace.projectId);
}

std::optional<TerminalWorkspace> WorkspacePersistence::load(const QString &projectPath) const
{
    const std::optional<QByteArray> bytes = m_store->readWorkspaceFile(projectPath);
    if (!bytes) {
        return std::nullopt;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(*bytes, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "WorkspacePersistence: stored workspace for" << projectPath << "is unreadable:" << error.errorString();
        return std::nullopt;
    }

    return TerminalWorkspace::fromJson(doc.object(), m_defaults);
}

const TerminalWorkspace &WorkspacePersistence::open(const QString &projectPath, const QString &projectId)
{
    flush();

    const std::optional<TerminalWorkspace> stored = load(projectPath);
    if (stored) {
        m_workspace = TerminalWorkspace::normalize(*stored, projectPath, projectId, m_defaults);
    } else {
        qDebug() << "WorkspacePersistence: no stored workspace for" << projectPath << ", creating default";
        m_workspace = TerminalWorkspace::createDefault(projectPath, projectId, m_defaults);
    }
    m_dirty = false;
    return m_workspace;
}

void WorkspacePersistence::setWorkspace(const TerminalWorkspace &workspace)
{
    m_workspace = workspace;
    scheduleSave();
}

void WorkspacePersistence::scheduleSave()
{
    m_dirty = true;
    m_debounceTimer->start();
}

TerminalWorkspace WorkspacePersistence::withSnapshots(const TerminalWorkspace &workspace) const
{
    TerminalWorkspace result = workspace;
    if (!m_registry) {
        return result;
    }

    const QString label = SessionKey::windowLabelForProject(workspace.projectId);
    const QStringList ids = workspace.referencedSessionIds();
    for (const QString &id : ids) {
        const QString state = m_registry->snapshot(SessionKey{label, id});
        if (state.isNull()) {
            continue;
        }
        SessionSnapshot session = result.sessions.value(id);
        session.id = id;
        session.savedState = state;
        result.sessions.insert(id, session);
    }
    return result;
}

bool WorkspacePersistence::save(const TerminalWorkspace &workspace, QString *error)
{
    if (!workspace.isValid()) {
        return true;
    }

    TerminalWorkspace snapshot = TerminalWorkspace::normalize(withSnapshots(workspace), workspace.projectPath, workspace.projectId, m_defaults);
    snapshot.updatedAt = QDateTime::currentMSecsSinceEpoch();

    const QByteArray bytes = QJsonDocument(snapshot.toJson()).toJson(QJsonDocument::Compact);
    if (!m_store->writeWorkspaceFile(snapshot.projectPath, bytes, error)) {
        return false;
    }

    Q_EMIT saved(snapshot.projectPath);
    return true;
}

bool WorkspacePersistence::flush()
{
    m_debounceTimer->stop();
    if (!m_dirty) {
        return true;
    }

    QString error;
    if (!save(m_workspace, &error)) {
        qWarning() << "WorkspacePersistence: failed to save workspace for" << m_workspace.projectPath << ":" << error;
        return false;
    }
    m_dirty = false;
    return true;
}

void WorkspacePersistence::onDebounceTimeout()
{
    if (!flush()) {
        // Keep the changes and try again in the next window
        m_debounceTimer->start();
    }
}

void WorkspacePersistence::onOutputActivity(const SessionKey &key)
{
    if (!m_workspace.isValid() || key.windowLabel != windowLabel() || !m_workspace.sessions.contains(key.sessionId)) {
        return;
    }
    scheduleSave();
}

} // namespace DevHaven

#include "moc_WorkspacePersistence.cpp"
