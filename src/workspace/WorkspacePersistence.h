/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACEPERSISTENCE_H
#define WORKSPACEPERSISTENCE_H

#include "devhavenprivate_export.h"

#include "PtySessionRegistry.h"
#include "TerminalWorkspace.h"

#include <QObject>
#include <QPointer>
#include <QString>

#include <optional>

class QTimer;

namespace DevHaven
{

class WorkspaceStore;

/**
 * WorkspacePersistence keeps one project's workspace on disk.
 *
 * Every change marks the workspace dirty and restarts a debounce timer; when
 * it fires, the live terminal buffers are snapshotted through the registry
 * and the whole workspace is written. A failed write is logged and retried
 * in the next debounce window. flush() writes pending changes immediately
 * and runs on application shutdown and destruction.
 */
class DEVHAVENPRIVATE_EXPORT WorkspacePersistence : public QObject
{
    Q_OBJECT

public:
    static constexpr int DEFAULT_DEBOUNCE_MS = 800;

    /**
     * @param store durable storage; not owned
     * @param registry source of terminal snapshots; may be null
     */
    WorkspacePersistence(WorkspaceStore *store, PtySessionRegistry *registry, QObject *parent = nullptr);
    ~WorkspacePersistence() override;

    void setDebounceInterval(int ms);
    int debounceInterval() const;

    void setDefaults(const WorkspaceDefaults &defaults)
    {
        m_defaults = defaults;
    }

    /**
     * Stored workspace of @p projectPath, exactly as read. Null when nothing
     * is stored or the data is not a JSON object.
     */
    std::optional<TerminalWorkspace> load(const QString &projectPath) const;

    /**
     * Load, repair and adopt the workspace of @p projectPath, falling back to
     * a fresh default workspace when nothing usable is stored.
     */
    const TerminalWorkspace &open(const QString &projectPath, const QString &projectId);

    const TerminalWorkspace &workspace() const
    {
        return m_workspace;
    }

    /**
     * Window label scoping this workspace's session keys
     */
    QString windowLabel() const;

    /**
     * Replace the current workspace and schedule a save
     */
    void setWorkspace(const TerminalWorkspace &workspace);

    /**
     * Mark the workspace changed and restart the debounce timer
     */
    void scheduleSave();

    /**
     * Snapshot the live sessions into @p workspace, repair it and write it.
     * Returns false when storage failed.
     */
    bool save(const TerminalWorkspace &workspace, QString *error = nullptr);

    /**
     * Write pending changes now. Returns false when a write failed.
     */
    bool flush();

    bool isDirty() const
    {
        return m_dirty;
    }

    bool isSaveScheduled() const;

Q_SIGNALS:
    void saved(const QString &projectPath);

private Q_SLOTS:
    void onDebounceTimeout();
    void onOutputActivity(const SessionKey &key);

private:
    TerminalWorkspace withSnapshots(const TerminalWorkspace &workspace) const;

    WorkspaceStore *m_store = nullptr;
    QPointer<PtySessionRegistry> m_registry;
    QTimer *m_debounceTimer = nullptr;
    WorkspaceDefaults m_defaults;
    TerminalWorkspace m_workspace;
    bool m_dirty = false;
};

} // namespace DevHaven

#endif // WORKSPACEPERSISTENCE_H
