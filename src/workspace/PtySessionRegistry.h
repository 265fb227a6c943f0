/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PTYSESSIONREGISTRY_H
#define PTYSESSIONREGISTRY_H

#include "devhavenprivate_export.h"

#include "PtyBackend.h"

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QSharedPointer>
#include <QString>

#include <functional>

class QTimer;

namespace DevHaven
{

/**
 * Identity of a terminal session inside one window
 */
struct DEVHAVENPRIVATE_EXPORT SessionKey {
    QString windowLabel;
    QString sessionId;

    bool isValid() const
    {
        return !windowLabel.isEmpty() && !sessionId.isEmpty();
    }

    QString toString() const
    {
        return windowLabel + QLatin1Char(':') + sessionId;
    }

    /**
     * Label of the window hosting the workspace of @p projectId
     */
    static QString windowLabelForProject(const QString &projectId);

    bool operator==(const SessionKey &other) const
    {
        return windowLabel == other.windowLabel && sessionId == other.sessionId;
    }
    bool operator!=(const SessionKey &other) const
    {
        return !(*this == other);
    }
};

inline size_t qHash(const SessionKey &key, size_t seed = 0)
{
    return qHashMulti(seed, key.windowLabel, key.sessionId);
}

/**
 * PtySessionRegistry maps session keys to at most one live shell each.
 *
 * Panes acquire() a key when they mount and release() it when they unmount.
 * A key whose reference count drops to zero keeps its shell for a grace
 * period so that an immediate remount (tab switch, layout change) finds the
 * same process. Concurrent ensureProcess() calls for one key share a single
 * spawn. Output is fanned out to every subscriber in the order the shell
 * produced it and also kept in a bounded replay buffer.
 *
 * All state lives on the thread owning the registry.
 */
class DEVHAVENPRIVATE_EXPORT PtySessionRegistry : public QObject
{
    Q_OBJECT

public:
    using ProcessCallback = std::function<void(TerminalProcess *process, const QString &error)>;
    using OutputCallback = std::function<void(const QByteArray &data)>;
    using Unsubscribe = std::function<void()>;
    using SnapshotProvider = std::function<QString()>;

    static constexpr int DEFAULT_GRACE_PERIOD_MS = 1000;
    static constexpr int DEFAULT_REPLAY_BUFFER_BYTES = 200000;

    /**
     * @param backend spawns the shells; not owned
     */
    explicit PtySessionRegistry(PtyBackend *backend, QObject *parent = nullptr);
    ~PtySessionRegistry() override;

    /**
     * Get the singleton instance
     */
    static PtySessionRegistry *instance();

    void setGracePeriod(int ms);
    int gracePeriod() const
    {
        return m_gracePeriodMs;
    }

    void setReplayBufferLimit(int bytes);
    int replayBufferLimit() const
    {
        return m_replayLimit;
    }

    /**
     * Take a reference on @p key, creating its entry on first use and
     * cancelling a pending grace-period kill.
     */
    void acquire(const SessionKey &key);

    /**
     * Drop a reference. At zero the shell is killed after the grace period
     * unless the key is acquired again first.
     */
    void release(const SessionKey &key);

    /**
     * Make sure @p key has a live shell and hand it to @p callback.
     *
     * Returns through the callback immediately when the shell exists. While a
     * spawn is in flight further callers wait for that same spawn. On failure
     * every waiting callback gets nullptr and the message, spawnFailed() is
     * emitted once and the key stays without a process so a later call can
     * retry. The key must have been acquired.
     */
    void ensureProcess(const SessionKey &key, const SpawnRequest &request, const ProcessCallback &callback);

    /**
     * Live process for @p key, or nullptr
     */
    TerminalProcess *process(const SessionKey &key) const;

    /**
     * Forward keystrokes. Dropped when the key has no live process.
     */
    void write(const SessionKey &key, const QByteArray &data);

    /**
     * Resize the pseudo-terminal. Calls arriving within one event loop
     * iteration are coalesced and only the latest geometry is applied.
     */
    void resize(const SessionKey &key, int cols, int rows);

    /**
     * Register an output listener. Returns the function that removes it, or
     * an empty function when the key cannot be observed; in that case a key
     * with a dead process is torn down immediately and sessionFailed() is
     * emitted.
     */
    Unsubscribe subscribeOutput(const SessionKey &key, const OutputCallback &callback);

    /**
     * Register the serializer of the terminal surface showing @p key,
     * replacing any earlier one. Returns the token identifying this
     * registration, or 0 when the key is unknown.
     */
    quint64 setSnapshotProvider(const SessionKey &key, const SnapshotProvider &provider);

    /**
     * Unregister the serializer identified by @p token, keeping its last
     * snapshot on the entry. Does nothing when another provider replaced it.
     */
    void clearSnapshotProvider(const SessionKey &key, quint64 token);

    /**
     * Serialized terminal state: the provider's result, else the cached
     * snapshot, else a null string.
     */
    QString snapshot(const SessionKey &key) const;

    /**
     * Tail of raw output, for repainting a remounted pane
     */
    QByteArray replayBuffer(const SessionKey &key) const;

    /**
     * Kill the shell and remove the entry now, skipping the grace period
     */
    void terminate(const SessionKey &key);

    bool hasEntry(const SessionKey &key) const;
    bool hasLiveProcess(const SessionKey &key) const;
    bool isSpawning(const SessionKey &key) const;
    int refCount(const SessionKey &key) const;
    int subscriberCount(const SessionKey &key) const;
    QList<SessionKey> liveKeys() const;

Q_SIGNALS:
    void processStarted(const SessionKey &key, qint64 pid);
    void spawnFailed(const SessionKey &key, const QString &message);
    void sessionFailed(const SessionKey &key, const QString &message);
    void processExited(const SessionKey &key, int exitCode);

    /**
     * A shell produced output; emitted after the subscribers ran
     */
    void outputActivity(const SessionKey &key);

    void entryRemoved(const SessionKey &key);

private:
    struct Subscriber {
        quint64 id;
        OutputCallback callback;
    };

    struct Entry {
        int refCount = 0;
        QPointer<TerminalProcess> process;

        // In-flight spawn shared by every concurrent caller
        bool spawning = false;
        quint64 spawnId = 0;
        QList<ProcessCallback> waiters;

        QTimer *killTimer = nullptr;

        QByteArray replay;
        QString cachedSnapshot;
        SnapshotProvider snapshotProvider;
        quint64 snapshotProviderId = 0;

        QList<Subscriber> subscribers;

        int pendingCols = 0;
        int pendingRows = 0;
        bool resizeScheduled = false;
    };
    using EntryPtr = QSharedPointer<Entry>;

    EntryPtr entry(const SessionKey &key) const;
    void onSpawnFinished(const SessionKey &key, quint64 spawnId, TerminalProcess *process, const QString &error);
    void attachProcess(const SessionKey &key, const EntryPtr &e, TerminalProcess *process);
    void onProcessOutput(const SessionKey &key, TerminalProcess *process, const QByteArray &data);
    void onProcessFinished(const SessionKey &key, TerminalProcess *process, int exitCode);
    void onKillTimer(const SessionKey &key);
    void flushResize(const SessionKey &key);
    void removeEntry(const SessionKey &key, const QString &reason);
    void unsubscribe(const SessionKey &key, quint64 subscriberId);
    void cacheSnapshot(Entry &e);

    PtyBackend *m_backend = nullptr;
    QHash<SessionKey, EntryPtr> m_entries;

    int m_gracePeriodMs = DEFAULT_GRACE_PERIOD_MS;
    int m_replayLimit = DEFAULT_REPLAY_BUFFER_BYTES;
    quint64 m_nextSpawnId = 1;
    quint64 m_nextSubscriberId = 1;
    quint64 m_nextProviderId = 1;
};

} // namespace DevHaven

Q_DECLARE_METATYPE(DevHaven::SessionKey)

#endif // PTYSESSIONREGISTRY_H
