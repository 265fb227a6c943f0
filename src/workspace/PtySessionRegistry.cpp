/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PtySessionRegistry.h"

#include "DevhavenSettings.h"

#include <KLocalizedString>

#include <QDebug>
#include <QTimer>

#include <algorithm>
#include <utility>

namespace DevHaven
{

static PtySessionRegistry *s_registryInstance = nullptr;

QString SessionKey::windowLabelForProject(const QString &projectId)
{
    if (projectId.isEmpty()) {
        return QStringLiteral("terminal");
    }
    return QStringLiteral("terminal-") + projectId;
}

PtySessionRegistry::PtySessionRegistry(PtyBackend *backend, QObject *parent)
    : QObject(parent)
    , m_backend(backend)
{
    if (!s_registryInstance) {
        s_registryInstance = this;
    }

    if (auto *settings = DevhavenSettings::instance()) {
        setGracePeriod(settings->killGracePeriodMs());
        setReplayBufferLimit(settings->replayBufferBytes());
    }
}

PtySessionRegistry::~PtySessionRegistry()
{
    for (auto it = m_entries.cbegin(); it != m_entries.cend(); ++it) {
        const EntryPtr &e = it.value();
        e->killTimer->stop();
        if (e->process) {
            disconnect(e->process, nullptr, this, nullptr);
            e->process->terminate();
        }
    }
    m_entries.clear();

    if (s_registryInstance == this) {
        s_registryInstance = nullptr;
    }
}

PtySessionRegistry *PtySessionRegistry::instance()
{
    return s_registryInstance;
}

void PtySessionRegistry::setGracePeriod(int ms)
{
    m_gracePeriodMs = qMax(0, ms);
}

void PtySessionRegistry::setReplayBufferLimit(int bytes)
{
    m_replayLimit = qMax(0, bytes);
}

PtySessionRegistry::EntryPtr PtySessionRegistry::entry(const SessionKey &key) const
{
    return m_entries.value(key);
}

void PtySessionRegistry::acquire(const SessionKey &key)
{
    if (!key.isValid()) {
        qWarning() << "PtySessionRegistry: ignoring acquire of invalid key" << key.toString();
        return;
    }

    EntryPtr e = entry(key);
    if (!e) {
        e = EntryPtr::create();
        e->killTimer = new QTimer(this);
        e->killTimer->setSingleShot(true);
        connect(e->killTimer, &QTimer::timeout, this, [this, key]() {
            onKillTimer(key);
        });
        m_entries.insert(key, e);
    }

    ++e->refCount;

    if (e->killTimer->isActive()) {
        e->killTimer->stop();
        qDebug() << "PtySessionRegistry: reacquired" << key.toString() << "within grace period";
    }
}

void PtySessionRegistry::release(const SessionKey &key)
{
    EntryPtr e = entry(key);
    if (!e) {
        qWarning() << "PtySessionRegistry: release of unknown key" << key.toString();
        return;
    }
    if (e->refCount == 0) {
        qWarning() << "PtySessionRegistry: unbalanced release of" << key.toString();
        return;
    }

    if (--e->refCount == 0) {
        cacheSnapshot(*e);
        e->killTimer->start(m_gracePeriodMs);
    }
}

void PtySessionRegistry::ensureProcess(const SessionKey &key, const SpawnRequest &request, const ProcessCallback &callback)
{
    EntryPtr e = entry(key);
    if (!e) {
        const QString message = i18n("Session %1 is not open", key.toString());
        qWarning() << "PtySessionRegistry: ensureProcess without acquire" << key.toString();
        if (callback) {
            callback(nullptr, message);
        }
        return;
    }

    if (e->process && e->process->isRunning()) {
        if (callback) {
            callback(e->process, QString());
        }
        return;
    }

    if (e->process) {
        // Exited, but finished() has not been delivered yet
        disconnect(e->process, nullptr, this, nullptr);
        e->process->deleteLater();
        e->process = nullptr;
    }

    e->waiters.append(callback);
    if (e->spawning) {
        return;
    }

    e->spawning = true;
    e->spawnId = m_nextSpawnId++;
    const quint64 spawnId = e->spawnId;

    qDebug() << "PtySessionRegistry: spawning shell for" << key.toString() << "in" << request.cwd;

    QPointer<PtySessionRegistry> self(this);
    m_backend->spawn(request, [self, key, spawnId](TerminalProcess *process, const QString &error) {
        if (!self) {
            if (process) {
                process->terminate();
                process->deleteLater();
            }
            return;
        }
        self->onSpawnFinished(key, spawnId, process, error);
    });
}

void PtySessionRegistry::onSpawnFinished(const SessionKey &key, quint64 spawnId, TerminalProcess *process, const QString &error)
{
    EntryPtr e = entry(key);
    if (!e || !e->spawning || e->spawnId != spawnId) {
        // The entry went away while the shell was starting
        if (process) {
            qDebug() << "PtySessionRegistry: discarding late shell for" << key.toString();
            connect(process, &TerminalProcess::finished, process, &QObject::deleteLater);
            process->terminate();
            if (!process->isRunning()) {
                process->deleteLater();
            }
        }
        return;
    }

    e->spawning = false;
    const QList<ProcessCallback> waiters = std::exchange(e->waiters, {});

    if (!process) {
        qWarning() << "PtySessionRegistry: failed to spawn shell for" << key.toString() << ":" << error;
        for (const ProcessCallback &waiter : waiters) {
            if (waiter) {
                waiter(nullptr, error);
            }
        }
        Q_EMIT spawnFailed(key, error);
        return;
    }

    attachProcess(key, e, process);
    if (e->pendingCols > 0 && e->pendingRows > 0) {
        process->setWindowSize(e->pendingCols, e->pendingRows);
    }

    Q_EMIT processStarted(key, process->pid());

    QPointer<TerminalProcess> guard(process);
    for (const ProcessCallback &waiter : waiters) {
        if (waiter) {
            waiter(guard.data(), guard ? QString() : i18n("Session %1 was closed", key.toString()));
        }
    }
}

void PtySessionRegistry::attachProcess(const SessionKey &key, const EntryPtr &e, TerminalProcess *process)
{
    process->setParent(this);
    e->process = process;

    connect(process, &TerminalProcess::dataReceived, this, [this, key, process](const QByteArray &data) {
        onProcessOutput(key, process, data);
    });
    connect(process, &TerminalProcess::finished, this, [this, key, process](int exitCode) {
        onProcessFinished(key, process, exitCode);
    });
}

void PtySessionRegistry::onProcessOutput(const SessionKey &key, TerminalProcess *process, const QByteArray &data)
{
    EntryPtr e = entry(key);
    if (!e || e->process != process) {
        return;
    }

    e->replay.append(data);
    if (e->replay.size() > m_replayLimit) {
        e->replay.remove(0, e->replay.size() - m_replayLimit);
    }

    // A callback may unsubscribe itself or others
    const QList<Subscriber> subscribers = e->subscribers;
    for (const Subscriber &subscriber : subscribers) {
        const bool stillSubscribed = std::any_of(e->subscribers.cbegin(), e->subscribers.cend(), [&subscriber](const Subscriber &s) {
            return s.id == subscriber.id;
        });
        if (stillSubscribed) {
            subscriber.callback(data);
        }
    }

    Q_EMIT outputActivity(key);
}

void PtySessionRegistry::onProcessFinished(const SessionKey &key, TerminalProcess *process, int exitCode)
{
    EntryPtr e = entry(key);
    if (!e || e->process != process) {
        return;
    }

    qDebug() << "PtySessionRegistry: shell for" << key.toString() << "exited with code" << exitCode;

    e->process = nullptr;
    disconnect(process, nullptr, this, nullptr);
    process->deleteLater();

    Q_EMIT processExited(key, exitCode);
}

void PtySessionRegistry::onKillTimer(const SessionKey &key)
{
    EntryPtr e = entry(key);
    if (!e || e->refCount > 0) {
        return;
    }

    qDebug() << "PtySessionRegistry: grace period elapsed for" << key.toString();
    removeEntry(key, i18n("Session %1 was closed", key.toString()));
}

void PtySessionRegistry::removeEntry(const SessionKey &key, const QString &reason)
{
    EntryPtr e = m_entries.take(key);
    if (!e) {
        return;
    }

    e->killTimer->stop();
    e->killTimer->deleteLater();

    if (TerminalProcess *process = e->process.data()) {
        disconnect(process, nullptr, this, nullptr);
        if (process->isRunning()) {
            connect(process, &TerminalProcess::finished, process, &QObject::deleteLater);
            process->terminate();
        } else {
            process->deleteLater();
        }
        e->process = nullptr;
    }

    const QList<ProcessCallback> waiters = std::exchange(e->waiters, {});
    e->spawning = false;
    for (const ProcessCallback &waiter : waiters) {
        if (waiter) {
            waiter(nullptr, reason);
        }
    }

    Q_EMIT entryRemoved(key);
}

TerminalProcess *PtySessionRegistry::process(const SessionKey &key) const
{
    EntryPtr e = entry(key);
    if (!e || !e->process || !e->process->isRunning()) {
        return nullptr;
    }
    return e->process;
}

void PtySessionRegistry::write(const SessionKey &key, const QByteArray &data)
{
    if (TerminalProcess *p = process(key)) {
        p->write(data);
        return;
    }
    qDebug() << "PtySessionRegistry: dropping input for" << key.toString() << "without a live shell";
}

void PtySessionRegistry::resize(const SessionKey &key, int cols, int rows)
{
    if (cols <= 0 || rows <= 0) {
        return;
    }

    EntryPtr e = entry(key);
    if (!e) {
        return;
    }

    e->pendingCols = cols;
    e->pendingRows = rows;
    if (e->resizeScheduled) {
        return;
    }

    e->resizeScheduled = true;
    QTimer::singleShot(0, this, [this, key]() {
        flushResize(key);
    });
}

void PtySessionRegistry::flushResize(const SessionKey &key)
{
    EntryPtr e = entry(key);
    if (!e) {
        return;
    }

    e->resizeScheduled = false;
    if (e->process && e->process->isRunning()) {
        e->process->setWindowSize(e->pendingCols, e->pendingRows);
    }
}

PtySessionRegistry::Unsubscribe PtySessionRegistry::subscribeOutput(const SessionKey &key, const OutputCallback &callback)
{
    EntryPtr e = entry(key);
    if (!e) {
        const QString message = i18n("Session %1 is not open", key.toString());
        qWarning() << "PtySessionRegistry: cannot subscribe to" << key.toString() << ": no entry";
        Q_EMIT sessionFailed(key, message);
        return {};
    }

    const bool hasHandle = !e->process.isNull();
    if (hasHandle && (!callback || !e->process->isRunning())) {
        const QString message = i18n("Session %1 cannot be observed", key.toString());
        qWarning() << "PtySessionRegistry: subscription failed for" << key.toString() << ", tearing it down";
        removeEntry(key, message);
        Q_EMIT sessionFailed(key, message);
        return {};
    }
    if (!callback) {
        qWarning() << "PtySessionRegistry: ignoring empty output callback for" << key.toString();
        return {};
    }

    const quint64 id = m_nextSubscriberId++;
    e->subscribers.append(Subscriber{id, callback});

    QPointer<PtySessionRegistry> self(this);
    return [self, key, id]() {
        if (self) {
            self->unsubscribe(key, id);
        }
    };
}

void PtySessionRegistry::unsubscribe(const SessionKey &key, quint64 subscriberId)
{
    EntryPtr e = entry(key);
    if (!e) {
        return;
    }
    e->subscribers.erase(std::remove_if(e->subscribers.begin(),
                                        e->subscribers.end(),
                                        [subscriberId](const Subscriber &s) {
                                            return s.id == subscriberId;
                                        }),
                         e->subscribers.end());
}

quint64 PtySessionRegistry::setSnapshotProvider(const SessionKey &key, const SnapshotProvider &provider)
{
    EntryPtr e = entry(key);
    if (!e) {
        qWarning() << "PtySessionRegistry: snapshot provider for unknown key" << key.toString();
        return 0;
    }
    e->snapshotProvider = provider;
    e->snapshotProviderId = m_nextProviderId++;
    return e->snapshotProviderId;
}

void PtySessionRegistry::clearSnapshotProvider(const SessionKey &key, quint64 token)
{
    EntryPtr e = entry(key);
    if (!e || token == 0 || e->snapshotProviderId != token) {
        return;
    }
    cacheSnapshot(*e);
    e->snapshotProvider = nullptr;
    e->snapshotProviderId = 0;
}

void PtySessionRegistry::cacheSnapshot(Entry &e)
{
    if (!e.snapshotProvider) {
        return;
    }
    const QString state = e.snapshotProvider();
    if (!state.isNull()) {
        e.cachedSnapshot = state;
    }
}

QString PtySessionRegistry::snapshot(const SessionKey &key) const
{
    EntryPtr e = entry(key);
    if (!e) {
        return QString();
    }
    if (e->snapshotProvider) {
        const QString state = e->snapshotProvider();
        if (!state.isNull()) {
            return state;
        }
    }
    return e->cachedSnapshot;
}

QByteArray PtySessionRegistry::replayBuffer(const SessionKey &key) const
{
    EntryPtr e = entry(key);
    return e ? e->replay : QByteArray();
}

void PtySessionRegistry::terminate(const SessionKey &key)
{
    if (!hasEntry(key)) {
        return;
    }
    qDebug() << "PtySessionRegistry: terminating" << key.toString();
    removeEntry(key, i18n("Session %1 was terminated", key.toString()));
}

bool PtySessionRegistry::hasEntry(const SessionKey &key) const
{
    return m_entries.contains(key);
}

bool PtySessionRegistry::hasLiveProcess(const SessionKey &key) const
{
    return process(key) != nullptr;
}

bool PtySessionRegistry::isSpawning(const SessionKey &key) const
{
    EntryPtr e = entry(key);
    return e && e->spawning;
}

int PtySessionRegistry::refCount(const SessionKey &key) const
{
    EntryPtr e = entry(key);
    return e ? e->refCount : 0;
}

int PtySessionRegistry::subscriberCount(const SessionKey &key) const
{
    EntryPtr e = entry(key);
    return e ? e->subscribers.size() : 0;
}

QList<SessionKey> PtySessionRegistry::liveKeys() const
{
    QList<SessionKey> keys;
    for (auto it = m_entries.cbegin(); it != m_entries.cend(); ++it) {
        if (it.value()->process && it.value()->process->isRunning()) {
            keys.append(it.key());
        }
    }
    return keys;
}

} // namespace DevHaven

#include "moc_PtySessionRegistry.cpp"
