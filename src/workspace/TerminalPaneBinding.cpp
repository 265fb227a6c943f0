/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalPaneBinding.h"

#include <KLocalizedString>

namespace DevHaven
{

TerminalPaneBinding::TerminalPaneBinding(PtySessionRegistry *registry, const SessionKey &key, QObject *parent)
    : QObject(parent)
    , m_registry(registry)
    , m_key(key)
{
    if (m_registry) {
        m_registry->acquire(m_key);

        connect(m_registry, &PtySessionRegistry::processExited, this, [this](const SessionKey &exitedKey, int exitCode) {
            if (exitedKey != m_key) {
                return;
            }
            m_connected = false;
            Q_EMIT processExited(exitCode);
        });
        connect(m_registry, &PtySessionRegistry::entryRemoved, this, [this](const SessionKey &removedKey) {
            if (removedKey != m_key) {
                return;
            }
            m_connected = false;
            m_unsubscribe = nullptr;
        });
    }
}

TerminalPaneBinding::~TerminalPaneBinding()
{
    if (m_unsubscribe) {
        m_unsubscribe();
    }
    if (m_registry) {
        m_registry->clearSnapshotProvider(m_key, m_snapshotToken);
        m_registry->release(m_key);
    }
}

void TerminalPaneBinding::setSnapshotProvider(const PtySessionRegistry::SnapshotProvider &provider)
{
    if (!m_registry) {
        return;
    }
    if (!provider) {
        m_registry->clearSnapshotProvider(m_key, m_snapshotToken);
        m_snapshotToken = 0;
        return;
    }
    m_snapshotToken = m_registry->setSnapshotProvider(m_key, provider);
}

void TerminalPaneBinding::connectSession(const SpawnRequest &request, const QString &savedState)
{
    if (!m_registry || m_connecting || m_connected) {
        return;
    }

    if (!m_registry->hasLiveProcess(m_key) && !savedState.isNull()) {
        Q_EMIT restoreRequested(savedState);
    }

    m_connecting = true;
    QPointer<TerminalPaneBinding> self(this);
    m_registry->ensureProcess(m_key, request, [self](TerminalProcess *process, const QString &error) {
        if (self) {
            self->onProcessReady(process, error);
        }
    });
}

void TerminalPaneBinding::onProcessReady(TerminalProcess *process, const QString &error)
{
    m_connecting = false;

    if (!process) {
        Q_EMIT failed(error);
        return;
    }

    const QByteArray replay = m_registry->replayBuffer(m_key);
    if (!replay.isEmpty()) {
        Q_EMIT outputReceived(replay);
    }

    if (m_unsubscribe) {
        m_unsubscribe();
    }

    QPointer<TerminalPaneBinding> self(this);
    m_unsubscribe = m_registry->subscribeOutput(m_key, [self](const QByteArray &data) {
        if (self) {
            Q_EMIT self->outputReceived(data);
        }
    });
    if (!m_unsubscribe) {
        Q_EMIT failed(i18n("Session %1 cannot be observed", m_key.toString()));
        return;
    }

    m_connected = true;
    Q_EMIT connected(process->pid());
}

void TerminalPaneBinding::sendInput(const QByteArray &data)
{
    if (m_registry) {
        m_registry->write(m_key, data);
    }
}

void TerminalPaneBinding::resize(int cols, int rows)
{
    if (m_registry) {
        m_registry->resize(m_key, cols, rows);
    }
}

} // namespace DevHaven

#include "moc_TerminalPaneBinding.cpp"
