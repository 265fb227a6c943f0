/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALPANEBINDING_H
#define TERMINALPANEBINDING_H

#include "devhavenprivate_export.h"

#include "PtySessionRegistry.h"

#include <QObject>
#include <QPointer>

namespace DevHaven
{

/**
 * TerminalPaneBinding ties one mounted pane to its session.
 *
 * Construction acquires the session key and destruction releases it, so the
 * lifetime of the binding is the lifetime of the mount. connectSession()
 * starts or reuses the shell and streams its output through
 * outputReceived(); the terminal surface sends keystrokes and geometry back
 * through sendInput() and resize().
 */
class DEVHAVENPRIVATE_EXPORT TerminalPaneBinding : public QObject
{
    Q_OBJECT

public:
    TerminalPaneBinding(PtySessionRegistry *registry, const SessionKey &key, QObject *parent = nullptr);
    ~TerminalPaneBinding() override;

    SessionKey key() const
    {
        return m_key;
    }

    bool isConnected() const
    {
        return m_connected;
    }

    /**
     * Serializer of the terminal surface, used for snapshots
     */
    void setSnapshotProvider(const PtySessionRegistry::SnapshotProvider &provider);

    /**
     * Attach to the session's shell, spawning it if needed.
     *
     * When no shell is running yet and @p savedState is not null,
     * restoreRequested() is emitted first so the surface can show the saved
     * buffer while the shell starts. When the shell already runs, its replay
     * buffer is emitted through outputReceived() before live output.
     */
    void connectSession(const SpawnRequest &request, const QString &savedState = QString());

    void sendInput(const QByteArray &data);
    void resize(int cols, int rows);

Q_SIGNALS:
    void restoreRequested(const QString &savedState);
    void connected(qint64 pid);
    void outputReceived(const QByteArray &data);
    void failed(const QString &message);
    void processExited(int exitCode);

private:
    void onProcessReady(TerminalProcess *process, const QString &error);

    QPointer<PtySessionRegistry> m_registry;
    SessionKey m_key;
    PtySessionRegistry::Unsubscribe m_unsubscribe;
    bool m_connecting = false;
    bool m_connected = false;
    quint64 m_snapshotToken = 0;
};

} // namespace DevHaven

#endif // TERMINALPANEBINDING_H
