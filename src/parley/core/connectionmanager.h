/*
 * connectionmanager.h - session lifecycle and correlated queries
 * Copyright (C) 2026  Parley developers
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this library.  If not, see <https://www.gnu.org/licenses/>.
 *
 */

#ifndef PARLEY_CONNECTIONMANAGER_H
#define PARLEY_CONNECTIONMANAGER_H

#include "connectionconfig.h"
#include "errors.h"
#include "transport.h"

#include <QDomDocument>
#include <QDomElement>
#include <QObject>

#include <functional>

namespace Parley {

/**
 * Owns the session with the server.
 *
 * Drives the transport through connect, online, error and disconnect,
 * reconnects with exponential backoff after failures and correlates
 * iq requests with their responses. All work happens on the thread the
 * manager lives in; nothing here blocks.
 */
class ConnectionManager : public QObject {
    Q_OBJECT
public:
    enum Status { Disconnected, Connecting, Online, Error, Disconnecting };
    Q_ENUM(Status)

    using ConnectCallback = std::function<void(bool success, const ConnectionError &error)>;
    using QueryCallback   = std::function<void(bool success, const QDomElement &response, const QueryError &error)>;

    /**
     * Throws std::invalid_argument if \a config misses a required field
     * or \a factory is empty. No transport is created here.
     */
    ConnectionManager(const ConnectionConfig &config, TransportFactory factory, QObject *parent = nullptr);
    ~ConnectionManager() override;

    Status                  status() const;
    const ConnectionConfig &config() const;
    QString                 userJid() const;
    bool                    isConnected() const;
    Transport              *transport() const;
    int                     reconnectAttempts() const;
    bool                    isReconnectScheduled() const;

    QDomDocument *doc() const;
    QString       genUniqueId();

    /**
     * Starts a connect attempt. Returns false, leaving the state untouched,
     * while connecting, online or waiting for a scheduled reconnect.
     * \a callback fires once, when this attempt goes online or fails.
     */
    bool connectToServer(ConnectCallback callback = ConnectCallback());
    void disconnectFromServer();

    // fire-and-forget, fails unless online
    bool send(const QDomElement &stanza, QueryError *error = nullptr);

    /**
     * Sends an iq and waits for the result or error iq with the same id.
     * An id is generated if \a iq has none. \a callback is always called
     * exactly once.
     */
    void sendQuery(QDomElement iq, QueryCallback callback);

    static int backoffDelay(int attempts, int maxBackoff = ConnectionConfig::DefaultMaxBackoff);

signals:
    void statusChanged(Parley::ConnectionManager::Status status);
    void error(const Parley::ConnectionError &error);
    void online();
    void offline();
    void reconnectScheduled(int attempt, int delayMs);
    void stanzaReceived(const QDomElement &stanza);
    void stanzaSent(const QDomElement &stanza);

    void debugText(const QString &text);
    void xmlIncoming(const QString &text);
    void xmlOutgoing(const QString &text);

private:
    class Private;
    Private *d;
};

} // namespace Parley

#endif // PARLEY_CONNECTIONMANAGER_H
