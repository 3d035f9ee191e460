/*
 * client.h - the parley client
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

#ifndef PARLEY_CLIENT_H
#define PARLEY_CLIENT_H

#include "attachmentmanager.h"
#include "dispatcher.h"
#include "messagestatus.h"
#include "parley/core/connectionmanager.h"
#include "types.h"

#include <QObject>

#include <functional>

class QNetworkAccessManager;

namespace Parley {

class ClientError {
public:
    QString code;
    QString message;
    QString type = QStringLiteral("cancel");
};

/**
 * One account, one session.
 *
 * Ties ConnectionManager, Dispatcher, MessageStatusManager and
 * AttachmentManager together and re-emits their events.
 */
class Client : public QObject {
    Q_OBJECT
public:
    using Callback = std::function<void(bool success, const ClientError &error)>;

    /**
     * Throws std::invalid_argument on an incomplete \a config.
     * Nothing is connected until connectToServer().
     */
    Client(const ConnectionConfig &config, TransportFactory factory, QObject *parent = nullptr);
    ~Client() override;

    ConnectionManager    *connection() const;
    Dispatcher           *dispatcher() const;
    MessageStatusManager *messageStatus() const;
    AttachmentManager    *attachments() const;

    // replaces the client's own network access manager, nullptr disables HTTP transfers
    void setNetworkAccessManager(QNetworkAccessManager *qnam);

    /**
     * When enabled, inbound and archived messages are emitted only after
     * their read status was fetched from the server and stored in
     * MessageBase::readStatus. A failed lookup leaves it unset.
     * Disabled by default, messages are then emitted as they arrive.
     */
    void setFetchReadStatus(bool enabled);
    bool fetchReadStatus() const;

    bool connectToServer(Callback callback = Callback());
    void disconnectFromServer();

    ConnectionManager::Status status() const;
    QString                   userJid() const;

    bool sendMessage(const QString &to, const QString &body, const MessageOptions &options = MessageOptions(),
                     QueryError *error = nullptr);
    // uploads \a file first, the message goes out only after the upload succeeded
    void sendAttachment(const QString &to, const QString &body, const Attachment &file, Callback callback);

    /**
     * Sends the archive query and returns its id, or an empty string if it
     * could not be sent. The result arrives through archiveResultReady().
     */
    QString queryArchive(const ArchiveQuery &query, QueryError *error = nullptr);

    bool broadcastPresence(bool available);
    bool subscribeToPresence(const QString &jid);
    bool probePresence(const QString &jid);
    bool acceptSubscription(const QString &jid);
    bool sendPresenceToRoom(const QString &room, bool available);

    void markMessageAsRead(const Message &message, Callback callback = Callback());
    void markMessageAsDelivered(const Message &message, Callback callback = Callback());
    void getMessageStatus(const QString &messageId, const QString &jid, MessageStatusManager::StatusCallback callback);
    void markMultipleMessagesAsRead(const QList<Message> &messages, Callback callback = Callback());
    void markMultipleMessagesAsDelivered(const QList<Message> &messages, Callback callback = Callback());

signals:
    void statusChanged(Parley::ConnectionManager::Status status);
    void error(const Parley::ClientError &error);

    void messageReceived(const Parley::Message &message);
    void presenceReceived(const Parley::Presence &presence);
    void receiptReceived(const Parley::Receipt &receipt);
    void archiveResultReady(const Parley::ArchiveResult &result);

    void messageRead(const QString &messageId, const QString &fromJid, const QString &toJid);
    void messageDelivered(const QString &messageId, const QString &fromJid, const QString &toJid);
    void messageReadError(const Parley::ClientError &error);
    void messageDeliveredError(const Parley::ClientError &error);

private:
    class Private;
    Private *d;
};

} // namespace Parley

Q_DECLARE_METATYPE(Parley::ClientError)

#endif // PARLEY_CLIENT_H
