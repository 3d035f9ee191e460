/*
 * client.cpp - the parley client
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

#include "client.h"

#include "stanzabuilder.h"

#include <QNetworkAccessManager>
#include <QPointer>

#include <memory>
#include <optional>
#include <variant>

using namespace Parley;

static ClientError clientError(const QueryError &err)
{
    ClientError e;
    switch (err.kind) {
    case QueryError::NotConnected:
        e.code = QStringLiteral("not_connected");
        break;
    case QueryError::Protocol:
        e.code = QStringLiteral("protocol_error");
        e.type = err.stanzaError.typeString();
        break;
    case QueryError::SendFailed:
        e.code = QStringLiteral("send_failed");
        break;
    }
    e.message = err.toString();
    return e;
}

static ClientError clientError(const StatusError &err) { return ClientError { err.code(), err.text }; }

static ClientError clientError(const FileError &err) { return ClientError { err.code(), err.text }; }

class Client::Private {
public:
    ConnectionManager     *connection  = nullptr;
    Dispatcher            *dispatcher  = nullptr;
    MessageStatusManager  *status      = nullptr;
    AttachmentManager     *attachments = nullptr;
    QNetworkAccessManager *qnam        = nullptr;
    bool                   fetchStatus = false;
};

// \a done runs exactly once, with the read status filled in when the lookup succeeded
static void withReadStatus(MessageStatusManager *status, const Message &message,
                           std::function<void(const Message &)> done)
{
    const MessageBase &base = messageBase(message);
    if (base.id.isEmpty()) {
        done(message);
        return;
    }
    status->getStatus(base.id, base.from,
                      [message, done](bool ok, const MessageReadStatus &readStatus, const StatusError &) {
                          Message m = message;
                          if (ok)
                              std::visit([&readStatus](auto &msg) { msg.readStatus = readStatus; }, m);
                          done(m);
                      });
}

Client::Client(const ConnectionConfig &config, TransportFactory factory, QObject *parent) : QObject(parent)
{
    // throws on a bad config, before anything else exists
    auto connection = new ConnectionManager(config, std::move(factory), this);

    qRegisterMetaType<ClientError>();

    d              = new Private;
    d->connection  = connection;
    d->dispatcher  = new Dispatcher(connection, this);
    d->status      = new MessageStatusManager(connection, this);
    d->attachments = new AttachmentManager(connection, connection->config().upload, this);
    d->qnam        = new QNetworkAccessManager(this);
    d->attachments->setNetworkAccessManager(d->qnam);

    connect(connection, &ConnectionManager::statusChanged, this, &Client::statusChanged);
    connect(connection, &ConnectionManager::error, this, [this](const ConnectionError &err) {
        emit error(ClientError { err.kindString(), err.text });
    });

    connect(d->dispatcher, &Dispatcher::messageReceived, this, [this](const Message &message) {
        if (!d->fetchStatus) {
            emit messageReceived(message);
            return;
        }
        QPointer<Client> self(this);
        withReadStatus(d->status, message, [self](const Message &m) {
            if (self)
                emit self->messageReceived(m);
        });
    });
    connect(d->dispatcher, &Dispatcher::presenceReceived, this, &Client::presenceReceived);
    connect(d->dispatcher, &Dispatcher::receiptReceived, this, &Client::receiptReceived);
    connect(d->dispatcher, &Dispatcher::archiveResultReady, this, [this](const ArchiveResult &result) {
        if (!d->fetchStatus || result.messages.isEmpty()) {
            emit archiveResultReady(result);
            return;
        }
        QPointer<Client> self(this);
        auto             enriched  = std::make_shared<ArchiveResult>(result);
        auto             remaining = std::make_shared<int>(int(result.messages.size()));
        for (int n = 0; n < result.messages.size(); ++n) {
            withReadStatus(d->status, result.messages.at(n), [self, enriched, remaining, n](const Message &m) {
                enriched->messages[n] = m;
                if (--*remaining == 0 && self)
                    emit self->archiveResultReady(*enriched);
            });
        }
    });
}

Client::~Client() { delete d; }

ConnectionManager *Client::connection() const { return d->connection; }

Dispatcher *Client::dispatcher() const { return d->dispatcher; }

MessageStatusManager *Client::messageStatus() const { return d->status; }

AttachmentManager *Client::attachments() const { return d->attachments; }

void Client::setNetworkAccessManager(QNetworkAccessManager *qnam) { d->attachments->setNetworkAccessManager(qnam); }

void Client::setFetchReadStatus(bool enabled) { d->fetchStatus = enabled; }

bool Client::fetchReadStatus() const { return d->fetchStatus; }

bool Client::connectToServer(Callback callback)
{
    return d->connection->connectToServer([callback](bool ok, const ConnectionError &err) {
        if (!callback)
            return;
        if (ok)
            callback(true, ClientError());
        else
            callback(false, ClientError { QStringLiteral("CONNECTION_ERROR"), err.text });
    });
}

void Client::disconnectFromServer() { d->connection->disconnectFromServer(); }

ConnectionManager::Status Client::status() const { return d->connection->status(); }

QString Client::userJid() const { return d->connection->userJid(); }

bool Client::sendMessage(const QString &to, const QString &body, const MessageOptions &options, QueryError *error)
{
    return d->connection->send(StanzaBuilder::chatMessage(d->connection->doc(), to, body, options), error);
}

void Client::sendAttachment(const QString &to, const QString &body, const Attachment &file, Callback callback)
{
    QPointer<Client> self(this);
    d->attachments->uploadFile(file, [self, to, body, file, callback](bool ok, const UploadSlot &slot,
                                                                      const FileError &err) {
        if (!ok) {
            if (callback)
                callback(false, clientError(err));
            return;
        }
        if (!self)
            return;

        FileDescriptor fd;
        fd.name     = file.fileName;
        fd.size     = file.size();
        fd.mimeType = file.mimeType;
        fd.url      = slot.getUrl;

        QueryError  sendErr;
        QDomElement m  = StanzaBuilder::attachmentMessage(self->d->connection->doc(), to, body, fd);
        bool        ok2 = self->d->connection->send(m, &sendErr);
        if (callback)
            callback(ok2, ok2 ? ClientError() : clientError(sendErr));
    });
}

QString Client::queryArchive(const ArchiveQuery &query, QueryError *error)
{
    if (!d->connection->isConnected()) {
        if (error)
            *error = QueryError::notConnected();
        return QString();
    }

    QDomElement   iq      = StanzaBuilder::archiveQuery(d->connection->doc(), query);
    const QString queryId = iq.attribute(QStringLiteral("id"));

    // the <fin/> result goes through the dispatcher, only failures are handled here
    struct SendState {
        bool                      inCall = true;
        std::optional<QueryError> failure;
    };
    auto             state = std::make_shared<SendState>();
    QPointer<Client> self(this);
    d->connection->sendQuery(iq, [self, state, queryId](bool ok, const QDomElement &, const QueryError &err) {
        if (ok)
            return;
        if (state->inCall) {
            state->failure = err;
            return;
        }
        if (!self)
            return;
        self->d->dispatcher->aggregator()->discard(queryId);
        ClientError e = clientError(err);
        e.message     = QString("Archive query %1 failed: %2").arg(queryId, e.message);
        emit self->error(e);
    });
    state->inCall = false;

    if (state->failure) {
        if (error)
            *error = *state->failure;
        return QString();
    }
    return queryId;
}

bool Client::broadcastPresence(bool available)
{
    return d->connection->send(StanzaBuilder::broadcastPresence(d->connection->doc(), available));
}

bool Client::subscribeToPresence(const QString &jid)
{
    return d->connection->send(StanzaBuilder::directedPresence(d->connection->doc(), jid, QStringLiteral("subscribe")));
}

bool Client::probePresence(const QString &jid)
{
    return d->connection->send(StanzaBuilder::directedPresence(d->connection->doc(), jid, QStringLiteral("probe")));
}

bool Client::acceptSubscription(const QString &jid)
{
    return d->connection->send(
        StanzaBuilder::directedPresence(d->connection->doc(), jid, QStringLiteral("subscribed")));
}

bool Client::sendPresenceToRoom(const QString &room, bool available)
{
    return d->connection->send(StanzaBuilder::roomPresence(d->connection->doc(), room, available));
}

void Client::markMessageAsRead(const Message &message, Callback callback)
{
    QPointer<Client>  self(this);
    const MessageBase base = messageBase(message);
    d->status->markAsRead(base, [self, base, callback](bool ok, const StatusError &err) {
        if (self) {
            if (ok)
                emit self->messageRead(base.id, base.from, base.to);
            else
                emit self->messageReadError(clientError(err));
        }
        if (callback)
            callback(ok, ok ? ClientError() : clientError(err));
    });
}

void Client::markMessageAsDelivered(const Message &message, Callback callback)
{
    QPointer<Client>  self(this);
    const MessageBase base = messageBase(message);
    d->status->markAsDelivered(base, [self, base, callback](bool ok, const StatusError &err) {
        if (self) {
            if (ok)
                emit self->messageDelivered(base.id, base.from, base.to);
            else
                emit self->messageDeliveredError(clientError(err));
        }
        if (callback)
            callback(ok, ok ? ClientError() : clientError(err));
    });
}

void Client::getMessageStatus(const QString &messageId, const QString &jid,
                              MessageStatusManager::StatusCallback callback)
{
    d->status->getStatus(messageId, jid, std::move(callback));
}

void Client::markMultipleMessagesAsRead(const QList<Message> &messages, Callback callback)
{
    QPointer<Client> self(this);
    d->status->markMultipleAsRead(messages, [self, messages, callback](bool ok, const StatusError &err) {
        if (self) {
            if (ok) {
                for (const Message &m : messages) {
                    const MessageBase &base = messageBase(m);
                    emit self->messageRead(base.id, base.from, base.to);
                }
            } else {
                emit self->messageReadError(clientError(err));
            }
        }
        if (callback)
            callback(ok, ok ? ClientError() : clientError(err));
    });
}

void Client::markMultipleMessagesAsDelivered(const QList<Message> &messages, Callback callback)
{
    QPointer<Client> self(this);
    d->status->markMultipleAsDelivered(messages, [self, messages, callback](bool ok, const StatusError &err) {
        if (self) {
            if (ok) {
                for (const Message &m : messages) {
                    const MessageBase &base = messageBase(m);
                    emit self->messageDelivered(base.id, base.from, base.to);
                }
            } else {
                emit self->messageDeliveredError(clientError(err));
            }
        }
        if (callback)
            callback(ok, ok ? ClientError() : clientError(err));
    });
}
