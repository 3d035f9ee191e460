/*
 * messagestatus.cpp - read and delivery status round trips
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

#include "messagestatus.h"

#include "stanzabuilder.h"
#include "stanzaparser.h"

#include <memory>

using namespace Parley;

MessageStatusManager::MessageStatusManager(ConnectionManager *connection, QObject *parent) :
    QObject(parent), connection_(connection)
{
}

void MessageStatusManager::markAsRead(const MessageBase &message, Callback callback)
{
    mark(Receipt::Displayed, message, std::move(callback));
}

void MessageStatusManager::markAsDelivered(const MessageBase &message, Callback callback)
{
    mark(Receipt::Received, message, std::move(callback));
}

void MessageStatusManager::mark(Receipt::Kind kind, const MessageBase &message, Callback callback)
{
    if (!connection_) {
        callback(false, errorFromQuery(QueryError::notConnected()));
        return;
    }

    QDomElement iq = StanzaBuilder::markStatus(connection_->doc(), kind, message);
    QPointer<MessageStatusManager> self(this);
    connection_->sendQuery(iq, [self, kind, message, callback](bool ok, const QDomElement &, const QueryError &err) {
        if (!ok) {
            callback(false, errorFromQuery(err));
            return;
        }
        if (!self || !self->connection_) {
            callback(false, errorFromQuery(QueryError::notConnected()));
            return;
        }

        QDomElement r = StanzaBuilder::receipt(self->connection_->doc(), kind, message);
        QueryError  sendErr;
        if (!self->connection_->send(r, &sendErr)) {
            callback(false, StatusError(StatusError::ServerError, sendErr.text));
            return;
        }
        callback(true, StatusError());
    });
}

void MessageStatusManager::getStatus(const QString &messageId, const QString &jid, StatusCallback callback)
{
    if (!connection_) {
        callback(false, MessageReadStatus(), errorFromQuery(QueryError::notConnected()));
        return;
    }

    QDomElement iq = StanzaBuilder::statusQuery(connection_->doc(), messageId, jid);
    connection_->sendQuery(iq, [callback](bool ok, const QDomElement &response, const QueryError &err) {
        if (!ok) {
            if (err.kind == QueryError::Protocol && err.stanzaError.condition == StanzaError::ItemNotFound) {
                callback(true, MessageReadStatus(), StatusError());
                return;
            }
            callback(false, MessageReadStatus(), errorFromQuery(err));
            return;
        }

        auto status = StanzaParser::parseReadStatus(response);
        if (!status) {
            callback(false, MessageReadStatus(),
                     StatusError(StatusError::ServerError, QStringLiteral("Invalid response format")));
            return;
        }
        callback(true, *status, StatusError());
    });
}

void MessageStatusManager::markMultipleAsRead(const QList<Message> &messages, Callback callback)
{
    markMultiple(Receipt::Displayed, messages, std::move(callback));
}

void MessageStatusManager::markMultipleAsDelivered(const QList<Message> &messages, Callback callback)
{
    markMultiple(Receipt::Received, messages, std::move(callback));
}

void MessageStatusManager::markMultiple(Receipt::Kind kind, const QList<Message> &messages, Callback callback)
{
    if (messages.isEmpty()) {
        callback(true, StatusError());
        return;
    }

    struct Batch {
        int      remaining;
        bool     settled;
        Callback callback;
    };
    auto batch = std::make_shared<Batch>(Batch { int(messages.size()), false, std::move(callback) });

    for (const Message &m : messages) {
        mark(kind, messageBase(m), [batch](bool ok, const StatusError &err) {
            if (batch->settled)
                return;
            if (!ok) {
                batch->settled = true;
                batch->callback(false, err);
                return;
            }
            if (--batch->remaining == 0) {
                batch->settled = true;
                batch->callback(true, StatusError());
            }
        });
    }
}

StatusError MessageStatusManager::errorFromQuery(const QueryError &error)
{
    if (error.kind != QueryError::Protocol)
        return StatusError(StatusError::ServerError, error.text);

    switch (error.stanzaError.condition) {
    case StanzaError::ItemNotFound:
        return StatusError(StatusError::NotFound, QStringLiteral("Message status not found"));
    case StanzaError::Forbidden:
        return StatusError(StatusError::Unauthorized, QStringLiteral("Not authorized to access message status"));
    case StanzaError::BadRequest:
        if (error.text.contains(QLatin1String("jid"), Qt::CaseInsensitive))
            return StatusError(StatusError::InvalidJid, QStringLiteral("Invalid JID format"));
        return StatusError(StatusError::InvalidId, QStringLiteral("Invalid message ID"));
    default:
        break;
    }
    return StatusError(StatusError::ServerError, error.toString());
}
