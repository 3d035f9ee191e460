/*
 * messagestatus.h - read and delivery status round trips
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

#ifndef PARLEY_MESSAGESTATUS_H
#define PARLEY_MESSAGESTATUS_H

#include "parley/core/connectionmanager.h"
#include "types.h"

#include <QList>
#include <QObject>
#include <QPointer>

#include <functional>

namespace Parley {

/**
 * Read and delivery bookkeeping through urn:xmpp:message-status:0.
 *
 * Marking is a correlated set iq followed, once the server accepted it,
 * by a receipt to the original sender. The receipt is never sent for a
 * rejected mark.
 */
class MessageStatusManager : public QObject {
    Q_OBJECT
public:
    using Callback       = std::function<void(bool success, const StatusError &error)>;
    using StatusCallback = std::function<void(bool success, const MessageReadStatus &status, const StatusError &error)>;

    explicit MessageStatusManager(ConnectionManager *connection, QObject *parent = nullptr);

    void markAsRead(const MessageBase &message, Callback callback);
    void markAsDelivered(const MessageBase &message, Callback callback);

    // a message the server knows nothing about is reported as neither delivered nor read
    void getStatus(const QString &messageId, const QString &jid, StatusCallback callback);

    /**
     * All marks are issued at once. The callback fires once: with the first
     * failure, or with success after the last mark went through. There is
     * no report of which marks succeeded before a failure.
     */
    void markMultipleAsRead(const QList<Message> &messages, Callback callback);
    void markMultipleAsDelivered(const QList<Message> &messages, Callback callback);

    static StatusError errorFromQuery(const QueryError &error);

private:
    void mark(Receipt::Kind kind, const MessageBase &message, Callback callback);
    void markMultiple(Receipt::Kind kind, const QList<Message> &messages, Callback callback);

    QPointer<ConnectionManager> connection_;
};

} // namespace Parley

#endif // PARLEY_MESSAGESTATUS_H
