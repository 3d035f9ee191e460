/*
 * types.h - domain records exchanged with callers
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

#ifndef PARLEY_TYPES_H
#define PARLEY_TYPES_H

#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QMap>
#include <QMetaType>
#include <QString>

#include <optional>
#include <variant>

namespace Parley {

struct ThreadInfo {
    QString id;
    QString parent;
};

class MessageOptions {
public:
    QString                   id; // generated if empty
    std::optional<ThreadInfo> thread;
    QDateTime                 delay;
    QString                   replacesId;
    bool                      requestReceipt  = false;
    bool                      requestMarkable = false;
};

class MessageReadStatus {
public:
    bool                  delivered = false;
    bool                  read      = false;
    std::optional<qint64> timestamp;
};

class MessageBase {
public:
    QString   id;
    QString   stanzaId; // archive id, XEP-0359
    QString   from;
    QString   to;
    QDateTime timestamp;
    QString   body;

    // set only when Client looked it up, see Client::setFetchReadStatus()
    std::optional<MessageReadStatus> readStatus;
};

class ChatMessage : public MessageBase { };

class FileMessage : public MessageBase {
public:
    QString url;
    QString name;
    qint64  size = 0;
    QString mimeType;
};

class GroupChatMessage : public MessageBase {
public:
    QString room;
    QString nickname;
};

using Message = std::variant<ChatMessage, FileMessage, GroupChatMessage>;

const MessageBase &messageBase(const Message &message);
QString            messageType(const Message &message); // "chat", "file" or "groupchat"

class Presence {
public:
    QString from;
    QString to;
    QString type; // "available" when the stanza has no type
    QString show;
    QString status;

    bool isAvailable() const { return type == QLatin1String("available"); }
};

class Receipt {
public:
    enum Kind { Received, Displayed };

    QString id;
    QString from;
    Kind    kind = Received;

    QString kindString() const { return kind == Displayed ? QStringLiteral("displayed") : QStringLiteral("received"); }
};

// XEP-0059 paging, as requested
class ResultSetRequest {
public:
    std::optional<int>     max;
    std::optional<QString> before; // an empty string asks for the last page
    std::optional<QString> after;
    std::optional<int>     index;
};

// XEP-0059 paging, as reported
class ResultSet {
public:
    QString            first;
    QString            last;
    std::optional<int> count;
};

class ArchiveFilter {
public:
    QString   with;
    QDateTime start;
    QDateTime end;
    QString   fullText;

    bool isEmpty() const { return with.isEmpty() && !start.isValid() && !end.isValid() && fullText.isEmpty(); }
};

class ArchiveQuery {
public:
    QString                         queryId; // generated if empty
    QString                         to;      // archive owner, empty for the own account
    QString                         xmlns; // empty means urn:xmpp:mam:2
    QString                         node;
    ArchiveFilter                   filter;
    std::optional<ResultSetRequest> rsm;
};

class ArchiveResult {
public:
    QString                  queryId;
    bool                     complete = false;
    QList<Message>           messages;
    std::optional<ResultSet> rsm;
};

class FileDescriptor {
public:
    QString name;
    qint64  size = 0;
    QString mimeType;
    QString url;
};

class Attachment {
public:
    QString    fileName;
    QString    mimeType;
    QByteArray data;

    qint64 size() const { return data.size(); }

    // reads \a path and guesses the MIME type from its name and content
    static std::optional<Attachment> fromFile(const QString &path);
};

class UploadSlot {
public:
    QString                putUrl;
    QString                getUrl;
    QMap<QString, QString> putHeaders;
    QMap<QString, QString> getHeaders;
};

class StatusError {
public:
    enum Kind { NotFound, Unauthorized, InvalidId, InvalidJid, ServerError };

    StatusError(Kind kind = ServerError, const QString &text = QString()) : kind(kind), text(text) { }

    Kind    kind;
    QString text;

    QString code() const;
};

class FileError {
public:
    enum Kind { SizeExceeded, InvalidType, UploadFailed, DownloadFailed };

    FileError(Kind kind = UploadFailed, const QString &text = QString()) : kind(kind), text(text) { }

    Kind    kind;
    QString text;

    QString code() const;
};

} // namespace Parley

Q_DECLARE_METATYPE(Parley::Message)
Q_DECLARE_METATYPE(Parley::Presence)
Q_DECLARE_METATYPE(Parley::Receipt)
Q_DECLARE_METATYPE(Parley::ArchiveResult)

#endif // PARLEY_TYPES_H
