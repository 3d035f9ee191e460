/*
 * types.cpp - domain records exchanged with callers
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

#include "types.h"

#include <QFile>
#include <QFileInfo>
#include <QMimeDatabase>

using namespace Parley;

const MessageBase &Parley::messageBase(const Message &message)
{
    return std::visit([](const auto &m) -> const MessageBase & { return m; }, message);
}

QString Parley::messageType(const Message &message)
{
    switch (message.index()) {
    case 1:
        return QStringLiteral("file");
    case 2:
        return QStringLiteral("groupchat");
    default:
        return QStringLiteral("chat");
    }
}

std::optional<Attachment> Attachment::fromFile(const QString &path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return {};

    Attachment a;
    a.data     = f.readAll();
    a.fileName = QFileInfo(path).fileName();
    a.mimeType = QMimeDatabase().mimeTypeForFileNameAndData(path, a.data).name();
    return a;
}

QString StatusError::code() const
{
    switch (kind) {
    case NotFound:
        return QStringLiteral("not_found");
    case Unauthorized:
        return QStringLiteral("unauthorized");
    case InvalidId:
        return QStringLiteral("invalid_id");
    case InvalidJid:
        return QStringLiteral("invalid_jid");
    case ServerError:
        break;
    }
    return QStringLiteral("server_error");
}

QString FileError::code() const
{
    switch (kind) {
    case SizeExceeded:
        return QStringLiteral("SIZE_EXCEEDED");
    case InvalidType:
        return QStringLiteral("INVALID_TYPE");
    case UploadFailed:
        return QStringLiteral("UPLOAD_FAILED");
    case DownloadFailed:
        break;
    }
    return QStringLiteral("DOWNLOAD_FAILED");
}
