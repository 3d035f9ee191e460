/*
 * attachmentmanager.cpp - HTTP file upload (XEP-0363)
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

#include "attachmentmanager.h"

#include "stanzabuilder.h"
#include "stanzaparser.h"

#include <QDebug>
#include <QMimeDatabase>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

using namespace Parley;

AttachmentManager::AttachmentManager(ConnectionManager *connection, const UploadConfig &config, QObject *parent) :
    QObject(parent), connection_(connection), config_(config)
{
}

const UploadConfig &AttachmentManager::config() const { return config_; }

void AttachmentManager::setNetworkAccessManager(QNetworkAccessManager *qnam) { qnam_ = qnam; }

QNetworkAccessManager *AttachmentManager::networkAccessManager() const { return qnam_; }

std::optional<FileError> AttachmentManager::validateFile(const Attachment &file) const
{
    if (config_.maxFileSize > 0 && file.size() > config_.maxFileSize) {
        return FileError(FileError::SizeExceeded,
                         QString("File size (%1 bytes) exceeds maximum allowed size (%2 bytes)")
                             .arg(file.size())
                             .arg(config_.maxFileSize));
    }

    if (!config_.allowedMimeTypes.isEmpty() && !config_.allowedMimeTypes.contains(file.mimeType)) {
        return FileError(FileError::InvalidType,
                         QString("File type %1 is not allowed. Allowed types: %2")
                             .arg(file.mimeType, config_.allowedMimeTypes.join(", ")));
    }

    return {};
}

void AttachmentManager::requestUploadSlot(const QString &fileName, qint64 size, const QString &mimeType,
                                          SlotCallback callback)
{
    if (!connection_) {
        callback(false, UploadSlot(), FileError(FileError::UploadFailed, "File upload failed: no connection"));
        return;
    }

    QDomElement iq = StanzaBuilder::uploadSlotRequest(connection_->doc(), connection_->config().domain, fileName, size,
                                                      mimeType);
    if (!config_.service.isEmpty())
        iq.setAttribute(QStringLiteral("to"), config_.service);

    connection_->sendQuery(iq, [callback](bool ok, const QDomElement &response, const QueryError &err) {
        if (!ok) {
            callback(false, UploadSlot(), FileError(FileError::UploadFailed, "File upload failed: " + err.toString()));
            return;
        }
        auto slot = StanzaParser::parseUploadSlot(response);
        if (!slot) {
            callback(false, UploadSlot(),
                     FileError(FileError::UploadFailed,
                               "File upload failed: either `put` or `get` URL is missing in the server's reply"));
            return;
        }
        callback(true, *slot, FileError());
    });
}

void AttachmentManager::uploadFile(const Attachment &file, SlotCallback callback)
{
    if (auto err = validateFile(file)) {
        callback(false, UploadSlot(), *err);
        return;
    }

    QPointer<AttachmentManager> self(this);
    requestUploadSlot(file.fileName, file.size(), file.mimeType,
                      [self, file, callback](bool ok, const UploadSlot &slot, const FileError &err) {
                          if (!ok) {
                              callback(false, slot, err);
                              return;
                          }
                          if (!self || !self->qnam_) { // w/o network access manager, it's not more than getting slots
                              callback(true, slot, FileError());
                              return;
                          }
                          self->put(file, slot, callback);
                      });
}

void AttachmentManager::put(const Attachment &file, const UploadSlot &slot, SlotCallback callback)
{
    QNetworkRequest req(QUrl(slot.putUrl));
    req.setHeader(QNetworkRequest::ContentTypeHeader, file.mimeType);
    for (auto it = config_.headers.constBegin(); it != config_.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toLatin1(), it.value().toLatin1());
    for (auto it = slot.putHeaders.constBegin(); it != slot.putHeaders.constEnd(); ++it)
        req.setRawHeader(it.key().toLatin1(), it.value().toLatin1());

    auto reply = qnam_->put(req, file.data);
    connect(reply, &QNetworkReply::finished, this, [reply, slot, callback]() {
        if (reply->error() == QNetworkReply::NoError) {
            callback(true, slot, FileError());
        } else {
            qWarning("AttachmentManager: PUT %s failed: %s", qPrintable(slot.putUrl),
                     qPrintable(reply->errorString()));
            callback(false, slot, FileError(FileError::UploadFailed, "File upload failed: " + reply->errorString()));
        }
        reply->deleteLater();
    });
}

void AttachmentManager::downloadFile(const QString &url, DownloadCallback callback)
{
    if (!qnam_) {
        callback(false, QByteArray(),
                 FileError(FileError::DownloadFailed, "File download failed: no network access manager"));
        return;
    }

    auto reply = qnam_->get(QNetworkRequest(QUrl(url)));
    connect(reply, &QNetworkReply::finished, this, [reply, callback]() {
        if (reply->error() == QNetworkReply::NoError)
            callback(true, reply->readAll(), FileError());
        else
            callback(false, QByteArray(),
                     FileError(FileError::DownloadFailed, "File download failed: " + reply->errorString()));
        reply->deleteLater();
    });
}

bool AttachmentManager::isSupportedFileType(const QString &mimeType)
{
    return UploadConfig::defaultMimeTypes().contains(mimeType);
}

QStringList AttachmentManager::fileExtensions(const QString &mimeType)
{
    if (!isSupportedFileType(mimeType))
        return QStringList();

    QStringList out;
    for (const QString &suffix : QMimeDatabase().mimeTypeForName(mimeType).suffixes())
        out.append(QLatin1Char('.') + suffix);
    return out;
}
