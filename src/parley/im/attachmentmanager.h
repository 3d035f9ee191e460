/*
 * attachmentmanager.h - HTTP file upload (XEP-0363)
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

#ifndef PARLEY_ATTACHMENTMANAGER_H
#define PARLEY_ATTACHMENTMANAGER_H

#include "parley/core/connectionconfig.h"
#include "parley/core/connectionmanager.h"
#include "types.h"

#include <QObject>
#include <QPointer>

#include <functional>
#include <optional>

class QNetworkAccessManager;

namespace Parley {

class AttachmentManager : public QObject {
    Q_OBJECT
public:
    using SlotCallback     = std::function<void(bool success, const UploadSlot &slot, const FileError &error)>;
    using DownloadCallback = std::function<void(bool success, const QByteArray &data, const FileError &error)>;

    AttachmentManager(ConnectionManager *connection, const UploadConfig &config, QObject *parent = nullptr);

    const UploadConfig &config() const;

    /**
     * Without a network access manager uploadFile() is not more than getting
     * a slot, and downloadFile() fails. Not owned.
     */
    void                   setNetworkAccessManager(QNetworkAccessManager *qnam);
    QNetworkAccessManager *networkAccessManager() const;

    std::optional<FileError> validateFile(const Attachment &file) const;

    void requestUploadSlot(const QString &fileName, qint64 size, const QString &mimeType, SlotCallback callback);

    // validates, gets a slot and PUTs the data there
    void uploadFile(const Attachment &file, SlotCallback callback);
    void downloadFile(const QString &url, DownloadCallback callback);

    static bool        isSupportedFileType(const QString &mimeType);
    static QStringList fileExtensions(const QString &mimeType);

private:
    void put(const Attachment &file, const UploadSlot &slot, SlotCallback callback);

    QPointer<ConnectionManager>     connection_;
    UploadConfig                    config_;
    QPointer<QNetworkAccessManager> qnam_;
};

} // namespace Parley

#endif // PARLEY_ATTACHMENTMANAGER_H
