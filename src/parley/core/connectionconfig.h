/*
 * connectionconfig.h - session and upload configuration
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

#ifndef PARLEY_CONNECTIONCONFIG_H
#define PARLEY_CONNECTIONCONFIG_H

#include <QMap>
#include <QString>
#include <QStringList>

class QSettings;

namespace Parley {

class UploadConfig {
public:
    static constexpr qint64 DefaultMaxFileSize = 10 * 1024 * 1024;

    qint64                 maxFileSize      = DefaultMaxFileSize;
    QStringList            allowedMimeTypes = defaultMimeTypes();
    QString                service; // empty means upload.<domain>
    QMap<QString, QString> headers;

    static QStringList defaultMimeTypes();
};

class ConnectionConfig {
public:
    static constexpr int DefaultConnectTimeout = 10000;
    static constexpr int DefaultQueryTimeout   = 30000;
    static constexpr int DefaultMaxReconnects  = 5;
    static constexpr int DefaultMaxBackoff     = 30000;

    QString service; // websocket or host URI handed to the transport
    QString domain;
    QString username; // bare JID
    QString password;
    QString resource;

    int connectTimeoutMs     = 0; // 0 means default
    int queryTimeoutMs       = DefaultQueryTimeout; // 0 disables
    int maxReconnectAttempts = DefaultMaxReconnects;
    int maxBackoffMs         = DefaultMaxBackoff;

    UploadConfig upload;

    bool        isValid() const;
    QStringList missingFields() const;

    /**
     * Returns a copy with defaults applied.
     * Throws std::invalid_argument if a required field is empty.
     */
    ConnectionConfig validated() const;

    // reads the current group of \a settings, see validated()
    static ConnectionConfig fromSettings(const QSettings &settings);
};

} // namespace Parley

#endif // PARLEY_CONNECTIONCONFIG_H
