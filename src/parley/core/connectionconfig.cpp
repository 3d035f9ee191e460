/*
 * connectionconfig.cpp - session and upload configuration
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

#include "connectionconfig.h"

#include <QSettings>

#include <stdexcept>

using namespace Parley;

QStringList UploadConfig::defaultMimeTypes()
{
    return { QStringLiteral("image/jpeg"),
             QStringLiteral("image/png"),
             QStringLiteral("image/gif"),
             QStringLiteral("image/webp"),
             QStringLiteral("application/pdf"),
             QStringLiteral("application/msword"),
             QStringLiteral("application/vnd.openxmlformats-officedocument.wordprocessingml.document"),
             QStringLiteral("application/vnd.ms-excel"),
             QStringLiteral("application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"),
             QStringLiteral("text/plain"),
             QStringLiteral("text/markdown"),
             QStringLiteral("application/zip"),
             QStringLiteral("application/x-rar-compressed"),
             QStringLiteral("application/x-7z-compressed") };
}

QStringList ConnectionConfig::missingFields() const
{
    QStringList missing;
    if (service.isEmpty())
        missing << QStringLiteral("service");
    if (domain.isEmpty())
        missing << QStringLiteral("domain");
    if (username.isEmpty())
        missing << QStringLiteral("username");
    if (password.isEmpty())
        missing << QStringLiteral("password");
    return missing;
}

bool ConnectionConfig::isValid() const { return missingFields().isEmpty(); }

ConnectionConfig ConnectionConfig::validated() const
{
    const QStringList missing = missingFields();
    if (!missing.isEmpty()) {
        throw std::invalid_argument(
            qPrintable(QStringLiteral("Invalid configuration: missing required fields (%1)").arg(missing.join(", "))));
    }

    ConnectionConfig c = *this;
    if (c.connectTimeoutMs <= 0)
        c.connectTimeoutMs = DefaultConnectTimeout;
    if (c.queryTimeoutMs < 0)
        c.queryTimeoutMs = DefaultQueryTimeout;
    if (c.maxReconnectAttempts < 0)
        c.maxReconnectAttempts = DefaultMaxReconnects;
    if (c.maxBackoffMs <= 0)
        c.maxBackoffMs = DefaultMaxBackoff;
    if (c.upload.maxFileSize <= 0)
        c.upload.maxFileSize = UploadConfig::DefaultMaxFileSize;
    return c;
}

ConnectionConfig ConnectionConfig::fromSettings(const QSettings &settings)
{
    ConnectionConfig c;
    c.service          = settings.value("service").toString();
    c.domain           = settings.value("domain").toString();
    c.username         = settings.value("username").toString();
    c.password         = settings.value("password").toString();
    c.resource         = settings.value("resource").toString();
    c.connectTimeoutMs = settings.value("timeout", 0).toInt();
    c.queryTimeoutMs   = settings.value("queryTimeout", DefaultQueryTimeout).toInt();

    c.upload.maxFileSize = settings.value("upload/maxFileSize", UploadConfig::DefaultMaxFileSize).toLongLong();
    if (settings.contains("upload/allowedMimeTypes"))
        c.upload.allowedMimeTypes = settings.value("upload/allowedMimeTypes").toStringList();
    c.upload.service = settings.value("upload/service").toString();

    const QString headerPrefix = QStringLiteral("upload/headers/");
    for (const QString &key : settings.allKeys()) {
        if (key.startsWith(headerPrefix))
            c.upload.headers.insert(key.mid(headerPrefix.length()), settings.value(key).toString());
    }

    return c.validated();
}
