/*
 * errors.cpp - connection and query errors
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

#include "errors.h"

using namespace Parley;

QString ConnectionError::kindString() const
{
    switch (kind) {
    case InvalidConfig:
        return QStringLiteral("invalid-config");
    case Timeout:
        return QStringLiteral("timeout");
    case TransportError:
        return QStringLiteral("transport-error");
    case AlreadyConnecting:
        return QStringLiteral("already-connecting");
    case AlreadyOnline:
        return QStringLiteral("already-online");
    }
    return QString();
}

QueryError QueryError::notConnected() { return QueryError(NotConnected, QStringLiteral("Not connected to server")); }

QueryError QueryError::sendFailed(const QString &reason)
{
    return QueryError(SendFailed, QStringLiteral("Failed to send IQ: ") + reason);
}

QString QueryError::toString() const
{
    if (kind == Protocol)
        return text.isEmpty() ? stanzaError.conditionString() : stanzaError.conditionString() + ": " + text;
    return text;
}
