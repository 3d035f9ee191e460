/*
 * errors.h - connection and query errors
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

#ifndef PARLEY_ERRORS_H
#define PARLEY_ERRORS_H

#include "stanzaerror.h"

#include <QMetaType>
#include <QString>

namespace Parley {

class ConnectionError {
public:
    enum Kind { InvalidConfig, Timeout, TransportError, AlreadyConnecting, AlreadyOnline };

    ConnectionError(Kind kind = TransportError, const QString &text = QString()) : kind(kind), text(text) { }

    Kind    kind;
    QString text;

    QString kindString() const;
};

/**
 * Failure of a fire-and-forget send or of a correlated query.
 *
 * Protocol errors carry the server's <error/> as is. SendFailed covers
 * everything below the protocol: a write the transport refused or a
 * response that never came.
 */
class QueryError {
public:
    enum Kind { NotConnected, Protocol, SendFailed };

    QueryError(Kind kind = SendFailed, const QString &text = QString()) : kind(kind), text(text) { }
    explicit QueryError(const StanzaError &error) : kind(Protocol), stanzaError(error), text(error.text) { }

    Kind        kind;
    StanzaError stanzaError; // valid for Protocol only
    QString     text;

    static QueryError notConnected();
    static QueryError sendFailed(const QString &reason);

    QString toString() const;
};

} // namespace Parley

Q_DECLARE_METATYPE(Parley::ConnectionError)

#endif // PARLEY_ERRORS_H
