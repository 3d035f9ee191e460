/*
 * transport.h - stream engine boundary
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

#ifndef PARLEY_TRANSPORT_H
#define PARLEY_TRANSPORT_H

#include <QDomElement>
#include <QObject>

#include <functional>

namespace Parley {

class ConnectionConfig;

/**
 * The XMPP stream engine underneath ConnectionManager.
 *
 * Stream setup (TLS, SASL, resource binding) is its business. Once the
 * session is usable it emits online(); every stanza read from the stream
 * is delivered through stanzaReceived() in arrival order.
 */
class Transport : public QObject {
    Q_OBJECT
public:
    explicit Transport(QObject *parent = nullptr) : QObject(parent) { }
    ~Transport() override = default;

    virtual void start() = 0;
    virtual void stop()  = 0;

    // false if the stanza could not be written, see errorString()
    virtual bool    send(const QDomElement &stanza) = 0;
    virtual QString errorString() const             = 0;

signals:
    void online();
    void offline();
    void error(const QString &text);
    void stanzaReceived(const QDomElement &stanza);
};

// called once per connect attempt, ConnectionManager takes ownership
using TransportFactory = std::function<Transport *(const ConnectionConfig &)>;

} // namespace Parley

#endif // PARLEY_TRANSPORT_H
