/*
 * mocktransport.h - scripted transport for unit tests
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

#ifndef PARLEY_MOCKTRANSPORT_H
#define PARLEY_MOCKTRANSPORT_H

#include "parley/core/transport.h"

#include <QDomDocument>
#include <QList>
#include <QPointer>

#include <functional>

namespace Parley {

/**
 * A transport that talks to nobody. Tests drive it by hand: goOnline(),
 * fail(), receive() and friends emit what a real stream would, and every
 * stanza written through send() is kept in sent.
 */
class MockTransport : public Transport {
    Q_OBJECT
public:
    using Responder = std::function<void(MockTransport *transport, const QDomElement &stanza)>;

    explicit MockTransport(QObject *parent = nullptr);

    void    start() override;
    void    stop() override;
    bool    send(const QDomElement &stanza) override;
    QString errorString() const override;

    void        goOnline();
    void        goOffline();
    void        fail(const QString &text);
    QDomElement receive(const QString &xml);
    void        receive(const QDomElement &stanza);

    QDomElement lastSent() const;

    bool               autoOnline = false; // emit online() from start()
    bool               sendFails  = false;
    QString            errorText  = QStringLiteral("broken pipe");
    Responder          responder;          // runs after each successful send
    int                startCount = 0;
    int                stopCount  = 0;
    QList<QDomElement> sent;

private:
    QList<QDomDocument> inbound_;
};

/**
 * Hands out MockTransports to a ConnectionManager and remembers them.
 * Must outlive the manager it feeds.
 */
class MockTransportFactory {
public:
    TransportFactory factory();
    MockTransport   *last() const;
    int              count() const { return created.size(); }

    bool                           autoOnline  = true;
    bool                           returnsNull = false;
    int                            calls       = 0; // including null returns
    MockTransport::Responder       responder;
    QList<QPointer<MockTransport>> created;
};

// parses \a xml with namespace processing on, as a stream parser would
QDomElement parseStanza(const QString &xml);

} // namespace Parley

#endif // PARLEY_MOCKTRANSPORT_H
