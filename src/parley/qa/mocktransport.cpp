/*
 * mocktransport.cpp - scripted transport for unit tests
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

#include "mocktransport.h"

#include <QtDebug>

namespace Parley {

static QDomDocument parseDocument(const QString &xml)
{
    QDomDocument doc;
    if (!doc.setContent(xml, true))
        qWarning("MockTransport: unparsable stanza: %s", qPrintable(xml));
    return doc;
}

QDomElement parseStanza(const QString &xml)
{
    // the element keeps its document alive
    return parseDocument(xml).documentElement();
}

MockTransport::MockTransport(QObject *parent) : Transport(parent) { }

void MockTransport::start()
{
    ++startCount;
    if (autoOnline)
        emit online();
}

void MockTransport::stop() { ++stopCount; }

bool MockTransport::send(const QDomElement &stanza)
{
    if (sendFails)
        return false;
    sent += stanza;
    if (responder)
        responder(this, stanza);
    return true;
}

QString MockTransport::errorString() const { return errorText; }

void MockTransport::goOnline() { emit online(); }

void MockTransport::goOffline() { emit offline(); }

void MockTransport::fail(const QString &text) { emit error(text); }

QDomElement MockTransport::receive(const QString &xml)
{
    inbound_ += parseDocument(xml);
    QDomElement e = inbound_.last().documentElement();
    emit stanzaReceived(e);
    return e;
}

void MockTransport::receive(const QDomElement &stanza) { emit stanzaReceived(stanza); }

QDomElement MockTransport::lastSent() const { return sent.isEmpty() ? QDomElement() : sent.last(); }

TransportFactory MockTransportFactory::factory()
{
    return [this](const ConnectionConfig &) -> Transport * {
        ++calls;
        if (returnsNull)
            return nullptr;
        auto t        = new MockTransport;
        t->autoOnline = autoOnline;
        t->responder  = responder;
        created += t;
        return t;
    };
}

MockTransport *MockTransportFactory::last() const { return created.isEmpty() ? nullptr : created.last().data(); }

} // namespace Parley
