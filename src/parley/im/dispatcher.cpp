/*
 * dispatcher.cpp - routes inbound stanzas
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

#include "dispatcher.h"

#include "parley/core/xmlcommon.h"
#include "stanzaparser.h"

#include <QDebug>

using namespace Parley;

Dispatcher::Dispatcher(ConnectionManager *connection, QObject *parent) : QObject(parent)
{
    if (!connection)
        return;

    connect(connection, &ConnectionManager::stanzaReceived, this, [this](const QDomElement &x) { dispatch(x); });
    // partial archive results never survive the session they started in
    connect(connection, &ConnectionManager::statusChanged, this, [this](ConnectionManager::Status status) {
        if (status != ConnectionManager::Online)
            aggregator_.reset();
    });
}

Dispatcher::Kind Dispatcher::classify(const QDomElement &stanza)
{
    const QString name = XMLHelper::localName(stanza);
    if (name == QLatin1String("presence"))
        return PresenceStanza;

    const bool isMessage = name == QLatin1String("message");
    if (isMessage || name == QLatin1String("iq")) {
        if (!StanzaParser::archiveChild(stanza, QStringLiteral("result")).isNull())
            return ArchiveItemStanza;
        if (!StanzaParser::archiveChild(stanza, QStringLiteral("fin")).isNull())
            return ArchiveTerminalStanza;
    }

    if (!isMessage)
        return IgnoredStanza;

    if (XMLHelper::hasChildNS(stanza, QString(), QStringLiteral("displayed"))
        || XMLHelper::hasChildNS(stanza, QString(), QStringLiteral("received")))
        return ReceiptStanza;

    return MessageStanza;
}

Dispatcher::Kind Dispatcher::dispatch(const QDomElement &stanza)
{
    const Kind kind = classify(stanza);
    switch (kind) {
    case PresenceStanza:
        if (auto p = StanzaParser::parsePresence(stanza))
            emit presenceReceived(*p);
        break;

    case ArchiveItemStanza:
        if (auto item = StanzaParser::parseArchiveItem(stanza))
            aggregator_.onItem(item->queryId, item->message);
        else
            qDebug("Dispatcher: malformed archive item dropped");
        break;

    case ArchiveTerminalStanza:
        if (auto fin = StanzaParser::parseArchiveFin(stanza))
            emit archiveResultReady(aggregator_.onTerminal(fin->queryId, fin->complete, fin->rsm));
        break;

    case ReceiptStanza:
        if (auto r = StanzaParser::parseReceipt(stanza))
            emit receiptReceived(*r);
        break;

    case MessageStanza:
        if (auto m = StanzaParser::parseMessage(stanza))
            emit messageReceived(*m);
        break;

    case IgnoredStanza:
        break;
    }
    return kind;
}

ArchiveResultAggregator *Dispatcher::aggregator() { return &aggregator_; }

const ArchiveResultAggregator *Dispatcher::aggregator() const { return &aggregator_; }
