/*
 * namespaces.h - XML namespaces used by parley
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

#ifndef PARLEY_NAMESPACES_H
#define PARLEY_NAMESPACES_H

#include <QLatin1String>

#define PARLEY_NS_STANZAS QLatin1String("urn:ietf:params:xml:ns:xmpp-stanzas")

// XEP-0313 Message Archive Management
#define PARLEY_NS_MAM QLatin1String("urn:xmpp:mam:2")
// XEP-0059 Result Set Management
#define PARLEY_NS_RSM QLatin1String("http://jabber.org/protocol/rsm")
// XEP-0004 Data Forms
#define PARLEY_NS_DATAFORM QLatin1String("jabber:x:data")
#define PARLEY_NS_FORWARD QLatin1String("urn:xmpp:forward:0")
#define PARLEY_NS_FULLTEXT_FIELD QLatin1String("{urn:xmpp:fulltext:0}fulltext")

#define PARLEY_NS_DELAY QLatin1String("urn:xmpp:delay")
#define PARLEY_NS_REPLACE QLatin1String("urn:xmpp:message-correct:0")
#define PARLEY_NS_RECEIPTS QLatin1String("urn:xmpp:receipts")
#define PARLEY_NS_CHAT_MARKERS QLatin1String("urn:xmpp:chat-markers:0")
#define PARLEY_NS_STANZA_ID QLatin1String("urn:xmpp:sid:0")
#define PARLEY_NS_MESSAGE_STATUS QLatin1String("urn:xmpp:message-status:0")

// XEP-0363 HTTP File Upload
#define PARLEY_NS_HTTP_UPLOAD QLatin1String("urn:xmpp:http:upload:0")

#endif // PARLEY_NAMESPACES_H
