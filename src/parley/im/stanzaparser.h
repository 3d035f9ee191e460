/*
 * stanzaparser.h - inbound stanza interpretation
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

#ifndef PARLEY_STANZAPARSER_H
#define PARLEY_STANZAPARSER_H

#include "types.h"

#include <QDomElement>

#include <optional>

namespace Parley {

/**
 * Turns inbound stanzas into domain records.
 *
 * Every function answers "not this kind" with an empty optional (or an
 * empty/invalid value) and never throws, whatever the element looks like.
 */
namespace StanzaParser {

    class ArchiveItem {
    public:
        QString queryId;
        Message message;
    };

    class ArchiveFin {
    public:
        QString                  queryId;
        bool                     complete = false;
        std::optional<ResultSet> rsm;
    };

    bool isArchiveNS(const QString &ns);
    // <result/> or <fin/> in any urn:xmpp:mam:* namespace
    QDomElement archiveChild(const QDomElement &e, const QString &name);

    std::optional<Presence> parsePresence(const QDomElement &e);
    std::optional<Message>  parseMessage(const QDomElement &e);
    std::optional<Receipt>  parseReceipt(const QDomElement &e);

    // a message carrying <result queryid=''><forwarded/></result>
    std::optional<ArchiveItem> parseArchiveItem(const QDomElement &e);
    // a stanza carrying <fin/>, the query id is the stanza id
    std::optional<ArchiveFin> parseArchiveFin(const QDomElement &e);
    std::optional<ResultSet>  parseResultSet(const QDomElement &set);

    std::optional<UploadSlot>        parseUploadSlot(const QDomElement &iq);
    std::optional<MessageReadStatus> parseReadStatus(const QDomElement &iq);

    std::optional<ThreadInfo> threadInfo(const QDomElement &message);
    QString                   replacedMessageId(const QDomElement &message);
    QDateTime                 delayTimestamp(const QDomElement &stanza);

} // namespace StanzaParser
} // namespace Parley

#endif // PARLEY_STANZAPARSER_H
