/*
 * stanzaparser.cpp - inbound stanza interpretation
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

#include "stanzaparser.h"

#include "parley/core/namespaces.h"
#include "parley/core/xmlcommon.h"

using namespace Parley;
using namespace Parley::XMLHelper;

namespace Parley {
namespace StanzaParser {

    static QString elementNS(const QDomElement &e)
    {
        const QString ns = e.namespaceURI();
        return ns.isEmpty() ? e.attribute(QStringLiteral("xmlns")) : ns;
    }

    QDomElement archiveChild(const QDomElement &e, const QString &name)
    {
        for (QDomElement c = e.firstChildElement(); !c.isNull(); c = c.nextSiblingElement()) {
            if (localName(c) == name && isArchiveNS(elementNS(c)))
                return c;
        }
        return QDomElement();
    }

    static Message messageFrom(const QDomElement &m, const QDateTime &timestamp)
    {
        MessageBase base;
        base.id        = m.attribute(QStringLiteral("id"));
        base.stanzaId
            = childElementNS(m, PARLEY_NS_STANZA_ID, QStringLiteral("stanza-id")).attribute(QStringLiteral("id"));
        base.from      = m.attribute(QStringLiteral("from"));
        base.to        = m.attribute(QStringLiteral("to"));
        base.timestamp = timestamp;
        base.body      = subTagText(m, QStringLiteral("body"));

        QDomElement x    = childElementNS(m, PARLEY_NS_HTTP_UPLOAD, QStringLiteral("x"));
        QDomElement file = childElementNS(x, QString(), QStringLiteral("file"));
        if (!file.isNull()) {
            FileMessage fm;
            static_cast<MessageBase &>(fm) = base;
            fm.url      = file.attribute(QStringLiteral("url"));
            fm.name     = file.attribute(QStringLiteral("name"));
            fm.size     = file.attribute(QStringLiteral("size")).toLongLong();
            fm.mimeType = file.attribute(QStringLiteral("type"));
            return fm;
        }

        if (m.attribute(QStringLiteral("type")) == QLatin1String("groupchat")) {
            GroupChatMessage gm;
            static_cast<MessageBase &>(gm) = base;
            gm.room     = bareJid(base.from);
            gm.nickname = jidResource(base.from);
            return gm;
        }

        ChatMessage cm;
        static_cast<MessageBase &>(cm) = base;
        return cm;
    }

    bool isArchiveNS(const QString &ns) { return ns.startsWith(QLatin1String("urn:xmpp:mam:")); }

    std::optional<Presence> parsePresence(const QDomElement &e)
    {
        if (localName(e) != QLatin1String("presence"))
            return {};

        Presence p;
        p.from   = e.attribute(QStringLiteral("from"));
        p.to     = e.attribute(QStringLiteral("to"));
        p.type   = e.attribute(QStringLiteral("type"), QStringLiteral("available"));
        p.show   = subTagText(e, QStringLiteral("show"));
        p.status = subTagText(e, QStringLiteral("status"));
        return p;
    }

    std::optional<Message> parseMessage(const QDomElement &e)
    {
        if (localName(e) != QLatin1String("message") || e.attribute(QStringLiteral("type")) == QLatin1String("error"))
            return {};

        QDateTime ts = delayTimestamp(e);
        if (!ts.isValid())
            ts = QDateTime::currentDateTimeUtc();
        return messageFrom(e, ts);
    }

    std::optional<Receipt> parseReceipt(const QDomElement &e)
    {
        if (localName(e) != QLatin1String("message"))
            return {};

        Receipt     r;
        QDomElement marker = childElementNS(e, QString(), QStringLiteral("received"));
        if (marker.isNull()) {
            marker = childElementNS(e, QString(), QStringLiteral("displayed"));
            r.kind = Receipt::Displayed;
        }
        if (marker.isNull())
            return {};

        r.id   = marker.attribute(QStringLiteral("id"));
        r.from = e.attribute(QStringLiteral("from"));
        return r;
    }

    std::optional<ArchiveItem> parseArchiveItem(const QDomElement &e)
    {
        QDomElement result = archiveChild(e, QStringLiteral("result"));
        if (result.isNull())
            return {};

        const QString queryId = result.attribute(QStringLiteral("queryid"));
        if (queryId.isEmpty())
            return {};

        QDomElement forwarded = childElementNS(result, PARLEY_NS_FORWARD, QStringLiteral("forwarded"));
        QDomElement m         = childElementNS(forwarded, QString(), QStringLiteral("message"));
        if (m.isNull())
            return {};

        QDateTime ts = delayTimestamp(forwarded);
        if (!ts.isValid())
            ts = delayTimestamp(m);
        if (!ts.isValid())
            ts = QDateTime::currentDateTimeUtc();

        ArchiveItem item;
        item.queryId = queryId;
        item.message = messageFrom(m, ts);

        // the archive id is on <result/>, older servers only tag the message
        const QString archiveId = result.attribute(QStringLiteral("id"));
        if (!archiveId.isEmpty()) {
            std::visit([&archiveId](auto &msg) {
                if (msg.stanzaId.isEmpty())
                    msg.stanzaId = archiveId;
            }, item.message);
        }
        return item;
    }

    std::optional<ArchiveFin> parseArchiveFin(const QDomElement &e)
    {
        QDomElement fin = archiveChild(e, QStringLiteral("fin"));
        if (fin.isNull())
            return {};

        ArchiveFin f;
        // a message-borne fin has its own stanza id, only queryid names the query
        f.queryId = fin.attribute(QStringLiteral("queryid"));
        if (f.queryId.isEmpty())
            f.queryId = e.attribute(QStringLiteral("id"));
        f.complete = fin.attribute(QStringLiteral("complete")) == QLatin1String("true");
        f.rsm      = parseResultSet(childElementNS(fin, PARLEY_NS_RSM, QStringLiteral("set")));
        return f;
    }

    std::optional<ResultSet> parseResultSet(const QDomElement &set)
    {
        if (set.isNull())
            return {};

        ResultSet rs;
        rs.first = subTagText(set, QStringLiteral("first"));
        rs.last  = subTagText(set, QStringLiteral("last"));

        QDomElement count = childElementNS(set, QString(), QStringLiteral("count"));
        if (!count.isNull()) {
            bool ok;
            int  n = tagContent(count).trimmed().toInt(&ok);
            if (ok && n >= 0)
                rs.count = n;
        }
        return rs;
    }

    std::optional<UploadSlot> parseUploadSlot(const QDomElement &iq)
    {
        QDomElement slot = childElementNS(iq, QString(), QStringLiteral("slot"));
        if (slot.isNull())
            return {};

        QDomElement get = childElementNS(slot, QString(), QStringLiteral("get"));
        QDomElement put = childElementNS(slot, QString(), QStringLiteral("put"));

        UploadSlot s;
        s.getUrl = get.attribute(QStringLiteral("url"));
        s.putUrl = put.attribute(QStringLiteral("url"));
        // XEP-0363 0.2 carried the urls as text
        if (s.getUrl.isEmpty())
            s.getUrl = tagContent(get).trimmed();
        if (s.putUrl.isEmpty())
            s.putUrl = tagContent(put).trimmed();
        if (s.getUrl.isEmpty() || s.putUrl.isEmpty())
            return {};

        // only these may be passed on to the http server
        for (QDomElement he = put.firstChildElement(QStringLiteral("header")); !he.isNull();
             he = he.nextSiblingElement(QStringLiteral("header"))) {
            QString header = he.attribute(QStringLiteral("name")).trimmed().remove(QLatin1Char('\n'));
            QString value  = he.text().trimmed().remove(QLatin1Char('\n'));
            if (!value.isEmpty()
                && (header.compare(QLatin1String("Authorization"), Qt::CaseInsensitive) == 0
                    || header.compare(QLatin1String("Cookie"), Qt::CaseInsensitive) == 0
                    || header.compare(QLatin1String("Expires"), Qt::CaseInsensitive) == 0))
                s.putHeaders.insert(header, value);
        }
        for (QDomElement he = get.firstChildElement(QStringLiteral("header")); !he.isNull();
             he = he.nextSiblingElement(QStringLiteral("header"))) {
            s.getHeaders.insert(he.attribute(QStringLiteral("name")).trimmed(), he.text().trimmed());
        }
        return s;
    }

    std::optional<MessageReadStatus> parseReadStatus(const QDomElement &iq)
    {
        QDomElement status = childElementNS(iq, QString(), QStringLiteral("status"));
        if (status.isNull())
            return {};

        MessageReadStatus s;
        s.delivered = status.attribute(QStringLiteral("delivered")) == QLatin1String("true");
        s.read      = status.attribute(QStringLiteral("read")) == QLatin1String("true");
        bool   ok;
        qint64 ts = status.attribute(QStringLiteral("timestamp")).toLongLong(&ok);
        if (ok)
            s.timestamp = ts;
        return s;
    }

    std::optional<ThreadInfo> threadInfo(const QDomElement &message)
    {
        QDomElement t = childElementNS(message, QString(), QStringLiteral("thread"));
        if (t.isNull())
            return {};
        return ThreadInfo { tagContent(t), t.attribute(QStringLiteral("parent")) };
    }

    QString replacedMessageId(const QDomElement &message)
    {
        return childElementNS(message, PARLEY_NS_REPLACE, QStringLiteral("replace")).attribute(QStringLiteral("id"));
    }

    QDateTime delayTimestamp(const QDomElement &stanza)
    {
        QDomElement delay = childElementNS(stanza, PARLEY_NS_DELAY, QStringLiteral("delay"));
        if (delay.isNull())
            delay = childElementNS(stanza, QStringLiteral("jabber:x:delay"), QStringLiteral("x"));
        if (delay.isNull())
            return QDateTime();
        return stamp2TS(delay.attribute(QStringLiteral("stamp")));
    }

} // namespace StanzaParser
} // namespace Parley
