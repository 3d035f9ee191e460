/*
 * xmlcommon.cpp - helper functions for dealing with XML
 * Copyright (C) 2001-2002  Justin Karneges
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

#include "xmlcommon.h"

#include <QTextStream>

namespace Parley {
namespace XMLHelper {

    /**
     * Parses both XEP-0082 timestamps ("2026-01-02T10:20:30.123Z") and the
     * legacy jabber:x:delay form ("20260102T10:20:30"). Returns an invalid
     * QDateTime if the string is neither.
     */
    QDateTime stamp2TS(const QString &ts)
    {
        QDateTime d = QDateTime::fromString(ts, Qt::ISODateWithMs);
        if (d.isValid())
            return d.toUTC();

        d = QDateTime::fromString(ts.left(19), Qt::ISODate);
        if (d.isValid()) {
            d.setTimeSpec(Qt::UTC);
            return d;
        }

        if (ts.length() != 17)
            return QDateTime();

        int year  = ts.mid(0, 4).toInt();
        int month = ts.mid(4, 2).toInt();
        int day   = ts.mid(6, 2).toInt();

        int hour = ts.mid(9, 2).toInt();
        int min  = ts.mid(12, 2).toInt();
        int sec  = ts.mid(15, 2).toInt();

        QDate xd;
        xd.setDate(year, month, day);
        if (!xd.isValid())
            return QDateTime();

        QTime xt;
        xt.setHMS(hour, min, sec);
        if (!xt.isValid())
            return QDateTime();

        return QDateTime(xd, xt, Qt::UTC);
    }

    QString TS2stamp(const QDateTime &d) { return d.toUTC().toString(Qt::ISODateWithMs); }

    QDomElement createIQ(QDomDocument *doc, const QString &type, const QString &to, const QString &id)
    {
        QDomElement iq = doc->createElement(QStringLiteral("iq"));
        if (!type.isEmpty())
            iq.setAttribute(QStringLiteral("type"), type);
        if (!to.isEmpty())
            iq.setAttribute(QStringLiteral("to"), to);
        if (!id.isEmpty())
            iq.setAttribute(QStringLiteral("id"), id);

        return iq;
    }

    QDomElement emptyTag(QDomDocument *doc, const QString &name) { return doc->createElement(name); }

    QDomElement emptyTagNS(QDomDocument *doc, const QString &ns, const QString &name)
    {
        return doc->createElementNS(ns, name);
    }

    QDomElement textTag(QDomDocument *doc, const QString &name, const QString &content)
    {
        QDomElement tag = doc->createElement(name);
        tag.appendChild(doc->createTextNode(content));
        return tag;
    }

    QString tagContent(const QDomElement &e)
    {
        // look for some tag content
        for (QDomNode n = e.firstChild(); !n.isNull(); n = n.nextSibling()) {
            QDomText i = n.toText();
            if (i.isNull())
                continue;
            return i.data();
        }

        return QString();
    }

    QString subTagText(const QDomElement &e, const QString &name)
    {
        QDomElement i = childElementNS(e, QString(), name);
        if (!i.isNull())
            return i.text();
        return QString();
    }

    QString localName(const QDomElement &e)
    {
        const QString ln = e.localName();
        if (!ln.isEmpty())
            return ln;

        const QString tn = e.tagName();
        const int     colon = tn.indexOf(QLatin1Char(':'));
        return colon == -1 ? tn : tn.mid(colon + 1);
    }

    QDomElement childElementNS(const QDomElement &e, const QString &ns, const QString &name)
    {
        for (QDomElement c = e.firstChildElement(); !c.isNull(); c = c.nextSiblingElement()) {
            if (localName(c) != name)
                continue;
            if (ns.isEmpty() || c.namespaceURI() == ns || c.attribute(QStringLiteral("xmlns")) == ns)
                return c;
        }
        return QDomElement();
    }

    bool hasChildNS(const QDomElement &e, const QString &ns, const QString &name)
    {
        return !childElementNS(e, ns, name).isNull();
    }

    QString toString(const QDomElement &e)
    {
        QString     out;
        QTextStream ts(&out);
        e.save(ts, 1);
        return out;
    }

    QString bareJid(const QString &jid) { return jid.section(QLatin1Char('/'), 0, 0); }

    QString jidResource(const QString &jid)
    {
        const int slash = jid.indexOf(QLatin1Char('/'));
        return slash == -1 ? QString() : jid.mid(slash + 1);
    }

} // namespace XMLHelper
} // namespace Parley
