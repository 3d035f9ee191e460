/*
 * xmlcommon.h - helper functions for dealing with XML
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

#ifndef PARLEY_XMLCOMMON_H
#define PARLEY_XMLCOMMON_H

#include <QDateTime>
#include <QDomDocument>
#include <QDomElement>
#include <QString>

namespace Parley {
namespace XMLHelper {

    QDateTime stamp2TS(const QString &ts);
    QString   TS2stamp(const QDateTime &d);

    QDomElement createIQ(QDomDocument *doc, const QString &type, const QString &to, const QString &id);
    QDomElement emptyTag(QDomDocument *doc, const QString &name);
    QDomElement emptyTagNS(QDomDocument *doc, const QString &ns, const QString &name);
    QDomElement textTag(QDomDocument *doc, const QString &name, const QString &content);
    QString     tagContent(const QDomElement &e);
    QString     subTagText(const QDomElement &e, const QString &name);

    // first child element with the given local name; an empty ns matches any namespace
    QDomElement childElementNS(const QDomElement &e, const QString &ns, const QString &localName);
    bool        hasChildNS(const QDomElement &e, const QString &ns, const QString &localName);

    QString localName(const QDomElement &e);
    QString toString(const QDomElement &e);

    QString bareJid(const QString &jid);
    QString jidResource(const QString &jid);

} // namespace XMLHelper
} // namespace Parley

#endif // PARLEY_XMLCOMMON_H
