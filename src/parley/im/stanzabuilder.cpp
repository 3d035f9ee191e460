/*
 * stanzabuilder.cpp - outbound stanza construction
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

#include "stanzabuilder.h"

#include "parley/core/namespaces.h"
#include "parley/core/xmlcommon.h"

#include <QUuid>

using namespace Parley;
using namespace Parley::XMLHelper;

namespace Parley {
namespace StanzaBuilder {

    static QDomElement basicMessage(QDomDocument *doc, const QString &to, const QString &type,
                                    const MessageOptions &options)
    {
        QDomElement m = doc->createElement(QStringLiteral("message"));
        m.setAttribute(QStringLiteral("to"), to);
        m.setAttribute(QStringLiteral("type"), type);
        m.setAttribute(QStringLiteral("id"), options.id.isEmpty() ? newId() : options.id);
        return m;
    }

    // everything the options add after the body
    static void appendOptions(QDomDocument *doc, QDomElement &m, const MessageOptions &options)
    {
        if (options.thread) {
            QDomElement t = textTag(doc, QStringLiteral("thread"), options.thread->id);
            if (!options.thread->parent.isEmpty())
                t.setAttribute(QStringLiteral("parent"), options.thread->parent);
            m.appendChild(t);
        }

        if (options.delay.isValid()) {
            QDomElement delay = emptyTagNS(doc, PARLEY_NS_DELAY, QStringLiteral("delay"));
            delay.setAttribute(QStringLiteral("stamp"), TS2stamp(options.delay));
            m.appendChild(delay);
        }

        if (!options.replacesId.isEmpty()) {
            QDomElement r = emptyTagNS(doc, PARLEY_NS_REPLACE, QStringLiteral("replace"));
            r.setAttribute(QStringLiteral("id"), options.replacesId);
            m.appendChild(r);
        }

        if (options.requestReceipt)
            m.appendChild(emptyTagNS(doc, PARLEY_NS_RECEIPTS, QStringLiteral("request")));
        if (options.requestMarkable)
            m.appendChild(emptyTagNS(doc, PARLEY_NS_CHAT_MARKERS, QStringLiteral("markable")));
    }

    QString newId() { return QUuid::createUuid().toString(QUuid::WithoutBraces); }

    QDomElement chatMessage(QDomDocument *doc, const QString &to, const QString &body, const MessageOptions &options)
    {
        QDomElement m = basicMessage(doc, to, QStringLiteral("chat"), options);
        m.appendChild(textTag(doc, QStringLiteral("body"), body));
        appendOptions(doc, m, options);
        return m;
    }

    QDomElement attachmentMessage(QDomDocument *doc, const QString &to, const QString &body,
                                  const FileDescriptor &file, const MessageOptions &options)
    {
        QDomElement m = basicMessage(doc, to, QStringLiteral("chat"), options);
        m.appendChild(textTag(doc, QStringLiteral("body"), body.isEmpty() ? file.name : body));

        QDomElement x = emptyTagNS(doc, PARLEY_NS_HTTP_UPLOAD, QStringLiteral("x"));
        QDomElement f = emptyTag(doc, QStringLiteral("file"));
        f.setAttribute(QStringLiteral("name"), file.name);
        f.setAttribute(QStringLiteral("size"), QString::number(file.size));
        f.setAttribute(QStringLiteral("type"), file.mimeType);
        f.setAttribute(QStringLiteral("url"), file.url);
        x.appendChild(f);
        m.appendChild(x);

        appendOptions(doc, m, options);
        return m;
    }

    QDomElement broadcastPresence(QDomDocument *doc, bool available)
    {
        QDomElement p = doc->createElement(QStringLiteral("presence"));
        if (!available)
            p.setAttribute(QStringLiteral("type"), QStringLiteral("unavailable"));
        return p;
    }

    QDomElement directedPresence(QDomDocument *doc, const QString &to, const QString &type)
    {
        QDomElement p = doc->createElement(QStringLiteral("presence"));
        p.setAttribute(QStringLiteral("to"), to);
        if (!type.isEmpty())
            p.setAttribute(QStringLiteral("type"), type);
        return p;
    }

    QDomElement roomPresence(QDomDocument *doc, const QString &room, bool available)
    {
        return directedPresence(doc, room, available ? QString() : QStringLiteral("unavailable"));
    }

    QDomElement resultSetElement(QDomDocument *doc, const ResultSetRequest &rsm)
    {
        QDomElement set = emptyTagNS(doc, PARLEY_NS_RSM, QStringLiteral("set"));
        if (rsm.max)
            set.appendChild(textTag(doc, QStringLiteral("max"), QString::number(*rsm.max)));
        if (rsm.before) {
            if (rsm.before->isEmpty())
                set.appendChild(emptyTag(doc, QStringLiteral("before")));
            else
                set.appendChild(textTag(doc, QStringLiteral("before"), *rsm.before));
        }
        if (rsm.after)
            set.appendChild(textTag(doc, QStringLiteral("after"), *rsm.after));
        if (rsm.index)
            set.appendChild(textTag(doc, QStringLiteral("index"), QString::number(*rsm.index)));
        return set;
    }

    QDomElement dataForm(QDomDocument *doc, const QString &formType, const QList<FormField> &fields)
    {
        QDomElement x = emptyTagNS(doc, PARLEY_NS_DATAFORM, QStringLiteral("x"));
        x.setAttribute(QStringLiteral("type"), QStringLiteral("submit"));

        QList<FormField> all;
        all.append(FormField { QStringLiteral("FORM_TYPE"), formType, QStringLiteral("hidden") });
        all.append(fields);
        for (const FormField &field : all) {
            QDomElement f = emptyTag(doc, QStringLiteral("field"));
            f.setAttribute(QStringLiteral("var"), field.var);
            if (!field.type.isEmpty())
                f.setAttribute(QStringLiteral("type"), field.type);
            f.appendChild(textTag(doc, QStringLiteral("value"), field.value));
            x.appendChild(f);
        }
        return x;
    }

    QDomElement archiveQuery(QDomDocument *doc, const ArchiveQuery &q)
    {
        const QString queryId = q.queryId.isEmpty() ? newId() : q.queryId;
        const QString xmlns   = q.xmlns.isEmpty() ? QString(PARLEY_NS_MAM) : q.xmlns;

        QDomElement iq    = createIQ(doc, QStringLiteral("set"), q.to, queryId);
        QDomElement query = emptyTagNS(doc, xmlns, QStringLiteral("query"));
        query.setAttribute(QStringLiteral("queryid"), queryId);
        if (!q.node.isEmpty())
            query.setAttribute(QStringLiteral("node"), q.node);

        if (!q.filter.isEmpty()) {
            QList<FormField> fields;
            if (!q.filter.with.isEmpty())
                fields.append(FormField { QStringLiteral("with"), q.filter.with, QString() });
            if (q.filter.start.isValid())
                fields.append(FormField { QStringLiteral("start"), TS2stamp(q.filter.start), QString() });
            if (q.filter.end.isValid())
                fields.append(FormField { QStringLiteral("end"), TS2stamp(q.filter.end), QString() });
            if (!q.filter.fullText.isEmpty())
                fields.append(FormField { PARLEY_NS_FULLTEXT_FIELD, q.filter.fullText, QString() });
            query.appendChild(dataForm(doc, xmlns, fields));
        }

        if (q.rsm)
            query.appendChild(resultSetElement(doc, *q.rsm));

        iq.appendChild(query);
        return iq;
    }

    QDomElement uploadSlotRequest(QDomDocument *doc, const QString &domain, const QString &fileName, qint64 size,
                                  const QString &contentType)
    {
        QDomElement iq  = createIQ(doc, QStringLiteral("get"), QStringLiteral("upload.") + domain, QString());
        QDomElement req = emptyTagNS(doc, PARLEY_NS_HTTP_UPLOAD, QStringLiteral("request"));
        req.setAttribute(QStringLiteral("filename"), fileName);
        req.setAttribute(QStringLiteral("size"), QString::number(size));
        req.setAttribute(QStringLiteral("content-type"), contentType);
        iq.appendChild(req);
        return iq;
    }

    QDomElement markStatus(QDomDocument *doc, Receipt::Kind kind, const MessageBase &message)
    {
        QDomElement iq   = createIQ(doc, QStringLiteral("set"), QString(), QString());
        QDomElement mark = emptyTagNS(doc, PARLEY_NS_MESSAGE_STATUS,
                                      kind == Receipt::Displayed ? QStringLiteral("mark-read")
                                                                 : QStringLiteral("mark-delivered"));
        mark.setAttribute(QStringLiteral("id"), message.id);
        mark.setAttribute(QStringLiteral("from"), message.from);
        mark.setAttribute(QStringLiteral("to"), message.to);
        iq.appendChild(mark);
        return iq;
    }

    QDomElement statusQuery(QDomDocument *doc, const QString &messageId, const QString &jid)
    {
        QDomElement iq = createIQ(doc, QStringLiteral("get"), QString(), QString());
        QDomElement q  = emptyTagNS(doc, PARLEY_NS_MESSAGE_STATUS, QStringLiteral("get-status"));
        q.setAttribute(QStringLiteral("id"), messageId);
        q.setAttribute(QStringLiteral("jid"), jid);
        iq.appendChild(q);
        return iq;
    }

    QDomElement receipt(QDomDocument *doc, Receipt::Kind kind, const MessageBase &message)
    {
        QDomElement m = doc->createElement(QStringLiteral("message"));
        m.setAttribute(QStringLiteral("id"), message.id);
        m.setAttribute(QStringLiteral("to"), message.from);
        if (!message.to.isEmpty())
            m.setAttribute(QStringLiteral("from"), message.to);
        m.setAttribute(QStringLiteral("type"), QStringLiteral("chat"));

        QDomElement r = emptyTagNS(doc, PARLEY_NS_RECEIPTS,
                                   kind == Receipt::Displayed ? QStringLiteral("displayed")
                                                              : QStringLiteral("received"));
        r.setAttribute(QStringLiteral("id"), message.id);
        m.appendChild(r);
        return m;
    }

} // namespace StanzaBuilder
} // namespace Parley
