/*
 * stanzabuildertest.cpp - StanzaBuilder unit tests
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

#include <QObject>
#include <QtTest/QtTest>

#include "parley/core/namespaces.h"
#include "parley/core/xmlcommon.h"
#include "parley/im/stanzabuilder.h"
#include "parley/qa/qttestutil/qttestutil.h"

using namespace Parley;
using namespace Parley::XMLHelper;

static QStringList childNames(const QDomElement &e)
{
    QStringList names;
    for (QDomElement c = e.firstChildElement(); !c.isNull(); c = c.nextSiblingElement())
        names << localName(c);
    return names;
}

class StanzaBuilderTest : public QObject {
    Q_OBJECT

private slots:
    void testChatMessage()
    {
        QDomDocument doc;
        QDomElement  m = StanzaBuilder::chatMessage(&doc, "bob@example.com", "Hello");

        QCOMPARE(m.tagName(), QString("message"));
        QCOMPARE(m.attribute("to"), QString("bob@example.com"));
        QCOMPARE(m.attribute("type"), QString("chat"));
        QCOMPARE(int(m.attribute("id").size()), 36);
        QCOMPARE(childNames(m), QStringList() << "body");
        QCOMPARE(subTagText(m, "body"), QString("Hello"));
    }

    void testChatMessageOptions()
    {
        MessageOptions o;
        o.id              = "m1";
        o.thread          = ThreadInfo { "t1", "t0" };
        o.delay           = QDateTime(QDate(2026, 1, 2), QTime(10, 20, 30), Qt::UTC);
        o.replacesId      = "m0";
        o.requestReceipt  = true;
        o.requestMarkable = true;

        QDomDocument doc;
        QDomElement  m = StanzaBuilder::chatMessage(&doc, "bob@example.com", "fixed", o);

        QCOMPARE(m.attribute("id"), QString("m1"));
        QCOMPARE(childNames(m),
                 QStringList() << "body" << "thread" << "delay" << "replace" << "request" << "markable");

        QDomElement thread = childElementNS(m, QString(), "thread");
        QCOMPARE(thread.text(), QString("t1"));
        QCOMPARE(thread.attribute("parent"), QString("t0"));

        QDomElement delay = childElementNS(m, PARLEY_NS_DELAY, "delay");
        QCOMPARE(delay.attribute("stamp"), QString("2026-01-02T10:20:30.000Z"));

        QCOMPARE(childElementNS(m, PARLEY_NS_REPLACE, "replace").attribute("id"), QString("m0"));
        QVERIFY(hasChildNS(m, PARLEY_NS_RECEIPTS, "request"));
        QVERIFY(hasChildNS(m, PARLEY_NS_CHAT_MARKERS, "markable"));
    }

    void testAttachmentMessage()
    {
        FileDescriptor f;
        f.name     = "cat.png";
        f.size     = 2048;
        f.mimeType = "image/png";
        f.url      = "https://upload.example.com/get/cat.png";

        QDomDocument doc;
        QDomElement  m = StanzaBuilder::attachmentMessage(&doc, "bob@example.com", QString(), f);

        QCOMPARE(subTagText(m, "body"), QString("cat.png"));
        QDomElement x = childElementNS(m, PARLEY_NS_HTTP_UPLOAD, "x");
        QVERIFY(!x.isNull());
        QDomElement file = x.firstChildElement("file");
        QCOMPARE(file.attribute("name"), QString("cat.png"));
        QCOMPARE(file.attribute("size"), QString("2048"));
        QCOMPARE(file.attribute("type"), QString("image/png"));
        QCOMPARE(file.attribute("url"), f.url);
    }

    void testPresence()
    {
        QDomDocument doc;
        QVERIFY(!StanzaBuilder::broadcastPresence(&doc, true).hasAttribute("type"));
        QCOMPARE(StanzaBuilder::broadcastPresence(&doc, false).attribute("type"), QString("unavailable"));

        QDomElement sub = StanzaBuilder::directedPresence(&doc, "bob@example.com", "subscribe");
        QCOMPARE(sub.attribute("to"), QString("bob@example.com"));
        QCOMPARE(sub.attribute("type"), QString("subscribe"));

        QDomElement join = StanzaBuilder::roomPresence(&doc, "room@muc.example.com/alice", true);
        QCOMPARE(join.attribute("to"), QString("room@muc.example.com/alice"));
        QVERIFY(!join.hasAttribute("type"));
        QCOMPARE(StanzaBuilder::roomPresence(&doc, "room@muc.example.com/alice", false).attribute("type"),
                 QString("unavailable"));
    }

    void testArchiveQuery()
    {
        ArchiveQuery q;
        q.queryId         = "q1";
        q.filter.with     = "bob@example.com";
        q.filter.start    = QDateTime(QDate(2026, 3, 1), QTime(0, 0), Qt::UTC);
        q.filter.fullText = "lunch";
        ResultSetRequest rsm;
        rsm.max    = 50;
        rsm.before = QString();
        q.rsm      = rsm;

        QDomDocument doc;
        QDomElement  iq = StanzaBuilder::archiveQuery(&doc, q);

        QCOMPARE(iq.attribute("type"), QString("set"));
        QCOMPARE(iq.attribute("id"), QString("q1"));
        QVERIFY(!iq.hasAttribute("to"));

        QDomElement query = childElementNS(iq, PARLEY_NS_MAM, "query");
        QVERIFY(!query.isNull());
        QCOMPARE(query.attribute("queryid"), QString("q1"));
        QCOMPARE(childNames(query), QStringList() << "x" << "set");

        QDomElement form = childElementNS(query, PARLEY_NS_DATAFORM, "x");
        QCOMPARE(form.attribute("type"), QString("submit"));
        QStringList vars, values;
        for (QDomElement f = form.firstChildElement(); !f.isNull(); f = f.nextSiblingElement()) {
            vars << f.attribute("var");
            values << subTagText(f, "value");
        }
        QCOMPARE(vars, QStringList() << "FORM_TYPE" << "with" << "start" << "{urn:xmpp:fulltext:0}fulltext");
        QCOMPARE(values,
                 QStringList() << PARLEY_NS_MAM << "bob@example.com" << "2026-03-01T00:00:00.000Z" << "lunch");
        QCOMPARE(form.firstChildElement().attribute("type"), QString("hidden"));

        QDomElement set = childElementNS(query, PARLEY_NS_RSM, "set");
        QCOMPARE(childNames(set), QStringList() << "max" << "before");
        QCOMPARE(subTagText(set, "max"), QString("50"));
        QVERIFY(childElementNS(set, QString(), "before").text().isEmpty());
    }

    void testArchiveQueryWithoutFilter()
    {
        ArchiveQuery q;
        q.to   = "room@muc.example.com";
        q.node = "urn:xmpp:mucsub:nodes:messages";

        QDomDocument doc;
        QDomElement  iq    = StanzaBuilder::archiveQuery(&doc, q);
        QDomElement  query = childElementNS(iq, PARLEY_NS_MAM, "query");

        QVERIFY(!iq.attribute("id").isEmpty());
        QCOMPARE(query.attribute("queryid"), iq.attribute("id"));
        QCOMPARE(iq.attribute("to"), QString("room@muc.example.com"));
        QCOMPARE(query.attribute("node"), q.node);
        QVERIFY(query.firstChildElement().isNull());
    }

    void testUploadSlotRequest()
    {
        QDomDocument doc;
        QDomElement  iq = StanzaBuilder::uploadSlotRequest(&doc, "example.com", "cat.png", 2048, "image/png");

        QCOMPARE(iq.attribute("type"), QString("get"));
        QCOMPARE(iq.attribute("to"), QString("upload.example.com"));
        QDomElement req = childElementNS(iq, PARLEY_NS_HTTP_UPLOAD, "request");
        QCOMPARE(req.attribute("filename"), QString("cat.png"));
        QCOMPARE(req.attribute("size"), QString("2048"));
        QCOMPARE(req.attribute("content-type"), QString("image/png"));

        QDomElement pdf = StanzaBuilder::uploadSlotRequest(&doc, "example.com", "a.pdf", 1024, "application/pdf");
        QCOMPARE(pdf.attribute("to"), QString("upload.example.com"));
        req = childElementNS(pdf, PARLEY_NS_HTTP_UPLOAD, "request");
        QCOMPARE(req.attribute("filename"), QString("a.pdf"));
        QCOMPARE(req.attribute("size"), QString("1024"));
        QCOMPARE(req.attribute("content-type"), QString("application/pdf"));
    }

    void testStatusStanzas()
    {
        MessageBase m;
        m.id   = "m1";
        m.from = "bob@example.com/phone";
        m.to   = "alice@example.com";

        QDomDocument doc;
        QDomElement  read = StanzaBuilder::markStatus(&doc, Receipt::Displayed, m);
        QCOMPARE(read.attribute("type"), QString("set"));
        QDomElement mark = childElementNS(read, PARLEY_NS_MESSAGE_STATUS, "mark-read");
        QCOMPARE(mark.attribute("id"), QString("m1"));
        QCOMPARE(mark.attribute("from"), QString("bob@example.com/phone"));
        QCOMPARE(mark.attribute("to"), QString("alice@example.com"));
        QVERIFY(hasChildNS(StanzaBuilder::markStatus(&doc, Receipt::Received, m), PARLEY_NS_MESSAGE_STATUS,
                           "mark-delivered"));

        QDomElement get = StanzaBuilder::statusQuery(&doc, "m1", "bob@example.com");
        QCOMPARE(get.attribute("type"), QString("get"));
        QCOMPARE(childElementNS(get, PARLEY_NS_MESSAGE_STATUS, "get-status").attribute("jid"),
                 QString("bob@example.com"));

        QDomElement r = StanzaBuilder::receipt(&doc, Receipt::Displayed, m);
        QCOMPARE(r.attribute("to"), QString("bob@example.com/phone"));
        QCOMPARE(r.attribute("from"), QString("alice@example.com"));
        QCOMPARE(r.attribute("id"), QString("m1"));
        QCOMPARE(childElementNS(r, PARLEY_NS_RECEIPTS, "displayed").attribute("id"), QString("m1"));
    }
};

PARLEY_REGISTER_TEST(StanzaBuilderTest);
#include "stanzabuildertest.moc"
