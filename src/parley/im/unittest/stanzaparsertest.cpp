/*
 * stanzaparsertest.cpp - StanzaParser unit tests
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

#include "parley/im/stanzaparser.h"
#include "parley/qa/mocktransport.h"
#include "parley/qa/qttestutil/qttestutil.h"

using namespace Parley;

static const char archiveItemXml[]
    = "<message xmlns='jabber:client' to='alice@example.com'>"
      "<result xmlns='urn:xmpp:mam:2' queryid='q1' id='28482-98726-73623'>"
      "<forwarded xmlns='urn:xmpp:forward:0'>"
      "<delay xmlns='urn:xmpp:delay' stamp='2010-07-10T23:08:25Z'/>"
      "<message xmlns='jabber:client' from='bob@example.com/phone' to='alice@example.com' id='m1' type='chat'>"
      "<body>Hail to thee</body>"
      "</message>"
      "</forwarded>"
      "</result>"
      "</message>";

class StanzaParserTest : public QObject {
    Q_OBJECT

private slots:
    void testPresence()
    {
        auto p = StanzaParser::parsePresence(parseStanza("<presence xmlns='jabber:client' from='bob@example.com/phone'>"
                                                         "<show>away</show><status>lunch</status></presence>"));
        QVERIFY(p);
        QCOMPARE(p->from, QString("bob@example.com/phone"));
        QCOMPARE(p->type, QString("available"));
        QVERIFY(p->isAvailable());
        QCOMPARE(p->show, QString("away"));
        QCOMPARE(p->status, QString("lunch"));

        auto gone = StanzaParser::parsePresence(parseStanza("<presence xmlns='jabber:client' type='unavailable'/>"));
        QVERIFY(gone);
        QVERIFY(!gone->isAvailable());

        QVERIFY(!StanzaParser::parsePresence(parseStanza("<message xmlns='jabber:client'/>")));
    }

    void testChatMessage()
    {
        auto m = StanzaParser::parseMessage(
            parseStanza("<message xmlns='jabber:client' from='bob@example.com/phone' to='alice@example.com' "
                        "id='m1' type='chat'>"
                        "<body>Hi</body>"
                        "<delay xmlns='urn:xmpp:delay' stamp='2026-01-02T10:20:30.500Z'/>"
                        "<stanza-id xmlns='urn:xmpp:sid:0' by='alice@example.com' id='s1'/>"
                        "</message>"));
        QVERIFY(m);
        QVERIFY(std::holds_alternative<ChatMessage>(*m));
        QCOMPARE(messageType(*m), QString("chat"));

        const MessageBase &base = messageBase(*m);
        QCOMPARE(base.id, QString("m1"));
        QCOMPARE(base.stanzaId, QString("s1"));
        QCOMPARE(base.from, QString("bob@example.com/phone"));
        QCOMPARE(base.body, QString("Hi"));
        QCOMPARE(base.timestamp, QDateTime(QDate(2026, 1, 2), QTime(10, 20, 30, 500), Qt::UTC));
    }

    void testForeignStanzaIdIgnored()
    {
        auto m = StanzaParser::parseMessage(parseStanza("<message xmlns='jabber:client' id='m2'><body>x</body>"
                                                        "<stanza-id xmlns='urn:example:other' id='zz'/>"
                                                        "</message>"));
        QVERIFY(m);
        QVERIFY(messageBase(*m).stanzaId.isEmpty());
    }

    void testMessageWithoutDelayIsStampedNow()
    {
        const QDateTime before = QDateTime::currentDateTimeUtc();
        auto m = StanzaParser::parseMessage(parseStanza("<message xmlns='jabber:client'><body>x</body></message>"));
        QVERIFY(m);
        QVERIFY(messageBase(*m).timestamp >= before);
    }

    void testGroupChatMessage()
    {
        auto m = StanzaParser::parseMessage(parseStanza("<message xmlns='jabber:client' type='groupchat' "
                                                        "from='room@muc.example.com/bob'><body>hi all</body>"
                                                        "</message>"));
        QVERIFY(m);
        QVERIFY(std::holds_alternative<GroupChatMessage>(*m));
        const GroupChatMessage &gm = std::get<GroupChatMessage>(*m);
        QCOMPARE(gm.room, QString("room@muc.example.com"));
        QCOMPARE(gm.nickname, QString("bob"));
    }

    void testFileMessage()
    {
        auto m = StanzaParser::parseMessage(
            parseStanza("<message xmlns='jabber:client' from='bob@example.com' type='chat'><body>cat.png</body>"
                        "<x xmlns='urn:xmpp:http:upload:0'>"
                        "<file name='cat.png' size='2048' type='image/png' url='https://up.example.com/cat.png'/>"
                        "</x></message>"));
        QVERIFY(m);
        QCOMPARE(messageType(*m), QString("file"));
        const FileMessage &fm = std::get<FileMessage>(*m);
        QCOMPARE(fm.name, QString("cat.png"));
        QCOMPARE(fm.size, qint64(2048));
        QCOMPARE(fm.mimeType, QString("image/png"));
        QCOMPARE(fm.url, QString("https://up.example.com/cat.png"));
    }

    void testErrorMessageIsNotAMessage()
    {
        QVERIFY(!StanzaParser::parseMessage(parseStanza("<message xmlns='jabber:client' type='error'/>")));
        QVERIFY(!StanzaParser::parseMessage(parseStanza("<iq xmlns='jabber:client' type='result'/>")));
    }

    void testReceipt()
    {
        auto r = StanzaParser::parseReceipt(parseStanza("<message xmlns='jabber:client' from='bob@example.com'>"
                                                        "<received xmlns='urn:xmpp:receipts' id='m1'/></message>"));
        QVERIFY(r);
        QCOMPARE(r->kind, Receipt::Received);
        QCOMPARE(r->id, QString("m1"));
        QCOMPARE(r->from, QString("bob@example.com"));

        auto d = StanzaParser::parseReceipt(parseStanza("<message xmlns='jabber:client' from='bob@example.com'>"
                                                        "<displayed xmlns='urn:xmpp:chat-markers:0' id='m2'/>"
                                                        "</message>"));
        QVERIFY(d);
        QCOMPARE(d->kind, Receipt::Displayed);
        QCOMPARE(d->kindString(), QString("displayed"));

        QVERIFY(!StanzaParser::parseReceipt(parseStanza("<message xmlns='jabber:client'><body>x</body></message>")));
    }

    void testArchiveItem()
    {
        auto item = StanzaParser::parseArchiveItem(parseStanza(archiveItemXml));
        QVERIFY(item);
        QCOMPARE(item->queryId, QString("q1"));

        const MessageBase &base = messageBase(item->message);
        QCOMPARE(base.id, QString("m1"));
        QCOMPARE(base.stanzaId, QString("28482-98726-73623"));
        QCOMPARE(base.from, QString("bob@example.com/phone"));
        QCOMPARE(base.body, QString("Hail to thee"));
        QCOMPARE(base.timestamp, QDateTime(QDate(2010, 7, 10), QTime(23, 8, 25), Qt::UTC));
    }

    void testArchiveItemOlderNamespace()
    {
        QString xml = QString(archiveItemXml).replace("urn:xmpp:mam:2", "urn:xmpp:mam:1");
        QVERIFY(StanzaParser::parseArchiveItem(parseStanza(xml)));
        QVERIFY(StanzaParser::isArchiveNS("urn:xmpp:mam:0"));
        QVERIFY(!StanzaParser::isArchiveNS("urn:xmpp:mix:core:1"));
    }

    void testMalformedArchiveItem()
    {
        QString noQueryId = QString(archiveItemXml).replace(" queryid='q1'", "");
        QVERIFY(!StanzaParser::parseArchiveItem(parseStanza(noQueryId)));

        QVERIFY(!StanzaParser::parseArchiveItem(
            parseStanza("<message xmlns='jabber:client'><result xmlns='urn:xmpp:mam:2' queryid='q1'>"
                        "<forwarded xmlns='urn:xmpp:forward:0'/></result></message>")));
    }

    void testArchiveFin()
    {
        auto fin = StanzaParser::parseArchiveFin(
            parseStanza("<iq xmlns='jabber:client' type='result' id='q1'>"
                        "<fin xmlns='urn:xmpp:mam:2' complete='true'>"
                        "<set xmlns='http://jabber.org/protocol/rsm'>"
                        "<first index='0'>28482-98726-73623</first><last>09af3-cc343-b409f</last>"
                        "<count>20</count></set></fin></iq>"));
        QVERIFY(fin);
        QCOMPARE(fin->queryId, QString("q1"));
        QVERIFY(fin->complete);
        QVERIFY(fin->rsm);
        QCOMPARE(fin->rsm->first, QString("28482-98726-73623"));
        QCOMPARE(fin->rsm->last, QString("09af3-cc343-b409f"));
        QVERIFY(fin->rsm->count);
        QCOMPARE(*fin->rsm->count, 20);
    }

    void testArchiveFinInMessage()
    {
        auto fin = StanzaParser::parseArchiveFin(
            parseStanza("<message xmlns='jabber:client' id='m77'>"
                        "<fin xmlns='urn:xmpp:mam:0' queryid='q2'/></message>"));
        QVERIFY(fin);
        QCOMPARE(fin->queryId, QString("q2"));
        QVERIFY(!fin->complete);
        QVERIFY(!fin->rsm);
    }

    void testUploadSlot()
    {
        auto slot = StanzaParser::parseUploadSlot(
            parseStanza("<iq xmlns='jabber:client' type='result' id='u1'>"
                        "<slot xmlns='urn:xmpp:http:upload:0'>"
                        "<put url='https://up.example.com/put/cat.png'>"
                        "<header name='Authorization'>Basic Base64String==</header>"
                        "<header name='X-Evil'>drop me</header>"
                        "</put>"
                        "<get url='https://up.example.com/get/cat.png'/>"
                        "</slot></iq>"));
        QVERIFY(slot);
        QCOMPARE(slot->putUrl, QString("https://up.example.com/put/cat.png"));
        QCOMPARE(slot->getUrl, QString("https://up.example.com/get/cat.png"));
        QCOMPARE(int(slot->putHeaders.size()), 1);
        QCOMPARE(slot->putHeaders.value("Authorization"), QString("Basic Base64String=="));
    }

    void testUploadSlotLegacyText()
    {
        auto slot = StanzaParser::parseUploadSlot(
            parseStanza("<iq xmlns='jabber:client' type='result'><slot xmlns='urn:xmpp:http:upload'>"
                        "<put>https://up.example.com/put</put><get>https://up.example.com/get</get>"
                        "</slot></iq>"));
        QVERIFY(slot);
        QCOMPARE(slot->putUrl, QString("https://up.example.com/put"));
        QCOMPARE(slot->getUrl, QString("https://up.example.com/get"));

        QVERIFY(!StanzaParser::parseUploadSlot(
            parseStanza("<iq xmlns='jabber:client' type='result'><slot xmlns='urn:xmpp:http:upload:0'>"
                        "<put url='https://up.example.com/put'/></slot></iq>")));
    }

    void testReadStatus()
    {
        auto s = StanzaParser::parseReadStatus(
            parseStanza("<iq xmlns='jabber:client' type='result'>"
                        "<status xmlns='urn:xmpp:message-status:0' delivered='true' read='false' "
                        "timestamp='1767225600000'/></iq>"));
        QVERIFY(s);
        QVERIFY(s->delivered);
        QVERIFY(!s->read);
        QVERIFY(s->timestamp);
        QCOMPARE(*s->timestamp, qint64(1767225600000LL));

        QVERIFY(!StanzaParser::parseReadStatus(parseStanza("<iq xmlns='jabber:client' type='result'/>")));
    }

    void testMessageHelpers()
    {
        QDomElement m = parseStanza("<message xmlns='jabber:client'>"
                                    "<thread parent='t0'>t1</thread>"
                                    "<replace xmlns='urn:xmpp:message-correct:0' id='m0'/>"
                                    "<x xmlns='jabber:x:delay' stamp='20020910T23:08:25'/>"
                                    "</message>");

        auto thread = StanzaParser::threadInfo(m);
        QVERIFY(thread);
        QCOMPARE(thread->id, QString("t1"));
        QCOMPARE(thread->parent, QString("t0"));
        QCOMPARE(StanzaParser::replacedMessageId(m), QString("m0"));
        QCOMPARE(StanzaParser::delayTimestamp(m), QDateTime(QDate(2002, 9, 10), QTime(23, 8, 25), Qt::UTC));
    }
};

PARLEY_REGISTER_TEST(StanzaParserTest);
#include "stanzaparsertest.moc"
