/*
 * dispatchertest.cpp - Dispatcher unit tests
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

#include "parley/im/dispatcher.h"
#include "parley/qa/mocktransport.h"
#include "parley/qa/qttestutil/qttestutil.h"

using namespace Parley;

static QString archiveItem(const QString &queryId, const QString &id, const QString &body)
{
    return QString("<message xmlns='jabber:client' to='alice@example.com'>"
                   "<result xmlns='urn:xmpp:mam:2' queryid='%1' id='arch-%2'>"
                   "<forwarded xmlns='urn:xmpp:forward:0'>"
                   "<delay xmlns='urn:xmpp:delay' stamp='2026-01-02T10:20:30Z'/>"
                   "<message xmlns='jabber:client' from='bob@example.com' id='%2' type='chat'><body>%3</body>"
                   "</message></forwarded></result></message>")
        .arg(queryId, id, body);
}

static QString archiveFin(const QString &queryId)
{
    return QString("<iq xmlns='jabber:client' type='result' id='%1'>"
                   "<fin xmlns='urn:xmpp:mam:2' complete='true'>"
                   "<set xmlns='http://jabber.org/protocol/rsm'><first>arch-m1</first><last>arch-m2</last></set>"
                   "</fin></iq>")
        .arg(queryId);
}

class DispatcherTest : public QObject {
    Q_OBJECT

private slots:
    void testClassify()
    {
        QCOMPARE(Dispatcher::classify(parseStanza("<presence xmlns='jabber:client'/>")), Dispatcher::PresenceStanza);
        QCOMPARE(Dispatcher::classify(parseStanza(archiveItem("q1", "m1", "hi"))), Dispatcher::ArchiveItemStanza);
        QCOMPARE(Dispatcher::classify(parseStanza(archiveFin("q1"))), Dispatcher::ArchiveTerminalStanza);
        QCOMPARE(Dispatcher::classify(parseStanza("<message xmlns='jabber:client'>"
                                                  "<received xmlns='urn:xmpp:receipts' id='m1'/></message>")),
                 Dispatcher::ReceiptStanza);
        QCOMPARE(Dispatcher::classify(parseStanza("<message xmlns='jabber:client'><body>hi</body></message>")),
                 Dispatcher::MessageStanza);
        QCOMPARE(Dispatcher::classify(parseStanza("<iq xmlns='jabber:client' type='get'>"
                                                  "<ping xmlns='urn:xmpp:ping'/></iq>")),
                 Dispatcher::IgnoredStanza);
        QDomElement features = parseStanza("<stream:features xmlns:stream='http://etherx.jabber.org/streams'/>");
        QCOMPARE(Dispatcher::classify(features), Dispatcher::IgnoredStanza);
    }

    void testReceiptWinsOverBody()
    {
        QDomElement x = parseStanza("<message xmlns='jabber:client' from='bob@example.com'><body>ok</body>"
                                    "<displayed xmlns='urn:xmpp:chat-markers:0' id='m1'/></message>");
        QCOMPARE(Dispatcher::classify(x), Dispatcher::ReceiptStanza);
    }

    void testArchiveRoundTrip()
    {
        Dispatcher           d(nullptr);
        QList<ArchiveResult> results;
        int                  messages = 0;
        connect(&d, &Dispatcher::archiveResultReady, this,
                [&results](const ArchiveResult &r) { results << r; });
        connect(&d, &Dispatcher::messageReceived, this, [&messages](const Message &) { ++messages; });

        QCOMPARE(d.dispatch(parseStanza(archiveItem("q1", "m1", "first"))), Dispatcher::ArchiveItemStanza);
        QCOMPARE(d.dispatch(parseStanza(archiveItem("q1", "m2", "second"))), Dispatcher::ArchiveItemStanza);
        QVERIFY(results.isEmpty());
        QVERIFY(d.aggregator()->hasPending("q1"));

        QCOMPARE(d.dispatch(parseStanza(archiveFin("q1"))), Dispatcher::ArchiveTerminalStanza);
        QCOMPARE(int(results.size()), 1);
        const ArchiveResult &r = results.first();
        QCOMPARE(r.queryId, QString("q1"));
        QVERIFY(r.complete);
        QCOMPARE(int(r.messages.size()), 2);
        QCOMPARE(messageBase(r.messages.at(0)).body, QString("first"));
        QCOMPARE(messageBase(r.messages.at(1)).stanzaId, QString("arch-m2"));
        QCOMPARE(r.rsm->last, QString("arch-m2"));

        // archived messages are not live messages
        QCOMPARE(messages, 0);
    }

    void testMalformedArchiveItemIsDropped()
    {
        Dispatcher d(nullptr);
        QDomElement x = parseStanza("<message xmlns='jabber:client'><result xmlns='urn:xmpp:mam:2' queryid='q1'/>"
                                    "</message>");
        QCOMPARE(d.dispatch(x), Dispatcher::ArchiveItemStanza);
        QCOMPARE(d.aggregator()->pendingCount(), 0);
    }

    void testLiveEvents()
    {
        Dispatcher      d(nullptr);
        QList<Presence> presences;
        QList<Receipt>  receipts;
        QList<Message>  messages;
        connect(&d, &Dispatcher::presenceReceived, this, [&presences](const Presence &p) { presences << p; });
        connect(&d, &Dispatcher::receiptReceived, this, [&receipts](const Receipt &r) { receipts << r; });
        connect(&d, &Dispatcher::messageReceived, this, [&messages](const Message &m) { messages << m; });

        d.dispatch(parseStanza("<presence xmlns='jabber:client' from='bob@example.com' type='unavailable'/>"));
        d.dispatch(parseStanza("<message xmlns='jabber:client' from='bob@example.com'>"
                               "<received xmlns='urn:xmpp:receipts' id='m1'/></message>"));
        d.dispatch(parseStanza("<message xmlns='jabber:client' from='bob@example.com' type='chat'>"
                               "<body>hello</body></message>"));
        d.dispatch(parseStanza("<message xmlns='jabber:client' type='error'><body>bounced</body></message>"));

        QCOMPARE(int(presences.size()), 1);
        QCOMPARE(presences.first().type, QString("unavailable"));
        QCOMPARE(int(receipts.size()), 1);
        QCOMPARE(receipts.first().id, QString("m1"));
        QCOMPARE(int(messages.size()), 1);
        QCOMPARE(messageBase(messages.first()).body, QString("hello"));
    }

    void testStreamFromConnection()
    {
        MockTransportFactory f;
        ConnectionConfig     c;
        c.service  = "wss://example.com/ws";
        c.domain   = "example.com";
        c.username = "alice@example.com";
        c.password = "secret";
        ConnectionManager m(c, f.factory());
        Dispatcher        d(&m);

        int messages = 0;
        connect(&d, &Dispatcher::messageReceived, this, [&messages](const Message &) { ++messages; });

        QVERIFY(m.connectToServer());
        f.last()->receive("<message xmlns='jabber:client' from='bob@example.com'><body>hi</body></message>");
        QCOMPARE(messages, 1);

        f.last()->receive(archiveItem("q1", "m1", "partial"));
        QVERIFY(d.aggregator()->hasPending("q1"));

        // partial results die with the session
        m.disconnectFromServer();
        QCOMPARE(d.aggregator()->pendingCount(), 0);
    }
};

PARLEY_REGISTER_TEST(DispatcherTest);
#include "dispatchertest.moc"
