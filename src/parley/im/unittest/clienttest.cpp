/*
 * clienttest.cpp - Client unit tests
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
#include "parley/im/client.h"
#include "parley/qa/mocktransport.h"
#include "parley/qa/qttestutil/qttestutil.h"

#include <stdexcept>

using namespace Parley;
using namespace Parley::XMLHelper;

static ConnectionConfig testConfig()
{
    ConnectionConfig c;
    c.service  = "wss://example.com/ws";
    c.domain   = "example.com";
    c.username = "alice@example.com";
    c.password = "secret";
    return c;
}

// answers get-status queries: m1 is read, everything else is unknown
static void answerStatus(MockTransport *t, const QDomElement &iq)
{
    QDomElement get = childElementNS(iq, PARLEY_NS_MESSAGE_STATUS, "get-status");
    if (get.isNull())
        return;
    if (get.attribute("id") == "m1")
        t->receive(QString("<iq xmlns='jabber:client' type='result' id='%1'>"
                           "<status xmlns='urn:xmpp:message-status:0' delivered='true' read='true'/></iq>")
                       .arg(iq.attribute("id")));
    else
        t->receive(QString("<iq xmlns='jabber:client' type='error' id='%1'><error type='cancel'>"
                           "<item-not-found xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'/></error></iq>")
                       .arg(iq.attribute("id")));
}

class ClientTest : public QObject {
    Q_OBJECT

private slots:
    void testIncompleteConfigThrows()
    {
        MockTransportFactory f;
        ConnectionConfig     c = testConfig();
        c.username.clear();

        bool thrown = false;
        try {
            Client client(c, f.factory());
        } catch (const std::invalid_argument &) {
            thrown = true;
        }
        QVERIFY(thrown);
    }

    void testConnectAndSendMessage()
    {
        MockTransportFactory f;
        Client               client(testConfig(), f.factory());
        QCOMPARE(client.status(), ConnectionManager::Disconnected);

        QList<int> statuses;
        connect(&client, &Client::statusChanged, this,
                [&statuses](ConnectionManager::Status s) { statuses << int(s); });

        bool ok = false;
        QVERIFY(client.connectToServer([&ok](bool success, const ClientError &) { ok = success; }));
        QVERIFY(ok);
        QCOMPARE(statuses, QList<int>() << ConnectionManager::Connecting << ConnectionManager::Online);
        QCOMPARE(client.userJid(), QString("alice@example.com"));

        MessageOptions o;
        o.requestReceipt = true;
        QVERIFY(client.sendMessage("bob@example.com", "Hello", o));
        QDomElement m = f.last()->lastSent();
        QCOMPARE(m.attribute("to"), QString("bob@example.com"));
        QCOMPARE(subTagText(m, "body"), QString("Hello"));
        QVERIFY(hasChildNS(m, PARLEY_NS_RECEIPTS, "request"));
    }

    void testSendMessageOffline()
    {
        MockTransportFactory f;
        Client               client(testConfig(), f.factory());

        QueryError err;
        QVERIFY(!client.sendMessage("bob@example.com", "Hello", MessageOptions(), &err));
        QCOMPARE(err.kind, QueryError::NotConnected);
    }

    void testConnectFailureIsReported()
    {
        MockTransportFactory f;
        f.autoOnline           = false;
        ConnectionConfig c     = testConfig();
        c.maxReconnectAttempts = 0;
        Client client(c, f.factory());

        QList<ClientError> errors;
        connect(&client, &Client::error, this, [&errors](const ClientError &e) { errors << e; });

        ClientError connectErr;
        client.connectToServer([&connectErr](bool, const ClientError &e) { connectErr = e; });
        f.last()->fail("connection refused");

        QCOMPARE(connectErr.code, QString("CONNECTION_ERROR"));
        QCOMPARE(connectErr.message, QString("connection refused"));
        QCOMPARE(int(errors.size()), 1);
        QCOMPARE(errors.first().code, QString("transport-error"));
        QCOMPARE(client.status(), ConnectionManager::Error);
    }

    void testInboundEvents()
    {
        MockTransportFactory f;
        Client               client(testConfig(), f.factory());
        QVERIFY(client.connectToServer());

        QList<Message>  messages;
        QList<Presence> presences;
        QList<Receipt>  receipts;
        connect(&client, &Client::messageReceived, this, [&messages](const Message &m) { messages << m; });
        connect(&client, &Client::presenceReceived, this, [&presences](const Presence &p) { presences << p; });
        connect(&client, &Client::receiptReceived, this, [&receipts](const Receipt &r) { receipts << r; });

        f.last()->receive("<message xmlns='jabber:client' from='bob@example.com/phone' type='chat' id='m1'>"
                          "<body>hi</body></message>");
        f.last()->receive("<presence xmlns='jabber:client' from='bob@example.com/phone'/>");
        f.last()->receive("<message xmlns='jabber:client' from='bob@example.com/phone'>"
                          "<received xmlns='urn:xmpp:receipts' id='x1'/></message>");

        QCOMPARE(int(messages.size()), 1);
        QCOMPARE(messageBase(messages.first()).id, QString("m1"));
        QVERIFY(!messageBase(messages.first()).readStatus);
        QCOMPARE(int(presences.size()), 1);
        QCOMPARE(int(receipts.size()), 1);
    }

    void testInboundMessageWithReadStatus()
    {
        MockTransportFactory f;
        f.responder = answerStatus;
        Client client(testConfig(), f.factory());
        QVERIFY(!client.fetchReadStatus());
        client.setFetchReadStatus(true);
        QVERIFY(client.connectToServer());

        QList<Message> messages;
        connect(&client, &Client::messageReceived, this, [&messages](const Message &m) { messages << m; });

        f.last()->receive("<message xmlns='jabber:client' from='bob@example.com/phone' type='chat' id='m1'>"
                          "<body>hi</body></message>");

        QDomElement get = childElementNS(f.last()->lastSent(), PARLEY_NS_MESSAGE_STATUS, "get-status");
        QCOMPARE(get.attribute("id"), QString("m1"));
        QCOMPARE(get.attribute("jid"), QString("bob@example.com/phone"));

        QCOMPARE(int(messages.size()), 1);
        const MessageBase &base = messageBase(messages.first());
        QCOMPARE(base.body, QString("hi"));
        QVERIFY(base.readStatus);
        QVERIFY(base.readStatus->delivered);
        QVERIFY(base.readStatus->read);
    }

    void testArchiveResultWithReadStatus()
    {
        MockTransportFactory f;
        f.responder = answerStatus;
        Client client(testConfig(), f.factory());
        client.setFetchReadStatus(true);
        QVERIFY(client.connectToServer());

        QList<ArchiveResult> results;
        connect(&client, &Client::archiveResultReady, this, [&results](const ArchiveResult &r) { results << r; });

        const QString queryId = client.queryArchive(ArchiveQuery());
        QVERIFY(!queryId.isEmpty());

        const QString item("<message xmlns='jabber:client'><result xmlns='urn:xmpp:mam:2' queryid='%1' id='%2'>"
                           "<forwarded xmlns='urn:xmpp:forward:0'>"
                           "<message xmlns='jabber:client' from='bob@example.com' %3><body>%4</body>"
                           "</message></forwarded></result></message>");
        f.last()->receive(item.arg(queryId, "a1", "id='m1'", "first"));
        f.last()->receive(item.arg(queryId, "a2", "id='m2'", "second"));
        f.last()->receive(item.arg(queryId, "a3", QString(), "third"));
        f.last()->receive(QString("<iq xmlns='jabber:client' type='result' id='%1'>"
                                  "<fin xmlns='urn:xmpp:mam:2' complete='true'/></iq>")
                              .arg(queryId));

        QCOMPARE(int(results.size()), 1);
        const QList<Message> &messages = results.first().messages;
        QCOMPARE(int(messages.size()), 3);

        QCOMPARE(messageBase(messages.at(0)).body, QString("first"));
        QVERIFY(messageBase(messages.at(0)).readStatus);
        QVERIFY(messageBase(messages.at(0)).readStatus->read);

        // an unknown message still gets a status, just an unread one
        QVERIFY(messageBase(messages.at(1)).readStatus);
        QVERIFY(!messageBase(messages.at(1)).readStatus->read);
        QVERIFY(!messageBase(messages.at(1)).readStatus->delivered);

        QCOMPARE(messageBase(messages.at(2)).body, QString("third"));
        QVERIFY(!messageBase(messages.at(2)).readStatus);
    }

    void testQueryArchive()
    {
        MockTransportFactory f;
        Client               client(testConfig(), f.factory());
        QVERIFY(client.connectToServer());

        QList<ArchiveResult> results;
        connect(&client, &Client::archiveResultReady, this, [&results](const ArchiveResult &r) { results << r; });

        ArchiveQuery q;
        q.filter.with = "bob@example.com";
        ResultSetRequest rsm;
        rsm.max = 10;
        q.rsm   = rsm;

        const QString queryId = client.queryArchive(q);
        QVERIFY(!queryId.isEmpty());
        QDomElement iq = f.last()->lastSent();
        QCOMPARE(iq.attribute("id"), queryId);
        QCOMPARE(childElementNS(iq, PARLEY_NS_MAM, "query").attribute("queryid"), queryId);

        f.last()->receive(QString("<message xmlns='jabber:client'><result xmlns='urn:xmpp:mam:2' queryid='%1' id='a1'>"
                                  "<forwarded xmlns='urn:xmpp:forward:0'>"
                                  "<message xmlns='jabber:client' from='bob@example.com' id='m1'><body>old</body>"
                                  "</message></forwarded></result></message>")
                              .arg(queryId));
        f.last()->receive(QString("<iq xmlns='jabber:client' type='result' id='%1'>"
                                  "<fin xmlns='urn:xmpp:mam:2' complete='true'/></iq>")
                              .arg(queryId));

        QCOMPARE(int(results.size()), 1);
        QCOMPARE(results.first().queryId, queryId);
        QVERIFY(results.first().complete);
        QCOMPARE(int(results.first().messages.size()), 1);
        QCOMPARE(messageBase(results.first().messages.first()).body, QString("old"));
    }

    void testRejectedArchiveQuery()
    {
        MockTransportFactory f;
        Client               client(testConfig(), f.factory());
        QVERIFY(client.connectToServer());

        QList<ClientError> errors;
        connect(&client, &Client::error, this, [&errors](const ClientError &e) { errors << e; });

        ArchiveQuery q;
        q.queryId = "q9";
        QCOMPARE(client.queryArchive(q), QString("q9"));

        f.last()->receive("<message xmlns='jabber:client'><result xmlns='urn:xmpp:mam:2' queryid='q9' id='a1'>"
                          "<forwarded xmlns='urn:xmpp:forward:0'>"
                          "<message xmlns='jabber:client' from='bob@example.com' id='m1'><body>x</body></message>"
                          "</forwarded></result></message>");
        QVERIFY(client.dispatcher()->aggregator()->hasPending("q9"));

        f.last()->receive("<iq xmlns='jabber:client' type='error' id='q9'><error type='modify'>"
                          "<bad-request xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'/></error></iq>");

        QCOMPARE(int(errors.size()), 1);
        QCOMPARE(errors.first().code, QString("protocol_error"));
        QCOMPARE(errors.first().type, QString("modify"));
        QVERIFY(errors.first().message.startsWith("Archive query q9 failed: bad-request"));
        QVERIFY(!client.dispatcher()->aggregator()->hasPending("q9"));
    }

    void testQueryArchiveOffline()
    {
        MockTransportFactory f;
        Client               client(testConfig(), f.factory());

        QueryError err;
        QVERIFY(client.queryArchive(ArchiveQuery(), &err).isEmpty());
        QCOMPARE(err.kind, QueryError::NotConnected);
    }

    void testQueryArchiveWriteFailure()
    {
        MockTransportFactory f;
        Client               client(testConfig(), f.factory());
        QVERIFY(client.connectToServer());
        f.last()->sendFails = true;

        QList<ClientError> errors;
        connect(&client, &Client::error, this, [&errors](const ClientError &e) { errors << e; });

        QueryError err;
        QVERIFY(client.queryArchive(ArchiveQuery(), &err).isEmpty());
        QCOMPARE(err.kind, QueryError::SendFailed);
        QVERIFY(errors.isEmpty());
    }

    void testPresence()
    {
        MockTransportFactory f;
        Client               client(testConfig(), f.factory());
        QVERIFY(client.connectToServer());

        QVERIFY(client.broadcastPresence(true));
        QVERIFY(client.subscribeToPresence("bob@example.com"));
        QCOMPARE(f.last()->lastSent().attribute("type"), QString("subscribe"));
        QVERIFY(client.probePresence("bob@example.com"));
        QCOMPARE(f.last()->lastSent().attribute("type"), QString("probe"));
        QVERIFY(client.acceptSubscription("bob@example.com"));
        QCOMPARE(f.last()->lastSent().attribute("type"), QString("subscribed"));
        QVERIFY(client.sendPresenceToRoom("room@muc.example.com/alice", false));
        QCOMPARE(f.last()->lastSent().attribute("type"), QString("unavailable"));
        QCOMPARE(int(f.last()->sent.size()), 5);
    }

    void testMarkMessageAsRead()
    {
        MockTransportFactory f;
        f.responder = [](MockTransport *t, const QDomElement &x) {
            if (localName(x) == QLatin1String("iq"))
                t->receive(QString("<iq xmlns='jabber:client' type='result' id='%1'/>").arg(x.attribute("id")));
        };
        Client client(testConfig(), f.factory());
        QVERIFY(client.connectToServer());

        QStringList read;
        connect(&client, &Client::messageRead, this,
                [&read](const QString &id, const QString &from, const QString &) { read << id + "|" + from; });

        ChatMessage m;
        m.id   = "m1";
        m.from = "bob@example.com/phone";
        m.to   = "alice@example.com";

        bool ok = false;
        client.markMessageAsRead(m, [&ok](bool success, const ClientError &) { ok = success; });
        QVERIFY(ok);
        QCOMPARE(read, QStringList() << "m1|bob@example.com/phone");
    }

    void testMarkMessageAsDeliveredFailure()
    {
        MockTransportFactory f;
        f.responder = [](MockTransport *t, const QDomElement &x) {
            t->receive(QString("<iq xmlns='jabber:client' type='error' id='%1'><error type='auth'>"
                               "<forbidden xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'/></error></iq>")
                           .arg(x.attribute("id")));
        };
        Client client(testConfig(), f.factory());
        QVERIFY(client.connectToServer());

        QList<ClientError> errors;
        connect(&client, &Client::messageDeliveredError, this, [&errors](const ClientError &e) { errors << e; });

        ChatMessage m;
        m.id   = "m1";
        m.from = "bob@example.com";
        client.markMessageAsDelivered(m);

        QCOMPARE(int(errors.size()), 1);
        QCOMPARE(errors.first().code, QString("unauthorized"));
    }

    void testSendAttachment()
    {
        MockTransportFactory f;
        f.responder = [](MockTransport *t, const QDomElement &x) {
            if (localName(x) != QLatin1String("iq"))
                return;
            t->receive(QString("<iq xmlns='jabber:client' type='result' id='%1'>"
                               "<slot xmlns='urn:xmpp:http:upload:0'>"
                               "<put url='https://up.example.com/put/cat.png'/>"
                               "<get url='https://up.example.com/get/cat.png'/>"
                               "</slot></iq>")
                           .arg(x.attribute("id")));
        };
        Client client(testConfig(), f.factory());
        client.setNetworkAccessManager(nullptr);
        QVERIFY(client.connectToServer());

        Attachment a;
        a.fileName = "cat.png";
        a.mimeType = "image/png";
        a.data     = QByteArray(64, 'x');

        bool ok = false;
        client.sendAttachment("bob@example.com", QString(), a, [&ok](bool success, const ClientError &) {
            ok = success;
        });

        QVERIFY(ok);
        QDomElement m    = f.last()->lastSent();
        QDomElement file = childElementNS(childElementNS(m, PARLEY_NS_HTTP_UPLOAD, "x"), QString(), "file");
        QCOMPARE(m.attribute("to"), QString("bob@example.com"));
        QCOMPARE(subTagText(m, "body"), QString("cat.png"));
        QCOMPARE(file.attribute("url"), QString("https://up.example.com/get/cat.png"));
        QCOMPARE(file.attribute("size"), QString("64"));
    }

    void testSendAttachmentTooLarge()
    {
        MockTransportFactory f;
        ConnectionConfig     c = testConfig();
        c.upload.maxFileSize   = 8;
        Client client(c, f.factory());
        QVERIFY(client.connectToServer());

        Attachment a;
        a.fileName = "cat.png";
        a.mimeType = "image/png";
        a.data     = QByteArray(64, 'x');

        ClientError err;
        client.sendAttachment("bob@example.com", QString(), a, [&err](bool, const ClientError &e) { err = e; });
        QCOMPARE(err.code, QString("SIZE_EXCEEDED"));
        QVERIFY(f.last()->sent.isEmpty());
    }
};

PARLEY_REGISTER_TEST(ClientTest);
#include "clienttest.moc"
