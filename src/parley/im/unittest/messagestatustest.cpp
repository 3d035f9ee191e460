/*
 * messagestatustest.cpp - MessageStatusManager unit tests
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
#include "parley/im/messagestatus.h"
#include "parley/qa/mocktransport.h"
#include "parley/qa/qttestutil/qttestutil.h"

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

static QString errorIq(const QString &id, const QString &type, const QString &condition,
                       const QString &text = QString())
{
    QString inner = QString("<%1 xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'/>").arg(condition);
    if (!text.isEmpty())
        inner += QString("<text xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'>%1</text>").arg(text);
    return QString("<iq xmlns='jabber:client' type='error' id='%1'><error type='%2'>%3</error></iq>")
        .arg(id, type, inner);
}

// answers every iq with \a reply, %1 being the request id
static MockTransport::Responder replyWith(const QString &reply)
{
    return [reply](MockTransport *t, const QDomElement &x) {
        if (localName(x) == QLatin1String("iq"))
            t->receive(QString(reply).arg(x.attribute("id")));
    };
}

static MessageBase incoming(const QString &id)
{
    MessageBase m;
    m.id   = id;
    m.from = "bob@example.com/phone";
    m.to   = "alice@example.com";
    return m;
}

struct Outcome {
    bool        called  = false;
    bool        success = false;
    int         calls   = 0;
    StatusError error;

    MessageStatusManager::Callback callback()
    {
        return [this](bool ok, const StatusError &e) {
            called  = true;
            success = ok;
            error   = e;
            ++calls;
        };
    }
};

class MessageStatusTest : public QObject {
    Q_OBJECT

private slots:
    void testMarkAsReadSendsMarkThenReceipt()
    {
        MockTransportFactory f;
        f.responder = replyWith("<iq xmlns='jabber:client' type='result' id='%1'/>");
        ConnectionManager    m(testConfig(), f.factory());
        MessageStatusManager s(&m);
        QVERIFY(m.connectToServer());

        Outcome o;
        s.markAsRead(incoming("m1"), o.callback());

        QVERIFY(o.called);
        QVERIFY(o.success);
        const QList<QDomElement> &sent = f.last()->sent;
        QCOMPARE(int(sent.size()), 2);
        QCOMPARE(childElementNS(sent.at(0), PARLEY_NS_MESSAGE_STATUS, "mark-read").attribute("id"), QString("m1"));
        QCOMPARE(localName(sent.at(1)), QString("message"));
        QCOMPARE(sent.at(1).attribute("to"), QString("bob@example.com/phone"));
        QCOMPARE(childElementNS(sent.at(1), PARLEY_NS_RECEIPTS, "displayed").attribute("id"), QString("m1"));
    }

    void testMarkAsDelivered()
    {
        MockTransportFactory f;
        f.responder = replyWith("<iq xmlns='jabber:client' type='result' id='%1'/>");
        ConnectionManager    m(testConfig(), f.factory());
        MessageStatusManager s(&m);
        QVERIFY(m.connectToServer());

        Outcome o;
        s.markAsDelivered(incoming("m1"), o.callback());

        QVERIFY(o.success);
        QVERIFY(hasChildNS(f.last()->sent.at(0), PARLEY_NS_MESSAGE_STATUS, "mark-delivered"));
        QVERIFY(hasChildNS(f.last()->sent.at(1), PARLEY_NS_RECEIPTS, "received"));
    }

    void testRejectedMarkSendsNoReceipt()
    {
        MockTransportFactory f;
        f.responder = replyWith(errorIq("%1", "auth", "forbidden"));
        ConnectionManager    m(testConfig(), f.factory());
        MessageStatusManager s(&m);
        QVERIFY(m.connectToServer());

        Outcome o;
        s.markAsRead(incoming("m1"), o.callback());

        QVERIFY(o.called);
        QVERIFY(!o.success);
        QCOMPARE(o.error.kind, StatusError::Unauthorized);
        QCOMPARE(o.error.code(), QString("unauthorized"));
        QCOMPARE(o.error.text, QString("Not authorized to access message status"));
        QCOMPARE(int(f.last()->sent.size()), 1);
    }

    void testErrorMapping()
    {
        auto protocol = [](StanzaError::ErrorCond cond, const QString &text) {
            return QueryError(StanzaError(StanzaError::Modify, cond, text));
        };

        StatusError e = MessageStatusManager::errorFromQuery(protocol(StanzaError::ItemNotFound, QString()));
        QCOMPARE(e.kind, StatusError::NotFound);
        QCOMPARE(e.text, QString("Message status not found"));

        e = MessageStatusManager::errorFromQuery(protocol(StanzaError::BadRequest, "Malformed JID"));
        QCOMPARE(e.kind, StatusError::InvalidJid);
        QCOMPARE(e.text, QString("Invalid JID format"));

        e = MessageStatusManager::errorFromQuery(protocol(StanzaError::BadRequest, "missing id"));
        QCOMPARE(e.kind, StatusError::InvalidId);
        QCOMPARE(e.code(), QString("invalid_id"));

        e = MessageStatusManager::errorFromQuery(protocol(StanzaError::InternalServerError, QString()));
        QCOMPARE(e.kind, StatusError::ServerError);

        e = MessageStatusManager::errorFromQuery(QueryError::notConnected());
        QCOMPARE(e.kind, StatusError::ServerError);
        QCOMPARE(e.text, QString("Not connected to server"));
    }

    void testMarkWhileOffline()
    {
        MockTransportFactory f;
        ConnectionManager    m(testConfig(), f.factory());
        MessageStatusManager s(&m);

        Outcome o;
        s.markAsRead(incoming("m1"), o.callback());
        QVERIFY(o.called);
        QCOMPARE(o.error.kind, StatusError::ServerError);
        QCOMPARE(o.error.text, QString("Not connected to server"));
    }

    void testGetStatus()
    {
        MockTransportFactory f;
        f.responder = replyWith("<iq xmlns='jabber:client' type='result' id='%1'>"
                                "<status xmlns='urn:xmpp:message-status:0' delivered='true' read='true' "
                                "timestamp='1767225600000'/></iq>");
        ConnectionManager    m(testConfig(), f.factory());
        MessageStatusManager s(&m);
        QVERIFY(m.connectToServer());

        bool              ok = false;
        MessageReadStatus status;
        s.getStatus("m1", "bob@example.com", [&](bool success, const MessageReadStatus &st, const StatusError &) {
            ok     = success;
            status = st;
        });

        QVERIFY(ok);
        QVERIFY(status.delivered);
        QVERIFY(status.read);
        QVERIFY(status.timestamp);
        QCOMPARE(*status.timestamp, qint64(1767225600000LL));
        QDomElement get = childElementNS(f.last()->lastSent(), PARLEY_NS_MESSAGE_STATUS, "get-status");
        QCOMPARE(get.attribute("id"), QString("m1"));
        QCOMPARE(get.attribute("jid"), QString("bob@example.com"));
    }

    void testGetStatusOfUnknownMessage()
    {
        MockTransportFactory f;
        f.responder = replyWith(errorIq("%1", "cancel", "item-not-found"));
        ConnectionManager    m(testConfig(), f.factory());
        MessageStatusManager s(&m);
        QVERIFY(m.connectToServer());

        bool              called = false, ok = false;
        MessageReadStatus status;
        status.read = true;
        s.getStatus("m1", "bob@example.com", [&](bool success, const MessageReadStatus &st, const StatusError &) {
            called = true;
            ok     = success;
            status = st;
        });

        QVERIFY(called);
        QVERIFY(ok);
        QVERIFY(!status.delivered);
        QVERIFY(!status.read);
    }

    void testGetStatusInvalidResponse()
    {
        MockTransportFactory f;
        f.responder = replyWith("<iq xmlns='jabber:client' type='result' id='%1'/>");
        ConnectionManager    m(testConfig(), f.factory());
        MessageStatusManager s(&m);
        QVERIFY(m.connectToServer());

        StatusError err;
        bool        ok = true;
        s.getStatus("m1", "bob@example.com", [&](bool success, const MessageReadStatus &, const StatusError &e) {
            ok  = success;
            err = e;
        });

        QVERIFY(!ok);
        QCOMPARE(err.text, QString("Invalid response format"));
    }

    void testMarkMultiple()
    {
        MockTransportFactory f;
        f.responder = replyWith("<iq xmlns='jabber:client' type='result' id='%1'/>");
        ConnectionManager    m(testConfig(), f.factory());
        MessageStatusManager s(&m);
        QVERIFY(m.connectToServer());

        QList<Message> messages;
        for (const QString &id : QStringList() << "m1" << "m2" << "m3") {
            ChatMessage c;
            static_cast<MessageBase &>(c) = incoming(id);
            messages << c;
        }

        Outcome o;
        s.markMultipleAsRead(messages, o.callback());
        QCOMPARE(o.calls, 1);
        QVERIFY(o.success);
        QCOMPARE(int(f.last()->sent.size()), 6);
    }

    void testMarkMultipleReportsFirstFailure()
    {
        MockTransportFactory f;
        f.responder = [](MockTransport *t, const QDomElement &x) {
            if (localName(x) != QLatin1String("iq"))
                return;
            const QString id = childElementNS(x, QString(), "mark-delivered").attribute("id");
            if (id == QLatin1String("m2"))
                t->receive(errorIq(x.attribute("id"), "cancel", "item-not-found"));
            else
                t->receive(QString("<iq xmlns='jabber:client' type='result' id='%1'/>").arg(x.attribute("id")));
        };
        ConnectionManager    m(testConfig(), f.factory());
        MessageStatusManager s(&m);
        QVERIFY(m.connectToServer());

        QList<Message> messages;
        for (const QString &id : QStringList() << "m1" << "m2" << "m3") {
            ChatMessage c;
            static_cast<MessageBase &>(c) = incoming(id);
            messages << c;
        }

        Outcome o;
        s.markMultipleAsDelivered(messages, o.callback());
        QCOMPARE(o.calls, 1);
        QVERIFY(!o.success);
        QCOMPARE(o.error.kind, StatusError::NotFound);
    }

    void testMarkMultipleEmpty()
    {
        MockTransportFactory f;
        ConnectionManager    m(testConfig(), f.factory());
        MessageStatusManager s(&m);

        Outcome o;
        s.markMultipleAsRead(QList<Message>(), o.callback());
        QCOMPARE(o.calls, 1);
        QVERIFY(o.success);
    }
};

PARLEY_REGISTER_TEST(MessageStatusTest);
#include "messagestatustest.moc"
