/*
 * connectionmanagertest.cpp - ConnectionManager unit tests
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

#include "parley/core/connectionmanager.h"
#include "parley/core/xmlcommon.h"
#include "parley/qa/mocktransport.h"
#include "parley/qa/qttestutil/qttestutil.h"

#include <stdexcept>

using namespace Parley;

static ConnectionConfig testConfig()
{
    ConnectionConfig c;
    c.service  = QStringLiteral("wss://example.com/ws");
    c.domain   = QStringLiteral("example.com");
    c.username = QStringLiteral("alice@example.com");
    c.password = QStringLiteral("secret");
    return c;
}

struct QueryOutcome {
    bool        called  = false;
    bool        success = false;
    QDomElement response;
    QueryError  error;

    ConnectionManager::QueryCallback callback()
    {
        return [this](bool ok, const QDomElement &r, const QueryError &e) {
            called   = true;
            success  = ok;
            response = r;
            error    = e;
        };
    }
};

class ConnectionManagerTest : public QObject {
    Q_OBJECT

private slots:
    void testBackoffDelay()
    {
        QCOMPARE(ConnectionManager::backoffDelay(0), 1000);
        QCOMPARE(ConnectionManager::backoffDelay(1), 2000);
        QCOMPARE(ConnectionManager::backoffDelay(2), 4000);
        QCOMPARE(ConnectionManager::backoffDelay(3), 8000);
        QCOMPARE(ConnectionManager::backoffDelay(4), 16000);
        QCOMPARE(ConnectionManager::backoffDelay(5), 30000);
        QCOMPARE(ConnectionManager::backoffDelay(40), 30000);
        QCOMPARE(ConnectionManager::backoffDelay(3, 5000), 5000);
    }

    void testConstructorRejectsIncompleteConfig()
    {
        MockTransportFactory f;
        ConnectionConfig     c = testConfig();
        c.password.clear();
        c.domain.clear();

        QObject owner;
        QString what;
        try {
            ConnectionManager m(c, f.factory(), &owner);
        } catch (const std::invalid_argument &e) {
            what = QString::fromUtf8(e.what());
        }
        QCOMPARE(what, QString("Invalid configuration: missing required fields (domain, password)"));
        QCOMPARE(f.count(), 0);
        QVERIFY(owner.children().isEmpty());
    }

    void testConstructionAppliesDefaults()
    {
        MockTransportFactory f;
        ConnectionManager    m(testConfig(), f.factory());

        QCOMPARE(m.status(), ConnectionManager::Disconnected);
        QCOMPARE(m.config().connectTimeoutMs, 10000);
        QVERIFY(!m.transport());
        QCOMPARE(f.count(), 0);
    }

    void testConnectGoesOnline()
    {
        MockTransportFactory f;
        ConnectionManager    m(testConfig(), f.factory());
        QList<int>           statuses;
        int                  onlineCount = 0;
        connect(&m, &ConnectionManager::statusChanged, this,
                [&statuses](ConnectionManager::Status s) { statuses << int(s); });
        connect(&m, &ConnectionManager::online, this, [&onlineCount]() { ++onlineCount; });

        QCOMPARE(m.status(), ConnectionManager::Disconnected);
        bool called = false, success = false;
        QVERIFY(m.connectToServer([&](bool ok, const ConnectionError &) {
            called  = true;
            success = ok;
        }));

        QVERIFY(called);
        QVERIFY(success);
        QVERIFY(m.isConnected());
        QCOMPARE(onlineCount, 1);
        QCOMPARE(statuses, QList<int>() << ConnectionManager::Connecting << ConnectionManager::Online);
        QCOMPARE(f.count(), 1);
        QCOMPARE(f.last()->startCount, 1);
        QCOMPARE(m.userJid(), QString("alice@example.com"));
    }

    void testConnectWhileConnectingFails()
    {
        MockTransportFactory f;
        f.autoOnline = false;
        ConnectionManager m(testConfig(), f.factory());

        QVERIFY(m.connectToServer());
        QCOMPARE(m.status(), ConnectionManager::Connecting);

        ConnectionError err;
        QVERIFY(!m.connectToServer([&err](bool, const ConnectionError &e) { err = e; }));
        QCOMPARE(err.kind, ConnectionError::AlreadyConnecting);
        QCOMPARE(err.text, QString("Connection already in progress"));
        QCOMPARE(m.status(), ConnectionManager::Connecting);
        QCOMPARE(f.count(), 1);
    }

    void testConnectWhileOnlineFails()
    {
        MockTransportFactory f;
        ConnectionManager    m(testConfig(), f.factory());
        QVERIFY(m.connectToServer());

        ConnectionError err;
        QVERIFY(!m.connectToServer([&err](bool, const ConnectionError &e) { err = e; }));
        QCOMPARE(err.kind, ConnectionError::AlreadyOnline);
        QCOMPARE(err.text, QString("Already connected"));
        QVERIFY(m.isConnected());
    }

    void testConnectTimeout()
    {
        MockTransportFactory f;
        f.autoOnline           = false;
        ConnectionConfig c     = testConfig();
        c.connectTimeoutMs     = 50;
        c.maxReconnectAttempts = 0;
        ConnectionManager m(c, f.factory());

        QList<ConnectionError> errors;
        connect(&m, &ConnectionManager::error, this, [&errors](const ConnectionError &e) { errors << e; });

        bool            called = false;
        ConnectionError err;
        m.connectToServer([&](bool ok, const ConnectionError &e) {
            QVERIFY(!ok);
            called = true;
            err    = e;
        });

        QTRY_VERIFY(called);
        QCOMPARE(err.kind, ConnectionError::Timeout);
        QCOMPARE(err.text, QString("Connection timeout"));
        QCOMPARE(m.status(), ConnectionManager::Error);
        QCOMPARE(int(errors.size()), 1);
        QVERIFY(!m.isReconnectScheduled());
    }

    void testConnectTimeoutSchedulesFirstReconnect()
    {
        MockTransportFactory f;
        f.autoOnline       = false;
        ConnectionConfig c = testConfig();
        c.connectTimeoutMs = 20;
        ConnectionManager m(c, f.factory());

        QList<QPair<int, int>> scheduled;
        connect(&m, &ConnectionManager::reconnectScheduled, this,
                [&scheduled](int attempt, int delay) { scheduled << qMakePair(attempt, delay); });

        QVERIFY(m.connectToServer());
        QTRY_COMPARE(m.status(), ConnectionManager::Error);
        QCOMPARE(scheduled, QList<QPair<int, int>>() << qMakePair(0, 1000));
        QVERIFY(m.isReconnectScheduled());

        m.disconnectFromServer();
    }

    void testTransportErrorSchedulesBackoff()
    {
        MockTransportFactory f;
        f.autoOnline           = false;
        ConnectionConfig c     = testConfig();
        c.maxReconnectAttempts = 3;
        c.maxBackoffMs         = 20;
        ConnectionManager m(c, f.factory());

        QList<QPair<int, int>> scheduled;
        connect(&m, &ConnectionManager::reconnectScheduled, this,
                [&scheduled](int attempt, int delay) { scheduled << qMakePair(attempt, delay); });

        QVERIFY(m.connectToServer());
        f.last()->fail(QStringLiteral("connection refused"));
        QCOMPARE(m.status(), ConnectionManager::Error);
        QVERIFY(m.isReconnectScheduled());
        QCOMPARE(m.reconnectAttempts(), 1);

        for (int n = 2; n <= 4; ++n) {
            QTRY_COMPARE(f.count(), n);
            QCOMPARE(m.status(), ConnectionManager::Connecting);
            f.last()->fail(QStringLiteral("connection refused"));
        }

        QCOMPARE(m.status(), ConnectionManager::Error);
        QVERIFY(!m.isReconnectScheduled());
        QCOMPARE(scheduled,
                 QList<QPair<int, int>>() << qMakePair(0, 20) << qMakePair(1, 20) << qMakePair(2, 20));

        QTest::qWait(60);
        QCOMPARE(f.count(), 4);
    }

    void testSuccessfulReconnectResetsAttempts()
    {
        MockTransportFactory f;
        f.autoOnline       = false;
        ConnectionConfig c = testConfig();
        c.maxBackoffMs     = 10;
        ConnectionManager m(c, f.factory());

        QVERIFY(m.connectToServer());
        f.last()->goOnline();
        f.last()->fail(QStringLiteral("stream error"));
        QCOMPARE(m.status(), ConnectionManager::Error);
        QCOMPARE(m.reconnectAttempts(), 1);

        QTRY_COMPARE(f.count(), 2);
        f.last()->goOnline();
        QVERIFY(m.isConnected());
        QCOMPARE(m.reconnectAttempts(), 0);
    }

    void testDisconnectCancelsReconnect()
    {
        MockTransportFactory f;
        f.autoOnline = false;
        ConnectionManager m(testConfig(), f.factory());

        QVERIFY(m.connectToServer());
        MockTransport *t = f.last();
        t->fail(QStringLiteral("connection refused"));
        QVERIFY(m.isReconnectScheduled());

        // a connect attempt is already on its way
        QVERIFY(!m.connectToServer());

        m.disconnectFromServer();
        QCOMPARE(m.status(), ConnectionManager::Disconnected);
        QVERIFY(!m.isReconnectScheduled());
        QCOMPARE(m.reconnectAttempts(), 0);
        QCOMPARE(t->stopCount, 1);
        QVERIFY(!m.transport());
    }

    void testDisconnectWhileConnectingAbortsCallback()
    {
        MockTransportFactory f;
        f.autoOnline = false;
        ConnectionManager m(testConfig(), f.factory());

        ConnectionError err;
        bool            called = false;
        m.connectToServer([&](bool ok, const ConnectionError &e) {
            QVERIFY(!ok);
            called = true;
            err    = e;
        });
        m.disconnectFromServer();

        QVERIFY(called);
        QCOMPARE(err.text, QString("Connection aborted"));
        QCOMPARE(m.status(), ConnectionManager::Disconnected);
    }

    void testDisconnectFailsPendingQueries()
    {
        MockTransportFactory f;
        ConnectionManager    m(testConfig(), f.factory());
        QVERIFY(m.connectToServer());

        int offlineCount = 0;
        connect(&m, &ConnectionManager::offline, this, [&offlineCount]() { ++offlineCount; });

        QueryOutcome q;
        m.sendQuery(XMLHelper::createIQ(m.doc(), "get", "example.com", QString()), q.callback());
        QVERIFY(!q.called);

        m.disconnectFromServer();
        QVERIFY(q.called);
        QVERIFY(!q.success);
        QCOMPARE(q.error.kind, QueryError::NotConnected);
        QCOMPARE(q.error.text, QString("Not connected to server"));
        QCOMPARE(offlineCount, 1);
    }

    void testPeerClosingStreamGoesOffline()
    {
        MockTransportFactory f;
        ConnectionManager    m(testConfig(), f.factory());
        QVERIFY(m.connectToServer());

        int offlineCount = 0;
        connect(&m, &ConnectionManager::offline, this, [&offlineCount]() { ++offlineCount; });

        f.last()->goOffline();
        QCOMPARE(m.status(), ConnectionManager::Disconnected);
        QCOMPARE(offlineCount, 1);
        QVERIFY(!m.isReconnectScheduled());
        QVERIFY(!m.transport());
    }

    void testNullTransportIsAnError()
    {
        MockTransportFactory f;
        f.returnsNull          = true;
        ConnectionConfig c     = testConfig();
        c.maxReconnectAttempts = 0;
        ConnectionManager m(c, f.factory());

        ConnectionError err;
        m.connectToServer([&err](bool, const ConnectionError &e) { err = e; });
        QCOMPARE(err.kind, ConnectionError::TransportError);
        QCOMPARE(m.status(), ConnectionManager::Error);
    }

    void testDisconnectCancelsReconnectWithoutTransport()
    {
        MockTransportFactory f;
        f.returnsNull      = true;
        ConnectionConfig c = testConfig();
        c.maxBackoffMs     = 20;
        ConnectionManager m(c, f.factory());

        QVERIFY(m.connectToServer());
        QCOMPARE(m.status(), ConnectionManager::Error);
        QVERIFY(m.isReconnectScheduled());
        QCOMPARE(f.calls, 1);

        m.disconnectFromServer();
        QCOMPARE(m.status(), ConnectionManager::Disconnected);
        QVERIFY(!m.isReconnectScheduled());
        QCOMPARE(m.reconnectAttempts(), 0);

        QTest::qWait(60);
        QCOMPARE(f.calls, 1);

        // the caller is free to connect again
        f.returnsNull = false;
        f.autoOnline  = true;
        QVERIFY(m.connectToServer());
        QVERIFY(m.isConnected());
    }

    void testConnectFromErrorSlotKeepsNewCallback()
    {
        MockTransportFactory f;
        f.autoOnline           = false;
        ConnectionConfig c     = testConfig();
        c.maxReconnectAttempts = 0;
        ConnectionManager m(c, f.factory());

        int  firstCalls = 0, secondCalls = 0;
        bool secondOk = false, retried = false;
        connect(&m, &ConnectionManager::error, this, [&](const ConnectionError &) {
            if (retried)
                return;
            retried = true;
            m.connectToServer([&](bool ok, const ConnectionError &) {
                ++secondCalls;
                secondOk = ok;
            });
        });

        QVERIFY(m.connectToServer([&firstCalls](bool ok, const ConnectionError &) {
            QVERIFY(!ok);
            ++firstCalls;
        }));
        f.last()->fail(QStringLiteral("connection refused"));

        QCOMPARE(firstCalls, 1);
        QCOMPARE(secondCalls, 0);
        QCOMPARE(m.status(), ConnectionManager::Connecting);
        QCOMPARE(f.count(), 2);

        f.last()->goOnline();
        QCOMPARE(secondCalls, 1);
        QVERIFY(secondOk);
    }

    void testSendRequiresOnline()
    {
        MockTransportFactory f;
        ConnectionManager    m(testConfig(), f.factory());

        QueryError err;
        QVERIFY(!m.send(m.doc()->createElement("presence"), &err));
        QCOMPARE(err.kind, QueryError::NotConnected);

        QueryOutcome q;
        m.sendQuery(XMLHelper::createIQ(m.doc(), "get", QString(), QString()), q.callback());
        QVERIFY(q.called);
        QCOMPARE(q.error.text, QString("Not connected to server"));
    }

    void testSendFailure()
    {
        MockTransportFactory f;
        ConnectionManager    m(testConfig(), f.factory());
        QVERIFY(m.connectToServer());
        f.last()->sendFails = true;

        QueryError err;
        QVERIFY(!m.send(m.doc()->createElement("presence"), &err));
        QCOMPARE(err.kind, QueryError::SendFailed);
        QCOMPARE(err.text, QString("Failed to send stanza: broken pipe"));

        QueryOutcome q;
        m.sendQuery(XMLHelper::createIQ(m.doc(), "get", QString(), QString()), q.callback());
        QVERIFY(q.called);
        QCOMPARE(q.error.kind, QueryError::SendFailed);
        QCOMPARE(q.error.text, QString("Failed to send IQ: broken pipe"));
    }

    void testSendQueryResult()
    {
        MockTransportFactory f;
        f.responder = [](MockTransport *t, const QDomElement &x) {
            t->receive(QString("<iq xmlns='jabber:client' type='result' from='example.com' id='%1'/>")
                           .arg(x.attribute("id")));
        };
        ConnectionManager m(testConfig(), f.factory());
        QVERIFY(m.connectToServer());

        QueryOutcome q;
        m.sendQuery(XMLHelper::createIQ(m.doc(), "get", "example.com", QString()), q.callback());

        QVERIFY(q.called);
        QVERIFY(q.success);
        QCOMPARE(q.response.attribute("id"), QString("aaaaa"));
        QCOMPARE(f.last()->lastSent().attribute("id"), QString("aaaaa"));
    }

    void testSendQueryError()
    {
        MockTransportFactory f;
        f.responder = [](MockTransport *t, const QDomElement &x) {
            t->receive(QString("<iq xmlns='jabber:client' type='error' id='%1'>"
                               "<error type='cancel'>"
                               "<item-not-found xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'/>"
                               "</error></iq>")
                           .arg(x.attribute("id")));
        };
        ConnectionManager m(testConfig(), f.factory());
        QVERIFY(m.connectToServer());

        QueryOutcome q;
        m.sendQuery(XMLHelper::createIQ(m.doc(), "get", QString(), "q1"), q.callback());

        QVERIFY(q.called);
        QVERIFY(!q.success);
        QCOMPARE(q.error.kind, QueryError::Protocol);
        QCOMPARE(q.error.stanzaError.condition, StanzaError::ItemNotFound);
        QCOMPARE(q.error.stanzaError.type, StanzaError::Cancel);
    }

    void testSendQueryIgnoresForeignSender()
    {
        MockTransportFactory f;
        ConnectionManager    m(testConfig(), f.factory());
        QVERIFY(m.connectToServer());

        QueryOutcome q;
        m.sendQuery(XMLHelper::createIQ(m.doc(), "get", "bob@example.com/phone", "q2"), q.callback());

        f.last()->receive("<iq xmlns='jabber:client' type='result' from='mallory@example.com' id='q2'/>");
        QVERIFY(!q.called);
        f.last()->receive("<iq xmlns='jabber:client' type='result' from='bob@example.com/laptop' id='q2'/>");
        QVERIFY(q.called);
        QVERIFY(q.success);
    }

    void testSendQueryRejectsDuplicateId()
    {
        MockTransportFactory f;
        ConnectionManager    m(testConfig(), f.factory());
        QVERIFY(m.connectToServer());

        QueryOutcome first, second;
        m.sendQuery(XMLHelper::createIQ(m.doc(), "get", QString(), "dup"), first.callback());
        m.sendQuery(XMLHelper::createIQ(m.doc(), "get", QString(), "dup"), second.callback());

        QVERIFY(!first.called);
        QVERIFY(second.called);
        QCOMPARE(second.error.text, QString("Failed to send IQ: duplicate id dup"));
    }

    void testSendQueryTimeout()
    {
        MockTransportFactory f;
        ConnectionConfig     c = testConfig();
        c.queryTimeoutMs       = 30;
        ConnectionManager m(c, f.factory());
        QVERIFY(m.connectToServer());

        QueryOutcome q;
        m.sendQuery(XMLHelper::createIQ(m.doc(), "get", QString(), QString()), q.callback());
        QTRY_VERIFY(q.called);
        QCOMPARE(q.error.kind, QueryError::SendFailed);
        QCOMPARE(q.error.text, QString("Failed to send IQ: timeout"));

        // a late answer is dropped
        f.last()->receive("<iq xmlns='jabber:client' type='result' id='aaaaa'/>");
        QVERIFY(m.isConnected());
    }

    void testIncomingStanzasAreForwarded()
    {
        MockTransportFactory f;
        ConnectionManager    m(testConfig(), f.factory());
        QVERIFY(m.connectToServer());

        QStringList names;
        connect(&m, &ConnectionManager::stanzaReceived, this,
                [&names](const QDomElement &x) { names << XMLHelper::localName(x); });
        f.last()->receive("<message xmlns='jabber:client' from='bob@example.com'><body>hi</body></message>");
        f.last()->receive("<presence xmlns='jabber:client' from='bob@example.com'/>");

        QCOMPARE(names, QStringList() << "message" << "presence");
    }
};

PARLEY_REGISTER_TEST(ConnectionManagerTest);
#include "connectionmanagertest.moc"
