/*
 * stanzaerrortest.cpp - StanzaError unit tests
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

#include "parley/core/stanzaerror.h"
#include "parley/qa/mocktransport.h"
#include "parley/qa/qttestutil/qttestutil.h"

using namespace Parley;

class StanzaErrorTest : public QObject {
    Q_OBJECT

private slots:
    void testFromXml()
    {
        QDomElement iq = parseStanza("<iq xmlns='jabber:client' type='error' id='1'>"
                                     "<error type='auth' by='example.com'>"
                                     "<forbidden xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'/>"
                                     "<text xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'>Go away</text>"
                                     "</error></iq>");

        StanzaError e;
        QVERIFY(e.fromXml(iq));
        QCOMPARE(e.type, StanzaError::Auth);
        QCOMPARE(e.condition, StanzaError::Forbidden);
        QCOMPARE(e.text, QString("Go away"));
        QCOMPARE(e.by, QString("example.com"));
        QCOMPARE(e.conditionString(), QString("forbidden"));
    }

    void testFromXmlKeepsApplicationCondition()
    {
        QDomElement err = parseStanza("<error type='modify'>"
                                      "<bad-request xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'/>"
                                      "<invalid-jid xmlns='urn:xmpp:message-status:0'/>"
                                      "</error>");

        StanzaError e;
        QVERIFY(e.fromXml(err));
        QCOMPARE(e.condition, StanzaError::BadRequest);
        QCOMPARE(e.appSpec.localName(), QString("invalid-jid"));
    }

    void testFromLegacyCode()
    {
        StanzaError e;
        QVERIFY(e.fromXml(parseStanza("<error code='404'/>")));
        QCOMPARE(e.condition, StanzaError::ItemNotFound);
        QCOMPARE(e.type, StanzaError::Cancel);
    }

    void testFromXmlWithoutError()
    {
        StanzaError e;
        QVERIFY(!e.fromXml(parseStanza("<iq xmlns='jabber:client' type='result'/>")));
    }

    void testUnknownConditionIsUndefined()
    {
        StanzaError e;
        QVERIFY(e.fromXml(parseStanza("<error type='wait'><whatever xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'/>"
                                      "</error>")));
        QCOMPARE(e.condition, StanzaError::UndefinedCondition);
    }

    void testTypeString()
    {
        StanzaError e(StanzaError::Modify, StanzaError::BadRequest, "missing id");
        QCOMPARE(e.typeString(), QString("modify"));
        QCOMPARE(e.conditionString(), QString("bad-request"));
    }
};

PARLEY_REGISTER_TEST(StanzaErrorTest);
#include "stanzaerrortest.moc"
