/*
 * archiveaggregatortest.cpp - ArchiveResultAggregator unit tests
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

#include "parley/im/archiveaggregator.h"
#include "parley/qa/qttestutil/qttestutil.h"

using namespace Parley;

static Message chat(const QString &id)
{
    ChatMessage m;
    m.id   = id;
    m.body = "body of " + id;
    return m;
}

static QStringList ids(const ArchiveResult &r)
{
    QStringList out;
    for (const Message &m : r.messages)
        out << messageBase(m).id;
    return out;
}

class ArchiveAggregatorTest : public QObject {
    Q_OBJECT

private slots:
    void testItemsAreReleasedInArrivalOrder()
    {
        ArchiveResultAggregator a;
        a.onItem("q1", chat("m1"));
        a.onItem("q1", chat("m2"));
        a.onItem("q1", chat("m3"));
        QVERIFY(a.hasPending("q1"));

        ResultSet rs;
        rs.first = "m1";
        rs.last  = "m3";
        ArchiveResult r = a.onTerminal("q1", true, rs);

        QCOMPARE(r.queryId, QString("q1"));
        QVERIFY(r.complete);
        QCOMPARE(ids(r), QStringList() << "m1" << "m2" << "m3");
        QVERIFY(r.rsm);
        QCOMPARE(r.rsm->last, QString("m3"));
        QVERIFY(!a.hasPending("q1"));
        QCOMPARE(a.pendingCount(), 0);
    }

    void testInterleavedQueriesStaySeparate()
    {
        ArchiveResultAggregator a;
        a.onItem("q1", chat("a1"));
        a.onItem("q2", chat("b1"));
        a.onItem("q1", chat("a2"));
        QCOMPARE(a.pendingCount(), 2);

        QCOMPARE(ids(a.onTerminal("q2", false)), QStringList() << "b1");
        QCOMPARE(ids(a.onTerminal("q1", true)), QStringList() << "a1" << "a2");
    }

    void testUnknownTerminalIsEmpty()
    {
        ArchiveResultAggregator a;
        ArchiveResult           r = a.onTerminal("nope", true);
        QCOMPARE(r.queryId, QString("nope"));
        QVERIFY(r.messages.isEmpty());
        QVERIFY(!r.rsm);
    }

    void testSecondTerminalStartsOver()
    {
        ArchiveResultAggregator a;
        a.onItem("q1", chat("m1"));
        a.onTerminal("q1", false);
        a.onItem("q1", chat("m2"));
        QCOMPARE(ids(a.onTerminal("q1", true)), QStringList() << "m2");
    }

    void testDiscardAndReset()
    {
        ArchiveResultAggregator a;
        a.onItem("q1", chat("m1"));
        a.onItem("q2", chat("m2"));

        a.discard("q1");
        QVERIFY(!a.hasPending("q1"));
        QVERIFY(a.hasPending("q2"));

        a.reset();
        QCOMPARE(a.pendingCount(), 0);
        QVERIFY(a.onTerminal("q2", true).messages.isEmpty());
    }
};

PARLEY_REGISTER_TEST(ArchiveAggregatorTest);
#include "archiveaggregatortest.moc"
