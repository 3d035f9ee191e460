/*
 * connectionconfigtest.cpp - ConnectionConfig unit tests
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
#include <QSettings>
#include <QTemporaryDir>
#include <QtTest/QtTest>

#include "parley/core/connectionconfig.h"
#include "parley/qa/qttestutil/qttestutil.h"

#include <stdexcept>

using namespace Parley;

class ConnectionConfigTest : public QObject {
    Q_OBJECT

private slots:
    void testMissingFields()
    {
        ConnectionConfig c;
        c.username = "alice@example.com";
        QCOMPARE(c.missingFields(), QStringList() << "service" << "domain" << "password");
        QVERIFY(!c.isValid());

        QString what;
        try {
            c.validated();
        } catch (const std::invalid_argument &e) {
            what = QString::fromUtf8(e.what());
        }
        QCOMPARE(what, QString("Invalid configuration: missing required fields (service, domain, password)"));
    }

    void testValidatedAppliesDefaults()
    {
        ConnectionConfig c;
        c.service            = "wss://example.com/ws";
        c.domain             = "example.com";
        c.username           = "alice@example.com";
        c.password           = "secret";
        c.upload.maxFileSize = 0;

        ConnectionConfig v = c.validated();
        QCOMPARE(v.connectTimeoutMs, ConnectionConfig::DefaultConnectTimeout);
        QCOMPARE(v.queryTimeoutMs, ConnectionConfig::DefaultQueryTimeout);
        QCOMPARE(v.maxReconnectAttempts, 5);
        QCOMPARE(v.maxBackoffMs, 30000);
        QCOMPARE(v.upload.maxFileSize, qint64(10 * 1024 * 1024));
        QVERIFY(v.upload.allowedMimeTypes.contains("image/png"));
        QVERIFY(v.upload.allowedMimeTypes.contains("application/pdf"));
    }

    void testFromSettings()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("parley.ini");
        {
            QSettings s(path, QSettings::IniFormat);
            s.beginGroup("account");
            s.setValue("service", "wss://example.com/ws");
            s.setValue("domain", "example.com");
            s.setValue("username", "alice@example.com");
            s.setValue("password", "secret");
            s.setValue("timeout", 2500);
            s.setValue("upload/maxFileSize", 1024);
            s.setValue("upload/allowedMimeTypes", QStringList() << "image/png" << "text/plain");
            s.setValue("upload/service", "share.example.com");
            s.setValue("upload/headers/X-Token", "abc");
            s.endGroup();
        }

        QSettings s(path, QSettings::IniFormat);
        s.beginGroup("account");
        ConnectionConfig c = ConnectionConfig::fromSettings(s);

        QCOMPARE(c.domain, QString("example.com"));
        QCOMPARE(c.connectTimeoutMs, 2500);
        QCOMPARE(c.queryTimeoutMs, ConnectionConfig::DefaultQueryTimeout);
        QCOMPARE(c.upload.maxFileSize, qint64(1024));
        QCOMPARE(c.upload.allowedMimeTypes, QStringList() << "image/png" << "text/plain");
        QCOMPARE(c.upload.service, QString("share.example.com"));
        QCOMPARE(c.upload.headers.value("X-Token"), QString("abc"));
    }
};

PARLEY_REGISTER_TEST(ConnectionConfigTest);
#include "connectionconfigtest.moc"
