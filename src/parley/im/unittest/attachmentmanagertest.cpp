/*
 * attachmentmanagertest.cpp - AttachmentManager unit tests
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
#include "parley/im/attachmentmanager.h"
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

static const char slotReply[] = "<iq xmlns='jabber:client' type='result' from='%2' id='%1'>"
                                "<slot xmlns='urn:xmpp:http:upload:0'>"
                                "<put url='https://up.example.com/put/cat.png'>"
                                "<header name='Authorization'>Basic Zm9vOmJhcg==</header></put>"
                                "<get url='https://up.example.com/get/cat.png'/>"
                                "</slot></iq>";

static void answerSlot(MockTransport *t, const QDomElement &x)
{
    if (localName(x) == QLatin1String("iq"))
        t->receive(QString(slotReply).arg(x.attribute("id"), x.attribute("to")));
}

static Attachment png(int size = 16)
{
    Attachment a;
    a.fileName = "cat.png";
    a.mimeType = "image/png";
    a.data     = QByteArray(size, 'x');
    return a;
}

struct SlotOutcome {
    bool       called  = false;
    bool       success = false;
    UploadSlot slot;
    FileError  error;

    AttachmentManager::SlotCallback callback()
    {
        return [this](bool ok, const UploadSlot &s, const FileError &e) {
            called  = true;
            success = ok;
            slot    = s;
            error   = e;
        };
    }
};

class AttachmentManagerTest : public QObject {
    Q_OBJECT

private slots:
    void testValidateSize()
    {
        UploadConfig cfg;
        cfg.maxFileSize = 10;
        AttachmentManager a(nullptr, cfg);

        auto err = a.validateFile(png(11));
        QVERIFY(err);
        QCOMPARE(err->kind, FileError::SizeExceeded);
        QCOMPARE(err->code(), QString("SIZE_EXCEEDED"));
        QCOMPARE(err->text, QString("File size (11 bytes) exceeds maximum allowed size (10 bytes)"));
        QVERIFY(!a.validateFile(png(10)));
    }

    void testValidateType()
    {
        AttachmentManager a(nullptr, UploadConfig());
        Attachment        exe = png();
        exe.mimeType          = "application/x-msdownload";

        auto err = a.validateFile(exe);
        QVERIFY(err);
        QCOMPARE(err->kind, FileError::InvalidType);
        QVERIFY(err->text.startsWith("File type application/x-msdownload is not allowed. Allowed types: image/jpeg, "));
    }

    void testRequestUploadSlot()
    {
        MockTransportFactory f;
        f.responder = answerSlot;
        ConnectionManager m(testConfig(), f.factory());
        AttachmentManager a(&m, m.config().upload);
        QVERIFY(m.connectToServer());

        SlotOutcome o;
        a.requestUploadSlot("cat.png", 2048, "image/png", o.callback());

        QDomElement iq = f.last()->lastSent();
        QCOMPARE(iq.attribute("to"), QString("upload.example.com"));
        QDomElement req = childElementNS(iq, PARLEY_NS_HTTP_UPLOAD, "request");
        QCOMPARE(req.attribute("size"), QString("2048"));

        QVERIFY(o.called);
        QVERIFY(o.success);
        QCOMPARE(o.slot.putUrl, QString("https://up.example.com/put/cat.png"));
        QCOMPARE(o.slot.getUrl, QString("https://up.example.com/get/cat.png"));
        QCOMPARE(o.slot.putHeaders.value("Authorization"), QString("Basic Zm9vOmJhcg=="));
    }

    void testConfiguredUploadService()
    {
        MockTransportFactory f;
        f.responder = answerSlot;
        ConnectionManager m(testConfig(), f.factory());
        UploadConfig      cfg;
        cfg.service = "share.example.org";
        AttachmentManager a(&m, cfg);
        QVERIFY(m.connectToServer());

        SlotOutcome o;
        a.requestUploadSlot("cat.png", 2048, "image/png", o.callback());
        QCOMPARE(f.last()->lastSent().attribute("to"), QString("share.example.org"));
        QVERIFY(o.success);
    }

    void testSlotWithoutUrl()
    {
        MockTransportFactory f;
        f.responder = [](MockTransport *t, const QDomElement &x) {
            t->receive(QString("<iq xmlns='jabber:client' type='result' id='%1'>"
                               "<slot xmlns='urn:xmpp:http:upload:0'><get url='https://up.example.com/get'/>"
                               "</slot></iq>")
                           .arg(x.attribute("id")));
        };
        ConnectionManager m(testConfig(), f.factory());
        AttachmentManager a(&m, m.config().upload);
        QVERIFY(m.connectToServer());

        SlotOutcome o;
        a.requestUploadSlot("cat.png", 2048, "image/png", o.callback());
        QVERIFY(o.called);
        QVERIFY(!o.success);
        QCOMPARE(o.error.kind, FileError::UploadFailed);
        QCOMPARE(o.error.text,
                 QString("File upload failed: either `put` or `get` URL is missing in the server's reply"));
    }

    void testSlotRefused()
    {
        MockTransportFactory f;
        f.responder = [](MockTransport *t, const QDomElement &x) {
            t->receive(QString("<iq xmlns='jabber:client' type='error' id='%1'><error type='modify'>"
                               "<not-acceptable xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'/>"
                               "<text xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'>File too large</text>"
                               "</error></iq>")
                           .arg(x.attribute("id")));
        };
        ConnectionManager m(testConfig(), f.factory());
        AttachmentManager a(&m, m.config().upload);
        QVERIFY(m.connectToServer());

        SlotOutcome o;
        a.requestUploadSlot("cat.png", 2048, "image/png", o.callback());
        QVERIFY(!o.success);
        QCOMPARE(o.error.code(), QString("UPLOAD_FAILED"));
        QCOMPARE(o.error.text, QString("File upload failed: not-acceptable: File too large"));
    }

    void testUploadWithoutNetworkOnlyGetsSlot()
    {
        MockTransportFactory f;
        f.responder = answerSlot;
        ConnectionManager m(testConfig(), f.factory());
        AttachmentManager a(&m, m.config().upload);
        QVERIFY(m.connectToServer());

        SlotOutcome o;
        a.uploadFile(png(), o.callback());
        QVERIFY(o.success);
        QCOMPARE(o.slot.getUrl, QString("https://up.example.com/get/cat.png"));
        QCOMPARE(int(f.last()->sent.size()), 1);
    }

    void testUploadRejectsInvalidFileBeforeAsking()
    {
        MockTransportFactory f;
        ConnectionManager    m(testConfig(), f.factory());
        AttachmentManager    a(&m, m.config().upload);
        QVERIFY(m.connectToServer());

        Attachment big = png(int(UploadConfig::DefaultMaxFileSize) + 1);
        SlotOutcome o;
        a.uploadFile(big, o.callback());
        QVERIFY(o.called);
        QCOMPARE(o.error.kind, FileError::SizeExceeded);
        QVERIFY(f.last()->sent.isEmpty());
    }

    void testDownloadWithoutNetwork()
    {
        AttachmentManager a(nullptr, UploadConfig());
        bool              ok = true;
        FileError         err;
        a.downloadFile("https://up.example.com/get/cat.png", [&](bool success, const QByteArray &, const FileError &e) {
            ok  = success;
            err = e;
        });
        QVERIFY(!ok);
        QCOMPARE(err.kind, FileError::DownloadFailed);
    }

    void testSupportedTypes()
    {
        QVERIFY(AttachmentManager::isSupportedFileType("image/png"));
        QVERIFY(AttachmentManager::isSupportedFileType("text/markdown"));
        QVERIFY(!AttachmentManager::isSupportedFileType("application/x-msdownload"));

        QVERIFY(AttachmentManager::fileExtensions("image/png").contains(".png"));
        QVERIFY(AttachmentManager::fileExtensions("application/x-msdownload").isEmpty());
    }
};

PARLEY_REGISTER_TEST(AttachmentManagerTest);
#include "attachmentmanagertest.moc"
