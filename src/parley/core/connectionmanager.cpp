/*
 * connectionmanager.cpp - session lifecycle and correlated queries
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

#include "connectionmanager.h"

#include "xmlcommon.h"

#include <QDebug>
#include <QHash>
#include <QTimer>

#include <stdexcept>
#include <utility>

using namespace Parley;

namespace {

struct PendingRequest {
    QString                          to;
    ConnectionManager::QueryCallback callback;
    QTimer                          *timer = nullptr;
};

}

class ConnectionManager::Private {
public:
    Private(ConnectionManager *q) : q(q) { }

    ConnectionManager *q;

    ConnectionConfig config;
    TransportFactory factory;
    Status           status    = Disconnected;
    Transport       *transport = nullptr;
    int              attempts  = 0;
    QTimer           connectTimer;
    QTimer           reconnectTimer;
    ConnectCallback  connectCallback;

    QDomDocument                   doc;
    int                            id_seed = 0xaaaa;
    QHash<QString, PendingRequest> pending;

    void debug(const QString &str) { emit q->debugText(str); }

    void setStatus(Status s)
    {
        if (status == s)
            return;
        status = s;
        emit q->statusChanged(s);
    }

    void finishConnect(bool success, const ConnectionError &err = ConnectionError())
    {
        if (!connectCallback)
            return;
        auto cb = std::move(connectCallback);
        connectCallback = ConnectCallback();
        cb(success, err);
    }

    // disconnects and schedules deletion of the current transport, if any
    void releaseTransport(bool stop)
    {
        if (!transport)
            return;
        Transport *t = transport;
        transport    = nullptr;
        QObject::disconnect(t, nullptr, q, nullptr);
        if (stop)
            t->stop();
        t->deleteLater();
    }

    void attemptConnect()
    {
        releaseTransport(true);

        transport = factory(config);
        if (!transport) {
            handleError(ConnectionError(ConnectionError::TransportError, QStringLiteral("Unable to create transport")),
                        true);
            return;
        }
        transport->setParent(q);
        QObject::connect(transport, &Transport::online, q, [this]() { transportOnline(); });
        QObject::connect(transport, &Transport::offline, q, [this]() { transportOffline(); });
        QObject::connect(transport, &Transport::error, q, [this](const QString &text) {
            handleError(ConnectionError(ConnectionError::TransportError, text));
        });
        QObject::connect(transport, &Transport::stanzaReceived, q,
                         [this](const QDomElement &x) { stanzaReceived(x); });

        setStatus(Connecting);
        connectTimer.start(config.connectTimeoutMs);
        debug(QString("ConnectionManager: connecting to %1 as %2\n").arg(config.service, config.username));
        transport->start();
    }

    void transportOnline()
    {
        if (status != Connecting) {
            debug("ConnectionManager: unexpected online signal ignored\n");
            return;
        }
        connectTimer.stop();
        attempts = 0;
        setStatus(Online);
        emit q->online();
        finishConnect(true);
    }

    void transportOffline()
    {
        if (status == Connecting) {
            handleError(ConnectionError(ConnectionError::TransportError, QStringLiteral("Connection closed")));
            return;
        }
        if (status != Online)
            return;

        debug("ConnectionManager: stream closed by peer\n");
        releaseTransport(false);
        failPending();
        setStatus(Disconnected);
        emit q->offline();
    }

    void connectTimeout()
    {
        if (status != Connecting)
            return;
        handleError(ConnectionError(ConnectionError::Timeout, QStringLiteral("Connection timeout")));
    }

    // the stale transport is kept so disconnectFromServer() can still stop it during the backoff
    void handleError(const ConnectionError &err, bool force = false)
    {
        if (!force && status != Connecting && status != Online) {
            debug(QString("ConnectionManager: error ignored in state %1: %2\n").arg(int(status)).arg(err.text));
            return;
        }

        connectTimer.stop();
        qWarning("ConnectionManager: %s: %s", qPrintable(err.kindString()), qPrintable(err.text));

        // taken first, an error slot may start a new attempt with its own callback
        ConnectCallback cb = std::move(connectCallback);
        connectCallback    = ConnectCallback();

        setStatus(Error);
        emit q->error(err);
        failPending();
        if (cb)
            cb(false, err);
        scheduleReconnect();
    }

    void scheduleReconnect()
    {
        // disconnectFromServer() or a new connect from a callback wins
        if (status != Error)
            return;
        if (attempts >= config.maxReconnectAttempts) {
            debug(QString("ConnectionManager: giving up after %1 reconnect attempts\n").arg(attempts));
            return;
        }

        const int delay = backoffDelay(attempts, config.maxBackoffMs);
        const int attempt = attempts++;
        reconnectTimer.start(delay);
        debug(QString("ConnectionManager: reconnecting in %1 ms\n").arg(delay));
        emit q->reconnectScheduled(attempt, delay);
    }

    void reconnect()
    {
        if (status != Error)
            return;
        attemptConnect();
    }

    bool write(const QDomElement &x)
    {
        QString out = XMLHelper::toString(x);
        debug(QString("ConnectionManager: outgoing: [\n%1]\n").arg(out));
        emit q->xmlOutgoing(out);
        if (!transport->send(x))
            return false;
        emit q->stanzaSent(x);
        return true;
    }

    PendingRequest takePending(const QString &id)
    {
        PendingRequest r = pending.take(id);
        if (r.timer) {
            r.timer->stop();
            r.timer->deleteLater();
            r.timer = nullptr;
        }
        return r;
    }

    void failPending()
    {
        const QStringList ids = pending.keys();
        for (const QString &id : ids) {
            if (!pending.contains(id)) // a callback may have settled it
                continue;
            PendingRequest r = takePending(id);
            r.callback(false, QDomElement(), QueryError::notConnected());
        }
    }

    // iqVerify, loosely: a response must come from where the request went
    bool matches(const PendingRequest &r, const QDomElement &x) const
    {
        const QString from = x.attribute(QStringLiteral("from"));
        if (r.to.isEmpty() || from.isEmpty())
            return true;
        return from == r.to || XMLHelper::bareJid(from) == XMLHelper::bareJid(r.to);
    }

    void stanzaReceived(const QDomElement &x)
    {
        QString out = XMLHelper::toString(x);
        debug(QString("ConnectionManager: incoming: [\n%1]\n").arg(out));
        emit q->xmlIncoming(out);

        emit q->stanzaReceived(x);

        if (XMLHelper::localName(x) != QLatin1String("iq"))
            return;
        const QString type = x.attribute(QStringLiteral("type"));
        if (type != QLatin1String("result") && type != QLatin1String("error"))
            return;
        const QString id = x.attribute(QStringLiteral("id"));
        auto          it = pending.constFind(id);
        if (it == pending.constEnd() || !matches(it.value(), x))
            return;

        PendingRequest r = takePending(id);
        if (type == QLatin1String("result")) {
            r.callback(true, x, QueryError());
            return;
        }

        StanzaError se;
        if (!se.fromXml(x))
            se = StanzaError(StanzaError::Cancel, StanzaError::UndefinedCondition);
        r.callback(false, x, QueryError(se));
    }
};

ConnectionManager::ConnectionManager(const ConnectionConfig &config, TransportFactory factory, QObject *parent) :
    QObject(parent)
{
    if (!factory)
        throw std::invalid_argument("Invalid configuration: no transport factory");

    qRegisterMetaType<ConnectionError>();

    ConnectionConfig validated = config.validated();

    d          = new Private(this);
    d->config  = std::move(validated);
    d->factory = std::move(factory);

    d->connectTimer.setSingleShot(true);
    d->reconnectTimer.setSingleShot(true);
    connect(&d->connectTimer, &QTimer::timeout, this, [this]() { d->connectTimeout(); });
    connect(&d->reconnectTimer, &QTimer::timeout, this, [this]() { d->reconnect(); });
}

ConnectionManager::~ConnectionManager()
{
    d->connectTimer.stop();
    d->reconnectTimer.stop();
    d->releaseTransport(true);
    for (const PendingRequest &r : std::as_const(d->pending))
        delete r.timer;
    delete d;
}

ConnectionManager::Status ConnectionManager::status() const { return d->status; }

const ConnectionConfig &ConnectionManager::config() const { return d->config; }

QString ConnectionManager::userJid() const { return XMLHelper::bareJid(d->config.username); }

bool ConnectionManager::isConnected() const { return d->status == Online; }

Transport *ConnectionManager::transport() const { return d->transport; }

int ConnectionManager::reconnectAttempts() const { return d->attempts; }

bool ConnectionManager::isReconnectScheduled() const { return d->reconnectTimer.isActive(); }

QDomDocument *ConnectionManager::doc() const { return &d->doc; }

QString ConnectionManager::genUniqueId()
{
    QString s = QString::asprintf("a%x", d->id_seed);
    d->id_seed += 0x10;
    return s;
}

bool ConnectionManager::connectToServer(ConnectCallback callback)
{
    ConnectionError err;
    if (d->status == Connecting || d->reconnectTimer.isActive()) {
        err = ConnectionError(ConnectionError::AlreadyConnecting, QStringLiteral("Connection already in progress"));
    } else if (d->status == Online) {
        err = ConnectionError(ConnectionError::AlreadyOnline, QStringLiteral("Already connected"));
    } else {
        d->connectCallback = std::move(callback);
        d->attemptConnect();
        return true;
    }

    if (callback)
        callback(false, err);
    return false;
}

void ConnectionManager::disconnectFromServer()
{
    const bool wasOnline = d->status == Online;
    d->connectTimer.stop();
    d->reconnectTimer.stop();
    d->attempts = 0;

    if (!d->transport && d->status == Disconnected)
        return;

    if (d->transport) {
        d->setStatus(Disconnecting);
        d->releaseTransport(true);
    }
    d->failPending();
    d->finishConnect(false, ConnectionError(ConnectionError::TransportError, QStringLiteral("Connection aborted")));
    d->setStatus(Disconnected);
    if (wasOnline)
        emit offline();
}

bool ConnectionManager::send(const QDomElement &stanza, QueryError *error)
{
    if (d->status != Online || !d->transport) {
        if (error)
            *error = QueryError::notConnected();
        return false;
    }

    if (!d->write(stanza)) {
        if (error)
            *error = QueryError(QueryError::SendFailed,
                                QStringLiteral("Failed to send stanza: ") + d->transport->errorString());
        return false;
    }
    return true;
}

void ConnectionManager::sendQuery(QDomElement iq, QueryCallback callback)
{
    if (d->status != Online || !d->transport) {
        callback(false, QDomElement(), QueryError::notConnected());
        return;
    }

    QString id = iq.attribute(QStringLiteral("id"));
    if (id.isEmpty()) {
        id = genUniqueId();
        iq.setAttribute(QStringLiteral("id"), id);
    }
    if (d->pending.contains(id)) {
        callback(false, QDomElement(), QueryError::sendFailed(QStringLiteral("duplicate id ") + id));
        return;
    }

    PendingRequest r;
    r.to       = iq.attribute(QStringLiteral("to"));
    r.callback = std::move(callback);
    if (d->config.queryTimeoutMs > 0) {
        r.timer = new QTimer(this);
        r.timer->setSingleShot(true);
        connect(r.timer, &QTimer::timeout, this, [this, id]() {
            if (!d->pending.contains(id))
                return;
            d->debug(QString("ConnectionManager: query %1 timed out\n").arg(id));
            PendingRequest timedOut = d->takePending(id);
            timedOut.callback(false, QDomElement(), QueryError::sendFailed(QStringLiteral("timeout")));
        });
        r.timer->start(d->config.queryTimeoutMs);
    }
    // registered before writing, the transport may answer synchronously
    d->pending.insert(id, r);

    if (!d->write(iq)) {
        const QString reason = d->transport ? d->transport->errorString() : QStringLiteral("not connected");
        if (!d->pending.contains(id))
            return;
        PendingRequest failed = d->takePending(id);
        failed.callback(false, QDomElement(), QueryError::sendFailed(reason));
    }
}

int ConnectionManager::backoffDelay(int attempts, int maxBackoff)
{
    if (attempts < 0)
        attempts = 0;
    if (attempts >= 30)
        return maxBackoff;
    return int(qMin<qint64>(qint64(1000) << attempts, maxBackoff));
}
