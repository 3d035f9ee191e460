/*
 * dispatcher.h - routes inbound stanzas
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

#ifndef PARLEY_DISPATCHER_H
#define PARLEY_DISPATCHER_H

#include "archiveaggregator.h"
#include "parley/core/connectionmanager.h"
#include "types.h"

#include <QDomElement>
#include <QObject>

namespace Parley {

/**
 * Decides who owns an inbound stanza.
 *
 * Presence first, then archive items and terminals (which go through the
 * aggregator), then receipts, then plain messages. Anything else is
 * dropped silently.
 */
class Dispatcher : public QObject {
    Q_OBJECT
public:
    enum Kind {
        PresenceStanza,
        ArchiveItemStanza,
        ArchiveTerminalStanza,
        ReceiptStanza,
        MessageStanza,
        IgnoredStanza
    };
    Q_ENUM(Kind)

    // \a connection may be null, stanzas are then fed through dispatch()
    explicit Dispatcher(ConnectionManager *connection, QObject *parent = nullptr);

    static Kind classify(const QDomElement &stanza);

    Kind dispatch(const QDomElement &stanza);

    ArchiveResultAggregator       *aggregator();
    const ArchiveResultAggregator *aggregator() const;

signals:
    void presenceReceived(const Parley::Presence &presence);
    void archiveResultReady(const Parley::ArchiveResult &result);
    void receiptReceived(const Parley::Receipt &receipt);
    void messageReceived(const Parley::Message &message);

private:
    ArchiveResultAggregator aggregator_;
};

} // namespace Parley

#endif // PARLEY_DISPATCHER_H
