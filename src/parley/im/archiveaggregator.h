/*
 * archiveaggregator.h - assembles multi-stanza archive results
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

#ifndef PARLEY_ARCHIVEAGGREGATOR_H
#define PARLEY_ARCHIVEAGGREGATOR_H

#include "types.h"

#include <QHash>
#include <QList>
#include <QString>

#include <optional>

namespace Parley {

/**
 * Collects the messages of XEP-0313 queries until their <fin/> arrives.
 *
 * Messages are kept per query id, in the order they were handed in. A
 * result leaves the aggregator only through onTerminal(), complete, and the
 * query is forgotten at that point.
 */
class ArchiveResultAggregator {
public:
    void onItem(const QString &queryId, const Message &message);

    // an unknown query id yields a result without messages
    ArchiveResult onTerminal(const QString &queryId, bool complete, const std::optional<ResultSet> &rsm = {});

    // forgets one query without producing a result, e.g. after the server rejected it
    void discard(const QString &queryId);
    // drops every partial result, used when the session goes away
    void reset();

    int  pendingCount() const;
    bool hasPending(const QString &queryId) const;

private:
    QHash<QString, QList<Message>> partials_;
};

} // namespace Parley

#endif // PARLEY_ARCHIVEAGGREGATOR_H
