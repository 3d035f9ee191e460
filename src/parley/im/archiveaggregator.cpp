/*
 * archiveaggregator.cpp - assembles multi-stanza archive results
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

#include "archiveaggregator.h"

using namespace Parley;

void ArchiveResultAggregator::onItem(const QString &queryId, const Message &message)
{
    partials_[queryId].append(message);
}

ArchiveResult ArchiveResultAggregator::onTerminal(const QString &queryId, bool complete,
                                                  const std::optional<ResultSet> &rsm)
{
    ArchiveResult result;
    result.queryId  = queryId;
    result.complete = complete;
    result.messages = partials_.take(queryId);
    result.rsm      = rsm;
    return result;
}

void ArchiveResultAggregator::discard(const QString &queryId) { partials_.remove(queryId); }

void ArchiveResultAggregator::reset() { partials_.clear(); }

int ArchiveResultAggregator::pendingCount() const { return partials_.size(); }

bool ArchiveResultAggregator::hasPending(const QString &queryId) const { return partials_.contains(queryId); }
