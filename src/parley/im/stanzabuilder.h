/*
 * stanzabuilder.h - outbound stanza construction
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

#ifndef PARLEY_STANZABUILDER_H
#define PARLEY_STANZABUILDER_H

#include "types.h"

#include <QDomDocument>
#include <QDomElement>
#include <QList>

namespace Parley {
namespace StanzaBuilder {

    class FormField {
    public:
        QString var;
        QString value;
        QString type; // omitted when empty
    };

    QString newId();

    QDomElement chatMessage(QDomDocument *doc, const QString &to, const QString &body,
                            const MessageOptions &options = MessageOptions());
    // an empty body is replaced with the file name
    QDomElement attachmentMessage(QDomDocument *doc, const QString &to, const QString &body,
                                  const FileDescriptor &file, const MessageOptions &options = MessageOptions());

    QDomElement broadcastPresence(QDomDocument *doc, bool available);
    // type is one of subscribe, subscribed, unsubscribe, unsubscribed or probe
    QDomElement directedPresence(QDomDocument *doc, const QString &to, const QString &type);
    QDomElement roomPresence(QDomDocument *doc, const QString &room, bool available);

    /**
     * Builds the XEP-0313 query iq. The iq id and the queryid are the same,
     * so the terminating <fin/> can be told apart by the iq id alone.
     */
    QDomElement archiveQuery(QDomDocument *doc, const ArchiveQuery &query);
    QDomElement resultSetElement(QDomDocument *doc, const ResultSetRequest &rsm);
    // submit form with a hidden FORM_TYPE field first
    QDomElement dataForm(QDomDocument *doc, const QString &formType, const QList<FormField> &fields);

    QDomElement uploadSlotRequest(QDomDocument *doc, const QString &domain, const QString &fileName, qint64 size,
                                  const QString &contentType);

    // Displayed maps to mark-read, Received to mark-delivered
    QDomElement markStatus(QDomDocument *doc, Receipt::Kind kind, const MessageBase &message);
    QDomElement statusQuery(QDomDocument *doc, const QString &messageId, const QString &jid);
    // acknowledgement addressed back to the sender of \a message
    QDomElement receipt(QDomDocument *doc, Receipt::Kind kind, const MessageBase &message);

} // namespace StanzaBuilder
} // namespace Parley

#endif // PARLEY_STANZABUILDER_H
