/*
 * stanzaerror.h - XMPP stanza error
 * Copyright (C) 2003  Justin Karneges
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

#ifndef PARLEY_STANZAERROR_H
#define PARLEY_STANZAERROR_H

#include <QDomElement>
#include <QString>

namespace Parley {

class StanzaError {
public:
    enum ErrorType { Cancel = 1, Continue, Modify, Auth, Wait };
    enum ErrorCond {
        BadRequest = 1,
        Conflict,
        FeatureNotImplemented,
        Forbidden,
        Gone,
        InternalServerError,
        ItemNotFound,
        JidMalformed,
        NotAcceptable,
        NotAllowed,
        NotAuthorized,
        PolicyViolation,
        RecipientUnavailable,
        Redirect,
        RegistrationRequired,
        RemoteServerNotFound,
        RemoteServerTimeout,
        ResourceConstraint,
        ServiceUnavailable,
        SubscriptionRequired,
        UndefinedCondition,
        UnexpectedRequest
    };

    StanzaError(ErrorType type = Cancel, ErrorCond condition = UndefinedCondition, const QString &text = QString(),
                const QDomElement &appSpec = QDomElement());

    ErrorType   type;
    ErrorCond   condition;
    QString     text;
    QString     by;
    QDomElement appSpec;

    // reads an <error/> element, either the error itself or a stanza carrying one
    bool fromXml(const QDomElement &e);

    QString typeString() const;
    QString conditionString() const;

private:
    class Private;
};

} // namespace Parley

#endif // PARLEY_STANZAERROR_H
