/*
 * stanzaerror.cpp - XMPP stanza error
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

#include "stanzaerror.h"

#include "namespaces.h"
#include "xmlcommon.h"

#include <QDebug>

#include <array>
#include <optional>

using namespace Parley;

/**
    \class StanzaError
    \brief Represents stanza error

    Stanza error consists of error type and condition.
    In addition, it may contain a human readable text
    and an application specific element.

    Reads both old (code only) and new style error elements, see XEP-0086.
*/

StanzaError::StanzaError(ErrorType _type, ErrorCond _condition, const QString &_text, const QDomElement &_appSpec)
{
    type      = _type;
    condition = _condition;
    text      = _text;
    appSpec   = _appSpec;
}

class StanzaError::Private {
public:
    struct ErrorTypeEntry {
        QString   str;
        ErrorType type;
    };
    static std::array<ErrorTypeEntry, 5> errorTypeTable;

    struct ErrorCondEntry {
        QString   str;
        ErrorCond cond;
    };
    static std::array<ErrorCondEntry, 22> errorCondTable;

    struct ErrorCodeEntry {
        ErrorCond cond;
        ErrorType type;
        int       code;
    };
    static std::array<ErrorCodeEntry, 22> errorCodeTable;

    static std::optional<ErrorType> stringToErrorType(const QString &s)
    {
        for (auto const &entry : errorTypeTable) {
            if (s == entry.str)
                return entry.type;
        }
        return {};
    }

    static QString errorTypeToString(ErrorType x)
    {
        for (auto const &entry : errorTypeTable) {
            if (x == entry.type)
                return entry.str;
        }
        return {};
    }

    static std::optional<ErrorCond> stringToErrorCond(const QString &s)
    {
        for (auto const &entry : errorCondTable) {
            if (s == entry.str)
                return entry.cond;
        }
        return {};
    }

    static QString errorCondToString(ErrorCond x)
    {
        for (auto const &entry : errorCondTable) {
            if (x == entry.cond)
                return entry.str;
        }
        return QString();
    }

    static std::optional<std::pair<ErrorType, ErrorCond>> errorCodeToTypeCond(int x)
    {
        for (auto const &entry : errorCodeTable) {
            if (x == entry.code)
                return std::make_pair(entry.type, entry.cond);
        }
        return {};
    }
};

std::array<StanzaError::Private::ErrorTypeEntry, 5> StanzaError::Private::errorTypeTable {
    { { QStringLiteral("cancel"), Cancel },
      { QStringLiteral("continue"), Continue },
      { QStringLiteral("modify"), Modify },
      { QStringLiteral("auth"), Auth },
      { QStringLiteral("wait"), Wait } }
};

std::array<StanzaError::Private::ErrorCondEntry, 22> StanzaError::Private::errorCondTable { {
    { QStringLiteral("bad-request"), BadRequest },
    { QStringLiteral("conflict"), Conflict },
    { QStringLiteral("feature-not-implemented"), FeatureNotImplemented },
    { QStringLiteral("forbidden"), Forbidden },
    { QStringLiteral("gone"), Gone },
    { QStringLiteral("internal-server-error"), InternalServerError },
    { QStringLiteral("item-not-found"), ItemNotFound },
    { QStringLiteral("jid-malformed"), JidMalformed },
    { QStringLiteral("not-acceptable"), NotAcceptable },
    { QStringLiteral("not-allowed"), NotAllowed },
    { QStringLiteral("not-authorized"), NotAuthorized },
    { QStringLiteral("policy-violation"), PolicyViolation },
    { QStringLiteral("recipient-unavailable"), RecipientUnavailable },
    { QStringLiteral("redirect"), Redirect },
    { QStringLiteral("registration-required"), RegistrationRequired },
    { QStringLiteral("remote-server-not-found"), RemoteServerNotFound },
    { QStringLiteral("remote-server-timeout"), RemoteServerTimeout },
    { QStringLiteral("resource-constraint"), ResourceConstraint },
    { QStringLiteral("service-unavailable"), ServiceUnavailable },
    { QStringLiteral("subscription-required"), SubscriptionRequired },
    { QStringLiteral("undefined-condition"), UndefinedCondition },
    { QStringLiteral("unexpected-request"), UnexpectedRequest },
} };

std::array<StanzaError::Private::ErrorCodeEntry, 22> StanzaError::Private::errorCodeTable { {
    { BadRequest, Modify, 400 },
    { Conflict, Cancel, 409 },
    { FeatureNotImplemented, Cancel, 501 },
    { Forbidden, Auth, 403 },
    { Gone, Modify, 302 }, // permanent
    { InternalServerError, Wait, 500 },
    { ItemNotFound, Cancel, 404 },
    { JidMalformed, Modify, 400 },
    { NotAcceptable, Modify, 406 },
    { NotAllowed, Cancel, 405 },
    { NotAuthorized, Auth, 401 },
    { PolicyViolation, Modify, 402 },
    { RecipientUnavailable, Wait, 404 },
    { Redirect, Modify, 302 }, // temporary
    { RegistrationRequired, Auth, 407 },
    { RemoteServerNotFound, Cancel, 404 },
    { RemoteServerTimeout, Wait, 504 },
    { ResourceConstraint, Wait, 500 },
    { ServiceUnavailable, Cancel, 503 },
    { SubscriptionRequired, Auth, 407 },
    { UndefinedCondition, Wait, 500 },
    { UnexpectedRequest, Wait, 400 },
} };

/**
    \brief Reads the error from XML

    \a e may be the <error/> element itself or the stanza carrying it.
    Returns false if there is no usable error.
*/
bool StanzaError::fromXml(const QDomElement &e)
{
    QDomElement err = e;
    if (XMLHelper::localName(err) != QLatin1String("error"))
        err = XMLHelper::childElementNS(e, QString(), QStringLiteral("error"));
    if (err.isNull())
        return false;

    // type
    auto parsedType = Private::stringToErrorType(err.attribute("type"));
    if (!parsedType.has_value()) {
        // code. deprecated, see XEP-0086
        bool      ok;
        const int code = err.attribute("code").toInt(&ok);
        if (ok && code) {
            auto guess = Private::errorCodeToTypeCond(code);
            if (guess.has_value()) {
                type      = guess->first;
                condition = guess->second;
            } else {
                ok = false;
            }
        }
        if (!ok) {
            qWarning("unexpected error type=%s", qUtf8Printable(err.attribute("type")));
            return false;
        }
    } else {
        type      = *parsedType;
        condition = ErrorCond(-1);
    }

    by = err.attribute(QStringLiteral("by"));
    for (auto t = err.firstChildElement(); !t.isNull(); t = t.nextSiblingElement()) {
        const bool stanzasNS
            = t.namespaceURI() == PARLEY_NS_STANZAS || t.attribute(QStringLiteral("xmlns")) == PARLEY_NS_STANZAS;
        if (stanzasNS) {
            const QString name = XMLHelper::localName(t);
            if (name == QLatin1String("text")) {
                text = t.text().trimmed();
            } else {
                auto parsedCond = Private::stringToErrorCond(name);
                if (parsedCond.has_value()) {
                    condition = *parsedCond;
                }
            }
        } else {
            appSpec = t;
        }
    }

    if (condition == ErrorCond(-1)) {
        condition = UndefinedCondition;
    }

    return true;
}

QString StanzaError::typeString() const { return Private::errorTypeToString(type); }

QString StanzaError::conditionString() const { return Private::errorCondToString(condition); }
