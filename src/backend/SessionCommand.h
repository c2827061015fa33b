/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONCOMMAND_H
#define SESSIONCOMMAND_H

#include <QString>
#include <QStringList>

namespace Synk
{

class SessionCommand
{
public:
    explicit SessionCommand(const QString &verb)
        : _verb(verb)
    {
    }

    SessionCommand &sessionTarget(int sessionId)
    {
        _parts.append(QStringLiteral("-t ") + QString::number(sessionId));
        return *this;
    }

    SessionCommand &flag(const QString &f)
    {
        _parts.append(f);
        return *this;
    }

    SessionCommand &option(const QString &f, const QString &value)
    {
        _parts.append(f);
        return singleQuotedArg(value);
    }

    // Embedded single quotes are written as '\'' like a POSIX shell would
    SessionCommand &singleQuotedArg(const QString &value)
    {
        QString escaped = value;
        escaped.replace(QLatin1Char('\''), QStringLiteral("'\\''"));
        _parts.append(QLatin1Char('\'') + escaped + QLatin1Char('\''));
        return *this;
    }

    SessionCommand &arg(const QString &value)
    {
        _parts.append(value);
        return *this;
    }

    QString build() const
    {
        QString result = _verb;
        for (const QString &part : _parts) {
            result += QLatin1Char(' ') + part;
        }
        return result;
    }

private:
    QString _verb;
    QStringList _parts;
};

} // namespace Synk

#endif // SESSIONCOMMAND_H
