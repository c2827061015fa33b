/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONNOTIFICATION_H
#define SESSIONNOTIFICATION_H

#include <QByteArray>
#include <QString>

#include <variant>

namespace Synk
{

struct SessionOutputNotification {
    int sessionId;
    QByteArray data;
};

struct SessionExitNotification {
    int sessionId;
    int exitCode;
};

struct SessionsChangedNotification {};

struct BackendExitNotification {
    QString reason;
};

using SessionNotification = std::variant<SessionOutputNotification, SessionExitNotification, SessionsChangedNotification, BackendExitNotification>;

} // namespace Synk

#endif // SESSIONNOTIFICATION_H
