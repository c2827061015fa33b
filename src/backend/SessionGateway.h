/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONGATEWAY_H
#define SESSIONGATEWAY_H

#include <QByteArray>
#include <QObject>
#include <QPointer>
#include <QQueue>

#include <functional>
#include <optional>

#include "SessionNotification.h"
#include "synkprivate_export.h"

class QIODevice;

namespace Synk
{

class SessionCommand;

/**
 * Line-level codec for the backend control stream.
 *
 * Commands are written one per line. Their replies arrive as
 * %begin/%end (or %error) blocks, strictly in the order the commands were
 * sent. Everything else starting with '%' is a notification.
 */
class SYNKPRIVATE_EXPORT SessionGateway : public QObject
{
    Q_OBJECT
public:
    explicit SessionGateway(QIODevice *device, QObject *parent = nullptr);

    void setDevice(QIODevice *device);
    void processLine(const QByteArray &line);

    using CommandCallback = std::function<void(bool success, const QByteArray &response)>;
    void sendCommand(const SessionCommand &command, CommandCallback callback = nullptr);

    /** Fails every queued command and refuses new ones from now on. */
    void shutdown(const QString &reason);
    bool hasExited() const
    {
        return _exited;
    }
    int pendingCommandCount() const
    {
        return _pendingCommands.size() + (_inResponseBlock && !_discardingBlock ? 1 : 0);
    }

    static std::optional<SessionNotification> parseNotification(const QByteArray &line);
    /** True for C0/C1 controls such as line breaks, which cannot travel inside a command line. */
    static bool containsControlCharacters(const QString &command);
    static QByteArray decodeOctalEscapes(const QByteArray &encoded);
    static QByteArray encodeOctalEscapes(const QByteArray &data);

Q_SIGNALS:
    void outputReceived(int sessionId, const QByteArray &data);
    void sessionExited(int sessionId, int exitCode);
    void sessionsChanged();
    void exitReceived(const QString &reason);

private:
    static int parseSessionId(const QByteArray &token);
    static int parseBlockId(const QByteArray &fields);
    void handleNotification(const QByteArray &line);
    void finishCurrentCommand(bool success);
    bool writeToGateway(const QByteArray &data);

    QPointer<QIODevice> _device;

    struct PendingCommand {
        QString command;
        CommandCallback callback;
        QByteArray response;
        int commandId = -1;
    };
    QQueue<PendingCommand> _pendingCommands;
    bool _inResponseBlock = false;
    bool _discardingBlock = false;
    bool _exited = false;
    PendingCommand _currentCommand;
};

} // namespace Synk

#endif // SESSIONGATEWAY_H
