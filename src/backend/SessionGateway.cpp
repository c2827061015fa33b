/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionGateway.h"

#include "SessionCommand.h"

#include <QIODevice>
#include <QLoggingCategory>

#include <utility>

Q_LOGGING_CATEGORY(SynkGateway, "synk.backend.gateway", QtInfoMsg)

namespace Synk
{

SessionGateway::SessionGateway(QIODevice *device, QObject *parent)
    : QObject(parent)
    , _device(device)
{
}

void SessionGateway::setDevice(QIODevice *device)
{
    _device = device;
}

void SessionGateway::processLine(const QByteArray &rawLine)
{
    QByteArray line = rawLine;
    if (line.endsWith('\r')) {
        line.chop(1);
    }

    if (_inResponseBlock) {
        // "%end <id> <number> <flags>" or "%error <id> <number> <flags>"
        if (line.startsWith("%end ") || line.startsWith("%error ")) {
            const bool success = line.startsWith("%end ");
            const int blockId = parseBlockId(line.mid(success ? 5 : 7));
            if (blockId != _currentCommand.commandId) {
                qCWarning(SynkGateway) << "protocol error:" << line << "does not close block" << _currentCommand.commandId;
                return;
            }
            finishCurrentCommand(success);
            return;
        }
        if (!_discardingBlock) {
            if (!_currentCommand.response.isEmpty()) {
                _currentCommand.response += '\n';
            }
            _currentCommand.response += line;
        }
        return;
    }

    if (line.startsWith("%begin ")) {
        // "%begin <id> <number> <flags>"; flags are reserved
        const int blockId = parseBlockId(line.mid(7));
        _inResponseBlock = true;
        if (_pendingCommands.isEmpty()) {
            qCWarning(SynkGateway) << "protocol error: reply block" << blockId << "with no command pending, discarding it";
            _discardingBlock = true;
            _currentCommand = PendingCommand();
        } else {
            _discardingBlock = false;
            _currentCommand = _pendingCommands.dequeue();
        }
        _currentCommand.commandId = blockId;
        return;
    }

    if (line.startsWith("%")) {
        handleNotification(line);
    } else if (!line.isEmpty()) {
        qCDebug(SynkGateway) << "ignoring stray line:" << line.left(80);
    }
}

std::optional<SessionNotification> SessionGateway::parseNotification(const QByteArray &line)
{
    if (line.startsWith("%output ")) {
        const int firstSpace = line.indexOf(' ', 8);
        if (firstSpace < 0) {
            return std::nullopt;
        }
        const int sessionId = parseSessionId(line.mid(8, firstSpace - 8));
        if (sessionId < 0) {
            return std::nullopt;
        }
        return SessionOutputNotification{sessionId, decodeOctalEscapes(line.mid(firstSpace + 1))};

    } else if (line.startsWith("%exit ")) {
        const QList<QByteArray> parts = line.mid(6).split(' ');
        if (parts.size() < 2) {
            return std::nullopt;
        }
        const int sessionId = parseSessionId(parts[0]);
        bool ok = false;
        const int exitCode = parts[1].toInt(&ok);
        if (sessionId < 0 || !ok) {
            return std::nullopt;
        }
        return SessionExitNotification{sessionId, exitCode};

    } else if (line == "%sessions-changed") {
        return SessionsChangedNotification{};

    } else if (line.startsWith("%backend-exit")) {
        QString reason;
        if (line.length() > 14) {
            reason = QString::fromUtf8(line.mid(14));
        }
        return BackendExitNotification{reason};
    }

    return std::nullopt;
}

void SessionGateway::handleNotification(const QByteArray &line)
{
    auto notification = parseNotification(line);
    if (!notification.has_value()) {
        qCDebug(SynkGateway) << "unparsed notification:" << line.left(80);
        return;
    }
    // Log everything except %output (too noisy)
    if (!line.startsWith("%output ")) {
        qCDebug(SynkGateway) << "notification:" << line;
    }

    std::visit(
        [this](auto &&n) {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, SessionOutputNotification>) {
                Q_EMIT outputReceived(n.sessionId, n.data);
            } else if constexpr (std::is_same_v<T, SessionExitNotification>) {
                Q_EMIT sessionExited(n.sessionId, n.exitCode);
            } else if constexpr (std::is_same_v<T, SessionsChangedNotification>) {
                Q_EMIT sessionsChanged();
            } else if constexpr (std::is_same_v<T, BackendExitNotification>) {
                shutdown(n.reason);
                Q_EMIT exitReceived(n.reason);
            }
        },
        notification.value());
}

void SessionGateway::finishCurrentCommand(bool success)
{
    _inResponseBlock = false;
    PendingCommand finished = std::move(_currentCommand);
    _currentCommand = PendingCommand();
    if (_discardingBlock) {
        _discardingBlock = false;
        return;
    }
    qCDebug(SynkGateway) << "finishCommand:" << (success ? "OK" : "FAIL") << "cmd=" << finished.command.left(80)
                         << "response bytes=" << finished.response.size();
    if (finished.callback) {
        finished.callback(success, finished.response);
    }
}

void SessionGateway::sendCommand(const SessionCommand &command, CommandCallback callback)
{
    const QString commandStr = command.build();

    if (_exited) {
        qCDebug(SynkGateway) << "sendCommand: DROPPED (exited):" << commandStr.left(80);
        if (callback) {
            callback(false, QByteArrayLiteral("backend is not running"));
        }
        return;
    }

    // One command, one line: replies are matched to commands by position
    if (containsControlCharacters(commandStr)) {
        qCWarning(SynkGateway) << "sendCommand: REFUSED (control characters):" << commandStr.left(80);
        if (callback) {
            callback(false, QByteArrayLiteral("command arguments must not contain control characters"));
        }
        return;
    }

    if (!writeToGateway(commandStr.toUtf8() + '\n')) {
        if (callback) {
            callback(false, QByteArrayLiteral("backend is not connected"));
        }
        return;
    }

    PendingCommand cmd;
    cmd.command = commandStr;
    cmd.callback = std::move(callback);
    _pendingCommands.enqueue(cmd);
}

void SessionGateway::shutdown(const QString &reason)
{
    if (_exited) {
        return;
    }
    _exited = true;
    qCInfo(SynkGateway) << "gateway shut down:" << reason;

    const QByteArray message = reason.isEmpty() ? QByteArrayLiteral("backend is not running") : reason.toUtf8();

    QList<PendingCommand> failed;
    if (_inResponseBlock && !_discardingBlock) {
        failed.append(std::move(_currentCommand));
    }
    _inResponseBlock = false;
    _discardingBlock = false;
    _currentCommand = PendingCommand();
    while (!_pendingCommands.isEmpty()) {
        failed.append(_pendingCommands.dequeue());
    }

    for (const PendingCommand &cmd : std::as_const(failed)) {
        if (cmd.callback) {
            cmd.callback(false, message);
        }
    }
}

QByteArray SessionGateway::decodeOctalEscapes(const QByteArray &encoded)
{
    QByteArray result;
    result.reserve(encoded.size());

    int i = 0;
    while (i < encoded.size()) {
        const char c = encoded[i];
        if (c == '\\' && i + 3 < encoded.size()) {
            // Try to read 3 octal digits
            int value = 0;
            bool valid = true;
            int j = i + 1;
            int digits = 0;
            while (digits < 3 && j < encoded.size()) {
                const char d = encoded[j];
                if (d == '\r') {
                    // Line driver artifact
                    j++;
                    continue;
                }
                if (d < '0' || d > '7') {
                    valid = false;
                    break;
                }
                value = value * 8 + (d - '0');
                digits++;
                j++;
            }
            if (valid && digits == 3) {
                result.append(static_cast<char>(value));
                i = j;
            } else {
                result.append('?');
                i++;
            }
        } else if (static_cast<unsigned char>(c) < ' ' && c != '\t') {
            // Raw control characters are never part of the payload
            i++;
        } else {
            result.append(c);
            i++;
        }
    }

    return result;
}

QByteArray SessionGateway::encodeOctalEscapes(const QByteArray &data)
{
    QByteArray result;
    result.reserve(data.size());
    for (char c : data) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte < 0x21 || byte == 0x7f || c == '\\') {
            result.append('\\');
            result.append(static_cast<char>('0' + ((byte >> 6) & 07)));
            result.append(static_cast<char>('0' + ((byte >> 3) & 07)));
            result.append(static_cast<char>('0' + (byte & 07)));
        } else {
            result.append(c);
        }
    }
    return result;
}

int SessionGateway::parseBlockId(const QByteArray &fields)
{
    const int space = fields.indexOf(' ');
    bool ok = false;
    const int id = (space < 0 ? fields : fields.left(space)).toInt(&ok);
    return ok ? id : -1;
}

bool SessionGateway::containsControlCharacters(const QString &command)
{
    for (const QChar c : command) {
        if (c.category() == QChar::Other_Control) {
            return true;
        }
    }
    return false;
}

int SessionGateway::parseSessionId(const QByteArray &token)
{
    bool ok = false;
    const int id = token.trimmed().toInt(&ok);
    return (ok && id >= 0) ? id : -1;
}

bool SessionGateway::writeToGateway(const QByteArray &data)
{
    if (!_device || !_device->isWritable()) {
        qCWarning(SynkGateway) << "no writable device, dropping" << data.size() << "bytes";
        return false;
    }
    if (_device->write(data) != data.size()) {
        qCWarning(SynkGateway) << "short write to backend:" << _device->errorString();
        return false;
    }
    return true;
}

} // namespace Synk

#include "moc_SessionGateway.cpp"
