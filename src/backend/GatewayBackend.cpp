/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "GatewayBackend.h"

#include "SessionCommand.h"
#include "SessionGateway.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(SynkBackendProcess, "synk.backend.process", QtInfoMsg)

namespace Synk
{

GatewayBackend::GatewayBackend(QObject *parent)
    : SessionBackend(parent)
    , _gateway(new SessionGateway(nullptr, this))
{
    connect(_gateway, &SessionGateway::outputReceived, this, &SessionBackend::outputReceived);
    connect(_gateway, &SessionGateway::sessionExited, this, &SessionBackend::sessionExited);
    connect(_gateway, &SessionGateway::sessionsChanged, this, &SessionBackend::sessionsChanged);
    connect(_gateway, &SessionGateway::exitReceived, this, [this](const QString &reason) {
        teardown(reason.isEmpty() ? QStringLiteral("backend exited") : reason);
    });
}

GatewayBackend::~GatewayBackend()
{
    if (_process) {
        // Nobody is listening any more; just make sure the child goes away
        disconnect(_process, nullptr, this, nullptr);
        if (_process->state() != QProcess::NotRunning) {
            _process->closeWriteChannel();
            _process->terminate();
            if (!_process->waitForFinished(1000)) {
                _process->kill();
                _process->waitForFinished(1000);
            }
        }
    }
}

bool GatewayBackend::start(const QString &program, const QStringList &arguments)
{
    if (_process) {
        qCWarning(SynkBackendProcess) << "backend already started";
        return false;
    }
    if (program.isEmpty()) {
        teardown(QStringLiteral("no backend program configured"));
        return false;
    }

    _process = new QProcess(this);
    _process->setProcessChannelMode(QProcess::ForwardedErrorChannel);
    connect(_process, &QProcess::readyReadStandardOutput, this, &GatewayBackend::onReadyRead);
    connect(_process, &QProcess::finished, this, &GatewayBackend::onProcessFinished);
    connect(_process, &QProcess::errorOccurred, this, &GatewayBackend::onProcessError);
    _gateway->setDevice(_process);

    qCInfo(SynkBackendProcess) << "starting backend:" << program << arguments;
    _process->start(program, arguments);
    if (!_process->waitForStarted(5000)) {
        teardown(_process->errorString());
        return false;
    }
    return true;
}

void GatewayBackend::stop()
{
    teardown(QStringLiteral("backend stopped"));
    if (_process && _process->state() != QProcess::NotRunning) {
        _process->closeWriteChannel();
        _process->terminate();
    }
}

bool GatewayBackend::isRunning() const
{
    return !_disconnected && _process && _process->state() == QProcess::Running;
}

SessionGateway *GatewayBackend::gateway() const
{
    return _gateway;
}

void GatewayBackend::receiveData(const QByteArray &data)
{
    _lineBuffer.append(data);
    int start = 0;
    int newline;
    while ((newline = _lineBuffer.indexOf('\n', start)) >= 0) {
        _gateway->processLine(_lineBuffer.mid(start, newline - start));
        start = newline + 1;
    }
    _lineBuffer.remove(0, start);
}

void GatewayBackend::onReadyRead()
{
    receiveData(_process->readAllStandardOutput());
}

void GatewayBackend::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    if (exitStatus == QProcess::CrashExit) {
        teardown(QStringLiteral("backend crashed"));
    } else {
        teardown(QStringLiteral("backend exited with code %1").arg(exitCode));
    }
}

void GatewayBackend::onProcessError(QProcess::ProcessError error)
{
    if (error == QProcess::FailedToStart || error == QProcess::Crashed) {
        teardown(_process->errorString());
    } else {
        qCWarning(SynkBackendProcess) << "backend process error:" << _process->errorString();
    }
}

void GatewayBackend::teardown(const QString &reason)
{
    if (_disconnected) {
        return;
    }
    _disconnected = true;
    qCWarning(SynkBackendProcess) << "backend unavailable:" << reason;
    _gateway->shutdown(reason);
    Q_EMIT disconnected(reason);
}

void GatewayBackend::create(AgentType agentType, const QString &workingDir, CreateCallback callback)
{
    SessionCommand command(QStringLiteral("create-session"));
    command.flag(QStringLiteral("-a")).arg(agentTypeName(agentType));
    if (!workingDir.isEmpty()) {
        command.option(QStringLiteral("-c"), workingDir);
    }

    _gateway->sendCommand(command, [agentType, workingDir, callback](bool success, const QByteArray &response) {
        if (!callback) {
            return;
        }
        if (!success) {
            callback(false, SessionInfo(), QString::fromUtf8(response));
            return;
        }
        auto session = parseCreateResponse(response);
        if (!session.has_value()) {
            callback(false, SessionInfo(), QStringLiteral("malformed create-session reply"));
            return;
        }
        session->agentType = agentType;
        session->workingDir = workingDir;
        callback(true, session.value(), QString());
    });
}

void GatewayBackend::destroy(SessionId sessionId, AckCallback callback)
{
    _gateway->sendCommand(SessionCommand(QStringLiteral("kill-session")).sessionTarget(sessionId),
                          [callback](bool success, const QByteArray &response) {
                              if (callback) {
                                  callback(success, success ? QString() : QString::fromUtf8(response));
                              }
                          });
}

void GatewayBackend::write(SessionId sessionId, const QByteArray &data)
{
    for (int offset = 0; offset < data.size(); offset += MaxWriteChunk) {
        const QByteArray chunk = data.mid(offset, MaxWriteChunk);
        _gateway->sendCommand(SessionCommand(QStringLiteral("send-bytes"))
                                  .sessionTarget(sessionId)
                                  .arg(QString::fromLatin1(SessionGateway::encodeOctalEscapes(chunk))),
                              [sessionId](bool success, const QByteArray &response) {
                                  if (!success) {
                                      qCDebug(SynkBackendProcess) << "send-bytes to" << sessionId << "failed:" << response;
                                  }
                              });
    }
}

void GatewayBackend::resize(SessionId sessionId, int columns, int rows)
{
    _gateway->sendCommand(SessionCommand(QStringLiteral("resize-session"))
                              .sessionTarget(sessionId)
                              .arg(QString::number(columns) + QLatin1Char('x') + QString::number(rows)));
}

void GatewayBackend::fetchScrollback(SessionId sessionId, ScrollbackCallback callback)
{
    _gateway->sendCommand(SessionCommand(QStringLiteral("capture-scrollback")).sessionTarget(sessionId),
                          [callback](bool success, const QByteArray &response) {
                              if (!callback) {
                                  return;
                              }
                              if (!success) {
                                  callback(false, QByteArray(), QString::fromUtf8(response));
                                  return;
                              }
                              // Payload newlines are escaped, so the block's own line
                              // breaks are dropped by the decoder.
                              callback(true, SessionGateway::decodeOctalEscapes(response), QString());
                          });
}

void GatewayBackend::list(ListCallback callback)
{
    _gateway->sendCommand(SessionCommand(QStringLiteral("list-sessions")), [callback](bool success, const QByteArray &response) {
        if (!callback) {
            return;
        }
        if (!success) {
            callback(false, {}, QString::fromUtf8(response));
            return;
        }
        callback(true, parseSessionList(response), QString());
    });
}

std::optional<SessionInfo> GatewayBackend::parseCreateResponse(const QByteArray &response)
{
    // "<sessionId>\t<paneIndex>"
    const QList<QByteArray> fields = response.trimmed().split('\t');
    if (fields.size() < 2) {
        return std::nullopt;
    }
    bool idOk = false;
    bool paneOk = false;
    SessionInfo session;
    session.sessionId = fields[0].toInt(&idOk);
    session.paneIndex = fields[1].toInt(&paneOk);
    if (!idOk || !paneOk || session.sessionId < 0 || session.paneIndex < 0) {
        return std::nullopt;
    }
    return session;
}

QList<SessionInfo> GatewayBackend::parseSessionList(const QByteArray &response)
{
    // One line per session: id, paneIndex, agent, branch, workingDir
    QList<SessionInfo> sessions;
    const QList<QByteArray> lines = response.split('\n');
    for (const QByteArray &line : lines) {
        if (line.trimmed().isEmpty()) {
            continue;
        }
        const QList<QByteArray> fields = line.split('\t');
        if (fields.size() < 3) {
            qCDebug(SynkBackendProcess) << "skipping malformed list-sessions line:" << line;
            continue;
        }
        bool idOk = false;
        bool paneOk = false;
        SessionInfo session;
        session.sessionId = fields[0].toInt(&idOk);
        session.paneIndex = fields[1].toInt(&paneOk);
        if (!idOk || !paneOk || session.sessionId < 0) {
            qCDebug(SynkBackendProcess) << "skipping malformed list-sessions line:" << line;
            continue;
        }
        session.agentType = agentTypeFromName(QString::fromUtf8(fields[2]));
        if (fields.size() > 3) {
            session.branch = QString::fromUtf8(fields[3]);
        }
        if (fields.size() > 4) {
            session.workingDir = QString::fromUtf8(fields[4]);
        }
        sessions.append(session);
    }
    return sessions;
}

} // namespace Synk

#include "moc_GatewayBackend.cpp"
