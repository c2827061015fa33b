/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef GATEWAYBACKEND_H
#define GATEWAYBACKEND_H

#include <QProcess>
#include <QStringList>

#include <optional>

#include "SessionBackend.h"
#include "synkprivate_export.h"

namespace Synk
{

class SessionGateway;

/**
 * SessionBackend that talks to an external backend process over its
 * stdin/stdout control stream.
 *
 * Owns the gateway (Qt parent = this) and, once start() is called, the
 * backend process. When the process goes away every pending request fails
 * and disconnected() is emitted.
 */
class SYNKPRIVATE_EXPORT GatewayBackend : public SessionBackend
{
    Q_OBJECT
public:
    explicit GatewayBackend(QObject *parent = nullptr);
    ~GatewayBackend() override;

    bool start(const QString &program, const QStringList &arguments);
    void stop();
    bool isRunning() const;

    /** Feeds raw bytes read from the control stream; partial lines are kept. */
    void receiveData(const QByteArray &data);

    SessionGateway *gateway() const;

    void create(AgentType agentType, const QString &workingDir, CreateCallback callback) override;
    void destroy(SessionId sessionId, AckCallback callback) override;
    void write(SessionId sessionId, const QByteArray &data) override;
    void resize(SessionId sessionId, int columns, int rows) override;
    void fetchScrollback(SessionId sessionId, ScrollbackCallback callback) override;
    void list(ListCallback callback) override;

    static std::optional<SessionInfo> parseCreateResponse(const QByteArray &response);
    static QList<SessionInfo> parseSessionList(const QByteArray &response);

    // Largest payload carried by a single send-bytes command
    static constexpr int MaxWriteChunk = 1024;

private Q_SLOTS:
    void onReadyRead();
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onProcessError(QProcess::ProcessError error);

private:
    void teardown(const QString &reason);

    SessionGateway *_gateway; // owned (Qt parent = this)
    QProcess *_process = nullptr; // owned (Qt parent = this)
    QByteArray _lineBuffer;
    bool _disconnected = false;
};

} // namespace Synk

#endif // GATEWAYBACKEND_H
