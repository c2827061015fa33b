/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef FAKESESSIONBACKEND_H
#define FAKESESSIONBACKEND_H

#include <QList>
#include <QPair>

#include <functional>

#include "../backend/SessionBackend.h"

namespace Synk
{

/**
 * In-process SessionBackend for tests. Every request is recorded and left
 * pending until the test completes it, so tests decide exactly where
 * other events interleave.
 */
class FakeSessionBackend : public SessionBackend
{
    Q_OBJECT
public:
    struct CreateRequest {
        AgentType agentType;
        QString workingDir;
        CreateCallback callback;
    };
    struct DestroyRequest {
        SessionId sessionId;
        AckCallback callback;
    };
    struct ScrollbackRequest {
        SessionId sessionId;
        ScrollbackCallback callback;
    };
    struct ResizeRequest {
        SessionId sessionId;
        int columns;
        int rows;
    };

    explicit FakeSessionBackend(QObject *parent = nullptr);

    void create(AgentType agentType, const QString &workingDir, CreateCallback callback) override;
    void destroy(SessionId sessionId, AckCallback callback) override;
    void write(SessionId sessionId, const QByteArray &data) override;
    void resize(SessionId sessionId, int columns, int rows) override;
    void fetchScrollback(SessionId sessionId, ScrollbackCallback callback) override;
    void list(ListCallback callback) override;

    // Completing requests; each returns false when nothing was pending
    bool completeCreate(SessionId sessionId, int paneIndex);
    bool failCreate(const QString &error);
    bool completeDestroy(SessionId sessionId, bool success = true);
    bool completeScrollback(SessionId sessionId, const QByteArray &data, bool success = true);
    bool completeList(const QList<SessionInfo> &sessions, bool success = true);

    void emitOutput(SessionId sessionId, const QByteArray &data);
    void emitExit(SessionId sessionId, int exitCode);

    QByteArray writtenTo(SessionId sessionId) const;

    static SessionInfo session(SessionId sessionId, int paneIndex, AgentType agentType = AgentType::Terminal);

    QList<CreateRequest> createRequests;
    QList<DestroyRequest> destroyRequests;
    QList<ScrollbackRequest> scrollbackRequests;
    QList<ListCallback> listRequests;
    QList<QPair<SessionId, QByteArray>> writes;
    QList<ResizeRequest> resizes;
    QList<SessionId> destroyedSessions;

    // Runs inside destroy(), before the request is recorded
    std::function<void(SessionId)> onDestroy;
};

} // namespace Synk

#endif // FAKESESSIONBACKEND_H
