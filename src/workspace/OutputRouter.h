/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef OUTPUTROUTER_H
#define OUTPUTROUTER_H

#include <QByteArray>
#include <QHash>
#include <QObject>

#include <functional>

#include "backend/SessionInfo.h"
#include "synkprivate_export.h"

namespace Synk
{

class SessionBackend;

/**
 * Demultiplexes the backend's output stream by session id.
 *
 * The router is the only subscriber of the backend's output and exit
 * events. Each session has at most one handler; output for a session
 * without one is dropped.
 */
class SYNKPRIVATE_EXPORT OutputRouter : public QObject
{
    Q_OBJECT
public:
    using OutputHandler = std::function<void(const QByteArray &data)>;

    explicit OutputRouter(SessionBackend *backend, QObject *parent = nullptr);

    /** Installs the handler for sessionId, replacing any previous one. */
    void registerHandler(SessionId sessionId, OutputHandler handler);
    void unregisterHandler(SessionId sessionId);
    bool hasHandler(SessionId sessionId) const;
    int handlerCount() const;

    void route(SessionId sessionId, const QByteArray &data);

    static QByteArray exitMarker(int exitCode);

Q_SIGNALS:
    // Emitted after the exit marker has reached the session's handler
    void sessionExited(Synk::SessionId sessionId, int exitCode);

private:
    void onSessionExited(SessionId sessionId, int exitCode);

    QHash<SessionId, OutputHandler> _handlers;
};

} // namespace Synk

#endif // OUTPUTROUTER_H
