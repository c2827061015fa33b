/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "OutputRouterTest.h"

#include <QSignalSpy>
#include <QTest>

#include "../workspace/OutputRouter.h"
#include "FakeSessionBackend.h"

using namespace Synk;

void OutputRouterTest::testRoutesBySessionId()
{
    FakeSessionBackend backend;
    OutputRouter router(&backend);

    QByteArray first;
    QByteArray second;
    router.registerHandler(1, [&first](const QByteArray &data) {
        first += data;
    });
    router.registerHandler(2, [&second](const QByteArray &data) {
        second += data;
    });

    backend.emitOutput(1, "one");
    backend.emitOutput(2, "two");

    QCOMPARE(first, QByteArray("one"));
    QCOMPARE(second, QByteArray("two"));
    QCOMPARE(router.handlerCount(), 2);
}

void OutputRouterTest::testUnregisteredSessionIsDropped()
{
    FakeSessionBackend backend;
    OutputRouter router(&backend);

    QByteArray received;
    router.registerHandler(1, [&received](const QByteArray &data) {
        received += data;
    });

    backend.emitOutput(42, "nobody listens");
    backend.emitExit(42, 0);
    QVERIFY(received.isEmpty());

    // Nothing was buffered for the late registration either
    router.registerHandler(42, [&received](const QByteArray &data) {
        received += data;
    });
    QVERIFY(received.isEmpty());
}

void OutputRouterTest::testRegisterReplacesHandler()
{
    FakeSessionBackend backend;
    OutputRouter router(&backend);

    int oldCalls = 0;
    int newCalls = 0;
    router.registerHandler(1, [&oldCalls](const QByteArray &) {
        ++oldCalls;
    });
    router.registerHandler(1, [&newCalls](const QByteArray &) {
        ++newCalls;
    });

    backend.emitOutput(1, "x");
    QCOMPARE(oldCalls, 0);
    QCOMPARE(newCalls, 1);
    QCOMPARE(router.handlerCount(), 1);
}

void OutputRouterTest::testUnregister()
{
    FakeSessionBackend backend;
    OutputRouter router(&backend);

    int calls = 0;
    router.registerHandler(1, [&calls](const QByteArray &) {
        ++calls;
    });
    router.unregisterHandler(1);
    router.unregisterHandler(1);

    backend.emitOutput(1, "x");
    QCOMPARE(calls, 0);
    QVERIFY(!router.hasHandler(1));
}

void OutputRouterTest::testHandlerMayUnregisterItself()
{
    FakeSessionBackend backend;
    OutputRouter router(&backend);

    QByteArray received;
    router.registerHandler(1, [&router, &received](const QByteArray &data) {
        received += data;
        router.unregisterHandler(1);
    });

    backend.emitOutput(1, "first");
    backend.emitOutput(1, "second");
    QCOMPARE(received, QByteArray("first"));
}

void OutputRouterTest::testInterleavedStreamsKeepOrder()
{
    FakeSessionBackend backend;
    OutputRouter router(&backend);

    QList<QByteArray> a;
    QList<QByteArray> b;
    router.registerHandler(1, [&a](const QByteArray &data) {
        a.append(data);
    });
    router.registerHandler(2, [&b](const QByteArray &data) {
        b.append(data);
    });

    for (int i = 0; i < 50; ++i) {
        backend.emitOutput(1, QByteArray::number(i));
        if (i % 3 == 0) {
            backend.emitOutput(2, "b" + QByteArray::number(i));
            backend.emitOutput(2, "c" + QByteArray::number(i));
        }
    }

    QCOMPARE(a.size(), 50);
    for (int i = 0; i < a.size(); ++i) {
        QCOMPARE(a[i], QByteArray::number(i));
    }
    QCOMPARE(b.size(), 34);
    QCOMPARE(b.first(), QByteArray("b0"));
    QCOMPARE(b.at(1), QByteArray("c0"));
    QCOMPARE(b.last(), QByteArray("c48"));
}

void OutputRouterTest::testExitMarkerPrecedesExitSignal()
{
    FakeSessionBackend backend;
    OutputRouter router(&backend);

    QStringList events;
    router.registerHandler(3, [&events](const QByteArray &data) {
        events.append(QString::fromUtf8(data));
    });
    connect(&router, &OutputRouter::sessionExited, this, [&events](SessionId sessionId, int exitCode) {
        events.append(QStringLiteral("exited %1 %2").arg(sessionId).arg(exitCode));
    });

    backend.emitExit(3, 127);

    QCOMPARE(events.size(), 2);
    QCOMPARE(events[0], QStringLiteral("\r\n[session exited: 127]\r\n"));
    QCOMPARE(events[1], QStringLiteral("exited 3 127"));
}

QTEST_GUILESS_MAIN(OutputRouterTest)
