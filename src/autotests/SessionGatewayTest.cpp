/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionGatewayTest.h"

#include <QBuffer>
#include <QSignalSpy>
#include <QTest>

#include "../backend/SessionCommand.h"
#include "../backend/SessionGateway.h"

using namespace Synk;

namespace
{
struct Reply {
    bool called = false;
    bool success = false;
    QByteArray response;
};

SessionGateway::CommandCallback recordInto(Reply &reply)
{
    return [&reply](bool success, const QByteArray &response) {
        reply.called = true;
        reply.success = success;
        reply.response = response;
    };
}
}

void SessionGatewayTest::testCommandIsWrittenAsLine()
{
    QBuffer device;
    device.open(QIODevice::ReadWrite);
    SessionGateway gateway(&device);

    gateway.sendCommand(SessionCommand(QStringLiteral("kill-session")).sessionTarget(4));
    gateway.sendCommand(SessionCommand(QStringLiteral("list-sessions")));

    QCOMPARE(device.data(), QByteArray("kill-session -t 4\nlist-sessions\n"));
    QCOMPARE(gateway.pendingCommandCount(), 2);
}

void SessionGatewayTest::testResponsesMatchRequestOrder()
{
    QBuffer device;
    device.open(QIODevice::ReadWrite);
    SessionGateway gateway(&device);

    Reply first;
    Reply second;
    gateway.sendCommand(SessionCommand(QStringLiteral("list-sessions")), recordInto(first));
    gateway.sendCommand(SessionCommand(QStringLiteral("capture-scrollback")).sessionTarget(1), recordInto(second));

    gateway.processLine("%begin 100 1 1");
    gateway.processLine("1\t0\tterminal\tmain\t/tmp");
    gateway.processLine("2\t1\tcodex\t\t/tmp\r");
    gateway.processLine("%end 100 1 1");
    QVERIFY(first.called);
    QVERIFY(!second.called);
    QVERIFY(first.success);
    QCOMPARE(first.response, QByteArray("1\t0\tterminal\tmain\t/tmp\n2\t1\tcodex\t\t/tmp"));

    gateway.processLine("%begin 101 2 1");
    gateway.processLine("%end 101 2 1");
    QVERIFY(second.called);
    QVERIFY(second.success);
    QVERIFY(second.response.isEmpty());
    QCOMPARE(gateway.pendingCommandCount(), 0);
}

void SessionGatewayTest::testErrorBlockFailsCommand()
{
    QBuffer device;
    device.open(QIODevice::ReadWrite);
    SessionGateway gateway(&device);

    Reply reply;
    gateway.sendCommand(SessionCommand(QStringLiteral("kill-session")).sessionTarget(9), recordInto(reply));
    gateway.processLine("%begin 7 1 1");
    gateway.processLine("no such session: 9");
    gateway.processLine("%error 7 1 1");

    QVERIFY(reply.called);
    QVERIFY(!reply.success);
    QCOMPARE(reply.response, QByteArray("no such session: 9"));
}

void SessionGatewayTest::testUnmatchedBlockIsDiscarded()
{
    QBuffer device;
    device.open(QIODevice::ReadWrite);
    SessionGateway gateway(&device);

    // Nothing was asked yet
    gateway.processLine("%begin 50 1 0");
    gateway.processLine("%output 1 inside");
    gateway.processLine("%end 50 1 0");
    QCOMPARE(gateway.pendingCommandCount(), 0);

    Reply reply;
    gateway.sendCommand(SessionCommand(QStringLiteral("list-sessions")), recordInto(reply));
    gateway.processLine("%begin 51 2 0");
    gateway.processLine("ours");
    gateway.processLine("%end 51 2 0");
    QVERIFY(reply.called);
    QVERIFY(reply.success);
    QCOMPARE(reply.response, QByteArray("ours"));
}

void SessionGatewayTest::testMismatchedTerminatorKeepsBlockOpen()
{
    QBuffer device;
    device.open(QIODevice::ReadWrite);
    SessionGateway gateway(&device);

    Reply reply;
    gateway.sendCommand(SessionCommand(QStringLiteral("list-sessions")), recordInto(reply));
    gateway.processLine("%begin 8 1 0");
    gateway.processLine("%end 9 1 0");
    QVERIFY(!reply.called);
    QCOMPARE(gateway.pendingCommandCount(), 1);

    gateway.processLine("1\t0\tterminal\t\t/tmp");
    gateway.processLine("%end 8 1 0");
    QVERIFY(reply.called);
    QCOMPARE(reply.response, QByteArray("1\t0\tterminal\t\t/tmp"));
}

void SessionGatewayTest::testControlCharactersAreRefused()
{
    QBuffer device;
    device.open(QIODevice::ReadWrite);
    SessionGateway gateway(&device);

    Reply refused;
    gateway.sendCommand(SessionCommand(QStringLiteral("create-session")).option(QStringLiteral("-c"), QStringLiteral("/tmp/a\nb")), recordInto(refused));
    QVERIFY(refused.called);
    QVERIFY(!refused.success);
    QVERIFY(device.data().isEmpty());
    QCOMPARE(gateway.pendingCommandCount(), 0);

    QVERIFY(SessionGateway::containsControlCharacters(QStringLiteral("a\rb")));
    QVERIFY(SessionGateway::containsControlCharacters(QStringLiteral("tab\there")));
    QVERIFY(!SessionGateway::containsControlCharacters(QStringLiteral("/home/dev/caf\u00e9 'x'")));

    // Later commands still line up with their replies
    Reply listed;
    gateway.sendCommand(SessionCommand(QStringLiteral("list-sessions")), recordInto(listed));
    QCOMPARE(device.data(), QByteArray("list-sessions\n"));
    gateway.processLine("%begin 3 1 0");
    gateway.processLine("%end 3 1 0");
    QVERIFY(listed.called);
    QVERIFY(listed.success);
}

void SessionGatewayTest::testNotifications()
{
    SessionGateway gateway(nullptr);
    QSignalSpy outputSpy(&gateway, &SessionGateway::outputReceived);
    QSignalSpy exitSpy(&gateway, &SessionGateway::sessionExited);
    QSignalSpy changedSpy(&gateway, &SessionGateway::sessionsChanged);

    gateway.processLine("%output 3 hello\\040world\\015\\012");
    QCOMPARE(outputSpy.count(), 1);
    QCOMPARE(outputSpy.first().at(0).toInt(), 3);
    QCOMPARE(outputSpy.first().at(1).toByteArray(), QByteArray("hello world\r\n"));

    gateway.processLine("%exit 3 1");
    QCOMPARE(exitSpy.count(), 1);
    QCOMPARE(exitSpy.first().at(0).toInt(), 3);
    QCOMPARE(exitSpy.first().at(1).toInt(), 1);

    gateway.processLine("%sessions-changed");
    QCOMPARE(changedSpy.count(), 1);
}

void SessionGatewayTest::testMalformedNotifications()
{
    QVERIFY(!SessionGateway::parseNotification("%output x data").has_value());
    QVERIFY(!SessionGateway::parseNotification("%output 3").has_value());
    QVERIFY(!SessionGateway::parseNotification("%exit 3").has_value());
    QVERIFY(!SessionGateway::parseNotification("%exit 3 abc").has_value());
    QVERIFY(!SessionGateway::parseNotification("%unknown").has_value());

    auto exit = SessionGateway::parseNotification("%backend-exit server shutting down");
    QVERIFY(exit.has_value());
    QVERIFY(std::holds_alternative<BackendExitNotification>(*exit));
    QCOMPARE(std::get<BackendExitNotification>(*exit).reason, QStringLiteral("server shutting down"));

    auto bare = SessionGateway::parseNotification("%backend-exit");
    QVERIFY(bare.has_value());
    QVERIFY(std::get<BackendExitNotification>(*bare).reason.isEmpty());
}

void SessionGatewayTest::testOutputBetweenResponses()
{
    QBuffer device;
    device.open(QIODevice::ReadWrite);
    SessionGateway gateway(&device);
    QSignalSpy outputSpy(&gateway, &SessionGateway::outputReceived);

    Reply reply;
    gateway.sendCommand(SessionCommand(QStringLiteral("create-session")).flag(QStringLiteral("-a")).arg(QStringLiteral("terminal")), recordInto(reply));

    gateway.processLine("%output 1 before");
    QVERIFY(!reply.called);
    gateway.processLine("%begin 1 1 1");
    gateway.processLine("5\t0");
    gateway.processLine("%end 1 1 1");
    gateway.processLine("%output 5 after");

    QCOMPARE(reply.response, QByteArray("5\t0"));
    QCOMPARE(outputSpy.count(), 2);
}

void SessionGatewayTest::testBackendExitFailsPendingCommands()
{
    QBuffer device;
    device.open(QIODevice::ReadWrite);
    SessionGateway gateway(&device);
    QSignalSpy exitSpy(&gateway, &SessionGateway::exitReceived);

    Reply inFlight;
    Reply queued;
    gateway.sendCommand(SessionCommand(QStringLiteral("list-sessions")), recordInto(inFlight));
    gateway.sendCommand(SessionCommand(QStringLiteral("list-sessions")), recordInto(queued));
    gateway.processLine("%begin 1 1 1");
    gateway.processLine("partial");

    gateway.processLine("%backend-exit killed");

    QVERIFY(inFlight.called);
    QVERIFY(!inFlight.success);
    QVERIFY(queued.called);
    QVERIFY(!queued.success);
    QCOMPARE(queued.response, QByteArray("killed"));
    QCOMPARE(exitSpy.count(), 1);
    QVERIFY(gateway.hasExited());
    QCOMPARE(gateway.pendingCommandCount(), 0);
}

void SessionGatewayTest::testSendAfterShutdownFailsImmediately()
{
    QBuffer device;
    device.open(QIODevice::ReadWrite);
    SessionGateway gateway(&device);
    gateway.shutdown(QStringLiteral("stopped"));

    Reply reply;
    gateway.sendCommand(SessionCommand(QStringLiteral("list-sessions")), recordInto(reply));
    QVERIFY(reply.called);
    QVERIFY(!reply.success);
    QVERIFY(device.data().isEmpty());
}

void SessionGatewayTest::testSendWithoutDeviceFails()
{
    SessionGateway gateway(nullptr);

    Reply reply;
    gateway.sendCommand(SessionCommand(QStringLiteral("list-sessions")), recordInto(reply));
    QVERIFY(reply.called);
    QVERIFY(!reply.success);
    QCOMPARE(gateway.pendingCommandCount(), 0);
}

void SessionGatewayTest::testDecodeOctalEscapes()
{
    QCOMPARE(SessionGateway::decodeOctalEscapes("plain"), QByteArray("plain"));
    QCOMPARE(SessionGateway::decodeOctalEscapes("a\\033[0mb"), QByteArray("a\x1b[0mb"));
    QCOMPARE(SessionGateway::decodeOctalEscapes("\\134"), QByteArray("\\"));
    QCOMPARE(SessionGateway::decodeOctalEscapes("\\360\\237\\230\\200"), QByteArray("\xF0\x9F\x98\x80"));
    // Line breaks between capture lines are not payload
    QCOMPARE(SessionGateway::decodeOctalEscapes("one\\012\ntwo"), QByteArray("one\ntwo"));
}

void SessionGatewayTest::testEncodeOctalEscapes()
{
    QCOMPARE(SessionGateway::encodeOctalEscapes("ls -l\r"), QByteArray("ls\\040-l\\015"));
    QCOMPARE(SessionGateway::encodeOctalEscapes("\x1b"), QByteArray("\\033"));
    QCOMPARE(SessionGateway::encodeOctalEscapes("a\\b"), QByteArray("a\\134b"));

    const QByteArray binary("\x00\x7f\xff\x1b[A", 6);
    QCOMPARE(SessionGateway::decodeOctalEscapes(SessionGateway::encodeOctalEscapes(binary)), binary);
}

void SessionGatewayTest::testCommandQuoting()
{
    const QString command = SessionCommand(QStringLiteral("create-session"))
                                .flag(QStringLiteral("-a"))
                                .arg(QStringLiteral("claude_code"))
                                .option(QStringLiteral("-c"), QStringLiteral("/home/me/it's here"))
                                .build();
    QCOMPARE(command, QStringLiteral("create-session -a claude_code -c '/home/me/it'\\''s here'"));
}

QTEST_GUILESS_MAIN(SessionGatewayTest)
