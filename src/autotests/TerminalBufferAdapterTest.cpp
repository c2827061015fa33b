/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalBufferAdapterTest.h"

#include <QSignalSpy>
#include <QTest>

#include "../terminal/TerminalBufferAdapter.h"
#include "FakeTerminalBuffer.h"

using namespace Synk;

void TerminalBufferAdapterTest::testWriteBytesDecodesAcrossChunks()
{
    FakeTerminalBuffer buffer;
    TerminalBufferAdapter adapter(7, &buffer, 10);

    // "é" split between two chunks
    adapter.writeBytes("caf\xC3");
    adapter.writeBytes("\xA9!");

    QCOMPARE(buffer.contents(), QStringLiteral("café!"));
    QVERIFY(!buffer.contents().contains(QChar::ReplacementCharacter));
}

void TerminalBufferAdapterTest::testResizeHint()
{
    FakeTerminalBuffer buffer;
    buffer.cols = 132;
    buffer.lines = 43;
    TerminalBufferAdapter adapter(1, &buffer, 10);

    QCOMPARE(adapter.resizeHint(), QSize(132, 43));
}

void TerminalBufferAdapterTest::testResizeIsDebounced()
{
    FakeTerminalBuffer buffer;
    TerminalBufferAdapter adapter(3, &buffer, 30);
    QSignalSpy spy(&adapter, &TerminalBufferAdapter::resizeSettled);

    // A window drag produces a burst of geometry changes
    for (int width = 80; width < 90; ++width) {
        buffer.cols = width;
        adapter.notifyGeometryChanged();
    }
    QCOMPARE(spy.count(), 0);

    QTRY_COMPARE(spy.count(), 1);
    const QList<QVariant> arguments = spy.takeFirst();
    QCOMPARE(arguments.at(0).toInt(), 3);
    QCOMPARE(arguments.at(1).toInt(), 89);
    QCOMPARE(arguments.at(2).toInt(), 24);

    QTest::qWait(80);
    QCOMPARE(spy.count(), 0);
}

void TerminalBufferAdapterTest::testUnchangedSizeIsNotReported()
{
    FakeTerminalBuffer buffer;
    TerminalBufferAdapter adapter(3, &buffer, 5);
    QSignalSpy spy(&adapter, &TerminalBufferAdapter::resizeSettled);

    adapter.notifyGeometryChanged();
    QTRY_COMPARE(spy.count(), 1);

    adapter.notifyGeometryChanged();
    QTest::qWait(40);
    QCOMPARE(spy.count(), 1);

    buffer.lines = 30;
    adapter.notifyGeometryChanged();
    QTRY_COMPARE(spy.count(), 2);
}

void TerminalBufferAdapterTest::testDisposeIsIdempotent()
{
    FakeTerminalBuffer buffer;
    auto *adapter = new TerminalBufferAdapter(4, &buffer, 10);

    adapter->dispose();
    adapter->dispose();
    QVERIFY(adapter->isDisposed());
    QCOMPARE(buffer.releaseCount, 1);

    adapter->writeBytes("late output");
    QVERIFY(buffer.writes.isEmpty());
    QVERIFY(!adapter->resizeHint().isValid());

    // Destruction does not release a second time
    delete adapter;
    QCOMPARE(buffer.releaseCount, 1);
}

void TerminalBufferAdapterTest::testDisposeStopsPendingResize()
{
    FakeTerminalBuffer buffer;
    TerminalBufferAdapter adapter(5, &buffer, 10);
    QSignalSpy spy(&adapter, &TerminalBufferAdapter::resizeSettled);

    adapter.notifyGeometryChanged();
    adapter.dispose();
    QTest::qWait(50);
    QCOMPARE(spy.count(), 0);
}

void TerminalBufferAdapterTest::testWithoutBuffer()
{
    TerminalBufferAdapter adapter(6, nullptr, 10);
    QSignalSpy spy(&adapter, &TerminalBufferAdapter::resizeSettled);

    adapter.writeBytes("dropped");
    adapter.notifyGeometryChanged();
    QTest::qWait(40);
    QCOMPARE(spy.count(), 0);
    adapter.dispose();
    QVERIFY(adapter.isDisposed());
}

QTEST_GUILESS_MAIN(TerminalBufferAdapterTest)
