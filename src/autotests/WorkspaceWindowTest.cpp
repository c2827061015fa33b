/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorkspaceWindowTest.h"

#include <QTest>

#include "../widgets/SessionGridWidget.h"
#include "../widgets/WorkspaceWindow.h"
#include "../workspace/WorkspaceController.h"
#include "FakeSessionBackend.h"

using namespace Synk;

namespace
{
bool showAndFocus(WorkspaceWindow &window)
{
    window.show();
    if (!QTest::qWaitForWindowActive(&window)) {
        return false;
    }
    window.grid()->setFocus();
    return QTest::qWaitFor([&window]() {
        return window.grid()->hasFocus();
    });
}
}

void WorkspaceWindowTest::testShortcutsApplyInNavigationMode()
{
    FakeSessionBackend backend;
    WorkspaceWindow window(&backend, WorkspaceSettings());
    QVERIFY(showAndFocus(window));

    QTest::keyClick(window.grid(), Qt::Key_T, Qt::ControlModifier | Qt::ShiftModifier);
    QCOMPARE(backend.createRequests.size(), 1);

    backend.completeCreate(1, 0);
    QCOMPARE(window.controller()->sessionIds(), QList<SessionId>{1});

    QTest::keyClick(window.grid(), Qt::Key_W, Qt::ControlModifier | Qt::ShiftModifier);
    QCOMPARE(backend.destroyRequests.size(), 1);
    QVERIFY(window.controller()->sessions().isEmpty());
    QVERIFY(backend.writes.isEmpty());
}

void WorkspaceWindowTest::testShortcutKeysReachActiveSession()
{
    FakeSessionBackend backend;
    WorkspaceWindow window(&backend, WorkspaceSettings());
    QVERIFY(showAndFocus(window));

    window.controller()->createSession(AgentType::Terminal, QString());
    backend.completeCreate(1, 0);
    QVERIFY(window.controller()->activateSession(1));

    QTest::keyClick(window.grid(), Qt::Key_T, Qt::ControlModifier | Qt::ShiftModifier);
    QTest::keyClick(window.grid(), Qt::Key_W, Qt::ControlModifier | Qt::ShiftModifier);

    QCOMPARE(backend.createRequests.size(), 0);
    QVERIFY(backend.destroyRequests.isEmpty());
    QCOMPARE(window.controller()->sessionIds(), QList<SessionId>{1});
    QVERIFY(!backend.writtenTo(1).isEmpty());
}

QTEST_MAIN(WorkspaceWindowTest)
