/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SCROLLBACKRECONCILERTEST_H
#define SCROLLBACKRECONCILERTEST_H

#include <QObject>

namespace Synk
{
class ScrollbackReconcilerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testScrollbackWrittenBeforeLiveOutput();
    void testOutputDuringFetchIsQueued();
    void testRegisterAfterFetchLosesOverlap();
    void testDisposedAdapterAbandonsAttach();
    void testDeletedAdapterAbandonsAttach();
    void testCancel();
    void testFailedFetchStillGoesLive();
    void testReattachSupersedesEarlierFetch();
    void testScrollbackSplitCharacterJoinsLiveOutput();
};
}

#endif // SCROLLBACKRECONCILERTEST_H
