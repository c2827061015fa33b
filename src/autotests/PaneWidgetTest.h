/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PANEWIDGETTEST_H
#define PANEWIDGETTEST_H

#include <QObject>

namespace Synk
{
class PaneWidgetTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testWriteStripsControlSequences();
    void testReleaseDeletesPane();
    void testMouseSignals();
    void testCloseButton();
    void testHeaderTitle();
    void testGridRelayout();
    void testGridFocus();
};
}

#endif // PANEWIDGETTEST_H
