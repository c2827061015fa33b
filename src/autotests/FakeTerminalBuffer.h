/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef FAKETERMINALBUFFER_H
#define FAKETERMINALBUFFER_H

#include <QStringList>

#include "../terminal/TerminalBuffer.h"

namespace Synk
{

class FakeTerminalBuffer : public TerminalBuffer
{
public:
    void write(const QString &text) override
    {
        writes.append(text);
    }
    int columns() const override
    {
        return cols;
    }
    int rows() const override
    {
        return lines;
    }
    void release() override
    {
        ++releaseCount;
    }

    QString contents() const
    {
        return writes.join(QString());
    }

    QStringList writes;
    int cols = 80;
    int lines = 24;
    int releaseCount = 0;
};

} // namespace Synk

#endif // FAKETERMINALBUFFER_H
