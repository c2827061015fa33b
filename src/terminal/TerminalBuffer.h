/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALBUFFER_H
#define TERMINALBUFFER_H

#include <QString>

#include "synkprivate_export.h"

namespace Synk
{

/**
 * Render target for one session's decoded output.
 *
 * Escape-sequence interpretation and glyph rendering are the buffer's
 * business; the workspace only pushes text into it and asks it for its
 * geometry in character cells.
 */
class SYNKPRIVATE_EXPORT TerminalBuffer
{
public:
    virtual ~TerminalBuffer() = default;

    virtual void write(const QString &text) = 0;
    virtual int columns() const = 0;
    virtual int rows() const = 0;

    // Called exactly once when the session's pane goes away. The buffer must
    // not be touched by the workspace afterwards.
    virtual void release() = 0;
};

} // namespace Synk

#endif // TERMINALBUFFER_H
