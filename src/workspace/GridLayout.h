/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef GRIDLAYOUT_H
#define GRIDLAYOUT_H

#include "synkprivate_export.h"

namespace Synk
{

enum class Direction { Left, Right, Up, Down };

struct GridGeometry {
    int columns = 1;
    int rows = 1;

    bool operator==(const GridGeometry &other) const
    {
        return columns == other.columns && rows == other.rows;
    }
    bool operator!=(const GridGeometry &other) const
    {
        return !(*this == other);
    }
};

/**
 * Fixed grid arrangement for up to MaxPanes panes, filled row by row.
 */
class SYNKPRIVATE_EXPORT GridLayout
{
public:
    static constexpr int MaxPanes = 12;

    // Counts above MaxPanes are not supported and get the 4x3 grid
    static GridGeometry forCount(int count);

    /**
     * Index reached by moving from index in the given direction, in the grid
     * for count panes. Movement stops at the grid edges and at empty cells;
     * returns -1 only when count is 0.
     */
    static int moveIndex(int index, Direction direction, int count);

    static int clampIndex(int index, int count);
};

} // namespace Synk

#endif // GRIDLAYOUT_H
