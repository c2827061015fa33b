/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "GridLayout.h"

namespace Synk
{

GridGeometry GridLayout::forCount(int count)
{
    if (count <= 1) {
        return {1, 1};
    }
    if (count == 2) {
        return {2, 1};
    }
    if (count <= 4) {
        return {2, 2};
    }
    if (count <= 6) {
        return {3, 2};
    }
    if (count <= 9) {
        return {3, 3};
    }
    return {4, 3};
}

int GridLayout::clampIndex(int index, int count)
{
    if (count <= 0) {
        return -1;
    }
    if (index < 0) {
        return 0;
    }
    return index >= count ? count - 1 : index;
}

int GridLayout::moveIndex(int index, Direction direction, int count)
{
    if (count <= 0) {
        return -1;
    }
    index = clampIndex(index, count);
    const int columns = forCount(count).columns;

    switch (direction) {
    case Direction::Left:
        return index % columns == 0 ? index : index - 1;
    case Direction::Right: {
        const int next = index + 1;
        if (next >= count || next % columns == 0) {
            return index;
        }
        return next;
    }
    case Direction::Up:
        return index - columns >= 0 ? index - columns : index;
    case Direction::Down:
        return index + columns < count ? index + columns : index;
    }
    return index;
}

} // namespace Synk
