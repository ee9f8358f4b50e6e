// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "config.h"
#include <algorithm>

using namespace dgrid;


namespace
{
const int    ROW_HEIGHT_MIN  = 1;
const size_t BUFFER_ROWS_MAX = 1000;
}


GridConfig dgrid::normalize(const GridConfig& cfg)
{
    GridConfig out = cfg;
    out.rowHeight  = std::max(out.rowHeight, ROW_HEIGHT_MIN);
    out.bufferRows = std::min(out.bufferRows, BUFFER_ROWS_MAX);
    out.pageSize   = std::max<size_t>(out.pageSize, 1);
    out.filterDebounce = std::max(out.filterDebounce, std::chrono::milliseconds(0));
    return out;
}
