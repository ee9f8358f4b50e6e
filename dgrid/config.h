// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CONFIG_H_4019283740192837
#define CONFIG_H_4019283740192837

#include <chrono>
#include <cstddef>
#include "cell_value.h"


namespace dgrid
{
enum class EditTrigger
{
    singleTap,
    doubleTap,
    manual, //host calls DataGrid::beginEdit() only
};

enum class SelectionMode
{
    none,
    single,
    multiple,
};


struct GridConfig
{
    int    rowHeight  = 24; //pixel, > 0
    size_t bufferRows = 5;  //extra bound rows per side of the visible window

    bool virtualizationEnabled = true; //false: bind every row of the effective sequence
    bool pagingEnabled = false;
    size_t pageSize = 50; //> 0

    std::chrono::milliseconds filterDebounce{300};

    NullOrder nullOrder = NullOrder::last;
    bool showGroupHeaders = true;

    EditTrigger   editTrigger   = EditTrigger::doubleTap;
    SelectionMode selectionMode = SelectionMode::single;

    size_t undoLimit = 100; //0 disables edit history
};

//clamp out-of-range values (host-supplied config is never rejected)
GridConfig normalize(const GridConfig& cfg);
}

#endif //CONFIG_H_4019283740192837
