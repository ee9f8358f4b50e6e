// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef AGGREGATE_H_7740918237409182
#define AGGREGATE_H_7740918237409182

#include <span>
#include "view_pipeline.h"


namespace dgrid
{
/*  over the item rows of a view sequence (group headers excluded):
        sum/average: numeric values only; null if there are none
        min/max:     compareCellValues(), nulls and absent values skipped
        count:       number of item rows                                   */
CellValue computeAggregate(std::span<const ViewRow> rows, const ColumnModel& col, AggregateType type);

std::wstring getAggregateLabel(AggregateType type); //"Sum", "Average", ...
}

#endif //AGGREGATE_H_7740918237409182
