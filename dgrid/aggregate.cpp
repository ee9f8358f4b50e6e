// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "aggregate.h"
#include <cassert>
#include "i18n.h"

using namespace dgrid;


CellValue dgrid::computeAggregate(std::span<const ViewRow> rows, const ColumnModel& col, AggregateType type)
{
    if (type == AggregateType::none)
        return CellValue();

    int64_t itemCount = 0;

    bool allIntegers = true;
    int64_t intSum = 0;
    double  sum = 0;
    int64_t numberCount = 0;

    std::optional<CellValue> minVal;
    std::optional<CellValue> maxVal;

    for (const ViewRow& row : rows)
        if (!row.isGroupHeader())
            if (const std::shared_ptr<void> item = row.item.lock())
            {
                ++itemCount;
                if (type == AggregateType::count)
                    continue;

                CellValue value;
                try
                {
                    value = col.getter(item.get()); //throw X
                }
                catch (const std::exception&) { continue; } //absent value

                if (isNull(value))
                    continue;

                if (const std::optional<double> num = getNumericValue(value))
                {
                    if (const int64_t* n = std::get_if<int64_t>(&value))
                        intSum += *n;
                    else
                        allIntegers = false;
                    sum += *num;
                    ++numberCount;
                }

                if (!minVal || compareCellValues(value, *minVal) < 0)
                    minVal = value;
                if (!maxVal || compareCellValues(value, *maxVal) > 0)
                    maxVal = value;
            }

    switch (type)
    {
        case AggregateType::none:
            break;

        case AggregateType::count:
            return itemCount;

        case AggregateType::sum:
            if (numberCount == 0)
                return CellValue();
            if (allIntegers)
                return intSum;
            return sum;

        case AggregateType::average:
            if (numberCount == 0)
                return CellValue();
            return sum / static_cast<double>(numberCount);

        case AggregateType::min:
            return minVal ? *minVal : CellValue();

        case AggregateType::max:
            return maxVal ? *maxVal : CellValue();
    }
    return CellValue();
}


std::wstring dgrid::getAggregateLabel(AggregateType type)
{
    switch (type)
    {
        case AggregateType::none:
            return std::wstring();
        case AggregateType::sum:
            return _("Sum");
        case AggregateType::average:
            return _("Average");
        case AggregateType::count:
            return _("Count");
        case AggregateType::min:
            return _("Min");
        case AggregateType::max:
            return _("Max");
    }
    assert(false);
    return std::wstring();
}
