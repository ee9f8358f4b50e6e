// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef COLUMN_LAYOUT_H_5601928374019283
#define COLUMN_LAYOUT_H_5601928374019283

#include <unordered_map>
#include <vector>
#include "column.h"
#include "theme.h"


namespace dgrid
{
struct ColumnWidth
{
    std::wstring columnId;
    int width = 0;

    bool operator==(const ColumnWidth&) const = default;
};

struct ColumnLayout
{
    std::vector<ColumnWidth> widths; //visible columns only, in column order
    int totalWidth    = 0;
    int viewportWidth = 0;
    bool overflow = false; //columns need more than the viewport: horizontal scrolling expected

    bool operator==(const ColumnLayout&) const = default;
};


/*  Resolution order:
        1. Fixed:     declared width
        2. FitHeader: header label, measured before any row is built
        3. Auto:      header label until content was measured over visible rows, then content width
        4. Fill:      remaining width by weight; minWidth on overflow

    - every width is clamped to [minWidth, maxWidth]
    - resolve() is idempotent: same columns + viewport width + measurements => same layout */
class ColumnLayoutEngine
{
public:
    ColumnLayout resolve(const std::vector<ColumnModel>& columns, int viewportWidth, const ThemeProvider& theme) const;

    //Auto columns: content width (text only, without padding) measured over the currently bound rows
    void setMeasuredContentWidth(const std::wstring& columnId, int contentWidth);
    bool isMeasured(const std::wstring& columnId) const { return measuredWidths_.contains(columnId); }
    void resetMeasurement(const std::wstring& columnId) { measuredWidths_.erase(columnId); }
    void resetAllMeasurements() { measuredWidths_.clear(); }

    bool needsMeasurement(const std::vector<ColumnModel>& columns) const; //any visible Auto column not measured yet

private:
    std::unordered_map<std::wstring, int> measuredWidths_;
};

//distribute "availableWidth" proportionally to "weights"; remainder pixels go to the first columns
std::vector<int> getStretchedWidths(int availableWidth, const std::vector<double>& weights);
}

#endif //COLUMN_LAYOUT_H_5601928374019283
