// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "column_layout.h"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <numeric>

using namespace dgrid;


std::vector<int> dgrid::getStretchedWidths(int availableWidth, const std::vector<double>& weights)
{
    assert(availableWidth >= 0);
    availableWidth = std::max(availableWidth, 0);

    double weightTotal = 0;
    for (const double w : weights)
    {
        assert(w > 0);
        weightTotal += w;
    }

    std::vector<int> output;
    if (weightTotal <= 0)
    {
        output.resize(weights.size()); //fill with zeros
        return output;
    }

    int remainingWidth = availableWidth;
    for (const double w : weights)
    {
        const int width = static_cast<int>(std::floor(availableWidth * w / weightTotal)); //rounds down!
        output.push_back(width);
        remainingWidth -= width;
    }

    //distribute *all* of availableWidth: should suffice to enlarge the first few columns; no need to minimize total absolute error of distribution
    for (size_t i = 0; remainingWidth > 0 && i < output.size(); ++i)
    {
        ++output[i];
        --remainingWidth;
    }
    assert(remainingWidth == 0);
    return output;
}


void ColumnLayoutEngine::setMeasuredContentWidth(const std::wstring& columnId, int contentWidth)
{
    measuredWidths_[columnId] = std::max(contentWidth, 0);
}


bool ColumnLayoutEngine::needsMeasurement(const std::vector<ColumnModel>& columns) const
{
    return std::any_of(columns.begin(), columns.end(), [&](const ColumnModel& col)
    {
        return col.visible && col.sizing.policy == SizingPolicy::autoSize && !isMeasured(col.id);
    });
}


ColumnLayout ColumnLayoutEngine::resolve(const std::vector<ColumnModel>& columns, int viewportWidth, const ThemeProvider& theme) const
{
    viewportWidth = std::max(viewportWidth, 0);
    const int padding = 2 * std::max(theme.getCellPadding(), 0);

    ColumnLayout layout;
    layout.viewportWidth = viewportWidth;

    std::vector<ColumnSizing> sizings;
    std::vector<size_t> fillCols; //positions in layout.widths
    int nonFillTotal = 0;

    for (const ColumnModel& col : columns)
        if (col.visible)
        {
            const ColumnSizing sz = normalizeSizing(col.sizing);
            const size_t pos = layout.widths.size();
            int width = 0;

            switch (sz.policy)
            {
                case SizingPolicy::fixed:
                    width = sz.fixedWidth ? *sz.fixedWidth : sz.minWidth;
                    break;

                case SizingPolicy::fitHeader:
                    width = theme.getTextWidth(col.header) + padding;
                    break;

                case SizingPolicy::autoSize:
                {
                    int contentWidth = theme.getTextWidth(col.header); //provisional until first measurement pass
                    if (auto it = measuredWidths_.find(col.id); it != measuredWidths_.end())
                        contentWidth = std::max(contentWidth, it->second);
                    width = contentWidth + padding;
                }
                break;

                case SizingPolicy::fill:
                    fillCols.push_back(pos);
                    break;
            }

            if (sz.policy != SizingPolicy::fill)
            {
                width = std::clamp(width, sz.minWidth, sz.maxWidth);
                nonFillTotal += width;
            }
            layout.widths.push_back({col.id, width});
            sizings.push_back(sz);
        }

    //------------------------------------------------------------------
    if (!fillCols.empty())
    {
        const int remainingWidth = viewportWidth - nonFillTotal;

        int fillMinTotal = 0;
        for (const size_t pos : fillCols)
            fillMinTotal += sizings[pos].minWidth;

        if (remainingWidth < fillMinTotal) //columns request more than available
        {
            for (const size_t pos : fillCols)
                layout.widths[pos].width = sizings[pos].minWidth;
            layout.overflow = true;
        }
        else
        {
            //columns hitting minWidth/maxWidth drop out; the rest share what is left
            std::vector<size_t> openCols = fillCols;
            int budget = remainingWidth;

            while (!openCols.empty())
            {
                std::vector<double> weights;
                for (const size_t pos : openCols)
                    weights.push_back(sizings[pos].fillWeight);

                const std::vector<int> stretched = getStretchedWidths(std::max(budget, 0), weights);

                std::vector<size_t> stillOpen;
                for (size_t i = 0; i < openCols.size(); ++i)
                {
                    const ColumnSizing& sz = sizings[openCols[i]];
                    const int width = std::clamp(stretched[i], sz.minWidth, sz.maxWidth);
                    layout.widths[openCols[i]].width = width;

                    if (width != stretched[i])
                        budget -= width; //fixed from now on
                    else
                        stillOpen.push_back(openCols[i]);
                }

                if (stillOpen.size() == openCols.size()) //no clamping: distribution is final
                    break;
                openCols.swap(stillOpen);
            }
        }
    }

    for (const ColumnWidth& cw : layout.widths)
        layout.totalWidth += cw.width;

    if (layout.totalWidth > viewportWidth)
        layout.overflow = true;

    return layout;
}
