// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include <dgrid/column_layout.h>
#include "test_tools.h"

using namespace dgrid;
using namespace dgrid::test;


namespace
{
ColumnModel makeSizedColumn(const std::wstring& id, const std::wstring& header, SizingPolicy policy)
{
    ColumnModel col = makeColumn<Person>(id, header, [](const Person& p) { return CellValue(p.name); });
    col.sizing.policy = policy;
    col.sizing.minWidth = 0;
    return col;
}


std::vector<ColumnModel> getMixedColumns()
{
    std::vector<ColumnModel> cols;
    cols.push_back(makeSizedColumn(L"fixed", L"Fixed", SizingPolicy::fixed));
    cols.back().sizing.fixedWidth = 100;
    cols.push_back(makeSizedColumn(L"header", L"Status", SizingPolicy::fitHeader)); //6 chars
    cols.push_back(makeSizedColumn(L"auto", L"Name", SizingPolicy::autoSize));      //4 chars
    cols.push_back(makeSizedColumn(L"fill1", L"A", SizingPolicy::fill));
    cols.push_back(makeSizedColumn(L"fill3", L"B", SizingPolicy::fill));
    cols.back().sizing.fillWeight = 3;
    return cols;
}


int getWidth(const ColumnLayout& layout, const std::wstring& columnId)
{
    for (const ColumnWidth& cw : layout.widths)
        if (cw.columnId == columnId)
            return cw.width;
    return -1;
}
}


TEST(column_layout, StretchedWidthsDistributeRemainder)
{
    EXPECT_EQ(getStretchedWidths(10, {1, 1, 1}), (std::vector<int>{4, 3, 3}));
    EXPECT_EQ(getStretchedWidths(100, {1, 3}), (std::vector<int>{25, 75}));
    EXPECT_EQ(getStretchedWidths(0, {1, 1}), (std::vector<int>{0, 0}));
}


TEST(column_layout, WidthsAddUpToViewport)
{
    const FixedWidthTheme theme;
    const ColumnLayoutEngine engine;

    const ColumnLayout layout = engine.resolve(getMixedColumns(), 600, theme);

    EXPECT_EQ(getWidth(layout, L"fixed"),  100);
    EXPECT_EQ(getWidth(layout, L"header"),  60);
    EXPECT_EQ(getWidth(layout, L"auto"),    40); //provisional: header width
    EXPECT_EQ(getWidth(layout, L"fill1"),  100);
    EXPECT_EQ(getWidth(layout, L"fill3"),  300);
    EXPECT_EQ(layout.totalWidth, 600);
    EXPECT_FALSE(layout.overflow);
}


TEST(column_layout, AutoColumnUsesMeasuredContent)
{
    const FixedWidthTheme theme;
    ColumnLayoutEngine engine;
    const std::vector<ColumnModel> cols = getMixedColumns();

    EXPECT_TRUE(engine.needsMeasurement(cols));
    engine.setMeasuredContentWidth(L"auto", 120);
    EXPECT_FALSE(engine.needsMeasurement(cols));

    const ColumnLayout layout = engine.resolve(cols, 600, theme);
    EXPECT_EQ(getWidth(layout, L"auto"), 120);
    EXPECT_EQ(layout.totalWidth, 600); //Fill columns absorb the difference

    //narrower content than the header: header wins
    engine.setMeasuredContentWidth(L"auto", 10);
    EXPECT_EQ(getWidth(engine.resolve(cols, 600, theme), L"auto"), 40);
}


TEST(column_layout, PaddingIsAddedPerSide)
{
    FixedWidthTheme theme;
    theme.padding = 4;

    const ColumnLayout layout = ColumnLayoutEngine().resolve(getMixedColumns(), 600, theme);
    EXPECT_EQ(getWidth(layout, L"header"), 68);
    EXPECT_EQ(getWidth(layout, L"fixed"), 100); //declared width is final
}


TEST(column_layout, FillColumnsOverflowAtMinWidth)
{
    const FixedWidthTheme theme;
    std::vector<ColumnModel> cols = getMixedColumns();
    cols[3].sizing.minWidth = 50;
    cols[4].sizing.minWidth = 50;

    const ColumnLayout layout = ColumnLayoutEngine().resolve(cols, 250, theme);

    EXPECT_EQ(getWidth(layout, L"fill1"), 50);
    EXPECT_EQ(getWidth(layout, L"fill3"), 50);
    EXPECT_EQ(layout.totalWidth, 300);
    EXPECT_TRUE(layout.overflow);
}


TEST(column_layout, ClampedFillColumnReleasesWidth)
{
    const FixedWidthTheme theme;
    std::vector<ColumnModel> cols;
    cols.push_back(makeSizedColumn(L"a", L"A", SizingPolicy::fill));
    cols.back().sizing.maxWidth = 100;
    cols.push_back(makeSizedColumn(L"b", L"B", SizingPolicy::fill));

    const ColumnLayout layout = ColumnLayoutEngine().resolve(cols, 500, theme);
    EXPECT_EQ(getWidth(layout, L"a"), 100);
    EXPECT_EQ(getWidth(layout, L"b"), 400);
    EXPECT_EQ(layout.totalWidth, 500);
}


TEST(column_layout, HiddenColumnsAreSkipped)
{
    const FixedWidthTheme theme;
    std::vector<ColumnModel> cols = getMixedColumns();
    cols[0].visible = false;

    const ColumnLayout layout = ColumnLayoutEngine().resolve(cols, 600, theme);
    EXPECT_EQ(layout.widths.size(), 4u);
    EXPECT_EQ(getWidth(layout, L"fixed"), -1);
    EXPECT_EQ(getWidth(layout, L"fill1"), 125);
    EXPECT_EQ(getWidth(layout, L"fill3"), 375);
}


TEST(column_layout, ResolveIsIdempotent)
{
    const FixedWidthTheme theme;
    ColumnLayoutEngine engine;
    engine.setMeasuredContentWidth(L"auto", 77);
    const std::vector<ColumnModel> cols = getMixedColumns();

    EXPECT_EQ(engine.resolve(cols, 613, theme), engine.resolve(cols, 613, theme));
}
