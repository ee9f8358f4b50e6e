// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include <algorithm>
#include <limits>
#include <unordered_set>
#include <dgrid/cell_value.h>

using namespace dgrid;


TEST(cell_value, NullIsHashableFilterKey)
{
    std::unordered_set<CellValue> accepted{CellValue(), CellValue(std::wstring(L"Active"))};

    EXPECT_TRUE(accepted.contains(CellValue()));
    EXPECT_TRUE(accepted.contains(CellValue(std::wstring(L"Active"))));
    EXPECT_FALSE(accepted.contains(CellValue(std::wstring(L""))));
    EXPECT_NE(CellValue(), CellValue(std::wstring(L"")));
}


TEST(cell_value, NumbersCompareAcrossTypes)
{
    EXPECT_EQ(compareCellValues(CellValue(int64_t(2)), CellValue(2.5)), std::weak_ordering::less);
    EXPECT_EQ(compareCellValues(CellValue(3.0), CellValue(int64_t(3))), std::weak_ordering::equivalent);
    EXPECT_EQ(compareCellValues(CellValue(true), CellValue(int64_t(0))), std::weak_ordering::greater);

    //numbers before text
    EXPECT_EQ(compareCellValues(CellValue(int64_t(100)), CellValue(std::wstring(L"1"))), std::weak_ordering::less);
}


TEST(cell_value, LargeIntegersKeepPrecision)
{
    const int64_t big = (int64_t(1) << 60);
    EXPECT_EQ(compareCellValues(CellValue(big), CellValue(big + 1)), std::weak_ordering::less);
}


TEST(cell_value, IntegerVersusDoubleIsExact)
{
    const int64_t p53 = int64_t(1) << 53;
    const CellValue above = p53 + 1;
    const CellValue exact = p53;
    const CellValue dbl   = static_cast<double>(p53);

    //equivalence stays transitive: above > exact == dbl  =>  above > dbl
    EXPECT_EQ(compareCellValues(exact, dbl),   std::weak_ordering::equivalent);
    EXPECT_EQ(compareCellValues(above, exact), std::weak_ordering::greater);
    EXPECT_EQ(compareCellValues(above, dbl),   std::weak_ordering::greater);
    EXPECT_EQ(compareCellValues(dbl, above),   std::weak_ordering::less);

    EXPECT_EQ(compareCellValues(CellValue(int64_t(-1)), CellValue(-1.5)), std::weak_ordering::greater);
    EXPECT_EQ(compareCellValues(CellValue(int64_t(2)),  CellValue(2.25)), std::weak_ordering::less);
    EXPECT_EQ(compareCellValues(CellValue(true),        CellValue(1.0)),  std::weak_ordering::equivalent);
    EXPECT_EQ(compareCellValues(CellValue(std::numeric_limits<int64_t>::max()), CellValue(1e19)), std::weak_ordering::less);
    EXPECT_EQ(compareCellValues(CellValue(std::numeric_limits<double>::quiet_NaN()), CellValue(int64_t(0))), std::weak_ordering::greater);
}


TEST(cell_value, NullOrderIndependentFromValue)
{
    const CellValue null;
    const CellValue one = int64_t(1);

    EXPECT_EQ(compareCellValues(null, one, NullOrder::last),  std::weak_ordering::greater);
    EXPECT_EQ(compareCellValues(null, one, NullOrder::first), std::weak_ordering::less);
    EXPECT_EQ(compareCellValues(null, null, NullOrder::last), std::weak_ordering::equivalent);
}


TEST(cell_value, NaturalOrder)
{
    EXPECT_EQ(compareNatural(L"row 2", L"Row 10"), std::weak_ordering::less);
    EXPECT_EQ(compareNatural(L"ABC", L"abc"), std::weak_ordering::equivalent);
    EXPECT_EQ(compareNatural(L"a  b", L"a b"), std::weak_ordering::equivalent);
    EXPECT_EQ(compareNatural(L"file007", L"file7"), std::weak_ordering::equivalent);
    EXPECT_EQ(compareNatural(L"", L"a"), std::weak_ordering::less);

    std::vector<std::wstring> names{L"item10", L"Item2", L"item1", L"item 3"};
    std::sort(names.begin(), names.end(), [](const std::wstring& lhs, const std::wstring& rhs) { return compareNatural(lhs, rhs) < 0; });
    EXPECT_EQ(names, (std::vector<std::wstring>{L"item 3", L"item1", L"Item2", L"item10"}));
}


TEST(cell_value, Format)
{
    EXPECT_EQ(formatCellValue(CellValue()), L"");
    EXPECT_EQ(formatCellValue(CellValue(true)), L"true");
    EXPECT_EQ(formatCellValue(CellValue(int64_t(-42))), L"-42");
    EXPECT_EQ(formatCellValue(CellValue(2.5)), L"2.5");
    EXPECT_EQ(formatCellValue(CellValue(1.0)), L"1");
    EXPECT_EQ(formatCellValue(CellValue(3.14159265)), L"3.14159");
    EXPECT_EQ(formatCellValue(CellValue(std::wstring(L"text"))), L"text");
}


TEST(cell_value, ParseUsesTypeHint)
{
    EXPECT_EQ(parseCellValue(L" 42 ", CellValue(int64_t(0))), CellValue(int64_t(42)));
    EXPECT_EQ(parseCellValue(L"1.5", CellValue(0.0)), CellValue(1.5));
    EXPECT_EQ(parseCellValue(L"TRUE", CellValue(false)), CellValue(true));
    EXPECT_EQ(parseCellValue(L"0", CellValue(true)), CellValue(false));

    //text is kept verbatim, including whitespace
    EXPECT_EQ(parseCellValue(L" a ", CellValue(std::wstring())), CellValue(std::wstring(L" a ")));

    //blank input clears a non-text cell
    EXPECT_EQ(parseCellValue(L"  ", CellValue(int64_t(7))), CellValue());

    //null hint: type unknown
    EXPECT_EQ(parseCellValue(L" x ", CellValue()), CellValue(std::wstring(L"x")));
}


TEST(cell_value, ParseRejectsInvalidNumbers)
{
    EXPECT_FALSE(parseCellValue(L"12abc", CellValue(int64_t(0))));
    EXPECT_FALSE(parseCellValue(L"1.5", CellValue(int64_t(0))));
    EXPECT_FALSE(parseCellValue(L"abc", CellValue(0.0)));
    EXPECT_FALSE(parseCellValue(L"yes", CellValue(true)));
}
