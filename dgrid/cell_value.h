// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CELL_VALUE_H_3409817234098132
#define CELL_VALUE_H_3409817234098132

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>


namespace dgrid
{
/*  value exchanged with the host through column getters/setters

    - std::monostate is "null": a regular, hashable value that can be selected in a filter
    - std::hash<CellValue> and operator== are provided by std::variant        */
using CellValue = std::variant<std::monostate, bool, int64_t, double, std::wstring>;

enum class NullOrder
{
    first,
    last,
};

inline bool isNull(const CellValue& val) { return std::holds_alternative<std::monostate>(val); }

std::optional<double> getNumericValue(const CellValue& val); //bool, int64_t, double

//null < numbers < text; numbers compare by value across types, text uses natural order
std::weak_ordering compareCellValues(const CellValue& lhs, const CellValue& rhs);

//honor NullOrder independent from sort direction
std::weak_ordering compareCellValues(const CellValue& lhs, const CellValue& rhs, NullOrder nullOrder);

//case-insensitive, digit sequences compared as numbers, whitespace condensed: "row 2" < "Row 10"
std::weak_ordering compareNatural(std::wstring_view lhs, std::wstring_view rhs);

std::wstring formatCellValue(const CellValue& val); //null => empty string

//inverse of formatCellValue() for the alternative held by "typeHint": empty/blank text => null
//std::nullopt: text is not a valid number/bool
std::optional<CellValue> parseCellValue(const std::wstring& text, const CellValue& typeHint);
}

#endif //CELL_VALUE_H_3409817234098132
