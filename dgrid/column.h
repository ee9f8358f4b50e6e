// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef COLUMN_H_1209384710928374
#define COLUMN_H_1209384710928374

#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include "cell_value.h"
#include "grid_error.h"


namespace dgrid
{
enum class SizingPolicy
{
    autoSize,  //content-based: provisional header width, refined after first measurement pass over visible rows
    fixed,     //declared width
    fitHeader, //header label width
    fill,      //share of remaining viewport width by weight
};

enum class AggregateType
{
    none,
    sum,
    average,
    count,
    min,
    max,
};

struct ValidationResult
{
    bool valid = true;
    std::wstring message; //shown to the user if !valid
};

using ValueGetter   = std::function<CellValue(const void* item)>;                               //throw X
using ValueSetter   = std::function<void(void* item, const CellValue& value)>;                  //throw X
using CellValidator = std::function<ValidationResult(const void* item, const CellValue& value)>;


const int COLUMN_MIN_WIDTH_DEFAULT = 50;

struct ColumnSizing //host-mutable at runtime; resolved pixel widths are owned by ColumnLayoutEngine
{
    SizingPolicy policy = SizingPolicy::autoSize;
    int minWidth = COLUMN_MIN_WIDTH_DEFAULT;
    int maxWidth = std::numeric_limits<int>::max();
    std::optional<int> fixedWidth; //required for SizingPolicy::fixed
    double fillWeight = 1; //SizingPolicy::fill only, > 0

    bool operator==(const ColumnSizing&) const = default;
};


struct ColumnModel
{
    std::wstring id; //unique
    std::wstring header;
    ColumnSizing sizing;

    bool sortable   = true;
    bool filterable = true;
    bool editable   = false;
    bool visible    = true;

    AggregateType aggregate = AggregateType::none;

    ValueGetter   getter;    //mandatory
    ValueSetter   setter;    //mandatory for editable columns
    CellValidator validator; //optional
};

void validateColumn (const ColumnModel& col);                  //throw GridError
void validateColumns(const std::vector<ColumnModel>& columns); //throw GridError

ColumnSizing normalizeSizing(ColumnSizing sizing); //maxWidth >= minWidth >= 0, weight > 0

const ColumnModel* findColumn(const std::vector<ColumnModel>& columns, const std::wstring& columnId); //nullptr if not found
const ColumnModel& getColumn (const std::vector<ColumnModel>& columns, const std::wstring& columnId); //throw GridError

//typed convenience for host code:
//      auto col = makeColumn<Customer>(L"name", _("Name"), [](const Customer& c) { return CellValue(c.name); });
template <class T, class Get>
ColumnModel makeColumn(const std::wstring& id, const std::wstring& header, Get getter);

template <class T, class Get, class Set>
ColumnModel makeEditableColumn(const std::wstring& id, const std::wstring& header, Get getter, Set setter);








//######################## implementation ########################
template <class T, class Get> inline
ColumnModel makeColumn(const std::wstring& id, const std::wstring& header, Get getter)
{
    ColumnModel col;
    col.id = id;
    col.header = header;
    col.getter = [getter = std::move(getter)](const void* item) -> CellValue { return getter(*static_cast<const T*>(item)); };
    return col;
}


template <class T, class Get, class Set> inline
ColumnModel makeEditableColumn(const std::wstring& id, const std::wstring& header, Get getter, Set setter)
{
    ColumnModel col = makeColumn<T>(id, header, std::move(getter));
    col.editable = true;
    col.setter = [setter = std::move(setter)](void* item, const CellValue& value) { setter(*static_cast<T*>(item), value); };
    return col;
}
}

#endif //COLUMN_H_1209384710928374
