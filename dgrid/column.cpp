// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "column.h"
#include <algorithm>
#include <unordered_set>
#include "i18n.h"

using namespace dgrid;


void dgrid::validateColumn(const ColumnModel& col) //throw GridError
{
    if (col.id.empty())
        throw GridError(_("Column identifier must not be empty."));

    if (!col.getter)
        throw GridError(replaceCpy(_("Column %x has no value accessor."), L"%x", fmtColumn(col.id)));

    if (col.editable && !col.setter)
        throw GridError(replaceCpy(_("Column %x is editable but has no value setter."), L"%x", fmtColumn(col.id)));

    if (col.sizing.policy == SizingPolicy::fixed && !col.sizing.fixedWidth)
        throw GridError(replaceCpy(_("Column %x has fixed sizing but no width."), L"%x", fmtColumn(col.id)));

    if (col.sizing.policy == SizingPolicy::fill && !(col.sizing.fillWeight > 0))
        throw GridError(replaceCpy(_("Column %x has an invalid fill weight."), L"%x", fmtColumn(col.id)),
                        replaceCpy(L"fillWeight: %x", L"%x", numberTo<std::wstring>(col.sizing.fillWeight)));
}


void dgrid::validateColumns(const std::vector<ColumnModel>& columns) //throw GridError
{
    std::unordered_set<std::wstring> ids;
    for (const ColumnModel& col : columns)
    {
        validateColumn(col); //throw GridError

        if (!ids.insert(col.id).second)
            throw GridError(replaceCpy(_("Duplicate column identifier %x."), L"%x", fmtColumn(col.id)));
    }
}


ColumnSizing dgrid::normalizeSizing(ColumnSizing sizing)
{
    sizing.minWidth = std::max(sizing.minWidth, 0);
    sizing.maxWidth = std::max(sizing.maxWidth, sizing.minWidth); //minimum wins
    if (sizing.fixedWidth)
        sizing.fixedWidth = std::max(*sizing.fixedWidth, 0);
    if (!(sizing.fillWeight > 0))
        sizing.fillWeight = 1;
    return sizing;
}


const ColumnModel* dgrid::findColumn(const std::vector<ColumnModel>& columns, const std::wstring& columnId)
{
    auto it = std::find_if(columns.begin(), columns.end(), [&](const ColumnModel& col) { return col.id == columnId; });
    return it != columns.end() ? &*it : nullptr;
}


const ColumnModel& dgrid::getColumn(const std::vector<ColumnModel>& columns, const std::wstring& columnId) //throw GridError
{
    if (const ColumnModel* col = findColumn(columns, columnId))
        return *col;
    throw GridError(replaceCpy(_("Column %x not found."), L"%x", fmtColumn(columnId)));
}
