// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef GRID_EVENTS_H_6602918374019283
#define GRID_EVENTS_H_6602918374019283

#include "cell_edit.h"


namespace dgrid
{
//outward notifications: observation only, a sink cannot veto
struct GridEventSink
{
    virtual ~GridEventSink() {}

    virtual void onSortChanged     (const SortState& sort) {}
    virtual void onFilterChanged   (const std::wstring& columnId, const ColumnFilter* filter /*nullptr: removed*/) {}
    virtual void onPageChanged     (size_t oldPage, size_t newPage, size_t pageSize, size_t totalRows) {} //effective rows replaced: oldPage == newPage after a page size change or paging on/off
    virtual void onEditCommitted   (const EditCommit& commit) {}
    virtual void onEditRefused     (const std::wstring& columnId, const std::wstring& message) {} //validation or setter failure: session stays open
    virtual void onEditCancelled   (const EditSession& session, bool forced /*row container was recycled*/) {}
    virtual void onSelectionChanged(const std::vector<size_t>& rows) {}
    virtual void onLayoutOverflow  (int totalWidth, int viewportWidth) {}
    virtual void onViewRebuilt     (const ViewStats& stats) {}
};
}

#endif //GRID_EVENTS_H_6602918374019283
