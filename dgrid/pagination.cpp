// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "pagination.h"
#include <algorithm>
#include "basic_math.h"
#include "grid_error.h"
#include "i18n.h"

using namespace dgrid;


size_t dgrid::getPageCount(size_t sequenceLength, size_t pageSize)
{
    assert(pageSize > 0);
    if (pageSize == 0)
        return 1;
    return std::max<size_t>(numeric::intDivCeil(sequenceLength, pageSize), 1);
}


PageSlice dgrid::slicePage(size_t sequenceLength, const PageState& state)
{
    PageSlice slice;
    slice.pageCount = getPageCount(sequenceLength, state.pageSize);

    const size_t pageIndex = std::min(state.currentPageIndex, slice.pageCount - 1);
    slice.first = std::min(pageIndex * state.pageSize, sequenceLength);
    slice.count = std::min(state.pageSize, sequenceLength - slice.first);
    return slice;
}


PaginationController::PaginationController(size_t pageSize)
{
    if (pageSize == 0)
        throw GridError(_("Page size must be greater than zero."));
    state_.pageSize = pageSize;
}


bool PaginationController::setPageSize(size_t pageSize) //throw GridError
{
    if (pageSize == 0)
        throw GridError(_("Page size must be greater than zero."));

    const size_t firstRow = state_.currentPageIndex * state_.pageSize;
    state_.pageSize = pageSize;

    return goToPage(firstRow / pageSize);
}


bool PaginationController::setSequenceLength(size_t len)
{
    sequenceLength_ = len;
    return goToPage(state_.currentPageIndex);
}


bool PaginationController::goToPage(size_t pageIndex)
{
    const size_t pageIndexNew = std::min(pageIndex, getPageCount() - 1);
    if (pageIndexNew == state_.currentPageIndex)
        return false;

    state_.currentPageIndex = pageIndexNew;
    return true;
}
