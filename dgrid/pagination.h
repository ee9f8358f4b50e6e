// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef PAGINATION_H_8123740981273401
#define PAGINATION_H_8123740981273401

#include <cstddef>


namespace dgrid
{
struct PageState
{
    size_t pageSize = 50; //> 0
    size_t currentPageIndex = 0;
};

struct PageSlice //half-open range [first, first + count) of the view sequence
{
    size_t first = 0;
    size_t count = 0;
    size_t pageCount = 1; //>= 1: an empty sequence still has one (empty) page
};

//ceil(|view sequence| / pageSize), minimum 1; pageIndex is clamped into [0, pageCount - 1]
PageSlice slicePage(size_t sequenceLength, const PageState& state);

size_t getPageCount(size_t sequenceLength, size_t pageSize);


class PaginationController
{
public:
    explicit PaginationController(size_t pageSize); //throw GridError

    size_t getPageSize   () const { return state_.pageSize; }
    size_t getCurrentPage() const { return state_.currentPageIndex; }
    size_t getPageCount  () const { return dgrid::getPageCount(sequenceLength_, state_.pageSize); }
    size_t getSequenceLength() const { return sequenceLength_; }

    PageSlice getSlice() const { return slicePage(sequenceLength_, state_); }

    //all return "true" if the current page index changed
    bool setPageSize(size_t pageSize); //throw GridError; keeps the first row of the current page visible
    bool setSequenceLength(size_t len); //clamp current page after the view sequence shrinks
    bool goToPage(size_t pageIndex);    //clamped
    bool nextPage    () { return goToPage(state_.currentPageIndex + 1); }
    bool previousPage() { return state_.currentPageIndex > 0 && goToPage(state_.currentPageIndex - 1); }
    bool firstPage   () { return goToPage(0); }
    bool lastPage    () { return goToPage(getPageCount() - 1); }

private:
    PageState state_;
    size_t sequenceLength_ = 0;
};
}

#endif //PAGINATION_H_8123740981273401
