// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef VIEW_PIPELINE_H_7012938471092384
#define VIEW_PIPELINE_H_7012938471092384

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <unordered_set>
#include <vector>
#include "column.h"
#include "item_source.h"


namespace dgrid
{
enum class SortDirection
{
    ascending,
    descending,
};

struct SortKey
{
    std::wstring columnId;
    SortDirection direction = SortDirection::ascending;

    bool operator==(const SortKey&) const = default;
};
using SortState = std::vector<SortKey>; //empty: source order; size 1: single-column sort


struct ColumnFilter //active parts combine by conjunction
{
    std::optional<std::unordered_set<CellValue>> acceptedValues; //may contain null; empty set accepts nothing
    std::function<bool(const CellValue& value)> predicate;
    std::wstring searchText; //case-insensitive substring of formatCellValue()

    bool isActive() const { return acceptedValues || predicate || !searchText.empty(); }
    bool accepts(const CellValue& value) const; //throw X (predicate)
};
using FilterState = std::map<std::wstring /*columnId*/, ColumnFilter>;

using GroupState = std::optional<std::wstring /*columnId*/>;


enum class RowKind
{
    item,
    groupHeader,
};

struct ViewRow
{
    RowKind kind = RowKind::item;
    std::weak_ptr<void> item; //RowKind::item: weak reference, never owning

    CellValue groupKey;         //RowKind::groupHeader
    size_t groupItemCount = 0;  //

    bool isGroupHeader() const { return kind == RowKind::groupHeader; }
};
using ViewSequence = std::vector<ViewRow>;


struct ViewStats
{
    size_t sourceItems   = 0;
    size_t filteredOut   = 0;
    size_t itemRows      = 0;
    size_t groupCount    = 0;
    size_t getterFaults  = 0; //contained: value treated as absent
};


struct PipelineInput
{
    const ItemSource* source = nullptr; //nullptr: empty
    const std::vector<ColumnModel>* columns = nullptr;
    SortState   sort;
    FilterState filter;
    GroupState  group;
    NullOrder nullOrder = NullOrder::last;
    bool showGroupHeaders = true;
};

/*  filter -> group (first-seen order) -> stable sort per group -> flatten

    - pure function of its input: no hidden state
    - getter faults: value is absent => passes every filter, sorts last, grouped under null */
ViewSequence rebuildView(const PipelineInput& input, ViewStats* stats = nullptr); //throw GridError (unknown column id)

//distinct values of "columnId" over items passing every *other* active filter; does not mutate the filter state
//ordered by compareCellValues() with NullOrder applied
std::vector<CellValue> getFilterCandidates(const PipelineInput& input, const std::wstring& columnId); //throw GridError
}

#endif //VIEW_PIPELINE_H_7012938471092384
