// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "view_pipeline.h"
#include <algorithm>
#include <cassert>
#include <unordered_map>
#include "string_tools.h"

using namespace dgrid;


bool ColumnFilter::accepts(const CellValue& value) const //throw X
{
    if (acceptedValues && !acceptedValues->contains(value))
        return false;

    if (predicate && !predicate(value)) //throw X
        return false;

    if (!searchText.empty() && !containsNoCase(formatCellValue(value), searchText))
        return false;

    return true;
}


namespace
{
using FetchedValue = std::optional<CellValue>; //std::nullopt: getter failed => value absent


FetchedValue fetchValue(const ColumnModel& col, const void* item, size_t& faultCount)
{
    try
    {
        return col.getter(item); //throw X
    }
    catch (const std::exception&)
    {
        ++faultCount;
        return std::nullopt;
    }
}


struct ActiveFilter
{
    const ColumnModel*  col    = nullptr;
    const ColumnFilter* filter = nullptr;
};

std::vector<ActiveFilter> getActiveFilters(const PipelineInput& input, const std::wstring* ignoreColumnId) //throw GridError
{
    std::vector<ActiveFilter> output;
    for (const auto& [columnId, filter] : input.filter)
        if (filter.isActive() && (!ignoreColumnId || columnId != *ignoreColumnId))
            output.push_back({&getColumn(*input.columns, columnId), &filter}); //throw GridError
    return output;
}


//conjunction across columns; absent values fail no filter
bool passesFilters(const std::vector<ActiveFilter>& filters, const void* item, size_t& faultCount)
{
    for (const ActiveFilter& af : filters)
        if (const FetchedValue value = fetchValue(*af.col, item, faultCount))
        {
            try
            {
                if (!af.filter->accepts(*value)) //throw X
                    return false;
            }
            catch (const std::exception&) { ++faultCount; } //failing host predicate: treat like an absent value
        }
    return true;
}


struct SortColumn
{
    const ColumnModel* col = nullptr;
    bool ascending = true;
};


struct Candidate
{
    std::shared_ptr<void> item;
    std::vector<FetchedValue> sortValues; //one per SortColumn
};


class LessCandidate
{
public:
    LessCandidate(const std::vector<SortColumn>& sortCols, NullOrder nullOrder) : sortCols_(sortCols), nullOrder_(nullOrder) {}

    bool operator()(const Candidate& lhs, const Candidate& rhs) const
    {
        for (size_t i = 0; i < sortCols_.size(); ++i)
        {
            const FetchedValue& valL = lhs.sortValues[i];
            const FetchedValue& valR = rhs.sortValues[i];

            //absent values always last
            if (!valL || !valR)
            {
                if (!valL && !valR)
                    continue;
                return static_cast<bool>(valL);
            }

            //nulls first or last, independent from sort direction
            const bool nullL = isNull(*valL);
            const bool nullR = isNull(*valR);
            if (nullL || nullR)
            {
                if (nullL && nullR)
                    continue;
                return compareCellValues(*valL, *valR, nullOrder_) < 0;
            }

            const std::weak_ordering cmp = sortCols_[i].ascending ?
                                           compareCellValues(*valL, *valR) :
                                           compareCellValues(*valR, *valL);
            if (cmp != std::weak_ordering::equivalent)
                return cmp < 0;
        }
        return false;
    }

private:
    const std::vector<SortColumn>& sortCols_;
    const NullOrder nullOrder_;
};


struct Group
{
    CellValue key;
    std::vector<Candidate> members;
};
}


ViewSequence dgrid::rebuildView(const PipelineInput& input, ViewStats* stats) //throw GridError
{
    ViewStats st;
    ViewSequence output;

    if (!input.source || !input.columns)
    {
        if (stats) *stats = st;
        return output;
    }
    const std::vector<ColumnModel>& columns = *input.columns;

    //resolve column ids up front: fail before touching any item
    const std::vector<ActiveFilter> filters = getActiveFilters(input, nullptr); //throw GridError

    std::vector<SortColumn> sortCols;
    for (const SortKey& key : input.sort)
        sortCols.push_back({&getColumn(columns, key.columnId), key.direction == SortDirection::ascending}); //throw GridError

    const ColumnModel* groupCol = input.group ? &getColumn(columns, *input.group) : nullptr; //throw GridError

    //-------------------------------------------------------------------
    std::vector<Group> groups;
    std::unordered_map<CellValue, size_t> groupIndex; //first-seen order => position in "groups"
    if (!groupCol)
        groups.emplace_back();

    st.sourceItems = input.source->size();

    for (size_t pos = 0; pos < st.sourceItems; ++pos)
    {
        std::shared_ptr<void> item = input.source->getItem(pos);
        assert(item);
        if (!item)
            continue;

        if (!passesFilters(filters, item.get(), st.getterFaults))
        {
            ++st.filteredOut;
            continue;
        }

        Candidate cand;
        cand.item = std::move(item);
        for (const SortColumn& sc : sortCols)
            cand.sortValues.push_back(fetchValue(*sc.col, cand.item.get(), st.getterFaults));

        if (groupCol)
        {
            CellValue key = fetchValue(*groupCol, cand.item.get(), st.getterFaults).value_or(CellValue()); //absent => null group

            const auto [it, inserted] = groupIndex.emplace(key, groups.size());
            if (inserted)
                groups.push_back({std::move(key), {}});
            groups[it->second].members.push_back(std::move(cand));
        }
        else
            groups[0].members.push_back(std::move(cand));
    }

    //-------------------------------------------------------------------
    if (!sortCols.empty())
        for (Group& grp : groups)
            std::stable_sort(grp.members.begin(), grp.members.end(), LessCandidate(sortCols, input.nullOrder));

    for (Group& grp : groups)
    {
        if (groupCol && input.showGroupHeaders)
        {
            ViewRow header;
            header.kind = RowKind::groupHeader;
            header.groupKey = grp.key;
            header.groupItemCount = grp.members.size();
            output.push_back(std::move(header));
        }

        for (const Candidate& cand : grp.members)
            output.push_back({RowKind::item, cand.item, CellValue(), 0});

        st.itemRows += grp.members.size();
    }
    st.groupCount = groupCol ? groups.size() : 0;

    if (stats) *stats = st;
    return output;
}


std::vector<CellValue> dgrid::getFilterCandidates(const PipelineInput& input, const std::wstring& columnId) //throw GridError
{
    if (!input.source || !input.columns)
        return {};

    const ColumnModel& col = getColumn(*input.columns, columnId); //throw GridError
    const std::vector<ActiveFilter> otherFilters = getActiveFilters(input, &columnId); //throw GridError

    size_t faultCount = 0;
    std::unordered_set<CellValue> seen;
    std::vector<CellValue> output;

    const size_t itemCount = input.source->size();
    for (size_t pos = 0; pos < itemCount; ++pos)
        if (const std::shared_ptr<void> item = input.source->getItem(pos))
            if (passesFilters(otherFilters, item.get(), faultCount))
                if (FetchedValue value = fetchValue(col, item.get(), faultCount))
                    if (seen.insert(*value).second)
                        output.push_back(std::move(*value));

    std::stable_sort(output.begin(), output.end(), [nullOrder = input.nullOrder](const CellValue& lhs, const CellValue& rhs)
    {
        return compareCellValues(lhs, rhs, nullOrder) < 0;
    });
    return output;
}
