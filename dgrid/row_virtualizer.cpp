// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "row_virtualizer.h"
#include <algorithm>
#include "basic_math.h"
#include "grid_error.h"
#include "scope_guard.h"

using namespace dgrid;


namespace
{
bool sameItem(const std::weak_ptr<void>& lhs, const std::weak_ptr<void>& rhs)
{
    return !lhs.owner_before(rhs) && !rhs.owner_before(lhs); //identity, even after expiry; never dereferenced
}
}


RowVirtualizer::RowVirtualizer(int rowHeight, size_t bufferRows, bool enabled, const RowVirtualizerCallbacks& callbacks) :
    rowHeight_(std::max(rowHeight, 1)),
    bufferRows_(bufferRows),
    enabled_(enabled),
    callbacks_(callbacks)
{
}


template <class Function>
void RowVirtualizer::runBatch(Function fun)
{
    ++layoutSuspendCount_;
    {
        DGRID_ON_SCOPE_EXIT(--layoutSuspendCount_);
        fun(); //throw X
    }

    if (layoutSuspendCount_ == 0 && layoutDirty_)
    {
        layoutDirty_ = false;
        ++layoutPassCount_;
        if (callbacks_.onLayoutPass)
            callbacks_.onLayoutPass();
    }
}


void RowVirtualizer::setSequence(std::span<const ViewRow> rows)
{
    runBatch([&]
    {
        rows_ = rows;
        updateWindow();

        //rows still in range: same index, but possibly a different item after the rebuild
        for (const std::unique_ptr<RowContainer>& row : pool_)
            if (row->boundIndex_ && *row->boundIndex_ < rows_.size())
            {
                const size_t index = *row->boundIndex_;
                const ViewRow& vr = rows_[index];

                if (vr.kind != row->kind_ || !sameItem(vr.item, row->item_) ||
                    (vr.isGroupHeader() && (vr.groupKey != row->groupKey_ || vr.groupItemCount != row->groupItemCount_)))
                {
                    if (callbacks_.onBeforeUnbind)
                        callbacks_.onBeforeUnbind(*row, index);
                    bind(*row, index);
                }
                else
                    refreshContent(*row); //same item: values may have changed nevertheless
                layoutDirty_ = true;
            }

        reconcile();
    });
}


void RowVirtualizer::resetSequence(std::span<const ViewRow> rows)
{
    runBatch([&]
    {
        for (const std::unique_ptr<RowContainer>& row : pool_)
            if (row->isBound())
            {
                unbind(*row);
                layoutDirty_ = true;
            }

        rows_ = rows;
        scrollOffset_ = 0;
        updateWindow();
        reconcile();
    });
}


void RowVirtualizer::setColumns(const std::vector<RowColumn>& columns)
{
    columns_ = columns;
    widths_.resize(columns_.size()); //until next applyColumnWidths()

    runBatch([&]
    {
        for (const std::unique_ptr<RowContainer>& row : pool_)
            if (row->isBound())
            {
                refreshContent(*row);
                layoutDirty_ = true;
            }
    });
}


void RowVirtualizer::applyColumnWidths(const std::vector<int>& widths)
{
    DGRID_CONTRACT_CHECK(widths.size() == columns_.size());
    widths_ = widths;

    runBatch([&]
    {
        //width is virtualizer-owned state: no container keeps a stale copy, bound or pooled
        for (const std::unique_ptr<RowContainer>& row : pool_)
            if (row->cellWidths_ != widths_)
            {
                row->cellWidths_ = widths_;
                layoutDirty_ |= row->isBound();
            }
    });
}


void RowVirtualizer::onViewportChanged(int scrollOffset, int viewportHeight)
{
    runBatch([&]
    {
        viewportHeight_ = std::max(viewportHeight, 0);
        scrollOffset_   = scrollOffset;
        updateWindow();
        reconcile();
    });
}


void RowVirtualizer::refreshRow(size_t index)
{
    for (const std::unique_ptr<RowContainer>& row : pool_)
        if (row->boundIndex_ == index)
        {
            runBatch([&]
            {
                refreshContent(*row);
                layoutDirty_ = true;
            });
            return;
        }
}


int RowVirtualizer::clampScrollOffset(int scrollOffset) const
{
    const int maxOffset = std::max(getContentHeight() - viewportHeight_, 0);
    return std::clamp(scrollOffset, 0, maxOffset);
}


int RowVirtualizer::getScrollOffsetForRow(size_t index) const
{
    if (index >= rows_.size())
        return scrollOffset_;

    const int rowTop    = static_cast<int>(index) * rowHeight_;
    const int rowBottom = rowTop + rowHeight_;

    int offset = scrollOffset_;
    if (rowTop < scrollOffset_)
        offset = rowTop;
    else if (rowBottom > scrollOffset_ + viewportHeight_)
        offset = rowBottom - viewportHeight_;

    return clampScrollOffset(offset);
}


size_t RowVirtualizer::getPoolCapacity() const
{
    if (!enabled_)
        return rows_.size();
    return viewportRowCount_ + 2 * bufferRows_; //independent from the sequence length
}


void RowVirtualizer::updateWindow()
{
    if (!enabled_)
    {
        scrollOffset_ = clampScrollOffset(scrollOffset_);
        window_ = {0, rows_.size(), 0};
        return;
    }

    //+1: partially visible rows at top and bottom
    viewportRowCount_ = viewportHeight_ > 0 ? numeric::intDivCeil(viewportHeight_, rowHeight_) + 1 : 0;

    scrollOffset_ = clampScrollOffset(scrollOffset_);

    //clamped at the end: startIndex + visibleCount + bufferPerSide <= sequence length
    window_.startIndex    = std::min(static_cast<size_t>(scrollOffset_ / rowHeight_), rows_.empty() ? 0 : rows_.size() - 1);
    window_.visibleCount  = std::min(viewportRowCount_, rows_.size() - std::min(window_.startIndex, rows_.size()));
    window_.bufferPerSide = std::min(bufferRows_, rows_.size() - std::min(window_.startIndex + window_.visibleCount, rows_.size()));
}


std::pair<size_t, size_t> RowVirtualizer::getDesiredRange() const
{
    if (!enabled_)
        return {0, rows_.size()};

    //leading buffer is clamped at the start only: window_.bufferPerSide may be trimmed by the end of the sequence
    const size_t first = window_.startIndex > bufferRows_ ? window_.startIndex - bufferRows_ : 0;
    const size_t last  = std::min(window_.startIndex + window_.visibleCount + window_.bufferPerSide, rows_.size());
    return {std::min(first, last), last};
}


const RowContainer* RowVirtualizer::findContainer(size_t index) const
{
    for (const std::unique_ptr<RowContainer>& row : pool_)
        if (row->boundIndex_ == index)
            return row.get();
    return nullptr;
}


void RowVirtualizer::reconcile()
{
    const auto [rangeFirst, rangeLast] = getDesiredRange();

    std::vector<char> covered(rangeLast - rangeFirst); //effectively a vector<bool>
    std::vector<RowContainer*> freeRows;

    for (const std::unique_ptr<RowContainer>& row : pool_)
        if (row->boundIndex_ && rangeFirst <= *row->boundIndex_ && *row->boundIndex_ < rangeLast && !covered[*row->boundIndex_ - rangeFirst])
            covered[*row->boundIndex_ - rangeFirst] = true;
        else
            freeRows.push_back(row.get()); //pooled or outside of the desired range

    size_t next = rangeFirst;
    auto skipCovered = [&] { while (next < rangeLast && covered[next - rangeFirst]) ++next; };

    //recycle: lowest uncovered index first
    for (RowContainer* row : freeRows)
    {
        skipCovered();
        if (next == rangeLast)
        {
            if (row->isBound())
            {
                unbind(*row);
                layoutDirty_ = true;
            }
        }
        else
        {
            bind(*row, next);
            covered[next - rangeFirst] = true;
            layoutDirty_ = true;
        }
    }

    //grow pool lazily up to capacity
    for (skipCovered(); next < rangeLast; skipCovered())
    {
        DGRID_CONTRACT_CHECK(pool_.size() < getPoolCapacity());

        pool_.push_back(std::unique_ptr<RowContainer>(new RowContainer(pool_.size())));
        RowContainer& row = *pool_.back();
        row.cellWidths_ = widths_;

        if (callbacks_.onContainerCreated)
            callbacks_.onContainerCreated(row); //once per lifetime

        bind(row, next);
        covered[next - rangeFirst] = true;
        layoutDirty_ = true;
    }

    checkInvariants(); //throw std::logic_error
}


void RowVirtualizer::bind(RowContainer& row, size_t index)
{
    DGRID_CONTRACT_CHECK(index < rows_.size());

    if (row.boundIndex_ && *row.boundIndex_ != index)
        if (callbacks_.onBeforeUnbind)
            callbacks_.onBeforeUnbind(row, *row.boundIndex_);

    const ViewRow& vr = rows_[index];
    row.boundIndex_     = index;
    row.kind_           = vr.kind;
    row.item_           = vr.item;
    row.groupKey_       = vr.groupKey;
    row.groupItemCount_ = vr.groupItemCount;
    ++row.bindCount_;

    refreshContent(row);
}


void RowVirtualizer::unbind(RowContainer& row)
{
    if (!row.boundIndex_)
        return;

    if (callbacks_.onBeforeUnbind)
        callbacks_.onBeforeUnbind(row, *row.boundIndex_);

    row.boundIndex_.reset();
    row.item_.reset();
    row.kind_ = RowKind::item;
    row.groupKey_ = CellValue();
    row.groupItemCount_ = 0;
}


void RowVirtualizer::refreshContent(RowContainer& row)
{
    row.cellWidths_ = widths_;

    if (row.isGroupHeader())
    {
        row.cellTexts_.clear();
        return;
    }

    row.cellTexts_.resize(columns_.size()); //keep existing strings: assignment reuses their buffers

    const std::shared_ptr<void> item = row.item_.lock(); //item may have expired since the last rebuild
    for (size_t col = 0; col < columns_.size(); ++col)
    {
        std::wstring& text = row.cellTexts_[col];
        text.clear();
        if (item)
        {
            try
            {
                text = formatCellValue(columns_[col].getter(item.get())); //throw X
            }
            catch (const std::exception&) {} //absent value: show empty cell; faults are reported by the pipeline
        }
    }
}


void RowVirtualizer::checkInvariants() const //throw std::logic_error
{
    DGRID_CONTRACT_CHECK(window_.startIndex + window_.visibleCount + window_.bufferPerSide <= rows_.size());

    const auto [rangeFirst, rangeLast] = getDesiredRange();
    std::vector<char> seen(rangeLast - rangeFirst);

    for (const std::unique_ptr<RowContainer>& row : pool_)
        if (row->boundIndex_)
        {
            const size_t index = *row->boundIndex_;
            DGRID_CONTRACT_CHECK(index < rows_.size());
            DGRID_CONTRACT_CHECK(rangeFirst <= index && index < rangeLast);
            DGRID_CONTRACT_CHECK(!seen[index - rangeFirst]);
            seen[index - rangeFirst] = true;
        }
}
