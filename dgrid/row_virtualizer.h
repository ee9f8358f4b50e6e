// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ROW_VIRTUALIZER_H_2309184710923847
#define ROW_VIRTUALIZER_H_2309184710923847

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include "view_pipeline.h"


namespace dgrid
{
struct VirtualWindow //over the effective sequence: page slice if paging is active, else the full view sequence
{
    size_t startIndex    = 0;
    size_t visibleCount  = 0;
    size_t bufferPerSide = 0;

    bool operator==(const VirtualWindow&) const = default;
};


struct RowColumn //what a container needs to know about a visible column
{
    std::wstring columnId;
    ValueGetter getter;
};


//reusable visual slot: created lazily, destroyed only with the virtualizer; owned and mutated exclusively by RowVirtualizer
class RowContainer
{
public:
    size_t getSlot() const { return slot_; } //position in the pool, stable for the container's lifetime

    bool isBound() const { return boundIndex_.has_value(); }
    std::optional<size_t> getBoundIndex() const { return boundIndex_; } //index into the effective sequence

    RowKind getKind() const { return kind_; }
    bool isGroupHeader() const { return kind_ == RowKind::groupHeader; }
    const std::weak_ptr<void>& getItem() const { return item_; }
    const CellValue& getGroupKey() const { return groupKey_; }
    size_t getGroupItemCount() const { return groupItemCount_; }

    const std::vector<std::wstring>& getCellTexts () const { return cellTexts_; }  //per visible column; empty for group headers
    const std::vector<int>&          getCellWidths() const { return cellWidths_; } //

    size_t getBindCount() const { return bindCount_; } //number of (re-)bindings over the container's lifetime

private:
    explicit RowContainer(size_t slot) : slot_(slot) {}
    RowContainer           (const RowContainer&) = delete;
    RowContainer& operator=(const RowContainer&) = delete;

    friend class RowVirtualizer;

    const size_t slot_;
    std::optional<size_t> boundIndex_;

    RowKind kind_ = RowKind::item;
    std::weak_ptr<void> item_;
    CellValue groupKey_;
    size_t groupItemCount_ = 0;

    std::vector<std::wstring> cellTexts_;  //child "visual elements": overwritten in place, never recreated
    std::vector<int>          cellWidths_; //
    size_t bindCount_ = 0;
};


struct RowVirtualizerCallbacks
{
    std::function<void(RowContainer& row)> onContainerCreated; //attach interaction handlers: exactly once per container
    std::function<void(const RowContainer& row, size_t oldIndex)> onBeforeUnbind; //container leaves "oldIndex": force-cancel an edit held there
    std::function<void()> onLayoutPass; //one measure/arrange pass after each reconcile that changed bindings
};


/*  windowing over the effective sequence with a bounded pool of recycled RowContainers

    - pool capacity: visibleCount + 2 * bufferPerSide, independent of the sequence length
    - reconcile(): containers outside the desired range are rebound in place to the lowest uncovered desired index
    - virtualization disabled: every row of the effective sequence is bound                                     */
class RowVirtualizer
{
public:
    RowVirtualizer(int rowHeight, size_t bufferRows, bool enabled, const RowVirtualizerCallbacks& callbacks);

    void setSequence(std::span<const ViewRow> rows); //keeps the window (clamped), refreshes bound rows whose item changed
    void resetSequence(std::span<const ViewRow> rows); //page change: unbind everything, window back to the top
    void setColumns(const std::vector<RowColumn>& columns); //refresh cell content of all bound rows
    void applyColumnWidths(const std::vector<int>& widths); //push to *every* bound container

    void onViewportChanged(int scrollOffset, int viewportHeight); //recompute window + reconcile
    void refreshRow(size_t index); //re-invoke getters of a bound row, e.g. after edit cancel/commit

    int getRowHeight() const { return rowHeight_; }
    bool isEnabled() const { return enabled_; }

    int getScrollOffset() const { return scrollOffset_; }
    int getContentHeight() const { return static_cast<int>(rows_.size()) * rowHeight_; }
    int getScrollOffsetForRow(size_t index) const; //minimal offset that shows the row completely
    int clampScrollOffset(int scrollOffset) const;

    const VirtualWindow& getWindow() const { return window_; }
    size_t getPoolCapacity() const;

    std::pair<size_t, size_t> getDesiredRange() const; //half-open range of indices that should be bound

    const std::vector<std::unique_ptr<RowContainer>>& getPool() const { return pool_; }
    const RowContainer* findContainer(size_t index) const; //nullptr if index is not bound; O(pool size)

    size_t getLayoutPassCount() const { return layoutPassCount_; }

    void checkInvariants() const; //throw std::logic_error

private:
    RowVirtualizer           (const RowVirtualizer&) = delete;
    RowVirtualizer& operator=(const RowVirtualizer&) = delete;

    template <class Function>
    void runBatch(Function fun);

    void reconcile();
    void updateWindow();

    void bind(RowContainer& row, size_t index);
    void unbind(RowContainer& row);
    void refreshContent(RowContainer& row);

    const int rowHeight_;
    const size_t bufferRows_;
    const bool enabled_;
    const RowVirtualizerCallbacks callbacks_;

    std::span<const ViewRow> rows_;
    std::vector<RowColumn> columns_;
    std::vector<int> widths_;

    int scrollOffset_   = 0;
    int viewportHeight_ = 0;
    size_t viewportRowCount_ = 0; //rows the viewport can show, regardless of the sequence length
    VirtualWindow window_;

    std::vector<std::unique_ptr<RowContainer>> pool_;

    size_t layoutPassCount_ = 0;
    int  layoutSuspendCount_ = 0; //batch bindings: one layout pass per bulk operation
    bool layoutDirty_ = false;   //
};
}

#endif //ROW_VIRTUALIZER_H_2309184710923847
