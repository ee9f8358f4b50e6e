// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef DATA_GRID_H_4409182730498123
#define DATA_GRID_H_4409182730498123

#include <span>
#include "aggregate.h"
#include "cell_edit.h"
#include "column_layout.h"
#include "config.h"
#include "debounce.h"
#include "edit_history.h"
#include "error_log.h"
#include "grid_events.h"
#include "pagination.h"
#include "row_virtualizer.h"
#include "selection.h"


namespace dgrid
{
enum class ActivationGesture
{
    singleTap,
    doubleTap,
};


/*  data-presentation engine of a grid control:

    item source -> rebuildView() -> view sequence -> PaginationController -> effective sequence -> RowVirtualizer -> row containers
                                                                                                         /|\
                                                                        ColumnLayoutEngine (widths) -----+
    CellEditController writes back through ColumnModel::setter => view sequence is rebuilt

    - single-threaded: call from the UI thread only
    - notifications are delivered after the triggering operation has completed      */
class DataGrid : private ItemSourceListener
{
public:
    DataGrid(const GridConfig& cfg, const ThemeProvider& theme, TimerScheduler& timer);
    ~DataGrid();

    const GridConfig& getConfig() const { return cfg_; }

    void setEventSink(GridEventSink* sink) { sink_ = sink; } //nullptr: none; sink must outlive DataGrid or be reset

    //-------------------------- source + columns --------------------------
    void setItemSource(const std::shared_ptr<ItemSource>& source); //nullptr: no items
    const std::shared_ptr<ItemSource>& getItemSource() const { return source_; }
    void refresh(); //rebuild view sequence: for sources without change notifications

    void setColumns(const std::vector<ColumnModel>& columns); //throw GridError
    void addColumn(const ColumnModel& col, std::optional<size_t> pos = std::nullopt); //throw GridError
    void removeColumn(const std::wstring& columnId); //throw GridError
    void moveColumn(const std::wstring& columnId, size_t newPos); //throw GridError
    void setColumnVisible(const std::wstring& columnId, bool visible); //throw GridError
    void setColumnSizing(const std::wstring& columnId, const ColumnSizing& sizing); //throw GridError
    void setColumnHeader(const std::wstring& columnId, const std::wstring& header); //throw GridError
    const std::vector<ColumnModel>& getColumns() const { return columns_; }

    //-------------------------- sort / filter / group --------------------------
    void setSort(const SortState& sort); //throw GridError
    bool toggleSort(const std::wstring& columnId); //throw GridError; none -> ascending -> descending -> none; "false": column not sortable
    void clearSort();
    const SortState& getSort() const { return sort_; }

    void setFilter(const std::wstring& columnId, const ColumnFilter& filter); //throw GridError; applied immediately
    void setFilterText(const std::wstring& columnId, const std::wstring& text); //throw GridError; debounced
    void flushFilterInput(); //apply pending filter text now
    void clearFilter(const std::wstring& columnId);
    void clearAllFilters();
    const ColumnFilter* getFilter(const std::wstring& columnId) const; //nullptr if not filtered
    const FilterState& getFilterState() const { return filter_; }
    std::vector<CellValue> getFilterCandidates(const std::wstring& columnId) const; //throw GridError; ignores the column's own filter

    void setGroupColumn(const GroupState& group); //throw GridError
    const GroupState& getGroupColumn() const { return group_; }

    //-------------------------- view --------------------------
    const ViewSequence& getViewSequence() const { return view_; }
    const ViewStats& getViewStats() const { return viewStats_; }

    std::span<const ViewRow> getEffectiveRows() const; //current page slice if paging is active
    size_t getEffectiveRowCount() const { return getEffectiveRows().size(); }
    const ViewRow* getEffectiveRow(size_t index) const; //nullptr if out of range

    CellValue getAggregate(const std::wstring& columnId) const; //throw GridError; over the whole view sequence, using the column's AggregateType

    //-------------------------- paging --------------------------
    void setPagingEnabled(bool enable);
    bool isPagingEnabled() const { return pagingEnabled_; }
    void setPageSize(size_t pageSize); //throw GridError
    size_t getPageSize   () const { return pager_.getPageSize(); }
    size_t getPageCount  () const { return pager_.getPageCount(); }
    size_t getCurrentPage() const { return pager_.getCurrentPage(); }
    bool goToPage(size_t pageIndex); //clamped; "true" if the page changed
    bool nextPage    () { return goToPage(getCurrentPage() + 1); }
    bool previousPage() { return getCurrentPage() > 0 && goToPage(getCurrentPage() - 1); }

    //-------------------------- viewport --------------------------
    void setViewport(int width, int height); //pushed by the hosting window on every resize
    void scrollTo(int scrollOffset);
    void scrollToRow(size_t index);
    int getScrollOffset () const { return virtualizer_.getScrollOffset(); }
    int getContentHeight() const { return virtualizer_.getContentHeight(); }
    int getViewportWidth () const { return viewportWidth_; }
    int getViewportHeight() const { return viewportHeight_; }

    const RowVirtualizer& getVirtualizer() const { return virtualizer_; }
    const ColumnLayout& getColumnLayout() const { return columnLayout_; }
    int getColumnWidth(const std::wstring& columnId) const; //-1 if hidden or unknown
    void remeasureAutoColumns();

    //-------------------------- editing --------------------------
    bool activateCell(size_t rowIndex, const std::wstring& columnId, ActivationGesture gesture); //throw GridError; "true" if an edit session was opened
    bool beginEdit(size_t rowIndex, const std::wstring& columnId); //throw GridError; commit-then-open if another cell is being edited
    bool setPendingValue(const CellValue& value);
    CommitResult commitEdit();
    bool cancelEdit();
    const EditSession* getEditSession() const { return edit_.getSession(); }
    EditState getEditState() const { return edit_.getState(); }

    bool undo();
    bool redo();
    bool canUndo() const { return history_.canUndo(); }
    bool canRedo() const { return history_.canRedo(); }

    //-------------------------- selection --------------------------
    void selectRow(size_t index, bool addToSelection = false);
    void selectRange(size_t rowFirst, size_t rowLast); //[rowFirst, rowLast)
    void selectAll();
    void clearSelection();
    std::vector<size_t> getSelectedRows() const { return selection_.get(); }
    bool isRowSelected(size_t index) const { return selection_.isSelected(index); }

    //-------------------------- logging --------------------------
    const ErrorLog& getErrorLog() const { return errorLog_; }
    void clearErrorLog() { errorLog_.clear(); }

private:
    DataGrid           (const DataGrid&) = delete;
    DataGrid& operator=(const DataGrid&) = delete;

    void onItemsAdded  (size_t first, size_t count) override;
    void onItemsRemoved(size_t first, size_t count) override;
    void onReset() override;

    RowVirtualizerCallbacks makeVirtualizerCallbacks();

    void rebuild();
    void pageChanged(size_t oldPage);
    void resetSelection();
    void updateRowColumns();
    void resolveLayout();
    void measureAutoColumns();
    void applyFilterText(const std::wstring& columnId, const std::wstring& text);

    void cancelEditImpl(bool forced);
    void onBeforeUnbind(size_t oldIndex);
    const ViewRow* relocateItem(const std::weak_ptr<void>& item, size_t& rowIndex) const;

    ColumnModel& refColumn(const std::wstring& columnId); //throw GridError
    void writeValue(void* item, const std::wstring& columnId, const CellValue& value); //throw X

    void post(std::function<void(GridEventSink& sink)>&& notify);
    void flushEvents();

    const GridConfig cfg_;
    const ThemeProvider& theme_;

    std::shared_ptr<ItemSource> source_;
    std::vector<ColumnModel> columns_;

    SortState   sort_;
    FilterState filter_;
    GroupState  group_;

    ViewSequence view_;
    ViewStats viewStats_;

    bool pagingEnabled_;
    PaginationController pager_;

    int viewportWidth_  = 0;
    int viewportHeight_ = 0;
    ColumnLayoutEngine layoutEngine_;
    ColumnLayout columnLayout_;
    bool overflowNotified_ = false;

    RowVirtualizer virtualizer_;
    CellEditController edit_;
    EditHistory history_;
    RowSelection selection_;
    FilterDebouncer debouncer_;

    GridEventSink* sink_ = nullptr;
    std::vector<std::function<void(GridEventSink& sink)>> pendingEvents_;

    ErrorLog errorLog_;
};
}

#endif //DATA_GRID_H_4409182730498123
