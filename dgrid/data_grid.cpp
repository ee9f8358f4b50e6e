// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "data_grid.h"
#include <algorithm>
#include "i18n.h"

using namespace dgrid;


namespace
{
bool sameItem(const std::weak_ptr<void>& lhs, const std::weak_ptr<void>& rhs)
{
    return !lhs.owner_before(rhs) && !rhs.owner_before(lhs);
}
}


DataGrid::DataGrid(const GridConfig& cfg, const ThemeProvider& theme, TimerScheduler& timer) :
    cfg_(normalize(cfg)),
    theme_(theme),
    pagingEnabled_(cfg_.pagingEnabled),
    pager_(cfg_.pageSize),
    virtualizer_(cfg_.rowHeight, cfg_.bufferRows, cfg_.virtualizationEnabled, makeVirtualizerCallbacks()),
    history_(cfg_.undoLimit),
    debouncer_(timer, cfg_.filterDebounce, [this](const std::wstring& columnId, const std::wstring& text) { applyFilterText(columnId, text); })
{
}


RowVirtualizerCallbacks DataGrid::makeVirtualizerCallbacks()
{
    RowVirtualizerCallbacks callbacks;
    //no per-container interaction handlers: gestures are routed through activateCell()
    callbacks.onBeforeUnbind = [this](const RowContainer& row, size_t oldIndex) { onBeforeUnbind(oldIndex); };
    return callbacks;
}


DataGrid::~DataGrid()
{
    if (source_)
        source_->removeListener(*this);
}

//------------------------------------------------------------------------------------------

void DataGrid::post(std::function<void(GridEventSink& sink)>&& notify)
{
    pendingEvents_.push_back(std::move(notify));
}


void DataGrid::flushEvents()
{
    while (!pendingEvents_.empty())
    {
        std::vector<std::function<void(GridEventSink& sink)>> events;
        events.swap(pendingEvents_); //sink may call back into the grid

        if (sink_)
            for (const auto& notify : events)
                notify(*sink_);
    }
}

//------------------------------------------------------------------------------------------

void DataGrid::setItemSource(const std::shared_ptr<ItemSource>& source)
{
    if (source_)
        source_->removeListener(*this);

    cancelEditImpl(false);
    history_.clear();

    source_ = source;
    if (source_)
        source_->addListener(*this);

    rebuild();
    flushEvents();
}


void DataGrid::refresh()
{
    rebuild();
    flushEvents();
}


void DataGrid::onItemsAdded(size_t first, size_t count) { refresh(); }
void DataGrid::onItemsRemoved(size_t first, size_t count) { refresh(); }
void DataGrid::onReset() { refresh(); }


void DataGrid::rebuild()
{
    PipelineInput input;
    input.source  = source_.get();
    input.columns = &columns_;
    input.sort    = sort_;
    input.filter  = filter_;
    input.group   = group_;
    input.nullOrder = cfg_.nullOrder;
    input.showGroupHeaders = cfg_.showGroupHeaders;

    ViewStats stats;
    ViewSequence view = rebuildView(input, &stats); //throw GridError: column ids are validated on entry => not expected here

    view_.swap(view); //"view" keeps the old rows alive until the virtualizer switched over
    viewStats_ = stats;

    if (stats.getterFaults > 0)
        logMsg(errorLog_, _P("Cannot read %x cell value. The value is treated as empty.",
                             "Cannot read %x cell values. The values are treated as empty.", stats.getterFaults), MSG_TYPE_WARNING);

    const size_t oldPage = pager_.getCurrentPage();
    if (pager_.setSequenceLength(view_.size()) && pagingEnabled_)
        pageChanged(oldPage);
    else
    {
        virtualizer_.setSequence(getEffectiveRows());
        resetSelection();
    }
    measureAutoColumns();

    post([stats](GridEventSink& sink) { sink.onViewRebuilt(stats); });
}


void DataGrid::pageChanged(size_t oldPage)
{
    cancelEditImpl(true); //window does not persist across pages: indices are not comparable

    virtualizer_.resetSequence(getEffectiveRows());
    resetSelection();
    measureAutoColumns();

    post([oldPage, newPage = pager_.getCurrentPage(), pageSize = pager_.getPageSize(), totalRows = view_.size()](GridEventSink& sink)
    {
        sink.onPageChanged(oldPage, newPage, pageSize, totalRows);
    });
}


void DataGrid::resetSelection()
{
    const bool hadSelection = !selection_.empty();
    selection_.init(getEffectiveRowCount());

    if (hadSelection)
        post([](GridEventSink& sink) { sink.onSelectionChanged({}); });
}


std::span<const ViewRow> DataGrid::getEffectiveRows() const
{
    std::span<const ViewRow> rows(view_);
    if (!pagingEnabled_)
        return rows;

    const PageSlice slice = pager_.getSlice();
    return rows.subspan(slice.first, slice.count);
}


const ViewRow* DataGrid::getEffectiveRow(size_t index) const
{
    const std::span<const ViewRow> rows = getEffectiveRows();
    return index < rows.size() ? &rows[index] : nullptr;
}

//------------------------------------------------------------------------------------------

ColumnModel& DataGrid::refColumn(const std::wstring& columnId) //throw GridError
{
    return const_cast<ColumnModel&>(getColumn(columns_, columnId)); //throw GridError
}


void DataGrid::setColumns(const std::vector<ColumnModel>& columns) //throw GridError
{
    validateColumns(columns); //throw GridError

    cancelEditImpl(false);
    history_.clear();
    debouncer_.cancel();
    layoutEngine_.resetAllMeasurements();

    columns_ = columns;

    //drop state of columns that no longer exist
    if (std::erase_if(sort_, [&](const SortKey& key) { return !findColumn(columns_, key.columnId); }) > 0)
        post([sort = sort_](GridEventSink& sink) { sink.onSortChanged(sort); });

    for (auto it = filter_.begin(); it != filter_.end();)
        if (!findColumn(columns_, it->first))
        {
            post([columnId = it->first](GridEventSink& sink) { sink.onFilterChanged(columnId, nullptr); });
            it = filter_.erase(it);
        }
        else
            ++it;

    if (group_ && !findColumn(columns_, *group_))
        group_.reset();

    updateRowColumns();
    rebuild();
    flushEvents();
}


void DataGrid::addColumn(const ColumnModel& col, std::optional<size_t> pos) //throw GridError
{
    validateColumn(col); //throw GridError
    if (findColumn(columns_, col.id))
        throw GridError(replaceCpy(_("Duplicate column identifier %x."), L"%x", fmtColumn(col.id)));

    const size_t insertPos = std::min(pos.value_or(columns_.size()), columns_.size());
    columns_.insert(columns_.begin() + insertPos, col);

    updateRowColumns();
    flushEvents();
}


void DataGrid::removeColumn(const std::wstring& columnId) //throw GridError
{
    getColumn(columns_, columnId); //throw GridError

    if (const EditSession* session = edit_.getSession(); session && session->columnId == columnId)
        cancelEditImpl(false);

    debouncer_.cancel(columnId);
    history_.removeColumn(columnId);
    layoutEngine_.resetMeasurement(columnId);

    bool viewChanged = false;
    if (std::erase_if(sort_, [&](const SortKey& key) { return key.columnId == columnId; }) > 0)
    {
        viewChanged = true;
        post([sort = sort_](GridEventSink& sink) { sink.onSortChanged(sort); });
    }
    if (filter_.erase(columnId) > 0)
    {
        viewChanged = true;
        post([columnId](GridEventSink& sink) { sink.onFilterChanged(columnId, nullptr); });
    }
    if (group_ == columnId)
    {
        viewChanged = true;
        group_.reset();
    }

    std::erase_if(columns_, [&](const ColumnModel& col) { return col.id == columnId; });

    updateRowColumns();
    if (viewChanged)
        rebuild();
    flushEvents();
}


void DataGrid::moveColumn(const std::wstring& columnId, size_t newPos) //throw GridError
{
    auto it = std::find_if(columns_.begin(), columns_.end(), [&](const ColumnModel& col) { return col.id == columnId; });
    if (it == columns_.end())
        throw GridError(replaceCpy(_("Column %x not found."), L"%x", fmtColumn(columnId)));

    ColumnModel col = std::move(*it);
    columns_.erase(it);
    columns_.insert(columns_.begin() + std::min(newPos, columns_.size()), std::move(col));

    updateRowColumns();
    flushEvents();
}


void DataGrid::setColumnVisible(const std::wstring& columnId, bool visible) //throw GridError
{
    ColumnModel& col = refColumn(columnId); //throw GridError
    if (col.visible == visible)
        return;

    if (!visible)
        if (const EditSession* session = edit_.getSession(); session && session->columnId == columnId)
            cancelEditImpl(false);

    col.visible = visible;
    updateRowColumns();
    flushEvents();
}


void DataGrid::setColumnSizing(const std::wstring& columnId, const ColumnSizing& sizing) //throw GridError
{
    ColumnModel& col = refColumn(columnId); //throw GridError

    ColumnModel tmp = col;
    tmp.sizing = sizing;
    validateColumn(tmp); //throw GridError

    if (col.sizing == sizing)
        return;

    col.sizing = sizing;
    if (sizing.policy == SizingPolicy::autoSize)
        layoutEngine_.resetMeasurement(columnId); //measure again over the currently visible rows

    resolveLayout();
    measureAutoColumns();
    flushEvents();
}


void DataGrid::setColumnHeader(const std::wstring& columnId, const std::wstring& header) //throw GridError
{
    ColumnModel& col = refColumn(columnId); //throw GridError
    if (col.header == header)
        return;

    col.header = header; //FitHeader/Auto depend on the label
    resolveLayout();
    flushEvents();
}


void DataGrid::updateRowColumns()
{
    std::vector<RowColumn> rowCols;
    for (const ColumnModel& col : columns_)
        if (col.visible)
            rowCols.push_back({col.id, col.getter});

    virtualizer_.setColumns(rowCols);
    resolveLayout(); //push widths to every bound container
    measureAutoColumns();
}


void DataGrid::resolveLayout()
{
    ColumnLayout layout = layoutEngine_.resolve(columns_, viewportWidth_, theme_);

    std::vector<int> widths;
    for (const ColumnWidth& cw : layout.widths)
        widths.push_back(cw.width);
    virtualizer_.applyColumnWidths(widths);

    const bool overflow = layout.overflow && viewportWidth_ > 0; //no viewport yet: nothing to warn about
    if (overflow && !overflowNotified_)
    {
        logMsg(errorLog_, replaceCpy(replaceCpy(_("Columns need %x pixels, but only %y are available."),
                                                L"%x", numberTo<std::wstring>(layout.totalWidth)),
                                     L"%y", numberTo<std::wstring>(viewportWidth_)), MSG_TYPE_WARNING);

        post([totalWidth = layout.totalWidth, viewportWidth = viewportWidth_](GridEventSink& sink) { sink.onLayoutOverflow(totalWidth, viewportWidth); });
    }
    overflowNotified_ = overflow;
    columnLayout_ = std::move(layout);
}


void DataGrid::measureAutoColumns()
{
    if (!layoutEngine_.needsMeasurement(columns_))
        return;

    const std::vector<std::unique_ptr<RowContainer>>& pool = virtualizer_.getPool();
    if (std::none_of(pool.begin(), pool.end(), [](const std::unique_ptr<RowContainer>& row) { return row->isBound() && !row->isGroupHeader(); }))
        return; //keep provisional header width until there is content

    size_t colPos = 0; //position among visible columns == position in RowContainer::getCellTexts()
    for (const ColumnModel& col : columns_)
        if (col.visible)
        {
            if (col.sizing.policy == SizingPolicy::autoSize && !layoutEngine_.isMeasured(col.id))
            {
                int contentWidth = 0;
                for (const std::unique_ptr<RowContainer>& row : pool)
                    if (row->isBound() && !row->isGroupHeader() && colPos < row->getCellTexts().size())
                        contentWidth = std::max(contentWidth, theme_.getTextWidth(row->getCellTexts()[colPos]));

                layoutEngine_.setMeasuredContentWidth(col.id, contentWidth);
            }
            ++colPos;
        }

    resolveLayout();
}


void DataGrid::remeasureAutoColumns()
{
    layoutEngine_.resetAllMeasurements();
    resolveLayout();
    measureAutoColumns();
    flushEvents();
}


int DataGrid::getColumnWidth(const std::wstring& columnId) const
{
    for (const ColumnWidth& cw : columnLayout_.widths)
        if (cw.columnId == columnId)
            return cw.width;
    return -1;
}

//------------------------------------------------------------------------------------------

void DataGrid::setSort(const SortState& sort) //throw GridError
{
    for (const SortKey& key : sort)
        if (!getColumn(columns_, key.columnId).sortable) //throw GridError
            throw GridError(replaceCpy(_("Column %x cannot be sorted."), L"%x", fmtColumn(key.columnId)));

    if (sort == sort_)
        return;

    sort_ = sort;
    rebuild();
    post([sort](GridEventSink& sink) { sink.onSortChanged(sort); });
    flushEvents();
}


bool DataGrid::toggleSort(const std::wstring& columnId) //throw GridError
{
    if (!getColumn(columns_, columnId).sortable) //throw GridError
        return false;

    SortState sort;
    if (sort_.size() == 1 && sort_[0].columnId == columnId)
    {
        if (sort_[0].direction == SortDirection::ascending)
            sort.push_back({columnId, SortDirection::descending});
        //descending => unsorted
    }
    else
        sort.push_back({columnId, SortDirection::ascending});

    setSort(sort); //throw GridError
    return true;
}


void DataGrid::clearSort()
{
    setSort({});
}


void DataGrid::setFilter(const std::wstring& columnId, const ColumnFilter& filter) //throw GridError
{
    if (!getColumn(columns_, columnId).filterable) //throw GridError
        throw GridError(replaceCpy(_("Column %x cannot be filtered."), L"%x", fmtColumn(columnId)));

    debouncer_.cancel(columnId); //explicit filter wins over pending text input

    if (filter.isActive())
        filter_[columnId] = filter;
    else if (filter_.erase(columnId) == 0)
        return;

    rebuild();
    post([columnId, filter](GridEventSink& sink) { sink.onFilterChanged(columnId, filter.isActive() ? &filter : nullptr); });
    flushEvents();
}


void DataGrid::setFilterText(const std::wstring& columnId, const std::wstring& text) //throw GridError
{
    if (!getColumn(columns_, columnId).filterable) //throw GridError
        throw GridError(replaceCpy(_("Column %x cannot be filtered."), L"%x", fmtColumn(columnId)));

    debouncer_.post(columnId, text);
}


void DataGrid::flushFilterInput()
{
    debouncer_.flush();
}


void DataGrid::applyFilterText(const std::wstring& columnId, const std::wstring& text)
{
    if (!findColumn(columns_, columnId)) //column removed meanwhile
        return;

    ColumnFilter filter;
    if (auto it = filter_.find(columnId); it != filter_.end())
        filter = it->second;

    if (filter.searchText == text)
        return;
    filter.searchText = text;

    if (filter.isActive())
        filter_[columnId] = filter;
    else
        filter_.erase(columnId);

    rebuild();
    post([columnId, filter](GridEventSink& sink) { sink.onFilterChanged(columnId, filter.isActive() ? &filter : nullptr); });
    flushEvents();
}


void DataGrid::clearFilter(const std::wstring& columnId)
{
    debouncer_.cancel(columnId);
    if (filter_.erase(columnId) == 0)
        return;

    rebuild();
    post([columnId](GridEventSink& sink) { sink.onFilterChanged(columnId, nullptr); });
    flushEvents();
}


void DataGrid::clearAllFilters()
{
    debouncer_.cancel();
    if (filter_.empty())
        return;

    FilterState oldFilter;
    oldFilter.swap(filter_);

    rebuild();
    for (const auto& [columnId, filter] : oldFilter)
        post([columnId](GridEventSink& sink) { sink.onFilterChanged(columnId, nullptr); });
    flushEvents();
}


const ColumnFilter* DataGrid::getFilter(const std::wstring& columnId) const
{
    auto it = filter_.find(columnId);
    return it != filter_.end() ? &it->second : nullptr;
}


std::vector<CellValue> DataGrid::getFilterCandidates(const std::wstring& columnId) const //throw GridError
{
    PipelineInput input;
    input.source  = source_.get();
    input.columns = &columns_;
    input.filter  = filter_;
    input.nullOrder = cfg_.nullOrder;

    return dgrid::getFilterCandidates(input, columnId); //throw GridError
}


void DataGrid::setGroupColumn(const GroupState& group) //throw GridError
{
    if (group)
        getColumn(columns_, *group); //throw GridError

    if (group == group_)
        return;

    group_ = group;
    rebuild();
    flushEvents();
}


CellValue DataGrid::getAggregate(const std::wstring& columnId) const //throw GridError
{
    const ColumnModel& col = getColumn(columns_, columnId); //throw GridError
    return computeAggregate(view_, col, col.aggregate);
}

//------------------------------------------------------------------------------------------

void DataGrid::setPagingEnabled(bool enable)
{
    if (enable == pagingEnabled_)
        return;

    const size_t oldPage = pager_.getCurrentPage();
    pagingEnabled_ = enable;
    pageChanged(oldPage); //effective sequence switched: same as a page change
    flushEvents();
}


void DataGrid::setPageSize(size_t pageSize) //throw GridError
{
    if (pageSize == pager_.getPageSize())
        return;

    const size_t oldPage = pager_.getCurrentPage();
    pager_.setPageSize(pageSize); //throw GridError

    if (pagingEnabled_)
        pageChanged(oldPage);
    flushEvents();
}


bool DataGrid::goToPage(size_t pageIndex)
{
    const size_t oldPage = pager_.getCurrentPage();
    if (!pager_.goToPage(pageIndex))
        return false;

    if (pagingEnabled_)
        pageChanged(oldPage);
    flushEvents();
    return true;
}

//------------------------------------------------------------------------------------------

void DataGrid::setViewport(int width, int height)
{
    viewportWidth_  = std::max(width,  0);
    viewportHeight_ = std::max(height, 0);

    resolveLayout(); //Fill columns follow the viewport width
    virtualizer_.onViewportChanged(virtualizer_.getScrollOffset(), viewportHeight_);
    measureAutoColumns();
    flushEvents();
}


void DataGrid::scrollTo(int scrollOffset)
{
    virtualizer_.onViewportChanged(scrollOffset, viewportHeight_);
    measureAutoColumns();
    flushEvents();
}


void DataGrid::scrollToRow(size_t index)
{
    scrollTo(virtualizer_.getScrollOffsetForRow(index));
}

//------------------------------------------------------------------------------------------

void DataGrid::onBeforeUnbind(size_t oldIndex)
{
    //a recycled container must never carry an edit session to a different item
    if (const EditSession* session = edit_.getSession(); session && session->rowIndexAtEntry == oldIndex)
        cancelEditImpl(true);
}


void DataGrid::cancelEditImpl(bool forced)
{
    if (std::optional<EditSession> session = edit_.cancel())
    {
        if (!forced) //forced: container is being rebound by the virtualizer anyway
            virtualizer_.refreshRow(session->rowIndexAtEntry); //show original value again

        post([session = std::move(*session), forced](GridEventSink& sink) { sink.onEditCancelled(session, forced); });
    }
}


//find the new row of an item after the view was rebuilt; O(window) via the bound containers
const ViewRow* DataGrid::relocateItem(const std::weak_ptr<void>& item, size_t& rowIndex) const
{
    if (const ViewRow* row = getEffectiveRow(rowIndex); row && sameItem(row->item, item))
        return row;

    for (const std::unique_ptr<RowContainer>& row : virtualizer_.getPool())
        if (row->isBound() && !row->isGroupHeader() && sameItem(row->getItem(), item))
        {
            rowIndex = *row->getBoundIndex();
            return getEffectiveRow(rowIndex);
        }
    return nullptr;
}


bool DataGrid::beginEdit(size_t rowIndex, const std::wstring& columnId) //throw GridError
{
    getColumn(columns_, columnId); //throw GridError

    const ViewRow* row = getEffectiveRow(rowIndex);
    if (!row || !virtualizer_.findContainer(rowIndex)) //only displayed cells can be activated
        return false;

    if (edit_.isEditing())
    {
        if (edit_.isEditingCell(rowIndex, columnId))
            return true;

        //commit-then-open: never silently drop the user's input
        const std::weak_ptr<void> target = row->item;
        commitEdit();
        if (edit_.isEditing()) //refused: prior session stays open
            return false;

        row = relocateItem(target, rowIndex); //commit rebuilt the view
        if (!row)
            return false;
    }

    const bool opened = edit_.beginEdit(rowIndex, *row, getColumn(columns_, columnId));
    flushEvents();
    return opened;
}


bool DataGrid::activateCell(size_t rowIndex, const std::wstring& columnId, ActivationGesture gesture) //throw GridError
{
    getColumn(columns_, columnId); //throw GridError

    const ViewRow* row = getEffectiveRow(rowIndex);
    if (!row)
        return false;

    if (!row->isGroupHeader())
        selectRow(rowIndex);

    const bool wantEdit = (cfg_.editTrigger == EditTrigger::singleTap && gesture == ActivationGesture::singleTap) ||
                          (cfg_.editTrigger == EditTrigger::doubleTap && gesture == ActivationGesture::doubleTap);
    if (wantEdit)
        return beginEdit(rowIndex, columnId); //throw GridError

    //moving focus to a different cell confirms the open edit
    if (edit_.isEditing() && !edit_.isEditingCell(rowIndex, columnId))
        commitEdit();
    return false;
}


bool DataGrid::setPendingValue(const CellValue& value)
{
    return edit_.setPendingValue(value);
}


CommitResult DataGrid::commitEdit()
{
    const EditSession* session = edit_.getSession();
    if (!session)
        return {};
    const std::wstring columnId = session->columnId;

    CommitResult result = edit_.commit();
    switch (result.status)
    {
        case CommitStatus::committed:
            history_.record(*result.commit);
            post([commit = *result.commit](GridEventSink& sink) { sink.onEditCommitted(commit); });
            rebuild(); //edited item may move, disappear or change its sort position
            break;

        case CommitStatus::noSession:
            break;

        case CommitStatus::validationFailed:
            logMsg(errorLog_, result.message, MSG_TYPE_INFO);
            post([columnId, msg = result.message](GridEventSink& sink) { sink.onEditRefused(columnId, msg); });
            break;

        case CommitStatus::setterFailed:
            logMsg(errorLog_, result.message, MSG_TYPE_ERROR);
            post([columnId, msg = result.message](GridEventSink& sink) { sink.onEditRefused(columnId, msg); });
            break;

        case CommitStatus::itemExpired:
            logMsg(errorLog_, result.message, MSG_TYPE_WARNING);
            post([columnId, msg = result.message](GridEventSink& sink) { sink.onEditRefused(columnId, msg); });
            rebuild();
            break;
    }
    flushEvents();
    return result;
}


bool DataGrid::cancelEdit()
{
    if (!edit_.isEditing())
        return false;

    cancelEditImpl(false);
    flushEvents();
    return true;
}


void DataGrid::writeValue(void* item, const std::wstring& columnId, const CellValue& value) //throw X
{
    const ColumnModel* col = findColumn(columns_, columnId);
    DGRID_CONTRACT_CHECK(col && col->setter); //history entries of removed columns are dropped

    col->setter(item, value); //throw X
}


bool DataGrid::undo()
{
    cancelEditImpl(false);

    std::optional<EditRecord> rec;
    try
    {
        rec = history_.undo([this](void* item, const std::wstring& columnId, const CellValue& value) { writeValue(item, columnId, value); }); //throw X
    }
    catch (const std::exception& e)
    {
        logMsg(errorLog_, _("Cannot undo the last edit.") + L"\n\n" + utfToWide(e.what()), MSG_TYPE_ERROR);
        flushEvents();
        return false;
    }

    if (rec)
        rebuild();
    flushEvents();
    return rec.has_value();
}


bool DataGrid::redo()
{
    cancelEditImpl(false);

    std::optional<EditRecord> rec;
    try
    {
        rec = history_.redo([this](void* item, const std::wstring& columnId, const CellValue& value) { writeValue(item, columnId, value); }); //throw X
    }
    catch (const std::exception& e)
    {
        logMsg(errorLog_, _("Cannot redo the last edit.") + L"\n\n" + utfToWide(e.what()), MSG_TYPE_ERROR);
        flushEvents();
        return false;
    }

    if (rec)
        rebuild();
    flushEvents();
    return rec.has_value();
}

//------------------------------------------------------------------------------------------

void DataGrid::selectRow(size_t index, bool addToSelection)
{
    const ViewRow* row = getEffectiveRow(index);
    if (cfg_.selectionMode == SelectionMode::none || !row || row->isGroupHeader())
        return;

    if (cfg_.selectionMode == SelectionMode::single || !addToSelection)
    {
        if (selection_.get() == std::vector<size_t> {index})
            return;
        selection_.clear();
    }
    selection_.selectRow(index);

    post([rows = selection_.get()](GridEventSink& sink) { sink.onSelectionChanged(rows); });
    flushEvents();
}


void DataGrid::selectRange(size_t rowFirst, size_t rowLast)
{
    if (cfg_.selectionMode == SelectionMode::none || rowFirst >= rowLast)
        return;

    if (cfg_.selectionMode == SelectionMode::single)
        return selectRow(rowFirst);

    selection_.clear();
    selection_.selectRange(rowFirst, rowLast);

    const std::span<const ViewRow> rows = getEffectiveRows();
    for (size_t i = rowFirst; i < std::min(rowLast, rows.size()); ++i)
        if (rows[i].isGroupHeader())
            selection_.selectRow(i, false);

    post([rows = selection_.get()](GridEventSink& sink) { sink.onSelectionChanged(rows); });
    flushEvents();
}


void DataGrid::selectAll()
{
    selectRange(0, getEffectiveRowCount());
}


void DataGrid::clearSelection()
{
    if (selection_.empty())
        return;

    selection_.clear();
    post([](GridEventSink& sink) { sink.onSelectionChanged({}); });
    flushEvents();
}
