// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "data_grid_window.h"
#include <algorithm>
#include <cassert>
#include <wx/dcclient.h>
#include <wx/msgdlg.h>
#include <wx/settings.h>
#include <wx/utils.h>
#include <dgrid/basic_math.h>
#include <dgrid/grid_error.h>
#include <dgrid/i18n.h>
#include <dgrid/scope_guard.h>
#include <dgrid/string_tools.h>
#include "context_menu.h"
#include "dc.h"

using namespace dgrid;


namespace
{
//------------------------------ Grid Parameters --------------------------------
inline wxColor getColorGridLine() { return wxSystemSettings::GetColour(wxSYS_COLOUR_BTNSHADOW); }

inline wxColor getColorLabelGradientFrom() { return wxSystemSettings::GetColour(wxSYS_COLOUR_WINDOW); }
inline wxColor getColorLabelGradientTo  () { return wxSystemSettings::GetColour(wxSYS_COLOUR_BTNFACE); }

const int    COL_LABEL_BORDER_DIP      = 6; //top + bottom border in addition to label height
const int    FILTER_MARKER_HEIGHT_DIP  = 2;
const size_t FILTER_MENU_VALUES_MAX    = 25; //distinct values offered in the column label context menu

wxDEFINE_EVENT(EVENT_DATAGRID_HAS_SCROLLED, wxCommandEvent);
wxDEFINE_EVENT(EVENT_DATAGRID_NEEDS_UPDATE, wxCommandEvent);


void drawCellBorder(wxDC& dc, const wxRect& rect)
{
    clearArea(dc, {rect.x + rect.width - dipToWxsize(1), rect.y, dipToWxsize(1), rect.height}, getColorGridLine()); //right border
    clearArea(dc, {rect.x, rect.y + rect.height - dipToWxsize(1), rect.width, dipToWxsize(1)}, getColorGridLine()); //bottom border
}


std::wstring formatGroupLabel(const CellValue& key, size_t itemCount)
{
    return (isNull(key) ? _("(empty)") : formatCellValue(key)) + L" (" + _P("%x item", "%x items", itemCount) + L")";
}
}

//----------------------------------------------------------------------------------------------------------------
namespace dgrid
{
wxDEFINE_EVENT(EVENT_DATAGRID_SORT_CHANGED,      DataGridSortEvent);
wxDEFINE_EVENT(EVENT_DATAGRID_FILTER_CHANGED,    DataGridFilterEvent);
wxDEFINE_EVENT(EVENT_DATAGRID_PAGE_CHANGED,      DataGridPageEvent);
wxDEFINE_EVENT(EVENT_DATAGRID_EDIT_COMMITTED,    DataGridEditEvent);
wxDEFINE_EVENT(EVENT_DATAGRID_EDIT_REFUSED,      DataGridEditRefusedEvent);
wxDEFINE_EVENT(EVENT_DATAGRID_SELECTION_CHANGED, DataGridSelectionEvent);
wxDEFINE_EVENT(EVENT_DATAGRID_VIEW_REBUILT,      DataGridViewEvent);
}

//----------------------------------------------------------------------------------------------------------------

class DataGridWindow::SubWindow : public wxWindow
{
public:
    explicit SubWindow(DataGridWindow& parent) :
        wxWindow(&parent, wxID_ANY, wxDefaultPosition, wxDefaultSize, wxWANTS_CHARS | wxBORDER_NONE, wxASCII_STR(wxPanelNameStr)),
        parent_(parent)
    {
        Bind(wxEVT_PAINT, [this](wxPaintEvent& event) { onPaintEvent(event); });
        Bind(wxEVT_SIZE,  [this](wxSizeEvent&  event) { Refresh(); event.Skip(); });
        Bind(wxEVT_ERASE_BACKGROUND, [](wxEraseEvent& event) {}); //https://wiki.wxwidgets.org/Flicker-Free_Drawing
        SetBackgroundStyle(wxBG_STYLE_PAINT);

        Bind(wxEVT_CHILD_FOCUS, [](wxChildFocusEvent& event) {}); //wxGTK::wxScrolledWindow automatically scrolls to child window when child gets focus -> prevent!

        Bind(wxEVT_LEFT_DOWN,    [this](wxMouseEvent& event) { onMouseLeftDown  (event); });
        Bind(wxEVT_LEFT_DCLICK,  [this](wxMouseEvent& event) { onMouseLeftDouble(event); });
        Bind(wxEVT_RIGHT_DOWN,   [this](wxMouseEvent& event) { onMouseRightDown (event); });
        Bind(wxEVT_MOTION,       [this](wxMouseEvent& event) { onMouseMovement  (event); });
        Bind(wxEVT_LEAVE_WINDOW, [this](wxMouseEvent& event) { onLeaveWindow    (event); });
        Bind(wxEVT_MOUSEWHEEL,   [this](wxMouseEvent& event) { onMouseWheel     (event); });

        Bind(wxEVT_KEY_DOWN, [this](wxKeyEvent& event)
        {
            if (!parent_.GetEventHandler()->ProcessEvent(event)) //let parent collect all key events
                event.Skip();
        });
    }

    DataGridWindow&       refParent()       { return parent_; }
    const DataGridWindow& refParent() const { return parent_; }

private:
    virtual void render(wxDC& dc, const wxRect& rect) = 0;

    virtual void onMouseLeftDown  (wxMouseEvent& event) { event.Skip(); }
    virtual void onMouseLeftDouble(wxMouseEvent& event) { event.Skip(); }
    virtual void onMouseRightDown (wxMouseEvent& event) { event.Skip(); }
    virtual void onMouseMovement  (wxMouseEvent& event) { event.Skip(); }
    virtual void onLeaveWindow    (wxMouseEvent& event) { event.Skip(); }

    void onMouseWheel(wxMouseEvent& event)
    {
        //wxScrollHelperBase::HandleOnMouseWheel() repeats wxEVT_SCROLLWIN_LINEUP for multi-line scrolling => scroll all rows at once
        if (event.GetWheelAxis() == wxMOUSE_WHEEL_VERTICAL &&
            !event.IsPageScroll())
        {
            mouseRotateRemainder_ += -event.GetWheelRotation();
            int rotations = mouseRotateRemainder_ / event.GetWheelDelta();
            mouseRotateRemainder_ -= rotations * event.GetWheelDelta();

            if (rotations == 0) //tiny GetWheelRotation(): always scroll a single row at least
            {
                rotations = event.GetWheelRotation() > 0 ? -1 : 1;
                mouseRotateRemainder_ = 0;
            }
            parent_.scrollDelta(0, rotations * event.GetLinesPerAction());
        }
        else
            parent_.HandleOnMouseWheel(event);

        event.Skip(false);
    }

    void onPaintEvent(wxPaintEvent& event)
    {
        BufferedPaintDC dc(*this, doubleBuffer_);

        const wxRegion& updateReg = GetUpdateRegion();
        for (wxRegionIterator it = updateReg; it; ++it)
            render(dc, it.GetRect());
    }

    DataGridWindow& parent_;
    std::optional<wxBitmap> doubleBuffer_;
    int mouseRotateRemainder_ = 0;
};

//----------------------------------------------------------------------------------------------------------------

class DataGridWindow::ColLabelWin : public SubWindow
{
public:
    explicit ColLabelWin(DataGridWindow& parent) : SubWindow(parent),
        labelFont_(GetFont().Bold())
    {
        //coordinate with ColLabelWin::render():
        colLabelHeight_ = dipToWxsize(2 * COL_LABEL_BORDER_DIP) + labelFont_.GetPixelSize().GetHeight();
    }

    int getColumnLabelHeight() const { return colLabelHeight_; }

private:
    bool AcceptsFocus() const override { return false; }

    void render(wxDC& dc, const wxRect& rect) override
    {
        clearArea(dc, rect, wxSystemSettings::GetColour(wxSYS_COLOUR_WINDOW));

        dc.SetFont(labelFont_);
        dc.SetTextForeground(wxSystemSettings::GetColour(wxSYS_COLOUR_WINDOWTEXT));

        wxPoint labelAreaTL(refParent().CalcScrolledPosition(wxPoint(0, 0)).x, 0); //client coordinates

        for (const ColumnWidth& cw : refParent().refGrid().getColumnLayout().widths)
        {
            if (labelAreaTL.x > rect.GetRight())
                return; //done, rect is fully covered
            if (labelAreaTL.x + cw.width > rect.x)
                drawColumnLabel(dc, wxRect(labelAreaTL, wxSize(cw.width, colLabelHeight_)), cw.columnId);
            labelAreaTL.x += cw.width;
        }

        //fill gap after columns and cover full width
        const int clientWidth = GetClientSize().GetWidth();
        if (labelAreaTL.x < clientWidth)
            drawLabelBackground(dc, wxRect(labelAreaTL, wxSize(clientWidth - labelAreaTL.x, colLabelHeight_)), false /*highlighted*/);
    }

    void drawColumnLabel(wxDC& dc, const wxRect& rect, const std::wstring& columnId)
    {
        const DataGrid& grid = refParent().refGrid();
        const ColumnModel* col = findColumn(grid.getColumns(), columnId);
        if (!col)
            return;

        wxDCClipper clip(dc, rect);
        drawLabelBackground(dc, rect, highlightCol_ && *highlightCol_ == columnId);

        std::wstring label = col->header;

        const SortState& sort = grid.getSort();
        if (auto it = std::find_if(sort.begin(), sort.end(), [&](const SortKey& key) { return key.columnId == columnId; });
            it != sort.end())
        {
            label += it->direction == SortDirection::ascending ? L" \u25b2" : L" \u25bc";
            if (sort.size() > 1) //show priority for multi-column sort
                label += numberTo<std::wstring>(it - sort.begin() + 1);
        }

        const int padding = refParent().theme_.getCellPadding();
        wxRect textRect = rect;
        textRect.x     += padding;
        textRect.width -= 2 * padding;
        dc.DrawLabel(label, textRect, wxALIGN_LEFT | wxALIGN_CENTER_VERTICAL);

        if (grid.getFilter(columnId)) //mark filtered columns
        {
            const int markerHeight = dipToWxsize(FILTER_MARKER_HEIGHT_DIP);
            clearArea(dc, wxRect(rect.x, rect.y + rect.height - dipToWxsize(1) - markerHeight, rect.width - dipToWxsize(1), markerHeight),
                      toWxColor(refParent().theme_.getAccentColor()));
        }
    }

    void drawLabelBackground(wxDC& dc, const wxRect& rect, bool highlighted)
    {
        dc.GradientFillLinear(rect, getColorLabelGradientFrom(), highlighted ? toWxColor(refParent().theme_.getAccentColor()) : getColorLabelGradientTo(), wxSOUTH);
        drawCellBorder(dc, rect);
    }

    void onMouseLeftDown(wxMouseEvent& event) override
    {
        if (const ColumnWidth* cw = refParent().getColumnAtWinPos(event.GetPosition().x))
            refParent().onColumnLabelClick(cw->columnId);
        event.Skip();
    }

    void onMouseRightDown(wxMouseEvent& event) override
    {
        if (const ColumnWidth* cw = refParent().getColumnAtWinPos(event.GetPosition().x))
            refParent().onColumnLabelContext(cw->columnId);
        event.Skip();
    }

    void onMouseMovement(wxMouseEvent& event) override
    {
        std::optional<std::wstring> highlightCol;
        if (const ColumnWidth* cw = refParent().getColumnAtWinPos(event.GetPosition().x))
            highlightCol = cw->columnId;

        if (highlightCol != highlightCol_)
        {
            highlightCol_ = highlightCol;
            Refresh();
        }
        event.Skip();
    }

    void onLeaveWindow(wxMouseEvent& event) override
    {
        if (highlightCol_)
        {
            highlightCol_.reset();
            Refresh();
        }
        event.Skip();
    }

    const wxFont labelFont_;
    int colLabelHeight_ = 0;
    std::optional<std::wstring> highlightCol_; //column id
};

//----------------------------------------------------------------------------------------------------------------

class DataGridWindow::MainWin : public SubWindow
{
public:
    MainWin(DataGridWindow& parent, ColLabelWin& colLabelWin) : SubWindow(parent),
        colLabelWin_(colLabelWin)
    {
        Bind(EVENT_DATAGRID_HAS_SCROLLED, [this](wxCommandEvent& event) { refParent().onScrolled(event); });
    }

private:
    void render(wxDC& dc, const wxRect& rect) override
    {
        clearArea(dc, rect, wxSystemSettings::GetColour(wxSYS_COLOUR_WINDOW));

        const DataGrid& grid = refParent().refGrid();

        dc.SetFont(GetFont()); //harmonize with WxThemeProvider::getTextWidth()
        dc.SetTextForeground(wxSystemSettings::GetColour(wxSYS_COLOUR_WINDOWTEXT));

        const int rowHeight = grid.getVirtualizer().getRowHeight();
        const int totalRowWidth = std::max(grid.getColumnLayout().totalWidth, GetClientSize().GetWidth()); //fill gap after columns

        const wxPoint gridAreaTL(refParent().CalcScrolledPosition(wxPoint(0, 0))); //client coordinates

        //only bound containers have a visual representation
        for (const std::unique_ptr<RowContainer>& row : grid.getVirtualizer().getPool())
            if (const std::optional<size_t> index = row->getBoundIndex())
            {
                const wxRect rowRect(gridAreaTL + wxPoint(0, static_cast<int>(*index) * rowHeight), wxSize(totalRowWidth, rowHeight));
                if (rowRect.Intersects(rect))
                {
                    if (row->isGroupHeader())
                        renderGroupHeader(dc, rowRect, *row);
                    else
                        renderItemRow(dc, rowRect, *row, grid.isRowSelected(*index));
                }
            }
    }

    void renderItemRow(wxDC& dc, const wxRect& rowRect, const RowContainer& row, bool selected)
    {
        if (selected)
            dc.GradientFillLinear(rowRect, toWxColor(refParent().theme_.getAccentColor()), wxSystemSettings::GetColour(wxSYS_COLOUR_WINDOW), wxEAST);

        wxDCTextColourChanger textColor(dc);
        if (selected) //accessibility: always set *both* foreground AND background colors!
            textColor.Set(wxSystemSettings::GetColour(wxSYS_COLOUR_HIGHLIGHTTEXT));

        const std::vector<std::wstring>& texts      = row.getCellTexts();
        const std::vector<int>&          cellWidths = row.getCellWidths();
        assert(texts.size() == cellWidths.size());

        const int padding = refParent().theme_.getCellPadding();

        wxRect cellRect = rowRect;
        for (size_t i = 0; i < texts.size() && i < cellWidths.size(); ++i)
        {
            cellRect.width = cellWidths[i];
            if (cellRect.width > 0)
            {
                {
                    wxDCClipper clip(dc, cellRect);
                    dc.DrawText(texts[i], cellRect.x + padding, cellRect.y + (cellRect.height - dc.GetCharHeight()) / 2);
                }
                drawCellBorder(dc, cellRect);
            }
            cellRect.x += cellRect.width;
        }
    }

    void renderGroupHeader(wxDC& dc, const wxRect& rowRect, const RowContainer& row)
    {
        clearArea(dc, rowRect, wxSystemSettings::GetColour(wxSYS_COLOUR_BTNFACE));

        //group headers span the view, not the columns: ignore horizontal scrolling
        const wxRect labelRect(refParent().theme_.getCellPadding(), rowRect.y, GetClientSize().GetWidth(), rowRect.height);

        wxDCFontChanger fontChanger(dc, dc.GetFont().Bold());
        dc.DrawLabel(formatGroupLabel(row.getGroupKey(), row.getGroupItemCount()), labelRect, wxALIGN_LEFT | wxALIGN_CENTER_VERTICAL);

        clearArea(dc, {rowRect.x, rowRect.y + rowRect.height - dipToWxsize(1), rowRect.width, dipToWxsize(1)}, getColorGridLine()); //bottom border
    }

    void onMouseLeftDown  (wxMouseEvent& event) override { onMouseClick(event, ActivationGesture::singleTap); }
    void onMouseLeftDouble(wxMouseEvent& event) override { onMouseClick(event, ActivationGesture::doubleTap); }

    void onMouseClick(wxMouseEvent& event, ActivationGesture gesture)
    {
        SetFocus(); //editor loses focus => commits first

        if (const std::optional<size_t> row = refParent().getRowAtWinPos(event.GetPosition().y))
            if (const ColumnWidth* cw = refParent().getColumnAtWinPos(event.GetPosition().x))
                refParent().onCellClick(*row, cw->columnId, gesture, event);
        event.Skip();
    }

    void ScrollWindow(int dx, int dy, const wxRect* rect) override
    {
        wxWindow::ScrollWindow(dx, dy, rect);
        colLabelWin_.ScrollWindow(dx, 0, rect);

        //wxScrollHelper updates its scroll position *after* calling us => CalcUnscrolledPosition() is outdated here
        GetEventHandler()->AddPendingEvent(wxCommandEvent(EVENT_DATAGRID_HAS_SCROLLED));
    }

    ColLabelWin& colLabelWin_;
};

//----------------------------------------------------------------------------------------------------------------

//GridEventSink => repaint + wx events for the host
class DataGridWindow::EventBridge : public GridEventSink
{
public:
    explicit EventBridge(DataGridWindow& wnd) : wnd_(wnd) {}

    void onSortChanged(const SortState& sort) override
    {
        wnd_.requestUpdate();
        sendEvent(DataGridSortEvent(EVENT_DATAGRID_SORT_CHANGED, sort));
    }

    void onFilterChanged(const std::wstring& columnId, const ColumnFilter* filter) override
    {
        wnd_.requestUpdate();
        sendEvent(DataGridFilterEvent(EVENT_DATAGRID_FILTER_CHANGED, columnId, filter != nullptr));
    }

    void onPageChanged(size_t oldPage, size_t newPage, size_t pageSize, size_t totalRows) override
    {
        wnd_.Scroll(wnd_.GetViewStart().x, 0); //a new page starts at the top
        wnd_.requestUpdate();
        sendEvent(DataGridPageEvent(EVENT_DATAGRID_PAGE_CHANGED, oldPage, newPage, pageSize, totalRows));
    }

    void onEditCommitted(const EditCommit& commit) override
    {
        wnd_.requestUpdate();
        sendEvent(DataGridEditEvent(EVENT_DATAGRID_EDIT_COMMITTED, commit));
    }

    void onEditRefused(const std::wstring& columnId, const std::wstring& message) override
    {
        sendEvent(DataGridEditRefusedEvent(EVENT_DATAGRID_EDIT_REFUSED, columnId, message));
    }

    void onEditCancelled(const EditSession& session, bool forced) override
    {
        wnd_.hideEditor();
        wnd_.requestUpdate();
    }

    void onSelectionChanged(const std::vector<size_t>& rows) override
    {
        wnd_.mainWin_->Refresh();
        sendEvent(DataGridSelectionEvent(EVENT_DATAGRID_SELECTION_CHANGED, rows));
    }

    void onLayoutOverflow(int totalWidth, int viewportWidth) override { wnd_.requestUpdate(); } //horizontal scrollbar

    void onViewRebuilt(const ViewStats& stats) override
    {
        wnd_.requestUpdate();
        sendEvent(DataGridViewEvent(EVENT_DATAGRID_VIEW_REBUILT, stats));
    }

private:
    template <class T>
    void sendEvent(T&& event) { wnd_.GetEventHandler()->ProcessEvent(event); }

    DataGridWindow& wnd_;
};

//----------------------------------------------------------------------------------------------------------------

DataGridWindow::DataGridWindow(wxWindow* parent,
                               const GridConfig& cfg,
                               wxWindowID id,
                               const wxPoint& pos,
                               const wxSize& size,
                               long style,
                               const wxString& name) : wxScrolledWindow(parent, id, pos, size, style | wxWANTS_CHARS, name)
{
    grid_        = std::make_unique<DataGrid>(cfg, theme_, timer_);
    eventBridge_ = std::make_unique<EventBridge>(*this);
    grid_->setEventSink(eventBridge_.get());

    colLabelWin_ = new ColLabelWin(*this);                //owership handled by "this"
    mainWin_     = new MainWin    (*this, *colLabelWin_); //

    editor_ = new wxTextCtrl(mainWin_, wxID_ANY, wxString(), wxDefaultPosition, wxDefaultSize, wxTE_PROCESS_ENTER | wxBORDER_SIMPLE);
    editor_->Hide();

    editor_->Bind(wxEVT_TEXT_ENTER, [this](wxCommandEvent& event) { commitEditor(); });
    editor_->Bind(wxEVT_TEXT, [this](wxCommandEvent& event) { updatePendingValue(); });
    editor_->Bind(wxEVT_KEY_DOWN, [this](wxKeyEvent& event)
    {
        if (event.GetKeyCode() == WXK_ESCAPE)
            return cancelEditor();
        event.Skip();
    });
    editor_->Bind(wxEVT_KILL_FOCUS, [this](wxFocusEvent& event)
    {
        if (!inEditorUpdate_ && editor_->IsShown())
            commitEditor();
        event.Skip();
    });

    SetTargetWindow(mainWin_);

    SetInitialSize(size); //"Most controls will use this to set their initial size"

    Bind(wxEVT_PAINT, [this](wxPaintEvent& event) { wxPaintDC dc(this); });
    Bind(wxEVT_SIZE,  [this](wxSizeEvent&  event) { updateWindowSizes(); event.Skip(); });
    Bind(wxEVT_ERASE_BACKGROUND, [](wxEraseEvent& event) {}); //https://wiki.wxwidgets.org/Flicker-Free_Drawing

    Bind(wxEVT_KEY_DOWN, [this](wxKeyEvent& event) { onKeyDown(event); });
    Bind(EVENT_DATAGRID_NEEDS_UPDATE, [this](wxCommandEvent& event) { onRequestUpdate(event); });
}


DataGridWindow::~DataGridWindow()
{
    inEditorUpdate_ = true; //child windows are destroyed after grid_: no more commits
    grid_->setEventSink(nullptr);
}


int DataGridWindow::getColumnLabelHeight() const { return colLabelWin_->getColumnLabelHeight(); }


void DataGridWindow::updateWindowSizes()
{
    /* circular dependency:
        mainWin_->GetClientSize()
            /|\
        SetScrollbars -> show/hide scrollbars depending on whether client size is big enough
            /|\
        GetClientSize(); -> possibly trimmed by scrollbars                           */
    const wxSize mainWinSize(std::max(0, GetClientSize().GetWidth()),
                             std::max(0, GetClientSize().GetHeight() - getColumnLabelHeight()));

    colLabelWin_->SetSize(0, 0, mainWinSize.GetWidth(), getColumnLabelHeight());
    mainWin_    ->SetSize(0, getColumnLabelHeight(), mainWinSize.GetWidth(), mainWinSize.GetHeight());

    grid_->setViewport(mainWinSize.GetWidth(), mainWinSize.GetHeight()); //Fill columns and the virtual window follow the client size

    mainWin_->SetVirtualSize(grid_->getColumnLayout().totalWidth, grid_->getContentHeight()); //set before calling SetScrollRate()

    int ppsuX = 0; //pixel per scroll unit
    int ppsuY = 0;
    GetScrollPixelsPerUnit(&ppsuX, &ppsuY);

    const int ppsuNew = grid_->getVirtualizer().getRowHeight();
    if (ppsuX != ppsuNew || ppsuY != ppsuNew)
        SetScrollRate(ppsuNew, ppsuNew); //internally calls AdjustScrollbars() and GetVirtualSize()!

    AdjustScrollbars(); //showing/hiding scrollbars triggers a *synchronous* resize event => updateWindowSizes() recursion (2 levels at most)

    colLabelWin_->Refresh();
    mainWin_    ->Refresh();
}


wxSize DataGridWindow::GetSizeAvailableForScrollTarget(const wxSize& size)
{
    if (size.x <= 1 || size.y <= 1) //happens temporarily during initialization
        return {};

    return {size.GetWidth(), std::max(0, size.GetHeight() - getColumnLabelHeight())};
}


void DataGridWindow::scrollDelta(int deltaX, int deltaY)
{
    const wxPoint scrollPosOld = GetViewStart();

    wxPoint scrollPosNew = scrollPosOld;
    scrollPosNew.x += deltaX;
    scrollPosNew.y += deltaY;

    scrollPosNew.x = std::max(0, scrollPosNew.x); //wxScrollHelper::Scroll() will exit prematurely if input happens to be "-1"!
    scrollPosNew.y = std::max(0, scrollPosNew.y); //

    if (scrollPosNew != scrollPosOld)
        Scroll(scrollPosNew); //internally calls wxWindows::Update()!
}


void DataGridWindow::requestUpdate()
{
    if (!updatePending_)
    {
        updatePending_ = true;
        GetEventHandler()->AddPendingEvent(wxCommandEvent(EVENT_DATAGRID_NEEDS_UPDATE)); //asynchronously call onRequestUpdate()
    }
}


void DataGridWindow::onRequestUpdate(wxCommandEvent& event)
{
    updatePending_ = false;
    updateWindowSizes(); //content height and column widths may have changed
    positionEditor();
}


void DataGridWindow::onScrolled(wxCommandEvent& event)
{
    grid_->scrollTo(CalcUnscrolledPosition(wxPoint(0, 0)).y); //may force-cancel an edit in a recycled row
    positionEditor();
    mainWin_->Refresh();
}


void DataGridWindow::makeRowVisible(size_t row)
{
    const int rowHeight = grid_->getVirtualizer().getRowHeight();
    if (row >= grid_->getEffectiveRowCount())
        return;

    const int clientPosY = CalcScrolledPosition(wxPoint(0, static_cast<int>(row) * rowHeight)).y;
    if (clientPosY < 0)
        Scroll(GetViewStart().x, static_cast<int>(row));
    else if (clientPosY + rowHeight > mainWin_->GetClientSize().GetHeight())
    {
        grid_->scrollToRow(row); //minimal offset that shows the row completely
        Scroll(GetViewStart().x, numeric::intDivCeil(grid_->getScrollOffset(), rowHeight));
    }
}


std::optional<size_t> DataGridWindow::getRowAtWinPos(int posY) const
{
    if (const int absY = CalcUnscrolledPosition(wxPoint(0, posY)).y;
        absY >= 0)
        if (const size_t row = static_cast<size_t>(absY / grid_->getVirtualizer().getRowHeight());
            row < grid_->getEffectiveRowCount())
            return row;
    return std::nullopt;
}


const ColumnWidth* DataGridWindow::getColumnAtWinPos(int posX) const
{
    if (const int absX = CalcUnscrolledPosition(wxPoint(posX, 0)).x;
        absX >= 0)
    {
        int accWidth = 0;
        for (const ColumnWidth& cw : grid_->getColumnLayout().widths)
        {
            accWidth += cw.width;
            if (absX < accWidth)
                return &cw;
        }
    }
    return nullptr;
}


wxRect DataGridWindow::getCellArea(size_t row, const std::wstring& columnId) const
{
    const int rowHeight = grid_->getVirtualizer().getRowHeight();

    int posX = 0;
    for (const ColumnWidth& cw : grid_->getColumnLayout().widths)
    {
        if (cw.columnId == columnId)
        {
            const wxPoint topLeft = CalcScrolledPosition(wxPoint(posX, static_cast<int>(row) * rowHeight)); //logical -> window coordinates
            return wxRect(topLeft, wxSize(cw.width - dipToWxsize(1), rowHeight - dipToWxsize(1))); //keep cell border visible
        }
        posX += cw.width;
    }
    return wxRect();
}


void DataGridWindow::onCellClick(size_t row, const std::wstring& columnId, ActivationGesture gesture, const wxMouseEvent& me)
{
    try
    {
        if (gesture == ActivationGesture::singleTap &&
            grid_->getConfig().selectionMode == SelectionMode::multiple)
        {
            if (me.ShiftDown())
                return grid_->selectRange(std::min(selectionAnchor_, row), std::max(selectionAnchor_, row) + 1);

            if (me.ControlDown())
            {
                selectionAnchor_ = row;
                return grid_->selectRow(row, true /*addToSelection*/);
            }
        }

        selectionAnchor_ = row;
        if (grid_->activateCell(row, columnId, gesture)) //throw GridError
            showEditor();
        else if (!grid_->getEditSession())
            hideEditor();
    }
    catch (const GridError& e) { showError(e.toString()); }
}


void DataGridWindow::onColumnLabelClick(const std::wstring& columnId)
{
    if (isEditorShown())
        commitEditor();

    try
    {
        if (!grid_->toggleSort(columnId)) //throw GridError
            wxBell(); //column not sortable
    }
    catch (const GridError& e) { showError(e.toString()); }
}


void DataGridWindow::onColumnLabelContext(const std::wstring& columnId)
{
    const ColumnModel* col = findColumn(grid_->getColumns(), columnId);
    if (!col)
        return;

    auto tryRun = [this](const std::function<void()>& fun)
    {
        return [this, fun]
        {
            try { fun(); /*throw GridError*/ }
            catch (const GridError& e) { showError(e.toString()); }
        };
    };

    ContextMenu menu;
    //----------------------------------------------------------------------------------------
    menu.addItem(_("Sort ascending"),  tryRun([&] { grid_->setSort({{columnId, SortDirection::ascending }}); }), col->sortable);
    menu.addItem(_("Sort descending"), tryRun([&] { grid_->setSort({{columnId, SortDirection::descending}}); }), col->sortable);
    menu.addItem(_("Clear sorting"), [&] { grid_->clearSort(); }, !grid_->getSort().empty());
    //----------------------------------------------------------------------------------------
    std::vector<CellValue> candidates;
    if (col->filterable)
    {
        try
        {
            candidates = grid_->getFilterCandidates(columnId); //throw GridError
        }
        catch (const GridError& e) { return showError(e.toString()); }

        menu.addSeparator();

        const ColumnFilter* filter = grid_->getFilter(columnId);
        for (size_t i = 0; i < candidates.size() && i < FILTER_MENU_VALUES_MAX; ++i)
        {
            const CellValue& val = candidates[i];
            const bool accepted = !filter || !filter->acceptedValues || filter->acceptedValues->contains(val);

            menu.addCheckBox(isNull(val) ? _("(empty)") : formatCellValue(val), tryRun([&, val, accepted]
            {
                ColumnFilter newFilter = filter ? *filter : ColumnFilter();
                if (!newFilter.acceptedValues)
                    newFilter.acceptedValues.emplace(candidates.begin(), candidates.end());

                if (accepted)
                    newFilter.acceptedValues->erase(val);
                else
                    newFilter.acceptedValues->insert(val);

                grid_->setFilter(columnId, newFilter); //throw GridError
            }), accepted);
        }
        menu.addItem(_("Clear filter"), [&] { grid_->clearFilter(columnId); }, filter != nullptr);
    }
    //----------------------------------------------------------------------------------------
    menu.addSeparator();
    const bool isGroupCol = grid_->getGroupColumn() == columnId;
    menu.addCheckBox(_("Group by this column"), tryRun([&] { grid_->setGroupColumn(isGroupCol ? GroupState() : GroupState(columnId)); }), isGroupCol);
    menu.addItem(_("Hide column"), tryRun([&] { grid_->setColumnVisible(columnId, false); }));
    menu.addItem(_("Fit column widths to content"), [&] { grid_->remeasureAutoColumns(); });

    menu.popup(*colLabelWin_);
}


void DataGridWindow::onKeyDown(wxKeyEvent& event)
{
    const ptrdiff_t rowCount  = grid_->getEffectiveRowCount();
    const ptrdiff_t cursorRow = static_cast<ptrdiff_t>(selectionAnchor_);
    const ptrdiff_t pageRows  = std::max(1, mainWin_->GetClientSize().GetHeight() / grid_->getVirtualizer().getRowHeight());

    auto moveCursorTo = [&](ptrdiff_t row)
    {
        if (rowCount > 0)
        {
            selectionAnchor_ = static_cast<size_t>(std::clamp<ptrdiff_t>(row, 0, rowCount - 1));
            grid_->selectRow(selectionAnchor_);
            makeRowVisible(selectionAnchor_);
        }
    };

    try
    {
        switch (event.GetKeyCode())
        {
            case WXK_UP:
            case WXK_NUMPAD_UP:
                return moveCursorTo(cursorRow - 1);

            case WXK_DOWN:
            case WXK_NUMPAD_DOWN:
                return moveCursorTo(cursorRow + 1);

            case WXK_HOME:
            case WXK_NUMPAD_HOME:
                return moveCursorTo(0);

            case WXK_END:
            case WXK_NUMPAD_END:
                return moveCursorTo(rowCount - 1);

            case WXK_PAGEUP:
            case WXK_NUMPAD_PAGEUP:
                if (event.ControlDown())
                {
                    grid_->previousPage();
                    return;
                }
                return moveCursorTo(cursorRow - pageRows);

            case WXK_PAGEDOWN:
            case WXK_NUMPAD_PAGEDOWN:
                if (event.ControlDown())
                {
                    grid_->nextPage();
                    return;
                }
                return moveCursorTo(cursorRow + pageRows);

            case WXK_F2: //edit first editable column of the cursor row
                if (cursorRow < rowCount)
                    for (const ColumnWidth& cw : grid_->getColumnLayout().widths)
                        if (const ColumnModel* col = findColumn(grid_->getColumns(), cw.columnId);
                            col && col->editable)
                        {
                            makeRowVisible(cursorRow);
                            if (grid_->beginEdit(cursorRow, cw.columnId)) //throw GridError
                                showEditor();
                            return;
                        }
                return;

            case 'A':
                if (event.ControlDown())
                    return grid_->selectAll();
                break;

            case 'Z':
                if (event.ControlDown())
                {
                    if (!grid_->undo())
                        wxBell();
                    return;
                }
                break;

            case 'Y':
                if (event.ControlDown())
                {
                    if (!grid_->redo())
                        wxBell();
                    return;
                }
                break;
        }
    }
    catch (const GridError& e) { return showError(e.toString()); }

    event.Skip();
}


void DataGridWindow::showEditor()
{
    const EditSession* session = grid_->getEditSession();
    if (!session)
        return;

    inEditorUpdate_ = true;
    DGRID_ON_SCOPE_EXIT(inEditorUpdate_ = false);

    editor_->UnsetToolTip();
    editor_->ChangeValue(formatCellValue(session->pendingValue)); //no wxEVT_TEXT
    positionEditor();
    editor_->Show();
    editor_->SetFocus();
    editor_->SelectAll();
}


void DataGridWindow::hideEditor()
{
    if (editor_->IsShown())
    {
        inEditorUpdate_ = true;
        DGRID_ON_SCOPE_EXIT(inEditorUpdate_ = false);

        editor_->Hide();
        editor_->UnsetToolTip();
        mainWin_->SetFocus();
    }
}


void DataGridWindow::positionEditor()
{
    if (const EditSession* session = grid_->getEditSession())
    {
        const wxRect area = getCellArea(session->rowIndexAtEntry, session->columnId);
        if (!area.IsEmpty())
            editor_->SetSize(area);
    }
}


void DataGridWindow::updatePendingValue()
{
    if (inEditorUpdate_)
        return;

    if (const EditSession* session = grid_->getEditSession())
    {
        //keep the session's pending value in step with every keystroke: unparsable input keeps the last valid value
        if (const std::optional<CellValue> value = parseCellValue(editor_->GetValue().ToStdWstring(), session->originalValue))
        {
            grid_->setPendingValue(*value);
            editor_->UnsetToolTip();
        }
        else
            editor_->SetToolTip(replaceCpy(_("Invalid value for column %x."), L"%x", fmtColumn(session->columnId)));
    }
}


void DataGridWindow::commitEditor()
{
    const EditSession* session = grid_->getEditSession();
    if (!session)
        return hideEditor();

    const std::optional<CellValue> value = parseCellValue(editor_->GetValue().ToStdWstring(), session->originalValue);
    if (!value)
    {
        editor_->SetToolTip(replaceCpy(_("Invalid value for column %x."), L"%x", fmtColumn(session->columnId)));
        wxBell();
        return;
    }

    grid_->setPendingValue(*value);
    const CommitResult result = grid_->commitEdit();

    switch (result.status)
    {
        case CommitStatus::committed:
        case CommitStatus::noSession:
        case CommitStatus::itemExpired:
            hideEditor();
            break;

        case CommitStatus::validationFailed: //session stays open
        case CommitStatus::setterFailed:     //
            editor_->SetToolTip(result.message);
            wxBell();
            break;
    }
}


void DataGridWindow::cancelEditor()
{
    grid_->cancelEdit(); //=> EventBridge::onEditCancelled()
    hideEditor();
}


void DataGridWindow::showError(const std::wstring& msg)
{
    wxMessageBox(msg, _("Error"), wxOK | wxICON_ERROR, this);
}
