// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef DATA_GRID_WINDOW_H_2019384701928374
#define DATA_GRID_WINDOW_H_2019384701928374

#include <memory>
#include <wx/scrolwin.h>
#include <wx/textctrl.h>
#include <dgrid/data_grid.h>
#include "timer_scheduler.h"
#include "wx_theme.h"


//wxWidgets front end of dgrid::DataGrid: column labels, virtualized rows, in-place text editor
namespace dgrid
{
//------------------------ events ------------------------------------------------
struct DataGridSortEvent : public wxCommandEvent
{
    DataGridSortEvent(wxEventType et, const SortState& sort) : wxCommandEvent(et), sort_(sort) {}
    DataGridSortEvent* Clone() const override { return new DataGridSortEvent(*this); }

    const SortState sort_;
};

struct DataGridFilterEvent : public wxCommandEvent
{
    DataGridFilterEvent(wxEventType et, const std::wstring& columnId, bool active) : wxCommandEvent(et), columnId_(columnId), active_(active) {}
    DataGridFilterEvent* Clone() const override { return new DataGridFilterEvent(*this); }

    const std::wstring columnId_;
    const bool active_; //"false": filter was removed
};

struct DataGridPageEvent : public wxCommandEvent
{
    DataGridPageEvent(wxEventType et, size_t oldPage, size_t newPage, size_t pageSize, size_t totalRows) :
        wxCommandEvent(et), oldPage_(oldPage), newPage_(newPage), pageSize_(pageSize), totalRows_(totalRows) {}
    DataGridPageEvent* Clone() const override { return new DataGridPageEvent(*this); }

    const size_t oldPage_;
    const size_t newPage_;
    const size_t pageSize_;
    const size_t totalRows_;
};

struct DataGridEditEvent : public wxCommandEvent
{
    DataGridEditEvent(wxEventType et, const EditCommit& commit) : wxCommandEvent(et), commit_(commit) {}
    DataGridEditEvent* Clone() const override { return new DataGridEditEvent(*this); }

    const EditCommit commit_;
};

struct DataGridEditRefusedEvent : public wxCommandEvent
{
    DataGridEditRefusedEvent(wxEventType et, const std::wstring& columnId, const std::wstring& message) : wxCommandEvent(et), columnId_(columnId), message_(message) {}
    DataGridEditRefusedEvent* Clone() const override { return new DataGridEditRefusedEvent(*this); }

    const std::wstring columnId_;
    const std::wstring message_;
};

struct DataGridSelectionEvent : public wxCommandEvent
{
    DataGridSelectionEvent(wxEventType et, const std::vector<size_t>& rows) : wxCommandEvent(et), rows_(rows) {}
    DataGridSelectionEvent* Clone() const override { return new DataGridSelectionEvent(*this); }

    const std::vector<size_t> rows_; //effective sequence indexes
};

struct DataGridViewEvent : public wxCommandEvent
{
    DataGridViewEvent(wxEventType et, const ViewStats& stats) : wxCommandEvent(et), stats_(stats) {}
    DataGridViewEvent* Clone() const override { return new DataGridViewEvent(*this); }

    const ViewStats stats_;
};

wxDECLARE_EVENT(EVENT_DATAGRID_SORT_CHANGED,      DataGridSortEvent);
wxDECLARE_EVENT(EVENT_DATAGRID_FILTER_CHANGED,    DataGridFilterEvent);
wxDECLARE_EVENT(EVENT_DATAGRID_PAGE_CHANGED,      DataGridPageEvent);
wxDECLARE_EVENT(EVENT_DATAGRID_EDIT_COMMITTED,    DataGridEditEvent);
wxDECLARE_EVENT(EVENT_DATAGRID_EDIT_REFUSED,      DataGridEditRefusedEvent);
wxDECLARE_EVENT(EVENT_DATAGRID_SELECTION_CHANGED, DataGridSelectionEvent);
wxDECLARE_EVENT(EVENT_DATAGRID_VIEW_REBUILT,      DataGridViewEvent);

//example: grid.Bind(EVENT_DATAGRID_PAGE_CHANGED, [this](DataGridPageEvent& event) { onPageChanged(event); });

//------------------------------------------------------------------------------------------------------------

class DataGridWindow : public wxScrolledWindow
{
public:
    DataGridWindow(wxWindow* parent,
                   const GridConfig& cfg,
                   wxWindowID id      = wxID_ANY,
                   const wxPoint& pos = wxDefaultPosition,
                   const wxSize& size = wxDefaultSize,
                   long style         = wxTAB_TRAVERSAL | wxNO_BORDER,
                   const wxString& name = wxASCII_STR(wxPanelNameStr));
    ~DataGridWindow();

    DataGrid&       refGrid()       { return *grid_; } //changes are picked up via GridEventSink: no explicit refresh required
    const DataGrid& refGrid() const { return *grid_; }

    void makeRowVisible(size_t row);

    bool isEditorShown() const { return editor_->IsShown(); }

private:
    DataGridWindow           (const DataGridWindow&) = delete;
    DataGridWindow& operator=(const DataGridWindow&) = delete;

    class SubWindow;
    class ColLabelWin;
    class MainWin;
    class EventBridge;

    void updateWindowSizes();
    wxSize GetSizeAvailableForScrollTarget(const wxSize& size) override; //required since wxWidgets 3.1: scroll target is smaller than the window
    void scrollDelta(int deltaX, int deltaY); //unit: [rows]
    void requestUpdate(); //coalesce multiple notifications into one relayout
    void onRequestUpdate(wxCommandEvent& event);
    void onScrolled(wxCommandEvent& event);
    void onKeyDown(wxKeyEvent& event);

    std::optional<size_t> getRowAtWinPos(int posY) const; //effective sequence index
    const ColumnWidth* getColumnAtWinPos(int posX) const;
    wxRect getCellArea(size_t row, const std::wstring& columnId) const; //MainWin client coordinates; empty if not visible

    void onCellClick(size_t row, const std::wstring& columnId, ActivationGesture gesture, const wxMouseEvent& me);
    void onColumnLabelClick(const std::wstring& columnId);
    void onColumnLabelContext(const std::wstring& columnId);

    void showEditor();
    void hideEditor();
    void positionEditor();
    void updatePendingValue(); //wxEVT_TEXT: mirror editor text into the open session
    void commitEditor(); //refused commit keeps the editor open
    void cancelEditor();

    void showError(const std::wstring& msg);

    int getColumnLabelHeight() const;

    WxThemeProvider theme_{*this};
    WxTimerScheduler timer_;
    std::unique_ptr<DataGrid> grid_;
    std::unique_ptr<EventBridge> eventBridge_;

    ColLabelWin* colLabelWin_ = nullptr; //owership handled by "this"
    MainWin*     mainWin_     = nullptr; //
    wxTextCtrl*  editor_      = nullptr; //child of mainWin_

    size_t selectionAnchor_ = 0;
    bool updatePending_ = false;
    bool inEditorUpdate_ = false; //editor focus changes while we show/hide it
};
}

#endif //DATA_GRID_WINDOW_H_2019384701928374
