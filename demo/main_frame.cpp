// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "main_frame.h"
#include <cmath>
#include <iterator>
#include <random>
#include <wx/msgdlg.h>
#include <wx/panel.h>
#include <wx/sizer.h>
#include <wx/statusbr.h>
#include <dgrid/i18n.h>

using namespace dgrid;


namespace
{
const size_t LOG_ENTRIES_SHOWN_MAX = 30;

enum StatusField
{
    STATUS_ROWS,
    STATUS_SELECTION,
    STATUS_BALANCE,
    STATUS_FIELD_COUNT
};
}


std::vector<std::shared_ptr<Customer>> dgrid::generateCustomers(size_t count)
{
    const wchar_t* firstNames[] = { L"Ada", L"Brian", L"Chen", L"Dana", L"Emil", L"Fatima", L"Grace", L"Hiro", L"Ines", L"Jonas", L"Kofi", L"Lena" };
    const wchar_t* lastNames [] = { L"Andersen", L"Bauer", L"Costa", L"Dubois", L"Eriksson", L"Fischer", L"Garcia", L"Hansen", L"Ito", L"Jensen" };
    const wchar_t* statuses  [] = { L"Active", L"Inactive", L"Pending" };

    std::mt19937 rng(42); //fixed seed: same data on every run
    std::uniform_real_distribution<double> balanceDist(-500, 10'000);

    std::vector<std::shared_ptr<Customer>> output;
    output.reserve(count);

    for (size_t i = 0; i < count; ++i)
    {
        auto c = std::make_shared<Customer>();
        c->id = static_cast<int64_t>(i + 1);

        const std::wstring first = firstNames[rng() % std::size(firstNames)];
        const std::wstring last  = lastNames [rng() % std::size(lastNames)];
        c->name  = first + L' ' + last;
        c->email = first + L'.' + last + numberTo<std::wstring>(c->id) + L"@example.com";

        if (i % 17 != 16)
            c->status = statuses[rng() % std::size(statuses)];

        c->balance = std::round(balanceDist(rng) * 100) / 100;
        output.push_back(std::move(c));
    }
    return output;
}


std::vector<ColumnModel> dgrid::getCustomerColumns()
{
    std::vector<ColumnModel> columns;

    ColumnModel colId = makeColumn<Customer>(L"id", _("ID"), [](const Customer& c) { return CellValue(c.id); });
    colId.sizing.policy = SizingPolicy::fixed;
    colId.sizing.fixedWidth = 70;
    colId.aggregate = AggregateType::count;
    colId.filterable = false;
    columns.push_back(colId);

    ColumnModel colName = makeColumn<Customer>(L"name", _("Name"), [](const Customer& c) { return CellValue(c.name); });
    colName.sizing.policy = SizingPolicy::autoSize;
    columns.push_back(colName);

    ColumnModel colEmail = makeEditableColumn<Customer>(L"email", _("Email"),
                                                        [](const Customer& c) { return CellValue(c.email); },
                                                        [](Customer& c, const CellValue& value) { c.email = std::get<std::wstring>(value); }); //throw std::bad_variant_access
    colEmail.sizing.policy = SizingPolicy::fill;
    colEmail.sizing.fillWeight = 2;
    colEmail.sizing.minWidth = 120;
    colEmail.validator = [](const void* item, const CellValue& value)
    {
        const std::wstring* email = std::get_if<std::wstring>(&value);
        if (!email || !contains(*email, L"@"))
            return ValidationResult{false, _("An email address must contain \"@\".")};
        return ValidationResult();
    };
    columns.push_back(colEmail);

    ColumnModel colStatus = makeColumn<Customer>(L"status", _("Status"), [](const Customer& c) { return c.status ? CellValue(*c.status) : CellValue(); });
    colStatus.sizing.policy = SizingPolicy::fitHeader;
    colStatus.sizing.minWidth = 90;
    columns.push_back(colStatus);

    ColumnModel colBalance = makeEditableColumn<Customer>(L"balance", _("Balance"),
                                                          [](const Customer& c) { return CellValue(c.balance); },
                                                          [](Customer& c, const CellValue& value) { c.balance = getNumericValue(value).value(); }); //throw std::bad_optional_access
    colBalance.sizing.policy = SizingPolicy::fixed;
    colBalance.sizing.fixedWidth = 110;
    colBalance.aggregate = AggregateType::sum;
    colBalance.validator = [](const void* item, const CellValue& value)
    {
        if (!getNumericValue(value))
            return ValidationResult{false, _("Please enter a number.")};
        return ValidationResult();
    };
    columns.push_back(colBalance);

    return columns;
}

//------------------------------------------------------------------------------------------

MainFrame::MainFrame(size_t itemCount) :
    wxFrame(nullptr, wxID_ANY, _("Data Grid Demo"), wxDefaultPosition, wxSize(900, 650)),
    customers_(std::make_shared<ItemList<Customer>>(generateCustomers(itemCount)))
{
    GridConfig cfg;
    cfg.selectionMode = SelectionMode::multiple;
    cfg.pageSize = 100;

    wxPanel* panel = new wxPanel(this);

    filterText_    = new wxTextCtrl(panel, wxID_ANY);
    filterText_->SetHint(_("Filter by name"));
    checkPaging_   = new wxCheckBox(panel, wxID_ANY, _("Paging"));
    checkGrouping_ = new wxCheckBox(panel, wxID_ANY, _("Group by status"));
    buttonPrev_    = new wxButton(panel, wxID_ANY, L"<", wxDefaultPosition, wxDefaultSize, wxBU_EXACTFIT);
    buttonNext_    = new wxButton(panel, wxID_ANY, L">", wxDefaultPosition, wxDefaultSize, wxBU_EXACTFIT);
    pageLabel_     = new wxStaticText(panel, wxID_ANY, wxString());
    wxButton* buttonLog = new wxButton(panel, wxID_ANY, _("Show log"));

    gridWin_ = new DataGridWindow(panel, cfg);

    wxBoxSizer* toolbar = new wxBoxSizer(wxHORIZONTAL);
    toolbar->Add(filterText_,    1, wxALIGN_CENTER_VERTICAL | wxALL, 5);
    toolbar->Add(checkGrouping_, 0, wxALIGN_CENTER_VERTICAL | wxALL, 5);
    toolbar->Add(checkPaging_,   0, wxALIGN_CENTER_VERTICAL | wxALL, 5);
    toolbar->Add(buttonPrev_,    0, wxALIGN_CENTER_VERTICAL | wxALL, 5);
    toolbar->Add(pageLabel_,     0, wxALIGN_CENTER_VERTICAL | wxALL, 5);
    toolbar->Add(buttonNext_,    0, wxALIGN_CENTER_VERTICAL | wxALL, 5);
    toolbar->Add(buttonLog,      0, wxALIGN_CENTER_VERTICAL | wxALL, 5);

    wxBoxSizer* mainSizer = new wxBoxSizer(wxVERTICAL);
    mainSizer->Add(toolbar, 0, wxEXPAND);
    mainSizer->Add(gridWin_, 1, wxEXPAND);
    panel->SetSizer(mainSizer);

    CreateStatusBar(STATUS_FIELD_COUNT);

    filterText_   ->Bind(wxEVT_TEXT,     [this](wxCommandEvent& event) { onFilterText    (event); });
    checkPaging_  ->Bind(wxEVT_CHECKBOX, [this](wxCommandEvent& event) { onTogglePaging  (event); });
    checkGrouping_->Bind(wxEVT_CHECKBOX, [this](wxCommandEvent& event) { onToggleGrouping(event); });
    buttonPrev_   ->Bind(wxEVT_BUTTON,   [this](wxCommandEvent& event) { onPagePrevious  (event); });
    buttonNext_   ->Bind(wxEVT_BUTTON,   [this](wxCommandEvent& event) { onPageNext      (event); });
    buttonLog     ->Bind(wxEVT_BUTTON,   [this](wxCommandEvent& event) { onShowLog       (event); });

    gridWin_->Bind(EVENT_DATAGRID_VIEW_REBUILT,      [this](DataGridViewEvent&      event) { updateGui(); });
    gridWin_->Bind(EVENT_DATAGRID_PAGE_CHANGED,      [this](DataGridPageEvent&      event) { updateGui(); });
    gridWin_->Bind(EVENT_DATAGRID_SELECTION_CHANGED, [this](DataGridSelectionEvent& event) { updateGui(); });
    gridWin_->Bind(EVENT_DATAGRID_EDIT_REFUSED,      [this](DataGridEditRefusedEvent& event) { SetStatusText(event.message_, STATUS_SELECTION); });

    DataGrid& grid = gridWin_->refGrid();
    grid.setColumns(getCustomerColumns()); //throw GridError: static column set => let it crash if invalid
    grid.setItemSource(customers_);

    updateGui();
}


void MainFrame::updateGui()
{
    const DataGrid& grid = gridWin_->refGrid();
    const ViewStats& stats = grid.getViewStats();

    std::wstring rowsText = _P("%x row", "%x rows", stats.itemRows);
    if (stats.filteredOut > 0)
        rowsText += L" (" + _P("%x filtered out", "%x filtered out", stats.filteredOut) + L")";
    if (stats.groupCount > 0)
        rowsText += L", " + _P("%x group", "%x groups", stats.groupCount);
    SetStatusText(rowsText, STATUS_ROWS);

    SetStatusText(_P("%x selected", "%x selected", grid.getSelectedRows().size()), STATUS_SELECTION);
    SetStatusText(_("Total balance:") + L' ' + formatCellValue(grid.getAggregate(L"balance")), STATUS_BALANCE);

    const bool paging = grid.isPagingEnabled();
    buttonPrev_->Enable(paging && grid.getCurrentPage() > 0);
    buttonNext_->Enable(paging && grid.getCurrentPage() + 1 < grid.getPageCount());
    pageLabel_->SetLabel(paging ? replaceCpy(replaceCpy(_("Page %x of %y"), L"%x", formatNumber(grid.getCurrentPage() + 1)),
                                             L"%y", formatNumber(grid.getPageCount())) : std::wstring());
    Layout();
}


void MainFrame::onFilterText(wxCommandEvent& event)
{
    gridWin_->refGrid().setFilterText(L"name", filterText_->GetValue().ToStdWstring()); //debounced: applied after the last keystroke
}


void MainFrame::onTogglePaging(wxCommandEvent& event)
{
    gridWin_->refGrid().setPagingEnabled(checkPaging_->GetValue());
    updateGui();
}


void MainFrame::onToggleGrouping(wxCommandEvent& event)
{
    gridWin_->refGrid().setGroupColumn(checkGrouping_->GetValue() ? GroupState(L"status") : GroupState()); //throw GridError: known column
}


void MainFrame::onPagePrevious(wxCommandEvent& event) { gridWin_->refGrid().previousPage(); }
void MainFrame::onPageNext    (wxCommandEvent& event) { gridWin_->refGrid().nextPage(); }


void MainFrame::onShowLog(wxCommandEvent& event)
{
    const ErrorLog& log = gridWin_->refGrid().getErrorLog();

    std::wstring msg;
    const size_t first = log.size() > LOG_ENTRIES_SHOWN_MAX ? log.size() - LOG_ENTRIES_SHOWN_MAX : 0;
    for (size_t i = first; i < log.size(); ++i)
        msg += formatMessage(log[i]);

    if (msg.empty())
        msg = _("No messages.");

    wxMessageBox(msg, _("Log"), wxOK | wxICON_INFORMATION, this);
}
