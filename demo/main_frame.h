// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef MAIN_FRAME_H_8810293847102938
#define MAIN_FRAME_H_8810293847102938

#include <optional>
#include <wx/button.h>
#include <wx/checkbox.h>
#include <wx/frame.h>
#include <wx/stattext.h>
#include <wx/textctrl.h>
#include <dgrid/item_source.h>
#include <wx+/data_grid_window.h>


namespace dgrid
{
const size_t DEMO_ITEM_COUNT_DEFAULT = 50'000;

struct Customer
{
    int64_t id = 0;
    std::wstring name;
    std::wstring email;
    std::optional<std::wstring> status; //std::nullopt: unknown
    double balance = 0;
};

std::vector<std::shared_ptr<Customer>> generateCustomers(size_t count); //deterministic
std::vector<ColumnModel> getCustomerColumns();


class MainFrame : public wxFrame
{
public:
    explicit MainFrame(size_t itemCount);

private:
    MainFrame           (const MainFrame&) = delete;
    MainFrame& operator=(const MainFrame&) = delete;

    void onFilterText    (wxCommandEvent& event);
    void onTogglePaging  (wxCommandEvent& event);
    void onToggleGrouping(wxCommandEvent& event);
    void onPagePrevious  (wxCommandEvent& event);
    void onPageNext      (wxCommandEvent& event);
    void onShowLog       (wxCommandEvent& event);

    void updateGui();

    std::shared_ptr<ItemList<Customer>> customers_;

    DataGridWindow* gridWin_       = nullptr;
    wxTextCtrl*     filterText_    = nullptr;
    wxCheckBox*     checkPaging_   = nullptr;
    wxCheckBox*     checkGrouping_ = nullptr;
    wxButton*       buttonPrev_    = nullptr;
    wxButton*       buttonNext_    = nullptr;
    wxStaticText*   pageLabel_     = nullptr;
};
}

#endif //MAIN_FRAME_H_8810293847102938
