// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CONTEXT_MENU_H_8812093740198237
#define CONTEXT_MENU_H_8812093740198237

#include <functional>
#include <memory>
#include <unordered_map>
#include <wx/app.h>
#include <wx/menu.h>


/*  popup menu with lambda callbacks:

        ContextMenu menu;
        menu.addItem(_("Clear sorting"), [&] { grid.clearSort(); }); -> captures must outlive ContextMenu::popup()
        menu.popup(wnd);                                                        */

namespace dgrid
{
class ContextMenu : private wxEvtHandler
{
public:
    ContextMenu() {}

    void addItem(const wxString& label, const std::function<void()>& command, bool enabled = true)
    {
        wxMenuItem* newItem = menu_->Append(wxID_ANY, label); //menu owns item!
        if (!enabled)
            newItem->Enable(false); //enable *after* appending
        commandList_[newItem->GetId()] = command;
    }

    void addCheckBox(const wxString& label, const std::function<void()>& command, bool checked, bool enabled = true)
    {
        wxMenuItem* newItem = menu_->AppendCheckItem(wxID_ANY, label);
        newItem->Check(checked);
        if (!enabled)
            newItem->Enable(false);
        commandList_[newItem->GetId()] = command;
    }

    void addSeparator() { menu_->AppendSeparator(); }

    void popup(wxWindow& wnd, const wxPoint& pos = wxDefaultPosition)
    {
        for (const auto& [itemId, command] : commandList_)
            menu_->Bind(wxEVT_COMMAND_MENU_SELECTED, [command = command](wxCommandEvent& event) { command(); }, itemId);

        wnd.PopupMenu(menu_.get(), pos);
        wxTheApp->ProcessPendingEvents(); //evaluate lambdas before captures go out of scope
    }

private:
    ContextMenu           (const ContextMenu&) = delete;
    ContextMenu& operator=(const ContextMenu&) = delete;

    std::unique_ptr<wxMenu> menu_ = std::make_unique<wxMenu>();
    std::unordered_map<int /*item id*/, std::function<void()>> commandList_;
};
}

#endif //CONTEXT_MENU_H_8812093740198237
