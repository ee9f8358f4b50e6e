// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "application.h"
#include <algorithm>
#include <iostream>
#include <dgrid/i18n.h>
#include <dgrid/string_tools.h>
#include "main_frame.h"

using namespace dgrid;


IMPLEMENT_APP(Application)


bool Application::OnInit()
{
    //do not call wxApp::OnInit() to avoid using wxWidgets command line parser

    size_t itemCount = DEMO_ITEM_COUNT_DEFAULT;
    if (argc > 1)
    {
        const std::wstring arg = argv[1].ToStdWstring();
        if (arg.empty() || arg.size() > 9 || !std::all_of(arg.begin(), arg.end(), [](wchar_t c) { return isDigit(c); }))
        {
            std::cerr << utfToNarrow(_("Error") + L": " + replaceCpy(_("Invalid item count %x."), L"%x", arg)) + '\n';
            return false;
        }
        itemCount = std::stoul(arg);
    }

    MainFrame* frame = new MainFrame(itemCount); //ownership passed to wxWidgets
    frame->Show();
    SetTopWindow(frame);
    return true;
}
