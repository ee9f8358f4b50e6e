// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "wx_theme.h"
#include <wx/dcclient.h>
#include <wx/settings.h>
#include "dc.h"

using namespace dgrid;


namespace
{
const int CELL_PADDING_DIP = 4; //left + right each
}


int WxThemeProvider::getTextWidth(const std::wstring& text) const
{
    if (text.empty())
        return 0;

    wxClientDC dc(&wnd_);
    dc.SetFont(wnd_.GetFont()); //harmonize with DataGridWindow::MainWin::render()
    return dc.GetTextExtent(text).GetWidth();
}


Rgb WxThemeProvider::getAccentColor() const
{
    return toRgb(wxSystemSettings::GetColour(wxSYS_COLOUR_HIGHLIGHT));
}


int WxThemeProvider::getCellPadding() const
{
    return dipToWxsize(CELL_PADDING_DIP);
}
