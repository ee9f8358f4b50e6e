// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef WX_THEME_H_7734019283740192
#define WX_THEME_H_7734019283740192

#include <wx/window.h>
#include <dgrid/theme.h>


namespace dgrid
{
//theme queries answered by the hosting window: font metrics and system colors are looked up on every call
class WxThemeProvider : public ThemeProvider
{
public:
    explicit WxThemeProvider(wxWindow& wnd) : wnd_(wnd) {}

    int getTextWidth(const std::wstring& text) const override;
    Rgb getAccentColor() const override;
    int getCellPadding() const override;

private:
    wxWindow& wnd_;
};
}

#endif //WX_THEME_H_7734019283740192
