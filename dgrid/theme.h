// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef THEME_H_6120398471203984
#define THEME_H_6120398471203984

#include <cstdint>
#include <string>


namespace dgrid
{
struct Rgb
{
    uint8_t red   = 0;
    uint8_t green = 0;
    uint8_t blue  = 0;

    bool operator==(const Rgb&) const = default;
};


//read-only presentation capability supplied by the host: queried on demand, never cached as global state
struct ThemeProvider
{
    virtual ~ThemeProvider() {}

    virtual int getTextWidth(const std::wstring& text) const = 0; //pixel width using the current font
    virtual Rgb getAccentColor() const = 0;
    virtual int getCellPadding() const = 0; //per side
};
}

#endif //THEME_H_6120398471203984
