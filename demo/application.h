// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef APPLICATION_H_4019283740192834
#define APPLICATION_H_4019283740192834

#include <wx/app.h>


namespace dgrid
{
class Application : public wxApp
{
private:
    bool OnInit() override;
};
}

#endif //APPLICATION_H_4019283740192834
