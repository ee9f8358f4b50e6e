// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef GRID_ERROR_H_5710923847561023
#define GRID_ERROR_H_5710923847561023

#include <stdexcept>
#include <string>
#include "string_tools.h"


namespace dgrid
{
class GridError //invalid host input: column declarations, unknown column ids, bad paging parameters
{
public:
    explicit GridError(const std::wstring& msg) : msg_(msg) {}
    GridError(const std::wstring& msg, const std::wstring& details) : msg_(msg + L"\n\n" + details) {}
    virtual ~GridError() {}

    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};


//structural invariant violated inside the grid itself => no sound continuation
#define DGRID_CONTRACT_CHECK(cond) \
    do { if (!(cond)) throw std::logic_error("Contract violation! " + std::string(__FILE__) + ":" + dgrid::numberTo<std::string>(__LINE__)); } while (false)

//----------- facilitate usage of std::wstring for error messages --------------------

inline std::wstring fmtColumn(const std::wstring& columnId) { return L'"' + columnId + L'"'; }
}

#endif //GRID_ERROR_H_5710923847561023
