// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef BASIC_MATH_H_2398471093847561348
#define BASIC_MATH_H_2398471093847561348

#include <cassert>
#include <concepts>
#include <type_traits>


namespace dgrid::numeric
{
template <std::integral N, std::integral D> auto intDivCeil (N numerator, D denominator); //non-negative only










//######################## implementation ########################
template <std::integral N, std::integral D> inline
auto intDivCeil(N num, D den)
{
    static_assert(std::is_signed_v<N> == std::is_signed_v<D>); //until further
    assert(den > 0 && num >= 0);
    return num == 0 ? 0 : (num - 1) / den + 1; //avoid overflow of (num + den - 1)
}
}

#endif //BASIC_MATH_H_2398471093847561348
