// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "cell_value.h"
#include <cassert>
#include <cmath>
#include <cwctype>
#include "string_tools.h"

using namespace dgrid;


namespace
{
enum class ValueClass
{
    null,
    number,
    text,
};

ValueClass getValueClass(const CellValue& val)
{
    if (isNull(val))
        return ValueClass::null;
    if (std::holds_alternative<std::wstring>(val))
        return ValueClass::text;
    return ValueClass::number;
}


std::weak_ordering compareNoCase(std::wstring_view lhs, std::wstring_view rhs)
{
    const size_t minLen = std::min(lhs.size(), rhs.size());
    for (size_t i = 0; i < minLen; ++i)
    {
        const wint_t charL = std::towlower(static_cast<wint_t>(lhs[i]));
        const wint_t charR = std::towlower(static_cast<wint_t>(rhs[i]));
        if (charL != charR)
            return charL <=> charR;
    }
    return lhs.size() <=> rhs.size();
}


std::optional<int64_t> getIntegerValue(const CellValue& val) //bool, int64_t
{
    if (const bool* b = std::get_if<bool>(&val))
        return *b ? 1 : 0;
    if (const int64_t* n = std::get_if<int64_t>(&val))
        return *n;
    return {};
}


//exact: a cast to double would round integers beyond 2^53 and break transitivity of "equivalent"
std::weak_ordering compareIntDouble(int64_t num, double dbl)
{
    if (std::isnan(dbl))
        return std::weak_ordering::less; //NaN after all numbers

    const double int64Bound = 9223372036854775808.0; //2^63: exactly representable
    if (dbl >= int64Bound)
        return std::weak_ordering::less;
    if (dbl < -int64Bound)
        return std::weak_ordering::greater;

    const double dblInt = std::trunc(dbl);
    if (const int64_t dblInt64 = static_cast<int64_t>(dblInt); //in range: [-2^63, 2^63)
        num != dblInt64)
        return num <=> dblInt64;

    const double fraction = dbl - dblInt; //exact
    if (fraction > 0) return std::weak_ordering::less;
    if (fraction < 0) return std::weak_ordering::greater;
    return std::weak_ordering::equivalent;
}
}


std::optional<double> dgrid::getNumericValue(const CellValue& val)
{
    if (const bool* b = std::get_if<bool>(&val))
        return *b ? 1.0 : 0.0;
    if (const int64_t* n = std::get_if<int64_t>(&val))
        return static_cast<double>(*n);
    if (const double* d = std::get_if<double>(&val))
        return *d;
    return {};
}


std::weak_ordering dgrid::compareNatural(std::wstring_view lhs, std::wstring_view rhs)
{
    const wchar_t* strL = lhs.data();
    const wchar_t* strR = rhs.data();

    const wchar_t* const strEndL = strL + lhs.size();
    const wchar_t* const strEndR = strR + rhs.size();
    /*  - compare strings after conceptually creating blocks of whitespace/numbers/text
        - implement strict weak ordering!                                               */
    for (;;)
    {
        if (strL == strEndL || strR == strEndR)
            return (strL != strEndL) <=> (strR != strEndR); //"nothing" before "something"
        //note: "something" never would have been condensed to "nothing" further below => can finish evaluation here

        const bool wsL = isWhiteSpace(*strL);
        const bool wsR = isWhiteSpace(*strR);
        if (wsL != wsR)
            return !wsL <=> !wsR; //whitespace before non-ws!
        if (wsL)
        {
            ++strL, ++strR;
            while (strL != strEndL && isWhiteSpace(*strL)) ++strL;
            while (strR != strEndR && isWhiteSpace(*strR)) ++strR;
            continue;
        }

        const bool digitL = isDigit(*strL);
        const bool digitR = isDigit(*strR);
        if (digitL != digitR)
            return !digitL <=> !digitR; //numbers before chars!
        if (digitL)
        {
            while (strL != strEndL && *strL == L'0') ++strL;
            while (strR != strEndR && *strR == L'0') ++strR;

            int rv = 0;
            for (;; ++strL, ++strR)
            {
                const bool endL = strL == strEndL || !isDigit(*strL);
                const bool endR = strR == strEndR || !isDigit(*strR);
                if (endL != endR)
                    return !endL <=> !endR; //more digits means bigger number
                if (endL)
                    break; //same number of digits

                if (rv == 0 && *strL != *strR)
                    rv = *strL - *strR; //found first digit difference comparing from left
            }
            if (rv != 0)
                return rv <=> 0;
            continue;
        }

        //compare full junks of text
        const wchar_t* textBeginL = strL++;
        const wchar_t* textBeginR = strR++; //current char is neither white space nor digit at this point!
        while (strL != strEndL && !isWhiteSpace(*strL) && !isDigit(*strL)) ++strL;
        while (strR != strEndR && !isWhiteSpace(*strR) && !isDigit(*strR)) ++strR;

        if (const std::weak_ordering cmp = compareNoCase({textBeginL, static_cast<size_t>(strL - textBeginL)},
                                                         {textBeginR, static_cast<size_t>(strR - textBeginR)});
            cmp != std::weak_ordering::equivalent)
            return cmp;
    }
}


std::weak_ordering dgrid::compareCellValues(const CellValue& lhs, const CellValue& rhs)
{
    const ValueClass classL = getValueClass(lhs);
    const ValueClass classR = getValueClass(rhs);
    if (classL != classR)
        return classL <=> classR;

    switch (classL)
    {
        case ValueClass::null:
            return std::weak_ordering::equivalent;

        case ValueClass::number:
        {
            const std::optional<int64_t> intL = getIntegerValue(lhs);
            const std::optional<int64_t> intR = getIntegerValue(rhs);

            if (intL && intR)
                return *intL <=> *intR;
            if (intL)
                return compareIntDouble(*intL, std::get<double>(rhs));
            if (intR)
                return 0 <=> compareIntDouble(*intR, std::get<double>(lhs));

            const double numL = std::get<double>(lhs);
            const double numR = std::get<double>(rhs);

            const bool nanL = std::isnan(numL);
            const bool nanR = std::isnan(numR);
            if (nanL || nanR)
                return nanL <=> nanR; //NaN after all numbers: keep strict weak ordering

            if (numL < numR) return std::weak_ordering::less;
            if (numR < numL) return std::weak_ordering::greater;
            return std::weak_ordering::equivalent;
        }

        case ValueClass::text:
            return compareNatural(std::get<std::wstring>(lhs), std::get<std::wstring>(rhs));
    }
    assert(false);
    return std::weak_ordering::equivalent;
}


std::weak_ordering dgrid::compareCellValues(const CellValue& lhs, const CellValue& rhs, NullOrder nullOrder)
{
    const bool nullL = isNull(lhs);
    const bool nullR = isNull(rhs);
    if (nullL || nullR)
        return nullOrder == NullOrder::first ?
               nullR <=> nullL :
               nullL <=> nullR;

    return compareCellValues(lhs, rhs);
}


std::wstring dgrid::formatCellValue(const CellValue& val)
{
    return std::visit([](const auto& v) -> std::wstring
    {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, std::monostate>)
            return std::wstring();
        else if constexpr (std::is_same_v<T, bool>)
            return v ? L"true" : L"false";
        else if constexpr (std::is_same_v<T, int64_t>)
            return numberTo<std::wstring>(v);
        else if constexpr (std::is_same_v<T, double>)
        {
            if (std::isnan(v))
                return L"NaN";
            if (std::isinf(v))
                return v < 0 ? L"-inf" : L"inf";

            char buffer[64];
            const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), v, std::chars_format::general, 6);
            if (rv.ec != std::errc())
                return std::wstring();
            return std::wstring(buffer, rv.ptr); //"general" format already omits trailing zeros
        }
        else
        {
            static_assert(std::is_same_v<T, std::wstring>);
            return v;
        }
    }, val);
}


std::optional<CellValue> dgrid::parseCellValue(const std::wstring& text, const CellValue& typeHint)
{
    if (std::holds_alternative<std::wstring>(typeHint))
        return text;

    const std::wstring trm = trimCpy(text);
    if (trm.empty())
        return CellValue();

    if (std::holds_alternative<bool>(typeHint))
    {
        if (trm == L"1" || compareNatural(trm, L"true") == 0)
            return true;
        if (trm == L"0" || compareNatural(trm, L"false") == 0)
            return false;
        return std::nullopt;
    }

    const std::string narrow = utfToNarrow(trm);
    const char* first = narrow.c_str();
    const char* last  = first + narrow.size();

    if (std::holds_alternative<int64_t>(typeHint))
    {
        int64_t num = 0;
        const std::from_chars_result rv = std::from_chars(first, last, num);
        if (rv.ec != std::errc() || rv.ptr != last)
            return std::nullopt;
        return num;
    }

    if (std::holds_alternative<double>(typeHint))
    {
        double num = 0;
        const std::from_chars_result rv = std::from_chars(first, last, num);
        if (rv.ec != std::errc() || rv.ptr != last)
            return std::nullopt;
        return num;
    }

    assert(isNull(typeHint)); //unknown type: keep text
    return trm;
}
