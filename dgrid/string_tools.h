// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_7340981347213958
#define STRING_TOOLS_H_7340981347213958

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cwctype>
#include <string>
#include <string_view>
#include <vector>


//wide-string helpers used for cell text: the grid only ever displays std::wstring
namespace dgrid
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only, unlike std::iswdigit()

bool contains      (std::wstring_view str, std::wstring_view term);
bool containsNoCase(std::wstring_view str, std::wstring_view term); //Unicode-aware via std::towlower()

[[nodiscard]] std::wstring trimCpy(std::wstring_view str);

[[nodiscard]] std::wstring replaceCpy(std::wstring str, std::wstring_view oldTerm, std::wstring_view newTerm);

template <class S, class Num> S numberTo(Num number); //S: std::string or std::wstring
std::wstring formatNumber(int64_t n); //thousands separators are left to the host

[[nodiscard]] std::string  utfToNarrow(std::wstring_view str); //UTF-8 encode (wchar_t is UCS-4 on Linux)
[[nodiscard]] std::wstring utfToWide  (std::string_view  str); //UTF-8 decode: invalid sequences => U+FFFD






//######################## implementation ########################
template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    //do not trip on UTF-8 continuation bytes: consider ASCII only
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f' || c == 0xa0 /*NBSP*/;
}


template <class Char> inline
bool isDigit(Char c)
{
    return static_cast<Char>('0') <= c && c <= static_cast<Char>('9');
}


inline
bool contains(std::wstring_view str, std::wstring_view term)
{
    return str.find(term) != std::wstring_view::npos;
}


inline
bool containsNoCase(std::wstring_view str, std::wstring_view term)
{
    if (term.empty())
        return true;

    return std::search(str.begin(), str.end(), term.begin(), term.end(), [](wchar_t lhs, wchar_t rhs)
    {
        return std::towlower(static_cast<wint_t>(lhs)) == std::towlower(static_cast<wint_t>(rhs));
    }) != str.end();
}


inline
std::wstring trimCpy(std::wstring_view str)
{
    auto itFirst = std::find_if_not(str.begin(), str.end(), [](wchar_t c) { return isWhiteSpace(c); });
    auto itLast  = std::find_if_not(str.rbegin(), std::make_reverse_iterator(itFirst), [](wchar_t c) { return isWhiteSpace(c); }).base();
    return std::wstring(itFirst, itLast);
}


inline
std::wstring replaceCpy(std::wstring str, std::wstring_view oldTerm, std::wstring_view newTerm)
{
    if (oldTerm.empty())
        return str;

    for (size_t pos = 0; (pos = str.find(oldTerm, pos)) != std::wstring::npos; pos += newTerm.size())
        str.replace(pos, oldTerm.size(), newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(Num number)
{
    static_assert(std::is_arithmetic_v<Num>);

    char buffer[64];
    const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), number);
    if (rv.ec != std::errc())
        return S();

    return S(buffer, rv.ptr); //digits are ASCII: char -> wchar_t is lossless
}


inline
std::wstring formatNumber(int64_t n)
{
    return numberTo<std::wstring>(n);
}


inline
std::string utfToNarrow(std::wstring_view str)
{
    std::string output;
    output.reserve(str.size());

    for (const wchar_t wc : str)
    {
        const auto cp = static_cast<uint32_t>(wc);
        if (cp < 0x80)
            output += static_cast<char>(cp);
        else if (cp < 0x800)
        {
            output += static_cast<char>(0xc0 | (cp >> 6));
            output += static_cast<char>(0x80 | (cp & 0x3f));
        }
        else if (cp < 0x10000)
        {
            output += static_cast<char>(0xe0 | (cp >> 12));
            output += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
            output += static_cast<char>(0x80 | (cp & 0x3f));
        }
        else
        {
            output += static_cast<char>(0xf0 | (cp >> 18));
            output += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
            output += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
            output += static_cast<char>(0x80 | (cp & 0x3f));
        }
    }
    return output;
}


inline
std::wstring utfToWide(std::string_view str)
{
    std::wstring output;
    output.reserve(str.size());

    for (auto it = str.begin(); it != str.end(); )
    {
        const auto lead = static_cast<unsigned char>(*it++);

        size_t trailCount = 0;
        uint32_t cp = 0;
        if (lead < 0x80)
            cp = lead;
        else if ((lead & 0xe0) == 0xc0)
        {
            cp = lead & 0x1f;
            trailCount = 1;
        }
        else if ((lead & 0xf0) == 0xe0)
        {
            cp = lead & 0x0f;
            trailCount = 2;
        }
        else if ((lead & 0xf8) == 0xf0)
        {
            cp = lead & 0x07;
            trailCount = 3;
        }
        else
        {
            output += L'\ufffd';
            continue;
        }

        bool valid = true;
        for (; trailCount > 0; --trailCount)
        {
            if (it == str.end() || (static_cast<unsigned char>(*it) & 0xc0) != 0x80)
            {
                valid = false;
                break;
            }
            cp = (cp << 6) | (static_cast<unsigned char>(*it++) & 0x3f);
        }
        output += valid ? static_cast<wchar_t>(cp) : L'\ufffd';
    }
    return output;
}
}

#endif //STRING_TOOLS_H_7340981347213958
