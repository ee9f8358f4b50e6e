// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ERROR_LOG_H_2367109845712309
#define ERROR_LOG_H_2367109845712309

#include <ctime>
#include <iterator>
#include <vector>
#include "i18n.h"
#include "string_tools.h"


namespace dgrid
{
enum MessageType
{
    MSG_TYPE_INFO    = 0x1,
    MSG_TYPE_WARNING = 0x2,
    MSG_TYPE_ERROR   = 0x4,
};

struct LogEntry
{
    time_t      time = 0; //of the latest occurrence
    MessageType type = MSG_TYPE_ERROR;
    std::wstring message;
    size_t repeatCount = 1; //identical consecutive messages are merged: a failing getter reports on every rebuild
};

using ErrorLog = std::vector<LogEntry>;

const size_t ERROR_LOG_ENTRIES_MAX = 1000; //oldest entries are dropped

void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time = std::time(nullptr));

struct ErrorLogStats
{
    int info    = 0;
    int warning = 0;
    int error   = 0;
};
ErrorLogStats getStats(const ErrorLog& log); //merged repetitions count once

std::wstring formatMessage(const LogEntry& entry); //"[HH:MM:SS]  Warning:  text", ends with a newline







//######################## implementation ##########################
inline
void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time)
{
    if (!log.empty() &&
        log.back().type    == type &&
        log.back().message == msg)
    {
        ++log.back().repeatCount;
        log.back().time = time;
        return;
    }

    if (log.size() >= ERROR_LOG_ENTRIES_MAX)
        log.erase(log.begin(), log.begin() + (log.size() - ERROR_LOG_ENTRIES_MAX + 1));

    log.push_back({time, type, msg});
}


inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats stats;
    for (const LogEntry& entry : log)
        if (entry.type == MSG_TYPE_INFO)
            ++stats.info;
        else if (entry.type == MSG_TYPE_WARNING)
            ++stats.warning;
        else
            ++stats.error;
    return stats;
}


namespace impl
{
inline
std::wstring getTypeLabel(MessageType type)
{
    switch (type)
    {
        case MSG_TYPE_INFO:
            return _("Info");
        case MSG_TYPE_WARNING:
            return _("Warning");
        case MSG_TYPE_ERROR:
            break;
    }
    return _("Error");
}


inline
std::wstring formatClockTime(time_t time)
{
    std::tm tc = {};
    if (!::localtime_r(&time, &tc))
        return L"--:--:--";

    wchar_t buf[16] = {};
    return std::wstring(buf, std::wcsftime(buf, std::size(buf), L"%H:%M:%S", &tc));
}
}


inline
std::wstring formatMessage(const LogEntry& entry)
{
    std::wstring output = L'[' + impl::formatClockTime(entry.time) + L"]  " + impl::getTypeLabel(entry.type) + L":  ";
    const size_t indent = output.size();

    bool lineBreak = false;
    for (const wchar_t c : trimCpy(entry.message))
        if (c == L'\n')
            lineBreak = true; //collapse empty lines
        else
        {
            if (lineBreak)
            {
                output += L'\n';
                output.append(indent, L' ');
                lineBreak = false;
            }
            output += c;
        }

    if (entry.repeatCount > 1)
        output += L" (" + _P("repeated once", "repeated %x times", static_cast<int64_t>(entry.repeatCount - 1)) + L')';

    output += L'\n';
    return output;
}
}

#endif //ERROR_LOG_H_2367109845712309
