// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "debounce.h"

using namespace dgrid;


void FilterDebouncer::post(const std::wstring& columnId, const std::wstring& text)
{
    pending_[columnId] = text;
    timer_.start(delay_, [this] { flush(); }); //restart: only the last keystroke counts
}


void FilterDebouncer::flush()
{
    timer_.stop();

    std::map<std::wstring, std::wstring> pending;
    pending.swap(pending_); //apply_() may post() again

    for (const auto& [columnId, text] : pending)
        apply_(columnId, text); //throw X
}


void FilterDebouncer::cancel()
{
    timer_.stop();
    pending_.clear();
}


void FilterDebouncer::cancel(const std::wstring& columnId)
{
    pending_.erase(columnId);
    if (pending_.empty())
        timer_.stop();
}


const std::wstring* FilterDebouncer::getPendingText(const std::wstring& columnId) const
{
    auto it = pending_.find(columnId);
    return it != pending_.end() ? &it->second : nullptr;
}
