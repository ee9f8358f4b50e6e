// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef DEBOUNCE_H_5809123740981237
#define DEBOUNCE_H_5809123740981237

#include <chrono>
#include <functional>
#include <map>
#include <string>


namespace dgrid
{
//one-shot timer firing on the UI thread
struct TimerScheduler
{
    virtual ~TimerScheduler() {}

    virtual void start(std::chrono::milliseconds delay, const std::function<void()>& callback) = 0; //replaces a pending callback
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;
};


//coalesce rapid filter-text input: every keystroke restarts the timer, only the last text per column is applied
class FilterDebouncer
{
public:
    using ApplyFilterText = std::function<void(const std::wstring& columnId, const std::wstring& text)>;

    FilterDebouncer(TimerScheduler& timer, std::chrono::milliseconds delay, const ApplyFilterText& apply) : timer_(timer), delay_(delay), apply_(apply) {}
    ~FilterDebouncer() { cancel(); }

    void post(const std::wstring& columnId, const std::wstring& text);

    void flush(); //apply pending texts now
    void cancel(); //drop pending texts
    void cancel(const std::wstring& columnId); //

    bool isPending() const { return !pending_.empty(); }
    const std::wstring* getPendingText(const std::wstring& columnId) const;

private:
    FilterDebouncer           (const FilterDebouncer&) = delete;
    FilterDebouncer& operator=(const FilterDebouncer&) = delete;

    TimerScheduler& timer_;
    const std::chrono::milliseconds delay_;
    const ApplyFilterText apply_;

    std::map<std::wstring /*columnId*/, std::wstring> pending_;
};
}

#endif //DEBOUNCE_H_5809123740981237
