// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TIMER_SCHEDULER_H_3309128374012938
#define TIMER_SCHEDULER_H_3309128374012938

#include <utility>
#include <wx/timer.h>
#include <dgrid/debounce.h>


namespace dgrid
{
//one-shot wxTimer: callback runs in the GUI event loop
class WxTimerScheduler : public TimerScheduler
{
public:
    WxTimerScheduler() { timer_.Bind(wxEVT_TIMER, [this](wxTimerEvent& event) { onTimerEvent(event); }); }
    ~WxTimerScheduler() { timer_.Stop(); }

    void start(std::chrono::milliseconds delay, const std::function<void()>& callback) override
    {
        callback_ = callback;
        timer_.StartOnce(static_cast<int>(delay.count()) /*unit: [ms]*/); //restarts a running timer
    }

    void stop() override
    {
        timer_.Stop();
        callback_ = nullptr;
    }

    bool isRunning() const override { return timer_.IsRunning(); }

private:
    WxTimerScheduler           (const WxTimerScheduler&) = delete;
    WxTimerScheduler& operator=(const WxTimerScheduler&) = delete;

    void onTimerEvent(wxTimerEvent& event)
    {
        if (auto cb = std::exchange(callback_, nullptr)) //callback may restart the timer
            cb();
    }

    wxTimer timer_; //don't use wxWidgets' idle handling => repeated idle requests/consumption hogs 100% cpu!
    std::function<void()> callback_;
};
}

#endif //TIMER_SCHEDULER_H_3309128374012938
