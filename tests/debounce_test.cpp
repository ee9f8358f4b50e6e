// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include <dgrid/debounce.h>
#include "test_tools.h"

using namespace dgrid;
using namespace dgrid::test;


namespace
{
class debounce : public testing::Test
{
protected:
    ManualTimer timer_;
    std::vector<std::pair<std::wstring, std::wstring>> applied_;
    FilterDebouncer debouncer_{timer_, std::chrono::milliseconds(300), [this](const std::wstring& columnId, const std::wstring& text)
    {
        applied_.emplace_back(columnId, text);
    }};
};
}


TEST_F(debounce, OnlyLastKeystrokeIsApplied)
{
    debouncer_.post(L"name", L"a");
    debouncer_.post(L"name", L"al");
    debouncer_.post(L"name", L"ali");

    EXPECT_TRUE(applied_.empty());
    EXPECT_EQ(timer_.getStartCount(), 3u); //restarted on every keystroke
    EXPECT_EQ(timer_.getLastDelay(), std::chrono::milliseconds(300));

    timer_.fire();
    ASSERT_EQ(applied_.size(), 1u);
    EXPECT_EQ(applied_[0], std::make_pair(std::wstring(L"name"), std::wstring(L"ali")));
    EXPECT_FALSE(debouncer_.isPending());
}


TEST_F(debounce, PendingTextPerColumn)
{
    debouncer_.post(L"name", L"x");
    debouncer_.post(L"email", L"y");

    ASSERT_TRUE(debouncer_.getPendingText(L"name"));
    EXPECT_EQ(*debouncer_.getPendingText(L"name"), L"x");

    timer_.fire();
    EXPECT_EQ(applied_.size(), 2u);
}


TEST_F(debounce, CancelDropsInput)
{
    debouncer_.post(L"name", L"abc");
    debouncer_.cancel(L"name");

    EXPECT_FALSE(timer_.isRunning());
    timer_.fire();
    EXPECT_TRUE(applied_.empty());

    debouncer_.post(L"name", L"abc");
    debouncer_.post(L"email", L"abc");
    debouncer_.cancel(L"name");
    EXPECT_TRUE(timer_.isRunning()); //"email" still pending
    debouncer_.cancel();
    EXPECT_FALSE(debouncer_.isPending());
}


TEST_F(debounce, FlushAppliesImmediately)
{
    debouncer_.post(L"name", L"abc");
    debouncer_.flush();

    EXPECT_EQ(applied_.size(), 1u);
    EXPECT_FALSE(timer_.isRunning());
}
