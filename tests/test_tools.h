// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TEST_TOOLS_H_7720193847561209
#define TEST_TOOLS_H_7720193847561209

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <dgrid/column.h>
#include <dgrid/debounce.h>
#include <dgrid/grid_events.h>
#include <dgrid/item_source.h>
#include <dgrid/theme.h>


namespace dgrid::test
{
//headless: every character is 10 pixel wide
struct FixedWidthTheme : public ThemeProvider
{
    int getTextWidth(const std::wstring& text) const override { return static_cast<int>(text.size()) * charWidth; }
    Rgb getAccentColor() const override { return {0, 120, 215}; }
    int getCellPadding() const override { return padding; }

    int charWidth = 10;
    int padding = 0;
};


//fires only when the test says so
class ManualTimer : public TimerScheduler
{
public:
    void start(std::chrono::milliseconds delay, const std::function<void()>& callback) override
    {
        callback_ = callback;
        lastDelay_ = delay;
        ++startCount_;
    }
    void stop() override { callback_ = nullptr; }
    bool isRunning() const override { return static_cast<bool>(callback_); }

    void fire()
    {
        if (auto cb = std::exchange(callback_, nullptr))
            cb();
    }

    size_t getStartCount() const { return startCount_; }
    std::chrono::milliseconds getLastDelay() const { return lastDelay_; }

private:
    std::function<void()> callback_;
    std::chrono::milliseconds lastDelay_{0};
    size_t startCount_ = 0;
};


struct Person
{
    int64_t id = 0;
    std::wstring name;
    std::wstring email;
    std::optional<std::wstring> status; //std::nullopt: null cell
    double balance = 0;
    bool faulty = false; //getter of "status" throws
};

inline std::shared_ptr<Person> makePerson(int64_t id, const std::wstring& name, const std::optional<std::wstring>& status, double balance = 0)
{
    auto p = std::make_shared<Person>();
    p->id = id;
    p->name = name;
    p->email = name + L"@example.com";
    p->status = status;
    p->balance = balance;
    return p;
}


inline std::vector<ColumnModel> getPersonColumns()
{
    std::vector<ColumnModel> cols;

    ColumnModel colId = makeColumn<Person>(L"id", L"ID", [](const Person& p) { return CellValue(p.id); });
    colId.sizing.policy = SizingPolicy::fixed;
    colId.sizing.fixedWidth = 60;
    colId.aggregate = AggregateType::count;
    cols.push_back(colId);

    ColumnModel colName = makeColumn<Person>(L"name", L"Name", [](const Person& p) { return CellValue(p.name); });
    colName.sizing.policy = SizingPolicy::fixed;
    colName.sizing.fixedWidth = 150;
    cols.push_back(colName);

    ColumnModel colEmail = makeEditableColumn<Person>(L"email", L"Email",
                                                      [](const Person& p) { return CellValue(p.email); },
                                                      [](Person& p, const CellValue& value) { p.email = std::get<std::wstring>(value); });
    colEmail.sizing.policy = SizingPolicy::fill;
    colEmail.validator = [](const void* item, const CellValue& value)
    {
        const std::wstring* email = std::get_if<std::wstring>(&value);
        if (!email || !contains(*email, L"@"))
            return ValidationResult{false, L"missing @"};
        return ValidationResult();
    };
    cols.push_back(colEmail);

    ColumnModel colStatus = makeColumn<Person>(L"status", L"Status", [](const Person& p)
    {
        if (p.faulty)
            throw std::runtime_error("status unavailable");
        return p.status ? CellValue(*p.status) : CellValue();
    });
    colStatus.sizing.policy = SizingPolicy::fitHeader;
    cols.push_back(colStatus);

    ColumnModel colBalance = makeEditableColumn<Person>(L"balance", L"Balance",
                                                        [](const Person& p) { return CellValue(p.balance); },
                                                        [](Person& p, const CellValue& value)
    {
        const std::optional<double> num = getNumericValue(value);
        if (!num)
            throw std::invalid_argument("not a number");
        p.balance = *num;
    });
    colBalance.sizing.policy = SizingPolicy::fixed;
    colBalance.sizing.fixedWidth = 100;
    colBalance.aggregate = AggregateType::sum;
    cols.push_back(colBalance);

    return cols;
}


//records every notification in arrival order
struct RecordingSink : public GridEventSink
{
    void onSortChanged     (const SortState& sort) override { sortEvents.push_back(sort); }
    void onFilterChanged   (const std::wstring& columnId, const ColumnFilter* filter) override { filterEvents.push_back({columnId, filter != nullptr}); }
    void onPageChanged     (size_t oldPage, size_t newPage, size_t pageSize, size_t totalRows) override { pageEvents.push_back({oldPage, newPage}); }
    void onEditCommitted   (const EditCommit& commit) override { commits.push_back(commit); }
    void onEditRefused     (const std::wstring& columnId, const std::wstring& message) override { refusals.push_back(message); }
    void onEditCancelled   (const EditSession& session, bool forced) override { cancellations.push_back(forced); cancelledValues.push_back(session.pendingValue); }
    void onSelectionChanged(const std::vector<size_t>& rows) override { selections.push_back(rows); }
    void onLayoutOverflow  (int totalWidth, int viewportWidth) override { ++overflowCount; }
    void onViewRebuilt     (const ViewStats& stats) override { ++rebuildCount; }

    std::vector<SortState> sortEvents;
    std::vector<std::pair<std::wstring, bool /*active*/>> filterEvents;
    std::vector<std::pair<size_t, size_t>> pageEvents;
    std::vector<EditCommit> commits;
    std::vector<std::wstring> refusals;
    std::vector<bool> cancellations; //"forced" flag
    std::vector<CellValue> cancelledValues;
    std::vector<std::vector<size_t>> selections;
    size_t overflowCount = 0;
    size_t rebuildCount = 0;
};


inline const Person& getPerson(const ViewRow& row)
{
    const std::shared_ptr<void> item = row.item.lock();
    if (!item)
        throw std::logic_error("expired item");
    return *static_cast<const Person*>(item.get());
}
}

#endif //TEST_TOOLS_H_7720193847561209
