// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include <dgrid/data_grid.h>
#include "test_tools.h"

using namespace dgrid;
using namespace dgrid::test;


namespace
{
const size_t ITEM_COUNT = 500;
const int VIEWPORT_WIDTH  = 800;
const int VIEWPORT_HEIGHT = 240; //10 rows of 24 pixel


std::optional<std::wstring> getTestStatus(size_t i)
{
    if (i % 10 == 9)
        return std::nullopt;
    switch (i % 3)
    {
        case 0:  return L"Active";
        case 1:  return L"Inactive";
        default: return L"Pending";
    }
}


class data_grid : public testing::Test
{
protected:
    void SetUp() override { init(GridConfig()); }

    void init(const GridConfig& cfg, std::vector<ColumnModel> columns = getPersonColumns())
    {
        grid_.reset();
        sink_ = RecordingSink();

        std::vector<std::shared_ptr<Person>> items;
        for (size_t i = 0; i < ITEM_COUNT; ++i)
            items.push_back(makePerson(static_cast<int64_t>(i), L"Customer " + numberTo<std::wstring>(i), getTestStatus(i), static_cast<double>(i)));
        items_ = std::make_shared<ItemList<Person>>(std::move(items));

        grid_ = std::make_unique<DataGrid>(cfg, theme_, timer_);
        grid_->setColumns(columns);
        grid_->setItemSource(items_);
        grid_->setViewport(VIEWPORT_WIDTH, VIEWPORT_HEIGHT);
        grid_->setEventSink(&sink_);
    }

    const Person& getRowPerson(size_t index) const
    {
        const ViewRow* row = grid_->getEffectiveRow(index);
        if (!row)
            throw std::logic_error("row out of range");
        return getPerson(*row);
    }

    ColumnFilter makeStatusFilter(const std::vector<CellValue>& values) const
    {
        ColumnFilter filter;
        filter.acceptedValues = std::unordered_set<CellValue>(values.begin(), values.end());
        return filter;
    }

    std::vector<std::wstring> getEmails() const
    {
        std::vector<std::wstring> emails;
        for (const std::shared_ptr<Person>& p : items_->getItems())
            emails.push_back(p->email);
        return emails;
    }

    FixedWidthTheme theme_;
    ManualTimer timer_;
    RecordingSink sink_;
    std::shared_ptr<ItemList<Person>> items_;
    std::unique_ptr<DataGrid> grid_;
};
}


TEST_F(data_grid, SortFilterPage)
{
    GridConfig cfg;
    cfg.virtualizationEnabled = true;
    cfg.pagingEnabled = true;
    cfg.pageSize = 50;
    init(cfg);

    grid_->setSort({{L"name", SortDirection::descending}});
    grid_->setFilter(L"status", makeStatusFilter({std::wstring(L"Active")}));

    size_t activeCount = 0;
    const Person* lastActive = nullptr;
    for (const std::shared_ptr<Person>& p : items_->getItems())
        if (p->status == L"Active")
        {
            ++activeCount;
            if (!lastActive || compareNatural(p->name, lastActive->name) > 0)
                lastActive = p.get();
        }
    ASSERT_TRUE(lastActive);

    EXPECT_EQ(grid_->getViewSequence().size(), activeCount);
    EXPECT_EQ(grid_->getPageCount(), (activeCount + 49) / 50);
    EXPECT_EQ(grid_->getEffectiveRowCount(), 50u);
    EXPECT_EQ(&getRowPerson(0), lastActive);
    EXPECT_EQ(lastActive->name, L"Customer 498");

    EXPECT_EQ(sink_.sortEvents.size(), 1u);
    ASSERT_EQ(sink_.filterEvents.size(), 1u);
    EXPECT_EQ(sink_.filterEvents[0], std::make_pair(std::wstring(L"status"), true));
}


TEST_F(data_grid, RecycledEditRowIsForceCancelled)
{
    const std::vector<std::wstring> emailsBefore = getEmails();

    ASSERT_TRUE(grid_->beginEdit(3, L"email"));
    ASSERT_TRUE(grid_->setPendingValue(std::wstring(L"typed@new.org")));

    grid_->scrollTo(40 * grid_->getConfig().rowHeight); //row 3 leaves the buffered window

    EXPECT_EQ(sink_.cancellations, std::vector<bool> {true});
    EXPECT_FALSE(grid_->getEditSession());
    EXPECT_EQ(grid_->getEditState(), EditState::idle);

    EXPECT_EQ(grid_->commitEdit().status, CommitStatus::noSession);
    EXPECT_TRUE(sink_.commits.empty());
    EXPECT_EQ(getEmails(), emailsBefore);
}


TEST_F(data_grid, PendingValueFollowsEachKeystroke)
{
    ASSERT_TRUE(grid_->beginEdit(3, L"email"));

    for (const wchar_t* typed : {L"t", L"ty", L"typ"})
    {
        ASSERT_TRUE(grid_->setPendingValue(std::wstring(typed)));
        EXPECT_EQ(grid_->getEditSession()->pendingValue, CellValue(std::wstring(typed)));
    }
    EXPECT_TRUE(sink_.commits.empty());

    //a forced cancel reports the input typed so far
    grid_->scrollTo(40 * grid_->getConfig().rowHeight);
    ASSERT_EQ(sink_.cancelledValues.size(), 1u);
    EXPECT_EQ(sink_.cancelledValues[0], CellValue(std::wstring(L"typ")));
    EXPECT_EQ((*items_)[3]->email, L"Customer 3@example.com");
}


TEST_F(data_grid, SmallScrollKeepsEditSession)
{
    ASSERT_TRUE(grid_->beginEdit(3, L"email"));
    grid_->setPendingValue(std::wstring(L"typed@new.org"));

    grid_->scrollTo(5 * grid_->getConfig().rowHeight); //row 3 is still inside the buffer
    ASSERT_TRUE(grid_->getEditSession());

    EXPECT_EQ(grid_->commitEdit().status, CommitStatus::committed);
    EXPECT_EQ((*items_)[3]->email, L"typed@new.org");
    EXPECT_EQ((*items_)[4]->email, L"Customer 4@example.com");
}


TEST_F(data_grid, InvalidColumnsAreRejected)
{
    std::vector<ColumnModel> cols = getPersonColumns();
    cols.push_back(cols[0]);
    EXPECT_THROW(grid_->setColumns(cols), GridError); //duplicate id

    cols = getPersonColumns();
    cols[1].getter = nullptr;
    EXPECT_THROW(grid_->setColumns(cols), GridError);

    cols = getPersonColumns();
    cols[2].setter = nullptr;
    EXPECT_THROW(grid_->setColumns(cols), GridError);

    EXPECT_EQ(grid_->getColumns().size(), 5u); //unchanged
}


TEST_F(data_grid, UnknownColumnThrows)
{
    EXPECT_THROW(grid_->toggleSort(L"unknown"), GridError);
    EXPECT_THROW(grid_->setFilter(L"unknown", ColumnFilter()), GridError);
    EXPECT_THROW(grid_->setGroupColumn(L"unknown"), GridError);
    EXPECT_THROW(grid_->beginEdit(0, L"unknown"), GridError);
    EXPECT_THROW(grid_->setPageSize(0), GridError);
}


TEST_F(data_grid, ToggleSortCycle)
{
    EXPECT_TRUE(grid_->toggleSort(L"name"));
    EXPECT_EQ(grid_->getSort(), (SortState{{L"name", SortDirection::ascending}}));
    EXPECT_TRUE(grid_->toggleSort(L"name"));
    EXPECT_EQ(grid_->getSort(), (SortState{{L"name", SortDirection::descending}}));
    EXPECT_EQ(getRowPerson(0).name, L"Customer 499");
    EXPECT_TRUE(grid_->toggleSort(L"name"));
    EXPECT_TRUE(grid_->getSort().empty());
    EXPECT_EQ(getRowPerson(0).id, 0);

    //a different column replaces the sort key
    grid_->toggleSort(L"name");
    grid_->toggleSort(L"balance");
    EXPECT_EQ(grid_->getSort(), (SortState{{L"balance", SortDirection::ascending}}));

    EXPECT_EQ(sink_.sortEvents.size(), 5u);
}


TEST_F(data_grid, NonSortableAndNonFilterableColumns)
{
    std::vector<ColumnModel> cols = getPersonColumns();
    cols[0].sortable   = false;
    cols[0].filterable = false;
    init(GridConfig(), cols);

    EXPECT_FALSE(grid_->toggleSort(L"id"));
    EXPECT_TRUE(grid_->getSort().empty());
    EXPECT_THROW(grid_->setSort({{L"id", SortDirection::ascending}}), GridError);
    EXPECT_THROW(grid_->setFilter(L"id", ColumnFilter()), GridError);
    EXPECT_THROW(grid_->setFilterText(L"id", L"1"), GridError);
    EXPECT_TRUE(sink_.sortEvents.empty());
}


TEST_F(data_grid, FilterTextIsDebounced)
{
    grid_->setFilterText(L"name", L"customer 4");
    grid_->setFilterText(L"name", L"customer 42");

    EXPECT_EQ(grid_->getViewSequence().size(), ITEM_COUNT); //not applied yet
    EXPECT_TRUE(timer_.isRunning());
    EXPECT_EQ(timer_.getLastDelay(), std::chrono::milliseconds(300));

    timer_.fire();
    EXPECT_EQ(grid_->getViewSequence().size(), 11u); //42, 420..429
    EXPECT_EQ(sink_.filterEvents.size(), 1u);

    ASSERT_TRUE(grid_->getFilter(L"name"));
    EXPECT_EQ(grid_->getFilter(L"name")->searchText, L"customer 42");

    grid_->clearFilter(L"name");
    EXPECT_EQ(grid_->getViewSequence().size(), ITEM_COUNT);
    EXPECT_EQ(sink_.filterEvents.back(), std::make_pair(std::wstring(L"name"), false));
}


TEST_F(data_grid, ExplicitFilterCancelsPendingText)
{
    grid_->setFilterText(L"status", L"Pend");
    grid_->setFilter(L"status", makeStatusFilter({CellValue()}));

    EXPECT_FALSE(timer_.isRunning());
    EXPECT_EQ(grid_->getViewSequence().size(), 50u); //every 10th item has no status
}


TEST_F(data_grid, FilterCandidatesIgnoreOwnFilter)
{
    grid_->setFilter(L"status", makeStatusFilter({std::wstring(L"Active")}));

    EXPECT_EQ(grid_->getFilterCandidates(L"status"),
              (std::vector<CellValue>{std::wstring(L"Active"), std::wstring(L"Inactive"), std::wstring(L"Pending"), CellValue()}));

    ColumnFilter balanceFilter;
    balanceFilter.predicate = [](const CellValue& value) { return getNumericValue(value).value_or(0) < 3; }; //items 0, 1, 2
    grid_->setFilter(L"balance", balanceFilter);

    EXPECT_EQ(grid_->getFilterCandidates(L"status"),
              (std::vector<CellValue>{std::wstring(L"Active"), std::wstring(L"Inactive"), std::wstring(L"Pending")}));
}


TEST_F(data_grid, PagingEmitsPageChangeAndResetsSelection)
{
    GridConfig cfg;
    cfg.pagingEnabled = true;
    cfg.pageSize = 50;
    init(cfg);

    grid_->selectRow(4);
    ASSERT_EQ(grid_->getSelectedRows(), std::vector<size_t> {4});

    EXPECT_TRUE(grid_->nextPage());
    EXPECT_EQ(grid_->getCurrentPage(), 1u);
    EXPECT_EQ(getRowPerson(0).id, 50);
    EXPECT_EQ(grid_->getScrollOffset(), 0);
    EXPECT_TRUE(grid_->getSelectedRows().empty());

    ASSERT_EQ(sink_.pageEvents.size(), 1u);
    EXPECT_EQ(sink_.pageEvents[0], std::make_pair(size_t(0), size_t(1)));

    EXPECT_FALSE(grid_->goToPage(1)); //no change
    EXPECT_TRUE(grid_->goToPage(100)); //clamped
    EXPECT_EQ(grid_->getCurrentPage(), 9u);
    EXPECT_EQ(grid_->getEffectiveRowCount(), 50u);
}


TEST_F(data_grid, PageChangeCancelsEdit)
{
    GridConfig cfg;
    cfg.pagingEnabled = true;
    cfg.pageSize = 50;
    init(cfg);

    ASSERT_TRUE(grid_->beginEdit(2, L"email"));
    grid_->setPendingValue(std::wstring(L"lost@input.org"));
    grid_->nextPage();

    EXPECT_FALSE(grid_->getEditSession());
    EXPECT_EQ(sink_.cancellations, std::vector<bool> {true});
    EXPECT_EQ((*items_)[2]->email, L"Customer 2@example.com");
}


TEST_F(data_grid, ShrinkingViewClampsPage)
{
    GridConfig cfg;
    cfg.pagingEnabled = true;
    cfg.pageSize = 50;
    init(cfg);

    grid_->goToPage(9);
    grid_->setFilter(L"status", makeStatusFilter({std::wstring(L"Active")}));

    EXPECT_EQ(grid_->getCurrentPage(), grid_->getPageCount() - 1);
    ASSERT_EQ(sink_.pageEvents.size(), 2u);
    EXPECT_EQ(sink_.pageEvents[1].first, 9u);
}


TEST_F(data_grid, PageSizeCanChangeAtRuntime)
{
    GridConfig cfg;
    cfg.pagingEnabled = true;
    cfg.pageSize = 50;
    init(cfg);

    grid_->goToPage(3); //rows [150, 200)
    grid_->setPageSize(100);
    EXPECT_EQ(grid_->getCurrentPage(), 1u);
    EXPECT_EQ(grid_->getEffectiveRowCount(), 100u);

    grid_->setPagingEnabled(false);
    EXPECT_EQ(grid_->getEffectiveRowCount(), ITEM_COUNT);
}


TEST_F(data_grid, SliceChangeOnSamePageNotifies)
{
    GridConfig cfg;
    cfg.pagingEnabled = true;
    cfg.pageSize = 50;
    init(cfg);
    ASSERT_TRUE(sink_.pageEvents.empty());

    grid_->setPageSize(100); //page 0 stays page 0, but shows more rows
    EXPECT_EQ(grid_->getEffectiveRowCount(), 100u);
    ASSERT_EQ(sink_.pageEvents.size(), 1u);
    EXPECT_EQ(sink_.pageEvents[0], std::make_pair(size_t(0), size_t(0)));

    grid_->setPagingEnabled(false);
    EXPECT_EQ(grid_->getEffectiveRowCount(), ITEM_COUNT);
    ASSERT_EQ(sink_.pageEvents.size(), 2u);
    EXPECT_EQ(sink_.pageEvents[1], std::make_pair(size_t(0), size_t(0)));

    //effective rows unchanged: no notification
    grid_->setPagingEnabled(false);
    grid_->setPageSize(25);
    grid_->setPageSize(25);
    EXPECT_EQ(sink_.pageEvents.size(), 2u);

    grid_->setPagingEnabled(true);
    EXPECT_EQ(grid_->getEffectiveRowCount(), 25u);
    EXPECT_EQ(sink_.pageEvents.size(), 3u);
}


TEST_F(data_grid, CommitRebuildsViewAndSupportsUndo)
{
    grid_->setSort({{L"email", SortDirection::ascending}});
    const Person* first = &getRowPerson(0);

    ASSERT_TRUE(grid_->beginEdit(0, L"email"));
    grid_->setPendingValue(std::wstring(L"zzz@last.org"));

    const CommitResult result = grid_->commitEdit();
    ASSERT_EQ(result.status, CommitStatus::committed);
    EXPECT_EQ(first->email, L"zzz@last.org");
    EXPECT_EQ(&getPerson(grid_->getViewSequence().back()), first); //moved by the sort

    ASSERT_EQ(sink_.commits.size(), 1u);
    EXPECT_EQ(sink_.commits[0].columnId, L"email");
    EXPECT_EQ(sink_.commits[0].newValue, CellValue(std::wstring(L"zzz@last.org")));

    EXPECT_TRUE(grid_->canUndo());
    EXPECT_TRUE(grid_->undo());
    EXPECT_EQ(first->email, L"Customer 0@example.com");
    EXPECT_EQ(&getRowPerson(0), first);

    EXPECT_TRUE(grid_->redo());
    EXPECT_EQ(first->email, L"zzz@last.org");
}


TEST_F(data_grid, RefusedCommitKeepsSessionOpen)
{
    ASSERT_TRUE(grid_->beginEdit(1, L"email"));
    grid_->setPendingValue(std::wstring(L"invalid"));

    EXPECT_EQ(grid_->commitEdit().status, CommitStatus::validationFailed);
    EXPECT_TRUE(grid_->getEditSession());
    EXPECT_EQ(sink_.refusals, std::vector<std::wstring> {L"missing @"});
    EXPECT_EQ(getStats(grid_->getErrorLog()).info, 1);

    //setter fault: reported as error
    ASSERT_TRUE(grid_->cancelEdit());
    ASSERT_TRUE(grid_->beginEdit(1, L"balance"));
    grid_->setPendingValue(std::wstring(L"abc"));
    EXPECT_EQ(grid_->commitEdit().status, CommitStatus::setterFailed);
    EXPECT_EQ(getStats(grid_->getErrorLog()).error, 1);
    EXPECT_EQ((*items_)[1]->balance, 1);
}


TEST_F(data_grid, OpeningAnotherCellCommitsFirst)
{
    ASSERT_TRUE(grid_->beginEdit(0, L"email"));
    grid_->setPendingValue(std::wstring(L"first@x.org"));

    EXPECT_TRUE(grid_->beginEdit(1, L"email"));
    EXPECT_EQ((*items_)[0]->email, L"first@x.org");
    ASSERT_TRUE(grid_->getEditSession());
    EXPECT_EQ(grid_->getEditSession()->rowIndexAtEntry, 1u);

    //refused commit: previous session stays open
    grid_->setPendingValue(std::wstring(L"invalid"));
    EXPECT_FALSE(grid_->beginEdit(2, L"email"));
    EXPECT_EQ(grid_->getEditSession()->rowIndexAtEntry, 1u);
}


TEST_F(data_grid, ActivationHonorsEditTrigger)
{
    EXPECT_FALSE(grid_->activateCell(2, L"email", ActivationGesture::singleTap));
    EXPECT_FALSE(grid_->getEditSession());
    EXPECT_EQ(grid_->getSelectedRows(), std::vector<size_t> {2});

    EXPECT_TRUE(grid_->activateCell(2, L"email", ActivationGesture::doubleTap));
    EXPECT_TRUE(grid_->getEditSession());

    EXPECT_FALSE(grid_->activateCell(3, L"name", ActivationGesture::doubleTap)); //not editable
}


TEST_F(data_grid, InvisibleRowCannotBeEdited)
{
    EXPECT_FALSE(grid_->beginEdit(400, L"email"));
    EXPECT_EQ(grid_->getEditState(), EditState::idle);
}


TEST_F(data_grid, HiddenColumnCannotBeEdited)
{
    grid_->setColumnVisible(L"email", false);
    EXPECT_FALSE(grid_->beginEdit(2, L"email"));
    EXPECT_FALSE(grid_->activateCell(2, L"email", ActivationGesture::doubleTap));
    EXPECT_FALSE(grid_->getEditSession());

    grid_->setColumnVisible(L"email", true);
    EXPECT_TRUE(grid_->beginEdit(2, L"email"));
}


TEST_F(data_grid, RemovingEditedItemCancelsSession)
{
    ASSERT_TRUE(grid_->beginEdit(3, L"email"));
    const std::weak_ptr<Person> removed = (*items_)[3];

    items_->remove(3);

    EXPECT_TRUE(removed.expired()); //grid keeps no owning reference
    EXPECT_FALSE(grid_->getEditSession());
    EXPECT_EQ(grid_->getViewSequence().size(), ITEM_COUNT - 1);
}


TEST_F(data_grid, SourceNotificationsRebuildView)
{
    items_->add(makePerson(1000, L"Zed", L"Active"));
    EXPECT_EQ(grid_->getViewSequence().size(), ITEM_COUNT + 1);
    EXPECT_EQ(sink_.rebuildCount, 1u);

    items_->clear();
    EXPECT_TRUE(grid_->getViewSequence().empty());
    EXPECT_EQ(grid_->getPageCount(), 1u);

    items_->assign({makePerson(1, L"Bob", L"Active"), makePerson(2, L"Ann", L"Active")});
    ASSERT_EQ(grid_->getViewSequence().size(), 2u);

    grid_->toggleSort(L"name");
    EXPECT_EQ(getPerson(grid_->getViewSequence()[0]).name, L"Ann");

    (*items_)[1]->name = L"Zoe"; //in-place change: host tells the source
    items_->itemChanged();
    EXPECT_EQ(getPerson(grid_->getViewSequence()[0]).name, L"Bob");
    EXPECT_EQ(sink_.rebuildCount, 5u);
}


TEST_F(data_grid, Selection)
{
    GridConfig cfg;
    cfg.selectionMode = SelectionMode::multiple;
    init(cfg);
    grid_->setGroupColumn(L"status");

    ASSERT_TRUE(grid_->getEffectiveRow(0)->isGroupHeader());
    grid_->selectRow(0);
    EXPECT_TRUE(grid_->getSelectedRows().empty()); //group headers are not selectable

    grid_->selectRow(1);
    grid_->selectRow(3, true);
    EXPECT_EQ(grid_->getSelectedRows(), (std::vector<size_t>{1, 3}));

    grid_->selectAll();
    EXPECT_EQ(grid_->getSelectedRows().size(), ITEM_COUNT);

    grid_->clearSelection();
    EXPECT_TRUE(grid_->getSelectedRows().empty());
    EXPECT_EQ(sink_.selections.back(), std::vector<size_t>());
}


TEST_F(data_grid, SingleSelectionReplaces)
{
    grid_->selectRow(1);
    grid_->selectRow(3, true);
    EXPECT_EQ(grid_->getSelectedRows(), std::vector<size_t> {3});

    grid_->selectRange(5, 9);
    EXPECT_EQ(grid_->getSelectedRows(), std::vector<size_t> {5});
}


TEST_F(data_grid, GroupingWithHeaders)
{
    grid_->setGroupColumn(L"status");

    const ViewStats& stats = grid_->getViewStats();
    EXPECT_EQ(stats.groupCount, 4u);
    EXPECT_EQ(stats.itemRows, ITEM_COUNT);
    EXPECT_EQ(grid_->getViewSequence().size(), ITEM_COUNT + 4);

    const ViewRow* header = grid_->getEffectiveRow(0);
    ASSERT_TRUE(header && header->isGroupHeader());
    EXPECT_EQ(header->groupKey, CellValue(std::wstring(L"Active"))); //first seen: item 0
}


TEST_F(data_grid, GetterFaultsAreLoggedOncePerRebuild)
{
    (*items_)[0]->faulty = true;
    (*items_)[1]->faulty = true;
    grid_->clearErrorLog();

    grid_->toggleSort(L"status");

    EXPECT_EQ(getStats(grid_->getErrorLog()).warning, 1);
    EXPECT_EQ(grid_->getViewStats().getterFaults, 2u);
    EXPECT_EQ(grid_->getViewSequence().size(), ITEM_COUNT); //faulty items are kept: sorted last
    EXPECT_TRUE(getPerson(grid_->getViewSequence()[ITEM_COUNT - 1]).faulty);
}


TEST_F(data_grid, ColumnWidthsFollowViewport)
{
    //id 60 + name 150 + status 60 + balance 100 => email fills the rest
    EXPECT_EQ(grid_->getColumnWidth(L"email"), VIEWPORT_WIDTH - 370);
    EXPECT_EQ(grid_->getColumnLayout().totalWidth, VIEWPORT_WIDTH);

    grid_->setViewport(1000, VIEWPORT_HEIGHT);
    EXPECT_EQ(grid_->getColumnWidth(L"email"), 630);

    for (const auto& row : grid_->getVirtualizer().getPool())
        EXPECT_EQ(row->getCellWidths(), (std::vector<int>{60, 150, 630, 60, 100}));
}


TEST_F(data_grid, LayoutOverflowIsReportedOnce)
{
    grid_->clearErrorLog();

    grid_->setViewport(300, VIEWPORT_HEIGHT);
    grid_->setViewport(310, VIEWPORT_HEIGHT);
    EXPECT_EQ(sink_.overflowCount, 1u);
    EXPECT_EQ(grid_->getColumnWidth(L"email"), COLUMN_MIN_WIDTH_DEFAULT);
    EXPECT_EQ(getStats(grid_->getErrorLog()).warning, 1);

    grid_->setViewport(VIEWPORT_WIDTH, VIEWPORT_HEIGHT);
    grid_->setViewport(300, VIEWPORT_HEIGHT);
    EXPECT_EQ(sink_.overflowCount, 2u);
}


TEST_F(data_grid, AutoColumnMeasuresVisibleRows)
{
    ColumnSizing sizing;
    sizing.policy = SizingPolicy::autoSize;
    sizing.minWidth = 0;
    grid_->setColumnSizing(L"name", sizing);

    //rows 0..15 are bound: "Customer 10" is the longest text
    EXPECT_EQ(grid_->getColumnWidth(L"name"), 11 * theme_.charWidth);
}


TEST_F(data_grid, ColumnManagement)
{
    grid_->setColumnVisible(L"id", false);
    EXPECT_EQ(grid_->getColumnWidth(L"id"), -1);
    EXPECT_EQ(grid_->getVirtualizer().findContainer(0)->getCellTexts().size(), 4u);

    grid_->moveColumn(L"balance", 0);
    EXPECT_EQ(grid_->getColumns()[0].id, L"balance");
    EXPECT_EQ(grid_->getVirtualizer().findContainer(0)->getCellTexts()[0], L"0");

    ColumnModel colExtra = makeColumn<Person>(L"extra", L"Extra", [](const Person& p) { return CellValue(p.id * 2); });
    grid_->addColumn(colExtra);
    EXPECT_THROW(grid_->addColumn(colExtra), GridError);
    EXPECT_EQ(grid_->getVirtualizer().findContainer(1)->getCellTexts().back(), L"2");
}


TEST_F(data_grid, RemovingColumnDropsItsState)
{
    grid_->toggleSort(L"name");
    grid_->setFilter(L"name", ColumnFilter{std::nullopt, nullptr, L"Customer 1"});
    ASSERT_TRUE(grid_->beginEdit(0, L"email"));

    grid_->removeColumn(L"email");
    EXPECT_EQ(sink_.cancellations, std::vector<bool> {false});

    grid_->removeColumn(L"name");
    EXPECT_TRUE(grid_->getSort().empty());
    EXPECT_FALSE(grid_->getFilter(L"name"));
    EXPECT_EQ(grid_->getViewSequence().size(), ITEM_COUNT);
    EXPECT_THROW(grid_->removeColumn(L"name"), GridError);
}


TEST_F(data_grid, ScrollToRow)
{
    grid_->scrollToRow(200);
    EXPECT_EQ(grid_->getScrollOffset(), 201 * 24 - VIEWPORT_HEIGHT);
    EXPECT_TRUE(grid_->getVirtualizer().findContainer(200));
}


TEST_F(data_grid, Aggregates)
{
    EXPECT_EQ(grid_->getAggregate(L"balance"), CellValue(124'750.0)); //0 + 1 + ... + 499
    EXPECT_EQ(grid_->getAggregate(L"id"), CellValue(int64_t(ITEM_COUNT)));
    EXPECT_EQ(grid_->getAggregate(L"name"), CellValue());

    grid_->setFilter(L"status", makeStatusFilter({CellValue()}));
    EXPECT_EQ(grid_->getAggregate(L"id"), CellValue(int64_t(50)));
}
