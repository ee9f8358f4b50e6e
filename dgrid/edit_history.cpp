// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "edit_history.h"
#include <algorithm>

using namespace dgrid;


namespace
{
bool isExpired(const EditRecord& rec) { return rec.item.expired(); }
}


void EditHistory::record(const EditCommit& ec)
{
    redo_.clear();

    if (limit_ == 0)
        return;

    undo_.push_back({ec.item, ec.columnId, ec.oldValue, ec.newValue});
    while (undo_.size() > limit_)
        undo_.pop_front();
}


bool EditHistory::canUndo() const { return std::any_of(undo_.begin(), undo_.end(), [](const EditRecord& rec) { return !isExpired(rec); }); }
bool EditHistory::canRedo() const { return std::any_of(redo_.begin(), redo_.end(), [](const EditRecord& rec) { return !isExpired(rec); }); }


void EditHistory::dropExpired(std::deque<EditRecord>& stack)
{
    while (!stack.empty() && isExpired(stack.back()))
        stack.pop_back();
}


std::optional<EditRecord> EditHistory::undo(const WriteBack& writeBack) //throw X
{
    dropExpired(undo_);
    if (undo_.empty())
        return std::nullopt;

    const EditRecord rec = undo_.back();
    if (const std::shared_ptr<void> item = rec.item.lock()) //not expired: see dropExpired()
        writeBack(item.get(), rec.columnId, rec.oldValue); //throw X

    undo_.pop_back();
    redo_.push_back(rec);
    return rec;
}


std::optional<EditRecord> EditHistory::redo(const WriteBack& writeBack) //throw X
{
    dropExpired(redo_);
    if (redo_.empty())
        return std::nullopt;

    const EditRecord rec = redo_.back();
    if (const std::shared_ptr<void> item = rec.item.lock())
        writeBack(item.get(), rec.columnId, rec.newValue); //throw X

    redo_.pop_back();
    undo_.push_back(rec);
    return rec;
}


void EditHistory::removeColumn(const std::wstring& columnId)
{
    std::erase_if(undo_, [&](const EditRecord& rec) { return rec.columnId == columnId; });
    std::erase_if(redo_, [&](const EditRecord& rec) { return rec.columnId == columnId; });
}
