// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef EDIT_HISTORY_H_3981274098123749
#define EDIT_HISTORY_H_3981274098123749

#include <deque>
#include <functional>
#include "cell_edit.h"


namespace dgrid
{
struct EditRecord
{
    std::weak_ptr<void> item;
    std::wstring columnId;
    CellValue oldValue;
    CellValue newValue;
};

//undo/redo of committed cell edits; items are never kept alive by the history
class EditHistory
{
public:
    explicit EditHistory(size_t limit) : limit_(limit) {}

    void record(const EditCommit& ec); //clears redo stack

    bool canUndo() const;
    bool canRedo() const;

    //writeBack(item, columnId, value): may throw => entry stays where it is
    using WriteBack = std::function<void(void* item, const std::wstring& columnId, const CellValue& value)>;

    std::optional<EditRecord> undo(const WriteBack& writeBack); //throw X; returns the reverted record, std::nullopt if nothing to undo
    std::optional<EditRecord> redo(const WriteBack& writeBack); //throw X

    void clear() { undo_.clear(); redo_.clear(); }
    void removeColumn(const std::wstring& columnId); //column no longer exists

    size_t getUndoCount() const { return undo_.size(); } //including expired entries
    size_t getRedoCount() const { return redo_.size(); } //

private:
    static void dropExpired(std::deque<EditRecord>& stack);

    const size_t limit_;
    std::deque<EditRecord> undo_; //back: most recent
    std::deque<EditRecord> redo_; //
};
}

#endif //EDIT_HISTORY_H_3981274098123749
