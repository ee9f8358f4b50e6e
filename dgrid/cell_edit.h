// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CELL_EDIT_H_0918234701928374
#define CELL_EDIT_H_0918234701928374

#include <optional>
#include "view_pipeline.h"


namespace dgrid
{
enum class EditState
{
    idle,
    editing,
    committing, //transient: valueSetter is running
    cancelled,  //transient
};

struct EditSession //at most one instance
{
    size_t rowIndexAtEntry = 0; //effective sequence index
    std::wstring columnId;
    CellValue originalValue;
    CellValue pendingValue;
    std::weak_ptr<void> boundItemAtEntry; //commit target, independent from what the row container displays later
};

struct EditCommit
{
    size_t rowIndex = 0;
    std::wstring columnId;
    std::weak_ptr<void> item;
    CellValue oldValue;
    CellValue newValue;
};

enum class CommitStatus
{
    committed,
    noSession,
    validationFailed, //session stays open
    setterFailed,     //session stays open
    itemExpired,      //session closed: nothing left to write to
};

struct CommitResult
{
    CommitStatus status = CommitStatus::noSession;
    std::wstring message; //validation/setter error for display
    std::optional<EditCommit> commit; //CommitStatus::committed only
};


/*  Idle -> Editing -> {Committing -> Idle, Cancelled -> Idle}

    - activation is refused without a transition for: non-editable columns, group headers, an already open session, getter faults
    - commit writes to the item captured at entry, never to whatever the row container currently shows  */
class CellEditController
{
public:
    CellEditController() {}

    bool beginEdit(size_t rowIndex, const ViewRow& row, const ColumnModel& col);

    bool setPendingValue(const CellValue& value); //"false" if no session is open

    CommitResult commit();

    std::optional<EditSession> cancel(); //discard pending value; returns closed session (if any)

    EditState getState() const { return state_; }
    bool isEditing() const { return session_.has_value(); }
    const EditSession* getSession() const { return session_ ? &*session_ : nullptr; }

    bool isEditingCell(size_t rowIndex, const std::wstring& columnId) const { return session_ && session_->rowIndexAtEntry == rowIndex && session_->columnId == columnId; }

    const std::wstring& getLastError() const { return lastError_; } //of the open session

private:
    CellEditController           (const CellEditController&) = delete;
    CellEditController& operator=(const CellEditController&) = delete;

    void closeSession();

    EditState state_ = EditState::idle;
    std::optional<EditSession> session_;

    ValueSetter   setter_;    //captured at entry: column may change while editing
    CellValidator validator_; //
    std::wstring lastError_;
};
}

#endif //CELL_EDIT_H_0918234701928374
