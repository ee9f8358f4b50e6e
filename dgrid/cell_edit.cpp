// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "cell_edit.h"
#include "grid_error.h"
#include "i18n.h"

using namespace dgrid;


bool CellEditController::beginEdit(size_t rowIndex, const ViewRow& row, const ColumnModel& col)
{
    if (state_ != EditState::idle) //at most one concurrent edit session
        return false;
    DGRID_CONTRACT_CHECK(!session_);

    if (!col.editable || !col.visible || row.isGroupHeader()) //hidden column: no cell to activate
        return false;
    DGRID_CONTRACT_CHECK(col.setter); //see validateColumn()

    const std::shared_ptr<void> item = row.item.lock();
    if (!item)
        return false;

    CellValue originalValue;
    try
    {
        originalValue = col.getter(item.get()); //throw X
    }
    catch (const std::exception&) { return false; } //absent value: nothing sound to edit

    EditSession session;
    session.rowIndexAtEntry  = rowIndex;
    session.columnId         = col.id;
    session.originalValue    = originalValue;
    session.pendingValue     = originalValue;
    session.boundItemAtEntry = item;

    session_   = std::move(session);
    setter_    = col.setter;
    validator_ = col.validator;
    lastError_.clear();
    state_ = EditState::editing;
    return true;
}


bool CellEditController::setPendingValue(const CellValue& value)
{
    if (state_ != EditState::editing)
        return false;

    session_->pendingValue = value;
    return true;
}


CommitResult CellEditController::commit()
{
    if (state_ != EditState::editing)
        return {CommitStatus::noSession, {}, {}};

    const std::shared_ptr<void> item = session_->boundItemAtEntry.lock();
    if (!item) //host removed the item while editing
    {
        const std::wstring msg = replaceCpy(_("The edited row of column %x no longer exists."), L"%x", fmtColumn(session_->columnId));
        closeSession();
        return {CommitStatus::itemExpired, msg, {}};
    }

    if (validator_)
    {
        ValidationResult vr;
        try
        {
            vr = validator_(item.get(), session_->pendingValue); //throw X
        }
        catch (const std::exception& e)
        {
            vr = {false, utfToWide(e.what())};
        }

        if (!vr.valid)
        {
            lastError_ = vr.message.empty() ? _("The value is not valid.") : vr.message;
            return {CommitStatus::validationFailed, lastError_, {}};
        }
    }

    state_ = EditState::committing;
    try
    {
        setter_(item.get(), session_->pendingValue); //throw X
    }
    catch (const std::exception& e)
    {
        state_ = EditState::editing; //abort only this commit: source left to the setter's own guarantees
        lastError_ = replaceCpy(_("Cannot write value of column %x."), L"%x", fmtColumn(session_->columnId)) + L"\n\n" + utfToWide(e.what());
        return {CommitStatus::setterFailed, lastError_, {}};
    }

    EditCommit ec;
    ec.rowIndex = session_->rowIndexAtEntry;
    ec.columnId = session_->columnId;
    ec.item     = session_->boundItemAtEntry;
    ec.oldValue = session_->originalValue;
    ec.newValue = session_->pendingValue;

    closeSession();
    return {CommitStatus::committed, {}, std::move(ec)};
}


std::optional<EditSession> CellEditController::cancel()
{
    if (state_ != EditState::editing)
        return std::nullopt;

    state_ = EditState::cancelled;
    std::optional<EditSession> closed = std::move(session_);
    closeSession();
    return closed;
}


void CellEditController::closeSession()
{
    session_.reset();
    setter_    = nullptr;
    validator_ = nullptr;
    lastError_.clear();
    state_ = EditState::idle;
}
