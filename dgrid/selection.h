// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SELECTION_H_1092837401928374
#define SELECTION_H_1092837401928374

#include <algorithm>
#include <cassert>
#include <vector>


namespace dgrid
{
//row selection over the effective sequence
class RowSelection
{
public:
    void init(size_t rowCount) { selected_.resize(rowCount); clear(); }

    std::vector<size_t> get() const
    {
        std::vector<size_t> result;
        for (size_t row = 0; row < selected_.size(); ++row)
            if (selected_[row] != 0)
                result.push_back(row);
        return result;
    }

    bool empty() const { return std::none_of(selected_.begin(), selected_.end(), [](char c) { return c != 0; }); }

    void selectRow(size_t row, bool positive = true) { selectRange(row, row + 1, positive); }
    void clear() { selectRange(0, selected_.size(), false); }

    bool isSelected(size_t row) const { return row < selected_.size() ? selected_[row] != 0 : false; }

    void selectRange(size_t rowFirst, size_t rowLast, bool positive = true) //select [rowFirst, rowLast), trims if required!
    {
        if (rowFirst <= rowLast)
        {
            rowFirst = std::clamp<size_t>(rowFirst, 0, selected_.size());
            rowLast  = std::clamp<size_t>(rowLast,  0, selected_.size());

            std::fill(selected_.begin() + rowFirst, selected_.begin() + rowLast, positive);
        }
        else assert(false);
    }

private:
    std::vector<char> selected_; //effectively a vector<bool> of size "number of rows"
};
}

#endif //SELECTION_H_1092837401928374
