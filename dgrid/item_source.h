// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ITEM_SOURCE_H_9812734098123412
#define ITEM_SOURCE_H_9812734098123412

#include <algorithm>
#include <cassert>
#include <memory>
#include <vector>
#include "grid_error.h"


namespace dgrid
{
struct ItemSourceListener
{
    virtual ~ItemSourceListener() {}

    virtual void onItemsAdded  (size_t first, size_t count) = 0;
    virtual void onItemsRemoved(size_t first, size_t count) = 0;
    virtual void onReset() = 0;
};


/*  raw collection as seen by the grid:
    - items are owned by the host: the grid only keeps std::weak_ptr
    - change notifications are optional: without them the host calls DataGrid::refresh() */
class ItemSource
{
public:
    virtual ~ItemSource() {}

    virtual size_t size() const = 0;
    virtual std::shared_ptr<void> getItem(size_t pos) const = 0; //never nullptr for pos < size()

    void addListener(ItemSourceListener& l) { assert(!isListening(l)); listeners_.push_back(&l); }
    void removeListener(ItemSourceListener& l) { std::erase(listeners_, &l); }
    bool isListening(const ItemSourceListener& l) const { return std::find(listeners_.begin(), listeners_.end(), &l) != listeners_.end(); }

protected:
    void notifyItemsAdded  (size_t first, size_t count) { for (ItemSourceListener* l : getListeners()) l->onItemsAdded  (first, count); }
    void notifyItemsRemoved(size_t first, size_t count) { for (ItemSourceListener* l : getListeners()) l->onItemsRemoved(first, count); }
    void notifyReset()                                  { for (ItemSourceListener* l : getListeners()) l->onReset(); }

private:
    std::vector<ItemSourceListener*> getListeners() const { return listeners_; } //listeners may unregister while being notified

    std::vector<ItemSourceListener*> listeners_;
};


template <class T>
class ItemList : public ItemSource
{
public:
    ItemList() {}
    explicit ItemList(std::vector<std::shared_ptr<T>> items) : items_(std::move(items)) { assert(std::none_of(items_.begin(), items_.end(), [](const auto& p) { return !p; })); }

    size_t size() const override { return items_.size(); }
    std::shared_ptr<void> getItem(size_t pos) const override
    {
        DGRID_CONTRACT_CHECK(pos < items_.size());
        return items_[pos];
    }

    const std::shared_ptr<T>& operator[](size_t pos) const { return items_[pos]; }
    const std::vector<std::shared_ptr<T>>& getItems() const { return items_; }

    void add(std::shared_ptr<T> item) { insert(items_.size(), std::move(item)); }

    void insert(size_t pos, std::shared_ptr<T> item)
    {
        DGRID_CONTRACT_CHECK(item && pos <= items_.size());
        items_.insert(items_.begin() + pos, std::move(item));
        notifyItemsAdded(pos, 1);
    }

    void remove(size_t pos, size_t count = 1)
    {
        DGRID_CONTRACT_CHECK(pos <= items_.size() && count <= items_.size() - pos);
        if (count == 0)
            return;
        items_.erase(items_.begin() + pos, items_.begin() + pos + count);
        notifyItemsRemoved(pos, count);
    }

    void clear()
    {
        items_.clear();
        notifyReset();
    }

    void assign(std::vector<std::shared_ptr<T>> items)
    {
        items_ = std::move(items);
        notifyReset();
    }

    void itemChanged() { notifyReset(); } //host mutated an item in place

private:
    std::vector<std::shared_ptr<T>> items_;
};
}

#endif //ITEM_SOURCE_H_9812734098123412
