#include <relay/core/dispatch/item_heap.hpp>
#include <algorithm>

namespace Relay {

void ItemHeap::push(ItemPtr item) {
    items_.push_back(std::move(item));
    std::push_heap(items_.begin(), items_.end(), ItemOrder{});
}

ItemPtr ItemHeap::pop() {
    if (items_.empty()) return nullptr;
    std::pop_heap(items_.begin(), items_.end(), ItemOrder{});
    ItemPtr item = std::move(items_.back());
    items_.pop_back();
    return item;
}

std::vector<ItemPtr> ItemHeap::removeIf(const std::function<bool(const ItemPtr&)>& pred) {
    std::vector<ItemPtr> removed;
    auto keep_end = std::partition(items_.begin(), items_.end(),
                                   [&pred](const ItemPtr& it) { return !pred(it); });
    if (keep_end == items_.end()) {
        return removed;
    }
    removed.assign(std::make_move_iterator(keep_end), std::make_move_iterator(items_.end()));
    items_.erase(keep_end, items_.end());
    std::make_heap(items_.begin(), items_.end(), ItemOrder{});
    return removed;
}

std::vector<ItemPtr> ItemHeap::drain() {
    std::vector<ItemPtr> out;
    out.swap(items_);
    return out;
}

void PriorityQueueSet::push(ItemPtr item) {
    heaps_[priorityIndex(item->priority)].push(std::move(item));
}

size_t PriorityQueueSet::size() const {
    size_t total = 0;
    for (const auto& h : heaps_) {
        total += h.size();
    }
    return total;
}

std::vector<ItemPtr> PriorityQueueSet::drain() {
    std::vector<ItemPtr> out;
    for (auto& h : heaps_) {
        auto items = h.drain();
        out.insert(out.end(), std::make_move_iterator(items.begin()),
                   std::make_move_iterator(items.end()));
    }
    return out;
}

} // namespace Relay
