#pragma once

#include <relay/core/dispatch/types.hpp>
#include <array>
#include <functional>
#include <vector>

namespace Relay {

/**
 * @class ItemHeap
 * @brief Binary heap of queued items for one (target, priority) pair.
 *
 * Not thread-safe: every call is made under the owning target's lock.
 * pop() is O(log n). Stale entries are skipped lazily by the dequeue path;
 * removeIf() is the O(n) compaction used only by the reaper and by
 * clearQueues(), never on the hot dequeue path.
 */
class ItemHeap {
public:
    void push(ItemPtr item);
    ItemPtr pop();

    const ItemPtr& top() const { return items_.front(); }
    bool empty() const { return items_.empty(); }
    size_t size() const { return items_.size(); }

    /**
     * @brief Remove every item matching `pred`, then re-heapify
     * @return Removed items (in no particular order)
     */
    std::vector<ItemPtr> removeIf(const std::function<bool(const ItemPtr&)>& pred);

    std::vector<ItemPtr> drain();

private:
    std::vector<ItemPtr> items_;
};

/**
 * @class PriorityQueueSet
 * @brief The four per-priority heaps of one target
 */
class PriorityQueueSet {
public:
    void push(ItemPtr item);

    ItemHeap& heap(MessagePriority p) { return heaps_[priorityIndex(p)]; }
    const ItemHeap& heap(MessagePriority p) const { return heaps_[priorityIndex(p)]; }

    size_t size() const;
    size_t size(MessagePriority p) const { return heap(p).size(); }
    bool empty() const { return size() == 0; }

    std::vector<ItemPtr> drain();

private:
    std::array<ItemHeap, PRIORITY_CLASSES> heaps_;
};

} // namespace Relay
