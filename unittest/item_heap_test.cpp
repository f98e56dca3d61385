// ============================================================================
// ITEM HEAP UNIT TESTS
// ============================================================================
// Ordering of the per-(target, priority) heaps and their compaction
// ============================================================================

#include <gtest/gtest.h>
#include <relay/core/dispatch/item_heap.hpp>
#include "test_helpers.hpp"

using namespace Relay;
using RelayTest::makeItem;

// ============================================================================
// ORDERING TESTS
// ============================================================================

TEST(ItemHeap, PopsHigherPriorityFirst) {
    ItemHeap heap;
    heap.push(makeItem(1, MessagePriority::LOW, 100));
    heap.push(makeItem(2, MessagePriority::URGENT, 300));
    heap.push(makeItem(3, MessagePriority::NORMAL, 200));

    EXPECT_EQ(heap.pop()->payload.id, 2u);
    EXPECT_EQ(heap.pop()->payload.id, 3u);
    EXPECT_EQ(heap.pop()->payload.id, 1u);
    EXPECT_EQ(heap.pop(), nullptr);
}

TEST(ItemHeap, OlderTimestampFirstWithinPriority) {
    ItemHeap heap;
    heap.push(makeItem(1, MessagePriority::NORMAL, 300));
    heap.push(makeItem(2, MessagePriority::NORMAL, 100));
    heap.push(makeItem(3, MessagePriority::NORMAL, 200));

    EXPECT_EQ(heap.pop()->payload.id, 2u);
    EXPECT_EQ(heap.pop()->payload.id, 3u);
    EXPECT_EQ(heap.pop()->payload.id, 1u);
}

TEST(ItemHeap, SequenceBreaksTimestampTies) {
    ItemHeap heap;
    for (uint64_t i = 0; i < 50; ++i) {
        heap.push(makeItem(i, MessagePriority::HIGH, 1000, 49 - i));
    }
    // Highest id was pushed with the lowest sequence
    for (uint64_t i = 0; i < 50; ++i) {
        EXPECT_EQ(heap.pop()->payload.id, 49 - i);
    }
    EXPECT_TRUE(heap.empty());
}

// ============================================================================
// COMPACTION TESTS
// ============================================================================

TEST(ItemHeap, RemoveIfKeepsHeapOrder) {
    ItemHeap heap;
    for (uint64_t i = 0; i < 20; ++i) {
        heap.push(makeItem(i, MessagePriority::NORMAL, 1000 + (i * 7) % 20, i));
    }

    auto removed = heap.removeIf([](const ItemPtr& it) { return it->payload.id % 2 == 0; });
    EXPECT_EQ(removed.size(), 10u);
    EXPECT_EQ(heap.size(), 10u);

    uint64_t last_ts = 0;
    while (!heap.empty()) {
        auto item = heap.pop();
        EXPECT_EQ(item->payload.id % 2, 1u);
        EXPECT_GE(item->timestamp_ms, last_ts);
        last_ts = item->timestamp_ms;
    }
}

TEST(ItemHeap, RemoveIfNothingMatches) {
    ItemHeap heap;
    heap.push(makeItem(1, MessagePriority::LOW, 10));
    auto removed = heap.removeIf([](const ItemPtr&) { return false; });
    EXPECT_TRUE(removed.empty());
    EXPECT_EQ(heap.size(), 1u);
}

TEST(PriorityQueueSet, RoutesByPriority) {
    PriorityQueueSet set;
    set.push(makeItem(1, MessagePriority::LOW, 10));
    set.push(makeItem(2, MessagePriority::LOW, 11));
    set.push(makeItem(3, MessagePriority::URGENT, 12));

    EXPECT_EQ(set.size(), 3u);
    EXPECT_EQ(set.size(MessagePriority::LOW), 2u);
    EXPECT_EQ(set.size(MessagePriority::URGENT), 1u);
    EXPECT_EQ(set.size(MessagePriority::HIGH), 0u);

    auto drained = set.drain();
    EXPECT_EQ(drained.size(), 3u);
    EXPECT_TRUE(set.empty());
}
