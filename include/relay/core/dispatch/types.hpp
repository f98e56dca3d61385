#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Relay {

using TargetId = size_t;

// ============================================================================
// PRIORITY CLASSES
// ============================================================================

enum class MessagePriority : uint8_t {
    LOW = 1,
    NORMAL = 2,
    HIGH = 3,
    URGENT = 4
};

constexpr size_t PRIORITY_CLASSES = 4;

// Dequeue / rebalance scan order
constexpr std::array<MessagePriority, PRIORITY_CLASSES> PRIORITIES_HIGH_TO_LOW = {
    MessagePriority::URGENT,
    MessagePriority::HIGH,
    MessagePriority::NORMAL,
    MessagePriority::LOW
};

inline size_t priorityIndex(MessagePriority p) {
    return static_cast<size_t>(p) - 1;
}

// One level down, floored at LOW
inline MessagePriority demote(MessagePriority p) {
    return p == MessagePriority::LOW
        ? MessagePriority::LOW
        : static_cast<MessagePriority>(static_cast<uint8_t>(p) - 1);
}

const char* toString(MessagePriority p);

// ============================================================================
// PAYLOAD & QUEUED ITEM
// ============================================================================

/**
 * @brief Message payload, opaque to the engine.
 *
 * Filtering, media handling and source/destination mapping happen upstream
 * of submit() and downstream of the send function.
 */
struct Payload {
    uint64_t id = 0;
    std::vector<uint8_t> body;
    std::unordered_map<std::string, std::string> metadata;
};

/**
 * @brief Content hints supplied by the caller at submission time
 */
struct SubmitHints {
    bool is_reply = false;
    bool has_media = false;
    size_t text_length = 0;
    std::optional<MessagePriority> priority;      // explicit override (only way to get URGENT)
    std::optional<TargetId> preferred_target;
};

struct QueuedItem {
    Payload payload;
    MessagePriority priority = MessagePriority::NORMAL;
    uint64_t timestamp_ms = 0;        // ordering key; bumped by retry backoff
    uint64_t submitted_ms = 0;        // original submission time, never changed
    uint64_t sequence = 0;            // tie-break for equal timestamps
    TargetId target = 0;
    uint32_t retry_count = 0;
    uint32_t max_retries = 3;
    double estimated_cost_s = 1.0;
};

using ItemPtr = std::shared_ptr<QueuedItem>;

/**
 * @brief Heap comparator: true when `a` must be served after `b`.
 *
 * Priority descending, then timestamp ascending (older first), then
 * submission sequence so equal-millisecond items stay FIFO.
 */
struct ItemOrder {
    bool operator()(const ItemPtr& a, const ItemPtr& b) const {
        if (a->priority != b->priority) {
            return a->priority < b->priority;
        }
        if (a->timestamp_ms != b->timestamp_ms) {
            return a->timestamp_ms > b->timestamp_ms;
        }
        return a->sequence > b->sequence;
    }
};

// ============================================================================
// SEND CONTRACT
// ============================================================================

enum class ErrorKind : uint8_t {
    NONE = 0,
    NETWORK = 1,        // transient transport failure
    TIMEOUT = 2,        // send or message deadline exceeded
    RATE_LIMITED = 3,   // explicit retry-after from the remote side
    CIRCUIT_OPEN = 4,   // skipped locally, no remote call made
    CANCELLED = 5,      // engine stopping
    OTHER = 6
};

const char* toString(ErrorKind kind);

inline bool isTransient(ErrorKind kind) {
    return kind == ErrorKind::NETWORK || kind == ErrorKind::TIMEOUT
        || kind == ErrorKind::RATE_LIMITED;
}

struct SendResult {
    bool ok = false;
    std::optional<std::chrono::milliseconds> retry_after;
    ErrorKind kind = ErrorKind::NONE;
    std::string message;

    static SendResult success() {
        SendResult r;
        r.ok = true;
        return r;
    }
    static SendResult failure(ErrorKind kind, std::string message = {}) {
        SendResult r;
        r.kind = kind;
        r.message = std::move(message);
        return r;
    }
    static SendResult retryAfter(std::chrono::milliseconds delay, std::string message = {}) {
        SendResult r;
        r.kind = ErrorKind::RATE_LIMITED;
        r.retry_after = delay;
        r.message = std::move(message);
        return r;
    }
};

// Supplied by the caller; the engine never builds protocol messages itself
using SendFunction = std::function<SendResult(TargetId, const Payload&)>;

// ============================================================================
// SELECTION STRATEGY
// ============================================================================

enum class SelectionStrategy : uint8_t {
    ROUND_ROBIN = 0,
    LEAST_LOADED = 1,
    SMART = 2
};

const char* toString(SelectionStrategy s);
std::optional<SelectionStrategy> parseSelectionStrategy(const std::string& name);

} // namespace Relay
