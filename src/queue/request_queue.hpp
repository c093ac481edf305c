//===----------------------------------------------------------------------===//
//                         DBDriver
//
// queue/request_queue.hpp
//
// Bounded priority queue of pending requests
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/rpc_types.hpp"
#include <parallel_hashmap/phmap.h>
#include <array>
#include <map>
#include <optional>

namespace dbdriver {

struct QueuedRequest {
    Request request;
    TimePoint enqueued_at;
    TimePoint deadline;
    uint64_t sequence = 0;
};

enum class EnqueueStatus : uint8_t {
    ACCEPTED = 0,
    QUEUE_FULL = 1,
    DUPLICATE_ID = 2,
    CLOSED = 3
};

const char* EnqueueStatusToString(EnqueueStatus status);

class RequestQueue {
public:
    struct Config {
        size_t max_size;
        std::chrono::milliseconds default_timeout;

        Config()
            : max_size(DEFAULT_QUEUE_MAX_SIZE)
            , default_timeout(DEFAULT_REQUEST_TIMEOUT_MS) {}
    };

    struct Stats {
        size_t size = 0;
        size_t max_size = 0;
        std::array<size_t, PRIORITY_LEVELS> per_priority{};
        std::chrono::milliseconds oldest_age{0};
        uint64_t total_enqueued = 0;
        uint64_t total_dequeued = 0;
        uint64_t total_rejected = 0;
        uint64_t total_expired = 0;
        uint64_t total_removed = 0;
    };

    explicit RequestQueue(const Config& config = Config{});
    ~RequestQueue();

    // Non-copyable
    RequestQueue(const RequestQueue&) = delete;
    RequestQueue& operator=(const RequestQueue&) = delete;

    // Add a request; never blocks
    EnqueueStatus Enqueue(Request request);

    // Highest priority, oldest first. Empty when nothing is queued.
    std::optional<QueuedRequest> Dequeue();

    // Like Dequeue but waits up to timeout for an item or Close()
    std::optional<QueuedRequest> WaitDequeue(std::chrono::milliseconds timeout);

    // Remove a queued request by id
    bool Remove(const std::string& request_id);

    // Remove and return every item whose deadline is at or before now
    std::vector<QueuedRequest> PopExpired(TimePoint now = Clock::now());

    // Reject further enqueues and wake waiters
    void Close();
    bool IsClosed() const;

    Stats GetStats() const;
    size_t Size() const;
    bool Empty() const { return Size() == 0; }
    const Config& GetConfig() const { return config_; }

private:
    struct QueueKey {
        uint8_t priority;
        uint64_t sequence;
    };

    // Higher priority first, then lower sequence
    struct KeyOrder {
        bool operator()(const QueueKey& a, const QueueKey& b) const {
            if (a.priority != b.priority) {
                return a.priority > b.priority;
            }
            return a.sequence < b.sequence;
        }
    };

    using ItemMap = std::map<QueueKey, QueuedRequest, KeyOrder>;

    // Caller holds mutex_
    QueuedRequest TakeLocked(ItemMap::iterator it);
    void EraseDeadlineLocked(const QueuedRequest& item);

private:
    Config config_;

    ItemMap items_;
    phmap::flat_hash_map<std::string, QueueKey> by_id_;
    std::multimap<TimePoint, QueueKey> deadlines_;
    std::array<size_t, PRIORITY_LEVELS> per_priority_{};

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    bool closed_ = false;
    uint64_t next_sequence_ = 1;

    // Statistics
    uint64_t total_enqueued_ = 0;
    uint64_t total_dequeued_ = 0;
    uint64_t total_rejected_ = 0;
    uint64_t total_expired_ = 0;
    uint64_t total_removed_ = 0;
};

} // namespace dbdriver
