//===----------------------------------------------------------------------===//
//                         DBDriver
//
// queue/request_queue.cpp
//
// Request queue implementation
//===----------------------------------------------------------------------===//

#include "queue/request_queue.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace dbdriver {

const char* EnqueueStatusToString(EnqueueStatus status) {
    switch (status) {
        case EnqueueStatus::ACCEPTED:     return "ACCEPTED";
        case EnqueueStatus::QUEUE_FULL:   return "QUEUE_FULL";
        case EnqueueStatus::DUPLICATE_ID: return "DUPLICATE_ID";
        case EnqueueStatus::CLOSED:       return "CLOSED";
        default:                          return "UNKNOWN";
    }
}

RequestQueue::RequestQueue(const Config& config)
    : config_(config) {
    if (config_.max_size == 0) {
        config_.max_size = DEFAULT_QUEUE_MAX_SIZE;
    }
}

RequestQueue::~RequestQueue() {
    Close();
}

EnqueueStatus RequestQueue::Enqueue(Request request) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (closed_) {
        total_rejected_++;
        return EnqueueStatus::CLOSED;
    }
    if (items_.size() >= config_.max_size) {
        total_rejected_++;
        LOG_WARN("request_queue", "Queue full (" + std::to_string(items_.size()) +
                 "), rejecting " + request.method + " " + request.id);
        return EnqueueStatus::QUEUE_FULL;
    }
    if (by_id_.find(request.id) != by_id_.end()) {
        total_rejected_++;
        return EnqueueStatus::DUPLICATE_ID;
    }

    auto timeout = request.timeout_ms > 0
        ? std::chrono::milliseconds(request.timeout_ms)
        : config_.default_timeout;

    QueueKey key{static_cast<uint8_t>(request.priority), next_sequence_++};

    QueuedRequest item;
    item.enqueued_at = Clock::now();
    item.deadline = item.enqueued_at + timeout;
    item.sequence = key.sequence;
    item.request = std::move(request);

    by_id_.emplace(item.request.id, key);
    deadlines_.emplace(item.deadline, key);
    per_priority_[key.priority]++;
    items_.emplace(key, std::move(item));
    total_enqueued_++;

    not_empty_.notify_one();
    return EnqueueStatus::ACCEPTED;
}

std::optional<QueuedRequest> RequestQueue::Dequeue() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) {
        return std::nullopt;
    }
    total_dequeued_++;
    return TakeLocked(items_.begin());
}

std::optional<QueuedRequest> RequestQueue::WaitDequeue(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) {
        return std::nullopt;
    }
    total_dequeued_++;
    return TakeLocked(items_.begin());
}

bool RequestQueue::Remove(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id_it = by_id_.find(request_id);
    if (id_it == by_id_.end()) {
        return false;
    }
    auto it = items_.find(id_it->second);
    if (it == items_.end()) {
        by_id_.erase(id_it);
        return false;
    }
    TakeLocked(it);
    total_removed_++;
    return true;
}

std::vector<QueuedRequest> RequestQueue::PopExpired(TimePoint now) {
    std::vector<QueuedRequest> expired;
    std::lock_guard<std::mutex> lock(mutex_);

    while (!deadlines_.empty() && deadlines_.begin()->first <= now) {
        QueueKey key = deadlines_.begin()->second;
        auto it = items_.find(key);
        if (it == items_.end()) {
            deadlines_.erase(deadlines_.begin());
            continue;
        }
        expired.push_back(TakeLocked(it));
        total_expired_++;
    }

    if (!expired.empty()) {
        LOG_DEBUG("request_queue", "Expired " + std::to_string(expired.size()) +
                  " queued requests");
    }
    return expired;
}

void RequestQueue::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
}

bool RequestQueue::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

RequestQueue::Stats RequestQueue::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Stats stats;
    stats.size = items_.size();
    stats.max_size = config_.max_size;
    stats.per_priority = per_priority_;
    stats.total_enqueued = total_enqueued_;
    stats.total_dequeued = total_dequeued_;
    stats.total_rejected = total_rejected_;
    stats.total_expired = total_expired_;
    stats.total_removed = total_removed_;

    // The first item of each band is the oldest in that band
    auto now = Clock::now();
    for (size_t p = 0; p < PRIORITY_LEVELS; ++p) {
        if (per_priority_[p] == 0) {
            continue;
        }
        auto it = items_.lower_bound(QueueKey{static_cast<uint8_t>(p), 0});
        if (it != items_.end() && it->first.priority == p) {
            auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
                now - it->second.enqueued_at);
            stats.oldest_age = std::max(stats.oldest_age, age);
        }
    }
    return stats;
}

size_t RequestQueue::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

QueuedRequest RequestQueue::TakeLocked(ItemMap::iterator it) {
    QueuedRequest item = std::move(it->second);
    per_priority_[it->first.priority]--;
    items_.erase(it);
    by_id_.erase(item.request.id);
    EraseDeadlineLocked(item);
    return item;
}

void RequestQueue::EraseDeadlineLocked(const QueuedRequest& item) {
    auto range = deadlines_.equal_range(item.deadline);
    for (auto it = range.first; it != range.second; ++it) {
        if (it->second.sequence == item.sequence) {
            deadlines_.erase(it);
            return;
        }
    }
}

} // namespace dbdriver
