//===----------------------------------------------------------------------===//
//                         DBDriver
//
// server/pending_registry.cpp
//
// Pending response registry implementation
//===----------------------------------------------------------------------===//

#include "server/pending_registry.hpp"
#include "logging/logger.hpp"

namespace dbdriver {

//===----------------------------------------------------------------------===//
// PendingResponse
//===----------------------------------------------------------------------===//

PendingResponse::PendingResponse(std::string request_id, TimePoint deadline,
                                 CompletionCallback callback)
    : request_id_(std::move(request_id))
    , deadline_(deadline)
    , callback_(std::move(callback)) {}

bool PendingResponse::WaitUntil(TimePoint deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_until(lock, deadline, [this] { return result_.has_value(); });
}

void PendingResponse::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return result_.has_value(); });
}

std::optional<Result> PendingResponse::GetResult() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return result_;
}

void PendingResponse::Fulfil(Result result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result_ = result;
    }
    cv_.notify_all();

    if (callback_) {
        try {
            callback_(request_id_, result);
        } catch (const std::exception& e) {
            LOG_ERROR("pending", "Completion callback for " + request_id_ + " failed: " + e.what());
        }
    }
}

//===----------------------------------------------------------------------===//
// PendingRegistry
//===----------------------------------------------------------------------===//

PendingPtr PendingRegistry::Register(const std::string& request_id, TimePoint deadline,
                                     CompletionCallback callback) {
    auto pending = std::make_shared<PendingResponse>(request_id, deadline, std::move(callback));

    std::lock_guard<std::mutex> lock(mutex_);
    if (!entries_.emplace(request_id, pending).second) {
        return nullptr;
    }
    total_registered_++;
    return pending;
}

PendingPtr PendingRegistry::Take(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(request_id);
    if (it == entries_.end()) {
        return nullptr;
    }
    PendingPtr pending = std::move(it->second);
    entries_.erase(it);
    return pending;
}

bool PendingRegistry::Complete(const std::string& request_id, Result result) {
    PendingPtr pending = Take(request_id);
    if (!pending) {
        late_results_dropped_++;
        LOG_WARN("pending", "Dropping late " + std::string(ResultKindToString(result.GetKind())) +
                 " result for " + request_id + " (caller no longer waiting)");
        return false;
    }
    total_completed_++;
    pending->Fulfil(std::move(result));
    return true;
}

bool PendingRegistry::Expire(const std::string& request_id, const std::string& reason) {
    PendingPtr pending = Take(request_id);
    if (!pending) {
        return false;
    }
    total_expired_++;
    LOG_DEBUG("pending", "Request " + request_id + " expired: " + reason);
    pending->Fulfil(Result::Error(ErrorCode::TIMEOUT, reason));
    return true;
}

size_t PendingRegistry::SweepExpired(TimePoint now) {
    std::vector<std::string> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : entries_) {
            if (entry.second->GetDeadline() <= now) {
                expired.push_back(entry.first);
            }
        }
    }

    size_t count = 0;
    for (const auto& id : expired) {
        if (Expire(id, "request timed out")) {
            count++;
        }
    }
    return count;
}

size_t PendingRegistry::FailAll(ErrorCode code, const std::string& message) {
    std::vector<PendingPtr> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : entries_) {
            all.push_back(std::move(entry.second));
        }
        entries_.clear();
    }
    for (auto& pending : all) {
        pending->Fulfil(Result::Error(code, message));
    }
    total_completed_ += all.size();
    return all.size();
}

bool PendingRegistry::IsPending(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(request_id) != 0;
}

size_t PendingRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

PendingRegistry::Stats PendingRegistry::GetStats() const {
    Stats stats;
    stats.pending = Size();
    stats.total_registered = total_registered_.load();
    stats.total_completed = total_completed_.load();
    stats.total_expired = total_expired_.load();
    stats.late_results_dropped = late_results_dropped_.load();
    return stats;
}

} // namespace dbdriver
