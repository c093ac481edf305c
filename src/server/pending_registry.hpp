//===----------------------------------------------------------------------===//
//                         DBDriver
//
// server/pending_registry.hpp
//
// Correlation of in-flight requests with their waiting callers
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/rpc_types.hpp"
#include <parallel_hashmap/phmap.h>
#include <optional>

namespace dbdriver {

using CompletionCallback = std::function<void(const std::string& request_id, const Result& result)>;

//===----------------------------------------------------------------------===//
// PendingResponse
//===----------------------------------------------------------------------===//
class PendingResponse {
public:
    PendingResponse(std::string request_id, TimePoint deadline, CompletionCallback callback);

    // Non-copyable
    PendingResponse(const PendingResponse&) = delete;
    PendingResponse& operator=(const PendingResponse&) = delete;

    const std::string& GetRequestId() const { return request_id_; }
    TimePoint GetDeadline() const { return deadline_; }
    bool HasCallback() const { return static_cast<bool>(callback_); }

    // Wait for the result until the deadline. False on timeout.
    bool WaitUntil(TimePoint deadline);

    // Wait without a deadline. Only valid once the entry left the registry.
    void Wait();

    std::optional<Result> GetResult() const;

private:
    friend class PendingRegistry;

    // Called exactly once, by whoever removed the entry from the registry
    void Fulfil(Result result);

    std::string request_id_;
    TimePoint deadline_;
    CompletionCallback callback_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<Result> result_;
};

using PendingPtr = std::shared_ptr<PendingResponse>;

//===----------------------------------------------------------------------===//
// PendingRegistry
//
// An entry is delivered by the thread that removes it under the registry
// lock, so a result and a timeout can never both reach the caller.
//===----------------------------------------------------------------------===//
class PendingRegistry {
public:
    struct Stats {
        size_t pending = 0;
        uint64_t total_registered = 0;
        uint64_t total_completed = 0;
        uint64_t total_expired = 0;
        uint64_t late_results_dropped = 0;
    };

    PendingRegistry() = default;

    // Non-copyable
    PendingRegistry(const PendingRegistry&) = delete;
    PendingRegistry& operator=(const PendingRegistry&) = delete;

    // nullptr when the id is already pending
    PendingPtr Register(const std::string& request_id, TimePoint deadline,
                        CompletionCallback callback = nullptr);

    // Deliver a result. False when the entry already expired (the result is dropped).
    bool Complete(const std::string& request_id, Result result);

    // Deliver TIMEOUT. False when the entry was already completed.
    bool Expire(const std::string& request_id, const std::string& reason);

    // Expire every entry whose deadline is at or before now
    size_t SweepExpired(TimePoint now = Clock::now());

    // Complete everything still pending with the given error
    size_t FailAll(ErrorCode code, const std::string& message);

    bool IsPending(const std::string& request_id) const;
    size_t Size() const;
    Stats GetStats() const;

private:
    PendingPtr Take(const std::string& request_id);

    phmap::flat_hash_map<std::string, PendingPtr> entries_;
    mutable std::mutex mutex_;

    std::atomic<uint64_t> total_registered_{0};
    std::atomic<uint64_t> total_completed_{0};
    std::atomic<uint64_t> total_expired_{0};
    std::atomic<uint64_t> late_results_dropped_{0};
};

} // namespace dbdriver
