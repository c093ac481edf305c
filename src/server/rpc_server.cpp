//===----------------------------------------------------------------------===//
//                         DBDriver
//
// server/rpc_server.cpp
//
// RPC server implementation
//===----------------------------------------------------------------------===//

#include "server/rpc_server.hpp"
#include "logging/logger.hpp"
#include "protocol/errors.hpp"
#include "utils/uuid.hpp"

namespace dbdriver {

RpcServer::RpcServer(MethodTable methods, const Config& config)
    : methods_(std::move(methods))
    , config_(config)
    , queue_(config.queue)
    , executor_(config.worker_threads) {}

RpcServer::~RpcServer() {
    Stop();
}

void RpcServer::Start() {
    if (running_.exchange(true)) {
        return;
    }
    executor_.Start();
    dispatch_thread_ = std::thread(&RpcServer::DispatchLoop, this);

    LOG_INFO("rpc", "RPC server started (" + std::to_string(methods_.Size()) + " methods, " +
             std::to_string(executor_.Size()) + " workers, queue max " +
             std::to_string(config_.queue.max_size) + ")");
}

void RpcServer::Stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    running_ = false;
    queue_.Close();

    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }

    // Requests still queued never reach a worker
    while (auto item = queue_.Dequeue()) {
        registry_.Complete(item->request.id,
                           Result::Error(ErrorCode::SHUTTING_DOWN, "server is shutting down"));
    }

    // Workers finish what they already hold
    executor_.Stop();

    size_t failed = registry_.FailAll(ErrorCode::SHUTTING_DOWN, "server is shutting down");
    LOG_INFO("rpc", "RPC server stopped (" + std::to_string(executed_.load()) +
             " executed, " + std::to_string(failed) + " abandoned)");
}

void RpcServer::SetDispatchObserver(DispatchObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_ = std::move(observer);
}

PendingPtr RpcServer::Accept(Request& request, CompletionCallback callback, Result& immediate) {
    if (!methods_.Contains(request.method)) {
        rejected_++;
        throw ProtocolError("unknown method: " + request.method, ErrorCode::UNKNOWN_METHOD);
    }
    if (request.id.empty()) {
        request.id = GenerateUuid();
    }
    if (request.timeout_ms == 0) {
        request.timeout_ms = static_cast<uint32_t>(config_.queue.default_timeout.count());
    }

    auto deadline = Clock::now() + std::chrono::milliseconds(request.timeout_ms);
    PendingPtr pending = registry_.Register(request.id, deadline, callback);
    if (!pending) {
        rejected_++;
        immediate = Result::Error(ErrorCode::INVALID_PARAMETER,
                                  "duplicate request id: " + request.id);
        if (callback) {
            callback(request.id, immediate);
        }
        return nullptr;
    }

    std::string id = request.id;
    EnqueueStatus status = stopped_ ? EnqueueStatus::CLOSED : queue_.Enqueue(request);
    switch (status) {
        case EnqueueStatus::ACCEPTED:
            accepted_++;
            return pending;
        case EnqueueStatus::QUEUE_FULL:
            rejected_++;
            registry_.Complete(id, Result::Error(ErrorCode::QUEUE_FULL, "request queue is full"));
            break;
        case EnqueueStatus::CLOSED:
            rejected_++;
            registry_.Complete(id, Result::Error(ErrorCode::SHUTTING_DOWN,
                                                 "server is shutting down"));
            break;
        case EnqueueStatus::DUPLICATE_ID:
        default:
            rejected_++;
            registry_.Complete(id, Result::Error(ErrorCode::INVALID_PARAMETER,
                                                 "duplicate request id: " + id));
            break;
    }
    // Completed above, the callback (if any) already ran
    return pending;
}

Result RpcServer::Call(Request request) {
    Result immediate;
    PendingPtr pending = Accept(request, nullptr, immediate);
    if (!pending) {
        return immediate;
    }

    auto deadline = pending->GetDeadline();
    if (!pending->WaitUntil(deadline)) {
        // Whoever removes the entry delivers; a concurrent result wins the race cleanly
        if (registry_.Expire(request.id, "request timed out after " +
                             std::to_string(request.timeout_ms) + "ms")) {
            queue_.Remove(request.id);
        }
        pending->Wait();
    }
    return *pending->GetResult();
}

void RpcServer::CallAsync(Request request, CompletionCallback callback) {
    Result immediate;
    Accept(request, std::move(callback), immediate);
}

void RpcServer::DispatchLoop() {
    auto next_sweep = Clock::now() + config_.sweep_interval;

    while (running_) {
        auto now = Clock::now();
        for (auto& item : queue_.PopExpired(now)) {
            registry_.Expire(item.request.id, "request timed out in queue after " +
                             std::to_string(item.request.timeout_ms) + "ms");
        }
        if (now >= next_sweep) {
            registry_.SweepExpired(now);
            next_sweep = now + config_.sweep_interval;
        }

        // Requests stay in the priority queue until a worker can take one
        if (!executor_.WaitForIdleWorker(config_.poll_interval)) {
            continue;
        }

        auto item = queue_.WaitDequeue(config_.poll_interval);
        if (!item) {
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(observer_mutex_);
            if (observer_) {
                observer_(item->request);
            }
        }
        dispatched_++;

        Request request = std::move(item->request);
        std::string id = request.id;
        if (!executor_.Submit([this, request]() { ExecuteRequest(request); })) {
            registry_.Complete(id, Result::Error(ErrorCode::SHUTTING_DOWN,
                                                 "server is shutting down"));
        }
    }
}

void RpcServer::ExecuteRequest(const Request& request) {
    // Expired while waiting for a worker
    if (!registry_.IsPending(request.id)) {
        LOG_DEBUG("rpc", "Skipping " + request.method + " " + request.id + " (no longer pending)");
        return;
    }

    auto started = Clock::now();
    Result result = methods_.Invoke(request);
    executed_++;

    DLOG_DEBUG("rpc", "{} {} -> {} in {}us", request.method, request.id,
               ResultKindToString(result.GetKind()),
               std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - started).count());

    registry_.Complete(request.id, std::move(result));
}

RpcServer::Stats RpcServer::GetStats() const {
    Stats stats;
    stats.queue = queue_.GetStats();
    stats.pending = registry_.GetStats();
    stats.workers = executor_.Size();
    stats.busy_workers = executor_.BusyWorkers();
    stats.accepted = accepted_.load();
    stats.rejected = rejected_.load();
    stats.dispatched = dispatched_.load();
    stats.executed = executed_.load();
    return stats;
}

Value RpcServer::GetHealth() const {
    Stats stats = GetStats();

    ValueMap health;
    health["status"] = Value(running_ ? "ok" : "stopping");
    health["queue_size"] = Value(static_cast<uint64_t>(stats.queue.size));
    health["queue_max_size"] = Value(static_cast<uint64_t>(stats.queue.max_size));
    health["pending"] = Value(static_cast<uint64_t>(stats.pending.pending));
    health["workers"] = Value(static_cast<uint64_t>(stats.workers));
    health["busy_workers"] = Value(static_cast<uint64_t>(stats.busy_workers));
    health["accepted"] = Value(stats.accepted);
    health["rejected"] = Value(stats.rejected);
    health["dispatched"] = Value(stats.dispatched);
    health["executed"] = Value(stats.executed);
    health["timeouts"] = Value(stats.pending.total_expired);
    health["late_results_dropped"] = Value(stats.pending.late_results_dropped);
    return Value(std::move(health));
}

} // namespace dbdriver
