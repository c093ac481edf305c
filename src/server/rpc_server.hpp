//===----------------------------------------------------------------------===//
//                         DBDriver
//
// server/rpc_server.hpp
//
// Request acceptance, priority dispatch and result correlation
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "executor/executor_pool.hpp"
#include "queue/request_queue.hpp"
#include "server/method_table.hpp"
#include "server/pending_registry.hpp"

namespace dbdriver {

class RpcServer {
public:
    struct Config {
        size_t worker_threads;
        RequestQueue::Config queue;
        std::chrono::milliseconds poll_interval;
        std::chrono::milliseconds sweep_interval;

        Config()
            : worker_threads(DEFAULT_WORKER_THREADS)
            , poll_interval(DEFAULT_POLL_INTERVAL_MS)
            , sweep_interval(100) {}
    };

    struct Stats {
        RequestQueue::Stats queue;
        PendingRegistry::Stats pending;
        size_t workers = 0;
        size_t busy_workers = 0;
        uint64_t accepted = 0;
        uint64_t rejected = 0;
        uint64_t dispatched = 0;
        uint64_t executed = 0;
    };

    // Invoked on the dispatch thread with each request, in dispatch order
    using DispatchObserver = std::function<void(const Request& request)>;

    RpcServer(MethodTable methods, const Config& config = Config{});
    ~RpcServer();

    // Non-copyable
    RpcServer(const RpcServer&) = delete;
    RpcServer& operator=(const RpcServer&) = delete;

    // Requests may be accepted before Start; they wait in the queue
    void Start();

    // Fails queued and pending requests with SHUTTING_DOWN
    void Stop();

    bool IsRunning() const { return running_; }

    // Block until the result or the request timeout.
    // Throws ProtocolError for an unknown method.
    Result Call(Request request);

    // Callback runs exactly once, on a worker or the dispatch thread.
    // Throws ProtocolError for an unknown method.
    void CallAsync(Request request, CompletionCallback callback);

    void SetDispatchObserver(DispatchObserver observer);

    const MethodTable& GetMethods() const { return methods_; }
    Stats GetStats() const;

    // Health map carried in PONG frames
    Value GetHealth() const;

private:
    // Registers and enqueues. nullptr when the request was answered immediately.
    PendingPtr Accept(Request& request, CompletionCallback callback, Result& immediate);

    void DispatchLoop();
    void ExecuteRequest(const Request& request);

private:
    MethodTable methods_;
    Config config_;

    RequestQueue queue_;
    PendingRegistry registry_;
    ExecutorPool executor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::thread dispatch_thread_;

    DispatchObserver observer_;
    std::mutex observer_mutex_;

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> dispatched_{0};
    std::atomic<uint64_t> executed_{0};
};

} // namespace dbdriver
