//===----------------------------------------------------------------------===//
//                         DBDriver
//
// network/io_context_pool.hpp
//
// One io_context per IO thread, handed out round-robin to connections
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <asio.hpp>
#include <optional>

namespace dbdriver {

class IoContextPool {
public:
    explicit IoContextPool(size_t threads = DEFAULT_IO_THREADS);
    ~IoContextPool();

    // Non-copyable
    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    // Restartable after Stop
    void Start();
    void Stop();

    // A connection stays on the context it was given for its lifetime
    asio::io_context& Next();

    size_t Size() const { return workers_.size(); }
    bool IsRunning() const { return running_; }

    // Handler exceptions caught by the IO threads
    uint64_t GetHandlerFailures() const { return handler_failures_; }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    struct Worker {
        asio::io_context context{1};
        std::optional<WorkGuard> guard;
        std::thread thread;
    };

    void Run(Worker& worker, size_t index);

    std::vector<std::unique_ptr<Worker>> workers_;
    std::atomic<size_t> next_{0};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> handler_failures_{0};
};

} // namespace dbdriver
