//===----------------------------------------------------------------------===//
//                         DBDriver
//
// network/io_context_pool.cpp
//
// IO thread pool implementation
//===----------------------------------------------------------------------===//

#include "network/io_context_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <pthread.h>

namespace dbdriver {

IoContextPool::IoContextPool(size_t threads) {
    threads = std::max<size_t>(threads, 1);
    for (size_t i = 0; i < threads; i++) {
        workers_.push_back(std::make_unique<Worker>());
    }
}

IoContextPool::~IoContextPool() {
    Stop();
}

void IoContextPool::Start() {
    if (running_.exchange(true)) {
        return;
    }

    for (size_t i = 0; i < workers_.size(); i++) {
        Worker& worker = *workers_[i];
        worker.context.restart();
        worker.guard.emplace(asio::make_work_guard(worker.context));
        worker.thread = std::thread(&IoContextPool::Run, this, std::ref(worker), i);
    }

    LOG_DEBUG("io_pool", "Started " + std::to_string(workers_.size()) + " IO threads");
}

void IoContextPool::Run(Worker& worker, size_t index) {
    std::string name = "dbdriver-io-" + std::to_string(index);
    pthread_setname_np(pthread_self(), name.c_str());

    // A throwing handler must not take the thread's connections down with it
    while (true) {
        try {
            worker.context.run();
            return;
        } catch (const std::exception& e) {
            handler_failures_++;
            LOG_ERROR("io_pool", name + ": handler failed: " + e.what());
        }
    }
}

void IoContextPool::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    for (auto& worker : workers_) {
        worker->guard.reset();
        worker->context.stop();
    }
    for (auto& worker : workers_) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }

    LOG_DEBUG("io_pool", "IO threads stopped");
}

asio::io_context& IoContextPool::Next() {
    return workers_[next_.fetch_add(1) % workers_.size()]->context;
}

} // namespace dbdriver
