//===----------------------------------------------------------------------===//
//                         DBDriver
//
// executor/executor_pool.cpp
//
// Worker pool implementation
//===----------------------------------------------------------------------===//

#include "executor/executor_pool.hpp"
#include "logging/logger.hpp"
#include <pthread.h>

namespace dbdriver {

namespace {

size_t ResolveThreadCount(size_t requested) {
    if (requested > 0) {
        return requested;
    }
    size_t cores = std::thread::hardware_concurrency();
    return cores > 0 ? cores : 4;
}

} // namespace

ExecutorPool::ExecutorPool(size_t thread_count)
    : thread_count_(ResolveThreadCount(thread_count)) {}

ExecutorPool::~ExecutorPool() {
    Stop();
}

void ExecutorPool::Start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::RUNNING) {
            return;
        }
        state_ = State::RUNNING;
    }

    workers_.reserve(thread_count_);
    for (size_t i = 0; i < thread_count_; ++i) {
        workers_.emplace_back(&ExecutorPool::WorkerLoop, this, i);
    }
    LOG_INFO("executor_pool", "Started " + std::to_string(thread_count_) + " workers");
}

void ExecutorPool::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::STOPPED) {
            return;
        }
        state_ = State::STOPPED;
    }
    task_ready_.notify_all();
    worker_idle_.notify_all();

    for (auto& worker : workers_) {
        worker.join();
    }
    if (!workers_.empty()) {
        LOG_INFO("executor_pool", "Stopped after " + std::to_string(completed_tasks_.load()) +
                 " tasks (" + std::to_string(failed_tasks_.load()) + " failed)");
    }
    workers_.clear();
}

bool ExecutorPool::Submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::STOPPED) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    task_ready_.notify_one();
    return true;
}

bool ExecutorPool::WaitForIdleWorker(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    worker_idle_.wait_for(lock, timeout, [this]() {
        return state_ == State::STOPPED || tasks_.size() + busy_workers_ < thread_count_;
    });
    return state_ != State::STOPPED && tasks_.size() + busy_workers_ < thread_count_;
}

size_t ExecutorPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

ExecutorPool::State ExecutorPool::GetState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void ExecutorPool::WorkerLoop(size_t index) {
    std::string name = "dbdriver-w" + std::to_string(index);
    pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());

    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        task_ready_.wait(lock, [this]() { return state_ == State::STOPPED || !tasks_.empty(); });
        if (tasks_.empty()) {
            return;
        }
        Task task = std::move(tasks_.front());
        tasks_.pop_front();
        busy_workers_++;

        lock.unlock();
        RunTask(task);
        lock.lock();

        busy_workers_--;
        worker_idle_.notify_one();
    }
}

void ExecutorPool::RunTask(Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        failed_tasks_++;
        LOG_ERROR("executor_pool", std::string("Task failed: ") + e.what());
    }
    completed_tasks_++;
}

} // namespace dbdriver
