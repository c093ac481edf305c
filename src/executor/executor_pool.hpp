//===----------------------------------------------------------------------===//
//                         DBDriver
//
// executor/executor_pool.hpp
//
// Fixed-size worker pool that runs dispatched requests
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <deque>

namespace dbdriver {

class ExecutorPool {
public:
    using Task = std::function<void()>;

    enum class State : uint8_t {
        IDLE,       // accepts tasks, nothing runs them yet
        RUNNING,
        STOPPED     // rejects tasks
    };

    explicit ExecutorPool(size_t thread_count = DEFAULT_WORKER_THREADS);
    ~ExecutorPool();

    // Non-copyable
    ExecutorPool(const ExecutorPool&) = delete;
    ExecutorPool& operator=(const ExecutorPool&) = delete;

    void Start();

    // Workers drain the tasks already queued, then exit
    void Stop();

    // False once Stop() has been called
    bool Submit(Task task);

    // Blocks until a submitted task would start at once. False on timeout or
    // once Stop() has been called.
    bool WaitForIdleWorker(std::chrono::milliseconds timeout);

    size_t Size() const { return thread_count_; }
    size_t PendingTasks() const;
    size_t BusyWorkers() const { return busy_workers_; }
    uint64_t CompletedTasks() const { return completed_tasks_; }
    // Tasks that ended in an exception; they also count as completed
    uint64_t FailedTasks() const { return failed_tasks_; }

    State GetState() const;
    bool IsRunning() const { return GetState() == State::RUNNING; }

private:
    void WorkerLoop(size_t index);
    void RunTask(Task& task);

    size_t thread_count_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable task_ready_;
    std::condition_variable worker_idle_;
    std::deque<Task> tasks_;
    State state_ = State::IDLE;

    std::atomic<size_t> busy_workers_{0};  // changed under mutex_
    std::atomic<uint64_t> completed_tasks_{0};
    std::atomic<uint64_t> failed_tasks_{0};
};

} // namespace dbdriver
