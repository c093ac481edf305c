//===----------------------------------------------------------------------===//
//                         DBDriver
//
// engine/connection_pool.cpp
//
// DuckDB connection pool implementation
//===----------------------------------------------------------------------===//

#include "engine/connection_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <utility>

namespace dbdriver {

//===----------------------------------------------------------------------===//
// ConnectionLease
//===----------------------------------------------------------------------===//

ConnectionLease::ConnectionLease(ConnectionLease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr))
    , connection_(std::exchange(other.connection_, nullptr)) {}

ConnectionLease& ConnectionLease::operator=(ConnectionLease&& other) noexcept {
    if (this != &other) {
        Release();
        pool_ = std::exchange(other.pool_, nullptr);
        connection_ = std::exchange(other.connection_, nullptr);
    }
    return *this;
}

void ConnectionLease::Return(bool discard) {
    if (pool_ && connection_) {
        pool_->Return(connection_, discard);
    }
    pool_ = nullptr;
    connection_ = nullptr;
}

//===----------------------------------------------------------------------===//
// ConnectionPool
//===----------------------------------------------------------------------===//

ConnectionPool::ConnectionPool(duckdb::DuckDB& database, const Config& config)
    : database_(database)
    , config_(config) {
    config_.max_connections = std::max<size_t>(config_.max_connections, 1);
    config_.min_connections = std::min(config_.min_connections, config_.max_connections);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (slots_.size() < config_.min_connections) {
            auto* conn = OpenLocked();
            if (!conn) {
                break;
            }
            idle_.push_back(conn);
        }
    }

    LOG_INFO("conn_pool", "Opened " + std::to_string(idle_.size()) + " connections (min=" +
             std::to_string(config_.min_connections) + ", max=" +
             std::to_string(config_.max_connections) + ")");

    maintenance_thread_ = std::thread(&ConnectionPool::MaintenanceLoop, this);
}

ConnectionPool::~ConnectionPool() {
    Shutdown();
}

void ConnectionPool::Shutdown() {
    std::vector<std::unique_ptr<duckdb::Connection>> closing;
    size_t leased = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;

        for (auto* conn : idle_) {
            auto it = slots_.find(conn);
            closing.push_back(std::move(it->second.connection));
            slots_.erase(it);
        }
        idle_.clear();
        leased = slots_.size();
        total_destroyed_ += closing.size();
    }
    returned_.notify_all();
    maintenance_wakeup_.notify_all();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }

    closing.clear();
    LOG_INFO("conn_pool", "Pool shut down, " + std::to_string(leased) + " still leased");
}

ConnectionLease ConnectionPool::Acquire(std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    acquire_count_++;

    for (;;) {
        if (shut_down_) {
            return ConnectionLease();
        }

        duckdb::Connection* conn = nullptr;
        if (!idle_.empty()) {
            conn = idle_.back();
            idle_.pop_back();
        } else if (slots_.size() < config_.max_connections) {
            conn = OpenLocked();
        }
        if (conn) {
            slots_[conn].leased = true;
            return ConnectionLease(this, conn);
        }

        if (!returned_.wait_until(lock, deadline, [this]() {
                return shut_down_ || !idle_.empty() || slots_.size() < config_.max_connections;
            })) {
            acquire_timeout_count_++;
            LOG_WARN("conn_pool", "No connection free after " + std::to_string(timeout.count()) + "ms");
            return ConnectionLease();
        }
    }
}

void ConnectionPool::Return(duckdb::Connection* conn, bool discard) {
    std::unique_ptr<duckdb::Connection> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(conn);
        if (it == slots_.end() || !it->second.leased) {
            LOG_WARN("conn_pool", "Returned connection does not belong to this pool");
            return;
        }

        if (discard || shut_down_) {
            closing = std::move(it->second.connection);
            slots_.erase(it);
            total_destroyed_++;
        } else {
            it->second.leased = false;
            it->second.idle_since = Clock::now();
            idle_.push_back(conn);
        }
    }
    returned_.notify_one();
}

duckdb::Connection* ConnectionPool::OpenLocked() {
    std::unique_ptr<duckdb::Connection> conn;
    try {
        conn = std::make_unique<duckdb::Connection>(database_);
    } catch (const std::exception& e) {
        LOG_ERROR("conn_pool", std::string("Cannot open connection: ") + e.what());
        return nullptr;
    }

    auto* raw = conn.get();
    Slot& slot = slots_[raw];
    slot.connection = std::move(conn);
    slot.idle_since = Clock::now();
    total_created_++;
    LOG_DEBUG("conn_pool", "Opened connection " + std::to_string(slots_.size()) + "/" +
              std::to_string(config_.max_connections));
    return raw;
}

std::vector<std::unique_ptr<duckdb::Connection>> ConnectionPool::TakeExpiredIdle() {
    std::vector<std::unique_ptr<duckdb::Connection>> expired;
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    while (!idle_.empty() && slots_.size() > config_.min_connections) {
        auto it = slots_.find(idle_.front());
        if (now - it->second.idle_since < config_.idle_timeout) {
            break;
        }
        expired.push_back(std::move(it->second.connection));
        slots_.erase(it);
        idle_.pop_front();
    }
    total_destroyed_ += expired.size();
    return expired;
}

void ConnectionPool::MaintenanceLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!maintenance_wakeup_.wait_for(lock, config_.maintenance_interval,
                                         [this]() { return shut_down_; })) {
        lock.unlock();
        // Closing a connection can be slow; do it outside the pool lock
        auto expired = TakeExpiredIdle();
        if (!expired.empty()) {
            LOG_DEBUG("conn_pool", "Closed " + std::to_string(expired.size()) + " idle connections");
        }
        expired.clear();
        lock.lock();
    }
}

ConnectionPool::Stats ConnectionPool::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    stats.total_created = total_created_;
    stats.total_destroyed = total_destroyed_;
    stats.current_size = slots_.size();
    stats.available = idle_.size();
    stats.in_use = slots_.size() - idle_.size();
    stats.acquire_count = acquire_count_;
    stats.acquire_timeout_count = acquire_timeout_count_;
    return stats;
}

} // namespace dbdriver
