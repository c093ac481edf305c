//===----------------------------------------------------------------------===//
//                         DBDriver
//
// engine/connection_pool.hpp
//
// Pool of DuckDB connections for reads and transactions
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "duckdb.hpp"
#include <deque>
#include <parallel_hashmap/phmap.h>

namespace dbdriver {

class ConnectionPool;

// Exclusive use of one pooled connection; hands it back on destruction
class ConnectionLease {
public:
    ConnectionLease() = default;
    ConnectionLease(ConnectionPool* pool, duckdb::Connection* conn) : pool_(pool), connection_(conn) {}
    ~ConnectionLease() { Release(); }

    ConnectionLease(ConnectionLease&& other) noexcept;
    ConnectionLease& operator=(ConnectionLease&& other) noexcept;
    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;

    duckdb::Connection* Get() const { return connection_; }
    duckdb::Connection* operator->() const { return connection_; }
    duckdb::Connection& operator*() const { return *connection_; }
    explicit operator bool() const { return connection_ != nullptr; }

    void Release() { Return(false); }

    // Close the connection instead of reusing it
    void Discard() { Return(true); }

private:
    void Return(bool discard);

    ConnectionPool* pool_ = nullptr;
    duckdb::Connection* connection_ = nullptr;
};

class ConnectionPool {
public:
    struct Config {
        size_t min_connections = 2;
        size_t max_connections = 16;
        std::chrono::seconds idle_timeout{300};
        std::chrono::milliseconds acquire_timeout{5000};
        std::chrono::seconds maintenance_interval{30};
    };

    struct Stats {
        size_t total_created = 0;
        size_t total_destroyed = 0;
        size_t current_size = 0;
        size_t available = 0;
        size_t in_use = 0;
        size_t acquire_count = 0;
        size_t acquire_timeout_count = 0;
    };

    explicit ConnectionPool(duckdb::DuckDB& database, const Config& config = Config{});
    ~ConnectionPool();

    // Non-copyable
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Empty lease on timeout or after Shutdown
    ConnectionLease Acquire() { return Acquire(config_.acquire_timeout); }
    ConnectionLease Acquire(std::chrono::milliseconds timeout);

    Stats GetStats() const;
    const Config& GetConfig() const { return config_; }

    // Idle connections close now, leased ones when their lease ends
    void Shutdown();

private:
    friend class ConnectionLease;

    struct Slot {
        std::unique_ptr<duckdb::Connection> connection;
        bool leased = false;
        TimePoint idle_since;
    };

    using SlotMap = phmap::flat_hash_map<duckdb::Connection*, Slot>;

    void Return(duckdb::Connection* conn, bool discard);
    // Caller holds mutex_
    duckdb::Connection* OpenLocked();
    std::vector<std::unique_ptr<duckdb::Connection>> TakeExpiredIdle();
    void MaintenanceLoop();

    duckdb::DuckDB& database_;
    Config config_;

    mutable std::mutex mutex_;
    std::condition_variable returned_;
    SlotMap slots_;
    // Front is the longest idle; Acquire takes from the back
    std::deque<duckdb::Connection*> idle_;
    bool shut_down_ = false;

    size_t total_created_ = 0;
    size_t total_destroyed_ = 0;
    size_t acquire_count_ = 0;
    size_t acquire_timeout_count_ = 0;

    std::thread maintenance_thread_;
    std::condition_variable maintenance_wakeup_;
};

} // namespace dbdriver
