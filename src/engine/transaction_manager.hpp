//===----------------------------------------------------------------------===//
//                         DBDriver
//
// engine/transaction_manager.hpp
//
// Explicit transactions, each on a dedicated pooled connection
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "engine/connection_pool.hpp"
#include <parallel_hashmap/phmap.h>

namespace dbdriver {

enum class TransactionState : uint8_t {
    ACTIVE = 0,
    COMMITTED = 1,
    ROLLED_BACK = 2
};

const char* TransactionStateToString(TransactionState state);

class Transaction {
public:
    Transaction(std::string id, ConnectionLease connection);

    // Non-copyable
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    const std::string& GetId() const { return id_; }
    TransactionState GetState() const { return state_.load(); }
    bool IsActive() const { return GetState() == TransactionState::ACTIVE; }

    // Statements of one transaction run one at a time under this mutex
    std::mutex& GetMutex() { return mutex_; }
    duckdb::Connection& GetConnection() { return *connection_; }

    void Touch();
    TimePoint GetLastActivity() const;
    bool IsIdle(std::chrono::seconds timeout) const;

private:
    friend class TransactionManager;

    std::string id_;
    ConnectionLease connection_;
    std::atomic<TransactionState> state_;
    std::mutex mutex_;
    std::atomic<TimePoint::rep> last_activity_;
};

using TransactionPtr = std::shared_ptr<Transaction>;

class TransactionManager {
public:
    struct Config {
        std::chrono::seconds idle_timeout;
        std::chrono::milliseconds cleanup_interval;

        Config()
            : idle_timeout(DEFAULT_TRANSACTION_IDLE_SECONDS)
            , cleanup_interval(5000) {}
    };

    struct Stats {
        size_t active = 0;
        uint64_t total_begun = 0;
        uint64_t total_committed = 0;
        uint64_t total_rolled_back = 0;
        uint64_t total_reaped = 0;
    };

    TransactionManager(ConnectionPool& pool, const Config& config = Config{});
    ~TransactionManager();

    // Non-copyable
    TransactionManager(const TransactionManager&) = delete;
    TransactionManager& operator=(const TransactionManager&) = delete;

    // Throws DriverError (CONNECTION_UNAVAILABLE, STORAGE_ERROR, SHUTTING_DOWN)
    TransactionPtr Begin();

    // Throws DriverError(TRANSACTION_NOT_FOUND)
    TransactionPtr Get(const std::string& id);

    // The id is retired before the statement runs, whatever its outcome
    void Commit(const std::string& id);
    void Rollback(const std::string& id);

    // Roll back transactions idle past the timeout. Busy ones are skipped.
    size_t ReapIdle();

    // Roll back everything still open
    void Shutdown();

    size_t ActiveCount() const;
    Stats GetStats() const;

private:
    std::string NextId();
    TransactionPtr Take(const std::string& id);
    void Finish(Transaction& tx, bool commit);
    void CleanupLoop();

    ConnectionPool& pool_;
    Config config_;

    phmap::flat_hash_map<std::string, TransactionPtr> transactions_;
    mutable std::mutex mutex_;

    uint64_t start_epoch_ = 0;
    std::atomic<uint64_t> counter_{0};
    std::atomic<uint64_t> total_begun_{0};
    std::atomic<uint64_t> total_committed_{0};
    std::atomic<uint64_t> total_rolled_back_{0};
    std::atomic<uint64_t> total_reaped_{0};

    std::atomic<bool> running_{true};
    std::thread cleanup_thread_;
    std::mutex cleanup_mutex_;
    std::condition_variable cleanup_cv_;
};

} // namespace dbdriver
