//===----------------------------------------------------------------------===//
//                         DBDriver
//
// engine/transaction_manager.cpp
//
// Transaction lifecycle and idle reaping
//===----------------------------------------------------------------------===//

#include "engine/transaction_manager.hpp"
#include "engine/storage_error.hpp"
#include "logging/logger.hpp"
#include <cstdio>

namespace dbdriver {

const char* TransactionStateToString(TransactionState state) {
    switch (state) {
        case TransactionState::ACTIVE: return "ACTIVE";
        case TransactionState::COMMITTED: return "COMMITTED";
        case TransactionState::ROLLED_BACK: return "ROLLED_BACK";
        default: return "UNKNOWN";
    }
}

//===----------------------------------------------------------------------===//
// Transaction
//===----------------------------------------------------------------------===//

Transaction::Transaction(std::string id, ConnectionLease connection)
    : id_(std::move(id))
    , connection_(std::move(connection))
    , state_(TransactionState::ACTIVE)
    , last_activity_(Clock::now().time_since_epoch().count()) {}

void Transaction::Touch() {
    last_activity_ = Clock::now().time_since_epoch().count();
}

TimePoint Transaction::GetLastActivity() const {
    return TimePoint(Duration(last_activity_.load()));
}

bool Transaction::IsIdle(std::chrono::seconds timeout) const {
    return Clock::now() - GetLastActivity() >= timeout;
}

//===----------------------------------------------------------------------===//
// TransactionManager
//===----------------------------------------------------------------------===//

TransactionManager::TransactionManager(ConnectionPool& pool, const Config& config)
    : pool_(pool)
    , config_(config) {
    // The start epoch keeps ids unique across restarts
    start_epoch_ = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());

    cleanup_thread_ = std::thread(&TransactionManager::CleanupLoop, this);

    LOG_INFO("transactions", "Transaction manager started (idle_timeout=" +
             std::to_string(config_.idle_timeout.count()) + "s)");
}

TransactionManager::~TransactionManager() {
    Shutdown();
}

std::string TransactionManager::NextId() {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "tx-%llx-%llu",
                  static_cast<unsigned long long>(start_epoch_),
                  static_cast<unsigned long long>(++counter_));
    return buf;
}

TransactionPtr TransactionManager::Begin() {
    if (!running_) {
        throw DriverError(ErrorCode::SHUTTING_DOWN, "transaction manager is shutting down");
    }

    ConnectionLease conn = pool_.Acquire();
    if (!conn) {
        throw DriverError(ErrorCode::CONNECTION_UNAVAILABLE,
                          "begin_transaction: no database connection available");
    }

    auto result = conn->Query("BEGIN TRANSACTION");
    if (result->HasError()) {
        conn.Discard();
        throw StorageFailure("begin_transaction", "", result->GetErrorObject());
    }

    std::string id;
    TransactionPtr tx;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        do {
            id = NextId();
        } while (transactions_.count(id) != 0);
        tx = std::make_shared<Transaction>(id, std::move(conn));
        transactions_.emplace(id, tx);
    }
    total_begun_++;

    LOG_DEBUG("transactions", "Began transaction " + id);
    return tx;
}

TransactionPtr TransactionManager::Get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transactions_.find(id);
    if (it == transactions_.end()) {
        throw DriverError(ErrorCode::TRANSACTION_NOT_FOUND, "transaction not found: " + id);
    }
    return it->second;
}

TransactionPtr TransactionManager::Take(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transactions_.find(id);
    if (it == transactions_.end()) {
        throw DriverError(ErrorCode::TRANSACTION_NOT_FOUND, "transaction not found: " + id);
    }
    TransactionPtr tx = std::move(it->second);
    transactions_.erase(it);
    return tx;
}

void TransactionManager::Finish(Transaction& tx, bool commit) {
    duckdb::Connection& conn = tx.GetConnection();
    std::unique_ptr<duckdb::MaterializedQueryResult> failure;

    if (commit) {
        auto result = conn.Query("COMMIT");
        if (!result->HasError()) {
            tx.state_ = TransactionState::COMMITTED;
            total_committed_++;
            tx.connection_.Release();
            return;
        }
        failure = std::move(result);
        // A failed commit leaves the transaction open on some errors
        if (conn.HasActiveTransaction()) {
            auto rollback = conn.Query("ROLLBACK");
            if (rollback->HasError()) {
                LOG_WARN("transactions", "Rollback after failed commit of " + tx.GetId() +
                         " failed: " + rollback->GetError());
            }
        }
    } else {
        auto result = conn.Query("ROLLBACK");
        if (result->HasError()) {
            failure = std::move(result);
        }
    }

    tx.state_ = TransactionState::ROLLED_BACK;
    total_rolled_back_++;

    // Never hand a connection with an open transaction back to the pool
    if (conn.HasActiveTransaction()) {
        tx.connection_.Discard();
    } else {
        tx.connection_.Release();
    }

    if (failure) {
        throw StorageFailure(commit ? "commit_transaction" : "rollback_transaction",
                             tx.GetId(), failure->GetErrorObject());
    }
}

void TransactionManager::Commit(const std::string& id) {
    TransactionPtr tx = Take(id);
    std::lock_guard<std::mutex> lock(tx->GetMutex());
    Finish(*tx, true);
    LOG_DEBUG("transactions", "Committed transaction " + id);
}

void TransactionManager::Rollback(const std::string& id) {
    TransactionPtr tx = Take(id);
    std::lock_guard<std::mutex> lock(tx->GetMutex());
    Finish(*tx, false);
    LOG_DEBUG("transactions", "Rolled back transaction " + id);
}

size_t TransactionManager::ReapIdle() {
    std::vector<std::pair<TransactionPtr, std::unique_lock<std::mutex>>> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = transactions_.begin(); it != transactions_.end();) {
            auto& tx = it->second;
            if (!tx->IsIdle(config_.idle_timeout)) {
                ++it;
                continue;
            }
            // A held mutex means a statement is running, not idle
            std::unique_lock<std::mutex> tx_lock(tx->GetMutex(), std::try_to_lock);
            if (!tx_lock.owns_lock()) {
                ++it;
                continue;
            }
            idle.emplace_back(tx, std::move(tx_lock));
            transactions_.erase(it++);
        }
    }

    for (auto& entry : idle) {
        Transaction& tx = *entry.first;
        LOG_WARN("transactions", "Rolling back idle transaction " + tx.GetId());
        try {
            Finish(tx, false);
        } catch (const DriverError& e) {
            LOG_ERROR("transactions", e.what());
        }
        total_reaped_++;
    }
    return idle.size();
}

void TransactionManager::Shutdown() {
    if (!running_.exchange(false)) {
        return;
    }
    cleanup_cv_.notify_all();
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }

    std::vector<TransactionPtr> open;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : transactions_) {
            open.push_back(entry.second);
        }
        transactions_.clear();
    }
    for (auto& tx : open) {
        std::lock_guard<std::mutex> lock(tx->GetMutex());
        try {
            Finish(*tx, false);
        } catch (const DriverError& e) {
            LOG_ERROR("transactions", e.what());
        }
    }
    if (!open.empty()) {
        LOG_INFO("transactions", "Rolled back " + std::to_string(open.size()) +
                 " open transactions on shutdown");
    }
}

void TransactionManager::CleanupLoop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(cleanup_mutex_);
            cleanup_cv_.wait_for(lock, config_.cleanup_interval,
                                 [this] { return !running_.load(); });
        }
        if (!running_) break;
        ReapIdle();
    }
}

size_t TransactionManager::ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transactions_.size();
}

TransactionManager::Stats TransactionManager::GetStats() const {
    Stats stats;
    stats.active = ActiveCount();
    stats.total_begun = total_begun_.load();
    stats.total_committed = total_committed_.load();
    stats.total_rolled_back = total_rolled_back_.load();
    stats.total_reaped = total_reaped_.load();
    return stats;
}

} // namespace dbdriver
