//===----------------------------------------------------------------------===//
//                         DBDriver
//
// engine/driver_engine.hpp
//
// Table-level database operations over one DuckDB instance
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "engine/connection_pool.hpp"
#include "engine/transaction_manager.hpp"
#include "engine/tree_provider.hpp"
#include "protocol/rpc_types.hpp"
#include "duckdb.hpp"
#include <set>

namespace dbdriver {

//===----------------------------------------------------------------------===//
// DriverEngine
//
// Auto-commit writes and DDL share the primary connection behind the write
// lane. Reads outside a transaction lease pool connections and run in
// parallel. A transaction owns one pooled connection for its lifetime.
//
// Operations take the request params map and throw DriverError (or
// std::invalid_argument for malformed params).
//===----------------------------------------------------------------------===//
class DriverEngine {
public:
    struct Config {
        std::string database_path;        // empty or ":memory:" = in-memory
        std::string backup_dir;           // sync_schema default snapshot directory
        ConnectionPool::Config pool;
        TransactionManager::Config transactions;
    };

    struct Stats {
        uint64_t reads = 0;
        uint64_t writes = 0;
        uint64_t transactional = 0;
        ConnectionPool::Stats pool;
        TransactionManager::Stats transactions;
    };

    explicit DriverEngine(const Config& config = Config{});
    ~DriverEngine();

    // Non-copyable
    DriverEngine(const DriverEngine&) = delete;
    DriverEngine& operator=(const DriverEngine&) = delete;

    // Schema
    Value CreateTable(const Value& params);
    Value DropTable(const Value& params);
    Value AlterTable(const Value& params);
    ValueList GetTableInfo(const Value& params);
    Value GetSchemaVersion(const Value& params);
    Value SyncSchema(const Value& params);

    // Rows
    Value Insert(const Value& params);
    Value Update(const Value& params);
    Value Delete(const Value& params);
    ValueList Select(const Value& params);
    Result Execute(const Value& params);

    // Transactions
    Value BeginTransaction(const Value& params);
    Value CommitTransaction(const Value& params);
    Value RollbackTransaction(const Value& params);

    // Syntax tree methods, UNSUPPORTED without a provider
    Result QueryTree(TreeKind kind, const Value& params);
    Result ModifyTree(TreeKind kind, const Value& params);
    void SetTreeProvider(std::shared_ptr<TreeProvider> provider);

    Stats GetStats() const;

    // Rolls back open transactions and closes the pool
    void Shutdown();

private:
    enum class AccessMode { READ, WRITE };

    template <typename Fn>
    decltype(auto) WithConnection(const Value& params, AccessMode mode,
                                  const std::string& operation, Fn&& fn);

    std::set<std::string> TableColumns(duckdb::Connection& conn, const std::string& table);
    std::set<std::string> RequireTable(duckdb::Connection& conn, const std::string& table,
                                       const std::string& operation);
    void RequireColumns(const std::set<std::string>& columns,
                        const std::vector<std::string>& names, const std::string& table);

    std::unique_ptr<duckdb::QueryResult> Run(duckdb::Connection& conn, const std::string& sql,
                                             const ValueList& params,
                                             const std::string& operation,
                                             const std::string& target);
    int64_t RunCount(duckdb::Connection& conn, const std::string& sql, const ValueList& params,
                     const std::string& operation, const std::string& target);

    // BEGIN/COMMIT around fn unless the connection is already in a transaction
    void RunAtomically(duckdb::Connection& conn, bool in_transaction,
                       const std::string& operation, const std::function<void()>& fn);

    std::shared_ptr<TreeProvider> GetTreeProvider();

private:
    Config config_;

    std::unique_ptr<duckdb::DuckDB> database_;

    // Write lane
    std::unique_ptr<duckdb::Connection> primary_;
    std::mutex write_mutex_;

    std::unique_ptr<ConnectionPool> read_pool_;
    std::unique_ptr<TransactionManager> transactions_;

    std::shared_ptr<TreeProvider> tree_provider_;
    std::mutex provider_mutex_;

    std::atomic<uint64_t> reads_{0};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> transactional_{0};
};

} // namespace dbdriver
