//===----------------------------------------------------------------------===//
//                         DBDriver
//
// engine/driver_engine.cpp
//
// Table-level database operations
//===----------------------------------------------------------------------===//

#include "engine/driver_engine.hpp"
#include "engine/schema_sync.hpp"
#include "engine/sql_builder.hpp"
#include "engine/storage_error.hpp"
#include "engine/value_convert.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>

namespace dbdriver {

namespace {

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

//===----------------------------------------------------------------------===//
// Param extraction
//===----------------------------------------------------------------------===//
std::string RequireTableName(const Value& params, const char* key = "table_name") {
    const Value& name = params[key];
    if (!name.IsString() || !sql::IsValidIdentifier(name.GetString())) {
        throw std::invalid_argument(std::string(key) + " must be a non-empty string");
    }
    return name.GetString();
}

const ValueMap& RequireData(const Value& params) {
    const Value& data = params["data"];
    if (!data.IsMap()) {
        throw std::invalid_argument("data must be a dictionary");
    }
    if (data.GetMap().empty()) {
        throw std::invalid_argument("data cannot be empty");
    }
    return data.GetMap();
}

ValueMap OptionalWhere(const Value& params) {
    const Value& where = params["where"];
    if (where.IsNull()) {
        return ValueMap();
    }
    if (!where.IsMap()) {
        throw std::invalid_argument("where must be a dictionary or None");
    }
    return where.GetMap();
}

ValueMap RequireWhere(const Value& params) {
    ValueMap where = OptionalWhere(params);
    if (where.empty()) {
        throw std::invalid_argument("where cannot be empty");
    }
    return where;
}

std::vector<std::string> OptionalNames(const Value& params, const char* key) {
    const Value& list = params[key];
    if (list.IsNull()) {
        return {};
    }
    std::string message = std::string(key) + " must be a list or None";
    if (!list.IsList()) {
        throw std::invalid_argument(message);
    }
    std::vector<std::string> names;
    for (const auto& item : list.GetList()) {
        if (!item.IsString() || item.GetString().empty()) {
            throw std::invalid_argument(message);
        }
        names.push_back(item.GetString());
    }
    return names;
}

int64_t OptionalNonNegative(const Value& params, const char* key, int64_t fallback) {
    const Value& value = params[key];
    if (value.IsNull()) {
        return fallback;
    }
    if (!value.IsInt() || value.GetInt() < 0) {
        throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
    }
    return value.GetInt();
}

std::string RequireTransactionId(const Value& params) {
    const Value& id = params["transaction_id"];
    if (!id.IsString() || id.GetString().empty()) {
        throw std::invalid_argument("transaction_id must be a non-empty string");
    }
    return id.GetString();
}

std::vector<std::string> Keys(const ValueMap& map) {
    std::vector<std::string> keys;
    for (const auto& entry : map) {
        keys.push_back(entry.first);
    }
    return keys;
}

Value AffectedRows(int64_t count) {
    ValueMap data;
    data["affected_rows"] = Value(count);
    return Value(std::move(data));
}

Value SuccessFlag() {
    ValueMap data;
    data["success"] = Value(true);
    return Value(std::move(data));
}

// DuckDB reports most failures in results, but some paths throw
template <typename Fn>
decltype(auto) Guarded(const std::string& operation, Fn&& fn) {
    try {
        return fn();
    } catch (const DriverError&) {
        throw;
    } catch (const std::invalid_argument&) {
        throw;
    } catch (const std::exception& ex) {
        duckdb::ErrorData error(ex);
        throw StorageFailure(operation, "", error);
    }
}

} // anonymous namespace

//===----------------------------------------------------------------------===//
// Lifecycle
//===----------------------------------------------------------------------===//

DriverEngine::DriverEngine(const Config& config)
    : config_(config) {
    const std::string& path = config_.database_path;
    bool in_memory = path.empty() || path == ":memory:";

    try {
        database_ = std::make_unique<duckdb::DuckDB>(in_memory ? nullptr : path.c_str());
        primary_ = std::make_unique<duckdb::Connection>(*database_);
    } catch (const std::exception& ex) {
        duckdb::ErrorData error(ex);
        throw DriverError(ErrorCode::STORAGE_ERROR,
                          "open database " + (in_memory ? std::string(":memory:") : path) +
                          ": " + error.Message());
    }

    read_pool_ = std::make_unique<ConnectionPool>(*database_, config_.pool);
    transactions_ = std::make_unique<TransactionManager>(*read_pool_, config_.transactions);

    LOG_INFO("engine", "Database opened: " + (in_memory ? std::string(":memory:") : path) +
             " (DuckDB " + std::string(duckdb::DuckDB::LibraryVersion()) + ")");
}

DriverEngine::~DriverEngine() {
    Shutdown();
}

void DriverEngine::Shutdown() {
    if (transactions_) {
        transactions_->Shutdown();
    }
    if (read_pool_) {
        read_pool_->Shutdown();
    }
}

void DriverEngine::SetTreeProvider(std::shared_ptr<TreeProvider> provider) {
    std::lock_guard<std::mutex> lock(provider_mutex_);
    tree_provider_ = std::move(provider);
}

std::shared_ptr<TreeProvider> DriverEngine::GetTreeProvider() {
    std::lock_guard<std::mutex> lock(provider_mutex_);
    return tree_provider_;
}

DriverEngine::Stats DriverEngine::GetStats() const {
    Stats stats;
    stats.reads = reads_.load();
    stats.writes = writes_.load();
    stats.transactional = transactional_.load();
    stats.pool = read_pool_->GetStats();
    stats.transactions = transactions_->GetStats();
    return stats;
}

//===----------------------------------------------------------------------===//
// Connection routing
//===----------------------------------------------------------------------===//

template <typename Fn>
decltype(auto) DriverEngine::WithConnection(const Value& params, AccessMode mode,
                                            const std::string& operation, Fn&& fn) {
    const Value& tx_id = params["transaction_id"];
    if (!tx_id.IsNull()) {
        std::string id = RequireTransactionId(params);
        TransactionPtr tx = transactions_->Get(id);
        std::lock_guard<std::mutex> lock(tx->GetMutex());
        if (!tx->IsActive()) {
            throw DriverError(ErrorCode::TRANSACTION_NOT_FOUND,
                              operation + ": transaction is no longer active: " + id);
        }
        tx->Touch();
        transactional_++;
        auto result = Guarded(operation, [&] { return fn(tx->GetConnection(), true); });
        tx->Touch();
        return result;
    }

    if (mode == AccessMode::WRITE) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        writes_++;
        return Guarded(operation, [&] { return fn(*primary_, false); });
    }

    ConnectionLease conn = read_pool_->Acquire();
    if (!conn) {
        throw DriverError(ErrorCode::CONNECTION_UNAVAILABLE,
                          operation + ": no database connection available");
    }
    reads_++;
    return Guarded(operation, [&] { return fn(*conn, false); });
}

std::set<std::string> DriverEngine::TableColumns(duckdb::Connection& conn,
                                                 const std::string& table) {
    auto result = Run(conn,
                      "SELECT column_name FROM duckdb_columns() "
                      "WHERE database_name = current_database() "
                      "AND schema_name = current_schema() AND lower(table_name) = lower(?)",
                      ValueList{Value(table)}, "inspect", table);
    auto& rows = result->Cast<duckdb::MaterializedQueryResult>();

    std::set<std::string> columns;
    for (duckdb::idx_t row = 0; row < rows.RowCount(); row++) {
        columns.insert(Lower(rows.GetValue(0, row).ToString()));
    }
    return columns;
}

std::set<std::string> DriverEngine::RequireTable(duckdb::Connection& conn,
                                                 const std::string& table,
                                                 const std::string& operation) {
    auto columns = TableColumns(conn, table);
    if (columns.empty()) {
        throw DriverError(ErrorCode::TABLE_NOT_FOUND,
                          operation + " on " + table + ": table does not exist");
    }
    return columns;
}

void DriverEngine::RequireColumns(const std::set<std::string>& columns,
                                  const std::vector<std::string>& names,
                                  const std::string& table) {
    for (const auto& name : names) {
        if (columns.count(Lower(name)) == 0) {
            throw DriverError(ErrorCode::COLUMN_NOT_FOUND,
                              "Column '" + name + "' not found in table '" + table + "'");
        }
    }
}

std::unique_ptr<duckdb::QueryResult> DriverEngine::Run(duckdb::Connection& conn,
                                                       const std::string& sql_text,
                                                       const ValueList& params,
                                                       const std::string& operation,
                                                       const std::string& target) {
    LOG_TRACE("engine", sql_text);
    auto stmt = conn.Prepare(sql_text);
    if (stmt->HasError()) {
        throw StorageFailure(operation, target, stmt->error);
    }
    auto values = ToDuckValues(params);
    auto result = stmt->Execute(values, false);
    CheckResult(*result, operation, target);
    return result;
}

int64_t DriverEngine::RunCount(duckdb::Connection& conn, const std::string& sql_text,
                               const ValueList& params, const std::string& operation,
                               const std::string& target) {
    auto result = Run(conn, sql_text, params, operation, target);
    auto& rows = result->Cast<duckdb::MaterializedQueryResult>();
    if (rows.RowCount() == 0 || rows.ColumnCount() == 0) {
        return 0;
    }
    auto count = rows.GetValue(0, 0);
    return count.IsNull() ? 0 : count.GetValue<int64_t>();
}

void DriverEngine::RunAtomically(duckdb::Connection& conn, bool in_transaction,
                                 const std::string& operation,
                                 const std::function<void()>& fn) {
    if (in_transaction) {
        fn();
        return;
    }

    auto begin = conn.Query("BEGIN TRANSACTION");
    CheckResult(*begin, operation, "transaction");
    try {
        fn();
    } catch (...) {
        if (conn.HasActiveTransaction()) {
            auto rollback = conn.Query("ROLLBACK");
            if (rollback->HasError()) {
                LOG_WARN("engine", operation + ": rollback failed: " + rollback->GetError());
            }
        }
        throw;
    }

    auto commit = conn.Query("COMMIT");
    if (commit->HasError()) {
        if (conn.HasActiveTransaction()) {
            auto rollback = conn.Query("ROLLBACK");
            if (rollback->HasError()) {
                LOG_WARN("engine", operation + ": rollback failed: " + rollback->GetError());
            }
        }
        throw StorageFailure(operation, "commit", commit->GetErrorObject());
    }
}

//===----------------------------------------------------------------------===//
// Schema
//===----------------------------------------------------------------------===//

Value DriverEngine::CreateTable(const Value& params) {
    const Value& schema = params["schema"];
    if (!schema.IsMap()) {
        throw std::invalid_argument("schema must be a dictionary");
    }

    TableSpec table;
    try {
        table = ParseTableSpec(schema);
    } catch (const std::invalid_argument& e) {
        throw DriverError(ErrorCode::INVALID_SCHEMA, std::string("create_table: ") + e.what());
    }

    return WithConnection(params, AccessMode::WRITE, "create_table",
                          [&](duckdb::Connection& conn, bool) {
        Run(conn, sql::CreateTable(table), ValueList(), "create_table", table.name);
        LOG_DEBUG("engine", "Created table " + table.name);
        return SuccessFlag();
    });
}

Value DriverEngine::DropTable(const Value& params) {
    std::string table = RequireTableName(params);
    bool if_exists = params.GetBoolOr("if_exists", true);

    return WithConnection(params, AccessMode::WRITE, "drop_table",
                          [&](duckdb::Connection& conn, bool) {
        if (!if_exists) {
            RequireTable(conn, table, "drop_table");
        }
        Run(conn, std::string("DROP TABLE ") + (if_exists ? "IF EXISTS " : "") +
            sql::QuoteIdentifier(table), ValueList(), "drop_table", table);
        return SuccessFlag();
    });
}

Value DriverEngine::AlterTable(const Value& params) {
    std::string table = RequireTableName(params);

    std::vector<ColumnSpec> add_columns;
    const Value& add = params["add_columns"];
    if (add.IsList()) {
        try {
            for (const auto& column : add.GetList()) {
                ColumnSpec spec = ParseColumnSpec(column);
                // Constraints cannot be added to existing tables
                spec.nullable = true;
                spec.primary_key = false;
                spec.unique = false;
                add_columns.push_back(std::move(spec));
            }
        } catch (const std::invalid_argument& e) {
            throw DriverError(ErrorCode::INVALID_SCHEMA, std::string("alter_table: ") + e.what());
        }
    } else if (!add.IsNull()) {
        throw std::invalid_argument("add_columns must be a list or None");
    }

    std::vector<std::string> drop_columns = OptionalNames(params, "drop_columns");

    std::string rename_to;
    if (!params["rename_to"].IsNull()) {
        rename_to = RequireTableName(params, "rename_to");
    }

    if (add_columns.empty() && drop_columns.empty() && rename_to.empty()) {
        throw std::invalid_argument("alter_table requires add_columns, drop_columns or rename_to");
    }

    return WithConnection(params, AccessMode::WRITE, "alter_table",
                          [&](duckdb::Connection& conn, bool in_transaction) {
        auto columns = RequireTable(conn, table, "alter_table");
        for (const auto& column : add_columns) {
            if (columns.count(Lower(column.name)) != 0) {
                throw DriverError(ErrorCode::INVALID_SCHEMA, "alter_table on " + table +
                                  ": column already exists: " + column.name);
            }
        }
        RequireColumns(columns, drop_columns, table);

        std::string quoted = sql::QuoteIdentifier(table);
        RunAtomically(conn, in_transaction, "alter_table", [&] {
            for (const auto& column : add_columns) {
                Run(conn, "ALTER TABLE " + quoted + " ADD COLUMN " + sql::ColumnDefinition(column),
                    ValueList(), "alter_table", table);
            }
            for (const auto& column : drop_columns) {
                Run(conn, "ALTER TABLE " + quoted + " DROP COLUMN " + sql::QuoteIdentifier(column),
                    ValueList(), "alter_table", table);
            }
            if (!rename_to.empty()) {
                Run(conn, "ALTER TABLE " + quoted + " RENAME TO " + sql::QuoteIdentifier(rename_to),
                    ValueList(), "alter_table", table);
            }
        });

        ValueMap data;
        data["success"] = Value(true);
        data["table_name"] = Value(rename_to.empty() ? table : rename_to);
        return Value(std::move(data));
    });
}

ValueList DriverEngine::GetTableInfo(const Value& params) {
    std::string table = RequireTableName(params);

    return WithConnection(params, AccessMode::READ, "get_table_info",
                          [&](duckdb::Connection& conn, bool) {
        RequireTable(conn, table, "get_table_info");
        auto result = Run(conn,
                          "SELECT name, type, \"notnull\", dflt_value AS \"default\", pk "
                          "FROM pragma_table_info(" + sql::QuoteLiteral(table) + ") ORDER BY cid",
                          ValueList(), "get_table_info", table);
        return ResultToRecords(result->Cast<duckdb::MaterializedQueryResult>());
    });
}

Value DriverEngine::GetSchemaVersion(const Value& params) {
    return WithConnection(params, AccessMode::READ, "get_schema_version",
                          [&](duckdb::Connection& conn, bool) {
        SchemaSynchronizer sync(conn);
        ValueMap data;
        data["version"] = sync.GetVersion();
        return Value(std::move(data));
    });
}

Value DriverEngine::SyncSchema(const Value& params) {
    SchemaDefinition definition = ParseSchemaDefinition(params["schema_definition"]);

    std::string backup_dir = config_.backup_dir;
    const Value& dir = params["backup_dir"];
    if (dir.IsString()) {
        backup_dir = dir.GetString();
    } else if (!dir.IsNull()) {
        throw std::invalid_argument("backup_dir must be a string or None");
    }

    // Runs its own transaction, so always on the write lane
    std::lock_guard<std::mutex> lock(write_mutex_);
    writes_++;
    return Guarded("sync_schema", [&] {
        SchemaSynchronizer sync(*primary_);
        return sync.Sync(definition, backup_dir);
    });
}

//===----------------------------------------------------------------------===//
// Rows
//===----------------------------------------------------------------------===//

Value DriverEngine::Insert(const Value& params) {
    std::string table = RequireTableName(params);
    const ValueMap& data = RequireData(params);

    return WithConnection(params, AccessMode::WRITE, "insert",
                          [&](duckdb::Connection& conn, bool) {
        RequireColumns(RequireTable(conn, table, "insert"), Keys(data), table);
        SqlStatement stmt = sql::Insert(table, data);
        return AffectedRows(RunCount(conn, stmt.sql, stmt.params, "insert", table));
    });
}

Value DriverEngine::Update(const Value& params) {
    std::string table = RequireTableName(params);
    const ValueMap& data = RequireData(params);
    ValueMap where = RequireWhere(params);

    return WithConnection(params, AccessMode::WRITE, "update",
                          [&](duckdb::Connection& conn, bool) {
        auto columns = RequireTable(conn, table, "update");
        RequireColumns(columns, Keys(data), table);
        RequireColumns(columns, Keys(where), table);
        SqlStatement stmt = sql::Update(table, data, where);
        return AffectedRows(RunCount(conn, stmt.sql, stmt.params, "update", table));
    });
}

Value DriverEngine::Delete(const Value& params) {
    std::string table = RequireTableName(params);
    ValueMap where = RequireWhere(params);

    return WithConnection(params, AccessMode::WRITE, "delete",
                          [&](duckdb::Connection& conn, bool) {
        RequireColumns(RequireTable(conn, table, "delete"), Keys(where), table);
        SqlStatement stmt = sql::Delete(table, where);
        return AffectedRows(RunCount(conn, stmt.sql, stmt.params, "delete", table));
    });
}

ValueList DriverEngine::Select(const Value& params) {
    std::string table = RequireTableName(params);

    sql::SelectOptions options;
    options.where = OptionalWhere(params);
    options.columns = OptionalNames(params, "columns");
    options.order_by = OptionalNames(params, "order_by");
    options.limit = OptionalNonNegative(params, "limit", -1);
    options.offset = OptionalNonNegative(params, "offset", 0);

    std::vector<std::string> referenced = options.columns;
    for (const auto& key : options.order_by) {
        referenced.push_back(key.size() > 1 && key[0] == '-' ? key.substr(1) : key);
    }
    for (const auto& entry : options.where) {
        referenced.push_back(entry.first);
    }

    return WithConnection(params, AccessMode::READ, "select",
                          [&](duckdb::Connection& conn, bool) {
        RequireColumns(RequireTable(conn, table, "select"), referenced, table);
        SqlStatement stmt = sql::Select(table, options);
        auto result = Run(conn, stmt.sql, stmt.params, "select", table);
        return ResultToRecords(result->Cast<duckdb::MaterializedQueryResult>());
    });
}

Result DriverEngine::Execute(const Value& params) {
    const Value& text = params["sql"];
    if (!text.IsString() || text.GetString().find_first_not_of(" \t\r\n") == std::string::npos) {
        throw std::invalid_argument("sql must be a non-empty string");
    }
    const std::string& sql_text = text.GetString();

    ValueList bound;
    const Value& args = params["params"];
    if (args.IsList()) {
        bound = args.GetList();
    } else if (!args.IsNull()) {
        throw std::invalid_argument("params must be a list or None");
    }

    AccessMode mode = sql::IsReadOnlyStatement(sql_text) ? AccessMode::READ : AccessMode::WRITE;

    return WithConnection(params, mode, "execute", [&](duckdb::Connection& conn, bool) {
        auto stmt = conn.Prepare(sql_text);
        if (stmt->HasError()) {
            throw StorageFailure("execute", "", stmt->error);
        }
        if (stmt->GetStatementType() == duckdb::StatementType::TRANSACTION_STATEMENT) {
            throw DriverError(ErrorCode::INVALID_PARAMETER,
                              "execute: transaction statements are not allowed, use "
                              "begin_transaction, commit_transaction or rollback_transaction");
        }

        auto values = ToDuckValues(bound);
        auto result = stmt->Execute(values, false);
        CheckResult(*result, "execute", "");
        auto& rows = result->Cast<duckdb::MaterializedQueryResult>();

        auto return_type = stmt->GetStatementProperties().return_type;
        if (return_type == duckdb::StatementReturnType::QUERY_RESULT) {
            return Result::Rows(ResultToRecords(rows));
        }
        int64_t affected = 0;
        if (return_type == duckdb::StatementReturnType::CHANGED_ROWS && rows.RowCount() > 0) {
            auto count = rows.GetValue(0, 0);
            affected = count.IsNull() ? 0 : count.GetValue<int64_t>();
        }
        return Result::Success(AffectedRows(affected));
    });
}

//===----------------------------------------------------------------------===//
// Transactions
//===----------------------------------------------------------------------===//

Value DriverEngine::BeginTransaction(const Value&) {
    TransactionPtr tx = Guarded("begin_transaction", [&] { return transactions_->Begin(); });
    ValueMap data;
    data["transaction_id"] = Value(tx->GetId());
    return Value(std::move(data));
}

Value DriverEngine::CommitTransaction(const Value& params) {
    std::string id = RequireTransactionId(params);
    Guarded("commit_transaction", [&] {
        transactions_->Commit(id);
        return true;
    });
    return SuccessFlag();
}

Value DriverEngine::RollbackTransaction(const Value& params) {
    std::string id = RequireTransactionId(params);
    Guarded("rollback_transaction", [&] {
        transactions_->Rollback(id);
        return true;
    });
    return SuccessFlag();
}

//===----------------------------------------------------------------------===//
// Syntax tree methods
//===----------------------------------------------------------------------===//

namespace {

Value RequireFileId(const Value& params) {
    const Value& file_id = params["file_id"];
    if (file_id.IsNull()) {
        throw std::invalid_argument("file_id parameter is required");
    }
    if (!file_id.IsInt() && !(file_id.IsString() && !file_id.GetString().empty())) {
        throw std::invalid_argument("file_id must be an integer or a non-empty string");
    }
    return file_id;
}

ValueMap RequireFilter(const Value& params) {
    const Value& filter = params["filter"];
    if (!filter.IsMap() || filter.GetMap().empty()) {
        throw std::invalid_argument("filter parameter is required");
    }
    return filter.GetMap();
}

} // anonymous namespace

Result DriverEngine::QueryTree(TreeKind kind, const Value& params) {
    TreeQuery query;
    query.kind = kind;
    query.file_id = RequireFileId(params);
    query.filter = RequireFilter(params);

    auto provider = GetTreeProvider();
    if (!provider) {
        throw DriverError(ErrorCode::UNSUPPORTED, std::string("query_") + TreeKindToString(kind) +
                          ": no tree provider is configured");
    }
    return provider->Query(query);
}

Result DriverEngine::ModifyTree(TreeKind kind, const Value& params) {
    TreeModification modification;
    modification.kind = kind;
    modification.file_id = RequireFileId(params);
    modification.filter = RequireFilter(params);

    const Value& action = params["action"];
    if (!action.IsString() || action.GetString().empty()) {
        throw std::invalid_argument("action parameter is required");
    }
    if (!ParseTreeAction(action.GetString(), modification.action)) {
        throw std::invalid_argument("Invalid action: " + action.GetString());
    }

    const Value& nodes = params["nodes"];
    if (nodes.IsList()) {
        modification.nodes = nodes.GetList();
    } else if (!nodes.IsNull()) {
        throw std::invalid_argument("nodes must be a list");
    }
    if (modification.action != TreeAction::DELETE && modification.nodes.empty()) {
        throw std::invalid_argument(std::string("nodes parameter required for ") +
                                    TreeActionToString(modification.action) + " action");
    }

    auto provider = GetTreeProvider();
    if (!provider) {
        throw DriverError(ErrorCode::UNSUPPORTED, std::string("modify_") + TreeKindToString(kind) +
                          ": no tree provider is configured");
    }
    return provider->Modify(modification);
}

} // namespace dbdriver
