//===----------------------------------------------------------------------===//
//                         DBDriver
//
// engine/schema_sync.cpp
//
// Declarative schema comparison and migration
//===----------------------------------------------------------------------===//

#include "engine/schema_sync.hpp"
#include "engine/storage_error.hpp"
#include "logging/logger.hpp"
#include "utils/uuid.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <map>
#include <set>

namespace dbdriver {

namespace fs = std::filesystem;

namespace {

std::string Upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    return s;
}

std::string VersionText(const Value& version) {
    if (version.IsString()) return version.GetString();
    if (version.IsInt()) return std::to_string(version.GetInt());
    return "";
}

// Added columns carry type and default only
ColumnSpec AddableColumn(const ColumnSpec& column) {
    ColumnSpec plain;
    plain.name = column.name;
    plain.type = column.type;
    plain.default_value = column.default_value;
    return plain;
}

} // anonymous namespace

SchemaDefinition ParseSchemaDefinition(const Value& definition) {
    if (!definition.IsMap()) {
        throw DriverError(ErrorCode::INVALID_SCHEMA, "schema_definition must be a dictionary");
    }

    SchemaDefinition schema;
    try {
        const Value& version = definition["version"];
        if (!version.IsNull() && !version.IsString() && !version.IsInt()) {
            throw std::invalid_argument("version must be a string or integer");
        }
        if (!version.IsNull()) {
            schema.version = Value(VersionText(version));
        }

        const Value& tables = definition["tables"];
        if (tables.IsMap()) {
            for (const auto& entry : tables.GetMap()) {
                Value table = entry.second;
                if (!table.IsMap()) {
                    throw std::invalid_argument("table '" + entry.first + "' must be a dictionary");
                }
                table["name"] = Value(entry.first);
                schema.tables.push_back(ParseTableSpec(table));
            }
        } else if (tables.IsList()) {
            for (const auto& table : tables.GetList()) {
                schema.tables.push_back(ParseTableSpec(table));
            }
        } else if (!tables.IsNull()) {
            throw std::invalid_argument("tables must be a dictionary or list");
        }

        const Value& indexes = definition["indexes"];
        if (indexes.IsList()) {
            for (const auto& index : indexes.GetList()) {
                schema.indexes.push_back(ParseIndexSpec(index));
            }
        } else if (!indexes.IsNull()) {
            throw std::invalid_argument("indexes must be a list");
        }
    } catch (const std::invalid_argument& e) {
        throw DriverError(ErrorCode::INVALID_SCHEMA, std::string("sync_schema: ") + e.what());
    }

    std::set<std::string> names;
    for (const auto& table : schema.tables) {
        if (table.name == SETTINGS_TABLE) {
            throw DriverError(ErrorCode::INVALID_SCHEMA,
                              "sync_schema: table name is reserved: " + table.name);
        }
        if (!names.insert(table.name).second) {
            throw DriverError(ErrorCode::INVALID_SCHEMA,
                              "sync_schema: duplicate table " + table.name);
        }
    }
    return schema;
}

bool SchemaDiff::RequiresMigration() const {
    if (!missing_indexes.empty()) return true;
    for (const auto& table : tables) {
        if (table.missing || !table.missing_columns.empty()) return true;
    }
    return false;
}

//===----------------------------------------------------------------------===//
// SchemaSynchronizer
//===----------------------------------------------------------------------===//

SchemaSynchronizer::SchemaSynchronizer(duckdb::Connection& connection)
    : connection_(connection) {}

void SchemaSynchronizer::Exec(const std::string& sql, const std::string& operation,
                              const std::string& target) {
    auto result = connection_.Query(sql);
    CheckResult(*result, operation, target);
}

std::vector<std::string> SchemaSynchronizer::CurrentTables() {
    auto result = connection_.Query(
        "SELECT table_name FROM duckdb_tables() "
        "WHERE database_name = current_database() AND schema_name = current_schema() "
        "ORDER BY table_name");
    CheckResult(*result, "sync_schema", "catalogue");

    std::vector<std::string> tables;
    for (duckdb::idx_t row = 0; row < result->RowCount(); row++) {
        tables.push_back(result->GetValue(0, row).ToString());
    }
    return tables;
}

std::vector<std::pair<std::string, std::string>>
SchemaSynchronizer::CurrentColumns(const std::string& table) {
    auto stmt = connection_.Prepare(
        "SELECT column_name, data_type FROM duckdb_columns() "
        "WHERE database_name = current_database() AND schema_name = current_schema() "
        "AND table_name = ? ORDER BY column_index");
    if (stmt->HasError()) {
        throw StorageFailure("sync_schema", table, stmt->error);
    }
    duckdb::vector<duckdb::Value> params{duckdb::Value(table)};
    auto pending = stmt->Execute(params, false);
    CheckResult(*pending, "sync_schema", table);
    auto& result = pending->Cast<duckdb::MaterializedQueryResult>();

    std::vector<std::pair<std::string, std::string>> columns;
    for (duckdb::idx_t row = 0; row < result.RowCount(); row++) {
        columns.emplace_back(result.GetValue(0, row).ToString(),
                             result.GetValue(1, row).ToString());
    }
    return columns;
}

std::vector<std::string> SchemaSynchronizer::CurrentIndexes() {
    auto result = connection_.Query(
        "SELECT index_name FROM duckdb_indexes() "
        "WHERE database_name = current_database() AND schema_name = current_schema()");
    CheckResult(*result, "sync_schema", "catalogue");

    std::vector<std::string> indexes;
    for (duckdb::idx_t row = 0; row < result->RowCount(); row++) {
        indexes.push_back(result->GetValue(0, row).ToString());
    }
    return indexes;
}

std::string SchemaSynchronizer::NormalizeType(const std::string& type) {
    // Let DuckDB resolve aliases such as TEXT -> VARCHAR or INT -> INTEGER
    auto stmt = connection_.Prepare("SELECT CAST(NULL AS " + type + ")");
    if (stmt->HasError() || stmt->GetTypes().empty()) {
        return Upper(type);
    }
    return stmt->GetTypes()[0].ToString();
}

SchemaDiff SchemaSynchronizer::Compare(const SchemaDefinition& definition) {
    SchemaDiff diff;

    auto tables = CurrentTables();
    std::set<std::string> existing(tables.begin(), tables.end());

    for (const auto& table : definition.tables) {
        TableDiff table_diff;
        table_diff.table = table.name;

        if (existing.count(table.name) == 0) {
            table_diff.missing = true;
            diff.tables.push_back(std::move(table_diff));
            continue;
        }

        auto columns = CurrentColumns(table.name);
        std::map<std::string, std::string> current(columns.begin(), columns.end());
        std::set<std::string> expected;

        for (const auto& column : table.columns) {
            expected.insert(column.name);
            auto it = current.find(column.name);
            if (it == current.end()) {
                table_diff.missing_columns.push_back(column);
                continue;
            }
            std::string want = NormalizeType(column.type);
            if (Upper(it->second) != Upper(want)) {
                table_diff.type_changes.push_back({column.name, it->second, want});
            }
        }
        for (const auto& column : columns) {
            if (expected.count(column.first) == 0) {
                table_diff.extra_columns.push_back(column.first);
            }
        }
        diff.tables.push_back(std::move(table_diff));
    }

    auto indexes = CurrentIndexes();
    std::set<std::string> existing_indexes(indexes.begin(), indexes.end());
    for (const auto& index : definition.indexes) {
        if (existing_indexes.count(index.name) == 0) {
            diff.missing_indexes.push_back(index);
        }
    }
    return diff;
}

std::vector<std::string> SchemaSynchronizer::MigrationStatements(const SchemaDefinition& definition,
                                                                 const SchemaDiff& diff) {
    std::vector<std::string> statements;
    for (size_t i = 0; i < diff.tables.size(); i++) {
        const TableDiff& table_diff = diff.tables[i];
        if (table_diff.missing) {
            statements.push_back(sql::CreateTable(definition.tables[i]));
            continue;
        }
        for (const auto& column : table_diff.missing_columns) {
            statements.push_back("ALTER TABLE " + sql::QuoteIdentifier(table_diff.table) +
                                 " ADD COLUMN " + sql::ColumnDefinition(AddableColumn(column)));
        }
    }
    // Indexes last so they can reference new tables and columns
    for (const auto& index : diff.missing_indexes) {
        statements.push_back(sql::CreateIndex(index));
    }
    return statements;
}

std::string SchemaSynchronizer::Snapshot(const std::string& backup_dir) {
    std::error_code ec;
    fs::create_directories(backup_dir, ec);
    if (ec) {
        throw DriverError(ErrorCode::STORAGE_ERROR,
                          "sync_schema: cannot create backup directory " + backup_dir +
                          ": " + ec.message());
    }

    std::time_t now = std::time(nullptr);
    std::tm tm_buf;
    gmtime_r(&now, &tm_buf);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm_buf);

    fs::path target = fs::path(backup_dir) /
                      ("schema_" + std::string(stamp) + "_" + GenerateUuid().substr(0, 8));
    Exec("EXPORT DATABASE " + sql::QuoteLiteral(target.string()), "sync_schema backup",
         target.string());

    LOG_INFO("schema_sync", "Database snapshot written to " + target.string());
    return target.string();
}

void SchemaSynchronizer::StoreVersion(const std::string& version) {
    Exec(std::string("CREATE TABLE IF NOT EXISTS ") + sql::QuoteIdentifier(SETTINGS_TABLE) +
         " (key VARCHAR PRIMARY KEY, value VARCHAR)", "sync_schema", SETTINGS_TABLE);

    Value current = GetVersion();
    std::string statement;
    if (current.IsNull()) {
        statement = std::string("INSERT INTO ") + sql::QuoteIdentifier(SETTINGS_TABLE) +
                    " (key, value) VALUES (" + sql::QuoteLiteral(SCHEMA_VERSION_KEY) + ", " +
                    sql::QuoteLiteral(version) + ")";
    } else if (current.GetString() != version) {
        // Only the non-key column changes, which keeps the primary key index untouched
        statement = std::string("UPDATE ") + sql::QuoteIdentifier(SETTINGS_TABLE) +
                    " SET value = " + sql::QuoteLiteral(version) +
                    " WHERE key = " + sql::QuoteLiteral(SCHEMA_VERSION_KEY);
    } else {
        return;
    }
    Exec(statement, "sync_schema", SETTINGS_TABLE);
}

Value SchemaSynchronizer::GetVersion() {
    auto tables = CurrentTables();
    if (std::find(tables.begin(), tables.end(), SETTINGS_TABLE) == tables.end()) {
        return Value();
    }
    auto result = connection_.Query(std::string("SELECT value FROM ") +
                                    sql::QuoteIdentifier(SETTINGS_TABLE) + " WHERE key = " +
                                    sql::QuoteLiteral(SCHEMA_VERSION_KEY));
    CheckResult(*result, "get_schema_version", SETTINGS_TABLE);
    if (result->RowCount() == 0) {
        return Value();
    }
    auto value = result->GetValue(0, 0);
    return value.IsNull() ? Value() : Value(value.ToString());
}

Value SchemaSynchronizer::Sync(const SchemaDefinition& definition, const std::string& backup_dir) {
    ValueMap outcome;
    ValueMap tables;
    ValueList changes;
    ValueList errors;

    outcome["success"] = Value(false);
    outcome["version"] = definition.version;
    outcome["backup_path"] = Value();

    SchemaDiff diff = Compare(definition);

    for (const auto& table_diff : diff.tables) {
        tables[table_diff.table] = Value(table_diff.missing ? "created" :
                                         table_diff.missing_columns.empty() ? "unchanged"
                                                                            : "altered");
        if (table_diff.missing) {
            changes.push_back(Value("create table " + table_diff.table));
        }
        for (const auto& column : table_diff.missing_columns) {
            changes.push_back(Value("add column " + table_diff.table + "." + column.name));
        }
        // Reported only, existing data is never rewritten
        for (const auto& change : table_diff.type_changes) {
            changes.push_back(Value("type differs " + table_diff.table + "." + change.column +
                                    ": " + change.current_type + " -> " +
                                    change.expected_type + " (not altered)"));
        }
    }
    for (const auto& index : diff.missing_indexes) {
        changes.push_back(Value("create index " + index.name + " on " + index.table));
        auto it = tables.find(index.table);
        if (it != tables.end() && it->second.GetString() == "unchanged") {
            it->second = Value("altered");
        }
    }

    std::string version = VersionText(definition.version);
    bool version_changed = false;
    if (!version.empty()) {
        Value stored = GetVersion();
        version_changed = stored.IsNull() || stored.GetString() != version;
    }

    auto finish = [&](bool success) {
        outcome["success"] = Value(success);
        outcome["tables"] = Value(std::move(tables));
        outcome["changes"] = Value(std::move(changes));
        outcome["errors"] = Value(std::move(errors));
        return Value(std::move(outcome));
    };

    if (!diff.RequiresMigration() && !version_changed) {
        return finish(true);
    }

    if (!backup_dir.empty() && diff.RequiresMigration()) {
        try {
            outcome["backup_path"] = Value(Snapshot(backup_dir));
        } catch (const DriverError& e) {
            errors.push_back(Value(e.what()));
            for (auto& entry : tables) entry.second = Value("unchanged");
            return finish(false);
        }
    }

    auto statements = MigrationStatements(definition, diff);

    auto begin = connection_.Query("BEGIN TRANSACTION");
    CheckResult(*begin, "sync_schema", "transaction");

    try {
        for (const auto& statement : statements) {
            DLOG_DEBUG("schema_sync", "{}", statement);
            Exec(statement, "sync_schema", "migration");
        }
        if (!version.empty()) {
            StoreVersion(version);
        }
        Exec("COMMIT", "sync_schema", "commit");
    } catch (const DriverError& e) {
        if (connection_.HasActiveTransaction()) {
            auto rollback = connection_.Query("ROLLBACK");
            if (rollback->HasError()) {
                LOG_ERROR("schema_sync", "Rollback failed: " + rollback->GetError());
            }
        }
        LOG_ERROR("schema_sync", e.what());
        errors.push_back(Value(e.what()));
        for (auto& entry : tables) entry.second = Value("unchanged");
        return finish(false);
    }

    LOG_INFO("schema_sync", "Schema synchronized (" + std::to_string(statements.size()) +
             " statements, version=" + (version.empty() ? "none" : version) + ")");
    return finish(true);
}

} // namespace dbdriver
