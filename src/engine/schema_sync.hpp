//===----------------------------------------------------------------------===//
//                         DBDriver
//
// engine/schema_sync.hpp
//
// Declarative schema comparison and migration
//===----------------------------------------------------------------------===//

#pragma once

#include "engine/sql_builder.hpp"
#include "protocol/value.hpp"
#include "duckdb.hpp"
#include <string>
#include <vector>

namespace dbdriver {

// Key/value table holding the schema version
constexpr const char* SETTINGS_TABLE = "db_settings";
constexpr const char* SCHEMA_VERSION_KEY = "schema_version";

struct SchemaDefinition {
    Value version;  // string, or null when not versioned
    std::vector<TableSpec> tables;
    std::vector<IndexSpec> indexes;
};

// Throws DriverError(INVALID_SCHEMA)
SchemaDefinition ParseSchemaDefinition(const Value& definition);

struct TypeChange {
    std::string column;
    std::string current_type;
    std::string expected_type;
};

struct TableDiff {
    std::string table;
    bool missing = false;
    std::vector<ColumnSpec> missing_columns;
    std::vector<std::string> extra_columns;
    std::vector<TypeChange> type_changes;

    bool HasChanges() const {
        return missing || !missing_columns.empty() || !type_changes.empty();
    }
};

struct SchemaDiff {
    std::vector<TableDiff> tables;  // one per defined table, in definition order
    std::vector<IndexSpec> missing_indexes;

    bool RequiresMigration() const;
};

//===----------------------------------------------------------------------===//
// SchemaSynchronizer - runs on the write connection, caller holds the lane
//===----------------------------------------------------------------------===//
class SchemaSynchronizer {
public:
    explicit SchemaSynchronizer(duckdb::Connection& connection);

    SchemaDiff Compare(const SchemaDefinition& definition);

    // DDL that brings the live catalogue up to the definition
    std::vector<std::string> MigrationStatements(const SchemaDefinition& definition,
                                                 const SchemaDiff& diff);

    // EXPORT DATABASE into a fresh directory under backup_dir, returns its path
    std::string Snapshot(const std::string& backup_dir);

    // Result map: success, version, backup_path, tables, changes, errors
    Value Sync(const SchemaDefinition& definition, const std::string& backup_dir);

    // Null when no version was ever stored
    Value GetVersion();

private:
    std::vector<std::string> CurrentTables();
    std::vector<std::pair<std::string, std::string>> CurrentColumns(const std::string& table);
    std::vector<std::string> CurrentIndexes();
    std::string NormalizeType(const std::string& type);
    void StoreVersion(const std::string& version);
    void Exec(const std::string& sql, const std::string& operation, const std::string& target);

    duckdb::Connection& connection_;
};

} // namespace dbdriver
