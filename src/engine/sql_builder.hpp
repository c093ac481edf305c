//===----------------------------------------------------------------------===//
//                         DBDriver
//
// engine/sql_builder.hpp
//
// Parameterized SQL text for table-level operations
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/value.hpp"
#include <string>
#include <vector>

namespace dbdriver {

struct SqlStatement {
    std::string sql;
    ValueList params;  // bound to '?' placeholders in order
};

// Column definition from a create_table / sync_schema description
struct ColumnSpec {
    std::string name;
    std::string type;
    bool nullable = true;
    bool primary_key = false;
    bool unique = false;
    Value default_value;  // null = no default
};

struct TableConstraintSpec {
    std::string kind;  // "primary_key", "unique" or "foreign_key"
    std::vector<std::string> columns;
    std::string ref_table;
    std::vector<std::string> ref_columns;
};

struct TableSpec {
    std::string name;
    std::vector<ColumnSpec> columns;
    std::vector<TableConstraintSpec> constraints;
};

struct IndexSpec {
    std::string name;
    std::string table;
    std::vector<std::string> columns;
    bool unique = false;
};

// Parsing from params. Throw std::invalid_argument with a caller-facing message.
ColumnSpec ParseColumnSpec(const Value& column);
TableSpec ParseTableSpec(const Value& schema);
IndexSpec ParseIndexSpec(const Value& index);
std::vector<std::string> ParseNameList(const Value& list, const char* what);

namespace sql {

// "name" with embedded quotes doubled
std::string QuoteIdentifier(const std::string& name);

// 'text' with embedded quotes doubled
std::string QuoteLiteral(const std::string& text);

// Non-empty identifier of sane length, no NUL bytes
bool IsValidIdentifier(const std::string& name);

// Column type names such as INTEGER, VARCHAR(255), DECIMAL(10,2), DOUBLE[]
bool IsValidTypeName(const std::string& type);

// Literal or whitelisted expression for DEFAULT clauses
std::string DefaultExpression(const Value& value);

std::string ColumnDefinition(const ColumnSpec& column);
std::string CreateTable(const TableSpec& table, bool if_not_exists = true);
std::string CreateIndex(const IndexSpec& index, bool if_not_exists = true);

// where: map column -> value (null => IS NULL, list => IN (...))
// An empty map yields no WHERE clause.
void AppendWhere(SqlStatement& stmt, const ValueMap& where);

SqlStatement Insert(const std::string& table, const ValueMap& data);
SqlStatement Update(const std::string& table, const ValueMap& data, const ValueMap& where);
SqlStatement Delete(const std::string& table, const ValueMap& where);

struct SelectOptions {
    std::vector<std::string> columns;   // empty = *
    ValueMap where;
    std::vector<std::string> order_by;  // "-col" = descending
    int64_t limit = -1;                 // -1 = none
    int64_t offset = 0;
};

SqlStatement Select(const std::string& table, const SelectOptions& options);

// First keyword decides whether a raw statement can run on a read connection
bool IsReadOnlyStatement(const std::string& sql_text);

} // namespace sql
} // namespace dbdriver
