//===----------------------------------------------------------------------===//
//                         DBDriver
//
// engine/sql_builder.cpp
//
// SQL generation
//===----------------------------------------------------------------------===//

#include "engine/sql_builder.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace dbdriver {

namespace {

constexpr size_t MAX_IDENTIFIER_LENGTH = 255;

std::string ToUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    return s;
}

std::string Trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string JoinQuoted(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i) out += ", ";
        out += sql::QuoteIdentifier(names[i]);
    }
    return out;
}

void RequireIdentifier(const std::string& name, const std::string& what) {
    if (!sql::IsValidIdentifier(name)) {
        throw std::invalid_argument(what + " must be a non-empty string");
    }
}

} // anonymous namespace

//===----------------------------------------------------------------------===//
// Schema description parsing
//===----------------------------------------------------------------------===//
std::vector<std::string> ParseNameList(const Value& list, const char* what) {
    if (!list.IsList()) {
        throw std::invalid_argument(std::string(what) + " must be a list");
    }
    std::vector<std::string> names;
    for (const auto& item : list.GetList()) {
        if (!item.IsString() || !sql::IsValidIdentifier(item.GetString())) {
            throw std::invalid_argument(std::string(what) + " must contain non-empty strings");
        }
        names.push_back(item.GetString());
    }
    return names;
}

ColumnSpec ParseColumnSpec(const Value& column) {
    if (!column.IsMap()) {
        throw std::invalid_argument("column definition must be a map");
    }
    ColumnSpec spec;
    spec.name = column.GetStringOr("name", "");
    RequireIdentifier(spec.name, "column name");

    spec.type = column.GetStringOr("type", "");
    if (!sql::IsValidTypeName(spec.type)) {
        throw std::invalid_argument("invalid type '" + spec.type + "' for column " + spec.name);
    }
    spec.nullable = column.GetBoolOr("nullable", !column.GetBoolOr("not_null", false));
    spec.primary_key = column.GetBoolOr("primary_key", false);
    spec.unique = column.GetBoolOr("unique", false);
    spec.default_value = column["default"];
    return spec;
}

TableSpec ParseTableSpec(const Value& schema) {
    if (!schema.IsMap()) {
        throw std::invalid_argument("schema must be a map");
    }
    TableSpec table;
    table.name = schema.GetStringOr("name", "");
    RequireIdentifier(table.name, "schema name");

    const Value& columns = schema["columns"];
    if (!columns.IsList() || columns.GetList().empty()) {
        throw std::invalid_argument("schema columns must be a non-empty list");
    }
    for (const auto& column : columns.GetList()) {
        table.columns.push_back(ParseColumnSpec(column));
    }

    const Value& constraints = schema["constraints"];
    if (constraints.IsList()) {
        for (const auto& c : constraints.GetList()) {
            TableConstraintSpec spec;
            spec.kind = c.GetStringOr("type", "");
            if (spec.kind != "primary_key" && spec.kind != "unique" && spec.kind != "foreign_key") {
                throw std::invalid_argument("unknown constraint type '" + spec.kind + "'");
            }
            spec.columns = ParseNameList(c["columns"], "constraint columns");
            if (spec.columns.empty()) {
                throw std::invalid_argument("constraint columns cannot be empty");
            }
            if (spec.kind == "foreign_key") {
                const Value& ref = c["references"];
                spec.ref_table = ref.GetStringOr("table", "");
                RequireIdentifier(spec.ref_table, "foreign key reference table");
                spec.ref_columns = ParseNameList(ref["columns"], "foreign key reference columns");
                if (spec.ref_columns.size() != spec.columns.size()) {
                    throw std::invalid_argument("foreign key column count mismatch");
                }
            }
            table.constraints.push_back(std::move(spec));
        }
    } else if (!constraints.IsNull()) {
        throw std::invalid_argument("constraints must be a list");
    }
    return table;
}

IndexSpec ParseIndexSpec(const Value& index) {
    if (!index.IsMap()) {
        throw std::invalid_argument("index definition must be a map");
    }
    IndexSpec spec;
    spec.name = index.GetStringOr("name", "");
    RequireIdentifier(spec.name, "index name");
    spec.table = index.GetStringOr("table", "");
    RequireIdentifier(spec.table, "index table");
    spec.columns = ParseNameList(index["columns"], "index columns");
    if (spec.columns.empty()) {
        throw std::invalid_argument("index columns cannot be empty");
    }
    spec.unique = index.GetBoolOr("unique", false);
    return spec;
}

namespace sql {

std::string QuoteIdentifier(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string QuoteLiteral(const std::string& text) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

bool IsValidIdentifier(const std::string& name) {
    return !name.empty() && name.size() <= MAX_IDENTIFIER_LENGTH &&
           name.find('\0') == std::string::npos;
}

bool IsValidTypeName(const std::string& type) {
    if (type.empty() || type.size() > 64 || !std::isalpha(static_cast<unsigned char>(type[0]))) {
        return false;
    }
    int depth = 0;
    for (char c : type) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ' ' || c == ',') {
            continue;
        }
        if (c == '(' || c == '[') { depth++; continue; }
        if (c == ')' || c == ']') {
            if (--depth < 0) return false;
            continue;
        }
        return false;
    }
    return depth == 0;
}

std::string DefaultExpression(const Value& value) {
    switch (value.GetType()) {
        case Value::Type::NULL_VALUE:
            return "NULL";
        case Value::Type::BOOLEAN:
            return value.GetBool() ? "TRUE" : "FALSE";
        case Value::Type::INTEGER:
            return std::to_string(value.GetInt());
        case Value::Type::DOUBLE: {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.17g", value.GetDouble());
            return buf;
        }
        case Value::Type::STRING: {
            std::string upper = ToUpper(Trim(value.GetString()));
            if (upper == "CURRENT_TIMESTAMP" || upper == "CURRENT_DATE" ||
                upper == "CURRENT_TIME" || upper == "NOW()" || upper == "NULL" ||
                upper == "TRUE" || upper == "FALSE") {
                return upper;
            }
            return QuoteLiteral(value.GetString());
        }
        default:
            throw std::invalid_argument(std::string("unsupported default of type ") +
                                        Value::TypeName(value.GetType()));
    }
}

std::string ColumnDefinition(const ColumnSpec& column) {
    std::string def = QuoteIdentifier(column.name) + " " + column.type;
    if (column.primary_key) {
        def += " PRIMARY KEY";
    } else {
        if (!column.nullable) def += " NOT NULL";
        if (column.unique) def += " UNIQUE";
    }
    if (!column.default_value.IsNull()) {
        def += " DEFAULT " + DefaultExpression(column.default_value);
    }
    return def;
}

std::string CreateTable(const TableSpec& table, bool if_not_exists) {
    std::string out = "CREATE TABLE ";
    if (if_not_exists) out += "IF NOT EXISTS ";
    out += QuoteIdentifier(table.name) + " (";

    bool first = true;
    for (const auto& column : table.columns) {
        if (!first) out += ", ";
        first = false;
        out += ColumnDefinition(column);
    }
    for (const auto& c : table.constraints) {
        out += ", ";
        if (c.kind == "primary_key") {
            out += "PRIMARY KEY (" + JoinQuoted(c.columns) + ")";
        } else if (c.kind == "unique") {
            out += "UNIQUE (" + JoinQuoted(c.columns) + ")";
        } else {
            out += "FOREIGN KEY (" + JoinQuoted(c.columns) + ") REFERENCES " +
                   QuoteIdentifier(c.ref_table) + " (" + JoinQuoted(c.ref_columns) + ")";
        }
    }
    out += ")";
    return out;
}

std::string CreateIndex(const IndexSpec& index, bool if_not_exists) {
    std::string out = index.unique ? "CREATE UNIQUE INDEX " : "CREATE INDEX ";
    if (if_not_exists) out += "IF NOT EXISTS ";
    out += QuoteIdentifier(index.name) + " ON " + QuoteIdentifier(index.table) +
           " (" + JoinQuoted(index.columns) + ")";
    return out;
}

void AppendWhere(SqlStatement& stmt, const ValueMap& where) {
    if (where.empty()) {
        return;
    }
    stmt.sql += " WHERE ";
    bool first = true;
    for (const auto& entry : where) {
        if (!first) stmt.sql += " AND ";
        first = false;

        std::string column = QuoteIdentifier(entry.first);
        const Value& v = entry.second;
        if (v.IsNull()) {
            stmt.sql += column + " IS NULL";
        } else if (v.IsList()) {
            const auto& items = v.GetList();
            if (items.empty()) {
                stmt.sql += "FALSE";
                continue;
            }
            stmt.sql += column + " IN (";
            for (size_t i = 0; i < items.size(); ++i) {
                stmt.sql += i ? ", ?" : "?";
                stmt.params.push_back(items[i]);
            }
            stmt.sql += ")";
        } else {
            stmt.sql += column + " = ?";
            stmt.params.push_back(v);
        }
    }
}

SqlStatement Insert(const std::string& table, const ValueMap& data) {
    SqlStatement stmt;
    std::string columns;
    std::string placeholders;
    for (const auto& entry : data) {
        if (!stmt.params.empty()) {
            columns += ", ";
            placeholders += ", ";
        }
        columns += QuoteIdentifier(entry.first);
        placeholders += "?";
        stmt.params.push_back(entry.second);
    }
    stmt.sql = "INSERT INTO " + QuoteIdentifier(table) + " (" + columns +
               ") VALUES (" + placeholders + ")";
    return stmt;
}

SqlStatement Update(const std::string& table, const ValueMap& data, const ValueMap& where) {
    SqlStatement stmt;
    stmt.sql = "UPDATE " + QuoteIdentifier(table) + " SET ";
    bool first = true;
    for (const auto& entry : data) {
        if (!first) stmt.sql += ", ";
        first = false;
        stmt.sql += QuoteIdentifier(entry.first) + " = ?";
        stmt.params.push_back(entry.second);
    }
    AppendWhere(stmt, where);
    return stmt;
}

SqlStatement Delete(const std::string& table, const ValueMap& where) {
    SqlStatement stmt;
    stmt.sql = "DELETE FROM " + QuoteIdentifier(table);
    AppendWhere(stmt, where);
    return stmt;
}

SqlStatement Select(const std::string& table, const SelectOptions& options) {
    SqlStatement stmt;
    stmt.sql = "SELECT ";
    stmt.sql += options.columns.empty() ? "*" : JoinQuoted(options.columns);
    stmt.sql += " FROM " + QuoteIdentifier(table);
    AppendWhere(stmt, options.where);

    if (!options.order_by.empty()) {
        stmt.sql += " ORDER BY ";
        for (size_t i = 0; i < options.order_by.size(); ++i) {
            if (i) stmt.sql += ", ";
            const std::string& key = options.order_by[i];
            if (key.size() > 1 && key[0] == '-') {
                stmt.sql += QuoteIdentifier(key.substr(1)) + " DESC";
            } else {
                stmt.sql += QuoteIdentifier(key) + " ASC";
            }
        }
    }
    if (options.limit >= 0) {
        stmt.sql += " LIMIT " + std::to_string(options.limit);
    }
    if (options.offset > 0) {
        stmt.sql += " OFFSET " + std::to_string(options.offset);
    }
    return stmt;
}

bool IsReadOnlyStatement(const std::string& sql_text) {
    size_t pos = 0;
    while (pos < sql_text.size()) {
        if (std::isspace(static_cast<unsigned char>(sql_text[pos]))) {
            pos++;
        } else if (sql_text.compare(pos, 2, "--") == 0) {
            pos = sql_text.find('\n', pos);
            if (pos == std::string::npos) return false;
        } else {
            break;
        }
    }
    size_t end = pos;
    while (end < sql_text.size() && std::isalpha(static_cast<unsigned char>(sql_text[end]))) {
        end++;
    }
    std::string keyword = ToUpper(sql_text.substr(pos, end - pos));
    return keyword == "SELECT" || keyword == "FROM" || keyword == "VALUES" ||
           keyword == "SHOW" || keyword == "DESCRIBE" || keyword == "EXPLAIN" ||
           keyword == "SUMMARIZE";
}

} // namespace sql
} // namespace dbdriver
