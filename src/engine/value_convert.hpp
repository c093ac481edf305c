//===----------------------------------------------------------------------===//
//                         DBDriver
//
// engine/value_convert.hpp
//
// Conversion between wire values and DuckDB values
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/value.hpp"
#include "duckdb.hpp"

namespace dbdriver {

// Throws std::invalid_argument for list and map values
duckdb::Value ToDuckValue(const Value& value);

duckdb::vector<duckdb::Value> ToDuckValues(const ValueList& values);

Value FromDuckValue(const duckdb::Value& value);

// One map per row, keyed by column name
ValueList ResultToRecords(duckdb::MaterializedQueryResult& result);

} // namespace dbdriver
