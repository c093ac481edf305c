//===----------------------------------------------------------------------===//
//                         DBDriver
//
// engine/storage_error.hpp
//
// Classification of DuckDB failures into driver error codes
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/errors.hpp"
#include "duckdb.hpp"
#include <string>

namespace dbdriver {

ErrorCode ClassifyStorageError(duckdb::ExceptionType type, const std::string& message);

// "<operation> on <target>: <message>" with the classified code
DriverError StorageFailure(const std::string& operation, const std::string& target,
                           const duckdb::ErrorData& error);

// Throws StorageFailure when the result carries an error
void CheckResult(duckdb::QueryResult& result, const std::string& operation,
                 const std::string& target);

} // namespace dbdriver
