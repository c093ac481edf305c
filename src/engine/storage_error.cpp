//===----------------------------------------------------------------------===//
//                         DBDriver
//
// engine/storage_error.cpp
//
// Classification of DuckDB failures into driver error codes
//===----------------------------------------------------------------------===//

#include "engine/storage_error.hpp"
#include <algorithm>
#include <cctype>

namespace dbdriver {

namespace {

bool ContainsNoCase(const std::string& haystack, const char* needle) {
    std::string lower = haystack;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower.find(needle) != std::string::npos;
}

} // anonymous namespace

ErrorCode ClassifyStorageError(duckdb::ExceptionType type, const std::string& message) {
    switch (type) {
        case duckdb::ExceptionType::CATALOG:
            return ContainsNoCase(message, "does not exist") ? ErrorCode::TABLE_NOT_FOUND
                                                             : ErrorCode::STORAGE_ERROR;
        case duckdb::ExceptionType::BINDER:
            return ContainsNoCase(message, "column") ? ErrorCode::COLUMN_NOT_FOUND
                                                     : ErrorCode::SYNTAX_ERROR;
        case duckdb::ExceptionType::PARSER:
        case duckdb::ExceptionType::SYNTAX:
            return ErrorCode::SYNTAX_ERROR;
        case duckdb::ExceptionType::CONSTRAINT:
            return ErrorCode::CONSTRAINT_VIOLATION;
        case duckdb::ExceptionType::TRANSACTION:
            return ErrorCode::TRANSACTION_CONFLICT;
        case duckdb::ExceptionType::CONVERSION:
        case duckdb::ExceptionType::MISMATCH_TYPE:
        case duckdb::ExceptionType::INVALID_INPUT:
            return ErrorCode::INVALID_PARAMETER;
        case duckdb::ExceptionType::INTERRUPT:
            return ErrorCode::TIMEOUT;
        default:
            return ErrorCode::STORAGE_ERROR;
    }
}

DriverError StorageFailure(const std::string& operation, const std::string& target,
                           const duckdb::ErrorData& error) {
    const std::string& message = error.Message();
    std::string context = target.empty() ? operation : operation + " on " + target;
    return DriverError(ClassifyStorageError(error.Type(), message), context + ": " + message);
}

void CheckResult(duckdb::QueryResult& result, const std::string& operation,
                 const std::string& target) {
    if (result.HasError()) {
        throw StorageFailure(operation, target, result.GetErrorObject());
    }
}

} // namespace dbdriver
