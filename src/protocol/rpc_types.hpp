//===----------------------------------------------------------------------===//
//                         DBDriver
//
// protocol/rpc_types.hpp
//
// Request, Result and priority definitions
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/message_types.hpp"
#include "protocol/value.hpp"
#include <cstdint>
#include <string>
#include <variant>

namespace dbdriver {

//===----------------------------------------------------------------------===//
// Priority
//===----------------------------------------------------------------------===//
enum class Priority : uint8_t {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    URGENT = 3
};

constexpr size_t PRIORITY_LEVELS = 4;

const char* PriorityToString(Priority priority);

// Accepts "low", "normal", "high", "urgent" (any case)
bool ParsePriority(const std::string& name, Priority& out);

//===----------------------------------------------------------------------===//
// Request
//===----------------------------------------------------------------------===//
struct Request {
    std::string id;                 // correlation token
    std::string method;
    Value params;                   // map, or null when absent
    Priority priority = Priority::NORMAL;
    Timestamp created_at;
    uint32_t timeout_ms = 0;        // 0 = server default

    static Request Make(std::string method, Value params = Value(),
                        Priority priority = Priority::NORMAL,
                        uint32_t timeout_ms = 0);
};

//===----------------------------------------------------------------------===//
// Result
//===----------------------------------------------------------------------===//
struct SuccessResult {
    Value data;
};

struct ErrorResult {
    ErrorCode code = ErrorCode::INTERNAL_ERROR;
    std::string message;
};

struct RowsResult {
    ValueList records;  // each record is a map column -> value
};

class Result {
public:
    enum class Kind : uint8_t {
        SUCCESS = 0,
        ERROR = 1,
        ROWS = 2
    };

    Result() : data_(ErrorResult{ErrorCode::INTERNAL_ERROR, "empty result"}) {}
    Result(SuccessResult r) : data_(std::move(r)) {}
    Result(ErrorResult r) : data_(std::move(r)) {}
    Result(RowsResult r) : data_(std::move(r)) {}

    static Result Success(Value data = Value()) { return Result(SuccessResult{std::move(data)}); }
    static Result Error(ErrorCode code, std::string message) {
        return Result(ErrorResult{code, std::move(message)});
    }
    static Result Rows(ValueList records) { return Result(RowsResult{std::move(records)}); }

    Kind GetKind() const { return static_cast<Kind>(data_.index()); }
    bool IsSuccess() const { return GetKind() == Kind::SUCCESS; }
    bool IsError() const { return GetKind() == Kind::ERROR; }
    bool IsRows() const { return GetKind() == Kind::ROWS; }

    // Accessors throw std::logic_error for the wrong variant
    const Value& GetData() const;
    ErrorCode GetErrorCode() const;
    const std::string& GetErrorMessage() const;
    const ValueList& GetRecords() const;

    std::string ToString() const;

private:
    std::variant<SuccessResult, ErrorResult, RowsResult> data_;
};

const char* ResultKindToString(Result::Kind kind);

} // namespace dbdriver
