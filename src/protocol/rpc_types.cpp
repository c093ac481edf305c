//===----------------------------------------------------------------------===//
//                         DBDriver
//
// protocol/rpc_types.cpp
//
// Request and Result helpers
//===----------------------------------------------------------------------===//

#include "protocol/rpc_types.hpp"
#include "utils/uuid.hpp"
#include <algorithm>
#include <stdexcept>

namespace dbdriver {

const char* PriorityToString(Priority priority) {
    switch (priority) {
        case Priority::LOW:    return "low";
        case Priority::NORMAL: return "normal";
        case Priority::HIGH:   return "high";
        case Priority::URGENT: return "urgent";
        default:               return "unknown";
    }
}

bool ParsePriority(const std::string& name, Priority& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "low")    { out = Priority::LOW; return true; }
    if (lower == "normal") { out = Priority::NORMAL; return true; }
    if (lower == "high")   { out = Priority::HIGH; return true; }
    if (lower == "urgent") { out = Priority::URGENT; return true; }
    return false;
}

Request Request::Make(std::string method, Value params, Priority priority, uint32_t timeout_ms) {
    Request request;
    request.id = GenerateUuid();
    request.method = std::move(method);
    request.params = std::move(params);
    request.priority = priority;
    request.created_at = Timestamp::Now();
    request.timeout_ms = timeout_ms;
    return request;
}

const Value& Result::GetData() const {
    if (!IsSuccess()) {
        throw std::logic_error("Result is not Success: " + ToString());
    }
    return std::get<SuccessResult>(data_).data;
}

ErrorCode Result::GetErrorCode() const {
    if (!IsError()) {
        throw std::logic_error("Result is not Error");
    }
    return std::get<ErrorResult>(data_).code;
}

const std::string& Result::GetErrorMessage() const {
    if (!IsError()) {
        throw std::logic_error("Result is not Error");
    }
    return std::get<ErrorResult>(data_).message;
}

const ValueList& Result::GetRecords() const {
    if (!IsRows()) {
        throw std::logic_error("Result is not Rows: " + ToString());
    }
    return std::get<RowsResult>(data_).records;
}

std::string Result::ToString() const {
    switch (GetKind()) {
        case Kind::SUCCESS:
            return "Success(" + std::get<SuccessResult>(data_).data.ToString() + ")";
        case Kind::ERROR: {
            const auto& err = std::get<ErrorResult>(data_);
            return std::string("Error(") + ErrorCodeToString(err.code) + ": " + err.message + ")";
        }
        case Kind::ROWS:
            return "Rows(" + std::to_string(std::get<RowsResult>(data_).records.size()) + " records)";
    }
    return "Result(?)";
}

const char* ResultKindToString(Result::Kind kind) {
    switch (kind) {
        case Result::Kind::SUCCESS: return "success";
        case Result::Kind::ERROR:   return "error";
        case Result::Kind::ROWS:    return "rows";
        default:                    return "unknown";
    }
}

} // namespace dbdriver
