//===----------------------------------------------------------------------===//
//                         DBDriver
//
// protocol/errors.hpp
//
// Exception types for protocol, operation and transport failures
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/message_types.hpp"
#include <stdexcept>
#include <string>

namespace dbdriver {

// Malformed frame, bad envelope or unknown method. Never carried in a Result.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message,
                           ErrorCode code = ErrorCode::PROTOCOL_ERROR)
        : std::runtime_error(message), code_(code) {}

    ErrorCode GetCode() const { return code_; }

private:
    ErrorCode code_;
};

// Typed operation failure. Converted to an Error result at the method boundary.
class DriverError : public std::runtime_error {
public:
    DriverError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode GetCode() const { return code_; }

private:
    ErrorCode code_;
};

// Transport failure after retries were exhausted
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace dbdriver
