//===----------------------------------------------------------------------===//
//                         DBDriver
//
// client/method_invoker.hpp
//
// Something that can run a catalogue method and hand back its Result
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/errors.hpp"
#include "protocol/rpc_types.hpp"

namespace dbdriver {

class MethodInvoker {
public:
    virtual ~MethodInvoker() = default;

    // timeout_ms of 0 uses the invoker's default
    virtual Result Call(const std::string& method,
                        Value params = Value(),
                        Priority priority = Priority::NORMAL,
                        uint32_t timeout_ms = 0) = 0;
};

// Data of a Success result, or the records of a Rows result as a list.
// Throws DriverError for an Error result.
inline Value UnwrapResult(const Result& result, const std::string& method) {
    if (result.IsError()) {
        throw DriverError(result.GetErrorCode(), method + ": " + result.GetErrorMessage());
    }
    if (result.IsRows()) {
        return Value(result.GetRecords());
    }
    return result.GetData();
}

} // namespace dbdriver
