//===----------------------------------------------------------------------===//
//                         DBDriver
//
// server/method_table.hpp
//
// Closed dispatch table from method name to handler
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/rpc_types.hpp"
#include <map>

namespace dbdriver {

using MethodHandler = std::function<Result(const Value& params)>;

// Built once at startup and read-only afterwards
class MethodTable {
public:
    MethodTable() = default;

    // Throws std::logic_error on a duplicate name
    void Register(const std::string& name, MethodHandler handler);

    bool Contains(const std::string& name) const;

    // Throws ProtocolError(UNKNOWN_METHOD)
    const MethodHandler& Find(const std::string& name) const;

    // Run the handler. Every failure comes back as an Error result.
    Result Invoke(const Request& request) const;

    std::vector<std::string> Names() const;
    size_t Size() const { return handlers_.size(); }

    // The driver catalogue bound to an engine
    static MethodTable ForEngine(DriverEngine& engine);

private:
    std::map<std::string, MethodHandler> handlers_;
};

} // namespace dbdriver
