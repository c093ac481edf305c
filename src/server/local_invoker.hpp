//===----------------------------------------------------------------------===//
//                         DBDriver
//
// server/local_invoker.hpp
//
// In-process MethodInvoker that goes through the RPC server's queue
//===----------------------------------------------------------------------===//

#pragma once

#include "client/method_invoker.hpp"
#include "server/rpc_server.hpp"

namespace dbdriver {

class LocalInvoker : public MethodInvoker {
public:
    explicit LocalInvoker(RpcServer& server) : server_(server) {}

    Result Call(const std::string& method,
                Value params = Value(),
                Priority priority = Priority::NORMAL,
                uint32_t timeout_ms = 0) override {
        return server_.Call(Request::Make(method, std::move(params), priority, timeout_ms));
    }

private:
    RpcServer& server_;
};

} // namespace dbdriver
