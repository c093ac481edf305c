//===----------------------------------------------------------------------===//
//                         DBDriver
//
// protocol/protocol_handler.hpp
//
// Routes inbound frames to the RPC server and writes the replies
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"

namespace dbdriver {

class UnixConnection;

class ProtocolHandler : public std::enable_shared_from_this<ProtocolHandler> {
public:
    explicit ProtocolHandler(RpcServer& server);
    ~ProtocolHandler() = default;

    // Handle one complete frame. Runs on the connection's io thread.
    void HandleMessage(const Message& message,
                       std::shared_ptr<UnixConnection> connection);

    uint64_t GetRequestsReceived() const { return requests_received_; }
    uint64_t GetProtocolErrors() const { return protocol_errors_; }

private:
    void HandlePing(const Message& message, std::shared_ptr<UnixConnection> connection);
    void HandleClose(const Message& message, std::shared_ptr<UnixConnection> connection);
    void HandleRequest(const Message& message, std::shared_ptr<UnixConnection> connection);

    void SendProtocolError(ErrorCode code,
                           const std::string& message,
                           const std::string& request_id,
                           std::shared_ptr<UnixConnection> connection);

private:
    RpcServer& server_;

    std::atomic<uint64_t> requests_received_{0};
    std::atomic<uint64_t> protocol_errors_{0};
};

} // namespace dbdriver
