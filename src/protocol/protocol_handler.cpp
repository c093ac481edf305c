//===----------------------------------------------------------------------===//
//                         DBDriver
//
// protocol/protocol_handler.cpp
//
// Protocol handler implementation
//===----------------------------------------------------------------------===//

#include "protocol/protocol_handler.hpp"
#include "protocol/errors.hpp"
#include "protocol/wire_codec.hpp"
#include "network/unix_connection.hpp"
#include "server/rpc_server.hpp"
#include "logging/logger.hpp"

namespace dbdriver {

ProtocolHandler::ProtocolHandler(RpcServer& server)
    : server_(server) {
}

void ProtocolHandler::HandleMessage(const Message& message,
                                    std::shared_ptr<UnixConnection> connection) {
    switch (message.GetType()) {
        case MessageType::PING:
            HandlePing(message, connection);
            break;
        case MessageType::CLOSE:
            HandleClose(message, connection);
            break;
        case MessageType::REQUEST:
            HandleRequest(message, connection);
            break;
        default:
            LOG_WARN("protocol", "Unexpected message type: " +
                     std::string(MessageTypeToString(message.GetType())));
            SendProtocolError(ErrorCode::PROTOCOL_ERROR,
                              "unexpected message type " +
                              std::to_string(static_cast<int>(message.GetHeader().type)),
                              "", connection);
            break;
    }
}

void ProtocolHandler::HandlePing(const Message& message,
                                 std::shared_ptr<UnixConnection> connection) {
    (void)message;
    connection->Send(Message(MessageType::PONG, EncodeValue(server_.GetHealth())));
}

void ProtocolHandler::HandleClose(const Message& message,
                                  std::shared_ptr<UnixConnection> connection) {
    (void)message;
    LOG_DEBUG("protocol", "Client closed connection " +
              std::to_string(connection->GetConnectionId()));
    connection->Close();
}

void ProtocolHandler::HandleRequest(const Message& message,
                                    std::shared_ptr<UnixConnection> connection) {
    requests_received_++;

    Request request;
    try {
        request = RequestPayload::Deserialize(message.GetPayload()).request;
    } catch (const ProtocolError& e) {
        // Echo the id when the envelope got far enough to carry one
        std::string request_id;
        try {
            request_id = DecodeValue(message.GetPayload()).GetStringOr("id", "");
        } catch (const ProtocolError&) {
            request_id.clear();
        }
        SendProtocolError(e.GetCode(), e.what(), request_id, connection);
        return;
    }

    std::string request_id = request.id;
    std::weak_ptr<UnixConnection> weak_conn = connection;

    try {
        server_.CallAsync(std::move(request),
            [weak_conn](const std::string& id, const Result& result) {
                auto conn = weak_conn.lock();
                if (!conn || !conn->IsConnected()) {
                    LOG_DEBUG("protocol", "Dropping result for " + id + ": connection gone");
                    return;
                }
                ResponsePayload payload;
                payload.request_id = id;
                payload.result = result;
                conn->Send(Message(MessageType::RESPONSE, payload.Serialize()));
            });
    } catch (const ProtocolError& e) {
        SendProtocolError(e.GetCode(), e.what(), request_id, connection);
    }
}

void ProtocolHandler::SendProtocolError(ErrorCode code,
                                        const std::string& message,
                                        const std::string& request_id,
                                        std::shared_ptr<UnixConnection> connection) {
    protocol_errors_++;

    ProtocolErrorPayload payload;
    payload.code = code;
    payload.message = message;
    payload.request_id = request_id;

    LOG_DEBUG("protocol", "Protocol error on connection " +
              std::to_string(connection->GetConnectionId()) + ": " + message);

    connection->Send(Message(MessageType::PROTOCOL_ERROR, payload.Serialize()));
}

} // namespace dbdriver
