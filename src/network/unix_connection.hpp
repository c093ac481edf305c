//===----------------------------------------------------------------------===//
//                         DBDriver
//
// network/unix_connection.hpp
//
// Framed connection over a local stream socket
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"
#include <asio.hpp>
#include <array>
#include <deque>

namespace dbdriver {

class UnixServer;
class ProtocolHandler;

// One accepted client. Reads run back to back on the socket's io_context;
// writes are queued from any thread and drained on that same io_context.
class UnixConnection : public std::enable_shared_from_this<UnixConnection> {
public:
    using Ptr = std::shared_ptr<UnixConnection>;
    using Socket = asio::local::stream_protocol::socket;

    UnixConnection(asio::io_context& io_context,
                   UnixServer& server,
                   std::shared_ptr<ProtocolHandler> handler,
                   uint32_t max_frame_bytes);
    ~UnixConnection();

    // Non-copyable
    UnixConnection(const UnixConnection&) = delete;
    UnixConnection& operator=(const UnixConnection&) = delete;

    Socket& GetSocket() { return socket_; }

    void Start();

    // Idempotent; detaches from the server
    void Close();

    // Thread-safe. Dropped once the connection is closed.
    void Send(const Message& message) { Enqueue(message.Serialize(), false); }

    // Close once this frame and everything queued before it is written
    void SendAndClose(const Message& message) { Enqueue(message.Serialize(), true); }

    uint64_t GetConnectionId() const { return connection_id_; }
    bool IsConnected() const { return connected_; }

private:
    void Enqueue(std::vector<uint8_t> frame, bool close_after);

    void ReadHeader();
    void OnHeader(const asio::error_code& ec, size_t bytes);
    void OnPayload(const asio::error_code& ec, size_t bytes);
    void Dispatch();
    // False (and the connection is being closed) on a read error
    bool ReadSucceeded(const asio::error_code& ec, size_t bytes, const char* stage);

    // Only on the socket's io_context
    void WriteNext();

    // Answer a bad frame with PROTOCOL_ERROR and drop the connection
    void RejectFrame(ErrorCode code, const std::string& message);

    Socket socket_;
    UnixServer& server_;
    std::shared_ptr<ProtocolHandler> handler_;
    const uint32_t max_frame_bytes_;
    const uint64_t connection_id_;

    std::atomic<bool> connected_{false};

    std::array<uint8_t, MessageHeader::SIZE> header_bytes_{};
    Message inbound_;

    std::mutex outbox_mutex_;
    std::deque<std::vector<uint8_t>> outbox_;
    bool close_when_drained_ = false;
    // io_context only
    bool write_in_flight_ = false;
    std::vector<uint8_t> in_flight_;

    std::atomic<uint64_t> frames_in_{0};
    std::atomic<uint64_t> frames_out_{0};

    static std::atomic<uint64_t> next_connection_id_;
};

} // namespace dbdriver
