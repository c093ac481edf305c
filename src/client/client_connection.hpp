//===----------------------------------------------------------------------===//
//                         DBDriver
//
// client/client_connection.hpp
//
// Blocking framed connection to the driver socket
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"
#include <asio.hpp>

namespace dbdriver {

class ClientConnection {
public:
    explicit ClientConnection(std::string socket_path,
                              uint32_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES);
    ~ClientConnection();

    // Non-copyable
    ClientConnection(const ClientConnection&) = delete;
    ClientConnection& operator=(const ClientConnection&) = delete;

    // Throws ConnectionError when the socket cannot be reached in time
    void Connect(std::chrono::milliseconds timeout);

    // Sends CLOSE first when asked and still open
    void Close(bool send_close = true);

    bool IsOpen() const { return socket_.is_open(); }

    // Throws ConnectionError on failure or timeout; the connection is closed
    void SendFrame(const Message& message, std::chrono::milliseconds timeout);

    // Next complete frame. Throws ConnectionError on failure or timeout and
    // ProtocolError for a frame that breaks the framing rules.
    Message ReceiveFrame(std::chrono::milliseconds timeout);

    // PING/PONG round trip. False when the connection is unusable.
    bool Ping(std::chrono::milliseconds timeout, Value* health = nullptr);

    const std::string& GetSocketPath() const { return socket_path_; }
    TimePoint GetLastUsed() const { return last_used_; }

private:
    // Run queued async work until done or timeout; closes the socket on timeout
    void RunFor(std::chrono::milliseconds timeout);

private:
    std::string socket_path_;
    uint32_t max_frame_bytes_;

    asio::io_context io_context_;
    asio::local::stream_protocol::socket socket_;

    TimePoint last_used_;
};

} // namespace dbdriver
