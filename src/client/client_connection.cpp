//===----------------------------------------------------------------------===//
//                         DBDriver
//
// client/client_connection.cpp
//
// Client connection implementation
//===----------------------------------------------------------------------===//

#include "client/client_connection.hpp"
#include "protocol/errors.hpp"
#include "protocol/wire_codec.hpp"
#include "logging/logger.hpp"
#include <array>

namespace dbdriver {

ClientConnection::ClientConnection(std::string socket_path, uint32_t max_frame_bytes)
    : socket_path_(std::move(socket_path))
    , max_frame_bytes_(max_frame_bytes)
    , socket_(io_context_)
    , last_used_(Clock::now()) {
}

ClientConnection::~ClientConnection() {
    Close(false);
}

void ClientConnection::RunFor(std::chrono::milliseconds timeout) {
    io_context_.restart();
    io_context_.run_for(timeout);

    // Still running: cancel the outstanding operation and let it finish
    if (!io_context_.stopped()) {
        asio::error_code ec;
        socket_.close(ec);
        io_context_.run();
    }
}

void ClientConnection::Connect(std::chrono::milliseconds timeout) {
    if (IsOpen()) {
        return;
    }

    asio::error_code result = asio::error::would_block;
    socket_.async_connect(asio::local::stream_protocol::endpoint(socket_path_),
        [&result](const asio::error_code& ec) { result = ec; });
    RunFor(timeout);

    if (result == asio::error::would_block || result == asio::error::operation_aborted) {
        throw ConnectionError("connect to " + socket_path_ + " timed out");
    }
    if (result) {
        asio::error_code ec;
        socket_.close(ec);
        throw ConnectionError("connect to " + socket_path_ + " failed: " + result.message());
    }

    last_used_ = Clock::now();
}

void ClientConnection::Close(bool send_close) {
    if (!IsOpen()) {
        return;
    }
    if (send_close) {
        try {
            SendFrame(Message(MessageType::CLOSE), std::chrono::milliseconds(200));
        } catch (const ConnectionError& e) {
            LOG_DEBUG("client", std::string("CLOSE not delivered: ") + e.what());
        }
    }
    asio::error_code ec;
    socket_.shutdown(asio::local::stream_protocol::socket::shutdown_both, ec);
    socket_.close(ec);
}

void ClientConnection::SendFrame(const Message& message, std::chrono::milliseconds timeout) {
    if (!IsOpen()) {
        throw ConnectionError("connection to " + socket_path_ + " is closed");
    }

    std::vector<uint8_t> data = message.Serialize();
    asio::error_code result = asio::error::would_block;
    asio::async_write(socket_, asio::buffer(data),
        [&result](const asio::error_code& ec, size_t) { result = ec; });
    RunFor(timeout);

    if (result) {
        asio::error_code ec;
        socket_.close(ec);
        if (result == asio::error::would_block || result == asio::error::operation_aborted) {
            throw ConnectionError("send to " + socket_path_ + " timed out");
        }
        throw ConnectionError("send to " + socket_path_ + " failed: " + result.message());
    }

    last_used_ = Clock::now();
}

Message ClientConnection::ReceiveFrame(std::chrono::milliseconds timeout) {
    if (!IsOpen()) {
        throw ConnectionError("connection to " + socket_path_ + " is closed");
    }

    TimePoint deadline = Clock::now() + timeout;
    auto remaining = [deadline]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(1);
    };
    auto fail = [this](const asio::error_code& result, const char* what) {
        asio::error_code ec;
        socket_.close(ec);
        if (result == asio::error::would_block || result == asio::error::operation_aborted) {
            throw ConnectionError(std::string(what) + " from " + socket_path_ + " timed out");
        }
        throw ConnectionError(std::string(what) + " from " + socket_path_ + " failed: " +
                              result.message());
    };

    std::array<uint8_t, MessageHeader::SIZE> header_buffer;
    asio::error_code result = asio::error::would_block;
    asio::async_read(socket_, asio::buffer(header_buffer),
        [&result](const asio::error_code& ec, size_t) { result = ec; });
    RunFor(remaining());
    if (result) {
        fail(result, "receive header");
    }

    MessageHeader header = ParseHeader(header_buffer.data());
    if (!header.IsValid() || header.length > max_frame_bytes_) {
        Close(false);
        throw ProtocolError("invalid frame header from " + socket_path_);
    }

    Message message = Message::ForHeader(header);
    if (header.length > 0) {
        result = asio::error::would_block;
        asio::async_read(socket_, asio::buffer(message.GetPayload()),
            [&result](const asio::error_code& ec, size_t) { result = ec; });
        RunFor(remaining());
        if (result) {
            fail(result, "receive payload");
        }
    }

    last_used_ = Clock::now();
    return message;
}

bool ClientConnection::Ping(std::chrono::milliseconds timeout, Value* health) {
    try {
        SendFrame(Message(MessageType::PING), timeout);
        Message reply = ReceiveFrame(timeout);
        if (reply.GetType() != MessageType::PONG) {
            LOG_DEBUG("client", "Expected PONG, got " +
                      std::string(MessageTypeToString(reply.GetType())));
            Close(false);
            return false;
        }
        if (health) {
            *health = reply.GetPayload().empty() ? Value() : DecodeValue(reply.GetPayload());
        }
        return true;
    } catch (const ConnectionError& e) {
        LOG_DEBUG("client", std::string("Health check failed: ") + e.what());
        return false;
    } catch (const ProtocolError& e) {
        LOG_DEBUG("client", std::string("Health check failed: ") + e.what());
        Close(false);
        return false;
    }
}

} // namespace dbdriver
