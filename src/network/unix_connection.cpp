//===----------------------------------------------------------------------===//
//                         DBDriver
//
// network/unix_connection.cpp
//
// Framed connection implementation
//===----------------------------------------------------------------------===//

#include "network/unix_connection.hpp"
#include "network/unix_server.hpp"
#include "protocol/protocol_handler.hpp"
#include "logging/logger.hpp"

namespace dbdriver {

std::atomic<uint64_t> UnixConnection::next_connection_id_{1};

UnixConnection::UnixConnection(asio::io_context& io_context,
                               UnixServer& server,
                               std::shared_ptr<ProtocolHandler> handler,
                               uint32_t max_frame_bytes)
    : socket_(io_context)
    , server_(server)
    , handler_(std::move(handler))
    , max_frame_bytes_(max_frame_bytes)
    , connection_id_(next_connection_id_++) {}

UnixConnection::~UnixConnection() {
    asio::error_code ignored;
    socket_.close(ignored);
}

void UnixConnection::Start() {
    connected_ = true;
    DLOG_DEBUG("connection", "#{} open", connection_id_);
    ReadHeader();
}

void UnixConnection::Close() {
    if (!connected_.exchange(false)) {
        return;
    }
    DLOG_DEBUG("connection", "#{} closed after {} frames in, {} out",
               connection_id_, frames_in_.load(), frames_out_.load());

    asio::error_code ignored;
    socket_.shutdown(Socket::shutdown_both, ignored);
    socket_.close(ignored);
    server_.RemoveConnection(shared_from_this());
}

void UnixConnection::Enqueue(std::vector<uint8_t> frame, bool close_after) {
    if (!connected_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(outbox_mutex_);
        outbox_.push_back(std::move(frame));
        close_when_drained_ = close_when_drained_ || close_after;
    }
    asio::post(socket_.get_executor(), [self = shared_from_this()]() {
        if (!self->write_in_flight_) {
            self->WriteNext();
        }
    });
}

//===----------------------------------------------------------------------===//
// Read path
//===----------------------------------------------------------------------===//

void UnixConnection::ReadHeader() {
    if (!connected_) {
        return;
    }
    asio::async_read(socket_, asio::buffer(header_bytes_),
        [self = shared_from_this()](const asio::error_code& ec, size_t bytes) {
            self->OnHeader(ec, bytes);
        });
}

bool UnixConnection::ReadSucceeded(const asio::error_code& ec, size_t bytes, const char* stage) {
    if (!ec) {
        server_.AddBytesReceived(bytes);
        return true;
    }
    // eof is the peer hanging up between frames
    if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
        LOG_WARN("connection", "#" + std::to_string(connection_id_) + " " + stage +
                 " failed: " + ec.message());
    }
    Close();
    return false;
}

void UnixConnection::OnHeader(const asio::error_code& ec, size_t bytes) {
    if (!ReadSucceeded(ec, bytes, "header read")) {
        return;
    }

    MessageHeader header = ParseHeader(header_bytes_.data());
    if (header.magic != PROTOCOL_MAGIC) {
        RejectFrame(ErrorCode::PROTOCOL_ERROR, "bad frame magic");
        return;
    }
    if (header.version != PROTOCOL_VERSION) {
        RejectFrame(ErrorCode::VERSION_MISMATCH,
                    "unsupported protocol version " + std::to_string(header.version));
        return;
    }
    if (header.length > max_frame_bytes_) {
        RejectFrame(ErrorCode::FRAME_TOO_LARGE,
                    "frame of " + std::to_string(header.length) + " bytes exceeds limit of " +
                    std::to_string(max_frame_bytes_));
        return;
    }

    inbound_ = Message::ForHeader(header);
    if (header.length == 0) {
        Dispatch();
        return;
    }
    asio::async_read(socket_, asio::buffer(inbound_.GetPayload()),
        [self = shared_from_this()](const asio::error_code& read_ec, size_t read_bytes) {
            self->OnPayload(read_ec, read_bytes);
        });
}

void UnixConnection::OnPayload(const asio::error_code& ec, size_t bytes) {
    if (ReadSucceeded(ec, bytes, "payload read")) {
        Dispatch();
    }
}

void UnixConnection::Dispatch() {
    frames_in_++;
    LOG_TRACE("connection", "#" + std::to_string(connection_id_) + " <- " +
              MessageTypeToString(inbound_.GetType()));

    Message message = std::move(inbound_);
    inbound_ = Message();
    if (handler_) {
        handler_->HandleMessage(message, shared_from_this());
    }
    ReadHeader();
}

//===----------------------------------------------------------------------===//
// Write path
//===----------------------------------------------------------------------===//

void UnixConnection::WriteNext() {
    bool close_now = false;
    {
        std::lock_guard<std::mutex> lock(outbox_mutex_);
        if (outbox_.empty()) {
            write_in_flight_ = false;
            close_now = close_when_drained_;
        } else {
            in_flight_ = std::move(outbox_.front());
            outbox_.pop_front();
            write_in_flight_ = true;
        }
    }
    if (!write_in_flight_) {
        if (close_now) {
            Close();
        }
        return;
    }
    if (!connected_) {
        write_in_flight_ = false;
        return;
    }

    asio::async_write(socket_, asio::buffer(in_flight_),
        [self = shared_from_this()](const asio::error_code& ec, size_t bytes) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    LOG_WARN("connection", "#" + std::to_string(self->connection_id_) +
                             " write failed: " + ec.message());
                }
                self->write_in_flight_ = false;
                self->Close();
                return;
            }
            self->server_.AddBytesSent(bytes);
            self->frames_out_++;
            self->WriteNext();
        });
}

void UnixConnection::RejectFrame(ErrorCode code, const std::string& message) {
    LOG_WARN("connection", "#" + std::to_string(connection_id_) + " rejected frame: " + message);
    server_.AddRejectedFrame();

    ProtocolErrorPayload payload;
    payload.code = code;
    payload.message = message;
    SendAndClose(Message(MessageType::PROTOCOL_ERROR, payload.Serialize()));
}

} // namespace dbdriver
