//===----------------------------------------------------------------------===//
//                         DBDriver
//
// network/unix_server.cpp
//
// Local stream socket listener implementation
//===----------------------------------------------------------------------===//

#include "network/unix_server.hpp"
#include "protocol/protocol_handler.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <pthread.h>
#include <stdexcept>

namespace dbdriver {

namespace fs = std::filesystem;

UnixServer::UnixServer(const Config& config, RpcServer& rpc_server)
    : config_(config)
    , io_pool_(config.io_threads)
    , acceptor_(accept_context_)
    , handler_(std::make_shared<ProtocolHandler>(rpc_server)) {}

UnixServer::~UnixServer() {
    Stop();
}

void UnixServer::ClaimSocketPath() {
    const std::string& path = config_.socket_path;
    std::error_code fs_ec;
    auto status = fs::symlink_status(path, fs_ec);
    if (fs_ec || status.type() == fs::file_type::not_found) {
        return;
    }
    if (status.type() != fs::file_type::socket) {
        throw std::runtime_error("socket path exists and is not a socket: " + path);
    }

    // A successful connect means another server owns the path
    asio::io_context probe_context;
    asio::local::stream_protocol::socket probe(probe_context);
    asio::error_code ec;
    probe.connect(asio::local::stream_protocol::endpoint(path), ec);
    if (!ec) {
        probe.close(ec);
        throw std::runtime_error("another server is listening on " + path);
    }

    LOG_INFO("server", "Replacing stale socket " + path);
    if (!fs::remove(path, fs_ec) && fs_ec) {
        throw std::runtime_error("cannot remove stale socket " + path + ": " + fs_ec.message());
    }
}

void UnixServer::Start() {
    if (running_) {
        return;
    }
    ClaimSocketPath();

    asio::local::stream_protocol::endpoint endpoint(config_.socket_path);
    acceptor_.open(endpoint.protocol());
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);

    std::error_code fs_ec;
    fs::permissions(config_.socket_path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, fs_ec);
    if (fs_ec) {
        LOG_WARN("server", "Cannot restrict permissions on " + config_.socket_path + ": " +
                 fs_ec.message());
    }

    running_ = true;
    io_pool_.Start();
    AcceptNext();
    accept_thread_ = std::thread([this]() {
        pthread_setname_np(pthread_self(), "dbdriver-accept");
        accept_context_.run();
    });

    LOG_INFO("server", "Listening on " + config_.socket_path + " (" +
             std::to_string(config_.io_threads) + " io threads)");
}

void UnixServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    asio::error_code ignored;
    acceptor_.close(ignored);
    accept_context_.stop();
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    // Close() calls back into RemoveConnection
    phmap::flat_hash_set<UnixConnection::Ptr> open;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        open.swap(connections_);
    }
    for (const auto& conn : open) {
        conn->Close();
    }
    io_pool_.Stop();

    std::error_code fs_ec;
    fs::remove(config_.socket_path, fs_ec);

    auto stats = GetStats();
    LOG_INFO("server", "Closed " + config_.socket_path + " after " +
             std::to_string(stats.accepted) + " connections (" +
             std::to_string(stats.refused) + " refused, " +
             std::to_string(stats.rejected_frames) + " bad frames, " +
             std::to_string(io_pool_.GetHandlerFailures()) + " handler failures)");
}

void UnixServer::RemoveConnection(const UnixConnection::Ptr& conn) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(conn);
}

size_t UnixServer::GetConnectionCount() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

UnixServer::Stats UnixServer::GetStats() const {
    Stats stats;
    stats.active = GetConnectionCount();
    stats.accepted = accepted_;
    stats.refused = refused_;
    stats.rejected_frames = rejected_frames_;
    stats.bytes_received = bytes_received_;
    stats.bytes_sent = bytes_sent_;
    return stats;
}

void UnixServer::AcceptNext() {
    if (!running_) {
        return;
    }
    auto conn = std::make_shared<UnixConnection>(io_pool_.Next(), *this, handler_,
                                                 config_.max_frame_bytes);
    acceptor_.async_accept(conn->GetSocket(), [this, conn](const asio::error_code& ec) {
        OnAccepted(ec, conn);
    });
}

void UnixServer::OnAccepted(const asio::error_code& ec, const UnixConnection::Ptr& conn) {
    if (ec) {
        if (running_) {
            LOG_WARN("server", "Accept failed: " + ec.message());
            AcceptNext();
        }
        return;
    }

    bool admitted = false;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        if (connections_.size() < config_.max_connections) {
            connections_.insert(conn);
            admitted = true;
        }
    }
    if (admitted) {
        accepted_++;
        conn->Start();
    } else {
        refused_++;
        LOG_WARN("server", "Refusing connection, limit of " +
                 std::to_string(config_.max_connections) + " reached");
        asio::error_code ignored;
        conn->GetSocket().close(ignored);
    }
    AcceptNext();
}

} // namespace dbdriver
