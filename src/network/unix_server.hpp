//===----------------------------------------------------------------------===//
//                         DBDriver
//
// network/unix_server.hpp
//
// Local stream socket listener
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "network/io_context_pool.hpp"
#include "network/unix_connection.hpp"
#include <asio.hpp>
#include <parallel_hashmap/phmap.h>

namespace dbdriver {


class UnixServer {
public:
    struct Config {
        std::string socket_path = DEFAULT_SOCKET_PATH;
        size_t io_threads = DEFAULT_IO_THREADS;
        size_t max_connections = DEFAULT_MAX_CONNECTIONS;
        uint32_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES;
    };

    struct Stats {
        size_t active = 0;
        uint64_t accepted = 0;
        uint64_t refused = 0;          // over max_connections
        uint64_t rejected_frames = 0;  // bad magic, version or size
        uint64_t bytes_received = 0;
        uint64_t bytes_sent = 0;
    };

    UnixServer(const Config& config, RpcServer& rpc_server);
    ~UnixServer();

    // Non-copyable
    UnixServer(const UnixServer&) = delete;
    UnixServer& operator=(const UnixServer&) = delete;

    // Bind the socket path. A stale socket file is replaced; a live one
    // (another process still accepting) is an error.
    void Start();

    // Close every connection and unlink the socket file
    void Stop();

    bool IsRunning() const { return running_; }
    const Config& GetConfig() const { return config_; }

    void RemoveConnection(const UnixConnection::Ptr& conn);
    size_t GetConnectionCount() const;
    Stats GetStats() const;

    // Called by connections
    void AddBytesReceived(uint64_t bytes) { bytes_received_ += bytes; }
    void AddBytesSent(uint64_t bytes) { bytes_sent_ += bytes; }
    void AddRejectedFrame() { rejected_frames_++; }

private:
    void ClaimSocketPath();
    void AcceptNext();
    void OnAccepted(const asio::error_code& ec, const UnixConnection::Ptr& conn);

    Config config_;
    IoContextPool io_pool_;

    // The acceptor has its own context and thread
    asio::io_context accept_context_;
    asio::local::stream_protocol::acceptor acceptor_;
    std::thread accept_thread_;

    std::shared_ptr<ProtocolHandler> handler_;

    mutable std::mutex connections_mutex_;
    phmap::flat_hash_set<UnixConnection::Ptr> connections_;

    std::atomic<bool> running_{false};

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> refused_{0};
    std::atomic<uint64_t> rejected_frames_{0};
    std::atomic<uint64_t> bytes_received_{0};
    std::atomic<uint64_t> bytes_sent_{0};
};

} // namespace dbdriver
