//===----------------------------------------------------------------------===//
//                         DBDriver
//
// client/client_pool.hpp
//
// Reusable client connections with a health check before reuse
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "client/client_connection.hpp"
#include <deque>

namespace dbdriver {

class ClientPool {
public:
    struct Config {
        std::string socket_path;
        size_t max_idle;
        std::chrono::milliseconds connect_timeout;
        std::chrono::milliseconds health_check_timeout;
        uint32_t max_frame_bytes;

        Config()
            : socket_path(DEFAULT_SOCKET_PATH)
            , max_idle(4)
            , connect_timeout(2000)
            , health_check_timeout(1000)
            , max_frame_bytes(DEFAULT_MAX_FRAME_BYTES) {}
    };

    struct Stats {
        size_t idle = 0;
        uint64_t created = 0;
        uint64_t reused = 0;
        uint64_t health_check_failures = 0;
        uint64_t discarded = 0;
    };

    explicit ClientPool(const Config& config = Config{});
    ~ClientPool();

    // Non-copyable
    ClientPool(const ClientPool&) = delete;
    ClientPool& operator=(const ClientPool&) = delete;

    // A healthy idle connection, or a new one.
    // Throws ConnectionError when a new connection cannot be made.
    std::unique_ptr<ClientConnection> Acquire();

    // Return a connection after a clean round trip
    void Release(std::unique_ptr<ClientConnection> conn);

    // Drop a connection whose state is unknown
    void Discard(std::unique_ptr<ClientConnection> conn);

    // Close every idle connection
    void Clear();

    Stats GetStats() const;
    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    std::deque<std::unique_ptr<ClientConnection>> idle_;
    mutable std::mutex mutex_;

    std::atomic<uint64_t> created_{0};
    std::atomic<uint64_t> reused_{0};
    std::atomic<uint64_t> health_check_failures_{0};
    std::atomic<uint64_t> discarded_{0};
};

} // namespace dbdriver
