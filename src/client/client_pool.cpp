//===----------------------------------------------------------------------===//
//                         DBDriver
//
// client/client_pool.cpp
//
// Client connection pool implementation
//===----------------------------------------------------------------------===//

#include "client/client_pool.hpp"
#include "logging/logger.hpp"

namespace dbdriver {

ClientPool::ClientPool(const Config& config)
    : config_(config) {
}

ClientPool::~ClientPool() {
    Clear();
}

std::unique_ptr<ClientConnection> ClientPool::Acquire() {
    while (true) {
        std::unique_ptr<ClientConnection> conn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (idle_.empty()) {
                break;
            }
            // Most recently used first
            conn = std::move(idle_.back());
            idle_.pop_back();
        }

        if (conn->Ping(config_.health_check_timeout)) {
            reused_++;
            return conn;
        }

        health_check_failures_++;
        LOG_DEBUG("client_pool", "Dropping idle connection that failed its health check");
        conn->Close(false);
    }

    auto conn = std::make_unique<ClientConnection>(config_.socket_path, config_.max_frame_bytes);
    conn->Connect(config_.connect_timeout);
    created_++;
    return conn;
}

void ClientPool::Release(std::unique_ptr<ClientConnection> conn) {
    if (!conn) {
        return;
    }
    if (!conn->IsOpen()) {
        discarded_++;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (idle_.size() >= config_.max_idle) {
        conn->Close(true);
        return;
    }
    idle_.push_back(std::move(conn));
}

void ClientPool::Discard(std::unique_ptr<ClientConnection> conn) {
    if (!conn) {
        return;
    }
    discarded_++;
    conn->Close(false);
}

void ClientPool::Clear() {
    std::deque<std::unique_ptr<ClientConnection>> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle.swap(idle_);
    }
    for (auto& conn : idle) {
        conn->Close(true);
    }
}

ClientPool::Stats ClientPool::GetStats() const {
    Stats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.idle = idle_.size();
    }
    stats.created = created_;
    stats.reused = reused_;
    stats.health_check_failures = health_check_failures_;
    stats.discarded = discarded_;
    return stats;
}

} // namespace dbdriver
