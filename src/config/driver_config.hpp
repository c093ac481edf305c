//===----------------------------------------------------------------------===//
//                         DBDriver
//
// config/driver_config.hpp
//
// Driver process configuration
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "client/driver_client.hpp"
#include "engine/driver_engine.hpp"
#include "network/unix_server.hpp"
#include "server/rpc_server.hpp"

namespace dbdriver {

struct DriverConfig {
    // Endpoint
    std::string socket_path = DEFAULT_SOCKET_PATH;
    uint32_t max_connections = DEFAULT_MAX_CONNECTIONS;
    uint32_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES;

    // Database
    std::string database_path = ":memory:";
    std::string backup_dir;

    // Logging
    std::string log_file;
    std::string log_level = "info";

    // Process
    std::string pid_file;
    std::string config_file;

    // Threading
    uint32_t io_threads = DEFAULT_IO_THREADS;
    uint32_t worker_threads = DEFAULT_WORKER_THREADS;

    // Queue
    uint32_t queue_max_size = DEFAULT_QUEUE_MAX_SIZE;
    uint32_t request_timeout_ms = DEFAULT_REQUEST_TIMEOUT_MS;
    uint32_t poll_interval_ms = DEFAULT_POLL_INTERVAL_MS;

    // Read pool
    uint32_t pool_min_connections = 2;
    uint32_t pool_max_connections = 16;
    uint32_t pool_idle_timeout_seconds = 300;
    uint32_t pool_acquire_timeout_ms = 5000;

    // Transactions
    uint32_t transaction_idle_seconds = DEFAULT_TRANSACTION_IDLE_SECONDS;

    bool Validate(std::string& error) const;

    // Auto-detects the format by extension
    bool LoadFromFile(const std::string& path, std::string& error);
    bool LoadFromIni(const std::string& path, std::string& error);
    bool LoadFromYaml(const std::string& path, std::string& error);
    bool LoadFromYamlString(const std::string& text, std::string& error);

    // Component configs derived from these settings
    DriverEngine::Config GetEngineConfig() const;
    RpcServer::Config GetServerConfig() const;
    UnixServer::Config GetListenerConfig() const;
    DriverClient::Config GetClientConfig() const;
};

struct CommandLineOptions {
    bool show_help = false;
    bool show_version = false;
};

void PrintUsage(const char* program);

// Config file first (-c), then command line overrides.
// False with a message in error for unknown options or bad values.
bool ParseCommandLine(int argc, char* argv[], DriverConfig& config,
                      CommandLineOptions& options, std::string& error);

} // namespace dbdriver
