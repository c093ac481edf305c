//===----------------------------------------------------------------------===//
//                         DBDriver
//
// config/driver_config.cpp
//
// Driver configuration loading and command line parsing
//===----------------------------------------------------------------------===//

#include "config/driver_config.hpp"
#include "config/settings_source.hpp"
#include "config/yaml_settings.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <iostream>
#include <limits>

namespace dbdriver {

namespace {

struct NumericSetting {
    const char* ini_key;
    const char* yaml_path;
    const char* option;
    uint32_t DriverConfig::*field;
};

struct StringSetting {
    const char* ini_key;
    const char* yaml_path;
    const char* option;
    std::string DriverConfig::*field;
};

const NumericSetting NUMERIC_SETTINGS[] = {
    {"max_connections",          "server.max_connections",            "--max-connections",   &DriverConfig::max_connections},
    {"max_frame_bytes",          "server.max_frame_bytes",            "--max-frame-bytes",   &DriverConfig::max_frame_bytes},
    {"io_threads",               "threads.io",                        "--io-threads",        &DriverConfig::io_threads},
    {"worker_threads",           "threads.workers",                   "--workers",           &DriverConfig::worker_threads},
    {"queue_max_size",           "queue.max_size",                    "--queue-size",        &DriverConfig::queue_max_size},
    {"request_timeout_ms",       "queue.default_timeout_ms",          "--timeout",           &DriverConfig::request_timeout_ms},
    {"poll_interval_ms",         "queue.poll_interval_ms",            "--poll-interval",     &DriverConfig::poll_interval_ms},
    {"pool_min",                 "pool.min",                          "--pool-min",          &DriverConfig::pool_min_connections},
    {"pool_max",                 "pool.max",                          "--pool-max",          &DriverConfig::pool_max_connections},
    {"pool_idle_timeout",        "pool.idle_timeout_seconds",         "--pool-idle-timeout", &DriverConfig::pool_idle_timeout_seconds},
    {"pool_acquire_timeout",     "pool.acquire_timeout_ms",           "--pool-acquire-timeout", &DriverConfig::pool_acquire_timeout_ms},
    {"transaction_idle_timeout", "transactions.idle_timeout_seconds", "--transaction-idle-timeout", &DriverConfig::transaction_idle_seconds},
};

const StringSetting STRING_SETTINGS[] = {
    {"socket_path", "server.socket_path",  "--socket",     &DriverConfig::socket_path},
    {"database",    "database.path",       "--database",   &DriverConfig::database_path},
    {"backup_dir",  "database.backup_dir", "--backup-dir", &DriverConfig::backup_dir},
    {"log_file",    "logging.file",        "--log-file",   &DriverConfig::log_file},
    {"log_level",   "logging.level",       "--log-level",  &DriverConfig::log_level},
    {"pid_file",    "process.pid_file",    "--pid-file",   &DriverConfig::pid_file},
};

bool ToUInt32(int64_t value, const std::string& name, uint32_t& out, std::string& error) {
    if (value < 0 || value > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        error = "'" + name + "' is out of range: " + std::to_string(value);
        return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
}

bool ParseUInt32(const std::string& text, const std::string& name, uint32_t& out, std::string& error) {
    size_t used = 0;
    int64_t value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != text.size()) {
        error = "'" + name + "' expects a number, got '" + text + "'";
        return false;
    }
    return ToUInt32(value, name, out, error);
}

// INI files may use the flat key or a [section] with the YAML path
bool ApplySettings(DriverConfig& config, const SettingsSource& source, bool flat_keys,
                   std::string& error) {
    auto key_for = [&](const char* flat, const char* dotted) -> const char* {
        if (flat_keys && source.Has(flat)) {
            return flat;
        }
        return source.Has(dotted) ? dotted : nullptr;
    };

    try {
        for (const auto& setting : STRING_SETTINGS) {
            if (const char* key = key_for(setting.ini_key, setting.yaml_path)) {
                config.*setting.field = source.GetString(key);
            }
        }
        for (const auto& setting : NUMERIC_SETTINGS) {
            if (const char* key = key_for(setting.ini_key, setting.yaml_path)) {
                if (!ToUInt32(source.GetInt(key), key, config.*setting.field, error)) {
                    return false;
                }
            }
        }
    } catch (const std::invalid_argument& e) {
        error = "Invalid config value: " + std::string(e.what());
        return false;
    }
    return true;
}

} // namespace

bool DriverConfig::Validate(std::string& error) const {
    if (socket_path.empty()) {
        error = "Socket path must not be empty";
        return false;
    }
    if (database_path.empty()) {
        error = "Database path must not be empty";
        return false;
    }
    if (worker_threads == 0) {
        error = "Worker threads must be greater than 0";
        return false;
    }
    if (io_threads == 0) {
        error = "IO threads must be greater than 0";
        return false;
    }
    if (queue_max_size == 0) {
        error = "Queue size must be greater than 0";
        return false;
    }
    if (request_timeout_ms == 0) {
        error = "Request timeout must be greater than 0";
        return false;
    }
    if (max_connections == 0) {
        error = "Max connections must be greater than 0";
        return false;
    }
    if (max_frame_bytes < 1024) {
        error = "Max frame size must be at least 1024 bytes";
        return false;
    }
    if (pool_max_connections == 0 || pool_min_connections > pool_max_connections) {
        error = "Pool bounds are invalid (min " + std::to_string(pool_min_connections) +
                ", max " + std::to_string(pool_max_connections) + ")";
        return false;
    }
    if (!Logger::IsValidLevel(log_level)) {
        error = "Unknown log level: " + log_level;
        return false;
    }
    return true;
}

bool DriverConfig::LoadFromFile(const std::string& path, std::string& error) {
    std::string ext;
    auto dot_pos = path.rfind('.');
    if (dot_pos != std::string::npos) {
        ext = path.substr(dot_pos);
        std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    }

    if (ext == ".yaml" || ext == ".yml") {
        return LoadFromYaml(path, error);
    }
    return LoadFromIni(path, error);
}

bool DriverConfig::LoadFromIni(const std::string& path, std::string& error) {
    IniSettings source;
    if (!source.Load(path)) {
        error = source.GetError();
        return false;
    }
    return ApplySettings(*this, source, true, error);
}

bool DriverConfig::LoadFromYaml(const std::string& path, std::string& error) {
    YamlSettings source;
    if (!source.Load(path)) {
        error = source.GetError();
        return false;
    }
    return ApplySettings(*this, source, false, error);
}

bool DriverConfig::LoadFromYamlString(const std::string& text, std::string& error) {
    YamlSettings source;
    if (!source.LoadString(text)) {
        error = source.GetError();
        return false;
    }
    return ApplySettings(*this, source, false, error);
}

DriverEngine::Config DriverConfig::GetEngineConfig() const {
    DriverEngine::Config config;
    config.database_path = database_path;
    config.backup_dir = backup_dir;
    config.pool.min_connections = pool_min_connections;
    config.pool.max_connections = pool_max_connections;
    config.pool.idle_timeout = std::chrono::seconds(pool_idle_timeout_seconds);
    config.pool.acquire_timeout = std::chrono::milliseconds(pool_acquire_timeout_ms);
    config.transactions.idle_timeout = std::chrono::seconds(transaction_idle_seconds);
    return config;
}

RpcServer::Config DriverConfig::GetServerConfig() const {
    RpcServer::Config config;
    config.worker_threads = worker_threads;
    config.queue.max_size = queue_max_size;
    config.queue.default_timeout = std::chrono::milliseconds(request_timeout_ms);
    config.poll_interval = std::chrono::milliseconds(poll_interval_ms);
    return config;
}

UnixServer::Config DriverConfig::GetListenerConfig() const {
    UnixServer::Config config;
    config.socket_path = socket_path;
    config.io_threads = io_threads;
    config.max_connections = max_connections;
    config.max_frame_bytes = max_frame_bytes;
    return config;
}

DriverClient::Config DriverConfig::GetClientConfig() const {
    DriverClient::Config config;
    config.socket_path = socket_path;
    config.timeout_ms = request_timeout_ms;
    config.max_frame_bytes = max_frame_bytes;
    return config;
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>            Config file path (.yaml/.yml or key=value)\n"
              << "  -s, --socket <path>            Socket path (default: " << DEFAULT_SOCKET_PATH << ")\n"
              << "  -d, --database <path>          Database path (default: :memory:)\n"
              << "  --backup-dir <path>            Default schema snapshot directory\n"
              << "  --pid-file <path>              PID file path\n"
              << "  --log-file <path>              Log file path\n"
              << "  --log-level <level>            Log level (trace, debug, info, warn, error)\n"
              << "  --io-threads <n>               IO thread count (default: " << DEFAULT_IO_THREADS << ")\n"
              << "  --workers <n>                  Worker thread count (default: " << DEFAULT_WORKER_THREADS << ")\n"
              << "  --queue-size <n>               Max queued requests (default: " << DEFAULT_QUEUE_MAX_SIZE << ")\n"
              << "  --timeout <ms>                 Default request timeout (default: " << DEFAULT_REQUEST_TIMEOUT_MS << ")\n"
              << "  --poll-interval <ms>           Dispatch poll interval (default: " << DEFAULT_POLL_INTERVAL_MS << ")\n"
              << "  --max-connections <n>          Max client connections (default: " << DEFAULT_MAX_CONNECTIONS << ")\n"
              << "  --max-frame-bytes <n>          Max frame payload (default: " << DEFAULT_MAX_FRAME_BYTES << ")\n"
              << "  --pool-min <n>                 Read pool minimum connections (default: 2)\n"
              << "  --pool-max <n>                 Read pool maximum connections (default: 16)\n"
              << "  --pool-idle-timeout <s>        Read pool idle timeout (default: 300)\n"
              << "  --pool-acquire-timeout <ms>    Read pool acquire timeout (default: 5000)\n"
              << "  --transaction-idle-timeout <s> Abandoned transaction timeout (default: "
              << DEFAULT_TRANSACTION_IDLE_SECONDS << ")\n"
              << "  --version                      Show version info\n"
              << "  -h, --help                     Show this help\n";
}

bool ParseCommandLine(int argc, char* argv[], DriverConfig& config,
                      CommandLineOptions& options, std::string& error) {
    std::string config_file_path;

    // First pass: look for config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file_path = argv[++i];
        }
    }

    if (!config_file_path.empty()) {
        if (!config.LoadFromFile(config_file_path, error)) {
            error = "Error loading config file " + config_file_path + ": " + error;
            return false;
        }
        config.config_file = config_file_path;
    }

    // Second pass: command line overrides config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--version") {
            options.show_version = true;
            continue;
        }
        if (arg == "-s") arg = "--socket";
        if (arg == "-d") arg = "--database";
        if (arg == "-c") arg = "--config";

        bool matched = false;
        bool needs_value = arg == "--config";
        for (const auto& setting : STRING_SETTINGS) {
            if (arg == setting.option) needs_value = true;
        }
        for (const auto& setting : NUMERIC_SETTINGS) {
            if (arg == setting.option) needs_value = true;
        }
        if (!needs_value) {
            error = "Unknown option: " + arg;
            return false;
        }
        if (i + 1 >= argc) {
            error = "Option " + arg + " requires a value";
            return false;
        }
        std::string value = argv[++i];

        if (arg == "--config") {
            continue;  // Already processed
        }
        for (const auto& setting : STRING_SETTINGS) {
            if (arg == setting.option) {
                config.*setting.field = value;
                matched = true;
            }
        }
        for (const auto& setting : NUMERIC_SETTINGS) {
            if (arg == setting.option) {
                if (!ParseUInt32(value, arg, config.*setting.field, error)) {
                    return false;
                }
                matched = true;
            }
        }
        if (!matched) {
            error = "Unknown option: " + arg;
            return false;
        }
    }

    return true;
}

} // namespace dbdriver
