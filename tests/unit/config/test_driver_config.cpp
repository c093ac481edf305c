//===----------------------------------------------------------------------===//
//                         DBDriver - Unit Tests
//
// tests/unit/config/test_driver_config.cpp
//
// Unit tests for DriverConfig
//===----------------------------------------------------------------------===//

#include "config/driver_config.hpp"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>

using namespace dbdriver;

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

static std::string WriteTempFile(const std::string& content, const std::string& suffix) {
    std::string path = "/tmp/dbdriver_test_config" + suffix;
    std::ofstream f(path);
    f << content;
    f.close();
    return path;
}

static void CleanupFile(const std::string& path) {
    std::remove(path.c_str());
}

static bool Parse(std::vector<std::string> args, DriverConfig& config,
                  CommandLineOptions& options, std::string& error) {
    args.insert(args.begin(), "dbdriverd");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);
    return ParseCommandLine(static_cast<int>(args.size()), argv.data(), config, options, error);
}

//===----------------------------------------------------------------------===//
// Defaults and Validation
//===----------------------------------------------------------------------===//

void TestDefaultValues() {
    std::cout << "  Testing default values..." << std::endl;

    DriverConfig config;
    assert(config.socket_path == DEFAULT_SOCKET_PATH);
    assert(config.database_path == ":memory:");
    assert(config.worker_threads == DEFAULT_WORKER_THREADS);
    assert(config.queue_max_size == DEFAULT_QUEUE_MAX_SIZE);
    assert(config.request_timeout_ms == DEFAULT_REQUEST_TIMEOUT_MS);
    assert(config.poll_interval_ms == DEFAULT_POLL_INTERVAL_MS);
    assert(config.max_frame_bytes == DEFAULT_MAX_FRAME_BYTES);
    assert(config.transaction_idle_seconds == DEFAULT_TRANSACTION_IDLE_SECONDS);
    assert(config.log_level == "info");

    std::string error;
    assert(config.Validate(error));

    std::cout << "    PASSED" << std::endl;
}

void TestValidationFailures() {
    std::cout << "  Testing validation failures..." << std::endl;

    std::string error;

    DriverConfig no_workers;
    no_workers.worker_threads = 0;
    assert(!no_workers.Validate(error));
    assert(error.find("Worker") != std::string::npos);

    DriverConfig tiny_frames;
    tiny_frames.max_frame_bytes = 100;
    assert(!tiny_frames.Validate(error));

    DriverConfig inverted_pool;
    inverted_pool.pool_min_connections = 8;
    inverted_pool.pool_max_connections = 4;
    assert(!inverted_pool.Validate(error));
    assert(error.find("Pool") != std::string::npos);

    DriverConfig bad_level;
    bad_level.log_level = "chatty";
    assert(!bad_level.Validate(error));

    DriverConfig empty_socket;
    empty_socket.socket_path.clear();
    assert(!empty_socket.Validate(error));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// File Loading
//===----------------------------------------------------------------------===//

void TestLoadYaml() {
    std::cout << "  Testing YAML config..." << std::endl;

    std::string path = WriteTempFile(
        "server:\n"
        "  socket_path: /tmp/yaml.sock\n"
        "  max_frame_bytes: 65536\n"
        "database:\n"
        "  path: /var/lib/app/main.db\n"
        "  backup_dir: /var/lib/app/snapshots\n"
        "threads:\n"
        "  workers: 6\n"
        "queue:\n"
        "  max_size: 250\n"
        "  default_timeout_ms: 1200\n"
        "pool:\n"
        "  min: 1\n"
        "  max: 3\n"
        "transactions:\n"
        "  idle_timeout_seconds: 45\n"
        "logging:\n"
        "  level: debug\n", ".yaml");

    DriverConfig config;
    std::string error;
    assert(config.LoadFromFile(path, error));
    assert(config.socket_path == "/tmp/yaml.sock");
    assert(config.max_frame_bytes == 65536);
    assert(config.database_path == "/var/lib/app/main.db");
    assert(config.backup_dir == "/var/lib/app/snapshots");
    assert(config.worker_threads == 6);
    assert(config.queue_max_size == 250);
    assert(config.request_timeout_ms == 1200);
    assert(config.pool_min_connections == 1);
    assert(config.pool_max_connections == 3);
    assert(config.transaction_idle_seconds == 45);
    assert(config.log_level == "debug");
    // Untouched settings keep their defaults
    assert(config.io_threads == DEFAULT_IO_THREADS);

    CleanupFile(path);
    std::cout << "    PASSED" << std::endl;
}

void TestLoadIni() {
    std::cout << "  Testing key=value config..." << std::endl;

    std::string path = WriteTempFile(
        "# driver settings\n"
        "socket_path = \"/tmp/ini.sock\"\n"
        "database = /data/app.db\n"
        "worker_threads = 3\n"
        "poll_interval_ms = 5\n"
        "transaction_idle_timeout = 90\n", ".conf");

    DriverConfig config;
    std::string error;
    assert(config.LoadFromFile(path, error));
    assert(config.socket_path == "/tmp/ini.sock");
    assert(config.database_path == "/data/app.db");
    assert(config.worker_threads == 3);
    assert(config.poll_interval_ms == 5);
    assert(config.transaction_idle_seconds == 90);
    CleanupFile(path);

    // Sections map onto the dotted names
    path = WriteTempFile(
        "; sectioned form\n"
        "[pool]\n"
        "min = 2\n"
        "max = 6\n"
        "[logging]\n"
        "level = 'debug'\n", ".ini");
    DriverConfig sectioned;
    assert(sectioned.LoadFromFile(path, error));
    assert(sectioned.pool_min_connections == 2);
    assert(sectioned.pool_max_connections == 6);
    assert(sectioned.log_level == "debug");
    CleanupFile(path);

    path = WriteTempFile("[pool\nmin = 1\n", ".ini");
    DriverConfig broken;
    assert(!broken.LoadFromFile(path, error));
    assert(error.find(":1:") != std::string::npos);
    CleanupFile(path);

    std::cout << "    PASSED" << std::endl;
}

void TestBadValuesRejected() {
    std::cout << "  Testing bad config values..." << std::endl;

    std::string error;

    DriverConfig negative;
    assert(!negative.LoadFromYamlString("pool:\n  min: -1\n", error));
    assert(error.find("pool.min") != std::string::npos);

    DriverConfig not_a_number;
    assert(!not_a_number.LoadFromYamlString("threads:\n  workers: lots\n", error));

    std::string path = WriteTempFile("queue_max_size = many\n", ".conf");
    DriverConfig ini;
    assert(!ini.LoadFromFile(path, error));
    assert(error.find("queue_max_size") != std::string::npos);
    CleanupFile(path);

    DriverConfig missing;
    assert(!missing.LoadFromFile("/tmp/dbdriver_no_such_config.yaml", error));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Command Line
//===----------------------------------------------------------------------===//

void TestCommandLineOverrides() {
    std::cout << "  Testing command line overrides config file..." << std::endl;

    std::string path = WriteTempFile(
        "server:\n"
        "  socket_path: /tmp/from-file.sock\n"
        "threads:\n"
        "  workers: 2\n", ".yml");

    DriverConfig config;
    CommandLineOptions options;
    std::string error;
    assert(Parse({"-s", "/tmp/from-cli.sock", "-c", path, "--queue-size", "42",
                  "--log-level", "warn"}, config, options, error));

    assert(config.socket_path == "/tmp/from-cli.sock");
    assert(config.worker_threads == 2);
    assert(config.queue_max_size == 42);
    assert(config.log_level == "warn");
    assert(config.config_file == path);
    assert(!options.show_help);

    CleanupFile(path);
    std::cout << "    PASSED" << std::endl;
}

void TestCommandLineErrors() {
    std::cout << "  Testing command line errors..." << std::endl;

    DriverConfig config;
    CommandLineOptions options;
    std::string error;

    assert(!Parse({"--frobnicate"}, config, options, error));
    assert(error.find("Unknown option") != std::string::npos);

    assert(!Parse({"--workers", "four"}, config, options, error));
    assert(!Parse({"--timeout", "-5"}, config, options, error));
    assert(!Parse({"--database"}, config, options, error));
    assert(error.find("requires a value") != std::string::npos);

    CommandLineOptions flags;
    assert(Parse({"--version", "-h"}, config, flags, error));
    assert(flags.show_version);
    assert(flags.show_help);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Derived Component Configs
//===----------------------------------------------------------------------===//

void TestDerivedConfigs() {
    std::cout << "  Testing derived component configs..." << std::endl;

    DriverConfig config;
    config.socket_path = "/tmp/derived.sock";
    config.worker_threads = 7;
    config.queue_max_size = 12;
    config.request_timeout_ms = 800;
    config.poll_interval_ms = 3;
    config.pool_max_connections = 5;
    config.pool_acquire_timeout_ms = 250;
    config.transaction_idle_seconds = 30;
    config.max_frame_bytes = 4096;

    auto server = config.GetServerConfig();
    assert(server.worker_threads == 7);
    assert(server.queue.max_size == 12);
    assert(server.queue.default_timeout == std::chrono::milliseconds(800));
    assert(server.poll_interval == std::chrono::milliseconds(3));

    auto engine = config.GetEngineConfig();
    assert(engine.database_path == ":memory:");
    assert(engine.pool.max_connections == 5);
    assert(engine.pool.acquire_timeout == std::chrono::milliseconds(250));
    assert(engine.transactions.idle_timeout == std::chrono::seconds(30));

    auto listener = config.GetListenerConfig();
    assert(listener.socket_path == "/tmp/derived.sock");
    assert(listener.max_frame_bytes == 4096);

    auto client = config.GetClientConfig();
    assert(client.socket_path == "/tmp/derived.sock");
    assert(client.timeout_ms == 800);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== DriverConfig Unit Tests ===" << std::endl;

    std::cout << "\n1. Defaults and Validation:" << std::endl;
    TestDefaultValues();
    TestValidationFailures();

    std::cout << "\n2. File Loading:" << std::endl;
    TestLoadYaml();
    TestLoadIni();
    TestBadValuesRejected();

    std::cout << "\n3. Command Line:" << std::endl;
    TestCommandLineOverrides();
    TestCommandLineErrors();

    std::cout << "\n4. Derived Configs:" << std::endl;
    TestDerivedConfigs();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
