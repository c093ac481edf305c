//===----------------------------------------------------------------------===//
//                         DBDriver
//
// programs/server/main.cpp
//
// dbdriverd entry point
//===----------------------------------------------------------------------===//

#include "common.hpp"
#include "config/driver_config.hpp"
#include "engine/driver_engine.hpp"
#include "network/unix_server.hpp"
#include "server/method_table.hpp"
#include "server/rpc_server.hpp"
#include "logging/logger.hpp"
#include "version.hpp"

#include <csignal>
#include <cstring>
#include <cerrno>
#include <execinfo.h>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

using namespace dbdriver;

static std::string g_pid_file;
static DriverConfig g_config;

//===----------------------------------------------------------------------===//
// Version Info
//===----------------------------------------------------------------------===//
void PrintVersion() {
    std::cout << "DBDriver " << DBDRIVER_VERSION << "\n"
              << "Git commit: " << DBDRIVER_GIT_COMMIT << "\n"
              << "Build type: " << DBDRIVER_BUILD_TYPE << "\n"
              << "Build time: " << DBDRIVER_BUILD_TIME << "\n";
}

//===----------------------------------------------------------------------===//
// PID File
//===----------------------------------------------------------------------===//
// Removes the file on scope exit. The crash handler removes it by path.
class PidFileGuard {
public:
    PidFileGuard() = default;
    ~PidFileGuard() { Release(); }

    // Non-copyable
    PidFileGuard(const PidFileGuard&) = delete;
    PidFileGuard& operator=(const PidFileGuard&) = delete;

    void Acquire(const std::string& path) {
        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write PID file " + path + ": " + std::strerror(errno));
        }
        out << getpid() << '\n';
        g_pid_file = path;
    }

    void Release() {
        if (!g_pid_file.empty()) {
            ::unlink(g_pid_file.c_str());
            g_pid_file.clear();
        }
    }
};

//===----------------------------------------------------------------------===//
// Crash Handler
//===----------------------------------------------------------------------===//
// Only async-signal-safe calls here: raw symbols go straight to stderr.
void CrashHandler(int signal) {
    static const char banner[] = "\n*** dbdriverd crashed, backtrace follows ***\n";
    ssize_t ignored = ::write(STDERR_FILENO, banner, sizeof(banner) - 1);
    (void)ignored;

    void* frames[64];
    int depth = backtrace(frames, 64);
    backtrace_symbols_fd(frames, depth, STDERR_FILENO);

    if (!g_pid_file.empty()) {
        ::unlink(g_pid_file.c_str());
    }

    std::signal(signal, SIG_DFL);
    raise(signal);
}

// SIGHUP: only the log level is applied at runtime
void ReloadLogLevel() {
    if (g_config.config_file.empty()) {
        LOG_WARN("main", "No config file specified, cannot reload");
        return;
    }

    LOG_INFO("main", "Reloading configuration from: " + g_config.config_file);

    DriverConfig new_config;
    std::string error;
    if (!new_config.LoadFromFile(g_config.config_file, error)) {
        LOG_ERROR("main", "Failed to reload config: " + error);
        return;
    }
    if (!Logger::IsValidLevel(new_config.log_level)) {
        LOG_ERROR("main", "Ignoring unknown log level: " + new_config.log_level);
        return;
    }

    if (new_config.log_level != g_config.log_level) {
        Logger::SetLevel(new_config.log_level);
        g_config.log_level = new_config.log_level;
        LOG_INFO("main", "Log level changed to: " + new_config.log_level);
    }
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//
int main(int argc, char* argv[]) {
    try {
        CommandLineOptions options;
        std::string error;
        if (!ParseCommandLine(argc, argv, g_config, options, error)) {
            std::cerr << error << "\n\n";
            PrintUsage(argv[0]);
            return 1;
        }
        if (options.show_help) {
            PrintUsage(argv[0]);
            return 0;
        }
        if (options.show_version) {
            PrintVersion();
            return 0;
        }

        if (!g_config.Validate(error)) {
            std::cerr << "Configuration error: " << error << std::endl;
            return 1;
        }

        LogOptions log_options;
        log_options.file = g_config.log_file;
        log_options.level = g_config.log_level;
        Logger::Initialize(log_options);

        PidFileGuard pid_file;
        if (!g_config.pid_file.empty()) {
            pid_file.Acquire(g_config.pid_file);
        }

        // Block SIGINT/SIGTERM/SIGHUP so they are handled synchronously via
        // sigwait() in the main loop. Threads created after this inherit the mask.
        sigset_t signal_mask;
        sigemptyset(&signal_mask);
        sigaddset(&signal_mask, SIGINT);
        sigaddset(&signal_mask, SIGTERM);
        sigaddset(&signal_mask, SIGHUP);
        pthread_sigmask(SIG_BLOCK, &signal_mask, nullptr);

        std::signal(SIGPIPE, SIG_IGN);

        for (int fatal : {SIGSEGV, SIGABRT, SIGFPE, SIGBUS}) {
            std::signal(fatal, CrashHandler);
        }

        LOG_INFO("main", "Starting DBDriver " + std::string(DBDRIVER_VERSION));
        LOG_INFO("main", "socket=" + g_config.socket_path + " database=" + g_config.database_path);
        LOG_INFO("main", "io_threads=" + std::to_string(g_config.io_threads) +
                 " workers=" + std::to_string(g_config.worker_threads) +
                 " queue=" + std::to_string(g_config.queue_max_size) +
                 " timeout_ms=" + std::to_string(g_config.request_timeout_ms) +
                 " pool=" + std::to_string(g_config.pool_min_connections) + ".." +
                 std::to_string(g_config.pool_max_connections));

        DriverEngine engine(g_config.GetEngineConfig());

        RpcServer rpc_server(MethodTable::ForEngine(engine), g_config.GetServerConfig());
        rpc_server.Start();

        UnixServer listener(g_config.GetListenerConfig(), rpc_server);
        listener.Start();

        LOG_INFO("main", "DBDriver is ready to accept connections");

        int sig;
        while (sigwait(&signal_mask, &sig) == 0) {
            if (sig == SIGHUP) {
                LOG_INFO("main", "Reload signal received");
                ReloadLogLevel();
            } else {
                LOG_INFO("main", "Shutdown signal received");
                break;
            }
        }

        LOG_INFO("main", "Shutting down...");

        // Stop taking frames, then fail what is still queued, then close the database
        listener.Stop();
        rpc_server.Stop();
        engine.Shutdown();
        pid_file.Release();

        LOG_INFO("main", "DBDriver stopped");
        Logger::Shutdown();

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        LOG_FATAL("main", std::string("Fatal error: ") + e.what());
        if (!g_pid_file.empty()) {
            ::unlink(g_pid_file.c_str());
        }
        return 1;
    }
}
