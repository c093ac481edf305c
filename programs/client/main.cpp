//===----------------------------------------------------------------------===//
//                         DBDriver CLI
//
// programs/client/main.cpp
//
// Command line client for the driver socket.
//
// Usage:
//   dbdriver-cli [--socket PATH] [--timeout MS]                 -- interactive shell
//   dbdriver-cli [--socket PATH] METHOD ['{yaml params}']       -- one request
//
// Shell input is "METHOD {yaml params}", for example:
//   select {table_name: users, where: {active: true}, limit: 10}
// Results are printed as YAML.
//===----------------------------------------------------------------------===//

#include "client/driver_client.hpp"
#include "protocol/errors.hpp"
#include "protocol/value_yaml.hpp"
#include "logging/logger.hpp"
#include "version.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>

#include <readline/readline.h>
#include <readline/history.h>

using namespace dbdriver;

static std::string Trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\n\r");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\n\r");
    return s.substr(b, e - b + 1);
}

static void PrintUsage(const char* program) {
    std::cout <<
        "Usage: " << program << " [options] [METHOD [PARAMS_YAML]]\n"
        "\n"
        "  -s, --socket PATH    Driver socket (default: " << DEFAULT_SOCKET_PATH << ")\n"
        "  -t, --timeout MS     Request timeout in milliseconds\n"
        "  --priority LEVEL     low, normal, high or urgent (default: normal)\n"
        "  --log-level LEVEL    Client log level (default: warn)\n"
        "  --version            Show version info\n"
        "  -h, --help           Show this help\n"
        "\n"
        "Without METHOD an interactive shell starts.\n";
}

static void PrintHelp(const DriverClient& client) {
    std::cout <<
        "\nDBDriver CLI, connected to " << client.GetConfig().socket_path << "\n"
        "\nMeta commands:\n"
        "  .help           Show this message\n"
        "  .ping           Show server health\n"
        "  .stats          Show client statistics\n"
        "  .quit / .exit   Exit the shell\n"
        "\nRequests:\n"
        "  METHOD {yaml params}\n"
        "  e.g. select {table_name: users, where: {id: 1}}\n"
        "       execute {sql: 'SELECT 42 AS answer'}\n"
        "       begin_transaction\n\n";
}

static void PrintResult(const Result& result) {
    if (result.IsError()) {
        std::cerr << "Error " << ErrorCodeToString(result.GetErrorCode())
                  << ": " << result.GetErrorMessage() << "\n";
        return;
    }
    if (result.IsRows()) {
        const auto& records = result.GetRecords();
        if (!records.empty()) {
            std::cout << FormatYamlValue(Value(records)) << "\n";
        }
        std::cout << "(" << records.size() << " row" << (records.size() != 1 ? "s" : "") << ")\n";
        return;
    }
    std::cout << FormatYamlValue(result.GetData()) << "\n";
}

// Returns false when the request could not be completed
static bool RunRequest(DriverClient& client, const std::string& method,
                       const std::string& params_text, Priority priority) {
    try {
        Value params;
        if (!Trim(params_text).empty()) {
            params = ParseYamlValue(params_text);
            if (!params.IsMap() && !params.IsNull()) {
                std::cerr << "Params must be a YAML mapping\n";
                return false;
            }
        }
        Result result = client.Call(method, std::move(params), priority);
        PrintResult(result);
        return !result.IsError();
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
    } catch (const ProtocolError& e) {
        std::cerr << "Protocol error " << ErrorCodeToString(e.GetCode()) << ": " << e.what() << "\n";
    } catch (const ConnectionError& e) {
        std::cerr << "Connection error: " << e.what() << "\n";
    }
    return false;
}

static void RunShell(DriverClient& client, Priority priority) {
    std::cout << "DBDriver CLI " << DBDRIVER_VERSION << ", socket " << client.GetConfig().socket_path
              << "\nEnter METHOD {params}  |  .help for tips  |  .quit to exit\n\n";

    using_history();

    while (true) {
        char* raw = readline("dbdriver> ");
        if (!raw) {
            std::cout << "\nBye!\n";
            break;
        }

        std::string line = Trim(raw);
        free(raw);

        if (line.empty()) continue;
        add_history(line.c_str());

        std::string low = line;
        std::transform(low.begin(), low.end(), low.begin(), ::tolower);

        if (low == ".quit" || low == ".exit" || low == ".q") {
            std::cout << "Bye!\n";
            break;
        }
        if (low == ".help" || low == ".h") {
            PrintHelp(client);
            continue;
        }
        if (low == ".ping") {
            try {
                std::cout << FormatYamlValue(client.Ping()) << "\n";
            } catch (const ConnectionError& e) {
                std::cerr << "Connection error: " << e.what() << "\n";
            }
            continue;
        }
        if (low == ".stats") {
            auto stats = client.GetStats();
            std::cout << "calls: " << stats.calls << "\n"
                      << "retries: " << stats.retries << "\n"
                      << "connection_failures: " << stats.connection_failures << "\n"
                      << "pool_created: " << stats.pool.created << "\n"
                      << "pool_reused: " << stats.pool.reused << "\n"
                      << "pool_idle: " << stats.pool.idle << "\n";
            continue;
        }
        if (line[0] == '.') {
            std::cerr << "Unknown command: " << line << " (try .help)\n";
            continue;
        }

        auto space = line.find_first_of(" \t");
        std::string method = line.substr(0, space);
        std::string params = space == std::string::npos ? "" : line.substr(space + 1);
        RunRequest(client, method, params, priority);
    }
}

int main(int argc, char* argv[]) {
    DriverClient::Config config;
    std::string log_level = "warn";
    Priority priority = Priority::NORMAL;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            std::cout << "dbdriver-cli " << DBDRIVER_VERSION << " (" << DBDRIVER_GIT_COMMIT << ")\n";
            return 0;
        } else if ((arg == "-s" || arg == "--socket") && i + 1 < argc) {
            config.socket_path = argv[++i];
        } else if ((arg == "-t" || arg == "--timeout") && i + 1 < argc) {
            char* end = nullptr;
            unsigned long timeout = std::strtoul(argv[++i], &end, 10);
            if (!end || *end != '\0' || timeout == 0) {
                std::cerr << "Invalid timeout: " << argv[i] << "\n";
                return 1;
            }
            config.timeout_ms = static_cast<uint32_t>(timeout);
        } else if (arg == "--priority" && i + 1 < argc) {
            if (!ParsePriority(argv[++i], priority)) {
                std::cerr << "Invalid priority: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            PrintUsage(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (!Logger::IsValidLevel(log_level)) {
        std::cerr << "Invalid log level: " << log_level << "\n";
        return 1;
    }
    Logger::Initialize("", log_level);

    DriverClient client(config);

    if (!positional.empty()) {
        std::string params;
        for (size_t i = 1; i < positional.size(); i++) {
            if (i > 1) params += " ";
            params += positional[i];
        }
        return RunRequest(client, positional[0], params, priority) ? 0 : 1;
    }

    RunShell(client, priority);
    return 0;
}
