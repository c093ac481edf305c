//===----------------------------------------------------------------------===//
//                         DBDriver
//
// logging/logger.cpp
//
// Sink setup and level handling
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

namespace dbdriver {

namespace {

const char* const kConsolePattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
const char* const kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

const std::pair<const char*, spdlog::level::level_enum> kLevelNames[] = {
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"fatal", spdlog::level::critical},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
};

} // namespace

std::shared_ptr<spdlog::logger> Logger::logger_;
bool Logger::initialized_ = false;

void Logger::Initialize(const LogOptions& options) {
    if (initialized_) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;
    // stdout may belong to the supervising process
    if (options.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        sinks.back()->set_pattern(kConsolePattern);
    }
    if (!options.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            options.file, options.max_file_bytes, options.max_files));
        sinks.back()->set_pattern(kFilePattern);
    }

    auto logger = std::make_shared<spdlog::logger>("dbdriver", sinks.begin(), sinks.end());
    logger->set_level(ToSpdlogLevel(options.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    logger_ = std::move(logger);
    initialized_ = true;
}

void Logger::Initialize(const std::string& log_file, const std::string& log_level) {
    LogOptions options;
    options.file = log_file;
    options.level = log_level;
    Initialize(options);
}

void Logger::Shutdown() {
    Flush();
    spdlog::shutdown();
    logger_.reset();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger>& Logger::Get() {
    if (!initialized_) {
        Initialize();
    }
    return logger_;
}

void Logger::SetLevel(LogLevel level) {
    Get()->set_level(ToSpdlogLevel(level));
}

void Logger::SetLevel(const std::string& level) {
    Get()->set_level(ToSpdlogLevel(level));
}

std::string Logger::GetLevelName() {
    auto name = spdlog::level::to_string_view(Get()->level());
    return std::string(name.data(), name.size());
}

void Logger::Flush() {
    if (logger_) {
        logger_->flush();
    }
}

std::optional<spdlog::level::level_enum> Logger::ParseLevel(const std::string& level) {
    std::string lower(level.size(), '\0');
    std::transform(level.begin(), level.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& entry : kLevelNames) {
        if (lower == entry.first) {
            return entry.second;
        }
    }
    return std::nullopt;
}

spdlog::level::level_enum Logger::ToSpdlogLevel(LogLevel level) {
    auto index = static_cast<int>(level);
    if (index < 0 || index > static_cast<int>(LogLevel::FATAL)) {
        return spdlog::level::info;
    }
    // LogLevel and spdlog share the trace..critical ordering
    return static_cast<spdlog::level::level_enum>(index);
}

spdlog::level::level_enum Logger::ToSpdlogLevel(const std::string& level) {
    return ParseLevel(level).value_or(spdlog::level::info);
}

} // namespace dbdriver
