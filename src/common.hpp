//===----------------------------------------------------------------------===//
//                         DBDriver
//
// common.hpp
//
// Common definitions shared by the driver, server and client
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <thread>

namespace dbdriver {

// Type aliases
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

// Forward declarations
class DriverEngine;
class RpcServer;
class RequestQueue;
class PendingRegistry;
class ExecutorPool;
class UnixServer;
struct DriverConfig;

// Constants
constexpr const char* DEFAULT_SOCKET_PATH = "/tmp/dbdriver.sock";
constexpr size_t DEFAULT_WORKER_THREADS = 10;
constexpr size_t DEFAULT_IO_THREADS = 2;
constexpr size_t DEFAULT_QUEUE_MAX_SIZE = 1000;
constexpr size_t DEFAULT_MAX_CONNECTIONS = 64;
constexpr uint32_t DEFAULT_REQUEST_TIMEOUT_MS = 30000;
constexpr uint32_t DEFAULT_POLL_INTERVAL_MS = 10;
constexpr uint32_t DEFAULT_MAX_FRAME_BYTES = 16 * 1024 * 1024;  // 16MB
constexpr uint32_t DEFAULT_TRANSACTION_IDLE_SECONDS = 600;

} // namespace dbdriver
