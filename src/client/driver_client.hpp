//===----------------------------------------------------------------------===//
//                         DBDriver
//
// client/driver_client.hpp
//
// RPC client for the driver process
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "client/client_pool.hpp"
#include "client/method_invoker.hpp"

namespace dbdriver {

class DriverClient : public MethodInvoker {
public:
    struct Config {
        std::string socket_path;
        uint32_t timeout_ms;             // default request timeout
        uint32_t grace_ms;               // extra wait past the request timeout
        uint32_t max_attempts;           // connect/send attempts per call
        std::chrono::milliseconds initial_backoff;
        std::chrono::milliseconds max_backoff;
        std::chrono::milliseconds connect_timeout;
        size_t pool_size;
        uint32_t max_frame_bytes;

        Config()
            : socket_path(DEFAULT_SOCKET_PATH)
            , timeout_ms(DEFAULT_REQUEST_TIMEOUT_MS)
            , grace_ms(2000)
            , max_attempts(3)
            , initial_backoff(100)
            , max_backoff(2000)
            , connect_timeout(2000)
            , pool_size(4)
            , max_frame_bytes(DEFAULT_MAX_FRAME_BYTES) {}
    };

    struct Stats {
        uint64_t calls = 0;
        uint64_t retries = 0;
        uint64_t connection_failures = 0;
        ClientPool::Stats pool;
    };

    explicit DriverClient(const Config& config = Config{});
    ~DriverClient() override;

    // Non-copyable
    DriverClient(const DriverClient&) = delete;
    DriverClient& operator=(const DriverClient&) = delete;

    // Generic call. Throws ConnectionError when the server cannot be reached
    // or the connection fails after the request was sent, and ProtocolError
    // when the server rejects the frame or the method.
    Result Call(const std::string& method,
                Value params = Value(),
                Priority priority = Priority::NORMAL,
                uint32_t timeout_ms = 0) override;

    // Server health map from a PONG. Throws ConnectionError.
    Value Ping();

    //===------------------------------------------------------------------===//
    // Catalogue wrappers
    //===------------------------------------------------------------------===//
    Result CreateTable(const Value& schema);
    Result DropTable(const std::string& table_name, bool if_exists = true);
    // changes: {add_columns, drop_columns, rename_to}
    Result AlterTable(const std::string& table_name, const Value& changes);

    Result Insert(const std::string& table_name, const ValueMap& data,
                  const std::string& transaction_id = "");
    Result Update(const std::string& table_name, const ValueMap& where, const ValueMap& data,
                  const std::string& transaction_id = "");
    Result Delete(const std::string& table_name, const ValueMap& where,
                  const std::string& transaction_id = "");
    // options: {where, columns, limit, offset, order_by}
    Result Select(const std::string& table_name, const Value& options = Value(),
                  const std::string& transaction_id = "");
    Result Execute(const std::string& sql, const ValueList& params = {},
                   const std::string& transaction_id = "");

    Result BeginTransaction();
    Result CommitTransaction(const std::string& transaction_id);
    Result RollbackTransaction(const std::string& transaction_id);

    Result GetTableInfo(const std::string& table_name);
    Result GetSchemaVersion();
    Result SyncSchema(const Value& schema_definition, const std::string& backup_dir = "");

    Result QueryAst(const std::string& file_id, const Value& filter = Value());
    Result QueryCst(const std::string& file_id, const Value& filter = Value());
    Result ModifyAst(const std::string& file_id, const Value& filter,
                     const std::string& action, const ValueList& nodes);
    Result ModifyCst(const std::string& file_id, const Value& filter,
                     const std::string& action, const ValueList& nodes);

    Stats GetStats() const;
    const Config& GetConfig() const { return config_; }

private:
    std::chrono::milliseconds Backoff(uint32_t attempt) const;

    // Wait for the reply to request_id on conn
    Result AwaitResponse(ClientConnection& conn, const std::string& request_id,
                         std::chrono::milliseconds timeout);

    static Value WithTransaction(ValueMap params, const std::string& transaction_id);
    Result Modify(const std::string& method, const std::string& file_id, const Value& filter,
                  const std::string& action, const ValueList& nodes);

private:
    Config config_;
    ClientPool pool_;

    std::atomic<uint64_t> calls_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> connection_failures_{0};
};

} // namespace dbdriver
