//===----------------------------------------------------------------------===//
//                         DBDriver
//
// client/driver_client.cpp
//
// RPC client implementation
//===----------------------------------------------------------------------===//

#include "client/driver_client.hpp"
#include "protocol/errors.hpp"
#include "logging/logger.hpp"
#include "utils/uuid.hpp"

namespace dbdriver {

namespace {

ClientPool::Config PoolConfig(const DriverClient::Config& config) {
    ClientPool::Config pool;
    pool.socket_path = config.socket_path;
    pool.max_idle = config.pool_size;
    pool.connect_timeout = config.connect_timeout;
    pool.max_frame_bytes = config.max_frame_bytes;
    return pool;
}

} // namespace

DriverClient::DriverClient(const Config& config)
    : config_(config)
    , pool_(PoolConfig(config)) {
}

DriverClient::~DriverClient() {
    pool_.Clear();
}

std::chrono::milliseconds DriverClient::Backoff(uint32_t attempt) const {
    auto delay = config_.initial_backoff;
    for (uint32_t i = 1; i < attempt && delay < config_.max_backoff; i++) {
        delay *= 2;
    }
    return std::min(delay, config_.max_backoff);
}

Result DriverClient::Call(const std::string& method, Value params,
                          Priority priority, uint32_t timeout_ms) {
    calls_++;

    Request request = Request::Make(method, std::move(params), priority,
                                    timeout_ms ? timeout_ms : config_.timeout_ms);
    Message frame(MessageType::REQUEST, RequestPayload{request}.Serialize());
    auto send_timeout = config_.connect_timeout;
    auto wait = std::chrono::milliseconds(request.timeout_ms + config_.grace_ms);

    std::string last_error;
    uint32_t attempts = std::max<uint32_t>(1, config_.max_attempts);

    for (uint32_t attempt = 1; attempt <= attempts; attempt++) {
        if (attempt > 1) {
            retries_++;
            auto delay = Backoff(attempt - 1);
            DLOG_DEBUG("client", "Retrying {} in {}ms (attempt {}/{})",
                       method, delay.count(), attempt, attempts);
            std::this_thread::sleep_for(delay);
        }

        std::unique_ptr<ClientConnection> conn;
        try {
            conn = pool_.Acquire();
            conn->SendFrame(frame, send_timeout);
        } catch (const ConnectionError& e) {
            connection_failures_++;
            last_error = e.what();
            LOG_DEBUG("client", "Attempt " + std::to_string(attempt) + " for " + method +
                      " failed: " + last_error);
            pool_.Discard(std::move(conn));
            continue;
        }

        // The request is on the wire; the server may execute it, so no retry
        try {
            Result result = AwaitResponse(*conn, request.id, wait);
            pool_.Release(std::move(conn));
            return result;
        } catch (const ProtocolError&) {
            pool_.Discard(std::move(conn));
            throw;
        } catch (const ConnectionError&) {
            connection_failures_++;
            pool_.Discard(std::move(conn));
            throw;
        }
    }

    throw ConnectionError("cannot reach driver at " + config_.socket_path + " after " +
                          std::to_string(attempts) + " attempts: " + last_error);
}

Result DriverClient::AwaitResponse(ClientConnection& conn, const std::string& request_id,
                                   std::chrono::milliseconds timeout) {
    TimePoint deadline = Clock::now() + timeout;

    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() <= 0) {
            conn.Close(false);
            throw ConnectionError("no response for request " + request_id);
        }

        Message reply = conn.ReceiveFrame(left);
        switch (reply.GetType()) {
            case MessageType::RESPONSE: {
                ResponsePayload payload = ResponsePayload::Deserialize(reply.GetPayload());
                if (payload.request_id != request_id) {
                    LOG_WARN("client", "Ignoring response for unexpected request " +
                             payload.request_id);
                    continue;
                }
                return payload.result;
            }
            case MessageType::PROTOCOL_ERROR: {
                ProtocolErrorPayload payload = ProtocolErrorPayload::Deserialize(reply.GetPayload());
                throw ProtocolError(payload.message, payload.code);
            }
            case MessageType::PONG:
                continue;
            default:
                throw ProtocolError("unexpected message type " +
                                    std::string(MessageTypeToString(reply.GetType())));
        }
    }
}

Value DriverClient::Ping() {
    auto conn = pool_.Acquire();
    Value health;
    if (!conn->Ping(config_.connect_timeout, &health)) {
        pool_.Discard(std::move(conn));
        throw ConnectionError("ping to " + config_.socket_path + " failed");
    }
    pool_.Release(std::move(conn));
    return health;
}

DriverClient::Stats DriverClient::GetStats() const {
    Stats stats;
    stats.calls = calls_;
    stats.retries = retries_;
    stats.connection_failures = connection_failures_;
    stats.pool = pool_.GetStats();
    return stats;
}

//===----------------------------------------------------------------------===//
// Catalogue wrappers
//===----------------------------------------------------------------------===//
Value DriverClient::WithTransaction(ValueMap params, const std::string& transaction_id) {
    if (!transaction_id.empty()) {
        params["transaction_id"] = transaction_id;
    }
    return Value(std::move(params));
}

Result DriverClient::CreateTable(const Value& schema) {
    ValueMap params;
    params["schema"] = schema;
    return Call("create_table", Value(std::move(params)));
}

Result DriverClient::DropTable(const std::string& table_name, bool if_exists) {
    ValueMap params;
    params["table_name"] = table_name;
    params["if_exists"] = if_exists;
    return Call("drop_table", Value(std::move(params)));
}

Result DriverClient::AlterTable(const std::string& table_name, const Value& changes) {
    ValueMap params = changes.IsMap() ? changes.GetMap() : ValueMap{};
    params["table_name"] = table_name;
    return Call("alter_table", Value(std::move(params)));
}

Result DriverClient::Insert(const std::string& table_name, const ValueMap& data,
                            const std::string& transaction_id) {
    ValueMap params;
    params["table_name"] = table_name;
    params["data"] = data;
    return Call("insert", WithTransaction(std::move(params), transaction_id));
}

Result DriverClient::Update(const std::string& table_name, const ValueMap& where,
                            const ValueMap& data, const std::string& transaction_id) {
    ValueMap params;
    params["table_name"] = table_name;
    params["where"] = where;
    params["data"] = data;
    return Call("update", WithTransaction(std::move(params), transaction_id));
}

Result DriverClient::Delete(const std::string& table_name, const ValueMap& where,
                            const std::string& transaction_id) {
    ValueMap params;
    params["table_name"] = table_name;
    params["where"] = where;
    return Call("delete", WithTransaction(std::move(params), transaction_id));
}

Result DriverClient::Select(const std::string& table_name, const Value& options,
                            const std::string& transaction_id) {
    ValueMap params = options.IsMap() ? options.GetMap() : ValueMap{};
    params["table_name"] = table_name;
    return Call("select", WithTransaction(std::move(params), transaction_id));
}

Result DriverClient::Execute(const std::string& sql, const ValueList& params,
                             const std::string& transaction_id) {
    ValueMap map;
    map["sql"] = sql;
    if (!params.empty()) {
        map["params"] = params;
    }
    return Call("execute", WithTransaction(std::move(map), transaction_id));
}

Result DriverClient::BeginTransaction() {
    return Call("begin_transaction", Value(), Priority::HIGH);
}

Result DriverClient::CommitTransaction(const std::string& transaction_id) {
    ValueMap params;
    params["transaction_id"] = transaction_id;
    return Call("commit_transaction", Value(std::move(params)), Priority::HIGH);
}

Result DriverClient::RollbackTransaction(const std::string& transaction_id) {
    ValueMap params;
    params["transaction_id"] = transaction_id;
    return Call("rollback_transaction", Value(std::move(params)), Priority::HIGH);
}

Result DriverClient::GetTableInfo(const std::string& table_name) {
    ValueMap params;
    params["table_name"] = table_name;
    return Call("get_table_info", Value(std::move(params)));
}

Result DriverClient::GetSchemaVersion() {
    return Call("get_schema_version");
}

Result DriverClient::SyncSchema(const Value& schema_definition, const std::string& backup_dir) {
    ValueMap params;
    params["schema_definition"] = schema_definition;
    if (!backup_dir.empty()) {
        params["backup_dir"] = backup_dir;
    }
    return Call("sync_schema", Value(std::move(params)));
}

Result DriverClient::QueryAst(const std::string& file_id, const Value& filter) {
    ValueMap params;
    params["file_id"] = file_id;
    params["filter"] = filter.IsMap() ? filter : Value(ValueMap{});
    return Call("query_ast", Value(std::move(params)));
}

Result DriverClient::QueryCst(const std::string& file_id, const Value& filter) {
    ValueMap params;
    params["file_id"] = file_id;
    params["filter"] = filter.IsMap() ? filter : Value(ValueMap{});
    return Call("query_cst", Value(std::move(params)));
}

Result DriverClient::Modify(const std::string& method, const std::string& file_id,
                            const Value& filter, const std::string& action,
                            const ValueList& nodes) {
    ValueMap params;
    params["file_id"] = file_id;
    params["filter"] = filter.IsMap() ? filter : Value(ValueMap{});
    params["action"] = action;
    params["nodes"] = nodes;
    return Call(method, Value(std::move(params)));
}

Result DriverClient::ModifyAst(const std::string& file_id, const Value& filter,
                               const std::string& action, const ValueList& nodes) {
    return Modify("modify_ast", file_id, filter, action, nodes);
}

Result DriverClient::ModifyCst(const std::string& file_id, const Value& filter,
                               const std::string& action, const ValueList& nodes) {
    return Modify("modify_cst", file_id, filter, action, nodes);
}

} // namespace dbdriver
