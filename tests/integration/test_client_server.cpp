//===----------------------------------------------------------------------===//
//                         DBDriver - Integration Tests
//
// tests/integration/test_client_server.cpp
//
// Client and server over a local socket
//===----------------------------------------------------------------------===//

#include "client/driver_client.hpp"
#include "engine/driver_engine.hpp"
#include "network/unix_server.hpp"
#include "protocol/errors.hpp"
#include "protocol/message.hpp"
#include "server/method_table.hpp"
#include "server/rpc_server.hpp"
#include <asio.hpp>
#include <array>
#include <cassert>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace dbdriver;

//===----------------------------------------------------------------------===//
// Fixture
//===----------------------------------------------------------------------===//

static std::string SocketPath() {
    return "/tmp/dbdriver_test_" + std::to_string(::getpid()) + ".sock";
}

static DriverEngine::Config EngineConfig() {
    DriverEngine::Config config;
    config.database_path = ":memory:";
    config.pool.max_connections = 4;
    return config;
}

static RpcServer::Config RpcConfig() {
    RpcServer::Config config;
    config.worker_threads = 4;
    return config;
}

static UnixServer::Config ListenerConfig() {
    UnixServer::Config config;
    config.socket_path = SocketPath();
    config.io_threads = 2;
    return config;
}

static DriverClient::Config ClientConfig(const std::string& socket_path = SocketPath()) {
    DriverClient::Config config;
    config.socket_path = socket_path;
    config.timeout_ms = 5000;
    config.grace_ms = 1000;
    config.max_attempts = 3;
    config.initial_backoff = std::chrono::milliseconds(10);
    config.max_backoff = std::chrono::milliseconds(40);
    config.connect_timeout = std::chrono::milliseconds(500);
    config.pool_size = 2;
    return config;
}

// Engine, RPC server and listener for one test
class Driver {
public:
    Driver()
        : engine_(EngineConfig())
        , rpc_(MethodTable::ForEngine(engine_), RpcConfig())
        , listener_(ListenerConfig(), rpc_) {
        rpc_.Start();
        listener_.Start();
    }

    ~Driver() { Stop(); }

    void Stop() {
        listener_.Stop();
        rpc_.Stop();
    }

    UnixServer& Listener() { return listener_; }

private:
    DriverEngine engine_;
    RpcServer rpc_;
    UnixServer listener_;
};

static Value NotesSchema() {
    Value schema;
    schema["name"] = "notes";
    ValueMap id;
    id["name"] = "id";
    id["type"] = "INTEGER";
    id["primary_key"] = true;
    ValueMap body;
    body["name"] = "body";
    body["type"] = "VARCHAR";
    ValueMap weight;
    weight["name"] = "weight";
    weight["type"] = "DOUBLE";
    ValueMap pinned;
    pinned["name"] = "pinned";
    pinned["type"] = "BOOLEAN";
    schema["columns"] = ValueList{Value(id), Value(body), Value(weight), Value(pinned)};
    return schema;
}

static ValueMap Note(int64_t id, const std::string& body, double weight, bool pinned) {
    ValueMap note;
    note["id"] = id;
    note["body"] = body;
    note["weight"] = weight;
    note["pinned"] = pinned;
    return note;
}

//===----------------------------------------------------------------------===//
// Tests
//===----------------------------------------------------------------------===//

void TestPing() {
    std::cout << "  Testing ping health..." << std::endl;

    Driver driver;
    DriverClient client(ClientConfig());

    Value health = client.Ping();
    assert(health["status"].GetString() == "ok");
    assert(health["workers"].GetInt() == 4);
    assert(driver.Listener().GetConnectionCount() >= 1);
    auto stats = driver.Listener().GetStats();
    assert(stats.accepted >= 1);
    assert(stats.rejected_frames == 0);
    assert(stats.bytes_received > 0 && stats.bytes_sent > 0);

    std::cout << "    PASSED" << std::endl;
}

void TestCrudOverSocket() {
    std::cout << "  Testing table and row operations..." << std::endl;

    Driver driver;
    DriverClient client(ClientConfig());

    assert(client.CreateTable(NotesSchema()).IsSuccess());

    Result info = client.GetTableInfo("notes");
    assert(info.IsRows());
    assert(info.GetRecords().size() == 4);

    assert(client.Insert("notes", Note(1, "first", 1.5, true)).IsSuccess());
    assert(client.Insert("notes", Note(2, "second", -0.25, false)).IsSuccess());
    Result inserted = client.Insert("notes", Note(3, "third", 0.0, false));
    assert(inserted.GetData()["affected_rows"].GetInt() == 1);

    Value options;
    options["order_by"] = "-id";
    options["limit"] = 2;
    Result page = client.Select("notes", options);
    assert(page.IsRows());
    assert(page.GetRecords().size() == 2);
    assert(page.GetRecords()[0]["id"].GetInt() == 3);
    assert(page.GetRecords()[1]["weight"].GetDouble() == -0.25);
    assert(page.GetRecords()[1]["pinned"].GetBool() == false);

    ValueMap where;
    where["id"] = 2;
    ValueMap data;
    data["body"] = "changed";
    assert(client.Update("notes", where, data).GetData()["affected_rows"].GetInt() == 1);

    Value by_id;
    by_id["where"]["id"] = 2;
    Result changed = client.Select("notes", by_id);
    assert(changed.GetRecords()[0]["body"].GetString() == "changed");

    assert(client.Delete("notes", where).GetData()["affected_rows"].GetInt() == 1);

    Result counted = client.Execute("SELECT COUNT(*) AS n FROM notes WHERE weight >= ?",
                                    ValueList{Value(0.0)});
    assert(counted.IsRows());
    assert(counted.GetRecords()[0]["n"].GetInt() == 2);

    Result missing = client.Select("nowhere");
    assert(missing.IsError());
    assert(missing.GetErrorCode() == ErrorCode::TABLE_NOT_FOUND);

    Result duplicate = client.Insert("notes", Note(1, "again", 0.0, false));
    assert(duplicate.GetErrorCode() == ErrorCode::CONSTRAINT_VIOLATION);

    assert(client.DropTable("notes").IsSuccess());

    std::cout << "    PASSED" << std::endl;
}

void TestTransactionOverSocket() {
    std::cout << "  Testing transaction across calls..." << std::endl;

    Driver driver;
    DriverClient client(ClientConfig());
    client.CreateTable(NotesSchema());

    Result begun = client.BeginTransaction();
    std::string tx = begun.GetData()["transaction_id"].GetString();
    assert(!tx.empty());

    client.Insert("notes", Note(10, "pending", 1.0, false), tx);
    assert(client.Select("notes").GetRecords().empty());
    assert(client.Select("notes", Value(), tx).GetRecords().size() == 1);

    assert(client.RollbackTransaction(tx).GetData()["success"].GetBool());
    assert(client.Select("notes").GetRecords().empty());

    Result again = client.CommitTransaction(tx);
    assert(again.GetErrorCode() == ErrorCode::TRANSACTION_NOT_FOUND);

    std::cout << "    PASSED" << std::endl;
}

void TestUnknownMethod() {
    std::cout << "  Testing unknown method..." << std::endl;

    Driver driver;
    DriverClient client(ClientConfig());

    bool threw = false;
    try {
        client.Call("format_disk");
    } catch (const ProtocolError& e) {
        threw = true;
        assert(e.GetCode() == ErrorCode::UNKNOWN_METHOD);
    }
    assert(threw);

    // The client keeps working afterwards
    assert(client.GetSchemaVersion().GetData()["version"].IsNull());

    std::cout << "    PASSED" << std::endl;
}

void TestBadFrameRejected() {
    std::cout << "  Testing malformed frame closes the connection..." << std::endl;

    Driver driver;

    asio::io_context io;
    asio::local::stream_protocol::socket socket(io);
    socket.connect(asio::local::stream_protocol::endpoint(SocketPath()));

    Message ping(MessageType::PING);
    auto frame = ping.Serialize();
    frame[0] = 'X';
    asio::write(socket, asio::buffer(frame));

    std::array<uint8_t, MessageHeader::SIZE> header_bytes;
    asio::read(socket, asio::buffer(header_bytes));
    MessageHeader header = ParseHeader(header_bytes.data());
    assert(header.IsValid());
    assert(header.GetType() == MessageType::PROTOCOL_ERROR);

    std::vector<uint8_t> payload(header.length);
    asio::read(socket, asio::buffer(payload));
    auto error = ProtocolErrorPayload::Deserialize(payload);
    assert(error.code == ErrorCode::PROTOCOL_ERROR);
    assert(error.message == "bad frame magic");

    // Server hangs up after the error frame
    uint8_t byte = 0;
    asio::error_code ec;
    asio::read(socket, asio::buffer(&byte, 1), ec);
    assert(ec == asio::error::eof);

    assert(driver.Listener().GetStats().rejected_frames == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestConnectionReuse() {
    std::cout << "  Testing pooled connection reuse..." << std::endl;

    Driver driver;
    DriverClient client(ClientConfig());

    for (int i = 0; i < 10; i++) {
        assert(client.GetSchemaVersion().IsSuccess());
    }

    auto stats = client.GetStats();
    assert(stats.calls == 10);
    assert(stats.retries == 0);
    assert(stats.pool.created == 1);
    assert(stats.pool.reused == 9);

    std::cout << "    PASSED" << std::endl;
}

void TestConcurrentClients() {
    std::cout << "  Testing concurrent callers..." << std::endl;

    Driver driver;
    DriverClient setup(ClientConfig());
    setup.CreateTable(NotesSchema());

    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([t, &ok] {
            DriverClient client(ClientConfig());
            for (int i = 0; i < 10; i++) {
                Result result = client.Insert("notes", Note(t * 100 + i, "n", 1.0, false));
                if (result.IsSuccess()) {
                    ok++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    assert(ok == 40);
    assert(setup.Select("notes").GetRecords().size() == 40);

    std::cout << "    PASSED" << std::endl;
}

void TestUnreachableServer() {
    std::cout << "  Testing retries against a missing socket..." << std::endl;

    DriverClient client(ClientConfig("/tmp/dbdriver_test_missing.sock"));

    bool threw = false;
    try {
        client.Call("get_schema_version");
    } catch (const ConnectionError& e) {
        threw = true;
        assert(std::string(e.what()).find("after 3 attempts") != std::string::npos);
    }
    assert(threw);

    auto stats = client.GetStats();
    assert(stats.retries == 2);
    assert(stats.connection_failures == 3);

    threw = false;
    try {
        client.Ping();
    } catch (const ConnectionError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

void TestServerGoesAway() {
    std::cout << "  Testing server shutdown seen by the client..." << std::endl;

    Driver driver;
    DriverClient client(ClientConfig());
    assert(client.GetSchemaVersion().IsSuccess());

    driver.Stop();

    bool threw = false;
    try {
        client.GetSchemaVersion();
    } catch (const ConnectionError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Client/Server Integration Tests ===" << std::endl;

    std::cout << "\n1. Calls:" << std::endl;
    TestPing();
    TestCrudOverSocket();
    TestTransactionOverSocket();
    TestUnknownMethod();
    TestBadFrameRejected();

    std::cout << "\n2. Connections:" << std::endl;
    TestConnectionReuse();
    TestConcurrentClients();
    TestUnreachableServer();
    TestServerGoesAway();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
