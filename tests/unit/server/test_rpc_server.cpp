//===----------------------------------------------------------------------===//
//                         DBDriver - Unit Tests
//
// tests/unit/server/test_rpc_server.cpp
//
// Unit tests for the RPC server and method table
//===----------------------------------------------------------------------===//

#include "engine/driver_engine.hpp"
#include "protocol/errors.hpp"
#include "server/local_invoker.hpp"
#include "server/method_table.hpp"
#include "server/rpc_server.hpp"
#include <cassert>
#include <iostream>
#include <map>
#include <thread>
#include <vector>

using namespace dbdriver;

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

// Collects async completions
class Collector {
public:
    CompletionCallback Callback() {
        return [this](const std::string& id, const Result& result) {
            std::lock_guard<std::mutex> lock(mutex_);
            results_.emplace(id, result);
            cv_.notify_all();
        };
    }

    bool WaitFor(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return results_.size() >= count; });
    }

    Result Get(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return results_.at(id);
    }

    size_t Size() {
        std::lock_guard<std::mutex> lock(mutex_);
        return results_.size();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Result> results_;
};

static std::atomic<int> g_slow_calls{0};

static MethodTable TestMethods() {
    MethodTable table;
    table.Register("echo", [](const Value& params) { return Result::Success(params); });
    table.Register("rows", [](const Value&) {
        ValueMap row;
        row["n"] = Value(1);
        return Result::Rows(ValueList{Value(row)});
    });
    table.Register("slow", [](const Value& params) {
        g_slow_calls++;
        std::this_thread::sleep_for(std::chrono::milliseconds(params.GetIntOr("sleep_ms", 200)));
        return Result::Success(Value("slept"));
    });
    table.Register("bad_args", [](const Value&) -> Result {
        throw std::invalid_argument("table_name is required");
    });
    table.Register("storage", [](const Value&) -> Result {
        throw DriverError(ErrorCode::TABLE_NOT_FOUND, "no such table");
    });
    table.Register("crash", [](const Value&) -> Result {
        throw std::runtime_error("unexpected");
    });
    return table;
}

static RpcServer::Config SmallConfig(size_t workers = 2, size_t queue_size = 1000) {
    RpcServer::Config config;
    config.worker_threads = workers;
    config.queue.max_size = queue_size;
    config.queue.default_timeout = std::chrono::milliseconds(5000);
    return config;
}

static Request MakeRequest(const std::string& method, const std::string& id,
                           Priority priority = Priority::NORMAL, uint32_t timeout_ms = 0) {
    Request request = Request::Make(method, Value(), priority, timeout_ms);
    request.id = id;
    return request;
}

//===----------------------------------------------------------------------===//
// Method Table Tests
//===----------------------------------------------------------------------===//

void TestMethodTable() {
    std::cout << "  Testing method table registration and invoke..." << std::endl;

    MethodTable table = TestMethods();
    assert(table.Size() == 6);
    assert(table.Contains("echo"));
    assert(!table.Contains("missing"));

    bool threw = false;
    try {
        table.Register("echo", [](const Value&) { return Result::Success(); });
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        table.Find("missing");
    } catch (const ProtocolError& e) {
        threw = true;
        assert(e.GetCode() == ErrorCode::UNKNOWN_METHOD);
    }
    assert(threw);

    // Every failure becomes an Error result
    Result bad = table.Invoke(MakeRequest("bad_args", "a"));
    assert(bad.GetErrorCode() == ErrorCode::INVALID_PARAMETER);
    assert(bad.GetErrorMessage().find("table_name is required") != std::string::npos);
    assert(table.Invoke(MakeRequest("storage", "b")).GetErrorCode() == ErrorCode::TABLE_NOT_FOUND);
    assert(table.Invoke(MakeRequest("crash", "c")).GetErrorCode() == ErrorCode::INTERNAL_ERROR);
    assert(table.Invoke(MakeRequest("missing", "d")).GetErrorCode() == ErrorCode::UNKNOWN_METHOD);

    std::cout << "    PASSED" << std::endl;
}

void TestEngineCatalogue() {
    std::cout << "  Testing engine method catalogue..." << std::endl;

    DriverEngine::Config engine_config;
    engine_config.database_path = ":memory:";
    DriverEngine engine(engine_config);
    MethodTable table = MethodTable::ForEngine(engine);

    const char* expected[] = {
        "create_table", "drop_table", "alter_table", "insert", "update", "delete", "select",
        "execute", "begin_transaction", "commit_transaction", "rollback_transaction",
        "get_table_info", "get_schema_version", "sync_schema", "query_ast", "query_cst",
        "modify_ast", "modify_cst"};
    for (const char* name : expected) {
        assert(table.Contains(name));
    }
    assert(table.Size() == sizeof(expected) / sizeof(expected[0]));

    // No tree provider configured
    Request tree_request = MakeRequest("query_ast", "t");
    tree_request.params["file_id"] = 7;
    tree_request.params["filter"]["type"] = "function";
    assert(table.Invoke(tree_request).GetErrorCode() == ErrorCode::UNSUPPORTED);

    // Malformed params surface as INVALID_PARAMETER
    assert(table.Invoke(MakeRequest("query_ast", "u")).GetErrorCode() ==
           ErrorCode::INVALID_PARAMETER);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Call Tests
//===----------------------------------------------------------------------===//

void TestCallRoundTrip() {
    std::cout << "  Testing blocking call..." << std::endl;

    RpcServer server(TestMethods(), SmallConfig());
    server.Start();
    assert(server.IsRunning());

    Value params;
    params["greeting"] = "hello";
    Result echoed = server.Call(Request::Make("echo", params));
    assert(echoed.IsSuccess());
    assert(echoed.GetData()["greeting"].GetString() == "hello");

    Result rows = server.Call(Request::Make("rows"));
    assert(rows.IsRows());
    assert(rows.GetRecords().size() == 1);

    Result failed = server.Call(Request::Make("storage"));
    assert(failed.GetErrorCode() == ErrorCode::TABLE_NOT_FOUND);

    server.Stop();
    assert(!server.IsRunning());
    std::cout << "    PASSED" << std::endl;
}

void TestUnknownMethodRejected() {
    std::cout << "  Testing unknown method is rejected at acceptance..." << std::endl;

    RpcServer server(TestMethods(), SmallConfig());
    server.Start();

    bool threw = false;
    try {
        server.Call(Request::Make("drop_everything"));
    } catch (const ProtocolError& e) {
        threw = true;
        assert(e.GetCode() == ErrorCode::UNKNOWN_METHOD);
    }
    assert(threw);

    auto stats = server.GetStats();
    assert(stats.rejected == 1);
    assert(stats.accepted == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestConcurrentCallers() {
    std::cout << "  Testing concurrent callers..." << std::endl;

    RpcServer server(TestMethods(), SmallConfig(4));
    server.Start();

    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&server, &ok, t] {
            for (int i = 0; i < 25; i++) {
                Value params;
                params["n"] = t * 100 + i;
                Result result = server.Call(Request::Make("echo", params));
                if (result.IsSuccess() && result.GetData()["n"].GetInt() == t * 100 + i) {
                    ok++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    assert(ok == 200);

    auto stats = server.GetStats();
    assert(stats.accepted == 200);
    assert(stats.executed == 200);
    assert(stats.pending.pending == 0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Scheduling Tests
//===----------------------------------------------------------------------===//

void TestUrgentDispatchedFirst() {
    std::cout << "  Testing urgent insert overtakes a backlog of selects..." << std::endl;

    DriverEngine::Config engine_config;
    engine_config.database_path = ":memory:";
    DriverEngine engine(engine_config);

    Value schema;
    schema["name"] = "events";
    ValueMap column;
    column["name"] = "label";
    column["type"] = "VARCHAR";
    schema["columns"] = ValueList{Value(column)};
    Value create;
    create["schema"] = schema;
    engine.CreateTable(create);

    RpcServer server(MethodTable::ForEngine(engine), SmallConfig(1));

    std::vector<std::string> order;
    std::mutex order_mutex;
    server.SetDispatchObserver([&](const Request& request) {
        std::lock_guard<std::mutex> lock(order_mutex);
        order.push_back(request.id);
    });

    Collector collector;
    for (int i = 0; i < 100; i++) {
        Request select = MakeRequest("select", "select-" + std::to_string(i));
        select.params["table_name"] = "events";
        server.CallAsync(select, collector.Callback());
    }
    Request insert = MakeRequest("insert", "urgent-insert", Priority::URGENT);
    insert.params["table_name"] = "events";
    insert.params["data"]["label"] = "urgent";
    server.CallAsync(insert, collector.Callback());
    assert(server.GetStats().queue.size == 101);

    server.Start();
    assert(collector.WaitFor(101));

    {
        std::lock_guard<std::mutex> lock(order_mutex);
        assert(order.size() == 101);
        assert(order[0] == "urgent-insert");
        for (int i = 0; i < 100; i++) {
            assert(order[i + 1] == "select-" + std::to_string(i));
        }
    }
    assert(collector.Get("urgent-insert").IsSuccess());

    // Every select ran after the insert and sees its row
    for (int i = 0; i < 100; i++) {
        Result rows = collector.Get("select-" + std::to_string(i));
        assert(rows.IsRows());
        assert(rows.GetRecords().size() == 1);
        assert(rows.GetRecords()[0]["label"].GetString() == "urgent");
    }

    server.Stop();
    std::cout << "    PASSED" << std::endl;
}

void TestBacklogWaitsInQueue() {
    std::cout << "  Testing backlog waits in the queue while workers are busy..." << std::endl;

    std::mutex gate_mutex;
    std::condition_variable gate_cv;
    bool holding = false;
    bool released = false;

    MethodTable methods = TestMethods();
    methods.Register("hold", [&](const Value&) {
        std::unique_lock<std::mutex> lock(gate_mutex);
        holding = true;
        gate_cv.notify_all();
        gate_cv.wait(lock, [&] { return released; });
        return Result::Success(Value("released"));
    });

    RpcServer server(std::move(methods), SmallConfig(1, 5));

    std::vector<std::string> order;
    std::mutex order_mutex;
    server.SetDispatchObserver([&](const Request& request) {
        std::lock_guard<std::mutex> lock(order_mutex);
        order.push_back(request.id);
    });
    server.Start();

    Collector collector;
    server.CallAsync(MakeRequest("hold", "blocker"), collector.Callback());
    {
        std::unique_lock<std::mutex> lock(gate_mutex);
        assert(gate_cv.wait_for(lock, std::chrono::seconds(5), [&] { return holding; }));
    }

    for (int i = 0; i < 20; i++) {
        if (i == 4) {
            server.CallAsync(MakeRequest("echo", "urgent", Priority::URGENT), collector.Callback());
        }
        server.CallAsync(MakeRequest("echo", "normal-" + std::to_string(i)), collector.Callback());
    }

    // The held worker keeps everything else in the bounded queue
    auto stats = server.GetStats();
    assert(stats.queue.size == 5);
    assert(stats.dispatched == 1);
    assert(stats.accepted == 6);
    assert(stats.rejected == 16);
    assert(collector.Size() == 16);
    for (int i = 4; i < 20; i++) {
        assert(collector.Get("normal-" + std::to_string(i)).GetErrorCode() ==
               ErrorCode::QUEUE_FULL);
    }

    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        released = true;
    }
    gate_cv.notify_all();
    assert(collector.WaitFor(21));

    {
        std::lock_guard<std::mutex> lock(order_mutex);
        assert(order.size() == 6);
        assert(order[0] == "blocker");
        assert(order[1] == "urgent");
        for (int i = 0; i < 4; i++) {
            assert(order[i + 2] == "normal-" + std::to_string(i));
        }
    }
    assert(collector.Get("blocker").IsSuccess());
    assert(collector.Get("urgent").IsSuccess());
    assert(collector.Get("normal-3").IsSuccess());

    server.Stop();
    std::cout << "    PASSED" << std::endl;
}

void TestQueueFull() {
    std::cout << "  Testing full queue rejects immediately..." << std::endl;

    RpcServer server(TestMethods(), SmallConfig(1, 2));
    Collector collector;

    server.CallAsync(MakeRequest("echo", "q1"), collector.Callback());
    server.CallAsync(MakeRequest("echo", "q2"), collector.Callback());
    server.CallAsync(MakeRequest("echo", "q3"), collector.Callback());

    // Rejected before any worker exists
    assert(collector.Size() == 1);
    assert(collector.Get("q3").GetErrorCode() == ErrorCode::QUEUE_FULL);
    assert(IsRetryable(ErrorCode::QUEUE_FULL));

    server.Start();
    assert(collector.WaitFor(3));
    assert(collector.Get("q1").IsSuccess());
    assert(collector.Get("q2").IsSuccess());

    auto stats = server.GetStats();
    assert(stats.accepted == 2);
    assert(stats.rejected == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestDuplicateIdRejected() {
    std::cout << "  Testing duplicate request id..." << std::endl;

    RpcServer server(TestMethods(), SmallConfig(1));
    Collector first;
    Collector second;

    server.CallAsync(MakeRequest("echo", "same-id"), first.Callback());
    server.CallAsync(MakeRequest("echo", "same-id"), second.Callback());
    assert(second.Size() == 1);
    assert(second.Get("same-id").GetErrorCode() == ErrorCode::INVALID_PARAMETER);

    server.Start();
    assert(first.WaitFor(1));
    assert(first.Get("same-id").IsSuccess());

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Timeout Tests
//===----------------------------------------------------------------------===//

void TestCallTimesOut() {
    std::cout << "  Testing call deadline and late result..." << std::endl;

    RpcServer server(TestMethods(), SmallConfig(1));
    server.Start();

    Value params;
    params["sleep_ms"] = 300;
    auto started = Clock::now();
    Result result = server.Call(Request::Make("slow", params, Priority::NORMAL, 50));
    auto waited = Clock::now() - started;

    assert(result.GetErrorCode() == ErrorCode::TIMEOUT);
    assert(waited < std::chrono::milliseconds(250));

    // The handler still finishes and its result is dropped
    auto deadline = Clock::now() + std::chrono::seconds(5);
    while (server.GetStats().pending.late_results_dropped == 0) {
        assert(Clock::now() < deadline);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    assert(server.GetHealth()["timeouts"].GetInt() == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestQueuedRequestExpires() {
    std::cout << "  Testing request expiring in the queue..." << std::endl;

    g_slow_calls = 0;
    RpcServer server(TestMethods(), SmallConfig(1));
    Collector collector;

    server.CallAsync(MakeRequest("slow", "stale", Priority::NORMAL, 20), collector.Callback());
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    server.Start();

    assert(collector.WaitFor(1));
    assert(collector.Get("stale").GetErrorCode() == ErrorCode::TIMEOUT);
    assert(g_slow_calls == 0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Lifecycle Tests
//===----------------------------------------------------------------------===//

void TestStopFailsQueued() {
    std::cout << "  Testing stop fails queued requests..." << std::endl;

    RpcServer server(TestMethods(), SmallConfig(1));
    Collector collector;
    for (int i = 0; i < 3; i++) {
        server.CallAsync(MakeRequest("echo", "queued-" + std::to_string(i)), collector.Callback());
    }

    server.Stop();
    assert(collector.Size() == 3);
    for (int i = 0; i < 3; i++) {
        assert(collector.Get("queued-" + std::to_string(i)).GetErrorCode() ==
               ErrorCode::SHUTTING_DOWN);
    }

    Result after = server.Call(Request::Make("echo"));
    assert(after.GetErrorCode() == ErrorCode::SHUTTING_DOWN);

    std::cout << "    PASSED" << std::endl;
}

void TestHealth() {
    std::cout << "  Testing health map..." << std::endl;

    RpcServer server(TestMethods(), SmallConfig(3, 64));
    Value idle = server.GetHealth();
    assert(idle["status"].GetString() == "stopping");

    server.Start();
    server.Call(Request::Make("echo"));

    Value health = server.GetHealth();
    assert(health["status"].GetString() == "ok");
    assert(health["queue_size"].GetInt() == 0);
    assert(health["queue_max_size"].GetInt() == 64);
    assert(health["workers"].GetInt() == 3);
    assert(health["accepted"].GetInt() == 1);
    assert(health["executed"].GetInt() == 1);
    assert(health["timeouts"].GetInt() == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestLocalInvoker() {
    std::cout << "  Testing local invoker over the engine..." << std::endl;

    DriverEngine::Config engine_config;
    engine_config.database_path = ":memory:";
    DriverEngine engine(engine_config);
    RpcServer server(MethodTable::ForEngine(engine), SmallConfig(2));
    server.Start();
    LocalInvoker invoker(server);

    Value schema;
    schema["name"] = "notes";
    ValueMap column;
    column["name"] = "body";
    column["type"] = "VARCHAR";
    schema["columns"] = ValueList{Value(column)};
    Value create;
    create["schema"] = schema;
    assert(invoker.Call("create_table", create).IsSuccess());

    Value insert;
    insert["table_name"] = "notes";
    insert["data"]["body"] = "remember";
    Value inserted = UnwrapResult(invoker.Call("insert", insert), "insert");
    assert(inserted["affected_rows"].GetInt() == 1);

    Value select;
    select["table_name"] = "notes";
    Value rows = UnwrapResult(invoker.Call("select", select, Priority::HIGH), "select");
    assert(rows.IsList());
    assert(rows.GetList().size() == 1);
    assert(rows.GetList()[0]["body"].GetString() == "remember");

    Value missing;
    missing["table_name"] = "nowhere";
    bool threw = false;
    try {
        UnwrapResult(invoker.Call("select", missing), "select");
    } catch (const DriverError& e) {
        threw = true;
        assert(e.GetCode() == ErrorCode::TABLE_NOT_FOUND);
    }
    assert(threw);

    server.Stop();
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== RPC Server Unit Tests ===" << std::endl;

    std::cout << "\n1. Method Table:" << std::endl;
    TestMethodTable();
    TestEngineCatalogue();

    std::cout << "\n2. Calls:" << std::endl;
    TestCallRoundTrip();
    TestUnknownMethodRejected();
    TestConcurrentCallers();

    std::cout << "\n3. Scheduling:" << std::endl;
    TestUrgentDispatchedFirst();
    TestBacklogWaitsInQueue();
    TestQueueFull();
    TestDuplicateIdRejected();

    std::cout << "\n4. Timeouts:" << std::endl;
    TestCallTimesOut();
    TestQueuedRequestExpires();

    std::cout << "\n5. Lifecycle:" << std::endl;
    TestStopFailsQueued();
    TestHealth();
    TestLocalInvoker();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
