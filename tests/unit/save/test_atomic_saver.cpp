//===----------------------------------------------------------------------===//
//                         DBDriver - Unit Tests
//
// tests/unit/save/test_atomic_saver.cpp
//
// Unit tests for atomic file and database updates
//===----------------------------------------------------------------------===//

#include "engine/driver_engine.hpp"
#include "save/atomic_saver.hpp"
#include "save/content_validator.hpp"
#include "server/local_invoker.hpp"
#include "server/method_table.hpp"
#include "server/rpc_server.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

using namespace dbdriver;
namespace fs = std::filesystem;

//===----------------------------------------------------------------------===//
// Fixture
//===----------------------------------------------------------------------===//

static const char* ORIGINAL = "name: original\nrules: [a, b]\n";
static const char* EDITED = "name: edited\nrules: [a, b, c]\n";

static void WriteText(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

static std::string ReadText(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Forwards to the server; commit_transaction can be answered with a timeout
class CommitReplyInvoker : public MethodInvoker {
public:
    enum class Mode {
        PASS,
        DROP_REPLY,    // the commit runs, the caller sees a timeout
        DROP_REQUEST   // the commit never reaches the server
    };

    explicit CommitReplyInvoker(MethodInvoker& inner) : inner_(inner) {}

    void SetMode(Mode mode) { mode_ = mode; }

    Result Call(const std::string& method,
                Value params = Value(),
                Priority priority = Priority::NORMAL,
                uint32_t timeout_ms = 0) override {
        if (method != "commit_transaction" || mode_ == Mode::PASS) {
            return inner_.Call(method, std::move(params), priority, timeout_ms);
        }
        if (mode_ == Mode::DROP_REPLY) {
            Result ignored = inner_.Call(method, std::move(params), priority, timeout_ms);
            assert(!ignored.IsError());
        }
        return Result::Error(ErrorCode::TIMEOUT, "request timed out");
    }

private:
    MethodInvoker& inner_;
    Mode mode_ = Mode::PASS;
};

// Engine, server and saver over a scratch directory
class SaveFixture {
public:
    explicit SaveFixture(const std::string& name)
        : root_(fs::temp_directory_path() / name)
        , engine_(EngineConfig())
        , server_(MethodTable::ForEngine(engine_), ServerConfig())
        , local_(server_)
        , invoker_(local_) {
        fs::remove_all(root_);
        fs::create_directories(root_ / "files");
        backups_ = std::make_unique<BackupManager>((root_ / "backups").string());
        saver_ = std::make_unique<AtomicSaver>(invoker_, *backups_, validator_);
        server_.Start();

        Value schema;
        schema["name"] = "derived";
        ValueMap file;
        file["name"] = "file";
        file["type"] = "VARCHAR";
        ValueMap rule;
        rule["name"] = "rule";
        rule["type"] = "VARCHAR";
        schema["columns"] = ValueList{Value(file), Value(rule)};
        Value params;
        params["schema"] = schema;
        engine_.CreateTable(params);
    }

    ~SaveFixture() {
        server_.Stop();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path Target() const { return root_ / "files" / "grammar.yaml"; }

    // Replace the derived rows for the target with the given rules
    DerivedUpdate ReplaceRules(std::vector<std::string> rules, bool fail_after = false) {
        std::string path = Target().string();
        return [path, rules, fail_after](MethodInvoker& invoker, const std::string& tx) {
            Value del;
            del["table_name"] = "derived";
            del["where"]["file"] = path;
            del["transaction_id"] = tx;
            UnwrapResult(invoker.Call("delete", del), "delete");

            for (const auto& rule : rules) {
                Value insert;
                insert["table_name"] = "derived";
                insert["data"]["file"] = path;
                insert["data"]["rule"] = rule;
                insert["transaction_id"] = tx;
                UnwrapResult(invoker.Call("insert", insert), "insert");
            }
            if (fail_after) {
                throw std::runtime_error("derived data extraction failed");
            }
        };
    }

    void SeedRules(const std::vector<std::string>& rules) {
        for (const auto& rule : rules) {
            Value insert;
            insert["table_name"] = "derived";
            insert["data"]["file"] = Target().string();
            insert["data"]["rule"] = rule;
            engine_.Insert(insert);
        }
    }

    size_t RuleCount() {
        Value select;
        select["table_name"] = "derived";
        return engine_.Select(select).size();
    }

    // Anything in the target directory besides the target itself
    size_t StrayFiles() const {
        size_t count = 0;
        for (const auto& entry : fs::directory_iterator(root_ / "files")) {
            if (entry.path() != Target()) {
                count++;
            }
        }
        return count;
    }

    size_t OpenTransactions() const { return engine_.GetStats().transactions.active; }

    SaveRequest MakeRequest(const std::string& content, DerivedUpdate update) const {
        SaveRequest request;
        request.target_path = Target().string();
        request.content = content;
        request.update_derived = std::move(update);
        request.command = "save_grammar";
        return request;
    }

    AtomicSaver& Saver() { return *saver_; }
    CommitReplyInvoker& Invoker() { return invoker_; }
    BackupManager& Backups() { return *backups_; }

private:
    static DriverEngine::Config EngineConfig() {
        DriverEngine::Config config;
        config.database_path = ":memory:";
        return config;
    }

    static RpcServer::Config ServerConfig() {
        RpcServer::Config config;
        config.worker_threads = 2;
        return config;
    }

    fs::path root_;
    DriverEngine engine_;
    RpcServer server_;
    LocalInvoker local_;
    CommitReplyInvoker invoker_;
    YamlValidator validator_;
    std::unique_ptr<BackupManager> backups_;
    std::unique_ptr<AtomicSaver> saver_;
};

//===----------------------------------------------------------------------===//
// Validator Tests
//===----------------------------------------------------------------------===//

void TestUtf8Validator() {
    std::cout << "  Testing UTF-8 validation..." << std::endl;

    Utf8TextValidator validator;
    std::string error;
    assert(validator.Validate("", error));
    assert(validator.Validate("plain ascii\n", error));
    assert(validator.Validate("h\xC3\xA9llo \xE2\x9C\x93 \xF0\x9F\x98\x80", error));

    assert(!validator.Validate(std::string("a\0b", 3), error));
    assert(error.find("NUL") != std::string::npos);
    assert(!validator.Validate("\x80", error));
    assert(!validator.Validate("abc\xC3", error));
    assert(error.find("truncated") != std::string::npos);
    assert(!validator.Validate("\xC0\xAF", error));        // overlong '/'
    assert(!validator.Validate("\xED\xA0\x80", error));    // surrogate
    assert(!validator.Validate("\xF4\x90\x80\x80", error)); // past U+10FFFF
    assert(!validator.Validate("\xE2\x28\xA1", error));
    assert(std::string(validator.Name()) == "utf8");

    std::cout << "    PASSED" << std::endl;
}

void TestYamlValidator() {
    std::cout << "  Testing YAML validation..." << std::endl;

    YamlValidator validator;
    std::string error;
    assert(validator.Validate(ORIGINAL, error));
    assert(validator.Validate("a: 1\n---\nb: 2\n", error));
    assert(!validator.Validate("key: [1, 2\n", error));
    assert(error.find("YAML") != std::string::npos);
    assert(!validator.Validate("key: \xFF\n", error));
    assert(std::string(validator.Name()) == "yaml");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Save Tests
//===----------------------------------------------------------------------===//

void TestSuccessfulSave() {
    std::cout << "  Testing successful save..." << std::endl;

    SaveFixture fixture("dbdriver_test_save_ok");
    WriteText(fixture.Target(), ORIGINAL);
    fixture.SeedRules({"a", "b"});

    SaveOutcome outcome = fixture.Saver().Save(
        fixture.MakeRequest(EDITED, fixture.ReplaceRules({"a", "b", "c"})));

    assert(outcome.success);
    assert(outcome.failed_stage == SaveStage::NONE);
    assert(!outcome.backup_uuid.empty());
    assert(!outcome.backup_retained);
    assert(ReadText(fixture.Target()) == EDITED);
    assert(fixture.RuleCount() == 3);
    assert(fixture.StrayFiles() == 0);
    assert(fixture.OpenTransactions() == 0);
    assert(fixture.Backups().ListBackups().empty());

    Value value = outcome.ToValue();
    assert(value["success"].GetBool());
    assert(value["failed_stage"].IsNull());
    assert(value["error"].IsNull());

    std::cout << "    PASSED" << std::endl;
}

void TestKeepBackup() {
    std::cout << "  Testing retained backup..." << std::endl;

    SaveFixture fixture("dbdriver_test_save_keep");
    WriteText(fixture.Target(), ORIGINAL);

    SaveRequest request = fixture.MakeRequest(EDITED, nullptr);
    request.retention = BackupRetention::KEEP;
    SaveOutcome outcome = fixture.Saver().Save(request);

    assert(outcome.success);
    assert(outcome.backup_retained);
    auto entries = fixture.Backups().ListBackups(fixture.Target().string());
    assert(entries.size() == 1);
    assert(entries[0].uuid == outcome.backup_uuid);
    assert(entries[0].command == "save_grammar");
    assert(ReadText(fixture.Backups().BackupPath(entries[0])) == ORIGINAL);

    std::cout << "    PASSED" << std::endl;
}

void TestNewFile() {
    std::cout << "  Testing save of a new file..." << std::endl;

    SaveFixture fixture("dbdriver_test_save_new");
    SaveOutcome outcome = fixture.Saver().Save(
        fixture.MakeRequest(EDITED, fixture.ReplaceRules({"a"})));

    assert(outcome.success);
    assert(outcome.backup_uuid.empty());
    assert(ReadText(fixture.Target()) == EDITED);
    assert(fixture.RuleCount() == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestInvalidContent() {
    std::cout << "  Testing invalid content is refused..." << std::endl;

    SaveFixture fixture("dbdriver_test_save_invalid");
    WriteText(fixture.Target(), ORIGINAL);
    fixture.SeedRules({"a", "b"});

    SaveOutcome outcome = fixture.Saver().Save(
        fixture.MakeRequest("rules: [a, b\n", fixture.ReplaceRules({})));

    assert(!outcome.success);
    assert(outcome.failed_stage == SaveStage::VALIDATE);
    assert(outcome.code == ErrorCode::ATOMIC_SAVE_FAILED);
    assert(outcome.error.find("yaml validation failed") != std::string::npos);
    assert(outcome.backup_uuid.empty());
    assert(ReadText(fixture.Target()) == ORIGINAL);
    assert(fixture.RuleCount() == 2);
    assert(fixture.Backups().ListBackups().empty());

    SaveRequest unnamed = fixture.MakeRequest(EDITED, nullptr);
    unnamed.target_path.clear();
    SaveOutcome refused = fixture.Saver().Save(unnamed);
    assert(!refused.success);
    assert(refused.code == ErrorCode::INVALID_PARAMETER);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Failure Injection Tests
//===----------------------------------------------------------------------===//

void TestFailureAtEachStage() {
    std::cout << "  Testing failure injected at each stage..." << std::endl;

    const SaveStage stages[] = {
        SaveStage::VALIDATE, SaveStage::BACKUP, SaveStage::WRITE_TEMP,
        SaveStage::REVALIDATE, SaveStage::BEGIN_TRANSACTION, SaveStage::UPDATE_DERIVED,
        SaveStage::RENAME, SaveStage::COMMIT};

    for (SaveStage failing : stages) {
        SaveFixture fixture(std::string("dbdriver_test_save_stage_") + SaveStageToString(failing));
        WriteText(fixture.Target(), ORIGINAL);
        fixture.SeedRules({"a", "b"});

        fixture.Saver().SetBeforeStageHook([failing](SaveStage stage) {
            if (stage == failing) {
                throw std::runtime_error(std::string("injected failure at ") +
                                         SaveStageToString(stage));
            }
        });

        SaveOutcome outcome = fixture.Saver().Save(
            fixture.MakeRequest(EDITED, fixture.ReplaceRules({"x"})));

        assert(!outcome.success);
        assert(outcome.failed_stage == failing);
        assert(outcome.error.find("injected failure") != std::string::npos);

        // File, rows and directory as before the attempt
        assert(ReadText(fixture.Target()) == ORIGINAL);
        assert(fixture.RuleCount() == 2);
        assert(fixture.StrayFiles() == 0);
        assert(fixture.OpenTransactions() == 0);

        if (failing >= SaveStage::WRITE_TEMP) {
            assert(outcome.file_restored);
            assert(!outcome.backup_retained);
            assert(fixture.Backups().ListBackups().empty());
        }
    }

    std::cout << "    PASSED" << std::endl;
}

void TestDerivedUpdateFailure() {
    std::cout << "  Testing failure inside the derived update..." << std::endl;

    SaveFixture fixture("dbdriver_test_save_derived");
    WriteText(fixture.Target(), ORIGINAL);
    fixture.SeedRules({"a", "b"});

    SaveOutcome outcome = fixture.Saver().Save(
        fixture.MakeRequest(EDITED, fixture.ReplaceRules({"x", "y", "z"}, true)));

    assert(!outcome.success);
    assert(outcome.failed_stage == SaveStage::UPDATE_DERIVED);
    assert(outcome.error.find("derived data extraction failed") != std::string::npos);
    assert(ReadText(fixture.Target()) == ORIGINAL);
    assert(fixture.RuleCount() == 2);
    assert(fixture.OpenTransactions() == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestNewFileRemovedOnCommitFailure() {
    std::cout << "  Testing new file removed when commit fails..." << std::endl;

    SaveFixture fixture("dbdriver_test_save_new_fail");
    fixture.Saver().SetBeforeStageHook([](SaveStage stage) {
        if (stage == SaveStage::COMMIT) {
            throw std::runtime_error("injected failure at commit");
        }
    });

    SaveOutcome outcome = fixture.Saver().Save(
        fixture.MakeRequest(EDITED, fixture.ReplaceRules({"a"})));

    assert(!outcome.success);
    assert(outcome.failed_stage == SaveStage::COMMIT);
    assert(outcome.file_restored);
    assert(!fs::exists(fixture.Target()));
    assert(fixture.RuleCount() == 0);

    Value value = outcome.ToValue();
    assert(value["failed_stage"].GetString() == "commit");
    assert(value["backup_uuid"].IsNull());

    std::cout << "    PASSED" << std::endl;
}

void TestCommitTimeoutAfterCommit() {
    std::cout << "  Testing commit timeout after the commit ran..." << std::endl;

    SaveFixture fixture("dbdriver_test_save_commit_lost");
    WriteText(fixture.Target(), ORIGINAL);
    fixture.SeedRules({"a", "b"});
    fixture.Invoker().SetMode(CommitReplyInvoker::Mode::DROP_REPLY);

    SaveOutcome outcome = fixture.Saver().Save(
        fixture.MakeRequest(EDITED, fixture.ReplaceRules({"x"})));

    assert(!outcome.success);
    assert(outcome.failed_stage == SaveStage::COMMIT);
    assert(outcome.needs_inspection);
    assert(!outcome.file_restored);
    assert(outcome.error.find("commit outcome unknown") != std::string::npos);

    // The rows were committed, so the file must stay consistent with them
    assert(ReadText(fixture.Target()) == EDITED);
    assert(fixture.RuleCount() == 1);
    assert(fixture.OpenTransactions() == 0);
    assert(fixture.StrayFiles() == 0);

    // The backup is the only way back to the old content
    assert(outcome.backup_retained);
    assert(fixture.Backups().GetBackup(outcome.backup_uuid).has_value());

    Value value = outcome.ToValue();
    assert(value["needs_inspection"].GetBool());
    assert(!value["file_restored"].GetBool());

    std::cout << "    PASSED" << std::endl;
}

void TestCommitTimeoutBeforeCommit() {
    std::cout << "  Testing commit timeout before the commit ran..." << std::endl;

    SaveFixture fixture("dbdriver_test_save_commit_unsent");
    WriteText(fixture.Target(), ORIGINAL);
    fixture.SeedRules({"a", "b"});
    fixture.Invoker().SetMode(CommitReplyInvoker::Mode::DROP_REQUEST);

    SaveOutcome outcome = fixture.Saver().Save(
        fixture.MakeRequest(EDITED, fixture.ReplaceRules({"x"})));

    // The rollback found the transaction, so nothing was committed
    assert(!outcome.success);
    assert(outcome.failed_stage == SaveStage::COMMIT);
    assert(!outcome.needs_inspection);
    assert(outcome.file_restored);
    assert(ReadText(fixture.Target()) == ORIGINAL);
    assert(fixture.RuleCount() == 2);
    assert(fixture.OpenTransactions() == 0);
    assert(fixture.Backups().ListBackups().empty());

    std::cout << "    PASSED" << std::endl;
}

void TestUnreadableTargetFailsBackup() {
    std::cout << "  Testing target that cannot be inspected..." << std::endl;

    SaveFixture fixture("dbdriver_test_save_unreadable");
    fs::create_symlink(fixture.Target(), fixture.Target());

    SaveOutcome outcome = fixture.Saver().Save(
        fixture.MakeRequest(EDITED, fixture.ReplaceRules({"x"})));

    assert(!outcome.success);
    assert(outcome.failed_stage == SaveStage::BACKUP);
    assert(outcome.error.find("cannot inspect") != std::string::npos);
    assert(fs::is_symlink(fixture.Target()));
    assert(fixture.RuleCount() == 0);
    assert(fixture.StrayFiles() == 0);
    assert(fixture.Backups().ListBackups().empty());

    std::cout << "    PASSED" << std::endl;
}

void TestCleanupFailureKeepsSave() {
    std::cout << "  Testing cleanup failure after commit..." << std::endl;

    SaveFixture fixture("dbdriver_test_save_cleanup");
    WriteText(fixture.Target(), ORIGINAL);
    fixture.Saver().SetBeforeStageHook([](SaveStage stage) {
        if (stage == SaveStage::CLEANUP) {
            throw std::runtime_error("injected failure at cleanup");
        }
    });

    SaveOutcome outcome = fixture.Saver().Save(
        fixture.MakeRequest(EDITED, fixture.ReplaceRules({"c"})));

    assert(outcome.success);
    assert(ReadText(fixture.Target()) == EDITED);
    assert(fixture.RuleCount() == 1);
    assert(outcome.backup_retained);
    assert(fixture.Backups().ListBackups().size() == 1);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Atomic Saver Unit Tests ===" << std::endl;

    std::cout << "\n1. Validators:" << std::endl;
    TestUtf8Validator();
    TestYamlValidator();

    std::cout << "\n2. Saves:" << std::endl;
    TestSuccessfulSave();
    TestKeepBackup();
    TestNewFile();
    TestInvalidContent();

    std::cout << "\n3. Failure Injection:" << std::endl;
    TestFailureAtEachStage();
    TestDerivedUpdateFailure();
    TestNewFileRemovedOnCommitFailure();
    TestCommitTimeoutAfterCommit();
    TestCommitTimeoutBeforeCommit();
    TestUnreadableTargetFailsBackup();
    TestCleanupFailureKeepsSave();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
