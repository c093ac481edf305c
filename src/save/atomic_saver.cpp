//===----------------------------------------------------------------------===//
//                         DBDriver
//
// save/atomic_saver.cpp
//
// Atomic save implementation
//===----------------------------------------------------------------------===//

#include "save/atomic_saver.hpp"
#include "logging/logger.hpp"
#include "utils/uuid.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace dbdriver {

namespace fs = std::filesystem;

namespace {

void WriteFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot open " + path + " for writing");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        throw std::runtime_error("write to " + path + " failed");
    }
}

std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path + " for reading");
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Same directory as the target so the rename stays on one filesystem
std::string TempPathFor(const std::string& target) {
    fs::path path(target);
    std::string name = "." + path.filename().string() + ".tmp-" + GenerateUuid().substr(0, 8);
    return (path.parent_path() / name).string();
}

} // namespace

const char* SaveStageToString(SaveStage stage) {
    switch (stage) {
        case SaveStage::NONE:              return "none";
        case SaveStage::VALIDATE:          return "validate";
        case SaveStage::BACKUP:            return "backup";
        case SaveStage::WRITE_TEMP:        return "write_temp";
        case SaveStage::REVALIDATE:        return "revalidate";
        case SaveStage::BEGIN_TRANSACTION: return "begin_transaction";
        case SaveStage::UPDATE_DERIVED:    return "update_derived";
        case SaveStage::RENAME:            return "rename";
        case SaveStage::COMMIT:            return "commit";
        case SaveStage::CLEANUP:           return "cleanup";
    }
    return "unknown";
}

Value SaveOutcome::ToValue() const {
    ValueMap map;
    map["success"] = success;
    map["failed_stage"] = success ? Value() : Value(SaveStageToString(failed_stage));
    map["error"] = error.empty() ? Value() : Value(error);
    map["backup_uuid"] = backup_uuid.empty() ? Value() : Value(backup_uuid);
    map["backup_retained"] = backup_retained;
    map["file_restored"] = file_restored;
    map["needs_inspection"] = needs_inspection;
    return Value(std::move(map));
}

AtomicSaver::AtomicSaver(MethodInvoker& invoker,
                         BackupManager& backups,
                         const ContentValidator& validator)
    : invoker_(invoker)
    , backups_(backups)
    , validator_(validator) {
}

void AtomicSaver::Enter(SaveStage stage, SaveStage& current) {
    current = stage;
    DLOG_DEBUG("atomic_save", "stage {}", SaveStageToString(stage));
    if (before_stage_) {
        before_stage_(stage);
    }
}

SaveOutcome AtomicSaver::Save(const SaveRequest& request) {
    SaveOutcome outcome;
    SaveState state;
    SaveStage stage = SaveStage::NONE;

    if (request.target_path.empty()) {
        outcome.failed_stage = SaveStage::VALIDATE;
        outcome.code = ErrorCode::INVALID_PARAMETER;
        outcome.error = "target path must not be empty";
        return outcome;
    }

    try {
        Enter(SaveStage::VALIDATE, stage);
        std::string reason;
        if (!validator_.Validate(request.content, reason)) {
            throw std::runtime_error(std::string(validator_.Name()) + " validation failed: " + reason);
        }

        Enter(SaveStage::BACKUP, stage);
        std::error_code ec;
        state.target_existed = fs::exists(request.target_path, ec);
        if (ec) {
            throw std::runtime_error("cannot inspect " + request.target_path + ": " + ec.message());
        }
        if (state.target_existed) {
            outcome.backup_uuid = backups_.CreateBackup(request.target_path, request.command,
                                                        {}, "atomic save");
            outcome.backup_retained = true;
        }

        Enter(SaveStage::WRITE_TEMP, stage);
        state.temp_path = TempPathFor(request.target_path);
        WriteFile(state.temp_path, request.content);

        Enter(SaveStage::REVALIDATE, stage);
        if (!validator_.Validate(ReadFile(state.temp_path), reason)) {
            throw std::runtime_error("staged file failed " + std::string(validator_.Name()) +
                                     " validation: " + reason);
        }

        Enter(SaveStage::BEGIN_TRANSACTION, stage);
        Value begun = UnwrapResult(invoker_.Call("begin_transaction", Value(), Priority::HIGH),
                                   "begin_transaction");
        state.transaction_id = begun.GetStringOr("transaction_id", "");
        if (state.transaction_id.empty()) {
            throw std::runtime_error("begin_transaction returned no transaction_id");
        }
        state.transaction_open = true;

        Enter(SaveStage::UPDATE_DERIVED, stage);
        if (request.update_derived) {
            request.update_derived(invoker_, state.transaction_id);
        }

        Enter(SaveStage::RENAME, stage);
        fs::rename(state.temp_path, request.target_path, ec);
        if (ec) {
            throw std::runtime_error("rename onto " + request.target_path + " failed: " + ec.message());
        }
        state.renamed = true;
        state.temp_path.clear();

        Enter(SaveStage::COMMIT, stage);
        ValueMap commit_params;
        commit_params["transaction_id"] = state.transaction_id;
        state.commit_sent = true;
        Result committed = invoker_.Call("commit_transaction", Value(std::move(commit_params)),
                                         Priority::HIGH);
        // The server rolls back a commit the database refused
        state.commit_refused = committed.IsError() &&
            GetErrorCategory(committed.GetErrorCode()) == ErrorCategory::STORAGE;
        UnwrapResult(committed, "commit_transaction");
        state.transaction_open = false;
    } catch (const std::exception& e) {
        outcome.success = false;
        outcome.failed_stage = stage;
        outcome.code = ErrorCode::ATOMIC_SAVE_FAILED;
        outcome.error = e.what();
        LOG_WARN("atomic_save", "Save of " + request.target_path + " failed at " +
                 SaveStageToString(stage) + ": " + e.what());
        if (stage >= SaveStage::WRITE_TEMP) {
            Rollback(request, state, outcome);
        }
        return outcome;
    }

    outcome.success = true;

    // The save is durable at this point; cleanup problems are only reported
    try {
        Enter(SaveStage::CLEANUP, stage);
        ApplyRetention(request, outcome);
    } catch (const std::exception& e) {
        LOG_WARN("atomic_save", "Cleanup after saving " + request.target_path +
                 " failed: " + e.what());
    }

    LOG_INFO("atomic_save", "Saved " + request.target_path);
    return outcome;
}

void AtomicSaver::Rollback(const SaveRequest& request, SaveState& state, SaveOutcome& outcome) {
    std::error_code ec;

    if (!state.temp_path.empty()) {
        fs::remove(state.temp_path, ec);
        if (ec) {
            LOG_WARN("atomic_save", "Cannot remove temp file " + state.temp_path + ": " + ec.message());
        }
    }

    if (state.transaction_open && !RollbackTransaction(state)) {
        // The commit may have landed, and the renamed file matches it if so
        outcome.needs_inspection = true;
        outcome.error += "; commit outcome unknown, " + request.target_path + " left in place";
        LOG_ERROR("atomic_save", "Commit of " + state.transaction_id + " for " +
                  request.target_path + " is unconfirmed; backup " +
                  (outcome.backup_uuid.empty() ? std::string("(none)") : outcome.backup_uuid) +
                  " kept for inspection");
        return;
    }

    if (!state.renamed) {
        // The target was never touched
        outcome.file_restored = true;
        ApplyRetention(request, outcome);
        return;
    }

    try {
        if (state.target_existed) {
            backups_.RestoreBackup(outcome.backup_uuid, request.target_path);
        } else {
            fs::remove(request.target_path, ec);
            if (ec) {
                throw std::runtime_error("cannot remove " + request.target_path + ": " + ec.message());
            }
        }
        outcome.file_restored = true;
        LOG_INFO("atomic_save", "Restored " + request.target_path + " after failed save");
        ApplyRetention(request, outcome);
    } catch (const std::exception& e) {
        // Leave the backup in place for manual recovery
        outcome.file_restored = false;
        outcome.error += "; restore failed: " + std::string(e.what());
        LOG_ERROR("atomic_save", "Cannot restore " + request.target_path + ": " + e.what());
    }
}

bool AtomicSaver::RollbackTransaction(SaveState& state) {
    state.transaction_open = false;

    ValueMap params;
    params["transaction_id"] = state.transaction_id;
    Result result;
    try {
        result = invoker_.Call("rollback_transaction", Value(std::move(params)), Priority::HIGH);
    } catch (const std::exception& e) {
        LOG_WARN("atomic_save", "Rollback of " + state.transaction_id + " not delivered: " + e.what());
        return !state.commit_sent;
    }
    if (!result.IsError()) {
        return true;
    }

    LOG_WARN("atomic_save", "Rollback of " + state.transaction_id + " failed: " +
             result.GetErrorMessage());
    // An unknown transaction after an unanswered commit may have been committed
    return !(state.commit_sent && !state.commit_refused &&
             result.GetErrorCode() == ErrorCode::TRANSACTION_NOT_FOUND);
}

void AtomicSaver::ApplyRetention(const SaveRequest& request, SaveOutcome& outcome) {
    if (request.retention != BackupRetention::DELETE_ON_SUCCESS || outcome.backup_uuid.empty()) {
        return;
    }
    if (backups_.DeleteBackup(outcome.backup_uuid)) {
        outcome.backup_retained = false;
    }
}

} // namespace dbdriver
