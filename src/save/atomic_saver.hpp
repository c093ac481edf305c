//===----------------------------------------------------------------------===//
//                         DBDriver
//
// save/atomic_saver.hpp
//
// All-or-nothing update of a file together with its database rows
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "backup/backup_manager.hpp"
#include "client/method_invoker.hpp"
#include "save/content_validator.hpp"

namespace dbdriver {

enum class SaveStage : uint8_t {
    NONE = 0,
    VALIDATE,
    BACKUP,
    WRITE_TEMP,
    REVALIDATE,
    BEGIN_TRANSACTION,
    UPDATE_DERIVED,
    RENAME,
    COMMIT,
    CLEANUP
};

const char* SaveStageToString(SaveStage stage);

enum class BackupRetention : uint8_t {
    DELETE_ON_SUCCESS = 0,
    KEEP = 1
};

// Replaces the derived rows for the file inside the open transaction.
// Signals failure by throwing.
using DerivedUpdate = std::function<void(MethodInvoker& invoker,
                                         const std::string& transaction_id)>;

struct SaveRequest {
    std::string target_path;
    std::string content;
    DerivedUpdate update_derived;
    BackupRetention retention = BackupRetention::DELETE_ON_SUCCESS;
    std::string command;  // recorded in the backup index
};

struct SaveOutcome {
    bool success = false;
    SaveStage failed_stage = SaveStage::NONE;
    ErrorCode code = ErrorCode::OK;
    std::string error;
    std::string backup_uuid;    // empty when the target did not exist
    bool backup_retained = false;
    bool file_restored = false;
    // Commit sent but never confirmed; file and backup left as they are
    bool needs_inspection = false;

    Value ToValue() const;
};

class AtomicSaver {
public:
    // Called before each stage starts. Throwing fails that stage.
    using StageHook = std::function<void(SaveStage stage)>;

    AtomicSaver(MethodInvoker& invoker,
                BackupManager& backups,
                const ContentValidator& validator);

    // Non-copyable
    AtomicSaver(const AtomicSaver&) = delete;
    AtomicSaver& operator=(const AtomicSaver&) = delete;

    // Never throws for a stage failure; the outcome names the stage
    SaveOutcome Save(const SaveRequest& request);

    void SetBeforeStageHook(StageHook hook) { before_stage_ = std::move(hook); }

private:
    // Per-save progress needed to undo a failed attempt
    struct SaveState {
        bool target_existed = false;
        std::string temp_path;
        std::string transaction_id;
        bool transaction_open = false;
        bool renamed = false;
        bool commit_sent = false;
        bool commit_refused = false;
    };

    void Enter(SaveStage stage, SaveStage& current);
    void Rollback(const SaveRequest& request, SaveState& state, SaveOutcome& outcome);
    // False when the transaction may already be committed
    bool RollbackTransaction(SaveState& state);
    void ApplyRetention(const SaveRequest& request, SaveOutcome& outcome);

private:
    MethodInvoker& invoker_;
    BackupManager& backups_;
    const ContentValidator& validator_;
    StageHook before_stage_;
};

} // namespace dbdriver
