//===----------------------------------------------------------------------===//
//                         DBDriver
//
// backup/backup_manager.hpp
//
// UUID-indexed file backups
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <optional>
#include <stdexcept>

namespace dbdriver {

class BackupError : public std::runtime_error {
public:
    explicit BackupError(const std::string& message)
        : std::runtime_error(message) {}
};

struct BackupEntry {
    std::string uuid;
    std::string file_path;
    std::string timestamp;      // source mtime, "%Y-%m-%dT%H-%M-%S" UTC
    std::string command;
    std::vector<std::string> related_files;
    std::string comment;
};

// Copies live in the backup directory as "<path with / as _>-<uuid>".
// backup_index.txt holds one line per copy:
//   UUID|File Path|Timestamp|Command|Related Files|Comment
class BackupManager {
public:
    static constexpr const char* INDEX_FILE = "backup_index.txt";

    explicit BackupManager(std::string backup_dir);

    // Non-copyable
    BackupManager(const BackupManager&) = delete;
    BackupManager& operator=(const BackupManager&) = delete;

    // Copy file_path into the backup directory. Returns the backup uuid.
    // Throws BackupError when the file is missing or cannot be copied.
    std::string CreateBackup(const std::string& file_path,
                             const std::string& command = "",
                             const std::vector<std::string>& related_files = {},
                             const std::string& comment = "");

    // Replace the original path, or target_path when given, with the backup.
    // The copy is staged beside the target and renamed over it.
    void RestoreBackup(const std::string& uuid, const std::string& target_path = "");

    // False when the uuid is not in the index
    bool DeleteBackup(const std::string& uuid);

    // All entries, or those for one file, oldest first
    std::vector<BackupEntry> ListBackups(const std::string& file_path = "") const;

    std::optional<BackupEntry> GetBackup(const std::string& uuid) const;

    // Location of the stored copy for an entry
    std::string BackupPath(const BackupEntry& entry) const;

    const std::string& GetBackupDir() const { return backup_dir_; }

private:
    std::vector<BackupEntry> LoadIndex() const;
    void SaveIndex(const std::vector<BackupEntry>& entries) const;
    void EnsureDirectory() const;

private:
    std::string backup_dir_;
    mutable std::mutex mutex_;
};

} // namespace dbdriver
