//===----------------------------------------------------------------------===//
//                         DBDriver
//
// backup/backup_manager.cpp
//
// Backup manager implementation
//===----------------------------------------------------------------------===//

#include "backup/backup_manager.hpp"
#include "logging/logger.hpp"
#include "utils/uuid.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>

namespace dbdriver {

namespace fs = std::filesystem;

namespace {

std::vector<std::string> Split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

std::string Join(const std::vector<std::string>& parts, char sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

// Index fields cannot carry the separators
void CheckField(const std::string& name, const std::string& value) {
    if (value.find_first_of("|\n\r") != std::string::npos) {
        throw BackupError(name + " must not contain '|' or line breaks");
    }
}

std::string ModificationStamp(const std::string& path) {
    struct stat st;
    std::time_t t = std::time(nullptr);
    if (::stat(path.c_str(), &st) == 0) {
        t = st.st_mtime;
    }
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H-%M-%S", &tm_buf);
    return stamp;
}

} // namespace

BackupManager::BackupManager(std::string backup_dir)
    : backup_dir_(std::move(backup_dir)) {
    EnsureDirectory();
}

void BackupManager::EnsureDirectory() const {
    std::error_code ec;
    fs::create_directories(backup_dir_, ec);
    if (ec) {
        throw BackupError("cannot create backup directory " + backup_dir_ + ": " + ec.message());
    }
}

std::string BackupManager::BackupPath(const BackupEntry& entry) const {
    std::string name = entry.file_path;
    std::replace(name.begin(), name.end(), '/', '_');
    std::replace(name.begin(), name.end(), '\\', '_');
    name.erase(0, name.find_first_not_of('_'));
    return (fs::path(backup_dir_) / (name + "-" + entry.uuid)).string();
}

std::string BackupManager::CreateBackup(const std::string& file_path,
                                        const std::string& command,
                                        const std::vector<std::string>& related_files,
                                        const std::string& comment) {
    CheckField("file path", file_path);
    CheckField("command", command);
    CheckField("comment", comment);
    for (const auto& related : related_files) {
        CheckField("related file", related);
        if (related.find(',') != std::string::npos) {
            throw BackupError("related file must not contain ','");
        }
    }

    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec)) {
        throw BackupError("file not found: " + file_path);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    EnsureDirectory();

    BackupEntry entry;
    entry.uuid = GenerateUuid();
    entry.file_path = file_path;
    entry.timestamp = ModificationStamp(file_path);
    entry.command = command;
    entry.related_files = related_files;
    entry.comment = comment;

    std::string target = BackupPath(entry);
    fs::copy_file(file_path, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw BackupError("cannot copy " + file_path + " to " + target + ": " + ec.message());
    }

    auto entries = LoadIndex();
    entries.push_back(entry);
    SaveIndex(entries);

    LOG_INFO("backup", "Backup created: " + target + " (" + entry.uuid + ")");
    return entry.uuid;
}

void BackupManager::RestoreBackup(const std::string& uuid, const std::string& target_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto entries = LoadIndex();
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const BackupEntry& e) { return e.uuid == uuid; });
    if (it == entries.end()) {
        throw BackupError("backup " + uuid + " not found");
    }

    std::string source = BackupPath(*it);
    std::string target = target_path.empty() ? it->file_path : target_path;

    std::error_code ec;
    if (!fs::exists(source, ec)) {
        throw BackupError("backup file missing: " + source);
    }

    fs::path parent = fs::path(target).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    // Stage beside the target so the rename replaces it in one step
    fs::path staged = parent /
                      ("." + fs::path(target).filename().string() + ".restore-" +
                       GenerateUuid().substr(0, 8));
    fs::copy_file(source, staged, fs::copy_options::overwrite_existing, ec);
    if (!ec) {
        fs::rename(staged, target, ec);
    }
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(staged, cleanup_ec);
        if (cleanup_ec) {
            LOG_WARN("backup", "Cannot remove staged restore " + staged.string() + ": " +
                     cleanup_ec.message());
        }
        throw BackupError("cannot restore " + target + " from " + uuid + ": " + ec.message());
    }

    LOG_INFO("backup", "File restored: " + target + " from " + uuid);
}

bool BackupManager::DeleteBackup(const std::string& uuid) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto entries = LoadIndex();
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const BackupEntry& e) { return e.uuid == uuid; });
    if (it == entries.end()) {
        return false;
    }

    std::error_code ec;
    fs::remove(BackupPath(*it), ec);
    if (ec) {
        LOG_WARN("backup", "Cannot remove backup file for " + uuid + ": " + ec.message());
    }

    entries.erase(it);
    SaveIndex(entries);

    LOG_INFO("backup", "Backup deleted: " + uuid);
    return true;
}

std::vector<BackupEntry> BackupManager::ListBackups(const std::string& file_path) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto entries = LoadIndex();
    if (file_path.empty()) {
        return entries;
    }

    std::vector<BackupEntry> matching;
    for (auto& entry : entries) {
        if (entry.file_path == file_path) {
            matching.push_back(std::move(entry));
        }
    }
    return matching;
}

std::optional<BackupEntry> BackupManager::GetBackup(const std::string& uuid) const {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& entry : LoadIndex()) {
        if (entry.uuid == uuid) {
            return entry;
        }
    }
    return std::nullopt;
}

std::vector<BackupEntry> BackupManager::LoadIndex() const {
    std::vector<BackupEntry> entries;

    std::ifstream in(fs::path(backup_dir_) / INDEX_FILE);
    if (!in) {
        return entries;
    }

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto parts = Split(line, '|');
        if (parts.size() < 3) {
            LOG_WARN("backup", "Skipping malformed index line: " + line);
            continue;
        }

        BackupEntry entry;
        entry.uuid = parts[0];
        entry.file_path = parts[1];
        entry.timestamp = parts[2];
        if (parts.size() > 3) entry.command = parts[3];
        if (parts.size() > 4 && !parts[4].empty()) entry.related_files = Split(parts[4], ',');
        if (parts.size() > 5) entry.comment = parts[5];
        entries.push_back(std::move(entry));
    }
    return entries;
}

void BackupManager::SaveIndex(const std::vector<BackupEntry>& entries) const {
    fs::path index_path = fs::path(backup_dir_) / INDEX_FILE;
    fs::path temp_path = index_path;
    temp_path += ".tmp";

    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out) {
            throw BackupError("cannot write backup index " + temp_path.string());
        }
        out << "# UUID|File Path|Timestamp|Command|Related Files|Comment\n";
        for (const auto& entry : entries) {
            out << entry.uuid << '|' << entry.file_path << '|' << entry.timestamp << '|'
                << entry.command << '|' << Join(entry.related_files, ',') << '|'
                << entry.comment << '\n';
        }
        out.flush();
        if (!out) {
            throw BackupError("cannot write backup index " + temp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(temp_path, index_path, ec);
    if (ec) {
        throw BackupError("cannot replace backup index: " + ec.message());
    }
}

} // namespace dbdriver
