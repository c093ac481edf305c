//===----------------------------------------------------------------------===//
//                         DBDriver - Unit Tests
//
// tests/unit/backup/test_backup_manager.cpp
//
// Unit tests for UUID-indexed file backups
//===----------------------------------------------------------------------===//

#include "backup/backup_manager.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

using namespace dbdriver;
namespace fs = std::filesystem;

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

static fs::path Fresh(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static void WriteText(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

static std::string ReadText(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

template <typename Fn>
static bool ThrowsBackupError(Fn&& fn) {
    try {
        fn();
    } catch (const BackupError&) {
        return true;
    }
    return false;
}

//===----------------------------------------------------------------------===//
// Backup Tests
//===----------------------------------------------------------------------===//

void TestCreateAndList() {
    std::cout << "  Testing create and list..." << std::endl;

    fs::path root = Fresh("dbdriver_test_backup_create");
    fs::path file = root / "grammar.yaml";
    WriteText(file, "rules: []\n");

    BackupManager manager((root / "backups").string());
    assert(fs::is_directory(root / "backups"));

    std::string uuid = manager.CreateBackup(file.string(), "save", {"a.txt", "b.txt"}, "before edit");
    assert(uuid.size() == 36);

    auto entries = manager.ListBackups();
    assert(entries.size() == 1);
    assert(entries[0].uuid == uuid);
    assert(entries[0].file_path == file.string());
    assert(entries[0].command == "save");
    assert(entries[0].related_files.size() == 2);
    assert(entries[0].related_files[1] == "b.txt");
    assert(entries[0].comment == "before edit");
    assert(entries[0].timestamp.size() == 19);

    // Copy named after the flattened path
    std::string copy = manager.BackupPath(entries[0]);
    assert(fs::path(copy).parent_path() == root / "backups");
    assert(fs::path(copy).filename().string().find('/') == std::string::npos);
    assert(copy.size() > uuid.size() && copy.compare(copy.size() - uuid.size(), uuid.size(), uuid) == 0);
    assert(ReadText(copy) == "rules: []\n");

    fs::remove_all(root);
    std::cout << "    PASSED" << std::endl;
}

void TestIndexPersists() {
    std::cout << "  Testing index persists across instances..." << std::endl;

    fs::path root = Fresh("dbdriver_test_backup_index");
    fs::path first = root / "one.txt";
    fs::path second = root / "two.txt";
    WriteText(first, "1");
    WriteText(second, "2");

    std::string a;
    std::string b;
    std::string c;
    {
        BackupManager manager((root / "backups").string());
        a = manager.CreateBackup(first.string());
        b = manager.CreateBackup(second.string());
        c = manager.CreateBackup(first.string());
    }

    BackupManager reopened((root / "backups").string());
    auto all = reopened.ListBackups();
    assert(all.size() == 3);
    assert(all[0].uuid == a && all[1].uuid == b && all[2].uuid == c);

    auto only_first = reopened.ListBackups(first.string());
    assert(only_first.size() == 2);
    assert(only_first[0].uuid == a);
    assert(only_first[1].uuid == c);

    auto found = reopened.GetBackup(b);
    assert(found.has_value());
    assert(found->file_path == second.string());
    assert(!reopened.GetBackup("00000000-0000-0000-0000-000000000000").has_value());

    // Index file carries a header and one line per backup
    std::string index = ReadText(root / "backups" / BackupManager::INDEX_FILE);
    assert(index.rfind("# UUID|File Path|Timestamp|Command|Related Files|Comment\n", 0) == 0);
    assert(index.find(a + "|" + first.string() + "|") != std::string::npos);

    fs::remove_all(root);
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Restore and Delete Tests
//===----------------------------------------------------------------------===//

void TestRestore() {
    std::cout << "  Testing restore..." << std::endl;

    fs::path root = Fresh("dbdriver_test_backup_restore");
    fs::path file = root / "doc.txt";
    WriteText(file, "original");

    BackupManager manager((root / "backups").string());
    std::string uuid = manager.CreateBackup(file.string());

    WriteText(file, "edited");
    manager.RestoreBackup(uuid);
    assert(ReadText(file) == "original");

    fs::path elsewhere = root / "restored" / "copy.txt";
    manager.RestoreBackup(uuid, elsewhere.string());
    assert(ReadText(elsewhere) == "original");

    // Restoring leaves the backup in place
    assert(manager.GetBackup(uuid).has_value());

    assert(ThrowsBackupError([&] { manager.RestoreBackup("missing-uuid"); }));

    fs::remove(manager.BackupPath(*manager.GetBackup(uuid)));
    assert(ThrowsBackupError([&] { manager.RestoreBackup(uuid); }));

    fs::remove_all(root);
    std::cout << "    PASSED" << std::endl;
}

void TestRestoreReplacesTarget() {
    std::cout << "  Testing restore replaces the target file..." << std::endl;

    fs::path root = Fresh("dbdriver_test_backup_replace");
    fs::path file = root / "doc.txt";
    WriteText(file, "original");

    BackupManager manager((root / "backups").string());
    std::string uuid = manager.CreateBackup(file.string());

    // A second link to the edited file keeps the edited bytes after the restore
    WriteText(file, "edited");
    fs::path reader = root / "reader.txt";
    fs::create_hard_link(file, reader);

    manager.RestoreBackup(uuid);
    assert(ReadText(file) == "original");
    assert(ReadText(reader) == "edited");
    assert(fs::hard_link_count(file) == 1);

    // Nothing staged is left beside the target
    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(root)) {
        (void)entry;
        entries++;
    }
    assert(entries == 3);  // doc.txt, reader.txt, backups/

    fs::remove_all(root);
    std::cout << "    PASSED" << std::endl;
}

void TestDelete() {
    std::cout << "  Testing delete..." << std::endl;

    fs::path root = Fresh("dbdriver_test_backup_delete");
    fs::path file = root / "doc.txt";
    WriteText(file, "content");

    BackupManager manager((root / "backups").string());
    std::string keep = manager.CreateBackup(file.string());
    std::string drop = manager.CreateBackup(file.string());
    std::string drop_path = manager.BackupPath(*manager.GetBackup(drop));

    assert(manager.DeleteBackup(drop));
    assert(!fs::exists(drop_path));
    assert(!manager.DeleteBackup(drop));

    auto entries = manager.ListBackups();
    assert(entries.size() == 1);
    assert(entries[0].uuid == keep);

    fs::remove_all(root);
    std::cout << "    PASSED" << std::endl;
}

void TestRejectedInput() {
    std::cout << "  Testing rejected input..." << std::endl;

    fs::path root = Fresh("dbdriver_test_backup_reject");
    fs::path file = root / "doc.txt";
    WriteText(file, "content");
    BackupManager manager((root / "backups").string());

    assert(ThrowsBackupError([&] { manager.CreateBackup((root / "absent.txt").string()); }));
    assert(ThrowsBackupError([&] { manager.CreateBackup(root.string()); }));
    assert(ThrowsBackupError([&] { manager.CreateBackup(file.string(), "a|b"); }));
    assert(ThrowsBackupError([&] { manager.CreateBackup(file.string(), "", {}, "two\nlines"); }));
    assert(ThrowsBackupError([&] { manager.CreateBackup(file.string(), "", {"x,y"}); }));
    assert(manager.ListBackups().empty());

    fs::remove_all(root);
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Backup Manager Unit Tests ===" << std::endl;

    std::cout << "\n1. Backups:" << std::endl;
    TestCreateAndList();
    TestIndexPersists();

    std::cout << "\n2. Restore and Delete:" << std::endl;
    TestRestore();
    TestRestoreReplacesTarget();
    TestDelete();
    TestRejectedInput();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
