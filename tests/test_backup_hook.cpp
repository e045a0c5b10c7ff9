#include <gtest/gtest.h>
#include "supervisor/backup_hook.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class BackupHookTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string world_dir;
    std::string backup_dir;

    void SetUp() override {
        test_dir = (fs::temp_directory_path() /
                    ("craftkeeper-bk-" + std::to_string(getpid()))).string();
        world_dir = test_dir + "/server/world";
        backup_dir = test_dir + "/backups";
        fs::create_directories(world_dir + "/region");
        std::ofstream(world_dir + "/level.dat") << "level data";
        std::ofstream(world_dir + "/region/r.0.0.mca") << std::string(4096, 'x');
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    /// Fake archive with a chosen modification time
    void touch_backup(const std::string& name, int age_seconds) {
        fs::create_directories(backup_dir);
        std::string path = backup_dir + "/" + name;
        std::ofstream(path) << "archive";
        fs::last_write_time(path, fs::file_time_type::clock::now() - std::chrono::seconds(age_seconds));
    }

    size_t count_files() const {
        size_t n = 0;
        for (const auto& e : fs::directory_iterator(backup_dir)) {
            (void)e;
            ++n;
        }
        return n;
    }
};

TEST_F(BackupHookTest, SanitizeName) {
    EXPECT_EQ(TarBackupHook::sanitize_name("pre_restart"), "pre_restart");
    EXPECT_EQ(TarBackupHook::sanitize_name("before update!"), "before_update_");
    EXPECT_EQ(TarBackupHook::sanitize_name("../../etc"), "______etc");
    EXPECT_EQ(TarBackupHook::sanitize_name(""), "backup");
    EXPECT_EQ(TarBackupHook::sanitize_name(std::string(80, 'a')).size(), 50u);
}

TEST_F(BackupHookTest, CreateSnapshot) {
    TarBackupHook hook(world_dir, backup_dir);
    auto r = hook.create_snapshot("pre_stop", 60s);
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.error, SupervisorError::None);
    EXPECT_TRUE(fs::exists(r.path));
    EXPECT_GT(fs::file_size(r.path), 0u);

    std::string name = fs::path(r.path).filename().string();
    EXPECT_EQ(name.rfind("pre_stop_", 0), 0u);
    EXPECT_NE(name.find(".tar.gz"), std::string::npos);

    // No partial file remains
    EXPECT_EQ(count_files(), 1u);
}

TEST_F(BackupHookTest, SameSecondSnapshotsGetDistinctNames) {
    TarBackupHook hook(world_dir, backup_dir);
    auto a = hook.create_snapshot("manual", 60s);
    auto b = hook.create_snapshot("manual", 60s);
    ASSERT_TRUE(a.success);
    ASSERT_TRUE(b.success);
    EXPECT_NE(a.path, b.path);
    EXPECT_EQ(hook.list().size(), 2u);
}

TEST_F(BackupHookTest, MissingSourceFails) {
    TarBackupHook hook(test_dir + "/no-such-world", backup_dir);
    auto r = hook.create_snapshot("manual", 10s);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, SupervisorError::BackupFailed);
    EXPECT_NE(r.message.find("not found"), std::string::npos);
}

TEST_F(BackupHookTest, MissingTarFails) {
    TarBackupHook hook(world_dir, backup_dir, "/nonexistent/tar");
    auto r = hook.create_snapshot("manual", 10s);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, SupervisorError::BackupFailed);
    EXPECT_TRUE(hook.list().empty());
    EXPECT_EQ(count_files(), 0u);
}

TEST_F(BackupHookTest, SlowArchiverIsKilled) {
    std::string slow = test_dir + "/slow-tar";
    {
        std::ofstream script(slow);
        script << "#!/bin/sh\nsleep 30\n";
    }
    fs::permissions(slow, fs::perms::owner_all);

    TarBackupHook hook(world_dir, backup_dir, slow);
    auto started = std::chrono::steady_clock::now();
    auto r = hook.create_snapshot("manual", 1s);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, SupervisorError::BackupFailed);
    EXPECT_NE(r.message.find("timed out"), std::string::npos);
    EXPECT_LT(elapsed, 10s);
    EXPECT_EQ(count_files(), 0u);
}

TEST_F(BackupHookTest, ListNewestFirstAndIgnoresOtherFiles) {
    touch_backup("auto_20240101_000000.tar.gz", 300);
    touch_backup("auto_20240101_010000.tar.gz", 200);
    touch_backup("auto_20240101_020000.tar.gz", 100);
    touch_backup("notes.txt", 0);

    TarBackupHook hook(world_dir, backup_dir);
    auto backups = hook.list();
    ASSERT_EQ(backups.size(), 3u);
    EXPECT_EQ(backups[0].name, "auto_20240101_020000.tar.gz");
    EXPECT_EQ(backups[2].name, "auto_20240101_000000.tar.gz");
    EXPECT_EQ(backups[0].size_bytes, 7);
}

TEST_F(BackupHookTest, ListWithoutDirectory) {
    TarBackupHook hook(world_dir, backup_dir);
    EXPECT_TRUE(hook.list().empty());
}

TEST_F(BackupHookTest, PruneKeepsNewest) {
    for (int i = 0; i < 5; ++i) {
        touch_backup("auto_" + std::to_string(i) + ".tar.gz", 500 - i * 100);
    }

    TarBackupHook hook(world_dir, backup_dir);
    auto r = hook.prune_old(2, 10s);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.removed, 3);

    auto left = hook.list();
    ASSERT_EQ(left.size(), 2u);
    EXPECT_EQ(left[0].name, "auto_4.tar.gz");
    EXPECT_EQ(left[1].name, "auto_3.tar.gz");
}

TEST_F(BackupHookTest, PruneUnderRetentionIsNoop) {
    touch_backup("a.tar.gz", 10);
    TarBackupHook hook(world_dir, backup_dir);
    auto r = hook.prune_old(10, 10s);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.removed, 0);
    EXPECT_EQ(hook.list().size(), 1u);
}

// ── Restore ─────────────────────────────────────────────────

TEST_F(BackupHookTest, RestoreReplacesWorld) {
    TarBackupHook hook(world_dir, backup_dir);
    auto snap = hook.create_snapshot("manual", 60s);
    ASSERT_TRUE(snap.success) << snap.message;

    std::ofstream(world_dir + "/level.dat") << "corrupted";
    std::ofstream(world_dir + "/stray.txt") << "new file";

    auto r = hook.restore(fs::path(snap.path).filename().string(), 60s);
    ASSERT_TRUE(r.success) << r.message;

    std::ifstream in(world_dir + "/level.dat");
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "level data");
    EXPECT_FALSE(fs::exists(world_dir + "/stray.txt"));
    EXPECT_TRUE(fs::exists(world_dir + "/region/r.0.0.mca"));

    // No staging or replaced directories are left beside the world
    size_t entries = 0;
    for (const auto& e : fs::directory_iterator(test_dir + "/server")) {
        (void)e;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(BackupHookTest, RestoreIntoMissingWorld) {
    TarBackupHook hook(world_dir, backup_dir);
    auto snap = hook.create_snapshot("manual", 60s);
    ASSERT_TRUE(snap.success) << snap.message;

    fs::remove_all(world_dir);
    auto r = hook.restore(fs::path(snap.path).filename().string(), 60s);
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_TRUE(fs::exists(world_dir + "/level.dat"));
}

TEST_F(BackupHookTest, RestoreRejectsUnknownAndUnsafeNames) {
    TarBackupHook hook(world_dir, backup_dir);

    auto missing = hook.restore("auto_20240101_000000.tar.gz", 10s);
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.error, SupervisorError::RestoreFailed);
    EXPECT_NE(missing.message.find("not found"), std::string::npos);

    EXPECT_FALSE(hook.restore("../server.tar.gz", 10s).success);
    EXPECT_FALSE(hook.restore("notes.txt", 10s).success);
    EXPECT_FALSE(hook.restore("", 10s).success);
}

TEST_F(BackupHookTest, CorruptArchiveLeavesWorldUntouched) {
    touch_backup("auto_20240101_000000.tar.gz", 10);
    TarBackupHook hook(world_dir, backup_dir);

    auto r = hook.restore("auto_20240101_000000.tar.gz", 10s);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, SupervisorError::RestoreFailed);

    std::ifstream in(world_dir + "/level.dat");
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "level data");
}

TEST_F(BackupHookTest, ArchiveOfAnotherDirectoryIsRejected) {
    std::string other_dir = test_dir + "/server/plugins";
    fs::create_directories(other_dir);
    std::ofstream(other_dir + "/p.jar") << "jar";

    TarBackupHook other(other_dir, backup_dir);
    auto snap = other.create_snapshot("plugins", 60s);
    ASSERT_TRUE(snap.success) << snap.message;

    TarBackupHook hook(world_dir, backup_dir);
    auto r = hook.restore(fs::path(snap.path).filename().string(), 60s);
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.message.find("does not contain"), std::string::npos);
    EXPECT_TRUE(fs::exists(world_dir + "/level.dat"));
}
