#pragma once

#include "supervisor/errors.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct BackupInfo {
    std::string name;
    std::string path;
    int64_t size_bytes = 0;
    std::chrono::system_clock::time_point created;
};

/// Called by the watchdog before restarts and planned stops.
/// Implementations must return within the given timeout.
class BackupHook {
public:
    virtual ~BackupHook() = default;

    struct BackupResult {
        bool success = false;
        SupervisorError error = SupervisorError::None;
        std::string message;
        std::string path;
    };

    struct RestoreResult {
        bool success = false;
        SupervisorError error = SupervisorError::None;
        std::string message;
    };

    struct PruneResult {
        bool success = false;
        SupervisorError error = SupervisorError::None;
        std::string message;
        int removed = 0;
    };

    virtual BackupResult create_snapshot(const std::string& reason, std::chrono::seconds timeout) = 0;

    /// Keep the newest `retention` snapshots, delete the rest
    virtual PruneResult prune_old(int retention, std::chrono::seconds timeout) = 0;

    /// Newest first
    virtual std::vector<BackupInfo> list() const = 0;

    /// Replace the live data with the named snapshot. The caller makes sure
    /// the server is stopped and a safety snapshot exists.
    virtual RestoreResult restore(const std::string& name, std::chrono::seconds timeout) = 0;
};

/// Archives a directory into <backup_dir>/<reason>_<YYYYmmdd_HHMMSS>.tar.gz
/// by running tar(1). tar is killed when it exceeds the timeout.
/// Restores extract into a staging directory beside the source and swap it in,
/// so a failed or timed out extraction leaves the live data untouched.
class TarBackupHook : public BackupHook {
public:
    static constexpr const char* kExtension = ".tar.gz";

    TarBackupHook(const std::string& source_dir, const std::string& backup_dir,
                  const std::string& tar_path = "tar");

    BackupResult create_snapshot(const std::string& reason, std::chrono::seconds timeout) override;
    PruneResult prune_old(int retention, std::chrono::seconds timeout) override;
    std::vector<BackupInfo> list() const override;
    RestoreResult restore(const std::string& name, std::chrono::seconds timeout) override;

    const std::string& source_dir() const { return source_dir_; }
    const std::string& backup_dir() const { return backup_dir_; }

    /// Replace characters that are unsafe in file names; empty becomes "backup"
    static std::string sanitize_name(const std::string& reason);

private:
    std::string source_dir_;
    std::string backup_dir_;
    std::string tar_path_;

    std::string next_archive_path(const std::string& reason) const;
};
