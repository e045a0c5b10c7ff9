#include "supervisor/backup_hook.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr size_t kMaxNameLength = 50;
constexpr auto kPollInterval = std::chrono::milliseconds(100);

std::string timestamp_now() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

bool has_extension(const std::string& name) {
    const std::string ext = TarBackupHook::kExtension;
    return name.size() > ext.size() &&
           name.compare(name.size() - ext.size(), ext.size(), ext) == 0;
}

struct TarRun {
    bool finished = false;      // false when tar was killed or never started
    int exit_code = -1;
    std::string error;          // fork failure
};

/// Run tar in its own process group and kill the group at the deadline
TarRun run_tar(const std::vector<const char*>& argv, std::chrono::seconds timeout) {
    TarRun run;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    pid_t pid = fork();
    if (pid < 0) {
        run.error = std::string("fork failed: ") + std::strerror(errno);
        return run;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    // Parent process
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            run.finished = true;
            break;
        }
        if (r < 0 && errno != EINTR) {
            break;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    if (!run.finished) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        return run;
    }

    run.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    return run;
}

std::chrono::system_clock::time_point to_system_time(fs::file_time_type ft) {
    // file_time_type has no portable conversion in C++17
    auto now_fs = fs::file_time_type::clock::now();
    auto now_sys = std::chrono::system_clock::now();
    return now_sys + std::chrono::duration_cast<std::chrono::system_clock::duration>(ft - now_fs);
}

}

TarBackupHook::TarBackupHook(const std::string& source_dir, const std::string& backup_dir,
                             const std::string& tar_path)
    : source_dir_(source_dir), backup_dir_(backup_dir), tar_path_(tar_path) {}

std::string TarBackupHook::sanitize_name(const std::string& reason) {
    std::string out;
    for (char c : reason) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_') {
            out += c;
        } else {
            out += '_';
        }
        if (out.size() >= kMaxNameLength) break;
    }
    if (out.empty()) return "backup";
    return out;
}

std::string TarBackupHook::next_archive_path(const std::string& reason) const {
    std::string base = backup_dir_ + "/" + sanitize_name(reason) + "_" + timestamp_now();
    std::string path = base + kExtension;
    for (int i = 1; fs::exists(path); ++i) {
        path = base + "_" + std::to_string(i) + kExtension;
    }
    return path;
}

BackupHook::BackupResult TarBackupHook::create_snapshot(const std::string& reason,
                                                        std::chrono::seconds timeout) {
    std::error_code ec;
    if (!fs::is_directory(source_dir_, ec)) {
        return {false, SupervisorError::BackupFailed,
                "source directory not found: " + source_dir_, ""};
    }

    fs::create_directories(backup_dir_, ec);
    if (ec) {
        return {false, SupervisorError::BackupFailed,
                "cannot create " + backup_dir_ + ": " + ec.message(), ""};
    }

    std::string archive = next_archive_path(reason);
    std::string partial = archive + ".part";

    fs::path source(source_dir_);
    if (!source.has_filename()) source = source.parent_path();
    std::string parent = source.parent_path().string();
    std::string leaf = source.filename().string();
    if (parent.empty()) parent = ".";

    std::vector<const char*> argv = {
        tar_path_.c_str(), "-czf", partial.c_str(), "-C", parent.c_str(), leaf.c_str(), nullptr
    };

    auto started = std::chrono::steady_clock::now();
    TarRun run = run_tar(argv, timeout);
    if (!run.finished) {
        fs::remove(partial, ec);
        if (!run.error.empty()) {
            return {false, SupervisorError::BackupFailed, run.error, ""};
        }
        spdlog::error("Backup '{}' timed out after {}s, tar killed", reason, timeout.count());
        return {false, SupervisorError::BackupFailed,
                "backup timed out after " + std::to_string(timeout.count()) + "s", ""};
    }

    if (run.exit_code != 0) {
        fs::remove(partial, ec);
        return {false, SupervisorError::BackupFailed,
                "tar exited with status " + std::to_string(run.exit_code), ""};
    }

    fs::rename(partial, archive, ec);
    if (ec) {
        fs::remove(partial, ec);
        return {false, SupervisorError::BackupFailed, "cannot finalize " + archive, ""};
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    auto size = fs::file_size(archive, ec);
    spdlog::info("Created backup {} ({:.1f} MB in {} ms)", fs::path(archive).filename().string(),
                 ec ? 0.0 : static_cast<double>(size) / (1024.0 * 1024.0), elapsed.count());

    return {true, SupervisorError::None, "", archive};
}

std::vector<BackupInfo> TarBackupHook::list() const {
    std::vector<BackupInfo> backups;
    std::error_code ec;
    if (!fs::is_directory(backup_dir_, ec)) return backups;

    for (const auto& entry : fs::directory_iterator(backup_dir_, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        std::string name = entry.path().filename().string();
        if (!has_extension(name)) continue;

        BackupInfo info;
        info.name = name;
        info.path = entry.path().string();
        auto size = entry.file_size(ec);
        info.size_bytes = ec ? 0 : static_cast<int64_t>(size);
        auto mtime = entry.last_write_time(ec);
        if (!ec) info.created = to_system_time(mtime);
        backups.push_back(std::move(info));
    }

    std::sort(backups.begin(), backups.end(), [](const BackupInfo& a, const BackupInfo& b) {
        if (a.created != b.created) return a.created > b.created;
        return a.name > b.name;
    });
    return backups;
}

BackupHook::PruneResult TarBackupHook::prune_old(int retention, std::chrono::seconds timeout) {
    PruneResult result;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    auto backups = list();
    if (static_cast<int>(backups.size()) <= retention) {
        result.success = true;
        return result;
    }

    for (size_t i = static_cast<size_t>(std::max(retention, 0)); i < backups.size(); ++i) {
        if (std::chrono::steady_clock::now() >= deadline) {
            result.error = SupervisorError::BackupFailed;
            result.message = "pruning timed out";
            return result;
        }
        std::error_code ec;
        if (fs::remove(backups[i].path, ec)) {
            spdlog::info("Removed old backup {}", backups[i].name);
            ++result.removed;
        } else {
            spdlog::warn("Could not remove {}: {}", backups[i].name, ec.message());
            result.error = SupervisorError::BackupFailed;
            result.message = "could not remove " + backups[i].name;
        }
    }

    result.success = result.error == SupervisorError::None;
    return result;
}

BackupHook::RestoreResult TarBackupHook::restore(const std::string& name, std::chrono::seconds timeout) {
    if (!has_extension(name) || name.find('/') != std::string::npos || name.front() == '.') {
        return {false, SupervisorError::RestoreFailed, "not a backup name: " + name};
    }

    std::error_code ec;
    std::string archive = backup_dir_ + "/" + name;
    if (!fs::is_regular_file(archive, ec)) {
        return {false, SupervisorError::RestoreFailed, "backup not found: " + name};
    }

    fs::path source(source_dir_);
    if (!source.has_filename()) source = source.parent_path();
    fs::path parent = source.parent_path();
    if (parent.empty()) parent = ".";
    std::string leaf = source.filename().string();

    fs::create_directories(parent, ec);
    std::string stamp = timestamp_now();
    fs::path staging = parent / (".restore_" + leaf + "_" + stamp);
    fs::remove_all(staging, ec);
    fs::create_directories(staging, ec);
    if (ec) {
        return {false, SupervisorError::RestoreFailed,
                "cannot create " + staging.string() + ": " + ec.message()};
    }

    std::string staging_str = staging.string();
    std::vector<const char*> argv = {
        tar_path_.c_str(), "-xzf", archive.c_str(), "-C", staging_str.c_str(), nullptr
    };

    TarRun run = run_tar(argv, timeout);
    if (!run.finished || run.exit_code != 0) {
        fs::remove_all(staging, ec);
        if (!run.error.empty()) return {false, SupervisorError::RestoreFailed, run.error};
        if (!run.finished) {
            spdlog::error("Restore of {} timed out after {}s, tar killed", name, timeout.count());
            return {false, SupervisorError::RestoreFailed,
                    "restore timed out after " + std::to_string(timeout.count()) + "s"};
        }
        return {false, SupervisorError::RestoreFailed,
                "tar exited with status " + std::to_string(run.exit_code)};
    }

    fs::path extracted = staging / leaf;
    if (!fs::is_directory(extracted, ec)) {
        fs::remove_all(staging, ec);
        return {false, SupervisorError::RestoreFailed, name + " does not contain " + leaf + "/"};
    }

    // Swap the extracted tree into place, keeping the old one until the swap succeeded
    fs::path previous = parent / (".replaced_" + leaf + "_" + stamp);
    bool had_source = fs::exists(source, ec);
    if (had_source) {
        fs::rename(source, previous, ec);
        if (ec) {
            fs::remove_all(staging, ec);
            return {false, SupervisorError::RestoreFailed,
                    "cannot move " + source.string() + " aside: " + ec.message()};
        }
    }

    fs::rename(extracted, source, ec);
    if (ec) {
        std::string why = ec.message();
        if (had_source) fs::rename(previous, source, ec);
        fs::remove_all(staging, ec);
        return {false, SupervisorError::RestoreFailed, "cannot move restored data into place: " + why};
    }

    fs::remove_all(staging, ec);
    if (had_source) {
        fs::remove_all(previous, ec);
        if (ec) spdlog::warn("Could not remove {}: {}", previous.string(), ec.message());
    }

    spdlog::info("Restored {} into {}", name, source.string());
    return {true, SupervisorError::None, "restored " + name};
}
