#include "supervisor/process_handle.hpp"
#include "supervisor/proc_stat.hpp"
#include "core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <sys/file.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(100);
constexpr auto kKillTimeout = std::chrono::milliseconds(5000);

std::string iso_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

/// Signal the whole process group when the server leads its own group
int signal_server(pid_t pid, int sig) {
    if (getpgid(pid) == pid) {
        return kill(-pid, sig);
    }
    return kill(pid, sig);
}

}

// ── LaunchSpec ──────────────────────────────────────────────

LaunchSpec LaunchSpec::from_config(const Config& config) {
    const auto& s = config.data().server;

    LaunchSpec spec;
    spec.executable = s.java_path;
    spec.args.push_back("-Xms" + s.memory_min);
    spec.args.push_back("-Xmx" + s.memory_max);

    std::istringstream extra(s.java_args);
    std::string arg;
    while (extra >> arg) {
        spec.args.push_back(arg);
    }

    spec.args.push_back("-jar");
    spec.args.push_back(s.jar_name);
    spec.args.push_back("nogui");
    spec.working_dir = config.server_dir();
    spec.console_log = config.console_log_path();
    return spec;
}

// ── ProcessHandle ───────────────────────────────────────────

ProcessHandle::ProcessHandle(const std::string& state_dir, const std::string& stop_command)
    : state_dir_(state_dir), stop_command_(stop_command) {}

ProcessHandle::~ProcessHandle() {
    if (own_child_ && is_alive()) {
        spdlog::warn("Supervisor exiting with server pid {} still running, killing it", process_.pid);
        force_kill();
    }
    if (control_fd_ >= 0) {
        close(control_fd_);
        control_fd_ = -1;
    }
    release_lock();
}

ProcessHandle::LockStatus ProcessHandle::acquire_lock(std::string& err) {
    if (lock_fd_ >= 0) return LockStatus::Acquired;

    std::error_code ec;
    fs::create_directories(state_dir_, ec);
    if (ec) {
        err = "cannot create state directory " + state_dir_ + ": " + ec.message();
        return LockStatus::Error;
    }

    int fd = open(lock_path().c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        err = "cannot open " + lock_path() + ": " + std::strerror(errno);
        return LockStatus::Error;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int saved = errno;
        close(fd);
        if (saved == EWOULDBLOCK) {
            return LockStatus::Held;
        }
        err = "cannot lock " + lock_path() + ": " + std::strerror(saved);
        return LockStatus::Error;
    }

    lock_fd_ = fd;
    return LockStatus::Acquired;
}

void ProcessHandle::release_lock() {
    if (lock_fd_ < 0) return;
    flock(lock_fd_, LOCK_UN);
    close(lock_fd_);
    lock_fd_ = -1;
}

std::optional<ServerProcess> ProcessHandle::read_record() const {
    std::ifstream in(record_path());
    if (!in.is_open()) return std::nullopt;

    try {
        json j = json::parse(in);
        ServerProcess rec;
        rec.pid = j.value("pid", -1);
        rec.start_ticks = j.value("start_ticks", uint64_t{0});
        rec.lock_owned = j.value("lock_owned", false);
        rec.started_at = std::chrono::system_clock::from_time_t(
            static_cast<std::time_t>(j.value("started_at_epoch", int64_t{0})));
        if (rec.pid <= 0) return std::nullopt;
        return rec;
    } catch (const json::exception& e) {
        spdlog::warn("Ignoring unreadable process record {}: {}", record_path(), e.what());
        return std::nullopt;
    }
}

bool ProcessHandle::write_record() const {
    json j = {
        {"pid", process_.pid},
        {"started_at", iso_time(process_.started_at)},
        {"started_at_epoch", static_cast<int64_t>(
            std::chrono::system_clock::to_time_t(process_.started_at))},
        {"start_ticks", process_.start_ticks},
        {"supervisor_pid", static_cast<int>(getpid())},
        {"lock_owned", process_.lock_owned}
    };

    std::string tmp = record_path() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) return false;
        out << j.dump(2) << "\n";
        if (!out.good()) return false;
    }
    std::error_code ec;
    fs::rename(tmp, record_path(), ec);
    return !ec;
}

void ProcessHandle::remove_record() const {
    std::error_code ec;
    fs::remove(record_path(), ec);
}

bool ProcessHandle::matches_identity(pid_t pid, uint64_t start_ticks) {
    auto stat = read_proc_stat(pid);
    if (!stat) return false;
    if (stat->state == 'Z' || stat->state == 'X') return false;
    if (start_ticks != 0 && stat->start_ticks != start_ticks) return false;
    return true;
}

ProcessControl::LaunchResult ProcessHandle::launch(const LaunchSpec& spec) {
    if (is_alive()) {
        return {false, SupervisorError::AlreadyRunning,
                "server already running (pid " + std::to_string(process_.pid) + ")", process_};
    }
    if (spec.executable.empty()) {
        return {false, SupervisorError::LaunchFailed, "no executable configured", {}};
    }

    std::string err;
    LockStatus lock = acquire_lock(err);
    if (lock == LockStatus::Held) {
        auto rec = read_record();
        if (rec && matches_identity(rec->pid, rec->start_ticks)) {
            return {false, SupervisorError::AlreadyRunning,
                    "server already running under another supervisor (pid " +
                    std::to_string(rec->pid) + ")", *rec};
        }
        return {false, SupervisorError::LockUnavailable,
                "process lock " + lock_path() + " is held by another supervisor", {}};
    }
    if (lock == LockStatus::Error) {
        return {false, SupervisorError::LockUnavailable, err, {}};
    }

    // A previous supervisor may have died and left its server running
    if (auto rec = read_record()) {
        if (matches_identity(rec->pid, rec->start_ticks)) {
            release_lock();
            return {false, SupervisorError::AlreadyRunning,
                    "server pid " + std::to_string(rec->pid) +
                    " from a previous supervisor is still running", *rec};
        }
        spdlog::info("Removing stale process record for pid {}", rec->pid);
        remove_record();
    }

    if (!spec.console_log.empty()) {
        std::error_code ec;
        fs::create_directories(fs::path(spec.console_log).parent_path(), ec);
    }

    int control[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, control) != 0) {
        release_lock();
        return {false, SupervisorError::LaunchFailed,
                std::string("socketpair failed: ") + std::strerror(errno), {}};
    }

    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close(control[0]);
        close(control[1]);
        release_lock();
        return {false, SupervisorError::LaunchFailed,
                std::string("pipe failed: ") + std::strerror(saved), {}};
    }

    // Build argv before forking; the child may only make async-signal-safe calls
    std::vector<const char*> argv;
    argv.push_back(spec.executable.c_str());
    for (const auto& arg : spec.args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);
    const char* log_path = spec.console_log.empty() ? "/dev/null" : spec.console_log.c_str();
    const char* work_dir = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(control[0]);
        close(control[1]);
        close(status_pipe[0]);
        close(status_pipe[1]);
        release_lock();
        return {false, SupervisorError::LaunchFailed,
                std::string("fork failed: ") + std::strerror(saved), {}};
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        dup2(control[1], STDIN_FILENO);
        int out = open(log_path, O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (out >= 0) {
            dup2(out, STDOUT_FILENO);
            dup2(out, STDERR_FILENO);
        }

        int child_errno = 0;
        if (work_dir && chdir(work_dir) != 0) {
            child_errno = errno;
        } else {
            execvp(argv[0], const_cast<char* const*>(argv.data()));
            child_errno = errno;
        }

        // Report the failure through the close-on-exec pipe
        ssize_t unused = write(status_pipe[1], &child_errno, sizeof(child_errno));
        (void)unused;
        _exit(127);
    }

    // Parent process
    close(control[1]);
    close(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n > 0) {
        int status = 0;
        waitpid(pid, &status, 0);
        close(control[0]);
        release_lock();
        return {false, SupervisorError::LaunchFailed,
                "cannot start " + spec.executable + ": " + std::strerror(child_errno), {}};
    }

    process_ = ServerProcess{};
    process_.pid = pid;
    process_.started_at = std::chrono::system_clock::now();
    process_.lock_owned = true;
    if (auto stat = read_proc_stat(pid)) {
        process_.start_ticks = stat->start_ticks;
    }
    own_child_ = true;
    control_fd_ = control[0];
    last_exit_status_ = -1;

    if (!write_record()) {
        spdlog::warn("Could not write process record {}", record_path());
    }

    spdlog::info("Launched {} (pid {})", spec.executable, pid);
    return {true, SupervisorError::None, "", process_};
}

bool ProcessHandle::is_alive() {
    if (process_.pid <= 0) return false;

    if (own_child_) {
        int status = 0;
        pid_t result = waitpid(process_.pid, &status, WNOHANG);
        if (result == process_.pid) {
            if (WIFEXITED(status)) {
                last_exit_status_ = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                last_exit_status_ = 128 + WTERMSIG(status);
            }
            on_exit_confirmed();
            return false;
        }
    }

    if (!matches_identity(process_.pid, process_.start_ticks)) {
        on_exit_confirmed();
        return false;
    }
    return true;
}

void ProcessHandle::on_exit_confirmed() {
    if (control_fd_ >= 0) {
        close(control_fd_);
        control_fd_ = -1;
    }
    remove_record();
    release_lock();
    process_ = ServerProcess{};
    own_child_ = false;
}

bool ProcessHandle::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!is_alive()) return true;
        std::this_thread::sleep_for(kPollInterval);
    }
    return !is_alive();
}

bool ProcessHandle::force_kill() {
    pid_t pid = process_.pid;
    if (pid <= 0) return true;

    if (signal_server(pid, SIGKILL) != 0 && errno != ESRCH) {
        spdlog::error("Cannot kill server pid {}: {}", pid, std::strerror(errno));
        return false;
    }
    if (!wait_for_exit(kKillTimeout)) {
        spdlog::error("Server pid {} survived SIGKILL", pid);
        return false;
    }
    return true;
}

ProcessControl::StopResult ProcessHandle::stop(bool graceful, std::chrono::milliseconds timeout) {
    if (!is_alive()) {
        return {false, SupervisorError::NotRunning, "server is not running"};
    }
    pid_t pid = process_.pid;

    if (!graceful) {
        if (force_kill()) {
            return {true, SupervisorError::None, "server killed"};
        }
        return {false, SupervisorError::StopTimedOut, "force termination failed"};
    }

    // Ask politely: console stop command, or SIGTERM when there is no channel
    bool asked = control_fd_ >= 0 && send_command(stop_command_).success;
    if (!asked && signal_server(pid, SIGTERM) != 0 && errno != ESRCH) {
        spdlog::warn("Cannot send SIGTERM to server pid {}: {}", pid, std::strerror(errno));
    }

    if (wait_for_exit(timeout)) {
        return {true, SupervisorError::None, "server stopped gracefully"};
    }

    spdlog::warn("Server pid {} did not stop within {} ms, forcing termination", pid, timeout.count());
    if (force_kill()) {
        return {true, SupervisorError::StopTimedOut, "server force stopped after timeout"};
    }
    return {false, SupervisorError::StopTimedOut, "force termination failed"};
}

ProcessControl::CommandResult ProcessHandle::send_command(const std::string& text) {
    if (!is_alive()) {
        return {false, SupervisorError::NotRunning};
    }
    if (control_fd_ < 0) {
        // Adopted processes have no console channel
        return {false, SupervisorError::WriteFailed};
    }

    std::string line = text + "\n";
    size_t total = 0;
    while (total < line.size()) {
        ssize_t n = ::send(control_fd_, line.data() + total, line.size() - total,
                           MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            spdlog::warn("Write to server console failed: {}", std::strerror(errno));
            return {false, SupervisorError::WriteFailed};
        }
        total += static_cast<size_t>(n);
    }
    return {true, SupervisorError::None};
}

bool ProcessHandle::adopt() {
    if (process_.pid > 0) return is_alive();

    auto rec = read_record();
    if (!rec) return false;

    std::string err;
    if (acquire_lock(err) != LockStatus::Acquired) {
        // Either another supervisor owns it or the lock file is unusable
        return false;
    }

    if (!matches_identity(rec->pid, rec->start_ticks)) {
        spdlog::info("Removing stale process record for pid {}", rec->pid);
        remove_record();
        release_lock();
        return false;
    }

    process_ = *rec;
    process_.lock_owned = true;
    own_child_ = false;
    control_fd_ = -1;
    last_exit_status_ = -1;
    if (!write_record()) {
        spdlog::warn("Could not update process record {}", record_path());
    }

    spdlog::info("Adopted running server pid {}", process_.pid);
    return true;
}

std::optional<ServerProcess> ProcessHandle::current() const {
    if (process_.pid <= 0) return std::nullopt;
    return process_;
}
