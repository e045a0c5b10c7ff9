#pragma once

#include "supervisor/errors.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

class Config;

/// How to start the supervised server
struct LaunchSpec {
    std::string executable;
    std::vector<std::string> args;
    std::string working_dir;    // empty = inherit
    std::string console_log;    // stdout/stderr are appended here; empty = /dev/null

    /// java <memory flags> <java_args> -jar <jar> nogui, run inside server.dir
    static LaunchSpec from_config(const Config& config);
};

struct ServerProcess {
    pid_t pid = -1;
    std::chrono::system_clock::time_point started_at;
    uint64_t start_ticks = 0;
    bool lock_owned = false;
};

/// Lifecycle control over the single supervised process.
/// ProcessHandle is the OS implementation; the watchdog only sees this interface.
class ProcessControl {
public:
    virtual ~ProcessControl() = default;

    struct LaunchResult {
        bool success = false;
        SupervisorError error = SupervisorError::None;
        std::string message;
        ServerProcess process;
    };

    /// success is true whenever the process is gone afterwards; error may still
    /// carry StopTimedOut when termination had to be forced
    struct StopResult {
        bool success = false;
        SupervisorError error = SupervisorError::None;
        std::string message;
    };

    struct CommandResult {
        bool success = false;
        SupervisorError error = SupervisorError::None;
    };

    virtual LaunchResult launch(const LaunchSpec& spec) = 0;
    virtual StopResult stop(bool graceful, std::chrono::milliseconds timeout) = 0;
    virtual bool is_alive() = 0;
    virtual CommandResult send_command(const std::string& text) = 0;

    /// Take over a live process recorded by a previous supervisor instance
    virtual bool adopt() = 0;

    virtual std::optional<ServerProcess> current() const = 0;

    /// Exit status of the last process observed to exit, -1 if unknown
    virtual int last_exit_status() const = 0;
};

class ProcessHandle : public ProcessControl {
public:
    /// state_dir holds server.lock and server.json
    ProcessHandle(const std::string& state_dir, const std::string& stop_command);
    ~ProcessHandle() override;

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    LaunchResult launch(const LaunchSpec& spec) override;
    StopResult stop(bool graceful, std::chrono::milliseconds timeout) override;
    bool is_alive() override;
    CommandResult send_command(const std::string& text) override;
    bool adopt() override;
    std::optional<ServerProcess> current() const override;
    int last_exit_status() const override { return last_exit_status_; }

    std::string lock_path() const { return state_dir_ + "/server.lock"; }
    std::string record_path() const { return state_dir_ + "/server.json"; }

    /// Durable record left by whichever supervisor launched the server
    std::optional<ServerProcess> read_record() const;

    /// True when pid exists, is not a zombie and started at start_ticks
    static bool matches_identity(pid_t pid, uint64_t start_ticks);

private:
    enum class LockStatus { Acquired, Held, Error };

    std::string state_dir_;
    std::string stop_command_;
    ServerProcess process_;
    bool own_child_ = false;
    int lock_fd_ = -1;
    int control_fd_ = -1;
    int last_exit_status_ = -1;

    LockStatus acquire_lock(std::string& err);
    void release_lock();
    bool write_record() const;
    void remove_record() const;

    /// Clear all per-process state after a confirmed exit
    void on_exit_confirmed();

    bool wait_for_exit(std::chrono::milliseconds timeout);
    bool force_kill();
};
