#pragma once

#include "supervisor/backup_hook.hpp"
#include "supervisor/clock.hpp"
#include "supervisor/errors.hpp"
#include "supervisor/health_scorer.hpp"
#include "supervisor/metrics_sampler.hpp"
#include "supervisor/process_handle.hpp"
#include "supervisor/restart_policy.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct AppConfig;

enum class WatchdogState { Stopped, Monitoring, Restarting, CoolingDown, Failed };

const char* to_string(WatchdogState state);

struct WatchdogOptions {
    std::chrono::seconds interval{30};
    bool restart_on_crash = true;
    std::chrono::seconds stop_timeout{10};
    std::chrono::seconds startup_grace{120};

    bool backup_on_stop = true;
    bool backup_on_restart = true;
    bool auto_backup = true;
    std::chrono::seconds backup_interval{3600};
    std::chrono::seconds backup_timeout{300};
    int max_backups = 10;

    static WatchdogOptions from_config(const AppConfig& config);
};

/// Published after every tick and command; readers never block the loop
struct StatusSnapshot {
    bool running = false;
    pid_t pid = -1;
    int64_t uptime_seconds = 0;
    HealthVerdict health;
    WatchdogState state = WatchdogState::Stopped;
    bool stopping = false;
    int restart_count_in_window = 0;
    int max_restarts = 0;
    int64_t cooldown_remaining_seconds = 0;
    std::string last_backup_outcome = "none";   // none | success | failed
    std::string last_backup_path;
    std::string last_error;
    std::optional<MetricsSample> last_sample;
    Trend trend_5m;
    Trend trend_1h;
    std::vector<RestartRecord> recent_restarts;   // newest last
    int last_exit_status = -1;

    // Since the supervisor started
    int64_t checks_performed = 0;
    int restarts_attempted = 0;
    int restarts_successful = 0;
    double restart_success_rate = 100.0;

    std::chrono::system_clock::time_point updated_at;
};

class Watchdog {
public:
    using Clock = SupervisorClock;
    using TimePoint = Instant;

    static constexpr size_t kRecentRestarts = 20;

    enum class CommandType { Start, Stop, Restart, SendCommand, Backup, Reset, Restore };

    struct CommandResult {
        bool success = false;
        SupervisorError error = SupervisorError::None;
        std::string message;
    };

    Watchdog(const WatchdogOptions& options, ProcessControl& process, MetricsSource& metrics,
             const HealthScorer& scorer, RestartPolicy& policy, BackupHook& backup,
             const LaunchSpec& launch_spec);
    ~Watchdog();

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    /// Start the background loop thread
    void start_loop();

    /// Finish the current transition, fail queued commands and join the loop
    void shutdown();

    bool loop_running() const { return loop_running_.load(); }

    /// Queue a command for the loop thread. The argument is the console text
    /// for SendCommand, the snapshot reason for Backup and the backup name
    /// for Restore.
    std::future<CommandResult> submit(CommandType type, const std::string& argument = "");

    std::shared_ptr<const StatusSnapshot> snapshot() const;

    // ── Loop-thread operations ─────────────────────────────
    // Called by the loop; may be called directly only while the loop is not running.

    void tick(TimePoint now);

    /// Run one command synchronously and publish the resulting snapshot
    CommandResult execute(CommandType type, const std::string& argument, TimePoint now);

    WatchdogState state() const { return state_; }
    int consecutive_port_failures() const { return consecutive_port_failures_; }

private:
    struct PendingCommand {
        CommandType type;
        std::string argument;
        std::promise<CommandResult> promise;
    };

    WatchdogOptions options_;
    ProcessControl& process_;
    MetricsSource& metrics_;
    HealthScorer scorer_;
    RestartPolicy& policy_;
    BackupHook& backup_;
    LaunchSpec launch_spec_;

    // Owned by the loop thread
    WatchdogState state_ = WatchdogState::Stopped;
    bool stopping_ = false;
    int consecutive_port_failures_ = 0;
    TimePoint launched_at_;
    TimePoint last_backup_at_;
    HealthVerdict last_verdict_;
    std::optional<MetricsSample> last_sample_;
    std::string last_backup_outcome_ = "none";
    std::string last_backup_path_;
    std::string last_error_;
    int64_t checks_performed_ = 0;
    int restarts_attempted_ = 0;
    int restarts_successful_ = 0;

    std::shared_ptr<const StatusSnapshot> snapshot_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<PendingCommand> commands_;
    bool stop_requested_ = false;
    std::atomic<bool> loop_running_{false};
    std::thread thread_;

    void run_loop();

    CommandResult start_server(TimePoint now);
    CommandResult stop_server(TimePoint now);
    CommandResult restart_server(TimePoint now);
    CommandResult send_console(const std::string& text);
    CommandResult backup_now(const std::string& reason, TimePoint now);
    CommandResult reset_restarts(TimePoint now);
    CommandResult restore_backup(const std::string& name, TimePoint now);

    void set_state(WatchdogState next, const std::string& why);
    HealthVerdict observe(TimePoint now);
    void attempt_restart(TimePoint now, const HealthVerdict& verdict);
    void enter_failed(TimePoint now);
    void on_launched(TimePoint now);
    void maybe_auto_backup(TimePoint now);

    /// Snapshot plus pruning; failures are logged and never propagate
    BackupHook::BackupResult run_backup(const std::string& reason, TimePoint now);

    void publish(TimePoint now);
};
