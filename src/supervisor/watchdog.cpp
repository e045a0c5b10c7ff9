#include "supervisor/watchdog.hpp"
#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>

const char* to_string(WatchdogState state) {
    switch (state) {
        case WatchdogState::Stopped:     return "stopped";
        case WatchdogState::Monitoring:  return "monitoring";
        case WatchdogState::Restarting:  return "restarting";
        case WatchdogState::CoolingDown: return "cooling_down";
        case WatchdogState::Failed:      return "failed";
    }
    return "unknown";
}

namespace {

std::string join_reasons(const std::set<std::string>& reasons) {
    std::string out;
    for (const auto& r : reasons) {
        if (!out.empty()) out += ",";
        out += r;
    }
    return out.empty() ? "unknown" : out;
}

}

// ── WatchdogOptions ─────────────────────────────────────────

WatchdogOptions WatchdogOptions::from_config(const AppConfig& config) {
    WatchdogOptions o;
    o.interval = std::chrono::seconds(config.watchdog.interval);
    // A disabled watchdog still samples for status but never acts on its own
    o.restart_on_crash = config.watchdog.enabled && config.watchdog.restart_on_crash;
    o.stop_timeout = std::chrono::seconds(config.server.stop_timeout);
    o.startup_grace = std::chrono::seconds(config.server.startup_grace);
    o.backup_on_stop = config.backup.on_stop;
    o.backup_on_restart = config.backup.on_restart;
    o.auto_backup = config.watchdog.enabled && config.backup.auto_backup;
    o.backup_interval = std::chrono::seconds(config.backup.interval);
    o.backup_timeout = std::chrono::seconds(config.backup.timeout);
    o.max_backups = config.backup.max_backups;
    return o;
}

// ── Watchdog ────────────────────────────────────────────────

Watchdog::Watchdog(const WatchdogOptions& options, ProcessControl& process, MetricsSource& metrics,
                   const HealthScorer& scorer, RestartPolicy& policy, BackupHook& backup,
                   const LaunchSpec& launch_spec)
    : options_(options),
      process_(process),
      metrics_(metrics),
      scorer_(scorer),
      policy_(policy),
      backup_(backup),
      launch_spec_(launch_spec) {
    publish(Clock::now());
}

Watchdog::~Watchdog() {
    shutdown();
}

void Watchdog::start_loop() {
    if (thread_.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    loop_running_.store(true);
    thread_ = std::thread(&Watchdog::run_loop, this);
}

void Watchdog::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::future<Watchdog::CommandResult> Watchdog::submit(CommandType type, const std::string& argument) {
    PendingCommand cmd{type, argument, std::promise<CommandResult>()};
    auto future = cmd.promise.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!loop_running_.load() || stop_requested_) {
            cmd.promise.set_value({false, SupervisorError::None, "watchdog is not running"});
            return future;
        }
        commands_.push_back(std::move(cmd));
    }
    cv_.notify_all();
    return future;
}

std::shared_ptr<const StatusSnapshot> Watchdog::snapshot() const {
    return std::atomic_load(&snapshot_);
}

void Watchdog::run_loop() {
    auto next_tick = std::chrono::steady_clock::now();

    for (;;) {
        std::deque<PendingCommand> batch;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_until(lock, next_tick, [this] {
                return stop_requested_ || !commands_.empty();
            });
            if (stop_requested_) break;
            batch.swap(commands_);
        }

        for (auto& cmd : batch) {
            CommandResult result;
            try {
                result = execute(cmd.type, cmd.argument, Clock::now());
            } catch (const std::exception& e) {
                spdlog::error("Watchdog command failed: {}", e.what());
                result = {false, SupervisorError::None, e.what()};
                publish(Clock::now());
            }
            cmd.promise.set_value(std::move(result));
        }

        if (std::chrono::steady_clock::now() >= next_tick) {
            try {
                tick(Clock::now());
            } catch (const std::exception& e) {
                spdlog::error("Watchdog tick failed: {}", e.what());
                publish(Clock::now());
            }
            next_tick = std::chrono::steady_clock::now() + options_.interval;
        }
    }

    std::deque<PendingCommand> leftovers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leftovers.swap(commands_);
    }
    for (auto& cmd : leftovers) {
        cmd.promise.set_value({false, SupervisorError::None, "watchdog is shutting down"});
    }
    loop_running_.store(false);
}

Watchdog::CommandResult Watchdog::execute(CommandType type, const std::string& argument, TimePoint now) {
    CommandResult result{false, SupervisorError::None, "unknown command"};
    switch (type) {
        case CommandType::Start:       result = start_server(now); break;
        case CommandType::Stop:        result = stop_server(now); break;
        case CommandType::Restart:     result = restart_server(now); break;
        case CommandType::SendCommand: result = send_console(argument); break;
        case CommandType::Backup:      result = backup_now(argument, now); break;
        case CommandType::Reset:       result = reset_restarts(now); break;
        case CommandType::Restore:     result = restore_backup(argument, now); break;
    }
    publish(now);
    return result;
}

void Watchdog::set_state(WatchdogState next, const std::string& why) {
    if (next == state_) return;
    spdlog::info("Watchdog {} -> {}: {}", to_string(state_), to_string(next), why);
    state_ = next;
}

// ── Tick ────────────────────────────────────────────────────

HealthVerdict Watchdog::observe(TimePoint now) {
    ++checks_performed_;
    if (!process_.is_alive()) {
        consecutive_port_failures_ = 0;
        last_sample_.reset();
        last_verdict_ = HealthScorer::process_gone();
        return last_verdict_;
    }

    auto result = metrics_.sample();
    if (!result.success) {
        consecutive_port_failures_ = 0;
        last_sample_.reset();
        last_verdict_ = HealthScorer::process_gone();
        return last_verdict_;
    }

    bool in_grace = now - launched_at_ < options_.startup_grace;
    if (result.sample.port_open || in_grace) {
        consecutive_port_failures_ = 0;
    } else {
        ++consecutive_port_failures_;
    }

    last_sample_ = result.sample;
    last_verdict_ = scorer_.evaluate(result.sample, metrics_.trend(TrendWindow::FiveMinutes),
                                     consecutive_port_failures_, in_grace);
    return last_verdict_;
}

void Watchdog::tick(TimePoint now) {
    switch (state_) {
        case WatchdogState::Stopped:
        case WatchdogState::Failed:
            break;

        case WatchdogState::Monitoring: {
            HealthVerdict verdict = observe(now);
            if (verdict.state == HealthState::Dead) {
                if (!options_.restart_on_crash) {
                    spdlog::error("Server is dead ({}); automatic restart is disabled",
                                  join_reasons(verdict.reasons));
                    if (!process_.is_alive()) {
                        set_state(WatchdogState::Stopped, "server exited");
                    }
                } else {
                    attempt_restart(now, verdict);
                }
            } else {
                if (verdict.state == HealthState::Degraded) {
                    spdlog::warn("Server degraded: score {} ({})", verdict.score,
                                 join_reasons(verdict.reasons));
                }
                maybe_auto_backup(now);
            }
            break;
        }

        case WatchdogState::Restarting:
        case WatchdogState::CoolingDown: {
            HealthVerdict verdict = observe(now);
            if (verdict.state != HealthState::Dead) {
                set_state(WatchdogState::Monitoring, "server healthy again");
            } else if (options_.restart_on_crash) {
                attempt_restart(now, verdict);
            } else if (!process_.is_alive()) {
                set_state(WatchdogState::Stopped, "server exited");
            }
            break;
        }
    }

    publish(now);
}

void Watchdog::attempt_restart(TimePoint now, const HealthVerdict& verdict) {
    std::string reason = join_reasons(verdict.reasons);
    int exit_status = process_.last_exit_status();
    if (verdict.reasons.count("process_gone") && exit_status >= 0) {
        reason += " exit=" + std::to_string(exit_status);
    }

    RestartDecision decision = policy_.decide(now);
    if (decision == RestartDecision::LimitExceeded) {
        enter_failed(now);
        return;
    }
    if (decision == RestartDecision::CoolingDown) {
        if (state_ != WatchdogState::CoolingDown) {
            set_state(WatchdogState::CoolingDown,
                      "next restart allowed in " +
                      std::to_string(policy_.cooldown_remaining(now).count()) + "s");
        }
        return;
    }

    set_state(WatchdogState::Restarting, reason);
    publish(now);

    if (options_.backup_on_restart) {
        run_backup("pre_restart", now);
    }

    if (process_.is_alive()) {
        auto stopped = process_.stop(false, options_.stop_timeout);
        if (!stopped.success) {
            spdlog::error("Could not kill unhealthy server: {}", stopped.message);
        }
    }

    policy_.record_attempt(now, reason, static_cast<int>(policy_.limits().cooldown.count()), true);
    ++restarts_attempted_;
    spdlog::warn("Restarting server (attempt {} of {} in window): {}",
                 policy_.attempts_in_window(now), policy_.limits().max_restarts, reason);

    auto launched = process_.launch(launch_spec_);
    policy_.record_outcome(launched.success);

    if (launched.success) {
        ++restarts_successful_;
        on_launched(now);
        set_state(WatchdogState::Monitoring, "restart succeeded");
        return;
    }

    last_error_ = launched.message;
    spdlog::error("Restart failed: {}", launched.message);
    if (policy_.decide(now) == RestartDecision::LimitExceeded) {
        enter_failed(now);
    } else {
        set_state(WatchdogState::CoolingDown, "launch failed");
    }
}

void Watchdog::enter_failed(TimePoint now) {
    set_state(WatchdogState::Failed, "restart limit exceeded");
    last_error_ = to_string(SupervisorError::RestartLimitExceeded);
    spdlog::critical("Server restarted {} times within {}s; giving up until the counter is reset",
                     policy_.attempts_in_window(now), policy_.limits().window.count());
}

void Watchdog::on_launched(TimePoint now) {
    launched_at_ = now;
    last_backup_at_ = now;
    consecutive_port_failures_ = 0;
    last_sample_.reset();
    last_verdict_ = HealthVerdict{};
    last_error_.clear();
    metrics_.reset();
}

void Watchdog::maybe_auto_backup(TimePoint now) {
    if (!options_.auto_backup) return;
    if (now - last_backup_at_ < options_.backup_interval) return;
    run_backup("auto", now);
}

BackupHook::BackupResult Watchdog::run_backup(const std::string& reason, TimePoint now) {
    auto result = backup_.create_snapshot(reason, options_.backup_timeout);
    last_backup_at_ = now;

    if (!result.success) {
        last_backup_outcome_ = "failed";
        spdlog::error("Backup '{}' failed: {}", reason, result.message);
        return result;
    }

    last_backup_outcome_ = "success";
    last_backup_path_ = result.path;

    auto pruned = backup_.prune_old(options_.max_backups, options_.backup_timeout);
    if (!pruned.success) {
        spdlog::warn("Pruning old backups failed: {}", pruned.message);
    }
    return result;
}

// ── Commands ────────────────────────────────────────────────

Watchdog::CommandResult Watchdog::start_server(TimePoint now) {
    if (state_ == WatchdogState::Failed) {
        return {false, SupervisorError::RestartLimitExceeded,
                "watchdog gave up after too many restarts; reset it first"};
    }

    if (process_.is_alive()) {
        set_state(WatchdogState::Monitoring, "server already running");
        return {false, SupervisorError::AlreadyRunning, "server is already running"};
    }

    if (process_.adopt()) {
        on_launched(now);
        if (auto proc = process_.current()) {
            launched_at_ = Clock::at_wall(proc->started_at, now);
        }
        set_state(WatchdogState::Monitoring, "adopted running server");
        return {true, SupervisorError::None, "adopted running server"};
    }

    auto launched = process_.launch(launch_spec_);
    if (!launched.success) {
        last_error_ = launched.message;
        spdlog::error("Start failed: {}", launched.message);
        return {false, launched.error, launched.message};
    }

    on_launched(now);
    set_state(WatchdogState::Monitoring, "started by operator");
    return {true, SupervisorError::None,
            "server started (pid " + std::to_string(launched.process.pid) + ")"};
}

Watchdog::CommandResult Watchdog::stop_server(TimePoint now) {
    if (!process_.is_alive()) {
        if (state_ != WatchdogState::Failed) {
            set_state(WatchdogState::Stopped, "stop requested");
        }
        return {false, SupervisorError::NotRunning, "server is not running"};
    }

    stopping_ = true;
    publish(now);

    if (options_.backup_on_stop) {
        run_backup("pre_stop", now);
    }

    auto stopped = process_.stop(true, options_.stop_timeout);
    stopping_ = false;

    if (!stopped.success) {
        last_error_ = stopped.message;
        spdlog::error("Stop failed: {}", stopped.message);
        return {false, stopped.error, stopped.message};
    }

    consecutive_port_failures_ = 0;
    last_sample_.reset();
    metrics_.reset();
    if (state_ != WatchdogState::Failed) {
        set_state(WatchdogState::Stopped, "stopped by operator");
    }
    return {true, stopped.error, stopped.message};
}

Watchdog::CommandResult Watchdog::restart_server(TimePoint now) {
    if (state_ == WatchdogState::Failed) {
        return {false, SupervisorError::RestartLimitExceeded,
                "watchdog gave up after too many restarts; reset it first"};
    }

    policy_.record_attempt(now, "manual", 0, false);
    WatchdogState previous = state_;
    set_state(WatchdogState::Restarting, "restart requested by operator");
    stopping_ = true;
    publish(now);

    if (options_.backup_on_restart) {
        run_backup("pre_restart", now);
    }

    if (process_.is_alive()) {
        auto stopped = process_.stop(true, options_.stop_timeout);
        if (!stopped.success) {
            stopping_ = false;
            policy_.record_outcome(false);
            last_error_ = stopped.message;
            set_state(previous, "restart aborted");
            return {false, stopped.error, stopped.message};
        }
    }
    stopping_ = false;

    auto launched = process_.launch(launch_spec_);
    policy_.record_outcome(launched.success);
    if (!launched.success) {
        last_error_ = launched.message;
        spdlog::error("Restart failed: {}", launched.message);
        set_state(WatchdogState::Stopped, "launch failed");
        return {false, launched.error, launched.message};
    }

    on_launched(now);
    set_state(WatchdogState::Monitoring, "restarted by operator");
    return {true, SupervisorError::None,
            "server restarted (pid " + std::to_string(launched.process.pid) + ")"};
}

Watchdog::CommandResult Watchdog::send_console(const std::string& text) {
    if (text.empty()) {
        return {false, SupervisorError::WriteFailed, "empty command"};
    }
    auto sent = process_.send_command(text);
    if (!sent.success) {
        return {false, sent.error, std::string("cannot send command: ") + to_string(sent.error)};
    }
    return {true, SupervisorError::None, "sent"};
}

Watchdog::CommandResult Watchdog::backup_now(const std::string& reason, TimePoint now) {
    auto result = run_backup(reason.empty() ? "manual" : reason, now);
    if (!result.success) {
        return {false, result.error, result.message};
    }
    return {true, SupervisorError::None, result.path};
}

Watchdog::CommandResult Watchdog::reset_restarts(TimePoint now) {
    policy_.reset(now);
    last_error_.clear();
    if (state_ == WatchdogState::Failed) {
        set_state(WatchdogState::Stopped, "restart counter reset by operator");
    }
    spdlog::info("Restart counter reset");
    return {true, SupervisorError::None, "restart counter reset"};
}

Watchdog::CommandResult Watchdog::restore_backup(const std::string& name, TimePoint now) {
    if (name.empty()) {
        return {false, SupervisorError::RestoreFailed, "no backup name given"};
    }
    if (state_ == WatchdogState::Failed) {
        return {false, SupervisorError::RestartLimitExceeded,
                "watchdog gave up after too many restarts; reset it first"};
    }
    if (state_ != WatchdogState::Stopped || process_.is_alive()) {
        return {false, SupervisorError::AlreadyRunning, "stop the server before restoring a backup"};
    }

    // Pruning waits until after the restore so it cannot remove the requested backup
    auto safety = backup_.create_snapshot("pre_restore", options_.backup_timeout);
    last_backup_at_ = now;
    if (!safety.success) {
        last_backup_outcome_ = "failed";
        last_error_ = safety.message;
        spdlog::error("Safety backup before restore failed: {}", safety.message);
        return {false, SupervisorError::BackupFailed,
                "safety backup failed, restore cancelled: " + safety.message};
    }
    last_backup_outcome_ = "success";
    last_backup_path_ = safety.path;

    auto restored = backup_.restore(name, options_.backup_timeout);
    if (!restored.success) {
        last_error_ = restored.message;
        spdlog::error("Restore of {} failed: {}", name, restored.message);
        return {false, restored.error, restored.message};
    }
    last_error_.clear();
    spdlog::info("Restored backup {} (previous data saved as {})", name, safety.path);

    auto pruned = backup_.prune_old(options_.max_backups, options_.backup_timeout);
    if (!pruned.success) {
        spdlog::warn("Pruning old backups failed: {}", pruned.message);
    }
    return {true, SupervisorError::None, restored.message};
}

// ── Snapshot ────────────────────────────────────────────────

void Watchdog::publish(TimePoint now) {
    auto s = std::make_shared<StatusSnapshot>();

    auto proc = process_.current();
    s->running = proc.has_value();
    if (proc) {
        s->pid = proc->pid;
        s->uptime_seconds = std::max<int64_t>(
            0, std::chrono::duration_cast<std::chrono::seconds>(now.wall - proc->started_at).count());
        s->health = last_verdict_;
    } else {
        s->health = HealthScorer::process_gone();
    }

    s->state = state_;
    s->stopping = stopping_;
    s->restart_count_in_window = policy_.attempts_in_window(now);
    s->max_restarts = policy_.limits().max_restarts;
    s->cooldown_remaining_seconds = policy_.cooldown_remaining(now).count();
    s->last_backup_outcome = last_backup_outcome_;
    s->last_backup_path = last_backup_path_;
    s->last_error = last_error_;
    s->last_sample = last_sample_;
    s->trend_5m = metrics_.trend(TrendWindow::FiveMinutes);
    s->trend_1h = metrics_.trend(TrendWindow::OneHour);

    const auto& history = policy_.history();
    size_t first = history.size() > kRecentRestarts ? history.size() - kRecentRestarts : 0;
    s->recent_restarts.assign(history.begin() + static_cast<long>(first), history.end());
    s->last_exit_status = process_.last_exit_status();

    s->checks_performed = checks_performed_;
    s->restarts_attempted = restarts_attempted_;
    s->restarts_successful = restarts_successful_;
    if (restarts_attempted_ > 0) {
        s->restart_success_rate = 100.0 * restarts_successful_ / restarts_attempted_;
    }
    s->updated_at = now.wall;

    std::atomic_store(&snapshot_, std::shared_ptr<const StatusSnapshot>(std::move(s)));
}
