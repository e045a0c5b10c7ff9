#pragma once

#include "supervisor/clock.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

enum class RestartOutcome { Pending, Success, Failed };

enum class RestartDecision {
    Allow,          // restart may proceed now
    CoolingDown,    // too soon after the previous attempt
    LimitExceeded   // window already holds max_restarts attempts
};

const char* to_string(RestartOutcome outcome);
const char* to_string(RestartDecision decision);

struct RestartRecord {
    std::chrono::system_clock::time_point timestamp;    // wall time, for the audit log
    std::chrono::steady_clock::time_point monotonic;    // window and cooldown arithmetic
    std::string reason;
    RestartOutcome outcome = RestartOutcome::Pending;
    int cooldown_applied_seconds = 0;
    bool automatic = true;      // false for operator-requested restarts
};

struct RestartLimits {
    int max_restarts = 5;
    std::chrono::seconds window{3600};
    std::chrono::seconds cooldown{300};
};

/// Sliding-window restart limiter with an append-only history.
/// Only automatic attempts count against the window and the cooldown.
class RestartPolicy {
public:
    using Clock = SupervisorClock;
    using TimePoint = Instant;

    /// history_path may be empty for an in-memory policy
    explicit RestartPolicy(const RestartLimits& limits, const std::string& history_path = "");

    /// Replay the history file. Returns false if it exists but cannot be read.
    /// Recorded wall times are placed on the monotonic clock relative to `now`;
    /// records dated after `now` count as happening at `now`.
    bool load(TimePoint now = Clock::now());

    RestartDecision decide(TimePoint now) const;
    bool can_restart(TimePoint now) const { return decide(now) == RestartDecision::Allow; }

    /// Append a pending record; call before the restart is attempted
    void record_attempt(TimePoint now, const std::string& reason,
                        int cooldown_applied_seconds = 0, bool automatic = true);

    /// Set the outcome of the most recent record
    void record_outcome(bool success);

    /// Operator reset: earlier attempts stop counting
    void reset(TimePoint now);

    int attempts_in_window(TimePoint now) const;
    std::chrono::seconds cooldown_remaining(TimePoint now) const;
    std::optional<TimePoint> last_attempt() const;

    const std::vector<RestartRecord>& history() const { return history_; }
    const RestartLimits& limits() const { return limits_; }

private:
    static constexpr size_t kMaxRecordsInMemory = 1000;

    RestartLimits limits_;
    std::string history_path_;
    std::vector<RestartRecord> history_;
    std::optional<std::chrono::steady_clock::time_point> reset_at_;

    bool counts(const RestartRecord& record) const;
    void append_line(const std::string& line) const;
    void trim();
};
