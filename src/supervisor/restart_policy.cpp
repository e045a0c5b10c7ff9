#include "supervisor/restart_policy.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

const char* to_string(RestartOutcome outcome) {
    switch (outcome) {
        case RestartOutcome::Pending: return "pending";
        case RestartOutcome::Success: return "success";
        case RestartOutcome::Failed:  return "failed";
    }
    return "unknown";
}

const char* to_string(RestartDecision decision) {
    switch (decision) {
        case RestartDecision::Allow:         return "allow";
        case RestartDecision::CoolingDown:   return "cooling_down";
        case RestartDecision::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

namespace {

using WallTime = std::chrono::system_clock::time_point;

int64_t to_epoch_ms(WallTime tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

WallTime from_epoch_ms(int64_t ms) {
    return WallTime(std::chrono::duration_cast<WallTime::duration>(std::chrono::milliseconds(ms)));
}

std::string iso_time(WallTime tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

RestartOutcome parse_outcome(const std::string& s) {
    if (s == "success") return RestartOutcome::Success;
    if (s == "failed") return RestartOutcome::Failed;
    return RestartOutcome::Pending;
}

}

RestartPolicy::RestartPolicy(const RestartLimits& limits, const std::string& history_path)
    : limits_(limits), history_path_(history_path) {}

bool RestartPolicy::load(TimePoint now) {
    if (history_path_.empty() || !fs::exists(history_path_)) return true;

    std::ifstream in(history_path_);
    if (!in.is_open()) {
        spdlog::error("Cannot read restart history {}", history_path_);
        return false;
    }

    history_.clear();
    reset_at_.reset();

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        try {
            json j = json::parse(line);
            std::string event = j.value("event", "");
            TimePoint ts = Clock::at_wall(from_epoch_ms(j.value("timestamp", int64_t{0})), now);

            if (event == "attempt") {
                RestartRecord rec;
                rec.timestamp = ts.wall;
                rec.monotonic = ts.mono;
                rec.reason = j.value("reason", "");
                rec.cooldown_applied_seconds = j.value("cooldown_applied", 0);
                rec.automatic = j.value("automatic", true);
                history_.push_back(std::move(rec));
            } else if (event == "outcome") {
                if (!history_.empty()) {
                    history_.back().outcome = parse_outcome(j.value("outcome", ""));
                }
            } else if (event == "reset") {
                reset_at_ = ts.mono;
            }
        } catch (const json::exception& e) {
            spdlog::warn("Skipping malformed line {} in {}: {}", line_no, history_path_, e.what());
        }
    }

    trim();
    return true;
}

bool RestartPolicy::counts(const RestartRecord& record) const {
    if (!record.automatic) return false;
    if (reset_at_ && record.monotonic <= *reset_at_) return false;
    return true;
}

int RestartPolicy::attempts_in_window(TimePoint now) const {
    auto window_start = now.mono - limits_.window;
    int count = 0;
    for (const auto& rec : history_) {
        if (!counts(rec)) continue;
        if (rec.monotonic >= window_start && rec.monotonic <= now.mono) ++count;
    }
    return count;
}

std::optional<RestartPolicy::TimePoint> RestartPolicy::last_attempt() const {
    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
        if (counts(*it)) return Instant{it->monotonic, it->timestamp};
    }
    return std::nullopt;
}

std::chrono::seconds RestartPolicy::cooldown_remaining(TimePoint now) const {
    auto last = last_attempt();
    if (!last) return std::chrono::seconds(0);
    auto elapsed = now - *last;
    if (elapsed >= limits_.cooldown) return std::chrono::seconds(0);
    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(limits_.cooldown - elapsed);
    // Round up so a fractional remainder is not reported as zero
    if (limits_.cooldown - elapsed > remaining) ++remaining;
    return remaining;
}

RestartDecision RestartPolicy::decide(TimePoint now) const {
    if (attempts_in_window(now) >= limits_.max_restarts) {
        return RestartDecision::LimitExceeded;
    }
    if (cooldown_remaining(now) > std::chrono::seconds(0)) {
        return RestartDecision::CoolingDown;
    }
    return RestartDecision::Allow;
}

void RestartPolicy::record_attempt(TimePoint now, const std::string& reason,
                                   int cooldown_applied_seconds, bool automatic) {
    RestartRecord rec;
    rec.timestamp = now.wall;
    rec.monotonic = now.mono;
    rec.reason = reason;
    rec.cooldown_applied_seconds = cooldown_applied_seconds;
    rec.automatic = automatic;
    history_.push_back(rec);
    trim();

    append_line(json({
        {"event", "attempt"},
        {"timestamp", to_epoch_ms(now.wall)},
        {"time", iso_time(now.wall)},
        {"reason", reason},
        {"cooldown_applied", cooldown_applied_seconds},
        {"automatic", automatic}
    }).dump());
}

void RestartPolicy::record_outcome(bool success) {
    if (history_.empty()) return;
    auto& rec = history_.back();
    rec.outcome = success ? RestartOutcome::Success : RestartOutcome::Failed;

    append_line(json({
        {"event", "outcome"},
        {"timestamp", to_epoch_ms(rec.timestamp)},
        {"outcome", to_string(rec.outcome)}
    }).dump());
}

void RestartPolicy::reset(TimePoint now) {
    reset_at_ = now.mono;
    append_line(json({
        {"event", "reset"},
        {"timestamp", to_epoch_ms(now.wall)},
        {"time", iso_time(now.wall)}
    }).dump());
}

void RestartPolicy::append_line(const std::string& line) const {
    if (history_path_.empty()) return;

    std::error_code ec;
    fs::create_directories(fs::path(history_path_).parent_path(), ec);

    std::ofstream out(history_path_, std::ios::app);
    if (!out.is_open()) {
        spdlog::error("Cannot append to restart history {}", history_path_);
        return;
    }
    out << line << "\n";
}

void RestartPolicy::trim() {
    if (history_.size() > kMaxRecordsInMemory) {
        history_.erase(history_.begin(),
                       history_.begin() + static_cast<long>(history_.size() - kMaxRecordsInMemory));
    }
}
