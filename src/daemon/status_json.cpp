#include "daemon/status_json.hpp"

using json = nlohmann::json;

namespace {

int64_t to_epoch(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch(int64_t seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

json trend_to_json(const Trend& t) {
    return {
        {"avg_cpu", t.avg_cpu},
        {"avg_memory", t.avg_memory},
        {"peak_cpu", t.peak_cpu},
        {"peak_memory", t.peak_memory},
        {"samples", t.samples}
    };
}

Trend trend_from_json(const json& j) {
    Trend t;
    if (!j.is_object()) return t;
    t.avg_cpu = j.value("avg_cpu", 0.0);
    t.avg_memory = j.value("avg_memory", 0.0);
    t.peak_cpu = j.value("peak_cpu", 0.0);
    t.peak_memory = j.value("peak_memory", int64_t{0});
    t.samples = j.value("samples", size_t{0});
    return t;
}

}

WatchdogState watchdog_state_from_string(const std::string& s) {
    if (s == "monitoring") return WatchdogState::Monitoring;
    if (s == "restarting") return WatchdogState::Restarting;
    if (s == "cooling_down") return WatchdogState::CoolingDown;
    if (s == "failed") return WatchdogState::Failed;
    return WatchdogState::Stopped;
}

HealthState health_state_from_string(const std::string& s) {
    if (s == "alive") return HealthState::Alive;
    if (s == "degraded") return HealthState::Degraded;
    return HealthState::Dead;
}

void to_json(json& j, const RestartRecord& r) {
    j = {
        {"timestamp", to_epoch(r.timestamp)},
        {"reason", r.reason},
        {"outcome", to_string(r.outcome)},
        {"cooldown_applied", r.cooldown_applied_seconds},
        {"automatic", r.automatic}
    };
}

void from_json(const json& j, RestartRecord& r) {
    r.timestamp = from_epoch(j.value("timestamp", int64_t{0}));
    r.reason = j.value("reason", "");
    std::string outcome = j.value("outcome", "pending");
    if (outcome == "success") {
        r.outcome = RestartOutcome::Success;
    } else if (outcome == "failed") {
        r.outcome = RestartOutcome::Failed;
    } else {
        r.outcome = RestartOutcome::Pending;
    }
    r.cooldown_applied_seconds = j.value("cooldown_applied", 0);
    r.automatic = j.value("automatic", true);
}

void to_json(json& j, const BackupInfo& b) {
    j = {
        {"name", b.name},
        {"path", b.path},
        {"size_bytes", b.size_bytes},
        {"created", to_epoch(b.created)}
    };
}

void from_json(const json& j, BackupInfo& b) {
    b.name = j.value("name", "");
    b.path = j.value("path", "");
    b.size_bytes = j.value("size_bytes", int64_t{0});
    b.created = from_epoch(j.value("created", int64_t{0}));
}

void to_json(json& j, const StatusSnapshot& s) {
    json reasons = json::array();
    for (const auto& r : s.health.reasons) reasons.push_back(r);

    j = {
        {"running", s.running},
        {"pid", static_cast<int>(s.pid)},
        {"uptime_seconds", s.uptime_seconds},
        {"state", to_string(s.state)},
        {"stopping", s.stopping},
        {"health", {
            {"score", s.health.score},
            {"state", to_string(s.health.state)},
            {"reasons", reasons}
        }},
        {"restart_count_in_window", s.restart_count_in_window},
        {"max_restarts", s.max_restarts},
        {"cooldown_remaining_seconds", s.cooldown_remaining_seconds},
        {"last_backup_outcome", s.last_backup_outcome},
        {"last_backup_path", s.last_backup_path},
        {"last_error", s.last_error},
        {"trend_5m", trend_to_json(s.trend_5m)},
        {"trend_1h", trend_to_json(s.trend_1h)},
        {"recent_restarts", s.recent_restarts},
        {"last_exit_status", s.last_exit_status},
        {"stats", {
            {"checks_performed", s.checks_performed},
            {"restarts_attempted", s.restarts_attempted},
            {"restarts_successful", s.restarts_successful},
            {"restart_success_rate", s.restart_success_rate}
        }},
        {"updated_at", to_epoch(s.updated_at)}
    };

    if (s.last_sample) {
        j["last_sample"] = {
            {"cpu_percent", s.last_sample->cpu_percent},
            {"memory_bytes", s.last_sample->memory_bytes},
            {"uptime_seconds", s.last_sample->uptime_seconds},
            {"port_open", s.last_sample->port_open},
            {"connection_count", s.last_sample->connection_count},
            {"thread_count", s.last_sample->thread_count}
        };
    } else {
        j["last_sample"] = nullptr;
    }
}

void from_json(const json& j, StatusSnapshot& s) {
    s.running = j.value("running", false);
    s.pid = j.value("pid", -1);
    s.uptime_seconds = j.value("uptime_seconds", int64_t{0});
    s.state = watchdog_state_from_string(j.value("state", "stopped"));
    s.stopping = j.value("stopping", false);

    if (j.contains("health") && j["health"].is_object()) {
        const auto& h = j["health"];
        s.health.score = h.value("score", 0);
        s.health.state = health_state_from_string(h.value("state", "dead"));
        s.health.reasons.clear();
        if (h.contains("reasons") && h["reasons"].is_array()) {
            for (const auto& r : h["reasons"]) {
                if (r.is_string()) s.health.reasons.insert(r.get<std::string>());
            }
        }
    }

    s.restart_count_in_window = j.value("restart_count_in_window", 0);
    s.max_restarts = j.value("max_restarts", 0);
    s.cooldown_remaining_seconds = j.value("cooldown_remaining_seconds", int64_t{0});
    s.last_backup_outcome = j.value("last_backup_outcome", "none");
    s.last_backup_path = j.value("last_backup_path", "");
    s.last_error = j.value("last_error", "");
    s.trend_5m = trend_from_json(j.value("trend_5m", json::object()));
    s.trend_1h = trend_from_json(j.value("trend_1h", json::object()));

    s.recent_restarts.clear();
    if (j.contains("recent_restarts") && j["recent_restarts"].is_array()) {
        s.recent_restarts = j["recent_restarts"].get<std::vector<RestartRecord>>();
    }
    s.last_exit_status = j.value("last_exit_status", -1);

    if (j.contains("stats") && j["stats"].is_object()) {
        const auto& st = j["stats"];
        s.checks_performed = st.value("checks_performed", int64_t{0});
        s.restarts_attempted = st.value("restarts_attempted", 0);
        s.restarts_successful = st.value("restarts_successful", 0);
        s.restart_success_rate = st.value("restart_success_rate", 100.0);
    }
    s.updated_at = from_epoch(j.value("updated_at", int64_t{0}));

    s.last_sample.reset();
    if (j.contains("last_sample") && j["last_sample"].is_object()) {
        const auto& ls = j["last_sample"];
        MetricsSample sample;
        sample.cpu_percent = ls.value("cpu_percent", 0.0);
        sample.memory_bytes = ls.value("memory_bytes", int64_t{0});
        sample.uptime_seconds = ls.value("uptime_seconds", int64_t{0});
        sample.port_open = ls.value("port_open", false);
        sample.connection_count = ls.value("connection_count", 0);
        sample.thread_count = ls.value("thread_count", 0);
        s.last_sample = sample;
    }
}
