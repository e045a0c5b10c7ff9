#include "supervisor/health_scorer.hpp"

#include <algorithm>
#include <cmath>

const char* to_string(HealthState state) {
    switch (state) {
        case HealthState::Alive:    return "alive";
        case HealthState::Degraded: return "degraded";
        case HealthState::Dead:     return "dead";
    }
    return "unknown";
}

namespace {

/// Linear penalty from 0 at the threshold to max_penalty at 100%
int proportional_penalty(double value, double threshold, int max_penalty) {
    if (value <= threshold) return 0;
    double span = std::max(100.0 - threshold, 10.0);
    double penalty = std::ceil((value - threshold) / span * max_penalty);
    return std::min(max_penalty, static_cast<int>(penalty));
}

}

HealthScorer::HealthScorer(const HealthThresholds& thresholds)
    : thresholds_(thresholds) {}

int HealthScorer::cpu_penalty(double cpu_percent) const {
    return proportional_penalty(cpu_percent, thresholds_.cpu_high_water, kMaxCpuPenalty);
}

int HealthScorer::memory_penalty(int64_t memory_bytes) const {
    if (thresholds_.memory_max_bytes <= 0) return 0;
    double percent = 100.0 * static_cast<double>(memory_bytes) /
                     static_cast<double>(thresholds_.memory_max_bytes);
    return proportional_penalty(percent, thresholds_.memory_warn_percent, kMaxMemoryPenalty);
}

HealthVerdict HealthScorer::evaluate(const MetricsSample& sample, const Trend& trend5m,
                                     int consecutive_port_failures, bool in_startup_grace) const {
    HealthVerdict verdict;
    int score = 100;

    bool port_failed = !sample.port_open && !in_startup_grace;
    if (!sample.port_open) {
        if (in_startup_grace) {
            verdict.reasons.insert("starting");
        } else {
            score -= kPortClosedPenalty;
            verdict.reasons.insert("port_closed");
        }
    }

    // Sustained CPU: fall back to the instant value before the trend has data
    double cpu = trend5m.samples > 0 ? trend5m.avg_cpu : sample.cpu_percent;
    int cpu_cost = cpu_penalty(cpu);
    if (cpu_cost > 0) {
        score -= cpu_cost;
        verdict.reasons.insert("cpu_high");
    }

    int mem_cost = memory_penalty(sample.memory_bytes);
    if (mem_cost > 0) {
        score -= mem_cost;
        verdict.reasons.insert("memory_high");
    }

    verdict.score = std::max(0, score);

    if (verdict.score >= kAliveScore) {
        verdict.state = HealthState::Alive;
    } else if (verdict.score >= kDeadScore) {
        verdict.state = HealthState::Degraded;
    } else {
        verdict.state = HealthState::Dead;
    }

    if (port_failed) {
        if (consecutive_port_failures >= kConfirmedProbeFailures) {
            verdict.state = HealthState::Dead;
        } else if (verdict.state == HealthState::Dead) {
            // A single failed probe is never enough to declare the server dead
            verdict.state = HealthState::Degraded;
            verdict.reasons.insert("probe_unconfirmed");
        }
    }

    return verdict;
}

HealthVerdict HealthScorer::process_gone() {
    HealthVerdict verdict;
    verdict.score = 0;
    verdict.state = HealthState::Dead;
    verdict.reasons.insert("process_gone");
    return verdict;
}
