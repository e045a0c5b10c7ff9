#pragma once

#include "supervisor/metrics_sampler.hpp"

#include <cstdint>
#include <set>
#include <string>

enum class HealthState { Alive, Degraded, Dead };

const char* to_string(HealthState state);

struct HealthVerdict {
    int score = 100;                    // 0..100
    HealthState state = HealthState::Alive;
    std::set<std::string> reasons;
};

struct HealthThresholds {
    double cpu_high_water = 85.0;       // percent
    double memory_warn_percent = 85.0;  // percent of memory_max_bytes
    int64_t memory_max_bytes = 0;       // 0 disables the memory check
};

/// Stateless scoring of one sample against the 5 minute trend.
/// The caller tracks how many probes in a row found the port closed.
class HealthScorer {
public:
    static constexpr int kAliveScore = 70;
    static constexpr int kDeadScore = 30;
    static constexpr int kPortClosedPenalty = 50;
    static constexpr int kMaxCpuPenalty = 30;
    static constexpr int kMaxMemoryPenalty = 30;
    static constexpr int kConfirmedProbeFailures = 2;

    explicit HealthScorer(const HealthThresholds& thresholds);

    /// consecutive_port_failures counts the current sample
    HealthVerdict evaluate(const MetricsSample& sample, const Trend& trend5m,
                           int consecutive_port_failures, bool in_startup_grace) const;

    /// Verdict for a process that no longer exists
    static HealthVerdict process_gone();

    int cpu_penalty(double cpu_percent) const;
    int memory_penalty(int64_t memory_bytes) const;

    const HealthThresholds& thresholds() const { return thresholds_; }

private:
    HealthThresholds thresholds_;
};
