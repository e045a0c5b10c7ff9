#pragma once

#include "supervisor/errors.hpp"
#include "supervisor/ring_buffer.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <sys/types.h>

class ProcessControl;

struct MetricsSample {
    std::chrono::steady_clock::time_point timestamp;
    double cpu_percent = 0.0;
    int64_t memory_bytes = 0;
    int64_t uptime_seconds = 0;
    bool port_open = false;
    int connection_count = 0;
    int thread_count = 0;
};

enum class TrendWindow { FiveMinutes, OneHour };

struct Trend {
    double avg_cpu = 0.0;
    double avg_memory = 0.0;
    double peak_cpu = 0.0;
    int64_t peak_memory = 0;
    size_t samples = 0;
};

class MetricsSource {
public:
    virtual ~MetricsSource() = default;

    struct SampleResult {
        bool success = false;
        SupervisorError error = SupervisorError::None;
        MetricsSample sample;
    };

    /// Take one sample of the supervised process and append it to the trends
    virtual SampleResult sample() = 0;
    virtual Trend trend(TrendWindow window) const = 0;

    /// Forget history, e.g. after the process was replaced
    virtual void reset() = 0;
};

class MetricsSampler : public MetricsSource {
public:
    static constexpr std::chrono::seconds kShortWindow{300};
    static constexpr std::chrono::seconds kLongWindow{3600};
    static constexpr std::chrono::seconds kLongResolution{60};

    /// interval_seconds is the watchdog tick, used to size the 5 minute buffer
    MetricsSampler(ProcessControl& process, int port, int interval_seconds,
                   std::chrono::milliseconds probe_timeout = std::chrono::milliseconds(2000));

    SampleResult sample() override;
    Trend trend(TrendWindow window) const override;
    void reset() override;

    /// Append an already-taken sample to both windows
    void record(const MetricsSample& sample);

    size_t short_window_size() const { return short_.size(); }
    size_t long_window_size() const { return long_.size(); }
    size_t short_window_capacity() const { return short_.capacity(); }

    /// TCP connect to host:port, bounded by timeout
    static bool probe_port(const std::string& host, int port, std::chrono::milliseconds timeout);

private:
    ProcessControl& process_;
    int port_;
    std::chrono::milliseconds probe_timeout_;

    RingBuffer<MetricsSample> short_;
    RingBuffer<MetricsSample> long_;

    // CPU baseline from the previous sample of the same pid
    pid_t last_pid_ = -1;
    uint64_t last_cpu_ticks_ = 0;
    std::chrono::steady_clock::time_point last_cpu_time_;
};
