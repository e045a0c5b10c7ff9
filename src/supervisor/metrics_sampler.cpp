#include "supervisor/metrics_sampler.hpp"
#include "supervisor/process_handle.hpp"
#include "supervisor/proc_stat.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

size_t short_capacity(int interval_seconds) {
    int interval = std::max(1, interval_seconds);
    // One extra slot so a full window still spans the whole five minutes
    return static_cast<size_t>((MetricsSampler::kShortWindow.count() + interval - 1) / interval) + 1;
}

}

MetricsSampler::MetricsSampler(ProcessControl& process, int port, int interval_seconds,
                               std::chrono::milliseconds probe_timeout)
    : process_(process),
      port_(port),
      probe_timeout_(probe_timeout),
      short_(short_capacity(interval_seconds)),
      long_(static_cast<size_t>(kLongWindow / kLongResolution)) {}

bool MetricsSampler::probe_port(const std::string& host, int port, std::chrono::milliseconds timeout) {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        close(fd);
        return false;
    }

    bool open_port = false;
    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) == 0) {
        open_port = true;
    } else if (errno == EINPROGRESS) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int ret;
        do {
            ret = poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (ret < 0 && errno == EINTR);

        if (ret > 0) {
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0) {
                open_port = true;
            }
        }
    }

    close(fd);
    return open_port;
}

MetricsSource::SampleResult MetricsSampler::sample() {
    SampleResult result;

    auto proc = process_.current();
    if (!proc) {
        result.error = SupervisorError::ProcessGone;
        return result;
    }

    auto stat = read_proc_stat(proc->pid);
    if (!stat || stat->state == 'Z' ||
        (proc->start_ticks != 0 && stat->start_ticks != proc->start_ticks)) {
        result.error = SupervisorError::ProcessGone;
        return result;
    }

    MetricsSample s;
    s.timestamp = std::chrono::steady_clock::now();
    s.thread_count = static_cast<int>(stat->num_threads);

    uint64_t cpu_ticks = stat->utime + stat->stime;
    if (proc->pid == last_pid_) {
        double elapsed = std::chrono::duration<double>(s.timestamp - last_cpu_time_).count();
        long ticks_per_sec = sysconf(_SC_CLK_TCK);
        if (elapsed > 0.0 && ticks_per_sec > 0 && cpu_ticks >= last_cpu_ticks_) {
            double cpu_seconds = static_cast<double>(cpu_ticks - last_cpu_ticks_) / ticks_per_sec;
            s.cpu_percent = 100.0 * cpu_seconds / elapsed;
        }
    }
    last_pid_ = proc->pid;
    last_cpu_ticks_ = cpu_ticks;
    last_cpu_time_ = s.timestamp;

    int64_t rss = read_rss_bytes(proc->pid);
    s.memory_bytes = rss >= 0 ? rss : static_cast<int64_t>(stat->rss_pages) * sysconf(_SC_PAGESIZE);

    auto uptime = std::chrono::system_clock::now() - proc->started_at;
    s.uptime_seconds = std::max<int64_t>(
        0, std::chrono::duration_cast<std::chrono::seconds>(uptime).count());

    s.port_open = probe_port("127.0.0.1", port_, probe_timeout_);
    s.connection_count = count_established_connections(port_);

    record(s);

    spdlog::debug("Sample pid {}: cpu {:.1f}% mem {} MB threads {} port {} conns {}",
                  proc->pid, s.cpu_percent, s.memory_bytes / (1024 * 1024), s.thread_count,
                  s.port_open ? "open" : "closed", s.connection_count);

    result.success = true;
    result.sample = s;
    return result;
}

void MetricsSampler::record(const MetricsSample& sample) {
    short_.push(sample);
    if (long_.empty() || sample.timestamp - long_.newest().timestamp >= kLongResolution) {
        long_.push(sample);
    }
}

Trend MetricsSampler::trend(TrendWindow window) const {
    const RingBuffer<MetricsSample>& buffer = window == TrendWindow::FiveMinutes ? short_ : long_;
    auto horizon = window == TrendWindow::FiveMinutes
        ? std::chrono::duration_cast<std::chrono::steady_clock::duration>(kShortWindow)
        : std::chrono::duration_cast<std::chrono::steady_clock::duration>(kLongWindow);

    Trend t;
    if (buffer.empty()) return t;

    auto newest = buffer.newest().timestamp;
    double cpu_sum = 0.0;
    double mem_sum = 0.0;
    for (size_t i = 0; i < buffer.size(); ++i) {
        const auto& s = buffer.at(i);
        if (newest - s.timestamp > horizon) continue;
        cpu_sum += s.cpu_percent;
        mem_sum += static_cast<double>(s.memory_bytes);
        t.peak_cpu = std::max(t.peak_cpu, s.cpu_percent);
        t.peak_memory = std::max(t.peak_memory, s.memory_bytes);
        ++t.samples;
    }
    if (t.samples > 0) {
        t.avg_cpu = cpu_sum / t.samples;
        t.avg_memory = mem_sum / t.samples;
    }
    return t;
}

void MetricsSampler::reset() {
    short_.clear();
    long_.clear();
    last_pid_ = -1;
    last_cpu_ticks_ = 0;
}
