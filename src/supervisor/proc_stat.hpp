#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>

/// Fields of /proc/<pid>/stat used by the supervisor
struct ProcStat {
    char state = '?';
    uint64_t utime = 0;         // clock ticks
    uint64_t stime = 0;         // clock ticks
    int64_t num_threads = 0;
    uint64_t start_ticks = 0;   // clock ticks after boot; identifies a process across PID reuse
    uint64_t rss_pages = 0;
};

/// Parse one /proc/<pid>/stat line. The comm field may contain spaces and
/// parentheses, so parsing starts after the last ')'.
std::optional<ProcStat> parse_proc_stat(const std::string& line);

std::optional<ProcStat> read_proc_stat(pid_t pid);

/// Resident set size in bytes from /proc/<pid>/statm; -1 if unreadable
int64_t read_rss_bytes(pid_t pid);

/// Count ESTABLISHED TCP sockets whose local port equals port,
/// from /proc/net/tcp and /proc/net/tcp6
int count_established_connections(int port);

/// Count ESTABLISHED entries for port in one /proc/net/tcp style table
int count_established_in_table(const std::string& table, int port);
