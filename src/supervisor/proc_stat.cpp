#include "supervisor/proc_stat.hpp"

#include <fstream>
#include <sstream>
#include <vector>
#include <unistd.h>

namespace {

std::string read_first_line(const std::string& path) {
    std::ifstream in(path);
    std::string line;
    if (!in.is_open() || !std::getline(in, line)) return "";
    return line;
}

}

std::optional<ProcStat> parse_proc_stat(const std::string& line) {
    size_t comm_end = line.rfind(')');
    if (comm_end == std::string::npos || comm_end + 2 > line.size()) {
        return std::nullopt;
    }

    std::istringstream iss(line.substr(comm_end + 2));
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) fields.push_back(field);

    // fields[0] is "state" (field 3 of the man page); rss is field 24
    if (fields.size() < 22 || fields[0].empty()) return std::nullopt;

    ProcStat stat;
    try {
        stat.state = fields[0][0];
        stat.utime = std::stoull(fields[11]);
        stat.stime = std::stoull(fields[12]);
        stat.num_threads = std::stoll(fields[17]);
        stat.start_ticks = std::stoull(fields[19]);
        stat.rss_pages = std::stoull(fields[21]);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return stat;
}

std::optional<ProcStat> read_proc_stat(pid_t pid) {
    if (pid <= 0) return std::nullopt;
    std::string line = read_first_line("/proc/" + std::to_string(pid) + "/stat");
    if (line.empty()) return std::nullopt;
    return parse_proc_stat(line);
}

int64_t read_rss_bytes(pid_t pid) {
    if (pid <= 0) return -1;
    std::string line = read_first_line("/proc/" + std::to_string(pid) + "/statm");
    if (line.empty()) return -1;

    std::istringstream iss(line);
    uint64_t size = 0, resident = 0;
    if (!(iss >> size >> resident)) return -1;
    return static_cast<int64_t>(resident) * sysconf(_SC_PAGESIZE);
}

int count_established_in_table(const std::string& table, int port) {
    // "  sl  local_address rem_address   st ..." followed by one socket per line,
    // addresses are HEX_IP:HEX_PORT, state 01 is ESTABLISHED
    std::istringstream lines(table);
    std::string line;
    int count = 0;
    bool header = true;
    while (std::getline(lines, line)) {
        if (header) {
            header = false;
            continue;
        }
        std::istringstream iss(line);
        std::string slot, local, remote, state;
        if (!(iss >> slot >> local >> remote >> state)) continue;

        size_t colon = local.rfind(':');
        if (colon == std::string::npos) continue;
        int local_port = 0;
        try {
            local_port = std::stoi(local.substr(colon + 1), nullptr, 16);
        } catch (const std::exception&) {
            continue;
        }
        if (local_port == port && state == "01") ++count;
    }
    return count;
}

int count_established_connections(int port) {
    int total = 0;
    for (const char* path : {"/proc/net/tcp", "/proc/net/tcp6"}) {
        std::ifstream in(path);
        if (!in.is_open()) continue;
        std::stringstream buffer;
        buffer << in.rdbuf();
        total += count_established_in_table(buffer.str(), port);
    }
    return total;
}
