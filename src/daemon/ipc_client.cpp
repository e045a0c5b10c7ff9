#include "daemon/ipc_client.hpp"
#include "daemon/status_json.hpp"
#include "core/config.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cstring>

using json = nlohmann::json;

namespace {

constexpr const char* kSystemSocket = "/var/lib/craftkeeper/craftkeeper.sock";

// Lifecycle commands may include a backup and a stop timeout
constexpr int kLongCommandTimeout = 600;

}

DaemonClient::DaemonClient(const std::string& socket_path)
    : socket_path_(socket_path.empty() ? resolve_socket_path() : socket_path) {}

std::string DaemonClient::resolve_socket_path() {
    // Try user-specific path first
    std::string path = Config::socket_path();
    if (!path.empty() && access(path.c_str(), F_OK) == 0) {
        return path;
    }

    // Fall back to system path (daemon running as root)
    if (access(kSystemSocket, F_OK) == 0) {
        return kSystemSocket;
    }

    // Neither exists; return default user path
    return path;
}

json DaemonClient::send_command(const json& cmd, int timeout_sec) {
    if (socket_path_.empty()) return json();

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return json();

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        return json();
    }

    // Set read timeout
    struct timeval tv;
    tv.tv_sec = timeout_sec;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    // Send command
    std::string msg = cmd.dump() + "\n";
    size_t total = 0;
    while (total < msg.size()) {
        ssize_t n = send(fd, msg.data() + total, msg.size() - total, MSG_NOSIGNAL);
        if (n <= 0) {
            close(fd);
            return json();
        }
        total += static_cast<size_t>(n);
    }

    // Read response
    std::string buffer;
    char c;
    while (read(fd, &c, 1) == 1) {
        if (c == '\n') break;
        buffer += c;
        if (buffer.size() > 1024 * 1024) break;
    }

    close(fd);

    if (buffer.empty()) return json();

    try {
        return json::parse(buffer);
    } catch (const json::parse_error&) {
        return json();
    }
}

bool DaemonClient::simple_command(const json& cmd, std::string& message, int timeout_sec) {
    auto resp = send_command(cmd, timeout_sec);
    if (resp.empty()) {
        message = "Cannot connect to daemon";
        return false;
    }
    if (resp.value("ok", false)) {
        if (resp.contains("data") && resp["data"].is_object()) {
            message = resp["data"].value("message", "");
            std::string warning = resp["data"].value("warning", "");
            if (!warning.empty()) message += " (" + warning + ")";
        } else {
            message.clear();
        }
        return true;
    }
    message = resp.value("error", "Unknown error");
    return false;
}

bool DaemonClient::is_daemon_running() {
    auto resp = send_command({{"cmd", "status"}}, 5);
    return !resp.empty() && resp.value("ok", false);
}

std::optional<StatusSnapshot> DaemonClient::get_status(std::string& err) {
    auto resp = send_command({{"cmd", "status"}}, 5);
    if (resp.empty()) {
        err = "Cannot connect to daemon";
        return std::nullopt;
    }
    if (!resp.value("ok", false) || !resp.contains("data")) {
        err = resp.value("error", "Unknown error");
        return std::nullopt;
    }

    try {
        return resp["data"].get<StatusSnapshot>();
    } catch (const json::exception& e) {
        err = std::string("Malformed status: ") + e.what();
        return std::nullopt;
    }
}

bool DaemonClient::start_server(std::string& message) {
    return simple_command({{"cmd", "start"}}, message, kLongCommandTimeout);
}

bool DaemonClient::stop_server(std::string& message) {
    return simple_command({{"cmd", "stop"}}, message, kLongCommandTimeout);
}

bool DaemonClient::restart_server(std::string& message) {
    return simple_command({{"cmd", "restart"}}, message, kLongCommandTimeout);
}

bool DaemonClient::send_console(const std::string& text, std::string& message) {
    return simple_command({{"cmd", "send"}, {"text", text}}, message, 30);
}

bool DaemonClient::create_backup(const std::string& reason, std::string& message) {
    return simple_command({{"cmd", "backup"}, {"reason", reason}}, message, kLongCommandTimeout);
}

bool DaemonClient::restore_backup(const std::string& name, std::string& message) {
    return simple_command({{"cmd", "restore"}, {"name", name}}, message, kLongCommandTimeout);
}

bool DaemonClient::reset_restarts(std::string& message) {
    return simple_command({{"cmd", "reset"}}, message, 30);
}

std::vector<BackupInfo> DaemonClient::list_backups(std::string& err) {
    std::vector<BackupInfo> backups;
    auto resp = send_command({{"cmd", "backups"}});
    if (resp.empty()) {
        err = "Cannot connect to daemon";
        return backups;
    }
    if (!resp.value("ok", false) || !resp.contains("data") || !resp["data"].is_array()) {
        err = resp.value("error", "Unknown error");
        return backups;
    }

    try {
        backups = resp["data"].get<std::vector<BackupInfo>>();
    } catch (const json::exception& e) {
        err = std::string("Malformed backup list: ") + e.what();
    }
    return backups;
}

std::vector<RestartRecord> DaemonClient::restart_history(int limit, std::string& err) {
    std::vector<RestartRecord> records;
    auto resp = send_command({{"cmd", "history"}, {"limit", limit}});
    if (resp.empty()) {
        err = "Cannot connect to daemon";
        return records;
    }
    if (!resp.value("ok", false) || !resp.contains("data") || !resp["data"].is_array()) {
        err = resp.value("error", "Unknown error");
        return records;
    }

    try {
        records = resp["data"].get<std::vector<RestartRecord>>();
    } catch (const json::exception& e) {
        err = std::string("Malformed history: ") + e.what();
    }
    return records;
}
