#pragma once

#include "supervisor/backup_hook.hpp"
#include "supervisor/restart_policy.hpp"
#include "supervisor/watchdog.hpp"

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

class DaemonClient {
public:
    /// Empty socket_path resolves the user socket, then the system one
    explicit DaemonClient(const std::string& socket_path = "");

    /// Check if the daemon is running (socket exists and responds)
    bool is_daemon_running();

    /// Get the watchdog status snapshot
    std::optional<StatusSnapshot> get_status(std::string& err);

    /// Server lifecycle. `message` receives the daemon's reply text or error.
    bool start_server(std::string& message);
    bool stop_server(std::string& message);
    bool restart_server(std::string& message);

    /// Write one line to the server console
    bool send_console(const std::string& text, std::string& message);

    /// On success `message` holds the archive path
    bool create_backup(const std::string& reason, std::string& message);

    /// Replace the world with a named archive; the server must be stopped
    bool restore_backup(const std::string& name, std::string& message);

    /// Clear the restart counter and leave the failed state
    bool reset_restarts(std::string& message);

    std::vector<BackupInfo> list_backups(std::string& err);
    std::vector<RestartRecord> restart_history(int limit, std::string& err);

    const std::string& socket_path() const { return socket_path_; }

private:
    std::string socket_path_;

    static std::string resolve_socket_path();

    /// Send a JSON command and receive response
    /// Returns empty json on connection failure
    nlohmann::json send_command(const nlohmann::json& cmd, int timeout_sec = 30);

    /// Shared handling for commands answered with {"ok", "data": {"message"}}
    bool simple_command(const nlohmann::json& cmd, std::string& message, int timeout_sec);
};
