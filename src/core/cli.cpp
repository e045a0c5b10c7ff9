#include "core/cli.hpp"
#include "core/config.hpp"
#include "daemon/ipc_client.hpp"
#include "ui/status_view.hpp"

#include <cstring>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

namespace fs = std::filesystem;

namespace {

std::string format_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

int report(bool ok, const std::string& message) {
    if (ok) {
        if (!message.empty()) std::cout << message << "\n";
        return 0;
    }
    std::cerr << "Error: " << message << "\n";
    return 1;
}

}

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return 1;
    }

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "daemon") == 0 || std::strcmp(cmd, "--daemon") == 0) {
        return -2;  // special: caller handles daemon mode
    }
    if (std::strcmp(cmd, "status") == 0) {
        return cmd_status();
    }
    if (std::strcmp(cmd, "start") == 0) {
        return cmd_start();
    }
    if (std::strcmp(cmd, "stop") == 0) {
        return cmd_stop();
    }
    if (std::strcmp(cmd, "restart") == 0) {
        return cmd_restart();
    }
    if (std::strcmp(cmd, "send") == 0) {
        return cmd_send(argc, argv);
    }
    if (std::strcmp(cmd, "backup") == 0) {
        return cmd_backup(argc, argv);
    }
    if (std::strcmp(cmd, "backups") == 0) {
        return cmd_backups();
    }
    if (std::strcmp(cmd, "restore") == 0) {
        return cmd_restore(argc, argv);
    }
    if (std::strcmp(cmd, "reset") == 0) {
        return cmd_reset();
    }
    if (std::strcmp(cmd, "history") == 0) {
        return cmd_history(argc, argv);
    }
    if (std::strcmp(cmd, "logs") == 0) {
        return cmd_logs(argc, argv);
    }
    if (std::strcmp(cmd, "config") == 0) {
        return cmd_config(argc, argv);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'craftkeeper help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "craftkeeper - supervisor and watchdog for a game server\n"
        "\n"
        "Usage:\n"
        "  craftkeeper daemon             Run the supervisor (foreground)\n"
        "  craftkeeper status             Show server, health and watchdog status\n"
        "  craftkeeper start              Start the server\n"
        "  craftkeeper stop               Back up, then stop the server gracefully\n"
        "  craftkeeper restart            Back up and restart the server\n"
        "  craftkeeper send <command...>  Send a line to the server console\n"
        "  craftkeeper backup [reason]    Create a backup now\n"
        "  craftkeeper backups            List backups, newest first\n"
        "  craftkeeper restore <name>     Restore a backup (server must be stopped)\n"
        "  craftkeeper reset              Reset the restart counter (leaves 'failed')\n"
        "  craftkeeper history [n]        Show the last n restart attempts\n"
        "  craftkeeper logs [n]           Show the last n lines of the server console\n"
        "  craftkeeper config [show|path|validate|init]\n"
        "                                 Inspect or create the configuration\n"
        "  craftkeeper version            Show version\n"
        "  craftkeeper help               Show this help\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "craftkeeper " << APP_VERSION << "\n";
    return 0;
}

// ── daemon commands ─────────────────────────────────────────

bool CLI::require_daemon() {
    DaemonClient client;
    if (client.is_daemon_running()) return true;
    std::cerr << "craftkeeper daemon is not running.\n";
    std::cerr << "Start it with 'craftkeeper daemon' (or your service manager).\n";
    return false;
}

int CLI::cmd_status() {
    DaemonClient client;
    std::string err;
    auto status = client.get_status(err);
    if (!status) {
        std::cerr << "craftkeeper daemon is not running (" << err << ").\n";
        return 1;
    }
    std::cout << StatusView::to_text(*status) << "\n";
    return 0;
}

int CLI::cmd_start() {
    if (!require_daemon()) return 1;
    DaemonClient client;
    std::string message;
    bool ok = client.start_server(message);
    return report(ok, message);
}

int CLI::cmd_stop() {
    if (!require_daemon()) return 1;
    DaemonClient client;
    std::string message;
    bool ok = client.stop_server(message);
    return report(ok, message);
}

int CLI::cmd_restart() {
    if (!require_daemon()) return 1;
    DaemonClient client;
    std::string message;
    bool ok = client.restart_server(message);
    return report(ok, message);
}

int CLI::cmd_send(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: craftkeeper send <command...>\n";
        return 1;
    }

    std::string text;
    for (int i = 2; i < argc; ++i) {
        if (!text.empty()) text += " ";
        text += argv[i];
    }

    if (!require_daemon()) return 1;
    DaemonClient client;
    std::string message;
    bool ok = client.send_console(text, message);
    return report(ok, message);
}

int CLI::cmd_backup(int argc, char* argv[]) {
    std::string reason = argc >= 3 ? argv[2] : "manual";

    if (!require_daemon()) return 1;
    DaemonClient client;
    std::string message;
    bool ok = client.create_backup(reason, message);
    if (ok) {
        std::cout << "Backup created: " << message << "\n";
        return 0;
    }
    return report(false, message);
}

int CLI::cmd_restore(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: craftkeeper restore <backup name>\n";
        std::cerr << "Run 'craftkeeper backups' to list them.\n";
        return 1;
    }

    if (!require_daemon()) return 1;
    DaemonClient client;
    std::string message;
    return report(client.restore_backup(argv[2], message), message);
}

int CLI::cmd_backups() {
    if (!require_daemon()) return 1;
    DaemonClient client;
    std::string err;
    auto backups = client.list_backups(err);
    if (!err.empty()) return report(false, err);

    if (backups.empty()) {
        std::cout << "No backups yet.\n";
        return 0;
    }
    for (const auto& b : backups) {
        std::cout << std::left << std::setw(48) << b.name
                  << std::setw(12) << StatusView::format_bytes(b.size_bytes)
                  << format_time(b.created) << "\n";
    }
    return 0;
}

int CLI::cmd_reset() {
    if (!require_daemon()) return 1;
    DaemonClient client;
    std::string message;
    bool ok = client.reset_restarts(message);
    return report(ok, message);
}

int CLI::cmd_history(int argc, char* argv[]) {
    int limit = argc >= 3 ? parse_count(argv[2], -1) : 10;
    if (limit <= 0) {
        std::cerr << "Usage: craftkeeper history [n]\n";
        return 1;
    }

    if (!require_daemon()) return 1;
    DaemonClient client;
    std::string err;
    auto records = client.restart_history(limit, err);
    if (!err.empty()) return report(false, err);

    if (records.empty()) {
        std::cout << "No restarts recorded.\n";
        return 0;
    }
    for (const auto& r : records) {
        std::cout << format_time(r.timestamp) << "  "
                  << std::left << std::setw(7) << (r.automatic ? "auto" : "manual")
                  << std::setw(9) << to_string(r.outcome)
                  << r.reason << "\n";
    }
    return 0;
}

// ── logs ────────────────────────────────────────────────────

std::vector<std::string> CLI::tail_lines(const std::string& path, size_t count) {
    std::vector<std::string> result;
    std::ifstream in(path);
    if (!in.is_open() || count == 0) return result;

    std::deque<std::string> window;
    std::string line;
    while (std::getline(in, line)) {
        window.push_back(line);
        if (window.size() > count) window.pop_front();
    }
    result.assign(window.begin(), window.end());
    return result;
}

int CLI::cmd_logs(int argc, char* argv[]) {
    int count = argc >= 3 ? parse_count(argv[2], -1) : 50;
    if (count <= 0) {
        std::cerr << "Usage: craftkeeper logs [n]\n";
        return 1;
    }

    Config config;
    config.load();
    std::string path = config.console_log_path();
    if (!fs::exists(path)) {
        std::cerr << "No console log at " << path << "\n";
        return 1;
    }

    for (const auto& line : tail_lines(path, static_cast<size_t>(count))) {
        std::cout << line << "\n";
    }
    return 0;
}

// ── config ──────────────────────────────────────────────────

int CLI::cmd_config(int argc, char* argv[]) {
    std::string sub = argc >= 3 ? argv[2] : "show";
    Config config;

    if (sub == "path") {
        std::cout << Config::config_path() << "\n";
        return 0;
    }

    if (sub == "init") {
        std::string path = Config::config_path();
        if (!path.empty() && fs::exists(path)) {
            std::cerr << "Configuration already exists: " << path << "\n";
            return 1;
        }
        if (!config.save()) {
            std::cerr << "Cannot write " << path << "\n";
            return 1;
        }
        std::cout << "Wrote default configuration to " << path << "\n";
        return 0;
    }

    bool loaded = config.load();

    if (sub == "show") {
        if (!loaded) {
            std::cout << "# " << Config::config_path() << " not found or unreadable, showing defaults\n";
        }
        std::cout << config.to_yaml();
        return 0;
    }

    if (sub == "validate") {
        if (!loaded && fs::exists(Config::config_path())) {
            std::cerr << "Cannot parse " << Config::config_path() << "\n";
            return 1;
        }
        auto errors = config.validate();
        if (errors.empty()) {
            std::cout << "Configuration OK\n";
            return 0;
        }
        for (const auto& e : errors) {
            std::cerr << "  " << e << "\n";
        }
        return 1;
    }

    std::cerr << "Unknown config subcommand: " << sub << "\n";
    std::cerr << "Usage: craftkeeper config [show|path|validate|init]\n";
    return 1;
}

int CLI::parse_count(const char* arg, int fallback) {
    try {
        size_t used = 0;
        int value = std::stoi(arg, &used);
        if (used != std::strlen(arg)) return fallback;
        return value;
    } catch (const std::logic_error&) {
        return fallback;
    }
}
