#pragma once

#include <string>
#include <vector>

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -2 for `daemon` (caller runs the daemon).
    static int run(int argc, char* argv[]);

    /// Last `count` lines of a text file; empty when it cannot be read
    static std::vector<std::string> tail_lines(const std::string& path, size_t count);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_status();
    static int cmd_start();
    static int cmd_stop();
    static int cmd_restart();
    static int cmd_send(int argc, char* argv[]);
    static int cmd_backup(int argc, char* argv[]);
    static int cmd_backups();
    static int cmd_restore(int argc, char* argv[]);
    static int cmd_reset();
    static int cmd_history(int argc, char* argv[]);
    static int cmd_logs(int argc, char* argv[]);
    static int cmd_config(int argc, char* argv[]);

    /// Print the usual hint and return false when no daemon answers
    static bool require_daemon();

    static int parse_count(const char* arg, int fallback);
};
