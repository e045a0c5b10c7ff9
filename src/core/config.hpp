#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct ServerSettings {
    std::string dir = "~/minecraft/server";
    std::string java_path = "java";
    std::string jar_name = "neoforge-server.jar";
    std::string memory_min = "2G";
    std::string memory_max = "4G";
    std::string java_args =
        "-XX:+UseG1GC -XX:+UnlockExperimentalVMOptions -XX:MaxGCPauseMillis=50 "
        "-XX:G1NewSizePercent=20 -XX:G1ReservePercent=20 -XX:G1HeapRegionSize=32M";
    int port = 25565;
    std::string stop_command = "stop";
    int stop_timeout = 10;          // seconds
    int startup_grace = 120;        // seconds a closed port is tolerated after launch
    std::string console_log;        // empty = <dir>/logs/craftkeeper-console.log
};

struct WatchdogSettings {
    bool enabled = true;
    int interval = 30;              // seconds between ticks
    bool restart_on_crash = true;
    int max_restarts = 5;
    int restart_window = 3600;      // seconds
    int restart_cooldown = 300;     // seconds
};

struct HealthSettings {
    double cpu_high_water = 85.0;       // percent, averaged over the 5 minute trend
    double memory_warn_percent = 85.0;  // percent of memory_max
};

struct BackupSettings {
    std::string dir = "~/minecraft/backups";
    int max_backups = 10;
    bool auto_backup = true;
    int interval = 3600;            // seconds
    bool on_stop = true;
    bool on_restart = true;
    int timeout = 300;              // seconds
};

struct LoggingSettings {
    std::string level = "info";
    std::string file;               // empty = <config_dir>/craftkeeper.log
};

struct AppConfig {
    ServerSettings server;
    WatchdogSettings watchdog;
    HealthSettings health;
    BackupSettings backup;
    LoggingSettings logging;
};

class Config {
public:
    Config();
    ~Config();

    bool load();
    bool save();

    /// Current settings as the YAML document save() writes
    std::string to_yaml() const;

    /// Returns one message per invalid setting; empty when the config is usable
    std::vector<std::string> validate() const;

    AppConfig& data();
    const AppConfig& data() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string state_dir();
    static std::string socket_path();
    static std::string expand_home(const std::string& path);

    /// "4G" -> 4096, "512M" -> 512. Returns -1 for malformed or out-of-range values.
    static int64_t parse_memory_mb(const std::string& value);

    /// Resolved paths derived from the loaded settings
    std::string server_dir() const;
    std::string console_log_path() const;
    std::string backup_dir() const;
    std::string log_file_path() const;
    int64_t memory_max_bytes() const;

private:
    AppConfig config_;
};
