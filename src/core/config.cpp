#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/craftkeeper";
    }
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/craftkeeper";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/craftkeeper";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::state_dir() {
    if (is_privileged()) {
        return "/var/lib/craftkeeper";
    }
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/state";
}

std::string Config::socket_path() {
    std::string dir = state_dir();
    if (dir.empty()) return "";
    return dir + "/craftkeeper.sock";
}

int64_t Config::parse_memory_mb(const std::string& value) {
    std::string s;
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            s += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    if (s.size() < 2) return -1;

    char unit = s.back();
    std::string number = s.substr(0, s.size() - 1);
    double amount = 0.0;
    try {
        size_t used = 0;
        amount = std::stod(number, &used);
        if (used != number.size()) return -1;
    } catch (const std::logic_error&) {
        return -1;
    }

    if (unit == 'G') {
        if (amount < 0.1 || amount > 64) return -1;
        return static_cast<int64_t>(amount * 1024);
    }
    if (unit == 'M') {
        if (amount < 100 || amount > 65536) return -1;
        return static_cast<int64_t>(amount);
    }
    return -1;
}

bool Config::load() {
    std::string path = config_path();
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);

        // Server section
        if (auto server = root["server"]) {
            auto& s = config_.server;
            s.dir = server["dir"].as<std::string>(s.dir);
            s.java_path = server["java_path"].as<std::string>(s.java_path);
            s.jar_name = server["jar_name"].as<std::string>(s.jar_name);
            s.memory_min = server["memory_min"].as<std::string>(s.memory_min);
            s.memory_max = server["memory_max"].as<std::string>(s.memory_max);
            s.java_args = server["java_args"].as<std::string>(s.java_args);
            s.port = server["port"].as<int>(s.port);
            s.stop_command = server["stop_command"].as<std::string>(s.stop_command);
            s.stop_timeout = server["stop_timeout"].as<int>(s.stop_timeout);
            s.startup_grace = server["startup_grace"].as<int>(s.startup_grace);
            s.console_log = server["console_log"].as<std::string>(s.console_log);
        }

        // Watchdog section
        if (auto wd = root["watchdog"]) {
            auto& w = config_.watchdog;
            w.enabled = wd["enabled"].as<bool>(w.enabled);
            w.interval = wd["interval"].as<int>(w.interval);
            w.restart_on_crash = wd["restart_on_crash"].as<bool>(w.restart_on_crash);
            w.max_restarts = wd["max_restarts"].as<int>(w.max_restarts);
            w.restart_window = wd["restart_window"].as<int>(w.restart_window);
            w.restart_cooldown = wd["restart_cooldown"].as<int>(w.restart_cooldown);
        }

        // Health section
        if (auto health = root["health"]) {
            auto& h = config_.health;
            h.cpu_high_water = health["cpu_high_water"].as<double>(h.cpu_high_water);
            h.memory_warn_percent = health["memory_warn_percent"].as<double>(h.memory_warn_percent);
        }

        // Backup section
        if (auto backup = root["backup"]) {
            auto& b = config_.backup;
            b.dir = backup["dir"].as<std::string>(b.dir);
            b.max_backups = backup["max_backups"].as<int>(b.max_backups);
            b.auto_backup = backup["auto_backup"].as<bool>(b.auto_backup);
            b.interval = backup["interval"].as<int>(b.interval);
            b.on_stop = backup["on_stop"].as<bool>(b.on_stop);
            b.on_restart = backup["on_restart"].as<bool>(b.on_restart);
            b.timeout = backup["timeout"].as<int>(b.timeout);
        }

        // Logging section
        if (auto logging = root["logging"]) {
            auto& l = config_.logging;
            l.level = logging["level"].as<std::string>(l.level);
            l.file = logging["file"].as<std::string>(l.file);
        }

        return true;
    } catch (const YAML::Exception&) {
        // Parse failed, use defaults
        config_ = AppConfig{};
        return false;
    }
}

std::string Config::to_yaml() const {
    const auto& s = config_.server;
    const auto& w = config_.watchdog;
    const auto& h = config_.health;
    const auto& b = config_.backup;
    const auto& l = config_.logging;

    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "server" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "dir" << YAML::Value << s.dir;
    out << YAML::Key << "java_path" << YAML::Value << s.java_path;
    out << YAML::Key << "jar_name" << YAML::Value << s.jar_name;
    out << YAML::Key << "memory_min" << YAML::Value << s.memory_min;
    out << YAML::Key << "memory_max" << YAML::Value << s.memory_max;
    out << YAML::Key << "java_args" << YAML::Value << s.java_args;
    out << YAML::Key << "port" << YAML::Value << s.port;
    out << YAML::Key << "stop_command" << YAML::Value << s.stop_command;
    out << YAML::Key << "stop_timeout" << YAML::Value << s.stop_timeout;
    out << YAML::Key << "startup_grace" << YAML::Value << s.startup_grace;
    out << YAML::Key << "console_log" << YAML::Value << s.console_log;
    out << YAML::EndMap;

    out << YAML::Key << "watchdog" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enabled" << YAML::Value << w.enabled;
    out << YAML::Key << "interval" << YAML::Value << w.interval;
    out << YAML::Key << "restart_on_crash" << YAML::Value << w.restart_on_crash;
    out << YAML::Key << "max_restarts" << YAML::Value << w.max_restarts;
    out << YAML::Key << "restart_window" << YAML::Value << w.restart_window;
    out << YAML::Key << "restart_cooldown" << YAML::Value << w.restart_cooldown;
    out << YAML::EndMap;

    out << YAML::Key << "health" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "cpu_high_water" << YAML::Value << h.cpu_high_water;
    out << YAML::Key << "memory_warn_percent" << YAML::Value << h.memory_warn_percent;
    out << YAML::EndMap;

    out << YAML::Key << "backup" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "dir" << YAML::Value << b.dir;
    out << YAML::Key << "max_backups" << YAML::Value << b.max_backups;
    out << YAML::Key << "auto_backup" << YAML::Value << b.auto_backup;
    out << YAML::Key << "interval" << YAML::Value << b.interval;
    out << YAML::Key << "on_stop" << YAML::Value << b.on_stop;
    out << YAML::Key << "on_restart" << YAML::Value << b.on_restart;
    out << YAML::Key << "timeout" << YAML::Value << b.timeout;
    out << YAML::EndMap;

    out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << l.level;
    out << YAML::Key << "file" << YAML::Value << l.file;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

bool Config::save() {
    std::string dir = config_dir();
    std::string path = config_path();
    if (dir.empty() || path.empty()) return false;

    try {
        fs::create_directories(dir);
        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << to_yaml();
        return fout.good();
    } catch (const std::exception&) {
        return false;
    }
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> errors;
    const auto& s = config_.server;
    const auto& w = config_.watchdog;
    const auto& h = config_.health;
    const auto& b = config_.backup;

    auto check_range = [&errors](const char* key, int value, int lo, int hi) {
        if (value < lo || value > hi) {
            errors.push_back(std::string(key) + " must be between " + std::to_string(lo) +
                             " and " + std::to_string(hi) + " (got " + std::to_string(value) + ")");
        }
    };

    if (s.dir.empty()) errors.push_back("server.dir must not be empty");
    if (s.jar_name.empty()) errors.push_back("server.jar_name must not be empty");
    if (s.java_path.empty()) errors.push_back("server.java_path must not be empty");
    if (s.stop_command.empty()) errors.push_back("server.stop_command must not be empty");

    int64_t min_mb = parse_memory_mb(s.memory_min);
    int64_t max_mb = parse_memory_mb(s.memory_max);
    if (min_mb < 0) errors.push_back("server.memory_min is invalid: '" + s.memory_min + "'");
    if (max_mb < 0) errors.push_back("server.memory_max is invalid: '" + s.memory_max + "'");
    if (min_mb > 0 && max_mb > 0 && min_mb > max_mb) {
        errors.push_back("server.memory_min must not exceed server.memory_max");
    }

    check_range("server.port", s.port, 1, 65535);
    check_range("server.stop_timeout", s.stop_timeout, 1, 120);
    check_range("server.startup_grace", s.startup_grace, 0, 3600);

    check_range("watchdog.interval", w.interval, 5, 300);
    check_range("watchdog.max_restarts", w.max_restarts, 1, 20);
    check_range("watchdog.restart_window", w.restart_window, 60, 86400);
    check_range("watchdog.restart_cooldown", w.restart_cooldown, 0, 3600);

    if (h.cpu_high_water <= 0.0) errors.push_back("health.cpu_high_water must be positive");
    if (h.memory_warn_percent <= 0.0 || h.memory_warn_percent >= 100.0) {
        errors.push_back("health.memory_warn_percent must be between 0 and 100");
    }

    if (b.dir.empty()) errors.push_back("backup.dir must not be empty");
    check_range("backup.max_backups", b.max_backups, 1, 100);
    check_range("backup.interval", b.interval, 300, 86400);
    check_range("backup.timeout", b.timeout, 10, 7200);

    static const std::vector<std::string> levels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"
    };
    if (std::find(levels.begin(), levels.end(), config_.logging.level) == levels.end()) {
        errors.push_back("logging.level is invalid: '" + config_.logging.level + "'");
    }

    return errors;
}

std::string Config::server_dir() const {
    return expand_home(config_.server.dir);
}

std::string Config::console_log_path() const {
    if (!config_.server.console_log.empty()) {
        return expand_home(config_.server.console_log);
    }
    return server_dir() + "/logs/craftkeeper-console.log";
}

std::string Config::backup_dir() const {
    return expand_home(config_.backup.dir);
}

std::string Config::log_file_path() const {
    if (!config_.logging.file.empty()) {
        return expand_home(config_.logging.file);
    }
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/craftkeeper.log";
}

int64_t Config::memory_max_bytes() const {
    int64_t mb = parse_memory_mb(config_.server.memory_max);
    if (mb <= 0) return 0;
    return mb * 1024 * 1024;
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
