#include "daemon/daemon.hpp"
#include "daemon/status_json.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sys/file.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <chrono>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr size_t kMaxRequestBytes = 65536;

RestartLimits limits_from(const AppConfig& c) {
    RestartLimits limits;
    limits.max_restarts = c.watchdog.max_restarts;
    limits.window = std::chrono::seconds(c.watchdog.restart_window);
    limits.cooldown = std::chrono::seconds(c.watchdog.restart_cooldown);
    return limits;
}

HealthThresholds thresholds_from(const Config& c) {
    HealthThresholds t;
    t.cpu_high_water = c.data().health.cpu_high_water;
    t.memory_warn_percent = c.data().health.memory_warn_percent;
    t.memory_max_bytes = c.memory_max_bytes();
    return t;
}

json error_reply(const std::string& message, SupervisorError code = SupervisorError::None) {
    json reply = {{"ok", false}, {"error", message}};
    if (code != SupervisorError::None) {
        reply["code"] = to_string(code);
    }
    return reply;
}

/// True when something accepts connections on the socket at `path`
bool socket_answers(const std::string& path) {
    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    bool answered = connect(fd, (struct sockaddr*)&addr, sizeof(addr)) == 0;
    close(fd);
    return answered;
}

}

Daemon::Daemon(Config& config)
    : config_(config),
      state_dir_(Config::state_dir()),
      process_(state_dir_, config.data().server.stop_command),
      metrics_(process_, config.data().server.port, config.data().watchdog.interval),
      policy_(limits_from(config.data()), state_dir_ + "/restart_history.jsonl"),
      backup_(config.server_dir() + "/world", config.backup_dir()),
      watchdog_(WatchdogOptions::from_config(config.data()), process_, metrics_,
                HealthScorer(thresholds_from(config)), policy_, backup_,
                LaunchSpec::from_config(config)) {}

Daemon::~Daemon() {
    request_stop();
    watchdog_.shutdown();
    reap_responders(true);
    cleanup_socket();
    release_instance_lock();
}

std::string Daemon::history_path() const {
    return state_dir_ + "/restart_history.jsonl";
}

std::string Daemon::socket_path() const {
    if (state_dir_.empty()) return "";
    return state_dir_ + "/craftkeeper.sock";
}

std::string Daemon::pid_path() const {
    if (state_dir_.empty()) return "";
    return state_dir_ + "/craftkeeper.pid";
}

bool Daemon::acquire_instance_lock() {
    std::string path = pid_path();
    if (path.empty()) {
        spdlog::error("Cannot determine state directory (is HOME set?)");
        return false;
    }

    std::error_code ec;
    fs::create_directories(state_dir_, ec);
    if (ec) {
        spdlog::error("Cannot create {}: {}", state_dir_, ec.message());
        return false;
    }

    int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        spdlog::error("Cannot open {}: {}", path, std::strerror(errno));
        return false;
    }
    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int saved = errno;
        close(fd);
        if (saved == EWOULDBLOCK) {
            spdlog::error("Another craftkeeper daemon is already running (lock {} is held)", path);
        } else {
            spdlog::error("Cannot lock {}: {}", path, std::strerror(saved));
        }
        return false;
    }

    std::string pid = std::to_string(static_cast<int>(getpid())) + "\n";
    if (ftruncate(fd, 0) != 0 || write(fd, pid.data(), pid.size()) != static_cast<ssize_t>(pid.size())) {
        spdlog::warn("Could not record daemon pid in {}: {}", path, std::strerror(errno));
    }
    pid_fd_ = fd;
    return true;
}

void Daemon::release_instance_lock() {
    if (pid_fd_ < 0) return;
    flock(pid_fd_, LOCK_UN);
    close(pid_fd_);
    pid_fd_ = -1;
}

void Daemon::cleanup_socket() {
    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
    }
    // Only the instance that bound the socket may remove it
    if (owns_socket_) {
        owns_socket_ = false;
        std::string path = socket_path();
        if (!path.empty()) {
            unlink(path.c_str());
        }
    }
}

bool Daemon::start_ipc_server() {
    std::string path = socket_path();
    if (path.empty()) {
        spdlog::error("Cannot determine state directory (is HOME set?)");
        return false;
    }

    std::error_code exists_ec;
    if (fs::exists(path, exists_ec)) {
        if (socket_answers(path)) {
            spdlog::error("Another craftkeeper daemon is listening on {}", path);
            return false;
        }
        // Left behind by a daemon that died without cleaning up
        spdlog::info("Removing stale control socket {}", path);
        unlink(path.c_str());
    }

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        spdlog::error("Cannot create {}: {}", fs::path(path).parent_path().string(), ec.message());
        return false;
    }

    socket_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (socket_fd_ < 0) {
        spdlog::error("socket() failed: {}", std::strerror(errno));
        return false;
    }

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(socket_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        spdlog::error("Cannot bind {}: {}", path, std::strerror(errno));
        close(socket_fd_);
        socket_fd_ = -1;
        return false;
    }
    owns_socket_ = true;

    // Restrict permissions to owner only
    chmod(path.c_str(), 0600);

    if (listen(socket_fd_, 5) < 0) {
        spdlog::error("listen() failed: {}", std::strerror(errno));
        cleanup_socket();
        return false;
    }

    spdlog::info("Control socket listening on {}", path);
    return true;
}

void Daemon::ipc_loop() {
    struct pollfd pfd;
    pfd.fd = socket_fd_;
    pfd.events = POLLIN;

    while (!stop_flag_.load()) {
        reap_responders(false);

        int ret = poll(&pfd, 1, 500); // 500ms timeout
        if (ret <= 0) continue;

        if (pfd.revents & POLLIN) {
            int client_fd = accept4(socket_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (client_fd < 0) continue;
            serve_client(client_fd);
        }
    }
}

void Daemon::serve_client(int client_fd) {
    // A client that never finishes its line must not stall the daemon
    struct timeval tv;
    tv.tv_sec = 5;
    tv.tv_usec = 0;
    setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    // Read a single JSON line
    std::string buffer;
    char c;
    while (read(client_fd, &c, 1) == 1) {
        if (c == '\n') break;
        buffer += c;
        if (buffer.size() > kMaxRequestBytes) {
            buffer.clear();
            break;
        }
    }
    if (buffer.empty()) {
        close(client_fd);
        return;
    }

    Request request = handle_command(buffer);
    if (!request.deferred) {
        write_reply(client_fd, request.reply + "\n");
        close(client_fd);
        return;
    }

    // Lifecycle commands can take as long as a stop timeout or a backup.
    // Their reply is written from a separate thread so status keeps answering.
    auto done = std::make_shared<std::atomic<bool>>(false);
    try {
        std::thread responder([client_fd, done, pending = std::move(request.pending)]() mutable {
            std::string reply;
            try {
                reply = command_reply(pending.get());
            } catch (const std::future_error& e) {
                reply = error_reply(std::string("Command abandoned: ") + e.what()).dump();
            }
            write_reply(client_fd, reply + "\n");
            close(client_fd);
            done->store(true);
        });
        std::lock_guard<std::mutex> lock(responders_mutex_);
        responders_.push_back({std::move(responder), done});
    } catch (const std::system_error& e) {
        spdlog::error("Cannot start reply thread: {}", e.what());
        write_reply(client_fd, error_reply(std::string("Daemon busy: ") + e.what()).dump() + "\n");
        close(client_fd);
    }
}

void Daemon::write_reply(int client_fd, const std::string& reply) {
    size_t total = 0;
    while (total < reply.size()) {
        ssize_t n = send(client_fd, reply.data() + total, reply.size() - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            spdlog::debug("Client went away before the reply was written");
            break;
        }
        total += static_cast<size_t>(n);
    }
}

void Daemon::reap_responders(bool wait_all) {
    std::lock_guard<std::mutex> lock(responders_mutex_);
    for (auto it = responders_.begin(); it != responders_.end();) {
        if (wait_all || it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = responders_.erase(it);
        } else {
            ++it;
        }
    }
}

std::string Daemon::command_reply(const Watchdog::CommandResult& result) {
    if (!result.success) {
        return error_reply(result.message, result.error).dump();
    }
    json data = {{"message", result.message}};
    if (result.error != SupervisorError::None) {
        // Soft errors, e.g. a stop that needed SIGKILL
        data["warning"] = to_string(result.error);
    }
    return json({{"ok", true}, {"data", data}}).dump();
}

Daemon::Request Daemon::defer(Watchdog::CommandType type, const std::string& argument) {
    Request request;
    request.deferred = true;
    request.pending = watchdog_.submit(type, argument);
    return request;
}

Daemon::Request Daemon::handle_command(const std::string& json_line) {
    Request request;
    try {
        auto req = json::parse(json_line);
        std::string cmd = req.value("cmd", "");

        if (cmd == "status") {
            auto snap = watchdog_.snapshot();
            request.reply = json({{"ok", true}, {"data", *snap}}).dump();
            return request;
        }

        if (cmd == "start") {
            return defer(Watchdog::CommandType::Start);
        }

        if (cmd == "stop") {
            return defer(Watchdog::CommandType::Stop);
        }

        if (cmd == "restart") {
            return defer(Watchdog::CommandType::Restart);
        }

        if (cmd == "send") {
            std::string text = req.value("text", "");
            if (text.empty()) {
                request.reply = error_reply("Missing 'text'").dump();
                return request;
            }
            return defer(Watchdog::CommandType::SendCommand, text);
        }

        if (cmd == "backup") {
            return defer(Watchdog::CommandType::Backup, req.value("reason", "manual"));
        }

        if (cmd == "restore") {
            std::string name = req.value("name", "");
            if (name.empty()) {
                request.reply = error_reply("Missing 'name'").dump();
                return request;
            }
            return defer(Watchdog::CommandType::Restore, name);
        }

        if (cmd == "reset") {
            return defer(Watchdog::CommandType::Reset);
        }

        if (cmd == "backups") {
            request.reply = json({{"ok", true}, {"data", backup_.list()}}).dump();
            return request;
        }

        if (cmd == "history") {
            auto snap = watchdog_.snapshot();
            int limit = std::max(1, req.value("limit", static_cast<int>(Watchdog::kRecentRestarts)));
            const auto& records = snap->recent_restarts;
            size_t first = records.size() > static_cast<size_t>(limit)
                ? records.size() - static_cast<size_t>(limit) : 0;
            json arr = json::array();
            for (size_t i = first; i < records.size(); ++i) {
                arr.push_back(records[i]);
            }
            request.reply = json({{"ok", true}, {"data", arr}}).dump();
            return request;
        }

        request.reply = error_reply("Unknown command: " + cmd).dump();

    } catch (const json::exception& e) {
        request.reply = error_reply(std::string("Parse error: ") + e.what()).dump();
    }
    return request;
}

void Daemon::request_stop() {
    stop_flag_.store(true);
}

int Daemon::run() {
    // 1. One daemon per state directory, then the IPC server
    if (!acquire_instance_lock()) {
        return 1;
    }
    if (!start_ipc_server()) {
        release_instance_lock();
        return 1;
    }

    // 2. Replay restart history
    if (!policy_.load()) {
        spdlog::warn("Restart history {} could not be read; starting with an empty history",
                     history_path());
    }

    // 3. Resume supervision of a server left behind by a previous daemon
    if (process_.read_record()) {
        spdlog::info("Found process record, resuming supervision");
        auto resumed = watchdog_.execute(Watchdog::CommandType::Start, "",
                                         SupervisorClock::now());
        if (!resumed.success) {
            spdlog::warn("Could not resume supervision: {}", resumed.message);
        }
    }

    // 4. Watchdog loop
    watchdog_.start_loop();
    spdlog::info("craftkeeper daemon running (pid {}), server {} on port {}",
                 static_cast<int>(getpid()), config_.server_dir(), config_.data().server.port);

    // 5. IPC main loop
    ipc_loop();

    // 6. Cleanup: the server does not outlive its supervisor
    spdlog::info("Shutting down");
    watchdog_.shutdown();
    reap_responders(true);
    if (process_.is_alive()) {
        auto stopped = watchdog_.execute(Watchdog::CommandType::Stop, "",
                                         SupervisorClock::now());
        if (!stopped.success) {
            spdlog::error("Stopping server on shutdown failed: {}", stopped.message);
        }
    }
    cleanup_socket();
    release_instance_lock();

    return 0;
}
