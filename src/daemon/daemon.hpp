#pragma once

#include "core/config.hpp"
#include "supervisor/backup_hook.hpp"
#include "supervisor/health_scorer.hpp"
#include "supervisor/metrics_sampler.hpp"
#include "supervisor/process_handle.hpp"
#include "supervisor/restart_policy.hpp"
#include "supervisor/watchdog.hpp"

#include <atomic>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

class Daemon {
public:
    explicit Daemon(Config& config);
    ~Daemon();

    /// Main loop, blocks until stop is requested
    int run();

    /// Request graceful stop (called from signal handler)
    void request_stop();

    std::string history_path() const;

private:
    Config& config_;
    std::string state_dir_;
    ProcessHandle process_;
    MetricsSampler metrics_;
    RestartPolicy policy_;
    TarBackupHook backup_;
    Watchdog watchdog_;
    std::atomic<bool> stop_flag_{false};
    int socket_fd_ = -1;
    bool owns_socket_ = false;
    int pid_fd_ = -1;

    /// A client waiting on a lifecycle command; the thread owns the fd
    struct Responder {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex responders_mutex_;
    std::list<Responder> responders_;

    /// Reply produced inline, or a watchdog command still in flight
    struct Request {
        std::string reply;
        bool deferred = false;
        std::future<Watchdog::CommandResult> pending;
    };

    // Single instance
    std::string pid_path() const;
    bool acquire_instance_lock();
    void release_instance_lock();

    // IPC
    std::string socket_path() const;
    bool start_ipc_server();
    void ipc_loop();
    void serve_client(int client_fd);
    Request handle_command(const std::string& json_line);
    Request defer(Watchdog::CommandType type, const std::string& argument = "");
    static std::string command_reply(const Watchdog::CommandResult& result);
    static void write_reply(int client_fd, const std::string& reply);
    void reap_responders(bool wait_all);
    void cleanup_socket();
};
