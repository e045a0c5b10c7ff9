#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "daemon/daemon.hpp"

#include <spdlog/spdlog.h>
#include <iostream>
#include <signal.h>

static Daemon* g_daemon = nullptr;

static void signal_handler(int /*sig*/) {
    if (g_daemon) {
        g_daemon->request_stop();
    }
}

static int run_daemon() {
    Config config;
    if (!config.load()) {
        std::cerr << "No usable configuration at " << Config::config_path()
                  << ", using defaults\n";
    }

    auto errors = config.validate();
    if (!errors.empty()) {
        std::cerr << "Invalid configuration (" << Config::config_path() << "):\n";
        for (const auto& e : errors) {
            std::cerr << "  " << e << "\n";
        }
        return 1;
    }

    logging::init(config.data().logging.level, config.log_file_path());

    // Writes to a dead console or client must not kill the supervisor
    signal(SIGPIPE, SIG_IGN);

    Daemon daemon(config);
    g_daemon = &daemon;

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    int ret = daemon.run();
    g_daemon = nullptr;
    spdlog::shutdown();
    return ret;
}

int main(int argc, char* argv[]) {
    logging::init_console("warn");

    int cli_result = CLI::run(argc, argv);

    if (cli_result == -2) {
        // daemon subcommand
        return run_daemon();
    }
    return cli_result;
}
