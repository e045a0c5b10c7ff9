#include <gtest/gtest.h>
#include "supervisor/process_handle.hpp"
#include "supervisor/proc_stat.hpp"
#include "core/config.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class ProcessHandleTest : public ::testing::Test {
protected:
    std::string state_dir;

    void SetUp() override {
        state_dir = (fs::temp_directory_path() /
                     ("craftkeeper-ph-" + std::to_string(getpid()))).string();
        fs::create_directories(state_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(state_dir, ec);
    }

    static LaunchSpec spec(const std::string& exe, std::vector<std::string> args,
                           const std::string& log = "") {
        LaunchSpec s;
        s.executable = exe;
        s.args = std::move(args);
        s.console_log = log;
        return s;
    }

    static bool wait_dead(ProcessHandle& h, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (!h.is_alive()) return true;
            std::this_thread::sleep_for(50ms);
        }
        return !h.is_alive();
    }

    static std::string read_file(const std::string& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    void write_record(pid_t pid, uint64_t start_ticks) {
        nlohmann::json j = {
            {"pid", pid},
            {"started_at_epoch", 0},
            {"start_ticks", start_ticks},
            {"lock_owned", true}
        };
        std::ofstream out(state_dir + "/server.json");
        out << j.dump();
    }
};

TEST_F(ProcessHandleTest, Construction) {
    ProcessHandle h(state_dir, "stop");
    EXPECT_FALSE(h.is_alive());
    EXPECT_FALSE(h.current().has_value());
    EXPECT_EQ(h.last_exit_status(), -1);
}

TEST_F(ProcessHandleTest, LaunchWritesRecordAndLock) {
    ProcessHandle h(state_dir, "stop");
    auto r = h.launch(spec("/bin/sleep", {"60"}));
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_GT(r.process.pid, 0);
    EXPECT_TRUE(r.process.lock_owned);
    EXPECT_GT(r.process.start_ticks, 0u);
    EXPECT_TRUE(h.is_alive());

    auto rec = h.read_record();
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->pid, r.process.pid);
    EXPECT_EQ(rec->start_ticks, r.process.start_ticks);
    EXPECT_TRUE(fs::exists(h.lock_path()));

    auto s = h.stop(false, 1s);
    EXPECT_TRUE(s.success);
    EXPECT_FALSE(h.is_alive());
    EXPECT_FALSE(fs::exists(h.record_path()));
}

TEST_F(ProcessHandleTest, GracefulStopViaConsoleCommand) {
    ProcessHandle h(state_dir, "stop");
    ASSERT_TRUE(h.launch(spec("/bin/sh", {"-c", "read line; exit 0"})).success);

    auto s = h.stop(true, 5s);
    EXPECT_TRUE(s.success);
    EXPECT_EQ(s.error, SupervisorError::None);
    EXPECT_FALSE(h.is_alive());
    EXPECT_EQ(h.last_exit_status(), 0);
}

TEST_F(ProcessHandleTest, StopIgnoringCommandIsForced) {
    ProcessHandle h(state_dir, "stop");
    ASSERT_TRUE(h.launch(spec("/bin/sleep", {"60"})).success);

    auto started = std::chrono::steady_clock::now();
    auto s = h.stop(true, 1s);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(s.success);
    EXPECT_EQ(s.error, SupervisorError::StopTimedOut);
    EXPECT_FALSE(h.is_alive());
    EXPECT_GE(elapsed, 1s);
    EXPECT_LT(elapsed, 10s);
}

TEST_F(ProcessHandleTest, StopWhenNotRunning) {
    ProcessHandle h(state_dir, "stop");
    auto s = h.stop(true, 1s);
    EXPECT_FALSE(s.success);
    EXPECT_EQ(s.error, SupervisorError::NotRunning);
}

TEST_F(ProcessHandleTest, SecondLaunchSameHandleAlreadyRunning) {
    ProcessHandle h(state_dir, "stop");
    auto first = h.launch(spec("/bin/sleep", {"60"}));
    ASSERT_TRUE(first.success);

    auto second = h.launch(spec("/bin/sleep", {"60"}));
    EXPECT_FALSE(second.success);
    EXPECT_EQ(second.error, SupervisorError::AlreadyRunning);
    EXPECT_EQ(h.current()->pid, first.process.pid);

    h.stop(false, 1s);
}

TEST_F(ProcessHandleTest, LockHeldByOtherSupervisorIsAlreadyRunning) {
    ProcessHandle owner(state_dir, "stop");
    auto first = owner.launch(spec("/bin/sleep", {"60"}));
    ASSERT_TRUE(first.success);

    ProcessHandle other(state_dir, "stop");
    auto second = other.launch(spec("/bin/sleep", {"60"}));
    EXPECT_FALSE(second.success);
    EXPECT_EQ(second.error, SupervisorError::AlreadyRunning);
    EXPECT_EQ(second.process.pid, first.process.pid);

    // No process action was taken
    EXPECT_FALSE(other.current().has_value());
    EXPECT_TRUE(owner.is_alive());

    owner.stop(false, 1s);
}

TEST_F(ProcessHandleTest, LockHeldWithoutLiveChildIsLockUnavailable) {
    ProcessHandle owner(state_dir, "stop");
    auto first = owner.launch(spec("/bin/sleep", {"60"}));
    ASSERT_TRUE(first.success);
    // Record vanishes while the lock is still held
    fs::remove(owner.record_path());

    ProcessHandle other(state_dir, "stop");
    auto second = other.launch(spec("/bin/sleep", {"60"}));
    EXPECT_FALSE(second.success);
    EXPECT_EQ(second.error, SupervisorError::LockUnavailable);

    owner.stop(false, 1s);
}

TEST_F(ProcessHandleTest, ExecFailureIsLaunchFailed) {
    ProcessHandle h(state_dir, "stop");
    auto r = h.launch(spec("/nonexistent/binary", {}));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, SupervisorError::LaunchFailed);
    EXPECT_FALSE(h.is_alive());
    EXPECT_FALSE(fs::exists(h.record_path()));

    // The lock was released: another launch works
    auto ok = h.launch(spec("/bin/sleep", {"60"}));
    EXPECT_TRUE(ok.success);
    h.stop(false, 1s);
}

TEST_F(ProcessHandleTest, BadWorkingDirIsLaunchFailed) {
    ProcessHandle h(state_dir, "stop");
    auto s = spec("/bin/sleep", {"60"});
    s.working_dir = state_dir + "/does-not-exist";
    auto r = h.launch(s);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, SupervisorError::LaunchFailed);
}

TEST_F(ProcessHandleTest, ExitStatusCaptured) {
    ProcessHandle h(state_dir, "stop");
    ASSERT_TRUE(h.launch(spec("/bin/sh", {"-c", "exit 3"})).success);
    ASSERT_TRUE(wait_dead(h, 3s));
    EXPECT_EQ(h.last_exit_status(), 3);
    EXPECT_FALSE(h.current().has_value());
    EXPECT_FALSE(fs::exists(h.record_path()));
}

TEST_F(ProcessHandleTest, KilledBySignalStatus) {
    ProcessHandle h(state_dir, "stop");
    auto r = h.launch(spec("/bin/sleep", {"60"}));
    ASSERT_TRUE(r.success);
    kill(r.process.pid, SIGKILL);
    ASSERT_TRUE(wait_dead(h, 3s));
    EXPECT_EQ(h.last_exit_status(), 128 + SIGKILL);
}

TEST_F(ProcessHandleTest, SendCommandReachesStdin) {
    std::string log = state_dir + "/console.log";
    ProcessHandle h(state_dir, "stop");
    ASSERT_TRUE(h.launch(spec("/bin/sh", {"-c", "read line; echo \"got:$line\"; exit 0"}, log)).success);

    auto sent = h.send_command("say hello");
    EXPECT_TRUE(sent.success);
    ASSERT_TRUE(wait_dead(h, 3s));
    EXPECT_NE(read_file(log).find("got:say hello"), std::string::npos);
}

TEST_F(ProcessHandleTest, SendCommandNotRunning) {
    ProcessHandle h(state_dir, "stop");
    auto sent = h.send_command("list");
    EXPECT_FALSE(sent.success);
    EXPECT_EQ(sent.error, SupervisorError::NotRunning);
}

TEST_F(ProcessHandleTest, MatchesIdentity) {
    auto stat = read_proc_stat(getpid());
    ASSERT_TRUE(stat.has_value());
    EXPECT_TRUE(ProcessHandle::matches_identity(getpid(), stat->start_ticks));
    EXPECT_FALSE(ProcessHandle::matches_identity(getpid(), stat->start_ticks + 12345));
}

TEST_F(ProcessHandleTest, AdoptLiveRecordedProcess) {
    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        execl("/bin/sleep", "sleep", "60", (char*)nullptr);
        _exit(127);
    }
    std::this_thread::sleep_for(100ms);
    auto stat = read_proc_stat(pid);
    ASSERT_TRUE(stat.has_value());
    write_record(pid, stat->start_ticks);

    {
        ProcessHandle h(state_dir, "stop");
        ASSERT_TRUE(h.adopt());
        ASSERT_TRUE(h.current().has_value());
        EXPECT_EQ(h.current()->pid, pid);
        EXPECT_TRUE(h.is_alive());

        // No console channel for an adopted process
        EXPECT_EQ(h.send_command("list").error, SupervisorError::WriteFailed);

        auto s = h.stop(false, 1s);
        EXPECT_TRUE(s.success);
        EXPECT_FALSE(h.is_alive());
    }

    int status = 0;
    waitpid(pid, &status, 0);
    EXPECT_TRUE(WIFSIGNALED(status));
}

TEST_F(ProcessHandleTest, AdoptStaleRecordRemovesIt) {
    auto stat = read_proc_stat(getpid());
    ASSERT_TRUE(stat.has_value());
    // Our own pid with the wrong start time looks like a reused pid
    write_record(getpid(), stat->start_ticks + 999);

    ProcessHandle h(state_dir, "stop");
    EXPECT_FALSE(h.adopt());
    EXPECT_FALSE(fs::exists(h.record_path()));
}

TEST_F(ProcessHandleTest, LaunchSpecFromDefaults) {
    Config config;
    auto s = LaunchSpec::from_config(config);
    EXPECT_EQ(s.executable, "java");
    ASSERT_GE(s.args.size(), 5u);
    EXPECT_EQ(s.args[0], "-Xms2G");
    EXPECT_EQ(s.args[1], "-Xmx4G");
    EXPECT_EQ(s.args[s.args.size() - 3], "-jar");
    EXPECT_EQ(s.args[s.args.size() - 2], "neoforge-server.jar");
    EXPECT_EQ(s.args.back(), "nogui");
    EXPECT_EQ(s.working_dir, config.server_dir());
}
