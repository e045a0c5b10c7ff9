#include <gtest/gtest.h>
#include "ui/status_view.hpp"

namespace {

StatusSnapshot running_snapshot() {
    StatusSnapshot s;
    s.running = true;
    s.pid = 1234;
    s.uptime_seconds = 3725;
    s.state = WatchdogState::Monitoring;
    s.health.score = 50;
    s.health.state = HealthState::Degraded;
    s.health.reasons = {"port_closed"};
    s.restart_count_in_window = 1;
    s.max_restarts = 5;
    s.last_backup_outcome = "success";

    MetricsSample m;
    m.cpu_percent = 42.5;
    m.memory_bytes = int64_t{3} * 1024 * 1024 * 1024;
    m.port_open = false;
    m.connection_count = 0;
    s.last_sample = m;

    RestartRecord r;
    r.timestamp = std::chrono::system_clock::now();
    r.reason = "process_gone";
    r.outcome = RestartOutcome::Success;
    s.recent_restarts.push_back(r);
    return s;
}

}

TEST(StatusViewTest, FormatBytes) {
    EXPECT_EQ(StatusView::format_bytes(512), "512 B");
    EXPECT_EQ(StatusView::format_bytes(1536), "1.5 KB");
    EXPECT_EQ(StatusView::format_bytes(5 * 1024 * 1024), "5.0 MB");
    EXPECT_EQ(StatusView::format_bytes(int64_t{3} * 1024 * 1024 * 1024), "3.00 GB");
}

TEST(StatusViewTest, FormatDuration) {
    EXPECT_EQ(StatusView::format_duration(0), "0s");
    EXPECT_EQ(StatusView::format_duration(59), "59s");
    EXPECT_EQ(StatusView::format_duration(61), "1m 1s");
    EXPECT_EQ(StatusView::format_duration(3600), "1h 0m 0s");
    EXPECT_EQ(StatusView::format_duration(90061), "1d 1h 1m 1s");
    EXPECT_EQ(StatusView::format_duration(-5), "0s");
}

TEST(StatusViewTest, RenderRunning) {
    auto element = StatusView::render(running_snapshot());
    EXPECT_NE(element, nullptr);

    std::string out = StatusView::to_text(running_snapshot(), 100);
    EXPECT_NE(out.find("running (pid 1234)"), std::string::npos);
    EXPECT_NE(out.find("1h 2m 5s"), std::string::npos);
    EXPECT_NE(out.find("monitoring"), std::string::npos);
    EXPECT_NE(out.find("50/100 degraded"), std::string::npos);
    EXPECT_NE(out.find("port_closed"), std::string::npos);
    EXPECT_NE(out.find("3.00 GB"), std::string::npos);
    EXPECT_NE(out.find("1/5 in window"), std::string::npos);
    EXPECT_NE(out.find("Recent restarts"), std::string::npos);
    EXPECT_NE(out.find("process_gone"), std::string::npos);
}

TEST(StatusViewTest, RenderStopped) {
    StatusSnapshot s;
    s.state = WatchdogState::Failed;
    s.max_restarts = 5;
    s.restart_count_in_window = 5;
    s.last_error = "restart_limit_exceeded";

    std::string out = StatusView::to_text(s);
    EXPECT_NE(out.find("not running"), std::string::npos);
    EXPECT_NE(out.find("failed"), std::string::npos);
    EXPECT_NE(out.find("restart_limit_exceeded"), std::string::npos);
    EXPECT_EQ(out.find("Health"), std::string::npos);
    EXPECT_EQ(out.find("Recent restarts"), std::string::npos);
}

TEST(StatusViewTest, ShowsStoppingAndCooldown) {
    StatusSnapshot s = running_snapshot();
    s.stopping = true;
    std::string stopping = StatusView::to_text(s, 100);
    EXPECT_NE(stopping.find("stopping"), std::string::npos);

    s.stopping = false;
    s.state = WatchdogState::CoolingDown;
    s.cooldown_remaining_seconds = 90;
    std::string cooling = StatusView::to_text(s, 100);
    EXPECT_NE(cooling.find("cooling_down"), std::string::npos);
    EXPECT_NE(cooling.find("1m 30s"), std::string::npos);
}

TEST(StatusViewTest, ShowsRestartStatistics) {
    StatusSnapshot s = running_snapshot();
    s.checks_performed = 120;
    s.restarts_attempted = 3;
    s.restarts_successful = 2;
    s.restart_success_rate = 200.0 / 3.0;
    s.last_sample->thread_count = 57;

    std::string out = StatusView::to_text(s, 100);
    EXPECT_NE(out.find("2/3 succeeded (67%)"), std::string::npos);
    EXPECT_NE(out.find("120"), std::string::npos);
    EXPECT_NE(out.find("57"), std::string::npos);

    s.restarts_attempted = 0;
    EXPECT_EQ(StatusView::to_text(s, 100).find("succeeded"), std::string::npos);
}

TEST(StatusViewTest, ShowsLastExitStatusWhenStopped) {
    StatusSnapshot s;
    s.last_exit_status = 137;
    std::string out = StatusView::to_text(s, 100);
    EXPECT_NE(out.find("status 137"), std::string::npos);
}
