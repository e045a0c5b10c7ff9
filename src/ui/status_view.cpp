#include "ui/status_view.hpp"

#include <ftxui/dom/node.hpp>
#include <ftxui/screen/screen.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace ftxui;

namespace {

Color state_color(WatchdogState state) {
    switch (state) {
        case WatchdogState::Monitoring:  return Color::Green;
        case WatchdogState::Restarting:  return Color::Yellow;
        case WatchdogState::CoolingDown: return Color::Yellow;
        case WatchdogState::Failed:      return Color::Red;
        case WatchdogState::Stopped:     return Color::GrayLight;
    }
    return Color::Default;
}

Color health_color(HealthState state) {
    switch (state) {
        case HealthState::Alive:    return Color::Green;
        case HealthState::Degraded: return Color::Yellow;
        case HealthState::Dead:     return Color::Red;
    }
    return Color::Default;
}

std::string percent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << "%";
    return oss.str();
}

std::string clock_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

Element row(const std::string& label, Element value) {
    return hbox({
        text(label) | size(WIDTH, EQUAL, 12),
        std::move(value),
    });
}

}

std::string StatusView::format_bytes(int64_t bytes) {
    std::ostringstream oss;
    if (bytes < 1024) {
        oss << bytes << " B";
    } else if (bytes < 1024 * 1024) {
        oss << std::fixed << std::setprecision(1) << (double)bytes / 1024.0 << " KB";
    } else if (bytes < 1024LL * 1024 * 1024) {
        oss << std::fixed << std::setprecision(1) << (double)bytes / (1024.0 * 1024.0) << " MB";
    } else {
        oss << std::fixed << std::setprecision(2)
            << (double)bytes / (1024.0 * 1024.0 * 1024.0) << " GB";
    }
    return oss.str();
}

std::string StatusView::format_duration(int64_t seconds) {
    if (seconds < 0) seconds = 0;
    int64_t days = seconds / 86400;
    int64_t hours = (seconds % 86400) / 3600;
    int64_t minutes = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    std::ostringstream oss;
    if (days > 0) oss << days << "d ";
    if (days > 0 || hours > 0) oss << hours << "h ";
    if (days > 0 || hours > 0 || minutes > 0) oss << minutes << "m ";
    oss << secs << "s";
    return oss.str();
}

Element StatusView::render(const StatusSnapshot& s) {
    Elements rows;

    // Server
    if (s.running) {
        rows.push_back(row("Server", text("running (pid " + std::to_string(s.pid) + ")")
                                     | color(Color::Green)));
        rows.push_back(row("Uptime", text(format_duration(s.uptime_seconds))));
    } else {
        rows.push_back(row("Server", text("not running") | color(Color::Red)));
    }

    // Watchdog
    Elements wd = {text(to_string(s.state)) | bold | color(state_color(s.state))};
    if (s.stopping) {
        wd.push_back(text("  stopping") | color(Color::Yellow));
    }
    if (s.state == WatchdogState::CoolingDown && s.cooldown_remaining_seconds > 0) {
        wd.push_back(text("  next attempt in " + format_duration(s.cooldown_remaining_seconds)));
    }
    rows.push_back(row("Watchdog", hbox(std::move(wd))));

    // Health
    if (s.running) {
        std::string reasons;
        for (const auto& r : s.health.reasons) {
            reasons += (reasons.empty() ? "" : ", ") + r;
        }
        Elements health = {
            text(std::to_string(s.health.score) + "/100 " + to_string(s.health.state))
                | color(health_color(s.health.state)),
        };
        if (!reasons.empty()) {
            health.push_back(text("  (" + reasons + ")") | dim);
        }
        rows.push_back(row("Health", hbox(std::move(health))));
    }

    // Metrics
    if (s.last_sample) {
        const auto& m = *s.last_sample;
        rows.push_back(row("CPU", text(percent(m.cpu_percent) +
                                       "  5m avg " + percent(s.trend_5m.avg_cpu) +
                                       "  1h peak " + percent(s.trend_1h.peak_cpu))));
        rows.push_back(row("Memory", text(format_bytes(m.memory_bytes) +
                                          "  1h peak " + format_bytes(s.trend_1h.peak_memory))));
        rows.push_back(row("Port", text(std::string(m.port_open ? "open" : "closed") + ", " +
                                        std::to_string(m.connection_count) + " connections")
                                   | color(m.port_open ? Color::Default : Color::Red)));
        rows.push_back(row("Threads", text(std::to_string(m.thread_count))));
    } else if (!s.running && s.last_exit_status >= 0) {
        rows.push_back(row("Last exit", text("status " + std::to_string(s.last_exit_status))));
    }

    // Restarts
    std::string restarts = std::to_string(s.restart_count_in_window) + "/" +
                           std::to_string(s.max_restarts) + " in window";
    rows.push_back(row("Restarts", text(restarts) |
                       color(s.restart_count_in_window >= s.max_restarts && s.max_restarts > 0
                             ? Color::Red : Color::Default)));
    if (s.restarts_attempted > 0) {
        std::ostringstream stats;
        stats << s.restarts_successful << "/" << s.restarts_attempted << " succeeded ("
              << std::fixed << std::setprecision(0) << s.restart_success_rate << "%)";
        rows.push_back(row("Recovery", text(stats.str()) |
                           color(s.restart_success_rate < 50.0 ? Color::Yellow : Color::Default)));
    }
    rows.push_back(row("Checks", text(std::to_string(s.checks_performed))));

    rows.push_back(row("Last backup", text(s.last_backup_outcome) |
                       color(s.last_backup_outcome == "failed" ? Color::Red : Color::Default)));

    if (!s.last_error.empty()) {
        rows.push_back(row("Last error", paragraph(s.last_error) | color(Color::Red)));
    }

    if (!s.recent_restarts.empty()) {
        rows.push_back(separator());
        rows.push_back(text("Recent restarts") | bold);
        size_t first = s.recent_restarts.size() > kShownRestarts
            ? s.recent_restarts.size() - kShownRestarts : 0;
        for (size_t i = first; i < s.recent_restarts.size(); ++i) {
            const auto& r = s.recent_restarts[i];
            rows.push_back(hbox({
                text(clock_time(r.timestamp) + "  "),
                text(std::string(r.automatic ? "auto  " : "manual") + "  "),
                text(to_string(r.outcome)) | color(r.outcome == RestartOutcome::Failed
                                                   ? Color::Red : Color::Default),
                text("  " + r.reason) | dim,
            }));
        }
    }

    return window(text(" craftkeeper ") | bold, vbox(std::move(rows)));
}

std::string StatusView::to_text(const StatusSnapshot& status, int width) {
    Element document = render(status);
    auto screen = Screen::Create(Dimension::Fixed(width), Dimension::Fit(document));
    Render(screen, document);
    return screen.ToString();
}
