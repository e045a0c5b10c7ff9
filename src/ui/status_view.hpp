#pragma once

#include "supervisor/watchdog.hpp"

#include <ftxui/dom/elements.hpp>
#include <cstdint>
#include <string>

/// Renders a watchdog status snapshot for the terminal
class StatusView {
public:
    static constexpr size_t kShownRestarts = 5;

    static ftxui::Element render(const StatusSnapshot& status);

    /// Render to a string `width` columns wide (includes terminal styling)
    static std::string to_text(const StatusSnapshot& status, int width = 80);

    static std::string format_bytes(int64_t bytes);
    static std::string format_duration(int64_t seconds);
};
