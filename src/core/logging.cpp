#include "core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

namespace logging {

namespace {

constexpr size_t kMaxLogBytes = 5 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;

spdlog::level::level_enum parse_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        return spdlog::level::info;
    }
    return parsed;
}

}

void init(const std::string& level, const std::string& file_path) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!file_path.empty()) {
        try {
            fs::create_directories(fs::path(file_path).parent_path());
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file_path, kMaxLogBytes, kMaxLogFiles));
        } catch (const std::exception& e) {
            // Keep logging to stderr only
            spdlog::warn("Cannot open log file {}: {}", file_path, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("craftkeeper", sinks.begin(), sinks.end());
    logger->set_level(parse_level(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

void init_console(const std::string& level) {
    auto logger = std::make_shared<spdlog::logger>(
        "craftkeeper", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    logger->set_level(parse_level(level));
    logger->set_pattern("%^%l%$: %v");
    spdlog::set_default_logger(logger);
}

}
