#pragma once

#include <string>

namespace logging {

/// Install the default spdlog logger: coloured stderr plus a rotating file
/// (when file_path is non-empty). Unknown level names fall back to "info".
void init(const std::string& level, const std::string& file_path);

/// Stderr-only logger used by the foreground CLI
void init_console(const std::string& level);

}
