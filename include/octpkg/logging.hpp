#pragma once

#include <string>

namespace octpkg {

// Configure the default spdlog logger (stderr).
// verbose -> debug, quiet -> err, otherwise warn.
void init_logging(bool verbose, bool quiet);

// Apply a level by name ("debug", "info", "warn", "error", "off")
void set_log_level(const std::string& level);

} // namespace octpkg
