#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace geobeam {

// One of: trace, debug, info, warn, error, critical, off.
bool is_log_level(const std::string& name);

// Create (or reconfigure) the shared "geobeam" console logger.
// Throws ConfigError if level is not a name accepted by is_log_level().
void init_logging(const std::string& level = "info");

// Shared logger; created with defaults on first use.
std::shared_ptr<spdlog::logger> log();

} // namespace geobeam
