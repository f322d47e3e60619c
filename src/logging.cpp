#include <geobeam/logging.hpp>
#include <array>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <geobeam/errors.hpp>

namespace geobeam {

static constexpr const char* kLoggerName = "geobeam";

static constexpr std::array<const char*, 7> kLevelNames{
  "trace", "debug", "info", "warn", "error", "critical", "off"};

static std::shared_ptr<spdlog::logger> get_or_create_() {
  if (auto existing = spdlog::get(kLoggerName)) return existing;
  auto lg = spdlog::stdout_color_mt(kLoggerName);
  lg->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  return lg;
}

bool is_log_level(const std::string& name) {
  for (const char* n : kLevelNames) {
    if (name == n) return true;
  }
  return false;
}

void init_logging(const std::string& level) {
  // spdlog maps unknown names to "off", which would hide every notice.
  if (!is_log_level(level)) {
    throw ConfigError("unknown log level '" + level +
                      "' (expected trace, debug, info, warn, error, critical or off)");
  }
  auto lg = get_or_create_();
  lg->set_level(spdlog::level::from_str(level));
  lg->flush_on(spdlog::level::warn);
}

std::shared_ptr<spdlog::logger> log() {
  static std::shared_ptr<spdlog::logger> lg = get_or_create_();
  return lg;
}

} // namespace geobeam
