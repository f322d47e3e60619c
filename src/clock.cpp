#include <geobeam/clock.hpp>
#include <ctime>
#include <thread>

namespace geobeam {

void SystemClock::sleep_for(std::chrono::milliseconds d) {
  std::this_thread::sleep_for(d);
}

static std::string strftime_utc_(TimePoint tp, const char* fmt) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[64];
  const std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

std::string format_log_time(TimePoint tp) {
  return strftime_utc_(tp, "%Y-%m-%d,%H:%M:%S");
}

std::string log_file_name(TimePoint tp) {
  return strftime_utc_(tp, "GPSSIM-%Y-%m-%d_%H:%M:%S");
}

} // namespace geobeam
