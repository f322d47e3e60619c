#pragma once
#include <chrono>
#include <string>

namespace geobeam {

using TimePoint = std::chrono::system_clock::time_point;

// Wall clock + blocking waits, injectable so runs can be driven in tests.
class Clock {
public:
  virtual ~Clock() = default;
  virtual TimePoint now() const = 0;
  virtual void sleep_for(std::chrono::milliseconds d) = 0;
};

class SystemClock : public Clock {
public:
  TimePoint now() const override { return std::chrono::system_clock::now(); }
  void sleep_for(std::chrono::milliseconds d) override;
};

// UTC, "YYYY-MM-DD,HH:MM:SS"
std::string format_log_time(TimePoint tp);

// UTC, "GPSSIM-YYYY-MM-DD_HH:MM:SS"
std::string log_file_name(TimePoint tp);

} // namespace geobeam
