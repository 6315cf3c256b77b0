#pragma once

#include <chrono>
#include <cstdint>

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

using SysClock = std::chrono::system_clock;
using SysTimePoint = std::chrono::sys_time<std::chrono::seconds>;

using milliseconds = std::chrono::milliseconds;
using seconds = std::chrono::seconds;
using minutes = std::chrono::minutes;

inline SysTimePoint from_unix_ms(int64_t ms) {
  auto tp = std::chrono::sys_time<milliseconds>{milliseconds{ms}};
  return std::chrono::floor<seconds>(tp);
}

struct Timer {
  TimePoint start;
  Timer() : start{Clock::now()} {}
  double diff_ms() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start)
        .count();
  }
};
