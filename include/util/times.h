#pragma once

#include <chrono>
#include <cstdint>
#include <string>

using SysClock = std::chrono::system_clock;
using SysTimePoint = std::chrono::sys_time<std::chrono::milliseconds>;

using milliseconds = std::chrono::milliseconds;
using minutes = std::chrono::minutes;
using hours = std::chrono::hours;
using days = std::chrono::days;

inline constexpr milliseconds H_1{hours{1}}, H_4{hours{4}}, D_1{days{1}};

inline constexpr int64_t MS_PER_HOUR = H_1.count();
inline constexpr int64_t MS_PER_DAY = D_1.count();

inline SysTimePoint to_time(int64_t ms) {
  return SysTimePoint{milliseconds{ms}};
}

// Start of the UTC calendar day containing `ms`.
inline int64_t utc_day_start(int64_t ms) {
  return std::chrono::floor<days>(to_time(ms)).time_since_epoch() /
         milliseconds{1};
}

// Floor of `ms` to a multiple of `width`, rounding toward negative infinity.
inline int64_t bucket_start(int64_t ms, milliseconds width) {
  auto w = width.count();
  auto q = ms / w;
  if (ms % w != 0 && ms < 0)
    q--;
  return q * w;
}

std::string datetime_to_string(int64_t ms);
std::string date_to_string(int64_t ms);

struct Timer {
  using Clock = std::chrono::steady_clock;
  Clock::time_point start;
  Timer() : start{Clock::now()} {}
  double diff_ms() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start)
        .count();
  }
};
