#include "util/times.h"

#include <format>

std::string datetime_to_string(int64_t ms) {
  return std::format("{:%F %R}", std::chrono::floor<minutes>(to_time(ms)));
}

std::string date_to_string(int64_t ms) {
  return std::format("{:%F}", std::chrono::floor<days>(to_time(ms)));
}
