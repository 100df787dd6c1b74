#pragma once

#include "ind/candle.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

// 2024-01-01 00:00 UTC
inline constexpr int64_t T0 = 1704067200000;

inline Candle hourly(size_t i,
                     double open,
                     double high,
                     double low,
                     double close,
                     double volume = 1000) {
  return {T0 + int64_t(i) * MS_PER_HOUR, open, high, low, close, volume};
}

// Doji bars at 100 with a one point range.
inline Candles flat(size_t n, double volume = 1000) {
  Candles out;
  for (size_t i = 0; i < n; i++)
    out.push_back(hourly(i, 100, 100.5, 99.5, 100, volume));
  return out;
}

// 90 flat bars, a five bar high-volume sell-off to 80, then a quiet
// recovery to 105.
inline Candles dip_and_recovery() {
  auto out = flat(90);

  double prev = 100;
  for (double c : {96, 92, 88, 84, 80}) {
    out.push_back(hourly(out.size(), prev, prev + 0.2, c - 3, c, 10000));
    prev = c;
  }
  for (double c : {85, 90, 95, 100, 105}) {
    out.push_back(hourly(out.size(), prev, c + 0.2, prev - 0.2, c, 1000));
    prev = c;
  }
  return out;
}

// Daily candles from a list of closes, low one below close.
inline Candles daily_from_closes(const std::vector<double>& closes) {
  Candles out;
  for (size_t i = 0; i < closes.size(); i++) {
    auto c = closes[i];
    out.push_back({T0 + int64_t(i) * MS_PER_DAY, c, c + 1, c - 1, c, 1000});
  }
  return out;
}

struct TempFile {
  std::filesystem::path path;

  TempFile(const std::string& name, const std::string& content)
      : path{std::filesystem::temp_directory_path() / name} {
    std::ofstream f{path};
    f << content;
  }
  ~TempFile() { std::filesystem::remove(path); }

  std::string str() const { return path.string(); }
};
