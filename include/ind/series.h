#pragma once

#include "ind/candle.h"

#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

// Every series is aligned 1:1 by index with the candles it was derived from.
// Positions without enough history hold NA rather than being dropped.
using Series = std::vector<double>;
using Flags = std::vector<bool>;

// Fine row index -> coarse bucket index, non-decreasing and starting at 0.
using IndexMap = std::vector<size_t>;

inline constexpr double NA = std::numeric_limits<double>::quiet_NaN();

inline bool valid(double v) {
  return std::isfinite(v);
}

template <typename F>
Series column(const Candles& candles, F&& f) {
  Series out;
  out.reserve(candles.size());
  for (auto& c : candles)
    out.push_back(f(c));
  return out;
}

inline Series opens(const Candles& c) {
  return column(c, [](auto& x) { return x.open; });
}
inline Series highs(const Candles& c) {
  return column(c, [](auto& x) { return x.high; });
}
inline Series lows(const Candles& c) {
  return column(c, [](auto& x) { return x.low; });
}
inline Series closes(const Candles& c) {
  return column(c, [](auto& x) { return x.close; });
}
inline Series volumes(const Candles& c) {
  return column(c, [](auto& x) { return x.volume; });
}
