#pragma once

#include "ind/series.h"

#include <format>
#include <map>
#include <stdexcept>
#include <string>

struct Resampled {
  Candles candles;
  IndexMap index;  // fine row -> candles[index[i]]
};

// UTC calendar-day buckets, each stamped with its UTC midnight.
Resampled resample_daily(const Candles& candles);

// Fixed-width buckets keyed by floor(ts / width) * width.
Resampled resample_bucket(const Candles& candles, milliseconds width);

// A coarse bar carrying per-row series sampled at its last contributing row.
struct DisplayBar {
  Candle candle;
  std::map<std::string, double> extras;
};

std::vector<DisplayBar> resample_bucket(
    const Candles& candles,
    milliseconds width,
    const std::map<std::string, Series>& extras);

// fine[i] = coarse[index[i]]
template <typename T>
std::vector<T> expand(const std::vector<T>& coarse, const IndexMap& index) {
  std::vector<T> out;
  out.reserve(index.size());
  for (size_t i = 0; i < index.size(); i++) {
    if (index[i] >= coarse.size())
      throw std::out_of_range(
          std::format("[expand] row {} maps to bucket {} of {}", i, index[i],
                      coarse.size()));
    out.push_back(coarse[index[i]]);
  }
  return out;
}
