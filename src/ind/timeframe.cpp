#include "ind/timeframe.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace {

inline double vol(const Candle& c) {
  return valid(c.volume) ? c.volume : 0.0;
}

// Opens a bucket stamped `key` from its first row.
inline Candle open_bucket(const Candle& c, int64_t key) {
  Candle out = c;
  out.ts = key;
  out.volume = vol(c);
  return out;
}

inline void add_to_bucket(Candle& out, const Candle& c) {
  out.high = std::max(out.high, c.high);
  out.low = std::min(out.low, c.low);
  out.close = c.close;
  out.mvrvz = c.mvrvz;
  out.volume += vol(c);
}

// A bucket closes only when a row with a different key shows up; the last
// open bucket is always flushed.
template <typename KeyF, typename RowF>
Candles fold(const Candles& candles, KeyF&& key_of, RowF&& on_row) {
  Candles out;
  if (candles.empty())
    return out;

  auto key = key_of(candles.front().ts);
  Candle cur = open_bucket(candles.front(), key);
  on_row(0, 0);

  for (size_t i = 1; i < candles.size(); i++) {
    auto& c = candles[i];
    auto k = key_of(c.ts);
    if (k != key) {
      out.push_back(cur);
      key = k;
      cur = open_bucket(c, key);
    } else {
      add_to_bucket(cur, c);
    }
    on_row(i, out.size());
  }

  out.push_back(cur);
  return out;
}

}  // namespace

Resampled resample_daily(const Candles& candles) {
  Resampled res;
  res.index.resize(candles.size());

  res.candles = fold(
      candles, [](int64_t ts) { return utc_day_start(ts); },
      [&res](size_t i, size_t bucket) {
        res.index[i] = bucket;
      });

  spdlog::debug("[resample] {} rows -> {} days", candles.size(),
                res.candles.size());
  return res;
}

Resampled resample_bucket(const Candles& candles, milliseconds width) {
  if (width <= milliseconds{0})
    throw std::invalid_argument("[resample] bucket width must be positive");

  Resampled res;
  res.index.resize(candles.size());

  res.candles = fold(
      candles, [width](int64_t ts) { return bucket_start(ts, width); },
      [&res](size_t i, size_t bucket) {
        res.index[i] = bucket;
      });

  return res;
}

std::vector<DisplayBar> resample_bucket(
    const Candles& candles,
    milliseconds width,
    const std::map<std::string, Series>& extras) {
  auto res = resample_bucket(candles, width);

  std::vector<DisplayBar> out;
  out.reserve(res.candles.size());
  for (auto& c : res.candles)
    out.push_back({c, {}});

  // rows are visited in order, so the last write per bucket wins
  for (size_t i = 0; i < candles.size(); i++) {
    auto& bar = out[res.index[i]];
    for (auto& [key, series] : extras)
      if (i < series.size())
        bar.extras[key] = series[i];
  }

  return out;
}
