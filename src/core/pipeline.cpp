#include "core/pipeline.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace {

Series slice(const Series& s, RowRange r) {
  return {s.begin() + r.first, s.begin() + r.second};
}

std::vector<DisplayBar> display_bars(const Analysis& a) {
  auto [start, end] = a.range;
  Candles visible{a.candles.begin() + start, a.candles.begin() + end};

  auto& s = a.signals;
  std::map<std::string, Series> extras{
      {"rsi", slice(s.rsi, a.range)},
      {"macd", slice(s.macd, a.range)},
      {"macdSig", slice(s.macd_signal, a.range)},
      {"sma7", slice(s.sma7, a.range)},
      {"sma30", slice(s.sma30, a.range)},
      {"sma90", slice(s.sma90, a.range)},
      {"pi", slice(s.pi_ratio, a.range)},
  };
  return resample_bucket(visible, H_4, extras);
}

std::vector<int64_t> buy_lines(const std::vector<BuyEvent>& buys) {
  std::vector<int64_t> lines;
  for (auto& b : buys)
    lines.push_back(bucket_start(b.ts, H_4));
  std::sort(lines.begin(), lines.end());
  lines.erase(std::unique(lines.begin(), lines.end()), lines.end());
  return lines;
}

}  // namespace

RowRange visible_range(const Candles& candles, const WindowConfig& window) {
  size_t n = candles.size();
  if (n == 0 || window.days <= 0)
    return {0, n};

  auto first = candles.front().ts, last = candles.back().ts;
  int64_t span = std::max<int64_t>(1, (last - first) / MS_PER_DAY);
  int64_t days = std::min<int64_t>(window.days, span);
  int64_t offset = std::clamp<int64_t>(window.offset_days, 0, span - days);

  auto start_ts = std::max(first, last - (offset + days) * MS_PER_DAY);
  auto end_ts = std::min(last, start_ts + days * MS_PER_DAY);

  auto by_ts = [](const Candle& c, int64_t ts) { return c.ts < ts; };
  auto lo = std::lower_bound(candles.begin(), candles.end(), start_ts, by_ts);
  auto hi = std::upper_bound(
      candles.begin(), candles.end(), end_ts,
      [](int64_t ts, const Candle& c) { return ts < c.ts; });

  return {static_cast<size_t>(lo - candles.begin()),
          static_cast<size_t>(hi - candles.begin())};
}

Analysis run_pipeline(const Candles& candles, const Config& config) {
  Analysis a;
  if (candles.empty()) {
    spdlog::warn("[pipeline] no candles");
    return a;
  }

  Timer timer;
  a.candles = candles;

  a.daily = resample_daily(candles);
  a.daily_ind = DailyIndicators{a.daily.candles};
  a.daily_rows = DailyRows{a.daily_ind, a.daily.index};

  auto& vsa_cfg = config.vsa_config;
  a.vsa = VSA{candles, vsa_cfg.weights, vsa_cfg.window};

  a.signals = Signals{candles, a.daily_rows, mvrvz_buy(candles), a.vsa};
  a.confidence = score_series(a.signals, config.weights);

  a.range = visible_range(candles, config.window_config);
  a.buys = find_buys(candles, a.confidence, config.buy_config, a.range.first,
                     a.range.second);

  a.display_4h = display_bars(a);
  a.buy_lines = buy_lines(a.buys);

  spdlog::info("[pipeline] {} rows, {} days, visible [{}, {}), {} buys, {:.1f}ms",
               candles.size(), a.daily.candles.size(), a.range.first,
               a.range.second, a.buys.size(), timer.diff_ms());
  return a;
}
