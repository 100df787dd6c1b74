#include "sig/buys.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <stdexcept>

namespace {

// No bar in (i, ts[i] + window] inside the scan range has higher confidence.
bool is_forward_peak(const Candles& candles,
                     const std::vector<Confidence>& conf,
                     size_t i,
                     size_t end,
                     int64_t window_ms) {
  auto horizon = candles[i].ts + window_ms;
  for (size_t k = i + 1; k < end && candles[k].ts <= horizon; k++)
    if (conf[k].value > conf[i].value)
      return false;
  return true;
}

}  // namespace

std::vector<BuyEvent> find_buys(const Candles& candles,
                                const std::vector<Confidence>& conf,
                                const BuyConfig& cfg,
                                size_t start,
                                size_t end) {
  if (conf.size() != candles.size())
    throw std::invalid_argument(
        std::format("[buys] {} confidence values for {} candles", conf.size(),
                    candles.size()));

  end = std::min(end, candles.size());
  std::vector<BuyEvent> buys;
  if (start >= end)
    return buys;

  std::optional<int64_t> last_buy_ts;
  bool armed = false;

  for (size_t i = start + 1; i < end; i++) {
    auto c = conf[i].value;

    if (!armed) {
      armed = c >= cfg.threshold && conf[i - 1].value < cfg.threshold;
      if (!armed)
        continue;
    } else if (c < cfg.threshold) {
      armed = false;
      continue;
    }

    if (!is_forward_peak(candles, conf, i, end, cfg.window_ms))
      continue;

    // the episode is spent whether or not the cooldown lets it through
    armed = false;

    auto ts = candles[i].ts;
    if (last_buy_ts && ts - *last_buy_ts < cfg.cooldown_ms) {
      spdlog::debug("[buys] {} conf {:.2f} inside cooldown",
                    datetime_to_string(ts), c);
      continue;
    }

    buys.push_back({i, ts, c, conf[i].parts});
    last_buy_ts = ts;
    spdlog::debug("[buys] {} conf {:.2f}", datetime_to_string(ts), c);
  }

  spdlog::info("[buys] {} buys in {} rows", buys.size(), end - start);
  return buys;
}
