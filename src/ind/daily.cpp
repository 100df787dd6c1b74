#include "ind/daily.h"
#include "ind/indicators.h"
#include "ind/timeframe.h"

#include <spdlog/spdlog.h>

DailyIndicators::DailyIndicators(const Candles& daily)
    : close{closes(daily)}, low{lows(daily)} {
  size_t n = daily.size();

  sma7 = SMA{close, 7}.values;
  sma30 = SMA{close, 30}.values;
  sma90 = SMA{close, 90}.values;
  sma111 = SMA{close, 111}.values;
  sma350 = SMA{close, 350}.values;

  pi_ratio.assign(n, NA);
  pi_buy.assign(n, false);
  for (size_t i = 0; i < n; i++) {
    if (!valid(sma111[i]) || !valid(sma350[i]) || sma350[i] == 0)
      continue;
    pi_ratio[i] = sma111[i] / (2 * sma350[i]);
    pi_buy[i] = pi_ratio[i] <= PI_BUY;
  }

  {
    // Bollinger lower band, 20d, 2 sd
    SMA ma{close, 20};
    StdDev sd{close, 20};
    bb_lower.assign(n, NA);
    for (size_t i = 0; i < n; i++)
      if (valid(ma.values[i]) && valid(sd.values[i]))
        bb_lower[i] = ma.values[i] - 2 * sd.values[i];
  }

  {
    MACD m{close, 12, 26, 9};
    macd = std::move(m.macd_line);
    macd_signal = std::move(m.signal_line);

    macd_cross.assign(n, false);
    for (size_t i = 1; i < n; i++) {
      if (!valid(macd[i]) || !valid(macd_signal[i]) || !valid(macd[i - 1]) ||
          !valid(macd_signal[i - 1]))
        continue;
      macd_cross[i] =
          macd[i] > macd_signal[i] && macd[i - 1] <= macd_signal[i - 1];
    }
  }

  rsi = RSI{close, 14}.values;

  {
    sma_stack.assign(n, false);
    int run = 0;
    for (size_t i = 0; i < n; i++) {
      bool stacked = valid(sma7[i]) && valid(sma30[i]) && valid(sma90[i]) &&
                     sma30[i] > sma90[i] && sma7[i] > sma30[i];
      run = stacked ? run + 1 : 0;
      sma_stack[i] = run >= STACK_PERSIST_DAYS;
    }
  }

  {
    RollingMin roll_low{low, ROLLING_LOW_DAYS};
    Slope slope90{sma90, SLOPE_DAYS};

    prev_low_up.assign(n, false);
    for (size_t i = 1; i < n; i++) {
      auto prev_min = roll_low.values[i - 1];
      bool touched = valid(prev_min) && valid(low[i]) && low[i] <= prev_min;
      bool uptrend = valid(slope90.values[i]) && slope90.values[i] > 0;
      prev_low_up[i] = touched && uptrend;
    }
  }

  spdlog::debug("[daily] {} days, last rsi {:.1f}", n, n ? rsi.back() : NA);
}

DailyRows::DailyRows(const DailyIndicators& d, const IndexMap& index)
    : bb_lower{expand(d.bb_lower, index)},
      rsi{expand(d.rsi, index)},
      macd{expand(d.macd, index)},
      macd_signal{expand(d.macd_signal, index)},
      macd_cross{expand(d.macd_cross, index)},
      sma7{expand(d.sma7, index)},
      sma30{expand(d.sma30, index)},
      sma90{expand(d.sma90, index)},
      sma_stack{expand(d.sma_stack, index)},
      prev_low_up{expand(d.prev_low_up, index)},
      pi_ratio{expand(d.pi_ratio, index)},
      pi_buy{expand(d.pi_buy, index)} {}

Flags mvrvz_buy(const Candles& rows) {
  Flags out(rows.size(), false);
  for (size_t i = 0; i < rows.size(); i++)
    out[i] = valid(rows[i].mvrvz) && rows[i].mvrvz <= 0;
  return out;
}
