#pragma once

#include "ind/series.h"

// Indicators on UTC-daily candles. Every series has one entry per day.
struct DailyIndicators {
  static constexpr double PI_BUY = 0.30;
  static constexpr int STACK_PERSIST_DAYS = 5;
  static constexpr int ROLLING_LOW_DAYS = 30;
  static constexpr int SLOPE_DAYS = 10;

  Series close, low;

  Series sma7, sma30, sma90, sma111, sma350;

  // sma111 / (2 * sma350); absolute buy at or below PI_BUY
  Series pi_ratio;
  Flags pi_buy;

  Series bb_lower;  // sma20 - 2 * std20

  Series macd, macd_signal;
  Flags macd_cross;  // macd <= signal yesterday, macd > signal today

  Series rsi;

  // sma30 > sma90 && sma7 > sma30 for STACK_PERSIST_DAYS days in a row
  Flags sma_stack;

  // low touched yesterday's 30d rolling low while the 90d SMA slopes up
  Flags prev_low_up;

  DailyIndicators() = default;
  explicit DailyIndicators(const Candles& daily);

  size_t size() const { return close.size(); }
};

// Daily indicators projected onto the fine row grid.
struct DailyRows {
  Series bb_lower;
  Series rsi;
  Series macd, macd_signal;
  Flags macd_cross;
  Series sma7, sma30, sma90;
  Flags sma_stack;
  Flags prev_low_up;
  Series pi_ratio;
  Flags pi_buy;

  DailyRows() = default;
  DailyRows(const DailyIndicators& daily, const IndexMap& index);

  size_t size() const { return rsi.size(); }
};

// Row-level absolute MVRV-Z buy (mvrvz <= 0); absent values never trigger.
Flags mvrvz_buy(const Candles& rows);
