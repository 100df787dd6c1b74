#pragma once

#include "ind/series.h"

struct DailyRows;
struct VSA;

// Row-level signals on the fine grid. Pure schema assembly: nothing here is
// windowed or weighted.
struct Signals {
  static constexpr double PI_DEEP = 0.125;

  // series
  Series rsi;
  Series macd, macd_signal;
  Flags macd_cross;
  Series sma7, sma30, sma90;
  Flags sma_stack;
  Flags prev_low_up;
  Series bb_lower;

  // features
  Flags touch_lower;  // row close at or below the daily lower band
  Flags vsa;
  Series vsa_score;
  Series pi_ratio;
  Flags pi_deep;

  // absolutes
  Flags pi_buy;
  Flags mvrvz_buy;

  Signals() = default;
  Signals(const Candles& rows,
          const DailyRows& daily,
          const Flags& mvrvz_buy,
          const VSA& vsa);

  size_t size() const { return rsi.size(); }
  bool absolute(size_t i) const { return pi_buy[i] || mvrvz_buy[i]; }
};
