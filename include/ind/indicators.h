#pragma once

#include "ind/series.h"

// All indicators take a full series and produce `values` of the same length.
// A non-positive period yields an all-NA series; periods are validated when
// the configuration is accepted, not here.

struct SMA {
  Series values;

  SMA() noexcept = default;
  SMA(const Series& src, int period) noexcept;
};

struct EMA {
  Series values;

  EMA() noexcept = default;
  EMA(const Series& src, int period) noexcept;
};

// Population standard deviation around the trailing SMA, skipping NA inputs.
struct StdDev {
  Series values;

  StdDev() noexcept = default;
  StdDev(const Series& src, int period) noexcept;
};

struct ATR {
  Series values;

  ATR() noexcept = default;
  ATR(const Series& high,
      const Series& low,
      const Series& close,
      int period = 14) noexcept;
  ATR(const Candles& candles, int period = 14) noexcept;
};

struct RSI {
  Series values;

  RSI() noexcept = default;
  RSI(const Series& src, int period = 14) noexcept;

  static double from_averages(double avg_gain, double avg_loss) noexcept;
};

struct MACD {
  Series macd_line;
  Series signal_line;

  MACD() noexcept = default;
  MACD(const Series& src, int fast = 12, int slow = 26, int signal = 9) noexcept;
};

// Least-squares slope of (offset, value) over the trailing window.
struct Slope {
  Series values;

  Slope() noexcept = default;
  Slope(const Series& src, int window = 10) noexcept;
};

struct RollingMin {
  Series values;

  RollingMin() noexcept = default;
  RollingMin(const Series& src, int window) noexcept;
};
