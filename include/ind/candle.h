#pragma once

#include "util/times.h"

#include <cstdint>
#include <limits>
#include <vector>

struct Candle {
  int64_t ts = 0;  // epoch ms, UTC
  double open = 0.0;
  double high = 0.0;
  double low = 0.0;
  double close = 0.0;
  double volume = 0.0;

  // Optional on-chain MVRV-Z value carried by the row, NaN when absent
  double mvrvz = std::numeric_limits<double>::quiet_NaN();
};

using Candles = std::vector<Candle>;
