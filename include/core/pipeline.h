#pragma once

#include "ind/daily.h"
#include "ind/timeframe.h"
#include "ind/vsa.h"
#include "sig/buys.h"
#include "sig/score.h"
#include "sig/signals.h"
#include "util/config.h"

#include <utility>
#include <vector>

// Rows [first, second) of the candles shown and searched for buys.
using RowRange = std::pair<size_t, size_t>;

RowRange visible_range(const Candles& candles, const WindowConfig& window);

struct Analysis {
  Candles candles;

  Resampled daily;
  DailyIndicators daily_ind;
  DailyRows daily_rows;
  VSA vsa;
  Signals signals;

  std::vector<Confidence> confidence;  // one per row, over the full series

  RowRange range{0, 0};
  std::vector<BuyEvent> buys;

  std::vector<DisplayBar> display_4h;
  std::vector<int64_t> buy_lines;  // 4h bucket starts holding a buy

  bool empty() const { return candles.empty(); }
};

Analysis run_pipeline(const Candles& candles, const Config& config);
