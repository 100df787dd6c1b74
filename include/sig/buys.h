#pragma once

#include "ind/candle.h"
#include "sig/score.h"
#include "util/config.h"

#include <limits>
#include <optional>
#include <vector>

struct BuyEvent {
  size_t index = 0;  // row in the candles the scan ran over
  int64_t ts = 0;
  double confidence = 0.0;
  std::optional<Contributions> parts;  // empty for absolute triggers
};

// Scans rows [start, end) left to right. A rising edge through the threshold
// arms an episode; the episode emits at its first bar that no later bar in
// the forward window beats, provided the cooldown since the previous buy has
// elapsed. Falling below the threshold, failing the cooldown, or emitting
// ends the episode.
std::vector<BuyEvent> find_buys(
    const Candles& candles,
    const std::vector<Confidence>& conf,
    const BuyConfig& cfg,
    size_t start = 0,
    size_t end = std::numeric_limits<size_t>::max());
