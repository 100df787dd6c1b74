#pragma once

#include "ind/series.h"
#include "sig/signal_types.h"
#include "util/config.h"

#include <array>

double weight_of(const VsaWeights& w, VsaPattern p);

// Weighted sum of the active patterns.
double vsa_score(const std::array<bool, N_VSA_PATTERNS>& active,
                 const VsaWeights& w);

// Everything a pattern needs to know about bar i.
struct VsaBar {
  double range;      // high - low
  double body;       // |close - ref open|
  double close_pos;  // (close - low) / range
  double lower_wick; // (min(ref open, close) - low) / range
  double tr;
  double atr;
  double prev_range;
  double net;        // |close - prev close|
  double prior_low;  // min of the two preceding lows, NA before bar 2

  bool up, down;
  bool hv, uhv;  // z >= 0.5, z >= 1.5
  bool lv, ulv;  // vol <= 0.75 ma, vol <= 0.55 ma
  bool downtrend;
  double low, close;

  double body_ratio() const { return body / range; }
};

using pattern_f = bool (*)(const VsaBar&);

// Volume spread analysis on fine-grained bars. Patterns are independent; the
// composite fires when the weighted sum reaches `weights.activation`.
// Bar 0 is never evaluated.
struct VSA {
  Series vol_ma, vol_sd, atr;

  std::array<Flags, N_VSA_PATTERNS> patterns;
  Series score;
  Flags combined;

  VSA() = default;
  VSA(const Candles& candles, const VsaWeights& weights = {}, int window = 24);

  const Flags& pattern(VsaPattern p) const {
    return patterns[static_cast<size_t>(p)];
  }

  size_t size() const { return score.size(); }
};
