#include "ind/vsa.h"
#include "ind/indicators.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

double weight_of(const VsaWeights& w, VsaPattern p) {
  switch (p) {
    case VsaPattern::Stopping:
      return w.stopping;
    case VsaPattern::NoSupply:
      return w.no_supply;
    case VsaPattern::TestBar:
      return w.test_bar;
    case VsaPattern::Shakeout:
      return w.shakeout;
    case VsaPattern::Climactic:
      return w.climactic;
    case VsaPattern::Spring:
      return w.spring;
    case VsaPattern::Demand:
      return w.demand;
    case VsaPattern::EffortResult:
      return w.effort_result;
  }
  return 0.0;
}

double vsa_score(const std::array<bool, N_VSA_PATTERNS>& active,
                 const VsaWeights& w) {
  double score = 0.0;
  for (auto p : vsa_patterns)
    if (active[static_cast<size_t>(p)])
      score += weight_of(w, p);
  return score;
}

namespace {

bool stopping_volume(const VsaBar& b) {
  return b.down && b.uhv && b.close_pos >= 0.35 && b.downtrend;
}

bool no_supply(const VsaBar& b) {
  return b.down && b.lv && b.body_ratio() < 0.35 && b.close_pos <= 0.25 &&
         b.range < b.prev_range;
}

bool test_bar(const VsaBar& b) {
  return b.lv && b.body_ratio() < 0.35 && b.close_pos >= 0.65 &&
         valid(b.prior_low) && b.low <= b.prior_low;
}

bool shakeout(const VsaBar& b) {
  return b.up && b.hv && b.lower_wick > 0.55;
}

bool climactic_action(const VsaBar& b) {
  return b.down && b.uhv && b.tr >= 1.5 * b.atr && b.downtrend;
}

bool spring(const VsaBar& b) {
  return b.up && valid(b.prior_low) && b.low < b.prior_low &&
         b.close > b.prior_low && b.close_pos >= 0.5 && !b.ulv;
}

bool demand_bar(const VsaBar& b) {
  return b.up && b.hv && b.body_ratio() >= 0.5 && b.close_pos >= 0.75 &&
         b.range >= b.prev_range;
}

bool effort_vs_result(const VsaBar& b) {
  return b.uhv && b.body_ratio() < 0.20 && b.net <= 0.5 * b.atr;
}

// Indexed by VsaPattern
inline constexpr pattern_f pattern_funcs[] = {
    stopping_volume,  //
    no_supply,        //
    test_bar,         //
    shakeout,         //
    climactic_action, //
    spring,           //
    demand_bar,       //
    effort_vs_result, //
};

static_assert(std::size(pattern_funcs) == N_VSA_PATTERNS);

}  // namespace

VSA::VSA(const Candles& candles, const VsaWeights& weights, int window) {
  size_t n = candles.size();

  auto vol = volumes(candles);
  vol_ma = SMA{vol, window}.values;
  vol_sd = StdDev{vol, window}.values;

  int atr_period = std::max(5, static_cast<int>(std::lround(window / 2.0)));
  atr = ATR{candles, atr_period}.values;

  for (auto& flags : patterns)
    flags.assign(n, false);
  score.assign(n, 0.0);
  combined.assign(n, false);

  auto tr_at = [&candles](size_t i) {
    auto& c = candles[i];
    auto pc = candles[i - 1].close;
    if (!valid(pc))
      return c.high - c.low;
    return std::max({c.high - c.low, std::abs(c.high - pc),
                     std::abs(c.low - pc)});
  };

  size_t n_active = 0;
  for (size_t i = 1; i < n; i++) {
    auto& c = candles[i];
    auto& prev = candles[i - 1];

    auto rng = c.high - c.low;
    if (!valid(rng) || rng <= 0)
      continue;

    auto ref_open = valid(c.open) ? c.open : prev.close;

    VsaBar b;
    b.range = rng;
    b.body = std::abs(c.close - ref_open);
    b.close_pos = (c.close - c.low) / rng;
    b.lower_wick = (std::min(ref_open, c.close) - c.low) / rng;
    b.tr = tr_at(i);
    b.atr = atr[i];
    b.prev_range = prev.high - prev.low;
    b.net = std::abs(c.close - prev.close);
    b.prior_low = i >= 2 ? std::min(prev.low, candles[i - 2].low) : NA;
    b.low = c.low;
    b.close = c.close;

    b.up = c.close > ref_open;
    b.down = c.close < ref_open;

    auto ma = vol_ma[i];
    auto sd = vol_sd[i];
    bool has_ma = valid(ma) && ma > 0 && valid(c.volume);
    double z = NA;
    if (has_ma)
      z = valid(sd) && sd > 0 ? (c.volume - ma) / sd : c.volume / ma - 1;

    b.hv = has_ma && z >= 0.5;
    b.uhv = has_ma && z >= 1.5;
    b.lv = has_ma && c.volume <= 0.75 * ma;
    b.ulv = has_ma && c.volume <= 0.55 * ma;

    b.downtrend = i >= 3 && candles[i - 3].close >= candles[i - 2].close &&
                  candles[i - 2].close >= candles[i - 1].close;

    std::array<bool, N_VSA_PATTERNS> active{};
    for (size_t p = 0; p < N_VSA_PATTERNS; p++) {
      active[p] = pattern_funcs[p](b);
      patterns[p][i] = active[p];
    }

    score[i] = vsa_score(active, weights);
    combined[i] = score[i] >= weights.activation;
    n_active += combined[i];
  }

  spdlog::debug("[vsa] {} bars, window {}, {} composite hits", n, window,
                n_active);
}
