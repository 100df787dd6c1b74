#include "sig/score.h"
#include "sig/signals.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <stdexcept>

namespace {

// First RSI tier whose bound holds, or 0 when none does.
inline double rsi_weight(double rsi, const ScoreWeights& w) {
  if (!valid(rsi))
    return 0.0;
  if (rsi <= 10)
    return w.rsi10;
  if (rsi <= 20)
    return w.rsi20;
  if (rsi <= 30)
    return w.rsi30;
  return 0.0;
}

}  // namespace

Confidence score_bar(const Signals& sig, size_t i, const ScoreWeights& w) {
  if (i >= sig.size())
    throw std::out_of_range(
        std::format("[score] row {} of {}", i, sig.size()));

  if (sig.absolute(i))
    return {ABSOLUTE_CAP, std::nullopt};

  Contributions parts;
  double raw = 0.0, max_raw = 0.0;
  auto add = [&](Component c, bool active, double weight) {
    auto v = active ? weight : 0.0;
    raw += v;
    max_raw += weight;
    parts[c] = v;
  };

  add(Component::Bollinger, sig.touch_lower[i], w.bollinger);
  add(Component::Macd, sig.macd_cross[i], w.macd);

  // tiers are exclusive; an unmet tier adds nothing to the denominator
  if (auto rw = rsi_weight(sig.rsi[i], w); rw > 0.0)
    add(Component::Rsi, true, rw);
  else
    parts[Component::Rsi] = 0.0;

  add(Component::Vsa, sig.vsa[i], w.vsa);
  add(Component::SmaStack, sig.sma_stack[i], w.sma_stack);
  add(Component::PrevLowUp, sig.prev_low_up[i], w.prev_low_up);
  add(Component::PiDeep, sig.pi_deep[i], w.pi_deep);

  double value =
      max_raw == 0 ? 0.0 : std::min(BLENDED_CAP, raw / max_raw * BLENDED_CAP);
  return {value, std::move(parts)};
}

std::vector<Confidence> score_series(const Signals& sig,
                                     const ScoreWeights& w) {
  std::vector<Confidence> out;
  out.reserve(sig.size());

  size_t n_absolute = 0;
  for (size_t i = 0; i < sig.size(); i++) {
    out.push_back(score_bar(sig, i, w));
    n_absolute += out.back().absolute();
  }

  spdlog::debug("[score] {} rows, {} absolute", out.size(), n_absolute);
  return out;
}
