#include "ind/indicators.h"

#include <algorithm>
#include <cmath>

SMA::SMA(const Series& src, int period) noexcept : values(src.size(), NA) {
  if (period <= 0)
    return;

  // NA inputs count as zero in the running sum
  auto at = [&src](size_t i) { return valid(src[i]) ? src[i] : 0.0; };

  size_t p = period;
  double sum = 0;
  for (size_t i = 0; i < src.size(); i++) {
    sum += at(i);
    if (i >= p)
      sum -= at(i - p);
    if (i + 1 >= p)
      values[i] = sum / period;
  }
}

EMA::EMA(const Series& src, int period) noexcept : values(src.size(), NA) {
  if (period <= 0)
    return;

  auto alpha = 2.0 / (period + 1);
  double prev = NA;
  for (size_t i = 0; i < src.size(); i++) {
    auto v = valid(src[i]) ? src[i] : prev;
    prev = valid(prev) ? (v - prev) * alpha + prev : v;
    values[i] = prev;
  }
}

StdDev::StdDev(const Series& src, int period) noexcept
    : values(src.size(), NA) {
  if (period <= 0)
    return;

  SMA ma{src, period};
  size_t p = period;
  for (size_t i = p - 1; i < src.size(); i++) {
    auto mean = ma.values[i];
    if (!valid(mean))
      continue;

    double s2 = 0;
    int cnt = 0;
    for (size_t j = i + 1 - p; j <= i; j++) {
      if (!valid(src[j]))
        continue;
      auto d = src[j] - mean;
      s2 += d * d;
      cnt++;
    }
    if (cnt > 0)
      values[i] = std::sqrt(s2 / cnt);
  }
}

ATR::ATR(const Series& high,
         const Series& low,
         const Series& close,
         int period) noexcept
    : values(close.size(), NA) {
  if (period <= 0)
    return;

  size_t n = close.size();
  auto at = [](const Series& s, size_t i) {
    return i < s.size() && valid(s[i]) ? s[i] : NA;
  };

  double prev_close = n ? at(close, 0) : NA;
  double running = 0;
  size_t count = 0;
  double prev_atr = NA;
  bool seeded = false;

  for (size_t i = 0; i < n; i++) {
    auto hi = at(high, i);
    auto lo = at(low, i);
    auto cl = valid(at(close, i)) ? at(close, i) : prev_close;

    if (!valid(hi) || !valid(lo)) {
      // skipped bar keeps the last defined value
      values[i] = i > 0 ? values[i - 1] : NA;
      prev_close = valid(cl) ? cl : prev_close;
      continue;
    }

    auto hl = hi - lo;
    auto hc = valid(prev_close) ? std::abs(hi - prev_close) : hl;
    auto lc = valid(prev_close) ? std::abs(lo - prev_close) : hl;
    auto tr = std::max({hl, hc, lc});

    if (!seeded) {
      running += tr;
      values[i] = running / ++count;
      if (count >= size_t(period)) {
        seeded = true;
        prev_atr = values[i];
      }
    } else {
      prev_atr = valid(prev_atr) ? (prev_atr * (period - 1) + tr) / period : tr;
      values[i] = prev_atr;
    }

    prev_close = cl;
  }
}

ATR::ATR(const Candles& candles, int period) noexcept
    : ATR{highs(candles), lows(candles), closes(candles), period} {}

double RSI::from_averages(double avg_gain, double avg_loss) noexcept {
  if (avg_loss == 0.0)
    return 100.0;
  double rs = avg_gain / avg_loss;
  return 100.0 - (100.0 / (1.0 + rs));
}

RSI::RSI(const Series& src, int period) noexcept : values(src.size(), NA) {
  size_t n = src.size();
  if (n < 2 || period <= 0)
    return;

  auto split = [](double change, double& gain, double& loss) {
    gain = change > 0 ? change : 0.0;
    loss = change < 0 ? -change : 0.0;
  };

  // initial averages over the first `period` deltas
  double gain_sum = 0.0, loss_sum = 0.0;
  for (size_t i = 1; i <= size_t(period) && i < n; ++i) {
    double g, l;
    split(src[i] - src[i - 1], g, l);
    gain_sum += g;
    loss_sum += l;
  }

  double avg_gain = gain_sum / period;
  double avg_loss = loss_sum / period;

  for (size_t i = period; i < n; ++i) {
    if (i > size_t(period)) {
      double g, l;
      split(src[i] - src[i - 1], g, l);
      avg_gain = (avg_gain * (period - 1) + g) / period;
      avg_loss = (avg_loss * (period - 1) + l) / period;
    }
    values[i] = from_averages(avg_gain, avg_loss);
  }
}

MACD::MACD(const Series& src, int fast, int slow, int signal) noexcept
    : macd_line(src.size(), NA) {
  EMA fast_ema{src, fast};
  EMA slow_ema{src, slow};

  size_t n = src.size();
  for (size_t i = 0; i < n; ++i) {
    auto f = fast_ema.values[i];
    auto s = slow_ema.values[i];
    if (valid(f) && valid(s))
      macd_line[i] = f - s;
  }

  signal_line = EMA{macd_line, signal}.values;
}

Slope::Slope(const Series& src, int window) noexcept : values(src.size(), NA) {
  if (window <= 1)
    return;

  size_t w = window;
  for (size_t i = w - 1; i < src.size(); i++) {
    double sx = 0, sy = 0, sxx = 0, sxy = 0;
    int cnt = 0;
    double x = 0;
    for (size_t j = i + 1 - w; j <= i; j++, x++) {
      auto y = src[j];
      if (!valid(y))
        continue;
      sx += x;
      sy += y;
      sxx += x * x;
      sxy += x * y;
      cnt++;
    }
    if (cnt < 2)
      continue;

    auto denom = cnt * sxx - sx * sx;
    if (denom != 0)
      values[i] = (cnt * sxy - sx * sy) / denom;
  }
}

RollingMin::RollingMin(const Series& src, int window) noexcept
    : values(src.size(), NA) {
  if (window <= 0)
    return;

  size_t w = window;
  for (size_t i = w - 1; i < src.size(); i++) {
    double m = NA;
    for (size_t j = i + 1 - w; j <= i; j++)
      if (valid(src[j]) && (!valid(m) || src[j] < m))
        m = src[j];
    values[i] = m;
  }
}
