#include "sig/signals.h"
#include "ind/daily.h"
#include "ind/vsa.h"

#include <spdlog/spdlog.h>

#include <format>
#include <stdexcept>

namespace {

inline void check_len(size_t got, size_t n, const char* what) {
  if (got != n)
    throw std::invalid_argument(
        std::format("[signals] {} has {} rows, expected {}", what, got, n));
}

}  // namespace

Signals::Signals(const Candles& rows,
                 const DailyRows& daily,
                 const Flags& mvrvz,
                 const VSA& v)
    : rsi{daily.rsi},
      macd{daily.macd},
      macd_signal{daily.macd_signal},
      macd_cross{daily.macd_cross},
      sma7{daily.sma7},
      sma30{daily.sma30},
      sma90{daily.sma90},
      sma_stack{daily.sma_stack},
      prev_low_up{daily.prev_low_up},
      bb_lower{daily.bb_lower},
      vsa{v.combined},
      vsa_score{v.score},
      pi_ratio{daily.pi_ratio},
      pi_buy{daily.pi_buy},
      mvrvz_buy{mvrvz} {
  size_t n = rows.size();
  check_len(daily.size(), n, "daily rows");
  check_len(mvrvz.size(), n, "mvrvz buy");
  check_len(v.size(), n, "vsa");

  touch_lower.assign(n, false);
  pi_deep.assign(n, false);
  for (size_t i = 0; i < n; i++) {
    touch_lower[i] = valid(bb_lower[i]) && rows[i].close <= bb_lower[i];
    pi_deep[i] = valid(pi_ratio[i]) && pi_ratio[i] < PI_DEEP;
  }

  spdlog::debug("[signals] assembled {} rows", n);
}
