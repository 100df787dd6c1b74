#pragma once

#include "ind/candle.h"

#include <cstdint>
#include <optional>
#include <string>

// Maps a numeric timestamp of unknown unit (Excel serial days, seconds,
// milliseconds, microseconds or nanoseconds) to epoch milliseconds.
int64_t normalize_epoch_ms(double v);

// Numeric timestamps go through normalize_epoch_ms, anything else is parsed
// as an ISO-8601 date or date-time in UTC. Numbers at or beyond -9e15 or 9e21
// do not fit in int64 milliseconds and are rejected.
std::optional<int64_t> parse_epoch_ms(const std::string& s);

// Reads either a headered OHLCV csv or a headerless Binance kline dump.
// Fields may be double-quoted to carry commas. The result is sorted by time
// with one row per timestamp.
Candles read_csv(const std::string& path);
