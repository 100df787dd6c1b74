#pragma once

#include "core/pipeline.h"

#include <string>

// JSON dump of the visible window: 4h display bars, per-row confidence,
// buys and buy lines. Undefined values are written as null.
void write_report(const Analysis& a, const std::string& path);

// One line per buy: UTC time, confidence and the contributing components.
std::string buy_table(const Analysis& a);
