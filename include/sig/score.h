#pragma once

#include "sig/signal_types.h"
#include "util/config.h"

#include <map>
#include <optional>
#include <vector>

struct Signals;

inline constexpr double ABSOLUTE_CAP = 100.0;
// Blended scores stay below the absolute cap so the two never look alike
inline constexpr double BLENDED_CAP = 99.9;

using Contributions = std::map<Component, double>;

struct Confidence {
  double value = 0.0;
  // Absent for absolute overrides
  std::optional<Contributions> parts;

  bool absolute() const { return !parts.has_value(); }
  operator double() const { return value; }
};

Confidence score_bar(const Signals& sig, size_t i, const ScoreWeights& w);

std::vector<Confidence> score_series(const Signals& sig,
                                     const ScoreWeights& w);
