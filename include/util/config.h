#pragma once

#include "util/times.h"

#include <cstdint>
#include <string>

struct VsaWeights {
  double stopping = 1.8;
  double no_supply = 1.0;
  double test_bar = 1.2;
  double shakeout = 2.2;
  double climactic = 1.6;
  double spring = 2.4;
  double demand = 1.4;
  double effort_result = 1.2;

  double activation = 2.6;
};

struct VsaConfig {
  static constexpr const char* name = "vsa";

  // Trailing bars used to normalise volume (24 = one day of 1h bars)
  int window = 24;
  VsaWeights weights;
};

struct ScoreWeights {
  static constexpr const char* name = "weights";
  static constexpr double MIN_WEIGHT = 0.0;
  static constexpr double MAX_WEIGHT = 5.0;

  double bollinger = 1.0;
  double macd = 1.0;
  double vsa = 1.0;
  double sma_stack = 1.5;
  double prev_low_up = 1.0;
  double rsi10 = 1.5;
  double rsi20 = 1.2;
  double rsi30 = 1.0;
  double pi_deep = 2.0;  // experimental, pi ratio < 0.125
};

struct BuyConfig {
  static constexpr const char* name = "buys";

  double threshold = 80.0;
  int64_t window_ms = 30 * MS_PER_DAY;    // forward-peak window
  int64_t cooldown_ms = 30 * MS_PER_DAY;  // min gap between accepted buys
};

struct WindowConfig {
  static constexpr const char* name = "window";

  int days = 0;  // 0 = whole series
  int offset_days = 0;
};

struct Config {
  bool debug_en = false;

  std::string input;
  std::string config_path;
  std::string out_path;

  VsaConfig vsa_config;
  ScoreWeights weights;
  BuyConfig buy_config;
  WindowConfig window_config;

  void read_args(int argc, char* argv[]);
  void read_file(const std::string& path);
  void validate() const;
};
