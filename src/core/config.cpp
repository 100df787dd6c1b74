#include "util/config.h"

#include <argparse/argparse.hpp>
#include <format>
#include <glaze/glaze.hpp>
#include <iostream>
#include <stdexcept>

namespace {

struct ConfigFile {
  VsaConfig vsa;
  ScoreWeights weights;
  BuyConfig buys;
  WindowConfig window;
};

void check(bool ok, const std::string& msg) {
  if (!ok)
    throw std::invalid_argument(std::format("[config] {}", msg));
}

void check_weight(double w, const char* key) {
  check(w >= ScoreWeights::MIN_WEIGHT && w <= ScoreWeights::MAX_WEIGHT,
        std::format("{}.{} = {} outside [{}, {}]", ScoreWeights::name, key, w,
                    ScoreWeights::MIN_WEIGHT, ScoreWeights::MAX_WEIGHT));
}

void check_vsa_weight(double w, const char* key) {
  check(w >= 0.0, std::format("{}.{} = {} is negative", VsaConfig::name, key, w));
}

}  // namespace

void Config::read_file(const std::string& path) {
  ConfigFile file{vsa_config, weights, buy_config, window_config};

  std::string buffer;
  auto ec = glz::read_file_json(file, path, buffer);
  if (ec)
    throw std::invalid_argument(std::format("[config] {} error {}", path,
                                            glz::format_error(ec, buffer)));

  vsa_config = file.vsa;
  weights = file.weights;
  buy_config = file.buys;
  window_config = file.window;
}

void Config::validate() const {
  auto& w = weights;
  check_weight(w.bollinger, "bollinger");
  check_weight(w.macd, "macd");
  check_weight(w.vsa, "vsa");
  check_weight(w.sma_stack, "sma_stack");
  check_weight(w.prev_low_up, "prev_low_up");
  check_weight(w.rsi10, "rsi10");
  check_weight(w.rsi20, "rsi20");
  check_weight(w.rsi30, "rsi30");
  check_weight(w.pi_deep, "pi_deep");

  auto& v = vsa_config.weights;
  check_vsa_weight(v.stopping, "stopping");
  check_vsa_weight(v.no_supply, "no_supply");
  check_vsa_weight(v.test_bar, "test_bar");
  check_vsa_weight(v.shakeout, "shakeout");
  check_vsa_weight(v.climactic, "climactic");
  check_vsa_weight(v.spring, "spring");
  check_vsa_weight(v.demand, "demand");
  check_vsa_weight(v.effort_result, "effort_result");
  check_vsa_weight(v.activation, "activation");
  check(vsa_config.window >= 2,
        std::format("vsa.window = {} must be at least 2", vsa_config.window));

  auto& b = buy_config;
  check(b.threshold >= 0.0 && b.threshold <= 100.0,
        std::format("buys.threshold = {} outside [0, 100]", b.threshold));
  check(b.window_ms >= 0, "buys.window_ms is negative");
  check(b.cooldown_ms >= 0, "buys.cooldown_ms is negative");

  check(window_config.days >= 0, "window.days is negative");
  check(window_config.offset_days >= 0, "window.offset_days is negative");
}

void Config::read_args(int argc, char* argv[]) {
  argparse::ArgumentParser program("confluence");

  program.add_argument("input").help("OHLCV csv (headered or Binance klines)");

  program.add_argument("-c", "--config")
      .default_value(std::string{})
      .help("JSON file with vsa, weights, buys and window sections");

  program.add_argument("-o", "--out")
      .default_value(std::string{})
      .help("Write the JSON report here");

  program.add_argument("-d", "--debug")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug");

  program.add_argument("-t", "--threshold")
      .help("Confidence threshold for buy events")
      .scan<'g', double>();

  program.add_argument("--cooldown-hours")
      .help("Minimum hours between accepted buys")
      .scan<'i', int>();

  program.add_argument("--window-hours")
      .help("Forward window in which a buy must be the peak")
      .scan<'i', int>();

  program.add_argument("--days")
      .help("Visible window in days, 0 for everything")
      .scan<'i', int>();

  program.add_argument("--offset-days")
      .help("Offset of the visible window from the end")
      .scan<'i', int>();

  try {
    program.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << "\n" << program << "\n";
    throw std::invalid_argument(err.what());
  }

  input = program.get<std::string>("input");
  config_path = program.get<std::string>("--config");
  out_path = program.get<std::string>("--out");
  debug_en = program.get<bool>("--debug");

  if (!config_path.empty())
    read_file(config_path);

  if (auto v = program.present<double>("--threshold"))
    buy_config.threshold = *v;
  if (auto v = program.present<int>("--cooldown-hours"))
    buy_config.cooldown_ms = int64_t{*v} * MS_PER_HOUR;
  if (auto v = program.present<int>("--window-hours"))
    buy_config.window_ms = int64_t{*v} * MS_PER_HOUR;
  if (auto v = program.present<int>("--days"))
    window_config.days = *v;
  if (auto v = program.present<int>("--offset-days"))
    window_config.offset_days = *v;

  validate();
}
