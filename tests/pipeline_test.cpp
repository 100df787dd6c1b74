#include "core/pipeline.h"
#include "core/report.h"
#include "test_util.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace {

// Only the VSA composite carries weight.
Config vsa_only(double threshold) {
  Config config;
  auto& w = config.weights;
  w.bollinger = w.macd = w.sma_stack = w.prev_low_up = w.rsi10 = w.rsi20 =
      w.rsi30 = w.pi_deep = 0.0;
  w.vsa = 1.0;
  config.buy_config.threshold = threshold;
  config.buy_config.cooldown_ms = 2 * MS_PER_HOUR;
  return config;
}

Candles hourly_days(size_t days) {
  return flat(days * 24);
}

}  // namespace

TEST(VisibleRange, WholeSeriesByDefault) {
  auto rows = hourly_days(10);
  EXPECT_EQ(visible_range(rows, {}), (RowRange{0, rows.size()}));
}

TEST(VisibleRange, TrailingDays) {
  auto rows = hourly_days(10);
  WindowConfig w;
  w.days = 3;
  EXPECT_EQ(visible_range(rows, w), (RowRange{167, 240}));

  w.offset_days = 2;
  EXPECT_EQ(visible_range(rows, w), (RowRange{119, 192}));
}

TEST(VisibleRange, ClampsToSpan) {
  auto rows = hourly_days(10);
  WindowConfig w;
  w.days = 100;
  w.offset_days = 50;
  EXPECT_EQ(visible_range(rows, w), (RowRange{23, 240}));
}

TEST(Pipeline, EmptyInput) {
  auto a = run_pipeline({}, Config{});
  EXPECT_TRUE(a.empty());
  EXPECT_TRUE(a.buys.empty());
  EXPECT_TRUE(a.confidence.empty());
}

TEST(Pipeline, SellOffClimaxIsOneBuy) {
  auto rows = dip_and_recovery();
  auto a = run_pipeline(rows, vsa_only(50));

  ASSERT_EQ(a.confidence.size(), rows.size());
  size_t crossings = 0;
  for (size_t i = 1; i < rows.size(); i++)
    crossings += a.confidence[i].value >= 50 && a.confidence[i - 1].value < 50;
  EXPECT_EQ(crossings, 1u);
  EXPECT_GT(a.vsa.score[90], 0.0);

  for (size_t i = 90; i < 95; i++)
    EXPECT_DOUBLE_EQ(a.confidence[i].value, 99.9) << "bar " << i;
  EXPECT_DOUBLE_EQ(a.confidence[89].value, 0.0);
  EXPECT_DOUBLE_EQ(a.confidence[95].value, 0.0);

  ASSERT_EQ(a.buys.size(), 1u);
  EXPECT_EQ(a.buys[0].index, 90u);
  EXPECT_EQ(a.buys[0].ts, rows[90].ts);
  EXPECT_DOUBLE_EQ(a.buys[0].parts->at(Component::Vsa), 1.0);

  EXPECT_EQ(a.buy_lines, (std::vector<int64_t>{T0 + 88 * MS_PER_HOUR}));
  EXPECT_EQ(a.display_4h.size(), 25u);
}

TEST(Pipeline, EverySeriesCoversEveryRow) {
  auto rows = dip_and_recovery();
  auto a = run_pipeline(rows, Config{});
  auto n = rows.size();

  EXPECT_EQ(a.daily.index.size(), n);
  EXPECT_EQ(a.daily_rows.size(), n);
  EXPECT_EQ(a.daily_rows.sma_stack.size(), n);
  EXPECT_EQ(a.vsa.size(), n);
  EXPECT_EQ(a.vsa.pattern(VsaPattern::Spring).size(), n);
  EXPECT_EQ(a.signals.size(), n);
  EXPECT_EQ(a.signals.touch_lower.size(), n);
  EXPECT_EQ(a.signals.mvrvz_buy.size(), n);
  EXPECT_EQ(a.confidence.size(), n);
}

TEST(Pipeline, RerunIsIndependentOfPreviousConfig) {
  auto rows = dip_and_recovery();
  auto first = run_pipeline(rows, vsa_only(50));
  run_pipeline(rows, Config{});
  auto again = run_pipeline(rows, vsa_only(50));

  ASSERT_EQ(first.confidence.size(), again.confidence.size());
  for (size_t i = 0; i < rows.size(); i++)
    EXPECT_DOUBLE_EQ(first.confidence[i].value, again.confidence[i].value);
  EXPECT_EQ(first.buys.size(), again.buys.size());
}

TEST(Pipeline, DefaultWeightsDiluteVsa) {
  auto rows = dip_and_recovery();
  Config config;
  config.buy_config.threshold = 50;

  auto a = run_pipeline(rows, config);
  EXPECT_NEAR(a.confidence[90].value, 99.9 / 7.5, 1e-9);
  EXPECT_TRUE(a.buys.empty());
}

TEST(Pipeline, ScoresAreBoundedAndBuysAreOrdered) {
  auto rows = dip_and_recovery();
  auto a = run_pipeline(rows, vsa_only(10));

  for (auto& c : a.confidence) {
    EXPECT_GE(c.value, 0.0);
    EXPECT_LE(c.value, 100.0);
    if (!c.absolute())
      EXPECT_LE(c.value, 99.9);
  }
  for (size_t k = 1; k < a.buys.size(); k++)
    EXPECT_GE(a.buys[k].ts - a.buys[k - 1].ts, 2 * MS_PER_HOUR);
}

TEST(Pipeline, WindowHidesEarlierBuys) {
  auto rows = dip_and_recovery();
  auto config = vsa_only(50);
  config.window_config.days = 1;

  auto a = run_pipeline(rows, config);
  EXPECT_EQ(a.range.second, rows.size());
  EXPECT_GT(a.range.first, 0u);
  EXPECT_EQ(a.confidence.size(), rows.size());

  // the whole dip is visible in the last day, so the buy survives
  ASSERT_EQ(a.buys.size(), 1u);
  EXPECT_EQ(a.buys[0].index, 90u);

  config.window_config.offset_days = 3;
  auto earlier = run_pipeline(rows, config);
  EXPECT_TRUE(earlier.buys.empty());
  EXPECT_LT(earlier.range.second, 90u);
}

TEST(Pipeline, MvrvzAbsoluteBuy) {
  auto rows = flat(30);
  rows[20].mvrvz = -0.3;

  auto a = run_pipeline(rows, Config{});
  EXPECT_DOUBLE_EQ(a.confidence[20].value, 100.0);
  ASSERT_EQ(a.buys.size(), 1u);
  EXPECT_EQ(a.buys[0].index, 20u);
  EXPECT_FALSE(a.buys[0].parts.has_value());

  EXPECT_NE(buy_table(a).find("Absolute"), std::string::npos);
}

TEST(Report, BuyTableListsContributions) {
  auto a = run_pipeline(dip_and_recovery(), vsa_only(50));
  auto table = buy_table(a);
  EXPECT_NE(table.find("2024-01-04 18:00"), std::string::npos);
  EXPECT_NE(table.find("99.90"), std::string::npos);
  EXPECT_NE(table.find("vsa: 1.00"), std::string::npos);
  EXPECT_EQ(table.find("macd"), std::string::npos);
}

TEST(Report, EmptyBuyTable) {
  EXPECT_EQ(buy_table(Analysis{}), "No buys\n");
}

TEST(Report, WritesJson) {
  auto a = run_pipeline(dip_and_recovery(), vsa_only(50));
  auto path = std::filesystem::temp_directory_path() / "confluence_report.json";

  write_report(a, path.string());

  std::ifstream f{path};
  std::stringstream ss;
  ss << f.rdbuf();
  auto json = ss.str();
  std::filesystem::remove(path);

  EXPECT_NE(json.find("\"buys\""), std::string::npos);
  EXPECT_NE(json.find("\"bars_4h\""), std::string::npos);
  EXPECT_NE(json.find("\"stopping\""), std::string::npos);
  // daily indicators are undefined on four days of data
  EXPECT_NE(json.find("null"), std::string::npos);
}
