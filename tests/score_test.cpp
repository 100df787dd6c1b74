#include "sig/score.h"
#include "sig/signals.h"

#include <gtest/gtest.h>

namespace {

// A single row with every feature off.
Signals quiet_row() {
  Signals s;
  s.rsi = {NA};
  s.macd = s.macd_signal = {NA};
  s.sma7 = s.sma30 = s.sma90 = {NA};
  s.bb_lower = {NA};
  s.vsa_score = {0.0};
  s.pi_ratio = {NA};
  s.macd_cross = s.sma_stack = s.prev_low_up = s.touch_lower = s.vsa =
      s.pi_deep = s.pi_buy = s.mvrvz_buy = {false};
  return s;
}

}  // namespace

TEST(Score, QuietRowIsZeroWithBreakdown) {
  auto c = score_bar(quiet_row(), 0, ScoreWeights{});
  EXPECT_DOUBLE_EQ(c.value, 0.0);
  ASSERT_TRUE(c.parts.has_value());
  EXPECT_FALSE(c.absolute());
  EXPECT_EQ(c.parts->size(), components.size());
  for (auto& [_, v] : *c.parts)
    EXPECT_DOUBLE_EQ(v, 0.0);
}

TEST(Score, AbsoluteOverridesEverything) {
  auto s = quiet_row();
  s.mvrvz_buy = {true};
  auto c = score_bar(s, 0, ScoreWeights{});
  EXPECT_DOUBLE_EQ(c.value, ABSOLUTE_CAP);
  EXPECT_TRUE(c.absolute());

  s = quiet_row();
  s.pi_buy = {true};
  EXPECT_DOUBLE_EQ(score_bar(s, 0, ScoreWeights{}).value, 100.0);
}

TEST(Score, BlendedIsProportionOfPossibleWeight) {
  auto s = quiet_row();
  s.vsa = {true};

  // bollinger, macd, vsa, sma_stack, prev_low_up, pi_deep = 7.5
  auto c = score_bar(s, 0, ScoreWeights{});
  EXPECT_NEAR(c.value, 1.0 / 7.5 * 99.9, 1e-9);
  EXPECT_DOUBLE_EQ(c.parts->at(Component::Vsa), 1.0);
  EXPECT_DOUBLE_EQ(c.parts->at(Component::Macd), 0.0);
}

TEST(Score, RsiTierCountsOnlyWhenMet) {
  auto s = quiet_row();
  s.rsi = {5.0};
  auto c = score_bar(s, 0, ScoreWeights{});
  EXPECT_NEAR(c.value, 1.5 / 9.0 * 99.9, 1e-9);
  EXPECT_DOUBLE_EQ(c.parts->at(Component::Rsi), 1.5);

  s.rsi = {15.0};
  EXPECT_DOUBLE_EQ(score_bar(s, 0, ScoreWeights{}).parts->at(Component::Rsi),
                   1.2);

  s.rsi = {30.0};
  EXPECT_DOUBLE_EQ(score_bar(s, 0, ScoreWeights{}).parts->at(Component::Rsi),
                   1.0);

  s.rsi = {45.0};
  c = score_bar(s, 0, ScoreWeights{});
  EXPECT_DOUBLE_EQ(c.value, 0.0);
  EXPECT_DOUBLE_EQ(c.parts->at(Component::Rsi), 0.0);
}

TEST(Score, EverythingOnCapsBelowAbsolute) {
  auto s = quiet_row();
  s.rsi = {8.0};
  s.touch_lower = s.macd_cross = s.vsa = s.sma_stack = s.prev_low_up =
      s.pi_deep = {true};

  auto c = score_bar(s, 0, ScoreWeights{});
  EXPECT_DOUBLE_EQ(c.value, BLENDED_CAP);
  EXPECT_LT(c.value, ABSOLUTE_CAP);
}

TEST(Score, AllZeroWeightsScoreZero) {
  ScoreWeights w{};
  w.bollinger = w.macd = w.vsa = w.sma_stack = w.prev_low_up = w.rsi10 =
      w.rsi20 = w.rsi30 = w.pi_deep = 0.0;

  auto s = quiet_row();
  s.vsa = {true};
  s.rsi = {5.0};
  EXPECT_DOUBLE_EQ(score_bar(s, 0, w).value, 0.0);
}

TEST(Score, RowOutOfRangeThrows) {
  EXPECT_THROW(score_bar(quiet_row(), 1, ScoreWeights{}), std::out_of_range);
}

TEST(Score, SeriesScoresEveryRow) {
  auto s = quiet_row();
  s.rsi.push_back(5.0);
  s.macd.push_back(NA);
  s.macd_signal.push_back(NA);
  s.sma7.push_back(NA);
  s.sma30.push_back(NA);
  s.sma90.push_back(NA);
  s.bb_lower.push_back(NA);
  s.vsa_score.push_back(0.0);
  s.pi_ratio.push_back(NA);
  for (auto* f : {&s.macd_cross, &s.sma_stack, &s.prev_low_up, &s.touch_lower,
                  &s.vsa, &s.pi_deep, &s.pi_buy, &s.mvrvz_buy})
    f->push_back(false);

  auto conf = score_series(s, ScoreWeights{});
  ASSERT_EQ(conf.size(), 2u);
  EXPECT_DOUBLE_EQ(conf[0].value, 0.0);
  EXPECT_GT(conf[1].value, 0.0);
}
