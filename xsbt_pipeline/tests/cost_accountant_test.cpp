/// @file tests/cost_accountant_test.cpp
/// @brief Tests for per-symbol turnover and linear transaction cost.

#include <gtest/gtest.h>

#include "xsbt/cost_accountant.hpp"
#include "xsbt/errors.hpp"

#include <limits>
#include <stdexcept>
#include <vector>

using namespace xsbt;

TEST(CostAccountant, FirstAppearanceStartsFromFlat) {
  const CostAccountant costs(10.0);
  const std::vector<Position> positions = {
      {"A", 20240102, 0.5},
      {"B", 20240102, -0.25},
      {"C", 20240102, 0.0},
  };

  const auto out = costs.Apply(positions);
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].prev_weight, 0.0);
  EXPECT_DOUBLE_EQ(out[0].turnover, 0.5);
  EXPECT_DOUBLE_EQ(out[0].cost, 0.0005);
  EXPECT_DOUBLE_EQ(out[1].turnover, 0.25);
  EXPECT_DOUBLE_EQ(out[1].cost, 0.00025);
  EXPECT_EQ(out[2].turnover, 0.0);
  EXPECT_EQ(out[2].cost, 0.0);
}

TEST(CostAccountant, TurnoverIsChangeSinceSymbolsPreviousAppearance) {
  const CostAccountant costs(1.0);
  const std::vector<Position> positions = {
      {"A", 20240102, 1.0},
      {"A", 20240103, -1.0},
      {"A", 20240105, -1.0},  // gap in days: previous appearance still counts
      {"A", 20240108, 0.0},
  };

  const auto out = costs.Apply(positions);
  ASSERT_EQ(out.size(), 4u);
  EXPECT_DOUBLE_EQ(out[1].prev_weight, 1.0);
  EXPECT_DOUBLE_EQ(out[1].turnover, 2.0);
  EXPECT_DOUBLE_EQ(out[1].cost, 2.0e-4);
  EXPECT_DOUBLE_EQ(out[2].prev_weight, -1.0);
  EXPECT_EQ(out[2].turnover, 0.0);
  EXPECT_DOUBLE_EQ(out[3].turnover, 1.0);
  for (const auto& c : out) EXPECT_GE(c.turnover, 0.0);
}

TEST(CostAccountant, PreviousWeightIsNeverTakenFromAnotherSymbol) {
  const CostAccountant costs(5.0);
  const std::vector<Position> positions = {
      {"A", 20240102, 1.0},
      {"B", 20240103, 0.5},  // B first appears after A held +1
      {"A", 20240103, 1.0},
  };

  const auto out = costs.Apply(positions);
  EXPECT_EQ(out[1].prev_weight, 0.0);
  EXPECT_DOUBLE_EQ(out[1].turnover, 0.5);
  EXPECT_DOUBLE_EQ(out[2].prev_weight, 1.0);
  EXPECT_EQ(out[2].turnover, 0.0);
}

TEST(CostAccountant, ZeroFeeMeansZeroCost) {
  const CostAccountant costs(0.0);
  const std::vector<Position> positions = {{"A", 20240102, 1.0}, {"A", 20240103, -1.0}};
  for (const auto& c : costs.Apply(positions)) EXPECT_EQ(c.cost, 0.0);
}

TEST(CostAccountant, FeeRateIsBasisPoints) {
  const CostAccountant costs(10.0);
  EXPECT_DOUBLE_EQ(costs.fee_rate(), 0.001);
  EXPECT_DOUBLE_EQ(costs.fee_bps(), 10.0);
}

TEST(CostAccountant, RejectsNegativeFee) {
  EXPECT_THROW(CostAccountant(-1.0), ConfigError);
  EXPECT_THROW(CostAccountant(std::numeric_limits<double>::infinity()), ConfigError);
}

TEST(CostAccountant, RejectsPositionsOutOfDayOrder) {
  const CostAccountant costs(1.0);
  const std::vector<Position> positions = {{"A", 20240103, 1.0}, {"A", 20240102, 1.0}};
  EXPECT_THROW(costs.Apply(positions), std::invalid_argument);
}
