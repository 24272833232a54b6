/// @file tests/pnl_aggregator_test.cpp
/// @brief Tests for prior-weight pnl booking, daily aggregation and equity.

#include <gtest/gtest.h>

#include "xsbt/cost_accountant.hpp"
#include "xsbt/pnl_aggregator.hpp"

#include <stdexcept>
#include <vector>

using namespace xsbt;

namespace {

SymbolPnl Row(const char* sym, uint32_t day, double pnl) {
  SymbolPnl r;
  r.symbol = sym;
  r.day    = day;
  r.pnl    = pnl;
  return r;
}

}  // namespace

TEST(BookSymbolPnl, HeldPositionEarnsTheNextBarReturn) {
  const std::vector<JoinedObservation> joined = {
      {"A", 20240102, 0.7, 0.05},
      {"A", 20240103, 0.7, 0.02},
  };
  const std::vector<Position> positions = {
      {"A", 20240102, 1.0},
      {"A", 20240103, 1.0},
  };
  const CostAccountant costs(10.0);
  const auto costed = costs.Apply(positions);

  const auto booked = BookSymbolPnl(joined, costed);
  ASSERT_EQ(booked.size(), 2u);

  // Day 1: nothing held yet; only the cost of opening the position.
  EXPECT_EQ(booked[0].prev_weight, 0.0);
  EXPECT_DOUBLE_EQ(booked[0].pnl, -0.001);

  // Day 2: +1 held through the bar, no turnover.
  EXPECT_DOUBLE_EQ(booked[1].prev_weight, 1.0);
  EXPECT_EQ(booked[1].turnover, 0.0);
  EXPECT_DOUBLE_EQ(booked[1].pnl, 0.02);
}

TEST(BookSymbolPnl, SameDayWeightNeverTouchesSameDayReturn) {
  const std::vector<JoinedObservation> joined = {{"A", 20240102, 1.0, 0.50}};
  const std::vector<Position> positions = {{"A", 20240102, 1.0}};
  const auto costed = CostAccountant(0.0).Apply(positions);

  const auto booked = BookSymbolPnl(joined, costed);
  EXPECT_EQ(booked[0].pnl, 0.0);
}

TEST(BookSymbolPnl, RejectsMisalignedInputs) {
  const std::vector<JoinedObservation> joined = {{"A", 20240102, 1.0, 0.0}};
  const std::vector<CostedPosition> costed = {{"B", 20240102, 1.0, 0.0, 1.0, 0.0}};
  EXPECT_THROW(BookSymbolPnl(joined, costed), std::invalid_argument);
  EXPECT_THROW(BookSymbolPnl(joined, {}), std::invalid_argument);
}

TEST(PnLAggregator, SumAggregation) {
  const std::vector<SymbolPnl> rows = {
      Row("A", 20240102, 0.01), Row("B", 20240102, 0.03),
  };
  const auto daily = AggregateDailyPnl(rows, DailyAggregation::Sum);
  ASSERT_EQ(daily.size(), 1u);
  EXPECT_DOUBLE_EQ(daily[0].pnl, 0.04);
  EXPECT_EQ(daily[0].num_symbols, 2u);
  EXPECT_DOUBLE_EQ(daily[0].equity, 1.04);
}

TEST(PnLAggregator, MeanAggregation) {
  const std::vector<SymbolPnl> rows = {
      Row("A", 20240102, 0.01), Row("B", 20240102, 0.03), Row("C", 20240102, -0.01),
  };
  const auto daily = AggregateDailyPnl(rows, DailyAggregation::Mean);
  ASSERT_EQ(daily.size(), 1u);
  EXPECT_NEAR(daily[0].pnl, 0.01, 1e-15);
}

TEST(PnLAggregator, EquityCompoundsInDayOrder) {
  const std::vector<SymbolPnl> rows = {
      Row("A", 20240102, 0.01), Row("A", 20240103, -0.02),
  };
  const auto daily = AggregateDailyPnl(rows, DailyAggregation::Sum);
  ASSERT_EQ(daily.size(), 2u);
  EXPECT_DOUBLE_EQ(daily[0].equity, 1.01);
  EXPECT_NEAR(daily[1].equity, 0.9898, 1e-12);
}

TEST(PnLAggregator, MissingDaysAreAbsentNotZero) {
  const std::vector<SymbolPnl> rows = {
      Row("A", 20240102, 0.10), Row("A", 20240108, 0.10),
  };
  const auto daily = AggregateDailyPnl(rows, DailyAggregation::Sum);
  ASSERT_EQ(daily.size(), 2u);
  EXPECT_EQ(daily[0].day, 20240102u);
  EXPECT_EQ(daily[1].day, 20240108u);
  EXPECT_NEAR(daily[1].equity, 1.21, 1e-12);
}

TEST(PnLAggregator, TracksGrossCostAndTurnover) {
  SymbolPnl a = Row("A", 20240102, 0.0);
  a.prev_weight = 0.5;
  a.realized_return = 0.04;
  a.turnover = 1.0;
  a.cost = 0.001;
  a.pnl = 0.5 * 0.04 - 0.001;
  SymbolPnl b = Row("B", 20240102, 0.0);
  b.prev_weight = -0.5;
  b.realized_return = 0.02;
  b.turnover = 0.5;
  b.cost = 0.0005;
  b.pnl = -0.5 * 0.02 - 0.0005;

  const std::vector<SymbolPnl> rows = {a, b};
  const auto daily = AggregateDailyPnl(rows, DailyAggregation::Sum);
  ASSERT_EQ(daily.size(), 1u);
  EXPECT_NEAR(daily[0].gross_pnl, 0.01, 1e-15);
  EXPECT_NEAR(daily[0].cost, 0.0015, 1e-15);
  EXPECT_NEAR(daily[0].turnover, 1.5, 1e-15);
  EXPECT_NEAR(daily[0].pnl, daily[0].gross_pnl - daily[0].cost, 1e-15);
}

TEST(PnLAggregator, RejectsRowsOutOfDayOrder) {
  PnLAggregator agg;
  agg.StartRun(DailyAggregation::Sum);
  agg.OnSymbolPnl(Row("A", 20240103, 0.0));
  EXPECT_THROW(agg.OnSymbolPnl(Row("A", 20240102, 0.0)), std::logic_error);
}

TEST(PnLAggregator, RejectsRowsForAClosedDay) {
  PnLAggregator agg;
  agg.StartRun(DailyAggregation::Sum);
  agg.OnSymbolPnl(Row("A", 20240102, 0.0));
  agg.OnSymbolPnl(Row("A", 20240103, 0.0));
  EXPECT_THROW(agg.OnSymbolPnl(Row("B", 20240102, 0.0)), std::logic_error);
}

TEST(PnLAggregator, StartRunResetsState) {
  PnLAggregator agg;
  agg.StartRun(DailyAggregation::Sum);
  agg.OnSymbolPnl(Row("A", 20240103, 0.5));
  ASSERT_EQ(agg.Finalize().size(), 1u);

  agg.StartRun(DailyAggregation::Sum);
  agg.OnSymbolPnl(Row("A", 20240102, 0.1));
  const auto& daily = agg.Finalize();
  ASSERT_EQ(daily.size(), 1u);
  EXPECT_DOUBLE_EQ(daily[0].equity, 1.1);
}

TEST(PnLAggregator, EmptyRunHasNoRows) {
  EXPECT_TRUE(AggregateDailyPnl({}, DailyAggregation::Mean).empty());
}
