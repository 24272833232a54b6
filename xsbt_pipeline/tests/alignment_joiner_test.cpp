/// @file tests/alignment_joiner_test.cpp
/// @brief Tests for return derivation, de-duplication and the score/return join.

#include <gtest/gtest.h>

#include "xsbt/alignment_joiner.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace xsbt;

namespace {

constexpr uint32_t kD1 = 20240102;
constexpr uint32_t kD2 = 20240103;
constexpr uint32_t kD3 = 20240104;

MarketBar Bar(std::string sym, uint32_t day, double close) {
  return MarketBar{std::move(sym), day, close};
}

ScoreObservation Score(std::string sym, uint32_t day, double score) {
  return ScoreObservation{std::move(sym), day, score};
}

}  // namespace

TEST(ComputeRealizedReturns, CloseToCloseWithinEachSymbol) {
  const std::vector<MarketBar> bars = {
      Bar("A", kD1, 100.0), Bar("A", kD2, 102.0), Bar("A", kD3, 99.96),
      Bar("B", kD1, 50.0),  Bar("B", kD2, 40.0),
  };

  const auto rets = ComputeRealizedReturns(bars);
  ASSERT_EQ(rets.size(), 3u);

  EXPECT_EQ(rets[0].symbol, "A");
  EXPECT_EQ(rets[0].day, kD2);
  EXPECT_NEAR(rets[0].realized_return, 0.02, 1e-12);
  EXPECT_EQ(rets[1].day, kD3);
  EXPECT_NEAR(rets[1].realized_return, 99.96 / 102.0 - 1.0, 1e-12);
  EXPECT_EQ(rets[2].symbol, "B");
  EXPECT_NEAR(rets[2].realized_return, -0.2, 1e-12);
}

TEST(ComputeRealizedReturns, FirstDayOfEverySymbolHasNoReturn) {
  const std::vector<MarketBar> bars = {
      Bar("A", kD1, 10.0), Bar("B", kD2, 20.0), Bar("C", kD3, 30.0),
  };
  EXPECT_TRUE(ComputeRealizedReturns(bars).empty());
}

TEST(ComputeRealizedReturns, SortsEachSymbolByDay) {
  const std::vector<MarketBar> bars = {
      Bar("A", kD3, 121.0), Bar("A", kD1, 100.0), Bar("A", kD2, 110.0),
  };
  const auto rets = ComputeRealizedReturns(bars);
  ASSERT_EQ(rets.size(), 2u);
  EXPECT_EQ(rets[0].day, kD2);
  EXPECT_NEAR(rets[0].realized_return, 0.1, 1e-12);
  EXPECT_EQ(rets[1].day, kD3);
  EXPECT_NEAR(rets[1].realized_return, 0.1, 1e-12);
}

TEST(ComputeRealizedReturns, DuplicateBarsKeepLastOccurrence) {
  const std::vector<MarketBar> bars = {
      Bar("A", kD1, 100.0), Bar("A", kD2, 110.0), Bar("A", kD1, 50.0),
  };
  const auto rets = ComputeRealizedReturns(bars);
  ASSERT_EQ(rets.size(), 1u);
  EXPECT_NEAR(rets[0].realized_return, 110.0 / 50.0 - 1.0, 1e-12);
}

TEST(ComputeRealizedReturns, BarsWithoutUsablePriceAreSkipped) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const std::vector<MarketBar> bars = {
      Bar("A", kD1, 100.0), Bar("A", kD2, 0.0), Bar("A", kD3, 110.0),
      Bar("A", 20240105, nan), Bar("A", 20240108, 121.0),
  };
  const auto rets = ComputeRealizedReturns(bars);
  ASSERT_EQ(rets.size(), 2u);
  EXPECT_EQ(rets[0].day, kD3);
  EXPECT_NEAR(rets[0].realized_return, 0.1, 1e-12);
  EXPECT_EQ(rets[1].day, 20240108u);
  EXPECT_NEAR(rets[1].realized_return, 0.1, 1e-12);
}

TEST(DedupeLast, KeepsLastOccurrenceAndSortsBySymbolThenDay) {
  const std::vector<ScoreObservation> rows = {
      Score("B", kD1, 1.0), Score("A", kD2, 0.1), Score("A", kD1, 0.5),
      Score("A", kD2, 0.7), Score("B", kD1, 2.0),
  };
  const auto out = DedupeLast(std::span<const ScoreObservation>(rows));
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].symbol, "A");
  EXPECT_EQ(out[0].day, kD1);
  EXPECT_EQ(out[1].symbol, "A");
  EXPECT_EQ(out[1].day, kD2);
  EXPECT_DOUBLE_EQ(out[1].score, 0.7);
  EXPECT_EQ(out[2].symbol, "B");
  EXPECT_DOUBLE_EQ(out[2].score, 2.0);
}

TEST(AlignScoresToReturns, InnerJoinDropsRowsMissingEitherSide) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const std::vector<MarketBar> market = {
      Bar("A", kD1, 100.0), Bar("A", kD2, 101.0), Bar("A", kD3, 102.0),
      Bar("C", kD1, 10.0),  Bar("C", kD2, 11.0),
  };
  const std::vector<ScoreObservation> scores = {
      Score("A", kD1, 0.3),  // first market day: no return
      Score("A", kD2, 0.4),
      Score("A", kD3, nan),  // undefined score
      Score("B", kD2, 0.9),  // no market data
      Score("C", kD2, -0.1),
  };

  AlignmentStats stats;
  const auto joined = AlignScoresToReturns(scores, market, &stats);
  ASSERT_EQ(joined.size(), 2u);

  EXPECT_EQ(joined[0].symbol, "A");
  EXPECT_EQ(joined[0].day, kD2);
  EXPECT_DOUBLE_EQ(joined[0].score, 0.4);
  EXPECT_NEAR(joined[0].realized_return, 0.01, 1e-12);

  EXPECT_EQ(joined[1].symbol, "C");
  EXPECT_EQ(joined[1].day, kD2);
  EXPECT_NEAR(joined[1].realized_return, 0.1, 1e-12);

  EXPECT_EQ(stats.score_rows_in, 5u);
  EXPECT_EQ(stats.score_rows_unique, 5u);
  EXPECT_EQ(stats.score_rows_dropped, 1u);
  EXPECT_EQ(stats.market_rows_in, 5u);
  EXPECT_EQ(stats.return_rows, 3u);
  EXPECT_EQ(stats.joined_rows, 2u);
  EXPECT_EQ(stats.distinct_days, 1u);
}

TEST(AlignScoresToReturns, OutputIsOrderedByDayThenSymbolAndUnique) {
  std::vector<MarketBar> market;
  std::vector<ScoreObservation> scores;
  const std::vector<std::string> symbols = {"ZZ", "AA", "MM"};
  const std::vector<uint32_t> days = {kD1, kD2, kD3, 20240105};
  for (const auto& s : symbols) {
    for (std::size_t i = 0; i < days.size(); ++i) {
      market.push_back(Bar(s, days[i], 100.0 + static_cast<double>(i)));
      scores.push_back(Score(s, days[i], static_cast<double>(i)));
      scores.push_back(Score(s, days[i], static_cast<double>(i) + 0.5));
    }
  }

  const auto joined = AlignScoresToReturns(scores, market);
  ASSERT_EQ(joined.size(), symbols.size() * (days.size() - 1));

  std::set<std::pair<std::string, uint32_t>> keys;
  for (std::size_t i = 0; i < joined.size(); ++i) {
    EXPECT_TRUE(keys.emplace(joined[i].symbol, joined[i].day).second);
    EXPECT_TRUE(std::isfinite(joined[i].score));
    EXPECT_TRUE(std::isfinite(joined[i].realized_return));
    // Last duplicate wins.
    EXPECT_DOUBLE_EQ(joined[i].score - std::floor(joined[i].score), 0.5);
    if (i > 0) {
      const auto& a = joined[i - 1];
      const auto& b = joined[i];
      EXPECT_TRUE(a.day < b.day || (a.day == b.day && a.symbol < b.symbol));
    }
  }
}

TEST(AlignScoresToReturns, InputsAreNotModified) {
  const std::vector<MarketBar> market = {
      Bar("B", kD2, 2.0), Bar("B", kD1, 1.0), Bar("A", kD2, 4.0), Bar("A", kD1, 2.0),
  };
  const std::vector<ScoreObservation> scores = {
      Score("B", kD2, 1.0), Score("A", kD2, -1.0),
  };
  const auto market_copy = market;
  const auto scores_copy = scores;

  (void)AlignScoresToReturns(scores, market);

  ASSERT_EQ(market.size(), market_copy.size());
  for (std::size_t i = 0; i < market.size(); ++i) {
    EXPECT_EQ(market[i].symbol, market_copy[i].symbol);
    EXPECT_EQ(market[i].day, market_copy[i].day);
  }
  EXPECT_EQ(scores[0].symbol, scores_copy[0].symbol);
}
