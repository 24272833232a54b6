#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "xsbt/types.hpp"

namespace xsbt {

// De-duplicate to one row per (symbol, day). When a key repeats, the LAST
// occurrence in input order wins. Output is sorted by (symbol, day).
std::vector<ScoreObservation> DedupeLast(std::span<const ScoreObservation> rows);
std::vector<MarketBar> DedupeLast(std::span<const MarketBar> rows);

// Close-to-close returns per symbol, each symbol's bars taken in day order.
// The first usable bar of every symbol has no return and produces no row.
// Bars whose close is non-finite or <= 0 carry no price and are skipped.
// Input is de-duplicated first; output is sorted by (symbol, day).
std::vector<ReturnObservation> ComputeRealizedReturns(
    std::span<const MarketBar> bars);

// Counters describing one alignment pass.
struct AlignmentStats {
  uint64_t score_rows_in       = 0;
  uint64_t score_rows_unique   = 0;
  uint64_t score_rows_dropped  = 0;  // non-finite score
  uint64_t market_rows_in      = 0;
  uint64_t return_rows         = 0;
  uint64_t joined_rows         = 0;
  uint64_t distinct_days       = 0;
};

// Inner join of de-duplicated scores to realized returns on exact
// (symbol, day). Rows missing either field are excluded.
// Output is sorted by (day, symbol) so each day's cross-section is a
// contiguous range.
std::vector<JoinedObservation> AlignScoresToReturns(
    std::span<const ScoreObservation> scores,
    std::span<const MarketBar> market,
    AlignmentStats* stats = nullptr);

}  // namespace xsbt
