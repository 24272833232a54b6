// xsbt_pipeline/src/alignment_joiner.cpp
//
// Turns the two external streams into one typed, de-duplicated table of
// (symbol, day, score, realized_return) rows.

#include "xsbt/alignment_joiner.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <ranges>

namespace rng = std::ranges;

namespace xsbt {

namespace {

// Keep-last de-duplication shared by both row types.
//
// A stable sort on (symbol, day) keeps equal keys in input order, so the
// last element of each run of equal keys is the last occurrence.
template <class Row>
std::vector<Row> DedupeLastImpl(std::span<const Row> rows) {
  std::vector<std::size_t> order(rows.size());
  std::iota(order.begin(), order.end(), std::size_t{0});

  std::stable_sort(order.begin(), order.end(),
                   [&](std::size_t a, std::size_t b) {
                     const Row& ra = rows[a];
                     const Row& rb = rows[b];
                     if (ra.symbol != rb.symbol) return ra.symbol < rb.symbol;
                     return ra.day < rb.day;
                   });

  std::vector<Row> out;
  out.reserve(rows.size());
  for (std::size_t i = 0; i < order.size(); ++i) {
    const Row& r = rows[order[i]];
    const bool last_of_key =
        (i + 1 == order.size()) || rows[order[i + 1]].symbol != r.symbol ||
        rows[order[i + 1]].day != r.day;
    if (last_of_key) out.push_back(r);
  }
  return out;
}

}  // namespace

std::vector<ScoreObservation> DedupeLast(
    std::span<const ScoreObservation> rows) {
  return DedupeLastImpl(rows);
}

std::vector<MarketBar> DedupeLast(std::span<const MarketBar> rows) {
  return DedupeLastImpl(rows);
}

std::vector<ReturnObservation> ComputeRealizedReturns(
    std::span<const MarketBar> bars) {
  const std::vector<MarketBar> unique = DedupeLast(bars);

  std::vector<ReturnObservation> out;
  out.reserve(unique.size());

  const MarketBar* prev = nullptr;
  for (const MarketBar& bar : unique) {
    if (!std::isfinite(bar.close) || bar.close <= 0.0) {
      continue;
    }
    // Rows are grouped by symbol; a new symbol starts a new price series.
    if (prev != nullptr && prev->symbol == bar.symbol) {
      ReturnObservation r;
      r.symbol          = bar.symbol;
      r.day             = bar.day;
      r.realized_return = bar.close / prev->close - 1.0;
      out.push_back(std::move(r));
    }
    prev = &bar;
  }
  return out;
}

std::vector<JoinedObservation> AlignScoresToReturns(
    std::span<const ScoreObservation> scores,
    std::span<const MarketBar> market,
    AlignmentStats* stats) {
  const std::vector<ScoreObservation> unique_scores = DedupeLast(scores);
  const std::vector<ReturnObservation> returns = ComputeRealizedReturns(market);

  // Both sides are sorted by (symbol, day): merge-join them.
  std::vector<JoinedObservation> joined;
  joined.reserve(std::min(unique_scores.size(), returns.size()));

  auto s_it = unique_scores.begin();
  auto r_it = returns.begin();
  while (s_it != unique_scores.end() && r_it != returns.end()) {
    if (s_it->symbol < r_it->symbol ||
        (s_it->symbol == r_it->symbol && s_it->day < r_it->day)) {
      ++s_it;
      continue;
    }
    if (r_it->symbol < s_it->symbol ||
        (r_it->symbol == s_it->symbol && r_it->day < s_it->day)) {
      ++r_it;
      continue;
    }

    if (std::isfinite(s_it->score)) {
      JoinedObservation j;
      j.symbol          = s_it->symbol;
      j.day             = s_it->day;
      j.score           = s_it->score;
      j.realized_return = r_it->realized_return;
      joined.push_back(std::move(j));
    }
    ++s_it;
    ++r_it;
  }

  // Re-key by (day, symbol) so each day's cross-section is contiguous.
  rng::sort(joined, [](const JoinedObservation& a, const JoinedObservation& b) {
    if (a.day != b.day) return a.day < b.day;
    return a.symbol < b.symbol;
  });

  if (stats != nullptr) {
    stats->score_rows_in      = scores.size();
    stats->score_rows_unique  = unique_scores.size();
    stats->score_rows_dropped = static_cast<uint64_t>(rng::count_if(
        unique_scores,
        [](const ScoreObservation& s) { return !std::isfinite(s.score); }));
    stats->market_rows_in     = market.size();
    stats->return_rows        = returns.size();
    stats->joined_rows        = joined.size();

    uint64_t days = 0;
    for (std::size_t i = 0; i < joined.size(); ++i) {
      if (i == 0 || joined[i].day != joined[i - 1].day) ++days;
    }
    stats->distinct_days = days;
  }
  return joined;
}

}  // namespace xsbt
