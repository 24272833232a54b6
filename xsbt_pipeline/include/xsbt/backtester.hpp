#pragma once

#include <concepts>
#include <iosfwd>
#include <span>
#include <vector>

#include "xsbt/alignment_joiner.hpp"
#include "xsbt/config.hpp"
#include "xsbt/cost_accountant.hpp"
#include "xsbt/performance_summarizer.hpp"
#include "xsbt/pnl_aggregator.hpp"
#include "xsbt/portfolio_constructor.hpp"
#include "xsbt/timing.hpp"
#include "xsbt/types.hpp"

namespace arrow {
class Table;
}  // namespace arrow

namespace xsbt {

// Everything one run produces. Built once, never updated.
struct BacktestResult {
  std::vector<DailyPnlRow> daily;  // ascending by day
  Metrics metrics;
  AlignmentStats alignment;
  ConstructionStats construction;
  std::vector<TimingEntry> stage_timings;  // this run's stages, in order
};

// Print the "=== backtest ===" summary block for a finished run.
void PrintRunSummary(std::ostream& out, const BacktestResult& result);

// Main backtest engine.
//
// Given:
//   - a BacktestConfig (policy parameters + fee)
//   - predictions and market bars
//
// It runs the stages in order:
//   align -> construct -> cost -> book/aggregate -> summarize
// Every stage returns fresh vectors; the inputs are only read.
template <PolicyLike P>
  requires std::derived_from<P, PortfolioPolicy>
class Backtester {
public:
  explicit Backtester(const BacktestConfig& cfg)
      : cfg_(cfg), policy_(cfg), costs_(cfg.fee_bps) {}

  BacktestResult Run(std::span<const ScoreObservation> scores,
                     std::span<const MarketBar> market) const;

  const P& policy() const { return policy_; }

private:
  BacktestConfig cfg_;
  P              policy_;  // concrete policy, stored by value
  CostAccountant costs_;
};

template <PolicyLike P>
  requires std::derived_from<P, PortfolioPolicy>
BacktestResult Backtester<P>::Run(std::span<const ScoreObservation> scores,
                                  std::span<const MarketBar> market) const {
  BacktestResult result;
  StageTimings timings;

  std::vector<JoinedObservation> joined;
  {
    XSBT_SCOPE_TIMER(timings, "align_scores_to_returns");
    joined = AlignScoresToReturns(scores, market, &result.alignment);
  }

  std::vector<Position> positions;
  {
    XSBT_SCOPE_TIMER(timings, "construct_positions");
    positions = ConstructPositions(policy_, joined, cfg_.workers,
                                   &result.construction);
  }

  std::vector<CostedPosition> costed;
  {
    XSBT_SCOPE_TIMER(timings, "apply_costs");
    costed = costs_.Apply(positions);
  }

  {
    XSBT_SCOPE_TIMER(timings, "aggregate_pnl");
    const std::vector<SymbolPnl> booked = BookSymbolPnl(joined, costed);
    result.daily = AggregateDailyPnl(booked, policy_.aggregation());
  }

  {
    XSBT_SCOPE_TIMER(timings, "summarize");
    result.metrics = Summarize(result.daily, cfg_, result.construction);
  }

  result.stage_timings = timings.Release();
  return result;
}

// Pick the policy named in `cfg`, validate the config and run.
// Prints the run summary to stdout when cfg.verbose is set.
BacktestResult RunBacktest(std::span<const ScoreObservation> scores,
                           std::span<const MarketBar> market,
                           const BacktestConfig& cfg);

// Same, starting from the two external tables. Throws InputShapeError
// before any computation if required columns are missing.
BacktestResult RunBacktest(const arrow::Table& predictions,
                           const arrow::Table& market,
                           const BacktestConfig& cfg);

}  // namespace xsbt
