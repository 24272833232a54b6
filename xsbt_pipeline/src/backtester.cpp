// xsbt_pipeline/src/backtester.cpp
//
// Runtime policy dispatch and run reporting around xsbt::Backtester.

#include "xsbt/backtester.hpp"

#include <arrow/api.h>

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <ostream>

#include "xsbt/table_io.hpp"
#include "xsbt/time_utils.hpp"

namespace xsbt {

namespace {

void PrintMetric(std::ostream& out, const char* name, double v) {
  out << "  " << name << " = ";
  if (std::isnan(v)) {
    out << "undefined";
  } else {
    out << v;
  }
  out << "\n";
}

}  // namespace

void PrintRunSummary(std::ostream& out, const BacktestResult& result) {
  const AlignmentStats& a = result.alignment;
  const ConstructionStats& c = result.construction;
  const Metrics& m = result.metrics;

  const auto old_flags = out.flags();
  const auto old_prec  = out.precision();
  out << std::setprecision(8);

  out << "=== backtest ===\n";
  if (!m.run_id.empty()) out << "  run_id = " << m.run_id << "\n";
  out << "  policy = " << PolicyName(m.policy) << "\n";
  if (m.policy == PolicyKind::QuantileLongShort) {
    out << "  long_quantile = " << m.long_quantile << "\n";
    out << "  short_quantile = " << m.short_quantile << "\n";
    out << "  min_cross_section = " << m.min_cross_section << "\n";
  }
  out << "  fee_bps = " << m.fee_bps << "\n";

  out << "=== alignment ===\n";
  out << "  score_rows_in = " << a.score_rows_in << "\n";
  out << "  score_rows_unique = " << a.score_rows_unique << "\n";
  out << "  score_rows_dropped = " << a.score_rows_dropped << "\n";
  out << "  market_rows_in = " << a.market_rows_in << "\n";
  out << "  return_rows = " << a.return_rows << "\n";
  out << "  joined_rows = " << a.joined_rows << "\n";
  out << "  distinct_days = " << a.distinct_days << "\n";

  out << "=== construction ===\n";
  out << "  days = " << c.days << "\n";
  out << "  traded_days = " << c.traded_days << "\n";
  out << "  thin_days = " << c.thin_days << "\n";
  out << "  overlap_days = " << c.overlap_days << "\n";
  out << "  long_positions = " << c.long_positions << "\n";
  out << "  short_positions = " << c.short_positions << "\n";

  out << "=== summary ===\n";
  out << "  n_days = " << m.n_days << "\n";
  if (!result.daily.empty()) {
    out << "  first_day = " << day_to_string(result.daily.front().day) << "\n";
    out << "  last_day = " << day_to_string(result.daily.back().day) << "\n";
  }
  PrintMetric(out, "mean_daily", m.mean_daily);
  PrintMetric(out, "vol_daily", m.vol_daily);
  PrintMetric(out, "sharpe_252", m.sharpe_252);
  PrintMetric(out, "max_drawdown", m.max_drawdown);
  PrintMetric(out, "total_return", m.total_return);
  PrintMetric(out, "mean_turnover", m.mean_turnover);
  out << "  up/down/flat days = " << m.up_days << "/" << m.down_days << "/"
      << m.flat_days << "\n";

  if (!result.stage_timings.empty()) {
    out << "=== timing ===\n";
    for (const TimingEntry& e : result.stage_timings) {
      const std::chrono::duration<double, std::milli> ms = e.duration;
      out << "  " << e.name << " = " << ms.count() << " ms\n";
    }
  }

  out.flags(old_flags);
  out.precision(old_prec);
}

BacktestResult RunBacktest(std::span<const ScoreObservation> scores,
                           std::span<const MarketBar> market,
                           const BacktestConfig& cfg) {
  ValidateConfig(cfg);

  BacktestResult result;
  switch (cfg.policy) {
    case PolicyKind::QuantileLongShort:
      result = Backtester<QuantileLongShortPolicy>(cfg).Run(scores, market);
      break;
    case PolicyKind::Sign:
      result = Backtester<SignPolicy>(cfg).Run(scores, market);
      break;
  }

  if (result.construction.overlap_days > 0) {
    std::cerr << "Warning: " << result.construction.overlap_days
              << " day(s) sat out because long and short buckets overlapped;"
              << " raise min_cross_section or lower the quantiles\n";
  }
  if (cfg.verbose) {
    PrintRunSummary(std::cout, result);
  }
  return result;
}

BacktestResult RunBacktest(const arrow::Table& predictions,
                           const arrow::Table& market,
                           const BacktestConfig& cfg) {
  ValidateConfig(cfg);

  // Both tables are validated before any computation starts.
  StageTimings timings;
  std::vector<ScoreObservation> scores;
  std::vector<MarketBar> bars;
  {
    XSBT_SCOPE_TIMER(timings, "load_tables");
    scores = PredictionsFromTable(predictions);
    bars   = MarketFromTable(market);
  }

  BacktestResult result = RunBacktest(scores, bars, cfg);
  timings.Append(result.stage_timings);
  result.stage_timings = timings.Release();
  return result;
}

}  // namespace xsbt
