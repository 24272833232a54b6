#pragma once

#include <cstdint>
#include <span>
#include <string>

#include <nlohmann/json.hpp>

#include "xsbt/config.hpp"
#include "xsbt/portfolio_constructor.hpp"
#include "xsbt/types.hpp"

namespace xsbt {

// Trading days per year used to annualize the Sharpe ratio.
inline constexpr double kTradingDaysPerYear = 252.0;

// Summary of one run. Metrics whose preconditions fail are quiet NaN:
//   vol_daily, sharpe_252 : need >= 2 days (and nonzero vol for sharpe)
//   max_drawdown, total_return, best_day, worst_day : need >= 1 day
// Callers must check with std::isnan before use.
struct Metrics {
  uint64_t n_days = 0;

  double mean_daily   = 0.0;
  double vol_daily    = 0.0;
  double sharpe_252   = 0.0;
  double max_drawdown = 0.0;

  double total_return = 0.0;  // final equity - 1
  double best_day     = 0.0;
  double worst_day    = 0.0;
  double mean_turnover = 0.0;  // mean of the daily summed turnover

  uint64_t up_days   = 0;
  uint64_t down_days = 0;
  uint64_t flat_days = 0;

  // Construction outcome counts.
  uint64_t traded_days  = 0;
  uint64_t thin_days    = 0;
  uint64_t overlap_days = 0;

  // Echo of the configuration that produced these numbers.
  std::string run_id;
  PolicyKind policy = PolicyKind::QuantileLongShort;
  double fee_bps = 0.0;
  double long_quantile = 0.0;
  double short_quantile = 0.0;
  int min_cross_section = 0;
};

// Arithmetic mean of the finite values; NaN if there are none.
double MeanFinite(std::span<const double> xs);

// Sample standard deviation (N - 1) of the finite values; NaN if < 2.
double SampleStdDev(std::span<const double> xs);

// (mean / std) * sqrt(252); NaN if < 2 values or std is zero / NaN.
double AnnualizedSharpe(std::span<const double> daily_pnl);

// min over t of equity(t) / max_{s<=t} equity(s) - 1; NaN if empty.
double MaxDrawdown(std::span<const double> equity);

// Summarize a daily series produced under `cfg`.
Metrics Summarize(std::span<const DailyPnlRow> daily,
                  const BacktestConfig& cfg,
                  const ConstructionStats& construction = {});

// JSON record of the metrics. NaN values are written as null.
nlohmann::json MetricsToJson(const Metrics& m);

}  // namespace xsbt
