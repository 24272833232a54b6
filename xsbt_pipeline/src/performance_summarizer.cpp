// xsbt_pipeline/src/performance_summarizer.cpp
//
// Risk and return statistics over the daily pnl / equity series.

#include "xsbt/performance_summarizer.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <vector>

using nlohmann::json;

namespace xsbt {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

json NumberOrNull(double v) {
  if (std::isfinite(v)) return json(v);
  return json(nullptr);
}

}  // namespace

double MeanFinite(std::span<const double> xs) {
  double sum = 0.0;
  std::size_t n = 0;
  for (double x : xs) {
    if (!std::isfinite(x)) continue;
    sum += x;
    ++n;
  }
  if (n == 0) return kNaN;
  return sum / static_cast<double>(n);
}

double SampleStdDev(std::span<const double> xs) {
  std::vector<double> finite;
  finite.reserve(xs.size());
  std::copy_if(xs.begin(), xs.end(), std::back_inserter(finite),
               [](double x) { return std::isfinite(x); });
  if (finite.size() < 2) return kNaN;

  const double mean = MeanFinite(finite);
  double ss = 0.0;
  for (double x : finite) {
    const double d = x - mean;
    ss += d * d;
  }
  return std::sqrt(ss / static_cast<double>(finite.size() - 1));
}

double AnnualizedSharpe(std::span<const double> daily_pnl) {
  const double sd = SampleStdDev(daily_pnl);
  if (!std::isfinite(sd) || sd == 0.0) return kNaN;
  return (MeanFinite(daily_pnl) / sd) * std::sqrt(kTradingDaysPerYear);
}

double MaxDrawdown(std::span<const double> equity) {
  double peak = kNaN;
  double worst = kNaN;
  for (double e : equity) {
    if (!std::isfinite(e)) continue;
    peak = std::isnan(peak) ? e : std::max(peak, e);
    const double dd = e / peak - 1.0;
    worst = std::isnan(worst) ? dd : std::min(worst, dd);
  }
  return worst;
}

Metrics Summarize(std::span<const DailyPnlRow> daily,
                  const BacktestConfig& cfg,
                  const ConstructionStats& construction) {
  std::vector<double> pnl;
  std::vector<double> equity;
  std::vector<double> turnover;
  pnl.reserve(daily.size());
  equity.reserve(daily.size());
  turnover.reserve(daily.size());
  for (const auto& row : daily) {
    pnl.push_back(row.pnl);
    equity.push_back(row.equity);
    turnover.push_back(row.turnover);
  }

  Metrics m;
  m.n_days        = daily.size();
  m.mean_daily    = MeanFinite(pnl);
  m.vol_daily     = SampleStdDev(pnl);
  m.sharpe_252    = AnnualizedSharpe(pnl);
  m.max_drawdown  = MaxDrawdown(equity);
  m.total_return  = equity.empty() ? kNaN : equity.back() - 1.0;
  m.mean_turnover = MeanFinite(turnover);

  m.best_day  = kNaN;
  m.worst_day = kNaN;
  for (double x : pnl) {
    if (!std::isfinite(x)) continue;
    m.best_day  = std::isnan(m.best_day) ? x : std::max(m.best_day, x);
    m.worst_day = std::isnan(m.worst_day) ? x : std::min(m.worst_day, x);
    if (x > 0.0) {
      ++m.up_days;
    } else if (x < 0.0) {
      ++m.down_days;
    } else {
      ++m.flat_days;
    }
  }

  m.traded_days  = construction.traded_days;
  m.thin_days    = construction.thin_days;
  m.overlap_days = construction.overlap_days;

  m.run_id            = cfg.run_id;
  m.policy            = cfg.policy;
  m.fee_bps           = cfg.fee_bps;
  m.long_quantile     = cfg.long_quantile;
  m.short_quantile    = cfg.short_quantile;
  m.min_cross_section = cfg.min_cross_section;
  return m;
}

json MetricsToJson(const Metrics& m) {
  json j;
  j["run_id"]        = m.run_id;
  j["n_days"]        = m.n_days;
  j["mean_daily"]    = NumberOrNull(m.mean_daily);
  j["vol_daily"]     = NumberOrNull(m.vol_daily);
  j["sharpe_252"]    = NumberOrNull(m.sharpe_252);
  j["max_drawdown"]  = NumberOrNull(m.max_drawdown);
  j["total_return"]  = NumberOrNull(m.total_return);
  j["best_day"]      = NumberOrNull(m.best_day);
  j["worst_day"]     = NumberOrNull(m.worst_day);
  j["mean_turnover"] = NumberOrNull(m.mean_turnover);
  j["up_days"]       = m.up_days;
  j["down_days"]     = m.down_days;
  j["flat_days"]     = m.flat_days;
  j["traded_days"]   = m.traded_days;
  j["thin_days"]     = m.thin_days;
  j["overlap_days"]  = m.overlap_days;

  j["fee_bps"]     = m.fee_bps;
  j["policy_name"] = std::string(PolicyName(m.policy));
  // Quantile parameters only mean something for the quantile policy.
  if (m.policy == PolicyKind::QuantileLongShort) {
    j["long_quantile"]     = m.long_quantile;
    j["short_quantile"]    = m.short_quantile;
    j["min_cross_section"] = m.min_cross_section;
  }
  return j;
}

}  // namespace xsbt
