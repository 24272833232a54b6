#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <thread>

namespace xsbt {

enum class PolicyKind {
  QuantileLongShort = 0,  // dollar-neutral top/bottom quantile book
  Sign              = 1   // weight = sign(score), unnormalized
};

// How per-symbol pnl is combined into one portfolio return per day.
enum class DailyAggregation {
  Sum  = 0,  // weights already form a normalized book
  Mean = 1   // average over the symbols booked that day
};

// Worker threads used when a config does not name a count:
// the machine's hardware concurrency, at least 1.
inline int DefaultWorkerCount() {
  const unsigned hw = std::thread::hardware_concurrency();
  return hw == 0 ? 1 : static_cast<int>(hw);
}

// High-level knobs for one backtest run.
// These are loaded from a flat JSON file by LoadBacktestConfig.
struct BacktestConfig {
  PolicyKind policy = PolicyKind::QuantileLongShort;

  // Fraction of the ranked cross-section held long / short.
  // Only used by the quantile policy. Must lie in (0, 1].
  double long_quantile  = 0.1;
  double short_quantile = 0.1;

  // Days with fewer joined rows than this are sat out (all weights 0).
  // Only used by the quantile policy.
  int min_cross_section = 20;

  // Linear transaction cost per unit of turnover, in basis points.
  double fee_bps = 1.0;

  // Identifier echoed into the metrics record.
  std::string run_id;

  // Threads used for per-day portfolio construction.
  int workers = DefaultWorkerCount();

  // Print stage summaries to stdout.
  bool verbose = false;

  double fee_rate() const { return fee_bps / 1e4; }
};

// Same as BacktestConfig{}; kept as the named entry point used by loaders.
BacktestConfig DefaultBacktestConfig();

// Throws ConfigError if any parameter is out of range.
void ValidateConfig(const BacktestConfig& cfg);

// Parse a config from JSON. Missing keys keep their defaults.
BacktestConfig BacktestConfigFromJson(const nlohmann::json& j);

// Load and validate a config from a JSON file.
BacktestConfig LoadBacktestConfig(const std::string& path);

// Serialize every field, including run_id and workers.
nlohmann::json BacktestConfigToJson(const BacktestConfig& cfg);

// "quantile_ls" / "sign"
std::string_view PolicyName(PolicyKind kind);
PolicyKind ParsePolicyName(std::string_view name);

}  // namespace xsbt
