// xsbt_pipeline/src/config.cpp
#include "xsbt/config.hpp"

#include <cmath>
#include <fstream>
#include <string>

#include "xsbt/errors.hpp"

using nlohmann::json;

namespace xsbt {

namespace {

bool InUnitInterval(double q) {
  return std::isfinite(q) && q > 0.0 && q <= 1.0;
}

}  // namespace

BacktestConfig DefaultBacktestConfig() {
  return BacktestConfig{};
}

std::string_view PolicyName(PolicyKind kind) {
  switch (kind) {
    case PolicyKind::QuantileLongShort:
      return "quantile_ls";
    case PolicyKind::Sign:
      return "sign";
  }
  return "unknown";
}

PolicyKind ParsePolicyName(std::string_view name) {
  if (name == "quantile_ls") return PolicyKind::QuantileLongShort;
  if (name == "sign") return PolicyKind::Sign;
  throw ConfigError("unknown policy '" + std::string(name) +
                    "' (expected quantile_ls or sign)");
}

void ValidateConfig(const BacktestConfig& cfg) {
  if (cfg.policy == PolicyKind::QuantileLongShort) {
    if (!InUnitInterval(cfg.long_quantile)) {
      throw ConfigError("long_quantile must lie in (0, 1], got " +
                        std::to_string(cfg.long_quantile));
    }
    if (!InUnitInterval(cfg.short_quantile)) {
      throw ConfigError("short_quantile must lie in (0, 1], got " +
                        std::to_string(cfg.short_quantile));
    }
    if (cfg.min_cross_section < 1) {
      throw ConfigError("min_cross_section must be >= 1, got " +
                        std::to_string(cfg.min_cross_section));
    }
  }
  if (!std::isfinite(cfg.fee_bps) || cfg.fee_bps < 0.0) {
    throw ConfigError("fee_bps must be finite and >= 0, got " +
                      std::to_string(cfg.fee_bps));
  }
  if (cfg.workers < 1) {
    throw ConfigError("workers must be >= 1, got " +
                      std::to_string(cfg.workers));
  }
}

// Fields it reads (defaults from BacktestConfig in config.hpp):
//   - policy            : "quantile_ls" or "sign"
//   - long_quantile     : long bucket fraction
//   - short_quantile    : short bucket fraction
//   - min_cross_section : thin-day threshold
//   - fee_bps           : cost per unit turnover
//   - run_id            : echoed into metrics
//   - workers           : construction threads
//   - verbose           : stage summaries on stdout
BacktestConfig BacktestConfigFromJson(const json& j) {
  if (!j.is_object()) {
    throw ConfigError("top-level JSON value must be an object");
  }

  BacktestConfig cfg = DefaultBacktestConfig();
  try {
    if (j.contains("policy")) {
      cfg.policy = ParsePolicyName(j.at("policy").get<std::string>());
    }
    cfg.long_quantile     = j.value("long_quantile", cfg.long_quantile);
    cfg.short_quantile    = j.value("short_quantile", cfg.short_quantile);
    cfg.min_cross_section = j.value("min_cross_section", cfg.min_cross_section);
    cfg.fee_bps           = j.value("fee_bps", cfg.fee_bps);
    cfg.run_id            = j.value("run_id", cfg.run_id);
    cfg.workers           = j.value("workers", cfg.workers);
    cfg.verbose           = j.value("verbose", cfg.verbose);
  } catch (const json::exception& e) {
    throw ConfigError(std::string("bad field type: ") + e.what());
  }
  return cfg;
}

BacktestConfig LoadBacktestConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("failed to open backtest config: " + path);
  }

  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    throw ConfigError("failed to parse " + path + ": " + e.what());
  }

  BacktestConfig cfg = BacktestConfigFromJson(j);
  ValidateConfig(cfg);
  return cfg;
}

json BacktestConfigToJson(const BacktestConfig& cfg) {
  json j;
  j["policy"]            = std::string(PolicyName(cfg.policy));
  j["long_quantile"]     = cfg.long_quantile;
  j["short_quantile"]    = cfg.short_quantile;
  j["min_cross_section"] = cfg.min_cross_section;
  j["fee_bps"]           = cfg.fee_bps;
  j["run_id"]            = cfg.run_id;
  j["workers"]           = cfg.workers;
  j["verbose"]           = cfg.verbose;
  return j;
}

}  // namespace xsbt
