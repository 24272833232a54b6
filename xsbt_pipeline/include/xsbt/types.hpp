#pragma once
#include <cstdint>
#include <string>

namespace xsbt {

// Calendar days are carried as YYYYMMDD integers (see time_utils.hpp).

// One model output row: score for a symbol as of a trading day.
struct ScoreObservation {
  std::string symbol;
  uint32_t day = 0;
  double score = 0.0;
};

// One market row. Only the close is used by the backtest.
struct MarketBar {
  std::string symbol;
  uint32_t day = 0;
  double close = 0.0;
};

// Close-to-close return into `day` from the symbol's previous bar.
struct ReturnObservation {
  std::string symbol;
  uint32_t day = 0;
  double realized_return = 0.0;
};

// Inner join of a score and a realized return on (symbol, day).
struct JoinedObservation {
  std::string symbol;
  uint32_t day = 0;
  double score = 0.0;
  double realized_return = 0.0;
};

// Signed portfolio weight decided from the day's cross-section only.
struct Position {
  std::string symbol;
  uint32_t day = 0;
  double weight = 0.0;
};

// Position plus the turnover it implies relative to the symbol's last weight.
struct CostedPosition {
  std::string symbol;
  uint32_t day = 0;
  double weight = 0.0;       // weight decided on `day`
  double prev_weight = 0.0;  // weight held into `day` (0 on first appearance)
  double turnover = 0.0;     // |weight - prev_weight|
  double cost = 0.0;         // fee_rate * turnover, in return units
};

// Per-symbol booked pnl for one day.
struct SymbolPnl {
  std::string symbol;
  uint32_t day = 0;
  double prev_weight = 0.0;
  double realized_return = 0.0;
  double turnover = 0.0;
  double cost = 0.0;
  double pnl = 0.0;  // prev_weight * realized_return - cost
};

// One row of the daily series.
struct DailyPnlRow {
  uint32_t day = 0;
  uint64_t num_symbols = 0;  // rows booked on that day

  double gross_pnl = 0.0;  // aggregated prev_weight * realized_return
  double cost = 0.0;       // aggregated cost
  double turnover = 0.0;   // summed turnover across symbols

  double pnl = 0.0;     // gross_pnl - cost under the day's aggregation
  double equity = 0.0;  // cumulative product of (1 + pnl)
};

}  // namespace xsbt
