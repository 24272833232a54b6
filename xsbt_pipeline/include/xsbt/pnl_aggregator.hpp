#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "xsbt/config.hpp"
#include "xsbt/types.hpp"

namespace xsbt {

// Book per-symbol pnl from the weight HELD INTO each day:
//   pnl = prev_weight * realized_return - cost
// The weight decided on a day never touches that same day's return.
// `joined` and `costed` must be index-aligned (same symbol and day per row).
std::vector<SymbolPnl> BookSymbolPnl(std::span<const JoinedObservation> joined,
                                     std::span<const CostedPosition> costed);

// Aggregates per-symbol pnl into daily rows and compounds the equity curve.
//
// Rows must arrive in ascending day order. Each day is closed when the first
// row of a later day arrives (or on Finalize), producing one DailyPnlRow:
//   Sum  : pnl = sum of the day's per-symbol pnl
//   Mean : pnl = mean of the day's per-symbol pnl
// equity = previous equity * (1 + pnl), with the curve anchored at 1.0
// before the first day. Days without rows produce no row.
class PnLAggregator {
public:
  PnLAggregator() = default;

  void StartRun(DailyAggregation aggregation);
  void OnSymbolPnl(const SymbolPnl& row);
  const std::vector<DailyPnlRow>& Finalize();

  const std::vector<DailyPnlRow>& daily_rows() const { return daily_rows_; }

private:
  void FlushCurrentDay();
  void CheckInvariants() const;

  DailyAggregation aggregation_ = DailyAggregation::Sum;

  std::vector<DailyPnlRow> daily_rows_;

  uint32_t current_day_      = 0;
  uint64_t day_count_        = 0;
  double   day_gross_sum_    = 0.0;
  double   day_cost_sum_     = 0.0;
  double   day_turnover_sum_ = 0.0;
  double   day_pnl_sum_      = 0.0;
  double   equity_           = 1.0;
};

// Convenience: book and aggregate a whole run in one call.
std::vector<DailyPnlRow> AggregateDailyPnl(std::span<const SymbolPnl> rows,
                                           DailyAggregation aggregation);

}  // namespace xsbt
