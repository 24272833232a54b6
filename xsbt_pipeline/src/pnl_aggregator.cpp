// xsbt_pipeline/src/pnl_aggregator.cpp
#include "xsbt/pnl_aggregator.hpp"

#include <cassert>
#include <cmath>
#include <stdexcept>
#include <string>

#include "xsbt/time_utils.hpp"

namespace xsbt {

std::vector<SymbolPnl> BookSymbolPnl(std::span<const JoinedObservation> joined,
                                     std::span<const CostedPosition> costed) {
  if (joined.size() != costed.size()) {
    throw std::invalid_argument("joined and costed rows differ in length");
  }

  std::vector<SymbolPnl> out;
  out.reserve(joined.size());
  for (std::size_t i = 0; i < joined.size(); ++i) {
    const JoinedObservation& j = joined[i];
    const CostedPosition& c = costed[i];
    if (j.day != c.day || j.symbol != c.symbol) {
      throw std::invalid_argument("joined and costed rows are not aligned at " +
                                  j.symbol + " " + day_to_string(j.day));
    }

    SymbolPnl s;
    s.symbol          = j.symbol;
    s.day             = j.day;
    s.prev_weight     = c.prev_weight;
    s.realized_return = j.realized_return;
    s.turnover        = c.turnover;
    s.cost            = c.cost;
    // Position held through the bar earns that bar's return.
    s.pnl = c.prev_weight * j.realized_return - c.cost;
    out.push_back(std::move(s));
  }
  return out;
}

void PnLAggregator::StartRun(DailyAggregation aggregation) {
  aggregation_ = aggregation;
  daily_rows_.clear();
  current_day_      = 0;
  day_count_        = 0;
  day_gross_sum_    = 0.0;
  day_cost_sum_     = 0.0;
  day_turnover_sum_ = 0.0;
  day_pnl_sum_      = 0.0;
  equity_           = 1.0;

  CheckInvariants();
}

void PnLAggregator::OnSymbolPnl(const SymbolPnl& row) {
  CheckInvariants();

  if (row.day == 0) {
    throw std::invalid_argument("symbol pnl row without a day: " + row.symbol);
  }

  if (!daily_rows_.empty() && row.day <= daily_rows_.back().day) {
    throw std::logic_error("pnl row for " + day_to_string(row.day) +
                           " arrived after that day was closed");
  }

  if (current_day_ == 0) {
    // No open day.
    current_day_ = row.day;
  } else if (row.day < current_day_) {
    throw std::logic_error("pnl rows out of day order: " +
                           day_to_string(row.day) + " after " +
                           day_to_string(current_day_));
  } else if (row.day != current_day_) {
    FlushCurrentDay();
    current_day_ = row.day;
  }

  ++day_count_;
  day_gross_sum_    += row.prev_weight * row.realized_return;
  day_cost_sum_     += row.cost;
  day_turnover_sum_ += row.turnover;
  day_pnl_sum_      += row.pnl;

  CheckInvariants();
}

void PnLAggregator::FlushCurrentDay() {
  if (current_day_ == 0 || day_count_ == 0) {
    return;
  }

  const double n = static_cast<double>(day_count_);
  const bool mean = (aggregation_ == DailyAggregation::Mean);

  DailyPnlRow row;
  row.day         = current_day_;
  row.num_symbols = day_count_;
  row.gross_pnl   = mean ? day_gross_sum_ / n : day_gross_sum_;
  row.cost        = mean ? day_cost_sum_ / n : day_cost_sum_;
  row.turnover    = day_turnover_sum_;
  row.pnl         = mean ? day_pnl_sum_ / n : day_pnl_sum_;

  // Compounding is a left fold over ascending days.
  equity_    = equity_ * (1.0 + row.pnl);
  row.equity = equity_;

  daily_rows_.push_back(row);

  // Reset per-day state; the next row opens a new day.
  current_day_      = 0;
  day_count_        = 0;
  day_gross_sum_    = 0.0;
  day_cost_sum_     = 0.0;
  day_turnover_sum_ = 0.0;
  day_pnl_sum_      = 0.0;

  CheckInvariants();
}

const std::vector<DailyPnlRow>& PnLAggregator::Finalize() {
  FlushCurrentDay();
  CheckInvariants();
  return daily_rows_;
}

void PnLAggregator::CheckInvariants() const {
#ifndef NDEBUG
  // Invariant 1: open sums belong to an open day.
  if (day_count_ > 0) {
    assert(current_day_ != 0);
  }

  // Invariant 2: with no rows booked for the open day, its sums are zero.
  if (day_count_ == 0) {
    assert(day_gross_sum_ == 0.0);
    assert(day_cost_sum_ == 0.0);
    assert(day_turnover_sum_ == 0.0);
    assert(day_pnl_sum_ == 0.0);
  }

  // Invariant 3: daily_rows_ is strictly increasing in day.
  uint32_t prev_day = 0;
  for (const auto& row : daily_rows_) {
    assert(row.day > prev_day);
    assert(row.num_symbols > 0);
    assert(row.turnover >= 0.0);
    prev_day = row.day;
  }

  // Invariant 4: an open day comes after every flushed day.
  if (!daily_rows_.empty() && current_day_ != 0) {
    assert(current_day_ > daily_rows_.back().day);
  }
#endif
}

std::vector<DailyPnlRow> AggregateDailyPnl(std::span<const SymbolPnl> rows,
                                           DailyAggregation aggregation) {
  PnLAggregator agg;
  agg.StartRun(aggregation);
  for (const SymbolPnl& r : rows) {
    agg.OnSymbolPnl(r);
  }
  return agg.Finalize();
}

}  // namespace xsbt
