#pragma once

#include <span>
#include <vector>

#include "xsbt/types.hpp"

namespace xsbt {

// Linear, direction-symmetric transaction costs on position changes.
//
// Each symbol's previous weight is the weight it was assigned on its
// previous appearance in `positions`, and 0 on its first appearance.
// turnover = |weight - prev_weight|, cost = fee_rate * turnover.
class CostAccountant {
public:
  // Throws ConfigError if fee_bps is negative or not finite.
  explicit CostAccountant(double fee_bps);

  // `positions` must be ordered by day ascending (any symbol order within a
  // day). Output is index-aligned with `positions`.
  std::vector<CostedPosition> Apply(std::span<const Position> positions) const;

  double fee_bps() const { return fee_bps_; }
  double fee_rate() const { return fee_rate_; }

private:
  double fee_bps_;
  double fee_rate_;  // fee_bps / 1e4
};

}  // namespace xsbt
