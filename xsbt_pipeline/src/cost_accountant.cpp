// xsbt_pipeline/src/cost_accountant.cpp
#include "xsbt/cost_accountant.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "xsbt/errors.hpp"

namespace xsbt {

CostAccountant::CostAccountant(double fee_bps)
    : fee_bps_(fee_bps), fee_rate_(fee_bps / 1e4) {
  if (!std::isfinite(fee_bps_) || fee_bps_ < 0.0) {
    throw ConfigError("fee_bps must be finite and >= 0, got " +
                      std::to_string(fee_bps_));
  }
}

std::vector<CostedPosition> CostAccountant::Apply(
    std::span<const Position> positions) const {
  std::vector<CostedPosition> out;
  out.reserve(positions.size());

  // Last weight seen per symbol. Absent => flat.
  std::unordered_map<std::string, double> last_weight;
  last_weight.reserve(positions.size() / 8 + 1);

  uint32_t prev_day = 0;
  for (const Position& p : positions) {
    if (p.day < prev_day) {
      throw std::invalid_argument("positions are not ordered by day");
    }
    prev_day = p.day;

    auto it = last_weight.try_emplace(p.symbol, 0.0).first;

    CostedPosition c;
    c.symbol      = p.symbol;
    c.day         = p.day;
    c.weight      = p.weight;
    c.prev_weight = it->second;
    c.turnover    = std::abs(c.weight - c.prev_weight);
    c.cost        = fee_rate_ * c.turnover;
    out.push_back(std::move(c));

    it->second = p.weight;
  }
  return out;
}

}  // namespace xsbt
