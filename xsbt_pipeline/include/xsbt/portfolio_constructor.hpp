#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "xsbt/config.hpp"
#include "xsbt/types.hpp"

namespace xsbt {

// One day's contiguous block of joined rows.
struct CrossSection {
  uint32_t day = 0;
  std::size_t offset = 0;  // index of the first row in the joined table
  std::span<const JoinedObservation> rows;
};

// Split a joined table sorted by (day, symbol) into per-day cross-sections.
std::vector<CrossSection> SplitByDay(std::span<const JoinedObservation> joined);

enum class DayOutcome {
  Traded  = 0,  // weights assigned by the policy
  Thin    = 1,  // cross-section below min_cross_section: all weights 0
  Overlap = 2   // long and short buckets would share symbols: all weights 0
};

// Weights for one cross-section, index-aligned with its rows.
struct DayWeights {
  std::vector<double> weights;
  DayOutcome outcome = DayOutcome::Traded;
};

// --- Policy-like concept --------------------------------------------------

// Any type P that maps one day's rows to weights and names its daily
// aggregation qualifies as a policy.
template <class P>
concept PolicyLike =
  requires(const P p, std::span<const JoinedObservation> rows) {
    { p.Assign(rows) } -> std::same_as<DayWeights>;
    { p.aggregation() } -> std::same_as<DailyAggregation>;
    { p.kind() } -> std::same_as<PolicyKind>;
  };

// Policy interface. Implementations must be pure functions of the rows they
// are given: no state may carry over from one day to the next.
class PortfolioPolicy {
public:
  virtual ~PortfolioPolicy() = default;

  virtual DayWeights Assign(std::span<const JoinedObservation> rows) const = 0;
  virtual DailyAggregation aggregation() const = 0;
  virtual PolicyKind kind() const = 0;
};

// Dollar-neutral long/short book on the ranked cross-section.
//
// Rows are ranked by score ascending, ties broken by symbol ascending.
// k_short = max(1, floor(short_quantile * n)) lowest rows get -1/k_short,
// k_long  = max(1, floor(long_quantile * n)) highest rows get +1/k_long.
// Days with n < min_cross_section, or with k_short + k_long > n, are sat
// out with all-zero weights.
// Scores must be finite (AlignScoresToReturns guarantees it); a traded day
// with a non-finite score throws std::invalid_argument.
class QuantileLongShortPolicy final : public PortfolioPolicy {
public:
  QuantileLongShortPolicy(double long_quantile,
                          double short_quantile,
                          int min_cross_section);
  explicit QuantileLongShortPolicy(const BacktestConfig& cfg);

  DayWeights Assign(std::span<const JoinedObservation> rows) const override;
  DailyAggregation aggregation() const override { return DailyAggregation::Sum; }
  PolicyKind kind() const override { return PolicyKind::QuantileLongShort; }

  double long_quantile() const { return long_quantile_; }
  double short_quantile() const { return short_quantile_; }
  int min_cross_section() const { return min_cross_section_; }

private:
  double long_quantile_;
  double short_quantile_;
  int    min_cross_section_;
};

// weight = sign(score) for every row, no normalization across the day.
// A NaN score gets weight 0.
class SignPolicy final : public PortfolioPolicy {
public:
  SignPolicy() = default;
  explicit SignPolicy(const BacktestConfig&) {}

  DayWeights Assign(std::span<const JoinedObservation> rows) const override;
  DailyAggregation aggregation() const override { return DailyAggregation::Mean; }
  PolicyKind kind() const override { return PolicyKind::Sign; }
};

static_assert(PolicyLike<QuantileLongShortPolicy>);
static_assert(PolicyLike<SignPolicy>);

struct ConstructionStats {
  uint64_t days            = 0;
  uint64_t traded_days     = 0;
  uint64_t thin_days       = 0;
  uint64_t overlap_days    = 0;
  uint64_t long_positions  = 0;
  uint64_t short_positions = 0;
};

// Evaluate the policy on every day of a joined table sorted by (day, symbol).
// Days are spread over `workers` threads; each day writes only its own slots,
// so the result does not depend on the worker count.
// Returns one Position per joined row, index-aligned with `joined`.
std::vector<Position> ConstructPositions(const PortfolioPolicy& policy,
                                         std::span<const JoinedObservation> joined,
                                         int workers = 1,
                                         ConstructionStats* stats = nullptr);

}  // namespace xsbt
