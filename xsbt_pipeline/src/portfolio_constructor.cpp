// xsbt_pipeline/src/portfolio_constructor.cpp
//
// Maps each day's cross-section of scores to signed weights.

#include "xsbt/portfolio_constructor.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <mutex>
#include <numeric>
#include <stdexcept>
#include <string>
#include <thread>

#include "xsbt/errors.hpp"

namespace xsbt {

std::vector<CrossSection> SplitByDay(std::span<const JoinedObservation> joined) {
  std::vector<CrossSection> days;
  std::size_t start = 0;
  for (std::size_t i = 1; i <= joined.size(); ++i) {
    if (i == joined.size() || joined[i].day != joined[start].day) {
      if (i < joined.size() && joined[i].day < joined[start].day) {
        throw std::invalid_argument("joined rows are not sorted by day");
      }
      CrossSection cs;
      cs.day    = joined[start].day;
      cs.offset = start;
      cs.rows   = joined.subspan(start, i - start);
      days.push_back(cs);
      start = i;
    }
  }
  return days;
}

// ------------------------- QuantileLongShortPolicy -------------------------

QuantileLongShortPolicy::QuantileLongShortPolicy(double long_quantile,
                                                 double short_quantile,
                                                 int min_cross_section)
    : long_quantile_(long_quantile),
      short_quantile_(short_quantile),
      min_cross_section_(min_cross_section) {
  if (!(long_quantile_ > 0.0 && long_quantile_ <= 1.0) ||
      !(short_quantile_ > 0.0 && short_quantile_ <= 1.0)) {
    throw ConfigError("quantiles must lie in (0, 1]");
  }
  if (min_cross_section_ < 1) {
    throw ConfigError("min_cross_section must be >= 1");
  }
}

QuantileLongShortPolicy::QuantileLongShortPolicy(const BacktestConfig& cfg)
    : QuantileLongShortPolicy(cfg.long_quantile, cfg.short_quantile,
                              cfg.min_cross_section) {}

DayWeights QuantileLongShortPolicy::Assign(
    std::span<const JoinedObservation> rows) const {
  const std::size_t n = rows.size();

  DayWeights out;
  out.weights.assign(n, 0.0);

  if (n < static_cast<std::size_t>(min_cross_section_)) {
    out.outcome = DayOutcome::Thin;
    return out;
  }

  const auto bucket = [n](double q) {
    const auto k = static_cast<std::size_t>(std::floor(q * static_cast<double>(n)));
    return std::max<std::size_t>(1, k);
  };
  const std::size_t k_short = bucket(short_quantile_);
  const std::size_t k_long  = bucket(long_quantile_);

  if (k_short + k_long > n) {
    out.outcome = DayOutcome::Overlap;
    return out;
  }

  // NaN has no rank; a comparator over it is not a strict weak order.
  for (const JoinedObservation& r : rows) {
    if (!std::isfinite(r.score)) {
      throw std::invalid_argument("non-finite score for " + r.symbol +
                                  " on day " + std::to_string(r.day));
    }
  }

  // Rank ascending by score; equal scores fall back to symbol order.
  std::vector<std::size_t> order(n);
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    if (rows[a].score != rows[b].score) return rows[a].score < rows[b].score;
    return rows[a].symbol < rows[b].symbol;
  });

  const double w_short = -1.0 / static_cast<double>(k_short);
  const double w_long  =  1.0 / static_cast<double>(k_long);
  for (std::size_t i = 0; i < k_short; ++i) {
    out.weights[order[i]] = w_short;
  }
  for (std::size_t i = 0; i < k_long; ++i) {
    out.weights[order[n - 1 - i]] = w_long;
  }
  out.outcome = DayOutcome::Traded;
  return out;
}

// ------------------------------ SignPolicy ---------------------------------

DayWeights SignPolicy::Assign(std::span<const JoinedObservation> rows) const {
  DayWeights out;
  out.weights.reserve(rows.size());
  for (const auto& r : rows) {
    out.weights.push_back(r.score > 0.0 ? 1.0 : (r.score < 0.0 ? -1.0 : 0.0));
  }
  out.outcome = DayOutcome::Traded;
  return out;
}

// --------------------------- ConstructPositions ----------------------------

std::vector<Position> ConstructPositions(const PortfolioPolicy& policy,
                                         std::span<const JoinedObservation> joined,
                                         int workers,
                                         ConstructionStats* stats) {
  const std::vector<CrossSection> days = SplitByDay(joined);

  std::vector<Position> positions(joined.size());
  std::vector<DayOutcome> outcomes(days.size(), DayOutcome::Traded);

  std::atomic<std::size_t> idx{0};
  std::mutex err_mu;
  std::exception_ptr first_error;

  auto worker = [&]() {
    while (true) {
      const std::size_t d = idx.fetch_add(1);
      if (d >= days.size()) break;
      try {
        const CrossSection& cs = days[d];
        DayWeights dw = policy.Assign(cs.rows);
        if (dw.weights.size() != cs.rows.size()) {
          throw std::logic_error("policy returned wrong number of weights");
        }
        for (std::size_t i = 0; i < cs.rows.size(); ++i) {
          Position& p = positions[cs.offset + i];
          p.symbol = cs.rows[i].symbol;
          p.day    = cs.day;
          p.weight = dw.weights[i];
        }
        outcomes[d] = dw.outcome;
      } catch (...) {
        std::lock_guard<std::mutex> lk(err_mu);
        if (!first_error) first_error = std::current_exception();
        idx.store(days.size());
      }
    }
  };

  const int W = std::max(1, std::min<int>(workers, static_cast<int>(days.size())));
  if (W <= 1) {
    worker();
  } else {
    std::vector<std::thread> pool;
    pool.reserve(static_cast<std::size_t>(W));
    for (int t = 0; t < W; ++t) pool.emplace_back(worker);
    for (auto& t : pool) t.join();
  }
  if (first_error) std::rethrow_exception(first_error);

  if (stats != nullptr) {
    ConstructionStats s;
    s.days = days.size();
    for (DayOutcome o : outcomes) {
      switch (o) {
        case DayOutcome::Traded:  ++s.traded_days;  break;
        case DayOutcome::Thin:    ++s.thin_days;    break;
        case DayOutcome::Overlap: ++s.overlap_days; break;
      }
    }
    for (const Position& p : positions) {
      if (p.weight > 0.0) ++s.long_positions;
      if (p.weight < 0.0) ++s.short_positions;
    }
    *stats = s;
  }
  return positions;
}

}  // namespace xsbt
