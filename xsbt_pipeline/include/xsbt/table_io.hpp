#pragma once

#include <arrow/api.h>

#include <memory>
#include <span>
#include <vector>

#include "xsbt/types.hpp"

namespace xsbt {

// Required columns of the two input tables. The first name is canonical,
// later names are accepted aliases used by the upstream pipeline.
//   predictions : symbol, date|ts, score|pred
//   market      : symbol, date|ts, close      (other OHLCV columns ignored)
//
// Both throw InputShapeError if a required column is missing or has an
// unsupported type; no rows are returned in that case.
// Rows with a null symbol or date are skipped. A null score or close becomes
// NaN, which later stages treat as undefined.
std::vector<ScoreObservation> PredictionsFromTable(const arrow::Table& table);
std::vector<MarketBar> MarketFromTable(const arrow::Table& table);

// Daily series as an Arrow table:
//   date (date32), pnl, equity, num_symbols (uint64), gross_pnl, cost,
//   turnover (float64)
std::shared_ptr<arrow::Table> DailySeriesToTable(std::span<const DailyPnlRow> rows);

}  // namespace xsbt
