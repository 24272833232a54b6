// xsbt_pipeline/src/table_io.cpp
//
// Boundary between loosely typed Arrow tables and the typed records used by
// every later stage. Column presence and types are validated here once.

#include "xsbt/table_io.hpp"

#include <cmath>
#include <limits>
#include <string>

#include "xsbt/arrow_utils.hpp"
#include "xsbt/errors.hpp"
#include "xsbt/time_utils.hpp"

namespace xsbt {

namespace {

struct KeyColumns {
  int symbol = -1;
  int date   = -1;
  int value  = -1;
};

// Look up (symbol, date, value) by name; report every missing column at once.
KeyColumns RequireColumns(const arrow::Table& table,
                          const char* table_name,
                          std::initializer_list<std::string_view> value_names) {
  const arrow::Schema& schema = *table.schema();

  KeyColumns cols;
  cols.symbol = FindColumn(schema, {"symbol"});
  cols.date   = FindColumn(schema, {"date", "ts"});
  cols.value  = FindColumn(schema, value_names);

  std::string missing;
  auto note = [&](int idx, const std::string& name) {
    if (idx >= 0) return;
    if (!missing.empty()) missing += ", ";
    missing += name;
  };
  note(cols.symbol, "symbol");
  note(cols.date, "date");
  note(cols.value, std::string(*value_names.begin()));

  if (!missing.empty()) {
    throw InputShapeError(std::string(table_name) +
                          " table missing required columns: " + missing);
  }

  // Types are checked up front so an empty table fails the same way.
  auto type_of = [&](int idx) { return schema.field(idx)->type()->id(); };
  auto reject = [&](int idx) {
    throw InputShapeError(std::string(table_name) + " column '" +
                          schema.field(idx)->name() + "' has unsupported type " +
                          schema.field(idx)->type()->ToString());
  };
  switch (type_of(cols.symbol)) {
    case arrow::Type::STRING:
    case arrow::Type::LARGE_STRING:
    case arrow::Type::DICTIONARY:
      break;
    default:
      reject(cols.symbol);
  }
  switch (type_of(cols.date)) {
    case arrow::Type::DATE32:
    case arrow::Type::DATE64:
    case arrow::Type::TIMESTAMP:
    case arrow::Type::INT32:
    case arrow::Type::UINT32:
    case arrow::Type::INT64:
    case arrow::Type::STRING:
    case arrow::Type::LARGE_STRING:
    case arrow::Type::DICTIONARY:
      break;
    default:
      reject(cols.date);
  }
  switch (type_of(cols.value)) {
    case arrow::Type::FLOAT:
    case arrow::Type::DOUBLE:
    case arrow::Type::INT32:
    case arrow::Type::INT64:
      break;
    default:
      reject(cols.value);
  }
  return cols;
}

// Walk the three key columns row by row and hand each non-null-key row
// to `emit(symbol, day, value)`. A null value is passed as NaN.
template <class Emit>
void ForEachKeyedRow(const arrow::Table& table, const KeyColumns& cols, Emit&& emit) {
  // Columns of one table may be chunked differently; align them first.
  auto selected = table.SelectColumns({cols.symbol, cols.date, cols.value});
  if (!selected.ok()) {
    throw std::runtime_error("select columns failed: " +
                             selected.status().ToString());
  }
  auto combined = (*selected)->CombineChunks(arrow::default_memory_pool());
  if (!combined.ok()) {
    throw std::runtime_error("combine chunks failed: " +
                             combined.status().ToString());
  }
  const std::shared_ptr<arrow::Table> aligned = *combined;
  if (aligned->num_rows() == 0) return;

  const auto sym_arr = aligned->column(0)->chunk(0);
  const auto day_arr = aligned->column(1)->chunk(0);
  const auto val_arr = aligned->column(2)->chunk(0);

  const int64_t n = aligned->num_rows();
  for (int64_t i = 0; i < n; ++i) {
    if (sym_arr->IsNull(i) || day_arr->IsNull(i)) continue;

    double value = std::numeric_limits<double>::quiet_NaN();
    if (!val_arr->IsNull(i)) value = ValueAt<double>(val_arr, i);

    emit(ValueAt<std::string>(sym_arr, i), DayAt(day_arr, i), value);
  }
}

}  // namespace

std::vector<ScoreObservation> PredictionsFromTable(const arrow::Table& table) {
  const KeyColumns cols = RequireColumns(table, "predictions", {"score", "pred"});

  std::vector<ScoreObservation> out;
  out.reserve(static_cast<std::size_t>(table.num_rows()));
  ForEachKeyedRow(table, cols, [&](std::string symbol, uint32_t day, double score) {
    out.push_back(ScoreObservation{std::move(symbol), day, score});
  });
  return out;
}

std::vector<MarketBar> MarketFromTable(const arrow::Table& table) {
  const KeyColumns cols = RequireColumns(table, "market", {"close"});

  std::vector<MarketBar> out;
  out.reserve(static_cast<std::size_t>(table.num_rows()));
  ForEachKeyedRow(table, cols, [&](std::string symbol, uint32_t day, double close) {
    out.push_back(MarketBar{std::move(symbol), day, close});
  });
  return out;
}

std::shared_ptr<arrow::Table> DailySeriesToTable(std::span<const DailyPnlRow> rows) {
  arrow::Date32Builder dateb(arrow::default_memory_pool());
  arrow::DoubleBuilder pnlb(arrow::default_memory_pool());
  arrow::DoubleBuilder equityb(arrow::default_memory_pool());
  arrow::UInt64Builder nsymb(arrow::default_memory_pool());
  arrow::DoubleBuilder grossb(arrow::default_memory_pool());
  arrow::DoubleBuilder costb(arrow::default_memory_pool());
  arrow::DoubleBuilder turnb(arrow::default_memory_pool());

  for (const DailyPnlRow& r : rows) {
    ARROW_OK(dateb.Append(day_to_epoch_days(r.day)));
    ARROW_OK(pnlb.Append(r.pnl));
    ARROW_OK(equityb.Append(r.equity));
    ARROW_OK(nsymb.Append(r.num_symbols));
    ARROW_OK(grossb.Append(r.gross_pnl));
    ARROW_OK(costb.Append(r.cost));
    ARROW_OK(turnb.Append(r.turnover));
  }

  auto schema = arrow::schema({
      arrow::field("date", arrow::date32()),
      arrow::field("pnl", arrow::float64()),
      arrow::field("equity", arrow::float64()),
      arrow::field("num_symbols", arrow::uint64()),
      arrow::field("gross_pnl", arrow::float64()),
      arrow::field("cost", arrow::float64()),
      arrow::field("turnover", arrow::float64()),
  });

  return arrow::Table::Make(schema, {
                                        dateb.Finish().ValueOrDie(),
                                        pnlb.Finish().ValueOrDie(),
                                        equityb.Finish().ValueOrDie(),
                                        nsymb.Finish().ValueOrDie(),
                                        grossb.Finish().ValueOrDie(),
                                        costb.Finish().ValueOrDie(),
                                        turnb.Finish().ValueOrDie(),
                                    });
}

}  // namespace xsbt
