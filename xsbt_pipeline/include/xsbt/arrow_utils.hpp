#pragma once
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "xsbt/errors.hpp"
#include "xsbt/time_utils.hpp"

namespace xsbt {

// helper used at runtime for validation
static inline void ARROW_OK(const arrow::Status& st) {
  if (!st.ok()) throw std::runtime_error(st.ToString());
}

// Index of the first of `names` present in the schema, or -1.
inline int FindColumn(const arrow::Schema& schema,
                      std::initializer_list<std::string_view> names) {
  for (std::string_view name : names) {
    const int idx = schema.GetFieldIndex(std::string(name));
    if (idx >= 0) return idx;
  }
  return -1;
}

// Generic declaration for typed value extraction from Arrow arrays
template <typename T>
T ValueAt(const std::shared_ptr<arrow::Array>& arr, int64_t i);

// Specialization for extracting numeric columns as double
template <>
inline double ValueAt<double>(const std::shared_ptr<arrow::Array>& arr,
                              int64_t i) {
  switch (arr->type_id()) {
    case arrow::Type::FLOAT:
      return static_cast<double>(
          static_cast<const arrow::FloatArray&>(*arr).Value(i));
    case arrow::Type::DOUBLE:
      return static_cast<const arrow::DoubleArray&>(*arr).Value(i);
    case arrow::Type::INT32:
      return static_cast<double>(
          static_cast<const arrow::Int32Array&>(*arr).Value(i));
    case arrow::Type::INT64:
      return static_cast<double>(
          static_cast<const arrow::Int64Array&>(*arr).Value(i));
    default:
      throw InputShapeError("unsupported numeric type: " +
                            arr->type()->ToString());
  }
}

// Specialization for extracting symbols: utf8, large_utf8 or
// dictionary-encoded utf8 (what partitioned Parquet datasets produce).
template <>
inline std::string ValueAt<std::string>(const std::shared_ptr<arrow::Array>& arr,
                                        int64_t i) {
  switch (arr->type_id()) {
    case arrow::Type::STRING:
      return std::string(static_cast<const arrow::StringArray&>(*arr).GetView(i));
    case arrow::Type::LARGE_STRING:
      return std::string(
          static_cast<const arrow::LargeStringArray&>(*arr).GetView(i));
    case arrow::Type::DICTIONARY: {
      const auto& dict = static_cast<const arrow::DictionaryArray&>(*arr);
      return ValueAt<std::string>(dict.dictionary(), dict.GetValueIndex(i));
    }
    default:
      throw InputShapeError("unsupported symbol type: " +
                            arr->type()->ToString());
  }
}

// Calendar day (YYYYMMDD) from a date-like cell.
//
// Accepts date32, date64, timestamp of any unit (floored to its UTC day),
// integer YYYYMMDD and "YYYY-MM-DD..." strings (see parse_day_string for
// how a string's time of day and zone are treated).
inline uint32_t DayAt(const std::shared_ptr<arrow::Array>& arr, int64_t i) {
  using namespace std::chrono;

  int64_t raw = 0;
  switch (arr->type_id()) {
    case arrow::Type::DATE32:
      return day_from_epoch_days(
          static_cast<const arrow::Date32Array&>(*arr).Value(i));
    case arrow::Type::DATE64:
      return day_from_epoch_duration(milliseconds{
          static_cast<const arrow::Date64Array&>(*arr).Value(i)});
    case arrow::Type::TIMESTAMP: {
      const int64_t v = static_cast<const arrow::TimestampArray&>(*arr).Value(i);
      const auto& ts_type = static_cast<const arrow::TimestampType&>(*arr->type());
      switch (ts_type.unit()) {
        case arrow::TimeUnit::SECOND: return day_from_epoch_duration(seconds{v});
        case arrow::TimeUnit::MILLI:  return day_from_epoch_duration(milliseconds{v});
        case arrow::TimeUnit::MICRO:  return day_from_epoch_duration(microseconds{v});
        case arrow::TimeUnit::NANO:   return day_from_epoch_duration(nanoseconds{v});
      }
      throw InputShapeError("unsupported timestamp unit: " + ts_type.ToString());
    }
    case arrow::Type::INT32:
      raw = static_cast<const arrow::Int32Array&>(*arr).Value(i);
      break;
    case arrow::Type::UINT32:
      raw = static_cast<const arrow::UInt32Array&>(*arr).Value(i);
      break;
    case arrow::Type::INT64:
      raw = static_cast<const arrow::Int64Array&>(*arr).Value(i);
      break;
    case arrow::Type::STRING:
    case arrow::Type::LARGE_STRING:
    case arrow::Type::DICTIONARY: {
      const std::string s = ValueAt<std::string>(arr, i);
      uint32_t day = 0;
      if (!parse_day_string(s, day)) {
        throw InputShapeError("unparseable or non-UTC date value '" + s + "'");
      }
      return day;
    }
    default:
      throw InputShapeError("unsupported date type: " + arr->type()->ToString());
  }

  // Integer columns carry YYYYMMDD directly. Range-check before narrowing.
  if (raw < 0 || raw > 99991231 || !is_valid_day(static_cast<uint32_t>(raw))) {
    throw InputShapeError("integer date is not YYYYMMDD: " + std::to_string(raw));
  }
  return static_cast<uint32_t>(raw);
}

// Read a whole Parquet file into an Arrow table.
inline std::shared_ptr<arrow::Table> ReadParquetTable(const std::string& path) {
  // Open file
  auto readable_file_result = arrow::io::ReadableFile::Open(path);
  if (!readable_file_result.ok()) {
    throw std::runtime_error("open input failed: " +
                             readable_file_result.status().ToString());
  }

  // Open file via parquet reader
  auto parquet_read_result = parquet::arrow::OpenFile(
      *readable_file_result, arrow::default_memory_pool());
  if (!parquet_read_result.ok()) {
    throw std::runtime_error("open parquet reader failed: " +
                             parquet_read_result.status().ToString());
  }

  auto reader = std::move(parquet_read_result).ValueOrDie();
  std::shared_ptr<arrow::Table> table;
  auto st = reader->ReadTable(&table);
  if (!st.ok()) {
    throw std::runtime_error("read table failed for " + path + ": " +
                             st.ToString());
  }
  return table;
}

// Write an Arrow table to a single Parquet file.
inline void WriteParquetTable(const arrow::Table& table, const std::string& path) {
  auto of_res = arrow::io::FileOutputStream::Open(path);
  if (!of_res.ok()) {
    throw std::runtime_error("open output failed: " +
                             of_res.status().ToString());
  }
  auto outfile = *of_res;

  ARROW_OK(parquet::arrow::WriteTable(table, arrow::default_memory_pool(),
                                      outfile, /*chunk_size=*/64 * 1024));
  ARROW_OK(outfile->Close());
}

}  // namespace xsbt
