// xsbt_pipeline/src/run_backtest.cpp
//
// Small CLI wrapper around xsbt::RunBacktest.
//
// Responsibilities:
//  - Parse command-line args (predictions, market, config, output dir)
//  - Load both Parquet tables and the JSON config
//  - Run the backtest
//  - Write daily.parquet and metrics.json into the output dir
//  - Record per-step timings and append a timing report.

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "xsbt/arrow_utils.hpp"
#include "xsbt/backtester.hpp"
#include "xsbt/config.hpp"
#include "xsbt/table_io.hpp"
#include "xsbt/timing.hpp"

namespace {

// Simple path join for building "<out_dir>/<file>".
std::string JoinPath(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  std::filesystem::path p(a);
  p /= b;
  return p.string();
}

// Print CLI usage/help message.
void PrintUsage(const char* prog) {
  std::cerr << "Usage:\n"
            << "  " << prog
            << " <predictions.parquet> <market.parquet> <config.json> <out_dir>\n\n"
            << "Example:\n"
            << "  " << prog
            << " reports/runs/20260223T224653Z/predictions.parquet"
            << " data/processed/market.parquet"
            << " config/backtest.json"
            << " reports/runs/20260223T224653Z\n";
}

}  // namespace

int main(int argc, char** argv) {
  using Clock = std::chrono::steady_clock;
  const auto program_start = Clock::now();

  // Expect exactly 4 arguments:
  // 1: predictions parquet
  // 2: market parquet
  // 3: config json
  // 4: output directory
  if (argc != 5) {
    PrintUsage(argv[0]);
    return 1;
  }

  // Driver-level steps plus the stages reported back by the backtest.
  xsbt::StageTimings timings;

  try {
    const std::string preds_path  = argv[1];
    const std::string market_path = argv[2];
    const std::string cfg_path    = argv[3];
    const std::string out_dir     = argv[4];

    xsbt::BacktestConfig cfg;
    {
      XSBT_SCOPE_TIMER(timings, "load_backtest_config");
      cfg = xsbt::LoadBacktestConfig(cfg_path);
    }

    std::shared_ptr<arrow::Table> preds;
    std::shared_ptr<arrow::Table> market;
    {
      XSBT_SCOPE_TIMER(timings, "read_parquet");
      preds  = xsbt::ReadParquetTable(preds_path);
      market = xsbt::ReadParquetTable(market_path);
    }

    std::cout << "Running backtest"
              << (cfg.run_id.empty() ? std::string() : " " + cfg.run_id)
              << " (" << preds->num_rows() << " prediction rows, "
              << market->num_rows() << " market rows)...\n";

    const xsbt::BacktestResult result = xsbt::RunBacktest(*preds, *market, cfg);
    timings.Append(result.stage_timings);

    std::filesystem::create_directories(out_dir);
    {
      XSBT_SCOPE_TIMER(timings, "write_outputs");
      const auto daily_table = xsbt::DailySeriesToTable(result.daily);
      xsbt::WriteParquetTable(*daily_table, JoinPath(out_dir, "daily.parquet"));

      const std::string metrics_path = JoinPath(out_dir, "metrics.json");
      std::ofstream out(metrics_path);
      if (!out) {
        throw std::runtime_error("Failed to open metrics output: " + metrics_path);
      }
      out << xsbt::MetricsToJson(result.metrics).dump(2) << "\n";
    }

    // RunBacktest already printed the summary in verbose mode.
    if (!cfg.verbose) {
      xsbt::PrintRunSummary(std::cout, result);
    }
    std::cout << "Backtest complete.\n";

    // Record total wall-clock time.
    const auto program_end = Clock::now();
    timings.Add("program_wall_clock", program_end - program_start);

    std::vector<std::string> args;
    args.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) {
      args.emplace_back(argv[i]);
    }

    xsbt::WriteTimingReport(JoinPath(out_dir, "timing_log.txt"), argv[0], args,
                           timings.entries());

    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error in run_backtest: " << ex.what() << "\n";
    return 1;
  }
}
