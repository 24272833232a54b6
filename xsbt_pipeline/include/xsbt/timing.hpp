#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace xsbt {

// One named, timed step of a run.
struct TimingEntry {
  std::string name;
  std::chrono::steady_clock::duration duration{};
};

// Ordered list of timed steps owned by whoever is running them.
//
// A backtest collects its stage timings into its own StageTimings and hands
// them back with the result, so repeated runs in one process never share
// (or accumulate) timing state. Not thread-safe; time whole stages from the
// calling thread.
class StageTimings {
 public:
  void Add(std::string name, std::chrono::steady_clock::duration d) {
    entries_.push_back(TimingEntry{std::move(name), d});
  }

  // Append every entry of `other` after the ones already recorded.
  void Append(const std::vector<TimingEntry>& other) {
    entries_.insert(entries_.end(), other.begin(), other.end());
  }

  const std::vector<TimingEntry>& entries() const { return entries_; }

  // Hand the entries to the caller and leave this list empty.
  std::vector<TimingEntry> Release() { return std::exchange(entries_, {}); }

 private:
  std::vector<TimingEntry> entries_;
};

// Records the lifetime of the enclosing scope into a StageTimings.
class ScopeTimer {
 public:
  ScopeTimer(StageTimings& sink, std::string name)
      : sink_(sink),
        name_(std::move(name)),
        start_(std::chrono::steady_clock::now()) {}

  ~ScopeTimer() {
    sink_.Add(std::move(name_), std::chrono::steady_clock::now() - start_);
  }

  ScopeTimer(const ScopeTimer&) = delete;
  ScopeTimer& operator=(const ScopeTimer&) = delete;

 private:
  StageTimings& sink_;
  std::string name_;
  std::chrono::steady_clock::time_point start_;
};

#define XSBT_CONCAT_INNER(a, b) a##b
#define XSBT_CONCAT(a, b) XSBT_CONCAT_INNER(a, b)

/// Helper macro so you can write: XSBT_SCOPE_TIMER(timings, "step_name");
#define XSBT_SCOPE_TIMER(sink, label) \
  ::xsbt::ScopeTimer XSBT_CONCAT(xsbt_scope_timer_, __LINE__)(sink, label)

/// Append a timing report for one driver invocation to a log file.
///
/// `append` defaults to true so repeated runs can share one timing log.
void WriteTimingReport(const std::string& out_path,
                       const std::string& program_name,
                       const std::vector<std::string>& args,
                       const std::vector<TimingEntry>& entries,
                       bool append = true);

}  // namespace xsbt
