#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace eventmix::utils::timing {

struct TimingStats {
  uint64_t count{0};
  double total_ms{0.0};
  double min_ms{0.0};
  double max_ms{0.0};

  void Add(double elapsed_ms);
  double MeanMs() const { return count ? total_ms / static_cast<double>(count) : 0.0; }
};

using NamedTimingStats = std::pair<std::string, TimingStats>;

// Process-wide accumulator for ScopedTimer samples, keyed by timer name
// ("mix.scan", "parquet.read_table", ...).
class TimingRegistry {
 public:
  static TimingRegistry& Instance();

  void SetEnabled(bool enabled) { enabled_.store(enabled, std::memory_order_relaxed); }
  bool Enabled() const { return enabled_.load(std::memory_order_relaxed); }

  void Record(const std::string& name, double elapsed_ms);
  // Slowest total first; ties by name.
  std::vector<NamedTimingStats> SortedByTotal() const;
  void Reset();

 private:
  TimingRegistry() = default;
  TimingRegistry(const TimingRegistry&) = delete;
  TimingRegistry& operator=(const TimingRegistry&) = delete;

  std::atomic<bool> enabled_{false};
  mutable std::mutex mutex_;
  std::map<std::string, TimingStats> stats_;
};

}  // namespace eventmix::utils::timing
