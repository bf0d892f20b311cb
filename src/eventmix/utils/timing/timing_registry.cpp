#include "eventmix/utils/timing/timing_registry.h"

#include <algorithm>

namespace eventmix::utils::timing {

void TimingStats::Add(double elapsed_ms) {
  min_ms = count == 0 ? elapsed_ms : std::min(min_ms, elapsed_ms);
  max_ms = count == 0 ? elapsed_ms : std::max(max_ms, elapsed_ms);
  ++count;
  total_ms += elapsed_ms;
}

TimingRegistry& TimingRegistry::Instance() {
  static TimingRegistry registry;
  return registry;
}

void TimingRegistry::Record(const std::string& name, double elapsed_ms) {
  std::lock_guard<std::mutex> guard(mutex_);
  stats_[name].Add(elapsed_ms);
}

std::vector<NamedTimingStats> TimingRegistry::SortedByTotal() const {
  std::vector<NamedTimingStats> sorted;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    sorted.assign(stats_.begin(), stats_.end());
  }
  // stats_ is name ordered, so a stable sort keeps ties alphabetical.
  std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
    return a.second.total_ms > b.second.total_ms;
  });
  return sorted;
}

void TimingRegistry::Reset() {
  std::lock_guard<std::mutex> guard(mutex_);
  stats_.clear();
}

}  // namespace eventmix::utils::timing
