#pragma once

#include <chrono>
#include <string>

namespace eventmix::utils::timing {

class Timer {
 public:
  Timer();
  void Reset();
  double ElapsedMs() const;

 private:
  std::chrono::steady_clock::time_point start_;
};

// Records the lifetime of the enclosing scope under `name` when timing is on.
class ScopedTimer {
 public:
  explicit ScopedTimer(std::string name);
  ~ScopedTimer() noexcept;

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

 private:
  std::string name_;
  Timer timer_;
  bool enabled_{false};
};

// True when enabled through TimingRegistry or the EVENTMIX_TIMING variable.
bool TimingEnabled();

}  // namespace eventmix::utils::timing
