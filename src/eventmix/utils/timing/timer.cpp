#include "eventmix/utils/timing/timer.h"

#include <cstdlib>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#include "eventmix/utils/timing/timing_registry.h"

namespace eventmix::utils::timing {

Timer::Timer() : start_(std::chrono::steady_clock::now()) {}

void Timer::Reset() {
  start_ = std::chrono::steady_clock::now();
}

double Timer::ElapsedMs() const {
  std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start_;
  return elapsed.count();
}

ScopedTimer::ScopedTimer(std::string name)
    : name_(std::move(name)), timer_(), enabled_(TimingEnabled()) {}

ScopedTimer::~ScopedTimer() noexcept {
  if (!enabled_) {
    return;
  }
  try {
    TimingRegistry::Instance().Record(name_, timer_.ElapsedMs());
  } catch (const std::exception& e) {
    spdlog::warn("[ScopedTimer] Dropped sample for {}: {}", name_, e.what());
  }
}

bool TimingEnabled() {
  if (TimingRegistry::Instance().Enabled()) {
    return true;
  }
  const char* env = std::getenv("EVENTMIX_TIMING");
  return env != nullptr && std::string(env) != "0";
}

}  // namespace eventmix::utils::timing
