#pragma once

#include <nlohmann/json.hpp>

namespace eventmix::utils::timing {

class TimingConfigurator {
 public:
  // Accepts `true`/`false` or {"enabled": bool}. Returns false if neither form matches.
  bool Configure(const nlohmann::json& timing_config) const;
  static nlohmann::json DefaultConfig();

  // Logs collected stats at debug level, slowest total first.
  static void LogTimings();
};

}  // namespace eventmix::utils::timing
