#pragma once

#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

namespace eventmix::utils::logging {

// Installs the spdlog default logger from a JSON "logger" block:
//   {"name", "level", "pattern", "flush_on",
//    "sinks": {"console": {"enabled", "color"},
//              "file": {"enabled", "filename", "max_size", "max_files"}}}
class LoggerConfigurator {
 public:
  bool Configure(const nlohmann::json& logger_config) const;
  static nlohmann::json DefaultConfig();

 private:
  std::vector<spdlog::sink_ptr> BuildSinks(const nlohmann::json& sinks_json) const;
};

}  // namespace eventmix::utils::logging
