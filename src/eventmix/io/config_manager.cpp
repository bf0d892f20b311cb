#include "eventmix/io/config_manager.h"

#include <spdlog/spdlog.h>

#include "eventmix/io/json_reader.h"
#include "eventmix/utils/logging/logger_configurator.h"
#include "eventmix/utils/timing/timing_configurator.h"

namespace eventmix::io {

ConfigManager& ConfigManager::Instance() {
  static ConfigManager manager;
  return manager;
}

void ConfigManager::Reset() {
  merged_json_ = nlohmann::json::object();
}

bool ConfigManager::LoadFiles(const std::vector<std::string>& filepaths) {
  Reset();
  for (const auto& filepath : filepaths) {
    if (!LoadFile(filepath)) {
      return false;
    }
  }
  return true;
}

bool ConfigManager::LoadFile(const std::string& filepath) {
  JsonReader reader;
  try {
    return AddJson(reader.ReadFile(filepath));
  } catch (const std::exception& e) {
    spdlog::error("[ConfigManager] Failed to load config file {}: {}", filepath, e.what());
    return false;
  }
}

bool ConfigManager::AddJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    spdlog::error("[ConfigManager] Config root must be a JSON object.");
    return false;
  }
  merged_json_.merge_patch(j);
  return true;
}

nlohmann::json ConfigManager::Section(const std::string& name) const {
  if (!merged_json_.contains(name)) {
    return nlohmann::json::object();
  }
  return merged_json_.at(name);
}

bool ConfigManager::ConfigureLogger() const {
  utils::logging::LoggerConfigurator configurator;
  return configurator.Configure(LoggerConfig());
}

bool ConfigManager::ConfigureTiming() const {
  utils::timing::TimingConfigurator configurator;
  return configurator.Configure(TimingConfig());
}

}  // namespace eventmix::io
