#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace eventmix::io {

// Merges JSON config files; later files override earlier ones key by key
// (RFC 7386 merge patch: objects merge, everything else is replaced).
class ConfigManager {
 public:
  static ConfigManager& Instance();

  bool LoadFiles(const std::vector<std::string>& filepaths);
  bool LoadFile(const std::string& filepath);
  bool AddJson(const nlohmann::json& j);
  void Reset();

  const nlohmann::json& MergedJson() const { return merged_json_; }
  nlohmann::json LoggerConfig() const { return Section("logger"); }
  nlohmann::json TimingConfig() const { return Section("timing"); }
  nlohmann::json MixingConfig() const { return Section("mixing"); }

  bool ConfigureLogger() const;
  bool ConfigureTiming() const;

 private:
  ConfigManager() = default;
  ConfigManager(const ConfigManager&) = delete;
  ConfigManager& operator=(const ConfigManager&) = delete;

  nlohmann::json Section(const std::string& name) const;

  nlohmann::json merged_json_{nlohmann::json::object()};
};

}  // namespace eventmix::io
