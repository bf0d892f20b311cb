#include "eventmix/utils/timing/timing_configurator.h"

#include <spdlog/spdlog.h>

#include "eventmix/utils/timing/timing_registry.h"

namespace eventmix::utils::timing {

bool TimingConfigurator::Configure(const nlohmann::json& timing_config) const {
  nlohmann::json config = timing_config;
  if (config.is_null() || (config.is_object() && config.empty())) {
    config = DefaultConfig();
  }

  if (config.is_boolean()) {
    TimingRegistry::Instance().SetEnabled(config.get<bool>());
    return true;
  }
  if (config.is_object() && config.contains("enabled")) {
    TimingRegistry::Instance().SetEnabled(config.at("enabled").get<bool>());
    return true;
  }
  return false;
}

nlohmann::json TimingConfigurator::DefaultConfig() {
  return nlohmann::json{{"enabled", false}};
}

void TimingConfigurator::LogTimings() {
  auto stats = TimingRegistry::Instance().SortedByTotal();
  if (stats.empty()) {
    spdlog::debug("timing: no stats collected");
    return;
  }
  spdlog::debug("timing: {} entries", stats.size());
  for (const auto& [name, stat] : stats) {
    spdlog::debug("timing: {:<32} n={:<8} total={:.3f} ms mean={:.3f} ms [{:.3f}, {:.3f}]",
                  name, stat.count, stat.total_ms, stat.MeanMs(), stat.min_ms, stat.max_ms);
  }
}

}  // namespace eventmix::utils::timing
