#include <exception>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "eventmix/io/config_manager.h"
#include "eventmix/pipeline/mixing_config.h"
#include "eventmix/pipeline/mixing_job.h"

int main(int argc, char** argv) {
  if (argc < 2) {
    spdlog::error("Usage: {} config.json [override.json ...]", argv[0]);
    return 2;
  }
  std::vector<std::string> config_paths(argv + 1, argv + argc);

  auto& configs = eventmix::io::ConfigManager::Instance();
  if (!configs.LoadFiles(config_paths)) {
    return 1;
  }
  configs.ConfigureLogger();
  configs.ConfigureTiming();

  try {
    auto config = eventmix::pipeline::MixingConfig::FromJson(configs.MixingConfig());
    eventmix::pipeline::MixingJob job(std::move(config));
    auto summary = job.Run();
    spdlog::info("{} entries scanned, {} mixed rows written.", summary.entries, summary.rows);
  } catch (const std::exception& e) {
    spdlog::error("eventmix_run failed: {}", e.what());
    return 1;
  }
  return 0;
}
