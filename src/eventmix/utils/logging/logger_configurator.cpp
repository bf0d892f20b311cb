#include "eventmix/utils/logging/logger_configurator.h"

#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace eventmix::utils::logging {

namespace {

constexpr const char* kDefaultName = "eventmix";
constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

}  // namespace

bool LoggerConfigurator::Configure(const nlohmann::json& logger_config) const {
  nlohmann::json config = logger_config;
  if (config.empty()) {
    config = DefaultConfig();
  }

  try {
    spdlog::level::level_enum level = spdlog::level::info;
    if (config.contains("level")) {
      level = spdlog::level::from_str(config.at("level").get<std::string>());
    }

    auto sinks = BuildSinks(config.value("sinks", nlohmann::json::object()));
    std::string logger_name = config.value("name", std::string(kDefaultName));
    auto logger = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());
    logger->set_pattern(config.value("pattern", std::string(kDefaultPattern)));
    logger->set_level(level);
    if (config.contains("flush_on")) {
      logger->flush_on(spdlog::level::from_str(config.at("flush_on").get<std::string>()));
    }
    spdlog::set_default_logger(logger);
    return true;
  } catch (const std::exception& e) {
    spdlog::error("[LoggerConfigurator] Logger config error: {}", e.what());
    return false;
  }
}

std::vector<spdlog::sink_ptr> LoggerConfigurator::BuildSinks(
    const nlohmann::json& sinks_json) const {
  std::vector<spdlog::sink_ptr> sinks;

  bool console_enabled = true;
  bool console_color = true;
  if (sinks_json.contains("console")) {
    console_enabled = sinks_json.at("console").value("enabled", true);
    console_color = sinks_json.at("console").value("color", true);
  }
  if (console_enabled) {
    if (console_color) {
      sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    } else {
      sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
    }
  }

  if (sinks_json.contains("file")) {
    const auto& file_cfg = sinks_json.at("file");
    if (file_cfg.value("enabled", false)) {
      auto filename = file_cfg.value("filename", std::string("eventmix.log"));
      if (file_cfg.contains("max_size") && file_cfg.contains("max_files")) {
        auto max_size = file_cfg.at("max_size").get<std::size_t>();
        auto max_files = file_cfg.at("max_files").get<std::size_t>();
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            filename, max_size, max_files));
      } else {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true));
      }
    }
  }
  return sinks;
}

nlohmann::json LoggerConfigurator::DefaultConfig() {
  return nlohmann::json{
      {"name", kDefaultName},
      {"level", "info"},
      {"pattern", kDefaultPattern},
      {"sinks",
       {{"console", {{"enabled", true}, {"color", true}}}}}};
}

}  // namespace eventmix::utils::logging
