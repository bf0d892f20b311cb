#include <pybind11/pybind11.h>

#include <string>

#include <spdlog/spdlog.h>

#include "bindings.h"
#include "eventmix/io/json_reader.h"
#include "eventmix/utils/logging/logger_configurator.h"

namespace py = pybind11;

namespace eventmix::bindings {

void BindLogging(py::module_& m) {
  m.def(
      "configure_logger_defaults",
      []() {
        utils::logging::LoggerConfigurator configurator;
        return configurator.Configure(nlohmann::json::object());
      },
      "Configure the logger with library defaults.");

  m.def(
      "configure_logger_json",
      [](const std::string& json_str) {
        io::JsonReader reader;
        utils::logging::LoggerConfigurator configurator;
        return configurator.Configure(reader.Parse(json_str));
      },
      py::arg("json_str"),
      "Configure the logger from a JSON string.");

  m.def(
      "configure_logger_from_file",
      [](const std::string& filepath) {
        io::JsonReader reader;
        auto j = reader.ReadFile(filepath);
        if (j.contains("logger")) {
          j = j.at("logger");
        }
        utils::logging::LoggerConfigurator configurator;
        return configurator.Configure(j);
      },
      py::arg("filepath"),
      "Configure the logger from a JSON file (uses the 'logger' key if present).");

  m.def(
      "set_level",
      [](const std::string& level) { spdlog::set_level(spdlog::level::from_str(level)); },
      py::arg("level"),
      "Set the level of the default logger (trace, debug, info, warn, error, critical, off).");
}

}  // namespace eventmix::bindings
