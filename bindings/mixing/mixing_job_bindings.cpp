#include <pybind11/pybind11.h>

#include <stdexcept>
#include <string>
#include <utility>

#include "bindings.h"
#include "eventmix/io/config_manager.h"
#include "eventmix/io/json_reader.h"
#include "eventmix/pipeline/mixing_config.h"
#include "eventmix/pipeline/mixing_job.h"

namespace py = pybind11;

namespace eventmix::bindings {

namespace {

py::dict RunMixingBlock(const nlohmann::json& mixing) {
  auto config = pipeline::MixingConfig::FromJson(mixing);
  core::MixSummary summary;
  {
    py::gil_scoped_release release;
    summary = pipeline::MixingJob(std::move(config)).Run();
  }
  py::dict out;
  out["entries"] = summary.entries;
  out["wagons_mixed"] = summary.wagons_mixed;
  out["wagons_filled"] = summary.wagons_filled;
  out["rows"] = summary.rows;
  return out;
}

}  // namespace

void BindMixingJob(py::module_& m) {
  m.def(
      "run_config_file",
      [](const std::string& filepath) {
        auto& configs = io::ConfigManager::Instance();
        if (!configs.LoadFiles({filepath})) {
          throw std::runtime_error("Could not load config file: " + filepath);
        }
        configs.ConfigureTiming();
        return RunMixingBlock(configs.MixingConfig());
      },
      py::arg("filepath"),
      "Run the job described by the 'mixing' block of a JSON config file.");

  m.def(
      "run_config_json",
      [](const std::string& json_str) {
        io::JsonReader reader;
        auto j = reader.Parse(json_str);
        if (j.contains("mixing")) {
          j = j.at("mixing");
        }
        return RunMixingBlock(j);
      },
      py::arg("json_str"),
      "Run a mixing job from a JSON string (uses the 'mixing' key if present).");
}

}  // namespace eventmix::bindings
