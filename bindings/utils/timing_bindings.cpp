#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>

#include "bindings.h"
#include "eventmix/io/json_reader.h"
#include "eventmix/utils/timing/timing_configurator.h"
#include "eventmix/utils/timing/timing_registry.h"

namespace py = pybind11;

namespace eventmix::bindings {

void BindTiming(py::module_& m) {
  m.def(
      "configure_timing_json",
      [](const std::string& json_str) {
        io::JsonReader reader;
        utils::timing::TimingConfigurator configurator;
        return configurator.Configure(reader.Parse(json_str));
      },
      py::arg("json_str"),
      "Configure timing from a JSON string.");

  m.def(
      "set_enabled",
      [](bool enabled) { utils::timing::TimingRegistry::Instance().SetEnabled(enabled); },
      py::arg("enabled"),
      "Enable or disable timing collection.");

  m.def(
      "stats",
      []() {
        py::list out;
        auto stats = utils::timing::TimingRegistry::Instance().SortedByTotal();
        for (const auto& [name, stat] : stats) {
          py::dict entry;
          entry["count"] = stat.count;
          entry["total_ms"] = stat.total_ms;
          entry["mean_ms"] = stat.MeanMs();
          entry["min_ms"] = stat.min_ms;
          entry["max_ms"] = stat.max_ms;
          out.append(py::make_tuple(name, entry));
        }
        return out;
      },
      "(name, stats) pairs, slowest total first.");

  m.def(
      "reset",
      []() { utils::timing::TimingRegistry::Instance().Reset(); },
      "Drop collected timing stats.");

  m.def(
      "log_timings",
      []() { utils::timing::TimingConfigurator::LogTimings(); },
      "Log collected timing stats at debug level.");
}

}  // namespace eventmix::bindings
