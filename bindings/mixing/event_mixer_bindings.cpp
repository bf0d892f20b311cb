#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "bindings.h"
#include "eventmix/core/event_mixer.h"
#include "eventmix/io/parquet_mix_writer.h"
#include "eventmix/io/parquet_reader.h"

namespace py = pybind11;

namespace eventmix::bindings {

namespace {

// Python-facing mixer that owns its Parquet input and output paths.
class PyEventMixer {
 public:
  PyEventMixer(int64_t train_length,
               const std::vector<std::string>& input_paths,
               std::string output_path,
               std::string run_column,
               std::string event_column)
      : output_path_(std::move(output_path)),
        mixer_(train_length,
               io::ParquetReader().ReadTables(input_paths),
               core::KeyColumns{std::move(run_column), std::move(event_column)}) {}

  void AddMixCombination(const std::string& name, const std::vector<std::string>& stems) {
    mixer_.AddMixCombination(name, stems);
  }

  py::dict RunMixing(bool progress, bool verbose) const {
    core::MixSummary summary;
    {
      py::gil_scoped_release release;
      io::ParquetMixWriter writer(output_path_, mixer_.combinations());
      summary = mixer_.RunMixing(writer, core::RunOptions{progress, verbose});
      writer.Close();
    }
    py::dict out;
    out["entries"] = summary.entries;
    out["wagons_mixed"] = summary.wagons_mixed;
    out["wagons_filled"] = summary.wagons_filled;
    out["rows"] = summary.rows;
    return out;
  }

  const core::EventMixer& mixer() const { return mixer_; }
  const std::string& output_path() const { return output_path_; }

 private:
  std::string output_path_;
  core::EventMixer mixer_;
};

}  // namespace

void BindEventMixer(py::module_& m) {
  py::class_<PyEventMixer>(m, "EventMixer")
      .def(py::init<int64_t, const std::vector<std::string>&, std::string, std::string,
                    std::string>(),
           py::arg("train_length"),
           py::arg("input_paths"),
           py::arg("output_path"),
           py::arg("run_column") = "runNumber",
           py::arg("event_column") = "eventNumber")
      .def(py::init([](int64_t train_length, const std::string& input_path,
                       std::string output_path, std::string run_column,
                       std::string event_column) {
             return PyEventMixer(train_length, {input_path}, std::move(output_path),
                                 std::move(run_column), std::move(event_column));
           }),
           py::arg("train_length"),
           py::arg("input_path"),
           py::arg("output_path"),
           py::arg("run_column") = "runNumber",
           py::arg("event_column") = "eventNumber")
      .def("add_mix_combination", &PyEventMixer::AddMixCombination,
           py::arg("mixed_cdt_name"), py::arg("stems"),
           "Add a combination; stems[0] is taken from the current event, the rest from the train.")
      .def("run_mixing", &PyEventMixer::RunMixing,
           py::arg("progress") = false, py::arg("verbose") = false,
           "Run the mixing and write the output Parquet file. Returns a summary dict.")
      .def_property_readonly("output_columns",
                             [](const PyEventMixer& self) { return self.mixer().OutputColumns(); })
      .def_property_readonly("train_length",
                             [](const PyEventMixer& self) { return self.mixer().train_length(); })
      .def_property_readonly("output_path", &PyEventMixer::output_path);
}

}  // namespace eventmix::bindings
