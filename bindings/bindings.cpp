#include <pybind11/pybind11.h>

#include "bindings.h"

namespace py = pybind11;

PYBIND11_MODULE(eventmix_python, m) {
  m.doc() = "Pybind11 bindings for eventmix candidate mixing";

  auto m_mixing = m.def_submodule("mixing");
  eventmix::bindings::BindEventMixer(m_mixing);
  eventmix::bindings::BindMixingJob(m_mixing);

  auto m_utils = m.def_submodule("utils");
  auto m_logging = m_utils.def_submodule("logging");
  eventmix::bindings::BindLogging(m_logging);
  auto m_timing = m_utils.def_submodule("timing");
  eventmix::bindings::BindTiming(m_timing);
}
