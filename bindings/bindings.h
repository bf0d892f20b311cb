#pragma once

#include <pybind11/pybind11.h>

namespace eventmix::bindings {

void BindEventMixer(pybind11::module_& m);
void BindMixingJob(pybind11::module_& m);

void BindLogging(pybind11::module_& m);
void BindTiming(pybind11::module_& m);

}  // namespace eventmix::bindings
