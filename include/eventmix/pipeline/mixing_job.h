#pragma once

#include <utility>

#include "eventmix/core/event_mixer.h"
#include "eventmix/pipeline/mixing_config.h"

namespace eventmix::pipeline {

// Reads the configured Parquet inputs, mixes them and writes the output file.
class MixingJob {
 public:
  explicit MixingJob(MixingConfig config) : config_(std::move(config)) {}

  core::MixSummary Run() const;

  const MixingConfig& config() const { return config_; }

 private:
  MixingConfig config_;
};

}  // namespace eventmix::pipeline
