#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "eventmix/core/event_mixer.h"
#include "eventmix/core/event_table.h"
#include "eventmix/core/mix_combination.h"

namespace eventmix::pipeline {

// The "mixing" block of a run configuration.
struct MixingConfig {
  std::vector<std::string> inputs;
  std::string output;
  int64_t train_length{0};
  core::KeyColumns key_columns;
  core::RunOptions options;
  std::vector<core::MixCombination> combinations;

  // Throws std::runtime_error / std::invalid_argument on malformed input.
  static MixingConfig FromJson(const nlohmann::json& cfg);

  // Key columns plus every stem column, in first-use order, without repeats.
  std::vector<std::string> InputColumns() const;
};

}  // namespace eventmix::pipeline
