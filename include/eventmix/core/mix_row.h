#pragma once

#include <cstdint>
#include <vector>

#include "eventmix/physics/kinematics.h"

namespace eventmix::core {

// One combination's share of an output row.
struct CandidateBlock {
  physics::Observables mixed;
  // Anchor first, then train stems in window order.
  std::vector<physics::Observables> daughters;
  int64_t weight{0};

  // Source rows; used for tracing only, never persisted.
  int64_t anchor_row{0};
  std::vector<int64_t> train_rows;
};

// One mixed (wagon entry, window) pair: a block per configured combination.
struct MixRow {
  std::vector<CandidateBlock> blocks;
};

}  // namespace eventmix::core
