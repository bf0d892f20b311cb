#pragma once

#include <cstdint>
#include <vector>

#include "eventmix/core/event_table.h"
#include "eventmix/core/mix_combination.h"
#include "eventmix/core/mix_row.h"
#include "eventmix/core/wagon_scanner.h"

namespace eventmix::core {

// Crosses wagon entries with sliding windows over the flattened train.
//
// For a pool of size P and a combination with k train stems, window n uses
// pool[n], ..., pool[n + k - 1] and every row carries the weight P - k + 1.
// Combinations mixed together share their windows, so they must all have the
// same number of train stems; the constructor throws std::invalid_argument
// otherwise.
class MixingEngine {
 public:
  MixingEngine(const EventTable& table, std::vector<MixCombination> combinations);

  size_t WindowSize() const { return window_size_; }
  int64_t WindowCount(size_t pool_size) const;

  std::vector<MixRow> MixEntry(int64_t anchor_row, const std::vector<int64_t>& pool) const;

  // Entries are mixed in parallel; rows come back in entry then window order.
  std::vector<MixRow> MixWagon(const Wagon& wagon, const std::vector<int64_t>& pool) const;

  const std::vector<MixCombination>& combinations() const { return combinations_; }

 private:
  std::vector<MixCombination> combinations_;
  std::vector<std::vector<StemColumns>> stems_;
  size_t window_size_{0};
};

}  // namespace eventmix::core
