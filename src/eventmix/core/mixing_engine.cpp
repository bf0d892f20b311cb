#include "eventmix/core/mixing_engine.h"

#include <stdexcept>
#include <string>
#include <utility>

#include "eventmix/utils/parallel/parallel.h"
#include "eventmix/utils/timing/timer.h"

namespace eventmix::core {

MixingEngine::MixingEngine(const EventTable& table, std::vector<MixCombination> combinations)
    : combinations_(std::move(combinations)) {
  if (combinations_.empty()) {
    throw std::invalid_argument("MixingEngine needs at least one combination.");
  }
  stems_.reserve(combinations_.size());
  for (const auto& combination : combinations_) {
    if (combination.stems.size() < 2) {
      throw std::invalid_argument("Combination '" + combination.name +
                                  "' needs an anchor stem and at least one train stem.");
    }
    std::vector<StemColumns> bound;
    bound.reserve(combination.stems.size());
    for (const auto& stem : combination.stems) {
      bound.push_back(table.BindStem(stem));
    }
    stems_.push_back(std::move(bound));
  }
  window_size_ = combinations_.front().TrainStemCount();
  for (const auto& combination : combinations_) {
    if (combination.TrainStemCount() != window_size_) {
      throw std::invalid_argument("Combination '" + combination.name + "' has " +
                                  std::to_string(combination.TrainStemCount()) +
                                  " train stem(s), expected " + std::to_string(window_size_) +
                                  " like '" + combinations_.front().name + "'.");
    }
  }
}

int64_t MixingEngine::WindowCount(size_t pool_size) const {
  if (pool_size < window_size_) {
    return 0;
  }
  return static_cast<int64_t>(pool_size - window_size_ + 1);
}

std::vector<MixRow> MixingEngine::MixEntry(int64_t anchor_row,
                                           const std::vector<int64_t>& pool) const {
  const int64_t windows = WindowCount(pool.size());
  if (windows == 0) {
    return {};
  }

  std::vector<StemColumns::Kinematics> anchors;
  anchors.reserve(combinations_.size());
  for (const auto& bound : stems_) {
    anchors.push_back(bound.front().Read(anchor_row));
  }

  std::vector<MixRow> rows(static_cast<size_t>(windows));
  for (int64_t n = 0; n < windows; ++n) {
    auto& row = rows[static_cast<size_t>(n)];
    row.blocks.resize(combinations_.size());
    for (size_t c = 0; c < combinations_.size(); ++c) {
      const auto& bound = stems_[c];
      const size_t train_stems = combinations_[c].TrainStemCount();
      auto& block = row.blocks[c];

      physics::FourVector total = anchors[c].p4;
      block.daughters.reserve(bound.size());
      block.daughters.push_back(anchors[c].observables);
      block.anchor_row = anchor_row;
      block.train_rows.reserve(train_stems);
      for (size_t k = 0; k < train_stems; ++k) {
        const int64_t train_row = pool[static_cast<size_t>(n) + k];
        auto daughter = bound[k + 1].Read(train_row);
        total += daughter.p4;
        block.daughters.push_back(daughter.observables);
        block.train_rows.push_back(train_row);
      }
      block.mixed = physics::ObservablesOf(total);
      block.weight = static_cast<int64_t>(pool.size() - train_stems + 1);
    }
  }
  return rows;
}

std::vector<MixRow> MixingEngine::MixWagon(const Wagon& wagon,
                                           const std::vector<int64_t>& pool) const {
  if (WindowCount(pool.size()) == 0 || wagon.Empty()) {
    return {};
  }
  utils::timing::ScopedTimer timer("mix.wagon");

  using utils::parallel::Parallel;
  const auto num_entries = static_cast<Parallel::Index>(wagon.rows.size());
  std::vector<std::vector<MixRow>> per_entry(wagon.rows.size());
  Parallel::For(0, num_entries, [&](Parallel::Index i) {
    per_entry[static_cast<size_t>(i)] = MixEntry(wagon.rows[static_cast<size_t>(i)], pool);
  });

  std::vector<Parallel::Index> counts(per_entry.size());
  for (size_t i = 0; i < per_entry.size(); ++i) {
    counts[i] = static_cast<Parallel::Index>(per_entry[i].size());
  }
  auto offsets = Parallel::PrefixSum(counts);

  std::vector<MixRow> rows(static_cast<size_t>(offsets.back()));
  Parallel::For(0, num_entries, [&](Parallel::Index i) {
    auto& entry_rows = per_entry[static_cast<size_t>(i)];
    std::move(entry_rows.begin(), entry_rows.end(),
              rows.begin() + offsets[static_cast<size_t>(i)]);
  });
  return rows;
}

}  // namespace eventmix::core
