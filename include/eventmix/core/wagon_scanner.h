#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "eventmix/core/event_key.h"
#include "eventmix/core/train.h"

namespace eventmix::core {

// Consecutive ordered entries sharing one event key.
struct Wagon {
  EventKey key;
  std::vector<int64_t> rows;
  int64_t end{0};  // ordered position one past the wagon's last entry

  bool Empty() const { return rows.empty(); }
};

enum class TrainState {
  kEmpty,     // nothing loaded yet
  kFilling,   // backward bootstrap in progress
  kSteady,    // one event out, one event in per boundary
  kCollided,  // bootstrap reached the forward scan; the train owns the rest
};

const char* TrainStateName(TrainState state);

// All mutable scan state. Positions index into *entries.
struct ScanContext {
  const std::vector<EntryRef>* entries{nullptr};
  int64_t cursor{0};
  // The forward scan stops here; [forward_end, entries->size()) belongs to the train.
  int64_t forward_end{0};
  Wagon current;
  Wagon stored;
  Train train;
  TrainState state{TrainState::kEmpty};
  int64_t wagons_mixed{0};
  int64_t wagons_filled{0};
};

struct ScanSummary {
  int64_t entries{0};
  int64_t wagons_mixed{0};
  int64_t wagons_filled{0};
  int64_t forward_end{0};
};

// Groups the ordered entry stream into wagons and keeps the train in step.
//
// The train is bootstrapped from the tail of the stream at the first event
// boundary. Afterwards every boundary evicts the train's tail, admits the
// previously mixed wagon, and mixes the wagon that just completed, so a
// wagon never meets its own rows. Events collected by the bootstrap are
// never anchors: the forward scan stops where the bootstrap region begins.
class WagonScanner {
 public:
  using MixFn = std::function<void(const Wagon& wagon, const Train& train)>;
  using ProgressFn = std::function<void(int64_t visited, int64_t total)>;

  explicit WagonScanner(int64_t train_length);

  // `progress` is called after every visited entry and ends at (total, total).
  ScanSummary Run(const std::vector<EntryRef>& entries,
                  const MixFn& mix,
                  const ProgressFn& progress = nullptr) const;

  // The first entry seeds the first wagon without any boundary handling.
  ScanContext Begin(const std::vector<EntryRef>& entries) const;
  // Visits ctx.cursor; detects a boundary when the key changes.
  void Step(ScanContext& ctx, const MixFn& mix) const;
  // Handles the completion of ctx.current.
  void HandleBoundary(ScanContext& ctx, const MixFn& mix) const;
  // Loads up to train_length events backward from the tail, stopping before
  // the region already consumed by the forward scan.
  void Bootstrap(ScanContext& ctx) const;
  // Flushes the in-flight wagon as if one more boundary had occurred.
  void Finish(ScanContext& ctx, const MixFn& mix) const;

  int64_t train_length() const { return train_length_; }

 private:
  int64_t train_length_;
};

}  // namespace eventmix::core
