#include "eventmix/core/wagon_scanner.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace eventmix::core {

const char* TrainStateName(TrainState state) {
  switch (state) {
    case TrainState::kEmpty: return "EMPTY";
    case TrainState::kFilling: return "FILLING";
    case TrainState::kSteady: return "STEADY";
    case TrainState::kCollided: return "COLLIDED";
  }
  return "UNKNOWN";
}

WagonScanner::WagonScanner(int64_t train_length) : train_length_(train_length) {
  if (train_length_ <= 0) {
    throw std::invalid_argument("train_length must be positive, got " +
                                std::to_string(train_length_));
  }
}

ScanSummary WagonScanner::Run(const std::vector<EntryRef>& entries,
                              const MixFn& mix,
                              const ProgressFn& progress) const {
  const auto total = static_cast<int64_t>(entries.size());
  ScanContext ctx = Begin(entries);
  if (progress && total > 0) {
    progress(ctx.cursor, total);
  }
  while (ctx.cursor < ctx.forward_end) {
    Step(ctx, mix);
    if (progress) {
      progress(ctx.cursor, total);
    }
  }
  Finish(ctx, mix);
  // The train-owned tail is never visited by the forward scan.
  if (progress && ctx.cursor < total) {
    progress(total, total);
  }

  ScanSummary summary;
  summary.entries = total;
  summary.wagons_mixed = ctx.wagons_mixed;
  summary.wagons_filled = ctx.wagons_filled;
  summary.forward_end = ctx.forward_end;
  return summary;
}

ScanContext WagonScanner::Begin(const std::vector<EntryRef>& entries) const {
  ScanContext ctx;
  ctx.entries = &entries;
  ctx.forward_end = static_cast<int64_t>(entries.size());
  if (!entries.empty()) {
    ctx.current = Wagon{entries.front().key, {entries.front().row}, 1};
    ctx.cursor = 1;
  }
  return ctx;
}

void WagonScanner::Step(ScanContext& ctx, const MixFn& mix) const {
  const EntryRef& entry = (*ctx.entries)[static_cast<size_t>(ctx.cursor)];
  if (entry.key == ctx.current.key) {
    ctx.current.rows.push_back(entry.row);
    ctx.current.end = ++ctx.cursor;
    return;
  }

  HandleBoundary(ctx, mix);
  // The bootstrap may have claimed everything from the cursor onward.
  if (ctx.cursor < ctx.forward_end) {
    ctx.current = Wagon{entry.key, {entry.row}, ctx.cursor + 1};
    ++ctx.cursor;
  }
}

void WagonScanner::HandleBoundary(ScanContext& ctx, const MixFn& mix) const {
  switch (ctx.state) {
    case TrainState::kEmpty:
      Bootstrap(ctx);
      break;
    case TrainState::kSteady:
      ctx.train.EvictTail();
      ctx.train.PromoteOrInsert(ctx.stored.key, ctx.stored.rows);
      break;
    case TrainState::kFilling:
    case TrainState::kCollided:
      throw std::logic_error(std::string("Wagon boundary in train state ") +
                             TrainStateName(ctx.state));
  }

  mix(ctx.current, ctx.train);
  ++ctx.wagons_mixed;
  ctx.stored = std::move(ctx.current);
  ctx.current = Wagon{};
}

void WagonScanner::Bootstrap(ScanContext& ctx) const {
  ctx.state = TrainState::kFilling;
  const auto& entries = *ctx.entries;
  const int64_t lower = ctx.current.end;

  std::vector<Wagon> filled;
  int64_t pos = static_cast<int64_t>(entries.size()) - 1;
  for (; pos >= lower; --pos) {
    const EntryRef& entry = entries[static_cast<size_t>(pos)];
    if (!filled.empty() && entry.key == filled.back().key) {
      filled.back().rows.push_back(entry.row);
      continue;
    }
    if (static_cast<int64_t>(filled.size()) == train_length_) {
      break;
    }
    filled.push_back(Wagon{entry.key, {entry.row}, pos + 1});
  }
  const bool collided = pos < lower;

  // Latest event at the front; each event keeps its rows in forward order.
  for (auto it = filled.rbegin(); it != filled.rend(); ++it) {
    std::reverse(it->rows.begin(), it->rows.end());
    ctx.train.PromoteOrInsert(it->key, std::move(it->rows));
  }

  ctx.forward_end = pos + 1;
  ctx.wagons_filled += static_cast<int64_t>(filled.size());
  ctx.state = collided ? TrainState::kCollided : TrainState::kSteady;
  spdlog::debug("[WagonScanner] Train bootstrapped with {} event(s), forward scan ends at {} ({})",
                filled.size(), ctx.forward_end, TrainStateName(ctx.state));
}

void WagonScanner::Finish(ScanContext& ctx, const MixFn& mix) const {
  if (!ctx.current.Empty()) {
    HandleBoundary(ctx, mix);
  }
}

}  // namespace eventmix::core
