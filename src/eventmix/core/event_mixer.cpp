#include "eventmix/core/event_mixer.h"

#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "eventmix/core/mixing_engine.h"
#include "eventmix/core/order_index.h"
#include "eventmix/utils/parquet/parquet_utils.h"
#include "eventmix/utils/timing/timer.h"

namespace eventmix::core {

EventMixer::EventMixer(int64_t train_length,
                       std::shared_ptr<arrow::Table> table,
                       KeyColumns key_columns)
    : scanner_(train_length),
      table_(std::move(table), std::move(key_columns)),
      order_(BuildOrderIndex(table_)) {}

void EventMixer::AddMixCombination(const std::string& mixed_candidate_name,
                                   const std::vector<std::string>& stems) {
  if (stems.size() < 2) {
    throw std::invalid_argument("Combination '" + mixed_candidate_name +
                                "' needs an anchor stem and at least one train stem.");
  }
  MixCombination combination{mixed_candidate_name, stems};
  if (!combinations_.empty() &&
      combination.TrainStemCount() != combinations_.front().TrainStemCount()) {
    throw std::invalid_argument("Combination '" + mixed_candidate_name + "' has " +
                                std::to_string(stems.size()) + " stems but '" +
                                combinations_.front().name + "' has " +
                                std::to_string(combinations_.front().stems.size()) +
                                "; combinations mixed together share their train windows.");
  }

  auto existing = OutputColumns();
  for (const auto& column : combination.OutputColumns()) {
    for (const auto& other : existing) {
      if (column == other) {
        throw std::invalid_argument("Duplicate output column: " + column);
      }
    }
  }

  for (const auto& stem : stems) {
    table_.WarnMissing(StemColumns::ColumnNames(stem), "EventMixer");
  }

  combinations_.push_back(std::move(combination));
  spdlog::info("Will mix {} to form {}.", utils::parquet::JoinNames(stems),
               mixed_candidate_name);
}

std::vector<std::string> EventMixer::OutputColumns() const {
  std::vector<std::string> columns;
  for (const auto& combination : combinations_) {
    auto names = combination.OutputColumns();
    columns.insert(columns.end(), names.begin(), names.end());
  }
  return columns;
}

MixSummary EventMixer::RunMixing(io::MixSink& sink, const RunOptions& options) const {
  if (combinations_.empty()) {
    throw std::runtime_error("No mix combination configured; call AddMixCombination first.");
  }
  utils::timing::ScopedTimer run_timer("mix.run");

  MixingEngine engine(table_, combinations_);
  auto entries = OrderedEntries(table_, order_);

  int64_t rows_written = 0;
  auto mix = [&](const Wagon& wagon, const Train& train) {
    if (options.verbose) {
      TraceTrain(train);
    }
    auto rows = engine.MixWagon(wagon, train.FlattenRows());
    for (const auto& row : rows) {
      if (options.verbose) {
        TraceRow(row);
      }
      sink.Append(row);
    }
    rows_written += static_cast<int64_t>(rows.size());
  };

  int64_t last_percent = -1;
  WagonScanner::ProgressFn progress;
  if (options.progress) {
    progress = [&](int64_t visited, int64_t total) {
      const int64_t percent = visited * 100 / total;
      if (percent != last_percent) {
        last_percent = percent;
        spdlog::info("Processing entry {}/{} ({}%)", visited, total, percent);
      }
    };
  }

  ScanSummary scan;
  {
    utils::timing::ScopedTimer scan_timer("mix.scan");
    scan = scanner_.Run(entries, mix, progress);
  }

  MixSummary summary;
  summary.entries = scan.entries;
  summary.wagons_mixed = scan.wagons_mixed;
  summary.wagons_filled = scan.wagons_filled;
  summary.rows = rows_written;

  if (summary.rows == 0) {
    spdlog::warn("[EventMixer] Mixed table is empty!");
  }
  spdlog::info("Mixing done on {} events ({} more used only as train, {} rows).",
               summary.wagons_mixed, summary.wagons_filled, summary.rows);
  return summary;
}

void EventMixer::TraceTrain(const Train& train) const {
  for (const auto& [key, rows] : train) {
    spdlog::info("train {}: {} row(s)", key.ToString(), rows.size());
  }
  spdlog::info("----------------------------------------------------");
}

void EventMixer::TraceRow(const MixRow& row) const {
  for (size_t c = 0; c < row.blocks.size(); ++c) {
    const auto& block = row.blocks[c];
    const auto& stems = combinations_[c].stems;
    auto anchor_key = table_.KeyAt(block.anchor_row);
    spdlog::info("{} from {} {} {}", stems[0], block.anchor_row, anchor_key.run,
                 anchor_key.event);
    for (size_t k = 0; k < block.train_rows.size(); ++k) {
      auto key = table_.KeyAt(block.train_rows[k]);
      spdlog::info("{} from {} {} {}", stems[k + 1], block.train_rows[k], key.run, key.event);
    }
    spdlog::info("Weight : {}", block.weight);
  }
  spdlog::info("----------------------------------------------------");
}

}  // namespace eventmix::core
