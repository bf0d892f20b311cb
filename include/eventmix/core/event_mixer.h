#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <arrow/api.h>

#include "eventmix/core/event_table.h"
#include "eventmix/core/mix_combination.h"
#include "eventmix/core/wagon_scanner.h"
#include "eventmix/io/mix_sink.h"

namespace eventmix::core {

struct RunOptions {
  // Log "Processing entry i/N (p%)" whenever the percentage changes.
  bool progress{false};
  // Log every mixed candidate's source rows and weight. Slow.
  bool verbose{false};
};

struct MixSummary {
  int64_t entries{0};
  int64_t wagons_mixed{0};
  int64_t wagons_filled{0};
  int64_t rows{0};
};

// Event mixing over a (run, event) ordered table.
//
// Typical use:
//   EventMixer mixer(50, table);
//   mixer.AddMixCombination("J_psi_1S", {"muplus", "muminus"});
//   io::ParquetMixWriter writer("mixed.parquet", mixer.combinations());
//   mixer.RunMixing(writer);
//   writer.Close();
class EventMixer {
 public:
  EventMixer(int64_t train_length, std::shared_ptr<arrow::Table> table, KeyColumns key_columns = {});

  // stems[0] is the anchor. Warns for every absent stem column. Throws
  // std::invalid_argument for fewer than two stems, a stem count differing
  // from earlier combinations, or a duplicate output column.
  void AddMixCombination(const std::string& mixed_candidate_name,
                         const std::vector<std::string>& stems);

  std::vector<std::string> OutputColumns() const;
  const std::vector<MixCombination>& combinations() const { return combinations_; }
  const std::vector<int64_t>& order_index() const { return order_; }
  const EventTable& table() const { return table_; }
  int64_t train_length() const { return scanner_.train_length(); }

  MixSummary RunMixing(io::MixSink& sink, const RunOptions& options = {}) const;

 private:
  void TraceTrain(const Train& train) const;
  void TraceRow(const MixRow& row) const;

  WagonScanner scanner_;
  EventTable table_;
  std::vector<int64_t> order_;
  std::vector<MixCombination> combinations_;
};

}  // namespace eventmix::core
