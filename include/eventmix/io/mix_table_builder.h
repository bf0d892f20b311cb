#pragma once

#include <memory>
#include <string>
#include <vector>

#include <arrow/api.h>

#include "eventmix/core/mix_combination.h"
#include "eventmix/io/mix_sink.h"

namespace eventmix::io {

// Accumulates mixed rows into Arrow builders: float64 observables, int64 weights.
class MixTableBuilder : public MixSink {
 public:
  explicit MixTableBuilder(std::vector<core::MixCombination> combinations);

  void Append(const core::MixRow& row) override;
  int64_t NumRows() const override { return num_rows_; }

  std::shared_ptr<arrow::Schema> schema() const { return schema_; }

  // Returns the accumulated table and resets the builder.
  std::shared_ptr<arrow::Table> Finish();

 private:
  std::vector<core::MixCombination> combinations_;
  std::shared_ptr<arrow::Schema> schema_;
  // Per combination: 3 * (stems + 1) observable builders.
  std::vector<std::vector<std::unique_ptr<arrow::DoubleBuilder>>> observables_;
  std::vector<std::unique_ptr<arrow::Int64Builder>> weights_;
  int64_t num_rows_{0};
};

}  // namespace eventmix::io
