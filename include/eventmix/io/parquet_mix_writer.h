#pragma once

#include <string>
#include <vector>

#include "eventmix/io/mix_table_builder.h"

namespace eventmix::io {

// Buffers mixed rows and writes them as one Parquet file on Close().
class ParquetMixWriter : public MixSink {
 public:
  ParquetMixWriter(std::string output_path, std::vector<core::MixCombination> combinations);

  void Append(const core::MixRow& row) override { builder_.Append(row); }
  int64_t NumRows() const override { return builder_.NumRows(); }

  // Writes the file. An empty table is still written so the schema is kept.
  void Close();

  const std::string& output_path() const { return output_path_; }

 private:
  std::string output_path_;
  MixTableBuilder builder_;
  bool closed_{false};
};

}  // namespace eventmix::io
