#include "eventmix/io/parquet_mix_writer.h"

#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "eventmix/utils/timing/timer.h"

namespace eventmix::io {

ParquetMixWriter::ParquetMixWriter(std::string output_path,
                                   std::vector<core::MixCombination> combinations)
    : output_path_(std::move(output_path)), builder_(std::move(combinations)) {}

void ParquetMixWriter::Close() {
  if (closed_) {
    throw std::runtime_error("ParquetMixWriter already closed: " + output_path_);
  }
  utils::timing::ScopedTimer timer("parquet.write_mixed");
  const int64_t rows = builder_.NumRows();
  auto table = builder_.Finish();

  auto out_result = arrow::io::FileOutputStream::Open(output_path_);
  if (!out_result.ok()) {
    throw std::runtime_error(out_result.status().ToString());
  }
  auto out = out_result.MoveValueUnsafe();
  auto status = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), out);
  if (!status.ok()) {
    throw std::runtime_error(status.ToString());
  }
  status = out->Close();
  if (!status.ok()) {
    throw std::runtime_error(status.ToString());
  }
  closed_ = true;
  spdlog::info("[ParquetMixWriter] Wrote {} mixed rows to {}", rows, output_path_);
}

}  // namespace eventmix::io
