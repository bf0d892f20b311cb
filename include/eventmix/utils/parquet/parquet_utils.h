#pragma once

#include <arrow/api.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace eventmix::utils::parquet {

// Reads a float or double column as double. Expects a single-chunk column.
class NumericAccessor {
 public:
  NumericAccessor() = default;

  static NumericAccessor FromColumn(const std::shared_ptr<arrow::ChunkedArray>& column,
                                    const std::string& context);

  bool IsValid(int64_t idx) const { return arr_ && arr_->IsValid(idx); }
  double Value(int64_t idx) const { return is_double_ ? d_[idx] : static_cast<double>(f_[idx]); }

 private:
  std::shared_ptr<arrow::Array> arr_;
  const float* f_{nullptr};
  const double* d_{nullptr};
  bool is_double_{false};
};

// Reads any Arrow integer column as int64. Expects a single-chunk column.
class IntegerAccessor {
 public:
  IntegerAccessor() = default;

  static IntegerAccessor FromColumn(const std::shared_ptr<arrow::ChunkedArray>& column,
                                    const std::string& context);

  int64_t Value(int64_t idx) const;

 private:
  std::shared_ptr<arrow::Array> arr_;
  const void* raw_{nullptr};
  arrow::Type::type type_id_{arrow::Type::NA};
};

std::string JoinNames(const std::vector<std::string>& names,
                      const std::string& sep = ", ");

std::vector<std::string> MissingColumns(const arrow::Table& table,
                                        const std::vector<std::string>& required);

// Concatenates same-schema tables and combines each column into one chunk.
std::shared_ptr<arrow::Table> ConcatenateTablesByRows(
    const std::vector<std::shared_ptr<arrow::Table>>& tables);

std::shared_ptr<arrow::Table> CombineChunks(const std::shared_ptr<arrow::Table>& table);

}  // namespace eventmix::utils::parquet
