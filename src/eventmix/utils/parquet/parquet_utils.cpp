#include "eventmix/utils/parquet/parquet_utils.h"

#include <sstream>
#include <stdexcept>

#include "eventmix/utils/timing/timer.h"

namespace eventmix::utils::parquet {

namespace {

std::shared_ptr<arrow::Array> SingleChunk(const std::shared_ptr<arrow::ChunkedArray>& column,
                                          const std::string& context) {
  if (!column) {
    throw std::runtime_error("Missing column for " + context + ".");
  }
  if (column->num_chunks() == 0) {
    return nullptr;
  }
  if (column->num_chunks() != 1) {
    throw std::runtime_error(context + " column has multiple chunks.");
  }
  return column->chunk(0);
}

template <typename ArrowType>
const void* RawValues(const std::shared_ptr<arrow::Array>& arr) {
  return static_cast<const arrow::NumericArray<ArrowType>&>(*arr).raw_values();
}

}  // namespace

NumericAccessor NumericAccessor::FromColumn(const std::shared_ptr<arrow::ChunkedArray>& column,
                                            const std::string& context) {
  NumericAccessor out;
  if (column && column->type()->id() != arrow::Type::DOUBLE &&
      column->type()->id() != arrow::Type::FLOAT) {
    throw std::runtime_error("Unsupported numeric type in " + context + ": " +
                             column->type()->ToString());
  }
  out.arr_ = SingleChunk(column, context);
  if (!out.arr_) {
    return out;
  }
  if (out.arr_->type_id() == arrow::Type::DOUBLE) {
    out.d_ = static_cast<const double*>(RawValues<arrow::DoubleType>(out.arr_));
    out.is_double_ = true;
  } else {
    out.f_ = static_cast<const float*>(RawValues<arrow::FloatType>(out.arr_));
    out.is_double_ = false;
  }
  return out;
}

IntegerAccessor IntegerAccessor::FromColumn(const std::shared_ptr<arrow::ChunkedArray>& column,
                                            const std::string& context) {
  IntegerAccessor out;
  out.arr_ = SingleChunk(column, context);
  if (!out.arr_) {
    return out;
  }
  out.type_id_ = out.arr_->type_id();
  switch (out.type_id_) {
    case arrow::Type::INT8: out.raw_ = RawValues<arrow::Int8Type>(out.arr_); break;
    case arrow::Type::INT16: out.raw_ = RawValues<arrow::Int16Type>(out.arr_); break;
    case arrow::Type::INT32: out.raw_ = RawValues<arrow::Int32Type>(out.arr_); break;
    case arrow::Type::INT64: out.raw_ = RawValues<arrow::Int64Type>(out.arr_); break;
    case arrow::Type::UINT8: out.raw_ = RawValues<arrow::UInt8Type>(out.arr_); break;
    case arrow::Type::UINT16: out.raw_ = RawValues<arrow::UInt16Type>(out.arr_); break;
    case arrow::Type::UINT32: out.raw_ = RawValues<arrow::UInt32Type>(out.arr_); break;
    case arrow::Type::UINT64: out.raw_ = RawValues<arrow::UInt64Type>(out.arr_); break;
    default:
      throw std::runtime_error("Unsupported integer type in " + context + ": " +
                               out.arr_->type()->ToString());
  }
  return out;
}

int64_t IntegerAccessor::Value(int64_t idx) const {
  switch (type_id_) {
    case arrow::Type::INT8: return static_cast<const int8_t*>(raw_)[idx];
    case arrow::Type::INT16: return static_cast<const int16_t*>(raw_)[idx];
    case arrow::Type::INT32: return static_cast<const int32_t*>(raw_)[idx];
    case arrow::Type::INT64: return static_cast<const int64_t*>(raw_)[idx];
    case arrow::Type::UINT8: return static_cast<const uint8_t*>(raw_)[idx];
    case arrow::Type::UINT16: return static_cast<const uint16_t*>(raw_)[idx];
    case arrow::Type::UINT32: return static_cast<const uint32_t*>(raw_)[idx];
    case arrow::Type::UINT64:
      return static_cast<int64_t>(static_cast<const uint64_t*>(raw_)[idx]);
    default:
      throw std::runtime_error("IntegerAccessor: read from an unbound column.");
  }
}

std::string JoinNames(const std::vector<std::string>& names, const std::string& sep) {
  std::ostringstream out;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i > 0) out << sep;
    out << names[i];
  }
  return out.str();
}

std::vector<std::string> MissingColumns(const arrow::Table& table,
                                        const std::vector<std::string>& required) {
  std::vector<std::string> missing;
  for (const auto& name : required) {
    if (!table.GetColumnByName(name)) {
      missing.push_back(name);
    }
  }
  return missing;
}

std::shared_ptr<arrow::Table> ConcatenateTablesByRows(
    const std::vector<std::shared_ptr<arrow::Table>>& tables) {
  utils::timing::ScopedTimer total_timer("parquet.concatenate_tables_by_rows");
  if (tables.empty()) {
    throw std::runtime_error("No tables provided to concatenate.");
  }
  auto result = arrow::ConcatenateTables(tables);
  if (!result.ok()) {
    throw std::runtime_error(result.status().ToString());
  }
  return CombineChunks(result.MoveValueUnsafe());
}

std::shared_ptr<arrow::Table> CombineChunks(const std::shared_ptr<arrow::Table>& table) {
  if (!table) {
    throw std::runtime_error("CombineChunks: null table.");
  }
  utils::timing::ScopedTimer combine_timer("parquet.combine_chunks");
  auto result = table->CombineChunks(arrow::default_memory_pool());
  if (!result.ok()) {
    throw std::runtime_error(result.status().ToString());
  }
  return result.MoveValueUnsafe();
}

}  // namespace eventmix::utils::parquet
