#include "eventmix/io/mix_table_builder.h"

#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace eventmix::io {

namespace {

void ThrowIfError(const arrow::Status& status) {
  if (!status.ok()) {
    throw std::runtime_error(status.ToString());
  }
}

template <typename Builder>
std::shared_ptr<arrow::Array> FinishArray(Builder& builder) {
  std::shared_ptr<arrow::Array> out;
  ThrowIfError(builder.Finish(&out));
  return out;
}

}  // namespace

MixTableBuilder::MixTableBuilder(std::vector<core::MixCombination> combinations)
    : combinations_(std::move(combinations)) {
  std::vector<std::shared_ptr<arrow::Field>> fields;
  std::unordered_set<std::string> seen;
  for (const auto& combination : combinations_) {
    auto columns = combination.OutputColumns();
    std::vector<std::unique_ptr<arrow::DoubleBuilder>> builders;
    for (size_t i = 0; i < columns.size(); ++i) {
      if (!seen.insert(columns[i]).second) {
        throw std::invalid_argument("Duplicate output column: " + columns[i]);
      }
      const bool is_weight = i + 1 == columns.size();
      fields.push_back(arrow::field(columns[i], is_weight ? arrow::int64() : arrow::float64()));
      if (!is_weight) {
        builders.push_back(std::make_unique<arrow::DoubleBuilder>());
      }
    }
    observables_.push_back(std::move(builders));
    weights_.push_back(std::make_unique<arrow::Int64Builder>());
  }
  schema_ = arrow::schema(fields);
}

void MixTableBuilder::Append(const core::MixRow& row) {
  if (row.blocks.size() != combinations_.size()) {
    throw std::runtime_error("Mixed row has " + std::to_string(row.blocks.size()) +
                             " blocks, expected " + std::to_string(combinations_.size()) + ".");
  }
  for (size_t c = 0; c < combinations_.size(); ++c) {
    if (row.blocks[c].daughters.size() != combinations_[c].stems.size()) {
      throw std::runtime_error("Mixed row for " + combinations_[c].name +
                               " has the wrong number of daughters.");
    }
  }
  for (size_t c = 0; c < combinations_.size(); ++c) {
    const auto& block = row.blocks[c];
    auto& builders = observables_[c];
    size_t column = 0;
    auto append = [&](const physics::Observables& obs) {
      ThrowIfError(builders[column++]->Append(obs.m));
      ThrowIfError(builders[column++]->Append(obs.pt));
      ThrowIfError(builders[column++]->Append(obs.y));
    };
    append(block.mixed);
    for (const auto& daughter : block.daughters) {
      append(daughter);
    }
    ThrowIfError(weights_[c]->Append(block.weight));
  }
  ++num_rows_;
}

std::shared_ptr<arrow::Table> MixTableBuilder::Finish() {
  std::vector<std::shared_ptr<arrow::Array>> columns;
  columns.reserve(static_cast<size_t>(schema_->num_fields()));
  for (size_t c = 0; c < combinations_.size(); ++c) {
    for (auto& builder : observables_[c]) {
      columns.push_back(FinishArray(*builder));
    }
    columns.push_back(FinishArray(*weights_[c]));
  }
  auto table = arrow::Table::Make(schema_, columns, num_rows_);
  num_rows_ = 0;
  return table;
}

}  // namespace eventmix::io
