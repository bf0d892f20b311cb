#include "eventmix/core/event_table.h"

#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace eventmix::core {

std::vector<std::string> StemColumns::ColumnNames(const std::string& stem) {
  std::vector<std::string> names;
  for (const char* suffix : kMomentumSuffixes) names.push_back(stem + suffix);
  for (const char* suffix : kObservableSuffixes) names.push_back(stem + suffix);
  return names;
}

StemColumns::Kinematics StemColumns::Read(int64_t row) const {
  if (!missing_.empty()) {
    throw std::runtime_error("Stem '" + stem_ + "' has no column(s): " +
                             utils::parquet::JoinNames(missing_));
  }
  for (size_t i = 0; i < momentum_.size(); ++i) {
    if (!momentum_[i].IsValid(row)) {
      throw std::runtime_error("Null value in " + stem_ + kMomentumSuffixes[i] + " at row " +
                               std::to_string(row));
    }
  }
  for (size_t i = 0; i < observables_.size(); ++i) {
    if (!observables_[i].IsValid(row)) {
      throw std::runtime_error("Null value in " + stem_ + kObservableSuffixes[i] + " at row " +
                               std::to_string(row));
    }
  }
  Kinematics out;
  out.p4.SetPxPyPzE(momentum_[0].Value(row), momentum_[1].Value(row), momentum_[2].Value(row),
                    momentum_[3].Value(row));
  out.observables.m = observables_[0].Value(row);
  out.observables.pt = observables_[1].Value(row);
  out.observables.y = observables_[2].Value(row);
  return out;
}

EventTable::EventTable(std::shared_ptr<arrow::Table> table, KeyColumns key_columns)
    : key_columns_(std::move(key_columns)) {
  if (!table) {
    throw std::invalid_argument("EventTable requires a table.");
  }
  table_ = utils::parquet::CombineChunks(table);

  auto missing = utils::parquet::MissingColumns(*table_, {key_columns_.run, key_columns_.event});
  if (!missing.empty()) {
    key_error_ = "Event key column(s) not found: " + utils::parquet::JoinNames(missing);
    return;
  }
  run_ = utils::parquet::IntegerAccessor::FromColumn(
      table_->GetColumnByName(key_columns_.run), key_columns_.run);
  event_ = utils::parquet::IntegerAccessor::FromColumn(
      table_->GetColumnByName(key_columns_.event), key_columns_.event);
}

bool EventTable::HasColumn(const std::string& name) const {
  return table_->GetColumnByName(name) != nullptr;
}

std::vector<std::string> EventTable::WarnMissing(const std::vector<std::string>& names,
                                                 const std::string& context) const {
  auto missing = utils::parquet::MissingColumns(*table_, names);
  for (const auto& name : missing) {
    spdlog::warn("[{}] '{}' is not a column of the given table, expect problems!", context,
                 name);
  }
  return missing;
}

EventKey EventTable::KeyAt(int64_t row) const {
  if (!key_error_.empty()) {
    throw std::runtime_error(key_error_);
  }
  return EventKey{run_.Value(row), event_.Value(row)};
}

StemColumns EventTable::BindStem(const std::string& stem) const {
  StemColumns out;
  out.stem_ = stem;
  out.missing_ = utils::parquet::MissingColumns(*table_, StemColumns::ColumnNames(stem));
  if (!out.missing_.empty()) {
    return out;
  }
  for (size_t i = 0; i < StemColumns::kMomentumSuffixes.size(); ++i) {
    const std::string name = stem + StemColumns::kMomentumSuffixes[i];
    out.momentum_[i] = utils::parquet::NumericAccessor::FromColumn(table_->GetColumnByName(name),
                                                                  name);
  }
  for (size_t i = 0; i < StemColumns::kObservableSuffixes.size(); ++i) {
    const std::string name = stem + StemColumns::kObservableSuffixes[i];
    out.observables_[i] = utils::parquet::NumericAccessor::FromColumn(
        table_->GetColumnByName(name), name);
  }
  return out;
}

}  // namespace eventmix::core
