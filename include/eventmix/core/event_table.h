#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <arrow/api.h>

#include "eventmix/core/event_key.h"
#include "eventmix/physics/kinematics.h"
#include "eventmix/utils/parquet/parquet_utils.h"

namespace eventmix::core {

struct KeyColumns {
  std::string run{"runNumber"};
  std::string event{"eventNumber"};
};

// Momentum and observable columns of one particle stem, bound once.
class StemColumns {
 public:
  struct Kinematics {
    physics::FourVector p4;
    physics::Observables observables;
  };

  static constexpr std::array<const char*, 4> kMomentumSuffixes{"_PX", "_PY", "_PZ", "_PE"};
  static constexpr std::array<const char*, 3> kObservableSuffixes{"_M", "_PT", "_Y"};

  static std::vector<std::string> ColumnNames(const std::string& stem);

  const std::string& stem() const { return stem_; }
  const std::vector<std::string>& missing() const { return missing_; }

  // Throws std::runtime_error naming the missing columns if any are absent,
  // or the column holding a null at `row`.
  Kinematics Read(int64_t row) const;

 private:
  friend class EventTable;

  std::string stem_;
  std::array<utils::parquet::NumericAccessor, 4> momentum_;
  std::array<utils::parquet::NumericAccessor, 3> observables_;
  std::vector<std::string> missing_;
};

// Read-only, randomly indexable view of the source table.
class EventTable {
 public:
  explicit EventTable(std::shared_ptr<arrow::Table> table, KeyColumns key_columns = {});

  int64_t NumRows() const { return table_->num_rows(); }
  bool HasColumn(const std::string& name) const;
  bool HasKeyColumns() const { return key_error_.empty(); }
  const KeyColumns& key_columns() const { return key_columns_; }
  const std::shared_ptr<arrow::Table>& table() const { return table_; }

  // Logs one warning per absent column and returns the absent names.
  std::vector<std::string> WarnMissing(const std::vector<std::string>& names,
                                       const std::string& context) const;

  // Throws std::runtime_error if the run or event column is absent.
  EventKey KeyAt(int64_t row) const;

  StemColumns BindStem(const std::string& stem) const;

 private:
  std::shared_ptr<arrow::Table> table_;
  KeyColumns key_columns_;
  utils::parquet::IntegerAccessor run_;
  utils::parquet::IntegerAccessor event_;
  std::string key_error_;
};

}  // namespace eventmix::core
