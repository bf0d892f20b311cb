#pragma once

#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <arrow/api.h>

#include "eventmix/core/event_key.h"
#include "eventmix/core/mix_row.h"
#include "eventmix/io/mix_sink.h"
#include "eventmix/physics/kinematics.h"

namespace eventmix::test {

struct Particle {
  double px{0.0};
  double py{0.0};
  double pz{0.0};
  double e{0.0};
};

inline Particle MakeParticle(double px, double py, double pz, double mass) {
  return Particle{px, py, pz, std::sqrt(px * px + py * py + pz * pz + mass * mass)};
}

inline physics::FourVector ToVector(const Particle& p) {
  return physics::FourVector(p.px, p.py, p.pz, p.e);
}

// One table row: key plus one particle per stem, in the table's stem order.
struct EventRow {
  int64_t run{0};
  int64_t event{0};
  std::vector<Particle> particles;
};

inline void Check(const arrow::Status& status) {
  if (!status.ok()) {
    throw std::runtime_error(status.ToString());
  }
}

template <typename Builder, typename T>
std::shared_ptr<arrow::Array> BuildArray(const std::vector<T>& values) {
  Builder builder;
  for (const auto& v : values) {
    Check(builder.Append(v));
  }
  std::shared_ptr<arrow::Array> out;
  Check(builder.Finish(&out));
  return out;
}

// runNumber is int32 and eventNumber int64, as ntuple producers usually write
// them. Stem columns are float64 unless `single_precision`.
inline std::shared_ptr<arrow::Table> MakeEventTable(const std::vector<std::string>& stems,
                                                    const std::vector<EventRow>& rows,
                                                    bool single_precision = false) {
  std::vector<std::shared_ptr<arrow::Field>> fields;
  std::vector<std::shared_ptr<arrow::Array>> columns;

  std::vector<int32_t> runs;
  std::vector<int64_t> events;
  for (const auto& row : rows) {
    runs.push_back(static_cast<int32_t>(row.run));
    events.push_back(row.event);
  }
  fields.push_back(arrow::field("runNumber", arrow::int32()));
  columns.push_back(BuildArray<arrow::Int32Builder>(runs));
  fields.push_back(arrow::field("eventNumber", arrow::int64()));
  columns.push_back(BuildArray<arrow::Int64Builder>(events));

  const char* suffixes[] = {"_PX", "_PY", "_PZ", "_PE", "_M", "_PT", "_Y"};
  for (size_t s = 0; s < stems.size(); ++s) {
    std::vector<std::vector<double>> values(7);
    for (const auto& row : rows) {
      const Particle& p = row.particles.at(s);
      auto obs = physics::ObservablesOf(ToVector(p));
      const double all[] = {p.px, p.py, p.pz, p.e, obs.m, obs.pt, obs.y};
      for (size_t i = 0; i < 7; ++i) values[i].push_back(all[i]);
    }
    for (size_t i = 0; i < 7; ++i) {
      const std::string name = stems[s] + suffixes[i];
      if (single_precision) {
        std::vector<float> narrowed(values[i].begin(), values[i].end());
        fields.push_back(arrow::field(name, arrow::float32()));
        columns.push_back(BuildArray<arrow::FloatBuilder>(narrowed));
      } else {
        fields.push_back(arrow::field(name, arrow::float64()));
        columns.push_back(BuildArray<arrow::DoubleBuilder>(values[i]));
      }
    }
  }
  return arrow::Table::Make(arrow::schema(fields), columns,
                            static_cast<int64_t>(rows.size()));
}

// `rows_per_event[i]` rows for event i + 1 of run 1; particle kinematics vary per row.
inline std::vector<EventRow> MakeEvents(const std::vector<int>& rows_per_event,
                                        size_t num_stems) {
  std::vector<EventRow> rows;
  int serial = 0;
  for (size_t i = 0; i < rows_per_event.size(); ++i) {
    for (int r = 0; r < rows_per_event[i]; ++r, ++serial) {
      EventRow row{1, static_cast<int64_t>(i + 1), {}};
      for (size_t s = 0; s < num_stems; ++s) {
        row.particles.push_back(MakeParticle(0.5 + 0.25 * serial, -0.3 + 0.1 * s,
                                             1.5 - 0.2 * serial + 0.4 * s, 0.105658));
      }
      rows.push_back(row);
    }
  }
  return rows;
}

inline std::vector<core::EntryRef> MakeEntries(const std::vector<int>& rows_per_event) {
  std::vector<core::EntryRef> entries;
  int64_t row = 0;
  for (size_t i = 0; i < rows_per_event.size(); ++i) {
    for (int r = 0; r < rows_per_event[i]; ++r) {
      entries.push_back(core::EntryRef{row++, core::EventKey{1, static_cast<int64_t>(i + 1)}});
    }
  }
  return entries;
}

class RecordingSink : public io::MixSink {
 public:
  void Append(const core::MixRow& row) override { rows.push_back(row); }
  int64_t NumRows() const override { return static_cast<int64_t>(rows.size()); }

  std::vector<core::MixRow> rows;
};

}  // namespace eventmix::test
