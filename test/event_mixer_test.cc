#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "eventmix/core/event_mixer.h"
#include "eventmix/io/mix_table_builder.h"
#include "test_tables.h"

using eventmix::core::EventMixer;
using eventmix::core::KeyColumns;
using eventmix::core::RunOptions;
using eventmix::io::MixTableBuilder;
using eventmix::physics::ObservablesOf;
using eventmix::test::EventRow;
using eventmix::test::MakeEvents;
using eventmix::test::MakeEventTable;
using eventmix::test::RecordingSink;
using eventmix::test::ToVector;

namespace {

const std::vector<std::string> kStems{"muplus", "muminus"};

// Routes the default logger into a string for the lifetime of the test.
class EventMixerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    previous_ = spdlog::default_logger();
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_);
    auto logger = std::make_shared<spdlog::logger>("event_mixer_test", sink);
    logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(logger);
  }

  void TearDown() override { spdlog::set_default_logger(previous_); }

  bool Logged(const std::string& text) const {
    return log_.str().find(text) != std::string::npos;
  }

  std::ostringstream log_;
  std::shared_ptr<spdlog::logger> previous_;
};

}  // namespace

TEST_F(EventMixerTest, ThreeEventsWithTrainOfOne) {
  auto rows = MakeEvents({1, 1, 1}, kStems.size());
  EventMixer mixer(1, MakeEventTable(kStems, rows));
  mixer.AddMixCombination("J_psi_1S", kStems);
  EXPECT_TRUE(Logged("Will mix muplus, muminus to form J_psi_1S."));

  MixTableBuilder builder(mixer.combinations());
  auto summary = mixer.RunMixing(builder);
  EXPECT_EQ(summary.entries, 3);
  EXPECT_EQ(summary.wagons_mixed, 2);
  EXPECT_EQ(summary.wagons_filled, 1);
  EXPECT_EQ(summary.rows, 2);

  auto table = builder.Finish();
  ASSERT_EQ(table->num_rows(), 2);
  EXPECT_EQ(table->ColumnNames(), mixer.OutputColumns());

  auto weights = std::static_pointer_cast<arrow::Int64Array>(
      table->GetColumnByName("w_muplus")->chunk(0));
  EXPECT_EQ(weights->Value(0), 1);
  EXPECT_EQ(weights->Value(1), 1);

  // Row 0: event 1 against event 3. Row 1: event 2 against event 1.
  auto masses = std::static_pointer_cast<arrow::DoubleArray>(
      table->GetColumnByName("J_psi_1S_M")->chunk(0));
  auto p4 = [&](int row, int stem) { return ToVector(rows[row].particles[stem]); };
  EXPECT_NEAR(masses->Value(0), ObservablesOf(p4(0, 0) + p4(2, 1)).m, 1e-9);
  EXPECT_NEAR(masses->Value(1), ObservablesOf(p4(1, 0) + p4(0, 1)).m, 1e-9);

  auto anchor_pt = std::static_pointer_cast<arrow::DoubleArray>(
      table->GetColumnByName("muplus_PT")->chunk(0));
  EXPECT_NEAR(anchor_pt->Value(1), ObservablesOf(p4(1, 0)).pt, 1e-9);
}

TEST_F(EventMixerTest, TrainLongerThanStreamMixesFirstEventOnly) {
  EventMixer mixer(5, MakeEventTable(kStems, MakeEvents({1, 1, 1}, kStems.size())));
  mixer.AddMixCombination("J_psi_1S", kStems);

  RecordingSink sink;
  auto summary = mixer.RunMixing(sink);
  ASSERT_EQ(sink.rows.size(), 2u);
  for (const auto& row : sink.rows) {
    EXPECT_EQ(row.blocks[0].anchor_row, 0);
    EXPECT_EQ(row.blocks[0].weight, 2);
  }
  EXPECT_EQ(sink.rows[0].blocks[0].train_rows, (std::vector<int64_t>{2}));
  EXPECT_EQ(sink.rows[1].blocks[0].train_rows, (std::vector<int64_t>{1}));
  EXPECT_EQ(summary.wagons_mixed, 1);
}

TEST_F(EventMixerTest, UnsortedInputMixesLikeSortedInput) {
  auto rows = MakeEvents({2, 1, 3, 1, 2, 1, 1}, kStems.size());
  // Rows of one event keep their relative order.
  std::vector<EventRow> shuffled{rows[6], rows[0], rows[9], rows[3], rows[7], rows[1],
                                 rows[4], rows[10], rows[8], rows[2], rows[5]};

  auto run = [&](const std::vector<EventRow>& input) {
    EventMixer mixer(3, MakeEventTable(kStems, input));
    mixer.AddMixCombination("J_psi_1S", kStems);
    MixTableBuilder builder(mixer.combinations());
    mixer.RunMixing(builder);
    return builder.Finish();
  };

  auto sorted_result = run(rows);
  auto shuffled_result = run(shuffled);
  EXPECT_GT(sorted_result->num_rows(), 0);
  EXPECT_TRUE(sorted_result->Equals(*shuffled_result));
  EXPECT_TRUE(sorted_result->Equals(*run(rows)));
}

TEST_F(EventMixerTest, NoEventIsMixedWithItself) {
  auto rows = MakeEvents({1, 3, 2, 1, 4, 1, 2, 2, 1, 3, 1}, kStems.size());
  auto table = MakeEventTable(kStems, rows);
  for (int64_t length : {1, 2, 4, 10, 20}) {
    EventMixer mixer(length, table);
    mixer.AddMixCombination("J_psi_1S", kStems);
    RecordingSink sink;
    auto summary = mixer.RunMixing(sink);
    EXPECT_EQ(summary.wagons_mixed + summary.wagons_filled, 11);
    for (const auto& row : sink.rows) {
      const auto& block = row.blocks[0];
      const auto anchor = mixer.table().KeyAt(block.anchor_row);
      for (int64_t train_row : block.train_rows) {
        EXPECT_NE(mixer.table().KeyAt(train_row), anchor) << "train_length " << length;
      }
    }
  }
}

TEST_F(EventMixerTest, SeveralCombinationsShareRows) {
  std::vector<std::string> stems{"muplus", "muminus", "eplus", "eminus"};
  EventMixer mixer(2, MakeEventTable(stems, MakeEvents({1, 1, 1, 1, 1}, stems.size())));
  mixer.AddMixCombination("J_psi_1S", {"muplus", "muminus"});
  mixer.AddMixCombination("Z0", {"eplus", "eminus"});

  MixTableBuilder builder(mixer.combinations());
  auto summary = mixer.RunMixing(builder);
  auto table = builder.Finish();
  EXPECT_EQ(table->num_rows(), summary.rows);
  EXPECT_GT(table->num_rows(), 0);
  EXPECT_EQ(table->num_columns(), 10 + 10);

  auto jpsi_w = std::static_pointer_cast<arrow::Int64Array>(
      table->GetColumnByName("w_muplus")->chunk(0));
  auto z_w = std::static_pointer_cast<arrow::Int64Array>(
      table->GetColumnByName("w_eplus")->chunk(0));
  for (int64_t i = 0; i < table->num_rows(); ++i) {
    EXPECT_EQ(jpsi_w->Value(i), z_w->Value(i));
  }
}

TEST_F(EventMixerTest, RejectsCombinationWithDifferentStemCount) {
  std::vector<std::string> stems{"muplus", "muminus", "Kplus", "piminus", "piplus"};
  EventMixer mixer(2, MakeEventTable(stems, MakeEvents({1, 1, 1}, stems.size())));
  mixer.AddMixCombination("J_psi_1S", {"muplus", "muminus"});
  EXPECT_THROW(mixer.AddMixCombination("D_plus", {"Kplus", "piminus", "piplus"}),
               std::invalid_argument);
  EXPECT_EQ(mixer.combinations().size(), 1u);
  EXPECT_FALSE(Logged("to form D_plus"));
}

TEST_F(EventMixerTest, MissingStemColumnWarnsThenFailsOnRead) {
  EventMixer mixer(1, MakeEventTable({"muplus"}, MakeEvents({1, 1, 1}, 1)));
  EXPECT_NO_THROW(mixer.AddMixCombination("J_psi_1S", kStems));
  EXPECT_TRUE(Logged("'muminus_PX' is not a column of the given table, expect problems!"));

  RecordingSink sink;
  EXPECT_THROW(mixer.RunMixing(sink), std::runtime_error);
}

TEST_F(EventMixerTest, MissingKeyColumnsWarnThenFailOnRun) {
  auto table = MakeEventTable(kStems, MakeEvents({1, 1}, kStems.size()));
  EventMixer mixer(1, table, KeyColumns{"runNumber", "evtNum"});
  EXPECT_TRUE(Logged("'evtNum' is not a column of the given table"));
  mixer.AddMixCombination("J_psi_1S", kStems);

  RecordingSink sink;
  EXPECT_THROW(mixer.RunMixing(sink), std::runtime_error);
}

TEST_F(EventMixerTest, EmptyResultIsReported) {
  EventMixer mixer(3, MakeEventTable(kStems, MakeEvents({4}, kStems.size())));
  mixer.AddMixCombination("J_psi_1S", kStems);

  RecordingSink sink;
  auto summary = mixer.RunMixing(sink);
  EXPECT_EQ(summary.rows, 0);
  EXPECT_EQ(summary.wagons_mixed, 1);
  EXPECT_TRUE(Logged("[EventMixer] Mixed table is empty!"));
}

TEST_F(EventMixerTest, EmptyTable) {
  EventMixer mixer(3, MakeEventTable(kStems, {}));
  mixer.AddMixCombination("J_psi_1S", kStems);

  RecordingSink sink;
  auto summary = mixer.RunMixing(sink);
  EXPECT_EQ(summary.entries, 0);
  EXPECT_EQ(summary.rows, 0);
  EXPECT_TRUE(Logged("Mixed table is empty!"));
}

TEST_F(EventMixerTest, ProgressAndVerboseTracing) {
  EventMixer mixer(1, MakeEventTable(kStems, MakeEvents({1, 1, 1}, kStems.size())));
  mixer.AddMixCombination("J_psi_1S", kStems);

  RecordingSink sink;
  RunOptions options;
  options.progress = true;
  options.verbose = true;
  mixer.RunMixing(sink, options);

  EXPECT_TRUE(Logged("Processing entry 1/3 (33%)"));
  EXPECT_TRUE(Logged("Processing entry 3/3 (100%)"));
  EXPECT_TRUE(Logged("muplus from 0 1 1"));
  EXPECT_TRUE(Logged("muminus from 2 1 3"));
  EXPECT_TRUE(Logged("Weight : 1"));
  EXPECT_TRUE(Logged("Mixing done on 2 events"));
}

TEST_F(EventMixerTest, RejectsBadSetup) {
  auto table = MakeEventTable(kStems, MakeEvents({1, 1}, kStems.size()));
  EXPECT_THROW(EventMixer(0, table), std::invalid_argument);

  EventMixer mixer(2, table);
  EXPECT_THROW(mixer.AddMixCombination("single", {"muplus"}), std::invalid_argument);

  RecordingSink sink;
  EXPECT_THROW(mixer.RunMixing(sink), std::runtime_error);

  mixer.AddMixCombination("J_psi_1S", kStems);
  EXPECT_THROW(mixer.AddMixCombination("J_psi_1S", {"muminus", "muplus"}),
               std::invalid_argument);
  EXPECT_EQ(mixer.combinations().size(), 1u);
}
