#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "eventmix/core/train.h"

using eventmix::core::EventKey;
using eventmix::core::Train;

namespace {

std::vector<EventKey> K(std::initializer_list<int64_t> events) {
  std::vector<EventKey> keys;
  for (auto e : events) keys.push_back(EventKey{1, e});
  return keys;
}

}  // namespace

TEST(TrainTest, InsertPutsNewKeysAtTheFront) {
  Train train;
  train.PromoteOrInsert({1, 1}, {10});
  train.PromoteOrInsert({1, 2}, {20, 21});
  train.PromoteOrInsert({1, 3}, {30});

  EXPECT_EQ(train.Size(), 3u);
  EXPECT_EQ(train.Keys(), K({3, 2, 1}));
  EXPECT_EQ(train.Values(), (std::vector<Train::Rows>{{30}, {20, 21}, {10}}));
}

TEST(TrainTest, PromoteMovesKeyWithoutTouchingRows) {
  Train train;
  train.PromoteOrInsert({1, 1}, {10, 11});
  train.PromoteOrInsert({1, 2}, {20});
  train.PromoteOrInsert({1, 3}, {30});

  train.PromoteOrInsert({1, 1}, {99});

  EXPECT_EQ(train.Size(), 3u);
  EXPECT_EQ(train.Keys(), K({1, 3, 2}));
  ASSERT_NE(train.Find({1, 1}), nullptr);
  EXPECT_EQ(*train.Find({1, 1}), (Train::Rows{10, 11}));
}

TEST(TrainTest, PromotingTheFrontKeyChangesNothing) {
  Train train;
  train.PromoteOrInsert({1, 1}, {10});
  train.PromoteOrInsert({1, 2}, {20});
  auto keys = train.Keys();
  auto values = train.Values();

  train.PromoteOrInsert({1, 2}, {});

  EXPECT_EQ(train.Keys(), keys);
  EXPECT_EQ(train.Values(), values);
}

TEST(TrainTest, EvictTailRemovesLeastRecentlyPromoted) {
  Train train;
  train.PromoteOrInsert({1, 1}, {10});
  train.PromoteOrInsert({1, 2}, {20});
  train.PromoteOrInsert({1, 3}, {30});
  train.PromoteOrInsert({1, 1}, {});

  auto evicted = train.EvictTail();
  EXPECT_EQ(evicted.first, (EventKey{1, 2}));
  EXPECT_EQ(evicted.second, (Train::Rows{20}));
  EXPECT_FALSE(train.Contains({1, 2}));
  EXPECT_EQ(train.Keys(), K({1, 3}));

  // An evicted key can come back as a fresh entry.
  train.PromoteOrInsert({1, 2}, {22});
  EXPECT_EQ(*train.Find({1, 2}), (Train::Rows{22}));
}

TEST(TrainTest, EvictTailOnEmptyTrainThrows) {
  Train train;
  EXPECT_THROW(train.EvictTail(), std::runtime_error);

  train.PromoteOrInsert({1, 1}, {10});
  train.EvictTail();
  EXPECT_TRUE(train.Empty());
  EXPECT_THROW(train.EvictTail(), std::runtime_error);
}

TEST(TrainTest, FlattenRowsFollowsTrainOrder) {
  Train train;
  train.PromoteOrInsert({1, 1}, {1, 2});
  train.PromoteOrInsert({1, 2}, {3});
  train.PromoteOrInsert({2, 1}, {4, 5, 6});

  EXPECT_EQ(train.FlattenRows(), (Train::Rows{4, 5, 6, 3, 1, 2}));
}

TEST(TrainTest, KeysDifferingOnlyByRunAreDistinct) {
  Train train;
  train.PromoteOrInsert({1, 7}, {1});
  train.PromoteOrInsert({2, 7}, {2});
  EXPECT_EQ(train.Size(), 2u);
  EXPECT_TRUE(train.Contains({1, 7}));
  EXPECT_TRUE(train.Contains({2, 7}));
  EXPECT_FALSE(train.Contains({3, 7}));
}

TEST(TrainTest, ClearEmptiesTrainAndIndex) {
  Train train;
  train.PromoteOrInsert({1, 1}, {1});
  train.Clear();
  EXPECT_TRUE(train.Empty());
  EXPECT_EQ(train.Find({1, 1}), nullptr);
  EXPECT_TRUE(train.FlattenRows().empty());
}
