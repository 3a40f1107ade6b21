#include <stdexcept>

#include <gtest/gtest.h>

#include "position_history.hpp"

TEST(PositionHistoryTest, KeepsInsertionOrder) {
  PositionHistory history;
  history.push(0.1);
  history.push(0.2);
  history.push(0.3);

  ASSERT_EQ(3u, history.size());
  EXPECT_DOUBLE_EQ(0.1, history.front());
  EXPECT_DOUBLE_EQ(0.2, history[1]);
  EXPECT_DOUBLE_EQ(0.3, history.back());
  EXPECT_FALSE(history.full());
}

TEST(PositionHistoryTest, EvictsOldestWhenFull) {
  PositionHistory history;
  for (int i = 0; i < 20; ++i) {
    history.push(i * 0.01);
  }

  ASSERT_EQ(PositionHistory::CAPACITY, history.size());
  EXPECT_TRUE(history.full());
  // Samples 5..19 remain, oldest first
  EXPECT_DOUBLE_EQ(0.05, history.front());
  EXPECT_DOUBLE_EQ(0.19, history.back());
  for (std::size_t i = 1; i < history.size(); ++i) {
    EXPECT_GT(history[i], history[i - 1]);
  }
}

TEST(PositionHistoryTest, ClearEmptiesAndAllowsReuse) {
  PositionHistory history;
  for (int i = 0; i < 17; ++i) {
    history.push(0.5);
  }
  history.clear();
  EXPECT_TRUE(history.empty());

  history.push(0.7);
  ASSERT_EQ(1u, history.size());
  EXPECT_DOUBLE_EQ(0.7, history.front());
  EXPECT_DOUBLE_EQ(0.7, history.back());
}

TEST(PositionHistoryTest, AtChecksBounds) {
  PositionHistory history;
  history.push(0.4);
  EXPECT_DOUBLE_EQ(0.4, history.at(0));
  EXPECT_THROW(history.at(1), std::out_of_range);
}
