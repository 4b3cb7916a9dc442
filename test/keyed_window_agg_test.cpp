#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "winagg/agg/sum.hpp"
#include "winagg/keyed_window_agg.hpp"

namespace {
using namespace winagg;
using namespace std::chrono_literals;

class KeyedWindowAggTest : public ::testing::Test {
protected:
  using count_agg = keyed_window_agg<std::string, int>;
  using sum_agg = keyed_window_agg<std::string, int, agg::sum<int64_t>>;
};

TEST_F(KeyedWindowAggTest, PanesCreatedLazily) {
  count_agg aggr(win::fixed(10ms));
  EXPECT_TRUE(aggr.empty());
  EXPECT_EQ(aggr.phase(), pane_phase::open);

  aggr.accumulate("a", 0, 1);
  aggr.accumulate("a", 0, 5);
  aggr.accumulate("b", 0, 7);
  aggr.accumulate("a", 0, 35); // skips [10, 20) and [20, 30)

  EXPECT_EQ(aggr.num_records(), 4u);
  EXPECT_EQ(aggr.num_panes(), 3u);

  ASSERT_NE(aggr.find({0, 10}, "a"), nullptr);
  EXPECT_EQ(*aggr.find({0, 10}, "a"), 2);
  EXPECT_EQ(*aggr.find({0, 10}, "b"), 1);
  EXPECT_EQ(*aggr.find({30, 40}, "a"), 1);

  // Nothing fell into these
  EXPECT_EQ(aggr.find({10, 20}, "a"), nullptr);
  EXPECT_EQ(aggr.find({20, 30}, "a"), nullptr);
  EXPECT_EQ(aggr.find({30, 40}, "b"), nullptr);
}

TEST_F(KeyedWindowAggTest, SlidingFanOut) {
  count_agg aggr(win::sliding(30s, 15s));

  aggr.accumulate(make_record(std::string("k"), 0, 1000000));

  // One record, two panes
  EXPECT_EQ(aggr.num_records(), 1u);
  ASSERT_EQ(aggr.num_panes(), 2u);
  EXPECT_EQ(*aggr.find({975000, 1005000}, "k"), 1);
  EXPECT_EQ(*aggr.find({990000, 1020000}, "k"), 1);

  aggr.accumulate("k", 0, 1004999);
  EXPECT_EQ(*aggr.find({975000, 1005000}, "k"), 2);
  EXPECT_EQ(*aggr.find({990000, 1020000}, "k"), 2);
}

TEST_F(KeyedWindowAggTest, ArrivalOrderDoesNotMatter) {
  count_agg in_order(win::sliding(20s, 12s));
  count_agg reversed(win::sliding(20s, 12s));

  std::vector<timestamp> ts{1000000, 1030001, 1059999, 1060000};
  for (auto t : ts) {
    in_order.accumulate("abc", 0, t);
  }
  for (auto it = ts.rbegin(); it != ts.rend(); ++it) {
    reversed.accumulate("abc", 0, *it);
  }

  EXPECT_EQ(in_order.state_view(), reversed.state_view());
}

TEST_F(KeyedWindowAggTest, SumPolicy) {
  sum_agg aggr(win::fixed(10ms));

  aggr.accumulate("x", 3, 1);
  aggr.accumulate("x", 4, 2);
  aggr.accumulate("y", 10, 3);
  aggr.accumulate("x", 100, 11);

  EXPECT_EQ(*aggr.find({0, 10}, "x"), 7);
  EXPECT_EQ(*aggr.find({0, 10}, "y"), 10);
  EXPECT_EQ(*aggr.find({10, 20}, "x"), 100);
}

TEST_F(KeyedWindowAggTest, SlidingGapDropsRecord) {
  count_agg aggr(win::sliding(5ms, 10ms));

  aggr.accumulate("a", 0, 7); // falls between [0, 5) and [10, 15)

  EXPECT_EQ(aggr.num_records(), 1u);
  EXPECT_TRUE(aggr.empty());
}

TEST_F(KeyedWindowAggTest, SealedAggregatorRejectsRecords) {
  count_agg aggr(win::fixed(10ms));
  aggr.accumulate("a", 0, 1);
  aggr.seal();

  EXPECT_EQ(aggr.phase(), pane_phase::complete);
  EXPECT_THROW(aggr.accumulate("a", 0, 2), std::logic_error);
  EXPECT_EQ(*aggr.find({0, 10}, "a"), 1);
}

TEST_F(KeyedWindowAggTest, UnrepresentableEventTimeTouchesNoPane) {
  count_agg aggr(win::sliding(30s, 15s));
  aggr.accumulate("a", 0, 1000000);
  ASSERT_EQ(aggr.num_panes(), 2u);

  EXPECT_THROW(aggr.accumulate("a", 0, max_timestamp - 5), timestamp_out_of_range);
  EXPECT_THROW(aggr.accumulate("a", 0, min_timestamp + 5), timestamp_out_of_range);

  EXPECT_EQ(aggr.num_panes(), 2u);
  EXPECT_EQ(aggr.num_records(), 1u);
  EXPECT_EQ(aggr.phase(), pane_phase::open);

  // Still accepting records afterwards
  aggr.accumulate("a", 0, 1000001);
  EXPECT_EQ(*aggr.find({990000, 1020000}, "a"), 2);
}

TEST_F(KeyedWindowAggTest, TakePanesLeavesNothingBehind) {
  count_agg aggr(win::fixed(10ms));
  aggr.accumulate("a", 0, 1);
  aggr.accumulate("a", 0, 11);

  auto panes = aggr.take_panes();
  EXPECT_EQ(panes.size(), 2u);
  EXPECT_TRUE(aggr.empty());
  EXPECT_EQ(aggr.phase(), pane_phase::emitted);
  EXPECT_THROW(aggr.accumulate("a", 0, 1), std::logic_error);
  EXPECT_TRUE(aggr.take_panes().empty());
}

TEST(PaneId, OrderedByWindowThenKey) {
  using id = pane_id<std::string>;
  EXPECT_LT((id{{0, 10}, "z"}), (id{{5, 10}, "a"}));
  EXPECT_LT((id{{0, 10}, "a"}), (id{{0, 10}, "b"}));
  EXPECT_LT((id{{0, 10}, "z"}), (id{{0, 20}, "a"}));
  EXPECT_FALSE((id{{0, 10}, "a"}) < (id{{0, 10}, "a"}));
}
} // namespace
