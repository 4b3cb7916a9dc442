#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <sstream>

#include "winagg/chrono.hpp"
#include "winagg/time_window.hpp"

using namespace winagg;

TEST(TimeWindow, HalfOpenContainment) {
  time_window w(1000, 2000);

  EXPECT_EQ(w.start(), 1000);
  EXPECT_EQ(w.end(), 2000);
  EXPECT_FALSE(w.contains(999));
  EXPECT_TRUE(w.contains(1000));  // left-closed
  EXPECT_TRUE(w.contains(1999));
  EXPECT_FALSE(w.contains(2000)); // right-open
}

TEST(TimeWindow, MaxTimestampIsOneBeforeEnd) {
  EXPECT_EQ(time_window(990000, 1020000).max_timestamp(), 1019999);
  EXPECT_EQ(time_window(-10, -5).max_timestamp(), -6);
}

TEST(TimeWindow, RejectsEmptyOrInvertedInterval) {
  EXPECT_THROW(time_window(5, 5), invalid_config);
  EXPECT_THROW(time_window(6, 5), invalid_config);
  EXPECT_THROW(time_window(6, 5), std::invalid_argument);
}

TEST(TimeWindow, OrderedByStartThenEnd) {
  std::set<time_window> windows{{20, 30}, {10, 40}, {10, 20}, {20, 30}};

  ASSERT_EQ(windows.size(), 3u); // duplicate collapsed
  auto it = windows.begin();
  EXPECT_EQ(*it++, time_window(10, 20));
  EXPECT_EQ(*it++, time_window(10, 40));
  EXPECT_EQ(*it++, time_window(20, 30));
}

TEST(TimeWindow, IntersectAndSpan) {
  time_window a(0, 10);
  time_window b(5, 15);
  time_window c(10, 20);

  EXPECT_TRUE(a.intersects(b));
  EXPECT_FALSE(a.intersects(c)); // touching is not intersecting
  EXPECT_EQ(a.span(c), time_window(0, 20));
  EXPECT_EQ(c.span(a), time_window(0, 20));
}

TEST(TimeWindow, StreamInsertion) {
  std::ostringstream os;
  os << time_window(1, 3);
  EXPECT_EQ(os.str(), "[1, 3)");
}

TEST(Chrono, EventTimeFromTimePoint) {
  using namespace std::chrono;
  sys_time<milliseconds> tp{milliseconds(1030001)};
  EXPECT_EQ(to_timestamp(tp), 1030001);

  // Sub-millisecond precision is truncated
  sys_time<microseconds> fine{microseconds(1000999)};
  EXPECT_EQ(to_timestamp(fine), 1000);
  EXPECT_EQ(to_millis(seconds(30)), 30000);
}
