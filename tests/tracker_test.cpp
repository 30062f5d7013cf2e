#include "tasks/inspection/tracker.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

using inspection::Tracker;

namespace
{
const cv::Rect2d BOX_A(100, 100, 80, 60);
const cv::Rect2d BOX_B(400, 300, 80, 60);

std::vector<int> ids_of(const inspection::TrackResult & result)
{
  std::vector<int> ids;
  for (const auto & t : result.tracks) ids.push_back(t.id);
  std::sort(ids.begin(), ids.end());
  return ids;
}
}  // namespace

TEST(TrackerTest, FirstTrackGetsIdOne)
{
  Tracker tracker(2, 3, 0.3);
  auto result = tracker.update({BOX_A});
  EXPECT_EQ(ids_of(result), (std::vector<int>{1}));
  EXPECT_TRUE(result.disappeared.empty());
}

TEST(TrackerTest, IdsRestartPerInstance)
{
  Tracker first(2, 3, 0.3);
  first.update({BOX_A, BOX_B});

  Tracker second(2, 3, 0.3);
  EXPECT_EQ(ids_of(second.update({BOX_B})), (std::vector<int>{1}));
}

TEST(TrackerTest, StationaryBoxKeepsItsId)
{
  Tracker tracker(2, 3, 0.3);
  for (int i = 0; i < 30; i++) {
    auto result = tracker.update({BOX_A});
    ASSERT_EQ(ids_of(result), (std::vector<int>{1})) << "frame " << i;
  }
  EXPECT_EQ(tracker.size(), 1u);
}

TEST(TrackerTest, NewTrackAfterGraceNeedsMinHits)
{
  Tracker tracker(5, 3, 0.3);
  for (int i = 0; i < 5; i++) tracker.update({BOX_A});

  // 第 6 帧出现的新目标，要连续命中 3 次才对外可见
  EXPECT_EQ(ids_of(tracker.update({BOX_A, BOX_B})), (std::vector<int>{1}));
  EXPECT_EQ(ids_of(tracker.update({BOX_A, BOX_B})), (std::vector<int>{1}));
  EXPECT_EQ(ids_of(tracker.update({BOX_A, BOX_B})), (std::vector<int>{1}));
  EXPECT_EQ(ids_of(tracker.update({BOX_A, BOX_B})), (std::vector<int>{1, 2}));
}

TEST(TrackerTest, MissedTrackIsNotReportedButSurvivesMaxAge)
{
  Tracker tracker(3, 1, 0.3);
  tracker.update({BOX_A});
  tracker.update({BOX_A});

  for (int i = 0; i < 3; i++) {
    auto result = tracker.update({});
    EXPECT_TRUE(result.tracks.empty());
    EXPECT_TRUE(result.disappeared.empty());
  }
  EXPECT_EQ(tracker.size(), 1u);

  // 重新出现时沿用原 id
  EXPECT_EQ(ids_of(tracker.update({BOX_A})), (std::vector<int>{1}));
}

TEST(TrackerTest, ReportedTrackDisappearsExactlyOnce)
{
  Tracker tracker(2, 1, 0.3);
  tracker.update({BOX_A});
  tracker.update({BOX_A});

  std::vector<int> disappeared;
  for (int i = 0; i < 6; i++) {
    auto result = tracker.update({});
    disappeared.insert(disappeared.end(), result.disappeared.begin(), result.disappeared.end());
    if (i < 2) EXPECT_TRUE(result.disappeared.empty()) << "frame " << i;
    if (i == 2) EXPECT_EQ(result.disappeared, (std::vector<int>{1}));
  }

  EXPECT_EQ(disappeared, (std::vector<int>{1}));
  EXPECT_EQ(tracker.size(), 0u);
}

TEST(TrackerTest, NeverReportedTrackIsRemovedSilently)
{
  Tracker tracker(2, 3, 0.3);
  for (int i = 0; i < 4; i++) tracker.update({BOX_A});

  // 启动宽限期已过，只出现一帧的目标从未对外可见
  tracker.update({BOX_A, BOX_B});
  for (int i = 0; i < 5; i++) {
    auto result = tracker.update({BOX_A});
    EXPECT_TRUE(result.disappeared.empty());
  }
  EXPECT_EQ(tracker.size(), 1u);
}

TEST(TrackerTest, IdsStrictlyIncreaseAndAreNeverReused)
{
  Tracker tracker(1, 1, 0.3);
  std::set<int> seen;
  int last = 0;

  for (int round = 0; round < 5; round++) {
    // 每轮换一个新位置，旧目标过期后新目标拿到新 id
    cv::Rect2d box(50 + round * 150, 50, 60, 60);
    for (int i = 0; i < 3; i++) {
      for (const auto & t : tracker.update({box}).tracks) {
        if (seen.insert(t.id).second) {
          EXPECT_GT(t.id, last);
          last = t.id;
        }
      }
    }
    for (int i = 0; i < 3; i++) tracker.update({});
  }

  EXPECT_EQ(seen.size(), 5u);
}

TEST(TrackerTest, DivergedReportedTrackIsDisappeared)
{
  // 高度为 0 的框使宽高比为 inf，预测结果为 NaN
  Tracker tracker(5, 1, 0.3);
  auto first = tracker.update({cv::Rect2d(10, 10, 20, 0)});
  EXPECT_EQ(ids_of(first), (std::vector<int>{1}));

  auto second = tracker.update({});
  EXPECT_EQ(second.disappeared, (std::vector<int>{1}));
  EXPECT_TRUE(second.tracks.empty());
  EXPECT_EQ(tracker.size(), 0u);

  EXPECT_TRUE(tracker.update({}).disappeared.empty());
}

TEST(TrackerTest, DivergedUnreportedTrackIsDroppedSilently)
{
  Tracker tracker(5, 3, 0.3);
  for (int i = 0; i < 4; i++) tracker.update({BOX_A});

  tracker.update({BOX_A, cv::Rect2d(400, 300, 20, 0)});
  EXPECT_EQ(tracker.size(), 2u);

  auto result = tracker.update({BOX_A});
  EXPECT_TRUE(result.disappeared.empty());
  EXPECT_EQ(ids_of(result), (std::vector<int>{1}));
  EXPECT_EQ(tracker.size(), 1u);
}
