#include "tasks/inspection/box_track.hpp"

#include <gtest/gtest.h>

using inspection::BoxTrack;

TEST(BoxTrackTest, MeasurementConversion)
{
  auto z = inspection::box_to_z({10, 20, 40, 20});
  EXPECT_DOUBLE_EQ(z[0], 30);
  EXPECT_DOUBLE_EQ(z[1], 30);
  EXPECT_DOUBLE_EQ(z[2], 800);
  EXPECT_DOUBLE_EQ(z[3], 2);

  Eigen::VectorXd x = Eigen::VectorXd::Zero(7);
  x.head<4>() = z;
  auto box = inspection::x_to_box(x);
  EXPECT_NEAR(box.x, 10, 1e-9);
  EXPECT_NEAR(box.y, 20, 1e-9);
  EXPECT_NEAR(box.width, 40, 1e-9);
  EXPECT_NEAR(box.height, 20, 1e-9);
}

TEST(BoxTrackTest, NewTrackStartsFresh)
{
  BoxTrack track({0, 0, 50, 50}, 3);
  EXPECT_EQ(track.id(), 3);
  EXPECT_EQ(track.hits(), 0);
  EXPECT_EQ(track.hit_streak(), 0);
  EXPECT_EQ(track.time_since_update(), 0);
  EXPECT_EQ(track.age(), 0);
  EXPECT_FALSE(track.has_been_returned());
}

TEST(BoxTrackTest, PredictUpdateCycleCountsHits)
{
  BoxTrack track({100, 100, 50, 50}, 1);

  for (int i = 0; i < 5; i++) {
    track.predict();
    track.update({100, 100, 50, 50});
  }

  EXPECT_EQ(track.hits(), 5);
  EXPECT_EQ(track.hit_streak(), 5);
  EXPECT_EQ(track.time_since_update(), 0);
  EXPECT_EQ(track.age(), 5);

  auto box = track.box();
  EXPECT_NEAR(box.x, 100, 1.0);
  EXPECT_NEAR(box.y, 100, 1.0);
  EXPECT_NEAR(box.width, 50, 1.0);
}

TEST(BoxTrackTest, MissedFramesResetStreak)
{
  BoxTrack track({100, 100, 50, 50}, 1);
  track.predict();
  track.update({100, 100, 50, 50});
  track.predict();
  track.update({100, 100, 50, 50});
  ASSERT_EQ(track.hit_streak(), 2);

  track.predict();
  EXPECT_EQ(track.time_since_update(), 1);
  EXPECT_EQ(track.hit_streak(), 2);

  track.predict();
  EXPECT_EQ(track.time_since_update(), 2);
  EXPECT_EQ(track.hit_streak(), 0);
}

TEST(BoxTrackTest, ConstantMotionIsExtrapolated)
{
  BoxTrack track({0, 100, 50, 50}, 1);
  for (int i = 1; i <= 20; i++) {
    track.predict();
    track.update({10.0 * i, 100, 50, 50});
  }

  auto predicted = track.predict();
  EXPECT_GT(predicted.x, 200);
  EXPECT_NEAR(predicted.y, 100, 2.0);
}

TEST(BoxTrackTest, ReturnedFlagIsSticky)
{
  BoxTrack track({0, 0, 10, 10}, 1);
  track.mark_returned();
  track.predict();
  track.update({0, 0, 10, 10});
  EXPECT_TRUE(track.has_been_returned());
}
