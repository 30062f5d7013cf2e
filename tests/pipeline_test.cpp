#include "tasks/inspection/pipeline.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>

#include "fakes.hpp"
#include "tasks/inspection/errors.hpp"

using inspection::Detection;
using inspection::FrameProcessingError;
using inspection::Pipeline;
using inspection::SessionConfig;
using inspection::SignalDecision;
using io::SignalCommand;

using namespace std::chrono_literals;

namespace
{
SessionConfig test_config()
{
  SessionConfig config;
  config.source = "fake.mp4";
  config.target_fps = 1000;
  config.max_age = 2;
  config.min_hits = 1;
  config.iou_threshold = 0.3;
  config.save_clips = false;
  config.recorder.output_dir =
    (std::filesystem::temp_directory_path() / "inspection_pipeline_clips").string();
  config.recorder.fps = 10;
  config.recorder.pre_seconds = 0.5;
  return config;
}

inspection::RequirementSpec test_spec()
{
  inspection::RequirementSpec spec;
  spec.container_key = "class0";
  spec.container_name = "storage box";
  spec.items = {{1, "class1", "tape", 1}, {2, "class2", "screwdriver", 1}};
  return spec;
}

// 前 5 帧收纳盒里只有胶带，之后收纳盒离开画面
std::vector<Detection> box_then_empty(int index)
{
  if (index >= 5) return {};
  return {Detection(50, 50, 150, 150, 0.9f, 0), Detection(90, 90, 110, 110, 0.8f, 1)};
}

cv::Mat blank() { return cv::Mat(240, 320, CV_8UC3, cv::Scalar(40, 40, 40)); }

bool has_line(const std::vector<std::string> & logs, const std::string & text)
{
  return std::any_of(logs.begin(), logs.end(), [&](const std::string & line) {
    return line.find(text) != std::string::npos;
  });
}
}  // namespace

TEST(PipelineTest, MissingItemRaisesAlertWhenContainerLeaves)
{
  auto light = std::make_shared<fakes::FakeLight::Log>();
  auto stats = std::make_shared<fakes::FakeSource::Stats>();
  Pipeline pipeline(
    test_config(), test_spec(), std::make_unique<fakes::FakeSource>(stats, 0),
    std::make_unique<fakes::FakeDetector>(box_then_empty),
    std::make_unique<fakes::FakeLight>(light));

  auto t0 = std::chrono::system_clock::now();
  for (int i = 0; i < 10; i++) {
    auto outcome = pipeline.process(blank(), t0 + i * 100ms);
    ASSERT_FALSE(outcome.rendered.empty());

    if (i < 5) {
      ASSERT_EQ(outcome.tracks.size(), 1u) << "frame " << i;
      EXPECT_EQ(outcome.tracks[0].id, 1);
      EXPECT_EQ(outcome.decision, SignalDecision::tracking_blue);
    }
    if (i == 5 || i == 6) EXPECT_EQ(outcome.decision, SignalDecision::idle_yellow);
    if (i == 7) {
      EXPECT_EQ(outcome.resolution.incomplete_ids, (std::vector<int>{1}));
      EXPECT_EQ(outcome.decision, SignalDecision::incomplete_alarm);
    } else {
      EXPECT_TRUE(outcome.resolution.alerts.empty()) << "frame " << i;
    }
  }

  auto alerts = pipeline.alerts();
  ASSERT_EQ(alerts.size(), 1u);
  ASSERT_EQ(alerts[0].events.size(), 1u);
  EXPECT_EQ(alerts[0].events[0].track_id, 1);
  ASSERT_EQ(alerts[0].events[0].missing.size(), 1u);
  EXPECT_EQ(alerts[0].events[0].missing[0].first, "class2");
  EXPECT_EQ(alerts[0].time.size(), 19u);

  EXPECT_TRUE(has_line(pipeline.recent_logs(), "alert: ID1 missing: screwdriver"));
  EXPECT_FALSE(pipeline.latest_frame().empty());
  EXPECT_EQ(pipeline.frame_count(), 10);

  ASSERT_TRUE(
    fakes::wait_until([&] { return light->count(SignalCommand::red_flash_buzzer) == 1; }));
  EXPECT_EQ(light->snapshot().front(), SignalCommand::blue_on);
}

TEST(PipelineTest, CompletedContainerFlashesGreen)
{
  auto light = std::make_shared<fakes::FakeLight::Log>();
  auto stats = std::make_shared<fakes::FakeSource::Stats>();
  Pipeline pipeline(
    test_config(), test_spec(), std::make_unique<fakes::FakeSource>(stats, 0),
    std::make_unique<fakes::FakeDetector>([](int index) -> std::vector<Detection> {
      if (index >= 3) return {};
      return {
        Detection(50, 50, 150, 150, 0.9f, 0), Detection(60, 60, 80, 80, 0.8f, 1),
        Detection(110, 110, 130, 130, 0.8f, 2)};
    }),
    std::make_unique<fakes::FakeLight>(light));

  std::vector<SignalDecision> decisions;
  for (int i = 0; i < 6; i++) decisions.push_back(pipeline.process(blank()).decision);

  EXPECT_EQ(decisions[5], SignalDecision::completed_flash);
  EXPECT_TRUE(pipeline.alerts().empty());
  EXPECT_TRUE(has_line(pipeline.recent_logs(), "ID1 completed"));
}

TEST(PipelineTest, DetectorFailureIsFrameProcessingError)
{
  auto stats = std::make_shared<fakes::FakeSource::Stats>();
  Pipeline pipeline(
    test_config(), test_spec(), std::make_unique<fakes::FakeSource>(stats, 0),
    std::make_unique<fakes::FakeDetector>(box_then_empty, 0), nullptr);

  EXPECT_THROW(pipeline.process(blank()), FrameProcessingError);
  EXPECT_EQ(pipeline.frame_count(), 0);
}

TEST(PipelineTest, RunsToEndOfStream)
{
  auto stats = std::make_shared<fakes::FakeSource::Stats>();
  Pipeline pipeline(
    test_config(), test_spec(), std::make_unique<fakes::FakeSource>(stats, 5),
    std::make_unique<fakes::FakeDetector>(box_then_empty), nullptr);

  pipeline.start();
  ASSERT_TRUE(pipeline.join_for(2000ms));

  EXPECT_FALSE(pipeline.running());
  EXPECT_EQ(pipeline.frame_count(), 5);
  EXPECT_EQ(stats->opened.load(), 1);
  EXPECT_EQ(stats->released.load(), 1);
  EXPECT_FALSE(pipeline.latest_frame().empty());

  auto logs = pipeline.recent_logs();
  EXPECT_TRUE(has_line(logs, "end of stream"));
  EXPECT_TRUE(has_line(logs, "stopped after 5 frames"));
}

TEST(PipelineTest, FileSourceIsPacedToTargetRate)
{
  auto stats = std::make_shared<fakes::FakeSource::Stats>();
  auto config = test_config();
  config.target_fps = 20;
  Pipeline pipeline(
    config, test_spec(), std::make_unique<fakes::FakeSource>(stats, 10),
    std::make_unique<fakes::FakeDetector>(box_then_empty), nullptr);

  auto begin = std::chrono::steady_clock::now();
  pipeline.start();
  ASSERT_TRUE(pipeline.join_for(5000ms));
  auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();

  // 10 帧 @ 20 fps 约 0.5 s
  EXPECT_EQ(pipeline.frame_count(), 10);
  EXPECT_GE(elapsed, 0.45);
  EXPECT_LT(elapsed, 1.5);
}

TEST(PipelineTest, LiveSourceIsNotThrottled)
{
  auto stats = std::make_shared<fakes::FakeSource::Stats>();
  auto config = test_config();
  config.target_fps = 2;
  Pipeline pipeline(
    config, test_spec(), std::make_unique<fakes::FakeSource>(stats, -1, true),
    std::make_unique<fakes::FakeDetector>(box_then_empty), nullptr);

  pipeline.start();
  // 按 2 fps 节流时 1 秒内只能处理 2 帧
  EXPECT_TRUE(fakes::wait_until([&] { return pipeline.frame_count() >= 10; }, 1000ms));
  pipeline.request_stop();
  ASSERT_TRUE(pipeline.join_for(2000ms));
}

TEST(PipelineTest, FrameErrorStopsSession)
{
  auto stats = std::make_shared<fakes::FakeSource::Stats>();
  Pipeline pipeline(
    test_config(), test_spec(), std::make_unique<fakes::FakeSource>(stats, 100),
    std::make_unique<fakes::FakeDetector>(box_then_empty, 3), nullptr);

  pipeline.start();
  ASSERT_TRUE(pipeline.join_for(2000ms));

  EXPECT_FALSE(pipeline.running());
  EXPECT_EQ(pipeline.frame_count(), 3);
  EXPECT_EQ(stats->released.load(), 1);
  EXPECT_TRUE(has_line(pipeline.recent_logs(), "frame processing error: inference failed"));
}

TEST(PipelineTest, RequestStopEndsLiveSource)
{
  auto stats = std::make_shared<fakes::FakeSource::Stats>();
  Pipeline pipeline(
    test_config(), test_spec(), std::make_unique<fakes::FakeSource>(stats, -1, true, 2ms),
    std::make_unique<fakes::FakeDetector>(box_then_empty), nullptr);

  pipeline.start();
  ASSERT_TRUE(fakes::wait_until([&] { return pipeline.frame_count() > 3; }));
  EXPECT_TRUE(pipeline.running());

  pipeline.request_stop();
  ASSERT_TRUE(pipeline.join_for(2000ms));
  EXPECT_FALSE(pipeline.running());
  EXPECT_EQ(stats->released.load(), 1);
}

TEST(PipelineTest, OpenFailureThrowsSourceError)
{
  auto stats = std::make_shared<fakes::FakeSource::Stats>();
  Pipeline pipeline(
    test_config(), test_spec(),
    std::make_unique<fakes::FakeSource>(stats, 5, false, 0ms, 0ms, true),
    std::make_unique<fakes::FakeDetector>(box_then_empty), nullptr);

  EXPECT_THROW(pipeline.start(), inspection::SourceError);
  EXPECT_FALSE(pipeline.running());
  EXPECT_EQ(stats->opened.load(), 0);
  EXPECT_TRUE(has_line(pipeline.recent_logs(), "source error: cannot open fake.mp4"));
}

TEST(PipelineTest, AlertClipIncludesPreRoll)
{
  auto clips = std::make_shared<fakes::FakeClipWriter::Log>();
  auto stats = std::make_shared<fakes::FakeSource::Stats>();
  auto config = test_config();
  config.save_clips = true;

  std::vector<std::string> logs;
  {
    Pipeline pipeline(
      config, test_spec(), std::make_unique<fakes::FakeSource>(stats, 0),
      std::make_unique<fakes::FakeDetector>(box_then_empty), nullptr,
      fakes::clip_writer_factory(clips));

    auto t0 = std::chrono::system_clock::now();
    for (int i = 0; i < 8; i++) pipeline.process(blank(), t0 + i * 100ms);
    logs = pipeline.recent_logs();
  }

  // 10 fps x 0.5 s 预录 + 报警帧，析构时关闭片段
  ASSERT_EQ(clips->opened.size(), 1u);
  EXPECT_EQ(clips->frames.size(), 6u);
  EXPECT_EQ(clips->released, 1);
  EXPECT_NE(clips->opened[0].find("inspection_pipeline_clips"), std::string::npos);
  EXPECT_TRUE(has_line(logs, "recording clip: " + clips->opened[0]));
}
