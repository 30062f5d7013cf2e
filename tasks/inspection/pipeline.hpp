#ifndef INSPECTION__PIPELINE_HPP
#define INSPECTION__PIPELINE_HPP

#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <opencv2/core.hpp>
#include <string>
#include <thread>
#include <vector>

#include "alert_recorder.hpp"
#include "detector.hpp"
#include "inventory.hpp"
#include "io/signal_light.hpp"
#include "io/video_source.hpp"
#include "item_assigner.hpp"
#include "requirement.hpp"
#include "session_config.hpp"
#include "signal_controller.hpp"
#include "tools/fps_counter.hpp"
#include "tracker.hpp"
#include "visualizer.hpp"

namespace inspection
{
/// 一次报警（同一帧内的所有报警事件）
struct AlertRecord
{
  std::string time;  // YYYY-mm-dd HH:MM:SS
  std::vector<AlertEvent> events;
};

/// 单帧处理结果
struct FrameOutcome
{
  std::vector<TrackedBox> tracks;
  Resolution resolution;
  SignalDecision decision;
  cv::Mat rendered;
};

/**
 * @brief 帧循环：采集 → 检测 → 跟踪 → 归属 → 台账 → 消失判定 → 灯控 → 录像
 *
 * 视频源只在帧循环线程内打开、读取、释放。外部线程只能读取最新画面、日志与报警记录。
 */
class Pipeline
{
public:
  Pipeline(
    const SessionConfig & config, const RequirementSpec & spec,
    std::unique_ptr<io::VideoSourceBase> source, std::unique_ptr<DetectorBase> detector,
    std::unique_ptr<io::SignalLightBase> light, ClipWriterFactory clip_writer = nullptr);

  ~Pipeline();

  /**
   * @brief 启动帧循环线程，并等待视频源打开
   * @throw SourceError 视频源打开失败
   */
  void start(std::chrono::milliseconds open_timeout = std::chrono::seconds(5));

  void request_stop() { stop_ = true; }

  /// @return false 表示超时后线程仍在运行（已请求停止，尚未退出）
  bool join_for(std::chrono::milliseconds timeout);

  bool running() const { return running_; }

  /**
   * @brief 处理一帧
   * @throw FrameProcessingError 检测、跟踪、计数或台账出错
   */
  FrameOutcome process(
    const cv::Mat & frame,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

  /// 最新一帧渲染画面的 JPEG 编码，尚无画面时为空
  std::vector<uchar> latest_frame() const;

  std::vector<std::string> recent_logs() const;
  std::vector<AlertRecord> alerts() const;
  std::vector<ClipFile> alert_files() const;

  int frame_count() const { return frame_count_; }

  void log(const std::string & message);

private:
  SessionConfig config_;
  std::unique_ptr<io::VideoSourceBase> source_;
  std::unique_ptr<DetectorBase> detector_;
  ClipWriterFactory clip_writer_;

  Tracker tracker_;
  Inventory inventory_;
  SignalController signal_;
  std::unique_ptr<AlertRecorder> recorder_;
  Visualizer visualizer_;
  tools::FpsCounter fps_counter_;
  double capture_fps_;

  std::atomic<bool> stop_;
  std::atomic<bool> running_;
  std::atomic<int> frame_count_;

  mutable std::mutex frame_mutex_;
  std::vector<uchar> latest_frame_;

  mutable std::mutex log_mutex_;
  std::deque<std::string> logs_;
  std::vector<AlertRecord> alerts_;

  std::promise<void> opened_;
  std::promise<void> finished_;
  std::future<void> finished_future_;
  std::thread thread_;

  void run();
  void record_alerts(const std::vector<AlertEvent> & events);
  void publish(const cv::Mat & rendered);
};

}  // namespace inspection

#endif  // INSPECTION__PIPELINE_HPP
