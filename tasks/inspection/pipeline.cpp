#include "pipeline.hpp"

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <algorithm>
#include <opencv2/imgcodecs.hpp>

#include "errors.hpp"
#include "tools/logger.hpp"
#include "tools/math_tools.hpp"

using namespace std::chrono_literals;

namespace inspection
{
Pipeline::Pipeline(
  const SessionConfig & config, const RequirementSpec & spec,
  std::unique_ptr<io::VideoSourceBase> source, std::unique_ptr<DetectorBase> detector,
  std::unique_ptr<io::SignalLightBase> light, ClipWriterFactory clip_writer)
: config_(config),
  source_(std::move(source)),
  detector_(std::move(detector)),
  clip_writer_(std::move(clip_writer)),
  tracker_(config.max_age, config.min_hits, config.iou_threshold),
  inventory_(spec),
  signal_(std::move(light), config.completed_signal_seconds, config.incomplete_signal_seconds),
  capture_fps_(config.recorder.fps),
  stop_(false),
  running_(false),
  frame_count_(0),
  finished_future_(finished_.get_future())
{
}

Pipeline::~Pipeline()
{
  request_stop();
  if (thread_.joinable()) thread_.join();
}

/**
 * @brief 启动帧循环线程
 * @param open_timeout 等待视频源打开的时限，超时视为仍在打开，不算失败
 * @note 打开失败时先回收线程再抛出，调用方拿到异常时线程已退出
 */
void Pipeline::start(std::chrono::milliseconds open_timeout)
{
  auto opened = opened_.get_future();
  running_ = true;
  thread_ = std::thread(&Pipeline::run, this);

  if (opened.wait_for(open_timeout) == std::future_status::timeout) {
    log("source is still opening");
    return;
  }

  try {
    opened.get();
  } catch (const SourceError &) {
    thread_.join();
    throw;
  }
}

bool Pipeline::join_for(std::chrono::milliseconds timeout)
{
  if (!thread_.joinable()) return true;
  if (finished_future_.wait_for(timeout) == std::future_status::timeout) return false;

  thread_.join();
  return true;
}

/**
 * @brief 单帧处理，顺序固定：检测 → 跟踪 → 归属 → 台账 → 消失判定 → 绘制 → 灯控 → 录像
 * @param frame 原始画面，不会被修改
 * @param now 报警时间戳，也是录像前后时长的计时基准
 */
FrameOutcome Pipeline::process(const cv::Mat & frame, std::chrono::system_clock::time_point now)
{
  fps_counter_.start();
  FrameOutcome outcome;

  try {
    auto detections = detector_->detect(frame);

    // 收纳盒送跟踪器，其余类别作为零件
    std::vector<cv::Rect2d> containers;
    std::vector<Detection> items;
    for (const auto & detection : detections) {
      if (detection.class_id == config_.container_class)
        containers.push_back(detection.box);
      else if (detection.class_id >= 0 && detection.class_id < config_.detector.num_classes)
        items.push_back(detection);
    }

    // 跟踪 → 归属 → 台账，消失判定必须在台账更新之后
    auto tracked = tracker_.update(containers);
    auto assignment = assign_items(tracked.tracks, items);
    inventory_.update(tracked.tracks, assignment.counts);
    outcome.resolution = inventory_.handle_disappearance(tracked.disappeared, now);
    outcome.tracks = std::move(tracked.tracks);

    outcome.rendered = visualizer_.render(
      frame, outcome.tracks, assignment, inventory_, outcome.resolution.alerts, fps_counter_.fps());
  } catch (const std::exception & e) {
    throw FrameProcessingError(e.what());
  }

  // 以下环节失败不影响会话：灯控写线程自行降级，录像线程自行关闭片段
  const auto & resolution = outcome.resolution;
  for (auto id : resolution.completed_ids) log(fmt::format("ID{} completed", id));

  outcome.decision = signal_.update(resolution, !outcome.tracks.empty());

  if (!resolution.alerts.empty()) record_alerts(resolution.alerts);

  if (config_.save_clips) {
    // 录像器在首帧创建，此时已知视频源帧率
    if (!recorder_) {
      auto recorder_config = config_.recorder;
      recorder_config.fps = capture_fps_;
      recorder_ = std::make_unique<AlertRecorder>(recorder_config, clip_writer_);
    }
    auto was_recording = recorder_->recording();
    recorder_->feed(outcome.rendered, resolution.alerts, now);
    if (!was_recording && recorder_->recording()) log("recording clip: " + recorder_->clip_path());
  }

  publish(outcome.rendered);
  fps_counter_.stop();
  frame_count_++;

  return outcome;
}

std::vector<uchar> Pipeline::latest_frame() const
{
  std::lock_guard<std::mutex> lock(frame_mutex_);
  return latest_frame_;
}

std::vector<std::string> Pipeline::recent_logs() const
{
  std::lock_guard<std::mutex> lock(log_mutex_);
  return {logs_.begin(), logs_.end()};
}

std::vector<AlertRecord> Pipeline::alerts() const
{
  std::lock_guard<std::mutex> lock(log_mutex_);
  return alerts_;
}

std::vector<ClipFile> Pipeline::alert_files() const
{
  return AlertRecorder::list_files(config_.recorder.output_dir, config_.recorder.format);
}

/// 写入会话日志（有界，超出容量丢弃最旧的），同时转发到全局 logger
void Pipeline::log(const std::string & message)
{
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  auto line = fmt::format("[{:%H:%M:%S}] {}", fmt::localtime(now), message);
  tools::logger()->info("[Pipeline] {}", message);

  std::lock_guard<std::mutex> lock(log_mutex_);
  logs_.push_back(std::move(line));
  while (logs_.size() > config_.log_capacity) logs_.pop_front();
}

/**
 * @brief 帧循环线程主体
 *
 * 视频源的打开、读取、释放都只在本线程内进行。
 * 退出条件：stop_ 被置位、视频结束、单帧处理异常。
 * 退出前依次释放视频源、关闭录像、关灯，最后通知 join_for。
 */
void Pipeline::run()
{
  log(fmt::format("opening source: {}", config_.source));

  try {
    source_->open(config_.source);
  } catch (const std::exception & e) {
    log(fmt::format("source error: {}", e.what()));
    opened_.set_exception(std::make_exception_ptr(SourceError(e.what())));
    signal_.stop();
    running_ = false;
    finished_.set_value();
    return;
  }
  opened_.set_value();

  if (source_->fps() > 0) capture_fps_ = source_->fps();
  log(fmt::format(
    "started, {} source, target fps {:.1f}", source_->is_live() ? "live" : "file",
    config_.target_fps));

  while (!stop_) {
    auto frame_start = std::chrono::steady_clock::now();

    cv::Mat frame;
    std::chrono::steady_clock::time_point timestamp;
    if (!source_->read(frame, timestamp)) {
      log("end of stream");
      break;
    }

    try {
      process(frame);
    } catch (const std::exception & e) {
      log(fmt::format("frame processing error: {}", e.what()));
      break;
    }

    // 文件按目标帧率播放，摄像头全速运行
    if (!source_->is_live()) {
      auto elapsed = tools::delta_time(std::chrono::steady_clock::now(), frame_start);
      auto wait = std::max(0.0001, 1.0 / config_.target_fps - elapsed);
      std::this_thread::sleep_for(std::chrono::duration<double>(wait));
    } else {
      std::this_thread::sleep_for(100us);
    }
  }

  source_->release();
  if (recorder_) recorder_->stop();
  signal_.stop();

  log(fmt::format("stopped after {} frames", frame_count_.load()));
  running_ = false;
  finished_.set_value();
}

/// 同一帧内的报警合并为一条记录，日志中逐个列出缺失零件
void Pipeline::record_alerts(const std::vector<AlertEvent> & events)
{
  auto now = std::chrono::system_clock::to_time_t(events.front().timestamp);
  AlertRecord record{fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(now)), events};

  std::string summary;
  for (const auto & event : events) {
    std::string names;
    for (const auto & [key, name] : event.missing) names += (names.empty() ? "" : ",") + name;
    summary += fmt::format("{}ID{} missing: {}", summary.empty() ? "" : "; ", event.track_id, names);
  }

  {
    std::lock_guard<std::mutex> lock(log_mutex_);
    alerts_.push_back(std::move(record));
  }
  log("alert: " + summary);
}

/// 编码在锁外完成，锁内只交换缓冲区
void Pipeline::publish(const cv::Mat & rendered)
{
  std::vector<uchar> buffer;
  if (!cv::imencode(".jpg", rendered, buffer, {cv::IMWRITE_JPEG_QUALITY, config_.jpeg_quality})) {
    tools::logger()->warn("[Pipeline] jpeg encode failed");
    return;
  }

  std::lock_guard<std::mutex> lock(frame_mutex_);
  latest_frame_.swap(buffer);
}

}  // namespace inspection
