#ifndef INSPECTION__ALERT_RECORDER_HPP
#define INSPECTION__ALERT_RECORDER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <opencv2/core.hpp>
#include <string>
#include <thread>
#include <vector>

#include "clip_writer.hpp"
#include "inventory.hpp"
#include "tools/thread_safe_queue.hpp"

namespace inspection
{
struct ClipFile
{
  std::string day;  // YYYYMMDD
  std::string name;
  std::string path;
  std::uintmax_t size;
};

struct AlertRecorderConfig
{
  std::string output_dir = "output";
  std::string prefix = "alert";
  std::string format = "mp4";
  double fps = 30;
  double pre_seconds = 5;
  double post_seconds = 5;
};

/**
 * @brief 报警片段录像
 *
 * 帧循环线程调用 feed，只做入队；打开、写入、关闭都在独立的录像线程中完成。
 * 触发时先写入预录缓冲（最旧的在前），之后逐帧写入，直到触发时刻之后 post_seconds。
 * 同一时刻最多一个打开的片段，录制期间再次报警不会另开片段。
 */
class AlertRecorder
{
public:
  AlertRecorder(const AlertRecorderConfig & config, ClipWriterFactory factory = nullptr);

  ~AlertRecorder();

  void feed(
    const cv::Mat & rendered, const std::vector<AlertEvent> & alerts,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

  bool recording() const { return open_; }

  /// 正在录制（或最近一次录制）的片段路径，尚未录制过时为空
  const std::string & clip_path() const { return path_; }

  std::size_t buffered() const { return ring_.size(); }
  std::size_t pre_roll_depth() const { return depth_; }

  /// 已经关闭落盘的片段数
  int finished_clips() const { return finished_; }

  /// 关闭当前片段，排空队列后结束录像线程
  void stop();

  std::vector<ClipFile> list_files() const;

  static std::vector<ClipFile> list_files(const std::string & output_dir, const std::string & format);

  /// <output_dir>/<YYYYMMDD>/<prefix>_<YYYYMMDD>_<HHMMSS>.<format>
  static std::string make_clip_path(
    const AlertRecorderConfig & config, std::chrono::system_clock::time_point time);

private:
  enum class ClipOp
  {
    open,
    write,
    close,
    stop
  };

  struct ClipCommand
  {
    ClipOp op;
    cv::Mat frame;
    std::string path;
    double fps;
    cv::Size size;
  };

  AlertRecorderConfig config_;
  ClipWriterFactory factory_;
  std::size_t depth_;

  std::deque<cv::Mat> ring_;
  bool open_;
  std::chrono::system_clock::time_point trigger_;
  std::string path_;

  std::atomic<int> finished_;
  std::atomic<bool> quit_;
  tools::ThreadSafeQueue<ClipCommand> queue_;
  std::thread thread_;

  void push(ClipCommand command);
  void run();
};

}  // namespace inspection

#endif  // INSPECTION__ALERT_RECORDER_HPP
