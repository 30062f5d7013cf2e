#include "alert_recorder.hpp"

#include <fmt/chrono.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

#include "tools/logger.hpp"

using namespace std::chrono_literals;

namespace inspection
{
namespace
{
std::size_t depth_of(const AlertRecorderConfig & config)
{
  auto depth = static_cast<long>(config.pre_seconds * config.fps);
  return depth > 0 ? static_cast<std::size_t>(depth) : 0;
}

std::string lower(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}
}  // namespace

AlertRecorder::AlertRecorder(const AlertRecorderConfig & config, ClipWriterFactory factory)
: config_(config),
  factory_(factory ? std::move(factory) : video_clip_writer_factory(config.format)),
  depth_(depth_of(config)),
  open_(false),
  finished_(0),
  quit_(false),
  queue_(depth_ * 2 + 256, [] { tools::logger()->warn("[AlertRecorder] queue full"); })
{
  thread_ = std::thread(&AlertRecorder::run, this);
  tools::logger()->info(
    "[AlertRecorder] output {}, pre-roll {} frames, post-roll {:.1f}s", config_.output_dir, depth_,
    config_.post_seconds);
}

AlertRecorder::~AlertRecorder() { stop(); }

/**
 * @brief 每帧调用一次
 * @param rendered 绘制后的画面，同时进入预录缓冲
 * @param alerts 本帧报警，非空且当前无片段时开始录制
 * @param now 本帧时间，触发时刻之后超过 post_seconds 即关闭片段
 */
void AlertRecorder::feed(
  const cv::Mat & rendered, const std::vector<AlertEvent> & alerts,
  std::chrono::system_clock::time_point now)
{
  if (rendered.empty()) return;

  if (!alerts.empty() && !open_) {
    open_ = true;
    trigger_ = now;
    path_ = make_clip_path(config_, now);

    // 先打开，再按时间顺序补写预录帧
    push({ClipOp::open, {}, path_, config_.fps, rendered.size()});
    for (const auto & frame : ring_) push({ClipOp::write, frame, {}, 0, {}});
  }

  if (open_) {
    push({ClipOp::write, rendered, {}, 0, {}});

    if (now > trigger_ + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                           std::chrono::duration<double>(config_.post_seconds))) {
      push({ClipOp::close, {}, {}, 0, {}});
      open_ = false;
    }
  }

  // 当前帧在写入之后才进缓冲，避免触发帧被写两次
  if (depth_ == 0) return;
  ring_.push_back(rendered);
  while (ring_.size() > depth_) ring_.pop_front();
}

void AlertRecorder::stop()
{
  if (!thread_.joinable()) return;

  if (open_) {
    push({ClipOp::close, {}, {}, 0, {}});
    open_ = false;
  }
  push({ClipOp::stop, {}, {}, 0, {}});
  quit_ = true;
  thread_.join();
  ring_.clear();
}

std::vector<ClipFile> AlertRecorder::list_files() const
{
  return list_files(config_.output_dir, config_.format);
}

/**
 * @brief 列出输出目录下的片段
 * @param format 扩展名，不区分大小写
 * @return 先按日期目录、再按文件名升序；目录不存在时为空
 */
std::vector<ClipFile> AlertRecorder::list_files(
  const std::string & output_dir, const std::string & format)
{
  namespace fs = std::filesystem;

  std::vector<ClipFile> files;
  std::error_code ec;
  if (!fs::is_directory(output_dir, ec)) return files;

  std::vector<fs::path> days;
  for (const auto & entry : fs::directory_iterator(output_dir, ec))
    if (entry.is_directory(ec)) days.push_back(entry.path());
  std::sort(days.begin(), days.end());

  auto extension = "." + lower(format);
  for (const auto & day : days) {
    std::vector<fs::path> clips;
    for (const auto & entry : fs::directory_iterator(day, ec)) {
      if (!entry.is_regular_file(ec)) continue;
      if (lower(entry.path().extension().string()) != extension) continue;
      clips.push_back(entry.path());
    }
    std::sort(clips.begin(), clips.end());

    for (const auto & clip : clips) {
      auto size = fs::file_size(clip, ec);
      files.push_back(
        {day.filename().string(), clip.filename().string(), clip.string(), ec ? 0 : size});
    }
  }

  return files;
}

std::string AlertRecorder::make_clip_path(
  const AlertRecorderConfig & config, std::chrono::system_clock::time_point time)
{
  auto tm = fmt::localtime(std::chrono::system_clock::to_time_t(time));
  auto day = fmt::format("{:%Y%m%d}", tm);
  auto stamp = fmt::format("{:%Y%m%d_%H%M%S}", tm);

  auto dir = std::filesystem::path(config.output_dir) / day;
  return (dir / fmt::format("{}_{}.{}", config.prefix, stamp, config.format)).string();
}

void AlertRecorder::push(ClipCommand command)
{
  // 队列满时只丢写帧指令，打开/关闭必须送达
  while (!queue_.push(command)) {
    if (command.op == ClipOp::write) return;
    std::this_thread::sleep_for(1ms);
  }
}

/**
 * @brief 录像线程主体
 *
 * 写入器只在本线程内创建和释放。写入失败只结束当前片段，线程继续处理后续指令。
 */
void AlertRecorder::run()
{
  std::unique_ptr<ClipWriterBase> writer;
  std::string path;
  int frames = 0;

  auto finalize = [&] {
    if (!writer) return;
    writer->release();
    writer.reset();
    finished_++;
    tools::logger()->info("[AlertRecorder] clip saved: {} ({} frames)", path, frames);
  };

  while (true) {
    ClipCommand command;
    if (!queue_.pop_for(command, 200ms)) {
      if (quit_) break;
      continue;
    }

    if (command.op == ClipOp::stop) break;

    switch (command.op) {
      case ClipOp::open: {
        finalize();
        path = command.path;
        frames = 0;

        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
        if (ec) {
          tools::logger()->error("[AlertRecorder] cannot create {}: {}", path, ec.message());
          break;
        }

        writer = factory_();
        if (!writer->open(path, command.fps, command.size)) {
          tools::logger()->error("[AlertRecorder] cannot open {}", path);
          writer.reset();
        }
        break;
      }

      case ClipOp::write:
        if (!writer) break;
        try {
          writer->write(command.frame);
          frames++;
        } catch (const std::exception & e) {
          tools::logger()->error("[AlertRecorder] write {} failed: {}", path, e.what());
          finalize();
        }
        break;

      case ClipOp::close:
        finalize();
        break;

      case ClipOp::stop:
        break;
    }
  }

  finalize();
}

}  // namespace inspection
