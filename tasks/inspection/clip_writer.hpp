#ifndef INSPECTION__CLIP_WRITER_HPP
#define INSPECTION__CLIP_WRITER_HPP

#include <functional>
#include <memory>
#include <opencv2/videoio.hpp>
#include <string>

namespace inspection
{
/// 报警片段的落盘接口，只在录像线程中使用
class ClipWriterBase
{
public:
  virtual ~ClipWriterBase() = default;

  /// @return 是否成功打开
  virtual bool open(const std::string & path, double fps, const cv::Size & size) = 0;

  /// @throw std::exception 写入失败
  virtual void write(const cv::Mat & frame) = 0;

  virtual void release() = 0;
};

using ClipWriterFactory = std::function<std::unique_ptr<ClipWriterBase>()>;

class VideoClipWriter : public ClipWriterBase
{
public:
  /// fourcc 例如 "mp4v"、"MJPG"
  explicit VideoClipWriter(const std::string & fourcc = "mp4v");

  bool open(const std::string & path, double fps, const cv::Size & size) override;
  void write(const cv::Mat & frame) override;
  void release() override;

private:
  int fourcc_;
  cv::Size size_;
  cv::VideoWriter writer_;
};

/// 按容器格式选择编码：avi → MJPG，其余 → mp4v
ClipWriterFactory video_clip_writer_factory(const std::string & format);

}  // namespace inspection

#endif  // INSPECTION__CLIP_WRITER_HPP
