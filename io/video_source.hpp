#ifndef IO__VIDEO_SOURCE_HPP
#define IO__VIDEO_SOURCE_HPP

#include <chrono>
#include <opencv2/opencv.hpp>
#include <string>

namespace io
{
/**
 * @brief 视频源接口
 * @note 句柄只在采集线程内打开、读取、释放
 */
class VideoSourceBase
{
public:
  virtual ~VideoSourceBase() = default;

  /// @throw std::runtime_error 无法打开
  virtual void open(const std::string & identifier) = 0;

  /// @return false 表示流结束或中断
  virtual bool read(cv::Mat & img, std::chrono::steady_clock::time_point & timestamp) = 0;

  virtual void release() = 0;

  /// 摄像头为true，文件为false；决定主循环是否按目标帧率节流
  virtual bool is_live() const = 0;

  /// 源的标称帧率，未知时返回 0
  virtual double fps() const = 0;
};

/// 纯数字标识符视为摄像头编号
bool is_device_identifier(const std::string & identifier);

/// cv::VideoCapture 实现：摄像头编号或视频文件路径
class VideoSource : public VideoSourceBase
{
public:
  /// @param flip_code 0 不翻转，否则按 cv::flip 的约定（1 水平，-1 双向，2 表示垂直）
  explicit VideoSource(int flip_code = 0);

  ~VideoSource() override;

  void open(const std::string & identifier) override;

  bool read(cv::Mat & img, std::chrono::steady_clock::time_point & timestamp) override;

  void release() override;

  bool is_live() const override { return live_; }

  double fps() const override;

private:
  cv::VideoCapture capture_;
  int flip_code_;
  bool live_;
};

}  // namespace io

#endif  // IO__VIDEO_SOURCE_HPP
