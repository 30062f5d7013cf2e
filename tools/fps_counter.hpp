#ifndef TOOLS__FPS_COUNTER_HPP
#define TOOLS__FPS_COUNTER_HPP

#include <chrono>
#include <deque>

namespace tools
{
/// 滑动窗口平均帧率
class FpsCounter
{
public:
  explicit FpsCounter(size_t window_size = 30);

  void start();

  /// @return 本帧结束后的平滑帧率
  double stop();

  double fps() const { return fps_; }

private:
  size_t window_size_;
  std::deque<double> history_;
  std::chrono::steady_clock::time_point start_;
  bool started_;
  double fps_;
};

}  // namespace tools

#endif  // TOOLS__FPS_COUNTER_HPP
