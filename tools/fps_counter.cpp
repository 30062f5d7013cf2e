#include "fps_counter.hpp"

#include <numeric>

#include "tools/math_tools.hpp"

namespace tools
{
FpsCounter::FpsCounter(size_t window_size)
: window_size_(window_size), started_(false), fps_(0.0)
{
}

void FpsCounter::start()
{
  start_ = std::chrono::steady_clock::now();
  started_ = true;
}

double FpsCounter::stop()
{
  if (!started_) return fps_;
  started_ = false;

  auto dt = delta_time(std::chrono::steady_clock::now(), start_);
  if (dt <= 0) return fps_;

  history_.push_back(1.0 / dt);
  if (history_.size() > window_size_) history_.pop_front();

  fps_ = std::accumulate(history_.begin(), history_.end(), 0.0) / history_.size();
  return fps_;
}

}  // namespace tools
