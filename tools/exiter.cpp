#include "exiter.hpp"

#include <atomic>
#include <csignal>
#include <stdexcept>

namespace tools
{
namespace
{
// 信号处理函数里只能安全地写 lock-free 原子量
std::atomic<bool> exit_{false};
bool exiter_inited_ = false;

void on_signal(int) { exit_ = true; }
}  // namespace

Exiter::Exiter()
{
  if (exiter_inited_) {
    throw std::runtime_error("Multiple Exiter instances!");
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  exiter_inited_ = true;
}

bool Exiter::exit() const { return exit_; }

}  // namespace tools
