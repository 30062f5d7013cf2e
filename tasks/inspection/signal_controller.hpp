#ifndef INSPECTION__SIGNAL_CONTROLLER_HPP
#define INSPECTION__SIGNAL_CONTROLLER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "inventory.hpp"
#include "io/command.hpp"
#include "io/signal_light.hpp"
#include "tools/thread_safe_queue.hpp"

namespace inspection
{
enum class SignalDecision
{
  incomplete_alarm,  // 红灯快闪+蜂鸣
  completed_flash,   // 绿灯
  hold,              // 定时序列进行中，不打断
  idle_yellow,       // 画面中无收纳盒
  tracking_blue      // 正常跟踪
};

/**
 * @brief 三色灯优先级状态机
 *
 * 所有串口写入都在独立线程中完成，调用方不会阻塞在串口上。
 * 定时指令（绿灯、红灯报警）到期后自动恢复蓝灯，同一时刻最多一个待恢复的定时。
 * 串口写入失败后控制器降级为空操作。
 */
class SignalController
{
public:
  /// light 为空时控制器处于禁用状态
  SignalController(
    std::unique_ptr<io::SignalLightBase> light, double completed_seconds = 0.5,
    double incomplete_seconds = 1.0);

  ~SignalController();

  /// 自上而下求值，命中即返回
  static SignalDecision decide(
    bool incomplete, bool completed, bool timer_active, bool has_container);

  /// 每帧在消失判定之后调用
  SignalDecision update(const Resolution & resolution, bool has_container);

  void yellow();
  void blue();
  void green(double seconds);
  void red_alarm(double seconds);
  void all_off();

  bool timer_active() const { return timer_active_; }
  bool enabled() const { return enabled_; }

  /// 最近一次交给写线程的指令
  std::optional<io::SignalCommand> last_sent() const;

  /// 关灯并排空写队列后退出写线程
  void stop();

private:
  struct SignalWrite
  {
    io::SignalCommand command;
    std::chrono::milliseconds pause;  // 写入后的停顿
  };

  std::unique_ptr<io::SignalLightBase> light_;
  double completed_seconds_;
  double incomplete_seconds_;

  std::atomic<bool> enabled_;
  std::atomic<bool> timer_active_;
  std::atomic<bool> quit_;

  mutable std::mutex mutex_;
  std::optional<io::SignalCommand> last_sent_;
  std::chrono::steady_clock::time_point deadline_;
  std::vector<SignalWrite> revert_;

  tools::ThreadSafeQueue<SignalWrite> queue_;
  std::thread thread_;

  void send(io::SignalCommand command, std::chrono::milliseconds pause = {});
  void send_locked(io::SignalCommand command, std::chrono::milliseconds pause);
  /// 下发定时指令并替换待恢复的定时，旧定时不会再触发
  void start_timed(io::SignalCommand command, double seconds, std::vector<SignalWrite> revert);
  void cancel_timer() { timer_active_ = false; }
  void fire_timer_if_due();
  void run();
};

}  // namespace inspection

#endif  // INSPECTION__SIGNAL_CONTROLLER_HPP
