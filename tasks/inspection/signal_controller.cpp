#include "signal_controller.hpp"

#include "tools/logger.hpp"

using namespace std::chrono_literals;

namespace inspection
{
SignalController::SignalController(
  std::unique_ptr<io::SignalLightBase> light, double completed_seconds, double incomplete_seconds)
: light_(std::move(light)),
  completed_seconds_(completed_seconds),
  incomplete_seconds_(incomplete_seconds),
  enabled_(light_ != nullptr),
  timer_active_(false),
  quit_(false),
  queue_(64, [] { tools::logger()->warn("[SignalController] queue full, command dropped"); })
{
  if (!enabled_) {
    tools::logger()->info("[SignalController] no light attached, disabled");
    return;
  }

  thread_ = std::thread(&SignalController::run, this);
}

SignalController::~SignalController() { stop(); }

SignalDecision SignalController::decide(
  bool incomplete, bool completed, bool timer_active, bool has_container)
{
  if (incomplete) return SignalDecision::incomplete_alarm;
  if (completed) return SignalDecision::completed_flash;
  if (timer_active) return SignalDecision::hold;
  if (!has_container) return SignalDecision::idle_yellow;
  return SignalDecision::tracking_blue;
}

SignalDecision SignalController::update(const Resolution & resolution, bool has_container)
{
  auto decision = decide(
    !resolution.incomplete_ids.empty(), !resolution.completed_ids.empty(), timer_active_,
    has_container);

  switch (decision) {
    case SignalDecision::incomplete_alarm:
      red_alarm(incomplete_seconds_);
      break;
    case SignalDecision::completed_flash:
      green(completed_seconds_);
      break;
    case SignalDecision::hold:
      break;
    case SignalDecision::idle_yellow:
      yellow();
      break;
    case SignalDecision::tracking_blue:
      blue();
      break;
  }

  return decision;
}

void SignalController::yellow()
{
  cancel_timer();
  send(io::SignalCommand::yellow_on);
}

void SignalController::blue()
{
  cancel_timer();
  send(io::SignalCommand::blue_on);
}

void SignalController::green(double seconds)
{
  start_timed(io::SignalCommand::green_on, seconds, {{io::SignalCommand::blue_on, 0ms}});
}

void SignalController::red_alarm(double seconds)
{
  start_timed(
    io::SignalCommand::red_flash_buzzer, seconds,
    {{io::SignalCommand::red_buzzer_off, 100ms}, {io::SignalCommand::blue_on, 0ms}});
}

void SignalController::all_off()
{
  cancel_timer();
  send(io::SignalCommand::all_off);
}

std::optional<io::SignalCommand> SignalController::last_sent() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return last_sent_;
}

void SignalController::stop()
{
  if (!thread_.joinable()) return;

  all_off();
  quit_ = true;
  thread_.join();
  tools::logger()->info("[SignalController] stopped");
}

void SignalController::send(io::SignalCommand command, std::chrono::milliseconds pause)
{
  if (!enabled_) return;

  std::lock_guard<std::mutex> lock(mutex_);
  send_locked(command, pause);
}

void SignalController::send_locked(io::SignalCommand command, std::chrono::milliseconds pause)
{
  // 与上一条相同的指令不重复下发
  if (last_sent_ && *last_sent_ == command) return;

  if (queue_.push({command, pause})) last_sent_ = command;
}

void SignalController::start_timed(
  io::SignalCommand command, double seconds, std::vector<SignalWrite> revert)
{
  if (!enabled_) return;

  // 下发与换定时在同一把锁内完成，写线程不会在两者之间执行旧定时的恢复
  std::lock_guard<std::mutex> lock(mutex_);
  timer_active_ = false;
  revert_.clear();
  send_locked(command, {});

  deadline_ = std::chrono::steady_clock::now() +
              std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double>(seconds));
  revert_ = std::move(revert);
  timer_active_ = true;
}

void SignalController::fire_timer_if_due()
{
  if (!timer_active_) return;

  std::lock_guard<std::mutex> lock(mutex_);
  if (!timer_active_ || std::chrono::steady_clock::now() < deadline_) return;

  for (const auto & step : revert_) send_locked(step.command, step.pause);
  revert_.clear();
  timer_active_ = false;
}

void SignalController::run()
{
  tools::logger()->info("[SignalController] writer started");

  while (true) {
    SignalWrite item;
    if (queue_.pop_for(item, 20ms)) {
      if (!enabled_) continue;

      try {
        light_->write(item.command);
        tools::logger()->debug("[SignalController] {}", io::str(item.command));
      } catch (const std::exception & e) {
        tools::logger()->warn("[SignalController] write failed, light disabled: {}", e.what());
        enabled_ = false;
        cancel_timer();
        continue;
      }

      if (item.pause.count() > 0) std::this_thread::sleep_for(item.pause);
    } else if (quit_) {
      // 队列已排空才退出
      break;
    }

    fire_timer_if_due();
  }
}

}  // namespace inspection
