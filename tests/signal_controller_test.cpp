#include "tasks/inspection/signal_controller.hpp"

#include <gtest/gtest.h>

#include <algorithm>

#include "fakes.hpp"

using inspection::Resolution;
using inspection::SignalController;
using inspection::SignalDecision;
using io::SignalCommand;

using namespace std::chrono_literals;

namespace
{
Resolution completed(int id)
{
  Resolution r;
  r.completed_ids = {id};
  return r;
}

Resolution incomplete(int id)
{
  Resolution r;
  r.incomplete_ids = {id};
  r.alerts.push_back({id, std::chrono::system_clock::now(), {{"class2", "screwdriver"}}});
  return r;
}
}  // namespace

TEST(SignalControllerTest, DecisionLadder)
{
  EXPECT_EQ(SignalController::decide(true, true, true, true), SignalDecision::incomplete_alarm);
  EXPECT_EQ(SignalController::decide(true, false, false, false), SignalDecision::incomplete_alarm);
  EXPECT_EQ(SignalController::decide(false, true, true, false), SignalDecision::completed_flash);
  EXPECT_EQ(SignalController::decide(false, false, true, false), SignalDecision::hold);
  EXPECT_EQ(SignalController::decide(false, false, true, true), SignalDecision::hold);
  EXPECT_EQ(SignalController::decide(false, false, false, false), SignalDecision::idle_yellow);
  EXPECT_EQ(SignalController::decide(false, false, false, true), SignalDecision::tracking_blue);
}

TEST(SignalControllerTest, RepeatedCommandIsSentOnce)
{
  auto log = std::make_shared<fakes::FakeLight::Log>();
  SignalController controller(std::make_unique<fakes::FakeLight>(log));

  for (int i = 0; i < 10; i++) controller.update({}, true);
  for (int i = 0; i < 10; i++) controller.update({}, false);
  controller.update({}, true);

  ASSERT_TRUE(fakes::wait_until([&] { return log->snapshot().size() >= 3; }));
  controller.stop();

  EXPECT_EQ(
    log->snapshot(), (std::vector<SignalCommand>{
                       SignalCommand::blue_on, SignalCommand::yellow_on, SignalCommand::blue_on,
                       SignalCommand::all_off}));
}

TEST(SignalControllerTest, IncompleteWinsOverCompleted)
{
  auto log = std::make_shared<fakes::FakeLight::Log>();
  SignalController controller(std::make_unique<fakes::FakeLight>(log));

  Resolution both = incomplete(1);
  both.completed_ids = {2};
  EXPECT_EQ(controller.update(both, true), SignalDecision::incomplete_alarm);
  EXPECT_EQ(controller.last_sent(), SignalCommand::red_flash_buzzer);
  EXPECT_TRUE(controller.timer_active());

  ASSERT_TRUE(fakes::wait_until([&] { return log->count(SignalCommand::red_flash_buzzer) == 1; }));
  EXPECT_EQ(log->count(SignalCommand::green_on), 0);
}

TEST(SignalControllerTest, GreenRevertsToBlue)
{
  auto log = std::make_shared<fakes::FakeLight::Log>();
  SignalController controller(std::make_unique<fakes::FakeLight>(log), 0.1, 0.1);

  controller.update({}, true);
  EXPECT_EQ(controller.update(completed(3), true), SignalDecision::completed_flash);

  // 定时期间保持绿灯
  EXPECT_EQ(controller.update({}, true), SignalDecision::hold);
  EXPECT_EQ(controller.update({}, false), SignalDecision::hold);

  ASSERT_TRUE(fakes::wait_until([&] { return !controller.timer_active(); }));
  ASSERT_TRUE(fakes::wait_until([&] { return log->snapshot().size() == 3; }));

  EXPECT_EQ(
    log->snapshot(), (std::vector<SignalCommand>{
                       SignalCommand::blue_on, SignalCommand::green_on, SignalCommand::blue_on}));
  EXPECT_EQ(controller.last_sent(), SignalCommand::blue_on);

  // 恢复蓝灯后，蓝灯决策不再重复下发
  EXPECT_EQ(controller.update({}, true), SignalDecision::tracking_blue);
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(log->count(SignalCommand::blue_on), 2);
}

TEST(SignalControllerTest, AlarmRevertOrder)
{
  auto log = std::make_shared<fakes::FakeLight::Log>();
  SignalController controller(std::make_unique<fakes::FakeLight>(log), 0.1, 0.1);

  controller.update(incomplete(4), true);
  ASSERT_TRUE(fakes::wait_until([&] { return log->snapshot().size() == 3; }));

  EXPECT_EQ(
    log->snapshot(),
    (std::vector<SignalCommand>{
      SignalCommand::red_flash_buzzer, SignalCommand::red_buzzer_off, SignalCommand::blue_on}));
  EXPECT_FALSE(controller.timer_active());
}

TEST(SignalControllerTest, NewTimedCommandReplacesOverdueRevert)
{
  // 红灯定时已到期但尚未恢复时立即切绿灯，绿灯窗口内不得被旧定时改回蓝灯
  for (int round = 0; round < 10; round++) {
    auto log = std::make_shared<fakes::FakeLight::Log>();
    SignalController controller(std::make_unique<fakes::FakeLight>(log));

    controller.red_alarm(0.0);
    controller.green(0.5);
    std::this_thread::sleep_for(250ms);

    EXPECT_TRUE(controller.timer_active()) << "round " << round;
    EXPECT_EQ(controller.last_sent(), SignalCommand::green_on) << "round " << round;

    auto commands = log->snapshot();
    auto green = std::find(commands.begin(), commands.end(), SignalCommand::green_on);
    ASSERT_TRUE(green != commands.end()) << "round " << round;
    EXPECT_TRUE(std::find(green, commands.end(), SignalCommand::blue_on) == commands.end())
      << "round " << round;
    EXPECT_TRUE(
      std::find(green, commands.end(), SignalCommand::red_buzzer_off) == commands.end())
      << "round " << round;
  }
}

TEST(SignalControllerTest, YellowCancelsTimer)
{
  auto log = std::make_shared<fakes::FakeLight::Log>();
  SignalController controller(std::make_unique<fakes::FakeLight>(log), 0.2, 0.2);

  controller.green(0.2);
  EXPECT_TRUE(controller.timer_active());
  controller.yellow();
  EXPECT_FALSE(controller.timer_active());

  std::this_thread::sleep_for(400ms);
  EXPECT_EQ(
    log->snapshot(), (std::vector<SignalCommand>{SignalCommand::green_on, SignalCommand::yellow_on}));
}

TEST(SignalControllerTest, WriteFailureDisablesLight)
{
  auto log = std::make_shared<fakes::FakeLight::Log>();
  log->fail = true;
  SignalController controller(std::make_unique<fakes::FakeLight>(log));

  controller.update({}, false);
  ASSERT_TRUE(fakes::wait_until([&] { return !controller.enabled(); }));

  // 降级后不再抛出也不再写入
  log->fail = false;
  controller.update(incomplete(1), true);
  EXPECT_FALSE(controller.timer_active());
  controller.stop();
  EXPECT_TRUE(log->snapshot().empty());
}

TEST(SignalControllerTest, NullLightIsDisabled)
{
  SignalController controller(nullptr);
  EXPECT_FALSE(controller.enabled());

  EXPECT_EQ(controller.update(incomplete(1), true), SignalDecision::incomplete_alarm);
  EXPECT_FALSE(controller.timer_active());
  EXPECT_FALSE(controller.last_sent().has_value());
  controller.stop();
}
