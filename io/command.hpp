#ifndef IO__COMMAND_HPP
#define IO__COMMAND_HPP

#include <string>
#include <vector>

namespace io
{
/// 三色灯/蜂鸣器指令
enum class SignalCommand
{
  all_off,
  yellow_on,
  blue_on,
  green_on,
  red_flash_buzzer,  // 红灯快闪+蜂鸣
  red_buzzer_off     // 关闭红灯+蜂鸣
};

const std::vector<std::string> SIGNAL_COMMANDS = {"all_off",          "yellow_on", "blue_on",
                                                  "green_on",         "red_flash_buzzer",
                                                  "red_buzzer_off"};

inline const std::string & str(SignalCommand command)
{
  return SIGNAL_COMMANDS[static_cast<size_t>(command)];
}

}  // namespace io

#endif  // IO__COMMAND_HPP
