#ifndef IO__SIGNAL_LIGHT_HPP
#define IO__SIGNAL_LIGHT_HPP

#include <array>
#include <cstdint>
#include <string>

#include "io/command.hpp"
#include "serial/serial.h"

namespace io
{
/// 灯控硬件的写入接口；写入失败抛出异常
class SignalLightBase
{
public:
  virtual ~SignalLightBase() = default;

  virtual void write(SignalCommand command) = 0;
};

/// Modbus-RTU 写单线圈帧：从站地址、功能码 0x05、线圈地址、模式、CRC
using ModbusFrame = std::array<uint8_t, 8>;

ModbusFrame modbus_frame(SignalCommand command);

/**
 * @brief RS-485 三色灯（带蜂鸣器）
 * @note 线圈地址：1红 2绿 3蓝 4黄 5蜂鸣 6红+蜂鸣 10全部；模式：0关 1常亮 3快闪
 */
class SignalLight : public SignalLightBase
{
public:
  /// @throw std::exception 串口无法打开
  SignalLight(const std::string & port, uint32_t baudrate = 9600);

  ~SignalLight() override;

  void write(SignalCommand command) override;

private:
  serial::Serial serial_;
  std::string port_;
};

}  // namespace io

#endif  // IO__SIGNAL_LIGHT_HPP
