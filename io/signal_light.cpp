#include "signal_light.hpp"

#include <fmt/core.h>

#include <stdexcept>

#include "tools/crc.hpp"
#include "tools/logger.hpp"

namespace io
{
namespace
{
constexpr uint8_t SLAVE_ID = 0x01;
constexpr uint8_t WRITE_SINGLE_COIL = 0x05;

// {线圈地址, 模式}
std::pair<uint8_t, uint8_t> coil_of(SignalCommand command)
{
  switch (command) {
    case SignalCommand::all_off:          return {0x0A, 0x00};
    case SignalCommand::yellow_on:        return {0x04, 0x01};
    case SignalCommand::blue_on:          return {0x03, 0x01};
    case SignalCommand::green_on:         return {0x02, 0x01};
    case SignalCommand::red_flash_buzzer: return {0x06, 0x03};
    case SignalCommand::red_buzzer_off:   return {0x06, 0x00};
  }
  throw std::invalid_argument("unknown signal command");
}
}  // namespace

ModbusFrame modbus_frame(SignalCommand command)
{
  auto [address, mode] = coil_of(command);
  ModbusFrame frame = {SLAVE_ID, WRITE_SINGLE_COIL, 0x00, address, mode, 0x00, 0x00, 0x00};

  auto crc = tools::get_crc16_modbus(frame.data(), frame.size() - 2);
  frame[6] = crc & 0xFF;
  frame[7] = crc >> 8;
  return frame;
}

SignalLight::SignalLight(const std::string & port, uint32_t baudrate) : port_(port)
{
  serial_.setPort(port);
  serial_.setBaudrate(baudrate);
  serial_.setBytesize(serial::eightbits);
  serial_.setParity(serial::parity_none);
  serial_.setStopbits(serial::stopbits_one);
  auto timeout = serial::Timeout::simpleTimeout(1000);
  serial_.setTimeout(timeout);
  serial_.open();

  tools::logger()->info("[SignalLight] Connected to {} @ {}.", port, baudrate);
}

SignalLight::~SignalLight()
{
  try {
    if (serial_.isOpen()) {
      auto frame = modbus_frame(SignalCommand::all_off);
      serial_.write(frame.data(), frame.size());
      serial_.flush();
      serial_.close();
    }
  } catch (const std::exception & e) {
    tools::logger()->warn("[SignalLight] Failed to close {}: {}", port_, e.what());
  }
}

void SignalLight::write(SignalCommand command)
{
  auto frame = modbus_frame(command);
  auto written = serial_.write(frame.data(), frame.size());
  if (written != frame.size()) {
    throw std::runtime_error(
      fmt::format("short write on {}: {}/{} bytes", port_, written, frame.size()));
  }
}

}  // namespace io
