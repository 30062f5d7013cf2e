#include "crc.hpp"

namespace tools
{
uint16_t get_crc16_modbus(const uint8_t * data, size_t len)
{
  uint16_t crc = 0xFFFF;
  for (size_t i = 0; i < len; ++i) {
    crc ^= data[i];
    for (int bit = 0; bit < 8; ++bit) {
      crc = (crc & 0x0001) ? static_cast<uint16_t>((crc >> 1) ^ 0xA001) : static_cast<uint16_t>(crc >> 1);
    }
  }
  return crc;
}

bool check_crc16_modbus(const uint8_t * data, size_t len)
{
  if (len < 2) return false;
  auto crc = get_crc16_modbus(data, len - 2);
  return data[len - 2] == (crc & 0xFF) && data[len - 1] == (crc >> 8);
}

}  // namespace tools
