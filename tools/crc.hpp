#ifndef TOOLS__CRC_HPP
#define TOOLS__CRC_HPP

#include <cstddef>
#include <cstdint>

namespace tools
{
/// CRC-16/MODBUS（多项式 0xA001 反射，初值 0xFFFF）
uint16_t get_crc16_modbus(const uint8_t * data, size_t len);

/// 末尾两字节为低字节在前的 CRC 时返回true
bool check_crc16_modbus(const uint8_t * data, size_t len);

}  // namespace tools

#endif  // TOOLS__CRC_HPP
