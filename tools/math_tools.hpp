#ifndef TOOLS__MATH_TOOLS_HPP
#define TOOLS__MATH_TOOLS_HPP

#include <chrono>

namespace tools
{
/// a - b，单位：秒
double delta_time(
  const std::chrono::steady_clock::time_point & a, const std::chrono::steady_clock::time_point & b);

}  // namespace tools

#endif  // TOOLS__MATH_TOOLS_HPP
