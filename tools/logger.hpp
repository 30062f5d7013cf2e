#ifndef TOOLS__LOGGER_HPP
#define TOOLS__LOGGER_HPP

#include <spdlog/spdlog.h>

namespace tools
{
/**
 * @brief 全局日志器（首次调用时创建）
 * @note 同时输出到彩色终端与 logs/<启动时间>.log，线程安全
 */
std::shared_ptr<spdlog::logger> logger();

}  // namespace tools

#endif  // TOOLS__LOGGER_HPP
