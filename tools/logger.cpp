#include "logger.hpp"

#include <fmt/chrono.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <chrono>
#include <ctime>
#include <mutex>
#include <string>

namespace tools
{
namespace
{
std::shared_ptr<spdlog::logger> logger_ = nullptr;
std::once_flag logger_once_;

void set_logger()
{
  // 文件名精确到秒，同一秒内重复启动时以追加方式写入同一文件
  auto now = std::time(nullptr);
  auto file_name = fmt::format("logs/{:%Y-%m-%d_%H-%M-%S}.log", fmt::localtime(now));

  // basic_file_sink 会自动创建 logs/ 目录
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_name, true);
  file_sink->set_level(spdlog::level::debug);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console_sink->set_level(spdlog::level::info);

  logger_ = std::make_shared<spdlog::logger>("", spdlog::sinks_init_list{file_sink, console_sink});
  logger_->set_level(spdlog::level::debug);
  logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
  logger_->flush_on(spdlog::level::info);
}
}  // namespace

std::shared_ptr<spdlog::logger> logger()
{
  // 采集线程、告警写盘线程、灯控线程都会调用，需保证只初始化一次
  std::call_once(logger_once_, set_logger);
  return logger_;
}

}  // namespace tools
