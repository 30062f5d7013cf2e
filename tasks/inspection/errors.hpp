#ifndef INSPECTION__ERRORS_HPP
#define INSPECTION__ERRORS_HPP

#include <stdexcept>
#include <string>

namespace inspection
{
/// 配置文件/装配清单缺字段或类型错误，拒绝启动会话
class ConfigError : public std::runtime_error
{
public:
  explicit ConfigError(const std::string & what) : std::runtime_error(what) {}
};

/// 视频源无法打开
class SourceError : public std::runtime_error
{
public:
  explicit SourceError(const std::string & what) : std::runtime_error(what) {}
};

/// 单帧处理（检测/跟踪/计数/台账）失败，终止当前会话
class FrameProcessingError : public std::runtime_error
{
public:
  explicit FrameProcessingError(const std::string & what) : std::runtime_error(what) {}
};

}  // namespace inspection

#endif  // INSPECTION__ERRORS_HPP
