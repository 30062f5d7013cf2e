#ifndef TOOLS__YAML_HPP
#define TOOLS__YAML_HPP

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

#include "tools/logger.hpp"

namespace tools
{
/**
 * @brief 加载YAML配置文件并返回根节点
 * @throw std::runtime_error 文件不存在或语法错误
 * @note 会话在运行期间可以被重新启动，配置错误只拒绝本次启动，不退出进程
 */
inline YAML::Node load(const std::string & path)
{
  try {
    return YAML::LoadFile(path);
  } catch (const YAML::BadFile &) {
    logger()->error("[YAML] Failed to load file: {}", path);
    throw std::runtime_error("failed to load yaml file: " + path);
  } catch (const YAML::ParserException & e) {
    logger()->error("[YAML] Parser error: {}", e.what());
    throw std::runtime_error(std::string("yaml parser error: ") + e.what());
  }
}

/**
 * @brief 读取指定键的配置值
 * @throw std::runtime_error 键不存在或类型不匹配
 */
template <typename T>
inline T read(const YAML::Node & yaml, const std::string & key)
{
  if (!yaml[key]) {
    logger()->error("[YAML] {} not found!", key);
    throw std::runtime_error(key + " not found");
  }

  try {
    return yaml[key].as<T>();
  } catch (const YAML::BadConversion & e) {
    logger()->error("[YAML] {} has wrong type: {}", key, e.what());
    throw std::runtime_error(key + " has wrong type");
  }
}

/// 可选键：缺失时返回默认值，类型错误仍然抛出
template <typename T>
inline T read(const YAML::Node & yaml, const std::string & key, const T & fallback)
{
  if (!yaml[key]) return fallback;
  return read<T>(yaml, key);
}

}  // namespace tools

#endif  // TOOLS__YAML_HPP
