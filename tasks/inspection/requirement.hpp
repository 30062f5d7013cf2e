#ifndef INSPECTION__REQUIREMENT_HPP
#define INSPECTION__REQUIREMENT_HPP

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace inspection
{
struct RequiredItem
{
  int class_id;
  std::string key;   // "class<N>"
  std::string name;  // 显示名
  int quantity;      // <=0 仅用于显示名，不构成要求
};

/// 一种收纳盒的装配清单
struct RequirementSpec
{
  std::string container_key;
  std::string container_name;
  std::vector<RequiredItem> items;  // 按类别号升序

  /// quantity > 0 的条目
  std::vector<RequiredItem> required() const;

  /// 未登记的类别返回 key 本身
  std::string name_of(const std::string & key) const;
};

/**
 * @brief 解析装配清单
 * @throw ConfigError 缺少根类别、name、contains，或 contains 不是对象
 */
RequirementSpec parse_requirements(
  const nlohmann::json & json, int container_class, int num_classes);

/// 读取并解析 JSON 文件，打不开或语法错误同样抛 ConfigError
RequirementSpec load_requirements(
  const std::string & path, int container_class, int num_classes);

/**
 * @brief 带缓存的清单加载器
 *
 * 文件修改时间不变时直接返回缓存；force 为 true 时总是重新读取。
 */
class RequirementLoader
{
public:
  RequirementLoader(const std::string & path, int container_class, int num_classes);

  const RequirementSpec & load(bool force = false);

  const std::string & path() const { return path_; }

private:
  std::string path_;
  int container_class_;
  int num_classes_;

  std::optional<RequirementSpec> cache_;
  std::filesystem::file_time_type mtime_;
};

}  // namespace inspection

#endif  // INSPECTION__REQUIREMENT_HPP
