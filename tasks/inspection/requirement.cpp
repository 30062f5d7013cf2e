#include "requirement.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>

#include "detection.hpp"
#include "errors.hpp"
#include "tools/logger.hpp"

namespace inspection
{
namespace
{
// "class<N>" → N，格式不符返回 -1
int parse_class_key(const std::string & key)
{
  const std::string prefix = "class";
  if (key.size() <= prefix.size() || key.compare(0, prefix.size(), prefix) != 0) return -1;

  auto digits = key.substr(prefix.size());
  if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); }))
    return -1;
  if (digits.size() > 6) return -1;

  return std::stoi(digits);
}

// 整数字符串（允许首尾空白）→ 数值，否则返回 0
int parse_quantity_string(const std::string & text)
{
  auto first = text.find_first_not_of(" \t");
  if (first == std::string::npos) return 0;
  auto last = text.find_last_not_of(" \t");
  auto digits = text.substr(first, last - first + 1);
  if (digits.front() == '+') digits.erase(0, 1);

  int value = 0;
  auto begin = digits.data();
  auto end = begin + digits.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) return 0;
  return value;
}

// 浮点截断、数字字符串按整数解析，其余类型以及负数一律归零
int normalize_quantity(const nlohmann::json & entry)
{
  if (!entry.is_object() || !entry.contains("quantity")) return 0;

  const auto & q = entry["quantity"];
  int quantity = 0;
  if (q.is_number_integer())
    quantity = q.get<int>();
  else if (q.is_number_float() && std::isfinite(q.get<double>()))
    quantity = static_cast<int>(q.get<double>());
  else if (q.is_string())
    quantity = parse_quantity_string(q.get<std::string>());

  return std::max(quantity, 0);
}
}  // namespace

std::vector<RequiredItem> RequirementSpec::required() const
{
  std::vector<RequiredItem> result;
  for (const auto & item : items)
    if (item.quantity > 0) result.push_back(item);
  return result;
}

std::string RequirementSpec::name_of(const std::string & key) const
{
  for (const auto & item : items)
    if (item.key == key) return item.name;
  return key;
}

RequirementSpec parse_requirements(
  const nlohmann::json & json, int container_class, int num_classes)
{
  auto root_key = class_key(container_class);
  if (!json.is_object() || !json.contains(root_key))
    throw ConfigError("requirement file has no " + root_key + " entry");

  const auto & root = json[root_key];
  if (!root.is_object() || !root.contains("name") || !root.contains("contains"))
    throw ConfigError(root_key + " needs both name and contains");

  const auto & contains = root["contains"];
  if (!contains.is_object()) throw ConfigError(root_key + ".contains must be an object");

  RequirementSpec spec;
  spec.container_key = root_key;
  spec.container_name = root["name"].is_string() ? root["name"].get<std::string>() : root_key;

  for (const auto & [key, entry] : contains.items()) {
    auto id = parse_class_key(key);
    if (id < 1 || id >= num_classes || id == container_class) {
      tools::logger()->debug("[Requirement] ignore key {}", key);
      continue;
    }

    auto name = key;
    if (entry.is_object() && entry.contains("name") && entry["name"].is_string())
      name = entry["name"].get<std::string>();

    spec.items.push_back({id, key, name, normalize_quantity(entry)});
  }

  std::sort(spec.items.begin(), spec.items.end(), [](const auto & a, const auto & b) {
    return a.class_id < b.class_id;
  });

  return spec;
}

RequirementSpec load_requirements(
  const std::string & path, int container_class, int num_classes)
{
  std::ifstream file(path);
  if (!file.is_open()) throw ConfigError("cannot open requirement file: " + path);

  nlohmann::json json;
  try {
    file >> json;
  } catch (const nlohmann::json::parse_error & e) {
    throw ConfigError(std::string("requirement file parse error: ") + e.what());
  }

  auto spec = parse_requirements(json, container_class, num_classes);
  tools::logger()->info(
    "[Requirement] {} loaded: {} ({} items, {} required)", path, spec.container_name,
    spec.items.size(), spec.required().size());
  return spec;
}

RequirementLoader::RequirementLoader(
  const std::string & path, int container_class, int num_classes)
: path_(path), container_class_(container_class), num_classes_(num_classes)
{
}

const RequirementSpec & RequirementLoader::load(bool force)
{
  std::error_code ec;
  auto mtime = std::filesystem::last_write_time(path_, ec);
  if (ec) throw ConfigError("cannot stat requirement file: " + path_);

  if (force || !cache_ || mtime != mtime_) {
    cache_ = load_requirements(path_, container_class_, num_classes_);
    mtime_ = mtime;
  }

  return *cache_;
}

}  // namespace inspection
