#ifndef INSPECTION__INVENTORY_HPP
#define INSPECTION__INVENTORY_HPP

#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "detection.hpp"
#include "item_assigner.hpp"
#include "requirement.hpp"

namespace inspection
{
/**
 * @brief 单个收纳盒的装配状态
 *
 * achieved 每帧覆盖；completed 只能由 false 置为 true。
 */
class InventoryRecord
{
public:
  explicit InventoryRecord(const std::vector<RequiredItem> & required);

  /// 用本帧计数覆盖 achieved，并对达标类别置完成
  void observe(const ItemCounts & counts);

  int achieved(const std::string & key) const;
  bool completed(const std::string & key) const;

  /// 没有任何要求时恒为 true
  bool all_completed() const;

  /// 尚未完成的类别键，按清单顺序
  std::vector<std::string> missing() const;

private:
  std::vector<std::pair<std::string, int>> required_;
  std::map<std::string, int> achieved_;
  std::map<std::string, bool> completed_;

  void mark_completed(const std::string & key) { completed_[key] = true; }
};

struct AlertEvent
{
  int track_id;
  std::chrono::system_clock::time_point timestamp;
  std::vector<std::pair<std::string, std::string>> missing;  // (class key, 显示名)
};

struct Resolution
{
  std::vector<AlertEvent> alerts;
  std::vector<int> completed_ids;
  std::vector<int> incomplete_ids;
};

/// 绘制用标签：仅包含 quantity > 0 的类别
struct RequirementLabel
{
  std::string key;
  std::string name;
  int required;
  int achieved;
  bool completed;
};

class Inventory
{
public:
  explicit Inventory(const RequirementSpec & spec);

  void update(const std::vector<TrackedBox> & tracks, const std::map<int, ItemCounts> & counts);

  /**
   * @brief 判定消失的收纳盒是否装配完整
   * @note 没有台账记录的 id（从未对外可见或已判定过）直接跳过；判定后记录被删除
   */
  Resolution handle_disappearance(
    const std::vector<int> & ids,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

  std::vector<RequirementLabel> labels(int track_id) const;

  const InventoryRecord * record(int track_id) const;

  /// 已对外可见且尚未判定
  bool tracking(int track_id) const { return records_.count(track_id) > 0; }

  const RequirementSpec & spec() const { return spec_; }

private:
  RequirementSpec spec_;
  std::vector<RequiredItem> required_;
  std::map<int, InventoryRecord> records_;
};

}  // namespace inspection

#endif  // INSPECTION__INVENTORY_HPP
