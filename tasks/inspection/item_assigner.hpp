#ifndef INSPECTION__ITEM_ASSIGNER_HPP
#define INSPECTION__ITEM_ASSIGNER_HPP

#include <map>
#include <string>
#include <vector>

#include "detection.hpp"

namespace inspection
{
/// 类别键 → 本帧数量
using ItemCounts = std::map<std::string, int>;

struct ItemAssignment
{
  std::map<int, ItemCounts> counts;                 // track id → 计数
  std::map<int, std::vector<Detection>> items;      // track id → 原始零件检测，供绘制
};

/**
 * @brief 按中心点归属零件
 * @note 中心点同时落在多个收纳盒内时，每个收纳盒各计一次；不在任何盒内的零件丢弃
 */
ItemAssignment assign_items(
  const std::vector<TrackedBox> & tracks, const std::vector<Detection> & items);

}  // namespace inspection

#endif  // INSPECTION__ITEM_ASSIGNER_HPP
