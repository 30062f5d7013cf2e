#include "inventory.hpp"

#include "tools/logger.hpp"

namespace inspection
{
InventoryRecord::InventoryRecord(const std::vector<RequiredItem> & required)
{
  for (const auto & item : required) {
    required_.emplace_back(item.key, item.quantity);
    achieved_[item.key] = 0;
    completed_[item.key] = false;
  }
}

void InventoryRecord::observe(const ItemCounts & counts)
{
  for (const auto & [key, need] : required_) {
    auto it = counts.find(key);
    auto have = (it == counts.end()) ? 0 : it->second;
    achieved_[key] = have;

    if (!completed_[key] && have >= need) mark_completed(key);
  }
}

int InventoryRecord::achieved(const std::string & key) const
{
  auto it = achieved_.find(key);
  return (it == achieved_.end()) ? 0 : it->second;
}

bool InventoryRecord::completed(const std::string & key) const
{
  auto it = completed_.find(key);
  return it != completed_.end() && it->second;
}

bool InventoryRecord::all_completed() const
{
  for (const auto & [key, done] : completed_)
    if (!done) return false;
  return true;
}

std::vector<std::string> InventoryRecord::missing() const
{
  std::vector<std::string> keys;
  for (const auto & [key, need] : required_)
    if (!completed(key)) keys.push_back(key);
  return keys;
}

Inventory::Inventory(const RequirementSpec & spec) : spec_(spec), required_(spec.required()) {}

void Inventory::update(
  const std::vector<TrackedBox> & tracks, const std::map<int, ItemCounts> & counts)
{
  static const ItemCounts empty;

  for (const auto & track : tracks) {
    auto record = records_.find(track.id);
    if (record == records_.end()) record = records_.emplace(track.id, InventoryRecord(required_)).first;

    auto it = counts.find(track.id);
    record->second.observe(it == counts.end() ? empty : it->second);
  }
}

Resolution Inventory::handle_disappearance(
  const std::vector<int> & ids, std::chrono::system_clock::time_point now)
{
  Resolution resolution;

  for (auto id : ids) {
    auto it = records_.find(id);
    if (it == records_.end()) {
      tools::logger()->debug("[Inventory] id {} has no record, skip", id);
      continue;
    }

    const auto & record = it->second;
    if (record.all_completed()) {
      resolution.completed_ids.push_back(id);
    } else {
      AlertEvent alert{id, now, {}};
      for (const auto & key : record.missing()) alert.missing.emplace_back(key, spec_.name_of(key));
      resolution.alerts.push_back(std::move(alert));
      resolution.incomplete_ids.push_back(id);
    }

    records_.erase(it);
  }

  return resolution;
}

std::vector<RequirementLabel> Inventory::labels(int track_id) const
{
  auto it = records_.find(track_id);
  const InventoryRecord * record = (it == records_.end()) ? nullptr : &it->second;

  std::vector<RequirementLabel> labels;
  for (const auto & item : required_) {
    labels.push_back(
      {item.key, item.name, item.quantity, record ? record->achieved(item.key) : 0,
       record ? record->completed(item.key) : false});
  }
  return labels;
}

const InventoryRecord * Inventory::record(int track_id) const
{
  auto it = records_.find(track_id);
  return (it == records_.end()) ? nullptr : &it->second;
}

}  // namespace inspection
