#include "item_assigner.hpp"

namespace inspection
{
ItemAssignment assign_items(
  const std::vector<TrackedBox> & tracks, const std::vector<Detection> & items)
{
  ItemAssignment assignment;

  for (const auto & track : tracks) {
    auto & counts = assignment.counts[track.id];
    auto & rows = assignment.items[track.id];

    for (const auto & item : items) {
      if (!contains_inclusive(track.box, item.center())) continue;
      counts[class_key(item.class_id)]++;
      rows.push_back(item);
    }
  }

  return assignment;
}

}  // namespace inspection
