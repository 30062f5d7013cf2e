#include "tracker.hpp"

#include <cmath>

#include "association.hpp"
#include "tools/logger.hpp"

namespace inspection
{
namespace
{
bool is_invalid(const cv::Rect2d & box)
{
  return std::isnan(box.x) || std::isnan(box.y) || std::isnan(box.width) ||
         std::isnan(box.height);
}
}  // namespace

Tracker::Tracker(int max_age, int min_hits, double iou_threshold)
: max_age_(max_age),
  min_hits_(min_hits),
  iou_threshold_(iou_threshold),
  frame_count_(0),
  next_id_(1)
{
}

TrackResult Tracker::update(const std::vector<cv::Rect2d> & detections)
{
  TrackResult result;
  frame_count_++;

  // 1. 预测，数值失效的轨迹直接丢弃
  std::vector<cv::Rect2d> predictions;
  for (auto it = tracks_.begin(); it != tracks_.end();) {
    auto box = it->predict();
    if (is_invalid(box)) {
      tools::logger()->warn("[Tracker] track {} diverged, removed", it->id());
      if (it->has_been_returned()) result.disappeared.push_back(it->id());
      it = tracks_.erase(it);
      continue;
    }
    predictions.push_back(box);
    ++it;
  }

  // 2. 关联
  auto association = associate(detections, predictions, iou_threshold_);

  // 3. 修正
  for (const auto & [det, pred] : association.matches) tracks_[pred].update(detections[det]);

  // 4. 未匹配的检测建立新轨迹
  for (auto det : association.unmatched_detections)
    tracks_.emplace_back(detections[det], next_id_++);

  // 5. 输出 6. 老化移除
  for (auto it = tracks_.begin(); it != tracks_.end();) {
    if (reportable(*it)) {
      it->mark_returned();
      result.tracks.push_back({it->id(), it->box()});
    }

    if (it->time_since_update() > max_age_) {
      if (it->has_been_returned()) result.disappeared.push_back(it->id());
      it = tracks_.erase(it);
      continue;
    }
    ++it;
  }

  return result;
}

bool Tracker::reportable(const BoxTrack & track) const
{
  // 启动后前 min_hits 帧内放宽连续命中要求
  return track.time_since_update() < 1 &&
         (track.hit_streak() >= min_hits_ || frame_count_ <= min_hits_);
}

}  // namespace inspection
