#ifndef INSPECTION__TRACKER_HPP
#define INSPECTION__TRACKER_HPP

#include <opencv2/core.hpp>
#include <vector>

#include "box_track.hpp"
#include "detection.hpp"

namespace inspection
{
struct TrackResult
{
  std::vector<TrackedBox> tracks;  // 本帧对外可见的轨迹
  std::vector<int> disappeared;    // 本帧被移除、且曾对外可见的轨迹 id
};

/**
 * @brief SORT 多目标跟踪器（只跟踪收纳盒）
 *
 * 每帧：预测 → 关联 → 修正 → 新建 → 输出 → 老化移除。
 * id 在单个实例内从 1 开始递增，不复用。
 */
class Tracker
{
public:
  Tracker(int max_age = 20, int min_hits = 20, double iou_threshold = 0.5);

  TrackResult update(const std::vector<cv::Rect2d> & detections);

  int frame_count() const { return frame_count_; }

  /// 当前存活（含未确认）的轨迹数
  std::size_t size() const { return tracks_.size(); }

private:
  int max_age_;
  int min_hits_;
  double iou_threshold_;

  int frame_count_;
  int next_id_;
  std::vector<BoxTrack> tracks_;

  bool reportable(const BoxTrack & track) const;
};

}  // namespace inspection

#endif  // INSPECTION__TRACKER_HPP
