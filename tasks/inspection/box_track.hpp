#ifndef INSPECTION__BOX_TRACK_HPP
#define INSPECTION__BOX_TRACK_HPP

#include <Eigen/Dense>
#include <opencv2/core.hpp>

#include "tools/kalman_filter.hpp"

namespace inspection
{
/// [x1,y1,x2,y2] → [cx, cy, s(面积), r(宽高比)]
Eigen::Vector4d box_to_z(const cv::Rect2d & box);

/// 状态前四维 → 框；面积或宽高比为负时结果含 NaN
cv::Rect2d x_to_box(const Eigen::VectorXd & x);

/**
 * @brief 单个收纳盒的卡尔曼轨迹
 *
 * 状态 [cx, cy, s, r, vcx, vcy, vs]，匀速模型，宽高比视为常量。
 */
class BoxTrack
{
public:
  BoxTrack(const cv::Rect2d & box, int id);

  /// 预测一步并返回预测框
  cv::Rect2d predict();

  /// 用观测框修正
  void update(const cv::Rect2d & box);

  cv::Rect2d box() const;

  int id() const { return id_; }
  int hits() const { return hits_; }
  int hit_streak() const { return hit_streak_; }
  int time_since_update() const { return time_since_update_; }
  int age() const { return age_; }

  bool has_been_returned() const { return has_been_returned_; }

  /// 只能从 false 变为 true
  void mark_returned() { has_been_returned_ = true; }

  const Eigen::VectorXd & state() const { return kf_.x; }

private:
  tools::KalmanFilter kf_;
  int id_;
  int hits_;
  int hit_streak_;
  int time_since_update_;
  int age_;
  bool has_been_returned_;
};

}  // namespace inspection

#endif  // INSPECTION__BOX_TRACK_HPP
