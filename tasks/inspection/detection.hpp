#ifndef INSPECTION__DETECTION_HPP
#define INSPECTION__DETECTION_HPP

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace inspection
{
/// 单帧检测结果，box 为像素坐标 (x, y, w, h)
struct Detection
{
  cv::Rect2d box;
  float score;
  int class_id;

  Detection() : score(0), class_id(-1) {}

  Detection(double x1, double y1, double x2, double y2, float score, int class_id)
  : box(x1, y1, x2 - x1, y2 - y1), score(score), class_id(class_id)
  {
  }

  cv::Point2d center() const { return {box.x + box.width / 2.0, box.y + box.height / 2.0}; }
};

/// 已确认的收纳盒轨迹（对外可见）
struct TrackedBox
{
  int id;
  cv::Rect2d box;
};

/// 装配清单与计数统一使用的类别键，如 "class3"
inline std::string class_key(int class_id) { return "class" + std::to_string(class_id); }

/// 闭区间包含判断：点落在边上也算在框内
inline bool contains_inclusive(const cv::Rect2d & box, const cv::Point2d & p)
{
  return p.x >= box.x && p.x <= box.x + box.width && p.y >= box.y && p.y <= box.y + box.height;
}

}  // namespace inspection

#endif  // INSPECTION__DETECTION_HPP
