#ifndef INSPECTION__VISUALIZER_HPP
#define INSPECTION__VISUALIZER_HPP

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "detection.hpp"
#include "inventory.hpp"
#include "item_assigner.hpp"

namespace inspection
{
/// 检测画面叠加层
class Visualizer
{
public:
  /// 在输入帧的拷贝上绘制，输入帧不变
  cv::Mat render(
    const cv::Mat & frame, const std::vector<TrackedBox> & tracks,
    const ItemAssignment & assignment, const Inventory & inventory,
    const std::vector<AlertEvent> & alerts, double fps) const;

  /// "The ID[3] is missing class[class1][comb clamp], ..."
  static std::string alert_text(const AlertEvent & alert);

  static cv::Scalar track_color(int track_id);
  static cv::Scalar item_color(int class_id);

private:
  void draw_tracks(cv::Mat & img, const std::vector<TrackedBox> & tracks) const;
  void draw_items(cv::Mat & img, const ItemAssignment & assignment) const;
  void draw_requirements(
    cv::Mat & img, const TrackedBox & track, const std::vector<RequirementLabel> & labels) const;
  void draw_alerts(cv::Mat & img, const std::vector<AlertEvent> & alerts) const;
};

}  // namespace inspection

#endif  // INSPECTION__VISUALIZER_HPP
