#ifndef INSPECTION__DETECTOR_HPP
#define INSPECTION__DETECTOR_HPP

#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "detection.hpp"

namespace inspection
{
struct DetectorConfig
{
  std::string yolo_name = "yolov8";
  std::string model_path;
  std::string device = "CPU";
  double min_confidence = 0.5;
  double nms_threshold = 0.45;
  int num_classes = 7;
  std::vector<cv::Rect2d> ignore_regions;  // 中心点落入其中的检测丢弃
};

/// 检测器接口：一帧图像 → 检测框列表
class DetectorBase
{
public:
  virtual ~DetectorBase() = default;

  virtual std::vector<Detection> detect(const cv::Mat & img) = 0;
};

/// 去掉中心点位于任一忽略区域内（含边界）的检测
std::vector<Detection> drop_ignored(
  const std::vector<Detection> & detections, const std::vector<cv::Rect2d> & regions);

}  // namespace inspection

#endif  // INSPECTION__DETECTOR_HPP
