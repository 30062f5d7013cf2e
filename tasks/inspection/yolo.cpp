#include "yolo.hpp"

#include "tools/logger.hpp"
#include "yolos/yolov8.hpp"

namespace inspection
{
std::vector<Detection> drop_ignored(
  const std::vector<Detection> & detections, const std::vector<cv::Rect2d> & regions)
{
  if (regions.empty()) return detections;

  std::vector<Detection> kept;
  for (const auto & detection : detections) {
    auto center = detection.center();
    auto ignored = false;
    for (const auto & region : regions) {
      if (contains_inclusive(region, center)) {
        ignored = true;
        break;
      }
    }
    if (!ignored) kept.push_back(detection);
  }
  return kept;
}

YOLO::YOLO(const DetectorConfig & config) : ignore_regions_(config.ignore_regions)
{
  if (config.yolo_name == "yolov8")
    yolo_ = std::make_unique<YOLOV8>(config);
  else
    throw std::runtime_error("Unknown yolo name: " + config.yolo_name + "!");

  if (!ignore_regions_.empty())
    tools::logger()->info("[YOLO] {} ignore regions", ignore_regions_.size());
}

std::vector<Detection> YOLO::detect(const cv::Mat & img)
{
  return drop_ignored(yolo_->detect(img), ignore_regions_);
}

}  // namespace inspection
