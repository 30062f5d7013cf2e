#ifndef INSPECTION__YOLO_HPP
#define INSPECTION__YOLO_HPP

#include <memory>
#include <opencv2/opencv.hpp>

#include "detector.hpp"

namespace inspection
{
/**
 * @brief 按 yolo_name 选择具体的检测网络
 * @throw std::runtime_error 未知的 yolo_name
 */
class YOLO : public DetectorBase
{
public:
  explicit YOLO(const DetectorConfig & config);

  std::vector<Detection> detect(const cv::Mat & img) override;

private:
  std::unique_ptr<DetectorBase> yolo_;
  std::vector<cv::Rect2d> ignore_regions_;
};

}  // namespace inspection

#endif  // INSPECTION__YOLO_HPP
