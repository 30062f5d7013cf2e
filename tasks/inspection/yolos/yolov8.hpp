#ifndef INSPECTION__YOLOV8_HPP
#define INSPECTION__YOLOV8_HPP

#include <opencv2/opencv.hpp>
#include <openvino/openvino.hpp>
#include <string>
#include <vector>

#include "tasks/inspection/detector.hpp"

namespace inspection
{
/**
 * @brief YOLOv8 检测网络（OpenVINO）
 *
 * 输入 640x640 BGR 左上角对齐缩放，输出 [1, 4 + nc, N]，
 * 每列为 (cx, cy, w, h, score_0 ... score_nc-1)。
 */
class YOLOV8 : public DetectorBase
{
public:
  explicit YOLOV8(const DetectorConfig & config);

  std::vector<Detection> detect(const cv::Mat & img) override;

private:
  std::string model_path_;
  std::string device_;
  double min_confidence_;
  double nms_threshold_;
  int num_classes_;

  ov::Core core_;
  ov::CompiledModel compiled_model_;

  std::vector<Detection> parse(double scale, const cv::Mat & raw) const;
};

}  // namespace inspection

#endif  // INSPECTION__YOLOV8_HPP
