#ifndef INSPECTION__ASSOCIATION_HPP
#define INSPECTION__ASSOCIATION_HPP

#include <Eigen/Dense>
#include <opencv2/core.hpp>
#include <utility>
#include <vector>

namespace inspection
{
/// 轴对齐框交并比：不相交为 0，完全重合为 1，对称
double iou(const cv::Rect2d & a, const cv::Rect2d & b);

/// rows = detections, cols = predictions
Eigen::MatrixXd iou_matrix(
  const std::vector<cv::Rect2d> & detections, const std::vector<cv::Rect2d> & predictions);

struct Association
{
  std::vector<std::pair<int, int>> matches;  // (detection, prediction)
  std::vector<int> unmatched_detections;
  std::vector<int> unmatched_predictions;
};

/**
 * @brief 检测框与预测框的数据关联
 *
 * 阈值化后的 IOU 矩阵若已是一一对应（每行每列恰好一个超阈值元素）则直接采用，
 * 否则以 -IOU 为代价求最优指派。IOU 低于阈值的配对拆为未匹配检测 + 未匹配预测。
 */
Association associate(
  const std::vector<cv::Rect2d> & detections, const std::vector<cv::Rect2d> & predictions,
  double iou_threshold);

}  // namespace inspection

#endif  // INSPECTION__ASSOCIATION_HPP
