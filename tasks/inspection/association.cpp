#include "association.hpp"

#include <algorithm>

#include "hungarian.hpp"

namespace inspection
{
double iou(const cv::Rect2d & a, const cv::Rect2d & b)
{
  auto xx1 = std::max(a.x, b.x);
  auto yy1 = std::max(a.y, b.y);
  auto xx2 = std::min(a.x + a.width, b.x + b.width);
  auto yy2 = std::min(a.y + a.height, b.y + b.height);

  auto w = std::max(0.0, xx2 - xx1);
  auto h = std::max(0.0, yy2 - yy1);
  auto inter = w * h;

  auto uni = a.width * a.height + b.width * b.height - inter;
  if (!(uni > 0)) return 0.0;
  return inter / uni;
}

Eigen::MatrixXd iou_matrix(
  const std::vector<cv::Rect2d> & detections, const std::vector<cv::Rect2d> & predictions)
{
  Eigen::MatrixXd m(detections.size(), predictions.size());
  for (size_t d = 0; d < detections.size(); ++d) {
    for (size_t t = 0; t < predictions.size(); ++t) {
      m(d, t) = iou(detections[d], predictions[t]);
    }
  }
  return m;
}

Association associate(
  const std::vector<cv::Rect2d> & detections, const std::vector<cv::Rect2d> & predictions,
  double iou_threshold)
{
  Association result;
  const int n = detections.size();
  const int m = predictions.size();

  if (m == 0) {
    for (int d = 0; d < n; ++d) result.unmatched_detections.push_back(d);
    return result;
  }

  auto ious = iou_matrix(detections, predictions);

  std::vector<std::pair<int, int>> candidates;
  if (n > 0) {
    Eigen::MatrixXi above = (ious.array() > iou_threshold).cast<int>().matrix();
    bool one_to_one = above.rowwise().sum().maxCoeff() == 1 && above.colwise().sum().maxCoeff() == 1;

    if (one_to_one) {
      for (int d = 0; d < n; ++d) {
        for (int t = 0; t < m; ++t) {
          if (above(d, t)) candidates.emplace_back(d, t);
        }
      }
    } else {
      auto assignment = Hungarian::solve(-ious);
      for (int d = 0; d < n; ++d) {
        if (assignment[d] >= 0) candidates.emplace_back(d, assignment[d]);
      }
    }
  }

  std::vector<bool> det_matched(n, false), pred_matched(m, false);
  for (const auto & [d, t] : candidates) {
    det_matched[d] = true;
    pred_matched[t] = true;
  }
  for (int d = 0; d < n; ++d) {
    if (!det_matched[d]) result.unmatched_detections.push_back(d);
  }
  for (int t = 0; t < m; ++t) {
    if (!pred_matched[t]) result.unmatched_predictions.push_back(t);
  }

  for (const auto & [d, t] : candidates) {
    if (ious(d, t) < iou_threshold) {
      result.unmatched_detections.push_back(d);
      result.unmatched_predictions.push_back(t);
    } else {
      result.matches.emplace_back(d, t);
    }
  }

  return result;
}

}  // namespace inspection
