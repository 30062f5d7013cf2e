#include "box_track.hpp"

#include <cmath>

namespace inspection
{
namespace
{
constexpr int DIM_X = 7;
constexpr int DIM_Z = 4;

const Eigen::MatrixXd & transition()
{
  static const Eigen::MatrixXd F = [] {
    Eigen::MatrixXd F = Eigen::MatrixXd::Identity(DIM_X, DIM_X);
    F(0, 4) = 1;
    F(1, 5) = 1;
    F(2, 6) = 1;
    return F;
  }();
  return F;
}

const Eigen::MatrixXd & observation()
{
  static const Eigen::MatrixXd H = Eigen::MatrixXd::Identity(DIM_Z, DIM_X);
  return H;
}

// 面积、宽高比的观测噪声放大 10 倍
const Eigen::MatrixXd & measurement_noise()
{
  static const Eigen::MatrixXd R = [] {
    Eigen::VectorXd d(DIM_Z);
    d << 1, 1, 10, 10;
    return Eigen::MatrixXd(d.asDiagonal());
  }();
  return R;
}

const Eigen::MatrixXd & process_noise()
{
  static const Eigen::MatrixXd Q = [] {
    Eigen::VectorXd d(DIM_X);
    d << 1, 1, 1, 1, 0.01, 0.01, 0.0001;
    return Eigen::MatrixXd(d.asDiagonal());
  }();
  return Q;
}

// 速度不可观测，初始不确定度给大
Eigen::MatrixXd initial_covariance()
{
  Eigen::VectorXd d(DIM_X);
  d << 10, 10, 10, 10, 1e4, 1e4, 1e4;
  return d.asDiagonal();
}
}  // namespace

Eigen::Vector4d box_to_z(const cv::Rect2d & box)
{
  auto w = box.width;
  auto h = box.height;
  return {box.x + w / 2.0, box.y + h / 2.0, w * h, w / h};
}

cv::Rect2d x_to_box(const Eigen::VectorXd & x)
{
  auto w = std::sqrt(x[2] * x[3]);
  auto h = x[2] / w;
  return {x[0] - w / 2.0, x[1] - h / 2.0, w, h};
}

BoxTrack::BoxTrack(const cv::Rect2d & box, int id)
: id_(id), hits_(0), hit_streak_(0), time_since_update_(0), age_(0), has_been_returned_(false)
{
  Eigen::VectorXd x0 = Eigen::VectorXd::Zero(DIM_X);
  x0.head<DIM_Z>() = box_to_z(box);
  kf_ = tools::KalmanFilter(x0, initial_covariance());
}

cv::Rect2d BoxTrack::predict()
{
  // 面积将被预测为非正时冻结面积速度
  if (kf_.x[6] + kf_.x[2] <= 0) kf_.x[6] = 0.0;

  kf_.predict(transition(), process_noise());

  age_++;
  if (time_since_update_ > 0) hit_streak_ = 0;
  time_since_update_++;

  return box();
}

void BoxTrack::update(const cv::Rect2d & box)
{
  time_since_update_ = 0;
  hits_++;
  hit_streak_++;

  kf_.update(box_to_z(box), observation(), measurement_noise());
}

cv::Rect2d BoxTrack::box() const { return x_to_box(kf_.x); }

}  // namespace inspection
