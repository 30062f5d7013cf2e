#include "kalman_filter.hpp"

namespace tools
{
KalmanFilter::KalmanFilter(const Eigen::VectorXd & x0, const Eigen::MatrixXd & P0)
: x(x0), P(P0), I(Eigen::MatrixXd::Identity(x0.rows(), x0.rows()))
{
}

Eigen::VectorXd KalmanFilter::predict(const Eigen::MatrixXd & F, const Eigen::MatrixXd & Q)
{
  x = F * x;
  P = F * P * F.transpose() + Q;
  return x;
}

Eigen::VectorXd KalmanFilter::update(
  const Eigen::VectorXd & z, const Eigen::MatrixXd & H, const Eigen::MatrixXd & R)
{
  Eigen::VectorXd y = z - H * x;

  Eigen::MatrixXd S = H * P * H.transpose() + R;
  Eigen::MatrixXd K = P * H.transpose() * S.inverse();

  x = x + K * y;
  P = (I - K * H) * P * (I - K * H).transpose() + K * R * K.transpose();

  return x;
}

}  // namespace tools
