#ifndef TOOLS__KALMAN_FILTER_HPP
#define TOOLS__KALMAN_FILTER_HPP

#include <Eigen/Dense>

namespace tools
{
/**
 * @brief 线性卡尔曼滤波器
 * @note 协方差更新采用 Joseph 形式，数值上保持对称正定
 */
class KalmanFilter
{
public:
  Eigen::VectorXd x;
  Eigen::MatrixXd P;

  KalmanFilter() = default;

  KalmanFilter(const Eigen::VectorXd & x0, const Eigen::MatrixXd & P0);

  Eigen::VectorXd predict(const Eigen::MatrixXd & F, const Eigen::MatrixXd & Q);

  Eigen::VectorXd update(
    const Eigen::VectorXd & z, const Eigen::MatrixXd & H, const Eigen::MatrixXd & R);

private:
  Eigen::MatrixXd I;
};

}  // namespace tools

#endif  // TOOLS__KALMAN_FILTER_HPP
