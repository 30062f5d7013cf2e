#ifndef INSPECTION__HUNGARIAN_HPP
#define INSPECTION__HUNGARIAN_HPP

#include <Eigen/Dense>
#include <vector>

namespace inspection
{
/**
 * @brief 匈牙利算法（Kuhn-Munkres）求最小代价指派
 *
 * 代价矩阵 rows × cols，非方阵时以大数补齐。
 * 返回 assignment[row] = col，未指派为 -1。
 */
class Hungarian
{
public:
  static std::vector<int> solve(const Eigen::MatrixXd & cost);

private:
  static constexpr double INF = 1e12;
};

}  // namespace inspection

#endif  // INSPECTION__HUNGARIAN_HPP
