#ifndef TOOLS__IMG_TOOLS_HPP
#define TOOLS__IMG_TOOLS_HPP

#include <opencv2/opencv.hpp>
#include <string>

namespace tools
{
void draw_box(cv::Mat & img, const cv::Rect & box, const cv::Scalar & color, int thickness = 2);

void draw_text(
  cv::Mat & img, const std::string & text, const cv::Point & point, const cv::Scalar & color,
  double font_scale = 1.0, int thickness = 2);

/**
 * @brief 带实心背板的文字
 * @param top_left 背板左上角
 * @return 背板所占矩形
 */
cv::Rect draw_label(
  cv::Mat & img, const std::string & text, const cv::Point & top_left, const cv::Scalar & background,
  const cv::Scalar & foreground = {255, 255, 255}, double font_scale = 0.6, int thickness = 1,
  int padding = 4);

}  // namespace tools

#endif  // TOOLS__IMG_TOOLS_HPP
