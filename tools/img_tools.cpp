#include "img_tools.hpp"

namespace tools
{
void draw_box(cv::Mat & img, const cv::Rect & box, const cv::Scalar & color, int thickness)
{
  cv::rectangle(img, box, color, thickness);
}

void draw_text(
  cv::Mat & img, const std::string & text, const cv::Point & point, const cv::Scalar & color,
  double font_scale, int thickness)
{
  cv::putText(img, text, point, cv::FONT_HERSHEY_SIMPLEX, font_scale, color, thickness);
}

cv::Rect draw_label(
  cv::Mat & img, const std::string & text, const cv::Point & top_left, const cv::Scalar & background,
  const cv::Scalar & foreground, double font_scale, int thickness, int padding)
{
  int baseline = 0;
  auto size = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, font_scale, thickness, &baseline);

  cv::Rect plate(
    top_left.x, top_left.y, size.width + 2 * padding, size.height + baseline + 2 * padding);
  cv::rectangle(img, plate, background, cv::FILLED);

  cv::Point origin(top_left.x + padding, top_left.y + padding + size.height);
  draw_text(img, text, origin, foreground, font_scale, thickness);
  return plate;
}

}  // namespace tools
