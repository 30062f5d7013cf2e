#include "visualizer.hpp"

#include <fmt/core.h>

#include "tools/img_tools.hpp"

namespace inspection
{
namespace
{
// BGR
const std::vector<cv::Scalar> TRACK_COLORS = {
  {255, 0, 0},   {0, 255, 0},     {0, 0, 255},   {255, 255, 0}, {255, 0, 255}, {0, 255, 255},
  {128, 0, 128}, {255, 165, 0},   {0, 128, 128}, {128, 128, 0}, {255, 192, 203}, {0, 128, 0},
  {128, 0, 0},   {0, 0, 128},     {128, 128, 128}, {255, 255, 255}};

const std::vector<cv::Scalar> ITEM_COLORS = {
  {0, 255, 255}, {255, 0, 255}, {0, 165, 255}, {255, 0, 0}, {0, 255, 0}, {128, 0, 128}};

const cv::Scalar COMPLETED_COLOR = {0, 200, 0};
const cv::Scalar MISSING_COLOR = {0, 0, 255};
}  // namespace

cv::Mat Visualizer::render(
  const cv::Mat & frame, const std::vector<TrackedBox> & tracks, const ItemAssignment & assignment,
  const Inventory & inventory, const std::vector<AlertEvent> & alerts, double fps) const
{
  auto img = frame.clone();

  draw_tracks(img, tracks);
  draw_items(img, assignment);
  for (const auto & track : tracks) draw_requirements(img, track, inventory.labels(track.id));

  tools::draw_text(img, fmt::format("FPS: {:.1f}", fps), {10, 30}, {0, 255, 0}, 0.8, 2);
  draw_alerts(img, alerts);

  return img;
}

std::string Visualizer::alert_text(const AlertEvent & alert)
{
  std::string parts;
  for (const auto & [key, name] : alert.missing) {
    if (!parts.empty()) parts += ", ";
    parts += fmt::format("class[{}][{}]", key, name);
  }
  return fmt::format("The ID[{}] is missing {}", alert.track_id, parts);
}

cv::Scalar Visualizer::track_color(int track_id)
{
  return TRACK_COLORS[static_cast<std::size_t>(track_id) % TRACK_COLORS.size()];
}

cv::Scalar Visualizer::item_color(int class_id)
{
  if (class_id < 1 || class_id > static_cast<int>(ITEM_COLORS.size())) return {200, 200, 200};
  return ITEM_COLORS[class_id - 1];
}

void Visualizer::draw_tracks(cv::Mat & img, const std::vector<TrackedBox> & tracks) const
{
  for (const auto & track : tracks) {
    auto color = track_color(track.id);
    cv::Rect box = track.box;
    tools::draw_box(img, box, color, 2);

    // id 标签贴在框的上沿
    auto label = fmt::format("#{}", track.id);
    int baseline = 0;
    auto size = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, 0.6, 2, &baseline);
    cv::Point top_left(box.x, box.y - size.height - baseline - 5);
    cv::rectangle(img, top_left, {box.x + size.width, box.y}, color, cv::FILLED);
    tools::draw_text(img, label, {box.x, box.y - baseline - 5}, {255, 255, 255}, 0.6, 2);
  }
}

void Visualizer::draw_items(cv::Mat & img, const ItemAssignment & assignment) const
{
  for (const auto & [id, items] : assignment.items)
    for (const auto & item : items) tools::draw_box(img, item.box, item_color(item.class_id), 2);
}

void Visualizer::draw_requirements(
  cv::Mat & img, const TrackedBox & track, const std::vector<RequirementLabel> & labels) const
{
  constexpr int line_height = 22;

  cv::Point top_left(static_cast<int>(track.box.x + track.box.width) + 8, static_cast<int>(track.box.y));
  for (const auto & label : labels) {
    auto text = fmt::format("{} x {}/{}", label.name, label.required, label.achieved);
    tools::draw_label(img, text, top_left, label.completed ? COMPLETED_COLOR : MISSING_COLOR);
    top_left.y += line_height;
  }
}

void Visualizer::draw_alerts(cv::Mat & img, const std::vector<AlertEvent> & alerts) const
{
  if (alerts.empty()) return;

  constexpr double scale = 0.8;
  constexpr int thickness = 2;

  auto y = img.rows / 2 - 20 * (static_cast<int>(alerts.size()) - 1);
  for (const auto & alert : alerts) {
    auto text = alert_text(alert);
    int baseline = 0;
    auto size = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, scale, thickness, &baseline);
    auto x = (img.cols - size.width) / 2;

    cv::rectangle(
      img, {x - 8, y - size.height - 8}, {x + size.width + 8, y + baseline + 8}, MISSING_COLOR,
      cv::FILLED);
    tools::draw_text(img, text, {x, y}, {255, 255, 255}, scale, thickness);
    y += size.height + 20;
  }
}

}  // namespace inspection
