#include "session_config.hpp"

#include <vector>

#include "errors.hpp"
#include "tools/logger.hpp"
#include "tools/yaml.hpp"

namespace inspection
{
namespace
{
std::vector<cv::Rect2d> read_regions(const YAML::Node & yaml)
{
  std::vector<cv::Rect2d> regions;
  if (!yaml["ignore_regions"]) return regions;

  for (const auto & node : yaml["ignore_regions"]) {
    auto xyxy = node.as<std::vector<double>>();
    if (xyxy.size() != 4) throw ConfigError("ignore_regions entries must be [x1, y1, x2, y2]");
    regions.emplace_back(xyxy[0], xyxy[1], xyxy[2] - xyxy[0], xyxy[3] - xyxy[1]);
  }
  return regions;
}

void check(bool ok, const std::string & message)
{
  if (!ok) throw ConfigError(message);
}
}  // namespace

SessionConfig parse_session_config(const YAML::Node & yaml)
{
  SessionConfig config;

  try {
    config.source = tools::read<std::string>(yaml, "source");
    config.target_fps = tools::read<double>(yaml, "target_fps", config.target_fps);
    config.flip = tools::read<int>(yaml, "flip", config.flip);

    auto & detector = config.detector;
    detector.yolo_name = tools::read<std::string>(yaml, "yolo_name", detector.yolo_name);
    detector.model_path = tools::read<std::string>(yaml, "model_path");
    detector.device = tools::read<std::string>(yaml, "device", detector.device);
    detector.min_confidence = tools::read<double>(yaml, "min_confidence", detector.min_confidence);
    detector.nms_threshold = tools::read<double>(yaml, "nms_threshold", detector.nms_threshold);
    detector.num_classes = tools::read<int>(yaml, "num_classes", detector.num_classes);
    detector.ignore_regions = read_regions(yaml);

    config.container_class = tools::read<int>(yaml, "container_class", config.container_class);
    config.max_age = tools::read<int>(yaml, "max_age", config.max_age);
    config.min_hits = tools::read<int>(yaml, "min_hits", config.min_hits);
    config.iou_threshold = tools::read<double>(yaml, "iou_threshold", config.iou_threshold);

    config.requirement_path = tools::read<std::string>(yaml, "requirement_path");

    auto & recorder = config.recorder;
    config.save_clips = tools::read<bool>(yaml, "save_clips", config.save_clips);
    recorder.output_dir = tools::read<std::string>(yaml, "output_dir", recorder.output_dir);
    recorder.prefix = tools::read<std::string>(yaml, "output_name", recorder.prefix);
    recorder.format = tools::read<std::string>(yaml, "clip_format", recorder.format);
    recorder.pre_seconds = tools::read<double>(yaml, "pre_seconds", recorder.pre_seconds);
    recorder.post_seconds = tools::read<double>(yaml, "post_seconds", recorder.post_seconds);

    config.light_enabled = tools::read<bool>(yaml, "light_enabled", config.light_enabled);
    config.light_port = tools::read<std::string>(yaml, "light_port", config.light_port);
    config.light_baudrate = tools::read<uint32_t>(yaml, "light_baudrate", config.light_baudrate);
    config.completed_signal_seconds =
      tools::read<double>(yaml, "completed_signal_seconds", config.completed_signal_seconds);
    config.incomplete_signal_seconds =
      tools::read<double>(yaml, "incomplete_signal_seconds", config.incomplete_signal_seconds);

    config.log_capacity = tools::read<std::size_t>(yaml, "log_capacity", config.log_capacity);
    config.jpeg_quality = tools::read<int>(yaml, "jpeg_quality", config.jpeg_quality);
  } catch (const ConfigError &) {
    throw;
  } catch (const YAML::Exception & e) {
    throw ConfigError(std::string("session config: ") + e.what());
  } catch (const std::runtime_error & e) {
    throw ConfigError(std::string("session config: ") + e.what());
  }

  check(config.target_fps > 0, "target_fps must be positive");
  check(config.detector.num_classes > 1, "num_classes must be greater than 1");
  check(
    config.container_class >= 0 && config.container_class < config.detector.num_classes,
    "container_class out of range");
  check(config.max_age >= 1, "max_age must be at least 1");
  check(config.min_hits >= 0, "min_hits must not be negative");
  check(config.iou_threshold >= 0 && config.iou_threshold <= 1, "iou_threshold must be in [0, 1]");
  check(config.recorder.pre_seconds >= 0, "pre_seconds must not be negative");
  check(config.recorder.post_seconds >= 0, "post_seconds must not be negative");
  check(config.log_capacity > 0, "log_capacity must be positive");
  check(config.jpeg_quality >= 0 && config.jpeg_quality <= 100, "jpeg_quality must be in [0, 100]");

  return config;
}

SessionConfig load_session_config(const std::string & config_path)
{
  YAML::Node yaml;
  try {
    yaml = tools::load(config_path);
  } catch (const std::runtime_error & e) {
    throw ConfigError(e.what());
  }

  auto config = parse_session_config(yaml);
  tools::logger()->info("[SessionConfig] {} loaded, source: {}", config_path, config.source);
  return config;
}

}  // namespace inspection
