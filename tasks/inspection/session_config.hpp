#ifndef INSPECTION__SESSION_CONFIG_HPP
#define INSPECTION__SESSION_CONFIG_HPP

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

#include "alert_recorder.hpp"
#include "detector.hpp"

namespace inspection
{
struct SessionConfig
{
  // 视频源
  std::string source = "0";
  double target_fps = 30;
  int flip = 0;

  // 检测与跟踪
  DetectorConfig detector;
  int container_class = 0;
  int max_age = 20;
  int min_hits = 20;
  double iou_threshold = 0.5;

  std::string requirement_path = "configs/Configuration.json";

  // 报警录像，fps 在打开视频源后按源帧率覆盖
  bool save_clips = true;
  AlertRecorderConfig recorder;

  // 三色灯
  bool light_enabled = true;
  std::string light_port = "/dev/ttyUSB0";
  uint32_t light_baudrate = 9600;
  double completed_signal_seconds = 0.5;
  double incomplete_signal_seconds = 1.0;

  std::size_t log_capacity = 200;
  int jpeg_quality = 80;
};

/// @throw ConfigError 取值非法或类型错误
SessionConfig parse_session_config(const YAML::Node & yaml);

/// @throw ConfigError 文件不存在、语法错误或取值非法
SessionConfig load_session_config(const std::string & config_path);

}  // namespace inspection

#endif  // INSPECTION__SESSION_CONFIG_HPP
