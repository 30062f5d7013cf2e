#include "video_source.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

#include "tools/logger.hpp"

namespace io
{
bool is_device_identifier(const std::string & identifier)
{
  return !identifier.empty() &&
         std::all_of(identifier.begin(), identifier.end(), [](unsigned char c) {
           return std::isdigit(c);
         });
}

VideoSource::VideoSource(int flip_code) : flip_code_(flip_code), live_(false) {}

VideoSource::~VideoSource() { release(); }

void VideoSource::open(const std::string & identifier)
{
  release();

  if (is_device_identifier(identifier)) {
    auto index = std::stoi(identifier);
    if (!capture_.open(index)) {
      throw std::runtime_error("cannot open camera " + identifier);
    }
    // 720p@30，自动曝光
    capture_.set(cv::CAP_PROP_FRAME_WIDTH, 1280);
    capture_.set(cv::CAP_PROP_FRAME_HEIGHT, 720);
    capture_.set(cv::CAP_PROP_FPS, 30);
    capture_.set(cv::CAP_PROP_AUTO_EXPOSURE, 1);
    live_ = true;
    tools::logger()->info("[VideoSource] Camera {} opened.", index);
    return;
  }

  if (!std::filesystem::exists(identifier)) {
    throw std::runtime_error("video file does not exist: " + identifier);
  }
  if (!capture_.open(identifier)) {
    throw std::runtime_error("cannot open video file: " + identifier);
  }
  live_ = false;
  tools::logger()->info("[VideoSource] Video file {} opened, {:.1f} fps.", identifier, fps());
}

bool VideoSource::read(cv::Mat & img, std::chrono::steady_clock::time_point & timestamp)
{
  if (!capture_.isOpened()) return false;

  if (!capture_.read(img) || img.empty()) return false;
  timestamp = std::chrono::steady_clock::now();

  if (flip_code_ == 1 || flip_code_ == -1) {
    cv::flip(img, img, flip_code_);
  } else if (flip_code_ == 2) {
    cv::flip(img, img, 0);
  }
  return true;
}

void VideoSource::release()
{
  if (capture_.isOpened()) capture_.release();
}

double VideoSource::fps() const
{
  if (!capture_.isOpened()) return 0.0;
  return capture_.get(cv::CAP_PROP_FPS);
}

}  // namespace io
