#include "clip_writer.hpp"

#include <stdexcept>

namespace inspection
{
VideoClipWriter::VideoClipWriter(const std::string & fourcc)
: fourcc_(cv::VideoWriter::fourcc('m', 'p', '4', 'v'))
{
  if (fourcc.size() == 4)
    fourcc_ = cv::VideoWriter::fourcc(fourcc[0], fourcc[1], fourcc[2], fourcc[3]);
}

bool VideoClipWriter::open(const std::string & path, double fps, const cv::Size & size)
{
  size_ = size;
  return writer_.open(path, fourcc_, fps, size);
}

void VideoClipWriter::write(const cv::Mat & frame)
{
  if (!writer_.isOpened()) throw std::runtime_error("video writer is not opened");
  if (frame.size() != size_) throw std::runtime_error("frame size changed while recording");

  writer_.write(frame);
}

void VideoClipWriter::release() { writer_.release(); }

ClipWriterFactory video_clip_writer_factory(const std::string & format)
{
  auto fourcc = (format == "avi") ? std::string("MJPG") : std::string("mp4v");
  return [fourcc] { return std::make_unique<VideoClipWriter>(fourcc); };
}

}  // namespace inspection
