#include "yolov8.hpp"

#include <opencv2/dnn.hpp>

#include "tools/logger.hpp"

namespace inspection
{
YOLOV8::YOLOV8(const DetectorConfig & config)
: model_path_(config.model_path),
  device_(config.device),
  min_confidence_(config.min_confidence),
  nms_threshold_(config.nms_threshold),
  num_classes_(config.num_classes)
{
  auto model = core_.read_model(model_path_);

  // 颜色转换与归一化交给 OpenVINO 完成
  ov::preprocess::PrePostProcessor ppp(model);
  auto & input = ppp.input();

  input.tensor()
    .set_element_type(ov::element::u8)
    .set_shape({1, 640, 640, 3})
    .set_layout("NHWC")
    .set_color_format(ov::preprocess::ColorFormat::BGR);

  input.model().set_layout("NCHW");

  input.preprocess()
    .convert_element_type(ov::element::f32)
    .convert_color(ov::preprocess::ColorFormat::RGB)
    .scale({255.0, 255.0, 255.0});

  model = ppp.build();
  compiled_model_ = core_.compile_model(
    model, device_, ov::hint::performance_mode(ov::hint::PerformanceMode::LATENCY));

  tools::logger()->info("[YOLOV8] model {} compiled on {}", model_path_, device_);
}

std::vector<Detection> YOLOV8::detect(const cv::Mat & img)
{
  if (img.empty()) {
    tools::logger()->warn("[YOLOV8] Empty img!");
    return {};
  }

  auto x_scale = static_cast<double>(640) / img.rows;
  auto y_scale = static_cast<double>(640) / img.cols;
  auto scale = std::min(x_scale, y_scale);
  auto h = static_cast<int>(img.rows * scale);
  auto w = static_cast<int>(img.cols * scale);

  auto input = cv::Mat(640, 640, CV_8UC3, cv::Scalar(0, 0, 0));
  auto roi = cv::Rect(0, 0, w, h);
  cv::resize(img, input(roi), {w, h});

  auto infer_request = compiled_model_.create_infer_request();
  ov::Tensor input_tensor(ov::element::u8, {1, 640, 640, 3}, input.data);
  infer_request.set_input_tensor(input_tensor);
  infer_request.infer();

  auto output_tensor = infer_request.get_output_tensor();
  auto output_shape = output_tensor.get_shape();
  cv::Mat output(output_shape[1], output_shape[2], CV_32F, output_tensor.data());

  return parse(scale, output);
}

std::vector<Detection> YOLOV8::parse(double scale, const cv::Mat & raw) const
{
  // [4 + nc, N] → [N, 4 + nc]
  cv::Mat output = raw.t();

  std::vector<int> class_ids;
  std::vector<float> confidences;
  std::vector<cv::Rect> boxes;

  auto nc = std::min(output.cols - 4, num_classes_);
  for (int r = 0; r < output.rows; r++) {
    cv::Mat scores = output.row(r).colRange(4, 4 + nc);
    double score;
    cv::Point class_id;
    cv::minMaxLoc(scores, nullptr, &score, nullptr, &class_id);
    if (score <= min_confidence_) continue;

    auto cx = output.at<float>(r, 0) / scale;
    auto cy = output.at<float>(r, 1) / scale;
    auto w = output.at<float>(r, 2) / scale;
    auto h = output.at<float>(r, 3) / scale;

    class_ids.emplace_back(class_id.x);
    confidences.emplace_back(static_cast<float>(score));
    boxes.emplace_back(cx - w / 2, cy - h / 2, w, h);
  }

  std::vector<int> indices;
  cv::dnn::NMSBoxes(boxes, confidences, min_confidence_, nms_threshold_, indices);

  std::vector<Detection> detections;
  for (auto i : indices) {
    const auto & box = boxes[i];
    detections.emplace_back(
      box.x, box.y, box.x + box.width, box.y + box.height, confidences[i], class_ids[i]);
  }

  return detections;
}

}  // namespace inspection
