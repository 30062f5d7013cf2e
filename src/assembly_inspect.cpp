#include <fmt/core.h>

#include <chrono>
#include <opencv2/opencv.hpp>
#include <thread>

#include "tasks/inspection/session_manager.hpp"
#include "tools/exiter.hpp"
#include "tools/logger.hpp"

using namespace std::chrono_literals;

const std::string keys =
  "{help h usage ? |                         | 输出命令行参数说明}"
  "{display d      |                         | 显示检测画面}"
  "{@config-path   | configs/inspection.yaml | yaml配置文件路径 }";

int main(int argc, char * argv[])
{
  cv::CommandLineParser cli(argc, argv, keys);
  auto config_path = cli.get<std::string>(0);
  if (cli.has("help") || config_path.empty()) {
    cli.printMessage();
    return 0;
  }
  auto display = cli.has("display");

  tools::Exiter exiter;
  inspection::SessionManager manager;

  auto result = manager.start(config_path);
  if (!result.ok) {
    tools::logger()->error("start failed: {}", result.message);
    return 1;
  }

  auto last_report = std::chrono::steady_clock::now();
  while (!exiter.exit() && manager.running()) {
    std::this_thread::sleep_for(display ? 30ms : 200ms);

    if (display) {
      auto jpeg = manager.latest_frame();
      if (!jpeg.empty()) {
        cv::imshow("inspection", cv::imdecode(jpeg, cv::IMREAD_COLOR));
        if (cv::waitKey(1) == 'q') break;
      }
    }

    auto now = std::chrono::steady_clock::now();
    if (now - last_report < 5s) continue;
    last_report = now;
    tools::logger()->info(
      "{} alerts, {} clips saved", manager.alerts().size(), manager.alert_files().size());
  }

  auto stopped = manager.stop();
  tools::logger()->info("{}", stopped.message);

  for (const auto & line : manager.recent_logs()) fmt::print("{}\n", line);

  return 0;
}
