#ifndef INSPECTION__SESSION_MANAGER_HPP
#define INSPECTION__SESSION_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "clip_writer.hpp"
#include "detector.hpp"
#include "io/signal_light.hpp"
#include "io/video_source.hpp"
#include "pipeline.hpp"
#include "requirement.hpp"
#include "session_config.hpp"

namespace inspection
{
struct ControlResult
{
  bool ok;
  std::string message;
};

/// 会话各协作者的构造方式，测试中替换为假实现
struct SessionFactories
{
  std::function<std::unique_ptr<io::VideoSourceBase>(const SessionConfig &)> source;
  std::function<std::unique_ptr<DetectorBase>(const SessionConfig &)> detector;
  std::function<std::unique_ptr<io::SignalLightBase>(const SessionConfig &)> light;
  ClipWriterFactory clip_writer;
};

/// 摄像头/视频文件、YOLO、串口三色灯；灯打不开时返回空指针（灯控禁用）
SessionFactories default_factories();

/**
 * @brief 检测会话的控制面
 *
 * 同一时刻至多一个会话。启动新会话前先停止并等待旧会话退出；
 * 旧会话在超时内未退出则拒绝本次启动。启动过程中的重复启动请求直接拒绝。
 */
class SessionManager
{
public:
  explicit SessionManager(
    SessionFactories factories = default_factories(),
    std::chrono::milliseconds join_timeout = std::chrono::seconds(3));

  ~SessionManager();

  ControlResult start(const std::string & config_path);
  ControlResult start(const SessionConfig & config);

  ControlResult stop();

  bool running() const;

  std::vector<uchar> latest_frame() const;
  std::vector<std::string> recent_logs() const;
  std::vector<AlertRecord> alerts() const;
  std::vector<ClipFile> alert_files() const;

  /// [{time, track_id, missing: [{class, name}]}]
  nlohmann::json alerts_json() const;

  /// 成功启动过的会话数
  int session_count() const { return sessions_; }

private:
  SessionFactories factories_;
  std::chrono::milliseconds join_timeout_;

  std::atomic<bool> starting_;
  std::atomic<int> sessions_;

  std::mutex control_mutex_;  // 串行化 start/stop
  mutable std::mutex mutex_;  // 保护 pipeline_
  std::shared_ptr<Pipeline> pipeline_;
  std::unique_ptr<RequirementLoader> requirements_;

  std::shared_ptr<Pipeline> current() const;
  /// 请求停止当前会话并限时等待，返回是否已退出
  bool shutdown_current();
};

}  // namespace inspection

#endif  // INSPECTION__SESSION_MANAGER_HPP
