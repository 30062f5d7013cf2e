#include "session_manager.hpp"

#include "errors.hpp"
#include "tools/logger.hpp"
#include "yolo.hpp"

namespace inspection
{
SessionFactories default_factories()
{
  SessionFactories factories;

  factories.source = [](const SessionConfig & config) {
    return std::make_unique<io::VideoSource>(config.flip);
  };

  factories.detector = [](const SessionConfig & config) {
    return std::make_unique<YOLO>(config.detector);
  };

  factories.light = [](const SessionConfig & config) -> std::unique_ptr<io::SignalLightBase> {
    if (!config.light_enabled) return nullptr;

    try {
      return std::make_unique<io::SignalLight>(config.light_port, config.light_baudrate);
    } catch (const std::exception & e) {
      tools::logger()->warn(
        "[SessionManager] light {} unavailable, signal disabled: {}", config.light_port, e.what());
      return nullptr;
    }
  };

  return factories;
}

SessionManager::SessionManager(SessionFactories factories, std::chrono::milliseconds join_timeout)
: factories_(std::move(factories)), join_timeout_(join_timeout), starting_(false), sessions_(0)
{
}

SessionManager::~SessionManager()
{
  auto pipeline = current();
  if (!pipeline) return;

  pipeline->request_stop();
  if (!pipeline->join_for(join_timeout_))
    tools::logger()->warn("[SessionManager] session did not stop in time, waiting");
}

ControlResult SessionManager::start(const std::string & config_path)
{
  SessionConfig config;
  try {
    config = load_session_config(config_path);
  } catch (const ConfigError & e) {
    tools::logger()->error("[SessionManager] {}", e.what());
    return {false, std::string("config error: ") + e.what()};
  }

  return start(config);
}

ControlResult SessionManager::start(const SessionConfig & config)
{
  // 启动过程中的重复请求合并为一次
  if (starting_.exchange(true)) return {false, "session is starting"};

  struct StartingGuard
  {
    std::atomic<bool> & flag;
    ~StartingGuard() { flag = false; }
  } guard{starting_};

  std::lock_guard<std::mutex> control(control_mutex_);

  if (!shutdown_current()) return {false, "previous session is still shutting down"};

  try {
    if (!requirements_ || requirements_->path() != config.requirement_path) {
      requirements_ = std::make_unique<RequirementLoader>(
        config.requirement_path, config.container_class, config.detector.num_classes);
    }
    const auto & spec = requirements_->load();

    auto pipeline = std::make_shared<Pipeline>(
      config, spec, factories_.source(config), factories_.detector(config),
      factories_.light(config), factories_.clip_writer);
    pipeline->start();

    std::lock_guard<std::mutex> lock(mutex_);
    pipeline_ = pipeline;
  } catch (const ConfigError & e) {
    tools::logger()->error("[SessionManager] config error: {}", e.what());
    return {false, std::string("config error: ") + e.what()};
  } catch (const SourceError & e) {
    tools::logger()->error("[SessionManager] source error: {}", e.what());
    return {false, std::string("source error: ") + e.what()};
  } catch (const std::exception & e) {
    tools::logger()->error("[SessionManager] start failed: {}", e.what());
    return {false, std::string("start failed: ") + e.what()};
  }

  sessions_++;
  tools::logger()->info("[SessionManager] session {} started", sessions_.load());
  return {true, "started"};
}

ControlResult SessionManager::stop()
{
  std::lock_guard<std::mutex> control(control_mutex_);
  if (!current()) return {true, "no session"};
  if (!shutdown_current()) return {true, "stop requested, shutdown pending"};
  return {true, "stopped"};
}

bool SessionManager::running() const
{
  auto pipeline = current();
  return pipeline && pipeline->running();
}

std::vector<uchar> SessionManager::latest_frame() const
{
  auto pipeline = current();
  return pipeline ? pipeline->latest_frame() : std::vector<uchar>{};
}

std::vector<std::string> SessionManager::recent_logs() const
{
  auto pipeline = current();
  return pipeline ? pipeline->recent_logs() : std::vector<std::string>{};
}

std::vector<AlertRecord> SessionManager::alerts() const
{
  auto pipeline = current();
  return pipeline ? pipeline->alerts() : std::vector<AlertRecord>{};
}

std::vector<ClipFile> SessionManager::alert_files() const
{
  auto pipeline = current();
  return pipeline ? pipeline->alert_files() : std::vector<ClipFile>{};
}

nlohmann::json SessionManager::alerts_json() const
{
  auto json = nlohmann::json::array();
  for (const auto & record : alerts()) {
    for (const auto & event : record.events) {
      auto missing = nlohmann::json::array();
      for (const auto & [key, name] : event.missing) missing.push_back({{"class", key}, {"name", name}});

      json.push_back({{"time", record.time}, {"track_id", event.track_id}, {"missing", missing}});
    }
  }
  return json;
}

std::shared_ptr<Pipeline> SessionManager::current() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return pipeline_;
}

bool SessionManager::shutdown_current()
{
  auto pipeline = current();
  if (!pipeline) return true;

  pipeline->request_stop();
  if (!pipeline->join_for(join_timeout_)) {
    tools::logger()->warn("[SessionManager] stop requested, shutdown pending");
    return false;
  }
  return true;
}

}  // namespace inspection
