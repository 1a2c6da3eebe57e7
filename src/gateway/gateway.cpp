#include "gateway/gateway.hpp"

#include <utility>

#include "gateway/jsonrpc.hpp"
#include "gateway/logging.hpp"
#include "gateway/tool_manifest.hpp"

namespace gateway {
namespace {

using gateway::logging::LogDebug;
using gateway::logging::LogInfo;

constexpr char kListChangedMethod[] = "notifications/tools/list_changed";

}  // namespace

nlohmann::json HealthToJson(const HealthStatus& health) {
  return {{"status", "ok"},
          {"plugins", health.plugins},
          {"sessions", health.sessions},
          {"tools", health.tools},
          {"generation", health.generation},
          {"uptime_ms", health.uptime_ms}};
}

Gateway::Gateway(GatewayConfig config)
    : config_(std::move(config)),
      registry_(config_.introspection),
      sessions_(config_.sessions),
      dispatcher_(registry_, config_.dispatcher),
      started_at_(std::chrono::steady_clock::now()) {}

Gateway::~Gateway() { Stop(); }

void Gateway::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_) {
    return;
  }
  LogInfo("Loading plugins from " + config_.plugins_dir);
  registry_.Scan(config_.plugins_dir);
  sessions_.StartReaper(config_.reap_interval);
  running_ = true;
}

void Gateway::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_) {
    return;
  }
  running_ = false;
  sessions_.Shutdown();
  sessions_.StopReaper();
  LogInfo("Gateway stopped");
}

std::shared_ptr<const RegistrySnapshot> Gateway::Rescan() {
  auto scanned = registry_.Scan(config_.plugins_dir);

  // Announce whatever is current, not what this scan built: a concurrent
  // rescan may have published a newer generation already.
  std::lock_guard<std::mutex> lock(stream_mutex_);
  const auto current = registry_.Snapshot();
  const auto notified = sessions_.Broadcast(
      jsonrpc::MakeNotification(kListChangedMethod, BuildManifest(*current)), "tools");
  LogDebug("Pushed manifest generation " + std::to_string(current->generation) + " to " +
           std::to_string(notified) + " session(s)");
  return scanned;
}

HealthStatus Gateway::Health() const {
  const auto snapshot = registry_.Snapshot();
  HealthStatus health;
  health.plugins = snapshot->PluginCount();
  health.tools = snapshot->ToolCount();
  health.generation = snapshot->generation;
  health.sessions = sessions_.LiveCount();
  health.uptime_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - started_at_)
                         .count();
  return health;
}

nlohmann::json Gateway::Manifest() const { return BuildManifest(*registry_.Snapshot()); }

std::shared_ptr<Session> Gateway::OpenStream() {
  // A rescan publishing after this read broadcasts once the lock is released,
  // by which time the session is registered.
  std::lock_guard<std::mutex> lock(stream_mutex_);
  return sessions_.Open(BuildManifest(*registry_.Snapshot()));
}

void Gateway::CloseStream(const std::string& session_id, const std::string& reason) {
  sessions_.Close(session_id, reason);
}

nlohmann::json Gateway::HandleMessage(const std::string& body, const std::string& session_id) {
  nlohmann::json response = dispatcher_.HandleMessage(body);
  if (!session_id.empty() && !sessions_.Push(session_id, response, "message")) {
    LogDebug("Session " + session_id + " is not live; response returned inline only");
  }
  return response;
}

}  // namespace gateway
