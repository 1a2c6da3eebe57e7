#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "gateway/plugin_introspector.hpp"
#include "gateway/plugin_registry.hpp"
#include "gateway/session_manager.hpp"
#include "gateway/tool_dispatcher.hpp"
#include "nlohmann/json.hpp"

namespace gateway {

struct GatewayConfig {
  std::string plugins_dir = "plugins";
  IntrospectionOptions introspection;
  DispatcherOptions dispatcher;
  SessionOptions sessions;
  std::chrono::milliseconds reap_interval{100};
};

struct HealthStatus {
  std::size_t plugins = 0;
  std::size_t sessions = 0;
  std::size_t tools = 0;
  std::uint64_t generation = 0;
  std::int64_t uptime_ms = 0;
};

nlohmann::json HealthToJson(const HealthStatus& health);

// Owns the registry, the session set and the dispatcher, and the lifecycle of
// the initial scan and the reap loop. Transport-agnostic.
class Gateway {
 public:
  explicit Gateway(GatewayConfig config);
  ~Gateway();

  Gateway(const Gateway&) = delete;
  Gateway& operator=(const Gateway&) = delete;

  void Start();
  void Stop();

  // Full rebuild from the plugins directory; live sessions get the new manifest.
  std::shared_ptr<const RegistrySnapshot> Rescan();

  HealthStatus Health() const;
  nlohmann::json Manifest() const;

  std::shared_ptr<Session> OpenStream();
  void CloseStream(const std::string& session_id, const std::string& reason);

  // When `session_id` names a live session the response is also pushed to it.
  nlohmann::json HandleMessage(const std::string& body, const std::string& session_id = {});

  const PluginRegistry& registry() const { return registry_; }
  SessionManager& sessions() { return sessions_; }

 private:
  const GatewayConfig config_;
  PluginRegistry registry_;
  SessionManager sessions_;
  ToolDispatcher dispatcher_;
  const std::chrono::steady_clock::time_point started_at_;

  // Orders manifest delivery: connect-time manifests against rescan broadcasts.
  std::mutex stream_mutex_;
  std::mutex lifecycle_mutex_;
  bool running_ = false;
};

}  // namespace gateway
