#include "gateway/app.hpp"

#include <chrono>
#include <cstdlib>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include "gateway/jsonrpc.hpp"
#include "gateway/logging.hpp"
#include "gateway/session_manager.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_server.hpp"

namespace gateway {
namespace {

using gateway::logging::LogDebug;
using gateway::logging::LogInfo;
using gateway::logging::LogWarn;
using nlohmann::json;

class StreamEventWriter : public EventWriter {
 public:
  explicit StreamEventWriter(platform::StreamWriter& writer) : writer_(writer) {}

  bool Write(const std::string& frame) override { return writer_.Write(frame); }
  bool IsConnected() const override { return writer_.IsWritable(); }

 private:
  platform::StreamWriter& writer_;
};

void ApplyCors(std::map<std::string, std::string>& headers) {
  headers["Access-Control-Allow-Origin"] = "*";
  headers["Access-Control-Allow-Methods"] = "GET,POST,OPTIONS";
  headers["Access-Control-Allow-Headers"] = "Content-Type";
}

platform::HttpResponse JsonResponse(const json& body, int status = 200) {
  platform::HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = jsonrpc::Serialize(body);
  ApplyCors(response.headers);
  return response;
}

platform::HttpResponse HandleCorsPreflight(const platform::HttpRequest&) {
  platform::HttpResponse response;
  response.status = 204;
  response.content_type = "text/plain";
  ApplyCors(response.headers);
  return response;
}

std::string GetQueryParam(const platform::HttpRequest& request, const std::string& key,
                          const std::string& fallback) {
  if (const auto it = request.query_params.find(key); it != request.query_params.end()) {
    return it->second;
  }
  return fallback;
}

const char* GetEnv(const char* key) {
  const char* value = std::getenv(key);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

// Parses a bounded integer variable; out-of-range or malformed values keep `fallback`.
long long ReadIntegerEnv(const char* key, long long fallback, long long min, long long max) {
  const char* raw = GetEnv(key);
  if (raw == nullptr) {
    return fallback;
  }
  try {
    std::size_t consumed = 0;
    const long long parsed = std::stoll(raw, &consumed);
    if (consumed != std::string(raw).size()) {
      throw std::invalid_argument("trailing characters");
    }
    if (parsed < min || parsed > max) {
      LogWarn(std::string{key} + " is outside [" + std::to_string(min) + ", " +
              std::to_string(max) + "], falling back to " + std::to_string(fallback));
      return fallback;
    }
    return parsed;
  } catch (const std::exception& ex) {
    LogWarn(std::string{"Failed to parse "} + key + ": " + ex.what() + ", falling back to " +
            std::to_string(fallback));
    return fallback;
  }
}

std::chrono::milliseconds ReadMillisEnv(const char* key, std::chrono::milliseconds fallback) {
  return std::chrono::milliseconds(ReadIntegerEnv(key, fallback.count(), 1, 24LL * 3600 * 1000));
}

}  // namespace

void ConfigureServer(platform::HttpServer& server, Gateway& gateway) {
  auto handle_health = [&gateway](const platform::HttpRequest&) {
    LogDebug("GET /health");
    return JsonResponse(HealthToJson(gateway.Health()));
  };

  auto handle_sse = [&gateway](const platform::HttpRequest&) {
    auto session = gateway.OpenStream();
    LogDebug("GET /sse session=" + session->id());

    platform::StreamResponse stream;
    stream.content_type = "text/event-stream";
    stream.headers["Cache-Control"] = "no-cache";
    stream.headers["Connection"] = "keep-alive";
    stream.headers["X-Accel-Buffering"] = "no";
    ApplyCors(stream.headers);
    stream.pump = [session](platform::StreamWriter& writer) {
      StreamEventWriter events(writer);
      return session->Pump(events);
    };
    stream.on_close = [&gateway, session](bool completed) {
      gateway.CloseStream(session->id(), completed ? "stream ended" : "client disconnected");
    };
    return stream;
  };

  auto handle_message = [&gateway](const platform::HttpRequest& request) {
    const std::string session_id =
        GetQueryParam(request, "sessionId", GetQueryParam(request, "session_id", ""));
    LogDebug("POST /message bytes=" + std::to_string(request.body.size()) +
             (session_id.empty() ? std::string{} : " session=" + session_id));
    // Protocol errors travel inside the JSON-RPC body; HTTP status stays 200.
    return JsonResponse(gateway.HandleMessage(request.body, session_id));
  };

  auto handle_rescan = [&gateway](const platform::HttpRequest&) {
    LogInfo("POST /rescan");
    gateway.Rescan();
    return JsonResponse(HealthToJson(gateway.Health()));
  };

  server.AddHandler(platform::HttpMethod::kGet, "/health", handle_health);
  server.AddStreamHandler("/sse", handle_sse);
  server.AddHandler(platform::HttpMethod::kPost, "/message", handle_message);
  server.AddHandler(platform::HttpMethod::kPost, "/rescan", handle_rescan);

  server.AddHandler(platform::HttpMethod::kOptions, "/health", HandleCorsPreflight);
  server.AddHandler(platform::HttpMethod::kOptions, "/sse", HandleCorsPreflight);
  server.AddHandler(platform::HttpMethod::kOptions, "/message", HandleCorsPreflight);
  server.AddHandler(platform::HttpMethod::kOptions, "/rescan", HandleCorsPreflight);
}

ServerConfig LoadServerConfig() {
  ServerConfig config;
  if (const char* host = GetEnv("PLUGIN_GATEWAY_HOST")) {
    config.host = host;
  }
  config.port = static_cast<int>(ReadIntegerEnv("PLUGIN_GATEWAY_PORT", config.port, 1, 65535));
  config.worker_threads = static_cast<std::size_t>(
      ReadIntegerEnv("PLUGIN_GATEWAY_WORKERS", static_cast<long long>(config.worker_threads), 1,
                     4096));

  auto& gateway = config.gateway;
  if (const char* plugins_dir = GetEnv("PLUGIN_GATEWAY_PLUGINS_DIR")) {
    gateway.plugins_dir = plugins_dir;
  }
  gateway.dispatcher.tool_timeout =
      ReadMillisEnv("PLUGIN_GATEWAY_TOOL_TIMEOUT_MS", gateway.dispatcher.tool_timeout);
  gateway.introspection.timeout =
      ReadMillisEnv("PLUGIN_GATEWAY_INTROSPECT_TIMEOUT_MS", gateway.introspection.timeout);
  gateway.reap_interval = ReadMillisEnv("PLUGIN_GATEWAY_REAP_INTERVAL_MS", gateway.reap_interval);
  gateway.sessions.keepalive_interval =
      ReadMillisEnv("PLUGIN_GATEWAY_KEEPALIVE_MS", gateway.sessions.keepalive_interval);
  gateway.sessions.max_pending_events = static_cast<std::size_t>(
      ReadIntegerEnv("PLUGIN_GATEWAY_MAX_PENDING_EVENTS",
                     static_cast<long long>(gateway.sessions.max_pending_events), 1, 1 << 20));
  return config;
}

}  // namespace gateway
