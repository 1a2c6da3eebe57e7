#pragma once

#include <cstddef>
#include <string>

#include "gateway/gateway.hpp"

namespace platform {
class HttpServer;
}  // namespace platform

namespace gateway {

struct ServerConfig {
  std::string host = "127.0.0.1";
  int port = 8080;
  std::size_t worker_threads = 64;
  GatewayConfig gateway;
};

// Routes: GET /health, GET /sse, POST /message, POST /rescan.
void ConfigureServer(platform::HttpServer& server, Gateway& gateway);
ServerConfig LoadServerConfig();

}  // namespace gateway
