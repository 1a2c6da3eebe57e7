#include <pthread.h>
#include <signal.h>

#include <csignal>
#include <exception>
#include <string>
#include <thread>

#include "gateway/app.hpp"
#include "gateway/gateway.hpp"
#include "gateway/logging.hpp"
#include "platform/http_server.hpp"

namespace {

// Waits for SIGINT/SIGTERM on a dedicated thread, then stops the gateway
// (ending every stream) before the server so its workers can drain.
void WatchForShutdown(gateway::Gateway& gateway, platform::HttpServer& server) {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  int received = 0;
  if (sigwait(&signals, &received) != 0) {
    return;
  }
  gateway::logging::LogInfo("Received signal " + std::to_string(received) + ", shutting down");
  gateway.Stop();
  server.Stop();
}

}  // namespace

int main() {
  gateway::logging::InitializeFromEnvironment();
  const auto config = gateway::LoadServerConfig();

  // Blocked before any thread starts so only the watcher receives them.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  std::signal(SIGPIPE, SIG_IGN);

  gateway::Gateway gateway(config.gateway);
  platform::HttpServer server(config.worker_threads);
  gateway::ConfigureServer(server, gateway);

  try {
    gateway.Start();
  } catch (const std::exception& ex) {
    gateway::logging::LogError(std::string{"Gateway failed to start: "} + ex.what());
    return 1;
  }

  std::thread watcher([&gateway, &server] { WatchForShutdown(gateway, server); });
  watcher.detach();

  gateway::logging::LogInfo("Starting plugin gateway on " + config.host + ":" +
                            std::to_string(config.port));
  try {
    server.Start(config.host, config.port);
  } catch (const std::exception& ex) {
    gateway::logging::LogError(std::string{"Server terminated with error: "} + ex.what());
    gateway.Stop();
    return 1;
  }

  gateway.Stop();
  gateway::logging::LogInfo("Server shut down gracefully.");
  return 0;
}
