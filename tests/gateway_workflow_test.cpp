#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "gateway/app.hpp"
#include "gateway/gateway.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_client.hpp"
#include "platform/http_server.hpp"
#include "test_support.hpp"

namespace {

using nlohmann::json;
using test_support::Assert;
using test_support::FixtureCommand;

class TestServer {
 public:
  explicit TestServer(gateway::GatewayConfig config) : gateway_(std::move(config)) {
    gateway::ConfigureServer(server_, gateway_);
  }

  ~TestServer() {
    if (worker_.joinable()) {
      gateway_.Stop();
      server_.Stop();
      worker_.join();
    }
  }

  void Start(const std::string& host, int port) {
    gateway_.Start();
    host_ = host;
    port_ = port;
    worker_ = std::thread([this] {
      try {
        server_.Start(host_, port_);
      } catch (const std::exception& ex) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = ex.what();
      }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  // Sessions first: open streams hold server workers until their pump ends.
  void Stop() {
    gateway_.Stop();
    server_.Stop();
    if (worker_.joinable()) {
      worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!error_.empty()) {
      throw std::runtime_error(error_);
    }
  }

 private:
  gateway::Gateway gateway_;
  platform::HttpServer server_;
  std::thread worker_;
  std::string host_;
  int port_ = 0;
  std::string error_;
  std::mutex mutex_;
};

FixtureCommand ResultCommand(const std::string& name, const std::string& text) {
  FixtureCommand command;
  command.name = name;
  command.help = "Run the " + name;
  command.body = test_support::EchoResult(text);
  return command;
}

void WriteFixtures(const std::filesystem::path& root) {
  FixtureCommand workflow;
  workflow.name = "workflow-command";
  workflow.help = "Run the workflow command";
  workflow.options = {{"--param", "PARAM", "Parameter for workflow (default: default)"}};
  workflow.body =
      "    printf '{\"result\": \"Workflow executed with param: %s\"}\\n' \"${param:-default}\"";
  test_support::WritePlugin(root, "workflow_test_plugin", {workflow}, "Workflow test plugin");

  for (const std::string name : {"plugin_a", "plugin_b", "plugin_c"}) {
    test_support::WritePlugin(root, name,
                              {ResultCommand("test-command", name + " executed successfully")},
                              name);
  }

  FixtureCommand error;
  error.name = "error-command";
  error.help = "Run the error command";
  error.body = "    echo '{\"error\": \"This is a test error\"}'";
  test_support::WritePlugin(root, "error_plugin", {error}, "Error test plugin");

  FixtureCommand concurrent = ResultCommand("concurrent-command", "Concurrent execution completed");
  concurrent.body = "    sleep 1\n" + concurrent.body;
  test_support::WritePlugin(root, "concurrent_plugin", {concurrent}, "Concurrent test plugin");
}

std::string ToolCall(const std::string& tool, const json& arguments, int id = 1) {
  return json{{"jsonrpc", "2.0"},
              {"id", id},
              {"method", "tools/call"},
              {"params", {{"name", tool}, {"arguments", arguments}}}}
      .dump();
}

json PostMessage(const platform::HttpClient& client, const std::string& body,
                 const std::map<std::string, std::string>& query = {}) {
  const auto response = client.Post("/message", body, query);
  Assert(response.status == 200, "POST /message must answer 200");
  const auto parsed = json::parse(response.body, nullptr, false);
  Assert(parsed.is_object() && parsed.value("jsonrpc", "") == "2.0",
         "POST /message must return a JSON-RPC object");
  return parsed;
}

json Health(const platform::HttpClient& client) {
  const auto response = client.Get("/health");
  Assert(response.status == 200, "GET /health must answer 200");
  return json::parse(response.body);
}

std::string ResultText(const json& response) {
  Assert(response.contains("result"), "Expected a result, got: " + response.dump());
  const auto& content = response.at("result").at("content");
  Assert(content.size() == 1 && content.at(0).at("type") == "text",
         "Result must carry one text block");
  return content.at(0).at("text").get<std::string>();
}

bool WaitForSessions(const platform::HttpClient& client, std::size_t expected,
                     std::chrono::milliseconds within) {
  const auto deadline = std::chrono::steady_clock::now() + within;
  while (std::chrono::steady_clock::now() < deadline) {
    if (Health(client).at("sessions") == expected) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  return false;
}

void TestHealthAndManifest(const platform::HttpClient& client) {
  const auto response = client.Get("/health");
  Assert(response.headers.count("Access-Control-Allow-Origin") == 1,
         "Responses must carry CORS headers");
  const auto health = json::parse(response.body);
  Assert(health.at("status") == "ok", "Health status must be ok");
  Assert(health.at("plugins") == 6, "Health must count six plugins");
  Assert(health.at("tools") == 6, "Health must count six tools");
  Assert(health.at("sessions") == 0, "No sessions before any stream opens");

  json manifest;
  const int status = client.ReadEvents("/sse", [&manifest](const platform::ServerSentEvent& event) {
    manifest = json::parse(event.data);
    return false;
  });
  Assert(status == 200, "GET /sse must answer 200");
  Assert(manifest.at("method") == "notifications/tools/list", "First event must be the manifest");
  Assert(!manifest.at("params").at("sessionId").get<std::string>().empty(),
         "Manifest must carry the session id");

  const auto& tools = manifest.at("params").at("tools");
  Assert(tools.size() == 6, "Manifest must list one tool per plugin");
  const json* workflow = nullptr;
  for (const auto& tool : tools) {
    if (tool.at("name") == "workflow_test_plugin.workflow-command") {
      workflow = &tool;
    }
  }
  Assert(workflow != nullptr, "Workflow tool must be in the manifest");
  Assert(workflow->at("inputSchema").at("properties").contains("param"),
         "Workflow tool must expose its param argument");
  for (const std::string name : {"plugin_a", "plugin_b", "plugin_c"}) {
    bool found = false;
    for (const auto& tool : tools) {
      found = found || tool.at("name") == name + ".test-command";
    }
    Assert(found, name + ".test-command must be in the manifest");
  }
}

void TestToolExecution(const platform::HttpClient& client) {
  Assert(ResultText(PostMessage(client, ToolCall("workflow_test_plugin.workflow-command",
                                                 {{"param", "test_value"}}))) ==
             "Workflow executed with param: test_value",
         "Workflow tool result mismatch");

  for (const std::string name : {"plugin_a", "plugin_b", "plugin_c"}) {
    Assert(ResultText(PostMessage(client, ToolCall(name + ".test-command", json::object()))) ==
               name + " executed successfully",
           name + " result mismatch");
  }

  const auto error = PostMessage(client, ToolCall("error_plugin.error-command", json::object()));
  Assert(error.at("error").at("code") == -32603, "Plugin error must be -32603");
  Assert(error.at("error").at("message").get<std::string>().find("This is a test error") !=
             std::string::npos,
         "Plugin error message must be forwarded");

  const auto parse = PostMessage(client, "{broken");
  Assert(parse.at("error").at("code") == -32700, "Malformed body must be -32700 over HTTP 200");
  const auto missing = PostMessage(client, ToolCall("ghost.tool", json::object()));
  Assert(missing.at("error").at("code") == -32601, "Unknown tool must be -32601 over HTTP 200");
}

// Open streams pin server workers for their lifetime; tool calls arriving
// meanwhile must still run side by side.
void TestConcurrentRequests(const platform::HttpClient& client) {
  constexpr std::size_t kHeldStreams = 4;
  std::mutex mutex;
  std::vector<std::string> held_ids;
  std::vector<std::thread> streams;
  for (std::size_t i = 0; i < kHeldStreams; ++i) {
    streams.emplace_back([&client, &mutex, &held_ids] {
      try {
        client.ReadEvents("/sse", [&](const platform::ServerSentEvent& event) {
          const auto payload = json::parse(event.data, nullptr, false);
          if (payload.value("method", "") == "notifications/tools/list") {
            std::lock_guard<std::mutex> lock(mutex);
            held_ids.push_back(payload.at("params").at("sessionId").get<std::string>());
            return true;
          }
          return event.event != "message";
        });
      } catch (const std::exception& ex) {
        std::cerr << "stream failed: " << ex.what() << std::endl;
      }
    });
  }
  const auto open_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  std::size_t held = 0;
  while (held < kHeldStreams && std::chrono::steady_clock::now() < open_deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    std::lock_guard<std::mutex> lock(mutex);
    held = held_ids.size();
  }
  Assert(held == kHeldStreams, "Held streams must receive their manifest");

  std::vector<json> responses(5);
  std::vector<std::thread> callers;
  const auto started = std::chrono::steady_clock::now();
  for (std::size_t i = 0; i < responses.size(); ++i) {
    callers.emplace_back([&client, &responses, i] {
      try {
        responses[i] = PostMessage(
            client, ToolCall("concurrent_plugin.concurrent-command", json::object(),
                             static_cast<int>(i)));
      } catch (const std::exception& ex) {
        responses[i] = json{{"failure", ex.what()}};
      }
    });
  }
  for (auto& caller : callers) {
    caller.join();
  }
  const auto elapsed = std::chrono::steady_clock::now() - started;
  for (const auto& response : responses) {
    Assert(ResultText(response) == "Concurrent execution completed",
           "Concurrent request result mismatch");
  }
  // Five one-second calls: about 1 s in parallel, 5 s one after another.
  Assert(elapsed < std::chrono::milliseconds(2500),
         "Concurrent requests must not serialize behind each other or behind open streams");

  // A pushed message event ends each held stream.
  for (const auto& id : held_ids) {
    PostMessage(client, json{{"jsonrpc", "2.0"}, {"id", 7}, {"method", "ping"}}.dump(),
                {{"sessionId", id}});
  }
  for (auto& stream : streams) {
    stream.join();
  }
}

void TestSessionLifecycle(const platform::HttpClient& client) {
  Assert(WaitForSessions(client, 0, std::chrono::milliseconds(3000)),
         "Earlier streams must be reaped");

  std::atomic<int> opened{0};
  std::atomic<int> refreshed{0};
  std::vector<std::thread> streams;
  for (int i = 0; i < 3; ++i) {
    streams.emplace_back([&client, &opened, &refreshed] {
      try {
        client.ReadEvents("/sse", [&](const platform::ServerSentEvent& event) {
          const auto payload = json::parse(event.data, nullptr, false);
          if (payload.value("method", "") == "notifications/tools/list") {
            ++opened;
            return true;
          }
          if (event.event == "tools" &&
              payload.value("method", "") == "notifications/tools/list_changed") {
            ++refreshed;
          }
          return false;
        });
      } catch (const std::exception& ex) {
        std::cerr << "stream failed: " << ex.what() << std::endl;
      }
    });
  }

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (opened.load() < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  Assert(opened.load() == 3, "Three streams must receive their manifest");
  Assert(Health(client).at("sessions") >= 3, "Health must count the open sessions");

  const auto rescan = client.Post("/rescan", "");
  Assert(rescan.status == 200, "POST /rescan must answer 200");
  Assert(json::parse(rescan.body).at("generation") == 2, "Rescan must publish generation 2");

  for (auto& stream : streams) {
    stream.join();
  }
  Assert(refreshed.load() == 3, "Every stream must be told the tool list changed");
  Assert(WaitForSessions(client, 0, std::chrono::milliseconds(2000)),
         "Closed streams must be cleaned up within two seconds");
}

void TestResponsePushedToSession(const platform::HttpClient& client) {
  std::mutex mutex;
  std::string session_id;
  std::atomic<bool> pushed{false};
  std::thread stream([&] {
    try {
      client.ReadEvents("/sse", [&](const platform::ServerSentEvent& event) {
        const auto payload = json::parse(event.data, nullptr, false);
        if (payload.value("method", "") == "notifications/tools/list") {
          std::lock_guard<std::mutex> lock(mutex);
          session_id = payload.at("params").at("sessionId").get<std::string>();
          return true;
        }
        if (event.event == "message" && payload.value("id", 0) == 99) {
          pushed = true;
        }
        return !pushed.load();
      });
    } catch (const std::exception& ex) {
      std::cerr << "stream failed: " << ex.what() << std::endl;
    }
  });

  std::string id;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (id.empty() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    std::lock_guard<std::mutex> lock(mutex);
    id = session_id;
  }
  Assert(!id.empty(), "Stream must announce its session id");

  const auto inline_response = PostMessage(
      client, json{{"jsonrpc", "2.0"}, {"id", 99}, {"method", "ping"}}.dump(), {{"sessionId", id}});
  Assert(inline_response.at("id") == 99, "Response must still be returned inline");
  stream.join();
  Assert(pushed.load(), "Response must also be pushed to the named session");
}

void RunTests() {
  constexpr int kTestPort = 18931;
  test_support::TempDir plugins("gateway-workflow");
  WriteFixtures(plugins.path());

  gateway::GatewayConfig config;
  config.plugins_dir = plugins.path().string();
  config.reap_interval = std::chrono::milliseconds(50);
  config.sessions.keepalive_interval = std::chrono::milliseconds(200);
  config.dispatcher.tool_timeout = std::chrono::milliseconds(10000);

  TestServer server(config);
  server.Start("127.0.0.1", kTestPort);
  const platform::HttpClient client("http://127.0.0.1:" + std::to_string(kTestPort), 10);

  TestHealthAndManifest(client);
  TestToolExecution(client);
  TestConcurrentRequests(client);
  TestSessionLifecycle(client);
  TestResponsePushedToSession(client);

  server.Stop();
}

}  // namespace

int main() {
  std::signal(SIGPIPE, SIG_IGN);
  try {
    RunTests();
  } catch (const std::exception& ex) {
    std::cerr << "Gateway workflow test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
