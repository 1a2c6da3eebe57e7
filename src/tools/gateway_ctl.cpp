#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "platform/http_client.hpp"

namespace {

std::string GetEnv(const char* key, const std::string& fallback) {
  if (const char* value = std::getenv(key)) {
    return value;
  }
  return fallback;
}

void PrintUsage() {
  std::cerr << "usage: gateway_ctl <command> [args]\n"
               "\n"
               "commands:\n"
               "  health                     Show plugin and session counts\n"
               "  tools                      Print the tool manifest sent to new streams\n"
               "  call <tool> [arguments]    Invoke a tool; arguments is a JSON object\n"
               "  rescan                     Rebuild the plugin registry\n"
               "\n"
               "The gateway address comes from PLUGIN_GATEWAY_URL, or\n"
               "PLUGIN_GATEWAY_HOST / PLUGIN_GATEWAY_PORT.\n";
}

int PrintBody(const platform::HttpClientResponse& response) {
  const auto parsed = nlohmann::json::parse(response.body, nullptr, false);
  std::cout << (parsed.is_discarded() ? response.body : parsed.dump(2)) << std::endl;
  return response.status == 200 ? 0 : 1;
}

int RunTools(const platform::HttpClient& client) {
  nlohmann::json tools;
  const int status = client.ReadEvents("/sse", [&tools](const platform::ServerSentEvent& event) {
    const auto payload = nlohmann::json::parse(event.data, nullptr, false);
    if (payload.is_discarded()) {
      return true;
    }
    tools = payload.value("params", nlohmann::json::object())
                .value("tools", nlohmann::json::array());
    return false;
  });
  if (status != 200 || tools.is_null()) {
    std::cerr << "Stream did not deliver a manifest (HTTP " << status << ")" << std::endl;
    return 1;
  }
  std::cout << tools.dump(2) << std::endl;
  return 0;
}

int RunCall(const platform::HttpClient& client, const std::string& tool,
            const std::string& raw_arguments) {
  const auto arguments = nlohmann::json::parse(raw_arguments, nullptr, false);
  if (arguments.is_discarded() || !arguments.is_object()) {
    std::cerr << "Arguments must be a JSON object, got: " << raw_arguments << std::endl;
    return 2;
  }
  const nlohmann::json request = {
      {"jsonrpc", "2.0"},
      {"id", 1},
      {"method", "tools/call"},
      {"params", {{"name", tool}, {"arguments", arguments}}},
  };
  const auto response = client.Post("/message", request.dump());
  const auto payload = nlohmann::json::parse(response.body, nullptr, false);
  if (payload.is_discarded()) {
    std::cerr << "Gateway returned a non-JSON body (HTTP " << response.status << ")" << std::endl;
    return 1;
  }
  if (const auto error = payload.find("error"); error != payload.end()) {
    std::cerr << "error " << error->value("code", 0) << ": "
              << error->value("message", std::string{}) << std::endl;
    return 1;
  }
  const auto result = payload.value("result", nlohmann::json::object());
  for (const auto& item : result.value("content", nlohmann::json::array())) {
    std::cout << item.value("text", std::string{}) << std::endl;
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty() || args[0] == "-h" || args[0] == "--help") {
    PrintUsage();
    return args.empty() ? 2 : 0;
  }

  try {
    const std::string base_url =
        GetEnv("PLUGIN_GATEWAY_URL", "http://" + GetEnv("PLUGIN_GATEWAY_HOST", "127.0.0.1") +
                                         ":" + GetEnv("PLUGIN_GATEWAY_PORT", "8080"));
    const platform::HttpClient client(base_url);

    const std::string& command = args[0];
    if (command == "health") {
      return PrintBody(client.Get("/health"));
    }
    if (command == "tools") {
      return RunTools(client);
    }
    if (command == "rescan") {
      return PrintBody(client.Post("/rescan", ""));
    }
    if (command == "call" && args.size() >= 2) {
      return RunCall(client, args[1], args.size() >= 3 ? args[2] : "{}");
    }
    PrintUsage();
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "gateway_ctl: " << ex.what() << std::endl;
    return 1;
  }
}
