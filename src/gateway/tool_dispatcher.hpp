#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "gateway/plugin_model.hpp"
#include "gateway/plugin_registry.hpp"
#include "nlohmann/json.hpp"
#include "platform/subprocess.hpp"

namespace gateway {

struct DispatcherOptions {
  std::chrono::milliseconds tool_timeout{30000};
  std::size_t max_output_bytes = 4 * 1024 * 1024;
  std::string server_name = "plugin-gateway";
  std::string server_version = "0.3.0";
};

// Resolves and executes JSON-RPC requests. Holds no lock while a plugin runs,
// so any number of calls may execute at once.
class ToolDispatcher {
 public:
  ToolDispatcher(const PluginRegistry& registry, DispatcherOptions options);

  // Always returns exactly one response object for the request.
  nlohmann::json Dispatch(const nlohmann::json& request) const;
  // Same, from an unparsed body; malformed JSON yields a parse error response.
  nlohmann::json HandleMessage(const std::string& body) const;

 private:
  nlohmann::json HandleToolCall(const nlohmann::json& id, const nlohmann::json& params) const;
  nlohmann::json HandleInitialize(const nlohmann::json& id) const;

  const PluginRegistry& registry_;
  DispatcherOptions options_;
};

// Command-line form of `arguments` for `command`: flags first (in key
// order), then positionals in declared order. Unknown keys pass through
// as --key value.
std::vector<std::string> BuildPluginArguments(const Command& command,
                                              const nlohmann::json& arguments);

// Maps a finished plugin process onto a JSON-RPC result or error.
nlohmann::json TranslateToolOutput(const nlohmann::json& id, const std::string& tool_name,
                                   const platform::SubprocessResult& result,
                                   std::chrono::milliseconds timeout);

}  // namespace gateway
