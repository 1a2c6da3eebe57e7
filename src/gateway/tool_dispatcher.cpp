#include "gateway/tool_dispatcher.hpp"

#include <cctype>
#include <filesystem>
#include <map>
#include <optional>
#include <sstream>
#include <utility>

#include "gateway/jsonrpc.hpp"
#include "gateway/logging.hpp"
#include "gateway/tool_manifest.hpp"

namespace gateway {
namespace {

using gateway::logging::LogDebug;
using gateway::logging::LogInfo;
using gateway::logging::LogWarn;
using nlohmann::json;

constexpr std::size_t kStderrExcerptBytes = 512;
constexpr std::size_t kStdoutExcerptBytes = 200;
constexpr char kProtocolVersion[] = "2024-11-05";

std::string Trim(const std::string& value) {
  std::size_t first = 0;
  std::size_t last = value.size();
  while (first < value.size() && std::isspace(static_cast<unsigned char>(value[first]))) {
    ++first;
  }
  while (last > first && std::isspace(static_cast<unsigned char>(value[last - 1]))) {
    --last;
  }
  return value.substr(first, last - first);
}

std::string Excerpt(const std::string& text, std::size_t limit) {
  const std::string trimmed = Trim(text);
  if (trimmed.size() <= limit) {
    return trimmed;
  }
  return trimmed.substr(0, limit) + "...";
}

std::string ValueText(const json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return jsonrpc::Serialize(value);
}

// Whole stdout first; failing that, its last non-empty line, so plugins that
// log before printing their result still parse.
std::optional<json> ParsePluginOutput(const std::string& output) {
  const std::string trimmed = Trim(output);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  json parsed = json::parse(trimmed, nullptr, false);
  if (!parsed.is_discarded()) {
    return parsed;
  }
  const auto newline = trimmed.find_last_of('\n');
  if (newline == std::string::npos) {
    return std::nullopt;
  }
  parsed = json::parse(Trim(trimmed.substr(newline + 1)), nullptr, false);
  if (parsed.is_discarded()) {
    return std::nullopt;
  }
  return parsed;
}

std::string PluginErrorText(const json& error) {
  if (error.is_string()) {
    return error.get<std::string>();
  }
  if (error.is_object()) {
    if (const auto it = error.find("message"); it != error.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return jsonrpc::Serialize(error);
}

std::string DescribeExit(const std::string& tool_name, const platform::SubprocessResult& result) {
  std::ostringstream message;
  message << "Plugin tool '" << tool_name << "' ";
  if (result.term_signal != 0) {
    message << "was terminated by signal " << result.term_signal;
  } else if (result.exit_code == 127 && result.stdout_output.empty()) {
    message << "could not be executed (exit code 127)";
  } else {
    message << "exited with code " << result.exit_code;
  }
  const std::string stderr_excerpt = Excerpt(result.stderr_output, kStderrExcerptBytes);
  if (!stderr_excerpt.empty()) {
    message << ": " << stderr_excerpt;
  }
  return message.str();
}

// Switch values: booleans, non-zero numbers, and true/yes/on/1 in any case.
bool IsTruthy(const json& value) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number()) {
    return value.get<double>() != 0.0;
  }
  if (value.is_string()) {
    std::string text = Trim(value.get<std::string>());
    for (auto& ch : text) {
      ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return text == "true" || text == "yes" || text == "on" || text == "1";
  }
  return false;
}

bool IsValidId(const json& id) { return id.is_string() || id.is_number() || id.is_null(); }

}  // namespace

std::vector<std::string> BuildPluginArguments(const Command& command, const json& arguments) {
  std::vector<std::string> argv;
  std::map<std::string, std::vector<std::string>> positional_values;

  if (!arguments.is_object()) {
    return argv;
  }
  for (const auto& [key, value] : arguments.items()) {
    if (value.is_null()) {
      continue;
    }
    const Parameter* parameter = command.FindParameter(key);
    if (parameter != nullptr && parameter->positional) {
      auto& values = positional_values[parameter->name];
      if (value.is_array()) {
        for (const auto& element : value) {
          values.push_back(ValueText(element));
        }
      } else {
        values.push_back(ValueText(value));
      }
      continue;
    }

    const std::string flag = parameter != nullptr ? parameter->flag : "--" + key;
    const bool is_switch = parameter != nullptr ? parameter->type == ParameterType::kFlag
                                                : value.is_boolean();
    if (is_switch) {
      if (IsTruthy(value)) {
        argv.push_back(flag);
      }
      continue;
    }
    if (value.is_array()) {
      for (const auto& element : value) {
        if (!element.is_null()) {
          argv.push_back(flag);
          argv.push_back(ValueText(element));
        }
      }
      continue;
    }
    argv.push_back(flag);
    argv.push_back(ValueText(value));
  }

  std::vector<std::string> positionals;
  for (const auto& parameter : command.parameters) {
    if (const auto it = positional_values.find(parameter.name); it != positional_values.end()) {
      positionals.insert(positionals.end(), it->second.begin(), it->second.end());
    }
  }
  if (!positionals.empty()) {
    for (const auto& value : positionals) {
      if (!value.empty() && value.front() == '-') {
        argv.push_back("--");
        break;
      }
    }
    argv.insert(argv.end(), positionals.begin(), positionals.end());
  }
  return argv;
}

json TranslateToolOutput(const json& id, const std::string& tool_name,
                         const platform::SubprocessResult& result,
                         std::chrono::milliseconds timeout) {
  if (result.timed_out) {
    return jsonrpc::MakeError(id, jsonrpc::kInternalError,
                              "Plugin tool '" + tool_name + "' timed out after " +
                                  std::to_string(timeout.count()) + " ms");
  }

  const auto parsed = ParsePluginOutput(result.stdout_output);
  if (parsed && parsed->is_object()) {
    if (const auto it = parsed->find("error"); it != parsed->end() && !it->is_null()) {
      return jsonrpc::MakeError(id, jsonrpc::kInternalError, PluginErrorText(*it));
    }
  }

  if (!result.Succeeded()) {
    return jsonrpc::MakeError(id, jsonrpc::kInternalError, DescribeExit(tool_name, result));
  }

  if (!parsed) {
    std::string message = "Plugin tool '" + tool_name + "' produced invalid JSON output";
    const std::string stdout_excerpt = Excerpt(result.stdout_output, kStdoutExcerptBytes);
    message += stdout_excerpt.empty() ? std::string{" (empty)"} : ": " + stdout_excerpt;
    if (result.output_truncated) {
      message += " (output truncated)";
    }
    return jsonrpc::MakeError(id, jsonrpc::kInternalError, message);
  }
  if (!parsed->is_object()) {
    return jsonrpc::MakeError(id, jsonrpc::kInternalError,
                              "Plugin tool '" + tool_name + "' printed a JSON " +
                                  std::string{parsed->type_name()} + " instead of an object");
  }

  std::string text;
  if (const auto it = parsed->find("result"); it != parsed->end()) {
    text = ValueText(*it);
  } else {
    text = jsonrpc::Serialize(*parsed);
  }
  return jsonrpc::MakeResult(id, jsonrpc::MakeTextContent(text));
}

ToolDispatcher::ToolDispatcher(const PluginRegistry& registry, DispatcherOptions options)
    : registry_(registry), options_(std::move(options)) {}

json ToolDispatcher::HandleMessage(const std::string& body) const {
  const json request = json::parse(body, nullptr, false);
  if (request.is_discarded()) {
    return jsonrpc::MakeError(nullptr, jsonrpc::kParseError,
                              "Parse error: request body is not valid JSON");
  }
  return Dispatch(request);
}

json ToolDispatcher::Dispatch(const json& request) const {
  if (request.is_array()) {
    return jsonrpc::MakeError(nullptr, jsonrpc::kInvalidRequest,
                              "Batch requests are not supported");
  }
  if (!request.is_object()) {
    return jsonrpc::MakeError(nullptr, jsonrpc::kInvalidRequest,
                              "Request must be a JSON object");
  }

  const auto id_it = request.find("id");
  if (id_it == request.end()) {
    return jsonrpc::MakeError(nullptr, jsonrpc::kInvalidRequest, "Request is missing 'id'");
  }
  if (!IsValidId(*id_it)) {
    return jsonrpc::MakeError(nullptr, jsonrpc::kInvalidRequest,
                              "Request 'id' must be a string, number or null");
  }
  const json& id = *id_it;

  const auto version_it = request.find("jsonrpc");
  if (version_it == request.end() || !version_it->is_string() ||
      version_it->get<std::string>() != jsonrpc::kVersion) {
    return jsonrpc::MakeError(id, jsonrpc::kInvalidRequest, "'jsonrpc' must be \"2.0\"");
  }

  const auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string()) {
    return jsonrpc::MakeError(id, jsonrpc::kInvalidRequest, "Request is missing 'method'");
  }
  const std::string method = method_it->get<std::string>();
  const json params = request.contains("params") ? request.at("params") : json::object();

  if (method == "tools/call") {
    return HandleToolCall(id, params);
  }
  if (method == "tools/list") {
    return jsonrpc::MakeResult(id, BuildManifest(*registry_.Snapshot()));
  }
  if (method == "initialize") {
    return HandleInitialize(id);
  }
  if (method == "ping") {
    return jsonrpc::MakeResult(id, json::object());
  }
  return jsonrpc::MakeError(id, jsonrpc::kInvalidRequest, "Unsupported method: " + method);
}

json ToolDispatcher::HandleInitialize(const json& id) const {
  return jsonrpc::MakeResult(
      id, {{"protocolVersion", kProtocolVersion},
           {"serverInfo", {{"name", options_.server_name}, {"version", options_.server_version}}},
           {"capabilities", {{"tools", {{"listChanged", true}}}}}});
}

json ToolDispatcher::HandleToolCall(const json& id, const json& params) const {
  if (!params.is_object()) {
    return jsonrpc::MakeError(id, jsonrpc::kInvalidRequest,
                              "'params' must be an object naming the tool");
  }
  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    return jsonrpc::MakeError(id, jsonrpc::kInvalidRequest, "'params.name' must be a string");
  }
  const std::string tool_name = name_it->get<std::string>();

  json arguments = json::object();
  if (const auto it = params.find("arguments"); it != params.end() && !it->is_null()) {
    if (!it->is_object()) {
      return jsonrpc::MakeError(id, jsonrpc::kInvalidParams,
                                "'params.arguments' must be an object");
    }
    arguments = *it;
  }

  const auto binding = registry_.Lookup(tool_name);
  if (!binding) {
    return jsonrpc::MakeError(id, jsonrpc::kMethodNotFound, "Tool not found: " + tool_name);
  }

  auto argv = binding->plugin->LaunchPrefix();
  argv.push_back(binding->command->name);
  const auto plugin_arguments = BuildPluginArguments(*binding->command, arguments);
  argv.insert(argv.end(), plugin_arguments.begin(), plugin_arguments.end());

  platform::SubprocessOptions subprocess_options;
  subprocess_options.timeout = options_.tool_timeout;
  subprocess_options.max_output_bytes = options_.max_output_bytes;
  subprocess_options.working_directory =
      std::filesystem::path(binding->plugin->executable_path).parent_path().string();

  LogDebug("Calling " + tool_name + ": " + platform::DescribeCommandLine(argv));
  platform::SubprocessResult result;
  try {
    result = platform::RunSubprocess(argv, subprocess_options);
  } catch (const platform::SubprocessError& ex) {
    LogWarn("Tool " + tool_name + " could not start: " + ex.what());
    return jsonrpc::MakeError(id, jsonrpc::kInternalError,
                              "Failed to start plugin tool '" + tool_name + "': " + ex.what());
  }

  json response = TranslateToolOutput(id, tool_name, result, options_.tool_timeout);
  const std::string elapsed = std::to_string(result.elapsed.count()) + " ms";
  if (response.contains("error")) {
    LogWarn("Tool " + tool_name + " failed after " + elapsed + ": " +
            response["error"].value("message", std::string{}));
  } else {
    LogInfo("Tool " + tool_name + " completed in " + elapsed);
  }
  return response;
}

}  // namespace gateway
