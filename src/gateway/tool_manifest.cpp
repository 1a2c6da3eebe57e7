#include "gateway/tool_manifest.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace gateway {
namespace {

nlohmann::json BuildPropertySchema(const Parameter& parameter) {
  nlohmann::json property = nlohmann::json::object();
  const std::string type = ParameterTypeToString(parameter.type);
  if (!type.empty()) {
    property["type"] = type;
  }
  if (!parameter.description.empty()) {
    property["description"] = parameter.description;
  }
  if (!parameter.choices.empty()) {
    property["enum"] = parameter.choices;
  }
  if (parameter.default_value) {
    property["default"] = *parameter.default_value;
  }
  return property;
}

}  // namespace

nlohmann::json BuildInputSchema(const Command& command) {
  nlohmann::json properties = nlohmann::json::object();
  nlohmann::json required = nlohmann::json::array();
  for (const auto& parameter : command.parameters) {
    properties[parameter.name] = BuildPropertySchema(parameter);
    if (parameter.required) {
      required.push_back(parameter.name);
    }
  }
  return {{"type", "object"}, {"properties", properties}, {"required", required}};
}

nlohmann::json BuildToolJson(const Plugin& plugin, const Command& command) {
  std::string description = command.description;
  if (description.empty()) {
    description = plugin.description.empty()
                      ? "Run '" + command.name + "' from plugin " + plugin.name
                      : plugin.description;
  }
  return {{"name", QualifiedToolName(plugin, command)},
          {"description", description},
          {"inputSchema", BuildInputSchema(command)}};
}

nlohmann::json BuildManifest(const RegistrySnapshot& snapshot) {
  std::vector<std::pair<const Plugin*, const Command*>> ordered;
  for (const auto& plugin : snapshot.plugins) {
    for (const auto& command : plugin.commands) {
      ordered.emplace_back(&plugin, &command);
    }
  }
  std::sort(ordered.begin(), ordered.end(), [](const auto& lhs, const auto& rhs) {
    if (lhs.first->name != rhs.first->name) {
      return lhs.first->name < rhs.first->name;
    }
    return lhs.second->name < rhs.second->name;
  });

  nlohmann::json tools = nlohmann::json::array();
  for (const auto& [plugin, command] : ordered) {
    tools.push_back(BuildToolJson(*plugin, *command));
  }
  return {{"tools", tools}};
}

}  // namespace gateway
