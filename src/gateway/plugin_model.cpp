#include "gateway/plugin_model.hpp"

namespace gateway {

const Parameter* Command::FindParameter(const std::string& parameter_name) const {
  for (const auto& parameter : parameters) {
    if (parameter.name == parameter_name) {
      return &parameter;
    }
  }
  return nullptr;
}

std::vector<std::string> Plugin::LaunchPrefix() const {
  std::vector<std::string> prefix;
  if (!interpreter.empty()) {
    prefix.push_back(interpreter);
  }
  prefix.push_back(executable_path);
  return prefix;
}

std::string QualifiedToolName(const Plugin& plugin, const Command& command) {
  return plugin.name + kQualifiedNameSeparator + command.name;
}

std::string ParameterTypeToString(ParameterType type) {
  switch (type) {
    case ParameterType::kString:
      return "string";
    case ParameterType::kNumber:
      return "number";
    case ParameterType::kBoolean:
    case ParameterType::kFlag:
      return "boolean";
    case ParameterType::kAny:
      return {};
  }
  return {};
}

}  // namespace gateway
