#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace gateway {

enum class ParameterType { kAny = 0, kString, kNumber, kBoolean, kFlag };

struct Parameter {
  std::string name;
  // Literal option spelling ("--dry-run"); empty for positionals.
  std::string flag;
  ParameterType type = ParameterType::kAny;
  bool required = false;
  bool positional = false;
  std::optional<nlohmann::json> default_value;
  std::vector<std::string> choices;
  std::string description;
};

struct Command {
  std::string name;
  std::string description;
  std::vector<Parameter> parameters;

  const Parameter* FindParameter(const std::string& name) const;
};

struct Plugin {
  std::string name;
  std::string executable_path;
  // Set when the entry point is a script that is not executable on its own.
  std::string interpreter;
  std::string description;
  std::vector<Command> commands;

  // argv prefix that launches the plugin: [interpreter] executable_path.
  std::vector<std::string> LaunchPrefix() const;
};

constexpr char kQualifiedNameSeparator = '.';

std::string QualifiedToolName(const Plugin& plugin, const Command& command);
std::string ParameterTypeToString(ParameterType type);

}  // namespace gateway
