#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "gateway/plugin_model.hpp"

namespace gateway {

class IntrospectionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct IntrospectionOptions {
  std::chrono::milliseconds timeout{10000};
};

struct PluginCandidate {
  std::string name;
  std::string entry_point;
  std::string interpreter;
};

struct DeclaredCommand {
  std::string name;
  std::string description;
};

// Resolves how to launch `entry_point`. Executable files run directly; .py and
// .sh scripts without the execute bit go through python3 / sh. Throws
// IntrospectionError when the file is missing or cannot be launched.
PluginCandidate MakeCandidate(const std::string& name, const std::string& entry_point);

// Asks the plugin for its help output (top level, then once per command) and
// turns it into a Plugin. Only `--help` invocations are made.
Plugin Introspect(const PluginCandidate& candidate, const IntrospectionOptions& options);
Plugin Introspect(const std::string& executable_path, const IntrospectionOptions& options);

// Help-text parsers for argparse-style output.
std::vector<DeclaredCommand> ParseCommandListing(const std::string& help_text);
std::vector<Parameter> ParseCommandParameters(const std::string& help_text);
std::string ParseProgramDescription(const std::string& help_text);

}  // namespace gateway
