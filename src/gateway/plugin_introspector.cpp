#include "gateway/plugin_introspector.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <regex>
#include <set>
#include <sstream>
#include <utility>

#include "gateway/logging.hpp"
#include "platform/subprocess.hpp"

namespace gateway {
namespace {

using gateway::logging::LogDebug;

constexpr std::size_t kHelpExcerptBytes = 256;

const std::set<std::string> kNumericMetavars = {"N", "INT", "INTEGER", "NUM", "NUMBER", "FLOAT"};

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

std::string ToLower(std::string value) {
  for (auto& ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(line);
  }
  return lines;
}

std::size_t IndentOf(const std::string& line) {
  std::size_t indent = 0;
  while (indent < line.size() && (line[indent] == ' ' || line[indent] == '\t')) {
    ++indent;
  }
  return indent;
}

bool IsBlank(const std::string& line) { return IndentOf(line) == line.size(); }

bool IsCommandToken(const std::string& token) {
  if (token.empty() || token.front() == '-') {
    return false;
  }
  return std::all_of(token.begin(), token.end(), [](unsigned char ch) {
    return std::isalnum(ch) != 0 || ch == '-' || ch == '_';
  });
}

// Splits "  --name NAME   Description text" into invocation and description.
std::pair<std::string, std::string> SplitEntry(const std::string& trimmed) {
  const auto gap = trimmed.find("  ");
  if (gap == std::string::npos) {
    return {trimmed, {}};
  }
  return {trimmed.substr(0, gap), Trim(trimmed.substr(gap))};
}

std::vector<std::string> SplitChoices(const std::string& braced) {
  std::vector<std::string> choices;
  const auto open = braced.find('{');
  const auto close = braced.find('}', open);
  if (open == std::string::npos || close == std::string::npos) {
    return choices;
  }
  std::stringstream stream(braced.substr(open + 1, close - open - 1));
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = Trim(item);
    if (!item.empty()) {
      choices.push_back(item);
    }
  }
  return choices;
}

// Text following "usage:", including indented continuation lines.
std::string ExtractUsage(const std::vector<std::string>& lines) {
  std::string usage;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const std::string trimmed = Trim(lines[i]);
    if (ToLower(trimmed).rfind("usage:", 0) != 0) {
      continue;
    }
    usage = trimmed.substr(6);
    for (std::size_t j = i + 1; j < lines.size(); ++j) {
      if (IsBlank(lines[j]) || IndentOf(lines[j]) == 0) {
        break;
      }
      usage += ' ' + Trim(lines[j]);
    }
    break;
  }
  return usage;
}

struct UsageTokens {
  std::set<std::string> mandatory;
  std::set<std::string> optional;
};

UsageTokens TokenizeUsage(const std::string& usage) {
  UsageTokens tokens;
  int depth = 0;
  int token_depth = 0;
  std::string current;
  auto flush = [&]() {
    if (!current.empty() && current != "...") {
      (token_depth == 0 ? tokens.mandatory : tokens.optional).insert(current);
    }
    current.clear();
  };
  for (const char ch : usage) {
    if (ch == '[' || ch == '(') {
      flush();
      ++depth;
    } else if (ch == ']' || ch == ')') {
      flush();
      depth = std::max(0, depth - 1);
    } else if (ch == '|' || std::isspace(static_cast<unsigned char>(ch))) {
      flush();
    } else {
      if (current.empty()) {
        token_depth = depth;
      }
      current.push_back(ch);
    }
  }
  flush();
  return tokens;
}

enum class HelpSection { kNone, kPositional, kOptions };

HelpSection ClassifyHeader(const std::string& line) {
  const std::string header = ToLower(Trim(line));
  if (header.empty() || header.back() != ':') {
    return HelpSection::kNone;
  }
  if (header.find("positional") != std::string::npos) {
    return HelpSection::kPositional;
  }
  if (header.find("option") != std::string::npos || header.find("argument") != std::string::npos ||
      header.find("flag") != std::string::npos) {
    return HelpSection::kOptions;
  }
  return HelpSection::kNone;
}

struct HelpEntry {
  HelpSection section = HelpSection::kNone;
  std::vector<std::pair<std::string, std::string>> forms;  // flag, metavar
  std::string positional_name;
  std::string description;
};

std::vector<HelpEntry> CollectEntries(const std::vector<std::string>& lines) {
  std::vector<HelpEntry> entries;
  HelpSection section = HelpSection::kNone;
  std::size_t entry_indent = 0;
  bool in_entry = false;

  for (const auto& line : lines) {
    if (IsBlank(line)) {
      continue;
    }
    const std::size_t indent = IndentOf(line);
    if (indent == 0) {
      section = ClassifyHeader(line);
      in_entry = false;
      entry_indent = 0;
      continue;
    }
    if (section == HelpSection::kNone) {
      continue;
    }

    const std::string trimmed = Trim(line);
    if (in_entry && indent > entry_indent) {
      auto& description = entries.back().description;
      description += description.empty() ? trimmed : ' ' + trimmed;
      continue;
    }
    if (section == HelpSection::kOptions && trimmed.front() != '-') {
      continue;
    }

    auto [invocation, description] = SplitEntry(trimmed);
    HelpEntry entry;
    entry.section = section;
    entry.description = std::move(description);
    if (section == HelpSection::kOptions) {
      std::size_t start = 0;
      while (start < invocation.size()) {
        auto end = invocation.find(", ", start);
        if (end == std::string::npos) {
          end = invocation.size();
        }
        const std::string form = Trim(invocation.substr(start, end - start));
        const auto space = form.find(' ');
        if (space == std::string::npos) {
          entry.forms.emplace_back(form, std::string{});
        } else {
          entry.forms.emplace_back(form.substr(0, space), Trim(form.substr(space + 1)));
        }
        start = end + 2;
      }
    } else {
      entry.positional_name = invocation;
    }
    entries.push_back(std::move(entry));
    in_entry = true;
    entry_indent = indent;
  }
  return entries;
}

std::optional<nlohmann::json> ParseDefault(const std::string& description, ParameterType type) {
  static const std::regex kDefaultPattern(R"(\(default:\s*([^)]*)\))");
  std::smatch match;
  if (!std::regex_search(description, match, kDefaultPattern)) {
    return std::nullopt;
  }
  const std::string raw = Trim(match[1].str());
  if (raw.empty() || raw == "None") {
    return std::nullopt;
  }
  if (type == ParameterType::kFlag) {
    return nlohmann::json(raw == "True" || raw == "true");
  }
  if (type == ParameterType::kNumber) {
    const auto number = nlohmann::json::parse(raw, nullptr, false);
    if (!number.is_discarded() && number.is_number()) {
      return number;
    }
  }
  return nlohmann::json(raw);
}

std::string DestinationName(const std::string& flag) {
  std::string name = flag;
  name.erase(0, name.find_first_not_of('-'));
  std::replace(name.begin(), name.end(), '-', '_');
  return name;
}

std::optional<Parameter> OptionToParameter(const HelpEntry& entry, const UsageTokens& usage) {
  if (entry.forms.empty()) {
    return std::nullopt;
  }
  auto chosen = entry.forms.front();
  for (const auto& form : entry.forms) {
    if (form.first.rfind("--", 0) == 0) {
      chosen = form;
      break;
    }
  }
  std::string metavar = chosen.second;
  for (const auto& form : entry.forms) {
    if (metavar.empty() && !form.second.empty()) {
      metavar = form.second;
    }
  }

  Parameter parameter;
  parameter.flag = chosen.first;
  parameter.name = DestinationName(chosen.first);
  if (parameter.name.empty() || parameter.name == "help" || parameter.name == "h") {
    return std::nullopt;
  }
  parameter.description = entry.description;

  bool implicit_metavar = false;
  if (metavar.empty()) {
    parameter.type = ParameterType::kFlag;
  } else if (metavar.front() == '{') {
    parameter.type = ParameterType::kString;
    parameter.choices = SplitChoices(metavar);
  } else {
    std::string head = metavar.substr(0, metavar.find(' '));
    head.erase(std::remove_if(head.begin(), head.end(),
                              [](char ch) { return ch == '[' || ch == ']'; }),
               head.end());
    std::transform(head.begin(), head.end(), head.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    parameter.type =
        kNumericMetavars.count(head) != 0 ? ParameterType::kNumber : ParameterType::kString;
    std::string dest = parameter.name;
    std::transform(dest.begin(), dest.end(), dest.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    implicit_metavar = head == dest;
  }

  for (const auto& form : entry.forms) {
    if (usage.mandatory.count(form.first) != 0) {
      parameter.required = true;
    }
  }
  parameter.default_value = ParseDefault(entry.description, parameter.type);
  // argparse prints the upper-cased dest when no metavar was given, which says
  // nothing about the type; a numeric default is the only evidence left.
  if (implicit_metavar && parameter.type == ParameterType::kString && parameter.default_value) {
    auto number = ParseDefault(entry.description, ParameterType::kNumber);
    if (number && number->is_number()) {
      parameter.type = ParameterType::kNumber;
      parameter.default_value = std::move(number);
    }
  }
  if (parameter.type == ParameterType::kFlag && !parameter.default_value) {
    parameter.default_value = false;
  }
  return parameter;
}

Parameter PositionalToParameter(const HelpEntry& entry, const UsageTokens& usage) {
  Parameter parameter;
  parameter.positional = true;
  parameter.description = entry.description;
  if (!entry.positional_name.empty() && entry.positional_name.front() == '{') {
    parameter.name = "choice";
    parameter.type = ParameterType::kString;
    parameter.choices = SplitChoices(entry.positional_name);
  } else {
    parameter.name = entry.positional_name;
  }
  // nargs='+' prints as "files [files ...]", so an unbracketed occurrence wins.
  parameter.required = usage.mandatory.count(entry.positional_name) != 0 ||
                       usage.optional.count(entry.positional_name) == 0;
  parameter.default_value = ParseDefault(entry.description, parameter.type);
  return parameter;
}

std::string Excerpt(const std::string& text) {
  const std::string trimmed = Trim(text);
  if (trimmed.size() <= kHelpExcerptBytes) {
    return trimmed;
  }
  return trimmed.substr(0, kHelpExcerptBytes) + "...";
}

std::string RunHelp(const std::string& plugin_name, const std::vector<std::string>& argv,
                    const std::string& working_directory, const IntrospectionOptions& options) {
  platform::SubprocessOptions subprocess_options;
  subprocess_options.timeout = options.timeout;
  subprocess_options.working_directory = working_directory;

  platform::SubprocessResult result;
  try {
    result = platform::RunSubprocess(argv, subprocess_options);
  } catch (const platform::SubprocessError& ex) {
    throw IntrospectionError("Plugin '" + plugin_name + "': " + ex.what());
  }

  const std::string command_line = platform::DescribeCommandLine(argv);
  if (result.timed_out) {
    throw IntrospectionError("Plugin '" + plugin_name + "': '" + command_line +
                             "' timed out after " + std::to_string(options.timeout.count()) +
                             " ms");
  }
  const std::string& text =
      Trim(result.stdout_output).empty() ? result.stderr_output : result.stdout_output;
  if (result.exit_code != 0 && ToLower(text).find("usage:") == std::string::npos) {
    throw IntrospectionError("Plugin '" + plugin_name + "': '" + command_line +
                             "' exited with code " + std::to_string(result.exit_code) + ": " +
                             Excerpt(result.stderr_output));
  }
  LogDebug("Introspected '" + command_line + "' (" + std::to_string(text.size()) + " bytes)");
  return text;
}

}  // namespace

PluginCandidate MakeCandidate(const std::string& name, const std::string& entry_point) {
  namespace fs = std::filesystem;
  std::error_code ec;
  const fs::path path(entry_point);
  if (!fs::is_regular_file(path, ec)) {
    throw IntrospectionError("Plugin '" + name + "': entry point " + entry_point +
                             " does not exist");
  }

  PluginCandidate candidate;
  candidate.name = name;
  const fs::path absolute = fs::absolute(path, ec);
  candidate.entry_point = ec ? path.string() : absolute.lexically_normal().string();

  if (::access(candidate.entry_point.c_str(), X_OK) == 0) {
    return candidate;
  }
  const std::string extension = path.extension().string();
  if (extension == ".py") {
    candidate.interpreter = "python3";
  } else if (extension == ".sh") {
    candidate.interpreter = "sh";
  } else {
    throw IntrospectionError("Plugin '" + name + "': " + entry_point + " is not executable");
  }
  return candidate;
}

Plugin Introspect(const PluginCandidate& candidate, const IntrospectionOptions& options) {
  Plugin plugin;
  plugin.name = candidate.name;
  plugin.executable_path = candidate.entry_point;
  plugin.interpreter = candidate.interpreter;

  const std::string working_directory =
      std::filesystem::path(plugin.executable_path).parent_path().string();
  const auto prefix = plugin.LaunchPrefix();

  auto argv = prefix;
  argv.push_back("--help");
  const std::string top_help = RunHelp(plugin.name, argv, working_directory, options);
  plugin.description = ParseProgramDescription(top_help);

  const auto declared = ParseCommandListing(top_help);
  if (declared.empty()) {
    throw IntrospectionError("Plugin '" + plugin.name +
                             "' does not declare any commands in its --help output");
  }

  std::set<std::string> seen;
  for (const auto& entry : declared) {
    if (!seen.insert(entry.name).second) {
      throw IntrospectionError("Plugin '" + plugin.name + "' declares command '" + entry.name +
                               "' more than once");
    }
    argv = prefix;
    argv.push_back(entry.name);
    argv.push_back("--help");
    Command command;
    command.name = entry.name;
    command.description = entry.description;
    command.parameters =
        ParseCommandParameters(RunHelp(plugin.name, argv, working_directory, options));
    plugin.commands.push_back(std::move(command));
  }
  return plugin;
}

Plugin Introspect(const std::string& executable_path, const IntrospectionOptions& options) {
  const std::filesystem::path path(executable_path);
  std::string name = path.stem().string();
  if ((name == "cli" || name == "main") && path.has_parent_path()) {
    name = path.parent_path().filename().string();
  }
  return Introspect(MakeCandidate(name, executable_path), options);
}

std::vector<DeclaredCommand> ParseCommandListing(const std::string& help_text) {
  const auto lines = SplitLines(help_text);
  std::vector<DeclaredCommand> commands;

  // The sub-command group is the brace token outside any [...] in the usage line.
  for (const auto& token : TokenizeUsage(ExtractUsage(lines)).mandatory) {
    if (token.front() != '{') {
      continue;
    }
    for (const auto& choice : SplitChoices(token)) {
      if (IsCommandToken(choice)) {
        commands.push_back({choice, {}});
      }
    }
    break;
  }

  if (commands.empty()) {
    bool in_section = false;
    std::size_t entry_indent = 0;
    for (const auto& line : lines) {
      if (IndentOf(line) == 0 && !IsBlank(line)) {
        const std::string header = ToLower(Trim(line));
        in_section = header == "available commands:" || header == "commands:" ||
                     header == "subcommands:";
        entry_indent = 0;
        continue;
      }
      if (!in_section) {
        continue;
      }
      if (IsBlank(line)) {
        in_section = commands.empty();
        continue;
      }
      const std::size_t indent = IndentOf(line);
      if (entry_indent != 0 && indent > entry_indent) {
        continue;
      }
      auto [name, description] = SplitEntry(Trim(line));
      if (IsCommandToken(name)) {
        entry_indent = indent;
        commands.push_back({name, description});
      }
    }
    return commands;
  }

  std::map<std::string, std::string> descriptions;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (IndentOf(lines[i]) == 0) {
      continue;
    }
    auto [name, description] = SplitEntry(Trim(lines[i]));
    if (descriptions.count(name) != 0 && !descriptions[name].empty()) {
      continue;
    }
    if (description.empty() && i + 1 < lines.size() &&
        IndentOf(lines[i + 1]) > IndentOf(lines[i]) && !IsBlank(lines[i + 1])) {
      description = Trim(lines[i + 1]);
    }
    descriptions[name] = description;
  }
  for (auto& command : commands) {
    if (const auto it = descriptions.find(command.name); it != descriptions.end()) {
      command.description = it->second;
    }
  }
  return commands;
}

std::vector<Parameter> ParseCommandParameters(const std::string& help_text) {
  const auto lines = SplitLines(help_text);
  const UsageTokens usage = TokenizeUsage(ExtractUsage(lines));

  std::vector<Parameter> parameters;
  std::set<std::string> names;
  for (const auto& entry : CollectEntries(lines)) {
    std::optional<Parameter> parameter;
    if (entry.section == HelpSection::kOptions) {
      parameter = OptionToParameter(entry, usage);
    } else if (!entry.positional_name.empty()) {
      parameter = PositionalToParameter(entry, usage);
    }
    if (parameter && names.insert(parameter->name).second) {
      parameters.push_back(std::move(*parameter));
    }
  }
  return parameters;
}

std::string ParseProgramDescription(const std::string& help_text) {
  const auto lines = SplitLines(help_text);
  std::size_t i = 0;
  bool seen_usage = false;
  for (; i < lines.size(); ++i) {
    if (ToLower(Trim(lines[i])).rfind("usage:", 0) == 0) {
      seen_usage = true;
    } else if (seen_usage && IsBlank(lines[i])) {
      break;
    }
  }
  if (!seen_usage) {
    i = 0;
  }

  std::string description;
  for (; i < lines.size(); ++i) {
    if (IsBlank(lines[i])) {
      if (!description.empty()) {
        break;
      }
      continue;
    }
    const std::string trimmed = Trim(lines[i]);
    if (IndentOf(lines[i]) == 0 && trimmed.back() == ':') {
      break;
    }
    description += description.empty() ? trimmed : ' ' + trimmed;
  }
  return description;
}

}  // namespace gateway
