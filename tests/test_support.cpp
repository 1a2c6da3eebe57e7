#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace test_support {
namespace {

std::string DestinationName(const std::string& flag) {
  std::string name = flag.substr(flag.find_first_not_of('-'));
  for (auto& ch : name) {
    if (ch == '-') {
      ch = '_';
    }
  }
  return name;
}

std::string JoinNames(const std::vector<FixtureCommand>& commands) {
  std::string joined;
  for (const auto& command : commands) {
    if (!joined.empty()) {
      joined += ',';
    }
    joined += command.name;
  }
  return joined;
}

std::string Pad(const std::string& text, std::size_t width) {
  return text.size() >= width ? text + "  " : text + std::string(width - text.size(), ' ');
}

std::string TopLevelHelp(const std::vector<FixtureCommand>& commands,
                         const std::string& description) {
  const std::string group = "{" + JoinNames(commands) + "}";
  std::ostringstream help;
  help << "usage: cli [-h] " << group << " ...\n\n"
       << description << "\n\n"
       << "positional arguments:\n"
       << "  " << Pad(group, 22) << "Available commands\n";
  for (const auto& command : commands) {
    help << "    " << Pad(command.name, 20) << command.help << "\n";
  }
  help << "\noptions:\n"
       << "  " << Pad("-h, --help", 22) << "show this help message and exit\n";
  return help.str();
}

std::string CommandHelp(const FixtureCommand& command) {
  std::ostringstream usage;
  usage << "usage: cli " << command.name << " [-h]";
  for (const auto& option : command.options) {
    std::string token = option.flag;
    if (!option.metavar.empty()) {
      token += " " + option.metavar;
    }
    usage << ' ' << (option.required ? token : "[" + token + "]");
  }

  std::ostringstream help;
  help << usage.str() << "\n\n"
       << "options:\n"
       << "  " << Pad("-h, --help", 22) << "show this help message and exit\n";
  for (const auto& option : command.options) {
    std::string invocation = option.flag;
    if (!option.metavar.empty()) {
      invocation += " " + option.metavar;
    }
    help << "  " << Pad(invocation, 22) << option.help << "\n";
  }
  return help.str();
}

std::string ParseLoop(const FixtureCommand& command) {
  std::ostringstream loop;
  loop << "    ARGS=\"$*\"\n"
       << "    while [ \"$#\" -gt 0 ]; do\n"
       << "      case \"$1\" in\n";
  for (const auto& option : command.options) {
    const std::string var = DestinationName(option.flag);
    if (option.metavar.empty()) {
      loop << "        " << option.flag << ") " << var << "=1; shift ;;\n";
    } else {
      loop << "        " << option.flag << ") " << var << "=\"$2\"; shift 2 ;;\n";
    }
  }
  loop << "        *) shift ;;\n"
       << "      esac\n"
       << "    done\n";
  return loop.str();
}

}  // namespace

TempDir::TempDir(const std::string& prefix) {
  static std::atomic<unsigned> counter{0};
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  path_ = std::filesystem::temp_directory_path() /
          (prefix + "-" + std::to_string(::getpid()) + "-" + std::to_string(stamp) + "-" +
           std::to_string(counter++));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path WriteFile(const std::filesystem::path& path, const std::string& content,
                                bool executable) {
  std::filesystem::create_directories(path.parent_path());
  {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("Cannot write " + path.string());
    }
    out << content;
  }
  if (executable) {
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read |
                                     std::filesystem::perms::group_exec,
                                 std::filesystem::perm_options::replace);
  }
  return path;
}

std::filesystem::path WritePlugin(const std::filesystem::path& root, const std::string& plugin,
                                  const std::vector<FixtureCommand>& commands,
                                  const std::string& description) {
  std::ostringstream script;
  script << "#!/bin/sh\n"
         << "if [ \"$#\" -eq 0 ] || [ \"$1\" = \"-h\" ] || [ \"$1\" = \"--help\" ]; then\n"
         << "cat <<'__HELP__'\n"
         << TopLevelHelp(commands, description) << "__HELP__\n"
         << "exit 0\n"
         << "fi\n"
         << "command=\"$1\"\n"
         << "shift\n"
         << "case \"$command\" in\n";
  for (const auto& command : commands) {
    script << "  " << command.name << ")\n"
           << "    if [ \"$1\" = \"-h\" ] || [ \"$1\" = \"--help\" ]; then\n"
           << "cat <<'__HELP__'\n"
           << CommandHelp(command) << "__HELP__\n"
           << "      exit 0\n"
           << "    fi\n"
           << ParseLoop(command) << command.body << "\n"
           << "    ;;\n";
  }
  script << "  *)\n"
         << "    echo '{\"error\": \"Unknown command\"}'\n"
         << "    exit 1\n"
         << "    ;;\n"
         << "esac\n";
  return WriteFile(root / plugin / "cli", script.str(), true);
}

std::string EchoResult(const std::string& text) {
  return "    echo '{\"result\": \"" + text + "\"}'";
}

}  // namespace test_support
