#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace test_support {

inline void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

// Unique scratch directory, removed with everything in it on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& prefix);
  ~TempDir();

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

struct FixtureOption {
  std::string flag;     // "--param"
  std::string metavar;  // "PARAM"; empty for a switch
  std::string help;
  bool required = false;
};

struct FixtureCommand {
  std::string name;
  std::string help;
  std::vector<FixtureOption> options;
  // Shell run for the command. Each option is parsed into a variable named
  // after it (--dry-run -> $dry_run) and "$ARGS" holds the raw arguments.
  std::string body;
};

// Writes an argparse-lookalike POSIX sh plugin at <root>/<plugin>/cli and
// returns its path.
std::filesystem::path WritePlugin(const std::filesystem::path& root, const std::string& plugin,
                                  const std::vector<FixtureCommand>& commands,
                                  const std::string& description = "Fixture plugin");

// Writes an arbitrary file and optionally marks it executable.
std::filesystem::path WriteFile(const std::filesystem::path& path, const std::string& content,
                                bool executable);

// JSON line a fixture body prints: {"result": "<text>"}. Text must not need escaping.
std::string EchoResult(const std::string& text);

}  // namespace test_support
