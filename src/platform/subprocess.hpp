#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace platform {

// Raised when the child cannot be started at all (pipe or fork failure).
class SubprocessError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct SubprocessOptions {
  std::chrono::milliseconds timeout{30000};
  std::size_t max_output_bytes = 4 * 1024 * 1024;
  std::string working_directory;
};

struct SubprocessResult {
  int exit_code = -1;
  int term_signal = 0;
  bool timed_out = false;
  bool output_truncated = false;
  std::string stdout_output;
  std::string stderr_output;
  std::chrono::milliseconds elapsed{0};

  bool Succeeded() const { return !timed_out && term_signal == 0 && exit_code == 0; }
};

// Runs argv[0] (resolved through PATH) with stdin from /dev/null and both
// output streams captured. Blocks the calling thread only; concurrent calls
// share no state. A child still running at the deadline is killed with SIGKILL.
SubprocessResult RunSubprocess(const std::vector<std::string>& argv,
                               const SubprocessOptions& options);

std::string DescribeCommandLine(const std::vector<std::string>& argv);

}  // namespace platform
