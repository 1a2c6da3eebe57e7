#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include "platform/subprocess.hpp"
#include "test_support.hpp"

namespace {

using test_support::Assert;

platform::SubprocessResult RunShell(const std::string& script,
                                    platform::SubprocessOptions options = {}) {
  return platform::RunSubprocess({"sh", "-c", script}, options);
}

void TestCapturesStreams() {
  const auto result = RunShell("echo out; echo err >&2; exit 3");
  Assert(result.exit_code == 3, "Exit code must be reported");
  Assert(!result.Succeeded(), "Non-zero exit is not success");
  Assert(result.stdout_output == "out\n", "stdout must be captured");
  Assert(result.stderr_output == "err\n", "stderr must be captured separately");
  Assert(!result.timed_out && result.term_signal == 0, "Plain exit is neither timeout nor signal");
}

void TestStdinIsEmpty() {
  const auto result = RunShell("cat; echo done");
  Assert(result.Succeeded() && result.stdout_output == "done\n",
         "Child stdin must be at end of file");
}

void TestWorkingDirectory() {
  test_support::TempDir dir("subprocess-cwd");
  test_support::WriteFile(dir.path() / "marker.txt", "here\n", false);
  platform::SubprocessOptions options;
  options.working_directory = dir.path().string();
  const auto result = RunShell("cat marker.txt", options);
  Assert(result.Succeeded() && result.stdout_output == "here\n",
         "Child must run in the requested directory");
}

void TestTruncation() {
  platform::SubprocessOptions options;
  options.max_output_bytes = 1000;
  const auto result = RunShell("i=0; while [ $i -lt 500 ]; do echo 0123456789; i=$((i+1)); done",
                               options);
  Assert(result.Succeeded(), "Truncated child must still run to completion");
  Assert(result.output_truncated, "Oversized output must be flagged");
  Assert(result.stdout_output.size() == 1000, "Output must be capped");
}

void TestTimeoutKillsProcessGroup() {
  platform::SubprocessOptions options;
  options.timeout = std::chrono::milliseconds(200);
  const auto started = std::chrono::steady_clock::now();
  const auto result = RunShell("sleep 5 & sleep 5; wait", options);
  Assert(result.timed_out, "Child must time out");
  Assert(result.term_signal == 9, "Timed out child must be killed with SIGKILL");
  Assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(3),
         "Background children must not hold the pipes open");
}

void TestExecFailure() {
  const auto result =
      platform::RunSubprocess({"/nonexistent/plugin-binary"}, platform::SubprocessOptions{});
  Assert(result.exit_code == 127, "Missing executable must exit 127");

  bool threw = false;
  try {
    platform::RunSubprocess({}, platform::SubprocessOptions{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Assert(threw, "Empty command line must be rejected");
  Assert(platform::DescribeCommandLine({"sh", "my script.sh", "--flag"}) ==
             "sh 'my script.sh' --flag",
         "Arguments with spaces must be quoted");
}

void RunTests() {
  TestCapturesStreams();
  TestStdinIsEmpty();
  TestWorkingDirectory();
  TestTruncation();
  TestTimeoutKillsProcessGroup();
  TestExecFailure();
}

}  // namespace

int main() {
  try {
    RunTests();
  } catch (const std::exception& ex) {
    std::cerr << "Subprocess test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
