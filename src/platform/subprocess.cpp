#include "platform/subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <string>

namespace platform {
namespace {

constexpr int kExecFailureExitCode = 127;

class Pipe {
 public:
  Pipe() {
    if (::pipe2(fds_.data(), O_CLOEXEC) != 0) {
      throw SubprocessError(std::string{"pipe() failed: "} + std::strerror(errno));
    }
  }
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  int read_fd() const { return fds_[0]; }
  int write_fd() const { return fds_[1]; }

  void CloseRead() { CloseFd(fds_[0]); }
  void CloseWrite() { CloseFd(fds_[1]); }

 private:
  static void CloseFd(int& fd) {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }

  std::array<int, 2> fds_{-1, -1};
};

void AppendCapped(std::string& buffer, const char* data, std::size_t size, std::size_t cap,
                  bool& truncated) {
  if (buffer.size() >= cap) {
    truncated = true;
    return;
  }
  const std::size_t room = cap - buffer.size();
  if (size > room) {
    truncated = true;
    size = room;
  }
  buffer.append(data, size);
}

[[noreturn]] void ExecChild(const std::vector<std::string>& argv, int stdout_fd, int stderr_fd,
                            const std::string& working_directory) {
  // Own process group so a timeout kill also reaches anything the plugin forked.
  ::setpgid(0, 0);
  const int null_fd = ::open("/dev/null", O_RDONLY);
  if (null_fd >= 0) {
    ::dup2(null_fd, STDIN_FILENO);
    ::close(null_fd);
  }
  ::dup2(stdout_fd, STDOUT_FILENO);
  ::dup2(stderr_fd, STDERR_FILENO);

  if (!working_directory.empty() && ::chdir(working_directory.c_str()) != 0) {
    _exit(kExecFailureExitCode);
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);
  ::execvp(args[0], args.data());
  _exit(kExecFailureExitCode);
}

int WaitForChild(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  return status;
}

}  // namespace

SubprocessResult RunSubprocess(const std::vector<std::string>& argv,
                               const SubprocessOptions& options) {
  if (argv.empty()) {
    throw std::invalid_argument("Subprocess command line must not be empty");
  }

  Pipe stdout_pipe;
  Pipe stderr_pipe;

  const auto started = std::chrono::steady_clock::now();
  const pid_t pid = ::fork();
  if (pid < 0) {
    throw SubprocessError(std::string{"fork() failed: "} + std::strerror(errno));
  }
  if (pid == 0) {
    ExecChild(argv, stdout_pipe.write_fd(), stderr_pipe.write_fd(), options.working_directory);
  }

  stdout_pipe.CloseWrite();
  stderr_pipe.CloseWrite();

  SubprocessResult result;
  std::array<pollfd, 2> fds{};
  fds[0] = {stdout_pipe.read_fd(), POLLIN, 0};
  fds[1] = {stderr_pipe.read_fd(), POLLIN, 0};
  int open_streams = 2;
  const auto deadline = started + options.timeout;
  std::array<char, 4096> chunk{};

  while (open_streams > 0) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                               deadline - std::chrono::steady_clock::now())
                               .count();
    if (remaining <= 0) {
      result.timed_out = true;
      break;
    }

    const int ready = ::poll(fds.data(), fds.size(), static_cast<int>(remaining));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      result.timed_out = true;
      break;
    }

    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      const ssize_t n = ::read(fds[i].fd, chunk.data(), chunk.size());
      if (n > 0) {
        auto& target = (i == 0) ? result.stdout_output : result.stderr_output;
        AppendCapped(target, chunk.data(), static_cast<std::size_t>(n),
                     options.max_output_bytes, result.output_truncated);
      } else if (n == 0 || errno != EINTR) {
        fds[i].fd = -1;
        --open_streams;
      }
    }
  }

  if (result.timed_out) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
  }

  const int status = WaitForChild(pid);
  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (status < 0) {
    result.exit_code = -1;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
    result.exit_code = 128 + result.term_signal;
  }
  return result;
}

std::string DescribeCommandLine(const std::vector<std::string>& argv) {
  std::string line;
  for (const auto& arg : argv) {
    if (!line.empty()) {
      line.push_back(' ');
    }
    if (arg.find_first_of(" \t\"'") != std::string::npos) {
      line += '\'' + arg + '\'';
    } else {
      line += arg;
    }
  }
  return line;
}

}  // namespace platform
