#include "core/subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>

namespace infer_gateway::core {
namespace {

using Clock = std::chrono::steady_clock;

int remaining_ms(const Clock::time_point deadline) noexcept {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  return left > 0 ? static_cast<int>(left) : 0;
}

void kill_and_reap(const pid_t pid) noexcept {
  kill(pid, SIGKILL);
  while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
  }
}

}  // namespace

std::optional<std::string> run_bounded(const std::vector<std::string>& argv,
                                       const std::chrono::milliseconds timeout) noexcept {
  if (argv.empty()) {
    return std::nullopt;
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  int pipe_fds[2]{};
  if (pipe2(pipe_fds, O_CLOEXEC) != 0) {
    return std::nullopt;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    return std::nullopt;
  }

  if (pid == 0) {
    dup2(pipe_fds[1], STDOUT_FILENO);
    const int devnull = open("/dev/null", O_WRONLY);
    if (devnull >= 0) {
      dup2(devnull, STDERR_FILENO);
    }
    execvp(args[0], args.data());
    _exit(127);
  }

  close(pipe_fds[1]);
  const int read_fd = pipe_fds[0];
  const auto deadline = Clock::now() + timeout;

  std::string output;
  char chunk[4096]{};
  bool eof = false;
  while (!eof) {
    pollfd pfd{read_fd, POLLIN, 0};
    const int wait_ms = remaining_ms(deadline);
    if (wait_ms == 0) {
      break;
    }

    const int ready = poll(&pfd, 1, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      break;
    }

    const ssize_t bytes_read = read(read_fd, chunk, sizeof(chunk));
    if (bytes_read > 0) {
      output.append(chunk, static_cast<std::size_t>(bytes_read));
    } else if (bytes_read == 0) {
      eof = true;
    } else if (errno != EINTR && errno != EAGAIN) {
      break;
    }
  }
  close(read_fd);

  if (!eof) {
    kill_and_reap(pid);
    return std::nullopt;
  }

  // stdout is closed; give the child the rest of the budget to exit.
  int status = 0;
  while (true) {
    const pid_t wait_result = waitpid(pid, &status, WNOHANG);
    if (wait_result == pid) {
      break;
    }
    if (wait_result < 0 && errno != EINTR) {
      return std::nullopt;
    }
    if (remaining_ms(deadline) == 0) {
      kill_and_reap(pid);
      return std::nullopt;
    }
    usleep(1000);
  }

  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    return std::nullopt;
  }
  return output;
}

}  // namespace infer_gateway::core
