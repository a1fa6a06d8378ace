#include <stubgate/process_runner.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <thread>

namespace stubgate {
namespace {

void AppendLimited(std::string &destination, const char *source,
                   ssize_t count, std::size_t limit) {
  if (count <= 0 || destination.size() >= limit) {
    return;
  }
  const auto take = std::min<std::size_t>(static_cast<std::size_t>(count),
                                          limit - destination.size());
  destination.append(source, take);
}

bool IsExecutableFile(const std::filesystem::path &path) {
  std::error_code error;
  return std::filesystem::is_regular_file(path, error) &&
         ::access(path.c_str(), X_OK) == 0;
}

void ClosePipe(int (&fds)[2]) {
  ::close(fds[0]);
  ::close(fds[1]);
}

[[noreturn]] void ExecChild(const ProcessSpec &spec,
                            const std::filesystem::path &executable,
                            int (&out_pipe)[2], int (&err_pipe)[2]) {
  ::setsid();
  ::dup2(out_pipe[1], STDOUT_FILENO);
  ::dup2(err_pipe[1], STDERR_FILENO);
  ClosePipe(out_pipe);
  ClosePipe(err_pipe);

  const int null_input = ::open("/dev/null", O_RDONLY);
  if (null_input >= 0) {
    ::dup2(null_input, STDIN_FILENO);
    ::close(null_input);
  }

  if (!spec.working_directory.empty() &&
      ::chdir(spec.working_directory.c_str()) != 0) {
    _exit(126);
  }

  std::vector<std::string> arguments = spec.argv;
  std::vector<char *> argv;
  argv.reserve(arguments.size() + 1);
  for (auto &argument : arguments) {
    argv.push_back(argument.data());
  }
  argv.push_back(nullptr);

  ::execv(executable.c_str(), argv.data());
  _exit(127);
}

int DecodeStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

std::filesystem::path LocateExecutable(const std::string &name) {
  if (name.empty()) {
    return {};
  }
  if (name.find('/') != std::string::npos) {
    return IsExecutableFile(name) ? std::filesystem::path(name)
                                  : std::filesystem::path{};
  }

  const char *raw_path = std::getenv("PATH");
  const std::string search_path =
      raw_path != nullptr ? raw_path : "/usr/local/bin:/usr/bin:/bin";
  std::size_t start = 0;
  while (start <= search_path.size()) {
    auto end = search_path.find(':', start);
    if (end == std::string::npos) {
      end = search_path.size();
    }
    const auto entry = search_path.substr(start, end - start);
    const std::filesystem::path directory = entry.empty() ? "." : entry;
    const auto candidate = directory / name;
    if (IsExecutableFile(candidate)) {
      return candidate;
    }
    start = end + 1;
  }
  return {};
}

ProcessResult PosixProcessRunner::Run(const ProcessSpec &spec) {
  ProcessResult result;
  if (spec.argv.empty()) {
    result.launch_error = LaunchError::kSpawnFailed;
    result.error_message = "empty command";
    return result;
  }

  const auto executable = LocateExecutable(spec.argv.front());
  if (executable.empty()) {
    result.launch_error = LaunchError::kNotFound;
    result.error_message = spec.argv.front() + ": not found on PATH";
    return result;
  }

  int out_pipe[2];
  int err_pipe[2];
  if (::pipe(out_pipe) != 0) {
    result.launch_error = LaunchError::kSpawnFailed;
    result.error_message = std::strerror(errno);
    return result;
  }
  if (::pipe(err_pipe) != 0) {
    result.launch_error = LaunchError::kSpawnFailed;
    result.error_message = std::strerror(errno);
    ClosePipe(out_pipe);
    return result;
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    result.launch_error = LaunchError::kSpawnFailed;
    result.error_message = std::strerror(errno);
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    return result;
  }
  if (pid == 0) {
    ExecChild(spec, executable, out_pipe, err_pipe);
  }

  ::close(out_pipe[1]);
  ::close(err_pipe[1]);

  const auto deadline = std::chrono::steady_clock::now() + spec.timeout;
  const auto remaining_ms = [&]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               deadline - std::chrono::steady_clock::now())
        .count();
  };

  pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
  std::string *sinks[2] = {&result.stdout_text, &result.stderr_text};
  char buffer[4096];
  int open_streams = 2;
  while (open_streams > 0 && !result.timed_out) {
    const auto wait_ms = remaining_ms();
    if (wait_ms <= 0) {
      result.timed_out = true;
      break;
    }
    const int ready =
        ::poll(fds, 2, static_cast<int>(std::min<long long>(wait_ms, 100)));
    if (ready < 0 && errno != EINTR) {
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 ||
          (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      const ssize_t count = ::read(fds[i].fd, buffer, sizeof(buffer));
      if (count > 0) {
        AppendLimited(*sinks[i], buffer, count, spec.max_output_bytes);
        continue;
      }
      if (count == 0 || errno != EINTR) {
        ::close(fds[i].fd);
        fds[i].fd = -1;
        --open_streams;
      }
    }
  }

  int status = 0;
  bool reaped = false;
  while (!result.timed_out) {
    const pid_t waited = ::waitpid(pid, &status, WNOHANG);
    if (waited == pid || (waited < 0 && errno != EINTR)) {
      reaped = waited == pid;
      break;
    }
    if (remaining_ms() <= 0) {
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  if (result.timed_out) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    reaped = ::waitpid(pid, &status, 0) == pid;
  }
  for (auto &descriptor : fds) {
    if (descriptor.fd >= 0) {
      ::close(descriptor.fd);
    }
  }

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (reaped) {
    result.exit_code = DecodeStatus(status);
  } else {
    result.exit_code = -1;
  }
  return result;
}

} // namespace stubgate
