#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace stubgate {

struct ProcessSpec {
  std::vector<std::string> argv;
  std::filesystem::path working_directory;
  std::chrono::milliseconds timeout{30000};
  std::size_t max_output_bytes = 256 * 1024;
};

enum class LaunchError { kNone, kNotFound, kSpawnFailed };

struct ProcessResult {
  int exit_code = 0;
  bool timed_out = false;
  LaunchError launch_error = LaunchError::kNone;
  std::string error_message;
  std::string stdout_text;
  std::string stderr_text;
};

class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;
  virtual ProcessResult Run(const ProcessSpec &spec) = 0;
};

class PosixProcessRunner : public ProcessRunner {
public:
  ProcessResult Run(const ProcessSpec &spec) override;
};

// Resolves `name` the way execvp would; names containing '/' are taken as
// paths.
std::filesystem::path LocateExecutable(const std::string &name);

} // namespace stubgate
