#include <stubgate/linter_dispatcher.h>
#include <stubgate/project_root_resolver.h>
#include <stubgate/text_utils.h>

#include <exception>
#include <system_error>
#include <utility>

namespace stubgate {
namespace {

std::vector<std::string> ExpandCommand(const std::vector<std::string> &command,
                                       const std::filesystem::path &file) {
  std::vector<std::string> argv;
  argv.reserve(command.size());
  for (const auto &argument : command) {
    argv.push_back(argument == kFilePlaceholder ? file.string() : argument);
  }
  return argv;
}

std::filesystem::path AbsolutePath(const std::filesystem::path &file) {
  std::error_code error;
  auto absolute = std::filesystem::absolute(file, error);
  return error ? file : absolute;
}

const char *LaunchErrorName(LaunchError error) {
  switch (error) {
  case LaunchError::kNone:
    return "none";
  case LaunchError::kNotFound:
    return "not_found";
  case LaunchError::kSpawnFailed:
    return "spawn_failed";
  }
  return "unknown";
}

} // namespace

std::vector<DiagnosticLine> ExtractDiagnostics(const std::string &output,
                                               const ToolInvocation &invocation,
                                               std::size_t max_errors) {
  std::vector<DiagnosticLine> diagnostics;
  for (const auto &line : SplitLines(output)) {
    if (diagnostics.size() >= max_errors) {
      break;
    }
    if (!PassesFilter(invocation.filter, line) || !IsValidUtf8(line)) {
      continue;
    }
    diagnostics.push_back(DiagnosticLine{
        TruncateUtf8(Trim(line), invocation.line_budget), invocation.tool});
  }
  return diagnostics;
}

LinterDispatcher::LinterDispatcher(ToolchainRegistry registry,
                                   std::shared_ptr<ProcessRunner> runner,
                                   std::shared_ptr<Logger> logger)
    : registry_(std::move(registry)), runner_(std::move(runner)),
      logger_(EnsureLogger(std::move(logger))) {
  if (!runner_) {
    runner_ = std::make_shared<PosixProcessRunner>();
  }
}

std::vector<DiagnosticLine>
LinterDispatcher::Lint(const std::filesystem::path &file,
                       std::size_t max_errors) {
  if (max_errors == 0) {
    return {};
  }

  try {
    const auto *toolchain =
        registry_.FindByExtension(file.extension().string());
    if (toolchain == nullptr) {
      logger_->Log(LogLevel::kDebug, "lint.unsupported",
                   {{"file", file.string()}});
      return {};
    }

    const auto target = AbsolutePath(file);
    std::filesystem::path working_directory = target.parent_path();
    if (!toolchain->root_markers.empty()) {
      const auto root = FindProjectRoot(target, toolchain->root_markers);
      if (!root) {
        logger_->Log(LogLevel::kInfo, "lint.root_missing",
                     {{"toolchain", toolchain->name},
                      {"file", target.string()}});
        return {};
      }
      working_directory = *root;
    }
    logger_->Log(LogLevel::kDebug, "lint.toolchain",
                 {{"toolchain", toolchain->name},
                  {"cwd", working_directory.string()}});

    bool not_installed = false;
    auto diagnostics = RunInvocation(toolchain->primary, target,
                                     working_directory, max_errors,
                                     not_installed);
    if (not_installed && toolchain->fallback) {
      logger_->Log(LogLevel::kInfo, "lint.fallback",
                   {{"toolchain", toolchain->name},
                    {"tool", toolchain->fallback->tool}});
      diagnostics = RunInvocation(*toolchain->fallback, target,
                                  working_directory, max_errors, not_installed);
    }

    logger_->Log(LogLevel::kDebug, "lint.toolchain.complete",
                 {{"toolchain", toolchain->name},
                  {"diagnostics", std::to_string(diagnostics.size())}});
    return diagnostics;
  } catch (const std::exception &ex) {
    logger_->Log(LogLevel::kWarn, "lint.failed",
                 {{"file", file.string()}, {"error", ex.what()}});
    return {};
  }
}

std::vector<DiagnosticLine> LinterDispatcher::RunInvocation(
    const ToolInvocation &invocation, const std::filesystem::path &file,
    const std::filesystem::path &cwd, std::size_t max_errors,
    bool &not_installed) {
  ProcessSpec spec;
  spec.argv = ExpandCommand(invocation.command, file);
  spec.working_directory = cwd;
  spec.timeout = invocation.timeout;

  const auto result = runner_->Run(spec);
  not_installed = result.launch_error == LaunchError::kNotFound;
  if (result.launch_error != LaunchError::kNone) {
    logger_->Log(LogLevel::kInfo, "lint.launch_failed",
                 {{"tool", invocation.tool},
                  {"reason", LaunchErrorName(result.launch_error)},
                  {"error", result.error_message}});
    return {};
  }

  if (result.timed_out) {
    const auto seconds = std::to_string(invocation.timeout.count());
    logger_->Log(LogLevel::kWarn, "lint.timeout",
                 {{"tool", invocation.tool}, {"timeout_s", seconds}});
    return {DiagnosticLine{
        TruncateUtf8(invocation.tool + " timed out after " + seconds + "s",
                     invocation.line_budget),
        invocation.tool}};
  }

  const auto &output = invocation.stream == OutputStream::kStdout
                           ? result.stdout_text
                           : result.stderr_text;
  return ExtractDiagnostics(output, invocation, max_errors);
}

} // namespace stubgate
