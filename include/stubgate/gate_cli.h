#pragma once

#include <stubgate/logging.h>
#include <stubgate/post_edit_gate.h>

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace stubgate {

struct GateOptions {
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> hook_directory;
  std::optional<std::filesystem::path> check_file;
  std::optional<LogLevel> log_level;
  std::optional<std::size_t> max_lint_lines;
  std::optional<bool> enable_stub_scan;
  std::optional<bool> enable_lint;
  std::vector<std::string> disabled_toolchains;
  bool show_help = false;
};

GateOptions ParseGateArguments(const std::vector<std::string> &arguments);
GateOptions ParseConfigFile(const std::filesystem::path &path);
GateOptions MergeOptions(const GateOptions &config_options,
                         const GateOptions &cli_options);
// Loads the config named by --config, or by STUBGATE_CONFIG when the flag is
// absent, and merges the command line over it.
GateOptions ResolveGateOptions(const GateOptions &cli_options);

GateSettings BuildGateSettings(const GateOptions &options,
                               const std::filesystem::path &executable);
PostEditGate BuildGate(const GateOptions &options,
                       const std::filesystem::path &executable,
                       std::shared_ptr<Logger> logger);

std::filesystem::path CurrentExecutablePath(const char *argv0);

int RunHook(const GateOptions &options, const std::filesystem::path &executable,
            std::istream &input, std::ostream &output, std::ostream &log);
int RunCheck(const GateOptions &options,
             const std::filesystem::path &executable, std::ostream &output,
             std::ostream &log);
int RunGate(const std::vector<std::string> &arguments, const char *argv0,
            std::istream &input, std::ostream &output, std::ostream &log);

} // namespace stubgate
