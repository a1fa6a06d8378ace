#include <stubgate/gate_cli.h>

#include <stubgate/hook_protocol.h>
#include <stubgate/linter_dispatcher.h>
#include <stubgate/text_utils.h>
#include <stubgate/toolchain_registry.h>

#include <unistd.h>

#include <algorithm>
#include <climits>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using stubgate::GateOptions;

void PrintUsage(std::ostream &stream) {
  stream
      << "Usage: stubgate [options] < hook-event.json\n"
      << "       stubgate --check <file> [options]\n\n"
      << "Reads a post-edit hook event on stdin, scans the edited file for\n"
      << "placeholder code, runs the language linter and answers with an\n"
      << "advisory on stdout. The exit status is always 0.\n\n"
      << "Options:\n"
      << "  --check <file>              Check a file directly and print the\n"
      << "                              advisory text\n"
      << "  --config <file>             YAML config file (default: "
         "$STUBGATE_CONFIG)\n"
      << "  --hook-dir <path>           Files under this directory are never\n"
      << "                              checked (default: executable's "
         "directory)\n"
      << "  --max-lint-lines <n>        Linter lines to keep (default: 10)\n"
      << "  --disable-toolchain <list>  Comma-separated toolchains to skip\n"
      << "                              (clippy,flake8,eslint,go-vet)\n"
      << "  --no-stub-scan              Skip the stub pattern scan\n"
      << "  --no-lint                   Skip the linter\n"
      << "  --log-level <level>         Logging verbosity "
         "(error,warn,info,debug)\n"
      << "  --verbose                   Shortcut for --log-level info\n"
      << "  --debug                     Shortcut for --log-level debug\n"
      << "  --help                      Show this message\n";
}

bool ParseBool(const std::string &value) {
  const auto normalized = stubgate::ToLower(stubgate::Trim(value));
  if (normalized == "true" || normalized == "1" || normalized == "yes" ||
      normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" ||
      normalized == "off") {
    return false;
  }
  throw std::invalid_argument("Expected a boolean value, got: " + value);
}

std::size_t ParseLineLimit(const std::string &value, const std::string &name) {
  const auto trimmed = stubgate::Trim(value);
  std::size_t consumed = 0;
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(trimmed, &consumed);
  } catch (const std::exception &) {
    throw std::invalid_argument(name + " must be a positive integer, got: " +
                                value);
  }
  if (consumed != trimmed.size() || parsed == 0 || trimmed.front() == '-') {
    throw std::invalid_argument(name + " must be a positive integer, got: " +
                                value);
  }
  return static_cast<std::size_t>(parsed);
}

void AppendValues(const std::string &raw_values,
                  std::vector<std::string> &target) {
  for (auto &value : stubgate::SplitList(raw_values)) {
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(std::move(value));
    }
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, GateOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level =
        stubgate::ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = stubgate::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = stubgate::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleCheckSelection(const std::vector<std::string> &arguments,
                          std::size_t &index, GateOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--no-stub-scan") {
    options.enable_stub_scan = false;
    return true;
  }
  if (argument == "--no-lint") {
    options.enable_lint = false;
    return true;
  }
  if (argument == "--disable-toolchain") {
    AppendValues(RequireValue(arguments, index, argument),
                 options.disabled_toolchains);
    return true;
  }
  if (argument == "--max-lint-lines") {
    options.max_lint_lines =
        ParseLineLimit(RequireValue(arguments, index, argument), argument);
    return true;
  }
  return false;
}

bool DispatchGateOption(const std::vector<std::string> &arguments,
                        std::size_t &index, GateOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--hook-dir") {
    options.hook_directory = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--check") {
    options.check_file = RequireValue(arguments, index, argument);
    return true;
  }
  return HandleLoggingOption(arguments, index, options) ||
         HandleCheckSelection(arguments, index, options);
}

using ConfigValue = std::variant<std::string, bool, std::vector<std::string>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "disabled_toolchains", "hook_dir", "lint",
      "log_level",           "max_lint_lines", "stub_scan"};
  return keys;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeConfigKey(std::string key) {
  key = stubgate::ToLower(stubgate::Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"hook_directory", "hook_dir"},
      {"max_errors", "max_lint_lines"},
      {"disable_toolchains", "disabled_toolchains"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), key) == supported.end()) {
    ThrowUnknownKey(key);
  }
  return key;
}

std::string ExtractScalar(const YAML::Node &node, const std::string &key) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key +
                                "' must be a scalar value");
  }
  return node.as<std::string>();
}

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      AppendValues(ExtractScalar(child, key), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    AppendValues(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key +
                              "' must be a string or list of strings");
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "disabled_toolchains") {
    return ExtractList(node, key);
  }
  if (key == "stub_scan" || key == "lint") {
    return ConfigValue{ParseBool(ExtractScalar(node, key))};
  }
  return ConfigValue{ExtractScalar(node, key)};
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  const auto root = YAML::LoadFile(path.string());
  if (root.IsNull()) {
    return {};
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeConfigKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, GateOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "log_level") {
      options.log_level = stubgate::ParseLogLevel(std::get<std::string>(value));
    } else if (key == "hook_dir") {
      options.hook_directory = std::get<std::string>(value);
    } else if (key == "max_lint_lines") {
      options.max_lint_lines =
          ParseLineLimit(std::get<std::string>(value), key);
    } else if (key == "disabled_toolchains") {
      options.disabled_toolchains = std::get<std::vector<std::string>>(value);
    } else if (key == "stub_scan") {
      options.enable_stub_scan = std::get<bool>(value);
    } else if (key == "lint") {
      options.enable_lint = std::get<bool>(value);
    } else {
      ThrowUnknownKey(key);
    }
  }
}

std::string ReadAll(std::istream &input) {
  return std::string(std::istreambuf_iterator<char>(input),
                     std::istreambuf_iterator<char>());
}

stubgate::LoggingConfig BuildLoggingConfig(const GateOptions &options) {
  stubgate::LoggingConfig logging;
  logging.level = options.log_level.value_or(stubgate::LogLevel::kWarn);
  return logging;
}

} // namespace

namespace stubgate {

GateOptions ParseGateArguments(const std::vector<std::string> &arguments) {
  GateOptions options;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchGateOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }

  return options;
}

GateOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  GateOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

GateOptions MergeOptions(const GateOptions &config_options,
                         const GateOptions &cli_options) {
  GateOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.hook_directory, cli_options.hook_directory);
  override_value(merged.check_file, cli_options.check_file);
  override_value(merged.log_level, cli_options.log_level);
  override_value(merged.max_lint_lines, cli_options.max_lint_lines);
  override_value(merged.enable_stub_scan, cli_options.enable_stub_scan);
  override_value(merged.enable_lint, cli_options.enable_lint);

  if (!cli_options.disabled_toolchains.empty()) {
    merged.disabled_toolchains = cli_options.disabled_toolchains;
  }
  merged.show_help = cli_options.show_help;
  return merged;
}

GateOptions ResolveGateOptions(const GateOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  GateOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  } else if (const char *from_env = std::getenv("STUBGATE_CONFIG");
             from_env != nullptr && *from_env != '\0') {
    config_options = ParseConfigFile(from_env);
  }
  return MergeOptions(config_options, cli_options);
}

GateSettings BuildGateSettings(const GateOptions &options,
                               const std::filesystem::path &executable) {
  GateSettings settings;
  settings.hook_directory =
      options.hook_directory.value_or(executable.parent_path());
  settings.max_lint_lines =
      options.max_lint_lines.value_or(kDefaultMaxLintLines);
  settings.enable_stub_scan = options.enable_stub_scan.value_or(true);
  settings.enable_lint = options.enable_lint.value_or(true);
  return settings;
}

PostEditGate BuildGate(const GateOptions &options,
                       const std::filesystem::path &executable,
                       std::shared_ptr<Logger> logger) {
  PostEditGateBuilder builder;
  builder.WithLogger(std::move(logger))
      .WithSettings(BuildGateSettings(options, executable))
      .WithToolchainRegistry(
          GlobalToolchainRegistry().Without(options.disabled_toolchains));
  return builder.Build();
}

std::filesystem::path CurrentExecutablePath(const char *argv0) {
  char buffer[PATH_MAX];
  const ssize_t length =
      ::readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
  if (length > 0) {
    return std::filesystem::path(
        std::string(buffer, static_cast<std::size_t>(length)));
  }
  if (argv0 == nullptr || *argv0 == '\0') {
    return {};
  }
  std::error_code error;
  auto resolved = std::filesystem::weakly_canonical(argv0, error);
  return error ? std::filesystem::path(argv0) : resolved;
}

int RunHook(const GateOptions &options, const std::filesystem::path &executable,
            std::istream &input, std::ostream &output, std::ostream &log) {
  auto logger = MakeLogger(BuildLoggingConfig(options), log);
  const auto request = ParseHookRequest(ReadAll(input));
  if (!request) {
    logger->Log(LogLevel::kDebug, "hook.malformed_input");
    return 0;
  }

  auto gate = BuildGate(options, executable, logger);
  const auto result = gate.Run(*request);
  if (result) {
    output << RenderHookResponse(result->advisory) << "\n";
  }
  return 0;
}

int RunCheck(const GateOptions &options,
             const std::filesystem::path &executable, std::ostream &output,
             std::ostream &log) {
  if (!options.check_file) {
    throw std::invalid_argument("--check requires a file");
  }
  auto logger = MakeLogger(BuildLoggingConfig(options), log);
  auto gate = BuildGate(options, executable, logger);
  const auto result = gate.Check(*options.check_file);
  output << result.advisory.Text() << "\n";
  return 0;
}

int RunGate(const std::vector<std::string> &arguments, const char *argv0,
            std::istream &input, std::ostream &output, std::ostream &log) {
  const auto cli_options = ParseGateArguments(arguments);
  if (cli_options.show_help) {
    PrintUsage(output);
    return 0;
  }

  const auto options = ResolveGateOptions(cli_options);
  const auto executable = CurrentExecutablePath(argv0);
  if (options.check_file) {
    return RunCheck(options, executable, output, log);
  }
  return RunHook(options, executable, input, output, log);
}

} // namespace stubgate
