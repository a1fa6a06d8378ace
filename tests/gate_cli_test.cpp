#include <stubgate/gate_cli.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace stubgate {
namespace {

using ::testing::HasSubstr;

// Clears STUBGATE_CONFIG for the duration of a test.
class ScopedConfigEnvironment {
public:
  ScopedConfigEnvironment() { ::unsetenv("STUBGATE_CONFIG"); }
  explicit ScopedConfigEnvironment(const std::filesystem::path &path) {
    ::setenv("STUBGATE_CONFIG", path.c_str(), 1);
  }
  ~ScopedConfigEnvironment() { ::unsetenv("STUBGATE_CONFIG"); }
};

TEST(ParseGateArgumentsTest, ParsesFlagsAndValues) {
  const std::vector<std::string> args = {"--config",
                                         "gate.yml",
                                         "--hook-dir",
                                         "/home/dev/.hooks",
                                         "--max-lint-lines",
                                         "25",
                                         "--disable-toolchain",
                                         "eslint,go-vet",
                                         "--no-stub-scan",
                                         "--log-level",
                                         "info"};

  const auto options = ParseGateArguments(args);

  ASSERT_TRUE(options.config_file);
  EXPECT_EQ(options.config_file->generic_string(), "gate.yml");
  ASSERT_TRUE(options.hook_directory);
  EXPECT_EQ(options.hook_directory->generic_string(), "/home/dev/.hooks");
  EXPECT_EQ(options.max_lint_lines, std::optional<std::size_t>(25));
  EXPECT_EQ(options.disabled_toolchains,
            (std::vector<std::string>{"eslint", "go-vet"}));
  EXPECT_EQ(options.enable_stub_scan, std::optional<bool>(false));
  EXPECT_FALSE(options.enable_lint.has_value());
  EXPECT_EQ(options.log_level, std::optional<LogLevel>(LogLevel::kInfo));
  EXPECT_FALSE(options.check_file.has_value());
}

TEST(ParseGateArgumentsTest, ShortcutsAndCheckMode) {
  const auto options =
      ParseGateArguments({"--check", "src/app.py", "--no-lint", "--debug"});

  ASSERT_TRUE(options.check_file);
  EXPECT_EQ(options.check_file->generic_string(), "src/app.py");
  EXPECT_EQ(options.enable_lint, std::optional<bool>(false));
  EXPECT_EQ(options.log_level, std::optional<LogLevel>(LogLevel::kDebug));
  EXPECT_EQ(ParseGateArguments({"--verbose"}).log_level,
            std::optional<LogLevel>(LogLevel::kInfo));
}

TEST(ParseGateArgumentsTest, RejectsInvalidArguments) {
  EXPECT_THROW(ParseGateArguments({"--bogus"}), std::invalid_argument);
  EXPECT_THROW(ParseGateArguments({"--hook-dir"}), std::invalid_argument);
  EXPECT_THROW(ParseGateArguments({"--max-lint-lines", "0"}),
               std::invalid_argument);
  EXPECT_THROW(ParseGateArguments({"--max-lint-lines", "-4"}),
               std::invalid_argument);
  EXPECT_THROW(ParseGateArguments({"--max-lint-lines", "ten"}),
               std::invalid_argument);
  EXPECT_THROW(ParseGateArguments({"--log-level", "chatty"}),
               std::invalid_argument);
}

TEST(ParseGateArgumentsTest, HelpStopsParsing) {
  const auto options = ParseGateArguments({"--help", "--bogus"});

  EXPECT_TRUE(options.show_help);
}

TEST(ParseConfigFileTest, ReadsYamlWithAliases) {
  test::TemporaryProject project;
  const auto config = project.AddFile("gate.yaml", R"(log-level: debug
hook_directory: /opt/hooks
max_errors: 4
disabled_toolchains:
  - clippy
  - eslint
stub_scan: true
lint: off
)");

  const auto options = ParseConfigFile(config);

  EXPECT_EQ(options.log_level, std::optional<LogLevel>(LogLevel::kDebug));
  ASSERT_TRUE(options.hook_directory);
  EXPECT_EQ(options.hook_directory->generic_string(), "/opt/hooks");
  EXPECT_EQ(options.max_lint_lines, std::optional<std::size_t>(4));
  EXPECT_EQ(options.disabled_toolchains,
            (std::vector<std::string>{"clippy", "eslint"}));
  EXPECT_EQ(options.enable_stub_scan, std::optional<bool>(true));
  EXPECT_EQ(options.enable_lint, std::optional<bool>(false));
}

TEST(ParseConfigFileTest, AcceptsCommaSeparatedToolchains) {
  test::TemporaryProject project;
  const auto config =
      project.AddFile("gate.yml", "disabled_toolchains: go-vet, flake8\n");

  const auto options = ParseConfigFile(config);

  EXPECT_EQ(options.disabled_toolchains,
            (std::vector<std::string>{"go-vet", "flake8"}));
}

TEST(ParseConfigFileTest, RejectsUnknownKeys) {
  test::TemporaryProject project;
  const auto config = project.AddFile("gate.yml", "colour: blue\n");

  try {
    ParseConfigFile(config);
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("Unknown config key: colour"));
    EXPECT_THAT(error.what(), HasSubstr("max_lint_lines"));
  }
}

TEST(ParseConfigFileTest, RejectsBadFilesAndValues) {
  test::TemporaryProject project;

  EXPECT_THROW(ParseConfigFile(project.root() / "missing.yml"),
               std::runtime_error);
  EXPECT_THROW(ParseConfigFile(project.AddFile("gate.json", "{}")),
               std::invalid_argument);
  EXPECT_THROW(ParseConfigFile(project.AddFile("list.yml", "- a\n- b\n")),
               std::invalid_argument);
  EXPECT_THROW(ParseConfigFile(project.AddFile("bool.yml", "lint: maybe\n")),
               std::invalid_argument);
  EXPECT_THROW(
      ParseConfigFile(project.AddFile("zero.yml", "max_lint_lines: 0\n")),
      std::invalid_argument);
}

TEST(MergeOptionsTest, CommandLineWinsOverConfig) {
  GateOptions config;
  config.hook_directory = "/from/config";
  config.max_lint_lines = 4;
  config.enable_lint = false;
  config.disabled_toolchains = {"clippy"};
  GateOptions cli;
  cli.max_lint_lines = 7;

  const auto merged = MergeOptions(config, cli);

  EXPECT_EQ(merged.hook_directory->generic_string(), "/from/config");
  EXPECT_EQ(merged.max_lint_lines, std::optional<std::size_t>(7));
  EXPECT_EQ(merged.enable_lint, std::optional<bool>(false));
  EXPECT_EQ(merged.disabled_toolchains, (std::vector<std::string>{"clippy"}));
}

TEST(ResolveGateOptionsTest, LoadsConfigFromEnvironment) {
  test::TemporaryProject project;
  const auto config = project.AddFile("env.yml", "max_lint_lines: 2\n");
  ScopedConfigEnvironment environment(config);

  const auto options = ResolveGateOptions(ParseGateArguments({}));

  EXPECT_EQ(options.max_lint_lines, std::optional<std::size_t>(2));
}

TEST(ResolveGateOptionsTest, ExplicitConfigOverridesEnvironment) {
  test::TemporaryProject project;
  const auto from_env = project.AddFile("env.yml", "max_lint_lines: 2\n");
  const auto explicit_config =
      project.AddFile("explicit.yml", "max_lint_lines: 6\n");
  ScopedConfigEnvironment environment(from_env);

  const auto options = ResolveGateOptions(
      ParseGateArguments({"--config", explicit_config.string()}));

  EXPECT_EQ(options.max_lint_lines, std::optional<std::size_t>(6));
}

TEST(BuildGateSettingsTest, DefaultsHookDirectoryToExecutableLocation) {
  const auto settings =
      BuildGateSettings(GateOptions{}, "/home/dev/.hooks/stubgate");

  EXPECT_EQ(settings.hook_directory.generic_string(), "/home/dev/.hooks");
  EXPECT_EQ(10u, settings.max_lint_lines);
  EXPECT_TRUE(settings.enable_stub_scan);
  EXPECT_TRUE(settings.enable_lint);
}

TEST(BuildGateTest, RejectsUnknownDisabledToolchain) {
  GateOptions options;
  options.disabled_toolchains = {"rubocop"};

  EXPECT_THROW(BuildGate(options, "/opt/stubgate", nullptr),
               std::invalid_argument);
}

TEST(RunHookTest, MalformedInputProducesNoOutput) {
  ScopedConfigEnvironment environment;
  std::istringstream input("this is not json");
  std::ostringstream output;
  std::ostringstream log;

  EXPECT_EQ(0, RunHook(GateOptions{}, "/opt/stubgate", input, output, log));
  EXPECT_TRUE(output.str().empty());
}

std::string WriteEvent(const std::string &tool,
                       const std::filesystem::path &file) {
  return R"({"tool_name":")" + tool + R"(","tool_input":{"file_path":")" +
         file.string() + R"("}})";
}

TEST(RunHookTest, SkippedRequestProducesNoOutput) {
  test::TemporaryProject project;
  const auto file = project.AddFile("notes.md", "TODO\n");
  std::istringstream input(WriteEvent("Write", file));
  std::ostringstream output;
  std::ostringstream log;

  EXPECT_EQ(0, RunHook(GateOptions{}, "/opt/stubgate", input, output, log));
  EXPECT_TRUE(output.str().empty());
}

TEST(RunHookTest, WritesHookResponseForStubs) {
  test::TemporaryProject project;
  const auto file = project.AddFile("pkg/mod.py", "def f():\n    pass\n");
  std::istringstream input(WriteEvent("Edit", file));
  std::ostringstream output;
  std::ostringstream log;
  GateOptions options;
  options.enable_lint = false;

  EXPECT_EQ(0, RunHook(options, "/opt/stubgate", input, output, log));

  const auto response = output.str();
  EXPECT_EQ(0u, response.find(R"({"hookSpecificOutput":)"
                               R"({"hookEventName":"PostToolUse",)"));
  EXPECT_THAT(response,
              HasSubstr(R"(Line 2: bare pass statement - `pass`\n)"));
  EXPECT_EQ('\n', response.back());
}

TEST(RunCheckTest, PrintsAdvisoryText) {
  test::TemporaryProject project;
  const auto file = project.AddFile("lib.rs", "fn later() {}\n");
  GateOptions options;
  options.check_file = file;
  options.enable_lint = false;
  std::ostringstream output;
  std::ostringstream log;

  EXPECT_EQ(0, RunCheck(options, "/opt/stubgate", output, log));
  EXPECT_THAT(output.str(),
              HasSubstr("Line 1: empty function body - `fn later() {}`"));
}

TEST(RunGateTest, HelpPrintsUsage) {
  std::istringstream input;
  std::ostringstream output;
  std::ostringstream log;

  EXPECT_EQ(0, RunGate({"--help"}, "stubgate", input, output, log));
  EXPECT_THAT(output.str(), HasSubstr("Usage: stubgate"));
}

} // namespace
} // namespace stubgate
