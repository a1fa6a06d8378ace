#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/wait.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace stubgate {
namespace {

using ::testing::HasSubstr;

std::string LoadFile(const std::filesystem::path &path) {
  std::ifstream stream(path);
  return std::string((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
}

std::filesystem::path ExecutableUnderTest() {
  return std::filesystem::current_path() / "stubgate";
}

int ExitCode(const std::string &command) {
  return WEXITSTATUS(std::system(command.c_str()));
}

std::string HookEvent(const std::string &tool,
                      const std::filesystem::path &file) {
  return R"({"session_id":"s1","hook_event_name":"PostToolUse","tool_name":")" +
         tool + R"(","tool_input":{"file_path":")" + file.string() +
         R"(","content":"ignored"}})";
}

class CliIntegrationTest : public ::testing::Test {
protected:
  void SetUp() override {
    cli_ = ExecutableUnderTest();
    ASSERT_TRUE(std::filesystem::exists(cli_))
        << "Expected CLI executable at " << cli_;
  }

  // Pipes `event` into the hook and returns its exit status; stdout lands in
  // output.json. Linting is off so results do not depend on installed tools.
  int RunHook(const std::string &event, const std::string &extra_flags = "") {
    const auto event_path = project_.AddFile("event.json", event);
    const std::string command = cli_.string() + " --no-lint --hook-dir " +
                                (project_.root() / "hooks").string() + " " +
                                extra_flags + " < " + event_path.string() +
                                " > " + output_path().string() + " 2> " +
                                (project_.root() / "stderr.log").string();
    return ExitCode(command);
  }

  std::filesystem::path output_path() const {
    return project_.root() / "output.json";
  }

  test::TemporaryProject project_;
  std::filesystem::path cli_;
};

TEST_F(CliIntegrationTest, ReportsStubsForEditedFile) {
  const auto file =
      project_.AddFile("src/service.py", "def handle():\n    pass\n");

  ASSERT_EQ(0, RunHook(HookEvent("Write", file)));

  const auto output = LoadFile(output_path());
  EXPECT_EQ(0u, output.find("{\"hookSpecificOutput\":{\"hookEventName\":"
                            "\"PostToolUse\",\"additionalContext\":\""));
  EXPECT_THAT(output, HasSubstr("STUB PATTERNS DETECTED in " + file.string()));
  EXPECT_THAT(output, HasSubstr("bare pass statement"));
}

TEST_F(CliIntegrationTest, ConfirmsCleanFile) {
  const auto file = project_.AddFile(
      "src/lib.rs", "pub fn add(a: i32, b: i32) -> i32 {\n    a + b\n}\n");

  ASSERT_EQ(0, RunHook(HookEvent("Edit", file)));

  EXPECT_THAT(LoadFile(output_path()),
              HasSubstr("no stub patterns or linter issues detected."));
}

TEST_F(CliIntegrationTest, SilentForIgnoredRequests) {
  const auto markdown = project_.AddFile("README.md", "TODO\n");
  const auto own_file = project_.AddFile("hooks/gate.py", "# TODO\n");

  ASSERT_EQ(0, RunHook(HookEvent("Write", markdown)));
  EXPECT_TRUE(LoadFile(output_path()).empty());

  ASSERT_EQ(0, RunHook(HookEvent("Bash", project_.root() / "x.py")));
  EXPECT_TRUE(LoadFile(output_path()).empty());

  ASSERT_EQ(0, RunHook(HookEvent("Write", own_file)));
  EXPECT_TRUE(LoadFile(output_path()).empty());

  ASSERT_EQ(0, RunHook("{\"tool_name\": "));
  EXPECT_TRUE(LoadFile(output_path()).empty());
}

TEST_F(CliIntegrationTest, ConfigurationErrorsStillExitZero) {
  const auto file = project_.AddFile("src/app.go", "package app\n");

  ASSERT_EQ(0, RunHook(HookEvent("Write", file), "--max-lint-lines zero"));

  EXPECT_TRUE(LoadFile(output_path()).empty());
  EXPECT_THAT(LoadFile(project_.root() / "stderr.log"),
              HasSubstr("stubgate: error:"));
}

TEST_F(CliIntegrationTest, CheckModePrintsAdvisory) {
  const auto file = project_.AddFile("web/app.ts", "// FIXME: wire api\n");
  const std::string command = cli_.string() + " --no-lint --check " +
                              file.string() + " > " + output_path().string();

  ASSERT_EQ(0, ExitCode(command));

  EXPECT_THAT(LoadFile(output_path()),
              HasSubstr("Line 1: FIXME marker - `// FIXME: wire api`"));
}

} // namespace
} // namespace stubgate
