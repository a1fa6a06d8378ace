#pragma once

#include <stubgate/interfaces.h>
#include <stubgate/logging.h>
#include <stubgate/process_runner.h>
#include <stubgate/toolchain_registry.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace stubgate {

constexpr std::size_t kDefaultMaxLintLines = 10;

class LinterDispatcher : public Linter {
public:
  explicit LinterDispatcher(
      ToolchainRegistry registry = GlobalToolchainRegistry(),
      std::shared_ptr<ProcessRunner> runner = nullptr,
      std::shared_ptr<Logger> logger = nullptr);

  std::vector<DiagnosticLine> Lint(const std::filesystem::path &file,
                                   std::size_t max_errors) override;

private:
  std::vector<DiagnosticLine> RunInvocation(const ToolInvocation &invocation,
                                            const std::filesystem::path &file,
                                            const std::filesystem::path &cwd,
                                            std::size_t max_errors,
                                            bool &not_installed);

  ToolchainRegistry registry_;
  std::shared_ptr<ProcessRunner> runner_;
  std::shared_ptr<Logger> logger_;
};

std::vector<DiagnosticLine> ExtractDiagnostics(const std::string &output,
                                               const ToolInvocation &invocation,
                                               std::size_t max_errors);

} // namespace stubgate
