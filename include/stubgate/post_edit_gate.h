#pragma once

#include <stubgate/interfaces.h>
#include <stubgate/logging.h>
#include <stubgate/models.h>
#include <stubgate/toolchain_registry.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stubgate {

const std::vector<std::string> &RecognizedToolNames();
const std::vector<std::string> &RecognizedExtensions();

struct GateSettings {
  std::filesystem::path hook_directory;
  std::size_t max_lint_lines = 10;
  bool enable_stub_scan = true;
  bool enable_lint = true;
};

struct GateComponents {
  std::unique_ptr<StubDetector> scanner;
  std::unique_ptr<Linter> linter;
  std::unique_ptr<AdvisoryComposer> composer;
  std::shared_ptr<Logger> logger;
  GateSettings settings;
};

class PostEditGate {
public:
  explicit PostEditGate(GateComponents components);

  // nullopt when the request does not pass the gate conditions.
  std::optional<GateResult> Run(const HookRequest &request);
  // Scans, lints and composes without the gate conditions.
  GateResult Check(const std::filesystem::path &file);

  std::optional<std::string> SkipReason(const HookRequest &request) const;

private:
  std::unique_ptr<StubDetector> scanner_;
  std::unique_ptr<Linter> linter_;
  std::unique_ptr<AdvisoryComposer> composer_;
  std::shared_ptr<Logger> logger_;
  GateSettings settings_;
};

class PostEditGateBuilder {
public:
  PostEditGateBuilder &WithScanner(std::unique_ptr<StubDetector> scanner);
  PostEditGateBuilder &WithLinter(std::unique_ptr<Linter> linter);
  PostEditGateBuilder &WithComposer(std::unique_ptr<AdvisoryComposer> composer);
  PostEditGateBuilder &WithLogger(std::shared_ptr<Logger> logger);
  PostEditGateBuilder &WithSettings(GateSettings settings);
  PostEditGateBuilder &WithToolchainRegistry(ToolchainRegistry registry);

  PostEditGate Build();

private:
  GateComponents components_;
  std::optional<ToolchainRegistry> registry_;
};

} // namespace stubgate
