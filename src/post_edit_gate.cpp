#include <stubgate/post_edit_gate.h>

#include <stubgate/advisory_composer.h>
#include <stubgate/linter_dispatcher.h>
#include <stubgate/project_root_resolver.h>
#include <stubgate/stub_scanner.h>
#include <stubgate/text_utils.h>
#include <stubgate/toolchain_registry.h>

#include <algorithm>
#include <chrono>
#include <utility>

namespace stubgate {
namespace {

bool Contains(const std::vector<std::string> &values,
              const std::string &value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

const std::vector<std::string> &RecognizedToolNames() {
  static const std::vector<std::string> names = {"Write", "Edit"};
  return names;
}

const std::vector<std::string> &RecognizedExtensions() {
  // Built-in toolchains, so disabling a linter keeps stub scanning.
  static const std::vector<std::string> extensions =
      GlobalToolchainRegistry().Extensions();
  return extensions;
}

PostEditGate::PostEditGate(GateComponents components)
    : scanner_(std::move(components.scanner)),
      linter_(std::move(components.linter)),
      composer_(std::move(components.composer)),
      logger_(EnsureLogger(std::move(components.logger))),
      settings_(std::move(components.settings)) {}

std::optional<std::string>
PostEditGate::SkipReason(const HookRequest &request) const {
  if (!Contains(RecognizedToolNames(), request.tool_name)) {
    return "unrecognized tool '" + request.tool_name + "'";
  }
  if (request.file_path.empty()) {
    return std::string("empty file path");
  }
  const auto extension = ToLower(request.file_path.extension().string());
  if (!Contains(RecognizedExtensions(), extension)) {
    return "unrecognized extension '" + extension + "'";
  }
  if (IsWithin(request.file_path, settings_.hook_directory)) {
    return std::string("file is inside the hook directory");
  }
  return std::nullopt;
}

std::optional<GateResult> PostEditGate::Run(const HookRequest &request) {
  if (const auto reason = SkipReason(request)) {
    logger_->Log(LogLevel::kDebug, "gate.skip",
                 {{"tool", request.tool_name},
                  {"file", request.file_path.string()},
                  {"reason", *reason}});
    return std::nullopt;
  }
  return Check(request.file_path);
}

GateResult PostEditGate::Check(const std::filesystem::path &file) {
  const auto start = std::chrono::steady_clock::now();
  GateResult result;

  if (settings_.enable_stub_scan && scanner_) {
    result.findings = scanner_->Scan(file);
    logger_->Log(LogLevel::kDebug, "scan.complete",
                 {{"file", file.string()},
                  {"findings", std::to_string(result.findings.size())}});
  }
  if (settings_.enable_lint && linter_) {
    result.diagnostics = linter_->Lint(file, settings_.max_lint_lines);
    logger_->Log(LogLevel::kDebug, "lint.complete",
                 {{"file", file.string()},
                  {"diagnostics", std::to_string(result.diagnostics.size())}});
  }
  result.advisory =
      composer_->Compose(file, result.findings, result.diagnostics);

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count();
  logger_->Log(LogLevel::kInfo, "gate.complete",
               {{"file", file.string()},
                {"findings", std::to_string(result.findings.size())},
                {"diagnostics", std::to_string(result.diagnostics.size())},
                {"duration_ms", std::to_string(duration_ms)}});
  return result;
}

PostEditGateBuilder &
PostEditGateBuilder::WithScanner(std::unique_ptr<StubDetector> scanner) {
  components_.scanner = std::move(scanner);
  return *this;
}

PostEditGateBuilder &
PostEditGateBuilder::WithLinter(std::unique_ptr<Linter> linter) {
  components_.linter = std::move(linter);
  return *this;
}

PostEditGateBuilder &PostEditGateBuilder::WithComposer(
    std::unique_ptr<AdvisoryComposer> composer) {
  components_.composer = std::move(composer);
  return *this;
}

PostEditGateBuilder &
PostEditGateBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

PostEditGateBuilder &PostEditGateBuilder::WithSettings(GateSettings settings) {
  components_.settings = std::move(settings);
  return *this;
}

PostEditGateBuilder &
PostEditGateBuilder::WithToolchainRegistry(ToolchainRegistry registry) {
  registry_ = std::move(registry);
  return *this;
}

PostEditGate PostEditGateBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  if (!components_.scanner) {
    components_.scanner = std::make_unique<RegexStubScanner>(
        DefaultPatternTable(), components_.logger);
  }
  if (!components_.linter) {
    if (registry_) {
      components_.linter = std::make_unique<LinterDispatcher>(
          std::move(*registry_), nullptr, components_.logger);
    } else {
      components_.linter = std::make_unique<LinterDispatcher>(
          GlobalToolchainRegistry(), nullptr, components_.logger);
    }
  }
  if (!components_.composer) {
    components_.composer = std::make_unique<TextAdvisoryComposer>();
  }
  return PostEditGate(std::move(components_));
}

} // namespace stubgate
