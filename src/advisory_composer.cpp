#include <stubgate/advisory_composer.h>

#include <algorithm>
#include <sstream>

namespace stubgate {
namespace {

std::string BuildStubSection(const std::filesystem::path &file,
                             const std::vector<Finding> &findings) {
  std::ostringstream section;
  section << "STUB PATTERNS DETECTED in " << file.string() << ":\n";
  const auto listed = std::min(findings.size(), kMaxListedFindings);
  for (std::size_t i = 0; i < listed; ++i) {
    const auto &finding = findings[i];
    section << "  Line " << finding.line_number << ": " << finding.label
            << " - `" << finding.excerpt << "`\n";
  }
  if (findings.size() > listed) {
    section << "  ... and " << findings.size() - listed << " more\n";
  }
  section << "Fix these now: replace placeholders with a real implementation.";
  return section.str();
}

std::string BuildLintSection(const std::filesystem::path &file,
                             const std::vector<DiagnosticLine> &diagnostics) {
  std::ostringstream section;
  section << "LINTER ISSUES";
  if (!diagnostics.front().tool.empty()) {
    section << " (" << diagnostics.front().tool << ")";
  }
  section << " in " << file.string() << ":";
  const auto listed = std::min(diagnostics.size(), kMaxListedDiagnostics);
  for (std::size_t i = 0; i < listed; ++i) {
    section << "\n  " << diagnostics[i].text;
  }
  if (diagnostics.size() > listed) {
    section << "\n  ... and more";
  }
  return section.str();
}

} // namespace

std::string Advisory::Text() const {
  if (!HasIssues()) {
    return clean_message.value_or("");
  }
  if (stub_section && lint_section) {
    return *stub_section + "\n\n" + *lint_section;
  }
  return stub_section ? *stub_section : *lint_section;
}

Advisory
TextAdvisoryComposer::Compose(const std::filesystem::path &file,
                              const std::vector<Finding> &findings,
                              const std::vector<DiagnosticLine> &diagnostics) {
  Advisory advisory;
  if (!findings.empty()) {
    advisory.stub_section = BuildStubSection(file, findings);
  }
  if (!diagnostics.empty()) {
    advisory.lint_section = BuildLintSection(file, diagnostics);
  }
  if (!advisory.HasIssues()) {
    advisory.clean_message =
        file.string() + ": no stub patterns or linter issues detected.";
  }
  return advisory;
}

} // namespace stubgate
