#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stubgate {

struct Finding {
  std::size_t line_number = 0;
  std::string label;
  std::string excerpt;
};

struct DiagnosticLine {
  std::string text;
  std::string tool;
};

struct Advisory {
  std::optional<std::string> stub_section;
  std::optional<std::string> lint_section;
  std::optional<std::string> clean_message;

  bool HasIssues() const { return stub_section || lint_section; }
  std::string Text() const;
};

struct HookRequest {
  std::string tool_name;
  std::filesystem::path file_path;
};

struct GateResult {
  std::vector<Finding> findings;
  std::vector<DiagnosticLine> diagnostics;
  Advisory advisory;
};

} // namespace stubgate
