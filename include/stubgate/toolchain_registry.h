#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace stubgate {

enum class OutputStream { kStdout, kStderr };

enum class LineFilter {
  kNonBlank,
  // Keeps lines mentioning "error" or "warning" in any case.
  kErrorOrWarning,
  kContainsColon,
};

bool PassesFilter(LineFilter filter, const std::string &line);

struct ToolInvocation {
  std::string tool;
  // "{file}" is replaced by the path being checked.
  std::vector<std::string> command;
  std::chrono::seconds timeout{30};
  OutputStream stream = OutputStream::kStdout;
  LineFilter filter = LineFilter::kNonBlank;
  std::size_t line_budget = 200;
};

struct ToolchainSpec {
  std::string name;
  std::vector<std::string> extensions;
  // Empty when the tool runs from the file's own directory.
  std::vector<std::string> root_markers;
  ToolInvocation primary;
  // Used when the primary executable is not installed.
  std::optional<ToolInvocation> fallback;
};

constexpr const char kFilePlaceholder[] = "{file}";

class ToolchainRegistry {
public:
  void Register(ToolchainSpec spec);

  const ToolchainSpec *FindByExtension(const std::string &extension) const;
  const ToolchainSpec *FindByName(const std::string &name) const;
  std::vector<std::string> Names() const;
  std::vector<std::string> Extensions() const;

  // Copy of this registry without the named toolchains.
  ToolchainRegistry Without(const std::vector<std::string> &names) const;

private:
  std::string JoinNames() const;

  std::vector<ToolchainSpec> toolchains_;
  std::unordered_map<std::string, std::size_t> by_extension_;
};

ToolchainRegistry MakeToolchainRegistryWithDefaults();
const ToolchainRegistry &GlobalToolchainRegistry();

} // namespace stubgate
