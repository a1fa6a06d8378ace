#include <stubgate/toolchain_registry.h>
#include <stubgate/text_utils.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace stubgate {
namespace {

bool ContainsInsensitive(const std::string &haystack,
                         const std::string &needle) {
  return ToLower(haystack).find(needle) != std::string::npos;
}

std::string NormalizeExtension(const std::string &extension) {
  auto normalized = ToLower(Trim(extension));
  if (!normalized.empty() && normalized.front() != '.') {
    normalized.insert(normalized.begin(), '.');
  }
  return normalized;
}

ToolchainSpec ClippyToolchain() {
  ToolchainSpec spec;
  spec.name = "clippy";
  spec.extensions = {".rs"};
  spec.root_markers = {"Cargo.toml"};
  spec.primary = ToolInvocation{
      "cargo clippy",
      {"cargo", "clippy", "--message-format=short", "--quiet"},
      std::chrono::seconds(30),
      OutputStream::kStderr,
      LineFilter::kErrorOrWarning,
      100};
  return spec;
}

ToolchainSpec Flake8Toolchain() {
  ToolchainSpec spec;
  spec.name = "flake8";
  spec.extensions = {".py"};
  spec.primary = ToolInvocation{"flake8",
                                {"flake8", "--max-line-length=120",
                                 kFilePlaceholder},
                                std::chrono::seconds(10),
                                OutputStream::kStdout,
                                LineFilter::kNonBlank,
                                200};
  // py_compile only reports syntax errors, on stderr.
  spec.fallback = ToolInvocation{"py_compile",
                                 {"python3", "-m", "py_compile",
                                  kFilePlaceholder},
                                 std::chrono::seconds(10),
                                 OutputStream::kStderr,
                                 LineFilter::kNonBlank,
                                 200};
  return spec;
}

ToolchainSpec EslintToolchain() {
  ToolchainSpec spec;
  spec.name = "eslint";
  spec.extensions = {".js", ".jsx", ".ts", ".tsx"};
  spec.root_markers = {"package.json",      ".eslintrc",
                       ".eslintrc.js",      ".eslintrc.json",
                       "eslint.config.js",  "eslint.config.mjs"};
  spec.primary = ToolInvocation{
      "eslint",
      {"npx", "--no-install", "eslint", "--format", "unix", kFilePlaceholder},
      std::chrono::seconds(30),
      OutputStream::kStdout,
      LineFilter::kContainsColon,
      100};
  return spec;
}

ToolchainSpec GoVetToolchain() {
  ToolchainSpec spec;
  spec.name = "go-vet";
  spec.extensions = {".go"};
  spec.root_markers = {"go.mod"};
  spec.primary = ToolInvocation{"go vet",
                                {"go", "vet", "./..."},
                                std::chrono::seconds(30),
                                OutputStream::kStderr,
                                LineFilter::kNonBlank,
                                200};
  return spec;
}

} // namespace

bool PassesFilter(LineFilter filter, const std::string &line) {
  if (Trim(line).empty()) {
    return false;
  }
  switch (filter) {
  case LineFilter::kNonBlank:
    return true;
  case LineFilter::kErrorOrWarning:
    return ContainsInsensitive(line, "error") ||
           ContainsInsensitive(line, "warning");
  case LineFilter::kContainsColon:
    return line.find(':') != std::string::npos;
  }
  return false;
}

void ToolchainRegistry::Register(ToolchainSpec spec) {
  if (spec.name.empty()) {
    throw std::invalid_argument("Toolchain name cannot be empty");
  }
  if (spec.primary.command.empty()) {
    throw std::invalid_argument("Toolchain '" + spec.name +
                                "' has no command");
  }
  if (FindByName(spec.name) != nullptr) {
    throw std::invalid_argument("Toolchain with name '" + spec.name +
                                "' already registered");
  }
  for (auto &extension : spec.extensions) {
    extension = NormalizeExtension(extension);
    if (by_extension_.count(extension) != 0) {
      throw std::invalid_argument(
          "Extension '" + extension + "' already handled by toolchain '" +
          toolchains_[by_extension_.at(extension)].name + "'");
    }
  }

  const auto index = toolchains_.size();
  for (const auto &extension : spec.extensions) {
    by_extension_.emplace(extension, index);
  }
  toolchains_.push_back(std::move(spec));
}

const ToolchainSpec *
ToolchainRegistry::FindByExtension(const std::string &extension) const {
  const auto found = by_extension_.find(NormalizeExtension(extension));
  if (found == by_extension_.end()) {
    return nullptr;
  }
  return &toolchains_[found->second];
}

const ToolchainSpec *
ToolchainRegistry::FindByName(const std::string &name) const {
  const auto found = std::find_if(
      toolchains_.begin(), toolchains_.end(),
      [&](const ToolchainSpec &spec) { return spec.name == name; });
  return found == toolchains_.end() ? nullptr : &*found;
}

std::vector<std::string> ToolchainRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(toolchains_.size());
  for (const auto &spec : toolchains_) {
    names.push_back(spec.name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::vector<std::string> ToolchainRegistry::Extensions() const {
  std::vector<std::string> extensions;
  extensions.reserve(by_extension_.size());
  for (const auto &entry : by_extension_) {
    extensions.push_back(entry.first);
  }
  std::sort(extensions.begin(), extensions.end());
  return extensions;
}

std::string ToolchainRegistry::JoinNames() const {
  const auto names = Names();
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

ToolchainRegistry
ToolchainRegistry::Without(const std::vector<std::string> &names) const {
  for (const auto &name : names) {
    if (FindByName(name) == nullptr) {
      throw std::invalid_argument("Unknown toolchain '" + name +
                                  "'. Registered: " + JoinNames());
    }
  }

  ToolchainRegistry filtered;
  for (const auto &spec : toolchains_) {
    if (std::find(names.begin(), names.end(), spec.name) == names.end()) {
      filtered.Register(spec);
    }
  }
  return filtered;
}

ToolchainRegistry MakeToolchainRegistryWithDefaults() {
  ToolchainRegistry registry;
  registry.Register(ClippyToolchain());
  registry.Register(Flake8Toolchain());
  registry.Register(EslintToolchain());
  registry.Register(GoVetToolchain());
  return registry;
}

const ToolchainRegistry &GlobalToolchainRegistry() {
  static const ToolchainRegistry registry =
      MakeToolchainRegistryWithDefaults();
  return registry;
}

} // namespace stubgate
