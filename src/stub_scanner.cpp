#include <stubgate/stub_scanner.h>
#include <stubgate/text_utils.h>

#include <fstream>
#include <iterator>
#include <utility>

namespace stubgate {
namespace {

bool LooksLikeText(const std::string &content) {
  return content.find('\0') == std::string::npos && IsValidUtf8(content);
}

} // namespace

RegexStubScanner::RegexStubScanner(const PatternTable &table,
                                   std::shared_ptr<Logger> logger)
    : table_(&table), logger_(EnsureLogger(std::move(logger))) {}

std::vector<Finding>
RegexStubScanner::ScanContent(const std::string &content) const {
  std::vector<Finding> findings;
  if (!LooksLikeText(content)) {
    return findings;
  }

  const auto lines = SplitLines(content);
  for (std::size_t index = 0; index < lines.size(); ++index) {
    const auto &line = lines[index];
    std::string prefix;
    const std::string *subject = &line;
    if (line.size() > kMaxMatchedLineBytes) {
      prefix = TruncateUtf8(line, kMaxMatchedLineBytes);
      subject = &prefix;
    }
    for (const auto &rule : table_->rules()) {
      if (!rule.Matches(*subject)) {
        continue;
      }
      findings.push_back(Finding{index + 1, rule.label,
                                 TruncateUtf8(Trim(line), kExcerptBudget)});
    }
  }
  return findings;
}

std::vector<Finding> RegexStubScanner::Scan(const std::filesystem::path &file) {
  std::error_code error;
  if (!std::filesystem::is_regular_file(file, error)) {
    logger_->Log(LogLevel::kDebug, "scan.unreadable",
                 {{"file", file.string()}, {"reason", "not a regular file"}});
    return {};
  }

  std::ifstream stream(file, std::ios::binary);
  if (!stream) {
    logger_->Log(LogLevel::kDebug, "scan.unreadable",
                 {{"file", file.string()}, {"reason", "open failed"}});
    return {};
  }
  const std::string content((std::istreambuf_iterator<char>(stream)),
                            std::istreambuf_iterator<char>());
  if (stream.bad()) {
    return {};
  }

  return ScanContent(content);
}

} // namespace stubgate
