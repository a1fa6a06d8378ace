#pragma once

#include <stubgate/interfaces.h>
#include <stubgate/logging.h>
#include <stubgate/pattern_table.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace stubgate {

constexpr std::size_t kExcerptBudget = 80;
// Rules only see this many leading bytes of a line; std::regex recursion
// grows with the subject length.
constexpr std::size_t kMaxMatchedLineBytes = 4096;

class RegexStubScanner : public StubDetector {
public:
  explicit RegexStubScanner(const PatternTable &table = DefaultPatternTable(),
                            std::shared_ptr<Logger> logger = nullptr);

  std::vector<Finding> Scan(const std::filesystem::path &file) override;
  std::vector<Finding> ScanContent(const std::string &content) const;

private:
  const PatternTable *table_;
  std::shared_ptr<Logger> logger_;
};

} // namespace stubgate
