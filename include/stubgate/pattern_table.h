#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace stubgate {

struct PatternRule {
  std::regex pattern;
  std::string label;
  // A line matching this expression does not count as a hit for the rule.
  std::optional<std::regex> suppression;

  bool Matches(const std::string &line) const;
};

class PatternTable {
public:
  // Expressions are ECMAScript and compiled case-insensitive.
  void Add(const std::string &pattern, std::string label,
           const std::optional<std::string> &suppression = std::nullopt);

  const std::vector<PatternRule> &rules() const { return rules_; }
  std::size_t size() const { return rules_.size(); }
  bool empty() const { return rules_.empty(); }

private:
  std::vector<PatternRule> rules_;
};

PatternTable MakeDefaultPatternTable();
const PatternTable &DefaultPatternTable();

} // namespace stubgate
