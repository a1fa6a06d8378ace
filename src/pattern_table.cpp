#include <stubgate/pattern_table.h>

#include <utility>

namespace stubgate {
namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

} // namespace

bool PatternRule::Matches(const std::string &line) const {
  if (!std::regex_search(line, pattern)) {
    return false;
  }
  return !(suppression && std::regex_search(line, *suppression));
}

void PatternTable::Add(const std::string &pattern, std::string label,
                       const std::optional<std::string> &suppression) {
  PatternRule rule{std::regex(pattern, kFlags), std::move(label), std::nullopt};
  if (suppression) {
    rule.suppression = std::regex(*suppression, kFlags);
  }
  rules_.push_back(std::move(rule));
}

PatternTable MakeDefaultPatternTable() {
  PatternTable table;
  table.Add(R"(\bTODO\b)", "TODO marker");
  table.Add(R"(\bFIXME\b)", "FIXME marker");
  table.Add(R"(\bXXX\b)", "XXX marker");
  table.Add(R"(\bHACK\b)", "HACK marker");
  table.Add(R"(^\s*pass\s*$)", "bare pass statement");
  table.Add(R"(^\s*\.\.\.\s*$)", "ellipsis placeholder");
  table.Add(R"(\bunimplemented!\s*\()", "unimplemented!() macro");
  table.Add(R"(\btodo!\s*\()", "todo!() macro");
  table.Add(R"(\bpanic!?\s*\(\s*"(not (yet )?implemented|todo))",
            "panic not implemented");
  table.Add(
      R"(\bthrow\s+(new\s+)?Error\s*\(\s*["'`](not (yet )?implemented|todo))",
      "throw not implemented");
  // A NotImplementedError that explains itself is a deliberate abstract
  // method, not a placeholder.
  table.Add(R"(\braise\s+NotImplementedError\b)", "raise NotImplementedError",
            std::string(
                R"(NotImplementedError\s*\(\s*[rbfu]{0,2}("[^"]+"|'[^']+'))"));
  table.Add(
      R"((#|//|/\*)\s*(implement\s+(this|me|here|later)|(to be|will be) implemented)\b)",
      "implement later comment");
  table.Add(
      R"(^\s*(async\s+)?def\s+\w+\s*\(.*\)\s*(->\s*[^:]+)?:\s*(pass|\.\.\.)\s*(#.*)?$)",
      "empty function");
  table.Add(
      R"(\b(fn|function|func(\s*\([^)]*\))?)\s+\w+\s*(<[^>]*>)?\s*\([^)]*\)[^{;]*\{\s*\})",
      "empty function body");
  table.Add(
      R"(\breturn\b\s*(None|null|nil|undefined|\{\}|\[\]|""|''|0|false)?\s*;?\s*(#|//|/\*).*\bstub\b)",
      "stub return");
  return table;
}

const PatternTable &DefaultPatternTable() {
  static const PatternTable table = MakeDefaultPatternTable();
  return table;
}

} // namespace stubgate
