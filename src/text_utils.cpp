#include <stubgate/text_utils.h>

#include <algorithm>
#include <cctype>

namespace stubgate {

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::vector<std::string> SplitLines(const std::string &content) {
  std::vector<std::string> lines;
  std::string current;
  for (const auto character : content) {
    if (character == '\n') {
      if (!current.empty() && current.back() == '\r') {
        current.pop_back();
      }
      lines.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  if (!current.empty()) {
    if (current.back() == '\r') {
      current.pop_back();
    }
    lines.push_back(std::move(current));
  }
  return lines;
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  const auto flush = [&]() {
    auto value = Trim(current);
    current.clear();
    if (value.empty()) {
      return;
    }
    if (std::find(values.begin(), values.end(), value) == values.end()) {
      values.push_back(std::move(value));
    }
  };
  for (const auto character : raw_values) {
    if (character == ',') {
      flush();
    } else {
      current.push_back(character);
    }
  }
  flush();
  return values;
}

bool IsValidUtf8(const std::string &value) {
  std::size_t i = 0;
  while (i < value.size()) {
    const auto lead = static_cast<unsigned char>(value[i]);
    std::size_t length = 0;
    unsigned char min_second = 0x80;
    unsigned char max_second = 0xBF;
    if (lead < 0x80) {
      ++i;
      continue;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
      length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      length = 3;
      if (lead == 0xE0) {
        min_second = 0xA0;
      } else if (lead == 0xED) {
        max_second = 0x9F;
      }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      length = 4;
      if (lead == 0xF0) {
        min_second = 0x90;
      } else if (lead == 0xF4) {
        max_second = 0x8F;
      }
    } else {
      return false;
    }
    if (i + length > value.size()) {
      return false;
    }
    const auto second = static_cast<unsigned char>(value[i + 1]);
    if (second < min_second || second > max_second) {
      return false;
    }
    for (std::size_t k = 2; k < length; ++k) {
      if ((static_cast<unsigned char>(value[i + k]) & 0xC0) != 0x80) {
        return false;
      }
    }
    i += length;
  }
  return true;
}

std::string TruncateUtf8(const std::string &value, std::size_t budget) {
  if (value.size() <= budget) {
    return value;
  }
  std::size_t cut = budget;
  // Step back over continuation bytes (10xxxxxx) to the start of a sequence.
  while (cut > 0 &&
         (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return value.substr(0, cut);
}

} // namespace stubgate
