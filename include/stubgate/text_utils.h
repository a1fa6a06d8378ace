#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace stubgate {

std::string Trim(std::string value);
std::string ToLower(std::string value);
std::vector<std::string> SplitLines(const std::string &content);
std::vector<std::string> SplitList(const std::string &raw_values);

// Rejects overlong forms, surrogates and code points above U+10FFFF.
bool IsValidUtf8(const std::string &value);

// Cuts at most `budget` bytes without splitting a UTF-8 sequence.
std::string TruncateUtf8(const std::string &value, std::size_t budget);

} // namespace stubgate
