#include <stubgate/hook_protocol.h>

#include <cctype>
#include <cstdint>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace stubgate {
namespace {

enum class JsonKind { kString, kObject, kOther };

struct JsonValue {
  JsonKind kind = JsonKind::kOther;
  // Decoded text for strings.
  std::string string_value;
  // Source text for objects.
  std::string raw;
};

using JsonMembers = std::unordered_map<std::string, JsonValue>;

constexpr int kMaxNestingDepth = 64;

// Validating reader for the hook envelope. Only the direct members of the
// root object are kept; nested containers are checked and skipped.
struct JsonReader {
  const std::string &text;
  std::size_t position = 0;

  std::optional<JsonMembers> ReadObjectDocument() {
    JsonMembers members;
    if (!ReadObject(0, &members)) {
      return std::nullopt;
    }
    SkipWhitespace();
    if (position != text.size()) {
      return std::nullopt;
    }
    return members;
  }

  void SkipWhitespace() {
    while (position < text.size() &&
           (text[position] == ' ' || text[position] == '\t' ||
            text[position] == '\n' || text[position] == '\r')) {
      ++position;
    }
  }

  bool Peek(char expected) const {
    return position < text.size() && text[position] == expected;
  }

  bool Eat(char expected) {
    SkipWhitespace();
    if (!Peek(expected)) {
      return false;
    }
    ++position;
    return true;
  }

  bool ReadObject(int depth, JsonMembers *members) {
    if (depth > kMaxNestingDepth || !Eat('{')) {
      return false;
    }
    if (Eat('}')) {
      return true;
    }
    do {
      SkipWhitespace();
      std::string key;
      JsonValue value;
      if (!ReadString(&key) || !Eat(':') || !ReadValue(depth + 1, &value)) {
        return false;
      }
      if (members != nullptr) {
        (*members)[key] = std::move(value);
      }
    } while (Eat(','));
    return Eat('}');
  }

  bool ReadArray(int depth) {
    if (depth > kMaxNestingDepth || !Eat('[')) {
      return false;
    }
    if (Eat(']')) {
      return true;
    }
    do {
      JsonValue ignored;
      if (!ReadValue(depth + 1, &ignored)) {
        return false;
      }
    } while (Eat(','));
    return Eat(']');
  }

  bool ReadValue(int depth, JsonValue *value) {
    SkipWhitespace();
    if (position >= text.size()) {
      return false;
    }
    const auto begin = position;
    switch (text[position]) {
    case '"':
      value->kind = JsonKind::kString;
      return ReadString(&value->string_value);
    case '{':
      if (!ReadObject(depth, nullptr)) {
        return false;
      }
      value->kind = JsonKind::kObject;
      value->raw = text.substr(begin, position - begin);
      return true;
    case '[':
      return ReadArray(depth);
    case 't':
      return ReadLiteral("true");
    case 'f':
      return ReadLiteral("false");
    case 'n':
      return ReadLiteral("null");
    default:
      return ReadNumber();
    }
  }

  bool ReadString(std::string *out) {
    if (!Peek('"')) {
      return false;
    }
    const auto begin = ++position;
    while (position < text.size()) {
      const auto character = static_cast<unsigned char>(text[position]);
      if (character == '"') {
        auto decoded = UnescapeJsonString(text.substr(begin, position - begin));
        ++position;
        if (!decoded) {
          return false;
        }
        *out = std::move(*decoded);
        return true;
      }
      if (character < 0x20) {
        return false;
      }
      position += character == '\\' ? 2 : 1;
    }
    return false;
  }

  bool ReadLiteral(const char *literal) {
    const auto length = std::strlen(literal);
    if (text.compare(position, length, literal) != 0) {
      return false;
    }
    position += length;
    return true;
  }

  bool ReadDigits() {
    const auto begin = position;
    while (position < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
      ++position;
    }
    return position > begin;
  }

  bool ReadNumber() {
    if (Peek('-')) {
      ++position;
    }
    if (Peek('0')) {
      ++position;
    } else if (!ReadDigits()) {
      return false;
    }
    if (Peek('.')) {
      ++position;
      if (!ReadDigits()) {
        return false;
      }
    }
    if (Peek('e') || Peek('E')) {
      ++position;
      if (Peek('+') || Peek('-')) {
        ++position;
      }
      if (!ReadDigits()) {
        return false;
      }
    }
    return true;
  }
};

const JsonValue *FindMember(const JsonMembers &members, const char *key,
                            JsonKind kind) {
  const auto found = members.find(key);
  if (found == members.end() || found->second.kind != kind) {
    return nullptr;
  }
  return &found->second;
}

void AppendUtf8(std::uint32_t code_point, std::string &output) {
  if (code_point < 0x80) {
    output.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    output.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    output.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    output.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    output.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    output.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    output.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    output.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    output.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    output.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

std::optional<std::uint32_t> ParseHex4(const std::string &value,
                                       std::size_t offset) {
  if (offset + 4 > value.size()) {
    return std::nullopt;
  }
  std::uint32_t code_unit = 0;
  for (std::size_t i = offset; i < offset + 4; ++i) {
    const auto character = value[i];
    code_unit <<= 4;
    if (character >= '0' && character <= '9') {
      code_unit |= static_cast<std::uint32_t>(character - '0');
    } else if (character >= 'a' && character <= 'f') {
      code_unit |= static_cast<std::uint32_t>(character - 'a' + 10);
    } else if (character >= 'A' && character <= 'F') {
      code_unit |= static_cast<std::uint32_t>(character - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return code_unit;
}

} // namespace

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""}, {'\\', "\\\\"}, {'\n', "\\n"},
      {'\r', "\\r"}, {'\t', "\\t"},  {'\b', "\\b"},
      {'\f', "\\f"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else if (static_cast<unsigned char>(character) < 0x20) {
      std::ostringstream code;
      code << "\\u" << std::hex << std::setw(4) << std::setfill('0')
           << static_cast<int>(character);
      escaped.append(code.str());
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::optional<std::string> UnescapeJsonString(const std::string &value) {
  std::string unescaped;
  unescaped.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '\\') {
      unescaped.push_back(value[i]);
      continue;
    }
    if (++i >= value.size()) {
      return std::nullopt;
    }
    switch (value[i]) {
    case '"':
    case '\\':
    case '/':
      unescaped.push_back(value[i]);
      break;
    case 'b':
      unescaped.push_back('\b');
      break;
    case 'f':
      unescaped.push_back('\f');
      break;
    case 'n':
      unescaped.push_back('\n');
      break;
    case 'r':
      unescaped.push_back('\r');
      break;
    case 't':
      unescaped.push_back('\t');
      break;
    case 'u': {
      auto code_point = ParseHex4(value, i + 1);
      if (!code_point) {
        return std::nullopt;
      }
      i += 4;
      // Combine a UTF-16 surrogate pair.
      if (*code_point >= 0xD800 && *code_point <= 0xDBFF &&
          i + 2 < value.size() && value[i + 1] == '\\' &&
          value[i + 2] == 'u') {
        const auto low = ParseHex4(value, i + 3);
        if (low && *low >= 0xDC00 && *low <= 0xDFFF) {
          code_point = 0x10000 + ((*code_point - 0xD800) << 10) +
                       (*low - 0xDC00);
          i += 6;
        }
      }
      AppendUtf8(*code_point, unescaped);
      break;
    }
    default:
      return std::nullopt;
    }
  }
  return unescaped;
}

std::optional<HookRequest> ParseHookRequest(const std::string &json) {
  const auto envelope = JsonReader{json}.ReadObjectDocument();
  if (!envelope) {
    return std::nullopt;
  }
  const auto *tool_name =
      FindMember(*envelope, "tool_name", JsonKind::kString);
  const auto *tool_input =
      FindMember(*envelope, "tool_input", JsonKind::kObject);
  if (tool_name == nullptr || tool_input == nullptr) {
    return std::nullopt;
  }

  const auto input = JsonReader{tool_input->raw}.ReadObjectDocument();
  if (!input) {
    return std::nullopt;
  }
  const auto *file_path = FindMember(*input, "file_path", JsonKind::kString);
  if (file_path == nullptr) {
    return std::nullopt;
  }
  return HookRequest{tool_name->string_value, file_path->string_value};
}

std::string RenderHookResponse(const Advisory &advisory) {
  std::ostringstream response;
  response << "{\"hookSpecificOutput\":{\"hookEventName\":\"" << kHookEventName
           << "\",\"additionalContext\":\"" << EscapeJsonString(advisory.Text())
           << "\"}}";
  return response.str();
}

} // namespace stubgate
