#pragma once

#include <stubgate/models.h>

#include <optional>
#include <string>

namespace stubgate {

constexpr const char kHookEventName[] = "PostToolUse";

// Returns nullopt for anything that is not an object carrying a string
// tool_name and a tool_input object with a string file_path.
std::optional<HookRequest> ParseHookRequest(const std::string &json);

std::string RenderHookResponse(const Advisory &advisory);

std::string EscapeJsonString(const std::string &value);
// Decodes the body of a JSON string literal (without the quotes).
std::optional<std::string> UnescapeJsonString(const std::string &value);

} // namespace stubgate
