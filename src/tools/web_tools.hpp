#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tools/tool.hpp"

namespace toolpilot::tools {

// Appended when get_url cuts content short.
constexpr const char* kTruncatedMarker = "... [truncated]";

// Applies max_length (characters) then max_lines. Non-positive or absent
// limits are ignored.
std::string limit_content(std::string content, std::optional<std::int64_t> max_length,
                          std::optional<std::int64_t> max_lines);

// get_url. Built on cpp-httplib; https needs it compiled with OpenSSL.
std::vector<std::shared_ptr<const Tool>> make_web_tools();

}  // namespace toolpilot::tools
