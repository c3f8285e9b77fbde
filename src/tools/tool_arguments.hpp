#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "tools/tool.hpp"

namespace toolpilot::tools {

// Parses the model's raw JSON argument string and binds it against the
// declared parameters. The returned object holds every declared parameter;
// List parameters are normalized to arrays of strings.
core::errors::Result<nlohmann::json> bind_arguments(const ToolSpec& spec,
                                                    const std::string& raw_arguments);

// Accessors for bound arguments. A null value means "not given".
std::optional<std::string> optional_string(const nlohmann::json& args,
                                           const std::string& name);
std::optional<std::int64_t> optional_int(const nlohmann::json& args,
                                         const std::string& name);
std::vector<std::string> string_list(const nlohmann::json& args,
                                     const std::string& name);

}  // namespace toolpilot::tools
