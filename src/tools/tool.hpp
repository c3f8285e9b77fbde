#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"

namespace toolpilot::tools {

enum class ParamType {
    String,
    Integer,
    Number,
    Boolean,
    Path,  // rendered as "string"
    List   // rendered as "string"; accepts a JSON array or a whitespace separated string
};

struct ParamSpec {
    std::string name;
    ParamType type = ParamType::String;
    std::string description;
    // Absent: the parameter is required. A json null default means "not given".
    std::optional<nlohmann::json> default_value;

    bool required() const { return !default_value.has_value(); }
};

// Static description of a tool. Built once per tool, never mutated.
struct ToolSpec {
    std::string name;
    std::string summary;
    std::string permissions;  // subset of "rwxn"
    std::vector<ParamSpec> params;
};

// Capability interface every tool implements.
//
// invoke() receives arguments already bound against spec().params: every
// declared parameter is present, optional ones filled with their defaults.
// A tool reports failure through the error alternative; exceptions escaping
// invoke() are caught by the orchestrator as well.
class Tool {
public:
    virtual ~Tool() = default;

    virtual const ToolSpec& spec() const = 0;

    virtual core::errors::Result<nlohmann::json> invoke(
        const nlohmann::json& args) const = 0;
};

inline ParamSpec required_param(std::string name, ParamType type,
                                std::string description) {
    return ParamSpec{std::move(name), type, std::move(description), std::nullopt};
}

inline ParamSpec optional_param(std::string name, ParamType type,
                                std::string description,
                                nlohmann::json default_value = nullptr) {
    return ParamSpec{std::move(name), type, std::move(description),
                     std::move(default_value)};
}

std::string to_schema_type(ParamType type);

}  // namespace toolpilot::tools
