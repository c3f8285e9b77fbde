#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "message_contract.hpp"

namespace toolpilot::protocol {

enum class ToolChoice {
    Auto,
    None,
    Required
};

struct CompletionRequest {
    std::string model;
    std::vector<Message> messages;
    double temperature = 1.0;
    nlohmann::json tools = nlohmann::json::array();  // function-calling schemas
    ToolChoice tool_choice = ToolChoice::Auto;
};

struct Usage {
    std::int64_t prompt_tokens = 0;
    std::int64_t completion_tokens = 0;
    std::int64_t total_tokens = 0;
};

struct CompletionResponse {
    Message message{Role::Assistant, "", {}, std::nullopt, std::nullopt};
    Usage usage;
    std::string finish_reason;
};

inline std::string to_string(const ToolChoice choice) {
    switch (choice) {
        case ToolChoice::Auto:
            return "auto";
        case ToolChoice::None:
            return "none";
        case ToolChoice::Required:
            return "required";
        default:
            return "auto";
    }
}

inline Usage& operator+=(Usage& lhs, const Usage& rhs) {
    lhs.prompt_tokens += rhs.prompt_tokens;
    lhs.completion_tokens += rhs.completion_tokens;
    lhs.total_tokens += rhs.total_tokens;
    return lhs;
}

}  // namespace toolpilot::protocol
