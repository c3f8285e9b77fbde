#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "tool_contract.hpp"

namespace toolpilot::protocol {

    enum class Role {
        System,
        User,
        Assistant,
        Tool
    };

    struct Message {
        Role role;
        std::string content;

        // Assistant only: the tool calls requested in this turn, in order.
        std::vector<ToolCall> tool_calls;

        // Tool only: id of the ToolCall this message answers.
        std::optional<std::string> tool_call_id;

        // Tool only: name of the tool that produced the content.
        std::optional<std::string> name;
    };

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::System:
                return "system";
            case Role::User:
                return "user";
            case Role::Assistant:
                return "assistant";
            case Role::Tool:
                return "tool";
            default:
                return "unknown";
        }
    }

    inline Message make_system(std::string content) {
        return Message{Role::System, std::move(content), {}, std::nullopt, std::nullopt};
    }

    inline Message make_user(std::string content) {
        return Message{Role::User, std::move(content), {}, std::nullopt, std::nullopt};
    }

    inline Message make_tool(const ToolCall& call, const ToolResult& result) {
        return Message{Role::Tool, render_content(result), {}, call.id, call.name};
    }

} // namespace toolpilot::protocol
