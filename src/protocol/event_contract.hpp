#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace toolpilot::protocol {

    // Why the conversation loop stopped
    enum class StopReason {
        Finished,       // Model answered without tool calls
        MaxTurns,       // Turn limit reached
        Error           // Model endpoint failed
    };

    // Lifecycle events emitted by the orchestrator
    struct TurnStartEvent { std::uint32_t turn; };
    struct AssistantMessageEvent { std::string content; std::size_t tool_call_count; };
    struct ToolExecutionStartEvent { std::string tool_name; std::string permissions; };
    struct ToolExecutionEndEvent { std::string tool_name; bool success; double duration_ms; };
    struct AgentEndEvent { StopReason reason; std::int64_t total_tokens; std::size_t message_count; };

    // An AgentEvent is exactly ONE of the types listed below.
    using AgentEvent = std::variant<
        TurnStartEvent,
        AssistantMessageEvent,
        ToolExecutionStartEvent,
        ToolExecutionEndEvent,
        AgentEndEvent
    >;

    inline std::string to_string(const StopReason reason) {
        switch (reason) {
            case StopReason::Finished: return "finished";
            case StopReason::MaxTurns: return "max_turns";
            case StopReason::Error:    return "error";
            default: return "unknown";
        }
    }

} // namespace toolpilot::protocol
