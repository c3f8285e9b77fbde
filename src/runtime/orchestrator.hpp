#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "model/model_endpoint.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/completion_contract.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/message_contract.hpp"
#include "tools/tool_registry.hpp"

namespace toolpilot::runtime {

enum class ConversationState {
    AwaitingModel,
    ExecutingTools,
    Done
};

std::string to_string(ConversationState state);

struct OrchestratorOptions {
    std::string model;
    std::string system_prompt;
    double temperature = 1.0;
    std::uint32_t max_turns = 25;  // model calls per prompt
};

using EventObserver = std::function<void(const protocol::AgentEvent&)>;
using MessageObserver = std::function<void(const protocol::Message&)>;

// Drives the model <-> tool loop for one conversation. Not thread-safe; the
// endpoint and registry must outlive it.
class Orchestrator {
public:
    Orchestrator(model::ModelEndpoint& endpoint, const tools::ToolRegistry& registry,
                 policy::PolicyGuard guard, OrchestratorOptions options);

    // Appends the prompt and loops until the model answers without tool
    // calls. Endpoint errors come back unchanged; tool failures never do.
    core::errors::Result<std::string> run(const std::string& prompt);

    // Back to [system message]. Token usage is kept.
    void reset();

    // Resolve, permission check, bind, invoke. Always yields a ToolResult
    // carrying call.id.
    protocol::ToolResult execute_tool_call(const protocol::ToolCall& call);

    void set_event_observer(EventObserver observer) { event_observer_ = std::move(observer); }
    void set_message_observer(MessageObserver observer) {
        message_observer_ = std::move(observer);
    }

    const std::vector<protocol::Message>& history() const { return history_; }
    const protocol::Usage& usage() const { return usage_; }
    ConversationState state() const { return state_; }

private:
    protocol::ToolResult invoke_tool(const tools::ToolDescriptor& descriptor,
                                     const protocol::ToolCall& call) const;
    protocol::CompletionRequest make_request() const;
    void append(protocol::Message message);
    void emit(const protocol::AgentEvent& event) const;
    void finish(protocol::StopReason reason);

    model::ModelEndpoint& endpoint_;
    const tools::ToolRegistry& registry_;
    policy::PolicyGuard guard_;
    OrchestratorOptions options_;

    std::vector<protocol::Message> history_;
    protocol::Usage usage_;
    ConversationState state_ = ConversationState::AwaitingModel;
    EventObserver event_observer_;
    MessageObserver message_observer_;
};

}  // namespace toolpilot::runtime
