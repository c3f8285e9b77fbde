#include "runtime/orchestrator.hpp"

#include <chrono>
#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/tool_arguments.hpp"

namespace toolpilot::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::Message;
using protocol::ToolCall;
using protocol::ToolResult;

namespace {

ToolResult recovered(const ToolCall& call, const AgentError& error) {
    LOG_WARN("Tool call '" + call.name + "' (" + call.id + ") failed: " +
             core::errors::describe(error));
    return protocol::make_failure(call.id, error.message);
}

// A tool's payload becomes the result; its own "success" and "error" fields
// decide the outcome when present.
ToolResult from_payload(const ToolCall& call, json payload) {
    ToolResult result;
    result.tool_call_id = call.id;
    if (!payload.is_object()) {
        payload = json{{"result", std::move(payload)}};
    }

    const auto success = payload.find("success");
    result.success = success == payload.end() || !success->is_boolean() || success->get<bool>();
    const auto error = payload.find("error");
    if (error != payload.end() && error->is_string()) {
        result.error = error->get<std::string>();
        payload.erase(error);
    }
    result.payload = std::move(payload);

    if (!result.success) {
        LOG_WARN("Tool call '" + call.name + "' (" + call.id + ") reported failure" +
                 (result.error.has_value() ? ": " + result.error.value() : std::string()));
    }
    return result;
}

}  // namespace

std::string to_string(const ConversationState state) {
    switch (state) {
        case ConversationState::AwaitingModel:
            return "awaiting_model";
        case ConversationState::ExecutingTools:
            return "executing_tools";
        case ConversationState::Done:
            return "done";
        default:
            return "unknown";
    }
}

Orchestrator::Orchestrator(model::ModelEndpoint& endpoint,
                           const tools::ToolRegistry& registry, policy::PolicyGuard guard,
                           OrchestratorOptions options)
    : endpoint_(endpoint),
      registry_(registry),
      guard_(std::move(guard)),
      options_(std::move(options)) {
    history_.push_back(protocol::make_system(options_.system_prompt));
}

void Orchestrator::reset() {
    history_.clear();
    history_.push_back(protocol::make_system(options_.system_prompt));
    state_ = ConversationState::AwaitingModel;
    LOG_DEBUG("Conversation reset");
}

core::errors::Result<std::string> Orchestrator::run(const std::string& prompt) {
    append(protocol::make_user(prompt));
    state_ = ConversationState::AwaitingModel;

    for (std::uint32_t turn = 1;; ++turn) {
        if (turn > options_.max_turns) {
            finish(protocol::StopReason::MaxTurns);
            return AgentError{ErrorCategory::Execution,
                              "No final answer after " + std::to_string(options_.max_turns) +
                                  " model turns",
                              "max_turns_exceeded", "Raise the limit with --max-turns."};
        }

        emit(protocol::TurnStartEvent{turn});
        LOG_DEBUG("Turn " + std::to_string(turn) + ": sending " +
                  std::to_string(history_.size()) + " messages");

        auto response = endpoint_.complete(make_request());
        if (core::errors::is_error(response)) {
            finish(protocol::StopReason::Error);
            return core::errors::get_error(response);
        }
        protocol::CompletionResponse& completion = core::errors::get_value(response);
        usage_ += completion.usage;

        Message assistant = std::move(completion.message);
        assistant.role = protocol::Role::Assistant;
        const std::vector<ToolCall> calls = assistant.tool_calls;
        emit(protocol::AssistantMessageEvent{assistant.content, calls.size()});
        const std::string content = assistant.content;
        append(std::move(assistant));

        if (calls.empty()) {
            finish(protocol::StopReason::Finished);
            return content;
        }

        state_ = ConversationState::ExecutingTools;
        for (const auto& call : calls) {
            const ToolResult result = execute_tool_call(call);
            append(protocol::make_tool(call, result));
        }
        state_ = ConversationState::AwaitingModel;
    }
}

ToolResult Orchestrator::execute_tool_call(const ToolCall& call) {
    auto resolved = registry_.resolve(call.name);
    if (core::errors::is_error(resolved)) {
        return recovered(call, core::errors::get_error(resolved));
    }
    const tools::ToolDescriptor& descriptor = *core::errors::get_value(resolved);

    emit(protocol::ToolExecutionStartEvent{descriptor.name(), descriptor.permissions()});
    const auto started = std::chrono::steady_clock::now();
    ToolResult result = invoke_tool(descriptor, call);
    result.duration_ms = std::chrono::duration<double, std::milli>(
                             std::chrono::steady_clock::now() - started)
                             .count();
    emit(protocol::ToolExecutionEndEvent{descriptor.name(), result.success,
                                         result.duration_ms});
    return result;
}

ToolResult Orchestrator::invoke_tool(const tools::ToolDescriptor& descriptor,
                                     const ToolCall& call) const {
    auto allowed = guard_.check(descriptor);
    if (core::errors::is_error(allowed)) {
        return recovered(call, core::errors::get_error(allowed));
    }

    auto arguments = tools::bind_arguments(descriptor.spec, call.arguments);
    if (core::errors::is_error(arguments)) {
        return recovered(call, core::errors::get_error(arguments));
    }

    try {
        auto output = descriptor.handler->invoke(core::errors::get_value(arguments));
        if (core::errors::is_error(output)) {
            return recovered(call, core::errors::get_error(output));
        }
        return from_payload(call, std::move(core::errors::get_value(output)));
    } catch (const std::exception& e) {
        return recovered(call, AgentError{ErrorCategory::Execution,
                                          "Tool '" + call.name + "' raised: " + e.what(),
                                          "tool_execution_failed"});
    }
}

protocol::CompletionRequest Orchestrator::make_request() const {
    protocol::CompletionRequest request;
    request.model = options_.model;
    request.messages = history_;
    request.temperature = options_.temperature;
    request.tools = registry_.list_schemas();
    request.tool_choice = protocol::ToolChoice::Auto;
    return request;
}

void Orchestrator::append(Message message) {
    history_.push_back(std::move(message));
    if (message_observer_) {
        message_observer_(history_.back());
    }
}

void Orchestrator::emit(const protocol::AgentEvent& event) const {
    if (event_observer_) {
        event_observer_(event);
    }
}

void Orchestrator::finish(const protocol::StopReason reason) {
    state_ = ConversationState::Done;
    emit(protocol::AgentEndEvent{reason, usage_.total_tokens, history_.size()});
}

}  // namespace toolpilot::runtime
