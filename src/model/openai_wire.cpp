#include "model/openai_wire.hpp"

#include <cstdint>
#include <utility>

namespace toolpilot::model::openai_wire {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::Message;
using protocol::Role;

namespace {

AgentError invalid_response(const std::string& detail) {
    return AgentError{ErrorCategory::Provider, "Invalid model response: " + detail,
                      "invalid_model_response"};
}

std::int64_t usage_field(const json& usage, const char* key) {
    const auto it = usage.find(key);
    if (it == usage.end() || !it->is_number_integer()) {
        return 0;
    }
    return it->get<std::int64_t>();
}

}  // namespace

json encode_message(const Message& message) {
    json out;
    out["role"] = protocol::to_string(message.role);

    if (message.role == Role::Assistant && !message.tool_calls.empty()) {
        // An assistant turn that only calls tools carries null content.
        out["content"] = message.content.empty() ? json(nullptr) : json(message.content);
        out["tool_calls"] = json::array();
        for (const auto& call : message.tool_calls) {
            out["tool_calls"].push_back(
                {{"id", call.id},
                 {"type", "function"},
                 {"function", {{"name", call.name}, {"arguments", call.arguments}}}});
        }
    } else {
        out["content"] = message.content;
    }

    if (message.role == Role::Tool) {
        out["tool_call_id"] = message.tool_call_id.value_or("");
        if (message.name.has_value()) {
            out["name"] = message.name.value();
        }
    }
    return out;
}

json encode_request(const protocol::CompletionRequest& request) {
    json body;
    body["model"] = request.model;
    body["temperature"] = request.temperature;
    body["messages"] = json::array();
    for (const auto& message : request.messages) {
        body["messages"].push_back(encode_message(message));
    }
    if (request.tools.is_array() && !request.tools.empty()) {
        body["tools"] = request.tools;
        body["tool_choice"] = protocol::to_string(request.tool_choice);
    }
    return body;
}

std::string encode_request_body(const protocol::CompletionRequest& request) {
    return encode_request(request).dump(-1, ' ', false, json::error_handler_t::replace);
}

core::errors::Result<protocol::CompletionResponse> decode_response(const std::string& body) {
    const json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return invalid_response("body is not a JSON object");
    }
    if (parsed.contains("error")) {
        const auto& error = parsed["error"];
        std::string detail = error.dump();
        if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            detail = error["message"].get<std::string>();
        }
        return AgentError{ErrorCategory::Provider, "Model endpoint returned an error: " + detail,
                          "model_communication_failed"};
    }

    const auto choices = parsed.find("choices");
    if (choices == parsed.end() || !choices->is_array() || choices->empty() ||
        !(*choices)[0].is_object()) {
        return invalid_response("missing choices");
    }
    const json& choice = (*choices)[0];
    const auto message = choice.find("message");
    if (message == choice.end() || !message->is_object()) {
        return invalid_response("choice has no message");
    }

    protocol::CompletionResponse response;
    const auto content = message->find("content");
    if (content != message->end() && content->is_string()) {
        response.message.content = content->get<std::string>();
    }

    const auto calls = message->find("tool_calls");
    if (calls != message->end() && calls->is_array()) {
        for (const auto& entry : *calls) {
            if (!entry.is_object() || !entry.contains("function") ||
                !entry["function"].is_object()) {
                return invalid_response("malformed tool call");
            }
            const json& function = entry["function"];
            protocol::ToolCall call;
            call.id = entry.value("id", "");
            call.name = function.value("name", "");
            if (call.name.empty()) {
                return invalid_response("tool call without a function name");
            }
            const auto arguments = function.find("arguments");
            if (arguments != function.end()) {
                call.arguments = arguments->is_string() ? arguments->get<std::string>()
                                                        : arguments->dump();
            }
            response.message.tool_calls.push_back(std::move(call));
        }
    }

    const auto finish = choice.find("finish_reason");
    if (finish != choice.end() && finish->is_string()) {
        response.finish_reason = finish->get<std::string>();
    }

    const auto usage = parsed.find("usage");
    if (usage != parsed.end() && usage->is_object()) {
        response.usage.prompt_tokens = usage_field(*usage, "prompt_tokens");
        response.usage.completion_tokens = usage_field(*usage, "completion_tokens");
        response.usage.total_tokens = usage_field(*usage, "total_tokens");
    }
    return response;
}

}  // namespace toolpilot::model::openai_wire
