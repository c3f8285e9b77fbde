#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/completion_contract.hpp"

namespace toolpilot::model::openai_wire {

// CompletionRequest -> chat-completions request body. "tools" and
// "tool_choice" are omitted when the request carries no schemas.
nlohmann::json encode_request(const protocol::CompletionRequest& request);

// encode_request() serialized for the wire. Invalid UTF-8 in message text is
// replaced with U+FFFD instead of throwing.
std::string encode_request_body(const protocol::CompletionRequest& request);

nlohmann::json encode_message(const protocol::Message& message);

// Response body -> CompletionResponse. Anything that is not a
// chat-completions object with at least one choice is invalid_model_response.
core::errors::Result<protocol::CompletionResponse> decode_response(const std::string& body);

}  // namespace toolpilot::model::openai_wire
