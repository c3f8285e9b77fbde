#pragma once

#include "core/errors/agent_errors.hpp"
#include "protocol/completion_contract.hpp"

namespace toolpilot::model {

// A chat-completion backend. complete() is synchronous and may block for a
// long time; failures are Provider errors.
class ModelEndpoint {
public:
    virtual ~ModelEndpoint() = default;

    virtual core::errors::Result<protocol::CompletionResponse> complete(
        const protocol::CompletionRequest& request) = 0;
};

}  // namespace toolpilot::model
