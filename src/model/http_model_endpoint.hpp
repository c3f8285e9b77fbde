#pragma once

#include <string>
#include "model/model_endpoint.hpp"

namespace toolpilot::model {

struct EndpointSettings {
    std::string base_url = "https://api.openai.com/v1";
    std::string api_key;
    int connect_timeout_seconds = 10;
    int read_timeout_seconds = 300;
};

// OpenAI-compatible chat completions over HTTP(S).
class HttpModelEndpoint : public ModelEndpoint {
public:
    explicit HttpModelEndpoint(EndpointSettings settings);

    core::errors::Result<protocol::CompletionResponse> complete(
        const protocol::CompletionRequest& request) override;

private:
    EndpointSettings settings_;
    std::string origin_;     // scheme://host[:port]
    std::string base_path_;  // e.g. "/v1"
};

}  // namespace toolpilot::model
