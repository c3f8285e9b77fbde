#include "model/http_model_endpoint.hpp"

#include <httplib.h>

#include <utility>
#include "core/logging/logger.hpp"
#include "model/openai_wire.hpp"

namespace toolpilot::model {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

AgentError communication_failure(const std::string& message) {
    return AgentError{ErrorCategory::Provider, message, "model_communication_failed",
                      "Check BASE_URL, API_KEY and network connectivity."};
}

std::string join_path(const std::string& base, const std::string& path) {
    if (base.empty()) {
        return path;
    }
    if (base.back() == '/') {
        return base + path.substr(1);
    }
    return base + path;
}

}  // namespace

HttpModelEndpoint::HttpModelEndpoint(EndpointSettings settings)
    : settings_(std::move(settings)) {
    const std::string& url = settings_.base_url;
    const auto scheme_end = url.find("://");
    const auto path_start =
        url.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
    if (path_start == std::string::npos) {
        origin_ = url;
    } else {
        origin_ = url.substr(0, path_start);
        base_path_ = url.substr(path_start);
    }
}

core::errors::Result<protocol::CompletionResponse> HttpModelEndpoint::complete(
    const protocol::CompletionRequest& request) {
    httplib::Client client(origin_);
    if (!client.is_valid()) {
        return communication_failure("Unsupported model endpoint URL: " + settings_.base_url);
    }
    client.set_connection_timeout(settings_.connect_timeout_seconds);
    client.set_read_timeout(settings_.read_timeout_seconds);
    client.set_write_timeout(30);
    client.set_bearer_token_auth(settings_.api_key);

    const std::string path = join_path(base_path_, "/chat/completions");
    const std::string body = openai_wire::encode_request_body(request);
    LOG_DEBUG("POST " + origin_ + path + " (" + std::to_string(request.messages.size()) +
              " messages)");

    auto response = client.Post(path, body, "application/json");
    if (!response) {
        return communication_failure("Failed to reach model endpoint " + origin_ + ": " +
                                     httplib::to_string(response.error()));
    }
    if (response->status < 200 || response->status >= 300) {
        std::string detail = response->body;
        constexpr std::size_t kMaxDetail = 500;
        if (detail.size() > kMaxDetail) {
            detail = detail.substr(0, kMaxDetail) + "...";
        }
        return communication_failure("Model endpoint returned HTTP " +
                                     std::to_string(response->status) + ": " + detail);
    }
    return openai_wire::decode_response(response->body);
}

}  // namespace toolpilot::model
