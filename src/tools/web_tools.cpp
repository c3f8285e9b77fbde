#include "tools/web_tools.hpp"

#include <httplib.h>

#include <chrono>
#include <cstdint>
#include <ctime>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "tools/function_tool.hpp"
#include "tools/tool_arguments.hpp"

namespace toolpilot::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using core::errors::Result;
using nlohmann::json;

namespace {

constexpr std::int64_t kDefaultTimeoutSeconds = 10;

struct UrlTarget {
    std::string origin;  // scheme://host[:port]
    std::string path;    // always starts with '/'
};

UrlTarget split_url(const std::string& url) {
    const auto host_start = url.find("://") + 3;
    const auto path_start = url.find_first_of("/?#", host_start);
    if (path_start == std::string::npos) {
        return {url, "/"};
    }
    std::string path = url.substr(path_start);
    if (path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    return {url.substr(0, path_start), path};
}

bool has_http_scheme(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

std::size_t count_lines(const std::string& content) {
    std::size_t lines = 1;
    for (const char c : content) {
        if (c == '\n') {
            ++lines;
        }
    }
    return lines;
}

std::shared_ptr<const Tool> make_get_url() {
    ToolSpec spec{"get_url",
                  "Fetch the content of an http:// or https:// URL.",
                  "n",
                  {required_param("url", ParamType::String,
                                  "The URL to fetch (must start with http:// or https://)"),
                   optional_param("max_length", ParamType::Integer,
                                  "Maximum number of characters to return", 5000),
                   optional_param("max_lines", ParamType::Integer,
                                  "Maximum number of lines to return", 200),
                   optional_param("timeout", ParamType::Integer,
                                  "Request timeout in seconds", kDefaultTimeoutSeconds),
                   optional_param("follow_redirects", ParamType::Boolean,
                                  "Whether to follow HTTP redirects", true)}};
    return std::make_shared<FunctionTool>(std::move(spec), [](const json& args) -> Result<json> {
        const std::string url = args.at("url").get<std::string>();
        if (!has_http_scheme(url)) {
            return AgentError{ErrorCategory::Execution,
                              "URL must start with http:// or https://: " + url, "invalid_url"};
        }
        const std::int64_t timeout = optional_int(args, "timeout").value_or(kDefaultTimeoutSeconds);
        if (timeout <= 0) {
            return AgentError{ErrorCategory::Execution,
                              "Timeout must be a positive number of seconds",
                              "invalid_timeout"};
        }

        const UrlTarget target = split_url(url);
        httplib::Client client(target.origin);
        if (!client.is_valid()) {
            return AgentError{ErrorCategory::Execution,
                              "Cannot fetch " + url + " (https requires TLS support)",
                              "invalid_url"};
        }
        client.set_connection_timeout(static_cast<std::time_t>(timeout));
        client.set_read_timeout(static_cast<std::time_t>(timeout));
        client.set_follow_location(args.at("follow_redirects").get<bool>());
        const httplib::Headers headers = {{"User-Agent", "toolpilot/0.1"}};

        LOG_INFO("Fetching URL: " + url);
        const auto started = std::chrono::steady_clock::now();
        auto response = client.Get(target.path, headers);
        const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - started)
                                    .count();
        if (!response) {
            return AgentError{ErrorCategory::Execution,
                              "Failed to fetch " + url + ": " +
                                  httplib::to_string(response.error()),
                              "url_fetch_failed"};
        }

        json payload;
        payload["url"] = url;
        payload["status_code"] = response->status;
        payload["execution_time_ms"] = static_cast<std::int64_t>(elapsed_ms);
        if (response->status >= 400) {
            payload["success"] = false;
            payload["error"] = "HTTP Error " + std::to_string(response->status);
            return payload;
        }

        const std::string content = limit_content(response->body, optional_int(args, "max_length"),
                                                  optional_int(args, "max_lines"));
        const std::size_t lines = count_lines(content);
        payload["success"] = true;
        payload["content"] = content;
        payload["content_length"] = response->body.size();
        payload["lines_returned"] = lines;
        LOG_INFO("Fetched " + std::to_string(response->body.size()) + " bytes (" +
                 std::to_string(lines) + " lines)");
        return payload;
    });
}

}  // namespace

std::string limit_content(std::string content, const std::optional<std::int64_t> max_length,
                          const std::optional<std::int64_t> max_lines) {
    if (max_length.has_value() && max_length.value() > 0 &&
        content.size() > static_cast<std::size_t>(max_length.value())) {
        content = content.substr(0, static_cast<std::size_t>(max_length.value())) +
                  kTruncatedMarker;
    }
    if (max_lines.has_value() && max_lines.value() > 0) {
        // Position of the max_lines-th newline, if the content has that many.
        std::size_t cut = std::string::npos;
        std::size_t from = 0;
        for (std::int64_t seen = 0; seen < max_lines.value(); ++seen) {
            cut = content.find('\n', from);
            if (cut == std::string::npos) {
                break;
            }
            from = cut + 1;
        }
        if (cut != std::string::npos) {
            content = content.substr(0, cut) + "\n" + kTruncatedMarker;
        }
    }
    return content;
}

std::vector<std::shared_ptr<const Tool>> make_web_tools() {
    return {make_get_url()};
}

}  // namespace toolpilot::tools
