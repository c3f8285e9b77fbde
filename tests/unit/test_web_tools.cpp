#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "tools/tool_arguments.hpp"
#include "tools/web_tools.hpp"

namespace {

using nlohmann::json;
using toolpilot::core::errors::get_error;
using toolpilot::core::errors::get_value;
using toolpilot::core::errors::is_error;
using toolpilot::core::errors::Result;
using toolpilot::tools::limit_content;
using toolpilot::tools::Tool;

// Serves a few fixed routes on an ephemeral loopback port.
class LocalServer {
public:
    LocalServer() {
        server_.Get("/hello", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("line1\nline2\nline3", "text/plain");
        });
        server_.Get("/missing", [](const httplib::Request&, httplib::Response& res) {
            res.status = 404;
            res.set_content("nope", "text/plain");
        });
        server_.Get("/moved", [](const httplib::Request&, httplib::Response& res) {
            res.set_redirect("/hello");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        for (int i = 0; i < 200 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    ~LocalServer() {
        server_.stop();
        thread_.join();
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
};

std::shared_ptr<const Tool> get_url_tool() {
    auto tools = toolpilot::tools::make_web_tools();
    return tools.at(0);
}

Result<json> call(const json& arguments) {
    const auto tool = get_url_tool();
    auto bound = toolpilot::tools::bind_arguments(tool->spec(), arguments.dump());
    if (is_error(bound)) {
        return get_error(bound);
    }
    return tool->invoke(get_value(bound));
}

TEST(WebToolsTest, DeclaresNetworkPermission) {
    const auto tool = get_url_tool();
    EXPECT_EQ(tool->spec().name, "get_url");
    EXPECT_EQ(tool->spec().permissions, "n");
}

TEST(WebToolsTest, FetchesContentAndStatus) {
    LocalServer server;
    auto result = call({{"url", server.url("/hello")}});
    ASSERT_FALSE(is_error(result));
    const json& payload = get_value(result);

    EXPECT_EQ(payload["success"], true);
    EXPECT_EQ(payload["status_code"], 200);
    EXPECT_EQ(payload["content"], "line1\nline2\nline3");
    EXPECT_EQ(payload["content_length"], 17);
    EXPECT_EQ(payload["lines_returned"], 3);
    EXPECT_EQ(payload["url"], server.url("/hello"));
}

TEST(WebToolsTest, TruncatesToMaxLines) {
    LocalServer server;
    auto result = call({{"url", server.url("/hello")}, {"max_lines", 2}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["content"], "line1\nline2\n... [truncated]");
    EXPECT_EQ(get_value(result)["content_length"], 17);
}

TEST(WebToolsTest, HttpErrorStatusIsAFailedResult) {
    LocalServer server;
    auto result = call({{"url", server.url("/missing")}});
    ASSERT_FALSE(is_error(result));
    const json& payload = get_value(result);
    EXPECT_EQ(payload["success"], false);
    EXPECT_EQ(payload["status_code"], 404);
    EXPECT_EQ(payload["error"], "HTTP Error 404");
}

TEST(WebToolsTest, RedirectsFollowedUnlessDisabled) {
    LocalServer server;
    auto followed = call({{"url", server.url("/moved")}});
    ASSERT_FALSE(is_error(followed));
    EXPECT_EQ(get_value(followed)["status_code"], 200);
    EXPECT_EQ(get_value(followed)["content"], "line1\nline2\nline3");

    auto held = call({{"url", server.url("/moved")}, {"follow_redirects", false}});
    ASSERT_FALSE(is_error(held));
    EXPECT_EQ(get_value(held)["status_code"], 302);
}

TEST(WebToolsTest, RejectsNonHttpUrlsAndBadTimeouts) {
    auto scheme = call({{"url", "ftp://example.com/file"}});
    ASSERT_TRUE(is_error(scheme));
    EXPECT_EQ(get_error(scheme).code, "invalid_url");

    auto timeout = call({{"url", "http://127.0.0.1/"}, {"timeout", 0}});
    ASSERT_TRUE(is_error(timeout));
    EXPECT_EQ(get_error(timeout).code, "invalid_timeout");
}

TEST(WebToolsTest, UnreachableServerIsReported) {
    // Port 1 is privileged and has nothing listening on loopback.
    auto result = call({{"url", "http://127.0.0.1:1/"}, {"timeout", 2}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "url_fetch_failed");
}

TEST(WebToolsTest, LimitsContentByLengthThenLines) {
    EXPECT_EQ(limit_content("abcdef", 3, std::nullopt), "abc... [truncated]");
    EXPECT_EQ(limit_content("a\nb\nc", std::nullopt, 5), "a\nb\nc");
    EXPECT_EQ(limit_content("a\nb\n", std::nullopt, 2), "a\nb\n... [truncated]");
    EXPECT_EQ(limit_content("a\nb\nc", 0, 0), "a\nb\nc");
}

}  // namespace
