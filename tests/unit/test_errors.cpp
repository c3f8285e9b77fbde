#include <string>
#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"

using namespace toolpilot::core::errors;

namespace {

// Stand-in for a tool step that can fail partway through
Result<int> count_lines(const std::string& text, bool readable) {
    if (!readable) {
        return AgentError{ErrorCategory::Execution, "Permission denied reading file",
                          "read_failed", "Check file permissions."};
    }
    int lines = 0;
    for (const char c : text) {
        lines += c == '\n' ? 1 : 0;
    }
    return lines;
}

Result<std::string> summarize(const std::string& text, bool readable) {
    auto counted = count_lines(text, readable);
    if (is_error(counted)) {
        return get_error(counted);
    }
    return std::to_string(get_value(counted)) + " lines";
}

}  // namespace

TEST(ErrorModelTest, CarriesValueOnSuccess) {
    auto result = summarize("a\nb\n", true);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "2 lines");
}

TEST(ErrorModelTest, PropagatesErrorUnchanged) {
    auto result = summarize("a\n", false);
    ASSERT_TRUE(is_error(result));

    const auto& error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Execution);
    EXPECT_EQ(error.code, "read_failed");
    EXPECT_EQ(error.hint, "Check file permissions.");
}

TEST(ErrorModelTest, ValueIsMutableThroughNonConstAccess) {
    Result<std::string> result = std::string("draft");
    get_value(result) += " final";
    EXPECT_EQ(get_value(result), "draft final");
}

TEST(ErrorModelTest, DefaultsCodeWhenNotGiven) {
    AgentError error{ErrorCategory::Internal, "boom"};
    EXPECT_EQ(error.code, "unknown_error");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, DescribesWithCode) {
    AgentError error{ErrorCategory::NotFound, "Tool 'x' not found", "tool_not_found"};
    EXPECT_EQ(describe(error), "[tool_not_found] Tool 'x' not found");
    EXPECT_EQ(to_string(ErrorCategory::Provider), "provider");
    EXPECT_EQ(to_string(ErrorCategory::Timeout), "timeout");
    EXPECT_EQ(to_string(ErrorCategory::Policy), "policy");
}
