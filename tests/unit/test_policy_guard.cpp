#include <memory>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "policy/policy_guard.hpp"
#include "tools/function_tool.hpp"
#include "tools/tool_registry.hpp"

namespace {

using toolpilot::core::errors::ErrorCategory;
using toolpilot::core::errors::get_error;
using toolpilot::core::errors::get_value;
using toolpilot::core::errors::is_error;
using toolpilot::policy::PermissionPolicy;
using toolpilot::policy::PolicyGuard;
using toolpilot::tools::FunctionTool;
using toolpilot::tools::ToolDescriptor;
using toolpilot::tools::ToolSpec;

ToolDescriptor make_descriptor(const std::string& name, const std::string& permissions) {
    ToolSpec spec{name, "test tool", permissions, {}};
    auto handler = std::make_shared<FunctionTool>(
        spec, [](const nlohmann::json&) -> toolpilot::core::errors::Result<nlohmann::json> {
            return nlohmann::json::object();
        });
    return ToolDescriptor{spec, handler};
}

TEST(PolicyGuardTest, DefaultPolicyAllowsEverything) {
    PolicyGuard guard;
    EXPECT_EQ(guard.policy().allowed, "rwxn");

    auto result = guard.check(make_descriptor("run_shell_code", "x"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "x");
}

TEST(PolicyGuardTest, ReadOnlyDeniesWriteTools) {
    PolicyGuard guard(PermissionPolicy::read_only());

    EXPECT_FALSE(is_error(guard.check(make_descriptor("read_file", "r"))));

    auto denied = guard.check(make_descriptor("replace_text_in_file", "rw"));
    ASSERT_TRUE(is_error(denied));
    EXPECT_EQ(get_error(denied).category, ErrorCategory::Policy);
    EXPECT_EQ(get_error(denied).code, "permission_denied");
    EXPECT_NE(get_error(denied).message.find("'w'"), std::string::npos);
}

TEST(PolicyGuardTest, ToolWithoutPermissionsAlwaysPasses) {
    PolicyGuard guard(PermissionPolicy{""});
    auto result = guard.check(make_descriptor("echo", ""));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "");
}

TEST(PermissionPolicyTest, ParseNormalizesAndDeduplicates) {
    auto result = PermissionPolicy::parse("RwrX");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).allowed, "rwx");
    EXPECT_TRUE(get_value(result).allows('x'));
    EXPECT_FALSE(get_value(result).allows('n'));
}

TEST(PermissionPolicyTest, ParseRejectsUnknownFlag) {
    auto result = PermissionPolicy::parse("rq");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Configuration);
    EXPECT_EQ(get_error(result).code, "invalid_permission_flag");
}

TEST(PermissionPolicyTest, EmptyFlagsAllowNothing) {
    auto result = PermissionPolicy::parse("");
    ASSERT_FALSE(is_error(result));
    PolicyGuard guard(get_value(result));
    EXPECT_TRUE(is_error(guard.check(make_descriptor("read_file", "r"))));
}

}  // namespace
