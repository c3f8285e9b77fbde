#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "tools/tool.hpp"
#include "tools/tool_arguments.hpp"

namespace {

using nlohmann::json;
using toolpilot::core::errors::ErrorCategory;
using toolpilot::core::errors::get_error;
using toolpilot::core::errors::get_value;
using toolpilot::core::errors::is_error;
using toolpilot::tools::bind_arguments;
using toolpilot::tools::optional_int;
using toolpilot::tools::optional_param;
using toolpilot::tools::optional_string;
using toolpilot::tools::ParamType;
using toolpilot::tools::required_param;
using toolpilot::tools::string_list;
using toolpilot::tools::ToolSpec;

ToolSpec sample_spec() {
    return ToolSpec{"sample",
                    "Sample tool",
                    "r",
                    {required_param("path", ParamType::Path, "A path"),
                     optional_param("limit", ParamType::Integer, "A limit"),
                     optional_param("ratio", ParamType::Number, "A ratio", 0.5),
                     optional_param("verbose", ParamType::Boolean, "Verbose", false),
                     optional_param("extra", ParamType::List, "Extra args")}};
}

TEST(ToolArgumentsTest, FillsDefaultsForMissingOptionals) {
    auto result = bind_arguments(sample_spec(), R"({"path": "a.txt"})");
    ASSERT_FALSE(is_error(result));

    const auto& args = get_value(result);
    EXPECT_EQ(args.at("path"), "a.txt");
    EXPECT_TRUE(args.at("limit").is_null());
    EXPECT_DOUBLE_EQ(args.at("ratio").get<double>(), 0.5);
    EXPECT_EQ(args.at("verbose"), false);
    EXPECT_FALSE(optional_int(args, "limit").has_value());
    EXPECT_EQ(optional_string(args, "path").value(), "a.txt");
}

TEST(ToolArgumentsTest, RejectsMalformedJson) {
    auto result = bind_arguments(sample_spec(), "{\"path\": ");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Execution);
    EXPECT_EQ(get_error(result).code, "invalid_tool_arguments");
}

TEST(ToolArgumentsTest, RejectsNonObjectArguments) {
    auto result = bind_arguments(sample_spec(), "[1, 2]");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_tool_arguments");
}

TEST(ToolArgumentsTest, RejectsUnexpectedArgument) {
    auto result = bind_arguments(sample_spec(), R"({"path": "a", "colour": "red"})");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unexpected_argument");
    EXPECT_NE(get_error(result).message.find("colour"), std::string::npos);
}

TEST(ToolArgumentsTest, RejectsMissingRequiredArgument) {
    auto empty = bind_arguments(sample_spec(), "");
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "missing_argument");

    auto null_value = bind_arguments(sample_spec(), R"({"path": null})");
    ASSERT_TRUE(is_error(null_value));
    EXPECT_EQ(get_error(null_value).code, "missing_argument");
}

TEST(ToolArgumentsTest, RejectsWrongTypes) {
    auto as_string = bind_arguments(sample_spec(), R"({"path": "a", "limit": "ten"})");
    ASSERT_TRUE(is_error(as_string));
    EXPECT_EQ(get_error(as_string).code, "invalid_argument_type");

    auto as_float = bind_arguments(sample_spec(), R"({"path": "a", "limit": 1.5})");
    ASSERT_TRUE(is_error(as_float));
    EXPECT_EQ(get_error(as_float).code, "invalid_argument_type");

    auto bad_list = bind_arguments(sample_spec(), R"({"path": "a", "extra": [1, 2]})");
    ASSERT_TRUE(is_error(bad_list));
    EXPECT_EQ(get_error(bad_list).code, "invalid_argument_type");
}

TEST(ToolArgumentsTest, AcceptsIntegerForNumber) {
    auto result = bind_arguments(sample_spec(), R"({"path": "a", "ratio": 2})");
    ASSERT_FALSE(is_error(result));
    EXPECT_DOUBLE_EQ(get_value(result).at("ratio").get<double>(), 2.0);
}

TEST(ToolArgumentsTest, NormalizesListArguments) {
    auto from_string = bind_arguments(sample_spec(), R"({"path": "a", "extra": "-v  --count 3"})");
    ASSERT_FALSE(is_error(from_string));
    EXPECT_EQ(string_list(get_value(from_string), "extra"),
              (std::vector<std::string>{"-v", "--count", "3"}));

    auto from_array = bind_arguments(sample_spec(), R"({"path": "a", "extra": ["x y", "z"]})");
    ASSERT_FALSE(is_error(from_array));
    EXPECT_EQ(string_list(get_value(from_array), "extra"),
              (std::vector<std::string>{"x y", "z"}));

    auto absent = bind_arguments(sample_spec(), R"({"path": "a"})");
    ASSERT_FALSE(is_error(absent));
    EXPECT_TRUE(string_list(get_value(absent), "extra").empty());
}

}  // namespace
