#include "tools/tool_arguments.hpp"

#include <sstream>
#include <unordered_set>

namespace toolpilot::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

bool matches_type(const ParamType type, const json& value) {
    switch (type) {
        case ParamType::String:
        case ParamType::Path:
            return value.is_string();
        case ParamType::Integer:
            return value.is_number_integer();
        case ParamType::Number:
            return value.is_number();
        case ParamType::Boolean:
            return value.is_boolean();
        case ParamType::List:
            if (value.is_string()) {
                return true;
            }
            if (!value.is_array()) {
                return false;
            }
            for (const auto& item : value) {
                if (!item.is_string()) {
                    return false;
                }
            }
            return true;
        default:
            return false;
    }
}

json normalize_list(const json& value) {
    if (value.is_array()) {
        return value;
    }
    json items = json::array();
    std::istringstream in(value.get<std::string>());
    std::string token;
    while (in >> token) {
        items.push_back(token);
    }
    return items;
}

}  // namespace

core::errors::Result<json> bind_arguments(const ToolSpec& spec,
                                          const std::string& raw_arguments) {
    json supplied = json::object();
    if (!raw_arguments.empty()) {
        supplied = json::parse(raw_arguments, nullptr, false);
        if (supplied.is_discarded()) {
            return AgentError{ErrorCategory::Execution,
                              "Arguments for '" + spec.name + "' are not valid JSON.",
                              "invalid_tool_arguments"};
        }
        if (supplied.is_null()) {
            supplied = json::object();
        }
        if (!supplied.is_object()) {
            return AgentError{ErrorCategory::Execution,
                              "Arguments for '" + spec.name + "' must be a JSON object.",
                              "invalid_tool_arguments"};
        }
    }

    std::unordered_set<std::string> declared;
    for (const auto& param : spec.params) {
        declared.insert(param.name);
    }
    for (auto it = supplied.begin(); it != supplied.end(); ++it) {
        if (declared.count(it.key()) == 0) {
            return AgentError{ErrorCategory::Execution,
                              spec.name + "() got an unexpected argument '" + it.key() + "'",
                              "unexpected_argument"};
        }
    }

    json bound = json::object();
    for (const auto& param : spec.params) {
        const auto found = supplied.find(param.name);
        const bool given = found != supplied.end() && !found->is_null();
        if (!given) {
            if (param.required()) {
                return AgentError{ErrorCategory::Execution,
                                  spec.name + "() missing required argument '" +
                                      param.name + "'",
                                  "missing_argument"};
            }
            bound[param.name] = param.default_value.value();
            continue;
        }

        if (!matches_type(param.type, *found)) {
            return AgentError{ErrorCategory::Execution,
                              "Argument '" + param.name + "' of " + spec.name +
                                  "() must be of type " + to_schema_type(param.type),
                              "invalid_argument_type"};
        }
        bound[param.name] =
            param.type == ParamType::List ? normalize_list(*found) : *found;
    }
    return bound;
}

std::optional<std::string> optional_string(const json& args, const std::string& name) {
    const auto it = args.find(name);
    if (it == args.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<std::int64_t> optional_int(const json& args, const std::string& name) {
    const auto it = args.find(name);
    if (it == args.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<std::int64_t>();
}

std::vector<std::string> string_list(const json& args, const std::string& name) {
    std::vector<std::string> items;
    const auto it = args.find(name);
    if (it == args.end() || !it->is_array()) {
        return items;
    }
    for (const auto& item : *it) {
        items.push_back(item.get<std::string>());
    }
    return items;
}

}  // namespace toolpilot::tools
