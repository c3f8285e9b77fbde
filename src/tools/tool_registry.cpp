#include "tools/tool_registry.hpp"

#include <unordered_set>
#include <utility>
#include "core/logging/logger.hpp"

namespace toolpilot::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

std::string to_schema_type(const ParamType type) {
    switch (type) {
        case ParamType::Integer:
            return "integer";
        case ParamType::Number:
            return "number";
        case ParamType::Boolean:
            return "boolean";
        default:
            return "string";
    }
}

json build_schema(const ToolDescriptor& descriptor) {
    json properties = json::object();
    json required = json::array();
    for (const auto& param : descriptor.spec.params) {
        json property;
        property["type"] = to_schema_type(param.type);
        if (!param.description.empty()) {
            property["description"] = param.description;
        }
        properties[param.name] = property;
        if (param.required()) {
            required.push_back(param.name);
        }
    }

    json schema;
    schema["name"] = descriptor.spec.name;
    schema["description"] = descriptor.spec.summary.empty()
                                ? "Function " + descriptor.spec.name
                                : descriptor.spec.summary;
    schema["parameters"] = {{"type", "object"},
                            {"properties", properties},
                            {"required", required}};
    return schema;
}

core::errors::Result<const ToolDescriptor*> ToolRegistry::resolve(
    const std::string& name) const {
    const auto it = index_.find(name);
    if (it == index_.end()) {
        std::string available;
        for (const auto& descriptor : descriptors_) {
            available += (available.empty() ? "" : ", ") + descriptor.name();
        }
        return AgentError{ErrorCategory::NotFound,
                          "Tool '" + name + "' not found. Available tools: [" +
                              available + "]",
                          "tool_not_found"};
    }
    return &descriptors_[it->second];
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(descriptors_.size());
    for (const auto& descriptor : descriptors_) {
        out.push_back(descriptor.name());
    }
    return out;
}

ToolRegistryBuilder& ToolRegistryBuilder::add(std::shared_ptr<const Tool> tool) {
    tools_.push_back(std::move(tool));
    return *this;
}

core::errors::Result<ToolRegistry> ToolRegistryBuilder::build() const {
    ToolRegistry registry;
    for (const auto& tool : tools_) {
        if (!tool) {
            return AgentError{ErrorCategory::Configuration,
                              "Cannot register a null tool.", "invalid_tool_spec"};
        }

        const ToolSpec& spec = tool->spec();
        if (spec.name.empty()) {
            return AgentError{ErrorCategory::Configuration,
                              "Tool name cannot be empty.", "invalid_tool_spec"};
        }
        if (registry.index_.count(spec.name) != 0) {
            return AgentError{ErrorCategory::Configuration,
                              "Tool '" + spec.name + "' is registered more than once.",
                              "duplicate_tool_name",
                              "Tool names must be unique across all tool sets."};
        }
        for (const char flag : spec.permissions) {
            if (flag != 'r' && flag != 'w' && flag != 'x' && flag != 'n') {
                return AgentError{ErrorCategory::Configuration,
                                  "Tool '" + spec.name + "' declares unknown permission '" +
                                      std::string(1, flag) + "'",
                                  "invalid_permission_flag"};
            }
        }
        std::unordered_set<std::string> param_names;
        for (const auto& param : spec.params) {
            if (param.name.empty() || !param_names.insert(param.name).second) {
                return AgentError{ErrorCategory::Configuration,
                                  "Tool '" + spec.name +
                                      "' has an empty or repeated parameter name.",
                                  "invalid_tool_spec"};
            }
        }

        registry.index_.emplace(spec.name, registry.descriptors_.size());
        registry.descriptors_.push_back(ToolDescriptor{spec, tool});
    }

    for (const auto& descriptor : registry.descriptors_) {
        registry.schemas_.push_back(
            json{{"type", "function"}, {"function", build_schema(descriptor)}});
    }
    LOG_DEBUG("ToolRegistry: registered " + std::to_string(registry.size()) + " tools");
    return registry;
}

}  // namespace toolpilot::tools
