#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "tools/tool.hpp"

namespace toolpilot::tools {

struct ToolDescriptor {
    ToolSpec spec;
    std::shared_ptr<const Tool> handler;

    const std::string& name() const { return spec.name; }
    const std::string& permissions() const { return spec.permissions; }
};

// {name, description, parameters: {type: "object", properties, required}}
nlohmann::json build_schema(const ToolDescriptor& descriptor);

// Immutable name -> descriptor table. Created only by ToolRegistryBuilder;
// lookups need no locking.
class ToolRegistry {
public:
    core::errors::Result<const ToolDescriptor*> resolve(const std::string& name) const;

    // Function-calling envelopes {"type":"function","function":<schema>},
    // in registration order.
    const nlohmann::json& list_schemas() const { return schemas_; }

    std::vector<std::string> names() const;
    std::size_t size() const { return descriptors_.size(); }
    bool empty() const { return descriptors_.empty(); }

private:
    friend class ToolRegistryBuilder;
    ToolRegistry() = default;

    std::vector<ToolDescriptor> descriptors_;
    std::unordered_map<std::string, std::size_t> index_;
    nlohmann::json schemas_ = nlohmann::json::array();
};

class ToolRegistryBuilder {
public:
    ToolRegistryBuilder& add(std::shared_ptr<const Tool> tool);

    // Fails with a Configuration error on duplicate names, unknown permission
    // flags or malformed specs.
    core::errors::Result<ToolRegistry> build() const;

private:
    std::vector<std::shared_ptr<const Tool>> tools_;
};

}  // namespace toolpilot::tools
