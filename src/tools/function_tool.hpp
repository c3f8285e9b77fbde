#pragma once

#include <functional>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "tools/tool.hpp"

namespace toolpilot::tools {

// A Tool made of a static spec plus a plain handler function.
class FunctionTool : public Tool {
public:
    using Handler =
        std::function<core::errors::Result<nlohmann::json>(const nlohmann::json&)>;

    FunctionTool(ToolSpec spec, Handler handler)
        : spec_(std::move(spec)), handler_(std::move(handler)) {}

    const ToolSpec& spec() const override { return spec_; }

    core::errors::Result<nlohmann::json> invoke(const nlohmann::json& args) const override {
        return handler_(args);
    }

private:
    ToolSpec spec_;
    Handler handler_;
};

}  // namespace toolpilot::tools
