#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "runtime/process_engine.hpp"
#include "tools/tool.hpp"

namespace toolpilot::tools {

struct CodeToolOptions {
    std::string python_executable = "python3";
    std::string shell_executable = "/bin/sh";
    std::uint32_t default_timeout_seconds = 60;
};

// Code tools hold a reference to the engine; the engine must outlive them.

class RunPythonCodeTool : public Tool {
public:
    RunPythonCodeTool(const runtime::ProcessEngine& engine, CodeToolOptions options);

    const ToolSpec& spec() const override { return spec_; }
    core::errors::Result<nlohmann::json> invoke(const nlohmann::json& args) const override;

private:
    const runtime::ProcessEngine& engine_;
    CodeToolOptions options_;
    ToolSpec spec_;
};

class RunPythonFileTool : public Tool {
public:
    RunPythonFileTool(const runtime::ProcessEngine& engine, CodeToolOptions options);

    const ToolSpec& spec() const override { return spec_; }
    core::errors::Result<nlohmann::json> invoke(const nlohmann::json& args) const override;

private:
    const runtime::ProcessEngine& engine_;
    CodeToolOptions options_;
    ToolSpec spec_;
};

class RunShellCodeTool : public Tool {
public:
    RunShellCodeTool(const runtime::ProcessEngine& engine, CodeToolOptions options);

    const ToolSpec& spec() const override { return spec_; }
    core::errors::Result<nlohmann::json> invoke(const nlohmann::json& args) const override;

private:
    const runtime::ProcessEngine& engine_;
    CodeToolOptions options_;
    ToolSpec spec_;
};

}  // namespace toolpilot::tools
