#include "tools/builtin_tools.hpp"

#include <memory>
#include "tools/file_tools.hpp"

namespace toolpilot::tools {

void register_builtin_tools(ToolRegistryBuilder& builder, const runtime::ProcessEngine& engine,
                            const CodeToolOptions& options) {
    for (auto& tool : make_file_read_tools()) {
        builder.add(std::move(tool));
    }
    for (auto& tool : make_search_tools()) {
        builder.add(std::move(tool));
    }
    for (auto& tool : make_file_write_tools()) {
        builder.add(std::move(tool));
    }
    builder.add(std::make_shared<RunPythonCodeTool>(engine, options))
        .add(std::make_shared<RunPythonFileTool>(engine, options))
        .add(std::make_shared<RunShellCodeTool>(engine, options));
}

}  // namespace toolpilot::tools
