#pragma once

#include "runtime/process_engine.hpp"
#include "tools/code_tools.hpp"
#include "tools/tool_registry.hpp"

namespace toolpilot::tools {

// Adds every built-in file, search and code tool to the builder. The code
// tools keep a reference to the engine.
void register_builtin_tools(ToolRegistryBuilder& builder, const runtime::ProcessEngine& engine,
                            const CodeToolOptions& options);

}  // namespace toolpilot::tools
