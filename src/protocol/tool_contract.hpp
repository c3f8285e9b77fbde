#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace toolpilot::protocol {

    // How the model asks the host to do something
    struct ToolCall {
        std::string id;
        std::string name;       // e.g., "read_file", "run_python_code"
        std::string arguments;  // Raw JSON string of the arguments
    };

    // How the host replies back. One per ToolCall, same id.
    struct ToolResult {
        std::string tool_call_id;
        bool success = false;
        nlohmann::json payload = nlohmann::json::object();
        std::optional<std::string> error;
        double duration_ms = 0.0;
    };

    inline ToolResult make_failure(const std::string& tool_call_id,
                                   const std::string& error) {
        ToolResult result;
        result.tool_call_id = tool_call_id;
        result.success = false;
        result.error = error;
        return result;
    }

    // The content string of the tool message fed back to the model:
    // {"success": ..., <payload fields>, "error": ...}
    inline std::string render_content(const ToolResult& result) {
        nlohmann::json content = nlohmann::json::object();
        content["success"] = result.success;
        if (result.payload.is_object()) {
            for (auto it = result.payload.begin(); it != result.payload.end(); ++it) {
                if (it.key() == "success") {
                    continue;
                }
                content[it.key()] = it.value();
            }
        }
        if (result.error.has_value()) {
            content["error"] = result.error.value();
        }
        // Program output may hold bytes that are not UTF-8.
        return content.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

} // namespace toolpilot::protocol
