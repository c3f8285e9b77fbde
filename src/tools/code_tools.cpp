#include "tools/code_tools.hpp"

#include <filesystem>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/tool_arguments.hpp"

namespace toolpilot::tools {

using nlohmann::json;
using runtime::ExecutionRequest;
using runtime::ExecutionResult;

namespace {

std::string preview(const std::string& code) {
    constexpr std::size_t kMaxPreview = 200;
    if (code.size() <= kMaxPreview) {
        return code;
    }
    return code.substr(0, kMaxPreview) + "...";
}

// Parameters shared by every code tool, appended after the tool's own ones.
void add_execution_params(std::vector<ParamSpec>& params,
                          const std::uint32_t default_timeout) {
    params.push_back(optional_param(
        "working_directory", ParamType::Path,
        "Working directory for execution (default: current directory)"));
    params.push_back(optional_param(
        "timeout", ParamType::Integer,
        "Maximum execution time in seconds (0 for no limit)", default_timeout));
    params.push_back(optional_param("capture_output", ParamType::Boolean,
                                    "Whether to capture standard output", true));
    params.push_back(optional_param("capture_errors", ParamType::Boolean,
                                    "Whether to capture standard error", true));
}

core::errors::Result<ExecutionRequest> make_request(const json& args, std::string executable,
                                                   std::vector<std::string> exec_args) {
    const auto timeout = optional_int(args, "timeout");
    if (timeout.has_value() && timeout.value() < 0) {
        return core::errors::AgentError{
            core::errors::ErrorCategory::Execution,
            "Timeout must be 0 (no limit) or a positive number of seconds, got " +
                std::to_string(timeout.value()),
            "invalid_timeout"};
    }

    ExecutionRequest request;
    request.executable = std::move(executable);
    request.args = std::move(exec_args);
    const auto dir = optional_string(args, "working_directory");
    if (dir.has_value() && !dir->empty()) {
        request.working_directory = dir.value();
    }
    request.timeout_seconds = timeout.has_value() ? static_cast<std::uint32_t>(timeout.value()) : 0;
    request.capture_stdout = args.value("capture_output", true);
    request.capture_stderr = args.value("capture_errors", true);
    return request;
}

std::string describe_directory(const ExecutionRequest& request) {
    if (!request.working_directory.empty()) {
        return request.working_directory.string();
    }
    std::error_code ec;
    return std::filesystem::current_path(ec).string();
}

// Engine result -> tool payload. Process failures stay data: the model sees
// the exit code and whatever the program printed.
json report(const ExecutionRequest& request, const ExecutionResult& result,
            const std::string& command, const std::string& label) {
    json payload;
    payload["success"] = result.success();
    payload["exit_code"] = result.exit_code;
    payload["command"] = command;
    payload["working_directory"] = describe_directory(request);
    payload["execution_time_ms"] = result.elapsed_ms;
    payload["timed_out"] = result.timed_out;
    if (result.stdout_capture.has_value()) {
        payload["stdout"] = result.stdout_capture->text();
    }
    if (result.stderr_capture.has_value()) {
        payload["stderr"] = result.stderr_capture->text();
    }

    if (result.error.has_value()) {
        payload["error"] = result.error->message;
        LOG_DEBUG(label + " failed: " + core::errors::describe(result.error.value()));
    } else if (!result.success()) {
        payload["error"] = label + " failed with exit code " + std::to_string(result.exit_code);
    } else {
        std::string summary = "Completed in " + std::to_string(result.elapsed_ms) + "ms";
        if (result.stdout_capture.has_value() && !result.stdout_capture->lines.empty()) {
            summary += " (" + std::to_string(result.stdout_capture->lines.size()) +
                       " lines output)";
        }
        LOG_INFO(summary);
    }
    return payload;
}

std::string interpreter_for(const json& args, const CodeToolOptions& options) {
    const auto chosen = optional_string(args, "python_executable");
    if (chosen.has_value() && !chosen->empty()) {
        return chosen.value();
    }
    return options.python_executable;
}

}  // namespace

RunPythonCodeTool::RunPythonCodeTool(const runtime::ProcessEngine& engine,
                                     CodeToolOptions options)
    : engine_(engine), options_(std::move(options)) {
    spec_.name = "run_python_code";
    spec_.summary = "Execute Python code and return its output, errors and exit code.";
    spec_.permissions = "x";
    spec_.params.push_back(required_param(
        "code", ParamType::String,
        "Python code to execute (single statement or multi-line script)"));
    add_execution_params(spec_.params, options_.default_timeout_seconds);
    spec_.params.push_back(optional_param(
        "python_executable", ParamType::Path,
        "Path to the Python executable (default: configured interpreter)"));
}

core::errors::Result<json> RunPythonCodeTool::invoke(const json& args) const {
    const std::string code = args.at("code").get<std::string>();
    auto prepared = make_request(args, interpreter_for(args, options_), {"-c", code});
    if (core::errors::is_error(prepared)) {
        return core::errors::get_error(prepared);
    }
    const auto& request = core::errors::get_value(prepared);
    LOG_INFO("Executing Python code in " + describe_directory(request) + ":\n" + preview(code));
    return report(request, engine_.execute(request), code, "Python execution");
}

RunPythonFileTool::RunPythonFileTool(const runtime::ProcessEngine& engine,
                                     CodeToolOptions options)
    : engine_(engine), options_(std::move(options)) {
    spec_.name = "run_python_file";
    spec_.summary = "Execute a Python script file and return its output, errors and exit code.";
    spec_.permissions = "x";
    spec_.params.push_back(required_param("file_path", ParamType::Path,
                                          "Path to the Python file to execute"));
    add_execution_params(spec_.params, options_.default_timeout_seconds);
    spec_.params.push_back(optional_param(
        "python_executable", ParamType::Path,
        "Path to the Python executable (default: configured interpreter)"));
    spec_.params.push_back(optional_param(
        "additional_args", ParamType::List,
        "Additional command-line arguments passed to the script"));
}

core::errors::Result<json> RunPythonFileTool::invoke(const json& args) const {
    const std::string file_path = args.at("file_path").get<std::string>();
    std::vector<std::string> exec_args{file_path};
    const auto extra = string_list(args, "additional_args");
    exec_args.insert(exec_args.end(), extra.begin(), extra.end());

    const std::string interpreter = interpreter_for(args, options_);
    auto prepared = make_request(args, interpreter, exec_args);
    if (core::errors::is_error(prepared)) {
        return core::errors::get_error(prepared);
    }
    const auto& request = core::errors::get_value(prepared);

    std::string command = interpreter;
    for (const auto& arg : exec_args) {
        command += " " + arg;
    }
    LOG_INFO("Executing Python file in " + describe_directory(request) + ": " + command);

    json payload = report(request, engine_.execute(request), command, "Python execution");
    payload["file_path"] = file_path;
    return payload;
}

RunShellCodeTool::RunShellCodeTool(const runtime::ProcessEngine& engine,
                                   CodeToolOptions options)
    : engine_(engine), options_(std::move(options)) {
    spec_.name = "run_shell_code";
    spec_.summary = "Execute a POSIX shell script and return its output, errors and exit code.";
    spec_.permissions = "x";
    spec_.params.push_back(required_param("code", ParamType::String,
                                          "Shell commands to execute"));
    add_execution_params(spec_.params, options_.default_timeout_seconds);
}

core::errors::Result<json> RunShellCodeTool::invoke(const json& args) const {
    const std::string code = args.at("code").get<std::string>();
    auto prepared = make_request(args, options_.shell_executable, {"-c", code});
    if (core::errors::is_error(prepared)) {
        return core::errors::get_error(prepared);
    }
    const auto& request = core::errors::get_value(prepared);
    LOG_INFO("Executing shell code in " + describe_directory(request) + ":\n" + preview(code));
    return report(request, engine_.execute(request), code, "Shell execution");
}

}  // namespace toolpilot::tools
