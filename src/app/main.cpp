#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include "app/cli_parser.hpp"
#include "core/config/app_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "model/http_model_endpoint.hpp"
#include "policy/policy_guard.hpp"
#include "runtime/orchestrator.hpp"
#include "runtime/process_engine.hpp"
#include "session/transcript_writer.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/tool_registry.hpp"
#include "tools/web_tools.hpp"

namespace {

using toolpilot::core::errors::AgentError;

void report_error(const std::string& what, const AgentError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Live progress for the CLI: intermediate assistant text on stdout, tool
// activity and totals through the logger.
void print_event(const toolpilot::protocol::AgentEvent& event) {
    namespace protocol = toolpilot::protocol;
    if (const auto* turn = std::get_if<protocol::TurnStartEvent>(&event)) {
        LOG_DEBUG("Turn " + std::to_string(turn->turn));
    } else if (const auto* message = std::get_if<protocol::AssistantMessageEvent>(&event)) {
        if (message->tool_call_count > 0 && !message->content.empty()) {
            std::cout << message->content << std::endl;
        }
    } else if (const auto* start = std::get_if<protocol::ToolExecutionStartEvent>(&event)) {
        LOG_INFO("Tool " + start->tool_name + " [" + start->permissions + "]");
    } else if (const auto* end = std::get_if<protocol::ToolExecutionEndEvent>(&event)) {
        LOG_DEBUG("Tool " + end->tool_name + (end->success ? " succeeded" : " failed") +
                  " in " + std::to_string(static_cast<long long>(end->duration_ms)) + "ms");
    } else if (const auto* done = std::get_if<protocol::AgentEndEvent>(&event)) {
        LOG_INFO("Conversation " + protocol::to_string(done->reason) + " after " +
                 std::to_string(done->message_count) + " messages, " +
                 std::to_string(done->total_tokens) + " tokens");
    }
}

// One prompt through the orchestrator, with transcript bookkeeping.
bool answer_prompt(toolpilot::runtime::Orchestrator& orchestrator,
                   const toolpilot::session::TranscriptWriter* transcript,
                   const std::string& model, const std::string& prompt) {
    if (transcript != nullptr) {
        auto written = transcript->write_request(model, prompt);
        if (toolpilot::core::errors::is_error(written)) {
            report_error("Failed to write transcript", toolpilot::core::errors::get_error(written));
        }
    }

    auto answer = orchestrator.run(prompt);
    if (toolpilot::core::errors::is_error(answer)) {
        const auto& err = toolpilot::core::errors::get_error(answer);
        report_error("Conversation failed", err);
        if (transcript != nullptr) {
            auto written = transcript->write_final(false, "", err.message);
            if (toolpilot::core::errors::is_error(written)) {
                report_error("Failed to write transcript",
                             toolpilot::core::errors::get_error(written));
            }
        }
        return false;
    }

    const auto& text = toolpilot::core::errors::get_value(answer);
    std::cout << text << std::endl;
    if (transcript != nullptr) {
        auto written = transcript->write_final(true, text);
        if (toolpilot::core::errors::is_error(written)) {
            report_error("Failed to write transcript", toolpilot::core::errors::get_error(written));
        }
    }
    return true;
}

void run_chat(toolpilot::runtime::Orchestrator& orchestrator,
              const toolpilot::session::TranscriptWriter* transcript, const std::string& model) {
    std::cout << "Starting interactive chat session. Type 'exit' or 'quit' to end the session, "
                 "'/reset' to clear the history."
              << std::endl;
    std::string line;
    while (true) {
        std::cout << ">>> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        const std::string input = trim(line);
        const std::string command = lowercase(input);
        if (command == "exit" || command == "quit") {
            break;
        }
        if (command == "/reset") {
            orchestrator.reset();
            std::cout << "History cleared." << std::endl;
            continue;
        }
        if (input.empty()) {
            continue;
        }
        answer_prompt(orchestrator, transcript, model, input);
    }
    std::cout << "\nChat session ended." << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = toolpilot::core::errors;

    // 1. Session id for log lines and the transcript
    const std::string session_id = toolpilot::core::config::generate_session_id();
    toolpilot::core::logging::Logger::get().set_session_id(session_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = toolpilot::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    auto options = errors::get_value(parsed);
    if (options.show_help) {
        std::cout << toolpilot::app::cli::usage();
        return 0;
    }

    // 3. Prompt from stdin when piped
    if (!options.prompt.has_value() && !options.chat) {
        if (isatty(STDIN_FILENO)) {
            std::cout << toolpilot::app::cli::usage();
            return 0;
        }
        const std::string piped{std::istreambuf_iterator<char>(std::cin),
                                std::istreambuf_iterator<char>()};
        if (trim(piped).empty()) {
            LOG_ERROR("Input error [empty_prompt]: Empty prompt provided");
            return 2;
        }
        options.prompt = trim(piped);
    }

    // 4. Environment configuration, then CLI overrides
    auto loaded = toolpilot::core::config::load_from_environment(
        toolpilot::core::config::process_environment());
    if (errors::is_error(loaded)) {
        report_error("Configuration error", errors::get_error(loaded));
        return 1;
    }
    auto config = errors::get_value(loaded);
    config.verbose = options.verbose;
    if (options.verbose) {
        config.log_level = toolpilot::core::logging::LogLevel::DEBUG;
    }
    if (options.max_turns.has_value()) {
        config.max_turns = options.max_turns.value();
    }
    if (options.permissions.has_value()) {
        config.allowed_permissions = options.permissions->allowed;
    }
    if (options.transcript_path.has_value()) {
        // Relative to where toolpilot was started, not to --cwd
        std::error_code ec;
        auto absolute = std::filesystem::absolute(options.transcript_path.value(), ec);
        config.transcript_path = ec ? options.transcript_path.value() : absolute;
    }
    if (options.working_directory.has_value()) {
        std::error_code ec;
        std::filesystem::current_path(options.working_directory.value(), ec);
        if (ec) {
            LOG_ERROR("Input error [invalid_path]: Cannot enter working directory " +
                      options.working_directory->string() + ": " + ec.message());
            return 2;
        }
    }
    std::error_code cwd_ec;
    config.working_directory = std::filesystem::current_path(cwd_ec);
    toolpilot::core::logging::Logger::get().set_min_level(config.log_level);

    LOG_DEBUG("Model: " + config.model + " via " + config.base_url);
    LOG_DEBUG("Working directory: " + config.working_directory.string() +
              ", permissions: " + config.allowed_permissions);

    // 5. Tools. The engine outlives the registry that references it.
    toolpilot::runtime::ProcessEngine engine;
    toolpilot::tools::CodeToolOptions code_options;
    code_options.python_executable = config.python_executable;
    code_options.default_timeout_seconds = config.default_timeout_seconds;

    toolpilot::tools::ToolRegistryBuilder builder;
    toolpilot::tools::register_builtin_tools(builder, engine, code_options);
    for (auto& tool : toolpilot::tools::make_web_tools()) {
        builder.add(std::move(tool));
    }
    auto built = builder.build();
    if (errors::is_error(built)) {
        report_error("Tool registration failed", errors::get_error(built));
        return 1;
    }
    const auto& registry = errors::get_value(built);
    LOG_DEBUG("Registered " + std::to_string(registry.size()) + " tools");

    auto policy = toolpilot::policy::PermissionPolicy::parse(config.allowed_permissions);
    if (errors::is_error(policy)) {
        report_error("Configuration error", errors::get_error(policy));
        return 1;
    }

    // 6. Model endpoint and conversation
    toolpilot::model::EndpointSettings endpoint_settings;
    endpoint_settings.base_url = config.base_url;
    endpoint_settings.api_key = config.api_key;
    toolpilot::model::HttpModelEndpoint endpoint(endpoint_settings);

    toolpilot::runtime::OrchestratorOptions orchestrator_options;
    orchestrator_options.model = config.model;
    orchestrator_options.system_prompt = config.system_prompt;
    orchestrator_options.temperature = config.temperature;
    orchestrator_options.max_turns = config.max_turns;
    toolpilot::runtime::Orchestrator orchestrator(
        endpoint, registry, toolpilot::policy::PolicyGuard(errors::get_value(policy)),
        orchestrator_options);
    orchestrator.set_event_observer(print_event);

    std::unique_ptr<toolpilot::session::TranscriptWriter> transcript;
    if (config.transcript_path.has_value()) {
        transcript = std::make_unique<toolpilot::session::TranscriptWriter>(
            config.transcript_path.value(), session_id);
        const auto* writer = transcript.get();
        orchestrator.set_message_observer([writer](const toolpilot::protocol::Message& message) {
            auto written = writer->write_message(message);
            if (errors::is_error(written)) {
                LOG_WARN("Transcript write failed: " + errors::get_error(written).message);
            }
        });
        LOG_DEBUG("Transcript: " + config.transcript_path->string());
    }

    if (options.chat) {
        run_chat(orchestrator, transcript.get(), config.model);
        return 0;
    }
    return answer_prompt(orchestrator, transcript.get(), config.model, options.prompt.value())
               ? 0
               : 1;
}
