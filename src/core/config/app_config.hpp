#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"

namespace toolpilot::core::config {

    constexpr const char* kDefaultBaseUrl = "https://api.openai.com/v1";
    constexpr const char* kDefaultSystemPrompt =
        "You are a helpful assistant with access to tools for reading, searching and "
        "editing files and for running Python and shell code in the user's working "
        "directory. Use them when they help answer the request, then reply with a "
        "concise final answer.";

    struct AppConfig {
        // Endpoint
        std::string base_url = kDefaultBaseUrl;
        std::string api_key;
        std::string model;

        // Conversation
        double temperature = 1.0;
        std::uint32_t max_turns = 25;
        std::string system_prompt = kDefaultSystemPrompt;

        // Tools
        std::string python_executable = "python3";
        std::uint32_t default_timeout_seconds = 60;
        std::string allowed_permissions = "rwxn";
        std::filesystem::path working_directory;

        // Diagnostics
        bool verbose = false;
        logging::LogLevel log_level = logging::LogLevel::INFO;
        std::optional<std::filesystem::path> transcript_path;
    };

    // Returns the variable's value, or nullopt when unset.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    EnvLookup process_environment();

    // Reads BASE_URL, API_KEY, MODEL, TOOLPILOT_PYTHON and TOOLPILOT_LOG_LEVEL.
    // Empty values count as unset.
    errors::Result<AppConfig> load_from_environment(const EnvLookup& env);

} // namespace toolpilot::core::config
