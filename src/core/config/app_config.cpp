#include "core/config/app_config.hpp"

#include <cstdlib>

namespace toolpilot::core::config {

    using errors::AgentError;
    using errors::ErrorCategory;

    namespace {

        std::optional<std::string> non_empty(const EnvLookup& env, const std::string& name) {
            auto value = env(name);
            if (!value.has_value() || value->empty()) {
                return std::nullopt;
            }
            return value;
        }

    } // namespace

    EnvLookup process_environment() {
        return [](const std::string& name) -> std::optional<std::string> {
            const char* value = std::getenv(name.c_str());
            if (value == nullptr) {
                return std::nullopt;
            }
            return std::string(value);
        };
    }

    errors::Result<AppConfig> load_from_environment(const EnvLookup& env) {
        AppConfig config;

        const auto api_key = non_empty(env, "API_KEY");
        if (!api_key.has_value()) {
            return AgentError{ErrorCategory::Configuration,
                              "API_KEY environment variable is required",
                              "missing_api_key",
                              "export API_KEY=<key for the model endpoint>"};
        }
        config.api_key = api_key.value();

        const auto model = non_empty(env, "MODEL");
        if (!model.has_value()) {
            return AgentError{ErrorCategory::Configuration,
                              "MODEL environment variable is required",
                              "missing_model",
                              "export MODEL=<model name, e.g. gpt-4o-mini>"};
        }
        config.model = model.value();

        if (auto base_url = non_empty(env, "BASE_URL")) {
            std::string url = base_url.value();
            while (!url.empty() && url.back() == '/') {
                url.pop_back();
            }
            if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
                return AgentError{ErrorCategory::Configuration,
                                  "BASE_URL must start with http:// or https://: " + url,
                                  "invalid_config"};
            }
            config.base_url = url;
        }

        if (auto python = non_empty(env, "TOOLPILOT_PYTHON")) {
            config.python_executable = python.value();
        }

        if (auto level_text = non_empty(env, "TOOLPILOT_LOG_LEVEL")) {
            const auto level = logging::parse_level(level_text.value());
            if (!level.has_value()) {
                return AgentError{ErrorCategory::Configuration,
                                  "Unknown TOOLPILOT_LOG_LEVEL: " + level_text.value(),
                                  "invalid_config",
                                  "Use one of debug, info, warn, error."};
            }
            config.log_level = level.value();
        }

        return config;
    }

} // namespace toolpilot::core::config
