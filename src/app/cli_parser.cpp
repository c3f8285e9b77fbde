#include "cli_parser.hpp"
#include <charconv>
#include <cstddef>
#include <system_error>
#include <vector>

namespace toolpilot::app::cli {

    using namespace toolpilot::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::vector<std::string> positional;
        std::optional<std::string> cwd;
        std::optional<std::string> max_turns;
        std::optional<std::string> permissions;
        std::optional<std::string> transcript;
        bool chat = false;
        bool verbose = false;
        bool read_only = false;
        bool help = false;
    };

    std::string usage() {
        return "Usage: toolpilot [options] \"prompt\"\n"
               "       toolpilot [options] --chat\n"
               "\n"
               "Options:\n"
               "  -v, --verbose          Debug logging and model/backend details\n"
               "      --chat             Interactive session; type 'exit' or 'quit' to end\n"
               "      --max-turns N      Model calls allowed per prompt (1-1000, default 25)\n"
               "      --cwd DIR          Working directory for tools\n"
               "      --permissions F    Allowed tool permissions, subset of rwxn (default rwxn)\n"
               "      --read-only        Same as --permissions r\n"
               "      --transcript FILE  Append a JSONL transcript of the session to FILE\n"
               "  -h, --help             Show this help\n"
               "\n"
               "Environment:\n"
               "  API_KEY              API key for the model endpoint (required)\n"
               "  MODEL                Model name (required)\n"
               "  BASE_URL             OpenAI-compatible endpoint (default https://api.openai.com/v1)\n"
               "  TOOLPILOT_PYTHON     Python interpreter for code tools (default python3)\n"
               "  TOOLPILOT_LOG_LEVEL  debug, info, warn or error\n";
    }

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--cwd") {
                if (i + 1 < args.size()) raw.cwd = args[++i];
                else return AgentError{ErrorCategory::Input, "Missing value for --cwd", "missing_value"};
            } else if (args[i] == "--max-turns") {
                if (i + 1 < args.size()) raw.max_turns = args[++i];
                else return AgentError{ErrorCategory::Input, "Missing value for --max-turns", "missing_value"};
            } else if (args[i] == "--permissions") {
                if (i + 1 < args.size()) raw.permissions = args[++i];
                else return AgentError{ErrorCategory::Input, "Missing value for --permissions", "missing_value"};
            } else if (args[i] == "--transcript") {
                if (i + 1 < args.size()) raw.transcript = args[++i];
                else return AgentError{ErrorCategory::Input, "Missing value for --transcript", "missing_value"};
            } else if (args[i] == "--chat") {
                raw.chat = true;
            } else if (args[i] == "-v" || args[i] == "--verbose") {
                raw.verbose = true;
            } else if (args[i] == "--read-only") {
                raw.read_only = true;
            } else if (args[i] == "-h" || args[i] == "--help") {
                raw.help = true;
            } else if (args[i] == "--") {
                raw.positional.insert(raw.positional.end(), args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
                break;
            } else if (args[i].size() > 1 && args[i][0] == '-') {
                return AgentError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", usage()};
            } else {
                raw.positional.push_back(args[i]);
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliOptions opts;
        opts.verbose = raw.verbose;
        opts.chat = raw.chat;
        if (raw.help) {
            opts.show_help = true;
            return opts;
        }

        if (raw.positional.size() > 1) {
            return AgentError{ErrorCategory::Input, "Expected a single prompt argument", "unexpected_positional", "Quote the prompt: toolpilot \"...\""};
        }
        if (!raw.positional.empty()) {
            if (raw.chat) {
                return AgentError{ErrorCategory::Input, "Cannot combine a prompt with --chat", "conflicting_flags"};
            }
            if (raw.positional.front().find_first_not_of(" \t\r\n") == std::string::npos) {
                return AgentError{ErrorCategory::Input, "Empty prompt provided", "empty_prompt"};
            }
            opts.prompt = raw.positional.front();
        }

        // Exception-free integer parsing
        if (raw.max_turns) {
            uint32_t turns = 0;
            const char* begin = raw.max_turns->data();
            const char* end = raw.max_turns->data() + raw.max_turns->size();
            auto [ptr, ec] = std::from_chars(begin, end, turns);
            if (ec != std::errc() || ptr != end) {
                return AgentError{ErrorCategory::Input, "Invalid number for --max-turns", "invalid_integer", "Provide a positive integer."};
            }
            if (turns == 0 || turns > 1000) {
                return AgentError{ErrorCategory::Input, "--max-turns out of bounds", "bounds_error", "Must be between 1 and 1000."};
            }
            opts.max_turns = turns;
        }

        if (raw.read_only && raw.permissions) {
            return AgentError{ErrorCategory::Input, "Cannot provide both --read-only and --permissions", "conflicting_flags"};
        }
        if (raw.read_only) {
            opts.permissions = policy::PermissionPolicy::read_only();
        }
        if (raw.permissions) {
            auto parsed = policy::PermissionPolicy::parse(raw.permissions.value());
            if (is_error(parsed)) {
                return AgentError{ErrorCategory::Input, get_error(parsed).message, "invalid_permissions", "Use a subset of rwxn, e.g. --permissions rw."};
            }
            opts.permissions = get_value(parsed);
        }

        if (raw.transcript) {
            if (raw.transcript->empty()) {
                return AgentError{ErrorCategory::Input, "Transcript path cannot be empty", "invalid_path"};
            }
            opts.transcript_path = std::filesystem::path(raw.transcript.value());
        }

        // Path validation
        if (raw.cwd) {
            std::filesystem::path p(raw.cwd.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (path_ec || !exists) {
                return AgentError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return AgentError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return AgentError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            opts.working_directory = std::move(canonical_path);
        }

        return opts;
    }

} // namespace toolpilot::app::cli
