#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "policy/policy_guard.hpp"

namespace toolpilot::app::cli {

    struct CliOptions {
        std::optional<std::string> prompt;
        bool chat = false;
        bool verbose = false;
        bool show_help = false;
        std::optional<std::uint32_t> max_turns;
        std::optional<std::filesystem::path> working_directory;  // canonical
        std::optional<policy::PermissionPolicy> permissions;
        std::optional<std::filesystem::path> transcript_path;
    };

    // Errors are Input errors; main exits with status 2 on them.
    toolpilot::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
