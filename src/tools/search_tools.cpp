#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <system_error>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "tools/file_tools.hpp"
#include "tools/file_utils.hpp"
#include "tools/function_tool.hpp"
#include "tools/tool_arguments.hpp"

namespace toolpilot::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using core::errors::Result;
using nlohmann::json;
namespace fs = std::filesystem;

namespace {

using LineMatcher = std::function<bool(const std::string&)>;

struct SearchOptions {
    std::optional<std::int64_t> max_depth;
    std::optional<std::int64_t> max_results;
    bool count_only = false;
};

struct SearchState {
    std::vector<std::string> matches;
    json counts = json::object();
    std::size_t total_matches = 0;
    std::size_t files_searched = 0;
};

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool limit_reached(const SearchState& state, const SearchOptions& options) {
    return !options.count_only && options.max_results.has_value() &&
           options.max_results.value() > 0 &&
           state.matches.size() >= static_cast<std::size_t>(options.max_results.value());
}

void search_file(const fs::path& file, const LineMatcher& matcher, const SearchOptions& options,
                 SearchState& state) {
    std::error_code ec;
    const auto size = fs::file_size(file, ec);
    ++state.files_searched;
    if (ec || size > kMaxSearchFileBytes || is_probably_binary(file)) {
        return;
    }

    std::ifstream in(file);
    if (!in.is_open()) {
        return;
    }

    std::string line;
    std::size_t line_no = 0;
    std::size_t file_matches = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!matcher(line)) {
            continue;
        }
        ++file_matches;
        ++state.total_matches;
        if (!options.count_only) {
            state.matches.push_back(file.string() + ":" + std::to_string(line_no) + ": " + line);
            if (limit_reached(state, options)) {
                break;
            }
        }
    }
    if (options.count_only && file_matches > 0) {
        state.counts[file.string()] = file_matches;
    }
}

// Files directly inside root are at depth 0 and always searched; a
// subdirectory is entered only while its contents stay below max_depth.
void search_directory(const fs::path& root, const LineMatcher& matcher,
                      const SearchOptions& options, SearchState& state) {
    std::error_code ec;
    std::vector<fs::path> files;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec)) {
            if (options.max_depth.has_value() && it.depth() + 1 >= options.max_depth.value()) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (it->is_regular_file(entry_ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        LOG_WARN("Stopped walking " + root.string() + ": " + ec.message());
    }

    std::sort(files.begin(), files.end());
    for (const auto& file : files) {
        if (limit_reached(state, options)) {
            return;
        }
        search_file(file, matcher, options, state);
    }
}

Result<json> run_search(const json& args, const std::string& description,
                        const LineMatcher& matcher) {
    const auto paths = string_list(args, "paths");
    if (paths.empty()) {
        return AgentError{ErrorCategory::Execution, "No paths provided", "missing_paths"};
    }

    std::vector<fs::path> valid;
    for (const auto& path : paths) {
        const fs::path resolved = absolute_path(path);
        std::error_code ec;
        if (!fs::exists(resolved, ec) || ec) {
            LOG_WARN("Path does not exist: " + resolved.string());
            continue;
        }
        valid.push_back(resolved);
    }
    if (valid.empty()) {
        return AgentError{ErrorCategory::Execution, "No valid paths to search",
                          "no_valid_paths"};
    }

    SearchOptions options;
    options.max_depth = optional_int(args, "max_depth");
    options.max_results = optional_int(args, "max_results");
    options.count_only = args.at("count_only").get<bool>();

    LOG_INFO("Searching for " + description + " in " + std::to_string(valid.size()) +
             " path(s)");

    SearchState state;
    for (const auto& path : valid) {
        if (limit_reached(state, options)) {
            break;
        }
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            search_directory(path, matcher, options, state);
        } else {
            search_file(path, matcher, options, state);
        }
    }

    json payload;
    payload["success"] = true;
    if (options.count_only) {
        payload["counts"] = state.counts;
        payload["total_matches"] = state.total_matches;
    } else {
        payload["matches"] = state.matches;
        payload["total_matches"] = state.matches.size();
    }
    payload["files_searched"] = state.files_searched;
    LOG_INFO("Found " + std::to_string(payload["total_matches"].get<std::size_t>()) +
             " matches in " + std::to_string(state.files_searched) + " files");
    return payload;
}

std::vector<ParamSpec> search_params(ParamSpec needle) {
    return {required_param("paths", ParamType::List,
                           "Space-separated paths to search in (directories or files)"),
            std::move(needle),
            optional_param("case_sensitive", ParamType::Boolean,
                           "If false, perform a case-insensitive search", true),
            optional_param("max_depth", ParamType::Integer,
                           "Maximum directory depth to search (null = unlimited)"),
            optional_param("max_results", ParamType::Integer,
                           "Maximum number of results to return (null = unlimited)", 100),
            optional_param("count_only", ParamType::Boolean,
                           "Return per-file match counts instead of matching lines", false)};
}

std::shared_ptr<const Tool> make_search_text() {
    ToolSpec spec{"search_text",
                  "Search for exact text in files and directories.",
                  "r",
                  search_params(required_param("query", ParamType::String,
                                               "Exact text to search for"))};
    return std::make_shared<FunctionTool>(std::move(spec), [](const json& args) -> Result<json> {
        const std::string query = args.at("query").get<std::string>();
        if (query.empty()) {
            return AgentError{ErrorCategory::Execution, "Search query cannot be empty",
                              "empty_search_pattern"};
        }
        const bool case_sensitive = args.at("case_sensitive").get<bool>();
        const std::string needle = case_sensitive ? query : lowercase(query);
        return run_search(args, "text '" + query + "'",
                          [needle, case_sensitive](const std::string& line) {
                              return (case_sensitive ? line : lowercase(line)).find(needle) !=
                                     std::string::npos;
                          });
    });
}

std::shared_ptr<const Tool> make_search_regex() {
    ToolSpec spec{"search_regex",
                  "Search files and directories for lines matching a regular expression.",
                  "r",
                  search_params(required_param("pattern", ParamType::String,
                                               "ECMAScript regular expression to match"))};
    return std::make_shared<FunctionTool>(std::move(spec), [](const json& args) -> Result<json> {
        const std::string pattern = args.at("pattern").get<std::string>();
        auto flags = std::regex::ECMAScript;
        if (!args.at("case_sensitive").get<bool>()) {
            flags |= std::regex::icase;
        }

        std::regex compiled;
        try {
            compiled = std::regex(pattern, flags);
        } catch (const std::regex_error& e) {
            const std::string message = "Invalid regex pattern '" + pattern + "': " + e.what();
            return AgentError{ErrorCategory::Execution, message, "invalid_regex"};
        }
        return run_search(args, "pattern '" + pattern + "'",
                          [compiled](const std::string& line) {
                              return std::regex_search(line, compiled);
                          });
    });
}

}  // namespace

std::vector<std::shared_ptr<const Tool>> make_search_tools() {
    return {make_search_text(), make_search_regex()};
}

}  // namespace toolpilot::tools
