#include "tools/file_tools.hpp"

#include <algorithm>
#include <cstdint>
#include <fnmatch.h>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
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

AgentError failure(const std::string& message, const std::string& code) {
    return AgentError{ErrorCategory::Execution, message, code};
}

Result<fs::path> existing_file(const std::string& filepath) {
    const fs::path path = absolute_path(filepath);
    std::error_code ec;
    if (!fs::exists(path, ec) || ec) {
        return failure("File does not exist: " + path.string(), "file_not_found");
    }
    if (!fs::is_regular_file(path, ec) || ec) {
        return failure("Path is not a file: " + path.string(), "not_a_file");
    }
    if (is_probably_binary(path)) {
        return failure("Refusing to read binary file: " + path.string(), "binary_file");
    }
    return path;
}

Result<std::vector<std::string>> read_lines(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return failure("Failed to open file: " + path.string(), "file_open_failed");
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    if (in.bad()) {
        return failure("I/O error while reading file: " + path.string(), "file_read_failed");
    }
    return lines;
}

Result<std::string> read_all(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return failure("Failed to open file: " + path.string(), "file_open_failed");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return failure("I/O error while reading file: " + path.string(), "file_read_failed");
    }
    return buffer.str();
}

std::string join_lines(const std::vector<std::string>& lines, const std::size_t begin,
                       const std::size_t end) {
    std::string out;
    for (std::size_t i = begin; i < end; ++i) {
        if (i != begin) {
            out += '\n';
        }
        out += lines[i];
    }
    return out;
}

// Full content, or only the first max_lines lines.
Result<json> read_file_content(const std::string& filepath,
                               const std::optional<std::int64_t> max_lines) {
    auto resolved = existing_file(filepath);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const fs::path path = core::errors::get_value(resolved);

    json payload;
    payload["filepath"] = filepath;
    if (max_lines.has_value()) {
        auto lines = read_lines(path);
        if (core::errors::is_error(lines)) {
            return core::errors::get_error(lines);
        }
        const auto& all = core::errors::get_value(lines);
        const std::size_t limit = std::min<std::size_t>(
            all.size(), static_cast<std::size_t>(std::max<std::int64_t>(0, max_lines.value())));
        payload["content"] = join_lines(all, 0, limit);
        payload["lines_read"] = limit;
        payload["max_lines"] = max_lines.value();
    } else {
        auto content = read_all(path);
        if (core::errors::is_error(content)) {
            return core::errors::get_error(content);
        }
        const auto& text = core::errors::get_value(content);
        payload["content"] = text;
        std::size_t line_count = static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
        if (!text.empty() && text.back() != '\n') {
            ++line_count;
        }
        payload["lines_read"] = line_count;
        payload["max_lines"] = nullptr;
    }
    payload["success"] = true;
    return payload;
}

std::vector<std::string> split_comma_list(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream in(text);
    std::string item;
    while (std::getline(in, item, ',')) {
        const auto first = item.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        const auto last = item.find_last_not_of(" \t");
        items.push_back(item.substr(first, last - first + 1));
    }
    return items;
}

bool matches_glob(const std::string& name, const std::optional<std::string>& pattern) {
    return !pattern.has_value() || fnmatch(pattern->c_str(), name.c_str(), 0) == 0;
}

std::shared_ptr<const Tool> make_read_file() {
    ToolSpec spec{"read_file",
                  "Read the contents of a file.",
                  "r",
                  {required_param("filepath", ParamType::Path, "The path to the file to read"),
                   optional_param("max_lines", ParamType::Integer,
                                  "Maximum number of lines to read (for large files)")}};
    return std::make_shared<FunctionTool>(std::move(spec), [](const json& args) {
        const std::string filepath = args.at("filepath").get<std::string>();
        LOG_INFO("Reading file: " + absolute_path(filepath).string());
        return read_file_content(filepath, optional_int(args, "max_lines"));
    });
}

std::shared_ptr<const Tool> make_read_file_lines() {
    ToolSpec spec{"read_file_lines",
                  "Read a range of lines from a file (1-based, inclusive).",
                  "r",
                  {required_param("filepath", ParamType::Path, "The path to the file to read"),
                   optional_param("from_line", ParamType::Integer,
                                  "Starting line number (1-based). Defaults to the first line."),
                   optional_param("to_line", ParamType::Integer,
                                  "Ending line number (1-based). Defaults to the last line.")}};
    return std::make_shared<FunctionTool>(std::move(spec), [](const json& args) -> Result<json> {
        const std::string filepath = args.at("filepath").get<std::string>();
        auto resolved = existing_file(filepath);
        if (core::errors::is_error(resolved)) {
            return core::errors::get_error(resolved);
        }
        auto lines = read_lines(core::errors::get_value(resolved));
        if (core::errors::is_error(lines)) {
            return core::errors::get_error(lines);
        }
        const auto& all = core::errors::get_value(lines);
        const auto total = static_cast<std::int64_t>(all.size());

        const std::int64_t from = optional_int(args, "from_line").value_or(1);
        const std::int64_t to = std::min(optional_int(args, "to_line").value_or(total), total);
        if (from < 1) {
            return failure("from_line must be 1 or greater", "invalid_line_range");
        }
        if (from > total && total > 0) {
            return failure("from_line " + std::to_string(from) + " is beyond the end of file (" +
                               std::to_string(total) + " lines)",
                           "invalid_line_range");
        }
        if (to < from - 1) {
            return failure("to_line must not be less than from_line", "invalid_line_range");
        }

        json payload;
        payload["success"] = true;
        payload["filepath"] = filepath;
        payload["content"] = join_lines(all, static_cast<std::size_t>(from - 1),
                                        static_cast<std::size_t>(std::max(to, from - 1)));
        payload["from_line"] = from;
        payload["to_line"] = to;
        payload["total_lines"] = total;
        payload["lines_read"] = std::max<std::int64_t>(0, to - from + 1);
        return payload;
    });
}

std::shared_ptr<const Tool> make_read_multiple_files() {
    ToolSpec spec{"read_multiple_files",
                  "Read the contents of multiple files.",
                  "r",
                  {required_param("filepaths", ParamType::String,
                                  "Comma-separated list of file paths to read"),
                   optional_param("max_lines", ParamType::Integer,
                                  "Maximum number of lines to read per file")}};
    return std::make_shared<FunctionTool>(std::move(spec), [](const json& args) -> Result<json> {
        const auto paths = split_comma_list(args.at("filepaths").get<std::string>());
        if (paths.empty()) {
            return failure("No file paths provided", "missing_paths");
        }

        json files = json::array();
        std::size_t succeeded = 0;
        for (const auto& path : paths) {
            auto read = read_file_content(path, optional_int(args, "max_lines"));
            json entry;
            if (core::errors::is_error(read)) {
                entry["filepath"] = path;
                entry["success"] = false;
                entry["error"] = core::errors::get_error(read).message;
            } else {
                entry = core::errors::get_value(read);
                ++succeeded;
            }
            files.push_back(entry);
        }
        LOG_INFO("Read " + std::to_string(succeeded) + " of " + std::to_string(paths.size()) +
                 " files");

        json payload;
        payload["success"] = succeeded > 0;
        payload["files"] = files;
        payload["total_files"] = paths.size();
        payload["successful_reads"] = succeeded;
        payload["failed_reads"] = paths.size() - succeeded;
        if (succeeded == 0) {
            payload["error"] = "None of the requested files could be read";
        }
        return payload;
    });
}

std::shared_ptr<const Tool> make_list_files() {
    ToolSpec spec{"list_files",
                  "List files and directories in the specified path.",
                  "r",
                  {optional_param("directory", ParamType::Path, "Directory to list", "."),
                   optional_param("pattern", ParamType::String,
                                  "Shell-style wildcard filter on names, e.g. *.cpp"),
                   optional_param("recursive", ParamType::Boolean,
                                  "Whether to descend into subdirectories", false),
                   optional_param("max_depth", ParamType::Integer,
                                  "Maximum recursion depth (0 = top level only)")}};
    return std::make_shared<FunctionTool>(std::move(spec), [](const json& args) -> Result<json> {
        const std::string directory = args.at("directory").get<std::string>();
        const auto pattern = optional_string(args, "pattern");
        const bool recursive = args.at("recursive").get<bool>();
        const auto max_depth = optional_int(args, "max_depth");

        const fs::path root = absolute_path(directory);
        std::error_code ec;
        if (!fs::exists(root, ec) || ec) {
            return failure("Directory does not exist: " + root.string(), "directory_not_found");
        }
        if (!fs::is_directory(root, ec) || ec) {
            return failure("Path is not a directory: " + root.string(), "not_a_directory");
        }
        LOG_INFO("Listing files at " + root.string() + (recursive ? " recursively" : ""));

        std::vector<std::string> entries;
        std::size_t file_count = 0;
        std::size_t dir_count = 0;
        auto visit = [&](const fs::directory_entry& entry) {
            std::error_code entry_ec;
            if (entry.is_directory(entry_ec)) {
                ++dir_count;
            } else {
                ++file_count;
            }
            if (matches_glob(entry.path().filename().string(), pattern)) {
                entries.push_back(entry.path().lexically_relative(root).string());
            }
        };

        const auto options = fs::directory_options::skip_permission_denied;
        if (recursive) {
            fs::recursive_directory_iterator it(root, options, ec);
            for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                if (max_depth.has_value() && it.depth() > max_depth.value()) {
                    it.disable_recursion_pending();
                    continue;
                }
                visit(*it);
                if (max_depth.has_value() && it.depth() >= max_depth.value()) {
                    it.disable_recursion_pending();
                }
            }
        } else {
            for (fs::directory_iterator it(root, options, ec);
                 !ec && it != fs::directory_iterator(); it.increment(ec)) {
                visit(*it);
            }
        }
        if (ec) {
            return failure("Error during file listing: " + ec.message(), "list_failed");
        }
        std::sort(entries.begin(), entries.end());

        json payload;
        payload["success"] = true;
        payload["files"] = entries;
        payload["directory"] = directory;
        payload["pattern"] = pattern.has_value() ? json(pattern.value()) : json(nullptr);
        payload["recursive"] = recursive;
        payload["max_depth"] = max_depth.has_value() ? json(max_depth.value()) : json(nullptr);
        payload["stats"] = {{"total_items", entries.size()},
                            {"files", file_count},
                            {"directories", dir_count}};
        return payload;
    });
}

std::shared_ptr<const Tool> make_create_file() {
    ToolSpec spec{"create_file",
                  "Create a new file with the specified content.",
                  "w",
                  {required_param("filepath", ParamType::Path,
                                  "The path where the file should be created"),
                   optional_param("content", ParamType::String,
                                  "Content to write to the file", ""),
                   optional_param("overwrite", ParamType::Boolean,
                                  "Whether to overwrite an existing file", false)}};
    return std::make_shared<FunctionTool>(std::move(spec), [](const json& args) -> Result<json> {
        const std::string filepath = args.at("filepath").get<std::string>();
        const std::string content = args.at("content").get<std::string>();
        const bool overwrite = args.at("overwrite").get<bool>();
        const fs::path path = absolute_path(filepath);

        std::error_code ec;
        const bool existed = fs::exists(path, ec);
        if (existed && fs::is_directory(path, ec)) {
            return failure("Path is a directory: " + path.string(), "not_a_file");
        }
        if (existed && !overwrite) {
            return failure("File already exists: " + path.string() +
                               " (set overwrite=true to replace it)",
                           "file_exists");
        }
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                return failure("Failed to create parent directory: " +
                                   path.parent_path().string(),
                               "directory_create_failed");
            }
        }

        LOG_INFO("Creating file: " + path.string());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return failure("Failed to open file for writing: " + path.string(),
                           "file_open_failed");
        }
        out << content;
        if (!out.good()) {
            return failure("Failed to write file: " + path.string(), "file_write_failed");
        }

        json payload;
        payload["success"] = true;
        payload["filepath"] = filepath;
        payload["bytes_written"] = content.size();
        payload["overwritten"] = existed;
        return payload;
    });
}

std::shared_ptr<const Tool> make_replace_text_in_file() {
    ToolSpec spec{"replace_text_in_file",
                  "Replace exact text in a file.",
                  "rw",
                  {required_param("filepath", ParamType::Path, "The path to the file to modify"),
                   required_param("old_str", ParamType::String, "The exact text to replace"),
                   required_param("new_str", ParamType::String, "The replacement text"),
                   optional_param("replace_all", ParamType::Boolean,
                                  "Replace every occurrence instead of exactly one", false)}};
    return std::make_shared<FunctionTool>(std::move(spec), [](const json& args) -> Result<json> {
        const std::string filepath = args.at("filepath").get<std::string>();
        const std::string old_str = args.at("old_str").get<std::string>();
        const std::string new_str = args.at("new_str").get<std::string>();
        const bool replace_all = args.at("replace_all").get<bool>();
        if (old_str.empty()) {
            return failure("old_str cannot be empty", "empty_search_text");
        }

        auto resolved = existing_file(filepath);
        if (core::errors::is_error(resolved)) {
            return core::errors::get_error(resolved);
        }
        const fs::path path = core::errors::get_value(resolved);
        auto read = read_all(path);
        if (core::errors::is_error(read)) {
            return core::errors::get_error(read);
        }
        std::string text = core::errors::get_value(read);

        std::size_t occurrences = 0;
        for (auto pos = text.find(old_str); pos != std::string::npos;
             pos = text.find(old_str, pos + old_str.size())) {
            ++occurrences;
        }
        if (occurrences == 0) {
            return failure("Text not found in " + path.string(), "text_not_found");
        }
        if (occurrences > 1 && !replace_all) {
            return failure("Found " + std::to_string(occurrences) + " occurrences in " +
                               path.string() +
                               "; provide more context or set replace_all=true",
                           "ambiguous_match");
        }

        std::string updated;
        updated.reserve(text.size());
        std::size_t start = 0;
        for (auto pos = text.find(old_str); pos != std::string::npos;
             pos = text.find(old_str, start)) {
            updated.append(text, start, pos - start);
            updated += new_str;
            start = pos + old_str.size();
        }
        updated.append(text, start, std::string::npos);

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << updated;
        if (!out.good()) {
            return failure("Failed to write file: " + path.string(), "file_write_failed");
        }
        LOG_INFO("Replaced " + std::to_string(occurrences) + " occurrence(s) in " + path.string());

        json payload;
        payload["success"] = true;
        payload["filepath"] = filepath;
        payload["replacements"] = occurrences;
        return payload;
    });
}

std::shared_ptr<const Tool> make_delete_file() {
    ToolSpec spec{"delete_file",
                  "Delete a file from the filesystem.",
                  "w",
                  {required_param("filepath", ParamType::Path, "The path to the file to delete"),
                   optional_param("force", ParamType::Boolean,
                                  "Delete without checking that the path is a regular file",
                                  false)}};
    return std::make_shared<FunctionTool>(std::move(spec), [](const json& args) -> Result<json> {
        const std::string filepath = args.at("filepath").get<std::string>();
        const bool force = args.at("force").get<bool>();
        const fs::path path = absolute_path(filepath);

        std::error_code ec;
        if (!fs::exists(fs::symlink_status(path, ec))) {
            return failure("File does not exist: " + path.string(), "file_not_found");
        }
        if (!force && !fs::is_regular_file(fs::symlink_status(path, ec))) {
            return failure("Path is not a file: " + path.string(), "not_a_file");
        }
        if (!fs::remove(path, ec) || ec) {
            return failure("Failed to delete " + path.string() +
                               (ec ? ": " + ec.message() : std::string()),
                           "delete_failed");
        }
        LOG_INFO("Deleted file: " + path.string());

        json payload;
        payload["success"] = true;
        payload["filepath"] = filepath;
        return payload;
    });
}

std::shared_ptr<const Tool> make_create_directory() {
    ToolSpec spec{"create_directory",
                  "Create a new directory.",
                  "w",
                  {required_param("directory", ParamType::Path,
                                  "The path where the directory should be created"),
                   optional_param("parents", ParamType::Boolean,
                                  "Create missing parent directories", false),
                   optional_param("exist_ok", ParamType::Boolean,
                                  "Succeed if the directory already exists", false)}};
    return std::make_shared<FunctionTool>(std::move(spec), [](const json& args) -> Result<json> {
        const std::string directory = args.at("directory").get<std::string>();
        const bool parents = args.at("parents").get<bool>();
        const bool exist_ok = args.at("exist_ok").get<bool>();
        const fs::path path = absolute_path(directory);

        std::error_code ec;
        json payload;
        payload["directory"] = directory;
        if (fs::exists(path, ec)) {
            if (!fs::is_directory(path, ec)) {
                return failure("Path exists and is not a directory: " + path.string(),
                               "not_a_directory");
            }
            if (!exist_ok) {
                return failure("Directory already exists: " + path.string(), "directory_exists");
            }
            payload["success"] = true;
            payload["created"] = false;
            return payload;
        }

        if (!parents && !fs::is_directory(path.parent_path(), ec)) {
            return failure("Parent directory does not exist: " + path.parent_path().string() +
                               " (set parents=true to create it)",
                           "parent_not_found");
        }
        if (parents) {
            fs::create_directories(path, ec);
        } else {
            fs::create_directory(path, ec);
        }
        if (ec) {
            return failure("Failed to create directory " + path.string() + ": " + ec.message(),
                           "directory_create_failed");
        }
        LOG_INFO("Created directory: " + path.string());
        payload["success"] = true;
        payload["created"] = true;
        return payload;
    });
}

std::shared_ptr<const Tool> make_remove_directory() {
    ToolSpec spec{"remove_directory",
                  "Remove a directory from the filesystem.",
                  "w",
                  {required_param("directory", ParamType::Path,
                                  "The path to the directory to remove"),
                   optional_param("recursive", ParamType::Boolean,
                                  "Remove the directory and all of its contents", false),
                   optional_param("force", ParamType::Boolean,
                                  "Succeed even if the directory does not exist", false)}};
    return std::make_shared<FunctionTool>(std::move(spec), [](const json& args) -> Result<json> {
        const std::string directory = args.at("directory").get<std::string>();
        const bool recursive = args.at("recursive").get<bool>();
        const bool force = args.at("force").get<bool>();
        const fs::path path = absolute_path(directory);

        std::error_code ec;
        json payload;
        payload["directory"] = directory;
        if (!fs::exists(path, ec)) {
            if (force) {
                payload["success"] = true;
                payload["removed_items"] = 0;
                return payload;
            }
            return failure("Directory does not exist: " + path.string(), "directory_not_found");
        }
        if (!fs::is_directory(path, ec)) {
            return failure("Path is not a directory: " + path.string(), "not_a_directory");
        }
        if (!recursive && !fs::is_empty(path, ec)) {
            return failure("Directory is not empty: " + path.string() +
                               " (set recursive=true to remove its contents)",
                           "directory_not_empty");
        }

        const std::uintmax_t removed = recursive ? fs::remove_all(path, ec)
                                                 : static_cast<std::uintmax_t>(fs::remove(path, ec));
        if (ec) {
            return failure("Failed to remove directory " + path.string() + ": " + ec.message(),
                           "directory_remove_failed");
        }
        LOG_INFO("Removed directory: " + path.string());
        payload["success"] = true;
        payload["removed_items"] = removed;
        return payload;
    });
}

}  // namespace

std::vector<std::shared_ptr<const Tool>> make_file_read_tools() {
    return {make_read_file(), make_read_file_lines(), make_read_multiple_files(),
            make_list_files()};
}

std::vector<std::shared_ptr<const Tool>> make_file_write_tools() {
    return {make_create_file(), make_replace_text_in_file(), make_delete_file(),
            make_create_directory(), make_remove_directory()};
}

}  // namespace toolpilot::tools
