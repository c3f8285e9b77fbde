#pragma once

#include <memory>
#include <vector>
#include "tools/tool.hpp"

namespace toolpilot::tools {

// read_file, read_file_lines, read_multiple_files, list_files
std::vector<std::shared_ptr<const Tool>> make_file_read_tools();

// create_file, replace_text_in_file, delete_file, create_directory,
// remove_directory
std::vector<std::shared_ptr<const Tool>> make_file_write_tools();

// search_text, search_regex
std::vector<std::shared_ptr<const Tool>> make_search_tools();

}  // namespace toolpilot::tools
