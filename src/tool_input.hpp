#pragma once
#include <cstddef>
#include <regex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolguard {

// Explicit allow-lists deciding which rules apply to a tool
struct ToolClassifier {
    std::vector<std::string> file_write_tools = {"Edit", "Write", "work_product_store"};
    std::vector<std::string> command_tools = {"Bash", "Run", "Execute"};

    bool is_file_write(const std::string& tool_name) const;
    bool is_command_execution(const std::string& tool_name) const;
};

// Depth-first collection of every string value (object values, array items)
std::vector<std::string> extract_string_content(const nlohmann::json& input);

// Top-level "file_path", "path" and "files" entries
std::vector<std::string> extract_file_paths(const nlohmann::json& input);

std::string join_strings(const std::vector<std::string>& parts, const std::string& sep);

// std::regex recurses once per repeated character, so long inputs are
// searched in overlapping windows. '^' and '$' only match at the real ends
// of the text; a window edge still counts as a word boundary, so a token
// longer than a window is matched in truncated form.
constexpr size_t kRegexScanWindow = 4096;
constexpr size_t kRegexScanOverlap = 256;

// Window-by-window regex_search over the whole text; `match` (when given)
// refers into `text`
bool bounded_regex_search(const std::string& text, const std::regex& re, std::smatch* match = nullptr);

// '*' matches any run of characters; whole-string, case-insensitive
bool glob_match(const std::string& pattern, const std::string& name);

// Empty pattern list matches everything
bool matches_tool_pattern(const std::string& tool_name, const std::vector<std::string>& patterns);

// Case-insensitive regex search; invalid patterns never match
bool matches_prompt_pattern(const std::string& prompt, const std::vector<std::string>& patterns);

} // namespace toolguard
