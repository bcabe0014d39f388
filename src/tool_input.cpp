#include "tool_input.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <regex>

namespace toolguard {

bool ToolClassifier::is_file_write(const std::string& tool_name) const {
    return std::find(file_write_tools.begin(), file_write_tools.end(), tool_name) != file_write_tools.end();
}

bool ToolClassifier::is_command_execution(const std::string& tool_name) const {
    return std::find(command_tools.begin(), command_tools.end(), tool_name) != command_tools.end();
}

static void collect_strings(const nlohmann::json& node, std::vector<std::string>& out) {
    if (node.is_string()) {
        out.push_back(node.get<std::string>());
    } else if (node.is_array() || node.is_object()) {
        for (auto& child : node) collect_strings(child, out);
    }
}

std::vector<std::string> extract_string_content(const nlohmann::json& input) {
    std::vector<std::string> content;
    collect_strings(input, content);
    return content;
}

std::vector<std::string> extract_file_paths(const nlohmann::json& input) {
    std::vector<std::string> paths;
    if (!input.is_object()) return paths;

    auto it = input.find("file_path");
    if (it != input.end() && it->is_string()) paths.push_back(it->get<std::string>());

    it = input.find("path");
    if (it != input.end() && it->is_string()) paths.push_back(it->get<std::string>());

    it = input.find("files");
    if (it != input.end() && it->is_array()) {
        for (auto& f : *it) {
            if (f.is_string()) paths.push_back(f.get<std::string>());
        }
    }
    return paths;
}

std::string join_strings(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

bool bounded_regex_search(const std::string& text, const std::regex& re, std::smatch* match) {
    std::smatch local;
    std::smatch& m = match ? *match : local;

    size_t pos = 0;
    while (true) {
        size_t len = std::min(kRegexScanWindow, text.size() - pos);
        auto flags = std::regex_constants::match_default;
        if (pos > 0) flags |= std::regex_constants::match_not_bol;
        if (pos + len < text.size()) flags |= std::regex_constants::match_not_eol;

        auto first = text.cbegin() + static_cast<std::ptrdiff_t>(pos);
        if (std::regex_search(first, first + static_cast<std::ptrdiff_t>(len), m, re, flags)) return true;
        if (pos + len >= text.size()) return false;
        pos += kRegexScanWindow - kRegexScanOverlap;
    }
}

bool glob_match(const std::string& pattern, const std::string& name) {
    std::string p = to_lower(pattern);
    std::string n = to_lower(name);

    size_t pi = 0, ni = 0;
    size_t star = std::string::npos, resume = 0;
    while (ni < n.size()) {
        if (pi < p.size() && p[pi] == '*') {
            star = pi++;
            resume = ni;
        } else if (pi < p.size() && p[pi] == n[ni]) {
            ++pi;
            ++ni;
        } else if (star != std::string::npos) {
            pi = star + 1;
            ni = ++resume;
        } else {
            return false;
        }
    }
    while (pi < p.size() && p[pi] == '*') ++pi;
    return pi == p.size();
}

bool matches_tool_pattern(const std::string& tool_name, const std::vector<std::string>& patterns) {
    if (patterns.empty()) return true;
    return std::any_of(patterns.begin(), patterns.end(),
                       [&](const std::string& p) { return glob_match(p, tool_name); });
}

// Prompt patterns come from hook registrations, so compile each once and
// remember failures as well.
static std::shared_ptr<const std::regex> compiled_prompt_pattern(const std::string& pattern) {
    static std::mutex mutex;
    static std::map<std::string, std::shared_ptr<const std::regex>> cache;

    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(pattern);
    if (it != cache.end()) return it->second;

    std::shared_ptr<const std::regex> re;
    try {
        re = std::make_shared<const std::regex>(
            pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        std::cerr << "[hooks] Invalid prompt pattern '" << pattern << "': " << e.what() << "\n";
    }
    cache.emplace(pattern, re);
    return re;
}

bool matches_prompt_pattern(const std::string& prompt, const std::vector<std::string>& patterns) {
    if (patterns.empty()) return true;
    for (auto& p : patterns) {
        auto re = compiled_prompt_pattern(p);
        if (re && bounded_regex_search(prompt, *re)) return true;
    }
    return false;
}

} // namespace toolguard
