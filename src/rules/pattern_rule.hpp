#pragma once
#include "../security_rules.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolguard {

// Declarative rule loaded from config: any pattern found in a top-level
// string value of the tool input triggers `action`.
struct PatternRuleSpec {
    std::string id;
    std::string name;
    std::string description;
    bool enabled = true;
    int priority = kDefaultRulePriority;
    std::vector<std::string> patterns;
    Severity severity = Severity::medium;
    SecurityAction action = SecurityAction::warn;

    nlohmann::json to_json() const;
    // Throws std::invalid_argument on a missing id or unknown enum value
    static PatternRuleSpec from_json(const nlohmann::json& j);
};

SecurityAction parse_security_action(const std::string& s);

// Patterns compile on first evaluation; invalid ones are logged and skipped
SecurityRule make_pattern_rule(const PatternRuleSpec& spec);

} // namespace toolguard
