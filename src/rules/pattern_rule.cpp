#include "pattern_rule.hpp"
#include "../tool_input.hpp"
#include <iostream>
#include <memory>
#include <mutex>
#include <regex>

namespace toolguard {

SecurityAction parse_security_action(const std::string& s) {
    if (s == "allow") return SecurityAction::allow;
    if (s == "warn") return SecurityAction::warn;
    if (s == "block") return SecurityAction::block;
    throw std::invalid_argument("Unknown security action: " + s);
}

nlohmann::json PatternRuleSpec::to_json() const {
    return {
        {"id", id},
        {"name", name},
        {"description", description},
        {"enabled", enabled},
        {"priority", priority},
        {"patterns", patterns},
        {"severity", to_string(severity)},
        {"action", to_string(action)},
    };
}

PatternRuleSpec PatternRuleSpec::from_json(const nlohmann::json& j) {
    PatternRuleSpec s;
    s.id = j.value("id", "");
    if (s.id.empty()) throw std::invalid_argument("Custom rule needs an id");
    s.name = j.value("name", s.id);
    s.description = j.value("description", "");
    s.enabled = j.value("enabled", true);
    s.priority = j.value("priority", kDefaultRulePriority);
    if (j.contains("patterns")) s.patterns = parse_string_array(j["patterns"]);
    if (j.contains("severity")) s.severity = parse_severity(j["severity"].get<std::string>());
    if (j.contains("action")) s.action = parse_security_action(j["action"].get<std::string>());
    return s;
}

namespace {

struct CompiledPatterns {
    std::once_flag once;
    std::vector<std::pair<std::string, std::regex>> regexes;
};

void compile_patterns(const PatternRuleSpec& spec, CompiledPatterns& out) {
    for (auto& p : spec.patterns) {
        try {
            out.regexes.emplace_back(p, std::regex(p, std::regex::ECMAScript | std::regex::icase));
        } catch (const std::regex_error& e) {
            std::cerr << "[security] Invalid pattern in rule " << spec.id << ": " << p
                      << " (" << e.what() << ")\n";
        }
    }
}

} // namespace

SecurityRule make_pattern_rule(const PatternRuleSpec& spec) {
    SecurityRule rule;
    rule.id = spec.id;
    rule.name = spec.name.empty() ? spec.id : spec.name;
    rule.description = spec.description;
    rule.enabled = spec.enabled;
    rule.priority = spec.priority;

    auto compiled = std::make_shared<CompiledPatterns>();
    rule.evaluate = [spec, compiled](const ToolCallContext& ctx) -> std::optional<RuleResult> {
        std::call_once(compiled->once, [&] { compile_patterns(spec, *compiled); });
        if (compiled->regexes.empty()) return std::nullopt;

        std::vector<std::string> values;
        if (ctx.tool_input.is_object()) {
            for (auto it = ctx.tool_input.begin(); it != ctx.tool_input.end(); ++it) {
                if (it->is_string()) values.push_back(it->get<std::string>());
            }
        }
        std::string text = join_strings(values, "\n");
        if (text.empty()) return std::nullopt;

        for (auto& [source, re] : compiled->regexes) {
            if (!bounded_regex_search(text, re)) continue;
            RuleResult r;
            r.action = spec.action;
            r.rule_name = spec.id;
            r.reason = "Matched pattern: " + source;
            r.severity = spec.severity;
            r.matched_pattern = source;
            r.recommendation = "Review " + ctx.tool_name + " call for security concerns";
            return r;
        }
        return std::nullopt;
    };
    return rule;
}

} // namespace toolguard
