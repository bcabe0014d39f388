#pragma once
#include "hooks.hpp"
#include "hook_registry.hpp"
#include "tool_input.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolguard {

constexpr size_t kMaxSecurityRules = 100;
constexpr int kDefaultRulePriority = 50;  // higher is evaluated first

struct RuleResult {
    SecurityAction action = SecurityAction::allow;
    std::string rule_name;
    std::string reason;
    Severity severity = Severity::medium;
    std::string matched_pattern;
    std::string recommendation;

    nlohmann::json to_json() const;
};

// Pure and synchronous; nullopt means the rule has no opinion
using RuleEvaluator = std::function<std::optional<RuleResult>(const ToolCallContext&)>;

struct SecurityRule {
    std::string id;
    std::string name;
    std::string description;
    bool enabled = true;
    int priority = kDefaultRulePriority;
    RuleEvaluator evaluate;
};

struct RuleSummary {
    std::string id;
    std::string name;
    std::string description;
    bool enabled = true;
    int priority = kDefaultRulePriority;

    nlohmann::json to_json() const;
};

struct SecurityEvaluation {
    bool allowed = true;
    SecurityAction action = SecurityAction::allow;
    std::vector<RuleResult> violations;
    std::vector<RuleResult> warnings;
    double execution_ms = 0.0;

    nlohmann::json to_json() const;
};

// Global rule set, independent from the hook registry. Every enabled rule
// is evaluated on every call, highest priority first, so callers always
// get the complete set of findings.
class SecurityRuleEngine {
public:
    explicit SecurityRuleEngine(ToolClassifier classifier = {}, size_t max_rules = kMaxSecurityRules);

    // Replaces a rule with the same id. Throws RegistryCapacityError.
    void register_rule(SecurityRule rule);
    bool unregister_rule(const std::string& rule_id);
    bool toggle_rule(const std::string& rule_id, bool enabled);

    std::optional<RuleSummary> get_rule(const std::string& rule_id) const;
    std::vector<RuleSummary> list_rules(bool include_disabled = true) const;
    size_t rule_count() const;

    void clear();
    // Drops every rule, custom ones included, and registers the default set
    void reset_to_defaults();

    SecurityEvaluation evaluate(const std::string& tool_name, const nlohmann::json& tool_input,
                                const nlohmann::json& metadata = nlohmann::json::object()) const;

    // Same evaluation, tagged {"dryRun": true}; for testing hypothetical calls
    SecurityEvaluation dry_run(const std::string& tool_name, const nlohmann::json& tool_input) const;

    const ToolClassifier& classifier() const { return classifier_; }

private:
    ToolClassifier classifier_;
    size_t max_rules_;
    std::vector<SecurityRule> rules_;  // registration order
    mutable std::shared_mutex mutex_;
};

// Adapts the engine into a pre-action hook: BLOCK -> deny, WARN -> warn.
// The hook shares ownership of the engine.
PreActionHook make_security_hook(std::shared_ptr<const SecurityRuleEngine> engine, int priority = 1);

} // namespace toolguard
