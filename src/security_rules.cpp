#include "security_rules.hpp"
#include "rules/default_rules.hpp"
#include "utils.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace toolguard {

nlohmann::json RuleResult::to_json() const {
    nlohmann::json j = {
        {"action", to_string(action)},
        {"rule_name", rule_name},
        {"reason", reason},
        {"severity", to_string(severity)},
    };
    if (!matched_pattern.empty()) j["matched_pattern"] = matched_pattern;
    if (!recommendation.empty()) j["recommendation"] = recommendation;
    return j;
}

nlohmann::json RuleSummary::to_json() const {
    return {{"id", id}, {"name", name}, {"description", description},
            {"enabled", enabled}, {"priority", priority}};
}

nlohmann::json SecurityEvaluation::to_json() const {
    nlohmann::json v = nlohmann::json::array();
    for (auto& r : violations) v.push_back(r.to_json());
    nlohmann::json w = nlohmann::json::array();
    for (auto& r : warnings) w.push_back(r.to_json());
    return {{"allowed", allowed}, {"action", to_string(action)}, {"violations", v},
            {"warnings", w}, {"execution_ms", execution_ms}};
}

SecurityRuleEngine::SecurityRuleEngine(ToolClassifier classifier, size_t max_rules)
    : classifier_(std::move(classifier)), max_rules_(max_rules) {}

void SecurityRuleEngine::register_rule(SecurityRule rule) {
    if (rule.id.empty()) throw std::invalid_argument("Security rule needs an id");
    if (!rule.evaluate) throw std::invalid_argument("Security rule '" + rule.id + "' has no evaluator");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [&](const SecurityRule& r) { return r.id == rule.id; });
    if (it != rules_.end()) {
        *it = std::move(rule);
        return;
    }
    if (rules_.size() >= max_rules_) {
        throw RegistryCapacityError("Maximum security rules (" + std::to_string(max_rules_) + ") reached");
    }
    rules_.push_back(std::move(rule));
}

bool SecurityRuleEngine::unregister_rule(const std::string& rule_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [&](const SecurityRule& r) { return r.id == rule_id; });
    if (it == rules_.end()) return false;
    rules_.erase(it);
    return true;
}

bool SecurityRuleEngine::toggle_rule(const std::string& rule_id, bool enabled) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& r : rules_) {
        if (r.id == rule_id) {
            r.enabled = enabled;
            return true;
        }
    }
    return false;
}

static RuleSummary summarize(const SecurityRule& r) {
    RuleSummary s;
    s.id = r.id;
    s.name = r.name;
    s.description = r.description;
    s.enabled = r.enabled;
    s.priority = r.priority;
    return s;
}

std::optional<RuleSummary> SecurityRuleEngine::get_rule(const std::string& rule_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (auto& r : rules_) {
        if (r.id == rule_id) return summarize(r);
    }
    return std::nullopt;
}

std::vector<RuleSummary> SecurityRuleEngine::list_rules(bool include_disabled) const {
    std::vector<RuleSummary> out;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (auto& r : rules_) {
            if (r.enabled || include_disabled) out.push_back(summarize(r));
        }
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const RuleSummary& a, const RuleSummary& b) { return a.priority > b.priority; });
    return out;
}

size_t SecurityRuleEngine::rule_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rules_.size();
}

void SecurityRuleEngine::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    rules_.clear();
}

void SecurityRuleEngine::reset_to_defaults() {
    clear();
    register_default_rules(*this);
}

SecurityEvaluation SecurityRuleEngine::evaluate(const std::string& tool_name,
                                                const nlohmann::json& tool_input,
                                                const nlohmann::json& metadata) const {
    auto start = std::chrono::steady_clock::now();

    ToolCallContext ctx;
    ctx.tool_name = tool_name;
    ctx.tool_input = tool_input.is_null() ? nlohmann::json::object() : tool_input;
    ctx.metadata = metadata.is_object() ? metadata : nlohmann::json::object();
    ctx.timestamp = now_iso8601();
    ctx.file_paths = extract_file_paths(ctx.tool_input);
    ctx.is_write_operation = classifier_.is_file_write(tool_name);
    ctx.is_command_execution = classifier_.is_command_execution(tool_name);

    // Snapshot so rule evaluation runs without holding the lock
    std::vector<SecurityRule> active;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (auto& r : rules_) {
            if (r.enabled) active.push_back(r);
        }
    }
    std::stable_sort(active.begin(), active.end(),
                     [](const SecurityRule& a, const SecurityRule& b) { return a.priority > b.priority; });

    SecurityEvaluation eval;
    for (auto& rule : active) {
        std::optional<RuleResult> result;
        try {
            result = rule.evaluate(ctx);
        } catch (const std::exception& e) {
            std::cerr << "[security] Error evaluating rule " << rule.id << ": " << e.what() << "\n";
            continue;
        } catch (...) {
            std::cerr << "[security] Error evaluating rule " << rule.id << ": Unknown error\n";
            continue;
        }
        if (!result) continue;
        if (result->rule_name.empty()) result->rule_name = rule.id;
        switch (result->action) {
            case SecurityAction::block: eval.violations.push_back(std::move(*result)); break;
            case SecurityAction::warn:  eval.warnings.push_back(std::move(*result)); break;
            case SecurityAction::allow: break;
        }
    }

    eval.allowed = eval.violations.empty();
    if (!eval.violations.empty()) eval.action = SecurityAction::block;
    else if (!eval.warnings.empty()) eval.action = SecurityAction::warn;
    else eval.action = SecurityAction::allow;

    eval.execution_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    return eval;
}

SecurityEvaluation SecurityRuleEngine::dry_run(const std::string& tool_name,
                                               const nlohmann::json& tool_input) const {
    return evaluate(tool_name, tool_input, {{"dryRun", true}});
}

static Severity highest_severity(const std::vector<RuleResult>& results) {
    Severity s = Severity::low;
    for (auto& r : results) {
        if (static_cast<int>(r.severity) > static_cast<int>(s)) s = r.severity;
    }
    return s;
}

PreActionHook make_security_hook(std::shared_ptr<const SecurityRuleEngine> engine, int priority) {
    if (!engine) throw std::invalid_argument("Security hook requires an engine");

    PreActionHook hook;
    hook.id = "security-rules";
    hook.name = "Security Rules";
    hook.description = "Evaluates tool calls against the security rule engine";
    hook.priority = priority;
    hook.tags = {"security"};

    hook.handler = [engine](const ToolCallContext& ctx) {
        auto eval = engine->evaluate(ctx.tool_name, ctx.tool_input, ctx.metadata);

        PreActionResult r;
        if (!eval.allowed) {
            std::vector<std::string> reasons;
            for (auto& v : eval.violations) reasons.push_back(v.reason);
            r.status = PreActionStatus::deny;
            r.reason = join_strings(reasons, "; ");
            r.severity = highest_severity(eval.violations);
        } else if (!eval.warnings.empty()) {
            r.status = PreActionStatus::warn;
            r.reason = eval.warnings.front().reason;
            for (auto& w : eval.warnings) r.warnings.push_back(w.reason);
            r.severity = highest_severity(eval.warnings);
        }
        return r;
    };
    return hook;
}

} // namespace toolguard
