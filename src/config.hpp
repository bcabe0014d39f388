#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "utils.hpp"
#include "hooks.hpp"
#include "tool_input.hpp"
#include "checkpoint_hooks.hpp"
#include "rules/pattern_rule.hpp"

namespace toolguard {

// One externally configured hook, backed by a shell command
struct HookConfig {
    HookType type = HookType::pre_action;
    std::string command;
    std::string id;
    std::string name;
    int priority = kDefaultHookPriority;
    int timeout_ms = 0;  // 0 = executor default
    HookScope scope = HookScope::global;
    std::string agent_id;
    std::string task_id;

    std::vector<std::string> tool_patterns;     // pre/post action
    bool on_error_only = false;                 // post action
    std::vector<std::string> prompt_patterns;   // prompt
    std::vector<std::string> command_patterns;  // prompt
    std::vector<StopTrigger> triggers;          // stop
    bool run_on_failure = false;                // stop

    nlohmann::json to_json() const;
    // Throws std::invalid_argument on unknown type/scope/trigger strings
    static HookConfig from_json(const nlohmann::json& j);
};

struct SecurityConfig {
    bool enabled = true;
    std::vector<std::string> disabled_rules;
    ToolClassifier classifier;
    std::vector<PatternRuleSpec> custom_rules;

    // Resets the engine to the default rules, then layers custom rules and
    // disabled rules on top
    void apply(SecurityRuleEngine& engine) const;
};

struct Config {
    int default_timeout_ms = 5000;
    int max_hooks_per_type = static_cast<int>(kMaxHooksPerType);

    SecurityConfig security;
    AutoCheckpointConfig checkpoint;
    std::vector<HookConfig> hooks;

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace toolguard
