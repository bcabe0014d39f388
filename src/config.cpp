#include "config.hpp"
#include "security_rules.hpp"
#include <fstream>
#include <iostream>

namespace toolguard {

nlohmann::json HookConfig::to_json() const {
    nlohmann::json j;
    j["type"] = to_string(type);
    j["command"] = command;
    if (!id.empty()) j["id"] = id;
    if (!name.empty()) j["name"] = name;
    j["priority"] = priority;
    if (timeout_ms > 0) j["timeout_ms"] = timeout_ms;
    if (scope != HookScope::global) {
        j["scope"] = to_string(scope);
        if (!agent_id.empty()) j["agent_id"] = agent_id;
        if (!task_id.empty()) j["task_id"] = task_id;
    }

    switch (type) {
        case HookType::pre_action:
            if (!tool_patterns.empty()) j["tool_patterns"] = tool_patterns;
            break;
        case HookType::post_action:
            if (!tool_patterns.empty()) j["tool_patterns"] = tool_patterns;
            if (on_error_only) j["on_error_only"] = true;
            break;
        case HookType::prompt_submitted:
            if (!prompt_patterns.empty()) j["prompt_patterns"] = prompt_patterns;
            if (!command_patterns.empty()) j["command_patterns"] = command_patterns;
            break;
        case HookType::stop: {
            nlohmann::json t = nlohmann::json::array();
            for (auto tr : triggers) t.push_back(to_string(tr));
            j["triggers"] = t;
            if (run_on_failure) j["run_on_failure"] = true;
            break;
        }
    }
    return j;
}

HookConfig HookConfig::from_json(const nlohmann::json& j) {
    HookConfig h;
    h.type = parse_hook_type(j.value("type", ""));
    h.command = j.value("command", "");
    if (h.command.empty()) throw std::invalid_argument("Hook has no command");
    h.id = j.value("id", "");
    h.name = j.value("name", "");
    h.priority = j.value("priority", kDefaultHookPriority);
    h.timeout_ms = j.value("timeout_ms", 0);
    if (j.contains("scope")) h.scope = parse_hook_scope(j["scope"].get<std::string>());
    h.agent_id = j.value("agent_id", "");
    h.task_id = j.value("task_id", "");

    if (j.contains("tool_patterns")) h.tool_patterns = parse_string_array(j["tool_patterns"]);
    h.on_error_only = j.value("on_error_only", false);
    if (j.contains("prompt_patterns")) h.prompt_patterns = parse_string_array(j["prompt_patterns"]);
    if (j.contains("command_patterns")) h.command_patterns = parse_string_array(j["command_patterns"]);
    if (j.contains("triggers")) {
        for (auto& t : parse_string_array(j["triggers"])) h.triggers.push_back(parse_stop_trigger(t));
    }
    h.run_on_failure = j.value("run_on_failure", false);
    return h;
}

void SecurityConfig::apply(SecurityRuleEngine& engine) const {
    engine.reset_to_defaults();
    for (auto& spec : custom_rules) {
        try {
            engine.register_rule(make_pattern_rule(spec));
        } catch (const std::exception& e) {
            std::cerr << "[config] Skipping custom rule " << spec.id << ": " << e.what() << "\n";
        }
    }
    for (auto& id : disabled_rules) {
        if (!engine.toggle_rule(id, false)) {
            std::cerr << "[config] Unknown rule in disabled_rules: " << id << "\n";
        }
    }
}

Config Config::make_default() {
    return Config{};
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["default_timeout_ms"] = default_timeout_ms;
    j["max_hooks_per_type"] = max_hooks_per_type;

    auto& sec = j["security"];
    sec["enabled"] = security.enabled;
    sec["disabled_rules"] = security.disabled_rules;
    sec["file_write_tools"] = security.classifier.file_write_tools;
    sec["command_tools"] = security.classifier.command_tools;
    sec["custom_rules"] = nlohmann::json::array();
    for (auto& r : security.custom_rules) sec["custom_rules"].push_back(r.to_json());

    j["checkpoint"] = checkpoint.to_json();

    j["hooks"] = nlohmann::json::array();
    for (auto& h : hooks) j["hooks"].push_back(h.to_json());
    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c = make_default();

    c.default_timeout_ms = j.value("default_timeout_ms", c.default_timeout_ms);
    c.max_hooks_per_type = j.value("max_hooks_per_type", c.max_hooks_per_type);

    if (j.contains("security")) {
        auto& sec = j["security"];
        c.security.enabled = sec.value("enabled", true);
        if (sec.contains("disabled_rules")) c.security.disabled_rules = parse_string_array(sec["disabled_rules"]);
        if (sec.contains("file_write_tools")) {
            c.security.classifier.file_write_tools = parse_string_array(sec["file_write_tools"]);
        }
        if (sec.contains("command_tools")) {
            c.security.classifier.command_tools = parse_string_array(sec["command_tools"]);
        }
        if (sec.contains("custom_rules") && sec["custom_rules"].is_array()) {
            for (auto& r : sec["custom_rules"]) {
                try {
                    c.security.custom_rules.push_back(PatternRuleSpec::from_json(r));
                } catch (const std::exception& e) {
                    std::cerr << "[config] Skipping custom rule: " << e.what() << "\n";
                }
            }
        }
    }

    if (j.contains("checkpoint")) {
        c.checkpoint = AutoCheckpointConfig::from_json(j["checkpoint"]);
    }

    // A bad hook entry is dropped on its own; the rest of the config stays
    if (j.contains("hooks") && j["hooks"].is_array()) {
        for (auto& h : j["hooks"]) {
            try {
                c.hooks.push_back(HookConfig::from_json(h));
            } catch (const std::exception& e) {
                std::cerr << "[config] Skipping hook: " << e.what() << "\n";
            }
        }
    }

    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[config] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[config] Failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    if (!f) throw std::runtime_error("Cannot write config: " + path);
    f << to_json().dump(2) << std::endl;
}

} // namespace toolguard
