#include "commands.hpp"
#include "shell_hook.hpp"
#include <iostream>
#include <iterator>

namespace toolguard {

constexpr int kExitBlocked = 2;

Runtime::Runtime(Config config)
    : config_(std::move(config))
    , engine_(std::make_shared<SecurityRuleEngine>(config_.security.classifier))
    , registry_(static_cast<size_t>(config_.max_hooks_per_type > 0 ? config_.max_hooks_per_type
                                                                   : static_cast<int>(kMaxHooksPerType)))
{
    config_.security.apply(*engine_);
    if (config_.security.enabled) {
        registry_.register_hook(make_security_hook(engine_));
    }

    if (config_.checkpoint.enabled) {
        try {
            checkpoint_store_ = std::make_shared<JsonlCheckpointStore>(config_.checkpoint.store_path);
            checkpoints_ = std::make_shared<AutoCheckpointHooks>(checkpoint_store_, config_.checkpoint);
            checkpoints_->register_hooks(registry_);
        } catch (const std::exception& e) {
            std::cerr << "[checkpoint] Disabled: " << e.what() << "\n";
        }
    }

    for (auto& hc : config_.hooks) {
        try {
            register_shell_hook(registry_, hc);
        } catch (const std::exception& e) {
            std::cerr << "[config] Failed to register hook " << hc.command << ": " << e.what() << "\n";
        }
    }
}

HookExecutor Runtime::executor() const {
    ExecutorOptions opts;
    if (config_.default_timeout_ms > 0) opts.default_timeout = std::chrono::milliseconds(config_.default_timeout_ms);
    opts.classifier = config_.security.classifier;
    return HookExecutor(registry_, opts);
}

static bool parse_json_arg(const std::string& text, nlohmann::json& out) {
    out = nlohmann::json::parse(text, nullptr, false);
    if (out.is_discarded()) {
        std::cerr << "Invalid JSON input\n";
        return false;
    }
    return true;
}

int cmd_check(const std::string& config_path, const std::string& tool, const std::string& input) {
    if (tool.empty()) {
        std::cerr << "Usage: toolguard check --tool NAME [--input JSON]\n";
        return 1;
    }
    nlohmann::json tool_input = nlohmann::json::object();
    if (!input.empty() && !parse_json_arg(input, tool_input)) return 1;

    Runtime rt(Config::load(config_path));
    auto eval = rt.engine().dry_run(tool, tool_input);
    std::cout << eval.to_json().dump(2) << "\n";
    return eval.allowed ? 0 : kExitBlocked;
}

int cmd_rules(const std::string& config_path, bool include_disabled) {
    Runtime rt(Config::load(config_path));
    auto rules = rt.engine().list_rules(include_disabled);

    std::cout << "=== toolguard rules ===\n";
    if (rules.empty()) {
        std::cout << "(none)\n";
        return 0;
    }
    for (auto& r : rules) {
        std::cout << (r.enabled ? "  [on]  " : "  [off] ") << r.id
                  << " (priority " << r.priority << ")\n";
        if (!r.description.empty()) std::cout << "        " << r.description << "\n";
    }
    return 0;
}

int cmd_hooks(const std::string& config_path) {
    Runtime rt(Config::load(config_path));
    auto stats = rt.registry().stats();

    std::cout << "=== toolguard hooks ===\n";
    std::cout << "Config path  : " << config_path << "\n";
    std::cout << "Pre-action   : " << stats.pre_action << "\n";
    std::cout << "Post-action  : " << stats.post_action << "\n";
    std::cout << "Prompt       : " << stats.prompt_submitted << "\n";
    std::cout << "Stop         : " << stats.stop << "\n";
    std::cout << "Total        : " << stats.total << "\n";

    for (auto& h : rt.registry().list_all()) {
        std::cout << "  " << to_string(h.type) << "  " << h.id << "  " << h.name
                  << " (priority " << h.priority << ", " << to_string(h.scope)
                  << (h.enabled ? "" : ", disabled") << ")\n";
    }
    return 0;
}

int cmd_event(const std::string& config_path, HookType type) {
    std::string text((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    nlohmann::json event;
    if (!parse_json_arg(text, event)) return 1;
    if (!event.is_object()) {
        std::cerr << "Event must be a JSON object\n";
        return 1;
    }

    Runtime rt(Config::load(config_path));
    auto exec = rt.executor();

    try {
        switch (type) {
            case HookType::pre_action: {
                auto out = exec.run_pre_action(ToolCallContext::from_json(event));
                std::cout << out.to_json().dump(2) << "\n";
                return out.allowed ? 0 : kExitBlocked;
            }
            case HookType::post_action: {
                auto out = exec.run_post_action(PostActionContext::from_json(event));
                std::cout << out.to_json().dump(2) << "\n";
                return 0;
            }
            case HookType::prompt_submitted: {
                auto out = exec.run_prompt_submitted(PromptContext::from_json(event));
                std::cout << out.to_json().dump(2) << "\n";
                return out.proceed ? 0 : kExitBlocked;
            }
            case HookType::stop: {
                auto out = exec.run_stop(StopContext::from_json(event));
                std::cout << out.to_json().dump(2) << "\n";
                return 0;
            }
        }
    } catch (const std::exception& e) {
        // Malformed event fields (unknown trigger, wrong types)
        std::cerr << "Invalid event: " << e.what() << "\n";
        return 1;
    }
    return 1;
}

} // namespace toolguard
