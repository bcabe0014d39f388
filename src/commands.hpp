#pragma once
#include "config.hpp"
#include "hook_executor.hpp"
#include "hook_registry.hpp"
#include "security_rules.hpp"
#include <memory>
#include <string>

namespace toolguard {

// Everything a command needs, wired from one Config: the registry holds
// the security hook, the checkpoint hooks and every configured shell hook.
class Runtime {
public:
    explicit Runtime(Config config);

    const Config& config() const { return config_; }
    HookRegistry& registry() { return registry_; }
    const SecurityRuleEngine& engine() const { return *engine_; }
    HookExecutor executor() const;

private:
    Config config_;
    // Shared with the hooks, whose handler threads may outlive a timed-out dispatch
    std::shared_ptr<SecurityRuleEngine> engine_;
    std::shared_ptr<JsonlCheckpointStore> checkpoint_store_;
    std::shared_ptr<AutoCheckpointHooks> checkpoints_;
    HookRegistry registry_;
};

int cmd_check(const std::string& config_path, const std::string& tool, const std::string& input);
int cmd_rules(const std::string& config_path, bool include_disabled);
int cmd_hooks(const std::string& config_path);
// Reads one event JSON from stdin, prints the outcome JSON
int cmd_event(const std::string& config_path, HookType type);

} // namespace toolguard
