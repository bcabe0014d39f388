#pragma once
#include "config.hpp"
#include "hook_registry.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace toolguard {

// Runs `command` with `input` on stdin and returns its stdout. Throws
// std::runtime_error when the command cannot be started or exits non-zero.
std::string run_shell_command(const std::string& command, const std::string& input);

// Empty or non-JSON output yields nullopt (the neutral result)
std::optional<nlohmann::json> parse_hook_output(const std::string& output);

PreActionHook make_shell_pre_action_hook(const HookConfig& cfg);
PostActionHook make_shell_post_action_hook(const HookConfig& cfg);
PromptHook make_shell_prompt_hook(const HookConfig& cfg);
StopHook make_shell_stop_hook(const HookConfig& cfg);

// Builds the typed hook for cfg.type and registers it with its scope
HookRegistration register_shell_hook(HookRegistry& registry, const HookConfig& cfg);

} // namespace toolguard
