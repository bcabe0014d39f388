#pragma once
#include "hook_registry.hpp"
#include "tool_input.hpp"
#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolguard {

struct ExecutorOptions {
    std::chrono::milliseconds default_timeout = kDefaultHookTimeout;
    ToolClassifier classifier;
};

struct PreActionOutcome {
    bool allowed = true;
    SecurityAction action = SecurityAction::allow;
    std::vector<PreActionResult> violations;  // deny results
    std::vector<PreActionResult> warnings;    // warn results, incl. timeouts and errors
    std::vector<PreActionResult> results;     // every result in execution order
    std::vector<ExecutionReport> reports;
    nlohmann::json effective_input;           // last modified_args, else the original input

    nlohmann::json to_json() const;
};

struct PostActionOutcome {
    std::vector<PostActionResult> results;
    std::vector<ExecutionReport> reports;

    nlohmann::json to_json() const;
};

struct PromptOutcome {
    bool proceed = true;
    std::vector<std::string> context_injections;  // execution order
    std::vector<std::string> skills_to_load;      // deduplicated, first-seen order
    std::string redirect_to;
    std::string user_message;
    std::vector<PromptResult> results;
    std::vector<ExecutionReport> reports;

    nlohmann::json to_json() const;
};

struct StopOutcome {
    std::vector<StopResult> results;
    std::vector<ExecutionReport> reports;

    nlohmann::json to_json() const;
};

// Dispatches the four lifecycle points against one registry.
//
// Hooks of a type run one after another in priority order. Each handler
// runs on its own thread and races its hook timeout; a handler that loses
// the race is left to finish in the background and its result is dropped.
// Handler failures never escape a dispatch: they become synthetic results
// and failed reports.
class HookExecutor {
public:
    explicit HookExecutor(const HookRegistry& registry, ExecutorOptions options = {});

    // Stops at the first deny
    PreActionOutcome run_pre_action(ToolCallContext ctx) const;

    // Never aborts; on_error_only hooks are skipped for successful calls
    PostActionOutcome run_post_action(PostActionContext ctx) const;

    PromptOutcome run_prompt_submitted(PromptContext ctx) const;

    // Best effort: only hooks subscribed to ctx.trigger run, all of them run
    StopOutcome run_stop(StopContext ctx) const;

    const ExecutorOptions& options() const { return options_; }

private:
    const HookRegistry& registry_;
    ExecutorOptions options_;

    std::chrono::milliseconds effective_timeout(const HookBase& hook) const;
    void prepare_tool_context(ToolCallContext& ctx) const;
};

} // namespace toolguard
