#include "hook_executor.hpp"
#include "utils.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <system_error>
#include <thread>

namespace toolguard {

namespace {

using Clock = std::chrono::steady_clock;

template <typename Result>
struct Invocation {
    std::optional<Result> result;
    bool timed_out = false;
    std::string error;
    int64_t elapsed_ms = 0;
};

int64_t ms_since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

// Run the handler on a detached thread and wait for at most `timeout`.
// The promise is shared with the thread, so a late completion after a
// timeout lands in a future nobody reads.
template <typename Result, typename Context>
Invocation<Result> invoke_with_timeout(const std::function<Result(const Context&)>& handler,
                                       const Context& ctx, std::chrono::milliseconds timeout) {
    Invocation<Result> inv;
    auto start = Clock::now();

    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();
    try {
        std::thread([promise, handler, ctx]() {
            try {
                promise->set_value(handler(ctx));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }).detach();
    } catch (const std::system_error& e) {
        inv.error = std::string("Failed to start handler: ") + e.what();
        inv.elapsed_ms = ms_since(start);
        return inv;
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        inv.timed_out = true;
        inv.elapsed_ms = timeout.count();
        return inv;
    }

    try {
        inv.result = future.get();
    } catch (const std::exception& e) {
        inv.error = e.what();
        if (inv.error.empty()) inv.error = "Unknown error";
    } catch (...) {
        inv.error = "Unknown error";
    }
    inv.elapsed_ms = ms_since(start);
    return inv;
}

ExecutionReport make_report(const std::string& hook_id, HookType type, bool success,
                            int64_t duration_ms, nlohmann::json result, std::string error = "") {
    ExecutionReport r;
    r.hook_id = hook_id;
    r.hook_type = type;
    r.success = success;
    r.duration_ms = duration_ms;
    r.result = std::move(result);
    r.error = std::move(error);
    r.timestamp = now_iso8601();
    return r;
}

template <typename Item>
nlohmann::json items_to_json(const std::vector<Item>& items) {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& i : items) arr.push_back(i.to_json());
    return arr;
}

std::string timeout_reason(const std::string& hook_id, std::chrono::milliseconds timeout) {
    return "Hook " + hook_id + " timed out after " + std::to_string(timeout.count()) + "ms";
}

} // namespace

// ── Outcome serialization ──────────────────────────────────────────────

nlohmann::json PreActionOutcome::to_json() const {
    return {
        {"allowed", allowed},
        {"action", to_string(action)},
        {"violations", items_to_json(violations)},
        {"warnings", items_to_json(warnings)},
        {"results", items_to_json(results)},
        {"reports", items_to_json(reports)},
        {"effective_input", effective_input},
    };
}

nlohmann::json PostActionOutcome::to_json() const {
    return {{"results", items_to_json(results)}, {"reports", items_to_json(reports)}};
}

nlohmann::json PromptOutcome::to_json() const {
    nlohmann::json j = {
        {"proceed", proceed},
        {"context_injections", context_injections},
        {"skills_to_load", skills_to_load},
        {"results", items_to_json(results)},
        {"reports", items_to_json(reports)},
    };
    if (!redirect_to.empty()) j["redirect_to"] = redirect_to;
    if (!user_message.empty()) j["user_message"] = user_message;
    return j;
}

nlohmann::json StopOutcome::to_json() const {
    return {{"results", items_to_json(results)}, {"reports", items_to_json(reports)}};
}

// ── Executor ───────────────────────────────────────────────────────────

HookExecutor::HookExecutor(const HookRegistry& registry, ExecutorOptions options)
    : registry_(registry)
    , options_(std::move(options))
{}

std::chrono::milliseconds HookExecutor::effective_timeout(const HookBase& hook) const {
    return hook.timeout.count() > 0 ? hook.timeout : options_.default_timeout;
}

void HookExecutor::prepare_tool_context(ToolCallContext& ctx) const {
    if (ctx.timestamp.empty()) ctx.timestamp = now_iso8601();
    if (ctx.file_paths.empty()) ctx.file_paths = extract_file_paths(ctx.tool_input);
    if (!ctx.is_write_operation) ctx.is_write_operation = options_.classifier.is_file_write(ctx.tool_name);
    if (!ctx.is_command_execution) {
        ctx.is_command_execution = options_.classifier.is_command_execution(ctx.tool_name);
    }
}

PreActionOutcome HookExecutor::run_pre_action(ToolCallContext ctx) const {
    prepare_tool_context(ctx);

    PreActionOutcome out;
    out.effective_input = ctx.tool_input;

    auto hooks = registry_.list_applicable<PreActionHook>(ctx.scope_filter());
    for (auto& hook : hooks) {
        if (!matches_tool_pattern(ctx.tool_name, hook.tool_patterns)) continue;

        auto timeout = effective_timeout(hook);
        auto inv = invoke_with_timeout(hook.handler, ctx, timeout);

        if (inv.timed_out) {
            std::cerr << "[hooks] " << timeout_reason(hook.id, timeout) << "\n";
            PreActionResult result;
            result.status = PreActionStatus::warn;
            result.reason = timeout_reason(hook.id, timeout);
            result.execution_ms = timeout.count();
            out.reports.push_back(make_report(hook.id, HookType::pre_action, false,
                                              timeout.count(), result.to_json(), "Timeout"));
            out.warnings.push_back(result);
            out.results.push_back(std::move(result));
        } else if (!inv.result) {
            std::cerr << "[hooks] Hook " << hook.id << " error: " << inv.error << "\n";
            PreActionResult result;
            result.status = PreActionStatus::warn;
            result.reason = "Hook " + hook.id + " error: " + inv.error;
            result.execution_ms = inv.elapsed_ms;
            out.reports.push_back(make_report(hook.id, HookType::pre_action, false,
                                              inv.elapsed_ms, result.to_json(), inv.error));
            out.warnings.push_back(result);
            out.results.push_back(std::move(result));
        } else {
            PreActionResult result = std::move(*inv.result);
            result.execution_ms = inv.elapsed_ms;
            if (result.status == PreActionStatus::deny) {
                out.allowed = false;
                out.violations.push_back(result);
            } else if (result.status == PreActionStatus::warn) {
                out.warnings.push_back(result);
            }
            if (result.status != PreActionStatus::deny && result.modified_args) {
                out.effective_input = *result.modified_args;
            }
            out.reports.push_back(make_report(hook.id, HookType::pre_action, true,
                                              inv.elapsed_ms, result.to_json()));
            out.results.push_back(std::move(result));
        }

        if (!out.allowed) break;
    }

    if (!out.violations.empty()) out.action = SecurityAction::block;
    else if (!out.warnings.empty()) out.action = SecurityAction::warn;
    return out;
}

PostActionOutcome HookExecutor::run_post_action(PostActionContext ctx) const {
    prepare_tool_context(ctx);

    PostActionOutcome out;
    auto hooks = registry_.list_applicable<PostActionHook>(ctx.scope_filter());
    for (auto& hook : hooks) {
        if (!matches_tool_pattern(ctx.tool_name, hook.tool_patterns)) continue;
        if (hook.on_error_only && ctx.success) continue;

        auto timeout = effective_timeout(hook);
        auto inv = invoke_with_timeout(hook.handler, ctx, timeout);

        if (inv.timed_out) {
            std::cerr << "[hooks] " << timeout_reason(hook.id, timeout) << "\n";
            PostActionResult result;
            result.execution_ms = timeout.count();
            out.reports.push_back(make_report(hook.id, HookType::post_action, false,
                                              timeout.count(), result.to_json(), "Timeout"));
            out.results.push_back(std::move(result));
        } else if (!inv.result) {
            std::cerr << "[hooks] Hook " << hook.id << " error: " << inv.error << "\n";
            PostActionResult result;
            result.execution_ms = inv.elapsed_ms;
            out.reports.push_back(make_report(hook.id, HookType::post_action, false,
                                              inv.elapsed_ms, result.to_json(), inv.error));
            out.results.push_back(std::move(result));
        } else {
            PostActionResult result = std::move(*inv.result);
            result.execution_ms = inv.elapsed_ms;
            out.reports.push_back(make_report(hook.id, HookType::post_action, true,
                                              inv.elapsed_ms, result.to_json()));
            out.results.push_back(std::move(result));
        }
    }
    return out;
}

PromptOutcome HookExecutor::run_prompt_submitted(PromptContext ctx) const {
    if (ctx.timestamp.empty()) ctx.timestamp = now_iso8601();

    PromptOutcome out;
    auto hooks = registry_.list_applicable<PromptHook>(ctx.scope_filter());
    for (auto& hook : hooks) {
        if (!matches_prompt_pattern(ctx.prompt_text, hook.prompt_patterns)) continue;
        if (!hook.command_patterns.empty()) {
            if (ctx.command.empty()) continue;
            if (std::find(hook.command_patterns.begin(), hook.command_patterns.end(), ctx.command) ==
                hook.command_patterns.end()) continue;
        }

        auto timeout = effective_timeout(hook);
        auto inv = invoke_with_timeout(hook.handler, ctx, timeout);

        if (inv.timed_out) {
            std::cerr << "[hooks] " << timeout_reason(hook.id, timeout) << "\n";
            PromptResult result;
            result.execution_ms = timeout.count();
            out.reports.push_back(make_report(hook.id, HookType::prompt_submitted, false,
                                              timeout.count(), result.to_json(), "Timeout"));
            out.results.push_back(std::move(result));
        } else if (!inv.result) {
            std::cerr << "[hooks] Hook " << hook.id << " error: " << inv.error << "\n";
            PromptResult result;
            result.execution_ms = inv.elapsed_ms;
            out.reports.push_back(make_report(hook.id, HookType::prompt_submitted, false,
                                              inv.elapsed_ms, result.to_json(), inv.error));
            out.results.push_back(std::move(result));
        } else {
            PromptResult result = std::move(*inv.result);
            result.execution_ms = inv.elapsed_ms;

            if (!result.context_injection.empty()) {
                out.context_injections.push_back(result.context_injection);
            }
            for (auto& skill : result.skills_to_load) {
                if (std::find(out.skills_to_load.begin(), out.skills_to_load.end(), skill) ==
                    out.skills_to_load.end()) {
                    out.skills_to_load.push_back(skill);
                }
            }
            if (result.status == PromptStatus::block || result.status == PromptStatus::redirect) {
                if (out.proceed) {
                    out.redirect_to = result.redirect_to;
                    out.user_message = result.user_message;
                }
                out.proceed = false;
            }

            out.reports.push_back(make_report(hook.id, HookType::prompt_submitted, true,
                                              inv.elapsed_ms, result.to_json()));
            out.results.push_back(std::move(result));
        }
    }
    return out;
}

StopOutcome HookExecutor::run_stop(StopContext ctx) const {
    if (ctx.timestamp.empty()) ctx.timestamp = now_iso8601();

    StopOutcome out;
    auto hooks = registry_.list_applicable<StopHook>(ctx.scope_filter());
    for (auto& hook : hooks) {
        if (std::find(hook.triggers.begin(), hook.triggers.end(), ctx.trigger) == hook.triggers.end()) {
            continue;
        }

        auto timeout = effective_timeout(hook);
        auto inv = invoke_with_timeout(hook.handler, ctx, timeout);

        if (inv.timed_out) {
            std::cerr << "[hooks] " << timeout_reason(hook.id, timeout) << "\n";
            StopResult result;
            result.success = false;
            result.execution_ms = timeout.count();
            out.reports.push_back(make_report(hook.id, HookType::stop, false,
                                              timeout.count(), result.to_json(), "Timeout"));
            out.results.push_back(std::move(result));
        } else if (!inv.result) {
            // Stop hooks are notifications: a failure is recorded and the
            // remaining hooks still run.
            std::cerr << "[hooks] Stop hook " << hook.id << " failed"
                      << (hook.run_on_failure ? " (run_on_failure)" : "") << ": " << inv.error << "\n";
            StopResult result;
            result.success = false;
            result.execution_ms = inv.elapsed_ms;
            out.reports.push_back(make_report(hook.id, HookType::stop, false,
                                              inv.elapsed_ms, result.to_json(), inv.error));
            out.results.push_back(std::move(result));
        } else {
            StopResult result = std::move(*inv.result);
            result.execution_ms = inv.elapsed_ms;
            out.reports.push_back(make_report(hook.id, HookType::stop, result.success,
                                              inv.elapsed_ms, result.to_json()));
            out.results.push_back(std::move(result));
        }
    }
    return out;
}

} // namespace toolguard
