#include "checkpoint_hooks.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace toolguard {

nlohmann::json AutoCheckpointConfig::to_json() const {
    return {
        {"enabled", enabled},
        {"iteration_start", iteration_start},
        {"iteration_failure", iteration_failure},
        {"task_status_change", task_status_change},
        {"work_product_store", work_product_store},
        {"store_path", store_path},
    };
}

AutoCheckpointConfig AutoCheckpointConfig::from_json(const nlohmann::json& j) {
    AutoCheckpointConfig c;
    c.enabled = j.value("enabled", c.enabled);
    c.iteration_start = j.value("iteration_start", c.iteration_start);
    c.iteration_failure = j.value("iteration_failure", c.iteration_failure);
    c.task_status_change = j.value("task_status_change", c.task_status_change);
    c.work_product_store = j.value("work_product_store", c.work_product_store);
    c.store_path = j.value("store_path", c.store_path);
    return c;
}

AutoCheckpointHooks::AutoCheckpointHooks(std::shared_ptr<CheckpointStore> store, AutoCheckpointConfig config)
    : store_(std::move(store)), config_(std::move(config)) {
    if (!store_) throw std::invalid_argument("AutoCheckpointHooks requires a checkpoint store");
}

void AutoCheckpointHooks::update_config(const AutoCheckpointConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
}

AutoCheckpointConfig AutoCheckpointHooks::config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

std::optional<std::string> AutoCheckpointHooks::create(const std::string& task_id,
                                                       const std::string& trigger,
                                                       const std::string& phase,
                                                       const nlohmann::json& context,
                                                       const std::string& what) {
    try {
        return store_->create_checkpoint(task_id, trigger, phase, context);
    } catch (const std::exception& e) {
        std::cerr << "[checkpoint] Auto-checkpoint failed for " << what << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

void AutoCheckpointHooks::on_iteration_start(const std::string& task_id, int iteration) {
    auto cfg = config();
    if (!cfg.enabled || !cfg.iteration_start) return;
    create(task_id, "auto_iteration", "iteration",
           {{"execution_step", iteration}, {"iteration_started", now_iso8601()}, {"auto_created", true}},
           "iteration " + std::to_string(iteration));
}

void AutoCheckpointHooks::on_iteration_failure(const std::string& task_id, int iteration,
                                               const nlohmann::json& validation_result,
                                               const std::string& agent_output) {
    auto cfg = config();
    if (!cfg.enabled || !cfg.iteration_failure) return;
    nlohmann::json ctx = {
        {"execution_step", iteration},
        {"validation_result", validation_result},
        {"iteration_failed", now_iso8601()},
        {"auto_created", true},
    };
    if (!agent_output.empty()) {
        ctx["draft_content"] = agent_output;
        ctx["draft_type"] = "implementation";
    }
    create(task_id, "auto_iteration", "iteration_failed", ctx, "iteration failure");
}

void AutoCheckpointHooks::on_task_status_change(const std::string& task_id,
                                                const std::string& old_status,
                                                const std::string& new_status) {
    auto cfg = config();
    if (!cfg.enabled || !cfg.task_status_change) return;

    static const std::vector<std::string> significant = {
        "pending->in_progress", "in_progress->blocked", "blocked->in_progress",
    };
    std::string transition = old_status + "->" + new_status;
    if (std::find(significant.begin(), significant.end(), transition) == significant.end()) return;

    create(task_id, "manual", "status_change",
           {{"old_status", old_status}, {"new_status", new_status},
            {"status_changed_at", now_iso8601()}, {"auto_created", true}},
           "status change");
}

void AutoCheckpointHooks::on_work_product_store(const std::string& task_id,
                                                const std::string& work_product_id,
                                                const std::string& work_product_type) {
    auto cfg = config();
    if (!cfg.enabled || !cfg.work_product_store) return;
    create(task_id, "auto_work_product", "work_product_stored",
           {{"work_product_id", work_product_id}, {"work_product_type", work_product_type},
            {"work_product_stored_at", now_iso8601()}, {"auto_created", true}},
           "work product store");
}

// Task id from the context, falling back to the tool input
static std::string resolve_task_id(const ToolCallContext& ctx) {
    if (!ctx.task_id.empty()) return ctx.task_id;
    for (const char* key : {"task_id", "taskId"}) {
        if (ctx.tool_input.contains(key) && ctx.tool_input[key].is_string()) {
            return ctx.tool_input[key].get<std::string>();
        }
    }
    return "";
}

static int resolve_iteration(const nlohmann::json& input) {
    for (const char* key : {"iteration", "iteration_number", "iterationNumber"}) {
        if (input.contains(key) && input[key].is_number_integer()) return input[key].get<int>();
    }
    return 0;
}

std::vector<std::string> AutoCheckpointHooks::register_hooks(HookRegistry& registry) {
    std::vector<std::string> ids;
    auto self = shared_from_this();

    PreActionHook start;
    start.id = "auto-checkpoint-iteration-start";
    start.name = "Auto Checkpoint: iteration start";
    start.priority = 5;
    start.tool_patterns = {"iteration_start", "iteration_next"};
    start.tags = {"checkpoint"};
    start.handler = [self](const ToolCallContext& ctx) {
        std::string task_id = resolve_task_id(ctx);
        if (!task_id.empty()) self->on_iteration_start(task_id, resolve_iteration(ctx.tool_input));
        return PreActionResult{};
    };
    ids.push_back(registry.register_hook(std::move(start)).hook_id);

    PostActionHook failure;
    failure.id = "auto-checkpoint-iteration-failure";
    failure.name = "Auto Checkpoint: iteration failure";
    failure.priority = 5;
    failure.tool_patterns = {"iteration_validate"};
    failure.on_error_only = true;
    failure.tags = {"checkpoint"};
    failure.handler = [self](const PostActionContext& ctx) {
        std::string task_id = resolve_task_id(ctx);
        if (!task_id.empty()) {
            self->on_iteration_failure(task_id, resolve_iteration(ctx.tool_input), ctx.tool_result, ctx.error);
        }
        return PostActionResult{};
    };
    ids.push_back(registry.register_hook(std::move(failure)).hook_id);

    StopHook stop;
    stop.id = "auto-checkpoint-stop";
    stop.name = "Auto Checkpoint: abnormal stop";
    stop.priority = 5;
    stop.triggers = {StopTrigger::error, StopTrigger::task_blocked, StopTrigger::timeout,
                     StopTrigger::user_interrupt, StopTrigger::context_limit};
    stop.tags = {"checkpoint"};
    stop.handler = [self](const StopContext& ctx) {
        StopResult result;
        std::string task_id = ctx.task_id;
        if (task_id.empty() && ctx.task_state) task_id = ctx.task_state->id;
        if (!self->config().enabled || task_id.empty()) return result;

        nlohmann::json snapshot = ctx.to_json();
        snapshot["auto_created"] = true;
        auto id = self->create(task_id, "auto_stop", "stop_" + to_string(ctx.trigger), snapshot, "stop");

        StopAction action;
        action.action = "checkpoint";
        action.success = id.has_value();
        action.message = id ? "Created checkpoint " + *id : "Checkpoint failed";
        result.actions_performed.push_back(action);
        if (id) result.persisted_state = nlohmann::json{{"checkpoint_id", *id}};
        return result;
    };
    ids.push_back(registry.register_hook(std::move(stop)).hook_id);

    return ids;
}

} // namespace toolguard
