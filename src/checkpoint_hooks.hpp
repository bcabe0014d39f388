#pragma once
#include "checkpoint_store.hpp"
#include "hook_registry.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolguard {

struct AutoCheckpointConfig {
    bool enabled = true;
    bool iteration_start = true;
    bool iteration_failure = true;
    bool task_status_change = false;  // noisy
    bool work_product_store = false;  // the work product already is the checkpoint
    std::string store_path = "~/.toolguard/checkpoints.jsonl";

    nlohmann::json to_json() const;
    static AutoCheckpointConfig from_json(const nlohmann::json& j);
};

// Creates checkpoints at iteration boundaries, status transitions and
// session stops. Store failures are logged and swallowed so that a
// checkpoint problem never changes a hook decision.
//
// Registered hooks hold a shared_ptr to the adapter (and through it the
// store), so instances must be owned by a std::shared_ptr before calling
// register_hooks.
class AutoCheckpointHooks : public std::enable_shared_from_this<AutoCheckpointHooks> {
public:
    AutoCheckpointHooks(std::shared_ptr<CheckpointStore> store, AutoCheckpointConfig config = {});

    void on_iteration_start(const std::string& task_id, int iteration);
    void on_iteration_failure(const std::string& task_id, int iteration,
                              const nlohmann::json& validation_result,
                              const std::string& agent_output = "");
    // Only pending->in_progress, in_progress->blocked and blocked->in_progress
    void on_task_status_change(const std::string& task_id, const std::string& old_status,
                               const std::string& new_status);
    void on_work_product_store(const std::string& task_id, const std::string& work_product_id,
                               const std::string& work_product_type);

    // Pre-action on iteration_start / iteration_next, post-action on failed
    // iteration_validate, stop on abnormal triggers. Returns the hook ids.
    // Throws std::bad_weak_ptr when the adapter is not shared-owned.
    std::vector<std::string> register_hooks(HookRegistry& registry);

    void update_config(const AutoCheckpointConfig& config);
    AutoCheckpointConfig config() const;

private:
    std::shared_ptr<CheckpointStore> store_;
    AutoCheckpointConfig config_;
    mutable std::mutex config_mutex_;

    std::optional<std::string> create(const std::string& task_id, const std::string& trigger,
                                      const std::string& phase, const nlohmann::json& context,
                                      const std::string& what);
};

} // namespace toolguard
