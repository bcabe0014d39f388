#pragma once
#include "hooks.hpp"
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolguard {

// Thrown when a registry would exceed its per-type ceiling
class RegistryCapacityError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Stores hook definitions per lifecycle type. Entries never leave the
// registry by reference: lookups return copies of the definitions.
//
// Mutation takes an exclusive lock, lookups a shared one, so concurrent
// dispatches can read while an administrative call is pending.
class HookRegistry {
public:
    explicit HookRegistry(size_t max_hooks_per_type = kMaxHooksPerType);

    // Assigns an id if the hook has none. Re-registering an existing id
    // replaces that definition in place. Throws RegistryCapacityError.
    HookRegistration register_hook(PreActionHook hook, HookScope scope = HookScope::global,
                                   const std::string& agent_id = "", const std::string& task_id = "");
    HookRegistration register_hook(PostActionHook hook, HookScope scope = HookScope::global,
                                   const std::string& agent_id = "", const std::string& task_id = "");
    HookRegistration register_hook(PromptHook hook, HookScope scope = HookScope::global,
                                   const std::string& agent_id = "", const std::string& task_id = "");
    HookRegistration register_hook(StopHook hook, HookScope scope = HookScope::global,
                                   const std::string& agent_id = "", const std::string& task_id = "");

    bool unregister_hook(const std::string& hook_id, HookType type);
    bool toggle_hook(const std::string& hook_id, HookType type, bool enabled);

    template <typename Hook>
    std::optional<Hook> get_hook(const std::string& hook_id) const;

    // Enabled hooks visible to the filter, ascending priority, ties in
    // registration order
    template <typename Hook>
    std::vector<Hook> list_applicable(const ScopeFilter& filter) const;

    size_t hook_count(HookType type) const;
    void clear();
    void clear(HookType type);

    RegistryStats stats() const;
    std::vector<HookSummary> list_all() const;

    size_t max_hooks_per_type() const { return max_per_type_; }

private:
    template <typename Hook>
    struct Entry {
        Hook hook;
        HookScope scope = HookScope::global;
        std::string agent_id;
        std::string task_id;
        std::string registered_at;
    };

    template <typename Hook>
    using Table = std::vector<Entry<Hook>>;

    Table<PreActionHook> pre_action_;
    Table<PostActionHook> post_action_;
    Table<PromptHook> prompt_;
    Table<StopHook> stop_;
    size_t max_per_type_;
    mutable std::shared_mutex mutex_;

    template <typename Hook> Table<Hook>& table();
    template <typename Hook> const Table<Hook>& table() const;

    template <typename Hook>
    HookRegistration add(Hook hook, HookScope scope, const std::string& agent_id,
                         const std::string& task_id);

    template <typename Fn>
    decltype(auto) visit(HookType type, Fn&& fn);
    template <typename Fn>
    decltype(auto) visit(HookType type, Fn&& fn) const;
};

} // namespace toolguard
