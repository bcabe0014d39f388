#include "hook_registry.hpp"
#include "utils.hpp"
#include <algorithm>
#include <mutex>
#include <type_traits>

namespace toolguard {

static std::string generate_hook_id(HookType type) {
    return to_string(type) + "-" + to_base36(static_cast<uint64_t>(epoch_ms())) + "-" + random_base36(6);
}

static bool scope_matches(HookScope scope, const std::string& agent_id, const std::string& task_id,
                          const ScopeFilter& filter) {
    switch (scope) {
        case HookScope::global: return true;
        case HookScope::agent:  return !filter.agent_id.empty() && agent_id == filter.agent_id;
        case HookScope::task:   return !filter.task_id.empty() && task_id == filter.task_id;
    }
    return false;
}

HookRegistry::HookRegistry(size_t max_hooks_per_type)
    : max_per_type_(max_hooks_per_type) {}

template <typename Hook>
HookRegistry::Table<Hook>& HookRegistry::table() {
    if constexpr (std::is_same_v<Hook, PreActionHook>) return pre_action_;
    else if constexpr (std::is_same_v<Hook, PostActionHook>) return post_action_;
    else if constexpr (std::is_same_v<Hook, PromptHook>) return prompt_;
    else return stop_;
}

template <typename Hook>
const HookRegistry::Table<Hook>& HookRegistry::table() const {
    return const_cast<HookRegistry*>(this)->table<Hook>();
}

template <typename Fn>
decltype(auto) HookRegistry::visit(HookType type, Fn&& fn) {
    switch (type) {
        case HookType::pre_action:       return fn(pre_action_);
        case HookType::post_action:      return fn(post_action_);
        case HookType::prompt_submitted: return fn(prompt_);
        case HookType::stop:             return fn(stop_);
    }
    throw std::invalid_argument("Unknown hook type");
}

template <typename Fn>
decltype(auto) HookRegistry::visit(HookType type, Fn&& fn) const {
    switch (type) {
        case HookType::pre_action:       return fn(pre_action_);
        case HookType::post_action:      return fn(post_action_);
        case HookType::prompt_submitted: return fn(prompt_);
        case HookType::stop:             return fn(stop_);
    }
    throw std::invalid_argument("Unknown hook type");
}

template <typename Hook>
HookRegistration HookRegistry::add(Hook hook, HookScope scope, const std::string& agent_id,
                                   const std::string& task_id) {
    if (!hook.handler) {
        throw std::invalid_argument("Hook '" + hook.name + "' has no handler");
    }
    if (hook.id.empty()) hook.id = generate_hook_id(Hook::kType);

    Entry<Hook> entry;
    entry.scope = scope;
    entry.agent_id = agent_id;
    entry.task_id = task_id;
    entry.registered_at = now_iso8601();

    HookRegistration reg;
    reg.hook_id = hook.id;
    reg.registered_at = entry.registered_at;
    reg.scope = scope;
    reg.active = hook.enabled;
    entry.hook = std::move(hook);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& tbl = table<Hook>();
    auto it = std::find_if(tbl.begin(), tbl.end(),
                           [&](const Entry<Hook>& e) { return e.hook.id == reg.hook_id; });
    if (it != tbl.end()) {
        *it = std::move(entry);
        return reg;
    }
    if (tbl.size() >= max_per_type_) {
        throw RegistryCapacityError("Maximum hooks (" + std::to_string(max_per_type_) +
                                    ") reached for type " + to_string(Hook::kType));
    }
    tbl.push_back(std::move(entry));
    return reg;
}

HookRegistration HookRegistry::register_hook(PreActionHook hook, HookScope scope,
                                             const std::string& agent_id, const std::string& task_id) {
    return add(std::move(hook), scope, agent_id, task_id);
}

HookRegistration HookRegistry::register_hook(PostActionHook hook, HookScope scope,
                                             const std::string& agent_id, const std::string& task_id) {
    return add(std::move(hook), scope, agent_id, task_id);
}

HookRegistration HookRegistry::register_hook(PromptHook hook, HookScope scope,
                                             const std::string& agent_id, const std::string& task_id) {
    return add(std::move(hook), scope, agent_id, task_id);
}

HookRegistration HookRegistry::register_hook(StopHook hook, HookScope scope,
                                             const std::string& agent_id, const std::string& task_id) {
    return add(std::move(hook), scope, agent_id, task_id);
}

bool HookRegistry::unregister_hook(const std::string& hook_id, HookType type) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return visit(type, [&](auto& tbl) {
        auto it = std::find_if(tbl.begin(), tbl.end(),
                               [&](const auto& e) { return e.hook.id == hook_id; });
        if (it == tbl.end()) return false;
        tbl.erase(it);
        return true;
    });
}

bool HookRegistry::toggle_hook(const std::string& hook_id, HookType type, bool enabled) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return visit(type, [&](auto& tbl) {
        auto it = std::find_if(tbl.begin(), tbl.end(),
                               [&](const auto& e) { return e.hook.id == hook_id; });
        if (it == tbl.end()) return false;
        it->hook.enabled = enabled;
        return true;
    });
}

template <typename Hook>
std::optional<Hook> HookRegistry::get_hook(const std::string& hook_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (auto& e : table<Hook>()) {
        if (e.hook.id == hook_id) return e.hook;
    }
    return std::nullopt;
}

template <typename Hook>
std::vector<Hook> HookRegistry::list_applicable(const ScopeFilter& filter) const {
    std::vector<Hook> hooks;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (auto& e : table<Hook>()) {
            if (!e.hook.enabled) continue;
            if (!scope_matches(e.scope, e.agent_id, e.task_id, filter)) continue;
            hooks.push_back(e.hook);
        }
    }
    std::stable_sort(hooks.begin(), hooks.end(),
                     [](const Hook& a, const Hook& b) { return a.priority < b.priority; });
    return hooks;
}

template std::optional<PreActionHook> HookRegistry::get_hook<PreActionHook>(const std::string&) const;
template std::optional<PostActionHook> HookRegistry::get_hook<PostActionHook>(const std::string&) const;
template std::optional<PromptHook> HookRegistry::get_hook<PromptHook>(const std::string&) const;
template std::optional<StopHook> HookRegistry::get_hook<StopHook>(const std::string&) const;

template std::vector<PreActionHook> HookRegistry::list_applicable<PreActionHook>(const ScopeFilter&) const;
template std::vector<PostActionHook> HookRegistry::list_applicable<PostActionHook>(const ScopeFilter&) const;
template std::vector<PromptHook> HookRegistry::list_applicable<PromptHook>(const ScopeFilter&) const;
template std::vector<StopHook> HookRegistry::list_applicable<StopHook>(const ScopeFilter&) const;

size_t HookRegistry::hook_count(HookType type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return visit(type, [](const auto& tbl) { return tbl.size(); });
}

void HookRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    pre_action_.clear();
    post_action_.clear();
    prompt_.clear();
    stop_.clear();
}

void HookRegistry::clear(HookType type) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    visit(type, [](auto& tbl) { tbl.clear(); });
}

RegistryStats HookRegistry::stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    RegistryStats s;
    s.pre_action = pre_action_.size();
    s.post_action = post_action_.size();
    s.prompt_submitted = prompt_.size();
    s.stop = stop_.size();
    s.total = s.pre_action + s.post_action + s.prompt_submitted + s.stop;
    return s;
}

std::vector<HookSummary> HookRegistry::list_all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<HookSummary> out;
    auto append = [&out](HookType type, const auto& tbl) {
        for (auto& e : tbl) {
            HookSummary s;
            s.type = type;
            s.id = e.hook.id;
            s.name = e.hook.name;
            s.enabled = e.hook.enabled;
            s.priority = e.hook.priority;
            s.scope = e.scope;
            out.push_back(std::move(s));
        }
    };
    append(HookType::pre_action, pre_action_);
    append(HookType::post_action, post_action_);
    append(HookType::prompt_submitted, prompt_);
    append(HookType::stop, stop_);
    return out;
}

} // namespace toolguard
