#pragma once
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace toolguard {

// Lifecycle points around a tool call
enum class HookType {
    pre_action,
    post_action,
    prompt_submitted,
    stop,
};

enum class HookScope {
    global,
    agent,
    task,
};

enum class Severity {
    low,
    medium,
    high,
    critical,
};

// Aggregate decision levels, ordered by strictness
enum class SecurityAction : int {
    allow = 0,
    warn = 1,
    block = 2,
};

enum class StopTrigger {
    session_end,
    task_complete,
    task_blocked,
    error,
    timeout,
    user_interrupt,
    context_limit,
};

constexpr int kDefaultHookPriority = 3;  // lower runs first
constexpr std::chrono::milliseconds kDefaultHookTimeout{5000};
constexpr size_t kMaxHooksPerType = 100;

// Parse from config / event strings. Throws std::invalid_argument on unknown values.
HookType parse_hook_type(const std::string& s);
HookScope parse_hook_scope(const std::string& s);
Severity parse_severity(const std::string& s);
StopTrigger parse_stop_trigger(const std::string& s);

std::string to_string(HookType t);
std::string to_string(HookScope s);
std::string to_string(Severity s);
std::string to_string(StopTrigger t);
std::string to_string(SecurityAction a);

// String elements of a JSON array; anything else is skipped
std::vector<std::string> parse_string_array(const nlohmann::json& arr);

// Empty ids mean "not set"
struct ScopeFilter {
    std::string agent_id;
    std::string task_id;
};

// ── Contexts ───────────────────────────────────────────────────────────

struct HookContextBase {
    std::string agent_id;
    std::string task_id;
    std::string initiative_id;
    std::string timestamp;
    nlohmann::json metadata = nlohmann::json::object();

    ScopeFilter scope_filter() const { return {agent_id, task_id}; }
};

struct ToolCallContext : HookContextBase {
    std::string tool_name;
    nlohmann::json tool_input = nlohmann::json::object();
    std::vector<std::string> file_paths;
    bool is_write_operation = false;
    bool is_command_execution = false;

    nlohmann::json to_json() const;
    static ToolCallContext from_json(const nlohmann::json& j);
};

struct PostActionContext : ToolCallContext {
    nlohmann::json tool_result;
    bool success = true;
    std::string error;
    int64_t duration_ms = 0;

    nlohmann::json to_json() const;
    static PostActionContext from_json(const nlohmann::json& j);
};

struct SuggestedSkill {
    std::string name;
    double confidence = 0.0;
};

struct PromptContext : HookContextBase {
    std::string prompt_text;
    std::string command;          // "/command" syntax, empty if none
    std::string detected_intent;  // question, command, correction, request, other
    std::vector<std::string> mentioned_files;
    std::vector<SuggestedSkill> suggested_skills;
    bool is_continuation = false;

    nlohmann::json to_json() const;
    static PromptContext from_json(const nlohmann::json& j);
};

struct TaskState {
    std::string id;
    std::string status;
    std::string notes;
};

struct StopError {
    std::string message;
    std::string stack;
    std::string code;
};

struct StopContext : HookContextBase {
    StopTrigger trigger = StopTrigger::session_end;
    std::optional<TaskState> task_state;
    std::vector<std::string> modified_files;
    std::vector<std::string> work_product_ids;
    std::optional<StopError> error;
    int64_t session_duration_ms = 0;

    nlohmann::json to_json() const;
    static StopContext from_json(const nlohmann::json& j);
};

// ── Results ────────────────────────────────────────────────────────────

enum class PreActionStatus { allow, deny, warn, skip };

struct PreActionResult {
    PreActionStatus status = PreActionStatus::allow;
    std::string reason;
    std::optional<nlohmann::json> modified_args;
    std::vector<std::string> warnings;
    std::optional<Severity> severity;
    int64_t execution_ms = 0;

    nlohmann::json to_json() const;
    static PreActionResult from_json(const nlohmann::json& j);
};

enum class PostActionStatus { continue_, halt, retry };

struct LogEntry {
    std::string level = "info";  // debug, info, warn, error
    std::string message;
    nlohmann::json data;
};

struct PostActionResult {
    PostActionStatus status = PostActionStatus::continue_;
    std::optional<nlohmann::json> transformed_result;
    std::optional<nlohmann::json> enrichment;
    std::optional<LogEntry> log_entry;
    int64_t execution_ms = 0;

    nlohmann::json to_json() const;
    static PostActionResult from_json(const nlohmann::json& j);
};

enum class PromptStatus { proceed, block, redirect };

struct PromptResult {
    PromptStatus status = PromptStatus::proceed;
    std::string context_injection;
    std::vector<std::string> skills_to_load;
    std::string redirect_to;
    std::string user_message;
    int64_t execution_ms = 0;

    nlohmann::json to_json() const;
    static PromptResult from_json(const nlohmann::json& j);
};

struct StopAction {
    std::string action;
    bool success = true;
    std::string message;
};

struct StopResult {
    bool success = true;
    std::vector<StopAction> actions_performed;
    std::optional<nlohmann::json> persisted_state;
    std::string audit_summary;
    int64_t execution_ms = 0;

    nlohmann::json to_json() const;
    static StopResult from_json(const nlohmann::json& j);
};

std::string to_string(PreActionStatus s);
std::string to_string(PostActionStatus s);
std::string to_string(PromptStatus s);

// ── Hook definitions ───────────────────────────────────────────────────

using PreActionHandler = std::function<PreActionResult(const ToolCallContext&)>;
using PostActionHandler = std::function<PostActionResult(const PostActionContext&)>;
using PromptHandler = std::function<PromptResult(const PromptContext&)>;
using StopHandler = std::function<StopResult(const StopContext&)>;

struct HookBase {
    std::string id;                      // generated on registration if empty
    std::string name;
    std::string description;
    bool enabled = true;
    int priority = kDefaultHookPriority;
    std::chrono::milliseconds timeout{0};  // 0 = executor default
    std::vector<std::string> tags;
};

struct PreActionHook : HookBase {
    static constexpr HookType kType = HookType::pre_action;
    std::vector<std::string> tool_patterns;  // globs, empty = all tools
    PreActionHandler handler;
};

struct PostActionHook : HookBase {
    static constexpr HookType kType = HookType::post_action;
    std::vector<std::string> tool_patterns;
    bool on_error_only = false;
    PostActionHandler handler;
};

struct PromptHook : HookBase {
    static constexpr HookType kType = HookType::prompt_submitted;
    std::vector<std::string> prompt_patterns;   // regex, empty = all prompts
    std::vector<std::string> command_patterns;  // exact command names
    PromptHandler handler;
};

struct StopHook : HookBase {
    static constexpr HookType kType = HookType::stop;
    std::vector<StopTrigger> triggers;
    bool run_on_failure = false;
    StopHandler handler;
};

// ── Registry / executor records ────────────────────────────────────────

struct HookRegistration {
    std::string hook_id;
    std::string registered_at;
    HookScope scope = HookScope::global;
    bool active = true;

    nlohmann::json to_json() const;
};

struct HookSummary {
    HookType type = HookType::pre_action;
    std::string id;
    std::string name;
    bool enabled = true;
    int priority = kDefaultHookPriority;
    HookScope scope = HookScope::global;

    nlohmann::json to_json() const;
};

struct RegistryStats {
    size_t pre_action = 0;
    size_t post_action = 0;
    size_t prompt_submitted = 0;
    size_t stop = 0;
    size_t total = 0;

    nlohmann::json to_json() const;
};

// One per handler invocation; never modified after creation
struct ExecutionReport {
    std::string hook_id;
    HookType hook_type = HookType::pre_action;
    bool success = false;
    int64_t duration_ms = 0;
    nlohmann::json result;
    std::string error;  // "Timeout", exception message, or empty
    std::string timestamp;

    nlohmann::json to_json() const;
};

} // namespace toolguard
