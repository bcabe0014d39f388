#include "hooks.hpp"
#include <stdexcept>

namespace toolguard {

HookType parse_hook_type(const std::string& s) {
    if (s == "pre_action" || s == "pre_tool_use")             return HookType::pre_action;
    if (s == "post_action" || s == "post_tool_use")           return HookType::post_action;
    if (s == "prompt_submitted" || s == "user_prompt_submit") return HookType::prompt_submitted;
    if (s == "stop")                                          return HookType::stop;
    throw std::invalid_argument("Unknown hook type: " + s);
}

HookScope parse_hook_scope(const std::string& s) {
    if (s == "global") return HookScope::global;
    if (s == "agent")  return HookScope::agent;
    if (s == "task")   return HookScope::task;
    throw std::invalid_argument("Unknown hook scope: " + s);
}

Severity parse_severity(const std::string& s) {
    if (s == "low")      return Severity::low;
    if (s == "medium")   return Severity::medium;
    if (s == "high")     return Severity::high;
    if (s == "critical") return Severity::critical;
    throw std::invalid_argument("Unknown severity: " + s);
}

StopTrigger parse_stop_trigger(const std::string& s) {
    if (s == "session_end")    return StopTrigger::session_end;
    if (s == "task_complete")  return StopTrigger::task_complete;
    if (s == "task_blocked")   return StopTrigger::task_blocked;
    if (s == "error")          return StopTrigger::error;
    if (s == "timeout")        return StopTrigger::timeout;
    if (s == "user_interrupt") return StopTrigger::user_interrupt;
    if (s == "context_limit")  return StopTrigger::context_limit;
    throw std::invalid_argument("Unknown stop trigger: " + s);
}

std::string to_string(HookType t) {
    switch (t) {
        case HookType::pre_action:       return "pre_action";
        case HookType::post_action:      return "post_action";
        case HookType::prompt_submitted: return "prompt_submitted";
        case HookType::stop:             return "stop";
    }
    return "pre_action";
}

std::string to_string(HookScope s) {
    switch (s) {
        case HookScope::global: return "global";
        case HookScope::agent:  return "agent";
        case HookScope::task:   return "task";
    }
    return "global";
}

std::string to_string(Severity s) {
    switch (s) {
        case Severity::low:      return "low";
        case Severity::medium:   return "medium";
        case Severity::high:     return "high";
        case Severity::critical: return "critical";
    }
    return "medium";
}

std::string to_string(StopTrigger t) {
    switch (t) {
        case StopTrigger::session_end:    return "session_end";
        case StopTrigger::task_complete:  return "task_complete";
        case StopTrigger::task_blocked:   return "task_blocked";
        case StopTrigger::error:          return "error";
        case StopTrigger::timeout:        return "timeout";
        case StopTrigger::user_interrupt: return "user_interrupt";
        case StopTrigger::context_limit:  return "context_limit";
    }
    return "session_end";
}

std::string to_string(SecurityAction a) {
    switch (a) {
        case SecurityAction::allow: return "allow";
        case SecurityAction::warn:  return "warn";
        case SecurityAction::block: return "block";
    }
    return "allow";
}

std::string to_string(PreActionStatus s) {
    switch (s) {
        case PreActionStatus::allow: return "allow";
        case PreActionStatus::deny:  return "deny";
        case PreActionStatus::warn:  return "warn";
        case PreActionStatus::skip:  return "skip";
    }
    return "allow";
}

std::string to_string(PostActionStatus s) {
    switch (s) {
        case PostActionStatus::continue_: return "continue";
        case PostActionStatus::halt:      return "halt";
        case PostActionStatus::retry:     return "retry";
    }
    return "continue";
}

std::string to_string(PromptStatus s) {
    switch (s) {
        case PromptStatus::proceed:  return "proceed";
        case PromptStatus::block:    return "block";
        case PromptStatus::redirect: return "redirect";
    }
    return "proceed";
}

std::vector<std::string> parse_string_array(const nlohmann::json& arr) {
    std::vector<std::string> result;
    if (arr.is_array()) {
        for (auto& item : arr) {
            if (item.is_string()) result.push_back(item.get<std::string>());
        }
    }
    return result;
}

// ── Context serialization ──────────────────────────────────────────────

static void base_to_json(const HookContextBase& c, nlohmann::json& j) {
    if (!c.agent_id.empty()) j["agent_id"] = c.agent_id;
    if (!c.task_id.empty()) j["task_id"] = c.task_id;
    if (!c.initiative_id.empty()) j["initiative_id"] = c.initiative_id;
    j["timestamp"] = c.timestamp;
    if (!c.metadata.is_null() && !c.metadata.empty()) j["metadata"] = c.metadata;
}

static void base_from_json(const nlohmann::json& j, HookContextBase& c) {
    c.agent_id = j.value("agent_id", "");
    c.task_id = j.value("task_id", "");
    c.initiative_id = j.value("initiative_id", "");
    c.timestamp = j.value("timestamp", "");
    if (j.contains("metadata") && j["metadata"].is_object()) c.metadata = j["metadata"];
}

nlohmann::json ToolCallContext::to_json() const {
    nlohmann::json j;
    base_to_json(*this, j);
    j["tool_name"] = tool_name;
    j["tool_input"] = tool_input;
    if (!file_paths.empty()) j["file_paths"] = file_paths;
    j["is_write_operation"] = is_write_operation;
    j["is_command_execution"] = is_command_execution;
    return j;
}

ToolCallContext ToolCallContext::from_json(const nlohmann::json& j) {
    ToolCallContext c;
    base_from_json(j, c);
    c.tool_name = j.value("tool_name", "");
    if (j.contains("tool_input") && j["tool_input"].is_object()) c.tool_input = j["tool_input"];
    if (j.contains("file_paths")) c.file_paths = parse_string_array(j["file_paths"]);
    c.is_write_operation = j.value("is_write_operation", false);
    c.is_command_execution = j.value("is_command_execution", false);
    return c;
}

nlohmann::json PostActionContext::to_json() const {
    nlohmann::json j = ToolCallContext::to_json();
    j["tool_result"] = tool_result;
    j["success"] = success;
    if (!error.empty()) j["error"] = error;
    j["duration_ms"] = duration_ms;
    return j;
}

PostActionContext PostActionContext::from_json(const nlohmann::json& j) {
    PostActionContext c;
    static_cast<ToolCallContext&>(c) = ToolCallContext::from_json(j);
    if (j.contains("tool_result")) c.tool_result = j["tool_result"];
    else if (j.contains("tool_response")) c.tool_result = j["tool_response"];
    c.error = j.value("error", "");
    c.success = j.value("success", c.error.empty());
    c.duration_ms = j.value("duration_ms", int64_t{0});
    return c;
}

nlohmann::json PromptContext::to_json() const {
    nlohmann::json j;
    base_to_json(*this, j);
    j["prompt_text"] = prompt_text;
    if (!command.empty()) j["command"] = command;
    if (!detected_intent.empty()) j["detected_intent"] = detected_intent;
    if (!mentioned_files.empty()) j["mentioned_files"] = mentioned_files;
    if (!suggested_skills.empty()) {
        auto& arr = j["suggested_skills"];
        for (auto& s : suggested_skills) {
            arr.push_back({{"name", s.name}, {"confidence", s.confidence}});
        }
    }
    j["is_continuation"] = is_continuation;
    return j;
}

PromptContext PromptContext::from_json(const nlohmann::json& j) {
    PromptContext c;
    base_from_json(j, c);
    c.prompt_text = j.value("prompt_text", j.value("prompt", ""));
    c.command = j.value("command", "");
    c.detected_intent = j.value("detected_intent", "");
    if (j.contains("mentioned_files")) c.mentioned_files = parse_string_array(j["mentioned_files"]);
    if (j.contains("suggested_skills") && j["suggested_skills"].is_array()) {
        for (auto& s : j["suggested_skills"]) {
            if (!s.is_object()) continue;
            c.suggested_skills.push_back({s.value("name", ""), s.value("confidence", 0.0)});
        }
    }
    c.is_continuation = j.value("is_continuation", false);
    return c;
}

nlohmann::json StopContext::to_json() const {
    nlohmann::json j;
    base_to_json(*this, j);
    j["trigger"] = to_string(trigger);
    if (task_state) {
        j["task_state"] = {{"id", task_state->id}, {"status", task_state->status}};
        if (!task_state->notes.empty()) j["task_state"]["notes"] = task_state->notes;
    }
    if (!modified_files.empty()) j["modified_files"] = modified_files;
    if (!work_product_ids.empty()) j["work_product_ids"] = work_product_ids;
    if (error) {
        j["error"] = {{"message", error->message}};
        if (!error->stack.empty()) j["error"]["stack"] = error->stack;
        if (!error->code.empty()) j["error"]["code"] = error->code;
    }
    if (session_duration_ms > 0) j["session_duration_ms"] = session_duration_ms;
    return j;
}

StopContext StopContext::from_json(const nlohmann::json& j) {
    StopContext c;
    base_from_json(j, c);
    c.trigger = parse_stop_trigger(j.value("trigger", "session_end"));
    if (j.contains("task_state") && j["task_state"].is_object()) {
        auto& ts = j["task_state"];
        c.task_state = TaskState{ts.value("id", ""), ts.value("status", ""), ts.value("notes", "")};
    }
    if (j.contains("modified_files")) c.modified_files = parse_string_array(j["modified_files"]);
    if (j.contains("work_product_ids")) c.work_product_ids = parse_string_array(j["work_product_ids"]);
    if (j.contains("error") && j["error"].is_object()) {
        auto& e = j["error"];
        c.error = StopError{e.value("message", ""), e.value("stack", ""), e.value("code", "")};
    }
    c.session_duration_ms = j.value("session_duration_ms", int64_t{0});
    return c;
}

// ── Result serialization ───────────────────────────────────────────────

nlohmann::json PreActionResult::to_json() const {
    nlohmann::json j;
    j["status"] = to_string(status);
    if (!reason.empty()) j["reason"] = reason;
    if (modified_args) j["modified_args"] = *modified_args;
    if (!warnings.empty()) j["warnings"] = warnings;
    if (severity) j["severity"] = to_string(*severity);
    j["execution_ms"] = execution_ms;
    return j;
}

PreActionResult PreActionResult::from_json(const nlohmann::json& j) {
    PreActionResult r;
    std::string status = j.value("status", "allow");
    if (status == "deny")      r.status = PreActionStatus::deny;
    else if (status == "warn") r.status = PreActionStatus::warn;
    else if (status == "skip") r.status = PreActionStatus::skip;
    r.reason = j.value("reason", "");
    if (j.contains("modified_args") && j["modified_args"].is_object()) r.modified_args = j["modified_args"];
    if (j.contains("warnings")) r.warnings = parse_string_array(j["warnings"]);
    if (j.contains("severity") && j["severity"].is_string()) {
        r.severity = parse_severity(j["severity"].get<std::string>());
    }
    return r;
}

nlohmann::json PostActionResult::to_json() const {
    nlohmann::json j;
    j["status"] = to_string(status);
    if (transformed_result) j["transformed_result"] = *transformed_result;
    if (enrichment) j["enrichment"] = *enrichment;
    if (log_entry) {
        j["log_entry"] = {{"level", log_entry->level}, {"message", log_entry->message}};
        if (!log_entry->data.is_null()) j["log_entry"]["data"] = log_entry->data;
    }
    j["execution_ms"] = execution_ms;
    return j;
}

PostActionResult PostActionResult::from_json(const nlohmann::json& j) {
    PostActionResult r;
    std::string status = j.value("status", "continue");
    if (status == "halt")       r.status = PostActionStatus::halt;
    else if (status == "retry") r.status = PostActionStatus::retry;
    if (j.contains("transformed_result")) r.transformed_result = j["transformed_result"];
    if (j.contains("enrichment") && j["enrichment"].is_object()) r.enrichment = j["enrichment"];
    if (j.contains("log_entry") && j["log_entry"].is_object()) {
        auto& le = j["log_entry"];
        LogEntry entry;
        entry.level = le.value("level", "info");
        entry.message = le.value("message", "");
        if (le.contains("data")) entry.data = le["data"];
        r.log_entry = std::move(entry);
    }
    return r;
}

nlohmann::json PromptResult::to_json() const {
    nlohmann::json j;
    j["status"] = to_string(status);
    if (!context_injection.empty()) j["context_injection"] = context_injection;
    if (!skills_to_load.empty()) j["skills_to_load"] = skills_to_load;
    if (!redirect_to.empty()) j["redirect_to"] = redirect_to;
    if (!user_message.empty()) j["user_message"] = user_message;
    j["execution_ms"] = execution_ms;
    return j;
}

PromptResult PromptResult::from_json(const nlohmann::json& j) {
    PromptResult r;
    std::string status = j.value("status", "proceed");
    if (status == "block")         r.status = PromptStatus::block;
    else if (status == "redirect") r.status = PromptStatus::redirect;
    r.context_injection = j.value("context_injection", "");
    if (j.contains("skills_to_load")) r.skills_to_load = parse_string_array(j["skills_to_load"]);
    r.redirect_to = j.value("redirect_to", "");
    r.user_message = j.value("user_message", "");
    return r;
}

nlohmann::json StopResult::to_json() const {
    nlohmann::json j;
    j["success"] = success;
    if (!actions_performed.empty()) {
        auto& arr = j["actions_performed"];
        for (auto& a : actions_performed) {
            nlohmann::json item = {{"action", a.action}, {"success", a.success}};
            if (!a.message.empty()) item["message"] = a.message;
            arr.push_back(std::move(item));
        }
    }
    if (persisted_state) j["persisted_state"] = *persisted_state;
    if (!audit_summary.empty()) j["audit_summary"] = audit_summary;
    j["execution_ms"] = execution_ms;
    return j;
}

StopResult StopResult::from_json(const nlohmann::json& j) {
    StopResult r;
    r.success = j.value("success", true);
    if (j.contains("actions_performed") && j["actions_performed"].is_array()) {
        for (auto& a : j["actions_performed"]) {
            if (!a.is_object()) continue;
            r.actions_performed.push_back({a.value("action", ""), a.value("success", true),
                                           a.value("message", "")});
        }
    }
    if (j.contains("persisted_state") && j["persisted_state"].is_object()) {
        r.persisted_state = j["persisted_state"];
    }
    r.audit_summary = j.value("audit_summary", "");
    return r;
}

// ── Registry records ───────────────────────────────────────────────────

nlohmann::json HookRegistration::to_json() const {
    return {{"hook_id", hook_id}, {"registered_at", registered_at},
            {"scope", to_string(scope)}, {"active", active}};
}

nlohmann::json HookSummary::to_json() const {
    return {{"type", to_string(type)}, {"id", id}, {"name", name},
            {"enabled", enabled}, {"priority", priority}, {"scope", to_string(scope)}};
}

nlohmann::json RegistryStats::to_json() const {
    return {{"pre_action", pre_action}, {"post_action", post_action},
            {"prompt_submitted", prompt_submitted}, {"stop", stop}, {"total", total}};
}

nlohmann::json ExecutionReport::to_json() const {
    nlohmann::json j;
    j["hook_id"] = hook_id;
    j["hook_type"] = to_string(hook_type);
    j["success"] = success;
    j["duration_ms"] = duration_ms;
    j["result"] = result;
    if (!error.empty()) j["error"] = error;
    j["timestamp"] = timestamp;
    return j;
}

} // namespace toolguard
