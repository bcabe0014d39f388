#include "shell_hook.hpp"
#include "utils.hpp"
#include <array>
#include <cstdio>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <stdexcept>

#ifdef _WIN32
#define popen _popen
#define pclose _pclose
#endif

namespace toolguard {

namespace {

// Removes the stdin spool file when the command finishes
struct TempFile {
    std::string path;
    ~TempFile() {
        std::error_code ec;
        fs::remove(path, ec);
    }
};

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

template <typename Hook>
void apply_common(Hook& hook, const HookConfig& cfg) {
    hook.id = cfg.id;
    hook.name = cfg.name.empty() ? to_string(cfg.type) + ":" + cfg.command : cfg.name;
    hook.description = "Shell hook: " + cfg.command;
    hook.priority = cfg.priority;
    hook.timeout = std::chrono::milliseconds(cfg.timeout_ms);
    hook.tags = {"shell"};
}

std::optional<nlohmann::json> invoke(const std::string& command, const nlohmann::json& context) {
    auto output = run_shell_command(command, context.dump());
    auto parsed = parse_hook_output(output);
    if (!parsed && output.find_first_not_of(" \t\r\n") != std::string::npos) {
        std::cerr << "[shell-hook] Ignoring non-JSON output from " << command << "\n";
    }
    return parsed;
}

// Result parsers fall back to the neutral status; make that visible
void check_status(const std::string& command, const nlohmann::json& out,
                  std::initializer_list<const char*> known, const char* fallback) {
    auto it = out.find("status");
    if (it == out.end()) return;
    std::string status = it->is_string() ? it->get<std::string>() : it->dump();
    for (const char* k : known) {
        if (status == k) return;
    }
    std::cerr << "[shell-hook] Unknown status '" << status << "' from " << command
              << ", treating as " << fallback << "\n";
}

} // namespace

std::string run_shell_command(const std::string& command, const std::string& input) {
    TempFile spool;
    spool.path = (fs::temp_directory_path() /
                  ("toolguard-hook-" + to_base36(static_cast<uint64_t>(epoch_ms())) + "-" +
                   random_base36(8) + ".json")).string();
    {
        std::ofstream f(spool.path, std::ios::binary);
        if (!f) throw std::runtime_error("Cannot write hook input file: " + spool.path);
        f << input;
    }

    std::string full_cmd = "(" + command + ") < " + shell_quote(spool.path);
    FILE* pipe = popen(full_cmd.c_str(), "r");
    if (!pipe) throw std::runtime_error("Failed to execute: " + command);

    std::string output;
    std::array<char, 4096> buf;
    while (auto n = std::fread(buf.data(), 1, buf.size(), pipe)) {
        output.append(buf.data(), n);
    }

    int status = pclose(pipe);
    if (status != 0) {
        throw std::runtime_error("Command exited with status " + std::to_string(status) + ": " + command);
    }
    return output;
}

std::optional<nlohmann::json> parse_hook_output(const std::string& output) {
    auto first = output.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::nullopt;
    auto j = nlohmann::json::parse(output, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    return j;
}

PreActionHook make_shell_pre_action_hook(const HookConfig& cfg) {
    PreActionHook hook;
    apply_common(hook, cfg);
    hook.tool_patterns = cfg.tool_patterns;
    std::string command = cfg.command;
    hook.handler = [command](const ToolCallContext& ctx) {
        auto out = invoke(command, ctx.to_json());
        if (!out) return PreActionResult{};
        check_status(command, *out, {"allow", "deny", "warn", "skip"}, "allow");
        return PreActionResult::from_json(*out);
    };
    return hook;
}

PostActionHook make_shell_post_action_hook(const HookConfig& cfg) {
    PostActionHook hook;
    apply_common(hook, cfg);
    hook.tool_patterns = cfg.tool_patterns;
    hook.on_error_only = cfg.on_error_only;
    std::string command = cfg.command;
    hook.handler = [command](const PostActionContext& ctx) {
        auto out = invoke(command, ctx.to_json());
        if (!out) return PostActionResult{};
        check_status(command, *out, {"continue", "halt", "retry"}, "continue");
        return PostActionResult::from_json(*out);
    };
    return hook;
}

PromptHook make_shell_prompt_hook(const HookConfig& cfg) {
    PromptHook hook;
    apply_common(hook, cfg);
    hook.prompt_patterns = cfg.prompt_patterns;
    hook.command_patterns = cfg.command_patterns;
    std::string command = cfg.command;
    hook.handler = [command](const PromptContext& ctx) {
        auto out = invoke(command, ctx.to_json());
        if (!out) return PromptResult{};
        check_status(command, *out, {"proceed", "block", "redirect"}, "proceed");
        return PromptResult::from_json(*out);
    };
    return hook;
}

StopHook make_shell_stop_hook(const HookConfig& cfg) {
    StopHook hook;
    apply_common(hook, cfg);
    hook.triggers = cfg.triggers;
    hook.run_on_failure = cfg.run_on_failure;
    std::string command = cfg.command;
    hook.handler = [command](const StopContext& ctx) {
        auto out = invoke(command, ctx.to_json());
        return out ? StopResult::from_json(*out) : StopResult{};
    };
    return hook;
}

HookRegistration register_shell_hook(HookRegistry& registry, const HookConfig& cfg) {
    switch (cfg.type) {
        case HookType::pre_action:
            return registry.register_hook(make_shell_pre_action_hook(cfg), cfg.scope, cfg.agent_id, cfg.task_id);
        case HookType::post_action:
            return registry.register_hook(make_shell_post_action_hook(cfg), cfg.scope, cfg.agent_id, cfg.task_id);
        case HookType::prompt_submitted:
            return registry.register_hook(make_shell_prompt_hook(cfg), cfg.scope, cfg.agent_id, cfg.task_id);
        case HookType::stop:
            return registry.register_hook(make_shell_stop_hook(cfg), cfg.scope, cfg.agent_id, cfg.task_id);
    }
    throw std::invalid_argument("Unknown hook type");
}

} // namespace toolguard
