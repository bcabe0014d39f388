#include <gtest/gtest.h>
#include "shell_hook.hpp"
#include "hook_executor.hpp"

using namespace toolguard;
using nlohmann::json;

TEST(ShellCommand, FeedsStdinAndCapturesStdout) {
    EXPECT_EQ(run_shell_command("cat", "{\"a\":1}"), "{\"a\":1}");
    EXPECT_EQ(run_shell_command("echo hi", ""), "hi\n");
}

TEST(ShellCommand, NonZeroExitThrows) {
    EXPECT_THROW(run_shell_command("exit 3", ""), std::runtime_error);
}

TEST(ShellCommand, ParseHookOutput) {
    EXPECT_FALSE(parse_hook_output("").has_value());
    EXPECT_FALSE(parse_hook_output("  \n").has_value());
    EXPECT_FALSE(parse_hook_output("not json").has_value());
    EXPECT_FALSE(parse_hook_output("[1,2]").has_value());
    auto j = parse_hook_output("{\"status\":\"deny\"}\n");
    ASSERT_TRUE(j.has_value());
    EXPECT_EQ((*j)["status"], "deny");
}

TEST(ShellHook, PreActionDecisionFromStdout) {
    HookConfig cfg;
    cfg.type = HookType::pre_action;
    cfg.id = "shell-guard";
    cfg.command = "grep -q '\"tool_name\":\"Bash\"' && echo '{\"status\":\"deny\",\"reason\":\"no shell\"}' || true";
    cfg.timeout_ms = 5000;

    HookRegistry reg;
    auto r = register_shell_hook(reg, cfg);
    EXPECT_EQ(r.hook_id, "shell-guard");

    HookExecutor exec(reg);
    ToolCallContext ctx;
    ctx.tool_name = "Bash";
    ctx.tool_input = {{"command", "ls"}};
    auto out = exec.run_pre_action(ctx);
    EXPECT_FALSE(out.allowed);
    ASSERT_EQ(out.violations.size(), 1u);
    EXPECT_EQ(out.violations[0].reason, "no shell");

    ctx.tool_name = "Read";
    EXPECT_TRUE(exec.run_pre_action(ctx).allowed);
}

TEST(ShellHook, UnknownStatusIsLoggedAndAllows) {
    HookConfig cfg;
    cfg.type = HookType::pre_action;
    cfg.id = "misspelled-gate";
    cfg.command = "cat > /dev/null; echo '{\"status\":\"block\",\"reason\":\"nope\"}'";

    auto hook = make_shell_pre_action_hook(cfg);
    ToolCallContext ctx;
    ctx.tool_name = "Bash";

    testing::internal::CaptureStderr();
    auto result = hook.handler(ctx);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(result.status, PreActionStatus::allow);
    EXPECT_NE(err.find("[shell-hook] Unknown status 'block'"), std::string::npos) << err;
    EXPECT_NE(err.find("treating as allow"), std::string::npos) << err;
}

TEST(ShellHook, FailingCommandIsRecordedAsError) {
    HookConfig cfg;
    cfg.type = HookType::stop;
    cfg.id = "shell-stop";
    cfg.command = "cat > /dev/null; exit 1";
    cfg.triggers = {StopTrigger::session_end};

    HookRegistry reg;
    register_shell_hook(reg, cfg);
    HookExecutor exec(reg);
    StopContext ctx;
    ctx.trigger = StopTrigger::session_end;
    auto out = exec.run_stop(ctx);
    ASSERT_EQ(out.results.size(), 1u);
    EXPECT_FALSE(out.results[0].success);
    EXPECT_FALSE(out.reports[0].error.empty());
}

TEST(ShellHook, PromptInjectionAndNeutralOutput) {
    HookConfig inject;
    inject.type = HookType::prompt_submitted;
    inject.id = "inject";
    inject.priority = 1;
    inject.command = "cat > /dev/null; echo '{\"context_injection\":\"Use the staging cluster\"}'";

    HookConfig quiet;
    quiet.type = HookType::prompt_submitted;
    quiet.id = "quiet";
    quiet.priority = 2;
    quiet.command = "cat > /dev/null; echo done";

    HookRegistry reg;
    register_shell_hook(reg, inject);
    register_shell_hook(reg, quiet);

    HookExecutor exec(reg);
    PromptContext ctx;
    ctx.prompt_text = "deploy";
    auto out = exec.run_prompt_submitted(ctx);
    EXPECT_TRUE(out.proceed);
    EXPECT_EQ(out.context_injections, (std::vector<std::string>{"Use the staging cluster"}));
    ASSERT_EQ(out.reports.size(), 2u);
    EXPECT_TRUE(out.reports[1].success);
}
