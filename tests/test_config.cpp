#include <gtest/gtest.h>
#include "config.hpp"
#include "security_rules.hpp"
#include <fstream>

using namespace toolguard;
using nlohmann::json;

namespace {

std::string temp_path(const std::string& name) {
    auto dir = fs::temp_directory_path() / ("toolguard-test-" + random_base36(8));
    fs::create_directories(dir);
    return (dir / name).string();
}

} // namespace

TEST(Config, Defaults) {
    auto c = Config::make_default();
    EXPECT_EQ(c.default_timeout_ms, 5000);
    EXPECT_EQ(c.max_hooks_per_type, 100);
    EXPECT_TRUE(c.security.enabled);
    EXPECT_TRUE(c.security.classifier.is_file_write("Write"));
    EXPECT_TRUE(c.checkpoint.enabled);
    EXPECT_TRUE(c.checkpoint.iteration_start);
    EXPECT_FALSE(c.checkpoint.task_status_change);
    EXPECT_TRUE(c.hooks.empty());
}

TEST(Config, FromJsonReadsEverySection) {
    json j = {
        {"default_timeout_ms", 1500},
        {"max_hooks_per_type", 10},
        {"security", {
            {"enabled", true},
            {"disabled_rules", {"git-secret-commit"}},
            {"command_tools", {"Bash", "Shell"}},
            {"custom_rules", {{{"id", "no-prod"}, {"patterns", {"production"}}, {"action", "block"}}}},
        }},
        {"checkpoint", {{"enabled", false}, {"store_path", "/tmp/cp.jsonl"}}},
        {"hooks", {
            {{"type", "pre_tool_use"}, {"command", "./guard.sh"}, {"tool_patterns", {"Bash"}}, {"priority", 2}},
            {{"type", "stop"}, {"command", "./audit.sh"}, {"triggers", {"error", "session_end"}},
             {"scope", "agent"}, {"agent_id", "agent-7"}},
        }},
    };

    auto c = Config::from_json(j);
    EXPECT_EQ(c.default_timeout_ms, 1500);
    EXPECT_EQ(c.max_hooks_per_type, 10);
    EXPECT_EQ(c.security.disabled_rules, (std::vector<std::string>{"git-secret-commit"}));
    EXPECT_TRUE(c.security.classifier.is_command_execution("Shell"));
    EXPECT_FALSE(c.security.classifier.is_command_execution("Run"));
    ASSERT_EQ(c.security.custom_rules.size(), 1u);
    EXPECT_EQ(c.security.custom_rules[0].action, SecurityAction::block);
    EXPECT_FALSE(c.checkpoint.enabled);
    EXPECT_EQ(c.checkpoint.store_path, "/tmp/cp.jsonl");

    ASSERT_EQ(c.hooks.size(), 2u);
    EXPECT_EQ(c.hooks[0].type, HookType::pre_action);
    EXPECT_EQ(c.hooks[0].tool_patterns, (std::vector<std::string>{"Bash"}));
    EXPECT_EQ(c.hooks[0].priority, 2);
    EXPECT_EQ(c.hooks[1].type, HookType::stop);
    EXPECT_EQ(c.hooks[1].scope, HookScope::agent);
    EXPECT_EQ(c.hooks[1].agent_id, "agent-7");
    EXPECT_EQ(c.hooks[1].triggers,
              (std::vector<StopTrigger>{StopTrigger::error, StopTrigger::session_end}));
}

TEST(Config, BadEntriesAreSkippedIndividually) {
    json j = {
        {"hooks", {
            {{"type", "on_boot"}, {"command", "./x.sh"}},
            {{"type", "stop"}, {"command", "./y.sh"}, {"triggers", {"meteor"}}},
            {{"type", "post_action"}},
            {{"type", "post_action"}, {"command", "./ok.sh"}, {"on_error_only", true}},
        }},
        {"security", {{"custom_rules", {{{"patterns", {"x"}}}, {{"id", "good"}}}}}},
    };
    auto c = Config::from_json(j);
    ASSERT_EQ(c.hooks.size(), 1u);
    EXPECT_EQ(c.hooks[0].command, "./ok.sh");
    EXPECT_TRUE(c.hooks[0].on_error_only);
    ASSERT_EQ(c.security.custom_rules.size(), 1u);
    EXPECT_EQ(c.security.custom_rules[0].id, "good");
}

TEST(Config, LoadMissingOrMalformedGivesDefaults) {
    auto missing = Config::load("/nonexistent/toolguard/config.json");
    EXPECT_EQ(missing.default_timeout_ms, 5000);

    auto path = temp_path("broken.json");
    {
        std::ofstream f(path);
        f << "{ not json";
    }
    auto broken = Config::load(path);
    EXPECT_EQ(broken.max_hooks_per_type, 100);
    fs::remove_all(fs::path(path).parent_path());
}

TEST(Config, SaveThenLoad) {
    auto c = Config::make_default();
    c.default_timeout_ms = 250;
    c.security.disabled_rules = {"credential-url"};
    HookConfig h;
    h.type = HookType::prompt_submitted;
    h.command = "./inject.sh";
    h.prompt_patterns = {"deploy"};
    c.hooks.push_back(h);

    auto path = temp_path("nested/config.json");
    c.save(path);
    auto loaded = Config::load(path);
    EXPECT_EQ(loaded.default_timeout_ms, 250);
    EXPECT_EQ(loaded.security.disabled_rules, c.security.disabled_rules);
    ASSERT_EQ(loaded.hooks.size(), 1u);
    EXPECT_EQ(loaded.hooks[0].type, HookType::prompt_submitted);
    EXPECT_EQ(loaded.hooks[0].prompt_patterns, (std::vector<std::string>{"deploy"}));
    fs::remove_all(fs::path(path).parent_path().parent_path());
}

TEST(SecurityConfig, ApplyLayersCustomAndDisabledRules) {
    SecurityConfig sec;
    sec.disabled_rules = {"destructive-command", "no-such-rule"};
    PatternRuleSpec spec;
    spec.id = "no-prod";
    spec.patterns = {"production"};
    spec.action = SecurityAction::block;
    sec.custom_rules.push_back(spec);

    SecurityRuleEngine engine(sec.classifier);
    sec.apply(engine);
    EXPECT_EQ(engine.rule_count(), 6u);
    EXPECT_FALSE(engine.get_rule("destructive-command")->enabled);
    EXPECT_TRUE(engine.evaluate("Bash", {{"command", "rm -rf /"}}).allowed);
    EXPECT_FALSE(engine.evaluate("Bash", {{"command", "deploy production"}}).allowed);
}
