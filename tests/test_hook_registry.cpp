#include <gtest/gtest.h>
#include "hook_registry.hpp"

using namespace toolguard;

static PreActionHook allow_hook(const std::string& id, int priority = kDefaultHookPriority) {
    PreActionHook h;
    h.id = id;
    h.name = id;
    h.priority = priority;
    h.handler = [](const ToolCallContext&) { return PreActionResult{}; };
    return h;
}

TEST(HookRegistry, GeneratesIdWhenMissing) {
    HookRegistry reg;
    auto r = reg.register_hook(allow_hook(""));
    EXPECT_EQ(r.hook_id.rfind("pre_action-", 0), 0u);
    EXPECT_TRUE(r.active);
    EXPECT_EQ(r.scope, HookScope::global);
    EXPECT_FALSE(r.registered_at.empty());

    auto r2 = reg.register_hook(allow_hook(""));
    EXPECT_NE(r.hook_id, r2.hook_id);
    EXPECT_EQ(reg.hook_count(HookType::pre_action), 2u);
}

TEST(HookRegistry, RejectsMissingHandler) {
    HookRegistry reg;
    PreActionHook h;
    h.id = "no-handler";
    EXPECT_THROW(reg.register_hook(h), std::invalid_argument);
}

TEST(HookRegistry, ReRegisterReplacesInPlace) {
    HookRegistry reg;
    reg.register_hook(allow_hook("a", 1));
    reg.register_hook(allow_hook("b", 1));
    auto replacement = allow_hook("a", 1);
    replacement.name = "replaced";
    reg.register_hook(replacement);

    EXPECT_EQ(reg.hook_count(HookType::pre_action), 2u);
    auto listed = reg.list_applicable<PreActionHook>({});
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].id, "a");
    EXPECT_EQ(listed[0].name, "replaced");
}

TEST(HookRegistry, CapacityPerType) {
    HookRegistry reg(2);
    reg.register_hook(allow_hook("a"));
    reg.register_hook(allow_hook("b"));
    EXPECT_THROW(reg.register_hook(allow_hook("c")), RegistryCapacityError);
    // replacing an existing id does not count against the ceiling
    EXPECT_NO_THROW(reg.register_hook(allow_hook("b")));

    StopHook s;
    s.handler = [](const StopContext&) { return StopResult{}; };
    EXPECT_NO_THROW(reg.register_hook(s));
}

TEST(HookRegistry, DefaultCeilingIsOneHundred) {
    HookRegistry reg;
    for (int i = 0; i < 100; ++i) reg.register_hook(allow_hook("h" + std::to_string(i)));
    EXPECT_THROW(reg.register_hook(allow_hook("h100")), RegistryCapacityError);
    EXPECT_EQ(reg.hook_count(HookType::pre_action), 100u);
}

TEST(HookRegistry, PriorityOrderingIsStable) {
    HookRegistry reg;
    reg.register_hook(allow_hook("late", 10));
    reg.register_hook(allow_hook("first-tie", 2));
    reg.register_hook(allow_hook("second-tie", 2));
    reg.register_hook(allow_hook("early", 1));

    auto listed = reg.list_applicable<PreActionHook>({});
    ASSERT_EQ(listed.size(), 4u);
    EXPECT_EQ(listed[0].id, "early");
    EXPECT_EQ(listed[1].id, "first-tie");
    EXPECT_EQ(listed[2].id, "second-tie");
    EXPECT_EQ(listed[3].id, "late");
}

TEST(HookRegistry, ScopeFiltering) {
    HookRegistry reg;
    reg.register_hook(allow_hook("global"));
    reg.register_hook(allow_hook("agent-a"), HookScope::agent, "agent-1");
    reg.register_hook(allow_hook("task-t"), HookScope::task, "", "task-9");

    auto ids = [&](const ScopeFilter& f) {
        std::vector<std::string> out;
        for (auto& h : reg.list_applicable<PreActionHook>(f)) out.push_back(h.id);
        return out;
    };

    EXPECT_EQ(ids({}), (std::vector<std::string>{"global"}));
    EXPECT_EQ(ids({"agent-1", ""}), (std::vector<std::string>{"global", "agent-a"}));
    EXPECT_EQ(ids({"agent-2", "task-9"}), (std::vector<std::string>{"global", "task-t"}));
    EXPECT_EQ(ids({"agent-1", "task-9"}), (std::vector<std::string>{"global", "agent-a", "task-t"}));
}

TEST(HookRegistry, ToggleAndUnregister) {
    HookRegistry reg;
    reg.register_hook(allow_hook("x"));

    EXPECT_TRUE(reg.toggle_hook("x", HookType::pre_action, false));
    EXPECT_TRUE(reg.list_applicable<PreActionHook>({}).empty());
    EXPECT_EQ(reg.hook_count(HookType::pre_action), 1u);

    EXPECT_TRUE(reg.toggle_hook("x", HookType::pre_action, true));
    EXPECT_EQ(reg.list_applicable<PreActionHook>({}).size(), 1u);

    EXPECT_FALSE(reg.toggle_hook("x", HookType::stop, false));
    EXPECT_FALSE(reg.unregister_hook("x", HookType::post_action));
    EXPECT_TRUE(reg.unregister_hook("x", HookType::pre_action));
    EXPECT_FALSE(reg.unregister_hook("x", HookType::pre_action));
    EXPECT_EQ(reg.hook_count(HookType::pre_action), 0u);
}

TEST(HookRegistry, GetHookReturnsCopy) {
    HookRegistry reg;
    reg.register_hook(allow_hook("x", 7));
    auto h = reg.get_hook<PreActionHook>("x");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->priority, 7);
    h->priority = 99;
    EXPECT_EQ(reg.get_hook<PreActionHook>("x")->priority, 7);
    EXPECT_FALSE(reg.get_hook<PostActionHook>("x").has_value());
}

TEST(HookRegistry, StatsAndClear) {
    HookRegistry reg;
    reg.register_hook(allow_hook("a"));
    PostActionHook p;
    p.handler = [](const PostActionContext&) { return PostActionResult{}; };
    reg.register_hook(p);
    PromptHook q;
    q.handler = [](const PromptContext&) { return PromptResult{}; };
    reg.register_hook(q);

    auto s = reg.stats();
    EXPECT_EQ(s.pre_action, 1u);
    EXPECT_EQ(s.post_action, 1u);
    EXPECT_EQ(s.prompt_submitted, 1u);
    EXPECT_EQ(s.stop, 0u);
    EXPECT_EQ(s.total, 3u);
    EXPECT_EQ(reg.list_all().size(), 3u);

    reg.clear(HookType::post_action);
    EXPECT_EQ(reg.stats().total, 2u);
    reg.clear();
    EXPECT_EQ(reg.stats().total, 0u);
}

TEST(HookTypeParsing, AliasesAndErrors) {
    EXPECT_EQ(parse_hook_type("pre_tool_use"), HookType::pre_action);
    EXPECT_EQ(parse_hook_type("post_action"), HookType::post_action);
    EXPECT_EQ(parse_hook_type("user_prompt_submit"), HookType::prompt_submitted);
    EXPECT_EQ(parse_hook_type("stop"), HookType::stop);
    EXPECT_THROW(parse_hook_type("session_start"), std::invalid_argument);
    EXPECT_THROW(parse_stop_trigger("crash"), std::invalid_argument);
}

TEST(HookRegistry, TaskScopedHookIsolatedFromOtherTasks) {
    HookRegistry reg;
    reg.register_hook(allow_hook("t1-only"), HookScope::task, "", "T1");
    EXPECT_TRUE(reg.list_applicable<PreActionHook>({"", "T2"}).empty());
    EXPECT_EQ(reg.list_applicable<PreActionHook>({"", "T1"}).size(), 1u);
}

TEST(HookRegistry, RegisterThenUnregisterLookup) {
    HookRegistry reg;
    auto id = reg.register_hook(allow_hook("")).hook_id;
    auto listed = reg.list_applicable<PreActionHook>({});
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].id, id);

    EXPECT_TRUE(reg.unregister_hook(id, HookType::pre_action));
    EXPECT_TRUE(reg.list_applicable<PreActionHook>({}).empty());
}
