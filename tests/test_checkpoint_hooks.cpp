#include <gtest/gtest.h>
#include "checkpoint_hooks.hpp"
#include "hook_executor.hpp"
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace toolguard;
using nlohmann::json;

namespace {

class RecordingStore : public CheckpointStore {
public:
    struct Call {
        std::string task_id, trigger, phase;
        json context;
    };

    std::string create_checkpoint(const std::string& task_id, const std::string& trigger,
                                  const std::string& phase, const json& context) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) throw std::runtime_error("store offline");
        calls_.push_back({task_id, trigger, phase, context});
        return "cp-" + std::to_string(calls_.size());
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    bool fail = false;

private:
    mutable std::mutex mutex_;
    std::vector<Call> calls_;
};

// Slow enough to lose a short timeout race, then touches its own state
class SlowStore : public CheckpointStore {
public:
    explicit SlowStore(std::shared_ptr<std::promise<std::string>> done)
        : done_(std::move(done)) {}

    std::string create_checkpoint(const std::string& task_id, const std::string&,
                                  const std::string&, const json&) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        std::string id = label_ + task_id;
        done_->set_value(id);
        return id;
    }

private:
    std::shared_ptr<std::promise<std::string>> done_;
    std::string label_ = "slow-store-checkpoint-for-task-";
};

} // namespace

TEST(AutoCheckpointHooks, DirectCallsRespectConfig) {
    auto store = std::make_shared<RecordingStore>();
    auto hooks = std::make_shared<AutoCheckpointHooks>(store);

    hooks->on_iteration_start("T1", 1);
    hooks->on_iteration_failure("T1", 1, {{"passed", false}}, "draft");
    hooks->on_task_status_change("T1", "pending", "in_progress");  // off by default
    hooks->on_work_product_store("T1", "WP-1", "implementation");  // off by default

    auto calls = store->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].trigger, "auto_iteration");
    EXPECT_EQ(calls[0].phase, "iteration");
    EXPECT_EQ(calls[0].context["execution_step"], 1);
    EXPECT_EQ(calls[1].phase, "iteration_failed");
    EXPECT_EQ(calls[1].context["draft_content"], "draft");
}

TEST(AutoCheckpointHooks, OnlySignificantStatusTransitions) {
    auto store = std::make_shared<RecordingStore>();
    AutoCheckpointConfig cfg;
    cfg.task_status_change = true;
    auto hooks = std::make_shared<AutoCheckpointHooks>(store, cfg);

    hooks->on_task_status_change("T1", "pending", "in_progress");
    hooks->on_task_status_change("T1", "in_progress", "completed");
    hooks->on_task_status_change("T1", "in_progress", "blocked");
    hooks->on_task_status_change("T1", "blocked", "in_progress");

    auto calls = store->calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].trigger, "manual");
    EXPECT_EQ(calls[0].phase, "status_change");
}

TEST(AutoCheckpointHooks, DisabledDoesNothing) {
    auto store = std::make_shared<RecordingStore>();
    AutoCheckpointConfig cfg;
    cfg.enabled = false;
    auto hooks = std::make_shared<AutoCheckpointHooks>(store, cfg);
    hooks->on_iteration_start("T1", 1);
    hooks->on_iteration_failure("T1", 1, json::object());
    EXPECT_TRUE(store->calls().empty());
}

TEST(AutoCheckpointHooks, StoreFailureIsSwallowed) {
    auto store = std::make_shared<RecordingStore>();
    store->fail = true;
    auto hooks = std::make_shared<AutoCheckpointHooks>(store);
    EXPECT_NO_THROW(hooks->on_iteration_start("T1", 2));
}

TEST(AutoCheckpointHooks, RegisteredHooksFireThroughExecutor) {
    auto store = std::make_shared<RecordingStore>();
    auto hooks = std::make_shared<AutoCheckpointHooks>(store);
    HookRegistry reg;
    auto ids = hooks->register_hooks(reg);
    EXPECT_EQ(ids.size(), 3u);
    EXPECT_EQ(reg.stats().total, 3u);

    HookExecutor exec(reg);

    ToolCallContext start;
    start.tool_name = "iteration_start";
    start.tool_input = {{"task_id", "T9"}, {"iteration", 3}};
    EXPECT_TRUE(exec.run_pre_action(start).allowed);

    ToolCallContext other;
    other.tool_name = "Write";
    other.task_id = "T9";
    exec.run_pre_action(other);

    PostActionContext ok;
    ok.tool_name = "iteration_validate";
    ok.task_id = "T9";
    exec.run_post_action(ok);

    PostActionContext failed = ok;
    failed.success = false;
    failed.error = "tests failed";
    failed.tool_result = {{"passed", false}};
    exec.run_post_action(failed);

    StopContext stop;
    stop.task_id = "T9";
    stop.trigger = StopTrigger::session_end;
    exec.run_stop(stop);
    stop.trigger = StopTrigger::context_limit;
    auto stop_out = exec.run_stop(stop);
    ASSERT_EQ(stop_out.results.size(), 1u);
    ASSERT_EQ(stop_out.results[0].actions_performed.size(), 1u);
    EXPECT_TRUE(stop_out.results[0].actions_performed[0].success);

    auto calls = store->calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].phase, "iteration");
    EXPECT_EQ(calls[0].task_id, "T9");
    EXPECT_EQ(calls[0].context["execution_step"], 3);
    EXPECT_EQ(calls[1].phase, "iteration_failed");
    EXPECT_EQ(calls[1].context["draft_content"], "tests failed");
    EXPECT_EQ(calls[2].trigger, "auto_stop");
    EXPECT_EQ(calls[2].phase, "stop_context_limit");
}

TEST(AutoCheckpointHooks, FailingStoreNeverChangesDecision) {
    auto store = std::make_shared<RecordingStore>();
    store->fail = true;
    auto hooks = std::make_shared<AutoCheckpointHooks>(store);
    HookRegistry reg;
    hooks->register_hooks(reg);
    HookExecutor exec(reg);

    ToolCallContext start;
    start.tool_name = "iteration_next";
    start.task_id = "T1";
    auto out = exec.run_pre_action(start);
    EXPECT_TRUE(out.allowed);
    EXPECT_EQ(out.action, SecurityAction::allow);

    StopContext stop;
    stop.task_id = "T1";
    stop.trigger = StopTrigger::error;
    auto stop_out = exec.run_stop(stop);
    ASSERT_EQ(stop_out.results.size(), 1u);
    EXPECT_TRUE(stop_out.results[0].success);
    EXPECT_FALSE(stop_out.results[0].actions_performed[0].success);
}

TEST(AutoCheckpointHooks, TimedOutHookKeepsStoreAlive) {
    auto done = std::make_shared<std::promise<std::string>>();
    auto finished = done->get_future();
    {
        auto store = std::make_shared<SlowStore>(done);
        auto hooks = std::make_shared<AutoCheckpointHooks>(store);
        HookRegistry reg;
        hooks->register_hooks(reg);

        ExecutorOptions opts;
        opts.default_timeout = std::chrono::milliseconds(20);
        HookExecutor exec(reg, opts);

        StopContext stop;
        stop.task_id = "T1";
        stop.trigger = StopTrigger::error;
        auto out = exec.run_stop(stop);
        ASSERT_EQ(out.reports.size(), 1u);
        EXPECT_EQ(out.reports[0].error, "Timeout");
    }
    // Owners are gone; the handler thread still finishes against live objects
    ASSERT_EQ(finished.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(finished.get(), "slow-store-checkpoint-for-task-T1");
}

TEST(AutoCheckpointHooks, RejectsMissingStore) {
    EXPECT_THROW(AutoCheckpointHooks(nullptr), std::invalid_argument);
}

TEST(AutoCheckpointHooks, RegisterRequiresSharedOwnership) {
    AutoCheckpointHooks hooks(std::make_shared<RecordingStore>());
    HookRegistry reg;
    EXPECT_THROW(hooks.register_hooks(reg), std::bad_weak_ptr);
}

TEST(JsonlCheckpointStore, AppendsAndLoads) {
    auto path = (fs::temp_directory_path() / ("toolguard-cp-" + random_base36(8)) / "cp.jsonl").string();
    JsonlCheckpointStore store(path);
    auto id1 = store.create_checkpoint("T1", "auto_iteration", "iteration", {{"execution_step", 1}});
    store.create_checkpoint("T2", "manual", "status_change", json::object());
    EXPECT_EQ(id1.rfind("cp-", 0), 0u);

    EXPECT_EQ(store.load().size(), 2u);
    auto t1 = store.load("T1");
    ASSERT_EQ(t1.size(), 1u);
    EXPECT_EQ(t1[0].id, id1);
    EXPECT_EQ(t1[0].context["execution_step"], 1);
    fs::remove_all(fs::path(path).parent_path());
}
