#include <gtest/gtest.h>
#include "sync/strategy_registry.hpp"
#include "sync/sync_engine.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace {

class FakeStrategy : public SyncStrategy {
public:
    using SyncHook = std::function<void(const SyncContext&, const Endpoint&, ProgressReporter&)>;

    explicit FakeStrategy(std::string name = "fake") : name_(std::move(name)) {}

    std::string getName() const override { return name_; }
    SyncType getType() const override { return SyncType::OBJECT_STORAGE; }
    int64_t estimateSize(const SyncContext&, const Endpoint&) override { return 100; }

    void sync(const SyncContext& ctx, const Endpoint& source, const Endpoint&,
              ProgressQueue& progressOut) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_[source.path]++;
        }
        totalCalls++;
        ProgressReporter reporter(ctx.taskId, &progressOut);
        reporter.setTotals(100, 1);
        if (hook) {
            hook(ctx, source, reporter);
        }
        reporter.update(100, 1, "done");
    }

    VerifyResult verify(const SyncContext&, const Endpoint&, const Endpoint&) override {
        VerifyResult result;
        result.setCounts(1, 1);
        return result;
    }

    bool supportsIncremental() const override { return false; }
    bool supportsResume() const override { return false; }

    int callsFor(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_[path];
    }

    SyncHook hook;
    std::atomic<int> totalCalls{0};

private:
    std::string name_;
    std::mutex mutex_;
    std::map<std::string, int> calls_;
};

class EventRecorder {
public:
    EventCallback callback() {
        return [this](const SyncEvent& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        };
    }

    // Everything except progress events, in emission order.
    std::vector<SyncEvent> milestones() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<SyncEvent> result;
        for (const auto& event : events_) {
            if (event.type != SyncEvent::Type::TASK_PROGRESS) {
                result.push_back(event);
            }
        }
        return result;
    }

    size_t count(SyncEvent::Type type) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& event : events_) {
            if (event.type == type) {
                n++;
            }
        }
        return n;
    }

private:
    std::mutex mutex_;
    std::vector<SyncEvent> events_;
};

bool waitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

} // namespace

class SyncEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        strategy_ = std::make_shared<FakeStrategy>();
        registry_ = std::make_shared<StrategyRegistry>();
        registry_->registerStrategy(strategy_);
        engine_ = std::make_unique<SyncEngine>(registry_);
    }

    void TearDown() override {
        engine_.reset();
    }

    SyncTask makeTask(const std::string& name, const std::string& strategy = "fake", bool verify = false) {
        auto source = std::make_shared<Endpoint>();
        source->type = "local";
        source->path = name;
        auto target = std::make_shared<Endpoint>();
        target->type = "local";
        target->path = name + "-copy";

        SyncOptions options;
        options.verifyAfterSync = verify;
        return SyncTask(name, SyncType::OBJECT_STORAGE, strategy, source, target, options);
    }

    std::shared_ptr<FakeStrategy> strategy_;
    StrategyRegistryPtr registry_;
    std::unique_ptr<SyncEngine> engine_;
    EventRecorder recorder_;
};

TEST_F(SyncEngineTest, RunsTasksInOrder) {
    auto plan = engine_->createPlan("ordered", {makeTask("a"), makeTask("b"), makeTask("c")});
    ASSERT_TRUE(engine_->start(plan.getId(), recorder_.callback()));
    ASSERT_TRUE(engine_->waitForCompletion(plan.getId(), std::chrono::seconds(10)));

    auto events = recorder_.milestones();
    ASSERT_EQ(events.size(), 7u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(events[2 * i].type, SyncEvent::Type::TASK_START);
        EXPECT_EQ(events[2 * i + 1].type, SyncEvent::Type::TASK_COMPLETE);
        EXPECT_EQ(events[2 * i].taskId, plan.tasks()[i].id);
        EXPECT_EQ(events[2 * i + 1].taskId, plan.tasks()[i].id);
        EXPECT_EQ(events[2 * i + 1].progress, 100);
    }
    EXPECT_EQ(events.back().type, SyncEvent::Type::PLAN_COMPLETE);
    EXPECT_EQ(events.back().status, "completed");

    auto execution = engine_->getPlan(plan.getId());
    ASSERT_TRUE(execution.has_value());
    EXPECT_EQ(execution->state, PlanState::COMPLETED);
    EXPECT_EQ(execution->plan.completedCount(), 3u);
    EXPECT_TRUE(execution->finishedAt.has_value());
}

TEST_F(SyncEngineTest, FailedTaskDoesNotStopLaterTasks) {
    strategy_->hook = [](const SyncContext&, const Endpoint& source, ProgressReporter&) {
        if (source.path == "b") {
            throw SyncError(SyncError::Category::TRANSFER, "copy failed");
        }
    };

    auto plan = engine_->createPlan("partial", {makeTask("a"), makeTask("b"), makeTask("c")});
    ASSERT_TRUE(engine_->start(plan.getId(), recorder_.callback()));
    ASSERT_TRUE(engine_->waitForCompletion(plan.getId(), std::chrono::seconds(10)));

    auto events = recorder_.milestones();
    ASSERT_EQ(events.size(), 7u);
    EXPECT_EQ(events[3].type, SyncEvent::Type::TASK_ERROR);
    EXPECT_EQ(events[3].error, "copy failed");
    EXPECT_EQ(events[5].type, SyncEvent::Type::TASK_COMPLETE);
    EXPECT_EQ(events.back().status, "failed");

    auto execution = engine_->getPlan(plan.getId());
    ASSERT_TRUE(execution.has_value());
    EXPECT_EQ(execution->state, PlanState::FAILED);
    EXPECT_EQ(execution->plan.tasks()[1].state, SyncTask::State::FAILED);
    EXPECT_EQ(execution->plan.tasks()[2].state, SyncTask::State::COMPLETED);
}

TEST_F(SyncEngineTest, MissingStrategyReportsTaskErrorOnly) {
    auto task = makeTask("orphan", "nonexistent");
    auto source = std::make_shared<Endpoint>(*task.source);
    source->type = "ftp";
    task.source = source;

    auto plan = engine_->createPlan("orphaned", {task});
    ASSERT_TRUE(engine_->start(plan.getId(), recorder_.callback()));
    ASSERT_TRUE(engine_->waitForCompletion(plan.getId(), std::chrono::seconds(10)));

    auto events = recorder_.milestones();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, SyncEvent::Type::TASK_ERROR);
    EXPECT_NE(events[0].error.find("no strategy found"), std::string::npos);
    EXPECT_EQ(events[1].type, SyncEvent::Type::PLAN_COMPLETE);
    EXPECT_EQ(recorder_.count(SyncEvent::Type::TASK_START), 0u);
    EXPECT_EQ(strategy_->totalCalls.load(), 0);
}

TEST_F(SyncEngineTest, ResolvesStrategyFromEndpointAlias) {
    auto minio = std::make_shared<FakeStrategy>("minio");
    registry_->registerStrategy(minio);

    auto plan = engine_->createPlan("alias", {makeTask("aliased", "")});
    ASSERT_TRUE(engine_->start(plan.getId(), recorder_.callback()));
    ASSERT_TRUE(engine_->waitForCompletion(plan.getId(), std::chrono::seconds(10)));

    EXPECT_EQ(engine_->getPlan(plan.getId())->state, PlanState::COMPLETED);
    EXPECT_EQ(minio->totalCalls.load(), 1);
    EXPECT_EQ(strategy_->totalCalls.load(), 0);
}

TEST_F(SyncEngineTest, PauseHoldsNextTaskUntilResume) {
    std::atomic<bool> release{false};
    strategy_->hook = [&release](const SyncContext& ctx, const Endpoint& source, ProgressReporter&) {
        if (source.path != "first") {
            return;
        }
        while (!release && !ctx.isCancelled()) {
            ctx.token->waitFor(std::chrono::milliseconds(10));
        }
    };

    auto plan = engine_->createPlan("pausable", {makeTask("first"), makeTask("second")});
    ASSERT_TRUE(engine_->start(plan.getId(), recorder_.callback()));
    ASSERT_TRUE(waitUntil([this]() { return strategy_->totalCalls.load() == 1; }, std::chrono::seconds(5)));

    ASSERT_TRUE(engine_->pause(plan.getId()));
    release = true;

    ASSERT_TRUE(waitUntil([&]() {
        auto execution = engine_->getPlan(plan.getId());
        return execution && execution->plan.tasks()[0].state == SyncTask::State::COMPLETED;
    }, std::chrono::seconds(5)));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    EXPECT_EQ(strategy_->totalCalls.load(), 1);
    EXPECT_EQ(engine_->getPlan(plan.getId())->state, PlanState::PAUSED);
    EXPECT_FALSE(engine_->start(plan.getId(), recorder_.callback()));

    ASSERT_TRUE(engine_->resume(plan.getId()));
    ASSERT_TRUE(engine_->waitForCompletion(plan.getId(), std::chrono::seconds(10)));
    EXPECT_EQ(strategy_->totalCalls.load(), 2);
    EXPECT_EQ(engine_->getPlan(plan.getId())->state, PlanState::COMPLETED);
}

TEST_F(SyncEngineTest, CancelStopsRunningTaskAndSkipsTheRest) {
    strategy_->hook = [](const SyncContext& ctx, const Endpoint&, ProgressReporter&) {
        while (!ctx.isCancelled()) {
            ctx.token->waitFor(std::chrono::milliseconds(10));
        }
        ctx.throwIfCancelled();
    };

    auto plan = engine_->createPlan("cancellable", {makeTask("first"), makeTask("second")});
    ASSERT_TRUE(engine_->start(plan.getId(), recorder_.callback()));
    ASSERT_TRUE(waitUntil([this]() { return strategy_->totalCalls.load() == 1; }, std::chrono::seconds(5)));

    ASSERT_TRUE(engine_->cancel(plan.getId()));
    ASSERT_TRUE(engine_->waitForCompletion(plan.getId(), std::chrono::seconds(10)));

    auto events = recorder_.milestones();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].type, SyncEvent::Type::TASK_START);
    EXPECT_EQ(events[1].type, SyncEvent::Type::TASK_ERROR);
    EXPECT_NE(events[1].error.find("cancelled"), std::string::npos);
    EXPECT_EQ(events[2].type, SyncEvent::Type::PLAN_COMPLETE);
    EXPECT_EQ(events[2].status, "cancelled");
    EXPECT_EQ(strategy_->callsFor("second"), 0);
    EXPECT_EQ(engine_->getPlan(plan.getId())->state, PlanState::CANCELLED);
    EXPECT_FALSE(engine_->cancel(plan.getId()));
}

TEST_F(SyncEngineTest, RestartRetriesOnlyFailedTasks) {
    std::atomic<bool> failSecond{true};
    strategy_->hook = [&failSecond](const SyncContext&, const Endpoint& source, ProgressReporter&) {
        if (source.path == "second" && failSecond) {
            throw SyncError(SyncError::Category::CONNECTIVITY, "target unreachable");
        }
    };

    auto plan = engine_->createPlan("retry", {makeTask("first"), makeTask("second")});
    ASSERT_TRUE(engine_->start(plan.getId(), recorder_.callback()));
    ASSERT_TRUE(engine_->waitForCompletion(plan.getId(), std::chrono::seconds(10)));
    EXPECT_EQ(engine_->getPlan(plan.getId())->state, PlanState::FAILED);

    failSecond = false;
    ASSERT_TRUE(engine_->start(plan.getId(), recorder_.callback()));
    ASSERT_TRUE(engine_->waitForCompletion(plan.getId(), std::chrono::seconds(10)));

    auto execution = engine_->getPlan(plan.getId());
    ASSERT_TRUE(execution.has_value());
    EXPECT_EQ(execution->state, PlanState::COMPLETED);
    EXPECT_EQ(strategy_->callsFor("first"), 1);
    EXPECT_EQ(strategy_->callsFor("second"), 2);
    EXPECT_EQ(execution->plan.tasks()[1].retries, 1);
}

TEST_F(SyncEngineTest, VerifyAfterSyncAttachesResult) {
    auto plan = engine_->createPlan("verified", {makeTask("a", "fake", true)});
    ASSERT_TRUE(engine_->start(plan.getId(), recorder_.callback()));
    ASSERT_TRUE(engine_->waitForCompletion(plan.getId(), std::chrono::seconds(10)));

    auto events = recorder_.milestones();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_NE(events[1].message.find("Verification passed"), std::string::npos);

    auto execution = engine_->getPlan(plan.getId());
    ASSERT_TRUE(execution->plan.tasks()[0].verifyResult.has_value());
    EXPECT_TRUE(execution->plan.tasks()[0].verifyResult->isValid());
}

TEST_F(SyncEngineTest, ForwardsProgressEvents) {
    strategy_->hook = [](const SyncContext&, const Endpoint&, ProgressReporter& reporter) {
        reporter.update(50, 0, "halfway");
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
    };

    auto plan = engine_->createPlan("progress", {makeTask("a")});
    ASSERT_TRUE(engine_->start(plan.getId(), recorder_.callback()));
    ASSERT_TRUE(engine_->waitForCompletion(plan.getId(), std::chrono::seconds(10)));
    EXPECT_GT(recorder_.count(SyncEvent::Type::TASK_PROGRESS), 0u);
}

TEST_F(SyncEngineTest, VerifyTaskOnDemand) {
    auto plan = engine_->createPlan("on-demand", {makeTask("a")});
    auto result = engine_->verifyTask(plan.getId(), plan.tasks()[0].id);
    EXPECT_TRUE(result.isValid());
    EXPECT_EQ(result.getSourceCount(), 1);

    EXPECT_THROW(engine_->verifyTask(plan.getId(), "missing"), SyncError);
    EXPECT_THROW(engine_->verifyTask("missing", plan.tasks()[0].id), SyncError);
}

TEST_F(SyncEngineTest, RejectsUnknownPlansAndIncompleteTasks) {
    EXPECT_FALSE(engine_->start("plan-missing", recorder_.callback()));
    EXPECT_NE(engine_->getLastError().find("plan not found"), std::string::npos);
    EXPECT_FALSE(engine_->pause("plan-missing"));
    EXPECT_FALSE(engine_->cancel("plan-missing"));

    SyncTask task = makeTask("a");
    task.target.reset();
    EXPECT_THROW(engine_->createPlan("broken", {task}), SyncError);
}
