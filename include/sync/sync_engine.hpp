#pragma once

#include "common/cancellation_token.hpp"
#include "sync/strategy_registry.hpp"
#include "sync/sync_event.hpp"
#include "sync/sync_plan.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

enum class PlanState {
    PENDING,
    RUNNING,
    PAUSED,
    COMPLETED,
    FAILED,
    CANCELLED
};

std::string planStateToString(PlanState state);

// Point-in-time copy of a plan and its execution status.
struct SyncExecution {
    SyncPlan plan;
    PlanState state{PlanState::PENDING};
    std::optional<std::chrono::system_clock::time_point> startedAt;
    std::optional<std::chrono::system_clock::time_point> finishedAt;
};

// Runs sync plans against a strategy registry. Each started plan executes
// its tasks one after another on a dedicated thread and reports through
// the caller's event callback. Pause takes effect before the next task
// starts; cancel also fires the token seen by the running strategy.
class SyncEngine {
public:
    explicit SyncEngine(StrategyRegistryPtr registry, size_t progressQueueCapacity = 100);
    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    // Assigns ids to the plan and any task without one. Throws SyncError
    // when a task lacks a source or target endpoint.
    SyncPlan createPlan(const std::string& name, std::vector<SyncTask> tasks);
    std::optional<SyncExecution> getPlan(const std::string& planId) const;
    std::vector<SyncExecution> listPlans() const;

    // Plan control
    bool start(const std::string& planId, EventCallback callback, CancellationTokenPtr parent = nullptr);
    bool pause(const std::string& planId);
    bool resume(const std::string& planId, EventCallback callback = nullptr);
    bool cancel(const std::string& planId);

    // True once the plan's thread has emitted plan_complete.
    bool waitForCompletion(const std::string& planId, std::chrono::milliseconds timeout) const;

    // Runs the task's strategy verification synchronously. Throws SyncError.
    VerifyResult verifyTask(const std::string& planId, const std::string& taskId,
                            CancellationTokenPtr parent = nullptr);

    std::vector<StrategyCapabilities> getStrategies() const;
    StrategyRegistryPtr getRegistry() const { return registry_; }

    // Error handling
    std::string getLastError() const;

private:
    struct ExecutionRecord {
        SyncPlan plan;
        PlanState state{PlanState::PENDING};
        std::optional<std::chrono::system_clock::time_point> startedAt;
        std::optional<std::chrono::system_clock::time_point> finishedAt;
        CancellationTokenPtr token;
        EventCallback callback;
        std::thread worker;
        bool workerActive{false};
    };
    using RecordPtr = std::shared_ptr<ExecutionRecord>;

    void executePlan(RecordPtr record);
    bool runTask(const RecordPtr& record, size_t index);
    SyncStrategyPtr resolveStrategy(const SyncTask& task) const;
    SyncEvent makeTaskEvent(SyncEvent::Type type, const std::string& planId, const SyncTask& task) const;
    void emit(const EventCallback& callback, const SyncEvent& event) const;
    static SyncExecution snapshot(const ExecutionRecord& record);

    StrategyRegistryPtr registry_;
    size_t progressQueueCapacity_;
    std::map<std::string, RecordPtr> executions_;
    std::string lastError_;
    mutable std::mutex mutex_;
    mutable std::condition_variable stateChanged_;
};
