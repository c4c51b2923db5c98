#pragma once

#include "sync/progress.hpp"
#include "sync/sync_types.hpp"
#include "sync/verify_result.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// One sync operation: a source, a target and the strategy that moves data
// between them. Mutated only by the engine while the plan executes.
class SyncTask {
public:
    enum class State {
        PENDING,
        RUNNING,
        COMPLETED,
        FAILED
    };

    using Clock = std::chrono::system_clock;

    SyncTask() = default;
    SyncTask(const std::string& name, SyncType type, const std::string& strategy,
             EndpointPtr source, EndpointPtr target, SyncOptions options = SyncOptions());

    // Lifecycle
    void start();
    void updateProgress(const Progress& progress);
    void complete();
    void fail(const std::string& error);
    bool canRetry() const;
    bool retry();
    void reset();

    std::chrono::milliseconds duration() const;

    static std::string stateToString(State state);
    nlohmann::json toJson() const;

    std::string id;
    std::string name;
    SyncType type{SyncType::OBJECT_STORAGE};
    std::string strategy;
    EndpointPtr source;
    EndpointPtr target;
    SyncOptions options;

    State state{State::PENDING};
    std::optional<Progress> progress;
    std::string errorMessage;
    std::optional<VerifyResult> verifyResult;
    std::optional<Clock::time_point> startedAt;
    std::optional<Clock::time_point> completedAt;
    int retries{0};
    int maxRetries{3};
};

// Ordered task list. Task order is execution order.
class SyncPlan {
public:
    using Clock = std::chrono::system_clock;

    SyncPlan() = default;
    SyncPlan(const std::string& id, const std::string& name, std::vector<SyncTask> tasks);

    const std::string& getId() const { return id_; }
    const std::string& getName() const { return name_; }
    Clock::time_point getCreatedAt() const { return createdAt_; }

    std::vector<SyncTask>& tasks() { return tasks_; }
    const std::vector<SyncTask>& tasks() const { return tasks_; }
    SyncTask* findTask(const std::string& taskId);
    const SyncTask* findTask(const std::string& taskId) const;

    size_t completedCount() const;
    size_t failedCount() const;
    bool hasFailures() const { return failedCount() > 0; }
    // Share of finished tasks, 0-100.
    double overallProgress() const;

    nlohmann::json toJson() const;

private:
    std::string id_;
    std::string name_;
    Clock::time_point createdAt_{Clock::now()};
    std::vector<SyncTask> tasks_;
};
