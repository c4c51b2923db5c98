#include "sync/sync_engine.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <future>
#include <sstream>

std::string planStateToString(PlanState state) {
    switch (state) {
        case PlanState::PENDING:   return "pending";
        case PlanState::RUNNING:   return "running";
        case PlanState::PAUSED:    return "paused";
        case PlanState::COMPLETED: return "completed";
        case PlanState::FAILED:    return "failed";
        case PlanState::CANCELLED: return "cancelled";
        default:                   return "unknown";
    }
}

SyncEngine::SyncEngine(StrategyRegistryPtr registry, size_t progressQueueCapacity)
    : registry_(registry ? std::move(registry) : std::make_shared<StrategyRegistry>())
    , progressQueueCapacity_(progressQueueCapacity) {
}

SyncEngine::~SyncEngine() {
    try {
        std::vector<RecordPtr> records;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& pair : executions_) {
                auto& record = pair.second;
                if (record->workerActive && record->token) {
                    record->token->cancel("engine shutting down");
                }
                records.push_back(record);
            }
        }
        stateChanged_.notify_all();

        for (auto& record : records) {
            if (record->worker.joinable()) {
                record->worker.join();
            }
        }
    } catch (const std::exception& e) {
        Logger::error("Error during SyncEngine shutdown: " + std::string(e.what()));
    }
}

SyncPlan SyncEngine::createPlan(const std::string& name, std::vector<SyncTask> tasks) {
    for (auto& task : tasks) {
        if (!task.source || !task.target) {
            throw SyncError(SyncError::Category::CONFIGURATION,
                            "task '" + task.name + "' requires both a source and a target endpoint");
        }
        if (task.id.empty()) {
            task.id = "task-" + utils::generateId();
        }
        if (task.name.empty()) {
            task.name = task.id;
        }
        task.reset();
    }

    auto record = std::make_shared<ExecutionRecord>();
    record->plan = SyncPlan("plan-" + utils::generateId(), name, std::move(tasks));

    std::lock_guard<std::mutex> lock(mutex_);
    executions_[record->plan.getId()] = record;
    Logger::info("Created sync plan " + record->plan.getId() + " with " +
                 std::to_string(record->plan.tasks().size()) + " tasks");
    return record->plan;
}

SyncExecution SyncEngine::snapshot(const ExecutionRecord& record) {
    SyncExecution execution;
    execution.plan = record.plan;
    execution.state = record.state;
    execution.startedAt = record.startedAt;
    execution.finishedAt = record.finishedAt;
    return execution;
}

std::optional<SyncExecution> SyncEngine::getPlan(const std::string& planId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = executions_.find(planId);
    if (it == executions_.end()) {
        return std::nullopt;
    }
    return snapshot(*it->second);
}

std::vector<SyncExecution> SyncEngine::listPlans() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SyncExecution> result;
    result.reserve(executions_.size());
    for (const auto& pair : executions_) {
        result.push_back(snapshot(*pair.second));
    }
    return result;
}

bool SyncEngine::start(const std::string& planId, EventCallback callback, CancellationTokenPtr parent) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = executions_.find(planId);
    if (it == executions_.end()) {
        lastError_ = "plan not found: " + planId;
        return false;
    }
    auto record = it->second;

    if (record->state == PlanState::RUNNING || record->workerActive) {
        lastError_ = "plan is already running: " + planId;
        return false;
    }
    if (record->state == PlanState::PAUSED) {
        lastError_ = "plan is paused, resume it instead: " + planId;
        return false;
    }

    // The previous worker has finished; reclaim it before starting again.
    if (record->worker.joinable()) {
        record->worker.join();
    }

    if (record->state == PlanState::FAILED) {
        for (auto& task : record->plan.tasks()) {
            if (task.canRetry()) {
                task.retry();
            }
        }
    } else if (record->state != PlanState::PENDING) {
        for (auto& task : record->plan.tasks()) {
            task.reset();
        }
    }

    record->token = parent ? parent->createChild() : CancellationToken::create();
    record->callback = std::move(callback);
    record->state = PlanState::RUNNING;
    record->startedAt = std::chrono::system_clock::now();
    record->finishedAt.reset();
    record->workerActive = true;
    record->worker = std::thread(&SyncEngine::executePlan, this, record);

    Logger::info("Started sync plan " + planId);
    return true;
}

bool SyncEngine::pause(const std::string& planId) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = executions_.find(planId);
    if (it == executions_.end()) {
        lastError_ = "plan not found: " + planId;
        return false;
    }
    if (it->second->state != PlanState::RUNNING) {
        lastError_ = "plan is not running: " + planId;
        return false;
    }

    it->second->state = PlanState::PAUSED;
    Logger::info("Paused sync plan " + planId + "; the current task will finish first");
    return true;
}

bool SyncEngine::resume(const std::string& planId, EventCallback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = executions_.find(planId);
        if (it == executions_.end()) {
            lastError_ = "plan not found: " + planId;
            return false;
        }
        if (it->second->state != PlanState::PAUSED) {
            lastError_ = "plan is not paused: " + planId;
            return false;
        }

        if (callback) {
            it->second->callback = std::move(callback);
        }
        it->second->state = PlanState::RUNNING;
        Logger::info("Resumed sync plan " + planId);
    }
    stateChanged_.notify_all();
    return true;
}

bool SyncEngine::cancel(const std::string& planId) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = executions_.find(planId);
        if (it == executions_.end()) {
            lastError_ = "plan not found: " + planId;
            return false;
        }
        auto& record = it->second;
        if (record->state == PlanState::COMPLETED || record->state == PlanState::FAILED ||
            record->state == PlanState::CANCELLED) {
            lastError_ = "plan has already finished: " + planId;
            return false;
        }

        record->state = PlanState::CANCELLED;
        if (record->token) {
            record->token->cancel("plan cancelled");
        }
        if (!record->workerActive) {
            record->finishedAt = std::chrono::system_clock::now();
        }
        Logger::info("Cancelled sync plan " + planId);
    }
    stateChanged_.notify_all();
    return true;
}

bool SyncEngine::waitForCompletion(const std::string& planId, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);

    auto it = executions_.find(planId);
    if (it == executions_.end()) {
        return false;
    }
    auto record = it->second;
    return stateChanged_.wait_for(lock, timeout, [&record]() {
        return !record->workerActive &&
               (record->state == PlanState::COMPLETED || record->state == PlanState::FAILED ||
                record->state == PlanState::CANCELLED);
    });
}

void SyncEngine::executePlan(RecordPtr record) {
    std::string planId;
    size_t taskCount = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        planId = record->plan.getId();
        taskCount = record->plan.tasks().size();
    }

    for (size_t i = 0; i < taskCount; ++i) {
        if (!runTask(record, i)) {
            Logger::info("Plan " + planId + " stopped before task " + std::to_string(i + 1) + " of " +
                         std::to_string(taskCount));
            break;
        }
    }

    SyncEvent done;
    EventCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (record->state != PlanState::CANCELLED) {
            record->state = record->plan.hasFailures() ? PlanState::FAILED : PlanState::COMPLETED;
        }
        record->finishedAt = std::chrono::system_clock::now();

        done.type = SyncEvent::Type::PLAN_COMPLETE;
        done.planId = planId;
        done.status = planStateToString(record->state);
        done.progress = static_cast<int>(record->plan.overallProgress());
        done.message = std::to_string(record->plan.completedCount()) + " completed, " +
                       std::to_string(record->plan.failedCount()) + " failed";
        callback = record->callback;
    }

    Logger::info("Sync plan " + planId + " finished: " + done.status + " (" + done.message + ")");
    emit(callback, done);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        record->workerActive = false;
    }
    stateChanged_.notify_all();
}

bool SyncEngine::runTask(const RecordPtr& record, size_t index) {
    SyncTask task;
    SyncStrategyPtr strategy;
    SyncEvent startEvent;
    EventCallback callback;
    CancellationTokenPtr planToken;
    std::string planId;

    {
        std::unique_lock<std::mutex> lock(mutex_);

        // Pause checkpoint: the next task does not start until resumed. The
        // timed wait also notices cancellation of a caller-supplied parent token.
        while (record->state == PlanState::PAUSED && !record->token->isCancelled()) {
            stateChanged_.wait_for(lock, std::chrono::milliseconds(100));
        }
        if (record->state == PlanState::CANCELLED || record->token->isCancelled()) {
            record->state = PlanState::CANCELLED;
            return false;
        }

        planId = record->plan.getId();
        auto& current = record->plan.tasks()[index];
        if (current.state != SyncTask::State::PENDING) {
            return true;
        }

        strategy = resolveStrategy(current);
        if (!strategy) {
            current.fail("no strategy found for task '" + current.name + "' (strategy '" +
                         current.strategy + "', source type '" + current.source->type + "')");
            SyncEvent event = makeTaskEvent(SyncEvent::Type::TASK_ERROR, planId, current);
            event.error = current.errorMessage;
            callback = record->callback;
            lock.unlock();

            Logger::error(event.error);
            emit(callback, event);
            return true;
        }

        current.start();
        task = current;
        planToken = record->token;
        startEvent = makeTaskEvent(SyncEvent::Type::TASK_START, planId, current);
        startEvent.message = "starting " + strategy->getName() + " sync";
        callback = record->callback;
    }

    Logger::info("Task " + task.id + " (" + task.name + "): " + task.source->describe() + " -> " +
                 task.target->describe() + " using " + strategy->getName());
    emit(callback, startEvent);

    auto taskToken = planToken->createChild();
    if (task.options.timeoutSeconds > 0) {
        taskToken->setTimeout(std::chrono::seconds(task.options.timeoutSeconds));
    }
    SyncContext ctx(taskToken, task.options, task.id);
    ProgressQueue progressQueue(progressQueueCapacity_);

    auto pending = std::async(std::launch::async, [&]() {
        strategy->sync(ctx, *task.source, *task.target, progressQueue);
    });

    while (pending.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
        auto update = progressQueue.popFor(std::chrono::milliseconds(50));
        if (!update) {
            continue;
        }

        SyncEvent event;
        EventCallback current;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& stored = record->plan.tasks()[index];
            stored.updateProgress(*update);
            event = makeTaskEvent(SyncEvent::Type::TASK_PROGRESS, planId, stored);
            event.message = update->lastMessage;
            current = record->callback;
        }
        emit(current, event);
    }
    size_t discarded = progressQueue.drain();
    if (discarded > 0) {
        Logger::debug("Discarded " + std::to_string(discarded) + " late progress updates for task " + task.id);
    }

    std::string failure;
    try {
        pending.get();
    } catch (const SyncError& e) {
        failure = e.what();
        if (e.isCancellation() || taskToken->isCancelled()) {
            failure = "cancelled: " + taskToken->getReason() + " (" + e.what() + ")";
        }
    } catch (const std::exception& e) {
        failure = e.what();
        if (taskToken->isCancelled()) {
            failure = "cancelled: " + taskToken->getReason() + " (" + e.what() + ")";
        }
    }

    std::optional<VerifyResult> verification;
    std::string verifyNote;
    if (failure.empty() && task.options.verifyAfterSync && !task.options.dryRun && !taskToken->isCancelled()) {
        try {
            verification = strategy->verify(ctx, *task.source, *task.target);
            verifyNote = verification->toString();
        } catch (const std::exception& e) {
            Logger::warning("Verification after sync failed for task " + task.id + ": " + e.what());
            verifyNote = std::string("verification error: ") + e.what();
        }
    }

    SyncEvent event;
    EventCallback current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& stored = record->plan.tasks()[index];
        if (failure.empty()) {
            stored.complete();
            stored.verifyResult = verification;
            event = makeTaskEvent(SyncEvent::Type::TASK_COMPLETE, planId, stored);
            event.progress = 100;
            event.message = verifyNote.empty() ? "sync completed" : "sync completed; " + verifyNote;
        } else {
            stored.fail(failure);
            event = makeTaskEvent(SyncEvent::Type::TASK_ERROR, planId, stored);
            event.error = failure;
        }
        current = record->callback;
    }

    if (failure.empty()) {
        Logger::info("Task " + task.id + " completed in " + std::to_string(
            std::chrono::duration_cast<std::chrono::seconds>(event.timestamp - *task.startedAt).count()) + "s");
    } else {
        Logger::error("Task " + task.id + " failed: " + failure);
    }
    emit(current, event);
    return true;
}

SyncStrategyPtr SyncEngine::resolveStrategy(const SyncTask& task) const {
    auto strategy = registry_->get(task.strategy);
    if (!strategy) {
        strategy = registry_->getForEndpoint(task.strategy);
    }
    if (!strategy && task.source) {
        strategy = registry_->getForEndpoint(task.source->type);
    }
    return strategy;
}

SyncEvent SyncEngine::makeTaskEvent(SyncEvent::Type type, const std::string& planId, const SyncTask& task) const {
    SyncEvent event;
    event.type = type;
    event.planId = planId;
    event.taskId = task.id;
    event.taskName = task.name;
    event.taskType = syncTypeToString(task.type);
    event.status = SyncTask::stateToString(task.state);
    if (task.progress) {
        event.progress = static_cast<int>(task.progress->percentDone());
        event.bytesTotal = task.progress->bytesTotal;
        event.bytesDone = task.progress->bytesDone;
        event.itemsTotal = task.progress->itemsTotal;
        event.itemsDone = task.progress->itemsDone;
    }
    return event;
}

void SyncEngine::emit(const EventCallback& callback, const SyncEvent& event) const {
    if (!callback) {
        return;
    }
    try {
        callback(event);
    } catch (const std::exception& e) {
        Logger::error("Sync event callback threw for " + SyncEvent::typeToString(event.type) + ": " + e.what());
    }
}

VerifyResult SyncEngine::verifyTask(const std::string& planId, const std::string& taskId,
                                    CancellationTokenPtr parent) {
    SyncTask task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = executions_.find(planId);
        if (it == executions_.end()) {
            throw SyncError(SyncError::Category::CONFIGURATION, "plan not found: " + planId);
        }
        const SyncTask* found = it->second->plan.findTask(taskId);
        if (!found) {
            throw SyncError(SyncError::Category::CONFIGURATION, "task not found: " + taskId);
        }
        task = *found;
    }

    auto strategy = resolveStrategy(task);
    if (!strategy) {
        throw SyncError(SyncError::Category::CONFIGURATION, "no strategy found for task '" + task.name + "'");
    }

    auto token = parent ? parent->createChild() : CancellationToken::create();
    SyncContext ctx(token, task.options, task.id);
    VerifyResult result = strategy->verify(ctx, *task.source, *task.target);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = executions_.find(planId);
        if (it != executions_.end()) {
            if (SyncTask* stored = it->second->plan.findTask(taskId)) {
                stored->verifyResult = result;
            }
        }
    }
    return result;
}

std::vector<StrategyCapabilities> SyncEngine::getStrategies() const {
    return registry_->getAllCapabilities();
}

std::string SyncEngine::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}
