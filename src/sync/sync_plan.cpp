#include "sync/sync_plan.hpp"

namespace {

int64_t toEpochSeconds(const std::optional<SyncTask::Clock::time_point>& time) {
    if (!time) {
        return 0;
    }
    return std::chrono::duration_cast<std::chrono::seconds>(time->time_since_epoch()).count();
}

} // namespace

SyncTask::SyncTask(const std::string& name, SyncType type, const std::string& strategy,
                   EndpointPtr source, EndpointPtr target, SyncOptions options)
    : name(name)
    , type(type)
    , strategy(strategy)
    , source(std::move(source))
    , target(std::move(target))
    , options(std::move(options)) {
}

void SyncTask::start() {
    state = State::RUNNING;
    startedAt = Clock::now();
    completedAt.reset();
    errorMessage.clear();
    verifyResult.reset();
}

void SyncTask::updateProgress(const Progress& value) {
    progress = value;
}

void SyncTask::complete() {
    state = State::COMPLETED;
    completedAt = Clock::now();
}

void SyncTask::fail(const std::string& error) {
    state = State::FAILED;
    errorMessage = error;
    completedAt = Clock::now();
}

bool SyncTask::canRetry() const {
    return state == State::FAILED && retries < maxRetries;
}

bool SyncTask::retry() {
    if (!canRetry()) {
        return false;
    }
    retries++;
    state = State::PENDING;
    errorMessage.clear();
    progress.reset();
    return true;
}

void SyncTask::reset() {
    state = State::PENDING;
    errorMessage.clear();
    progress.reset();
    verifyResult.reset();
    startedAt.reset();
    completedAt.reset();
    retries = 0;
}

std::chrono::milliseconds SyncTask::duration() const {
    if (!startedAt) {
        return std::chrono::milliseconds(0);
    }
    auto end = completedAt ? *completedAt : Clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - *startedAt);
}

std::string SyncTask::stateToString(State state) {
    switch (state) {
        case State::PENDING:   return "pending";
        case State::RUNNING:   return "running";
        case State::COMPLETED: return "completed";
        case State::FAILED:    return "failed";
        default:               return "unknown";
    }
}

nlohmann::json SyncTask::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["type"] = syncTypeToString(type);
    j["strategy"] = strategy;
    j["status"] = stateToString(state);
    j["error"] = errorMessage;
    j["retries"] = retries;
    j["started_at"] = toEpochSeconds(startedAt);
    j["completed_at"] = toEpochSeconds(completedAt);
    j["duration_ms"] = duration().count();
    if (source) {
        j["source"] = source->describe();
    }
    if (target) {
        j["target"] = target->describe();
    }
    if (progress) {
        j["progress"] = progress->toJson();
    }
    if (verifyResult) {
        j["verify"] = verifyResult->toJson();
    }
    return j;
}

SyncPlan::SyncPlan(const std::string& id, const std::string& name, std::vector<SyncTask> tasks)
    : id_(id)
    , name_(name)
    , tasks_(std::move(tasks)) {
}

SyncTask* SyncPlan::findTask(const std::string& taskId) {
    for (auto& task : tasks_) {
        if (task.id == taskId) {
            return &task;
        }
    }
    return nullptr;
}

const SyncTask* SyncPlan::findTask(const std::string& taskId) const {
    for (const auto& task : tasks_) {
        if (task.id == taskId) {
            return &task;
        }
    }
    return nullptr;
}

size_t SyncPlan::completedCount() const {
    size_t count = 0;
    for (const auto& task : tasks_) {
        if (task.state == SyncTask::State::COMPLETED) {
            count++;
        }
    }
    return count;
}

size_t SyncPlan::failedCount() const {
    size_t count = 0;
    for (const auto& task : tasks_) {
        if (task.state == SyncTask::State::FAILED) {
            count++;
        }
    }
    return count;
}

double SyncPlan::overallProgress() const {
    if (tasks_.empty()) {
        return 0.0;
    }
    return static_cast<double>(completedCount() + failedCount()) * 100.0 / static_cast<double>(tasks_.size());
}

nlohmann::json SyncPlan::toJson() const {
    nlohmann::json j;
    j["id"] = id_;
    j["name"] = name_;
    j["created_at"] = std::chrono::duration_cast<std::chrono::seconds>(createdAt_.time_since_epoch()).count();
    j["completed"] = completedCount();
    j["failed"] = failedCount();
    j["overall_progress"] = overallProgress();
    j["tasks"] = nlohmann::json::array();
    for (const auto& task : tasks_) {
        j["tasks"].push_back(task.toJson());
    }
    return j;
}
