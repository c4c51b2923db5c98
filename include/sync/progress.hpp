#pragma once

#include "common/bounded_queue.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

struct Progress {
    using Clock = std::chrono::system_clock;

    std::string taskId;
    std::string phase;
    int64_t bytesTotal{0};
    int64_t bytesDone{0};
    int64_t itemsTotal{0};
    int64_t itemsDone{0};
    std::string currentItem;
    Clock::time_point startedAt{Clock::now()};
    Clock::time_point updatedAt{Clock::now()};
    std::string lastMessage;
    int64_t errors{0};
    int64_t warnings{0};

    // bytesDone / bytesTotal * 100, clamped to [0, 100]; 0 when the total
    // is unknown.
    double percentDone() const;
    double itemPercentDone() const;
    int64_t remainingBytes() const;
    std::chrono::seconds elapsed() const;
    double bytesPerSecond() const;
    // Estimated seconds left at the current rate, or -1 when unknown.
    int64_t etaSeconds() const;

    std::string toString() const;
    nlohmann::json toJson() const;
};

using ProgressQueue = BoundedQueue<Progress>;

std::string formatBytes(int64_t bytes);
std::string formatDuration(std::chrono::seconds duration);

// Owns the Progress of one sync invocation. Every mutation is applied under
// the reporter's lock and a copy is offered to the outbound queue without
// blocking; when the queue is full the update is dropped.
class ProgressReporter {
public:
    ProgressReporter(const std::string& taskId, ProgressQueue* out);

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void setPhase(const std::string& phase);
    void setTotals(int64_t bytesTotal, int64_t itemsTotal);
    void update(int64_t bytesDone, int64_t itemsDone, const std::string& message = "");
    void addBytes(int64_t bytes);
    void incrementItems(int64_t count = 1);
    void setCurrentItem(const std::string& item);
    void setMessage(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    Progress getProgress() const;
    size_t droppedUpdates() const;

private:
    template<typename Mutator>
    void apply(Mutator&& mutate);

    mutable std::mutex mutex_;
    Progress progress_;
    ProgressQueue* out_;
    size_t dropped_{0};
};
