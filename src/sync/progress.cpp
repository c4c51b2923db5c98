#include "sync/progress.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

double Progress::percentDone() const {
    if (bytesTotal <= 0) {
        return 0.0;
    }
    double percent = static_cast<double>(bytesDone) / static_cast<double>(bytesTotal) * 100.0;
    return std::clamp(percent, 0.0, 100.0);
}

double Progress::itemPercentDone() const {
    if (itemsTotal <= 0) {
        return 0.0;
    }
    double percent = static_cast<double>(itemsDone) / static_cast<double>(itemsTotal) * 100.0;
    return std::clamp(percent, 0.0, 100.0);
}

int64_t Progress::remainingBytes() const {
    return std::max<int64_t>(0, bytesTotal - bytesDone);
}

std::chrono::seconds Progress::elapsed() const {
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - startedAt);
    return std::max(elapsed, std::chrono::seconds(0));
}

double Progress::bytesPerSecond() const {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - startedAt).count();
    if (ms <= 0 || bytesDone <= 0) {
        return 0.0;
    }
    return static_cast<double>(bytesDone) * 1000.0 / static_cast<double>(ms);
}

int64_t Progress::etaSeconds() const {
    double speed = bytesPerSecond();
    if (speed <= 0.0 || bytesTotal <= 0) {
        return -1;
    }
    return static_cast<int64_t>(static_cast<double>(remainingBytes()) / speed);
}

std::string Progress::toString() const {
    std::stringstream ss;
    ss << "[" << phase << "] " << std::fixed << std::setprecision(1) << percentDone() << "% ("
       << formatBytes(bytesDone) << "/" << formatBytes(bytesTotal) << ", "
       << itemsDone << "/" << itemsTotal << " items)";
    if (!currentItem.empty()) {
        ss << " " << currentItem;
    }
    if (!lastMessage.empty()) {
        ss << " - " << lastMessage;
    }
    return ss.str();
}

nlohmann::json Progress::toJson() const {
    nlohmann::json j;
    j["task_id"] = taskId;
    j["phase"] = phase;
    j["bytes_total"] = bytesTotal;
    j["bytes_done"] = bytesDone;
    j["items_total"] = itemsTotal;
    j["items_done"] = itemsDone;
    j["current_item"] = currentItem;
    j["percent"] = percentDone();
    j["elapsed_seconds"] = elapsed().count();
    j["bytes_per_second"] = bytesPerSecond();
    j["eta_seconds"] = etaSeconds();
    j["message"] = lastMessage;
    j["errors"] = errors;
    j["warnings"] = warnings;
    return j;
}

std::string formatBytes(int64_t bytes) {
    const int64_t unit = 1024;
    if (bytes < unit) {
        return std::to_string(bytes) + " B";
    }
    const char* suffixes = "KMGTPE";
    double value = static_cast<double>(bytes);
    int exp = -1;
    while (value >= unit && exp < 5) {
        value /= unit;
        exp++;
    }
    std::stringstream ss;
    ss << std::fixed << std::setprecision(1) << value << " " << suffixes[exp] << "iB";
    return ss.str();
}

std::string formatDuration(std::chrono::seconds duration) {
    int64_t total = duration.count();
    if (total < 0) {
        total = 0;
    }
    int64_t hours = total / 3600;
    int64_t minutes = (total % 3600) / 60;
    int64_t seconds = total % 60;

    std::stringstream ss;
    if (hours > 0) {
        ss << hours << "h" << minutes << "m" << seconds << "s";
    } else if (minutes > 0) {
        ss << minutes << "m" << seconds << "s";
    } else {
        ss << seconds << "s";
    }
    return ss.str();
}

ProgressReporter::ProgressReporter(const std::string& taskId, ProgressQueue* out)
    : out_(out) {
    progress_.taskId = taskId;
    progress_.phase = "starting";
}

template<typename Mutator>
void ProgressReporter::apply(Mutator&& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    mutate(progress_);
    progress_.updatedAt = Progress::Clock::now();
    if (out_ && !out_->tryPush(progress_)) {
        dropped_++;
    }
}

void ProgressReporter::setPhase(const std::string& phase) {
    apply([&](Progress& p) { p.phase = phase; });
}

void ProgressReporter::setTotals(int64_t bytesTotal, int64_t itemsTotal) {
    apply([&](Progress& p) {
        p.bytesTotal = bytesTotal;
        p.itemsTotal = itemsTotal;
    });
}

void ProgressReporter::update(int64_t bytesDone, int64_t itemsDone, const std::string& message) {
    apply([&](Progress& p) {
        p.bytesDone = bytesDone;
        p.itemsDone = itemsDone;
        if (!message.empty()) {
            p.lastMessage = message;
        }
    });
}

void ProgressReporter::addBytes(int64_t bytes) {
    apply([&](Progress& p) { p.bytesDone += bytes; });
}

void ProgressReporter::incrementItems(int64_t count) {
    apply([&](Progress& p) { p.itemsDone += count; });
}

void ProgressReporter::setCurrentItem(const std::string& item) {
    apply([&](Progress& p) { p.currentItem = item; });
}

void ProgressReporter::setMessage(const std::string& message) {
    apply([&](Progress& p) { p.lastMessage = message; });
}

void ProgressReporter::warning(const std::string& message) {
    apply([&](Progress& p) {
        p.warnings++;
        p.lastMessage = "warning: " + message;
    });
}

void ProgressReporter::error(const std::string& message) {
    apply([&](Progress& p) {
        p.errors++;
        p.lastMessage = "error: " + message;
    });
}

size_t ProgressReporter::droppedUpdates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

Progress ProgressReporter::getProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}
