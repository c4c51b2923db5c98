#include "common/cancellation_token.hpp"

std::shared_ptr<CancellationToken> CancellationToken::create() {
    return std::shared_ptr<CancellationToken>(new CancellationToken());
}

std::shared_ptr<CancellationToken> CancellationToken::createChild() {
    auto child = create();

    std::unique_lock<std::mutex> lock(mutex_);
    if (hasDeadline_) {
        child->hasDeadline_ = true;
        child->deadline_ = deadline_;
    }
    if (cancelled_.load()) {
        std::string reason = reason_;
        lock.unlock();
        child->cancel(reason);
        return child;
    }

    // Drop entries for children that no longer exist.
    for (auto it = children_.begin(); it != children_.end();) {
        if (it->expired()) {
            it = children_.erase(it);
        } else {
            ++it;
        }
    }
    children_.push_back(child);
    return child;
}

void CancellationToken::cancel(const std::string& reason) {
    std::vector<std::shared_ptr<CancellationToken>> children;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load()) {
            return;
        }
        reason_ = reason;
        cancelled_.store(true);
        for (const auto& weak : children_) {
            if (auto child = weak.lock()) {
                children.push_back(child);
            }
        }
        children_.clear();
    }
    cv_.notify_all();

    for (const auto& child : children) {
        child->cancel(reason);
    }
}

bool CancellationToken::checkDeadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load()) {
        return true;
    }
    if (hasDeadline_ && Clock::now() >= deadline_) {
        reason_ = "deadline exceeded";
        cancelled_.store(true);
        return true;
    }
    return false;
}

bool CancellationToken::isCancelled() const {
    if (cancelled_.load()) {
        return true;
    }
    return checkDeadline();
}

std::string CancellationToken::getReason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

void CancellationToken::setDeadline(Clock::time_point deadline) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hasDeadline_ = true;
        deadline_ = deadline;
    }
    cv_.notify_all();
}

void CancellationToken::setTimeout(std::chrono::seconds timeout) {
    setDeadline(Clock::now() + timeout);
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    auto until = Clock::now() + duration;
    if (hasDeadline_ && deadline_ < until) {
        until = deadline_;
    }
    cv_.wait_until(lock, until, [this] { return cancelled_.load(); });
    if (cancelled_.load()) {
        return true;
    }
    lock.unlock();
    return checkDeadline();
}
