#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Cooperative cancellation shared between a controller and the workers it
// drives. Cancelling a token cancels every child created from it.
class CancellationToken : public std::enable_shared_from_this<CancellationToken> {
public:
    using Clock = std::chrono::steady_clock;

    static std::shared_ptr<CancellationToken> create();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    std::shared_ptr<CancellationToken> createChild();

    void cancel(const std::string& reason = "cancelled");
    bool isCancelled() const;
    std::string getReason() const;

    // A token past its deadline reports itself cancelled with reason
    // "deadline exceeded".
    void setDeadline(Clock::time_point deadline);
    void setTimeout(std::chrono::seconds timeout);

    // Sleeps for up to `duration`. Returns true if the token was cancelled
    // before or during the wait.
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    CancellationToken() = default;

    bool checkDeadline() const;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    mutable std::atomic<bool> cancelled_{false};
    mutable std::string reason_;
    bool hasDeadline_{false};
    Clock::time_point deadline_;
    std::vector<std::weak_ptr<CancellationToken>> children_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;
