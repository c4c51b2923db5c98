#pragma once

#include "sync/progress.hpp"
#include "sync/sync_error.hpp"
#include "sync/sync_types.hpp"
#include "sync/verify_result.hpp"
#include <cstdint>
#include <memory>
#include <string>

struct StrategyCapabilities {
    std::string name;
    SyncType type{SyncType::OBJECT_STORAGE};
    bool supportsIncremental{false};
    bool supportsResume{false};
};

// One way of moving data between two endpoints. Implementations must be
// safe to call concurrently for unrelated endpoint pairs and report
// failures by throwing SyncError.
class SyncStrategy {
public:
    virtual ~SyncStrategy() = default;

    virtual std::string getName() const = 0;
    virtual SyncType getType() const = 0;

    // Best effort; callers continue without totals when this throws.
    virtual int64_t estimateSize(const SyncContext& ctx, const Endpoint& source) = 0;

    // Pushes progress onto `progressOut` without blocking and never closes
    // it. Returns once the transfer finished and every process or
    // connection it opened has been released.
    virtual void sync(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                      ProgressQueue& progressOut) = 0;

    virtual VerifyResult verify(const SyncContext& ctx, const Endpoint& source, const Endpoint& target) = 0;

    virtual bool supportsIncremental() const = 0;
    virtual bool supportsResume() const = 0;

    StrategyCapabilities getCapabilities() const {
        return StrategyCapabilities{getName(), getType(), supportsIncremental(), supportsResume()};
    }
};

using SyncStrategyPtr = std::shared_ptr<SyncStrategy>;
