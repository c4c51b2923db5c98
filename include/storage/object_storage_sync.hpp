#pragma once

#include "storage/object_transport.hpp"
#include "sync/sync_strategy.hpp"
#include <map>
#include <mutex>

// Object storage strategy. The transfer itself is delegated to one of the
// installed transports, chosen per task from SyncOptions.engine; with no
// engine named, local-to-local syncs use "filesystem" and everything else
// the strategy's default engine.
//
// Modes: "" / "mirror" runs the transport's one-way mirror; "parallel"
// lists the source and copies objects through a worker pool. An
// incremental parallel run consults the manifest named by the target's
// "manifest" option (or one kept in the manifest directory) and skips
// objects recorded as unchanged.
class ObjectStorageSync : public SyncStrategy {
public:
    ObjectStorageSync(const std::string& name, const std::string& defaultEngine);

    std::string getName() const override { return name_; }
    SyncType getType() const override { return SyncType::OBJECT_STORAGE; }

    int64_t estimateSize(const SyncContext& ctx, const Endpoint& source) override;
    void sync(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
              ProgressQueue& progressOut) override;
    VerifyResult verify(const SyncContext& ctx, const Endpoint& source, const Endpoint& target) override;

    bool supportsIncremental() const override { return true; }
    bool supportsResume() const override { return true; }

    void addTransport(const std::string& engine, ObjectTransportPtr transport);
    std::vector<std::string> listEngines() const;
    void setManifestDirectory(const std::string& directory) { manifestDirectory_ = directory; }
    std::string manifestPathFor(const SyncOptions& options, const Endpoint& target) const;

    ObjectTransportPtr selectTransport(const SyncOptions& options, const Endpoint& source,
                                       const Endpoint& target) const;

private:
    void syncParallel(const SyncContext& ctx, ObjectTransport& transport, const Endpoint& source,
                      const Endpoint& target, ProgressReporter& reporter);

    std::string name_;
    std::string defaultEngine_;
    std::string manifestDirectory_;
    mutable std::mutex mutex_;
    std::map<std::string, ObjectTransportPtr> transports_;
};
