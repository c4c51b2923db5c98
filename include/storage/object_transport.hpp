#pragma once

#include "sync/progress.hpp"
#include "sync/sync_error.hpp"
#include "sync/sync_types.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct ObjectInfo {
    std::string key;
    int64_t size{0};
    std::string etag;
    std::string modified;
    std::string checksum;
};

struct StorageUsage {
    int64_t bytes{0};
    int64_t count{0};
};

// One backend able to move objects between two containers. Operations
// throw SyncError; per-object failures are left to the caller to count.
class ObjectTransport {
public:
    virtual ~ObjectTransport() = default;

    virtual std::string getName() const = 0;

    // Registers credentials or aliases for the endpoint. Idempotent.
    virtual void prepare(const SyncContext& ctx, const Endpoint& endpoint) = 0;
    virtual StorageUsage usage(const SyncContext& ctx, const Endpoint& endpoint) = 0;
    virtual std::vector<ObjectInfo> listObjects(const SyncContext& ctx, const Endpoint& endpoint) = 0;
    // Creates the bucket or directory when missing.
    virtual void ensureContainer(const SyncContext& ctx, const Endpoint& endpoint) = 0;
    virtual void copyObject(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                            const std::string& key) = 0;
    // One-way mirror of the whole container honouring dryRun,
    // deleteExtraneous, checksumVerify, parallel and bandwidth options.
    virtual void mirror(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                        ProgressReporter& reporter) = 0;

    // One description per object that is missing from or differs in the
    // target. The default compares listings by key, size and etag.
    virtual std::vector<std::string> checkOneWay(const SyncContext& ctx, const Endpoint& source,
                                                 const Endpoint& target);

    static std::vector<std::string> compareListings(const std::vector<ObjectInfo>& source,
                                                    const std::vector<ObjectInfo>& target);
};

using ObjectTransportPtr = std::shared_ptr<ObjectTransport>;

// "a/b" + "c" -> "a/b/c", tolerating empty parts and stray slashes.
std::string joinObjectPath(const std::string& base, const std::string& key);
