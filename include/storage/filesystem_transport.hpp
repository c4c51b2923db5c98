#pragma once

#include "storage/object_transport.hpp"
#include <filesystem>

// Native transport for "local" endpoints: the container is the directory
// bucket/path, object keys are paths relative to it. Content checks use
// SHA-256.
class FilesystemTransport : public ObjectTransport {
public:
    std::string getName() const override { return "filesystem"; }

    void prepare(const SyncContext& ctx, const Endpoint& endpoint) override;
    StorageUsage usage(const SyncContext& ctx, const Endpoint& endpoint) override;
    std::vector<ObjectInfo> listObjects(const SyncContext& ctx, const Endpoint& endpoint) override;
    void ensureContainer(const SyncContext& ctx, const Endpoint& endpoint) override;
    void copyObject(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                    const std::string& key) override;
    void mirror(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                ProgressReporter& reporter) override;
    std::vector<std::string> checkOneWay(const SyncContext& ctx, const Endpoint& source,
                                         const Endpoint& target) override;

    static std::filesystem::path rootOf(const Endpoint& endpoint);
};
