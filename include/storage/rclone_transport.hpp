#pragma once

#include "common/subprocess.hpp"
#include "storage/object_transport.hpp"
#include <mutex>
#include <set>

// Transfers through the rclone command-line tool. Each endpoint gets a
// named remote ("s3_<region>", "gcs", "azure_<account>",
// "minio_<host>_<port>") created once per transport instance; local
// endpoints use plain filesystem paths.
class RcloneTransport : public ObjectTransport {
public:
    explicit RcloneTransport(const std::string& program = "rclone");

    std::string getName() const override { return "rclone"; }

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

    static std::string getRemoteName(const Endpoint& endpoint);
    static std::string sanitizeRemoteName(const std::string& name);
    // "remote:bucket/prefix", or the plain directory for local endpoints.
    static std::string buildPath(const Endpoint& endpoint);
    // Arguments of "rclone config create" for the endpoint; empty for local.
    static std::vector<std::string> buildConfigArgs(const Endpoint& endpoint);
    // "rclone sync" when extraneous target objects are deleted, else "rclone copy".
    static std::vector<std::string> buildSyncArgs(const std::string& sourcePath, const std::string& targetPath,
                                                  const SyncOptions& options);

private:
    ProcessResult runTool(const SyncContext& ctx, const std::vector<std::string>& args) const;
    void checkResult(const ProcessResult& result, const std::string& what,
                     SyncError::Category category = SyncError::Category::TRANSFER) const;

    std::string program_;
    std::mutex mutex_;
    std::set<std::string> configuredRemotes_;
};
