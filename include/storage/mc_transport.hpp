#pragma once

#include "common/subprocess.hpp"
#include "storage/object_transport.hpp"
#include <initializer_list>

// Transfers through the MinIO client. Aliases are handed to every mc call
// as MC_HOST_<alias> environment entries, so credentials never appear on
// the command line or in the user's mc configuration.
class McTransport : public ObjectTransport {
public:
    explicit McTransport(const std::string& program = "mc");

    std::string getName() const override { return "mc"; }

    void prepare(const SyncContext& ctx, const Endpoint& endpoint) override;
    StorageUsage usage(const SyncContext& ctx, const Endpoint& endpoint) override;
    std::vector<ObjectInfo> listObjects(const SyncContext& ctx, const Endpoint& endpoint) override;
    void ensureContainer(const SyncContext& ctx, const Endpoint& endpoint) override;
    void copyObject(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                    const std::string& key) override;
    void mirror(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                ProgressReporter& reporter) override;

    static std::string getAliasName(const Endpoint& endpoint);
    // Service URL of the endpoint's provider, without credentials.
    static std::string getAliasUrl(const Endpoint& endpoint);
    // MC_HOST_<alias> value: the alias URL with credentials embedded.
    static std::string buildHostValue(const Endpoint& endpoint);
    // "alias/bucket/prefix"
    static std::string buildPath(const Endpoint& endpoint);
    static std::vector<std::string> buildMirrorArgs(const std::string& sourcePath, const std::string& targetPath,
                                                    const SyncOptions& options);

private:
    CommandSpec makeCommand(const std::vector<std::string>& args, std::initializer_list<const Endpoint*> endpoints) const;
    ProcessResult runTool(const SyncContext& ctx, const CommandSpec& command) const;
    void checkResult(const ProcessResult& result, const std::string& what, SyncError::Category category) const;

    std::string program_;
};
