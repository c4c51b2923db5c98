#pragma once

#include "sync/sync_strategy.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class StrategyRegistry {
public:
    StrategyRegistry() = default;

    // Replaces any strategy already registered under the same name.
    bool registerStrategy(SyncStrategyPtr strategy);
    bool unregisterStrategy(const std::string& name);

    // nullptr when nothing is registered under `name`.
    SyncStrategyPtr get(const std::string& name) const;

    // Resolves endpoint types to strategy names: postgresql -> postgres,
    // mariadb -> mysql, valkey -> redis, s3/gcs/azure-blob/local -> minio.
    SyncStrategyPtr getForEndpoint(const std::string& endpointType) const;

    std::vector<std::string> listNames() const;
    std::vector<SyncStrategyPtr> listByType(SyncType type) const;
    std::optional<StrategyCapabilities> getCapabilities(const std::string& name) const;
    std::vector<StrategyCapabilities> getAllCapabilities() const;

    static std::string resolveAlias(const std::string& endpointType);

private:
    std::map<std::string, SyncStrategyPtr> strategies_;
    mutable std::mutex mutex_;
};

using StrategyRegistryPtr = std::shared_ptr<StrategyRegistry>;
