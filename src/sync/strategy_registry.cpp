#include "sync/strategy_registry.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

bool StrategyRegistry::registerStrategy(SyncStrategyPtr strategy) {
    if (!strategy) {
        Logger::error("Refusing to register a null sync strategy");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto name = strategy->getName();
    if (strategies_.count(name)) {
        Logger::warning("Replacing sync strategy: " + name);
    }
    strategies_[name] = std::move(strategy);
    Logger::debug("Registered sync strategy: " + name);
    return true;
}

bool StrategyRegistry::unregisterStrategy(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return strategies_.erase(name) > 0;
}

SyncStrategyPtr StrategyRegistry::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strategies_.find(name);
    return it != strategies_.end() ? it->second : nullptr;
}

std::string StrategyRegistry::resolveAlias(const std::string& endpointType) {
    std::string type = utils::toLower(endpointType);
    if (type == "postgres" || type == "postgresql") {
        return "postgres";
    }
    if (type == "mysql" || type == "mariadb") {
        return "mysql";
    }
    if (type == "redis" || type == "valkey") {
        return "redis";
    }
    if (type == "minio" || type == "s3" || type == "gcs" || type == "azure-blob" || type == "local") {
        return "minio";
    }
    return "";
}

SyncStrategyPtr StrategyRegistry::getForEndpoint(const std::string& endpointType) const {
    std::string name = resolveAlias(endpointType);
    if (name.empty()) {
        return nullptr;
    }
    return get(name);
}

std::vector<std::string> StrategyRegistry::listNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(strategies_.size());
    for (const auto& pair : strategies_) {
        names.push_back(pair.first);
    }
    return names;
}

std::vector<SyncStrategyPtr> StrategyRegistry::listByType(SyncType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SyncStrategyPtr> result;
    for (const auto& pair : strategies_) {
        if (pair.second->getType() == type) {
            result.push_back(pair.second);
        }
    }
    return result;
}

std::optional<StrategyCapabilities> StrategyRegistry::getCapabilities(const std::string& name) const {
    auto strategy = get(name);
    if (!strategy) {
        return std::nullopt;
    }
    return strategy->getCapabilities();
}

std::vector<StrategyCapabilities> StrategyRegistry::getAllCapabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StrategyCapabilities> result;
    for (const auto& pair : strategies_) {
        result.push_back(pair.second->getCapabilities());
    }
    return result;
}
