#pragma once

#include "sync/strategy_registry.hpp"
#include "sync/sync_config.hpp"

// Registry holding every built-in strategy, wired to the configured tool
// paths: postgres, mysql, redis, redis-replication, minio and rclone.
StrategyRegistryPtr createDefaultRegistry(const SyncConfig& config = SyncConfig());
