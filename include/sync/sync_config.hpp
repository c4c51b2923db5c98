#pragma once

#include "sync/sync_types.hpp"
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

// External executables, looked up on PATH unless given as paths.
struct ToolPaths {
    std::string rclone = "rclone";
    std::string mc = "mc";
    std::string pgDump = "pg_dump";
    std::string pgRestore = "pg_restore";
    std::string psql = "psql";
    std::string mysqldump = "mysqldump";
    std::string mysql = "mysql";
    std::string redisCli = "redis-cli";
    std::string rdb = "rdb";
};

struct SyncConfig {
    std::string logPath = "/tmp/datasync.log";
    std::string logLevel = "info";
    size_t progressQueueCapacity = 100;
    // Default home of incremental manifests.
    std::string stagingDirectory = "/tmp/datasync";
    ToolPaths tools;
    SyncOptions defaults;
};

// Missing keys keep their defaults. Throws SyncError (CONFIGURATION) when
// the file cannot be read or a value has the wrong type.
SyncConfig loadSyncConfig(const std::string& path);
SyncConfig syncConfigFromJson(const nlohmann::json& j);

SyncOptions syncOptionsFromJson(const nlohmann::json& j, const SyncOptions& defaults = SyncOptions());
nlohmann::json syncOptionsToJson(const SyncOptions& options);
