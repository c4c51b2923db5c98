#include "sync/sync_config.hpp"
#include "sync/sync_error.hpp"
#include <fstream>

using json = nlohmann::json;

namespace {

template<typename T>
void readValue(const json& j, const char* key, T& out) {
    if (j.contains(key) && !j.at(key).is_null()) {
        out = j.at(key).get<T>();
    }
}

} // namespace

SyncOptions syncOptionsFromJson(const json& j, const SyncOptions& defaults) {
    SyncOptions options = defaults;
    if (!j.is_object()) {
        throw SyncError(SyncError::Category::CONFIGURATION, "sync options must be a JSON object");
    }
    try {
        readValue(j, "parallel", options.parallel);
        readValue(j, "batch_size", options.batchSize);
        readValue(j, "incremental", options.incremental);
        readValue(j, "dry_run", options.dryRun);
        readValue(j, "verify_after_sync", options.verifyAfterSync);
        readValue(j, "delete_extraneous", options.deleteExtraneous);
        readValue(j, "checksum_verify", options.checksumVerify);
        readValue(j, "timeout_seconds", options.timeoutSeconds);
        readValue(j, "bandwidth_bytes_per_sec", options.bandwidthBytesPerSec);
        readValue(j, "resume_from", options.resumeFrom);
        readValue(j, "mode", options.mode);
        readValue(j, "engine", options.engine);
    } catch (const json::exception& e) {
        throw SyncError(SyncError::Category::CONFIGURATION, std::string("invalid sync options: ") + e.what());
    }
    if (options.parallel < 1) {
        throw SyncError(SyncError::Category::CONFIGURATION, "parallel must be at least 1");
    }
    if (options.batchSize < 1) {
        throw SyncError(SyncError::Category::CONFIGURATION, "batch_size must be at least 1");
    }
    return options;
}

json syncOptionsToJson(const SyncOptions& options) {
    return {
        {"parallel", options.parallel},
        {"batch_size", options.batchSize},
        {"incremental", options.incremental},
        {"dry_run", options.dryRun},
        {"verify_after_sync", options.verifyAfterSync},
        {"delete_extraneous", options.deleteExtraneous},
        {"checksum_verify", options.checksumVerify},
        {"timeout_seconds", options.timeoutSeconds},
        {"bandwidth_bytes_per_sec", options.bandwidthBytesPerSec},
        {"resume_from", options.resumeFrom},
        {"mode", options.mode},
        {"engine", options.engine},
    };
}

SyncConfig syncConfigFromJson(const json& j) {
    SyncConfig config;
    if (!j.is_object()) {
        throw SyncError(SyncError::Category::CONFIGURATION, "configuration must be a JSON object");
    }
    try {
        if (j.contains("log")) {
            const json& log = j.at("log");
            readValue(log, "path", config.logPath);
            readValue(log, "level", config.logLevel);
        }
        readValue(j, "progress_queue_capacity", config.progressQueueCapacity);
        readValue(j, "staging_directory", config.stagingDirectory);
        if (j.contains("tools")) {
            const json& tools = j.at("tools");
            readValue(tools, "rclone", config.tools.rclone);
            readValue(tools, "mc", config.tools.mc);
            readValue(tools, "pg_dump", config.tools.pgDump);
            readValue(tools, "pg_restore", config.tools.pgRestore);
            readValue(tools, "psql", config.tools.psql);
            readValue(tools, "mysqldump", config.tools.mysqldump);
            readValue(tools, "mysql", config.tools.mysql);
            readValue(tools, "redis_cli", config.tools.redisCli);
            readValue(tools, "rdb", config.tools.rdb);
        }
    } catch (const json::exception& e) {
        throw SyncError(SyncError::Category::CONFIGURATION, std::string("invalid configuration: ") + e.what());
    }
    if (j.contains("defaults")) {
        config.defaults = syncOptionsFromJson(j.at("defaults"));
    }
    if (config.progressQueueCapacity == 0) {
        throw SyncError(SyncError::Category::CONFIGURATION, "progress_queue_capacity must be positive");
    }
    return config;
}

SyncConfig loadSyncConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SyncError(SyncError::Category::CONFIGURATION, "cannot open configuration file " + path);
    }
    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw SyncError(SyncError::Category::CONFIGURATION, "cannot parse " + path + ": " + e.what());
    }
    return syncConfigFromJson(j);
}
