#pragma once

#include "cache/resp_client.hpp"
#include "sync/sync_strategy.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

// Cache migration over the RESP protocol. Three paths are available:
// key-by-key DUMP/RESTORE (default), a BGSAVE snapshot loaded through an
// external loader, and live replication followed by promotion.
class RedisSync : public SyncStrategy {
public:
    enum class Mode {
        PIPELINE,
        SNAPSHOT,
        REPLICATION
    };

    RedisSync();
    RedisSync(const std::string& name, Mode defaultMode);

    std::string getName() const override { return name_; }
    SyncType getType() const override { return SyncType::CACHE; }

    int64_t estimateSize(const SyncContext& ctx, const Endpoint& source) override;
    void sync(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
              ProgressQueue& progressOut) override;
    VerifyResult verify(const SyncContext& ctx, const Endpoint& source, const Endpoint& target) override;

    bool supportsIncremental() const override { return defaultMode_ == Mode::REPLICATION; }
    bool supportsResume() const override { return defaultMode_ == Mode::REPLICATION; }

    int64_t getKeyCount(const SyncContext& ctx, const Endpoint& endpoint);
    // Triggers BGSAVE and returns the snapshot path once LASTSAVE advances.
    std::string createSnapshot(const SyncContext& ctx, RespClient& client);

    // Tool and tuning configuration
    void setLoaderProgram(const std::string& program) { loaderProgram_ = program; }
    void setCliProgram(const std::string& program) { cliProgram_ = program; }
    void setSampleSize(int sampleSize) { sampleSize_ = sampleSize; }
    void setProgressInterval(int keys) { progressInterval_ = keys > 0 ? keys : 1; }
    void setPollInterval(std::chrono::milliseconds interval) { pollInterval_ = interval; }
    void setSnapshotMaxPolls(int polls) { snapshotMaxPolls_ = polls; }
    // Polls of INFO replication before giving up; 0 waits until cancelled.
    void setReplicationMaxPolls(int polls) { replicationMaxPolls_ = polls; }

    // INFO parsing helpers, tolerant of missing fields.
    static std::optional<std::string> parseInfoField(const std::string& info, const std::string& field);
    static int64_t parseInfoInteger(const std::string& info, const std::string& field, int64_t defaultValue = 0);
    // Keys in "db<N>" of an INFO keyspace section; database < 0 sums all.
    static int64_t parseKeyspaceKeys(const std::string& info, int database = -1);

    static Mode parseMode(const std::string& mode, Mode defaultMode);

private:
    std::unique_ptr<RespClient> connect(const Endpoint& endpoint) const;
    int64_t keyCount(RespClient& client) const;
    int64_t usedMemory(RespClient& client) const;

    void syncPipeline(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                      ProgressReporter& reporter);
    void syncSnapshot(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                      ProgressReporter& reporter);
    void syncReplication(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                         ProgressReporter& reporter);
    // Returns the payload size moved, or -1 when the key was skipped.
    int64_t migrateKey(RespClient& source, RespClient& target, const std::string& key,
                       ProgressReporter& reporter);

    std::string name_;
    Mode defaultMode_;
    std::string loaderProgram_{"rdb"};
    std::string cliProgram_{"redis-cli"};
    int sampleSize_{100};
    int progressInterval_{100};
    std::chrono::milliseconds pollInterval_{1000};
    int snapshotMaxPolls_{300};
    int replicationMaxPolls_{3600};
};
