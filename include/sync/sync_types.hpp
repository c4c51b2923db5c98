#pragma once

#include "common/cancellation_token.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>

enum class SyncType {
    OBJECT_STORAGE,
    DATABASE,
    CACHE
};

std::string syncTypeToString(SyncType type);
bool parseSyncType(const std::string& name, SyncType& type);

struct Credentials {
    std::string username;
    std::string password;
    std::string accessKey;
    std::string secretKey;
    std::string token;
    std::string keyFile;
};

// Connection and location descriptor for one side of a sync. Built by the
// caller and shared read-only with strategies.
struct Endpoint {
    std::string type;
    std::string host;
    int port{0};
    std::string database;
    std::string bucket;
    std::string path;
    std::string region;
    Credentials credentials;
    bool ssl{false};
    std::string sslMode;
    std::map<std::string, std::string> options;

    std::string getOption(const std::string& key, const std::string& defaultValue = "") const;
    bool hasOption(const std::string& key) const;

    // Driver-style URL for the endpoint type (postgres://, mysql://,
    // redis:// or rediss://, s3://). Credentials are percent-encoded.
    std::string connectionString() const;

    // host:port/location without credentials, for log lines.
    std::string describe() const;
};

using EndpointPtr = std::shared_ptr<const Endpoint>;

struct SyncOptions {
    int parallel{4};
    int batchSize{1000};
    bool incremental{false};
    bool dryRun{false};
    bool verifyAfterSync{true};
    bool deleteExtraneous{false};
    bool checksumVerify{true};
    int timeoutSeconds{3600};
    int64_t bandwidthBytesPerSec{0};
    std::string resumeFrom;

    // Strategy-specific path: "parallel" (object storage worker pool),
    // "tables" (relational per-table pipes), "pipeline"/"snapshot"/
    // "replication" (cache). Empty selects the strategy default.
    std::string mode;
    // Object storage transfer engine: "rclone", "mc" or "filesystem".
    std::string engine;
};

// Per-invocation state handed to every strategy call.
struct SyncContext {
    CancellationTokenPtr token;
    SyncOptions options;
    std::string taskId;

    SyncContext() : token(CancellationToken::create()) {}
    SyncContext(CancellationTokenPtr t, SyncOptions o, std::string id = "")
        : token(t ? std::move(t) : CancellationToken::create()), options(std::move(o)), taskId(std::move(id)) {}

    bool isCancelled() const { return token->isCancelled(); }
    // Throws SyncError(CANCELLED) once the token has fired.
    void throwIfCancelled() const;
};
