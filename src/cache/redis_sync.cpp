#include "cache/redis_sync.hpp"
#include "common/logger.hpp"
#include "common/process_pipeline.hpp"
#include "common/utils.hpp"
#include <set>

namespace {

void validateEndpoint(const Endpoint& endpoint, const std::string& role) {
    if (endpoint.host.empty()) {
        throw SyncError(SyncError::Category::CONFIGURATION, role + " cache endpoint requires a host");
    }
}

std::string configValue(RespClient& client, const std::string& parameter) {
    RespValue reply = client.execute({"CONFIG", "GET", parameter});
    if (!reply.isArray() || reply.elements.size() < 2) {
        throw SyncError(SyncError::Category::PROTOCOL, "unexpected CONFIG GET " + parameter + " reply");
    }
    return reply.elements[1].asString();
}

} // namespace

RedisSync::RedisSync()
    : RedisSync("redis", Mode::PIPELINE) {
}

RedisSync::RedisSync(const std::string& name, Mode defaultMode)
    : name_(name)
    , defaultMode_(defaultMode) {
}

RedisSync::Mode RedisSync::parseMode(const std::string& mode, Mode defaultMode) {
    std::string lower = utils::toLower(mode);
    if (lower.empty()) {
        return defaultMode;
    }
    if (lower == "pipeline" || lower == "keys") {
        return Mode::PIPELINE;
    }
    if (lower == "snapshot" || lower == "rdb") {
        return Mode::SNAPSHOT;
    }
    if (lower == "replication" || lower == "replica") {
        return Mode::REPLICATION;
    }
    throw SyncError(SyncError::Category::CONFIGURATION, "unknown cache sync mode: " + mode);
}

std::optional<std::string> RedisSync::parseInfoField(const std::string& info, const std::string& field) {
    for (const auto& rawLine : utils::split(info, '\n')) {
        std::string line = utils::trim(rawLine);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (line.compare(0, colon, field) == 0 && colon == field.size()) {
            return line.substr(colon + 1);
        }
    }
    return std::nullopt;
}

int64_t RedisSync::parseInfoInteger(const std::string& info, const std::string& field, int64_t defaultValue) {
    auto value = parseInfoField(info, field);
    if (!value) {
        return defaultValue;
    }
    try {
        return std::stoll(*value);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

int64_t RedisSync::parseKeyspaceKeys(const std::string& info, int database) {
    int64_t total = 0;
    for (const auto& rawLine : utils::split(info, '\n')) {
        std::string line = utils::trim(rawLine);
        if (!utils::startsWith(line, "db")) {
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (database >= 0 && line.substr(0, colon) != "db" + std::to_string(database)) {
            continue;
        }
        for (const auto& pair : utils::split(line.substr(colon + 1), ',')) {
            if (utils::startsWith(pair, "keys=")) {
                try {
                    total += std::stoll(pair.substr(5));
                } catch (const std::exception&) {
                    Logger::debug("Ignoring malformed keyspace entry: " + line);
                }
            }
        }
    }
    return total;
}

std::unique_ptr<RespClient> RedisSync::connect(const Endpoint& endpoint) const {
    auto client = std::make_unique<RespClient>(RespClient::optionsFromEndpoint(endpoint));
    client->connect();
    return client;
}

int64_t RedisSync::keyCount(RespClient& client) const {
    std::string info = client.execute({"INFO", "keyspace"}).asString();
    return parseKeyspaceKeys(info, client.getOptions().database);
}

int64_t RedisSync::usedMemory(RespClient& client) const {
    std::string info = client.execute({"INFO", "memory"}).asString();
    auto value = parseInfoField(info, "used_memory");
    if (!value) {
        throw SyncError(SyncError::Category::PROTOCOL, "used_memory missing from INFO memory reply");
    }
    return parseInfoInteger(info, "used_memory");
}

int64_t RedisSync::estimateSize(const SyncContext& ctx, const Endpoint& source) {
    validateEndpoint(source, "source");
    ctx.throwIfCancelled();
    auto client = connect(source);
    return usedMemory(*client);
}

int64_t RedisSync::getKeyCount(const SyncContext& ctx, const Endpoint& endpoint) {
    validateEndpoint(endpoint, "cache");
    ctx.throwIfCancelled();
    auto client = connect(endpoint);
    return keyCount(*client);
}

void RedisSync::sync(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                     ProgressQueue& progressOut) {
    validateEndpoint(source, "source");
    validateEndpoint(target, "target");
    Mode mode = parseMode(ctx.options.mode, defaultMode_);

    ProgressReporter reporter(ctx.taskId, &progressOut);
    reporter.setPhase("connecting");
    Logger::info("Cache sync " + source.describe() + " -> " + target.describe());

    switch (mode) {
        case Mode::SNAPSHOT:
            syncSnapshot(ctx, source, target, reporter);
            break;
        case Mode::REPLICATION:
            syncReplication(ctx, source, target, reporter);
            break;
        case Mode::PIPELINE:
        default:
            syncPipeline(ctx, source, target, reporter);
            break;
    }

    reporter.setPhase("completed");
}

void RedisSync::syncPipeline(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                             ProgressReporter& reporter) {
    auto sourceClient = connect(source);
    auto targetClient = connect(target);

    int64_t totalKeys = keyCount(*sourceClient);
    int64_t memory = 0;
    try {
        memory = usedMemory(*sourceClient);
    } catch (const SyncError& e) {
        Logger::warning(std::string("Could not read source memory usage: ") + e.what());
    }
    reporter.setTotals(memory, totalKeys);

    if (ctx.options.dryRun) {
        reporter.update(0, 0, "dry run: " + std::to_string(totalKeys) + " keys would be migrated");
        return;
    }

    reporter.setPhase("flushing target");
    targetClient->execute({"FLUSHDB"});

    reporter.setPhase("migrating keys");
    std::string batch = std::to_string(ctx.options.batchSize > 0 ? ctx.options.batchSize : 1000);
    std::string cursor = "0";
    int64_t processed = 0;
    int64_t migrated = 0;
    int64_t bytesMoved = 0;

    do {
        ctx.throwIfCancelled();

        RespValue reply = sourceClient->execute({"SCAN", cursor, "COUNT", batch});
        if (!reply.isArray() || reply.elements.size() != 2 || !reply.elements[1].isArray()) {
            throw SyncError(SyncError::Category::PROTOCOL, "unexpected SCAN reply");
        }
        cursor = reply.elements[0].asString();

        for (const auto& keyValue : reply.elements[1].elements) {
            const std::string key = keyValue.asString();
            int64_t size = migrateKey(*sourceClient, *targetClient, key, reporter);
            if (size >= 0) {
                migrated++;
                bytesMoved += size;
            }
            processed++;
            if (processed % progressInterval_ == 0) {
                reporter.setCurrentItem(key);
                reporter.update(bytesMoved, processed, "migrated " + std::to_string(migrated) + " keys");
            }
        }
    } while (cursor != "0");

    reporter.update(bytesMoved, processed,
                    "migrated " + std::to_string(migrated) + " of " + std::to_string(processed) + " keys");
    Logger::info("Cache pipeline migration finished: " + std::to_string(migrated) + " keys");
}

int64_t RedisSync::migrateKey(RespClient& source, RespClient& target, const std::string& key,
                              ProgressReporter& reporter) {
    RespValue dump = source.command({"DUMP", key});
    if (dump.isError()) {
        Logger::warning("DUMP failed for key " + key + ": " + dump.str);
        reporter.warning("DUMP " + key + ": " + dump.str);
        return -1;
    }
    if (dump.isNil()) {
        // Expired or deleted between SCAN and DUMP.
        return -1;
    }

    RespValue pttl = source.command({"PTTL", key});
    if (pttl.isError()) {
        Logger::warning("PTTL failed for key " + key + ": " + pttl.str);
        reporter.warning("PTTL " + key + ": " + pttl.str);
        return -1;
    }
    if (pttl.integer == -2) {
        return -1;
    }
    int64_t ttl = pttl.integer < 0 ? 0 : pttl.integer;

    RespValue restored = target.command({"RESTORE", key, std::to_string(ttl), dump.str, "REPLACE"});
    if (restored.isError()) {
        Logger::warning("RESTORE failed for key " + key + ": " + restored.str);
        reporter.warning("RESTORE " + key + ": " + restored.str);
        return -1;
    }
    return static_cast<int64_t>(dump.str.size());
}

std::string RedisSync::createSnapshot(const SyncContext& ctx, RespClient& client) {
    int64_t lastSave = client.execute({"LASTSAVE"}).integer;

    RespValue reply = client.command({"BGSAVE"});
    if (reply.isError()) {
        if (reply.str.find("in progress") == std::string::npos) {
            throw SyncError(SyncError::Category::TRANSFER, "BGSAVE failed: " + reply.str);
        }
        Logger::info("Background save already in progress, waiting for it");
    } else {
        std::string text = reply.asString();
        if (text.find("started") == std::string::npos && text.find("progress") == std::string::npos) {
            throw SyncError(SyncError::Category::PROTOCOL, "unexpected BGSAVE reply: " + text);
        }
    }

    bool saved = false;
    for (int poll = 0; poll < snapshotMaxPolls_; ++poll) {
        if (ctx.token->waitFor(pollInterval_)) {
            ctx.throwIfCancelled();
        }
        if (client.execute({"LASTSAVE"}).integer > lastSave) {
            saved = true;
            break;
        }
    }
    if (!saved) {
        throw SyncError(SyncError::Category::TRANSFER, "timed out waiting for BGSAVE to complete");
    }

    std::string dir = configValue(client, "dir");
    std::string file = configValue(client, "dbfilename");
    return dir.empty() ? file : dir + "/" + file;
}

void RedisSync::syncSnapshot(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                             ProgressReporter& reporter) {
    auto sourceClient = connect(source);
    auto targetClient = connect(target);

    int64_t totalKeys = keyCount(*sourceClient);
    reporter.setTotals(0, totalKeys);

    reporter.setPhase("snapshot");
    std::string snapshotPath = createSnapshot(ctx, *sourceClient);
    Logger::info("Source snapshot written to " + snapshotPath);
    reporter.setCurrentItem(snapshotPath);

    if (ctx.options.dryRun) {
        reporter.setMessage("dry run: snapshot taken, target left untouched");
        return;
    }

    reporter.setPhase("flushing target");
    if (targetClient->getOptions().database != 0) {
        targetClient->execute({"FLUSHDB"});
    } else {
        targetClient->execute({"FLUSHALL"});
    }

    reporter.setPhase("loading snapshot");
    CommandSpec loader;
    loader.program = loaderProgram_;
    loader.args = {"--command", "protocol", snapshotPath};

    const auto& options = targetClient->getOptions();
    CommandSpec cli;
    cli.program = cliProgram_;
    cli.args = {"-h", options.host, "-p", std::to_string(options.port),
                "-n", std::to_string(options.database), "--pipe"};
    if (!options.username.empty()) {
        cli.args.push_back("--user");
        cli.args.push_back(options.username);
    }
    if (options.tls) {
        cli.args.push_back("--tls");
    }
    if (!options.password.empty()) {
        cli.env["REDISCLI_AUTH"] = options.password;
    }

    ProcessPipeline pipeline(loader, cli);
    auto result = pipeline.run(ctx.token.get());
    if (!result.succeeded()) {
        ctx.throwIfCancelled();
        throw SyncError(SyncError::Category::TRANSFER,
                        "snapshot load failed: " + result.describeFailure(loaderProgram_, cliProgram_));
    }

    int64_t loaded = keyCount(*targetClient);
    reporter.update(0, loaded, "loaded " + std::to_string(loaded) + " keys from snapshot");
}

void RedisSync::syncReplication(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                                ProgressReporter& reporter) {
    auto targetClient = connect(target);

    std::string masterHost = source.getOption("replication_host", source.host);
    std::string masterPort = source.getOption("replication_port",
                                              std::to_string(source.port > 0 ? source.port : 6379));

    if (ctx.options.dryRun) {
        reporter.setMessage("dry run: target would replicate from " + masterHost + ":" + masterPort);
        return;
    }

    if (!source.credentials.password.empty()) {
        if (!source.credentials.username.empty()) {
            targetClient->execute({"CONFIG", "SET", "masteruser", source.credentials.username});
        }
        targetClient->execute({"CONFIG", "SET", "masterauth", source.credentials.password});
    }

    reporter.setPhase("replicating");
    targetClient->execute({"REPLICAOF", masterHost, masterPort});
    Logger::info("Target " + target.describe() + " now replicating from " + masterHost + ":" + masterPort);

    auto promote = [&](const std::string& why) {
        Logger::warning("Replication " + why + ", promoting target back to standalone");
        RespValue promoted = targetClient->command({"REPLICAOF", "NO", "ONE"});
        if (promoted.isError()) {
            Logger::error("Failed to promote target after replication " + why + ": " + promoted.str);
        }
    };

    bool caughtUp = false;
    for (int poll = 0; !caughtUp; ++poll) {
        if (replicationMaxPolls_ > 0 && poll >= replicationMaxPolls_) {
            promote("timed out");
            reporter.error("replication did not catch up");
            throw SyncError(SyncError::Category::TRANSFER,
                            "timed out waiting for replication from " + masterHost + ":" + masterPort +
                                " to catch up");
        }
        if (ctx.token->waitFor(pollInterval_)) {
            promote("cancelled");
            ctx.throwIfCancelled();
        }

        std::string info = targetClient->execute({"INFO", "replication"}).asString();
        std::string link = parseInfoField(info, "master_link_status").value_or("");
        int64_t lag = parseInfoInteger(info, "master_last_io_seconds_ago", -1);
        int64_t syncTotal = parseInfoInteger(info, "master_sync_total_bytes", 0);
        int64_t syncRead = parseInfoInteger(info, "master_sync_read_bytes", 0);

        if (syncTotal > 0) {
            reporter.setTotals(syncTotal, 0);
            reporter.update(syncRead, 0, "initial sync in progress");
        } else {
            reporter.setMessage("link " + (link.empty() ? std::string("unknown") : link) +
                                ", last io " + std::to_string(lag) + "s ago");
        }

        caughtUp = link == "up" && lag == 0;
    }

    reporter.setPhase("promoting");
    targetClient->execute({"REPLICAOF", "NO", "ONE"});
    Logger::info("Target " + target.describe() + " promoted to standalone");
}

VerifyResult RedisSync::verify(const SyncContext& ctx, const Endpoint& source, const Endpoint& target) {
    validateEndpoint(source, "source");
    validateEndpoint(target, "target");

    auto sourceClient = connect(source);
    auto targetClient = connect(target);

    VerifyResult result;
    int64_t sourceKeys = keyCount(*sourceClient);
    int64_t targetKeys = keyCount(*targetClient);
    result.setCounts(sourceKeys, targetKeys);
    if (sourceKeys != targetKeys) {
        result.addMismatch("key count mismatch: source=" + std::to_string(sourceKeys) +
                           " target=" + std::to_string(targetKeys));
    }

    try {
        result.setDetail("source_memory", usedMemory(*sourceClient));
        result.setDetail("target_memory", usedMemory(*targetClient));
    } catch (const SyncError& e) {
        Logger::warning(std::string("Memory usage unavailable during verification: ") + e.what());
    }

    std::set<std::string> sampled;
    for (int i = 0; i < sampleSize_ && sourceKeys > 0; ++i) {
        ctx.throwIfCancelled();

        RespValue key = sourceClient->execute({"RANDOMKEY"});
        if (key.isNil()) {
            break;
        }
        const std::string name = key.asString();
        if (!sampled.insert(name).second) {
            continue;
        }

        std::string sourceType = sourceClient->execute({"TYPE", name}).asString();
        std::string targetType = targetClient->execute({"TYPE", name}).asString();
        if (targetType == "none" && sourceType != "none") {
            result.addMismatch("key '" + name + "' missing in target");
        } else if (sourceType != targetType) {
            result.addMismatch("key '" + name + "' type mismatch: source=" + sourceType +
                               " target=" + targetType);
        }
    }
    result.setDetail("sampled_keys", static_cast<int64_t>(sampled.size()));

    Logger::info("Cache verification: " + result.toString());
    return result;
}
