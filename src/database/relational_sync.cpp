#include "database/relational_sync.hpp"
#include "common/logger.hpp"
#include "common/process_pipeline.hpp"
#include <algorithm>
#include <mutex>
#include <set>

namespace {

void validateEndpoint(const Endpoint& endpoint, const std::string& role) {
    if (endpoint.host.empty()) {
        throw SyncError(SyncError::Category::CONFIGURATION, role + " database endpoint requires a host");
    }
    if (endpoint.database.empty()) {
        throw SyncError(SyncError::Category::CONFIGURATION, role + " database endpoint requires a database name");
    }
}

} // namespace

int64_t RelationalSync::estimateSize(const SyncContext& ctx, const Endpoint& source) {
    validateEndpoint(source, "source");
    auto conn = openConnection(ctx, source, source.database);
    return conn->queryInt(sizeQuery(*conn, source.database));
}

std::vector<std::string> RelationalSync::listTables(const SyncContext& ctx, const Endpoint& endpoint) {
    auto conn = openConnection(ctx, endpoint, endpoint.database);
    return conn->queryColumn(listTablesQuery(*conn, endpoint.database));
}

void RelationalSync::ensureDatabase(const SyncContext& ctx, const Endpoint& target) {
    auto admin = openConnection(ctx, target, adminDatabase());
    if (admin->queryInt(databaseExistsQuery(*admin, target.database)) > 0) {
        Logger::debug("Target database " + target.database + " already exists");
        return;
    }
    Logger::info("Creating target database " + target.database + " on " + target.host);
    admin->execute(createDatabaseStatement(*admin, target.database));
}

void RelationalSync::sync(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                          ProgressQueue& progressOut) {
    validateEndpoint(source, "source");
    validateEndpoint(target, "target");

    ProgressReporter reporter(ctx.taskId, &progressOut);
    Logger::info(getName() + " sync " + source.describe() + " -> " + target.describe());

    reporter.setPhase("estimating");
    try {
        reporter.setTotals(estimateSize(ctx, source), 0);
    } catch (const SyncError& e) {
        if (e.isCancellation()) {
            throw;
        }
        Logger::warning("Size estimate failed, continuing without totals: " + std::string(e.what()));
        reporter.warning(std::string("size estimate unavailable: ") + e.what());
    }
    ctx.throwIfCancelled();

    if (ctx.options.dryRun) {
        reporter.setMessage("dry run: " + source.database + " would be copied to " + target.database);
        return;
    }

    reporter.setPhase("preparing target");
    ensureDatabase(ctx, target);
    ctx.throwIfCancelled();

    if (ctx.options.mode == "tables") {
        syncTables(ctx, source, target, reporter);
    } else if (ctx.options.mode.empty() || ctx.options.mode == "dump") {
        syncDatabase(ctx, source, target, reporter);
    } else {
        throw SyncError(SyncError::Category::CONFIGURATION, "unknown database sync mode: " + ctx.options.mode);
    }
    reporter.setPhase("completed");
}

void RelationalSync::syncDatabase(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                                  ProgressReporter& reporter) {
    reporter.setPhase("transferring");
    runPipeline(ctx, buildDumpCommand(source), buildRestoreCommand(target), reporter, true);

    Progress current = reporter.getProgress();
    reporter.update(current.bytesTotal, current.itemsDone, "dump restored into " + target.database);
}

void RelationalSync::syncTables(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                                ProgressReporter& reporter) {
    auto schema = buildSchemaCommands(source, target);
    if (schema) {
        reporter.setPhase("copying schema");
        runPipeline(ctx, schema->first, schema->second, reporter, false);
    }

    std::vector<std::string> tables = listTables(ctx, source);
    Progress current = reporter.getProgress();
    reporter.setTotals(current.bytesTotal, static_cast<int64_t>(tables.size()));
    reporter.setPhase("transferring tables");

    int64_t done = 0;
    for (const auto& table : tables) {
        ctx.throwIfCancelled();
        reporter.setCurrentItem(table);
        Logger::debug("Copying table " + table);
        runPipeline(ctx, buildTableDumpCommand(source, table), buildTableRestoreCommand(target, table),
                    reporter, false);
        ++done;
        reporter.update(reporter.getProgress().bytesDone, done, "copied table " + table);
    }

    current = reporter.getProgress();
    reporter.update(current.bytesTotal, done, "copied " + std::to_string(done) + " tables");
}

void RelationalSync::runPipeline(const SyncContext& ctx, const CommandSpec& producer, const CommandSpec& consumer,
                                 ProgressReporter& reporter, bool extrapolateBytes) {
    std::mutex seenMutex;
    std::set<std::string> seenTables;
    auto onStderr = [&](const std::string& line) {
        auto table = parseProgressLine(line);
        if (!table) {
            return;
        }
        std::lock_guard<std::mutex> lock(seenMutex);
        if (seenTables.insert(*table).second) {
            reporter.setCurrentItem(*table);
        }
    };

    ProcessPipeline pipeline(producer, consumer);
    pipeline.setProducerStderrCallback(onStderr);
    pipeline.setConsumerStderrCallback(onStderr);
    if (extrapolateBytes) {
        // The dump stream carries no byte count, so progress is elapsed time
        // at the assumed throughput, held below the estimate.
        pipeline.setTickCallback(progressInterval_, [&](std::chrono::milliseconds elapsed) {
            Progress current = reporter.getProgress();
            int64_t bytes = assumedThroughput_ * elapsed.count() / 1000;
            if (current.bytesTotal > 0) {
                bytes = std::min(bytes, current.bytesTotal);
            }
            reporter.update(bytes, current.itemsDone, "streaming dump");
        });
    }

    ProcessPipeline::Result result = pipeline.run(ctx.token.get());
    if (result.cancelled || ctx.isCancelled()) {
        throw SyncError(SyncError::Category::CANCELLED,
                        "dump cancelled: " + ctx.token->getReason());
    }
    if (!result.succeeded()) {
        std::string failure = result.describeFailure(producer.program, consumer.program);
        reporter.error(failure);
        throw SyncError(SyncError::Category::TRANSFER, failure);
    }
    Logger::debug(producer.program + " | " + consumer.program + " finished in " +
                  std::to_string(result.elapsed.count()) + " ms");
}

VerifyResult RelationalSync::verify(const SyncContext& ctx, const Endpoint& source, const Endpoint& target) {
    validateEndpoint(source, "source");
    validateEndpoint(target, "target");

    auto sourceConn = openConnection(ctx, source, source.database);
    auto targetConn = openConnection(ctx, target, target.database);
    std::vector<std::string> tables = sourceConn->queryColumn(listTablesQuery(*sourceConn, source.database));

    VerifyResult result;
    for (const auto& table : tables) {
        ctx.throwIfCancelled();
        int64_t sourceRows = sourceConn->queryInt(countRowsQuery(*sourceConn, table));
        int64_t targetRows = 0;
        try {
            targetRows = targetConn->queryInt(countRowsQuery(*targetConn, table));
        } catch (const SyncError& e) {
            if (e.isCancellation() || e.getCategory() == SyncError::Category::CONNECTIVITY) {
                throw;
            }
            Logger::warning("Row count failed on target table " + table + ": " + e.what());
            result.addCounts(sourceRows, 0);
            result.addMismatch("table " + table + ": missing in target");
            result.setDetail(table, {{"source", sourceRows}, {"target", nullptr}});
            continue;
        }

        result.addCounts(sourceRows, targetRows);
        result.setDetail(table, {{"source", sourceRows}, {"target", targetRows}});
        if (sourceRows != targetRows) {
            result.addMismatch("table " + table + ": source=" + std::to_string(sourceRows) +
                               " target=" + std::to_string(targetRows));
        }
    }
    result.setDetail("table_count", static_cast<int64_t>(tables.size()));
    Logger::info("Verification of " + target.database + ": " + result.toString());
    return result;
}
