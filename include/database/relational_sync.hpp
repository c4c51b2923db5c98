#pragma once

#include "common/subprocess.hpp"
#include "database/sql_connection.hpp"
#include "sync/sync_strategy.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Dump/restore migration shared by the relational engines. The dump tool's
// stdout is streamed straight into the restore tool; no intermediate file
// is written. Subclasses supply the SQL dialect and the tool command lines.
class RelationalSync : public SyncStrategy {
public:
    SyncType getType() const override { return SyncType::DATABASE; }

    int64_t estimateSize(const SyncContext& ctx, const Endpoint& source) override;
    void sync(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
              ProgressQueue& progressOut) override;
    // Row counts of every source table compared against the target.
    VerifyResult verify(const SyncContext& ctx, const Endpoint& source, const Endpoint& target) override;

    bool supportsIncremental() const override { return false; }
    bool supportsResume() const override { return false; }

    std::vector<std::string> listTables(const SyncContext& ctx, const Endpoint& endpoint);
    // Creates the target database when it does not exist yet.
    void ensureDatabase(const SyncContext& ctx, const Endpoint& target);

    // Dump throughput assumed when extrapolating progress from elapsed time.
    void setAssumedThroughput(int64_t bytesPerSecond) { assumedThroughput_ = bytesPerSecond; }
    void setProgressInterval(std::chrono::milliseconds interval) { progressInterval_ = interval; }

    virtual CommandSpec buildDumpCommand(const Endpoint& source) const = 0;
    virtual CommandSpec buildRestoreCommand(const Endpoint& target) const = 0;
    virtual CommandSpec buildTableDumpCommand(const Endpoint& source, const std::string& table) const = 0;
    virtual CommandSpec buildTableRestoreCommand(const Endpoint& target, const std::string& table) const = 0;
    // Schema transfer run ahead of per-table copies, when the table commands
    // do not carry DDL themselves.
    virtual std::optional<std::pair<CommandSpec, CommandSpec>> buildSchemaCommands(const Endpoint& source,
                                                                                   const Endpoint& target) const {
        (void)source;
        (void)target;
        return std::nullopt;
    }
    // Table name announced by a verbose dump or restore stderr line.
    virtual std::optional<std::string> parseProgressLine(const std::string& line) const = 0;

protected:
    virtual std::unique_ptr<SqlConnection> openConnection(const SyncContext& ctx, const Endpoint& endpoint,
                                                          const std::string& database) = 0;
    // Database to connect to while the target database may not exist.
    virtual std::string adminDatabase() const = 0;
    virtual std::string sizeQuery(SqlConnection& conn, const std::string& database) const = 0;
    virtual std::string databaseExistsQuery(SqlConnection& conn, const std::string& database) const = 0;
    virtual std::string createDatabaseStatement(SqlConnection& conn, const std::string& database) const = 0;
    virtual std::string listTablesQuery(SqlConnection& conn, const std::string& database) const = 0;
    virtual std::string countRowsQuery(SqlConnection& conn, const std::string& table) const = 0;

private:
    void syncDatabase(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                      ProgressReporter& reporter);
    void syncTables(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                    ProgressReporter& reporter);
    void runPipeline(const SyncContext& ctx, const CommandSpec& producer, const CommandSpec& consumer,
                     ProgressReporter& reporter, bool extrapolateBytes);

    int64_t assumedThroughput_{10 * 1024 * 1024};
    std::chrono::milliseconds progressInterval_{2000};
};
