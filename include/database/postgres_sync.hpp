#pragma once

#include "database/relational_sync.hpp"

// PostgreSQL migration: pg_dump in custom format piped into pg_restore, or
// per-table COPY through psql in "tables" mode.
class PostgresSync : public RelationalSync {
public:
    std::string getName() const override { return "postgres"; }

    CommandSpec buildDumpCommand(const Endpoint& source) const override;
    CommandSpec buildRestoreCommand(const Endpoint& target) const override;
    CommandSpec buildTableDumpCommand(const Endpoint& source, const std::string& table) const override;
    CommandSpec buildTableRestoreCommand(const Endpoint& target, const std::string& table) const override;
    std::optional<std::pair<CommandSpec, CommandSpec>> buildSchemaCommands(const Endpoint& source,
                                                                           const Endpoint& target) const override;
    std::optional<std::string> parseProgressLine(const std::string& line) const override;

    void setTools(const std::string& pgDump, const std::string& pgRestore, const std::string& psql) {
        pgDump_ = pgDump;
        pgRestore_ = pgRestore;
        psql_ = psql;
    }

    // "schema.table" with each part double-quoted.
    static std::string quoteQualifiedName(const std::string& table);

protected:
    std::unique_ptr<SqlConnection> openConnection(const SyncContext& ctx, const Endpoint& endpoint,
                                                  const std::string& database) override;
    std::string adminDatabase() const override { return "postgres"; }
    std::string sizeQuery(SqlConnection& conn, const std::string& database) const override;
    std::string databaseExistsQuery(SqlConnection& conn, const std::string& database) const override;
    std::string createDatabaseStatement(SqlConnection& conn, const std::string& database) const override;
    std::string listTablesQuery(SqlConnection& conn, const std::string& database) const override;
    std::string countRowsQuery(SqlConnection& conn, const std::string& table) const override;

private:
    CommandSpec baseCommand(const std::string& program, const Endpoint& endpoint) const;

    std::string pgDump_{"pg_dump"};
    std::string pgRestore_{"pg_restore"};
    std::string psql_{"psql"};
};
