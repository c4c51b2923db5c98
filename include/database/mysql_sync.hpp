#pragma once

#include "database/relational_sync.hpp"

// MySQL/MariaDB migration: mysqldump piped into the mysql client. Catalog
// queries also go through the mysql client.
class MysqlSync : public RelationalSync {
public:
    std::string getName() const override { return "mysql"; }

    CommandSpec buildDumpCommand(const Endpoint& source) const override;
    CommandSpec buildRestoreCommand(const Endpoint& target) const override;
    CommandSpec buildTableDumpCommand(const Endpoint& source, const std::string& table) const override;
    CommandSpec buildTableRestoreCommand(const Endpoint& target, const std::string& table) const override;
    std::optional<std::string> parseProgressLine(const std::string& line) const override;

    void setTools(const std::string& mysqldump, const std::string& mysql) {
        mysqldump_ = mysqldump;
        mysql_ = mysql;
    }

protected:
    std::unique_ptr<SqlConnection> openConnection(const SyncContext& ctx, const Endpoint& endpoint,
                                                  const std::string& database) override;
    std::string adminDatabase() const override { return ""; }
    std::string sizeQuery(SqlConnection& conn, const std::string& database) const override;
    std::string databaseExistsQuery(SqlConnection& conn, const std::string& database) const override;
    std::string createDatabaseStatement(SqlConnection& conn, const std::string& database) const override;
    std::string listTablesQuery(SqlConnection& conn, const std::string& database) const override;
    std::string countRowsQuery(SqlConnection& conn, const std::string& table) const override;

private:
    std::string mysqldump_{"mysqldump"};
    std::string mysql_{"mysql"};
};
