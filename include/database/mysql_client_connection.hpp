#pragma once

#include "common/cancellation_token.hpp"
#include "common/subprocess.hpp"
#include "database/sql_connection.hpp"
#include "sync/sync_types.hpp"
#include <string>

// Catalog access to MySQL/MariaDB through the `mysql` command-line client
// in batch mode (-N -B). The password travels in MYSQL_PWD, never argv.
class MysqlClientConnection : public SqlConnection {
public:
    // Runs "SELECT 1" to confirm the server is reachable; throws SyncError
    // (CONNECTIVITY) otherwise.
    MysqlClientConnection(const Endpoint& endpoint, const std::string& database,
                          const std::string& clientProgram = "mysql",
                          const CancellationToken* token = nullptr);

    std::vector<std::string> queryColumn(const std::string& sql) override;
    void execute(const std::string& sql) override;

    std::string quoteIdentifier(const std::string& identifier) const override;
    std::string quoteLiteral(const std::string& value) const override;

    CommandSpec buildQueryCommand(const std::string& sql) const;

private:
    ProcessResult runQuery(const std::string& sql);

    Endpoint endpoint_;
    std::string database_;
    std::string clientProgram_;
    const CancellationToken* token_;
};

// Arguments shared by mysql and mysqldump: host, port, user and TLS mode.
std::vector<std::string> mysqlConnectionArgs(const Endpoint& endpoint);
std::map<std::string, std::string> mysqlEnvironment(const Endpoint& endpoint);
