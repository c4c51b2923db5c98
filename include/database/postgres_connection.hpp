#pragma once

#include "database/sql_connection.hpp"
#include "sync/sync_types.hpp"
#include <string>

typedef struct pg_conn PGconn;

// libpq connection to one PostgreSQL database.
class PostgresConnection : public SqlConnection {
public:
    // Throws SyncError (CONNECTIVITY) when the server rejects the connection.
    PostgresConnection(const Endpoint& endpoint, const std::string& database);
    ~PostgresConnection() override;

    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    std::vector<std::string> queryColumn(const std::string& sql) override;
    void execute(const std::string& sql) override;

    std::string quoteIdentifier(const std::string& identifier) const override;
    std::string quoteLiteral(const std::string& value) const override;

private:
    PGconn* conn_{nullptr};
    std::string description_;
};
