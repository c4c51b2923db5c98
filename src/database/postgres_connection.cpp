#include "database/postgres_connection.hpp"
#include "common/logger.hpp"
#include "sync/sync_error.hpp"
#include <libpq-fe.h>
#include <vector>

namespace {

std::string sslModeFor(const Endpoint& endpoint) {
    if (!endpoint.sslMode.empty()) {
        return endpoint.sslMode;
    }
    return endpoint.ssl ? "require" : "prefer";
}

} // namespace

PostgresConnection::PostgresConnection(const Endpoint& endpoint, const std::string& database) {
    std::string host = endpoint.host.empty() ? "localhost" : endpoint.host;
    std::string port = std::to_string(endpoint.port > 0 ? endpoint.port : 5432);
    std::string sslMode = sslModeFor(endpoint);
    std::string connectTimeout = endpoint.getOption("connect_timeout", "10");
    description_ = host + ":" + port + "/" + database;

    std::vector<const char*> keywords = {"host", "port", "dbname", "sslmode", "connect_timeout",
                                         "application_name"};
    std::vector<const char*> values = {host.c_str(), port.c_str(), database.c_str(), sslMode.c_str(),
                                       connectTimeout.c_str(), "datasync"};
    if (!endpoint.credentials.username.empty()) {
        keywords.push_back("user");
        values.push_back(endpoint.credentials.username.c_str());
    }
    if (!endpoint.credentials.password.empty()) {
        keywords.push_back("password");
        values.push_back(endpoint.credentials.password.c_str());
    }
    keywords.push_back(nullptr);
    values.push_back(nullptr);

    conn_ = PQconnectdbParams(keywords.data(), values.data(), 0);
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        std::string error = conn_ ? PQerrorMessage(conn_) : "out of memory";
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
        throw SyncError(SyncError::Category::CONNECTIVITY,
                        "failed to connect to PostgreSQL at " + description_ + ": " + error);
    }
    PQsetClientEncoding(conn_, "UTF8");
    Logger::debug("Connected to PostgreSQL at " + description_);
}

PostgresConnection::~PostgresConnection() {
    if (conn_) {
        PQfinish(conn_);
    }
}

std::vector<std::string> PostgresConnection::queryColumn(const std::string& sql) {
    PGresult* result = PQexec(conn_, sql.c_str());
    if (!result) {
        throw SyncError(SyncError::Category::CONNECTIVITY,
                        "query on " + description_ + " failed: " + PQerrorMessage(conn_));
    }

    ExecStatusType status = PQresultStatus(result);
    if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
        std::string error = PQresultErrorMessage(result);
        PQclear(result);
        throw SyncError(SyncError::Category::PROTOCOL, "query on " + description_ + " failed: " + error);
    }

    std::vector<std::string> rows;
    if (status == PGRES_TUPLES_OK && PQnfields(result) > 0) {
        int numRows = PQntuples(result);
        rows.reserve(static_cast<size_t>(numRows));
        for (int row = 0; row < numRows; ++row) {
            rows.push_back(PQgetisnull(result, row, 0) ? "" : PQgetvalue(result, row, 0));
        }
    }
    PQclear(result);
    return rows;
}

void PostgresConnection::execute(const std::string& sql) {
    queryColumn(sql);
}

std::string PostgresConnection::quoteIdentifier(const std::string& identifier) const {
    char* escaped = PQescapeIdentifier(conn_, identifier.c_str(), identifier.size());
    if (!escaped) {
        throw SyncError(SyncError::Category::PROTOCOL,
                        "failed to quote identifier '" + identifier + "': " + PQerrorMessage(conn_));
    }
    std::string result(escaped);
    PQfreemem(escaped);
    return result;
}

std::string PostgresConnection::quoteLiteral(const std::string& value) const {
    char* escaped = PQescapeLiteral(conn_, value.c_str(), value.size());
    if (!escaped) {
        throw SyncError(SyncError::Category::PROTOCOL, std::string("failed to quote literal: ") + PQerrorMessage(conn_));
    }
    std::string result(escaped);
    PQfreemem(escaped);
    return result;
}
