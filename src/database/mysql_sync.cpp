#include "database/mysql_sync.hpp"
#include "database/mysql_client_connection.hpp"
#include <regex>

namespace {

CommandSpec toolCommand(const std::string& program, const Endpoint& endpoint) {
    CommandSpec command;
    command.program = program;
    command.args = mysqlConnectionArgs(endpoint);
    command.env = mysqlEnvironment(endpoint);
    return command;
}

} // namespace

// The dump names no --databases so the restore may land in a database
// with a different name.
CommandSpec MysqlSync::buildDumpCommand(const Endpoint& source) const {
    CommandSpec command = toolCommand(mysqldump_, source);
    command.args.insert(command.args.end(), {"--single-transaction", "--quick", "--routines", "--triggers",
                                             "--events", "--verbose", source.database});
    return command;
}

CommandSpec MysqlSync::buildRestoreCommand(const Endpoint& target) const {
    CommandSpec command = toolCommand(mysql_, target);
    command.args.push_back(target.database);
    return command;
}

CommandSpec MysqlSync::buildTableDumpCommand(const Endpoint& source, const std::string& table) const {
    CommandSpec command = toolCommand(mysqldump_, source);
    command.args.insert(command.args.end(),
                        {"--single-transaction", "--quick", "--verbose", source.database, table});
    return command;
}

CommandSpec MysqlSync::buildTableRestoreCommand(const Endpoint& target, const std::string& table) const {
    (void)table;
    return buildRestoreCommand(target);
}

std::optional<std::string> MysqlSync::parseProgressLine(const std::string& line) const {
    // -- Retrieving table structure for table `users`...
    static const std::regex pattern("(?:Retrieving table structure for table|Dumping data for table) `([^`]+)`");
    std::smatch match;
    if (std::regex_search(line, match, pattern)) {
        return match[1].str();
    }
    return std::nullopt;
}

std::unique_ptr<SqlConnection> MysqlSync::openConnection(const SyncContext& ctx, const Endpoint& endpoint,
                                                         const std::string& database) {
    ctx.throwIfCancelled();
    return std::make_unique<MysqlClientConnection>(endpoint, database, mysql_, ctx.token.get());
}

std::string MysqlSync::sizeQuery(SqlConnection& conn, const std::string& database) const {
    return "SELECT COALESCE(SUM(data_length + index_length), 0) FROM information_schema.tables "
           "WHERE table_schema = " + conn.quoteLiteral(database);
}

std::string MysqlSync::databaseExistsQuery(SqlConnection& conn, const std::string& database) const {
    return "SELECT COUNT(*) FROM information_schema.schemata WHERE schema_name = " + conn.quoteLiteral(database);
}

std::string MysqlSync::createDatabaseStatement(SqlConnection& conn, const std::string& database) const {
    return "CREATE DATABASE IF NOT EXISTS " + conn.quoteIdentifier(database);
}

std::string MysqlSync::listTablesQuery(SqlConnection& conn, const std::string& database) const {
    return "SELECT table_name FROM information_schema.tables WHERE table_schema = " +
           conn.quoteLiteral(database) + " AND table_type = 'BASE TABLE' ORDER BY table_name";
}

std::string MysqlSync::countRowsQuery(SqlConnection& conn, const std::string& table) const {
    return "SELECT COUNT(*) FROM " + conn.quoteIdentifier(table);
}
