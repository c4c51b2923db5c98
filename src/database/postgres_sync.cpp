#include "database/postgres_sync.hpp"
#include "database/postgres_connection.hpp"
#include "common/utils.hpp"
#include <regex>

std::string PostgresSync::quoteQualifiedName(const std::string& table) {
    auto quote = [](const std::string& part) {
        std::string quoted = "\"";
        for (char c : part) {
            if (c == '"') {
                quoted += '"';
            }
            quoted += c;
        }
        return quoted + "\"";
    };

    auto dot = table.find('.');
    if (dot == std::string::npos) {
        return quote(table);
    }
    return quote(table.substr(0, dot)) + "." + quote(table.substr(dot + 1));
}

CommandSpec PostgresSync::baseCommand(const std::string& program, const Endpoint& endpoint) const {
    CommandSpec command;
    command.program = program;
    command.args = {"-h", endpoint.host, "-p", std::to_string(endpoint.port > 0 ? endpoint.port : 5432)};
    if (!endpoint.credentials.username.empty()) {
        command.args.push_back("-U");
        command.args.push_back(endpoint.credentials.username);
    }
    command.args.push_back("--no-password");
    if (!endpoint.credentials.password.empty()) {
        command.env["PGPASSWORD"] = endpoint.credentials.password;
    }
    if (!endpoint.sslMode.empty()) {
        command.env["PGSSLMODE"] = endpoint.sslMode;
    } else if (endpoint.ssl) {
        command.env["PGSSLMODE"] = "require";
    }
    return command;
}

CommandSpec PostgresSync::buildDumpCommand(const Endpoint& source) const {
    CommandSpec command = baseCommand(pgDump_, source);
    command.args.insert(command.args.end(), {"-Fc", "-v", source.database});
    return command;
}

CommandSpec PostgresSync::buildRestoreCommand(const Endpoint& target) const {
    CommandSpec command = baseCommand(pgRestore_, target);
    command.args.insert(command.args.end(),
                        {"-d", target.database, "--clean", "--if-exists", "--no-owner", "--no-privileges", "-v"});
    return command;
}

std::optional<std::pair<CommandSpec, CommandSpec>> PostgresSync::buildSchemaCommands(const Endpoint& source,
                                                                                     const Endpoint& target) const {
    CommandSpec dump = baseCommand(pgDump_, source);
    dump.args.insert(dump.args.end(), {"-Fc", "--schema-only", source.database});

    CommandSpec restore = baseCommand(pgRestore_, target);
    restore.args.insert(restore.args.end(),
                        {"-d", target.database, "--clean", "--if-exists", "--no-owner", "--no-privileges"});
    return std::make_pair(dump, restore);
}

CommandSpec PostgresSync::buildTableDumpCommand(const Endpoint& source, const std::string& table) const {
    CommandSpec command = baseCommand(psql_, source);
    command.args.insert(command.args.end(),
                        {"-d", source.database, "-v", "ON_ERROR_STOP=1",
                         "-c", "COPY " + quoteQualifiedName(table) + " TO STDOUT"});
    return command;
}

CommandSpec PostgresSync::buildTableRestoreCommand(const Endpoint& target, const std::string& table) const {
    CommandSpec command = baseCommand(psql_, target);
    command.args.insert(command.args.end(),
                        {"-d", target.database, "-v", "ON_ERROR_STOP=1",
                         "-c", "COPY " + quoteQualifiedName(table) + " FROM STDIN"});
    return command;
}

std::optional<std::string> PostgresSync::parseProgressLine(const std::string& line) const {
    // pg_dump: dumping contents of table "public.users"
    // pg_restore: processing data for table "public.users"
    static const std::regex pattern("(?:dumping contents of|processing data for) table \"([^\"]+)\"");
    std::smatch match;
    if (std::regex_search(line, match, pattern)) {
        return match[1].str();
    }
    return std::nullopt;
}

std::unique_ptr<SqlConnection> PostgresSync::openConnection(const SyncContext& ctx, const Endpoint& endpoint,
                                                            const std::string& database) {
    ctx.throwIfCancelled();
    return std::make_unique<PostgresConnection>(endpoint, database);
}

std::string PostgresSync::sizeQuery(SqlConnection& conn, const std::string& database) const {
    (void)conn;
    (void)database;
    return "SELECT pg_database_size(current_database())";
}

std::string PostgresSync::databaseExistsQuery(SqlConnection& conn, const std::string& database) const {
    return "SELECT COUNT(*) FROM pg_database WHERE datname = " + conn.quoteLiteral(database);
}

std::string PostgresSync::createDatabaseStatement(SqlConnection& conn, const std::string& database) const {
    return "CREATE DATABASE " + conn.quoteIdentifier(database);
}

std::string PostgresSync::listTablesQuery(SqlConnection& conn, const std::string& database) const {
    (void)conn;
    (void)database;
    return "SELECT schemaname || '.' || tablename FROM pg_tables "
           "WHERE schemaname NOT IN ('pg_catalog', 'information_schema') ORDER BY 1";
}

std::string PostgresSync::countRowsQuery(SqlConnection& conn, const std::string& table) const {
    auto dot = table.find('.');
    if (dot == std::string::npos) {
        return "SELECT COUNT(*) FROM " + conn.quoteIdentifier(table);
    }
    return "SELECT COUNT(*) FROM " + conn.quoteIdentifier(table.substr(0, dot)) + "." +
           conn.quoteIdentifier(table.substr(dot + 1));
}
