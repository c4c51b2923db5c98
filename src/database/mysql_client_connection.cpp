#include "database/mysql_client_connection.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "sync/sync_error.hpp"
#include <cctype>

namespace {

bool isConnectivityFailure(const std::string& stderrText) {
    static const char* markers[] = {"Can't connect", "Access denied", "Unknown MySQL server host",
                                    "Lost connection", "ERROR 2002", "ERROR 2003", "ERROR 2005"};
    for (const char* marker : markers) {
        if (stderrText.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

std::vector<std::string> mysqlConnectionArgs(const Endpoint& endpoint) {
    std::vector<std::string> args = {
        "-h", endpoint.host.empty() ? "localhost" : endpoint.host,
        "-P", std::to_string(endpoint.port > 0 ? endpoint.port : 3306),
    };
    if (!endpoint.credentials.username.empty()) {
        args.push_back("-u");
        args.push_back(endpoint.credentials.username);
    }
    if (!endpoint.sslMode.empty()) {
        // libpq spellings are accepted for symmetry with PostgreSQL endpoints
        std::string mode = utils::toLower(endpoint.sslMode);
        if (mode == "disable") {
            mode = "disabled";
        } else if (mode == "require") {
            mode = "required";
        }
        for (auto& c : mode) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        args.push_back("--ssl-mode=" + mode);
    } else if (endpoint.ssl) {
        args.push_back("--ssl-mode=REQUIRED");
    }
    return args;
}

std::map<std::string, std::string> mysqlEnvironment(const Endpoint& endpoint) {
    std::map<std::string, std::string> env;
    if (!endpoint.credentials.password.empty()) {
        env["MYSQL_PWD"] = endpoint.credentials.password;
    }
    return env;
}

MysqlClientConnection::MysqlClientConnection(const Endpoint& endpoint, const std::string& database,
                                             const std::string& clientProgram,
                                             const CancellationToken* token)
    : endpoint_(endpoint)
    , database_(database)
    , clientProgram_(clientProgram)
    , token_(token) {
    ProcessResult result = runQuery("SELECT 1");
    if (result.exitCode != 0) {
        throw SyncError(SyncError::Category::CONNECTIVITY,
                        "failed to connect to MySQL at " + endpoint_.describe() + ": " +
                            utils::trim(result.stderrText));
    }
    Logger::debug("Connected to MySQL at " + endpoint_.describe());
}

CommandSpec MysqlClientConnection::buildQueryCommand(const std::string& sql) const {
    CommandSpec command;
    command.program = clientProgram_;
    command.args = mysqlConnectionArgs(endpoint_);
    command.args.insert(command.args.end(), {"-N", "-B", "-e", sql});
    if (!database_.empty()) {
        command.args.push_back(database_);
    }
    command.env = mysqlEnvironment(endpoint_);
    return command;
}

ProcessResult MysqlClientConnection::runQuery(const std::string& sql) {
    ProcessResult result = Subprocess::run(buildQueryCommand(sql), token_);
    if (result.cancelled) {
        throw SyncError(SyncError::Category::CANCELLED, "query cancelled");
    }
    return result;
}

std::vector<std::string> MysqlClientConnection::queryColumn(const std::string& sql) {
    ProcessResult result = runQuery(sql);
    if (result.exitCode != 0) {
        std::string error = utils::trim(result.stderrText);
        throw SyncError(isConnectivityFailure(error) ? SyncError::Category::CONNECTIVITY
                                                     : SyncError::Category::PROTOCOL,
                        "query on " + endpoint_.describe() + " failed: " + error);
    }

    std::vector<std::string> rows;
    for (const auto& line : utils::split(result.stdoutText, '\n')) {
        if (line.empty()) {
            continue;
        }
        std::string value = line.substr(0, line.find('\t'));
        rows.push_back(value == "NULL" ? "" : value);
    }
    return rows;
}

void MysqlClientConnection::execute(const std::string& sql) {
    queryColumn(sql);
}

std::string MysqlClientConnection::quoteIdentifier(const std::string& identifier) const {
    std::string quoted = "`";
    for (char c : identifier) {
        if (c == '`') {
            quoted += "``";
        } else {
            quoted += c;
        }
    }
    return quoted + "`";
}

std::string MysqlClientConnection::quoteLiteral(const std::string& value) const {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    return quoted + "'";
}
