#include "sync/sync_types.hpp"
#include "sync/sync_error.hpp"
#include "common/utils.hpp"

std::string syncTypeToString(SyncType type) {
    switch (type) {
        case SyncType::OBJECT_STORAGE: return "storage";
        case SyncType::DATABASE:       return "database";
        case SyncType::CACHE:          return "cache";
        default:                       return "unknown";
    }
}

bool parseSyncType(const std::string& name, SyncType& type) {
    std::string lower = utils::toLower(name);
    if (lower == "storage" || lower == "object-storage" || lower == "object_storage") {
        type = SyncType::OBJECT_STORAGE;
    } else if (lower == "database" || lower == "relational") {
        type = SyncType::DATABASE;
    } else if (lower == "cache") {
        type = SyncType::CACHE;
    } else {
        return false;
    }
    return true;
}

std::string Endpoint::getOption(const std::string& key, const std::string& defaultValue) const {
    auto it = options.find(key);
    return it != options.end() ? it->second : defaultValue;
}

bool Endpoint::hasOption(const std::string& key) const {
    return options.find(key) != options.end();
}

namespace {

std::string userInfo(const Credentials& credentials) {
    if (credentials.username.empty() && credentials.password.empty()) {
        return "";
    }
    std::string info = utils::urlEncode(credentials.username);
    if (!credentials.password.empty()) {
        info += ":" + utils::urlEncode(credentials.password);
    }
    return info + "@";
}

std::string hostPort(const Endpoint& endpoint, int defaultPort) {
    int port = endpoint.port > 0 ? endpoint.port : defaultPort;
    return endpoint.host + ":" + std::to_string(port);
}

} // namespace

std::string Endpoint::connectionString() const {
    std::string kind = utils::toLower(type);

    if (kind == "postgres" || kind == "postgresql") {
        std::string url = "postgres://" + userInfo(credentials) + hostPort(*this, 5432) + "/" + database;
        std::string mode = sslMode;
        if (mode.empty()) {
            mode = ssl ? "require" : "disable";
        }
        return url + "?sslmode=" + mode;
    }
    if (kind == "mysql" || kind == "mariadb") {
        return "mysql://" + userInfo(credentials) + hostPort(*this, 3306) + "/" + database;
    }
    if (kind == "redis" || kind == "valkey") {
        std::string scheme = ssl ? "rediss://" : "redis://";
        std::string db = database.empty() ? "0" : database;
        return scheme + userInfo(credentials) + hostPort(*this, 6379) + "/" + db;
    }
    if (kind == "s3" || kind == "minio" || kind == "gcs" || kind == "azure-blob") {
        std::string url = "s3://" + bucket;
        if (!path.empty()) {
            url += "/" + path;
        }
        return url;
    }
    if (port > 0) {
        return host + ":" + std::to_string(port);
    }
    return host;
}

std::string Endpoint::describe() const {
    std::string location = !bucket.empty() ? bucket : database;
    std::string result = type + "://";
    if (!host.empty()) {
        result += host;
        if (port > 0) {
            result += ":" + std::to_string(port);
        }
    }
    if (!location.empty()) {
        result += "/" + location;
    }
    if (!path.empty()) {
        result += "/" + path;
    }
    return result;
}

void SyncContext::throwIfCancelled() const {
    if (token->isCancelled()) {
        throw SyncError(SyncError::Category::CANCELLED, "operation cancelled: " + token->getReason());
    }
}
