#include "sync/plan_loader.hpp"
#include "sync/sync_config.hpp"
#include "sync/sync_error.hpp"
#include <fstream>

using json = nlohmann::json;

Endpoint endpointFromJson(const json& j) {
    if (!j.is_object()) {
        throw SyncError(SyncError::Category::CONFIGURATION, "endpoint must be a JSON object");
    }

    Endpoint endpoint;
    try {
        endpoint.type = j.at("type").get<std::string>();
        endpoint.host = j.value("host", "");
        endpoint.port = j.value("port", 0);
        endpoint.database = j.value("database", "");
        endpoint.bucket = j.value("bucket", "");
        endpoint.path = j.value("path", "");
        endpoint.region = j.value("region", "");
        endpoint.ssl = j.value("ssl", false);
        endpoint.sslMode = j.value("ssl_mode", "");

        if (j.contains("credentials")) {
            const json& creds = j.at("credentials");
            endpoint.credentials.username = creds.value("username", "");
            endpoint.credentials.password = creds.value("password", "");
            endpoint.credentials.accessKey = creds.value("access_key", "");
            endpoint.credentials.secretKey = creds.value("secret_key", "");
            endpoint.credentials.token = creds.value("token", "");
            endpoint.credentials.keyFile = creds.value("key_file", "");
        }
        if (j.contains("options")) {
            for (const auto& [key, value] : j.at("options").items()) {
                endpoint.options[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
    } catch (const json::exception& e) {
        throw SyncError(SyncError::Category::CONFIGURATION, std::string("invalid endpoint: ") + e.what());
    }

    if (endpoint.type.empty()) {
        throw SyncError(SyncError::Category::CONFIGURATION, "endpoint type must not be empty");
    }
    if (endpoint.port < 0 || endpoint.port > 65535) {
        throw SyncError(SyncError::Category::CONFIGURATION, "endpoint port out of range: " + std::to_string(endpoint.port));
    }
    return endpoint;
}

json endpointToJson(const Endpoint& endpoint, bool includeSecrets) {
    json j = {
        {"type", endpoint.type},
        {"host", endpoint.host},
        {"port", endpoint.port},
        {"database", endpoint.database},
        {"bucket", endpoint.bucket},
        {"path", endpoint.path},
        {"region", endpoint.region},
        {"ssl", endpoint.ssl},
        {"ssl_mode", endpoint.sslMode},
        {"options", endpoint.options},
    };
    json creds = {{"username", endpoint.credentials.username}, {"key_file", endpoint.credentials.keyFile}};
    if (includeSecrets) {
        creds["password"] = endpoint.credentials.password;
        creds["access_key"] = endpoint.credentials.accessKey;
        creds["secret_key"] = endpoint.credentials.secretKey;
        creds["token"] = endpoint.credentials.token;
    }
    j["credentials"] = creds;
    return j;
}

PlanDocument parsePlan(const json& j, const SyncOptions& defaults) {
    if (!j.is_object() || !j.contains("tasks") || !j.at("tasks").is_array()) {
        throw SyncError(SyncError::Category::CONFIGURATION, "plan must be an object with a \"tasks\" array");
    }

    PlanDocument plan;
    plan.name = j.value("name", "");

    size_t index = 0;
    for (const auto& entry : j.at("tasks")) {
        std::string label = "task " + std::to_string(index++);
        if (!entry.is_object()) {
            throw SyncError(SyncError::Category::CONFIGURATION, label + " must be an object");
        }

        SyncType type = SyncType::OBJECT_STORAGE;
        std::string typeName = entry.value("type", "");
        if (!parseSyncType(typeName, type)) {
            throw SyncError(SyncError::Category::CONFIGURATION, label + " has unknown type '" + typeName + "'");
        }
        if (!entry.contains("source") || !entry.contains("target")) {
            throw SyncError(SyncError::Category::CONFIGURATION, label + " requires a source and a target");
        }

        SyncOptions options = defaults;
        if (entry.contains("options")) {
            options = syncOptionsFromJson(entry.at("options"), defaults);
        }

        SyncTask task(entry.value("name", label), type, entry.value("strategy", ""),
                      std::make_shared<const Endpoint>(endpointFromJson(entry.at("source"))),
                      std::make_shared<const Endpoint>(endpointFromJson(entry.at("target"))), options);
        plan.tasks.push_back(std::move(task));
    }
    return plan;
}

PlanDocument loadPlanFile(const std::string& path, const SyncOptions& defaults) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SyncError(SyncError::Category::CONFIGURATION, "cannot open plan file " + path);
    }
    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw SyncError(SyncError::Category::CONFIGURATION, "cannot parse " + path + ": " + e.what());
    }
    PlanDocument plan = parsePlan(j, defaults);
    if (plan.name.empty()) {
        plan.name = path;
    }
    return plan;
}
