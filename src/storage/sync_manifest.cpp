#include "storage/sync_manifest.hpp"
#include "sync/sync_error.hpp"
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

SyncManifest::SyncManifest(const std::string& source, const std::string& target)
    : source_(source)
    , target_(target) {
}

void SyncManifest::record(const ObjectInfo& object) {
    objects_[object.key] = Entry{object.size, object.etag, object.modified};
}

bool SyncManifest::isUnchanged(const ObjectInfo& object) const {
    auto it = objects_.find(object.key);
    if (it == objects_.end() || it->second.size != object.size) {
        return false;
    }
    if (!object.etag.empty() && !it->second.etag.empty()) {
        return object.etag == it->second.etag;
    }
    return !object.modified.empty() && object.modified == it->second.modified;
}

json SyncManifest::toJson() const {
    json objects = json::object();
    for (const auto& [key, entry] : objects_) {
        objects[key] = {{"size", entry.size}, {"etag", entry.etag}, {"modified", entry.modified}};
    }
    return {
        {"version", kVersion},
        {"source", source_},
        {"target", target_},
        {"syncedAt", std::chrono::duration_cast<std::chrono::milliseconds>(syncedAt_.time_since_epoch()).count()},
        {"objects", objects},
    };
}

SyncManifest SyncManifest::fromJson(const json& j) {
    try {
        int version = j.value("version", 0);
        if (version != kVersion) {
            throw SyncError(SyncError::Category::CONFIGURATION,
                            "unsupported manifest version " + std::to_string(version));
        }
        SyncManifest manifest(j.value("source", ""), j.value("target", ""));
        manifest.syncedAt_ = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(j.value("syncedAt", static_cast<int64_t>(0))));
        if (j.contains("objects")) {
            for (const auto& [key, value] : j.at("objects").items()) {
                Entry entry;
                entry.size = value.value("size", static_cast<int64_t>(0));
                entry.etag = value.value("etag", "");
                entry.modified = value.value("modified", "");
                manifest.objects_[key] = entry;
            }
        }
        return manifest;
    } catch (const json::exception& e) {
        throw SyncError(SyncError::Category::CONFIGURATION, std::string("invalid manifest: ") + e.what());
    }
}

void SyncManifest::save(const std::string& path) const {
    std::filesystem::path file(path);
    std::error_code ec;
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec) {
            throw SyncError(SyncError::Category::CONFIGURATION,
                            "cannot create manifest directory " + file.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw SyncError(SyncError::Category::CONFIGURATION, "cannot write manifest " + path);
    }
    out << toJson().dump(2) << std::endl;
    if (!out) {
        throw SyncError(SyncError::Category::CONFIGURATION, "failed writing manifest " + path);
    }
}

SyncManifest SyncManifest::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw SyncError(SyncError::Category::CONFIGURATION, "cannot read manifest " + path);
    }
    try {
        return fromJson(json::parse(in));
    } catch (const json::parse_error& e) {
        throw SyncError(SyncError::Category::CONFIGURATION, "cannot parse manifest " + path + ": " + e.what());
    }
}
