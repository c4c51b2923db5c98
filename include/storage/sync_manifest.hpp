#pragma once

#include "storage/object_transport.hpp"
#include <chrono>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

// Record of the objects a previous run copied, kept next to the target so
// an incremental run can skip objects that have not changed since.
class SyncManifest {
public:
    struct Entry {
        int64_t size{0};
        std::string etag;
        std::string modified;
    };

    static constexpr int kVersion = 1;

    SyncManifest() = default;
    SyncManifest(const std::string& source, const std::string& target);

    void record(const ObjectInfo& object);
    // True when the object was recorded with the same size and the same
    // etag or modification time.
    bool isUnchanged(const ObjectInfo& object) const;
    void markSynced() { syncedAt_ = std::chrono::system_clock::now(); }

    const std::string& getSource() const { return source_; }
    const std::string& getTarget() const { return target_; }
    const std::map<std::string, Entry>& getObjects() const { return objects_; }
    std::chrono::system_clock::time_point getSyncedAt() const { return syncedAt_; }

    nlohmann::json toJson() const;
    static SyncManifest fromJson(const nlohmann::json& j);

    // Both throw SyncError (CONFIGURATION) on I/O or format problems.
    void save(const std::string& path) const;
    static SyncManifest load(const std::string& path);

private:
    std::string source_;
    std::string target_;
    std::chrono::system_clock::time_point syncedAt_{};
    std::map<std::string, Entry> objects_;
};
