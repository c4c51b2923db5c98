#include "storage/object_transport.hpp"
#include <map>

std::string joinObjectPath(const std::string& base, const std::string& key) {
    if (base.empty()) {
        return key;
    }
    if (key.empty()) {
        return base;
    }
    std::string left = base;
    while (left.size() > 1 && left.back() == '/') {
        left.pop_back();
    }
    size_t start = 0;
    while (start < key.size() && key[start] == '/') {
        ++start;
    }
    if (left == "/") {
        return "/" + key.substr(start);
    }
    return left + "/" + key.substr(start);
}

std::vector<std::string> ObjectTransport::compareListings(const std::vector<ObjectInfo>& source,
                                                          const std::vector<ObjectInfo>& target) {
    std::map<std::string, const ObjectInfo*> targetByKey;
    for (const auto& object : target) {
        targetByKey[object.key] = &object;
    }

    std::vector<std::string> differences;
    for (const auto& object : source) {
        auto it = targetByKey.find(object.key);
        if (it == targetByKey.end()) {
            differences.push_back("missing in target: " + object.key);
            continue;
        }
        const ObjectInfo& other = *it->second;
        if (object.size != other.size) {
            differences.push_back("size differs: " + object.key + " (source=" + std::to_string(object.size) +
                                  " target=" + std::to_string(other.size) + ")");
        } else if (!object.etag.empty() && !other.etag.empty() && object.etag != other.etag) {
            differences.push_back("etag differs: " + object.key);
        } else if (!object.checksum.empty() && !other.checksum.empty() && object.checksum != other.checksum) {
            differences.push_back("checksum differs: " + object.key);
        }
    }
    return differences;
}

std::vector<std::string> ObjectTransport::checkOneWay(const SyncContext& ctx, const Endpoint& source,
                                                      const Endpoint& target) {
    return compareListings(listObjects(ctx, source), listObjects(ctx, target));
}
