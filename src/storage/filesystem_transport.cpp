#include "storage/filesystem_transport.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <set>
#include <system_error>

namespace fs = std::filesystem;

fs::path FilesystemTransport::rootOf(const Endpoint& endpoint) {
    if (endpoint.bucket.empty() && endpoint.path.empty()) {
        throw SyncError(SyncError::Category::CONFIGURATION, "local endpoint requires a bucket or path");
    }
    return fs::path(joinObjectPath(endpoint.bucket, endpoint.path));
}

void FilesystemTransport::prepare(const SyncContext& ctx, const Endpoint& endpoint) {
    (void)ctx;
    if (endpoint.type != "local") {
        throw SyncError(SyncError::Category::CONFIGURATION,
                        "filesystem transport only handles local endpoints, got " + endpoint.type);
    }
    rootOf(endpoint);
}

std::vector<ObjectInfo> FilesystemTransport::listObjects(const SyncContext& ctx, const Endpoint& endpoint) {
    prepare(ctx, endpoint);
    fs::path root = rootOf(endpoint);

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw SyncError(SyncError::Category::CONNECTIVITY, "directory not found: " + root.string());
    }

    std::vector<ObjectInfo> objects;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        throw SyncError(SyncError::Category::CONNECTIVITY, "cannot list " + root.string() + ": " + ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw SyncError(SyncError::Category::CONNECTIVITY, "cannot list " + root.string() + ": " + ec.message());
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        ObjectInfo object;
        object.key = fs::relative(it->path(), root, ec).generic_string();
        object.size = static_cast<int64_t>(it->file_size(ec));
        auto writeTime = it->last_write_time(ec);
        if (!ec) {
            object.modified = std::to_string(writeTime.time_since_epoch().count());
        }
        objects.push_back(std::move(object));
    }
    return objects;
}

StorageUsage FilesystemTransport::usage(const SyncContext& ctx, const Endpoint& endpoint) {
    StorageUsage total;
    for (const auto& object : listObjects(ctx, endpoint)) {
        total.bytes += object.size;
        total.count++;
    }
    return total;
}

void FilesystemTransport::ensureContainer(const SyncContext& ctx, const Endpoint& endpoint) {
    prepare(ctx, endpoint);
    fs::path root = rootOf(endpoint);
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        throw SyncError(SyncError::Category::TRANSFER, "cannot create " + root.string() + ": " + ec.message());
    }
}

void FilesystemTransport::copyObject(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                                     const std::string& key) {
    ctx.throwIfCancelled();
    fs::path from = rootOf(source) / key;
    fs::path to = rootOf(target) / key;

    std::error_code ec;
    fs::create_directories(to.parent_path(), ec);
    if (ec) {
        throw SyncError(SyncError::Category::TRANSFER, "cannot create " + to.parent_path().string() + ": " + ec.message());
    }
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw SyncError(SyncError::Category::TRANSFER, "copy " + key + " failed: " + ec.message());
    }
}

void FilesystemTransport::mirror(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                                 ProgressReporter& reporter) {
    std::vector<ObjectInfo> objects = listObjects(ctx, source);
    if (!ctx.options.dryRun) {
        ensureContainer(ctx, target);
    }

    int64_t bytesDone = 0;
    int64_t itemsDone = 0;
    int64_t failures = 0;
    std::set<std::string> sourceKeys;
    for (const auto& object : objects) {
        ctx.throwIfCancelled();
        sourceKeys.insert(object.key);
        reporter.setCurrentItem(object.key);
        if (!ctx.options.dryRun) {
            try {
                copyObject(ctx, source, target, object.key);
            } catch (const SyncError& e) {
                if (e.isCancellation()) {
                    throw;
                }
                Logger::warning(e.what());
                reporter.error(e.what());
                failures++;
                continue;
            }
        }
        bytesDone += object.size;
        itemsDone++;
        reporter.update(bytesDone, itemsDone);
    }

    if (ctx.options.deleteExtraneous) {
        for (const auto& object : listObjects(ctx, target)) {
            if (sourceKeys.count(object.key)) {
                continue;
            }
            if (ctx.options.dryRun) {
                reporter.setMessage("would delete " + object.key);
                continue;
            }
            std::error_code ec;
            fs::remove(rootOf(target) / object.key, ec);
            if (ec) {
                reporter.warning("delete " + object.key + " failed: " + ec.message());
            }
        }
    }

    if (failures > 0) {
        std::string summary = "sync completed with " + std::to_string(failures) + " failed objects";
        Logger::warning(summary + " (" + std::to_string(objects.size()) + " listed)");
        reporter.setMessage(summary);
    }
}

std::vector<std::string> FilesystemTransport::checkOneWay(const SyncContext& ctx, const Endpoint& source,
                                                          const Endpoint& target) {
    std::vector<ObjectInfo> sourceObjects = listObjects(ctx, source);
    std::vector<ObjectInfo> targetObjects = listObjects(ctx, target);

    std::set<std::string> targetKeys;
    for (const auto& object : targetObjects) {
        targetKeys.insert(object.key);
    }
    std::set<std::string> sharedKeys;
    for (const auto& object : sourceObjects) {
        if (targetKeys.count(object.key)) {
            sharedKeys.insert(object.key);
        }
    }
    // Hash only objects present on both sides; the rest differ regardless.
    auto hashShared = [&](std::vector<ObjectInfo>& objects, const fs::path& root) {
        for (auto& object : objects) {
            ctx.throwIfCancelled();
            if (!sharedKeys.count(object.key)) {
                continue;
            }
            try {
                object.checksum = utils::sha256File((root / object.key).string());
            } catch (const std::exception& e) {
                Logger::warning(std::string("Checksum failed: ") + e.what());
            }
        }
    };
    hashShared(sourceObjects, rootOf(source));
    hashShared(targetObjects, rootOf(target));

    return compareListings(sourceObjects, targetObjects);
}
