#include "storage/object_storage_sync.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "storage/parallel_object_copier.hpp"
#include "storage/sync_manifest.hpp"
#include <filesystem>
#include <set>

namespace {

void validateEndpoint(const Endpoint& endpoint, const std::string& role) {
    if (endpoint.bucket.empty() && !(endpoint.type == "local" && !endpoint.path.empty())) {
        throw SyncError(SyncError::Category::CONFIGURATION, role + " storage endpoint requires a bucket");
    }
}

} // namespace

ObjectStorageSync::ObjectStorageSync(const std::string& name, const std::string& defaultEngine)
    : name_(name)
    , defaultEngine_(defaultEngine) {
}

void ObjectStorageSync::addTransport(const std::string& engine, ObjectTransportPtr transport) {
    std::lock_guard<std::mutex> lock(mutex_);
    transports_[engine] = std::move(transport);
}

std::vector<std::string> ObjectStorageSync::listEngines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> engines;
    for (const auto& entry : transports_) {
        engines.push_back(entry.first);
    }
    return engines;
}

ObjectTransportPtr ObjectStorageSync::selectTransport(const SyncOptions& options, const Endpoint& source,
                                                      const Endpoint& target) const {
    std::string engine = options.engine;
    if (engine.empty()) {
        if (source.type == "local" && target.type == "local") {
            engine = "filesystem";
        } else {
            engine = defaultEngine_.empty() ? "rclone" : defaultEngine_;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transports_.find(engine);
    if (it == transports_.end() || !it->second) {
        throw SyncError(SyncError::Category::CONFIGURATION, "no object storage engine named " + engine);
    }
    return it->second;
}

std::string ObjectStorageSync::manifestPathFor(const SyncOptions& options, const Endpoint& target) const {
    if (target.hasOption("manifest")) {
        return target.getOption("manifest");
    }
    if (!options.incremental || manifestDirectory_.empty()) {
        return "";
    }
    return joinObjectPath(manifestDirectory_, utils::sanitizeName(target.describe()) + ".json");
}

int64_t ObjectStorageSync::estimateSize(const SyncContext& ctx, const Endpoint& source) {
    validateEndpoint(source, "source");
    return selectTransport(ctx.options, source, source)->usage(ctx, source).bytes;
}

void ObjectStorageSync::sync(const SyncContext& ctx, const Endpoint& source, const Endpoint& target,
                             ProgressQueue& progressOut) {
    validateEndpoint(source, "source");
    validateEndpoint(target, "target");

    ProgressReporter reporter(ctx.taskId, &progressOut);
    reporter.setPhase("initializing");
    ObjectTransportPtr transport = selectTransport(ctx.options, source, target);
    Logger::info(name_ + " sync via " + transport->getName() + ": " + source.describe() + " -> " + target.describe());

    transport->prepare(ctx, source);
    transport->prepare(ctx, target);

    try {
        StorageUsage usage = transport->usage(ctx, source);
        reporter.setTotals(usage.bytes, usage.count);
    } catch (const SyncError& e) {
        if (e.isCancellation()) {
            throw;
        }
        Logger::warning(std::string("Could not estimate source size: ") + e.what());
        reporter.warning(std::string("could not estimate size: ") + e.what());
    }

    reporter.setPhase("syncing");
    if (ctx.options.mode == "parallel") {
        syncParallel(ctx, *transport, source, target, reporter);
    } else if (ctx.options.mode.empty() || ctx.options.mode == "mirror") {
        transport->mirror(ctx, source, target, reporter);
    } else {
        throw SyncError(SyncError::Category::CONFIGURATION, "unknown object storage sync mode: " + ctx.options.mode);
    }
    ctx.throwIfCancelled();
    reporter.setPhase("completed");
}

void ObjectStorageSync::syncParallel(const SyncContext& ctx, ObjectTransport& transport, const Endpoint& source,
                                     const Endpoint& target, ProgressReporter& reporter) {
    reporter.setPhase("listing");
    std::vector<ObjectInfo> objects = transport.listObjects(ctx, source);

    std::string manifestPath = manifestPathFor(ctx.options, target);
    SyncManifest manifest(source.describe(), target.describe());
    if (ctx.options.incremental && !manifestPath.empty() && std::filesystem::exists(manifestPath)) {
        manifest = SyncManifest::load(manifestPath);
        size_t before = objects.size();
        std::vector<ObjectInfo> changed;
        for (const auto& object : objects) {
            if (!manifest.isUnchanged(object)) {
                changed.push_back(object);
            }
        }
        objects.swap(changed);
        Logger::info("Manifest " + manifestPath + ": " + std::to_string(before - objects.size()) +
                     " unchanged objects skipped");
    }

    int64_t totalBytes = 0;
    for (const auto& object : objects) {
        totalBytes += object.size;
    }
    reporter.setTotals(totalBytes, static_cast<int64_t>(objects.size()));

    if (ctx.options.dryRun) {
        reporter.setMessage("dry run: " + std::to_string(objects.size()) + " objects would be copied");
        return;
    }

    transport.ensureContainer(ctx, target);
    reporter.setPhase("syncing");
    ParallelObjectCopier copier(transport, ctx.options.parallel);
    ParallelObjectCopier::Result result = copier.run(ctx, source, target, objects, reporter);
    if (result.cancelled) {
        throw SyncError(SyncError::Category::CANCELLED, "object copy cancelled: " + ctx.token->getReason());
    }
    if (result.objectsFailed > 0) {
        std::string summary = "sync completed with " + std::to_string(result.objectsFailed) + " failed objects";
        Logger::warning(summary);
        reporter.setMessage(summary);
    }

    if (!manifestPath.empty()) {
        std::set<std::string> failed(result.failedKeys.begin(), result.failedKeys.end());
        for (const auto& object : objects) {
            // Failed objects stay out of the manifest and are retried next run.
            if (!failed.count(object.key)) {
                manifest.record(object);
            }
        }
        manifest.markSynced();
        manifest.save(manifestPath);
    }
}

VerifyResult ObjectStorageSync::verify(const SyncContext& ctx, const Endpoint& source, const Endpoint& target) {
    validateEndpoint(source, "source");
    validateEndpoint(target, "target");
    ObjectTransportPtr transport = selectTransport(ctx.options, source, target);

    StorageUsage sourceUsage = transport->usage(ctx, source);
    StorageUsage targetUsage = transport->usage(ctx, target);

    VerifyResult result;
    result.setCounts(sourceUsage.count, targetUsage.count);
    if (sourceUsage.count != targetUsage.count) {
        result.addMismatch("object count mismatch: source=" + std::to_string(sourceUsage.count) +
                           ", target=" + std::to_string(targetUsage.count));
    }
    if (sourceUsage.bytes != targetUsage.bytes) {
        result.addMismatch("total size mismatch: source=" + std::to_string(sourceUsage.bytes) +
                           " bytes, target=" + std::to_string(targetUsage.bytes) + " bytes");
    }
    result.setDetail("source_bytes", sourceUsage.bytes);
    result.setDetail("target_bytes", targetUsage.bytes);

    if (ctx.options.checksumVerify) {
        for (const auto& difference : transport->checkOneWay(ctx, source, target)) {
            result.addMismatch(difference);
        }
    }
    Logger::info("Object storage verification: " + result.toString());
    return result;
}
